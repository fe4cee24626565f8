// 파일 헤더
#include "Indicators/Volume.hpp"

namespace tradesim::indicator {

Volume::Volume(const string& name) : Indicator(name) {}

void Volume::Initialize() {}

double Volume::Calculate() { return GetCurrentBar().volume; }

}  // namespace tradesim::indicator
