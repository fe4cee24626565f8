// 파일 헤더
#include "Indicators/Low.hpp"

namespace tradesim::indicator {

Low::Low(const string& name) : Indicator(name) {}

void Low::Initialize() {}

double Low::Calculate() { return GetCurrentBar().low; }

}  // namespace tradesim::indicator
