// 파일 헤더
#include "Indicators/Open.hpp"

namespace tradesim::indicator {

Open::Open(const string& name) : Indicator(name) {}

void Open::Initialize() {}

double Open::Calculate() { return GetCurrentBar().open; }

}  // namespace tradesim::indicator
