// 파일 헤더
#include "Indicators/High.hpp"

namespace tradesim::indicator {

High::High(const string& name) : Indicator(name) {}

void High::Initialize() {}

double High::Calculate() { return GetCurrentBar().high; }

}  // namespace tradesim::indicator
