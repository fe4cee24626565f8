// 파일 헤더
#include "Indicators/Close.hpp"

namespace tradesim::indicator {

Close::Close(const string& name) : Indicator(name) {}

void Close::Initialize() {}

double Close::Calculate() { return GetCurrentBar().close; }

}  // namespace tradesim::indicator
