// 파일 헤더
#include "Indicators/Difference.hpp"

namespace tradesim::indicator {

Difference::Difference(const string& name, Indicator& minuend,
                       Indicator& subtrahend)
    : Indicator(name), minuend_(minuend), subtrahend_(subtrahend) {}

void Difference::Initialize() {}

double Difference::Calculate() { return minuend_[0] - subtrahend_[0]; }

}  // namespace tradesim::indicator
