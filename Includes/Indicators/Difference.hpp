#pragma once

// 내부 헤더
#include "Engines/Indicator.hpp"

namespace tradesim::indicator {

/// 두 지표의 차이 (minuend - subtrahend).\n
/// 바의 범위(고가 - 저가)나 채널 폭 계산에 사용
class Difference final : public Indicator {
 public:
  explicit Difference(const string& name, Indicator& minuend,
                      Indicator& subtrahend);

 private:
  Indicator& minuend_;
  Indicator& subtrahend_;

  void Initialize() override;
  double Calculate() override;
};

}  // namespace tradesim::indicator
