#pragma once

// 내부 헤더
#include "Engines/Indicator.hpp"

namespace tradesim::indicator {

/// True Range.\n
/// max(고가 - 저가, |고가 - 전 종가|, |저가 - 전 종가|), 첫 바는 고가 - 저가
class TrueRange final : public Indicator {
 public:
  explicit TrueRange(const string& name);

  /// 전 종가가 주어졌을 때의 True Range를 계산하는 함수.
  /// 전 종가가 NaN이면 고가 - 저가
  [[nodiscard]] static double CalculateTrueRange(const Bar& bar,
                                                  double prev_close);

 private:
  double prev_close_;

  void Initialize() override;
  double Calculate() override;
};

}  // namespace tradesim::indicator
