#pragma once

// 내부 헤더
#include "Engines/Indicator.hpp"

namespace tradesim::indicator {

/// Simple Average True Range.\n
/// True Range의 단순 이동평균
class SimpleAverageTrueRange final : public Indicator {
 public:
  explicit SimpleAverageTrueRange(const string& name, size_t period,
                                  WindowPolicy policy = PARTIAL);

 private:
  WindowPolicy policy_;
  RollingWindow window_;
  double prev_close_;  // TR 계산용

  void Initialize() override;
  double Calculate() override;
};

}  // namespace tradesim::indicator
