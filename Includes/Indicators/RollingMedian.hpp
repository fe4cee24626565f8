#pragma once

// 표준 라이브러리
#include <vector>

// 내부 헤더
#include "Engines/Indicator.hpp"

namespace tradesim::indicator {

/// 소스 지표의 최근 period개 바의 중앙값.\n
/// 변동성 필터의 기준선으로 사용
class RollingMedian final : public Indicator {
 public:
  explicit RollingMedian(const string& name, Indicator& source, size_t period,
                         WindowPolicy policy = FULL);

 private:
  Indicator& source_;
  size_t period_;
  WindowPolicy policy_;
  vector<double> values_;

  void Initialize() override;
  double Calculate() override;
};

}  // namespace tradesim::indicator
