#pragma once

// 표준 라이브러리
#include <vector>

// 내부 헤더
#include "Engines/Indicator.hpp"

namespace tradesim::indicator {

/// 소스 지표의 최근 period개 바 중 최댓값.\n
/// shift가 1이면 현재 바를 제외한 이전 바들로 윈도우를 구성 (Donchian 채널)
class Highest final : public Indicator {
 public:
  explicit Highest(const string& name, Indicator& source, size_t period,
                   WindowPolicy policy = FULL, size_t shift = 0);

 private:
  Indicator& source_;
  size_t period_;
  WindowPolicy policy_;
  size_t shift_;
  vector<double> values_;  // 윈도우 수집용 버퍼

  void Initialize() override;
  double Calculate() override;
};

}  // namespace tradesim::indicator
