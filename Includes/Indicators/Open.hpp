#pragma once

// 내부 헤더
#include "Engines/Indicator.hpp"

namespace tradesim::indicator {

/// 전략 작성 편의성용 바의 시가 데이터 지표화
class Open final : public Indicator {
 public:
  explicit Open(const string& name);

 private:
  void Initialize() override;
  double Calculate() override;
};

}  // namespace tradesim::indicator
