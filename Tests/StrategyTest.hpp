#pragma once

// 표준 라이브러리
#include <memory>

// 외부 라이브러리
#include <gtest/gtest.h>

// 내부 헤더
#include "Engines/IndicatorEngine.hpp"
#include "Engines/Strategy.hpp"
#include "TestHelpers.hpp"

using namespace std;
using namespace tradesim::engine;
using namespace tradesim::strategy;

class StrategyTest : public testing::Test {
 protected:
  shared_ptr<tradesim::logger::Logger> logger;

  void SetUp() override;

  /// 전략의 지표를 계산하고 신호를 생성하는 함수
  [[nodiscard]] vector<tradesim::signal::Signal> GenerateSignals(
      const Strategy& strategy, const tradesim::bar::BarData& bars) const;
};
