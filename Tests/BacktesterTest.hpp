#pragma once

// 표준 라이브러리
#include <memory>
#include <string>

// 외부 라이브러리
#include <gtest/gtest.h>

// 내부 헤더
#include "Engines/Backtester.hpp"
#include "TestHelpers.hpp"

using namespace std;
using namespace tradesim::engine;

class BacktesterTest : public testing::Test {
 protected:
  shared_ptr<tradesim::logger::Logger> logger;
  Config config;
  string results_directory;

  void SetUp() override;
  void TearDown() override;

  /// 주어진 전략 설정으로 실행기를 만드는 함수
  [[nodiscard]] Backtester MakeBacktester(
      const StrategyConfig& strategy_config) const;
};
