#pragma once

// 표준 라이브러리
#include <memory>

// 외부 라이브러리
#include <gtest/gtest.h>

// 내부 헤더
#include "Engines/Config.hpp"
#include "Engines/PositionManager.hpp"
#include "Engines/RunContext.hpp"
#include "TestHelpers.hpp"

using namespace std;
using namespace tradesim::engine;
using namespace tradesim::order;

class PositionManagerTest : public testing::Test {
 protected:
  shared_ptr<tradesim::logger::Logger> logger;
  RiskConfig atr_risk_config;
  RiskConfig debit_config;
  unique_ptr<RunContext> context;

  void SetUp() override;
};
