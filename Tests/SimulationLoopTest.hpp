#pragma once

// 표준 라이브러리
#include <memory>

// 외부 라이브러리
#include <gtest/gtest.h>

// 내부 헤더
#include "Engines/PositionManager.hpp"
#include "Engines/RunContext.hpp"
#include "Engines/SimulationLoop.hpp"
#include "TestHelpers.hpp"

using namespace std;
using namespace tradesim::engine;

class SimulationLoopTest : public testing::Test {
 protected:
  shared_ptr<tradesim::logger::Logger> logger;
  RiskConfig risk_config;
  unique_ptr<SimulationLoop> simulation_loop;

  void SetUp() override;
};
