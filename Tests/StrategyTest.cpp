// 표준 라이브러리
#include <algorithm>

// 내부 헤더
#include "Engines/Exception.hpp"
#include "Engines/StrategyLoader.hpp"
#include "Strategies/DonchianStrategy.hpp"

// 파일 헤더
#include "StrategyTest.hpp"

using namespace tradesim::exception;
using namespace tradesim::test;
using tradesim::indicator::IndicatorEngine;

void StrategyTest::SetUp() { logger = CreateTestLogger(); }

vector<tradesim::signal::Signal> StrategyTest::GenerateSignals(
    const Strategy& strategy, const tradesim::bar::BarData& bars) const {
  IndicatorEngine indicators(logger);
  strategy.Initialize(indicators);
  indicators.Compute(bars);

  return strategy.GenerateSignals(indicators);
}

TEST_F(StrategyTest, LoaderCreatesEveryFamily) {
  for (const auto family : {DONCHIAN, DONCHIAN_ATR, SMA_THRESHOLD,
                            SMA_CROSSOVER, EMA_CROSSOVER, MACD_VOLATILITY}) {
    const auto& strategy = LoadStrategy(StrategyConfig(family), logger);

    ASSERT_NE(strategy, nullptr);
    EXPECT_EQ(strategy->GetName(), StrategyFamilyToString(family));
    EXPECT_EQ(strategy->GetConfig().GetFamily(), family);
  }
}

TEST_F(StrategyTest, RunModeAndAtrSeries) {
  EXPECT_EQ(LoadStrategy(StrategyConfig(SMA_THRESHOLD), logger)->GetRunMode(),
            CUSTOM);
  EXPECT_EQ(LoadStrategy(StrategyConfig(DONCHIAN), logger)->GetRunMode(),
            GENERIC);

  EXPECT_EQ(
      LoadStrategy(StrategyConfig(EMA_CROSSOVER), logger)->GetAtrSeriesName(),
      "atr");
  EXPECT_TRUE(LoadStrategy(StrategyConfig(SMA_CROSSOVER), logger)
                  ->GetAtrSeriesName()
                  .empty());
}

TEST_F(StrategyTest, CrossoverWindowsMustBeOrdered) {
  StrategyConfig strategy_config(SMA_CROSSOVER);
  strategy_config.SetParameter("short_window", 20)
      .SetParameter("long_window", 20);

  EXPECT_THROW(static_cast<void>(LoadStrategy(strategy_config, logger)),
               ConfigError);
}

TEST_F(StrategyTest, MacdSpansMustBeOrdered) {
  StrategyConfig strategy_config(MACD_VOLATILITY);
  strategy_config.SetParameter("macd_fast", 30);

  EXPECT_THROW(static_cast<void>(LoadStrategy(strategy_config, logger)),
               ConfigError);
}

TEST_F(StrategyTest, StrategyRejectsOtherFamilies) {
  EXPECT_THROW(static_cast<void>(
                   DonchianStrategy(StrategyConfig(SMA_CROSSOVER), logger)),
               ConfigError);
}

TEST_F(StrategyTest, DonchianBreakoutBuysAboveChannel) {
  StrategyConfig strategy_config(DONCHIAN_ATR);
  strategy_config.SetParameter("donchian_entry_window", 3)
      .SetParameter("donchian_exit_window", 2)
      .SetParameter("atr_period", 2)
      .SetParameter("atr_median_window", 3)
      .SetParameter("atr_mult_entry", 0)
      .SetParameter("sma_trend_period", 0)
      .SetParameter("sma_momentum_period", 2);

  const auto& strategy = LoadStrategy(strategy_config, logger);

  vector<tradesim::bar::Bar> bars;
  for (size_t day = 0; day < 5; day++) {
    bars.push_back(MakeBar(day, 100, 101, 99, 100));
  }
  bars.push_back(MakeBar(5, 105, 111, 104, 110));  // 돌파
  bars.push_back(MakeBar(6, 100, 101, 90, 92));    // 채널 하단 이탈

  const auto& signals = GenerateSignals(
      *strategy, {"TEST", tradesim::utils::DAY_1, std::move(bars)});
  ASSERT_EQ(signals.size(), 7u);

  for (size_t day = 0; day < 5; day++) {
    EXPECT_FALSE(signals[day].buy) << "day " << day;
  }
  EXPECT_TRUE(signals[5].buy);
  EXPECT_FALSE(signals[6].buy);
  EXPECT_TRUE(signals[6].sell);
}

TEST_F(StrategyTest, SmaCrossoverSignalsOnSampleCloses) {
  StrategyConfig strategy_config(SMA_CROSSOVER);
  strategy_config.SetParameter("short_window", 2)
      .SetParameter("long_window", 3);

  const auto& signals =
      GenerateSignals(*LoadStrategy(strategy_config, logger),
                      MakeBarsFromCloses({10, 11, 12, 9, 8}));

  ASSERT_EQ(signals.size(), 5u);
  EXPECT_TRUE(signals[2].buy);
  EXPECT_EQ(count_if(signals.begin(), signals.end(),
                     [](const auto& signal) { return signal.buy; }),
            1);

  // 단기 이동평균이 장기 이동평균 아래로 내려간 바 3에서 매도
  EXPECT_TRUE(signals[3].sell);
  EXPECT_FALSE(signals[4].sell);
}

TEST_F(StrategyTest, EmaCrossoverSellsWhileBelow) {
  StrategyConfig strategy_config(EMA_CROSSOVER);
  strategy_config.SetParameter("short_window", 2)
      .SetParameter("long_window", 4);

  const auto& signals =
      GenerateSignals(*LoadStrategy(strategy_config, logger),
                      MakeBarsFromCloses({10, 9, 8, 7, 6}));

  // 하락이 이어지는 동안 매 바 매도 신호
  for (size_t idx = 1; idx < signals.size(); idx++) {
    EXPECT_TRUE(signals[idx].sell) << "bar " << idx;
  }
}

TEST_F(StrategyTest, MacdVolatilityBuysAndSellsWithExpandingRange) {
  StrategyConfig strategy_config(MACD_VOLATILITY);
  strategy_config.SetParameter("macd_fast", 2)
      .SetParameter("macd_slow", 3)
      .SetParameter("macd_signal", 2)
      .SetParameter("sma_fast_period", 2)
      .SetParameter("sma_slow_period", 3)
      .SetParameter("channel_period", 2)
      .SetParameter("volatility_median_window", 2)
      .SetParameter("atr_period", 2);

  vector<tradesim::bar::Bar> bars = {MakeBar(0, 10, 10.5, 9.5, 10),
                                     MakeBar(1, 10, 10.5, 9.5, 10),
                                     MakeBar(2, 10, 10.5, 9.5, 10),
                                     MakeBar(3, 10, 11.5, 10, 11),
                                     MakeBar(4, 11, 11, 8, 8.5)};

  const auto& signals =
      GenerateSignals(*LoadStrategy(strategy_config, logger),
                      {"TEST", tradesim::utils::DAY_1, std::move(bars)});
  ASSERT_EQ(signals.size(), 5u);

  // MACD와 시그널이 모두 0인 구간에서는 신호 없음
  for (size_t idx = 0; idx < 3; idx++) {
    EXPECT_FALSE(signals[idx].buy) << "bar " << idx;
    EXPECT_FALSE(signals[idx].sell) << "bar " << idx;
  }

  // 바 3: MACD > 시그널, 종가 > 단기 SMA > 장기 SMA, 변동성 2 > 중앙값 1.5
  EXPECT_TRUE(signals[3].buy);

  // 바 4: 모든 조건이 반대로 성립하고 변동성 3.5 > 중앙값 2.75
  EXPECT_FALSE(signals[4].buy);
  EXPECT_TRUE(signals[4].sell);
}

TEST_F(StrategyTest, SmaThresholdBuyNeedsPreviousLowStrictlyBelowSma) {
  StrategyConfig strategy_config(SMA_THRESHOLD);
  strategy_config.SetParameter("sma_period", 3);
  const auto& strategy = LoadStrategy(strategy_config, logger);

  // 직전 저가 10이 SMA 10과 같으면 매수하지 않음
  const auto& flat_signals =
      GenerateSignals(*strategy, MakeBarsFromCloses({10, 10, 10, 12}));
  EXPECT_FALSE(flat_signals[3].buy);

  // 직전 저가 9가 SMA 9.67 아래면 매수
  const auto& dip_signals =
      GenerateSignals(*strategy, MakeBarsFromCloses({10, 10, 9, 12}));
  EXPECT_TRUE(dip_signals[3].buy);
}
