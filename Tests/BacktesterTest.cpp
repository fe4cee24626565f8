// 표준 라이브러리
#include <filesystem>

// 내부 헤더
#include "Engines/BaseBroker.hpp"
#include "Engines/Exception.hpp"
#include "Engines/PaperBroker.hpp"
#include "Engines/StrategyLoader.hpp"

// 파일 헤더
#include "BacktesterTest.hpp"

using namespace tradesim::exception;
using namespace tradesim::test;
using tradesim::analyzer::TradeType;
using tradesim::broker::BaseBroker;
using tradesim::broker::OrderConfirmation;
using tradesim::broker::OrderSide;
using tradesim::broker::OrderType;
using tradesim::broker::TimeInForce;
using tradesim::broker::PaperBroker;
using tradesim::strategy::LoadStrategy;

namespace {

const vector<double> kCrossoverCloses = {10, 11, 12, 9, 8, 10, 13, 15, 14, 16};

/// 모든 주문을 주문 실패로 거부하는 브로커
class RejectingBroker final : public BaseBroker {
 public:
  OrderConfirmation PlaceOrder(const string& instrument, double, OrderSide,
                               double, OrderType, TimeInForce) override {
    throw OrderFailed("[" + instrument + "] 주문 거부");
  }
};

}  // namespace

void BacktesterTest::SetUp() {
  logger = CreateTestLogger();
  results_directory = GetTestDirectory("BacktesterTest");
  filesystem::remove_all(results_directory);

  config = Config();
  config.SetInitialBalance(10000).SetResultsDirectory(results_directory);
}

void BacktesterTest::TearDown() { filesystem::remove_all(results_directory); }

Backtester BacktesterTest::MakeBacktester(
    const StrategyConfig& strategy_config) const {
  return {LoadStrategy(strategy_config, logger), config, logger};
}

TEST_F(BacktesterTest, SmaCrossoverRun) {
  StrategyConfig strategy_config(SMA_CROSSOVER);
  strategy_config.SetParameter("short_window", 2)
      .SetParameter("long_window", 3);

  const auto& backtester = MakeBacktester(strategy_config);
  const auto& bars = MakeBarsFromCloses(kCrossoverCloses, "AAPL");
  const auto& result = backtester.Run(bars);

  EXPECT_EQ(result.instrument, "AAPL");
  EXPECT_EQ(result.strategy_name, "sma_crossover");
  ASSERT_EQ(result.equity_curve.size(), bars.GetNumBars());

  // 첫 매수는 단기 이동평균이 장기 이동평균을 처음 넘는 바 2
  ASSERT_FALSE(result.trades.empty());
  EXPECT_EQ(result.trades[0].GetTradeType(), TradeType::BUY);
  EXPECT_EQ(result.trades[0].GetTimestamp(), bars.GetBar(2).timestamp);
  EXPECT_DOUBLE_EQ(result.trades[0].GetPrice(), 12.0);

  EXPECT_DOUBLE_EQ(result.final_cash, result.metrics.final_capital);
  EXPECT_LE(result.metrics.max_drawdown, 0.0);
}

TEST_F(BacktesterTest, RunsAreIndependent) {
  StrategyConfig strategy_config(SMA_CROSSOVER);
  strategy_config.SetParameter("short_window", 2)
      .SetParameter("long_window", 3);

  const auto& backtester = MakeBacktester(strategy_config);
  const auto& bars = MakeBarsFromCloses(kCrossoverCloses);

  const auto& first = backtester.Run(bars);
  const auto& second = backtester.Run(bars);

  EXPECT_EQ(first.trades.size(), second.trades.size());
  EXPECT_DOUBLE_EQ(first.final_cash, second.final_cash);
  EXPECT_EQ(first.equity_curve.size(), second.equity_curve.size());
}

TEST_F(BacktesterTest, SmaThresholdSamplesEquityBeforeSignals) {
  StrategyConfig strategy_config(SMA_THRESHOLD);
  strategy_config.SetParameter("sma_period", 3);

  const auto& backtester = MakeBacktester(strategy_config);
  const auto& bars = MakeBarsFromCloses({10, 10, 9, 12, 13, 14});
  const auto& result = backtester.Run(bars);

  ASSERT_EQ(result.equity_curve.size(), bars.GetNumBars());

  // 바 3에서 진입해도 바 3의 자산은 진입 전 현금
  ASSERT_FALSE(result.trades.empty());
  EXPECT_EQ(result.trades[0].GetTimestamp(), bars.GetBar(3).timestamp);
  EXPECT_DOUBLE_EQ(result.equity_curve[3].equity, 10000.0);
}

TEST_F(BacktesterTest, EmptyBarsProduceEmptyResult) {
  const auto& backtester = MakeBacktester(StrategyConfig(DONCHIAN));
  const auto& result = backtester.Run(MakeBarsFromCloses({}));

  EXPECT_TRUE(result.trades.empty());
  EXPECT_TRUE(result.equity_curve.empty());
  EXPECT_DOUBLE_EQ(result.metrics.final_capital, 10000.0);
}

TEST_F(BacktesterTest, EveryFamilyRunsOnShortHistory) {
  const auto& bars = MakeBarsFromCloses(kCrossoverCloses);

  for (const auto family : {DONCHIAN, DONCHIAN_ATR, SMA_THRESHOLD,
                            SMA_CROSSOVER, EMA_CROSSOVER, MACD_VOLATILITY}) {
    const auto& result = MakeBacktester(StrategyConfig(family)).Run(bars);
    EXPECT_EQ(result.equity_curve.size(), bars.GetNumBars())
        << StrategyFamilyToString(family);
  }
}

TEST_F(BacktesterTest, BrokerReceivesEveryTrade) {
  StrategyConfig strategy_config(SMA_CROSSOVER);
  strategy_config.SetParameter("short_window", 2)
      .SetParameter("long_window", 3);

  const auto broker = make_shared<PaperBroker>(logger);
  const Backtester backtester(LoadStrategy(strategy_config, logger), config,
                              logger, broker);
  const auto& result = backtester.Run(MakeBarsFromCloses(kCrossoverCloses));

  EXPECT_EQ(broker->GetOrders().size(), result.trades.size());
}

TEST_F(BacktesterTest, NullStrategyThrowsConfigError) {
  EXPECT_THROW(static_cast<void>(Backtester(nullptr, config, logger)),
               ConfigError);
}

TEST_F(BacktesterTest, SaveResultWritesInstrumentDirectory) {
  StrategyConfig strategy_config(SMA_CROSSOVER);
  strategy_config.SetParameter("short_window", 2)
      .SetParameter("long_window", 3);

  const auto& backtester = MakeBacktester(strategy_config);
  const auto& result =
      backtester.Run(MakeBarsFromCloses(kCrossoverCloses, "BTC/USD"));
  backtester.SaveResult(result);

  const auto& directory = results_directory + "/BTC_USD";
  EXPECT_TRUE(filesystem::exists(directory + "/trade_list.json"));
  EXPECT_TRUE(filesystem::exists(directory + "/equity_curve.parquet"));
  EXPECT_TRUE(filesystem::exists(directory + "/metrics.json"));
}

TEST_F(BacktesterTest, BrokerFailureOnGenericPathThrowsExecutionFailure) {
  StrategyConfig strategy_config(SMA_CROSSOVER);
  strategy_config.SetParameter("short_window", 2)
      .SetParameter("long_window", 3);

  const Backtester backtester(LoadStrategy(strategy_config, logger), config,
                              logger, make_shared<RejectingBroker>());

  EXPECT_THROW(
      static_cast<void>(backtester.Run(MakeBarsFromCloses(kCrossoverCloses))),
      ExecutionFailure);
}

TEST_F(BacktesterTest, BrokerFailureOnCustomPathThrowsExecutionFailure) {
  StrategyConfig strategy_config(SMA_THRESHOLD);
  strategy_config.SetParameter("sma_period", 3);

  const Backtester backtester(LoadStrategy(strategy_config, logger), config,
                              logger, make_shared<RejectingBroker>());
  ASSERT_EQ(backtester.GetStrategy()->GetRunMode(),
            tradesim::strategy::CUSTOM);

  EXPECT_THROW(static_cast<void>(backtester.Run(
                   MakeBarsFromCloses({10, 10, 9, 12, 13, 14}))),
               ExecutionFailure);
}
