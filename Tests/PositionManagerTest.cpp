// 표준 라이브러리
#include <cmath>

// 내부 헤더
#include "Engines/PaperBroker.hpp"

// 파일 헤더
#include "PositionManagerTest.hpp"

using namespace tradesim::test;
using tradesim::analyzer::TradeType;
using tradesim::broker::OrderSide;
using tradesim::broker::PaperBroker;
using tradesim::signal::Signal;

namespace {

Signal BuySignal() { return {true, false}; }
Signal SellSignal() { return {false, true}; }
Signal HoldSignal() { return {false, false}; }

}  // namespace

void PositionManagerTest::SetUp() {
  logger = CreateTestLogger();

  atr_risk_config = RiskConfig();
  atr_risk_config.sizing_mode = ATR_RISK;
  atr_risk_config.entry_accounting = TRACK_EXPOSURE;
  atr_risk_config.sell_action = OPEN_SHORT;
  atr_risk_config.risk_per_trade_fraction = 0.01;
  atr_risk_config.stop_atr_multiple = 2.0;
  atr_risk_config.max_notional_fraction = 0.10;
  atr_risk_config.min_notional = 10.0;

  debit_config = RiskConfig();
  debit_config.sizing_mode = BALANCE_FRACTION;
  debit_config.entry_accounting = DEBIT_NOTIONAL;
  debit_config.sell_action = EXIT_LONG;
  debit_config.balance_investment_fraction = 0.8;
  debit_config.use_stop_loss = false;

  context = make_unique<RunContext>("TEST", 10000.0);
}

TEST_F(PositionManagerTest, AtrRiskSizing) {
  PositionManager manager(atr_risk_config, logger);

  // 10,000 × 0.01 / (2 × 5) = 10
  const auto trade =
      manager.TryEnter(LONG, 50.0, 5.0, kTestStartMs, "BUY_SIGNAL", *context);
  ASSERT_TRUE(trade.has_value());
  EXPECT_DOUBLE_EQ(trade->GetSize(), 10.0);
  EXPECT_EQ(trade->GetTradeType(), TradeType::ENTRY);
  EXPECT_EQ(trade->GetTradeNumber(), 1);

  const auto& position = context->GetPositions().front();
  EXPECT_DOUBLE_EQ(position.stop_price, 40.0);
  EXPECT_TRUE(isnan(position.take_profit_price));

  // 노출 추적 방식은 진입 시 현금이 변하지 않음
  EXPECT_DOUBLE_EQ(context->GetCash(), 10000.0);
  EXPECT_DOUBLE_EQ(trade->GetBalance(), 10000.0);
}

TEST_F(PositionManagerTest, AtrRiskSizingIsClampedToMaxNotional) {
  PositionManager manager(atr_risk_config, logger);

  // 10 × 200 = 2,000 > 10,000 × 0.10 → 1,000 / 200 = 5
  const auto trade =
      manager.TryEnter(LONG, 200.0, 5.0, kTestStartMs, "BUY_SIGNAL", *context);
  ASSERT_TRUE(trade.has_value());
  EXPECT_DOUBLE_EQ(trade->GetSize(), 5.0);
  EXPECT_DOUBLE_EQ(context->GetTrades().back().GetSize(), 5.0);
}

TEST_F(PositionManagerTest, SkipsEntryBelowMinNotional) {
  PositionManager manager(atr_risk_config, logger);

  // 100 / 2,000 = 0.05 → 0.05 × 50 = 2.5 < 10
  EXPECT_FALSE(manager
                   .TryEnter(LONG, 50.0, 1000.0, kTestStartMs, "BUY_SIGNAL",
                             *context)
                   .has_value());
  EXPECT_TRUE(context->GetTrades().empty());
}

TEST_F(PositionManagerTest, SkipsAtrEntryWithoutAtr) {
  PositionManager manager(atr_risk_config, logger);

  EXPECT_FALSE(manager
                   .TryEnter(LONG, 50.0, nan(""), kTestStartMs, "BUY_SIGNAL",
                             *context)
                   .has_value());
  EXPECT_FALSE(
      manager.TryEnter(LONG, 50.0, 0.0, kTestStartMs, "BUY_SIGNAL", *context)
          .has_value());
}

TEST_F(PositionManagerTest, OnePositionPerDirection) {
  PositionManager manager(atr_risk_config, logger);

  EXPECT_TRUE(
      manager.TryEnter(LONG, 50.0, 5.0, kTestStartMs, "BUY_SIGNAL", *context)
          .has_value());
  EXPECT_FALSE(
      manager.TryEnter(LONG, 51.0, 5.0, kTestStartMs, "BUY_SIGNAL", *context)
          .has_value());
  EXPECT_TRUE(
      manager.TryEnter(SHORT, 50.0, 5.0, kTestStartMs, "SELL_SIGNAL", *context)
          .has_value());

  EXPECT_EQ(context->GetNumOpenPositions(), 2u);
}

TEST_F(PositionManagerTest, StopIsCheckedBeforeEntryWithinBar) {
  PositionManager manager(atr_risk_config, logger);
  manager.OnBar(MakeBar(0, 50, 50, 50, 50), BuySignal(),
                5.0, *context);

  // 저가가 손절가 40 이하 → 손절 후 같은 바에서 다시 진입
  const auto& trades =
      manager.OnBar(MakeBar(1, 45, 46, 39, 42), BuySignal(), 5.0, *context);
  ASSERT_EQ(trades.size(), 2u);

  EXPECT_EQ(trades[0].GetReason(), "STOP_LOSS");
  EXPECT_DOUBLE_EQ(trades[0].GetPrice(), 40.0);
  EXPECT_DOUBLE_EQ(*trades[0].GetProfit(), -100.0);
  EXPECT_EQ(trades[1].GetReason(), "BUY_SIGNAL");
  EXPECT_DOUBLE_EQ(trades[1].GetPrice(), 42.0);

  EXPECT_DOUBLE_EQ(context->GetCash(), 9900.0);
  EXPECT_EQ(context->GetNumOpenPositions(), 1u);
}

TEST_F(PositionManagerTest, ShortStopAndTakeProfit) {
  atr_risk_config.take_profit_atr_multiple = 3.0;
  PositionManager manager(atr_risk_config, logger);

  manager.OnBar(MakeBar(0, 100, 100, 100, 100),
                SellSignal(), 5.0, *context);
  ASSERT_EQ(context->GetNumOpenPositions(), 1u);

  const auto& short_position = context->GetPositions().front();
  EXPECT_EQ(short_position.direction, SHORT);
  EXPECT_DOUBLE_EQ(short_position.stop_price, 110.0);
  EXPECT_DOUBLE_EQ(short_position.take_profit_price, 85.0);

  // 저가가 익절가 85 이하
  const auto& trades =
      manager.OnBar(MakeBar(1, 90, 92, 84, 88), HoldSignal(), 5.0, *context);
  ASSERT_EQ(trades.size(), 1u);
  EXPECT_EQ(trades[0].GetReason(), "TAKE_PROFIT");
  EXPECT_DOUBLE_EQ(trades[0].GetPrice(), 85.0);
  EXPECT_GT(*trades[0].GetProfit(), 0.0);
}

TEST_F(PositionManagerTest, DebitNotionalEntryAndExit) {
  PositionManager manager(debit_config, logger);

  // 10,000 × 0.8 / 100 = 80
  auto trades =
      manager.OnBar(MakeBar(0, 100, 100, 100, 100), BuySignal(), nan(""),
                    *context);
  ASSERT_EQ(trades.size(), 1u);
  EXPECT_EQ(trades[0].GetTradeType(), TradeType::BUY);
  EXPECT_DOUBLE_EQ(trades[0].GetSize(), 80.0);
  EXPECT_DOUBLE_EQ(context->GetCash(), 2000.0);
  EXPECT_DOUBLE_EQ(PositionManager::GetEquity(*context, 100.0), 10000.0);

  trades = manager.OnBar(MakeBar(1, 110, 110, 110, 110), SellSignal(),
                         nan(""), *context);
  ASSERT_EQ(trades.size(), 1u);
  EXPECT_EQ(trades[0].GetTradeType(), TradeType::SELL);
  EXPECT_EQ(trades[0].GetReason(), "SELL_SIGNAL");
  EXPECT_DOUBLE_EQ(*trades[0].GetProfit(), 800.0);
  EXPECT_DOUBLE_EQ(context->GetCash(), 10800.0);
  EXPECT_EQ(context->GetNumOpenPositions(), 0u);
}

TEST_F(PositionManagerTest, DebitNotionalSkipsWhenCashIsInsufficient) {
  debit_config.sizing_mode = FIXED_QUANTITY;
  debit_config.fixed_quantity = 200.0;
  PositionManager manager(debit_config, logger);

  EXPECT_FALSE(
      manager.TryEnter(LONG, 100.0, nan(""), kTestStartMs, "BUY_SIGNAL",
                       *context)
          .has_value());
  EXPECT_DOUBLE_EQ(context->GetCash(), 10000.0);
}

TEST_F(PositionManagerTest, ProfitGatedExit) {
  debit_config.profit_gated_exit = true;
  debit_config.profit_threshold = 0.2;
  PositionManager manager(debit_config, logger);

  manager.OnBar(MakeBar(0, 100, 100, 100, 100), BuySignal(),
                nan(""), *context);

  // 수익률 10%는 임계값 미만
  EXPECT_TRUE(manager
                  .OnBar(MakeBar(1, 110, 110, 110, 110), SellSignal(),
                         nan(""), *context)
                  .empty());

  // 손실 중에는 청산하지 않음
  EXPECT_TRUE(manager
                  .OnBar(MakeBar(2, 90, 90, 90, 90), SellSignal(), nan(""),
                         *context)
                  .empty());

  const auto& trades = manager.OnBar(MakeBar(3, 125, 125, 125, 125),
                                     SellSignal(), nan(""), *context);
  ASSERT_EQ(trades.size(), 1u);
  EXPECT_EQ(trades[0].GetReason(), "SELL_SIGNAL");
}

TEST_F(PositionManagerTest, NoStopWithoutAtrOrWhenDisabled) {
  atr_risk_config.sizing_mode = FIXED_QUANTITY;
  atr_risk_config.use_stop_loss = false;
  PositionManager manager(atr_risk_config, logger);

  ASSERT_TRUE(
      manager.TryEnter(LONG, 50.0, 5.0, kTestStartMs, "BUY_SIGNAL", *context)
          .has_value());
  EXPECT_TRUE(isnan(context->GetPositions().front().stop_price));

  // 가격이 크게 떨어져도 손절하지 않음
  EXPECT_TRUE(
      manager.OnBar(MakeBar(1, 10, 10, 1, 5), HoldSignal(), 5.0, *context)
          .empty());
}

TEST_F(PositionManagerTest, OrdersAreMirroredToBroker) {
  const auto broker = make_shared<PaperBroker>(logger);
  PositionManager manager(debit_config, logger, broker);

  manager.OnBar(MakeBar(0, 100, 100, 100, 100), BuySignal(),
                nan(""), *context);
  manager.OnBar(MakeBar(1, 110, 110, 110, 110),
                SellSignal(), nan(""), *context);

  const auto& orders = broker->GetOrders();
  ASSERT_EQ(orders.size(), 2u);
  EXPECT_EQ(orders[0].side, OrderSide::BUY);
  EXPECT_DOUBLE_EQ(orders[0].quantity, 80.0);
  EXPECT_EQ(orders[1].side, OrderSide::SELL);
  EXPECT_DOUBLE_EQ(orders[1].price, 110.0);
  EXPECT_EQ(orders[0].instrument, "TEST");
}

TEST_F(PositionManagerTest, TradeNumbersAreSequential) {
  PositionManager manager(debit_config, logger);

  for (size_t day = 0; day < 4; day++) {
    const auto price = day % 2 == 0 ? 100.0 : 120.0;
    manager.OnBar(MakeBar(day, price, price, price, price),
                  day % 2 == 0 ? BuySignal() : SellSignal(),
                  nan(""), *context);
  }

  const auto& trades = context->GetTrades();
  ASSERT_EQ(trades.size(), 4u);
  for (size_t idx = 0; idx < trades.size(); idx++) {
    EXPECT_EQ(trades[idx].GetTradeNumber(), static_cast<int>(idx) + 1);
  }
}
