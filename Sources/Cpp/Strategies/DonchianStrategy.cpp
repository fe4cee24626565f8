// 파일 헤더
#include "Strategies/DonchianStrategy.hpp"

// 네임 스페이스
using namespace tradesim::indicator;
using namespace tradesim::signal;

namespace tradesim::strategy {

DonchianStrategy::DonchianStrategy(const StrategyConfig& config,
                                   shared_ptr<Logger> logger)
    : Strategy(engine::StrategyFamilyToString(config.GetFamily()), config,
               std::move(logger)) {
  CheckFamily({engine::DONCHIAN, engine::DONCHIAN_ATR});

  SignalRule buy_rule;
  buy_rule.conditions = {
      {"close", GREATER, "donchian_high"},
      {"today_range", GREATER, "atr_median",
       config.GetParameter("atr_mult_entry")},
      {"close", GREATER, "sma_momentum"}};

  if (config.GetWindow("sma_trend_period") > 0) {
    buy_rule.conditions.push_back({"close", GREATER, "sma_trend"});
  }

  SignalRule sell_rule;
  sell_rule.conditions = {{"close", LESS, "donchian_low"}};

  signal_generator_.SetBuyRule(buy_rule).SetSellRule(sell_rule);
}
DonchianStrategy::~DonchianStrategy() = default;

void DonchianStrategy::Initialize(IndicatorEngine& indicators) const {
  const auto& config = GetConfig();
  const auto channel_policy =
      config.GetFlag("full_channel_window") ? FULL : PARTIAL;
  const auto shift = config.GetWindow("donchian_shift");

  indicators.AddIndicator<Highest>("donchian_high", indicators.high,
                                   config.GetWindow("donchian_entry_window"),
                                   channel_policy, shift);
  indicators.AddIndicator<Lowest>("donchian_low", indicators.low,
                                  config.GetWindow("donchian_exit_window"),
                                  channel_policy, shift);

  // 변동성 필터: 당일 범위 > 배수 × ATR 중앙값
  auto& atr = indicators.AddIndicator<SimpleAverageTrueRange>(
      "atr", config.GetWindow("atr_period"), PARTIAL);
  indicators.AddIndicator<RollingMedian>(
      "atr_median", atr, config.GetWindow("atr_median_window"), PARTIAL);
  indicators.AddIndicator<Difference>("today_range", indicators.high,
                                      indicators.low);

  if (const auto trend_period = config.GetWindow("sma_trend_period");
      trend_period > 0) {
    indicators.AddIndicator<SimpleMovingAverage>(
        "sma_trend", indicators.close, trend_period, PARTIAL);
  }

  indicators.AddIndicator<SimpleMovingAverage>(
      "sma_momentum", indicators.close,
      config.GetWindow("sma_momentum_period"), PARTIAL);
}

}  // namespace tradesim::strategy
