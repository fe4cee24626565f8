// 파일 헤더
#include "Strategies/MacdVolatilityStrategy.hpp"

// 내부 헤더
#include "Engines/Exception.hpp"

// 네임 스페이스
using namespace tradesim::exception;
using namespace tradesim::indicator;
using namespace tradesim::signal;

namespace tradesim::strategy {

MacdVolatilityStrategy::MacdVolatilityStrategy(const StrategyConfig& config,
                                               shared_ptr<Logger> logger)
    : Strategy(engine::StrategyFamilyToString(config.GetFamily()), config,
               std::move(logger)) {
  CheckFamily({engine::MACD_VOLATILITY});

  if (config.GetWindow("macd_fast") >= config.GetWindow("macd_slow")) {
    logger_->LogAndThrowError<ConfigError>(
        "MACD 빠른 기간은 느린 기간보다 작아야 합니다.", __FILE__, __LINE__);
  }

  const Condition volatility_filter = {"volatility", GREATER,
                                       "volatility_median"};

  SignalRule buy_rule;
  buy_rule.conditions = {{"macd", GREATER, "macd_signal"},
                         {"close", GREATER, "sma_fast"},
                         {"sma_fast", GREATER, "sma_slow"},
                         volatility_filter};

  SignalRule sell_rule;
  sell_rule.conditions = {{"macd", LESS_OR_EQUAL, "macd_signal"},
                          {"close", LESS, "sma_fast"},
                          {"sma_fast", LESS, "sma_slow"},
                          volatility_filter};

  signal_generator_.SetBuyRule(buy_rule).SetSellRule(sell_rule);
}
MacdVolatilityStrategy::~MacdVolatilityStrategy() = default;

void MacdVolatilityStrategy::Initialize(IndicatorEngine& indicators) const {
  const auto& config = GetConfig();

  auto& macd = indicators.AddIndicator<MovingAverageConvergenceDivergence>(
      "macd", indicators.close, config.GetWindow("macd_fast"),
      config.GetWindow("macd_slow"));
  indicators.AddIndicator<ExponentialMovingAverage>(
      "macd_signal", macd, config.GetWindow("macd_signal"));

  indicators.AddIndicator<SimpleMovingAverage>(
      "sma_fast", indicators.close, config.GetWindow("sma_fast_period"), FULL);
  indicators.AddIndicator<SimpleMovingAverage>(
      "sma_slow", indicators.close, config.GetWindow("sma_slow_period"), FULL);

  const auto channel_period = config.GetWindow("channel_period");
  auto& channel_high = indicators.AddIndicator<Highest>(
      "channel_high", indicators.high, channel_period, FULL);
  auto& channel_low = indicators.AddIndicator<Lowest>(
      "channel_low", indicators.low, channel_period, FULL);
  auto& volatility = indicators.AddIndicator<Difference>(
      "volatility", channel_high, channel_low);
  indicators.AddIndicator<RollingMedian>(
      "volatility_median", volatility,
      config.GetWindow("volatility_median_window"), FULL);

  indicators.AddIndicator<SimpleAverageTrueRange>(
      "atr", config.GetWindow("atr_period"), FULL);
}

}  // namespace tradesim::strategy
