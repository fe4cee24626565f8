// 파일 헤더
#include "Strategies/MovingAverageCrossoverStrategy.hpp"

// 내부 헤더
#include "Engines/Exception.hpp"

// 네임 스페이스
using namespace tradesim::exception;
using namespace tradesim::indicator;
using namespace tradesim::signal;

namespace tradesim::strategy {

MovingAverageCrossoverStrategy::MovingAverageCrossoverStrategy(
    const StrategyConfig& config, shared_ptr<Logger> logger)
    : Strategy(engine::StrategyFamilyToString(config.GetFamily()), config,
               std::move(logger)),
      is_exponential_(config.GetFamily() == engine::EMA_CROSSOVER) {
  CheckFamily({engine::SMA_CROSSOVER, engine::EMA_CROSSOVER});

  const auto short_window = config.GetWindow("short_window");
  const auto long_window = config.GetWindow("long_window");
  if (short_window >= long_window) {
    logger_->LogAndThrowError<ConfigError>(
        "단기 기간 [" + to_string(short_window) + "]은(는) 장기 기간 [" +
            to_string(long_window) + "]보다 작아야 합니다.",
        __FILE__, __LINE__);
  }

  SignalRule buy_rule;
  buy_rule.conditions = {{"short_ma", GREATER, "long_ma"}};
  buy_rule.style = CROSSOVER;

  SignalRule sell_rule;
  sell_rule.conditions = {{"short_ma", LESS, "long_ma"}};
  sell_rule.style = is_exponential_ ? THRESHOLD : CROSSOVER;

  signal_generator_.SetBuyRule(buy_rule).SetSellRule(sell_rule);
}
MovingAverageCrossoverStrategy::~MovingAverageCrossoverStrategy() = default;

void MovingAverageCrossoverStrategy::Initialize(
    IndicatorEngine& indicators) const {
  const auto& config = GetConfig();
  const auto short_window = config.GetWindow("short_window");
  const auto long_window = config.GetWindow("long_window");

  if (is_exponential_) {
    indicators.AddIndicator<ExponentialMovingAverage>(
        "short_ma", indicators.close, short_window);
    indicators.AddIndicator<ExponentialMovingAverage>(
        "long_ma", indicators.close, long_window);
    indicators.AddIndicator<SimpleAverageTrueRange>(
        "atr", config.GetWindow("atr_period"), FULL);
    return;
  }

  indicators.AddIndicator<SimpleMovingAverage>("short_ma", indicators.close,
                                               short_window, FULL);
  indicators.AddIndicator<SimpleMovingAverage>("long_ma", indicators.close,
                                               long_window, FULL);
}

string MovingAverageCrossoverStrategy::GetAtrSeriesName() const {
  return is_exponential_ ? "atr" : "";
}

}  // namespace tradesim::strategy
