// 파일 헤더
#include "Strategies/SmaThresholdStrategy.hpp"

// 내부 헤더
#include "Engines/Logger.hpp"
#include "Engines/SimulationLoop.hpp"

// 네임 스페이스
using namespace tradesim::indicator;
using namespace tradesim::logger;
using namespace tradesim::signal;

namespace tradesim::strategy {

SmaThresholdStrategy::SmaThresholdStrategy(const StrategyConfig& config,
                                           shared_ptr<Logger> logger)
    : Strategy(engine::StrategyFamilyToString(config.GetFamily()), config,
               std::move(logger)) {
  CheckFamily({engine::SMA_THRESHOLD});

  // 직전 바의 저가가 SMA보다 엄격히 아래였고 현재 저가가 SMA 위
  SignalRule buy_rule;
  buy_rule.conditions = {{"low", GREATER, "sma"},
                         {"low", LESS, "sma", 1.0, 0.0, 1}};

  SignalRule sell_rule;
  sell_rule.conditions = {{"high", LESS, "sma"}};

  signal_generator_.SetBuyRule(buy_rule).SetSellRule(sell_rule);
}
SmaThresholdStrategy::~SmaThresholdStrategy() = default;

void SmaThresholdStrategy::Initialize(IndicatorEngine& indicators) const {
  indicators.AddIndicator<SimpleMovingAverage>(
      "sma", indicators.close, GetConfig().GetWindow("sma_period"), PARTIAL);
}

void SmaThresholdStrategy::Backtest(const BarData& bars,
                                    const IndicatorEngine& /* indicators */,
                                    const vector<Signal>& signals,
                                    PositionManager& manager,
                                    RunContext& context) const {
  const engine::SimulationLoop simulation_loop(logger_);
  simulation_loop.Run(bars, signals, {}, manager, context,
                      engine::BEFORE_SIGNAL);

  logger_->Log(DEBUG_L,
               "[" + context.GetInstrument() + "] [" + GetName() +
                   "] 신호 전 자산 기록 방식으로 실행을 완료했습니다.",
               __FILE__, __LINE__);
}

RunMode SmaThresholdStrategy::GetRunMode() const { return CUSTOM; }

string SmaThresholdStrategy::GetAtrSeriesName() const { return ""; }

}  // namespace tradesim::strategy
