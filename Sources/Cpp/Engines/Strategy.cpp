// 표준 라이브러리
#include <algorithm>

// 파일 헤더
#include "Engines/Strategy.hpp"

// 내부 헤더
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"
#include "Engines/SimulationLoop.hpp"

// 네임 스페이스
using namespace tradesim::exception;

namespace tradesim::strategy {

Strategy::Strategy(const string& name, const StrategyConfig& config,
                   shared_ptr<Logger> logger)
    : logger_(std::move(logger)), name_(name), config_(config) {}
Strategy::~Strategy() = default;

vector<Signal> Strategy::GenerateSignals(
    const IndicatorEngine& indicators) const {
  return signal_generator_.Generate(indicators);
}

void Strategy::Backtest(const BarData& bars, const IndicatorEngine& indicators,
                        const vector<Signal>& signals,
                        PositionManager& manager, RunContext& context) const {
  const engine::SimulationLoop simulation_loop(logger_);
  simulation_loop.Run(bars, signals, GetAtrSeries(indicators), manager,
                      context);
}

RunMode Strategy::GetRunMode() const { return GENERIC; }

string Strategy::GetAtrSeriesName() const { return "atr"; }

vector<double> Strategy::GetAtrSeries(const IndicatorEngine& indicators) const {
  const auto& atr_name = GetAtrSeriesName();
  if (atr_name.empty()) {
    return {};
  }

  return indicators.GetSeries(atr_name);
}

RiskConfig Strategy::GetRiskConfig() const { return config_.GetRiskConfig(); }

string Strategy::GetName() const { return name_; }

const StrategyConfig& Strategy::GetConfig() const { return config_; }

const SignalGenerator& Strategy::GetSignalGenerator() const {
  return signal_generator_;
}

void Strategy::CheckFamily(
    const vector<engine::StrategyFamily>& families) const {
  if (find(families.begin(), families.end(), config_.GetFamily()) ==
      families.end()) {
    logger_->LogAndThrowError<ConfigError>(
        "[" + name_ + "] 전략은 [" +
            engine::StrategyFamilyToString(config_.GetFamily()) +
            "] 계열 설정을 사용할 수 없습니다.",
        __FILE__, __LINE__);
  }
}

}  // namespace tradesim::strategy
