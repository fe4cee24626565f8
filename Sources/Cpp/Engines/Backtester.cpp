// 표준 라이브러리
#include <chrono>

// 파일 헤더
#include "Engines/Backtester.hpp"

// 내부 헤더
#include "Engines/DataUtils.hpp"
#include "Engines/Exception.hpp"
#include "Engines/IndicatorEngine.hpp"
#include "Engines/Logger.hpp"
#include "Engines/PositionManager.hpp"
#include "Engines/SimulationLoop.hpp"
#include "Engines/TimeUtils.hpp"

// 네임 스페이스
using namespace chrono;
using namespace tradesim::exception;
using namespace tradesim::logger;
using namespace tradesim::utils;

namespace tradesim::engine {

using analyzer::Analyzer;
using indicator::IndicatorEngine;
using order::PositionManager;

Backtester::Backtester(shared_ptr<Strategy> strategy, const Config& config,
                       shared_ptr<Logger> logger, shared_ptr<BaseBroker> broker)
    : strategy_(std::move(strategy)),
      config_(config),
      logger_(std::move(logger)),
      broker_(std::move(broker)) {
  if (strategy_ == nullptr) {
    logger_->LogAndThrowError<ConfigError>(
        "백테스팅 실행기에 전략이 지정되지 않았습니다.", __FILE__, __LINE__);
  }
}
Backtester::~Backtester() = default;

BacktestResult Backtester::Run(const BarData& bars) const {
  const auto start_time = steady_clock::now();
  const auto& instrument = bars.GetInstrument();

  logger_->Log(INFO_L,
               "[" + instrument + "] [" + strategy_->GetName() +
                   "] 백테스팅을 시작합니다. (" +
                   to_string(bars.GetNumBars()) + "개 바)",
               __FILE__, __LINE__);

  try {
    RunContext context(instrument, config_.GetInitialBalance());
    Simulate(bars, context);

    const Analyzer analyzer(config_.GetInitialBalance(),
                            config_.GetRiskFreeRate(), logger_);

    BacktestResult result;
    result.instrument = instrument;
    result.strategy_name = strategy_->GetName();
    result.final_cash = context.GetCash();
    result.trades = context.GetTrades();
    result.equity_curve = context.GetEquityCurve();
    result.metrics = analyzer.CalculateMetrics(
        result.trades, result.equity_curve, result.final_cash);

    const auto elapsed_ms =
        duration_cast<milliseconds>(steady_clock::now() - start_time).count();
    logger_->Log(INFO_L,
                 "[" + instrument + "] 백테스팅이 완료되었습니다. (" +
                     to_string(result.trades.size()) + "개 거래, 소요 시간 " +
                     FormatTimeDiff(elapsed_ms) + ")",
                 __FILE__, __LINE__);

    return result;
  } catch (const std::exception& e) {
    logger_->Log(ERROR_L,
                 "[" + instrument + "] [" + strategy_->GetName() +
                     "] 백테스팅이 실패했습니다: " + e.what(),
                 __FILE__, __LINE__);
    throw;
  }
}

void Backtester::Simulate(const BarData& bars, RunContext& context) const {
  IndicatorEngine indicators(logger_);
  strategy_->Initialize(indicators);
  indicators.Compute(bars);

  const auto& signals = strategy_->GenerateSignals(indicators);
  PositionManager manager(strategy_->GetRiskConfig(), logger_, broker_);

  switch (strategy_->GetRunMode()) {
    case strategy::CUSTOM: {
      strategy_->Backtest(bars, indicators, signals, manager, context);
      break;
    }

    case strategy::GENERIC: {
      const SimulationLoop simulation_loop(logger_);
      simulation_loop.Run(bars, signals, strategy_->GetAtrSeries(indicators),
                          manager, context);
      break;
    }
  }
}

void Backtester::SaveResult(const BacktestResult& result) const {
  const auto& directory =
      config_.GetResultsDirectory() + "/" + ToFileName(result.instrument);

  const Analyzer analyzer(config_.GetInitialBalance(),
                          config_.GetRiskFreeRate(), logger_);
  analyzer.SaveTradeList(result.trades, directory + "/trade_list.json");
  analyzer.SaveEquityCurve(result.equity_curve, directory,
                           "equity_curve.parquet");
  analyzer.SaveMetrics(result.metrics, directory + "/metrics.json");

  logger_->Log(INFO_L,
               "[" + result.instrument + "] 백테스팅 결과가 [" + directory +
                   "]에 저장되었습니다.",
               __FILE__, __LINE__);
}

const Config& Backtester::GetConfig() const { return config_; }

const shared_ptr<Strategy>& Backtester::GetStrategy() const {
  return strategy_;
}

}  // namespace tradesim::engine
