// 표준 라이브러리
#include <cmath>

// 파일 헤더
#include "Engines/SimulationLoop.hpp"

// 내부 헤더
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"
#include "Engines/TimeUtils.hpp"

// 네임 스페이스
using namespace tradesim::exception;
using namespace tradesim::logger;
using namespace tradesim::utils;

namespace tradesim::engine {

SimulationLoop::SimulationLoop(shared_ptr<Logger> logger)
    : logger_(std::move(logger)) {}
SimulationLoop::~SimulationLoop() = default;

void SimulationLoop::Run(const BarData& bars, const vector<Signal>& signals,
                         const vector<double>& atr, PositionManager& manager,
                         RunContext& context,
                         const EquitySampling equity_sampling) const {
  const size_t num_bars = bars.GetNumBars();

  if (signals.size() != num_bars) {
    logger_->LogAndThrowError<DataError>(
        "신호 개수 [" + to_string(signals.size()) + "]가 바 개수 [" +
            to_string(num_bars) + "]와 일치하지 않습니다.",
        __FILE__, __LINE__);
  }

  if (!atr.empty() && atr.size() != num_bars) {
    logger_->LogAndThrowError<DataError>(
        "ATR 개수 [" + to_string(atr.size()) + "]가 바 개수 [" +
            to_string(num_bars) + "]와 일치하지 않습니다.",
        __FILE__, __LINE__);
  }

  for (size_t bar_idx = 0; bar_idx < num_bars; bar_idx++) {
    const auto& bar = bars.GetBar(bar_idx);
    context.SetCurrentBar(bar_idx, bar.timestamp);

    try {
      if (equity_sampling == BEFORE_SIGNAL) {
        context.AppendEquity(bar.timestamp,
                             PositionManager::GetEquity(context, bar.close));
      }

      const double current_atr = atr.empty() ? NAN : atr[bar_idx];
      manager.OnBar(bar, signals[bar_idx], current_atr, context);

      if (equity_sampling == AFTER_SIGNAL) {
        context.AppendEquity(bar.timestamp,
                             PositionManager::GetEquity(context, bar.close));
      }
    } catch (const DataError&) {
      throw;
    } catch (const ConfigError&) {
      throw;
    } catch (const ExecutionFailure&) {
      throw;
    } catch (const std::exception& e) {
      logger_->LogAndThrowError<ExecutionFailure>(
          "[" + context.GetInstrument() + "] 바 인덱스 [" +
              to_string(bar_idx) + "] 시간 [" +
              UtcTimestampToUtcDatetime(bar.timestamp) +
              "]에서 시뮬레이션이 실패했습니다: " + e.what(),
          __FILE__, __LINE__);
    }
  }

  logger_->Log(DEBUG_L,
               "[" + context.GetInstrument() + "] " + to_string(num_bars) +
                   "개 바의 시뮬레이션을 완료했습니다.",
               __FILE__, __LINE__);
}

}  // namespace tradesim::engine
