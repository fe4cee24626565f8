// 표준 라이브러리
#include <cmath>

// 파일 헤더
#include "Indicators/MovingAverageConvergenceDivergence.hpp"

// 내부 헤더
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"

// 네임 스페이스
using namespace tradesim::exception;
using namespace tradesim::logger;

namespace tradesim::indicator {

MovingAverageConvergenceDivergence::MovingAverageConvergenceDivergence(
    const string& name, Indicator& source, const size_t fast_span,
    const size_t slow_span)
    : Indicator(name),
      source_(source),
      fast_alpha_(0.0),
      slow_alpha_(0.0),
      fast_ema_(nan("")),
      slow_ema_(nan("")) {
  ValidatePeriod(name, fast_span);
  ValidatePeriod(name, slow_span);

  if (fast_span >= slow_span) {
    Logger::GetLogger()->LogAndThrowError<ConfigError>(
        "[" + name + "] MACD의 fast 기간 " + to_string(fast_span) +
            "은(는) slow 기간 " + to_string(slow_span) + "보다 작아야 합니다.",
        __FILE__, __LINE__);
  }

  fast_alpha_ = 2.0 / (static_cast<double>(fast_span) + 1.0);
  slow_alpha_ = 2.0 / (static_cast<double>(slow_span) + 1.0);
}

void MovingAverageConvergenceDivergence::Initialize() {
  fast_ema_ = nan("");
  slow_ema_ = nan("");
}

double MovingAverageConvergenceDivergence::Calculate() {
  if (const double value = source_[0]; isfinite(value)) {
    // 첫 유한 관측값으로 두 EMA를 시드
    if (isnan(fast_ema_)) {
      fast_ema_ = value;
      slow_ema_ = value;
    } else {
      fast_ema_ = fast_alpha_ * value + (1.0 - fast_alpha_) * fast_ema_;
      slow_ema_ = slow_alpha_ * value + (1.0 - slow_alpha_) * slow_ema_;
    }
  }

  return fast_ema_ - slow_ema_;
}

}  // namespace tradesim::indicator
