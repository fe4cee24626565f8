// 표준 라이브러리
#include <algorithm>
#include <cmath>

// 파일 헤더
#include "Engines/BarData.hpp"

// 내부 헤더
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"

// 네임 스페이스
using namespace tradesim::exception;
using namespace tradesim::logger;
using namespace tradesim::utils;

namespace tradesim::bar {

BarData::BarData() : timeframe_(MINUTE_1) {}

BarData::BarData(const string& instrument, const Timeframe timeframe,
                 vector<Bar> bars)
    : instrument_(instrument), timeframe_(timeframe), bars_(std::move(bars)) {
  Validate();
}

BarData::~BarData() = default;

const Bar& BarData::GetBar(const size_t bar_idx) const {
  if (bar_idx >= bars_.size()) [[unlikely]] {
    Logger::GetLogger()->LogAndThrowError<DataError>(
        "[" + instrument_ + "] 바 인덱스 " + to_string(bar_idx) +
            "이(가) 바 개수 " + to_string(bars_.size()) + "을(를) 벗어났습니다.",
        __FILE__, __LINE__);
  }

  return bars_[bar_idx];
}

const vector<Bar>& BarData::GetBars() const { return bars_; }

size_t BarData::GetNumBars() const { return bars_.size(); }

bool BarData::IsEmpty() const { return bars_.empty(); }

const string& BarData::GetInstrument() const { return instrument_; }

Timeframe BarData::GetTimeframe() const { return timeframe_; }

BarData BarData::Resample(const Timeframe target_timeframe) const {
  const int64_t source_ms = GetTimeframeMilliseconds(timeframe_);
  const int64_t target_ms = GetTimeframeMilliseconds(target_timeframe);

  if (target_ms < source_ms) {
    Logger::GetLogger()->LogAndThrowError<ConfigError>(
        "[" + instrument_ + "] " + TimeframeToString(timeframe_) +
            " 바를 더 작은 타임프레임 " + TimeframeToString(target_timeframe) +
            "(으)로 리샘플링할 수 없습니다.",
        __FILE__, __LINE__);
  }

  if (target_ms == source_ms) {
    return *this;
  }

  vector<Bar> resampled;
  for (const auto& bar : bars_) {
    // 버킷 시작 시간으로 내림
    const int64_t bucket = bar.timestamp - bar.timestamp % target_ms;

    if (resampled.empty() || resampled.back().timestamp != bucket) {
      resampled.emplace_back(bucket, bar.open, bar.high, bar.low, bar.close,
                             bar.volume);
      continue;
    }

    auto& current = resampled.back();
    current.high = max(current.high, bar.high);
    current.low = min(current.low, bar.low);
    current.close = bar.close;
    current.volume += bar.volume;
  }

  return {instrument_, target_timeframe, std::move(resampled)};
}

BarData BarData::Slice(const int64_t start_ms, const int64_t end_ms) const {
  vector<Bar> sliced;
  copy_if(bars_.begin(), bars_.end(), back_inserter(sliced),
          [start_ms, end_ms](const Bar& bar) {
            return bar.timestamp >= start_ms && bar.timestamp <= end_ms;
          });

  return {instrument_, timeframe_, std::move(sliced)};
}

void BarData::Validate() const {
  const auto& logger = Logger::GetLogger();

  for (size_t bar_idx = 0; bar_idx < bars_.size(); bar_idx++) {
    const auto& bar = bars_[bar_idx];

    const pair<const char*, double> fields[] = {{"open", bar.open},
                                                {"high", bar.high},
                                                {"low", bar.low},
                                                {"close", bar.close},
                                                {"volume", bar.volume}};

    for (const auto& [column, value] : fields) {
      if (!isfinite(value)) [[unlikely]] {
        logger->LogAndThrowError<DataError>(
            "[" + instrument_ + "] " + to_string(bar_idx) + "번 바(" +
                UtcTimestampToUtcDatetime(bar.timestamp) + ")의 [" + column +
                "] 값이 유효한 숫자가 아닙니다.",
            __FILE__, __LINE__);
      }
    }

    if (bar_idx > 0 && bar.timestamp < bars_[bar_idx - 1].timestamp)
        [[unlikely]] {
      logger->LogAndThrowError<DataError>(
          "[" + instrument_ + "] " + to_string(bar_idx) +
              "번 바의 타임스탬프가 이전 바보다 이릅니다. 바는 시간 오름차순으로 "
              "정렬되어야 합니다.",
          __FILE__, __LINE__);
    }
  }
}

}  // namespace tradesim::bar
