// 파일 헤더
#include "Engines/IndicatorEngine.hpp"

// 네임 스페이스
using namespace tradesim::exception;
using namespace tradesim::logger;

namespace tradesim::indicator {

IndicatorEngine::IndicatorEngine(shared_ptr<Logger> logger)
    : logger_(std::move(logger)),
      open(AddIndicator<Open>("open")),
      high(AddIndicator<High>("high")),
      low(AddIndicator<Low>("low")),
      close(AddIndicator<Close>("close")),
      volume(AddIndicator<Volume>("volume")),
      bars_(nullptr),
      current_bar_idx_(0),
      num_bars_(0) {}

IndicatorEngine::~IndicatorEngine() = default;

void IndicatorEngine::Compute(const BarData& bars) {
  bars_ = &bars;
  num_bars_ = bars.GetNumBars();
  current_bar_idx_ = 0;

  for (const auto& indicator : indicators_) {
    indicator->output_.clear();
    indicator->output_.reserve(num_bars_);
    indicator->Initialize();
  }

  // 바 우선 순회: t번째 바의 모든 지표 → t + 1번째 바의 모든 지표
  for (size_t bar_idx = 0; bar_idx < num_bars_; bar_idx++) {
    current_bar_idx_ = bar_idx;

    for (const auto& indicator : indicators_) {
      indicator->output_.push_back(indicator->Calculate());
    }
  }

  bars_ = nullptr;

  logger_->Log(DEBUG_L,
               "[" + bars.GetInstrument() + "] 지표 " +
                   to_string(indicators_.size()) + "개를 " +
                   to_string(num_bars_) + "개 바에 대해 계산했습니다.",
               __FILE__, __LINE__);
}

const vector<double>& IndicatorEngine::GetSeries(const string& name) const {
  return GetIndicator(name).output_;
}

bool IndicatorEngine::HasSeries(const string& name) const {
  return indicator_index_.contains(name);
}

Indicator& IndicatorEngine::GetIndicator(const string& name) const {
  const auto& it = indicator_index_.find(name);
  if (it == indicator_index_.end()) {
    logger_->LogAndThrowError<DataError>(
        "[" + name + "] 지표가 존재하지 않습니다.", __FILE__, __LINE__);
  }

  return *it->second;
}

size_t IndicatorEngine::GetCurrentBarIndex() const {
  return current_bar_idx_;
}

const Bar& IndicatorEngine::GetCurrentBar() const {
  if (bars_ == nullptr) [[unlikely]] {
    logger_->LogAndThrowError<ExecutionFailure>(
        "지표 계산 중이 아닐 때는 현재 바를 참조할 수 없습니다.", __FILE__,
        __LINE__);
  }

  return bars_->GetBar(current_bar_idx_);
}

size_t IndicatorEngine::GetNumBars() const { return num_bars_; }

void IndicatorEngine::Register(unique_ptr<Indicator> indicator) {
  indicator->engine_ = this;
  indicator_index_[indicator->GetName()] = indicator.get();
  indicators_.push_back(std::move(indicator));
}

}  // namespace tradesim::indicator
