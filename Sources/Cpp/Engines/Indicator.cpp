// 표준 라이브러리
#include <algorithm>
#include <cmath>

// 파일 헤더
#include "Engines/Indicator.hpp"

// 내부 헤더
#include "Engines/Exception.hpp"
#include "Engines/IndicatorEngine.hpp"
#include "Engines/Logger.hpp"

// 네임 스페이스
using namespace tradesim::exception;
using namespace tradesim::logger;

namespace tradesim::indicator {

RollingWindow::RollingWindow(const size_t period)
    : period_(period),
      buffer_(period, nan("")),
      next_idx_(0),
      num_pushed_(0),
      sum_(0.0),
      finite_count_(0) {}

void RollingWindow::Reset() {
  fill(buffer_.begin(), buffer_.end(), nan(""));
  next_idx_ = 0;
  num_pushed_ = 0;
  sum_ = 0.0;
  finite_count_ = 0;
}

void RollingWindow::Push(const double value) {
  // 윈도우가 찼으면 가장 오래된 데이터를 제거
  if (num_pushed_ >= period_) {
    if (const double evicted = buffer_[next_idx_]; isfinite(evicted)) {
      sum_ -= evicted;
      finite_count_--;
    }
  }

  buffer_[next_idx_] = value;
  if (isfinite(value)) {
    sum_ += value;
    finite_count_++;
  }

  next_idx_ = (next_idx_ + 1) % period_;
  num_pushed_++;
}

double RollingWindow::GetMean(const WindowPolicy policy) const {
  if (policy == FULL) {
    return finite_count_ == period_ ? sum_ / static_cast<double>(period_)
                                    : nan("");
  }

  return finite_count_ > 0 ? sum_ / static_cast<double>(finite_count_)
                           : nan("");
}

Indicator::Indicator(const string& name) : name_(name), engine_(nullptr) {}
Indicator::~Indicator() = default;

double Indicator::operator[](const size_t index) const {
  if (engine_ == nullptr) [[unlikely]] {
    return nan("");
  }

  const size_t current_bar_idx = engine_->GetCurrentBarIndex();
  if (index > current_bar_idx) {
    return nan("");
  }

  // 현재 바에서 아직 계산되지 않은 값은 참조할 수 없음
  const size_t target_idx = current_bar_idx - index;
  if (target_idx >= output_.size()) {
    return nan("");
  }

  return output_[target_idx];
}

const string& Indicator::GetName() const { return name_; }

const vector<double>& Indicator::GetOutput() const { return output_; }

const Bar& Indicator::GetCurrentBar() const {
  return engine_->GetCurrentBar();
}

size_t Indicator::GetCurrentBarIndex() const {
  return engine_->GetCurrentBarIndex();
}

bool Indicator::CollectWindow(const Indicator& source, const size_t period,
                              const size_t shift, const WindowPolicy policy,
                              vector<double>& values) {
  values.clear();

  for (size_t offset = shift; offset < shift + period; offset++) {
    if (const double value = source[offset]; isfinite(value)) {
      values.push_back(value);
    }
  }

  return policy == FULL ? values.size() == period : !values.empty();
}

void Indicator::ValidatePeriod(const string& name, const size_t period) {
  if (period == 0) {
    Logger::GetLogger()->LogAndThrowError<ConfigError>(
        "[" + name + "] 지표의 기간은 1 이상이어야 합니다.", __FILE__,
        __LINE__);
  }
}

}  // namespace tradesim::indicator
