// 파일 헤더
#include "Engines/RunContext.hpp"

namespace tradesim::engine {

RunContext::RunContext(const string& instrument, const double initial_capital)
    : instrument_(instrument),
      initial_capital_(initial_capital),
      cash_(initial_capital),
      current_bar_idx_(0),
      current_timestamp_(0) {}

RunContext::~RunContext() = default;

const string& RunContext::GetInstrument() const { return instrument_; }

double RunContext::GetInitialCapital() const { return initial_capital_; }

double RunContext::GetCash() const { return cash_; }

const vector<Position>& RunContext::GetPositions() const { return positions_; }

const vector<Trade>& RunContext::GetTrades() const { return trades_; }

const vector<EquityPoint>& RunContext::GetEquityCurve() const {
  return equity_curve_;
}

optional<size_t> RunContext::FindOpenPosition(const Direction direction) const {
  for (size_t position_idx = 0; position_idx < positions_.size();
       position_idx++) {
    if (const auto& position = positions_[position_idx];
        !position.closed && position.direction == direction) {
      return position_idx;
    }
  }

  return nullopt;
}

size_t RunContext::GetNumOpenPositions() const {
  size_t num_open = 0;
  for (const auto& position : positions_) {
    if (!position.closed) {
      num_open++;
    }
  }

  return num_open;
}

void RunContext::AppendEquity(const int64_t timestamp, const double equity) {
  equity_curve_.push_back({timestamp, equity});
}

void RunContext::SetCurrentBar(const size_t bar_idx, const int64_t timestamp) {
  current_bar_idx_ = bar_idx;
  current_timestamp_ = timestamp;
}

size_t RunContext::GetCurrentBarIndex() const { return current_bar_idx_; }

int64_t RunContext::GetCurrentTimestamp() const { return current_timestamp_; }

}  // namespace tradesim::engine
