// 파일 헤더
#include "Engines/Trade.hpp"

namespace tradesim::analyzer {

string TradeTypeToString(const TradeType trade_type) {
  switch (trade_type) {
    case BUY: {
      return "BUY";
    }

    case SELL: {
      return "SELL";
    }

    case ENTRY: {
      return "ENTRY";
    }

    case EXIT: {
      return "EXIT";
    }
  }

  return "";
}

Trade::Trade()
    : trade_number_(0),
      timestamp_(0),
      trade_type_(ENTRY),
      direction_(order::LONG),
      price_(0.0),
      size_(0.0),
      balance_(0.0) {}
Trade::~Trade() = default;

Trade& Trade::SetTradeNumber(const int trade_number) {
  trade_number_ = trade_number;
  return *this;
}

Trade& Trade::SetTimestamp(const int64_t timestamp) {
  timestamp_ = timestamp;
  return *this;
}

Trade& Trade::SetTradeType(const TradeType trade_type) {
  trade_type_ = trade_type;
  return *this;
}

Trade& Trade::SetDirection(const Direction direction) {
  direction_ = direction;
  return *this;
}

Trade& Trade::SetPrice(const double price) {
  price_ = price;
  return *this;
}

Trade& Trade::SetSize(const double size) {
  size_ = size;
  return *this;
}

Trade& Trade::SetBalance(const double balance) {
  balance_ = balance;
  return *this;
}

Trade& Trade::SetProfit(const double profit) {
  profit_ = profit;
  return *this;
}

Trade& Trade::SetReason(const string& reason) {
  reason_ = reason;
  return *this;
}

int Trade::GetTradeNumber() const { return trade_number_; }
int64_t Trade::GetTimestamp() const { return timestamp_; }
TradeType Trade::GetTradeType() const { return trade_type_; }
Direction Trade::GetDirection() const { return direction_; }
double Trade::GetPrice() const { return price_; }
double Trade::GetSize() const { return size_; }
double Trade::GetBalance() const { return balance_; }
optional<double> Trade::GetProfit() const { return profit_; }
string Trade::GetReason() const { return reason_; }

}  // namespace tradesim::analyzer
