// 표준 라이브러리
#include <cmath>

// 파일 헤더
#include "Engines/PositionManager.hpp"

// 내부 헤더
#include "Engines/BaseBroker.hpp"
#include "Engines/DataUtils.hpp"
#include "Engines/Logger.hpp"
#include "Engines/TimeUtils.hpp"

// 네임 스페이스
using namespace tradesim::logger;
using namespace tradesim::utils;

namespace tradesim::order {

using broker::OrderSide;
using enum analyzer::TradeType;
using enum engine::EntryAccounting;
using enum engine::SellAction;
using enum engine::SizingMode;

PositionManager::PositionManager(const RiskConfig& risk_config,
                                 shared_ptr<Logger> logger,
                                 shared_ptr<BaseBroker> broker)
    : risk_config_(risk_config),
      logger_(std::move(logger)),
      broker_(std::move(broker)) {}
PositionManager::~PositionManager() = default;

vector<Trade> PositionManager::OnBar(const Bar& bar, const Signal& signal,
                                     const double atr, RunContext& context) {
  vector<Trade> trades;

  // 1. 손절 및 익절 확인
  for (size_t position_idx = 0; position_idx < context.positions_.size();
       position_idx++) {
    const auto& position = context.positions_[position_idx];
    if (position.closed) {
      continue;
    }

    if (!isnan(position.stop_price)) {
      const bool stop_hit = position.direction == LONG
                                ? IsLessOrEqual(bar.low, position.stop_price)
                                : IsGreaterOrEqual(bar.high, position.stop_price);

      if (stop_hit) {
        trades.push_back(ClosePosition(position_idx, position.stop_price,
                                       bar.timestamp, "STOP_LOSS", context));
        continue;
      }
    }

    if (!isnan(position.take_profit_price)) {
      const bool take_profit_hit =
          position.direction == LONG
              ? IsGreaterOrEqual(bar.high, position.take_profit_price)
              : IsLessOrEqual(bar.low, position.take_profit_price);

      if (take_profit_hit) {
        trades.push_back(ClosePosition(position_idx,
                                       position.take_profit_price,
                                       bar.timestamp, "TAKE_PROFIT", context));
      }
    }
  }

  // 2. 매도 신호로 롱 청산
  if (signal.sell && risk_config_.sell_action == EXIT_LONG) {
    if (const auto position_idx = context.FindOpenPosition(LONG)) {
      if (IsExitAllowed(context.positions_[*position_idx], bar.close)) {
        trades.push_back(ClosePosition(*position_idx, bar.close, bar.timestamp,
                                       "SELL_SIGNAL", context));
      }
    }
  }

  // 3. 진입
  if (signal.buy) {
    if (auto trade =
            TryEnter(LONG, bar.close, atr, bar.timestamp, "BUY_SIGNAL",
                     context)) {
      trades.push_back(std::move(*trade));
    }
  }

  if (signal.sell && risk_config_.sell_action == OPEN_SHORT) {
    if (auto trade =
            TryEnter(SHORT, bar.close, atr, bar.timestamp, "SELL_SIGNAL",
                     context)) {
      trades.push_back(std::move(*trade));
    }
  }

  return trades;
}

optional<Trade> PositionManager::TryEnter(const Direction direction,
                                          const double price, const double atr,
                                          const int64_t timestamp,
                                          const string& reason,
                                          RunContext& context) {
  // 방향별로 하나의 포지션만 보유
  if (context.FindOpenPosition(direction)) {
    return nullopt;
  }

  if (!isfinite(price) || price <= 0) {
    logger_->Log(WARN_L,
                 "진입 가격 [" + to_string(price) + "]이(가) 유효하지 않아 " +
                     DirectionToString(direction) + " 진입을 건너뜁니다.",
                 __FILE__, __LINE__);
    return nullopt;
  }

  const auto size = CalculateEntrySize(price, atr, context.cash_);
  if (!size) {
    return nullopt;
  }

  const double notional = *size * price;

  // 현금 차감 방식은 현금이 부족하면 진입하지 않음
  double reserved_cash = 0.0;
  if (risk_config_.entry_accounting == DEBIT_NOTIONAL) {
    if (IsGreater(notional, context.cash_)) {
      logger_->Log(DEBUG_L,
                   "현금 " + FormatDollar(context.cash_) + "이(가) 진입 금액 " +
                       FormatDollar(notional) + "보다 부족하여 진입하지 "
                       "않습니다.",
                   __FILE__, __LINE__);
      return nullopt;
    }

    reserved_cash = notional;
  }

  MirrorOrder(context.instrument_, *size, direction == LONG, price);

  Position position;
  position.direction = direction;
  position.entry_price = price;
  position.size = *size;
  position.entry_time = timestamp;
  position.reserved_cash = reserved_cash;

  if (isfinite(atr) && atr > 0) {
    const double sign = direction == LONG ? 1.0 : -1.0;

    if (risk_config_.use_stop_loss) {
      position.stop_price = price - sign * risk_config_.stop_atr_multiple * atr;
    }

    if (risk_config_.take_profit_atr_multiple > 0) {
      position.take_profit_price =
          price + sign * risk_config_.take_profit_atr_multiple * atr;
    }
  }

  context.cash_ -= reserved_cash;
  context.positions_.push_back(position);

  Trade trade;
  trade.SetTradeNumber(static_cast<int>(context.trades_.size()) + 1)
      .SetTimestamp(timestamp)
      .SetTradeType(GetTradeType(direction, true))
      .SetDirection(direction)
      .SetPrice(price)
      .SetSize(*size)
      .SetBalance(context.cash_)
      .SetReason(reason);
  context.trades_.push_back(trade);

  logger_->Log(DEBUG_L,
               "[" + UtcTimestampToUtcDatetime(timestamp) + "] " +
                   DirectionToString(direction) + " 진입 | 가격 " +
                   FormatDollar(price) + " | 수량 " + ToFixedString(*size, 6),
               __FILE__, __LINE__);

  return trade;
}

Trade PositionManager::ClosePosition(const size_t position_idx,
                                     const double exit_price,
                                     const int64_t timestamp,
                                     const string& reason,
                                     RunContext& context) {
  auto& position = context.positions_.at(position_idx);
  const double pnl = position.GetUnrealizedPnl(exit_price);

  MirrorOrder(context.instrument_, position.size, position.direction == SHORT,
              exit_price);

  context.cash_ += position.reserved_cash + pnl;

  position.closed = true;
  position.exit_price = exit_price;
  position.exit_time = timestamp;

  Trade trade;
  trade.SetTradeNumber(static_cast<int>(context.trades_.size()) + 1)
      .SetTimestamp(timestamp)
      .SetTradeType(GetTradeType(position.direction, false))
      .SetDirection(position.direction)
      .SetPrice(exit_price)
      .SetSize(position.size)
      .SetBalance(context.cash_)
      .SetProfit(pnl)
      .SetReason(reason);
  context.trades_.push_back(trade);

  logger_->Log(DEBUG_L,
               "[" + UtcTimestampToUtcDatetime(timestamp) + "] " +
                   DirectionToString(position.direction) + " 청산 (" + reason +
                   ") | 가격 " + FormatDollar(exit_price) + " | 손익 " +
                   FormatDollar(pnl),
               __FILE__, __LINE__);

  return trade;
}

double PositionManager::GetEquity(const RunContext& context,
                                  const double price) {
  double equity = context.cash_;
  for (const auto& position : context.positions_) {
    if (!position.closed) {
      equity += position.reserved_cash + position.GetUnrealizedPnl(price);
    }
  }

  return equity;
}

const RiskConfig& PositionManager::GetRiskConfig() const {
  return risk_config_;
}

optional<double> PositionManager::CalculateEntrySize(const double price,
                                                     const double atr,
                                                     const double cash) const {
  switch (risk_config_.sizing_mode) {
    case ATR_RISK: {
      if (!isfinite(atr) || atr <= 0) {
        return nullopt;
      }

      const double stop_distance = risk_config_.stop_atr_multiple * atr;
      const double dollar_risk = cash * risk_config_.risk_per_trade_fraction;
      double size = dollar_risk / stop_distance;

      if (!isfinite(size) || size <= 0) {
        return nullopt;
      }

      if (IsLess(size * price, risk_config_.min_notional)) {
        return nullopt;
      }

      // 명목 금액 상한으로 수량 제한
      if (const double max_notional = cash * risk_config_.max_notional_fraction;
          IsGreater(size * price, max_notional)) {
        size = max_notional / price;
      }

      return size > 0 ? optional(size) : nullopt;
    }

    case BALANCE_FRACTION: {
      const double notional = cash * risk_config_.balance_investment_fraction;
      if (!isfinite(notional) || notional <= 0) {
        return nullopt;
      }

      return notional / price;
    }

    case FIXED_QUANTITY: {
      return risk_config_.fixed_quantity;
    }
  }

  return nullopt;
}

bool PositionManager::IsExitAllowed(const Position& position,
                                    const double price) const {
  if (!risk_config_.profit_gated_exit) {
    return true;
  }

  if (!IsGreater(price, position.entry_price)) {
    return false;
  }

  const double profit_ratio =
      (price - position.entry_price) / position.entry_price;

  return IsGreaterOrEqual(profit_ratio, risk_config_.profit_threshold);
}

TradeType PositionManager::GetTradeType(const Direction direction,
                                       const bool is_entry) const {
  if (risk_config_.entry_accounting != DEBIT_NOTIONAL) {
    return is_entry ? ENTRY : EXIT;
  }

  // 현금이 오가는 방식은 실제 매수와 매도로 기록
  return (direction == LONG) == is_entry ? BUY : SELL;
}

void PositionManager::MirrorOrder(const string& instrument, const double size,
                                  const bool is_buy, const double price) const {
  if (!broker_) {
    return;
  }

  const auto confirmation = broker_->PlaceOrder(
      instrument, size, is_buy ? OrderSide::BUY : OrderSide::SELL, price);

  logger_->Log(DEBUG_L,
               "브로커 주문 [" + confirmation.order_id + "] " +
                   OrderSideToString(confirmation.side) + " " +
                   ToFixedString(confirmation.quantity, 6),
               __FILE__, __LINE__);
}

}  // namespace tradesim::order
