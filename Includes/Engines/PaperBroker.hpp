#pragma once

// 표준 라이브러리
#include <memory>
#include <mutex>
#include <vector>

// 내부 헤더
#include "Engines/BaseBroker.hpp"

namespace tradesim::broker {

/// 주문을 즉시 체결하고 기록만 하는 모의 브로커
class PaperBroker final : public BaseBroker {
 public:
  explicit PaperBroker(shared_ptr<Logger> logger);
  ~PaperBroker() override;

  /// 수량과 가격이 유효하면 즉시 체결. 유효하지 않으면 OrderFailed
  OrderConfirmation PlaceOrder(
      const string& instrument, double quantity, OrderSide side, double price,
      OrderType order_type = OrderType::MARKET,
      TimeInForce time_in_force = TimeInForce::GTC) override;

  /// 지금까지 체결된 주문들을 반환하는 함수
  [[nodiscard]] vector<OrderConfirmation> GetOrders() const;

 private:
  shared_ptr<Logger> logger_;

  mutable mutex mutex_;
  vector<OrderConfirmation> orders_;
};

}  // namespace tradesim::broker
