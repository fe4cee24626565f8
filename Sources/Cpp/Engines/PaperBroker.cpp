// 표준 라이브러리
#include <cmath>

// 파일 헤더
#include "Engines/PaperBroker.hpp"

// 내부 헤더
#include "Engines/DataUtils.hpp"
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"

// 네임 스페이스
using namespace tradesim::exception;
using namespace tradesim::logger;
using namespace tradesim::utils;

namespace tradesim::broker {

PaperBroker::PaperBroker(shared_ptr<Logger> logger)
    : logger_(std::move(logger)) {}

PaperBroker::~PaperBroker() = default;

OrderConfirmation PaperBroker::PlaceOrder(const string& instrument,
                                          const double quantity,
                                          const OrderSide side,
                                          const double price,
                                          const OrderType order_type,
                                          const TimeInForce time_in_force) {
  if (!isfinite(quantity) || quantity <= 0.0) {
    logger_->LogAndThrowError<OrderFailed>(
        "[" + instrument + "] 주문 수량 " + to_string(quantity) +
            "은(는) 0보다 커야 합니다.",
        __FILE__, __LINE__);
  }

  if (!isfinite(price) || price <= 0.0) {
    logger_->LogAndThrowError<OrderFailed>(
        "[" + instrument + "] 주문 가격 " + to_string(price) +
            "은(는) 0보다 커야 합니다.",
        __FILE__, __LINE__);
  }

  lock_guard lock(mutex_);

  OrderConfirmation confirmation;
  confirmation.order_id = "paper-" + to_string(orders_.size() + 1);
  confirmation.instrument = instrument;
  confirmation.quantity = quantity;
  confirmation.side = side;
  confirmation.price = price;
  confirmation.order_type = order_type;
  confirmation.time_in_force = time_in_force;
  confirmation.status = OrderStatus::FILLED;

  orders_.push_back(confirmation);

  logger_->Log(DEBUG_L,
               "[" + instrument + "] 모의 주문 체결 " + confirmation.order_id +
                   ": " + OrderSideToString(side) + " " +
                   ToFixedString(quantity, 6) + " @ " + FormatDollar(price),
               __FILE__, __LINE__);

  return confirmation;
}

vector<OrderConfirmation> PaperBroker::GetOrders() const {
  lock_guard lock(mutex_);
  return orders_;
}

}  // namespace tradesim::broker
