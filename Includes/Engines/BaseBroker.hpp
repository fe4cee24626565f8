#pragma once

// 표준 라이브러리
#include <memory>
#include <string>

// 전방 선언
namespace tradesim::logger {
class Logger;
}

// 네임 스페이스
using namespace std;

namespace tradesim::broker {

using logger::Logger;

/// 주문 방향
enum class OrderSide { BUY, SELL };

/// 주문 유형
enum class OrderType { MARKET, LIMIT };

/// 주문 유효 기간
enum class TimeInForce { GTC, DAY, IOC };

/// 주문 처리 상태
enum class OrderStatus { FILLED, REJECTED };

/// 브로커 종류. 알 수 없는 이름은 설정 시점에 ConfigError
enum class BrokerType { PAPER };

/// 브로커가 반환하는 주문 확인 정보
struct OrderConfirmation {
  string order_id;
  string instrument;
  double quantity = 0.0;
  OrderSide side = OrderSide::BUY;
  double price = 0.0;
  OrderType order_type = OrderType::MARKET;
  TimeInForce time_in_force = TimeInForce::GTC;
  OrderStatus status = OrderStatus::FILLED;
};

/// 주문 방향을 문자열로 변환하는 함수
[[nodiscard]] string OrderSideToString(OrderSide side);

/// 브로커 이름(paper)을 BrokerType으로 변환하는 함수.
/// 알 수 없는 이름이면 ConfigError
[[nodiscard]] BrokerType ParseBrokerType(const string& broker_name);

/**
 * 실제 또는 모의 주문 체결을 담당하는 브로커의 추상 클래스
 *
 * 시뮬레이션은 브로커 없이도 완결되며, 브로커가 주입되면 모든 진입과 청산이
 * PlaceOrder로 전달된다.
 */
class BaseBroker {
 public:
  virtual ~BaseBroker();

  /**
   * 주문을 제출하는 함수
   *
   * @param instrument 종목 이름
   * @param quantity 주문 수량. 0보다 커야 함
   * @param side 주문 방향
   * @param price 주문 가격
   * @param order_type 주문 유형
   * @param time_in_force 주문 유효 기간
   * @return 주문 확인 정보
   */
  virtual OrderConfirmation PlaceOrder(
      const string& instrument, double quantity, OrderSide side, double price,
      OrderType order_type = OrderType::MARKET,
      TimeInForce time_in_force = TimeInForce::GTC) = 0;

 protected:
  BaseBroker();
};

/// 브로커 종류에 해당되는 브로커를 생성하는 함수
[[nodiscard]] shared_ptr<BaseBroker> CreateBroker(BrokerType broker_type,
                                                  shared_ptr<Logger> logger);

}  // namespace tradesim::broker
