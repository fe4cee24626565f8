#pragma once

// 표준 라이브러리
#include <cmath>
#include <cstdint>
#include <string>

// 네임 스페이스
using namespace std;

namespace tradesim::order {

/// 포지션 방향을 지정하는 열거형 클래스
enum class Direction { LONG, SHORT };
using enum Direction;

/// 방향을 문자열로 변환하는 함수
[[nodiscard]] inline string DirectionToString(const Direction direction) {
  return direction == LONG ? "LONG" : "SHORT";
}

/**
 * 하나의 포지션 정보를 저장하는 구조체
 *
 * 실행 컨텍스트가 소유하며 청산된 후에는 변경되지 않는다.
 * 손절가와 익절가가 NaN이면 해당 가격으로 청산하지 않는다.
 */
struct Position {
  Direction direction = LONG;
  double entry_price = 0.0;
  double size = 0.0;
  double stop_price = nan("");
  double take_profit_price = nan("");
  int64_t entry_time = 0;
  double reserved_cash = 0.0;  // 진입 시 현금에서 차감된 금액

  bool closed = false;
  double exit_price = nan("");
  int64_t exit_time = 0;

  /// 주어진 가격에서의 미실현 손익을 반환하는 함수
  [[nodiscard]] double GetUnrealizedPnl(const double price) const {
    return direction == LONG ? (price - entry_price) * size
                             : (entry_price - price) * size;
  }
};

}  // namespace tradesim::order
