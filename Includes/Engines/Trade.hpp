#pragma once

// 표준 라이브러리
#include <cstdint>
#include <optional>
#include <string>

// 내부 헤더
#include "Engines/Position.hpp"

// 네임 스페이스
using namespace std;

namespace tradesim::analyzer {

using order::Direction;

/// 거래 기록의 종류를 지정하는 열거형 클래스.\n
/// ENTRY, EXIT → 현금은 그대로 두고 노출만 추적하는 진입과 청산\n
/// BUY, SELL → 진입 금액을 현금에서 차감하는 실제 매수와 매도
enum class TradeType { BUY, SELL, ENTRY, EXIT };
using enum TradeType;

/// 거래 종류를 문자열로 변환하는 함수
[[nodiscard]] string TradeTypeToString(TradeType trade_type);

/// 현금이 변경된 하나의 거래 정보를 저장하는 빌더 클래스
class Trade final {
 public:
  Trade();
  ~Trade();

  Trade& SetTradeNumber(int trade_number);
  Trade& SetTimestamp(int64_t timestamp);
  Trade& SetTradeType(TradeType trade_type);
  Trade& SetDirection(Direction direction);
  Trade& SetPrice(double price);
  Trade& SetSize(double size);
  Trade& SetBalance(double balance);
  Trade& SetProfit(double profit);
  Trade& SetReason(const string& reason);

  // ======================================================
  [[nodiscard]] int GetTradeNumber() const;
  [[nodiscard]] int64_t GetTimestamp() const;
  [[nodiscard]] TradeType GetTradeType() const;
  [[nodiscard]] Direction GetDirection() const;
  [[nodiscard]] double GetPrice() const;
  [[nodiscard]] double GetSize() const;

  /// 거래 직후의 현금 잔고를 반환하는 함수
  [[nodiscard]] double GetBalance() const;

  /// 청산 거래의 실현 손익을 반환하는 함수. 진입 거래는 nullopt
  [[nodiscard]] optional<double> GetProfit() const;

  [[nodiscard]] string GetReason() const;

 private:
  int trade_number_;       // 거래 번호
  int64_t timestamp_;      // 거래 시간
  TradeType trade_type_;   // 거래 종류
  Direction direction_;    // 포지션 방향
  double price_;           // 체결 가격
  double size_;            // 체결 수량
  double balance_;         // 거래 직후 현금
  optional<double> profit_;  // 실현 손익
  string reason_;          // 거래 사유
};

}  // namespace tradesim::analyzer
