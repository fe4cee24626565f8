#pragma once

// 표준 라이브러리
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// 내부 헤더
#include "Engines/BarData.hpp"
#include "Engines/Config.hpp"
#include "Engines/RunContext.hpp"
#include "Engines/SignalGenerator.hpp"

// 전방 선언
namespace tradesim::broker {
class BaseBroker;
}

namespace tradesim::logger {
class Logger;
}

// 네임 스페이스
using namespace std;

namespace tradesim::order {

using analyzer::Trade;
using analyzer::TradeType;
using bar::Bar;
using broker::BaseBroker;
using engine::RiskConfig;
using engine::RunContext;
using logger::Logger;
using signal::Signal;

/**
 * 신호를 포지션 진입과 청산으로 변환하고 현금을 관리하는 클래스
 *
 * 상태는 모두 RunContext에 있으므로 하나의 관리자를 여러 실행에서 순차적으로
 * 사용할 수 있다.
 *
 * ! 한 바의 처리 순서 !
 * 1. 열린 포지션의 손절 확인 후 익절 확인
 * 2. EXIT_LONG일 때 매도 신호로 롱 포지션 청산
 * 3. 매수 신호로 롱 진입, OPEN_SHORT일 때 매도 신호로 숏 진입
 */
class PositionManager final {
 public:
  PositionManager(const RiskConfig& risk_config, shared_ptr<Logger> logger,
                  shared_ptr<BaseBroker> broker = nullptr);
  ~PositionManager();

  /**
   * 하나의 바에 대해 손절, 익절, 청산 신호, 진입 신호를 순서대로 처리하는
   * 함수
   *
   * @param bar 현재 바
   * @param signal 현재 바의 신호
   * @param atr 현재 바의 ATR. 정의되지 않았으면 NaN
   * @param context 현재 실행 컨텍스트
   * @return 이번 바에서 발생한 거래들
   */
  vector<Trade> OnBar(const Bar& bar, const Signal& signal, double atr,
                      RunContext& context);

  /**
   * 지정된 방향으로 진입을 시도하는 함수.
   * 같은 방향의 열린 포지션이 있거나 수량 조건을 만족하지 못하면 진입하지
   * 않는다.
   *
   * @return 진입했으면 진입 거래, 아니면 nullopt
   */
  optional<Trade> TryEnter(Direction direction, double price, double atr,
                           int64_t timestamp, const string& reason,
                           RunContext& context);

  /// 지정된 포지션을 주어진 가격에 청산하고 청산 거래를 반환하는 함수
  Trade ClosePosition(size_t position_idx, double exit_price, int64_t timestamp,
                      const string& reason, RunContext& context);

  /// 현금 + 열린 포지션의 (차감된 현금 + 미실현 손익)을 반환하는 함수
  [[nodiscard]] static double GetEquity(const RunContext& context,
                                        double price);

  [[nodiscard]] const RiskConfig& GetRiskConfig() const;

 private:
  RiskConfig risk_config_;
  shared_ptr<Logger> logger_;
  shared_ptr<BaseBroker> broker_;

  /// 진입 수량을 계산하는 함수. 진입할 수 없으면 nullopt
  [[nodiscard]] optional<double> CalculateEntrySize(double price, double atr,
                                                    double cash) const;

  /// 수익 조건부 청산을 허용하는지 확인하는 함수
  [[nodiscard]] bool IsExitAllowed(const Position& position,
                                   double price) const;

  /// 거래 기록의 종류를 결정하는 함수.
  /// 현금 차감 방식이면 BUY, SELL이고 아니면 ENTRY, EXIT
  [[nodiscard]] TradeType GetTradeType(Direction direction,
                                       bool is_entry) const;

  /// 브로커가 있으면 주문을 전달하는 함수
  void MirrorOrder(const string& instrument, double size, bool is_buy,
                   double price) const;
};

}  // namespace tradesim::order
