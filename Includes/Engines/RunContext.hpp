#pragma once

// 표준 라이브러리
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// 내부 헤더
#include "Engines/Position.hpp"
#include "Engines/Trade.hpp"

// 전방 선언
namespace tradesim::order {
class PositionManager;
}

// 네임 스페이스
using namespace std;

namespace tradesim::engine {

using analyzer::Trade;
using order::Direction;
using order::Position;

/// 한 바가 끝난 시점의 자산 가치
struct EquityPoint {
  int64_t timestamp;
  double equity;
};

/**
 * 한 번의 백테스팅 실행 동안의 모든 가변 상태를 소유하는 클래스
 *
 * 현금, 포지션, 거래 기록은 PositionManager만 변경할 수 있으며,
 * 실행마다 새로 생성되어 다른 실행과 공유되지 않는다.
 */
class RunContext final {
  // 현금, 포지션, 거래 기록 변경용
  friend class order::PositionManager;

 public:
  RunContext(const string& instrument, double initial_capital);
  ~RunContext();

  [[nodiscard]] const string& GetInstrument() const;
  [[nodiscard]] double GetInitialCapital() const;
  [[nodiscard]] double GetCash() const;

  /// 열린 포지션과 청산된 포지션을 진입 순서대로 반환하는 함수
  [[nodiscard]] const vector<Position>& GetPositions() const;

  /// 거래 기록을 반환하는 함수
  [[nodiscard]] const vector<Trade>& GetTrades() const;

  /// 자산 곡선을 반환하는 함수
  [[nodiscard]] const vector<EquityPoint>& GetEquityCurve() const;

  /// 해당 방향의 열린 포지션 인덱스를 반환하는 함수
  [[nodiscard]] optional<size_t> FindOpenPosition(Direction direction) const;

  /// 열린 포지션 개수를 반환하는 함수
  [[nodiscard]] size_t GetNumOpenPositions() const;

  /// 자산 곡선에 한 점을 추가하는 함수
  void AppendEquity(int64_t timestamp, double equity);

  /// 현재 처리 중인 바를 기록하는 함수. 오류 로그의 문맥으로 사용
  void SetCurrentBar(size_t bar_idx, int64_t timestamp);

  [[nodiscard]] size_t GetCurrentBarIndex() const;
  [[nodiscard]] int64_t GetCurrentTimestamp() const;

 private:
  string instrument_;
  double initial_capital_;
  double cash_;

  vector<Position> positions_;
  vector<Trade> trades_;
  vector<EquityPoint> equity_curve_;

  size_t current_bar_idx_;
  int64_t current_timestamp_;
};

}  // namespace tradesim::engine
