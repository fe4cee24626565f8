#pragma once

// 표준 라이브러리
#include <memory>
#include <vector>

// 내부 헤더
#include "Engines/BarData.hpp"
#include "Engines/PositionManager.hpp"
#include "Engines/RunContext.hpp"
#include "Engines/SignalGenerator.hpp"

// 네임 스페이스
using namespace std;

namespace tradesim::engine {

using bar::BarData;
using logger::Logger;
using order::PositionManager;
using signal::Signal;

/// 바마다 자산을 기록하는 시점을 지정하는 열거형 클래스.\n
/// AFTER_SIGNAL → 신호 처리 후 종가 기준으로 기록\n
/// BEFORE_SIGNAL → 신호 처리 전 종가 기준으로 기록
enum class EquitySampling { AFTER_SIGNAL, BEFORE_SIGNAL };
using enum EquitySampling;

/**
 * 바를 시간 순서대로 재생하며 포지션 관리자를 호출하고 자산 곡선을 기록하는
 * 기본 시뮬레이션 루프
 *
 * 각 바마다 PositionManager::OnBar를 호출하고 종가 기준 자산을 한 점씩
 * 추가하므로, 실행이 끝나면 자산 곡선의 길이는 바 개수와 같다.
 */
class SimulationLoop final {
 public:
  explicit SimulationLoop(shared_ptr<Logger> logger);
  ~SimulationLoop();

  /**
   * 시뮬레이션을 실행하는 함수
   *
   * DataError와 ConfigError는 그대로 전파되며, 그 외의 예외는 종목, 바
   * 인덱스, 시간을 로깅한 뒤 ExecutionFailure로 다시 던진다.
   *
   * @param bars 바 데이터
   * @param signals 바마다 하나씩 생성된 신호
   * @param atr 바마다 하나씩 계산된 ATR. 비어 있으면 모든 바에서 NaN
   * @param manager 포지션 관리자
   * @param context 실행 컨텍스트
   * @param equity_sampling 자산 기록 시점
   */
  void Run(const BarData& bars, const vector<Signal>& signals,
           const vector<double>& atr, PositionManager& manager,
           RunContext& context,
           EquitySampling equity_sampling = AFTER_SIGNAL) const;

 private:
  shared_ptr<Logger> logger_;
};

}  // namespace tradesim::engine
