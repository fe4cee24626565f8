#pragma once

// 표준 라이브러리
#include <memory>
#include <string>
#include <vector>

// 내부 헤더
#include "Engines/BarData.hpp"
#include "Engines/Config.hpp"
#include "Engines/IndicatorEngine.hpp"
#include "Engines/PositionManager.hpp"
#include "Engines/RunContext.hpp"
#include "Engines/SignalGenerator.hpp"
#include "Indicators/Indicators.hpp"  // 전략 구현에서 사용 편의성을 위해 직접 포함

// 네임 스페이스
using namespace std;

namespace tradesim::strategy {

using bar::BarData;
using engine::RiskConfig;
using engine::RunContext;
using engine::StrategyConfig;
using indicator::IndicatorEngine;
using logger::Logger;
using order::PositionManager;
using signal::Signal;
using signal::SignalGenerator;

/// 전략의 실행 경로를 지정하는 열거형 클래스.\n
/// GENERIC → 엔진의 기본 시뮬레이션 루프로 실행\n
/// CUSTOM → 전략이 오버라이드한 Backtest로 실행
enum class RunMode { GENERIC, CUSTOM };
using enum RunMode;

/**
 * 백테스팅 전략의 추상 클래스
 *
 * ※ 전략 작성 시 유의 사항 ※\n
 * 1. Strategy 클래스를 Public 상속 후 Initialize를 오버라이드하여 필요한
 *    지표들을 AddIndicator로 추가하고, 생성자에서 signal_generator_의 매수,
 *    매도 규칙을 설정\n
 *
 * 2. 전략은 설정만 보유하며 실행 상태는 RunContext에 있으므로 하나의 전략
 *    객체로 독립적인 여러 실행을 수행할 수 있음\n
 *
 * 3. 기본 시뮬레이션 루프와 다른 순서가 필요하면 GetRunMode에서 CUSTOM을
 *    반환하고 Backtest를 오버라이드\n
 *
 * 4. 손절과 ATR 기반 수량 계산에 사용할 지표 이름은 GetAtrSeriesName으로
 *    지정하며, 빈 문자열이면 ATR 없이 실행
 */
class Strategy {
 public:
  virtual ~Strategy();

  Strategy(const Strategy&) = delete;
  Strategy& operator=(const Strategy&) = delete;

  /// 전략에서 사용하는 지표들을 지표 엔진에 추가하는 함수
  virtual void Initialize(IndicatorEngine& indicators) const = 0;

  /// 계산된 지표로 바별 신호를 생성하는 함수
  [[nodiscard]] virtual vector<Signal> GenerateSignals(
      const IndicatorEngine& indicators) const;

  /**
   * 전략 자체 실행 경로. 기본 구현은 엔진의 시뮬레이션 루프에 위임한다.
   *
   * @param bars 바 데이터
   * @param indicators 계산이 끝난 지표 엔진
   * @param signals 바별 신호
   * @param manager 포지션 관리자
   * @param context 실행 컨텍스트
   */
  virtual void Backtest(const BarData& bars, const IndicatorEngine& indicators,
                        const vector<Signal>& signals,
                        PositionManager& manager, RunContext& context) const;

  /// 전략의 실행 경로를 반환하는 함수
  [[nodiscard]] virtual RunMode GetRunMode() const;

  /// ATR 지표 이름을 반환하는 함수. 빈 문자열이면 ATR을 사용하지 않음
  [[nodiscard]] virtual string GetAtrSeriesName() const;

  /// ATR 값들을 반환하는 함수. ATR을 사용하지 않으면 빈 벡터
  [[nodiscard]] vector<double> GetAtrSeries(
      const IndicatorEngine& indicators) const;

  /// 전략의 위험 관리 설정을 반환하는 함수
  [[nodiscard]] RiskConfig GetRiskConfig() const;

  /// 전략의 이름을 반환하는 함수
  [[nodiscard]] string GetName() const;

  /// 전략의 설정을 반환하는 함수
  [[nodiscard]] const StrategyConfig& GetConfig() const;

  /// 전략의 신호 생성기를 반환하는 함수
  [[nodiscard]] const SignalGenerator& GetSignalGenerator() const;

 protected:
  Strategy(const string& name, const StrategyConfig& config,
           shared_ptr<Logger> logger);

  shared_ptr<Logger> logger_;
  SignalGenerator signal_generator_;

  /// 설정의 전략 계열이 기대한 계열 중 하나인지 확인하는 함수.
  /// 아니면 ConfigError
  void CheckFamily(const vector<engine::StrategyFamily>& families) const;

 private:
  string name_;
  StrategyConfig config_;
};

}  // namespace tradesim::strategy
