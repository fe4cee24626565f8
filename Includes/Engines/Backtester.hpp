#pragma once

// 표준 라이브러리
#include <memory>
#include <string>
#include <vector>

// 내부 헤더
#include "Engines/Analyzer.hpp"
#include "Engines/BarData.hpp"
#include "Engines/Config.hpp"
#include "Engines/RunContext.hpp"
#include "Engines/Strategy.hpp"
#include "Engines/Trade.hpp"

// 네임 스페이스
using namespace std;

namespace tradesim::engine {

using analyzer::PerformanceMetrics;
using analyzer::Trade;
using bar::BarData;
using broker::BaseBroker;
using logger::Logger;
using strategy::Strategy;

/// 한 번의 백테스팅 실행 결과
struct BacktestResult {
  string instrument;
  string strategy_name;
  PerformanceMetrics metrics;
  vector<Trade> trades;
  vector<EquityPoint> equity_curve;
  double final_cash = 0.0;
};

/**
 * 전략, 지표 계산, 시뮬레이션, 성과 분석을 연결하는 백테스팅 실행기
 *
 * Run을 호출할 때마다 새로운 RunContext와 지표 엔진을 만들기 때문에 하나의
 * 실행기로 여러 종목을 순차적으로 실행할 수 있다.
 */
class Backtester final {
 public:
  Backtester(shared_ptr<Strategy> strategy, const Config& config,
             shared_ptr<Logger> logger, shared_ptr<BaseBroker> broker = nullptr);
  ~Backtester();

  /**
   * 주어진 바 데이터로 백테스팅을 실행하는 함수.
   * 실행 중 발생한 예외는 원인을 로깅한 뒤 그대로 다시 던진다.
   *
   * @param bars 한 종목의 바 데이터
   * @return 실행 결과
   */
  [[nodiscard]] BacktestResult Run(const BarData& bars) const;

  /// 실행 결과를 결과 폴더의 종목 하위 폴더에 저장하는 함수
  void SaveResult(const BacktestResult& result) const;

  [[nodiscard]] const Config& GetConfig() const;
  [[nodiscard]] const shared_ptr<Strategy>& GetStrategy() const;

 private:
  shared_ptr<Strategy> strategy_;
  Config config_;
  shared_ptr<Logger> logger_;
  shared_ptr<BaseBroker> broker_;

  /// 전략의 실행 경로로 시뮬레이션을 수행하는 함수
  void Simulate(const BarData& bars, RunContext& context) const;
};

}  // namespace tradesim::engine
