#pragma once

// 표준 라이브러리
#include <memory>
#include <string>
#include <vector>

// 외부 라이브러리
#include <nlohmann/json_fwd.hpp>

// 내부 헤더
#include "Engines/RunContext.hpp"
#include "Engines/Trade.hpp"

// 전방 선언
namespace tradesim::logger {
class Logger;
}

// 네임 스페이스
using namespace std;
using namespace nlohmann;

namespace tradesim::analyzer {

using engine::EquityPoint;
using logger::Logger;

/// 한 번의 백테스팅 성과 지표. 모든 값은 유한함
struct PerformanceMetrics {
  double final_capital = 0.0;
  double cagr = 0.0;          // 비율 (0.1 = 10%)
  double sharpe = 0.0;
  double max_drawdown = 0.0;  // 비율. 거래 후 현금 기준, 항상 0 이하
  double avg_trades_per_day = 0.0;
  double avg_trades_per_month = 0.0;
};

/// 거래 기록과 자산 곡선으로 성과를 분석하고 결과를 저장하는 클래스
class Analyzer final {
 public:
  Analyzer(double initial_capital, double risk_free_rate,
           shared_ptr<Logger> logger);
  ~Analyzer();

  /**
   * 성과 지표를 계산하는 함수
   *
   * 거래가 없으면 최종 자금은 초기 자금, 나머지 지표는 0이다.
   * 기간은 첫 거래와 마지막 거래 사이의 일 수(소수점 버림)이며,
   * 중간 계산이 유한하지 않으면 해당 지표는 0으로 처리한다.
   *
   * @param trades 거래 기록
   * @param equity_curve 바마다 기록된 자산 곡선
   * @param final_cash 마지막 바 처리 후의 현금
   * @return 성과 지표
   */
  [[nodiscard]] PerformanceMetrics CalculateMetrics(
      const vector<Trade>& trades, const vector<EquityPoint>& equity_curve,
      double final_cash) const;

  /// 거래 기록을 Json 배열 파일로 저장하는 함수
  void SaveTradeList(const vector<Trade>& trades,
                     const string& file_path) const;

  /// 자산 곡선을 Parquet 파일로 저장하는 함수
  void SaveEquityCurve(const vector<EquityPoint>& equity_curve,
                       const string& directory_path,
                       const string& file_name) const;

  /// 성과 지표를 Json 파일로 저장하는 함수
  void SaveMetrics(const PerformanceMetrics& metrics,
                   const string& file_path) const;

  /// 성과 지표를 Json으로 변환하는 함수
  [[nodiscard]] static json MetricsToJson(const PerformanceMetrics& metrics);

  /// 성과 지표를 로그 출력용 요약 문자열로 변환하는 함수
  [[nodiscard]] static string FormatSummary(const PerformanceMetrics& metrics);

  [[nodiscard]] double GetInitialCapital() const;
  [[nodiscard]] double GetRiskFreeRate() const;

 private:
  double initial_capital_;
  double risk_free_rate_;
  shared_ptr<Logger> logger_;

  /// 자산 곡선의 변화율로 연율화 샤프 지수를 계산하는 함수
  [[nodiscard]] double CalculateSharpe(
      const vector<EquityPoint>& equity_curve) const;

  /// 거래 기록 순서대로 거래 후 현금의 최대 낙폭을 계산하는 함수.
  /// 고점은 첫 거래의 현금에서 시작하며 미실현 손익은 반영하지 않음
  [[nodiscard]] static double CalculateMaxDrawdown(
      const vector<Trade>& trades);
};

}  // namespace tradesim::analyzer
