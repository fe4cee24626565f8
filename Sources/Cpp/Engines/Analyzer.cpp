// 표준 라이브러리
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>

// 외부 라이브러리
#include <arrow/api.h>
#include <nlohmann/json.hpp>

// 파일 헤더
#include "Engines/Analyzer.hpp"

// 내부 헤더
#include "Engines/DataUtils.hpp"
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"
#include "Engines/TimeUtils.hpp"

// 네임 스페이스
using namespace tradesim::exception;
using namespace tradesim::logger;
using namespace tradesim::utils;

namespace tradesim::analyzer {

namespace {

constexpr double kTradingDaysPerYear = 252.0;
constexpr double kDaysPerYear = 365.25;
constexpr double kDaysPerMonth = 30.44;
constexpr double kSharpeEpsilon = 1e-10;

/// 유한하지 않은 값을 0으로 바꾸는 함수
double FiniteOrZero(const double value) { return isfinite(value) ? value : 0.0; }

}  // namespace

Analyzer::Analyzer(const double initial_capital, const double risk_free_rate,
                   shared_ptr<Logger> logger)
    : initial_capital_(initial_capital),
      risk_free_rate_(risk_free_rate),
      logger_(std::move(logger)) {}
Analyzer::~Analyzer() = default;

PerformanceMetrics Analyzer::CalculateMetrics(
    const vector<Trade>& trades, const vector<EquityPoint>& equity_curve,
    const double final_cash) const {
  PerformanceMetrics metrics;

  if (trades.empty()) {
    metrics.final_capital = initial_capital_;
    return metrics;
  }

  metrics.final_capital = final_cash;

  const int64_t days =
      (trades.back().GetTimestamp() - trades.front().GetTimestamp()) / kDay;
  const double years = static_cast<double>(days) / kDaysPerYear;

  if (years > 0) {
    metrics.cagr = FiniteOrZero(
        pow(final_cash / initial_capital_, 1.0 / years) - 1.0);
  }

  metrics.sharpe = CalculateSharpe(equity_curve);
  metrics.max_drawdown = CalculateMaxDrawdown(trades);

  if (days > 0) {
    const auto num_trades = static_cast<double>(trades.size());
    metrics.avg_trades_per_day =
        FiniteOrZero(num_trades / static_cast<double>(days));
    metrics.avg_trades_per_month =
        FiniteOrZero(num_trades / (static_cast<double>(days) / kDaysPerMonth));
  }

  return metrics;
}

double Analyzer::CalculateSharpe(
    const vector<EquityPoint>& equity_curve) const {
  vector<double> returns;
  returns.reserve(equity_curve.size());

  for (size_t idx = 1; idx < equity_curve.size(); idx++) {
    if (const double change =
            equity_curve[idx].equity / equity_curve[idx - 1].equity - 1.0;
        isfinite(change)) {
      returns.push_back(change);
    }
  }

  if (returns.empty()) {
    return 0.0;
  }

  double sum = 0.0;
  for (const double value : returns) {
    sum += value;
  }
  const double mean = sum / static_cast<double>(returns.size());

  // 모집단 표준 편차
  double squared_sum = 0.0;
  for (const double value : returns) {
    squared_sum += (value - mean) * (value - mean);
  }
  const double stddev = sqrt(squared_sum / static_cast<double>(returns.size()));

  return FiniteOrZero((mean - risk_free_rate_ / kTradingDaysPerYear) /
                      (stddev + kSharpeEpsilon) * sqrt(kTradingDaysPerYear));
}

double Analyzer::CalculateMaxDrawdown(const vector<Trade>& trades) {
  if (trades.empty()) {
    return 0.0;
  }

  double peak = trades.front().GetBalance();
  double max_drawdown = 0.0;

  for (const auto& trade : trades) {
    const double balance = trade.GetBalance();
    peak = max(peak, balance);

    if (const double drawdown = (balance - peak) / peak;
        isfinite(drawdown) && drawdown < max_drawdown) {
      max_drawdown = drawdown;
    }
  }

  return max_drawdown;
}

void Analyzer::SaveTradeList(const vector<Trade>& trades,
                             const string& file_path) const {
  ordered_json trade_list_json = ordered_json::array();

  for (const auto& trade : trades) {
    ordered_json trade_json = {
        {"거래 번호", trade.GetTradeNumber()},
        {"거래 시간", UtcTimestampToUtcDatetime(trade.GetTimestamp())},
        {"거래 종류", TradeTypeToString(trade.GetTradeType())},
        {"방향", order::DirectionToString(trade.GetDirection())},
        {"가격", trade.GetPrice()},
        {"수량", trade.GetSize()},
        {"현재 자금", trade.GetBalance()},
        {"사유", trade.GetReason()}};

    if (const auto profit = trade.GetProfit()) {
      trade_json["손익"] = *profit;
    } else {
      trade_json["손익"] = nullptr;
    }

    trade_list_json.push_back(trade_json);
  }

  if (const auto& parent = filesystem::path(file_path).parent_path();
      !parent.empty()) {
    filesystem::create_directories(parent);
  }

  ofstream trade_list_file(file_path);
  if (!trade_list_file.is_open()) {
    logger_->LogAndThrowError<DataError>(
        "거래 내역 [" + file_path + "]을(를) 생성할 수 없습니다.", __FILE__,
        __LINE__);
  }

  trade_list_file << trade_list_json.dump(2);
  trade_list_file.close();

  logger_->Log(INFO_L, "거래 내역이 저장되었습니다.", __FILE__, __LINE__);
}

void Analyzer::SaveEquityCurve(const vector<EquityPoint>& equity_curve,
                               const string& directory_path,
                               const string& file_name) const {
  arrow::Int64Builder timestamp_builder;
  arrow::DoubleBuilder equity_builder;

  for (const auto& [timestamp, equity] : equity_curve) {
    if (const auto& status = timestamp_builder.Append(timestamp);
        !status.ok()) {
      logger_->LogAndThrowError<DataError>(
          "자산 곡선 시간 열을 만드는 데 실패했습니다.: " + status.ToString(),
          __FILE__, __LINE__);
    }

    if (const auto& status = equity_builder.Append(equity); !status.ok()) {
      logger_->LogAndThrowError<DataError>(
          "자산 곡선 자산 열을 만드는 데 실패했습니다.: " + status.ToString(),
          __FILE__, __LINE__);
    }
  }

  shared_ptr<arrow::Array> timestamp_array;
  shared_ptr<arrow::Array> equity_array;
  auto status = timestamp_builder.Finish(&timestamp_array);
  if (status.ok()) {
    status = equity_builder.Finish(&equity_array);
  }

  if (!status.ok()) {
    logger_->LogAndThrowError<DataError>(
        "자산 곡선 테이블을 만드는 데 실패했습니다.: " + status.ToString(),
        __FILE__, __LINE__);
  }

  const auto schema = arrow::schema({arrow::field("timestamp", arrow::int64()),
                                     arrow::field("equity", arrow::float64())});
  const auto table =
      arrow::Table::Make(schema, {timestamp_array, equity_array});

  TableToParquet(table, directory_path, file_name);

  logger_->Log(INFO_L, "자산 곡선이 저장되었습니다.", __FILE__, __LINE__);
}

void Analyzer::SaveMetrics(const PerformanceMetrics& metrics,
                           const string& file_path) const {
  JsonToFile(MetricsToJson(metrics), file_path);
  logger_->Log(INFO_L, "성과 지표가 저장되었습니다.", __FILE__, __LINE__);
}

json Analyzer::MetricsToJson(const PerformanceMetrics& metrics) {
  return {{"final_capital", metrics.final_capital},
          {"cagr", metrics.cagr},
          {"sharpe", metrics.sharpe},
          {"max_drawdown", metrics.max_drawdown},
          {"avg_trades_per_day", metrics.avg_trades_per_day},
          {"avg_trades_per_month", metrics.avg_trades_per_month}};
}

string Analyzer::FormatSummary(const PerformanceMetrics& metrics) {
  string summary;
  summary += "최종 자금: " + FormatDollar(metrics.final_capital) + "\n";
  summary += "CAGR: " + FormatPercentage(metrics.cagr) + "\n";
  summary += "샤프 지수: " + ToFixedString(metrics.sharpe, 2) + "\n";
  summary += "최대 낙폭: " + FormatPercentage(metrics.max_drawdown) + "\n";
  summary += "일 평균 거래 횟수: " +
             ToFixedString(metrics.avg_trades_per_day, 2) + "\n";
  summary += "월 평균 거래 횟수: " +
             ToFixedString(metrics.avg_trades_per_month, 2);

  return summary;
}

double Analyzer::GetInitialCapital() const { return initial_capital_; }
double Analyzer::GetRiskFreeRate() const { return risk_free_rate_; }

}  // namespace tradesim::analyzer
