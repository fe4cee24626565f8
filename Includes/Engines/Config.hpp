#pragma once

// 표준 라이브러리
#include <map>
#include <optional>
#include <string>

// 외부 라이브러리
#include <nlohmann/json_fwd.hpp>

// 내부 헤더
#include "Engines/BaseBroker.hpp"
#include "Engines/TimeUtils.hpp"

// 네임 스페이스
using namespace std;
using namespace nlohmann;

namespace tradesim::engine {

using broker::BrokerType;
using utils::Timeframe;

/// 전략 계열. 알 수 없는 이름은 설정 시점에 ConfigError
enum class StrategyFamily {
  DONCHIAN,         // 필터링된 Donchian 돌파 (이전 바 채널)
  DONCHIAN_ATR,     // 긴 채널 Donchian 돌파 + ATR 변동성 필터
  SMA_THRESHOLD,    // SMA 상향 돌파 매수, 수익 조건부 매도 (자체 실행 경로)
  SMA_CROSSOVER,    // 단기, 장기 SMA 교차
  EMA_CROSSOVER,    // 단기, 장기 EMA 교차
  MACD_VOLATILITY,  // MACD + SMA 추세 + 변동성 필터
};
using enum StrategyFamily;

/// 진입 수량 결정 방식
enum class SizingMode {
  ATR_RISK,          // 자본 × 위험 비율 / (ATR × 손절 배수)
  BALANCE_FRACTION,  // 현금 × 투자 비율 만큼의 명목 금액
  FIXED_QUANTITY,    // 고정 수량
};
using enum SizingMode;

/// 진입 시 현금 처리 방식
enum class EntryAccounting {
  TRACK_EXPOSURE,  // 현금은 그대로 두고 청산 시 손익만 반영
  DEBIT_NOTIONAL,  // 진입 시 명목 금액을 현금에서 차감
};
using enum EntryAccounting;

/// 매도 신호의 의미
enum class SellAction {
  OPEN_SHORT,  // 숏 포지션 진입
  EXIT_LONG,   // 롱 포지션 청산
};
using enum SellAction;

[[nodiscard]] StrategyFamily ParseStrategyFamily(const string& name);
[[nodiscard]] SizingMode ParseSizingMode(const string& name);
[[nodiscard]] EntryAccounting ParseEntryAccounting(const string& name);
[[nodiscard]] SellAction ParseSellAction(const string& name);

[[nodiscard]] string StrategyFamilyToString(StrategyFamily family);
[[nodiscard]] string SizingModeToString(SizingMode sizing_mode);
[[nodiscard]] string EntryAccountingToString(EntryAccounting accounting);
[[nodiscard]] string SellActionToString(SellAction sell_action);

/// 포지션 관리자의 진입, 청산 규칙을 지정하는 구조체
struct RiskConfig {
  SizingMode sizing_mode = ATR_RISK;
  EntryAccounting entry_accounting = TRACK_EXPOSURE;
  SellAction sell_action = OPEN_SHORT;

  double stop_atr_multiple = 2.0;         // 손절 거리 = ATR × 배수
  double take_profit_atr_multiple = 0.0;  // 0이면 익절 없음
  double risk_per_trade_fraction = 0.005;
  double max_notional_fraction = 0.10;
  double min_notional = 10.0;
  double balance_investment_fraction = 0.8;
  double fixed_quantity = 1.0;
  bool use_stop_loss = true;  // false면 손절 거리는 수량 계산에만 사용

  bool profit_gated_exit = false;  // 매도 청산을 수익일 때만 허용
  double profit_threshold = 0.0;   // 청산에 필요한 최소 수익률
};

/// 엔진의 사전 설정값을 담당하는 빌더 클래스
class Config final {
 public:
  Config();
  ~Config();

  /**
   * Json에서 엔진 설정을 읽어오는 함수.
   * 알 수 없는 키나 잘못된 값이면 ConfigError를 던진다.
   *
   * 키: initial_balance, risk_free_rate, results_directory, log_directory,
   *     data_directory, cache_directory, broker
   */
  [[nodiscard]] static Config FromJson(const json& config);

  /// 초기 자금을 설정하는 함수. 0보다 커야 함
  Config& SetInitialBalance(double initial_balance);

  /// 샤프 지수 계산에 사용할 연간 무위험 수익률을 설정하는 함수
  Config& SetRiskFreeRate(double risk_free_rate);

  /// 백테스팅 결과가 저장될 폴더를 설정하는 함수
  Config& SetResultsDirectory(const string& results_directory);

  /// 로그 파일이 저장될 폴더를 설정하는 함수
  Config& SetLogDirectory(const string& log_directory);

  /// Parquet 바 데이터가 저장된 폴더를 설정하는 함수
  Config& SetDataDirectory(const string& data_directory);

  /// 바 데이터 캐시 폴더를 설정하는 함수. 비어 있으면 캐시하지 않음
  Config& SetCacheDirectory(const string& cache_directory);

  /// 주문을 전달할 브로커를 설정하는 함수
  Config& SetBroker(BrokerType broker);

  [[nodiscard]] double GetInitialBalance() const;
  [[nodiscard]] double GetRiskFreeRate() const;
  [[nodiscard]] string GetResultsDirectory() const;
  [[nodiscard]] string GetLogDirectory() const;
  [[nodiscard]] string GetDataDirectory() const;
  [[nodiscard]] string GetCacheDirectory() const;
  [[nodiscard]] optional<BrokerType> GetBroker() const;

  /// 설정을 Json으로 변환하는 함수
  [[nodiscard]] json ToJson() const;

 private:
  double initial_balance_;
  double risk_free_rate_;
  string results_directory_;
  string log_directory_;
  string data_directory_;
  string cache_directory_;
  optional<BrokerType> broker_;
};

/**
 * 전략 계열, 타임프레임, 계열별로 고정된 이름의 파라미터를 담는 클래스
 *
 * 생성 시 계열의 기본값으로 채워지며, 계열에 없는 파라미터 이름이나
 * 범위를 벗어난 값은 ConfigError를 던진다. 불리언 파라미터는 0 또는 1로
 * 저장한다.
 */
class StrategyConfig final {
 public:
  explicit StrategyConfig(StrategyFamily family,
                          Timeframe timeframe = utils::DAY_1);
  ~StrategyConfig();

  /**
   * Json에서 전략 설정을 읽어오는 함수
   *
   * 키: family (필수), timeframe, sizing_mode, entry_accounting,
   *     sell_action, parameters (이름: 숫자 또는 불리언)
   */
  [[nodiscard]] static StrategyConfig FromJson(const json& config);

  /// 파라미터를 설정하는 함수
  StrategyConfig& SetParameter(const string& key, double value);

  StrategyConfig& SetSizingMode(SizingMode sizing_mode);
  StrategyConfig& SetEntryAccounting(EntryAccounting entry_accounting);
  StrategyConfig& SetSellAction(SellAction sell_action);

  [[nodiscard]] StrategyFamily GetFamily() const;
  [[nodiscard]] Timeframe GetTimeframe() const;

  /// 파라미터 값을 반환하는 함수. 없는 이름이면 ConfigError
  [[nodiscard]] double GetParameter(const string& key) const;

  /// 기간 파라미터를 정수로 반환하는 함수
  [[nodiscard]] size_t GetWindow(const string& key) const;

  /// 불리언 파라미터를 반환하는 함수
  [[nodiscard]] bool GetFlag(const string& key) const;

  /// 모든 파라미터를 이름 순서로 반환하는 함수
  [[nodiscard]] const map<string, double>& GetParameters() const;

  /// 위험 관련 파라미터로 RiskConfig를 만들어 반환하는 함수
  [[nodiscard]] RiskConfig GetRiskConfig() const;

  /// 설정을 Json으로 변환하는 함수
  [[nodiscard]] json ToJson() const;

 private:
  StrategyFamily family_;
  Timeframe timeframe_;
  map<string, double> parameters_;
  SizingMode sizing_mode_;
  EntryAccounting entry_accounting_;
  SellAction sell_action_;
};

}  // namespace tradesim::engine
