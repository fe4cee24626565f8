// 표준 라이브러리
#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <vector>

// 외부 라이브러리
#include <nlohmann/json.hpp>

// 파일 헤더
#include "Engines/Config.hpp"

// 내부 헤더
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"

// 네임 스페이스
using namespace tradesim::exception;
using namespace tradesim::logger;

namespace tradesim::engine {

namespace {

/// 파라미터 값의 허용 범위 종류
enum class ParameterKind {
  WINDOW,           // 1 이상의 정수
  OPTIONAL_WINDOW,  // 0 이상의 정수. 0이면 해당 필터 비활성화
  SHIFT,            // 0 또는 1
  FLAG,             // 0 또는 1
  FRACTION,         // (0, 1]
  NON_NEGATIVE,     // 0 이상
  POSITIVE,         // 0 초과
};
using enum ParameterKind;

const unordered_map<string, ParameterKind>& GetParameterKinds() {
  static const unordered_map<string, ParameterKind> kinds = {
      // 위험 관리
      {"stop_atr_multiple", POSITIVE},
      {"take_profit_atr_multiple", NON_NEGATIVE},
      {"risk_per_trade_fraction", FRACTION},
      {"max_notional_fraction", FRACTION},
      {"min_notional", NON_NEGATIVE},
      {"balance_investment_fraction", FRACTION},
      {"fixed_quantity", POSITIVE},
      {"profit_threshold", NON_NEGATIVE},
      {"profit_gated_exit", FLAG},
      {"use_stop_loss", FLAG},

      // Donchian
      {"donchian_entry_window", WINDOW},
      {"donchian_exit_window", WINDOW},
      {"donchian_shift", SHIFT},
      {"full_channel_window", FLAG},
      {"atr_period", WINDOW},
      {"atr_median_window", WINDOW},
      {"atr_mult_entry", NON_NEGATIVE},
      {"sma_trend_period", OPTIONAL_WINDOW},
      {"sma_momentum_period", WINDOW},

      // 이동 평균
      {"sma_period", WINDOW},
      {"short_window", WINDOW},
      {"long_window", WINDOW},

      // MACD
      {"macd_fast", WINDOW},
      {"macd_slow", WINDOW},
      {"macd_signal", WINDOW},
      {"sma_fast_period", WINDOW},
      {"sma_slow_period", WINDOW},
      {"channel_period", WINDOW},
      {"volatility_median_window", WINDOW}};

  return kinds;
}

/// 모든 계열이 공유하는 위험 관리 파라미터 기본값
map<string, double> GetCommonDefaults() {
  return {{"stop_atr_multiple", 2.0},
          {"take_profit_atr_multiple", 0.0},
          {"risk_per_trade_fraction", 0.005},
          {"max_notional_fraction", 0.10},
          {"min_notional", 10.0},
          {"balance_investment_fraction", 0.8},
          {"fixed_quantity", 1.0},
          {"profit_threshold", 0.0},
          {"profit_gated_exit", 0.0},
          {"use_stop_loss", 1.0}};
}

/// 계열별 파라미터 기본값을 공통 기본값 위에 덮어써 반환하는 함수
map<string, double> GetFamilyDefaults(const StrategyFamily family) {
  auto parameters = GetCommonDefaults();

  const auto apply = [&parameters](const map<string, double>& overrides) {
    for (const auto& [key, value] : overrides) {
      parameters[key] = value;
    }
  };

  switch (family) {
    case DONCHIAN: {
      apply({{"donchian_entry_window", 20},
             {"donchian_exit_window", 10},
             {"donchian_shift", 1},
             {"full_channel_window", 1},
             {"atr_period", 14},
             {"atr_median_window", 50},
             {"atr_mult_entry", 1.5},
             {"sma_trend_period", 200},
             {"sma_momentum_period", 50}});
      break;
    }

    case DONCHIAN_ATR: {
      apply({{"donchian_entry_window", 55},
             {"donchian_exit_window", 20},
             {"donchian_shift", 1},
             {"full_channel_window", 0},
             {"atr_period", 21},
             {"atr_median_window", 50},
             {"atr_mult_entry", 1.0},
             {"sma_trend_period", 200},
             {"sma_momentum_period", 10}});
      break;
    }

    case SMA_THRESHOLD: {
      apply({{"sma_period", 200},
             {"balance_investment_fraction", 0.8},
             {"profit_threshold", 0.20},
             {"profit_gated_exit", 1},
             {"use_stop_loss", 0}});
      break;
    }

    case SMA_CROSSOVER: {
      apply({{"short_window", 5},
             {"long_window", 20},
             {"fixed_quantity", 1},
             {"profit_gated_exit", 1},
             {"use_stop_loss", 0}});
      break;
    }

    case EMA_CROSSOVER: {
      apply({{"short_window", 8},
             {"long_window", 21},
             {"atr_period", 14},
             {"stop_atr_multiple", 1.0},
             {"risk_per_trade_fraction", 0.01},
             {"profit_gated_exit", 1},
             {"use_stop_loss", 0}});
      break;
    }

    case MACD_VOLATILITY: {
      apply({{"macd_fast", 12},
             {"macd_slow", 26},
             {"macd_signal", 9},
             {"sma_fast_period", 20},
             {"sma_slow_period", 50},
             {"channel_period", 14},
             {"volatility_median_window", 50},
             {"atr_period", 14}});
      break;
    }
  }

  return parameters;
}

/// 계열별 진입, 청산 규칙 기본값을 설정하는 함수
void GetFamilyModes(const StrategyFamily family, SizingMode& sizing_mode,
                    EntryAccounting& entry_accounting,
                    SellAction& sell_action) {
  switch (family) {
    case DONCHIAN:
      [[fallthrough]];
    case MACD_VOLATILITY: {
      sizing_mode = ATR_RISK;
      entry_accounting = TRACK_EXPOSURE;
      sell_action = OPEN_SHORT;
      return;
    }

    case DONCHIAN_ATR:
      [[fallthrough]];
    case EMA_CROSSOVER: {
      sizing_mode = ATR_RISK;
      entry_accounting = TRACK_EXPOSURE;
      sell_action = EXIT_LONG;
      return;
    }

    case SMA_THRESHOLD: {
      sizing_mode = BALANCE_FRACTION;
      entry_accounting = DEBIT_NOTIONAL;
      sell_action = EXIT_LONG;
      return;
    }

    case SMA_CROSSOVER: {
      sizing_mode = FIXED_QUANTITY;
      entry_accounting = DEBIT_NOTIONAL;
      sell_action = EXIT_LONG;
      return;
    }
  }
}

/// 값이 정수인지 확인하는 함수
bool IsInteger(const double value) { return value == floor(value); }

/// 파라미터 값이 허용 범위 안인지 확인하는 함수
bool IsValidParameter(const ParameterKind kind, const double value) {
  if (!isfinite(value)) {
    return false;
  }

  switch (kind) {
    case WINDOW: {
      return IsInteger(value) && value >= 1;
    }

    case OPTIONAL_WINDOW: {
      return IsInteger(value) && value >= 0;
    }

    case SHIFT:
      [[fallthrough]];
    case FLAG: {
      return value == 0 || value == 1;
    }

    case FRACTION: {
      return value > 0 && value <= 1;
    }

    case NON_NEGATIVE: {
      return value >= 0;
    }

    case POSITIVE: {
      return value > 0;
    }
  }

  return false;
}

/// Json 객체에 허용되지 않은 키가 있으면 ConfigError를 던지는 함수
void CheckKeys(const json& config, const vector<string>& allowed_keys,
               const string& section) {
  if (!config.is_object()) {
    Logger::GetLogger()->LogAndThrowError<ConfigError>(
        "[" + section + "] 설정은 Json 객체여야 합니다.", __FILE__, __LINE__);
  }

  for (const auto& [key, value] : config.items()) {
    if (find(allowed_keys.begin(), allowed_keys.end(), key) ==
        allowed_keys.end()) {
      Logger::GetLogger()->LogAndThrowError<ConfigError>(
          "[" + section + "] 설정에 알 수 없는 키 [" + key + "]이(가) 있습니다.",
          __FILE__, __LINE__);
    }
  }
}

/// Json 값을 지정된 타입으로 읽는 함수. 타입이 다르면 ConfigError
template <typename T>
T ReadValue(const json& config, const string& key) {
  try {
    return config.at(key).get<T>();
  } catch (const json::exception& e) {
    Logger::GetLogger()->LogAndThrowError<ConfigError>(
        "설정 키 [" + key + "]을(를) 읽을 수 없습니다: " + e.what(), __FILE__,
        __LINE__);
  }
}

}  // namespace

// =============================================================================
StrategyFamily ParseStrategyFamily(const string& name) {
  static const unordered_map<string, StrategyFamily> families = {
      {"donchian", DONCHIAN},
      {"donchian_atr", DONCHIAN_ATR},
      {"sma_threshold", SMA_THRESHOLD},
      {"sma_crossover", SMA_CROSSOVER},
      {"ema_crossover", EMA_CROSSOVER},
      {"macd_volatility", MACD_VOLATILITY}};

  if (const auto it = families.find(name); it != families.end()) {
    return it->second;
  }

  Logger::GetLogger()->LogAndThrowError<ConfigError>(
      "알 수 없는 전략 계열 [" + name + "]이(가) 지정되었습니다.", __FILE__,
      __LINE__);
}

SizingMode ParseSizingMode(const string& name) {
  if (name == "atr_risk") {
    return ATR_RISK;
  }

  if (name == "balance_fraction") {
    return BALANCE_FRACTION;
  }

  if (name == "fixed_quantity") {
    return FIXED_QUANTITY;
  }

  Logger::GetLogger()->LogAndThrowError<ConfigError>(
      "알 수 없는 수량 결정 방식 [" + name + "]이(가) 지정되었습니다.",
      __FILE__, __LINE__);
}

EntryAccounting ParseEntryAccounting(const string& name) {
  if (name == "track_exposure") {
    return TRACK_EXPOSURE;
  }

  if (name == "debit_notional") {
    return DEBIT_NOTIONAL;
  }

  Logger::GetLogger()->LogAndThrowError<ConfigError>(
      "알 수 없는 진입 회계 방식 [" + name + "]이(가) 지정되었습니다.",
      __FILE__, __LINE__);
}

SellAction ParseSellAction(const string& name) {
  if (name == "open_short") {
    return OPEN_SHORT;
  }

  if (name == "exit_long") {
    return EXIT_LONG;
  }

  Logger::GetLogger()->LogAndThrowError<ConfigError>(
      "알 수 없는 매도 신호 동작 [" + name + "]이(가) 지정되었습니다.",
      __FILE__, __LINE__);
}

string StrategyFamilyToString(const StrategyFamily family) {
  switch (family) {
    case DONCHIAN: {
      return "donchian";
    }

    case DONCHIAN_ATR: {
      return "donchian_atr";
    }

    case SMA_THRESHOLD: {
      return "sma_threshold";
    }

    case SMA_CROSSOVER: {
      return "sma_crossover";
    }

    case EMA_CROSSOVER: {
      return "ema_crossover";
    }

    case MACD_VOLATILITY: {
      return "macd_volatility";
    }
  }

  return "";
}

string SizingModeToString(const SizingMode sizing_mode) {
  switch (sizing_mode) {
    case ATR_RISK: {
      return "atr_risk";
    }

    case BALANCE_FRACTION: {
      return "balance_fraction";
    }

    case FIXED_QUANTITY: {
      return "fixed_quantity";
    }
  }

  return "";
}

string EntryAccountingToString(const EntryAccounting accounting) {
  return accounting == TRACK_EXPOSURE ? "track_exposure" : "debit_notional";
}

string SellActionToString(const SellAction sell_action) {
  return sell_action == OPEN_SHORT ? "open_short" : "exit_long";
}

// =============================================================================
Config::Config()
    : initial_balance_(100000.0),
      risk_free_rate_(0.02),
      results_directory_("Results"),
      log_directory_("Logs"),
      data_directory_("Data") {}
Config::~Config() = default;

Config Config::FromJson(const json& config) {
  CheckKeys(config,
            {"initial_balance", "risk_free_rate", "results_directory",
             "log_directory", "data_directory", "cache_directory", "broker"},
            "engine");

  Config engine_config;

  if (config.contains("initial_balance")) {
    engine_config.SetInitialBalance(
        ReadValue<double>(config, "initial_balance"));
  }

  if (config.contains("risk_free_rate")) {
    engine_config.SetRiskFreeRate(ReadValue<double>(config, "risk_free_rate"));
  }

  if (config.contains("results_directory")) {
    engine_config.SetResultsDirectory(
        ReadValue<string>(config, "results_directory"));
  }

  if (config.contains("log_directory")) {
    engine_config.SetLogDirectory(ReadValue<string>(config, "log_directory"));
  }

  if (config.contains("data_directory")) {
    engine_config.SetDataDirectory(ReadValue<string>(config, "data_directory"));
  }

  if (config.contains("cache_directory")) {
    engine_config.SetCacheDirectory(
        ReadValue<string>(config, "cache_directory"));
  }

  if (config.contains("broker")) {
    engine_config.SetBroker(
        broker::ParseBrokerType(ReadValue<string>(config, "broker")));
  }

  return engine_config;
}

Config& Config::SetInitialBalance(const double initial_balance) {
  if (!isfinite(initial_balance) || initial_balance <= 0) {
    Logger::GetLogger()->LogAndThrowError<ConfigError>(
        "초기 자금 [" + to_string(initial_balance) + "]은(는) 0보다 커야 합니다.",
        __FILE__, __LINE__);
  }

  initial_balance_ = initial_balance;
  return *this;
}

Config& Config::SetRiskFreeRate(const double risk_free_rate) {
  if (!isfinite(risk_free_rate)) {
    Logger::GetLogger()->LogAndThrowError<ConfigError>(
        "무위험 수익률은 유한한 값이어야 합니다.", __FILE__, __LINE__);
  }

  risk_free_rate_ = risk_free_rate;
  return *this;
}

Config& Config::SetResultsDirectory(const string& results_directory) {
  results_directory_ = results_directory;
  return *this;
}

Config& Config::SetLogDirectory(const string& log_directory) {
  log_directory_ = log_directory;
  return *this;
}

Config& Config::SetDataDirectory(const string& data_directory) {
  data_directory_ = data_directory;
  return *this;
}

Config& Config::SetCacheDirectory(const string& cache_directory) {
  cache_directory_ = cache_directory;
  return *this;
}

Config& Config::SetBroker(const BrokerType broker) {
  broker_ = broker;
  return *this;
}

double Config::GetInitialBalance() const { return initial_balance_; }
double Config::GetRiskFreeRate() const { return risk_free_rate_; }
string Config::GetResultsDirectory() const { return results_directory_; }
string Config::GetLogDirectory() const { return log_directory_; }
string Config::GetDataDirectory() const { return data_directory_; }
string Config::GetCacheDirectory() const { return cache_directory_; }
optional<BrokerType> Config::GetBroker() const { return broker_; }

json Config::ToJson() const {
  json config = {{"initial_balance", initial_balance_},
                 {"risk_free_rate", risk_free_rate_},
                 {"results_directory", results_directory_},
                 {"log_directory", log_directory_},
                 {"data_directory", data_directory_},
                 {"cache_directory", cache_directory_}};

  if (broker_) {
    config["broker"] = "paper";
  }

  return config;
}

// =============================================================================
StrategyConfig::StrategyConfig(const StrategyFamily family,
                               const Timeframe timeframe)
    : family_(family),
      timeframe_(timeframe),
      parameters_(GetFamilyDefaults(family)),
      sizing_mode_(ATR_RISK),
      entry_accounting_(TRACK_EXPOSURE),
      sell_action_(OPEN_SHORT) {
  GetFamilyModes(family, sizing_mode_, entry_accounting_, sell_action_);
}
StrategyConfig::~StrategyConfig() = default;

StrategyConfig StrategyConfig::FromJson(const json& config) {
  CheckKeys(config,
            {"family", "timeframe", "sizing_mode", "entry_accounting",
             "sell_action", "parameters"},
            "strategy");

  if (!config.contains("family")) {
    Logger::GetLogger()->LogAndThrowError<ConfigError>(
        "전략 설정에 family 키가 없습니다.", __FILE__, __LINE__);
  }

  const auto family = ParseStrategyFamily(ReadValue<string>(config, "family"));
  const auto timeframe =
      config.contains("timeframe")
          ? utils::ParseTimeframe(ReadValue<string>(config, "timeframe"))
          : utils::DAY_1;

  StrategyConfig strategy_config(family, timeframe);

  if (config.contains("sizing_mode")) {
    strategy_config.SetSizingMode(
        ParseSizingMode(ReadValue<string>(config, "sizing_mode")));
  }

  if (config.contains("entry_accounting")) {
    strategy_config.SetEntryAccounting(
        ParseEntryAccounting(ReadValue<string>(config, "entry_accounting")));
  }

  if (config.contains("sell_action")) {
    strategy_config.SetSellAction(
        ParseSellAction(ReadValue<string>(config, "sell_action")));
  }

  if (config.contains("parameters")) {
    const auto& parameters = config.at("parameters");
    if (!parameters.is_object()) {
      Logger::GetLogger()->LogAndThrowError<ConfigError>(
          "parameters 설정은 Json 객체여야 합니다.", __FILE__, __LINE__);
    }

    for (const auto& [key, value] : parameters.items()) {
      if (value.is_boolean()) {
        strategy_config.SetParameter(key, value.get<bool>() ? 1.0 : 0.0);
      } else if (value.is_number()) {
        strategy_config.SetParameter(key, value.get<double>());
      } else {
        Logger::GetLogger()->LogAndThrowError<ConfigError>(
            "파라미터 [" + key + "]의 값은 숫자 또는 불리언이어야 합니다.",
            __FILE__, __LINE__);
      }
    }
  }

  return strategy_config;
}

StrategyConfig& StrategyConfig::SetParameter(const string& key,
                                             const double value) {
  const auto it = parameters_.find(key);
  if (it == parameters_.end()) {
    Logger::GetLogger()->LogAndThrowError<ConfigError>(
        "[" + StrategyFamilyToString(family_) + "] 전략에 파라미터 [" + key +
            "]이(가) 존재하지 않습니다.",
        __FILE__, __LINE__);
  }

  if (!IsValidParameter(GetParameterKinds().at(key), value)) {
    Logger::GetLogger()->LogAndThrowError<ConfigError>(
        "파라미터 [" + key + "]의 값 [" + to_string(value) +
            "]이(가) 허용 범위를 벗어났습니다.",
        __FILE__, __LINE__);
  }

  it->second = value;
  return *this;
}

StrategyConfig& StrategyConfig::SetSizingMode(const SizingMode sizing_mode) {
  sizing_mode_ = sizing_mode;
  return *this;
}

StrategyConfig& StrategyConfig::SetEntryAccounting(
    const EntryAccounting entry_accounting) {
  entry_accounting_ = entry_accounting;
  return *this;
}

StrategyConfig& StrategyConfig::SetSellAction(const SellAction sell_action) {
  sell_action_ = sell_action;
  return *this;
}

StrategyFamily StrategyConfig::GetFamily() const { return family_; }
Timeframe StrategyConfig::GetTimeframe() const { return timeframe_; }

double StrategyConfig::GetParameter(const string& key) const {
  const auto it = parameters_.find(key);
  if (it == parameters_.end()) {
    Logger::GetLogger()->LogAndThrowError<ConfigError>(
        "[" + StrategyFamilyToString(family_) + "] 전략에 파라미터 [" + key +
            "]이(가) 존재하지 않습니다.",
        __FILE__, __LINE__);
  }

  return it->second;
}

size_t StrategyConfig::GetWindow(const string& key) const {
  return static_cast<size_t>(GetParameter(key));
}

bool StrategyConfig::GetFlag(const string& key) const {
  return GetParameter(key) != 0.0;
}

const map<string, double>& StrategyConfig::GetParameters() const {
  return parameters_;
}

RiskConfig StrategyConfig::GetRiskConfig() const {
  RiskConfig risk_config;
  risk_config.sizing_mode = sizing_mode_;
  risk_config.entry_accounting = entry_accounting_;
  risk_config.sell_action = sell_action_;
  risk_config.stop_atr_multiple = GetParameter("stop_atr_multiple");
  risk_config.take_profit_atr_multiple =
      GetParameter("take_profit_atr_multiple");
  risk_config.risk_per_trade_fraction = GetParameter("risk_per_trade_fraction");
  risk_config.max_notional_fraction = GetParameter("max_notional_fraction");
  risk_config.min_notional = GetParameter("min_notional");
  risk_config.balance_investment_fraction =
      GetParameter("balance_investment_fraction");
  risk_config.fixed_quantity = GetParameter("fixed_quantity");
  risk_config.use_stop_loss = GetFlag("use_stop_loss");
  risk_config.profit_gated_exit = GetFlag("profit_gated_exit");
  risk_config.profit_threshold = GetParameter("profit_threshold");

  return risk_config;
}

json StrategyConfig::ToJson() const {
  return {{"family", StrategyFamilyToString(family_)},
          {"timeframe", utils::TimeframeToString(timeframe_)},
          {"sizing_mode", SizingModeToString(sizing_mode_)},
          {"entry_accounting", EntryAccountingToString(entry_accounting_)},
          {"sell_action", SellActionToString(sell_action_)},
          {"parameters", parameters_}};
}

}  // namespace tradesim::engine
