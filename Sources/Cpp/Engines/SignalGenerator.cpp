// 파일 헤더
#include "Engines/SignalGenerator.hpp"

// 내부 헤더
#include "Engines/DataUtils.hpp"
#include "Engines/IndicatorEngine.hpp"

// 네임 스페이스
using namespace tradesim::utils;

namespace tradesim::signal {

SignalGenerator::SignalGenerator() = default;
SignalGenerator::~SignalGenerator() = default;

SignalGenerator& SignalGenerator::SetBuyRule(const SignalRule& buy_rule) {
  buy_rule_ = buy_rule;
  return *this;
}

SignalGenerator& SignalGenerator::SetSellRule(const SignalRule& sell_rule) {
  sell_rule_ = sell_rule;
  return *this;
}

vector<Signal> SignalGenerator::Generate(
    const IndicatorEngine& indicators) const {
  const auto& buy = EvaluateRule(buy_rule_, indicators);
  const auto& sell = EvaluateRule(sell_rule_, indicators);

  vector<Signal> signals(indicators.GetNumBars());
  for (size_t bar_idx = 0; bar_idx < signals.size(); bar_idx++) {
    signals[bar_idx].buy = buy[bar_idx];
    signals[bar_idx].sell = !buy[bar_idx] && sell[bar_idx];
  }

  return signals;
}

const SignalRule& SignalGenerator::GetBuyRule() const { return buy_rule_; }

const SignalRule& SignalGenerator::GetSellRule() const { return sell_rule_; }

vector<bool> SignalGenerator::EvaluateRule(const SignalRule& rule,
                                           const IndicatorEngine& indicators) {
  const size_t num_bars = indicators.GetNumBars();
  vector<bool> result(num_bars, false);

  if (rule.conditions.empty()) {
    return result;
  }

  // 바마다 이름 조회를 하지 않도록 시리즈를 미리 찾아둠
  // 없는 지표 이름이면 DataError
  struct ResolvedCondition {
    const vector<double>* lhs;
    const vector<double>* rhs;
    const Condition* condition;
  };

  vector<ResolvedCondition> resolved;
  resolved.reserve(rule.conditions.size());
  for (const auto& condition : rule.conditions) {
    resolved.push_back(
        {&indicators.GetSeries(condition.lhs),
         condition.rhs.empty() ? nullptr : &indicators.GetSeries(condition.rhs),
         &condition});
  }

  bool prev_raw = false;
  for (size_t bar_idx = 0; bar_idx < num_bars; bar_idx++) {
    bool raw = true;

    for (const auto& [lhs, rhs, condition] : resolved) {
      if (bar_idx < condition->shift) {
        raw = false;
        break;
      }

      const size_t value_idx = bar_idx - condition->shift;
      const double left = (*lhs)[value_idx];
      const double right = rhs == nullptr
                               ? condition->constant
                               : condition->multiplier * (*rhs)[value_idx];

      bool satisfied = false;
      switch (condition->op) {
        case GREATER: {
          satisfied = IsGreater(left, right);
          break;
        }

        case GREATER_OR_EQUAL: {
          satisfied = IsGreaterOrEqual(left, right);
          break;
        }

        case LESS: {
          satisfied = IsLess(left, right);
          break;
        }

        case LESS_OR_EQUAL: {
          satisfied = IsLessOrEqual(left, right);
          break;
        }
      }

      if (!satisfied) {
        raw = false;
        break;
      }
    }

    // 교차 방식은 이전 바에서 거짓이었을 때만 발생. 첫 바의 이전은 거짓
    result[bar_idx] = rule.style == CROSSOVER ? raw && !prev_raw : raw;
    prev_raw = raw;
  }

  return result;
}

}  // namespace tradesim::signal
