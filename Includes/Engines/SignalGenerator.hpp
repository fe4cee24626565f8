#pragma once

// 표준 라이브러리
#include <cstddef>
#include <string>
#include <vector>

// 전방 선언
namespace tradesim::indicator {
class IndicatorEngine;
}

// 네임 스페이스
using namespace std;

namespace tradesim::signal {

using indicator::IndicatorEngine;

/// 한 바의 신호를 범주로 나타내는 열거형 클래스
enum class SignalType { BUY, SELL, HOLD };
using enum SignalType;

/// 한 바의 매수, 매도 신호. 같은 바에서 둘 다 참일 수 없음
struct Signal {
  bool buy = false;
  bool sell = false;

  [[nodiscard]] SignalType GetType() const {
    if (buy) {
      return BUY;
    }

    return sell ? SELL : HOLD;
  }
};

/// 조건의 비교 연산자를 지정하는 열거형 클래스
enum class CompareOperator { GREATER, GREATER_OR_EQUAL, LESS, LESS_OR_EQUAL };
using enum CompareOperator;

/// 신호 규칙의 발생 방식을 지정하는 열거형 클래스.\n
/// THRESHOLD → 조건이 참인 모든 바에서 발생\n
/// CROSSOVER → 조건이 새로 참이 된 바에서만 발생
enum class SignalStyle { THRESHOLD, CROSSOVER };
using enum SignalStyle;

/**
 * 하나의 비교 조건: lhs op (multiplier × rhs).\n
 * rhs가 빈 문자열이면 rhs 지표 대신 constant와 비교한다.\n
 * shift가 0보다 크면 shift 바 이전의 값끼리 비교하며, 이전 값이 없는 바에서는
 * 거짓이다.\n
 * 피연산자 중 하나라도 NaN이면 조건은 거짓이다.
 */
struct Condition {
  string lhs;
  CompareOperator op = GREATER;
  string rhs;
  double multiplier = 1.0;
  double constant = 0.0;
  size_t shift = 0;
};

/// AND로 결합된 조건들과 발생 방식.
/// 조건이 비어 있으면 신호는 발생하지 않는다.
struct SignalRule {
  vector<Condition> conditions;
  SignalStyle style = THRESHOLD;
};

/// 계산된 지표들로부터 바별 매수, 매도 신호를 생성하는 클래스
class SignalGenerator final {
 public:
  SignalGenerator();
  ~SignalGenerator();

  /// 매수 규칙을 설정하는 함수
  SignalGenerator& SetBuyRule(const SignalRule& buy_rule);

  /// 매도 규칙을 설정하는 함수
  SignalGenerator& SetSellRule(const SignalRule& sell_rule);

  /**
   * 바별 신호를 생성하는 함수.
   * 매수와 매도 규칙이 같은 바에서 모두 참이면 매수가 우선한다.
   *
   * @param indicators 계산이 끝난 지표 엔진
   * @return 바 개수와 같은 길이의 신호 벡터
   */
  [[nodiscard]] vector<Signal> Generate(
      const IndicatorEngine& indicators) const;

  [[nodiscard]] const SignalRule& GetBuyRule() const;
  [[nodiscard]] const SignalRule& GetSellRule() const;

 private:
  SignalRule buy_rule_;
  SignalRule sell_rule_;

  /// 규칙을 모든 바에서 평가하는 함수
  [[nodiscard]] static vector<bool> EvaluateRule(
      const SignalRule& rule, const IndicatorEngine& indicators);
};

}  // namespace tradesim::signal
