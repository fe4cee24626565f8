#pragma once

// 표준 라이브러리
#include <string>
#include <vector>

// 내부 헤더
#include "Engines/BarData.hpp"

// 전방 선언
namespace tradesim::indicator {
class IndicatorEngine;
}

// 네임 스페이스
using namespace std;

namespace tradesim::indicator {

using bar::Bar;

/// 윈도우가 채워지기 전의 계산 방식을 지정하는 열거형 클래스.\n
/// PARTIAL → 지금까지 사용 가능한 바들로 계산\n
/// FULL → 윈도우가 모두 채워질 때까지 NaN
enum class WindowPolicy { PARTIAL, FULL };
using enum WindowPolicy;

/// 최근 period개 값의 합과 유한한 값의 개수를 유지하는 고정 크기 윈도우
class RollingWindow final {
 public:
  explicit RollingWindow(size_t period);

  void Reset();
  void Push(double value);

  /// 윈도우 내 유한한 값들의 평균을 반환하는 함수.
  /// 정책상 계산할 수 없으면 NaN
  [[nodiscard]] double GetMean(WindowPolicy policy) const;

 private:
  size_t period_;
  vector<double> buffer_;
  size_t next_idx_;
  size_t num_pushed_;
  double sum_;
  size_t finite_count_;
};

/**
 * 전략에서 사용하는 지표를 생성하기 위한 추상 클래스
 *
 * ※ 지표 생성 시 유의 사항 ※\n
 * 1. Indicator 클래스를 Public 상속 후 Initialize, Calculate 함수들을
 *    오버라이드해서 제작\n
 *
 *    Initialize → 지표 계산 시 최초 1회 실행\n
 *    Calculate → 각 바마다 값을 계산하여 반환\n
 *
 * 2. 지표 생성자의 첫 인수는 지표 이름이어야 하며,
 *    IndicatorEngine::AddIndicator를 통해서만 생성해야 함\n
 *
 * 3. 다른 지표를 사용하기 위해서는 생성자에서 Indicator& 타입의 인수를 받아
 *    [] 연산자로 참조하여 사용하면 됨.\n
 *    ※ 주의: 인수로 넣을 다른 지표는 먼저 추가되어야 함.
 */
class Indicator {
  // 계산 커서 및 output_ 접근용
  friend class IndicatorEngine;

 public:
  // 지표 반환 시 참조 타입으로 받는 것을 강요하기 위하여
  // 복사 생성자, 할당 연산자 삭제
  Indicator(const Indicator&) = delete;
  Indicator& operator=(const Indicator&) = delete;
  virtual ~Indicator();

  /// 지표의 계산된 값을 반환하는 연산자 오버로딩.\n\n
  /// 사용법: 지표 클래스 객체[n개 바 전 인덱스]\n
  /// 범위를 벗어나거나 아직 계산되지 않은 바는 NaN
  [[nodiscard]] double operator[](size_t index) const;

  /// 해당 지표의 이름을 반환하는 함수
  [[nodiscard]] const string& GetName() const;

  /// 모든 바에 대해 계산된 값을 반환하는 함수
  [[nodiscard]] const vector<double>& GetOutput() const;

 protected:
  explicit Indicator(const string& name);

  /// 지표의 멤버 변수들을 초기 상태로 되돌리는 함수.
  /// 계산 시작 시 1회 호출됨.
  virtual void Initialize() = 0;

  /// 현재 바에서 지표를 계산하는 함수. 메인 로직을 작성.
  virtual double Calculate() = 0;

  /// 현재 계산 중인 바를 반환하는 함수
  [[nodiscard]] const Bar& GetCurrentBar() const;

  /// 현재 계산 중인 바의 인덱스를 반환하는 함수
  [[nodiscard]] size_t GetCurrentBarIndex() const;

  /**
   * 소스 지표의 최근 period개 값 중 유한한 값들을 수집하는 함수
   *
   * @param source 값을 수집할 지표
   * @param period 윈도우 크기
   * @param shift 윈도우를 과거로 이동할 바 개수
   * @param policy 윈도우 정책
   * @param values 수집된 값이 저장될 벡터
   * @return 정책상 계산 가능하면 true
   */
  static bool CollectWindow(const Indicator& source, size_t period,
                            size_t shift, WindowPolicy policy,
                            vector<double>& values);

  /// 기간 파라미터가 1 이상인지 검사하는 함수. 위반 시 ConfigError
  static void ValidatePeriod(const string& name, size_t period);

 private:
  string name_;            // 지표의 이름
  vector<double> output_;  // 지표의 계산된 값
  const IndicatorEngine* engine_;  // 계산 커서를 제공하는 엔진
};

}  // namespace tradesim::indicator
