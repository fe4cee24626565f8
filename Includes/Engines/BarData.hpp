#pragma once

// 표준 라이브러리
#include <cstdint>
#include <string>
#include <vector>

// 내부 헤더
#include "Engines/TimeUtils.hpp"

// 네임 스페이스
using namespace std;

namespace tradesim::bar {

using utils::Timeframe;

/// 하나의 바 구조를 지정하는 구조체
struct Bar {
  Bar() = default;  // 명시적 초기화용
  Bar(const int64_t timestamp, const double open, const double high,
      const double low, const double close, const double volume) {
    this->timestamp = timestamp;
    this->open = open;
    this->high = high;
    this->low = low;
    this->close = close;
    this->volume = volume;
  }

  int64_t timestamp{};  // UTC 밀리초 타임스탬프
  double open{};
  double high{};
  double low{};
  double close{};
  double volume{};
};

/**
 * 한 종목의 바를 시계열 순서대로 저장하는 클래스
 *
 * 생성 시 모든 가격과 거래량이 유한한 숫자인지, 타임스탬프가 감소하지 않는지
 * 검증하며 위반 시 DataError를 던진다. 중복이나 누락된 바는 정규화하지 않는다.
 */
class BarData final {
 public:
  BarData();
  BarData(const string& instrument, Timeframe timeframe, vector<Bar> bars);
  ~BarData();

  /// 범위 검사 후 바 인덱스에 해당되는 바를 반환하는 함수
  [[nodiscard]] const Bar& GetBar(size_t bar_idx) const;

  /// 모든 바를 반환하는 함수
  [[nodiscard]] const vector<Bar>& GetBars() const;

  /// 바 개수를 반환하는 함수
  [[nodiscard]] size_t GetNumBars() const;

  /// 바가 하나도 없는지 확인하는 함수
  [[nodiscard]] bool IsEmpty() const;

  /// 종목 이름을 반환하는 함수
  [[nodiscard]] const string& GetInstrument() const;

  /// 바 데이터의 타임프레임을 반환하는 함수
  [[nodiscard]] Timeframe GetTimeframe() const;

  /**
   * 더 큰 타임프레임으로 리샘플링한 바 데이터를 반환하는 함수.
   * Open은 첫 값, High는 최댓값, Low는 최솟값, Close는 마지막 값,
   * Volume은 합계로 집계한다.
   *
   * @param target_timeframe 리샘플링할 타임프레임.
   *                         현재보다 작으면 ConfigError
   */
  [[nodiscard]] BarData Resample(Timeframe target_timeframe) const;

  /// [start_ms, end_ms] 범위의 타임스탬프를 가진 바만 남긴 바 데이터를
  /// 반환하는 함수
  [[nodiscard]] BarData Slice(int64_t start_ms, int64_t end_ms) const;

 private:
  string instrument_;
  Timeframe timeframe_;
  vector<Bar> bars_;

  /// 바들의 유효성을 검사하는 함수
  void Validate() const;
};

}  // namespace tradesim::bar
