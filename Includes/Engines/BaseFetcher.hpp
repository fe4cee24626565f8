#pragma once

// 표준 라이브러리
#include <cstdint>
#include <string>

// 내부 헤더
#include "Engines/BarData.hpp"
#include "Engines/TimeUtils.hpp"

// 네임 스페이스
using namespace std;

namespace tradesim::fetcher {

using bar::BarData;
using utils::Timeframe;

/**
 * 과거 바 데이터를 가져오는 데이터 공급자의 추상 클래스
 *
 * 시뮬레이션 엔진은 데이터 출처를 알지 못하며, 바 데이터는 실행 전에 모두
 * 준비되어 있어야 한다.
 */
class BaseFetcher {
 public:
  virtual ~BaseFetcher();

  /**
   * 지정된 기간의 바 데이터를 가져오는 함수
   *
   * @param start_ms 시작 시간 (UTC 밀리초, 포함)
   * @param end_ms 종료 시간 (UTC 밀리초, 포함)
   * @param instrument 종목 이름
   * @param timeframe 타임프레임
   * @return 가져온 바 데이터. 데이터가 없거나 손상되었으면 DataError
   */
  [[nodiscard]] virtual BarData FetchHistory(int64_t start_ms, int64_t end_ms,
                                             const string& instrument,
                                             Timeframe timeframe) = 0;

 protected:
  BaseFetcher();

  /// 시작 시간이 종료 시간보다 늦으면 ConfigError를 던지는 함수
  static void CheckPeriod(int64_t start_ms, int64_t end_ms);
};

}  // namespace tradesim::fetcher
