#pragma once

// 표준 라이브러리
#include <cstdint>
#include <string>

// 네임 스페이스
using namespace std;

/// 시간 핸들링을 위한 유틸리티 네임스페이스
namespace tradesim::utils {

constexpr int64_t kSecond = 1000;
constexpr int64_t kMinute = 60 * kSecond;
constexpr int64_t kHour = 60 * kMinute;
constexpr int64_t kDay = 24 * kHour;

/// 바 데이터의 타임프레임을 지정하는 열거형 클래스
enum class Timeframe { MINUTE_1, MINUTE_15, HOUR_1, DAY_1 };
using enum Timeframe;

/**
 * 현재 시스템의 로컬 시간대를 기준으로 현재 날짜와 시간을 반환하는 함수
 *
 * @return 현재 로컬 날짜와 시간의 문자열
 */
[[nodiscard]] string GetCurrentLocalDatetime();

/**
 * 주어진 타임스탬프(밀리초 기준)를 UTC 날짜-시간 문자열로 변환하여
 * 반환하는 함수
 *
 * @param timestamp_ms 변환할 밀리초 단위의 타임스탬프
 * @return %Y-%m-%d %H:%M:%S 형식의 UTC 날짜와 시간 문자열
 */
[[nodiscard]] string UtcTimestampToUtcDatetime(int64_t timestamp_ms);

/**
 * 주어진 UTC 날짜 및 시간 문자열을 UTC 타임스탬프로 변환하여 반환하는 함수.
 * 파싱에 실패하면 ConfigError를 던진다.
 *
 * @param datetime 변환할 UTC 날짜 및 시간의 문자열
 * @param format datetime 문자열의 포맷을 지정하는 형식 문자열
 * @return 밀리초 단위의 UTC 타임스탬프
 */
[[nodiscard]] int64_t UtcDatetimeToUtcTimestamp(const string& datetime,
                                                const string& format);

/// 타임프레임 문자열(1m, 15m, 1h, 1d)을 Timeframe으로 변환하는 함수.
/// 알 수 없는 문자열이면 ConfigError를 던진다.
[[nodiscard]] Timeframe ParseTimeframe(const string& timeframe_str);

/// Timeframe을 문자열로 변환하는 함수
[[nodiscard]] string TimeframeToString(Timeframe timeframe);

/// Timeframe의 길이를 밀리초로 반환하는 함수
[[nodiscard]] int64_t GetTimeframeMilliseconds(Timeframe timeframe);

/// 타임스탬프 차이를 보기 쉬운 시간으로 포맷하여 반환하는 함수
[[nodiscard]] string FormatTimeDiff(int64_t diff_ms);

}  // namespace tradesim::utils
