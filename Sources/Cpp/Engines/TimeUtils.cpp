// 표준 라이브러리
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

// 파일 헤더
#include "Engines/TimeUtils.hpp"

// 내부 헤더
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"

// 네임 스페이스
using namespace chrono;
using namespace tradesim::exception;
using namespace tradesim::logger;

namespace tradesim::utils {

string GetCurrentLocalDatetime() {
  const time_t now = system_clock::to_time_t(system_clock::now());

  tm local_time{};
  localtime_r(&now, &local_time);

  ostringstream ss;
  ss << put_time(&local_time, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

string UtcTimestampToUtcDatetime(const int64_t timestamp_ms) {
  if (timestamp_ms < 0) {
    return "";
  }

  const time_t timestamp_s = timestamp_ms / 1000;

  tm utc_time{};
  gmtime_r(&timestamp_s, &utc_time);

  ostringstream ss;
  ss << put_time(&utc_time, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

int64_t UtcDatetimeToUtcTimestamp(const string& datetime,
                                  const string& format) {
  tm tm = {};
  istringstream ss(datetime);

  // 문자열을 tm으로 파싱
  ss >> get_time(&tm, format.c_str());
  if (ss.fail()) {
    Logger::GetLogger()->LogAndThrowError<ConfigError>(
        "[" + datetime + "] Datetime 문자열을 [" + format +
            "] 포맷으로 파싱하는 데 실패했습니다.",
        __FILE__, __LINE__);
  }

  // tm 구조체를 UTC로 해석
  return static_cast<int64_t>(timegm(&tm)) * 1000;
}

Timeframe ParseTimeframe(const string& timeframe_str) {
  if (timeframe_str == "1m") {
    return MINUTE_1;
  }

  if (timeframe_str == "15m") {
    return MINUTE_15;
  }

  if (timeframe_str == "1h") {
    return HOUR_1;
  }

  if (timeframe_str == "1d") {
    return DAY_1;
  }

  Logger::GetLogger()->LogAndThrowError<ConfigError>(
      "잘못된 타임프레임 [" + timeframe_str +
          "]이(가) 지정되었습니다. 1m, 15m, 1h, 1d 중 하나여야 합니다.",
      __FILE__, __LINE__);
}

string TimeframeToString(const Timeframe timeframe) {
  switch (timeframe) {
    case MINUTE_1: {
      return "1m";
    }

    case MINUTE_15: {
      return "15m";
    }

    case HOUR_1: {
      return "1h";
    }

    case DAY_1: {
      return "1d";
    }
  }

  return "";
}

int64_t GetTimeframeMilliseconds(const Timeframe timeframe) {
  switch (timeframe) {
    case MINUTE_1: {
      return kMinute;
    }

    case MINUTE_15: {
      return 15 * kMinute;
    }

    case HOUR_1: {
      return kHour;
    }

    case DAY_1: {
      return kDay;
    }
  }

  return 0;
}

string FormatTimeDiff(const int64_t diff_ms) {
  const int64_t days = diff_ms / kDay;
  const int64_t hours = diff_ms % kDay / kHour;
  const int64_t minutes = diff_ms % kHour / kMinute;

  string result;
  if (days > 0) {
    result += to_string(days) + "일 ";
  }

  if (hours > 0 || days > 0) {
    result += to_string(hours) + "시간 ";
  }

  result += to_string(minutes) + "분";
  return result;
}

}  // namespace tradesim::utils
