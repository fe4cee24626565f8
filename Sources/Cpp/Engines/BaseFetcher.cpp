// 파일 헤더
#include "Engines/BaseFetcher.hpp"

// 내부 헤더
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"

// 네임 스페이스
using namespace tradesim::exception;
using namespace tradesim::logger;

namespace tradesim::fetcher {

BaseFetcher::BaseFetcher() = default;
BaseFetcher::~BaseFetcher() = default;

void BaseFetcher::CheckPeriod(const int64_t start_ms, const int64_t end_ms) {
  if (start_ms > end_ms) {
    Logger::GetLogger()->LogAndThrowError<ConfigError>(
        "시작 시간 [" + utils::UtcTimestampToUtcDatetime(start_ms) +
            "]이(가) 종료 시간 [" + utils::UtcTimestampToUtcDatetime(end_ms) +
            "]보다 늦습니다.",
        __FILE__, __LINE__);
  }
}

}  // namespace tradesim::fetcher
