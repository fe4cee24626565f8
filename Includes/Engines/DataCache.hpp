#pragma once

// 표준 라이브러리
#include <cstdint>
#include <memory>
#include <string>

// 내부 헤더
#include "Engines/BaseFetcher.hpp"

// 전방 선언
namespace tradesim::logger {
class Logger;
}

// 네임 스페이스
using namespace std;

namespace tradesim::fetcher {

using logger::Logger;

/**
 * 다른 데이터 공급자의 결과를 파일 시스템에 캐시하는 데이터 공급자
 *
 * 캐시 키는 "종목_시작_종료_타임프레임" 문자열의 MD5 해시이며, 캐시 파일은
 * 캐시 폴더에 Parquet 형식으로 저장된다. 같은 요청이 다시 들어오면 원본
 * 공급자를 호출하지 않고 캐시 파일을 읽는다.
 */
class CachedFetcher final : public BaseFetcher {
 public:
  CachedFetcher(shared_ptr<BaseFetcher> source, const string& cache_directory,
                shared_ptr<Logger> logger);
  ~CachedFetcher() override;

  [[nodiscard]] BarData FetchHistory(int64_t start_ms, int64_t end_ms,
                                     const string& instrument,
                                     Timeframe timeframe) override;

  /// 요청에 해당되는 캐시 파일 이름(MD5 해시.parquet)을 반환하는 함수
  [[nodiscard]] static string MakeCacheKey(const string& instrument,
                                           int64_t start_ms, int64_t end_ms,
                                           Timeframe timeframe);

  [[nodiscard]] const string& GetCacheDirectory() const;

 private:
  shared_ptr<BaseFetcher> source_;
  string cache_directory_;
  shared_ptr<Logger> logger_;

  /// 문자열의 MD5 해시를 16진수 문자열로 반환하는 함수
  [[nodiscard]] static string Md5Hex(const string& data);
};

}  // namespace tradesim::fetcher
