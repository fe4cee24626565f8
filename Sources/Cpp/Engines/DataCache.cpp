// 표준 라이브러리
#include <array>
#include <filesystem>
#include <iomanip>
#include <sstream>

// 외부 라이브러리
#include <openssl/evp.h>

// 파일 헤더
#include "Engines/DataCache.hpp"

// 내부 헤더
#include "Engines/DataUtils.hpp"
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"
#include "Engines/ParquetFetcher.hpp"

// 네임 스페이스
using namespace tradesim::exception;
using namespace tradesim::logger;
using namespace tradesim::utils;

namespace tradesim::fetcher {

CachedFetcher::CachedFetcher(shared_ptr<BaseFetcher> source,
                             const string& cache_directory,
                             shared_ptr<Logger> logger)
    : source_(std::move(source)),
      cache_directory_(cache_directory),
      logger_(std::move(logger)) {
  if (source_ == nullptr) {
    logger_->LogAndThrowError<ConfigError>(
        "캐시할 데이터 공급자가 지정되지 않았습니다.", __FILE__, __LINE__);
  }

  if (cache_directory_.empty()) {
    logger_->LogAndThrowError<ConfigError>("캐시 폴더가 비어 있습니다.",
                                           __FILE__, __LINE__);
  }
}
CachedFetcher::~CachedFetcher() = default;

BarData CachedFetcher::FetchHistory(const int64_t start_ms,
                                    const int64_t end_ms,
                                    const string& instrument,
                                    const Timeframe timeframe) {
  CheckPeriod(start_ms, end_ms);

  const auto& file_name = MakeCacheKey(instrument, start_ms, end_ms, timeframe);

  if (const auto& file_path = cache_directory_ + "/" + file_name;
      filesystem::exists(file_path)) {
    logger_->Log(INFO_L,
                 "[" + instrument + "] 캐시된 바 데이터를 사용합니다. (" +
                     file_name + ")",
                 __FILE__, __LINE__);

    return ParquetFetcher::TableToBarData(ReadParquet(file_path), instrument,
                                          timeframe);
  }

  auto bar_data =
      source_->FetchHistory(start_ms, end_ms, instrument, timeframe);

  TableToParquet(ParquetFetcher::BarDataToTable(bar_data), cache_directory_,
                 file_name);

  logger_->Log(INFO_L,
               "[" + instrument + "] 바 데이터를 캐시했습니다. (" + file_name +
                   ")",
               __FILE__, __LINE__);

  return bar_data;
}

string CachedFetcher::MakeCacheKey(const string& instrument,
                                   const int64_t start_ms, const int64_t end_ms,
                                   const Timeframe timeframe) {
  return Md5Hex(instrument + "_" + to_string(start_ms) + "_" +
                to_string(end_ms) + "_" + TimeframeToString(timeframe)) +
         ".parquet";
}

const string& CachedFetcher::GetCacheDirectory() const {
  return cache_directory_;
}

string CachedFetcher::Md5Hex(const string& data) {
  array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int md_len = 0;

  if (!EVP_Digest(data.data(), data.size(), digest.data(), &md_len,
                  EVP_md5(), nullptr)) {
    Logger::GetLogger()->LogAndThrowError<DataError>(
        "캐시 키의 MD5 해시 계산이 실패했습니다.", __FILE__, __LINE__);
  }

  ostringstream oss;
  oss << hex << setfill('0');
  for (unsigned int idx = 0; idx < md_len; idx++) {
    oss << setw(2) << static_cast<int>(digest[idx]);
  }

  return oss.str();
}

}  // namespace tradesim::fetcher
