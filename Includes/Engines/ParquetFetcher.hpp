#pragma once

// 표준 라이브러리
#include <memory>
#include <string>

// 내부 헤더
#include "Engines/BaseFetcher.hpp"

// 전방 선언
namespace arrow {
class Table;
}  // namespace arrow

namespace tradesim::logger {
class Logger;
}

// 네임 스페이스
using namespace std;

namespace tradesim::fetcher {

using logger::Logger;

/**
 * 로컬 Parquet 파일에서 바 데이터를 읽어오는 데이터 공급자
 *
 * 파일 경로: 데이터 폴더/종목 이름/타임프레임.parquet\n
 * 열: timestamp (int64, UTC 밀리초), open, high, low, close, volume\n
 * 요청한 타임프레임의 파일이 없으면 1m 파일을 읽어 리샘플링한다.
 */
class ParquetFetcher final : public BaseFetcher {
 public:
  ParquetFetcher(const string& data_directory, shared_ptr<Logger> logger);
  ~ParquetFetcher() override;

  [[nodiscard]] BarData FetchHistory(int64_t start_ms, int64_t end_ms,
                                     const string& instrument,
                                     Timeframe timeframe) override;

  /// 종목과 타임프레임에 해당하는 Parquet 파일 경로를 반환하는 함수
  [[nodiscard]] string GetFilePath(const string& instrument,
                                   Timeframe timeframe) const;

  /**
   * Arrow 테이블을 바 데이터로 변환하는 함수.
   * 필요한 열이 없거나 숫자 열이 아니면 DataError를 던진다.
   */
  [[nodiscard]] static BarData TableToBarData(
      const shared_ptr<arrow::Table>& table, const string& instrument,
      Timeframe timeframe);

  /// 바 데이터를 Arrow 테이블로 변환하는 함수
  [[nodiscard]] static shared_ptr<arrow::Table> BarDataToTable(
      const BarData& bar_data);

 private:
  string data_directory_;
  shared_ptr<Logger> logger_;
};

}  // namespace tradesim::fetcher
