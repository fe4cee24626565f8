// 표준 라이브러리
#include <cmath>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

// 외부 라이브러리
#include <arrow/api.h>

// 파일 헤더
#include "Engines/ParquetFetcher.hpp"

// 내부 헤더
#include "Engines/DataUtils.hpp"
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"

// 네임 스페이스
using namespace tradesim::exception;
using namespace tradesim::logger;
using namespace tradesim::utils;

namespace tradesim::fetcher {

using bar::Bar;

namespace {

/// 테이블에서 이름에 해당되는 열을 찾는 함수. 없으면 DataError
shared_ptr<arrow::ChunkedArray> GetColumn(const shared_ptr<arrow::Table>& table,
                                          const string& column_name) {
  auto column = table->GetColumnByName(column_name);
  if (column == nullptr) {
    Logger::GetLogger()->LogAndThrowError<DataError>(
        "바 데이터에 [" + column_name + "] 열이 없습니다.", __FILE__,
        __LINE__);
  }

  return column;
}

/// 정수 시간 열을 읽는 함수. null 값이 있으면 DataError
vector<int64_t> ReadTimestampColumn(const shared_ptr<arrow::Table>& table) {
  const auto& column = GetColumn(table, "timestamp");
  if (column->type()->id() != arrow::Type::INT64) {
    Logger::GetLogger()->LogAndThrowError<DataError>(
        "[timestamp] 열은 int64 타입이어야 합니다. (현재 " +
            column->type()->ToString() + ")",
        __FILE__, __LINE__);
  }

  vector<int64_t> values;
  values.reserve(column->length());

  for (const auto& chunk : column->chunks()) {
    const auto& array = static_pointer_cast<arrow::Int64Array>(chunk);
    for (int64_t idx = 0; idx < array->length(); idx++) {
      if (array->IsNull(idx)) {
        Logger::GetLogger()->LogAndThrowError<DataError>(
            "[timestamp] 열의 [" + to_string(values.size()) +
                "]번째 값이 비어 있습니다.",
            __FILE__, __LINE__);
      }

      values.push_back(array->Value(idx));
    }
  }

  return values;
}

/// 숫자 배열 청크의 값들을 double로 변환하여 추가하는 함수
template <typename ArrayType>
void AppendNumericChunk(const shared_ptr<arrow::Array>& chunk,
                        vector<double>& values) {
  const auto& array = static_pointer_cast<ArrayType>(chunk);
  for (int64_t idx = 0; idx < array->length(); idx++) {
    values.push_back(array->IsNull(idx)
                         ? NAN
                         : static_cast<double>(array->Value(idx)));
  }
}

/// 문자열 배열 청크의 값들을 숫자로 해석하여 추가하는 함수.
/// 숫자로 해석할 수 없는 값이 있으면 DataError
template <typename ArrayType>
void AppendStringChunk(const shared_ptr<arrow::Array>& chunk,
                       const string& column_name, vector<double>& values) {
  const auto& array = static_pointer_cast<ArrayType>(chunk);
  for (int64_t idx = 0; idx < array->length(); idx++) {
    if (array->IsNull(idx)) {
      values.push_back(NAN);
      continue;
    }

    const string text(array->GetView(idx));
    size_t parsed = 0;
    double value = NAN;
    try {
      value = stod(text, &parsed);
    } catch (const logic_error&) {
      parsed = 0;
    }

    if (parsed == 0 || parsed != text.size()) {
      Logger::GetLogger()->LogAndThrowError<DataError>(
          "[" + column_name + "] 열의 [" + to_string(values.size()) +
              "]번째 값 [" + text + "]을(를) 숫자로 변환할 수 없습니다.",
          __FILE__, __LINE__);
    }

    values.push_back(value);
  }
}

/// 가격, 거래량 열을 double로 읽는 함수.
/// 정수, 실수, 숫자 문자열 열을 변환하며 null 값은 NaN으로 읽어 바 검증에서
/// 걸러지도록 함. 숫자로 변환할 수 없는 타입이면 DataError
vector<double> ReadDoubleColumn(const shared_ptr<arrow::Table>& table,
                                const string& column_name) {
  const auto& column = GetColumn(table, column_name);

  vector<double> values;
  values.reserve(column->length());

  for (const auto& chunk : column->chunks()) {
    switch (column->type()->id()) {
      case arrow::Type::DOUBLE: {
        AppendNumericChunk<arrow::DoubleArray>(chunk, values);
        break;
      }

      case arrow::Type::FLOAT: {
        AppendNumericChunk<arrow::FloatArray>(chunk, values);
        break;
      }

      case arrow::Type::INT64: {
        AppendNumericChunk<arrow::Int64Array>(chunk, values);
        break;
      }

      case arrow::Type::INT32: {
        AppendNumericChunk<arrow::Int32Array>(chunk, values);
        break;
      }

      case arrow::Type::INT16: {
        AppendNumericChunk<arrow::Int16Array>(chunk, values);
        break;
      }

      case arrow::Type::INT8: {
        AppendNumericChunk<arrow::Int8Array>(chunk, values);
        break;
      }

      case arrow::Type::UINT64: {
        AppendNumericChunk<arrow::UInt64Array>(chunk, values);
        break;
      }

      case arrow::Type::UINT32: {
        AppendNumericChunk<arrow::UInt32Array>(chunk, values);
        break;
      }

      case arrow::Type::UINT16: {
        AppendNumericChunk<arrow::UInt16Array>(chunk, values);
        break;
      }

      case arrow::Type::UINT8: {
        AppendNumericChunk<arrow::UInt8Array>(chunk, values);
        break;
      }

      case arrow::Type::STRING: {
        AppendStringChunk<arrow::StringArray>(chunk, column_name, values);
        break;
      }

      case arrow::Type::LARGE_STRING: {
        AppendStringChunk<arrow::LargeStringArray>(chunk, column_name,
                                                   values);
        break;
      }

      default: {
        Logger::GetLogger()->LogAndThrowError<DataError>(
            "[" + column_name + "] 열의 타입 " + column->type()->ToString() +
                "은(는) 숫자로 변환할 수 없습니다.",
            __FILE__, __LINE__);
      }
    }
  }

  return values;
}

}  // namespace

ParquetFetcher::ParquetFetcher(const string& data_directory,
                               shared_ptr<Logger> logger)
    : data_directory_(data_directory), logger_(std::move(logger)) {}
ParquetFetcher::~ParquetFetcher() = default;

BarData ParquetFetcher::FetchHistory(const int64_t start_ms,
                                     const int64_t end_ms,
                                     const string& instrument,
                                     const Timeframe timeframe) {
  CheckPeriod(start_ms, end_ms);

  if (const auto& file_path = GetFilePath(instrument, timeframe);
      filesystem::exists(file_path)) {
    logger_->Log(DEBUG_L, "[" + file_path + "] 파일을 읽습니다.", __FILE__,
                 __LINE__);

    return TableToBarData(ReadParquet(file_path), instrument, timeframe)
        .Slice(start_ms, end_ms);
  }

  // 1분봉을 리샘플링
  if (const auto& minute_path = GetFilePath(instrument, MINUTE_1);
      timeframe != MINUTE_1 && filesystem::exists(minute_path)) {
    logger_->Log(INFO_L,
                 "[" + instrument + "] " + TimeframeToString(timeframe) +
                     " 파일이 없어 1m 데이터를 리샘플링합니다.",
                 __FILE__, __LINE__);

    return TableToBarData(ReadParquet(minute_path), instrument, MINUTE_1)
        .Slice(start_ms, end_ms)
        .Resample(timeframe);
  }

  logger_->LogAndThrowError<DataError>(
      "[" + instrument + "] " + TimeframeToString(timeframe) +
          " 바 데이터 파일을 찾을 수 없습니다. (" +
          GetFilePath(instrument, timeframe) + ")",
      __FILE__, __LINE__);
}

string ParquetFetcher::GetFilePath(const string& instrument,
                                   const Timeframe timeframe) const {
  return data_directory_ + "/" + ToFileName(instrument) + "/" +
         TimeframeToString(timeframe) + ".parquet";
}

BarData ParquetFetcher::TableToBarData(const shared_ptr<arrow::Table>& table,
                                       const string& instrument,
                                       const Timeframe timeframe) {
  if (table == nullptr) {
    Logger::GetLogger()->LogAndThrowError<DataError>(
        "[" + instrument + "] 바 데이터 테이블이 비어 있습니다.", __FILE__,
        __LINE__);
  }

  const auto& timestamps = ReadTimestampColumn(table);
  const auto& opens = ReadDoubleColumn(table, "open");
  const auto& highs = ReadDoubleColumn(table, "high");
  const auto& lows = ReadDoubleColumn(table, "low");
  const auto& closes = ReadDoubleColumn(table, "close");
  const auto& volumes = ReadDoubleColumn(table, "volume");

  vector<Bar> bars;
  bars.reserve(timestamps.size());

  for (size_t bar_idx = 0; bar_idx < timestamps.size(); bar_idx++) {
    bars.emplace_back(timestamps[bar_idx], opens[bar_idx], highs[bar_idx],
                      lows[bar_idx], closes[bar_idx], volumes[bar_idx]);
  }

  return {instrument, timeframe, std::move(bars)};
}

shared_ptr<arrow::Table> ParquetFetcher::BarDataToTable(
    const BarData& bar_data) {
  arrow::Int64Builder timestamp_builder;
  arrow::DoubleBuilder open_builder;
  arrow::DoubleBuilder high_builder;
  arrow::DoubleBuilder low_builder;
  arrow::DoubleBuilder close_builder;
  arrow::DoubleBuilder volume_builder;

  arrow::Status status;
  for (const auto& bar : bar_data.GetBars()) {
    status &= timestamp_builder.Append(bar.timestamp);
    status &= open_builder.Append(bar.open);
    status &= high_builder.Append(bar.high);
    status &= low_builder.Append(bar.low);
    status &= close_builder.Append(bar.close);
    status &= volume_builder.Append(bar.volume);
  }

  vector<shared_ptr<arrow::Array>> arrays(6);
  status &= timestamp_builder.Finish(&arrays[0]);
  status &= open_builder.Finish(&arrays[1]);
  status &= high_builder.Finish(&arrays[2]);
  status &= low_builder.Finish(&arrays[3]);
  status &= close_builder.Finish(&arrays[4]);
  status &= volume_builder.Finish(&arrays[5]);

  if (!status.ok()) {
    Logger::GetLogger()->LogAndThrowError<DataError>(
        "[" + bar_data.GetInstrument() +
            "] 바 데이터 테이블을 만드는 데 실패했습니다.: " +
            status.ToString(),
        __FILE__, __LINE__);
  }

  const auto schema = arrow::schema({arrow::field("timestamp", arrow::int64()),
                                     arrow::field("open", arrow::float64()),
                                     arrow::field("high", arrow::float64()),
                                     arrow::field("low", arrow::float64()),
                                     arrow::field("close", arrow::float64()),
                                     arrow::field("volume", arrow::float64())});

  return arrow::Table::Make(schema, arrays);
}

}  // namespace tradesim::fetcher
