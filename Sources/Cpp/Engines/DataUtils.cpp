// 표준 라이브러리
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

// 외부 라이브러리
#include "arrow/io/file.h"
#include "arrow/memory_pool.h"
#include "arrow/table.h"
#include "nlohmann/json.hpp"
#include "parquet/arrow/reader.h"
#include "parquet/arrow/writer.h"
#include "parquet/exception.h"
#include "parquet/properties.h"

// 파일 헤더
#include "Engines/DataUtils.hpp"

// 내부 헤더
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"

// 네임 스페이스
using namespace tradesim::exception;
using namespace tradesim::logger;

namespace tradesim::utils {

double RoundToDecimalPlaces(const double value, const size_t decimal_places) {
  const auto scale = pow(10, decimal_places);
  return round(value * scale) / scale;
}

string FormatDollar(const double price) {
  // 음수 0 처리 - 매우 작은 값들은 0으로 처리
  const double adjusted_price = fabs(price) < 1e-10 ? 0.0 : price;

  // 정수부에 천 단위 쉼표 삽입
  const string& digits = ToFixedString(fabs(adjusted_price), 2);
  const size_t dot_pos = digits.find('.');
  string integer_part = digits.substr(0, dot_pos);

  for (int pos = static_cast<int>(integer_part.size()) - 3; pos > 0; pos -= 3) {
    integer_part.insert(static_cast<size_t>(pos), ",");
  }

  return (adjusted_price < 0.0 ? "-$" : "$") + integer_part +
         digits.substr(dot_pos);
}

string FormatPercentage(const double ratio) {
  const double percentage = fabs(ratio) < 1e-12 ? 0.0 : ratio * 100;
  return ToFixedString(percentage, 2) + "%";
}

string ToFixedString(const double value, const int precision) {
  ostringstream oss;
  oss << fixed << setprecision(precision) << value;
  return oss.str();
}

string ToFileName(const string& name) {
  string file_name = name;
  for (auto& character : file_name) {
    if (character == '/' || character == '\\' || character == ':') {
      character = '_';
    }
  }

  return file_name;
}

shared_ptr<arrow::Table> ReadParquet(const string& file_path) {
  const auto& logger = Logger::GetLogger();

  // 메모리 맵 파일 열기
  const auto& memory_mapped_result =
      arrow::io::MemoryMappedFile::Open(file_path, arrow::io::FileMode::READ);

  if (!memory_mapped_result.ok()) {
    logger->LogAndThrowError<DataError>(
        "[" + file_path + "] 경로의 Parquet 파일을 열 수 없습니다: " +
            memory_mapped_result.status().ToString(),
        __FILE__, __LINE__);
  }

  const auto& random_access_file = memory_mapped_result.ValueOrDie();

  unique_ptr<parquet::arrow::FileReader> arrow_reader;
  shared_ptr<arrow::Table> table;

  try {
    auto parquet_reader = parquet::ParquetFileReader::Open(
        random_access_file, parquet::default_reader_properties());

    PARQUET_THROW_NOT_OK(parquet::arrow::FileReader::Make(
        arrow::default_memory_pool(), std::move(parquet_reader),
        parquet::default_arrow_reader_properties(), &arrow_reader));
    PARQUET_THROW_NOT_OK(arrow_reader->ReadTable(&table));
  } catch (const parquet::ParquetException& e) {
    logger->LogAndThrowError<DataError>(
        "[" + file_path + "] Parquet 파일을 읽는 데 실패했습니다: " + e.what(),
        __FILE__, __LINE__);
  }

  return table;
}

void TableToParquet(const shared_ptr<arrow::Table>& table,
                    const string& directory_path, const string& file_name) {
  const auto& logger = Logger::GetLogger();

  // 폴더가 존재하지 않으면 생성
  if (!filesystem::exists(directory_path)) {
    filesystem::create_directories(directory_path);
  }

  // 파일 열기
  const auto& result =
      arrow::io::FileOutputStream::Open(directory_path + "/" + file_name);
  if (!result.ok()) {
    logger->LogAndThrowError<DataError>(
        "파일을 여는 데 실패했습니다.: " + result.status().ToString(),
        __FILE__, __LINE__);
  }

  const auto& outfile = result.ValueOrDie();

  // Parquet로 테이블 쓰기
  if (const auto& write_status =
          parquet::arrow::WriteTable(*table, arrow::default_memory_pool(),
                                     outfile, max<int64_t>(1, table->num_rows()));
      !write_status.ok()) {
    logger->LogAndThrowError<DataError>(
        "테이블을 저장하는 데 실패했습니다.: " + write_status.ToString(),
        __FILE__, __LINE__);
  }

  // 파일 스트림 닫기
  if (const auto& close_status = outfile->Close(); !close_status.ok()) {
    logger->LogAndThrowError<DataError>(
        "파일을 닫는 데 실패했습니다.: " + close_status.ToString(), __FILE__,
        __LINE__);
  }
}

void JsonToFile(const json& data, const string& file_path) {
  if (const auto& parent = filesystem::path(file_path).parent_path();
      !parent.empty() && !filesystem::exists(parent)) {
    filesystem::create_directories(parent);
  }

  if (ofstream file(file_path); file.is_open()) {
    file << data.dump(4);  // 4는 들여쓰기를 위한 인자
    file.close();
  } else {
    Logger::GetLogger()->LogAndThrowError<DataError>(
        "[" + file_path + "] 파일을 열 수 없습니다.", __FILE__, __LINE__);
  }
}

}  // namespace tradesim::utils
