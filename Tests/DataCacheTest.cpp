// 표준 라이브러리
#include <filesystem>

// 외부 라이브러리
#include <arrow/api.h>

// 내부 헤더
#include "Engines/DataUtils.hpp"
#include "Engines/Exception.hpp"
#include "Engines/ParquetFetcher.hpp"

// 파일 헤더
#include "DataCacheTest.hpp"

using namespace tradesim::exception;
using namespace tradesim::test;
using namespace tradesim::utils;

CountingFetcher::CountingFetcher(BarData bar_data)
    : bar_data_(std::move(bar_data)), num_calls_(0) {}

BarData CountingFetcher::FetchHistory(const int64_t start_ms,
                                      const int64_t end_ms, const string&,
                                      Timeframe) {
  CheckPeriod(start_ms, end_ms);
  num_calls_++;

  return bar_data_.Slice(start_ms, end_ms);
}

int CountingFetcher::GetNumCalls() const { return num_calls_; }

namespace {

/// 값들로 Arrow 배열을 만드는 함수
template <typename BuilderType, typename ValueType>
shared_ptr<arrow::Array> MakeArray(const vector<ValueType>& values) {
  BuilderType builder;
  for (const auto& value : values) {
    EXPECT_TRUE(builder.Append(value).ok());
  }

  shared_ptr<arrow::Array> array;
  EXPECT_TRUE(builder.Finish(&array).ok());

  return array;
}

/// 하루 간격 시간 열과 주어진 가격, 거래량 열로 테이블을 만드는 함수
shared_ptr<arrow::Table> MakeBarTable(
    const shared_ptr<arrow::Field>& price_field,
    const shared_ptr<arrow::Array>& price_array,
    const shared_ptr<arrow::Field>& volume_field,
    const shared_ptr<arrow::Array>& volume_array) {
  vector<int64_t> timestamps;
  for (int64_t idx = 0; idx < price_array->length(); idx++) {
    timestamps.push_back(kTestStartMs + idx * kDay);
  }

  vector<shared_ptr<arrow::Field>> fields = {
      arrow::field("timestamp", arrow::int64())};
  vector<shared_ptr<arrow::Array>> arrays = {
      MakeArray<arrow::Int64Builder>(timestamps)};

  for (const auto& name : {"open", "high", "low", "close"}) {
    fields.push_back(arrow::field(name, price_field->type()));
    arrays.push_back(price_array);
  }
  fields.push_back(volume_field);
  arrays.push_back(volume_array);

  return arrow::Table::Make(arrow::schema(fields), arrays);
}

}  // namespace

void DataCacheTest::SetUp() {
  logger = CreateTestLogger();
  source = make_shared<CountingFetcher>(
      MakeBarsFromCloses({100, 101, 102, 103, 104}, "AAPL"));

  cache_directory = GetTestDirectory("Cache");
  data_directory = GetTestDirectory("Data");
  filesystem::remove_all(cache_directory);
  filesystem::remove_all(data_directory);
}

void DataCacheTest::TearDown() {
  filesystem::remove_all(cache_directory);
  filesystem::remove_all(data_directory);
}

TEST_F(DataCacheTest, CacheKeyIsDeterministicMd5) {
  const auto& key = CachedFetcher::MakeCacheKey("AAPL", 0, 1000, DAY_1);

  EXPECT_EQ(key, CachedFetcher::MakeCacheKey("AAPL", 0, 1000, DAY_1));
  EXPECT_EQ(key.size(), 32u + string(".parquet").size());
  EXPECT_EQ(key.substr(32), ".parquet");

  EXPECT_NE(key, CachedFetcher::MakeCacheKey("MSFT", 0, 1000, DAY_1));
  EXPECT_NE(key, CachedFetcher::MakeCacheKey("AAPL", 0, 1001, DAY_1));
  EXPECT_NE(key, CachedFetcher::MakeCacheKey("AAPL", 0, 1000, HOUR_1));
}

TEST_F(DataCacheTest, SecondRequestIsServedFromCache) {
  CachedFetcher fetcher(source, cache_directory, logger);
  const int64_t end_ms = kTestStartMs + 10 * kDay;

  const auto& first = fetcher.FetchHistory(kTestStartMs, end_ms, "AAPL", DAY_1);
  const auto& second =
      fetcher.FetchHistory(kTestStartMs, end_ms, "AAPL", DAY_1);

  EXPECT_EQ(source->GetNumCalls(), 1);
  ASSERT_EQ(second.GetNumBars(), first.GetNumBars());
  for (size_t idx = 0; idx < first.GetNumBars(); idx++) {
    EXPECT_EQ(second.GetBar(idx).timestamp, first.GetBar(idx).timestamp);
    EXPECT_DOUBLE_EQ(second.GetBar(idx).close, first.GetBar(idx).close);
  }

  // 다른 범위는 새로 가져옴
  static_cast<void>(
      fetcher.FetchHistory(kTestStartMs, kTestStartMs + kDay, "AAPL", DAY_1));
  EXPECT_EQ(source->GetNumCalls(), 2);
}

TEST_F(DataCacheTest, InvalidPeriodThrowsConfigError) {
  CachedFetcher fetcher(source, cache_directory, logger);
  EXPECT_THROW(static_cast<void>(fetcher.FetchHistory(10, 5, "AAPL", DAY_1)),
               ConfigError);
}

TEST_F(DataCacheTest, ParquetFetcherReadsInstrumentFile) {
  const auto& bars = MakeBarsFromCloses({100, 101, 102, 103}, "BTC/USD");
  TableToParquet(ParquetFetcher::BarDataToTable(bars),
                 data_directory + "/BTC_USD", "1d.parquet");

  ParquetFetcher fetcher(data_directory, logger);
  const auto& loaded = fetcher.FetchHistory(
      kTestStartMs + kDay, kTestStartMs + 2 * kDay, "BTC/USD", DAY_1);

  ASSERT_EQ(loaded.GetNumBars(), 2u);
  EXPECT_EQ(loaded.GetInstrument(), "BTC/USD");
  EXPECT_DOUBLE_EQ(loaded.GetBar(0).close, 101.0);
  EXPECT_DOUBLE_EQ(loaded.GetBar(1).close, 102.0);
}

TEST_F(DataCacheTest, ParquetFetcherResamplesMinuteFile) {
  vector<tradesim::bar::Bar> minute_bars;
  for (int idx = 0; idx < 120; idx++) {
    minute_bars.emplace_back(kTestStartMs + idx * kMinute, 10.0, 11.0, 9.0,
                             10.0, 1.0);
  }

  TableToParquet(ParquetFetcher::BarDataToTable(
                     {"AAPL", MINUTE_1, std::move(minute_bars)}),
                 data_directory + "/AAPL", "1m.parquet");

  ParquetFetcher fetcher(data_directory, logger);
  const auto& hourly = fetcher.FetchHistory(
      kTestStartMs, kTestStartMs + kDay, "AAPL", HOUR_1);

  ASSERT_EQ(hourly.GetNumBars(), 2u);
  EXPECT_EQ(hourly.GetTimeframe(), HOUR_1);
  EXPECT_DOUBLE_EQ(hourly.GetBar(0).volume, 60.0);
}

TEST_F(DataCacheTest, MissingFileThrowsDataError) {
  ParquetFetcher fetcher(data_directory, logger);
  EXPECT_THROW(static_cast<void>(fetcher.FetchHistory(
                   kTestStartMs, kTestStartMs + kDay, "MISSING", DAY_1)),
               DataError);
}

TEST_F(DataCacheTest, IntegerAndFloatColumnsAreCoercedToDouble) {
  const auto& table = MakeBarTable(
      arrow::field("close", arrow::float32()),
      MakeArray<arrow::FloatBuilder>(vector<float>{100.5F, 101.25F}),
      arrow::field("volume", arrow::int64()),
      MakeArray<arrow::Int64Builder>(vector<int64_t>{1500, 2500}));

  const auto& bars = ParquetFetcher::TableToBarData(table, "AAPL", DAY_1);

  ASSERT_EQ(bars.GetNumBars(), 2u);
  EXPECT_DOUBLE_EQ(bars.GetBar(0).close, 100.5);
  EXPECT_DOUBLE_EQ(bars.GetBar(1).high, 101.25);
  EXPECT_DOUBLE_EQ(bars.GetBar(0).volume, 1500.0);
  EXPECT_DOUBLE_EQ(bars.GetBar(1).volume, 2500.0);
}

TEST_F(DataCacheTest, NumericStringColumnsAreParsed) {
  const auto& table = MakeBarTable(
      arrow::field("close", arrow::utf8()),
      MakeArray<arrow::StringBuilder>(vector<string>{"10", "10.5"}),
      arrow::field("volume", arrow::int32()),
      MakeArray<arrow::Int32Builder>(vector<int32_t>{7, 8}));

  const auto& bars = ParquetFetcher::TableToBarData(table, "AAPL", DAY_1);

  ASSERT_EQ(bars.GetNumBars(), 2u);
  EXPECT_DOUBLE_EQ(bars.GetBar(1).close, 10.5);
  EXPECT_DOUBLE_EQ(bars.GetBar(1).volume, 8.0);
}

TEST_F(DataCacheTest, NonNumericColumnThrowsDataError) {
  const auto& table = MakeBarTable(
      arrow::field("close", arrow::utf8()),
      MakeArray<arrow::StringBuilder>(vector<string>{"10", "abc"}),
      arrow::field("volume", arrow::float64()),
      MakeArray<arrow::DoubleBuilder>(vector<double>{1.0, 1.0}));

  EXPECT_THROW(static_cast<void>(
                   ParquetFetcher::TableToBarData(table, "AAPL", DAY_1)),
               DataError);
}

TEST_F(DataCacheTest, BooleanColumnThrowsDataError) {
  const auto& table = MakeBarTable(
      arrow::field("close", arrow::float64()),
      MakeArray<arrow::DoubleBuilder>(vector<double>{1.0, 2.0}),
      arrow::field("volume", arrow::boolean()),
      MakeArray<arrow::BooleanBuilder>(vector<bool>{true, false}));

  EXPECT_THROW(static_cast<void>(
                   ParquetFetcher::TableToBarData(table, "AAPL", DAY_1)),
               DataError);
}
