// 표준 라이브러리
#include <cmath>

// 내부 헤더
#include "Engines/Exception.hpp"
#include "Indicators/Indicators.hpp"

// 파일 헤더
#include "IndicatorTest.hpp"

using namespace tradesim::exception;
using namespace tradesim::test;

void IndicatorTest::SetUp() {
  logger = CreateTestLogger();
  engine = make_unique<IndicatorEngine>(logger);
}

void IndicatorTest::TearDown() { engine.reset(); }

TEST_F(IndicatorTest, SimpleMovingAverageWindowPolicy) {
  engine->AddIndicator<SimpleMovingAverage>("sma_full", engine->close, 3);
  engine->AddIndicator<SimpleMovingAverage>("sma_partial", engine->close, 3,
                                            PARTIAL);

  engine->Compute(MakeBarsFromCloses({1, 2, 3, 4}));

  const auto& full_series = engine->GetSeries("sma_full");
  EXPECT_TRUE(isnan(full_series[0]));
  EXPECT_TRUE(isnan(full_series[1]));
  EXPECT_DOUBLE_EQ(full_series[2], 2.0);
  EXPECT_DOUBLE_EQ(full_series[3], 3.0);

  // 부분 윈도우는 사용 가능한 바들의 평균
  const auto& partial_series = engine->GetSeries("sma_partial");
  EXPECT_DOUBLE_EQ(partial_series[0], 1.0);
  EXPECT_DOUBLE_EQ(partial_series[1], 1.5);
  EXPECT_DOUBLE_EQ(partial_series[2], 2.0);
}

TEST_F(IndicatorTest, ExponentialMovingAverageSeedsWithFirstValue) {
  engine->AddIndicator<ExponentialMovingAverage>("ema", engine->close, 3);
  engine->Compute(MakeBarsFromCloses({10, 20, 30}));

  // alpha = 2 / (3 + 1) = 0.5
  const auto& ema = engine->GetSeries("ema");
  EXPECT_DOUBLE_EQ(ema[0], 10.0);
  EXPECT_DOUBLE_EQ(ema[1], 15.0);
  EXPECT_DOUBLE_EQ(ema[2], 22.5);
}

TEST_F(IndicatorTest, ShiftedDonchianChannelExcludesCurrentBar) {
  engine->AddIndicator<Highest>("high_channel", engine->high, 2, FULL, 1);
  engine->AddIndicator<Lowest>("low_channel", engine->low, 2, FULL, 1);
  engine->Compute(MakeBarsFromCloses({5, 7, 6, 9}));

  const auto& high_channel = engine->GetSeries("high_channel");
  EXPECT_TRUE(isnan(high_channel[0]));
  EXPECT_TRUE(isnan(high_channel[1]));
  EXPECT_DOUBLE_EQ(high_channel[2], 7.0);
  EXPECT_DOUBLE_EQ(high_channel[3], 7.0);

  const auto& low_channel = engine->GetSeries("low_channel");
  EXPECT_DOUBLE_EQ(low_channel[2], 5.0);
  EXPECT_DOUBLE_EQ(low_channel[3], 6.0);
}

TEST_F(IndicatorTest, TrueRangeUsesPreviousClose) {
  engine->AddIndicator<TrueRange>("tr");
  engine->AddIndicator<SimpleAverageTrueRange>("atr", 2, FULL);

  vector<tradesim::bar::Bar> bars = {MakeBar(0, 10, 12, 9, 11),
                                     MakeBar(1, 11, 11.5, 10.5, 11),
                                     MakeBar(2, 14, 15, 13, 14)};
  engine->Compute({"TEST", tradesim::utils::DAY_1, bars});

  const auto& true_range = engine->GetSeries("tr");
  EXPECT_DOUBLE_EQ(true_range[0], 3.0);  // 첫 바는 high - low
  EXPECT_DOUBLE_EQ(true_range[1], 1.0);
  EXPECT_DOUBLE_EQ(true_range[2], 4.0);  // high - prev close

  const auto& atr = engine->GetSeries("atr");
  EXPECT_TRUE(isnan(atr[0]));
  EXPECT_DOUBLE_EQ(atr[1], 2.0);
  EXPECT_DOUBLE_EQ(atr[2], 2.5);
}

TEST_F(IndicatorTest, RollingMedianAveragesMiddleValues) {
  engine->AddIndicator<RollingMedian>("median", engine->close, 4, PARTIAL);
  engine->Compute(MakeBarsFromCloses({4, 1, 3, 2}));

  const auto& median = engine->GetSeries("median");
  EXPECT_DOUBLE_EQ(median[0], 4.0);
  EXPECT_DOUBLE_EQ(median[1], 2.5);
  EXPECT_DOUBLE_EQ(median[2], 3.0);
  EXPECT_DOUBLE_EQ(median[3], 2.5);
}

TEST_F(IndicatorTest, DifferenceSubtractsSeries) {
  engine->AddIndicator<Difference>("range", engine->high, engine->low);

  vector<tradesim::bar::Bar> bars = {MakeBar(0, 10, 12, 9, 11),
                                     MakeBar(1, 11, 13, 10.5, 12)};
  engine->Compute({"TEST", tradesim::utils::DAY_1, bars});

  const auto& range = engine->GetSeries("range");
  EXPECT_DOUBLE_EQ(range[0], 3.0);
  EXPECT_DOUBLE_EQ(range[1], 2.5);
}

TEST_F(IndicatorTest, SeriesLengthMatchesBarCount) {
  engine->AddIndicator<SimpleMovingAverage>("sma", engine->close, 50);
  engine->Compute(MakeBarsFromCloses({1, 2, 3}));

  EXPECT_EQ(engine->GetSeries("sma").size(), 3u);
  EXPECT_EQ(engine->GetNumBars(), 3u);
}

TEST_F(IndicatorTest, DuplicateNameThrowsConfigError) {
  engine->AddIndicator<SimpleMovingAverage>("sma", engine->close, 2);
  EXPECT_THROW(
      engine->AddIndicator<SimpleMovingAverage>("sma", engine->close, 3),
      ConfigError);
}

TEST_F(IndicatorTest, ZeroPeriodThrowsConfigError) {
  EXPECT_THROW(
      engine->AddIndicator<SimpleMovingAverage>("sma", engine->close, 0),
      ConfigError);
}

TEST_F(IndicatorTest, UnknownSeriesThrowsDataError) {
  engine->Compute(MakeBarsFromCloses({1, 2}));
  EXPECT_THROW(static_cast<void>(engine->GetSeries("missing")), DataError);
}

TEST_F(IndicatorTest, MacdLineAndSignalLine) {
  auto& macd = engine->AddIndicator<MovingAverageConvergenceDivergence>(
      "macd", engine->close, 3, 5);
  engine->AddIndicator<ExponentialMovingAverage>("macd_signal", macd, 2);
  engine->Compute(MakeBarsFromCloses({10, 11, 12, 9, 8, 13, 14, 12}));

  const vector<double> expected_macd = {0.0,       0.166667,  0.361111,
                                        -0.134259, -0.443673, 0.360468,
                                        0.735104,  0.404132};
  const vector<double> expected_signal = {0.0,       0.111111,  0.277778,
                                          0.003086,  -0.294753, 0.142061,
                                          0.537423,  0.448562};

  const auto& macd_series = engine->GetSeries("macd");
  const auto& signal_series = engine->GetSeries("macd_signal");
  ASSERT_EQ(macd_series.size(), expected_macd.size());
  ASSERT_EQ(signal_series.size(), expected_signal.size());

  for (size_t idx = 0; idx < expected_macd.size(); idx++) {
    EXPECT_NEAR(macd_series[idx], expected_macd[idx], 1e-6) << "bar " << idx;
    EXPECT_NEAR(signal_series[idx], expected_signal[idx], 1e-6)
        << "bar " << idx;
  }
}

TEST_F(IndicatorTest, MacdRequiresFastSpanBelowSlowSpan) {
  EXPECT_THROW(static_cast<void>(
                   engine->AddIndicator<MovingAverageConvergenceDivergence>(
                       "macd", engine->close, 5, 5)),
               ConfigError);
}
