//
//  © 2024 Traderhs. All rights reserved.
//
//  ● 단일 종목 규칙 기반 전략을 위한 바 단위 백테스팅 프로그램 ●
//
//  ◆ 돈치안 채널, 이동평균 교차, MACD 변동성, SMA 임계값 전략 지원 ◆
//  ◆ ATR 위험 기반, 잔고 비율, 고정 수량 포지션 크기 결정 ◆
//  ◆ 손절, 익절, 수익 조건부 청산 ◆
//  ◆ CAGR, 샤프 지수, 최대 낙폭 등 성과 통계 분석 ◆
//
//  ============================================================================
//   ● 기본 작동 ●
//
//   ◆ 사용법: tradesim <config.json>
//   ◆ 시간은 UTC 기준
//   ◆ 바 데이터 형식은 Parquet만 지원하며,
//     timestamp (int64 밀리초), open, high, low, close, volume 열이
//     존재해야 함.
//   ◆ 바 데이터 경로는 데이터 폴더/종목 이름/타임프레임.parquet이며,
//     파일이 없으면 1m 파일을 리샘플링함
//   ◆ 각 바는 종가에 체결되며 손절, 익절은 고가와 저가로 확인함
//     → PositionManager 헤더 파일 참조
//   ◆ 방향별로 하나의 포지션만 보유 가능
//   ◆ 커스텀 전략 및 지표 생성 방법은 Strategy, Indicator 헤더 파일 참조
//   ◆ 종목별로 독립 계좌로 실행되며, 한 종목이 실패해도 나머지 종목은
//     계속 실행함. 하나라도 실패하면 종료 코드 1을 반환
//  ============================================================================
//
//   ● 설정 파일 형식 ●
//
//   {
//     "engine": { "initial_balance": 100000, "results_directory": "Results",
//                 "cache_directory": "Cache", "broker": "paper", ... },
//     "strategy": { "family": "donchian", "timeframe": "1d",
//                   "parameters": { "donchian_entry_window": 20, ... } },
//     "data": { "instruments": ["AAPL", "BTC/USD"],
//               "start": "2020-01-01 00:00:00", "end": "2024-12-31 00:00:00",
//               "datetime_format": "%Y-%m-%d %H:%M:%S" }
//   }
//  ============================================================================

// 표준 라이브러리
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// 외부 라이브러리
#include <nlohmann/json.hpp>

// 내부 헤더
#include "Engines/Analyzer.hpp"
#include "Engines/Backtester.hpp"
#include "Engines/BaseBroker.hpp"
#include "Engines/Config.hpp"
#include "Engines/DataCache.hpp"
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"
#include "Engines/ParquetFetcher.hpp"
#include "Engines/StrategyLoader.hpp"
#include "Engines/TimeUtils.hpp"

// 네임 스페이스
using namespace std;
using namespace nlohmann;
using namespace tradesim;
using namespace tradesim::exception;
using namespace tradesim::logger;
using namespace tradesim::utils;

namespace {

/// 바 데이터 범위와 종목 목록
struct DataRequest {
  vector<string> instruments;
  int64_t start_ms = 0;
  int64_t end_ms = 0;
};

/// 설정 파일을 읽어 Json으로 반환하는 함수
json ReadConfigFile(const string& file_path) {
  ifstream config_file(file_path);
  if (!config_file.is_open()) {
    throw ConfigError("설정 파일 [" + file_path + "]을(를) 열 수 없습니다.");
  }

  try {
    return json::parse(config_file);
  } catch (const json::exception& e) {
    throw ConfigError("설정 파일 [" + file_path +
                      "]을(를) 파싱할 수 없습니다.: " + e.what());
  }
}

/// data 섹션을 읽는 함수
DataRequest ParseDataRequest(const json& data_json,
                             const shared_ptr<Logger>& logger) {
  DataRequest request;
  string datetime_format = "%Y-%m-%d %H:%M:%S";

  try {
    for (const auto& [key, value] : data_json.items()) {
      if (key == "instruments") {
        request.instruments = value.get<vector<string>>();
      } else if (key == "start") {
        request.start_ms = UtcDatetimeToUtcTimestamp(
            value.get<string>(), data_json.value("datetime_format",
                                                 datetime_format));
      } else if (key == "end") {
        request.end_ms = UtcDatetimeToUtcTimestamp(
            value.get<string>(), data_json.value("datetime_format",
                                                 datetime_format));
      } else if (key != "datetime_format") {
        logger->LogAndThrowError<ConfigError>(
            "data 설정에 알 수 없는 키 [" + key + "]이(가) 있습니다.",
            __FILE__, __LINE__);
      }
    }
  } catch (const json::exception& e) {
    logger->LogAndThrowError<ConfigError>(
        string("data 설정을 읽을 수 없습니다.: ") + e.what(), __FILE__,
        __LINE__);
  }

  if (request.instruments.empty()) {
    logger->LogAndThrowError<ConfigError>(
        "data 설정에 종목이 하나도 지정되지 않았습니다.", __FILE__, __LINE__);
  }

  if (request.start_ms > request.end_ms) {
    logger->LogAndThrowError<ConfigError>(
        "data 설정의 시작 시간이 종료 시간보다 늦습니다.", __FILE__, __LINE__);
  }

  return request;
}

}  // namespace

int main(const int argc, char** argv) {
  if (argc != 2) {
    cerr << "사용법: " << argv[0] << " <config.json>" << endl;
    return EXIT_FAILURE;
  }

  json config_json;
  engine::Config config;
  engine::StrategyConfig strategy_config(engine::DONCHIAN);

  try {
    config_json = ReadConfigFile(argv[1]);
    config = engine::Config::FromJson(config_json.value("engine", json::object()));

    if (!config_json.contains("strategy")) {
      throw ConfigError("설정 파일에 strategy 섹션이 없습니다.");
    }

    strategy_config = engine::StrategyConfig::FromJson(config_json["strategy"]);
  } catch (const ConfigError& e) {
    cerr << e.what() << endl;
    return EXIT_FAILURE;
  }

  Logger::SetLogDirectory(config.GetLogDirectory());
  const auto& logger = Logger::GetLogger();

  try {
    const auto& request =
        ParseDataRequest(config_json.value("data", json::object()), logger);

    // 데이터 공급자 설정
    shared_ptr<fetcher::BaseFetcher> data_fetcher =
        make_shared<fetcher::ParquetFetcher>(config.GetDataDirectory(), logger);
    if (!config.GetCacheDirectory().empty()) {
      data_fetcher = make_shared<fetcher::CachedFetcher>(
          data_fetcher, config.GetCacheDirectory(), logger);
    }

    // 브로커 설정
    shared_ptr<broker::BaseBroker> broker;
    if (const auto broker_type = config.GetBroker()) {
      broker = broker::CreateBroker(*broker_type, logger);
    }

    const engine::Backtester backtester(
        strategy::LoadStrategy(strategy_config, logger), config, logger,
        broker);

    size_t num_failures = 0;
    for (const auto& instrument : request.instruments) {
      try {
        const auto& bars = data_fetcher->FetchHistory(
            request.start_ms, request.end_ms, instrument,
            strategy_config.GetTimeframe());

        const auto& result = backtester.Run(bars);

        logger->Log(INFO_L,
                    "[" + instrument + "] [" + result.strategy_name +
                        "] 백테스팅 결과\n" +
                        analyzer::Analyzer::FormatSummary(result.metrics),
                    __FILE__, __LINE__, true);

        backtester.SaveResult(result);
      } catch (const std::exception& e) {
        // 한 종목의 실패는 다른 종목의 실행을 막지 않음
        num_failures++;
        logger->Log(ERROR_L,
                    "[" + instrument + "] 백테스팅이 실패했습니다.: " + e.what(),
                    __FILE__, __LINE__, true);
      }
    }

    if (num_failures > 0) {
      logger->Log(WARN_L,
                  to_string(request.instruments.size()) + "개 종목 중 " +
                      to_string(num_failures) + "개 종목이 실패했습니다.",
                  __FILE__, __LINE__, true);
      return EXIT_FAILURE;
    }
  } catch (const std::exception& e) {
    logger->Log(ERROR_L, string("백테스팅을 시작할 수 없습니다.: ") + e.what(),
                __FILE__, __LINE__, true);
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
