// 파일 헤더
#include "Engines/StrategyLoader.hpp"

// 내부 헤더
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"
#include "Strategies/DonchianStrategy.hpp"
#include "Strategies/MacdVolatilityStrategy.hpp"
#include "Strategies/MovingAverageCrossoverStrategy.hpp"
#include "Strategies/SmaThresholdStrategy.hpp"

// 네임 스페이스
using namespace tradesim::exception;
using namespace tradesim::logger;

namespace tradesim::strategy {

shared_ptr<Strategy> LoadStrategy(const StrategyConfig& config,
                                  shared_ptr<Logger> logger) {
  shared_ptr<Strategy> strategy;

  switch (config.GetFamily()) {
    case engine::DONCHIAN:
      [[fallthrough]];
    case engine::DONCHIAN_ATR: {
      strategy = make_shared<DonchianStrategy>(config, logger);
      break;
    }

    case engine::SMA_CROSSOVER:
      [[fallthrough]];
    case engine::EMA_CROSSOVER: {
      strategy = make_shared<MovingAverageCrossoverStrategy>(config, logger);
      break;
    }

    case engine::MACD_VOLATILITY: {
      strategy = make_shared<MacdVolatilityStrategy>(config, logger);
      break;
    }

    case engine::SMA_THRESHOLD: {
      strategy = make_shared<SmaThresholdStrategy>(config, logger);
      break;
    }
  }

  if (strategy == nullptr) [[unlikely]] {
    logger->LogAndThrowError<ConfigError>("지원하지 않는 전략 계열입니다.",
                                          __FILE__, __LINE__);
  }

  logger->Log(INFO_L,
              "[" + strategy->GetName() + "] 전략이 생성되었습니다. (" +
                  utils::TimeframeToString(config.GetTimeframe()) + ")",
              __FILE__, __LINE__);

  return strategy;
}

}  // namespace tradesim::strategy
