// 파일 헤더
#include "Engines/BaseBroker.hpp"

// 내부 헤더
#include "Engines/Exception.hpp"
#include "Engines/Logger.hpp"
#include "Engines/PaperBroker.hpp"

// 네임 스페이스
using namespace tradesim::exception;

namespace tradesim::broker {

BaseBroker::BaseBroker() = default;
BaseBroker::~BaseBroker() = default;

string OrderSideToString(const OrderSide side) {
  return side == OrderSide::BUY ? "BUY" : "SELL";
}

BrokerType ParseBrokerType(const string& broker_name) {
  if (broker_name == "paper") {
    return BrokerType::PAPER;
  }

  Logger::GetLogger()->LogAndThrowError<ConfigError>(
      "알 수 없는 브로커 [" + broker_name + "]이(가) 지정되었습니다.",
      __FILE__, __LINE__);
}

shared_ptr<BaseBroker> CreateBroker(const BrokerType broker_type,
                                    shared_ptr<Logger> logger) {
  switch (broker_type) {
    case BrokerType::PAPER: {
      return make_shared<PaperBroker>(std::move(logger));
    }
  }

  logger->LogAndThrowError<ConfigError>("지원하지 않는 브로커 종류입니다.",
                                        __FILE__, __LINE__);
}

}  // namespace tradesim::broker
