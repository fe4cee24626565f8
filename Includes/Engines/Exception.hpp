#pragma once

// 표준 라이브러리
#include <stdexcept>
#include <string>

// 네임 스페이스
using namespace std;

namespace tradesim::exception {

/// 바 데이터가 누락되었거나 숫자로 변환할 수 없을 때 발생하는 에러
class DataError final : public runtime_error {
 public:
  explicit DataError(const string& message) : runtime_error(message) {}
};

/// 알 수 없는 식별자나 범위를 벗어난 설정값이 주어졌을 때 발생하는 에러
class ConfigError final : public runtime_error {
 public:
  explicit ConfigError(const string& message) : runtime_error(message) {}
};

/// 시뮬레이션 도중 예상하지 못한 오류가 발생했을 때 발생하는 에러
class ExecutionFailure final : public runtime_error {
 public:
  explicit ExecutionFailure(const string& message) : runtime_error(message) {}
};

/// 주문 실패 시 발생하는 에러
class OrderFailed final : public runtime_error {
 public:
  explicit OrderFailed(const string& message) : runtime_error(message) {}
};

}  // namespace tradesim::exception
