#pragma once

// 표준 라이브러리
#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <type_traits>

// 외부 라이브러리
#include <nlohmann/json_fwd.hpp>

// 전방 선언
namespace arrow {
class Table;
}  // namespace arrow

// 네임 스페이스
using namespace std;
using namespace nlohmann;

/// 데이터 핸들링을 위한 유틸리티 네임스페이스
namespace tradesim::utils {

/// 두 값의 차이가 절대 오차 또는 상대 오차 안에 있는지 확인하는 함수.
/// NaN이 포함되면 false를 반환함.
template <typename T, typename U>
[[nodiscard]] inline bool IsWithinTolerance(T a, U b) noexcept {
  using CommonType = common_type_t<T, U, double>;

  const auto ca = static_cast<CommonType>(a);
  const auto cb = static_cast<CommonType>(b);

  if (std::isnan(ca) || std::isnan(cb)) [[unlikely]] {
    return false;
  }

  // 절대적 오차 (0에 가까운 값들)
  constexpr CommonType abs_tolerance =
      numeric_limits<CommonType>::epsilon() * 100;

  // 상대적 오차 (큰 값들)
  constexpr CommonType rel_tolerance = CommonType(1e-12);

  const CommonType diff = std::fabs(ca - cb);
  return diff <= abs_tolerance ||
         diff <= rel_tolerance * std::fmax(std::fabs(ca), std::fabs(cb));
}

/// 부동 소수점 같은 값 비교를 위한 함수.
/// 왼쪽 값이 오른쪽 값과 같으면 true를 반환함.
template <typename T, typename U>
[[nodiscard]] inline bool IsEqual(T a, U b) noexcept {
  return IsWithinTolerance(a, b);
}

/// 부동 소수점 크기 비교를 위한 함수.
/// 왼쪽 값이 오른쪽 값보다 크면 true를 반환함. NaN이면 false.
template <typename T, typename U>
[[nodiscard]] inline bool IsGreater(T a, U b) noexcept {
  if (std::isnan(static_cast<double>(a)) || std::isnan(static_cast<double>(b)))
      [[unlikely]] {
    return false;
  }

  return !IsWithinTolerance(a, b) && a > b;
}

/// 부동 소수점 크기 비교를 위한 함수.
/// 왼쪽 값이 오른쪽 값보다 크거나 같으면 true를 반환함. NaN이면 false.
template <typename T, typename U>
[[nodiscard]] inline bool IsGreaterOrEqual(T a, U b) noexcept {
  if (std::isnan(static_cast<double>(a)) || std::isnan(static_cast<double>(b)))
      [[unlikely]] {
    return false;
  }

  return IsWithinTolerance(a, b) || a > b;
}

/// 부동 소수점 크기 비교를 위한 함수.
/// 왼쪽 값이 오른쪽 값보다 작으면 true를 반환함. NaN이면 false.
template <typename T, typename U>
[[nodiscard]] inline bool IsLess(T a, U b) noexcept {
  if (std::isnan(static_cast<double>(a)) || std::isnan(static_cast<double>(b)))
      [[unlikely]] {
    return false;
  }

  return !IsWithinTolerance(a, b) && a < b;
}

/// 부동 소수점 크기 비교를 위한 함수.
/// 왼쪽 값이 오른쪽 값보다 작거나 같으면 true를 반환함. NaN이면 false.
template <typename T, typename U>
[[nodiscard]] inline bool IsLessOrEqual(T a, U b) noexcept {
  if (std::isnan(static_cast<double>(a)) || std::isnan(static_cast<double>(b)))
      [[unlikely]] {
    return false;
  }

  return IsWithinTolerance(a, b) || a < b;
}

/**
 * 주어진 값을 지정된 소수 자릿수로 반올림하여 반환하는 함수
 *
 * @param value 반올림할 값
 * @param decimal_places 값이 반올림될 소수점 자릿수
 * @return 주어진 값이 지정된 소수 자릿수로 반올림된 값
 */
[[nodiscard]] double RoundToDecimalPlaces(double value, size_t decimal_places);

/// 금액을 천 단위 쉼표와 달러 표기로 포맷하여 반환하는 함수
[[nodiscard]] string FormatDollar(double price);

/// 비율 값(0.1 = 10%)을 퍼센트 형식으로 포맷하여 반환하는 함수
[[nodiscard]] string FormatPercentage(double ratio);

/// 값을 주어진 정밀도의 string으로 변환하여 반환하는 함수
[[nodiscard]] string ToFixedString(double value, int precision);

/// 경로 구분자(/, \, :)를 _로 바꿔 파일 이름으로 사용할 수 있게 하는 함수
[[nodiscard]] string ToFileName(const string& name);

/**
 * 지정된 경로의 Parquet 파일을 읽어오는 함수.
 * 파일을 열거나 읽을 수 없으면 DataError를 던진다.
 *
 * @param file_path 읽을 Parquet 파일의 경로
 * @return 읽은 테이블을 포함하는 shared_ptr 객체
 */
[[nodiscard]] shared_ptr<arrow::Table> ReadParquet(const string& file_path);

/**
 * 주어진 테이블을 Parquet 파일 형식으로 지정된 경로에 저장하는 함수
 *
 * @param table 저장할 데이터를 포함하는 Table 객체에 대한 shared_ptr
 * @param directory_path 데이터를 저장할 폴더의 경로
 * @param file_name 파일 이름
 */
void TableToParquet(const shared_ptr<arrow::Table>& table,
                    const string& directory_path, const string& file_name);

/// Json을 지정된 경로에 파일로 저장하는 함수
void JsonToFile(const json& data, const string& file_path);

}  // namespace tradesim::utils
