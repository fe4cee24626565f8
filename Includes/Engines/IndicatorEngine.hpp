#pragma once

// 표준 라이브러리
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// 내부 헤더
#include "Engines/BarData.hpp"
#include "Engines/Exception.hpp"
#include "Engines/Indicator.hpp"
#include "Engines/Logger.hpp"
#include "Indicators/Close.hpp"
#include "Indicators/High.hpp"
#include "Indicators/Low.hpp"
#include "Indicators/Open.hpp"
#include "Indicators/Volume.hpp"

// 네임 스페이스
using namespace std;

namespace tradesim::indicator {

using bar::BarData;
using logger::Logger;

/**
 * 등록된 지표들을 바 순서대로 계산하는 엔진
 *
 * 모든 지표의 t번째 바를 계산한 뒤 t + 1번째 바로 넘어가므로, 지표는 현재
 * 바 이전의 값만 참조할 수 있다. 등록 순서가 계산 순서이므로 다른 지표를
 * 소스로 사용하는 지표는 소스보다 나중에 추가되어야 한다.
 */
class IndicatorEngine final {
  // 가격 지표 참조보다 먼저 초기화되어야 하므로 public 멤버보다 위에 선언
  shared_ptr<Logger> logger_;
  vector<unique_ptr<Indicator>> indicators_;
  unordered_map<string, Indicator*> indicator_index_;

 public:
  explicit IndicatorEngine(shared_ptr<Logger> logger);
  ~IndicatorEngine();

  IndicatorEngine(const IndicatorEngine&) = delete;
  IndicatorEngine& operator=(const IndicatorEngine&) = delete;

  /**
   * 지표를 생성하고 계산 목록에 추가하는 함수.
   * 이미 같은 이름의 지표가 있으면 ConfigError를 던진다.
   *
   * @tparam CustomIndicator 추가할 지표 클래스
   * @param name 지표 이름
   * @param args 지표 생성자의 이름 이후 인수들
   * @return 추가된 지표에 대한 참조
   */
  template <typename CustomIndicator, typename... Args>
  CustomIndicator& AddIndicator(const string& name, Args&&... args) {
    if (indicator_index_.contains(name)) {
      logger_->LogAndThrowError<exception::ConfigError>(
          "[" + name + "] 지표가 이미 추가되어 있습니다.", __FILE__, __LINE__);
    }

    auto indicator =
        make_unique<CustomIndicator>(name, std::forward<Args>(args)...);
    CustomIndicator& reference = *indicator;
    Register(std::move(indicator));

    return reference;
  }

  /**
   * 주어진 바 데이터로 등록된 모든 지표를 처음부터 계산하는 함수
   *
   * @param bars 계산할 바 데이터. 계산이 끝날 때까지 유효해야 함
   */
  void Compute(const BarData& bars);

  /// 이름에 해당되는 지표의 계산된 값을 반환하는 함수.
  /// 없는 이름이면 DataError
  [[nodiscard]] const vector<double>& GetSeries(const string& name) const;

  /// 이름에 해당되는 지표가 추가되어 있는지 확인하는 함수
  [[nodiscard]] bool HasSeries(const string& name) const;

  /// 이름에 해당되는 지표를 반환하는 함수. 없는 이름이면 DataError
  [[nodiscard]] Indicator& GetIndicator(const string& name) const;

  /// 현재 계산 중인 바 인덱스를 반환하는 함수.
  /// 계산이 끝난 후에는 마지막 바 인덱스
  [[nodiscard]] size_t GetCurrentBarIndex() const;

  /// 현재 계산 중인 바를 반환하는 함수
  [[nodiscard]] const Bar& GetCurrentBar() const;

  /// 마지막으로 계산한 바 개수를 반환하는 함수
  [[nodiscard]] size_t GetNumBars() const;

  // 전략 작성 편의성용 가격 지표
  Open& open;
  High& high;
  Low& low;
  Close& close;
  Volume& volume;

 private:
  const BarData* bars_;     // 계산 중인 바 데이터
  size_t current_bar_idx_;  // 계산 커서
  size_t num_bars_;         // 마지막으로 계산한 바 개수

  /// 지표의 계산 커서를 이 엔진으로 연결하고 목록에 추가하는 함수
  void Register(unique_ptr<Indicator> indicator);
};

}  // namespace tradesim::indicator
