#pragma once

// 표준 라이브러리
#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

// 네임 스페이스
using namespace std;

namespace tradesim::logger {

/// 로그 레벨을 지정하는 열거형 클래스
enum class LogLevel { DEBUG_L, INFO_L, WARN_L, ERROR_L };
using enum LogLevel;

/**
 * 시스템 로깅을 담당하는 클래스
 *
 * 애플리케이션 범위의 기본 로거는 GetLogger로 얻고, 각 컴포넌트는 생성자에서
 * shared_ptr<Logger>를 주입받아 사용한다.
 * 레벨별 로그 파일(debug.log, info.log, warn.log, error.log)과 모든 레벨이
 * 기록되는 backtesting.log를 관리하며, 내부 뮤텍스로 동기화되어 여러
 * 백테스팅이 하나의 로거를 공유할 수 있다.
 */
class Logger final {
 public:
  Logger(const Logger&) = delete;             // 복사 생성자 삭제
  Logger& operator=(const Logger&) = delete;  // 대입 연산자 삭제
  ~Logger();

  /**
   * 지정된 폴더에 로그 파일을 생성하는 독립 로거를 만드는 함수
   *
   * @param log_directory 로그 파일들이 저장될 디렉터리 경로
   * @return 주입 가능한 Logger 인스턴스
   */
  [[nodiscard]] static shared_ptr<Logger> Create(const string& log_directory);

  /**
   * 애플리케이션 로거의 로그 파일이 저장될 폴더를 설정하는 함수.
   * 이미 생성된 애플리케이션 로거가 있으면 새 폴더에서 파일을 다시 연다.
   *
   * @param log_directory 로그 파일들이 저장될 디렉터리 경로
   */
  static void SetLogDirectory(const string& log_directory);

  /// 애플리케이션 범위의 로거를 반환하는 함수. 최초 호출 시 생성
  static shared_ptr<Logger>& GetLogger();

  /**
   * 지정된 로그 레벨과 파일 및 라인 정보를 사용하여 메시지를 기록하는 함수
   *
   * @param log_level 로그 메시지의 레벨
   * @param message 기록할 로그 메시지
   * @param file 로그가 생성된 파일의 이름. __FILE__로 지정
   * @param line 로그 명령문이 발생한 파일의 라인 번호. __LINE__으로 지정
   * @param log_to_console 콘솔에 로그를 출력할지 결정하는 플래그
   */
  void Log(LogLevel log_level, const string& message, const string& file,
           int line, bool log_to_console = false);

  /// 포맷 없이 로그를 기록하는 함수
  void LogNoFormat(LogLevel log_level, const string& message,
                   bool log_to_console = false);

  /**
   * 에러를 로깅하고 Throw하는 함수
   *
   * @tparam Error 던질 예외 타입
   * @param message 오류에 대한 설명 메시지
   * @param file __FILE__로 지정
   * @param line __LINE__으로 지정
   */
  template <typename Error = runtime_error>
  [[noreturn]] void LogAndThrowError(const string& message, const string& file,
                                     const int line) {
    Log(ERROR_L, message, file, line, true);
    throw Error(message);
  }

  /// 로그 파일이 저장되는 폴더를 반환하는 함수
  [[nodiscard]] string GetLogDirectory() const;

 private:
  explicit Logger(const string& log_directory);

  // 애플리케이션 로거 관리 멤버
  static mutex instance_mutex_;
  static shared_ptr<Logger> instance_;
  static string default_log_directory_;

  mutex write_mutex_;
  string log_directory_;

  // 로그 파일 스트림
  ofstream debug_log_;
  ofstream info_log_;
  ofstream warn_log_;
  ofstream error_log_;
  ofstream backtesting_log_;

  /// 로그 폴더를 생성하고 파일들을 여는 함수
  void OpenLogFiles(const string& log_directory);

  /// 열려있는 로그 파일을 모두 닫는 함수
  void CloseLogFiles();

  /// 로그 레벨에 해당되는 파일 스트림을 반환하는 함수
  ofstream& GetLevelStream(LogLevel log_level);

  /// 파일 스트림들에 한 줄을 쓰는 함수. write_mutex_를 잡은 상태로 호출
  void WriteLine(LogLevel log_level, const string& line);

  /// [TIME] [LEVEL] [filename:line] | message 형식으로 포맷하는 함수
  static string FormatMessage(LogLevel log_level, const string& file, int line,
                              const string& message);

  /// 로그 레벨을 문자열로 변환하는 함수
  static const char* GetLevelString(LogLevel log_level);

  /// 파일 경로에서 파일명만 추출하는 함수
  static string ExtractFilename(const string& file_path);

  /// 콘솔에 레벨별 색상으로 로그 메시지를 출력하는 함수
  static void ConsoleLog(LogLevel log_level, const string& message);
};

}  // namespace tradesim::logger
