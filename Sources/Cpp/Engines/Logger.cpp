// 표준 라이브러리
#include <filesystem>
#include <iostream>

// 파일 헤더
#include "Engines/Logger.hpp"

// 내부 헤더
#include "Engines/TimeUtils.hpp"

// 네임 스페이스
using namespace tradesim::utils;

namespace tradesim::logger {

// 정적 멤버 변수 정의
mutex Logger::instance_mutex_;
shared_ptr<Logger> Logger::instance_;
string Logger::default_log_directory_ = ".";

Logger::Logger(const string& log_directory) { OpenLogFiles(log_directory); }

Logger::~Logger() { CloseLogFiles(); }

shared_ptr<Logger> Logger::Create(const string& log_directory) {
  // 생성자가 private이므로 make_shared 대신 직접 생성
  return shared_ptr<Logger>(new Logger(log_directory));
}

void Logger::SetLogDirectory(const string& log_directory) {
  lock_guard lock(instance_mutex_);
  default_log_directory_ = log_directory;

  if (instance_) {
    lock_guard write_lock(instance_->write_mutex_);
    instance_->CloseLogFiles();
    instance_->OpenLogFiles(log_directory);
  }
}

shared_ptr<Logger>& Logger::GetLogger() {
  lock_guard lock(instance_mutex_);
  if (!instance_) {
    instance_ = shared_ptr<Logger>(new Logger(default_log_directory_));
  }

  return instance_;
}

void Logger::Log(const LogLevel log_level, const string& message,
                 const string& file, const int line,
                 const bool log_to_console) {
  const string& formatted = FormatMessage(log_level, file, line, message);

  lock_guard lock(write_mutex_);
  if (log_to_console) {
    ConsoleLog(log_level, formatted);
  }

  WriteLine(log_level, formatted);
}

void Logger::LogNoFormat(const LogLevel log_level, const string& message,
                         const bool log_to_console) {
  lock_guard lock(write_mutex_);
  if (log_to_console) {
    ConsoleLog(log_level, message);
  }

  WriteLine(log_level, message);
}

string Logger::GetLogDirectory() const { return log_directory_; }

void Logger::OpenLogFiles(const string& log_directory) {
  log_directory_ = log_directory.empty() ? "." : log_directory;

  if (error_code ec; !filesystem::exists(log_directory_) &&
                     !filesystem::create_directories(log_directory_, ec)) {
    throw runtime_error("[" + log_directory_ +
                        "] 로그 폴더를 생성할 수 없습니다: " + ec.message());
  }

  const string& log_path = log_directory_ + "/";
  debug_log_.open(log_path + "debug.log", ios::app);
  info_log_.open(log_path + "info.log", ios::app);
  warn_log_.open(log_path + "warn.log", ios::app);
  error_log_.open(log_path + "error.log", ios::app);

  // 백테스팅 로그는 로거 생성마다 새로 시작
  backtesting_log_.open(log_path + "backtesting.log", ios::out | ios::trunc);
}

void Logger::CloseLogFiles() {
  for (ofstream* stream :
       {&debug_log_, &info_log_, &warn_log_, &error_log_, &backtesting_log_}) {
    if (stream->is_open()) {
      stream->close();
    }
  }
}

ofstream& Logger::GetLevelStream(const LogLevel log_level) {
  switch (log_level) {
    case DEBUG_L: {
      return debug_log_;
    }

    case WARN_L: {
      return warn_log_;
    }

    case ERROR_L: {
      return error_log_;
    }

    default: {
      return info_log_;
    }
  }
}

void Logger::WriteLine(const LogLevel log_level, const string& line) {
  if (ofstream& level_log = GetLevelStream(log_level); level_log.is_open()) {
    level_log << line << '\n';
    level_log.flush();
  }

  if (backtesting_log_.is_open()) {
    backtesting_log_ << line << '\n';
    backtesting_log_.flush();
  }
}

string Logger::FormatMessage(const LogLevel log_level, const string& file,
                             const int line, const string& message) {
  return "[" + GetCurrentLocalDatetime() + "] [" + GetLevelString(log_level) +
         "] [" + ExtractFilename(file) + ":" + to_string(line) + "] | " +
         message;
}

const char* Logger::GetLevelString(const LogLevel log_level) {
  switch (log_level) {
    case DEBUG_L: {
      return "DEBUG";
    }

    case INFO_L: {
      return "INFO";
    }

    case WARN_L: {
      return "WARN";
    }

    case ERROR_L: {
      return "ERROR";
    }

    default: {
      return "UNKNOWN";
    }
  }
}

string Logger::ExtractFilename(const string& file_path) {
  const size_t pos = file_path.find_last_of("/\\");
  return pos == string::npos ? file_path : file_path.substr(pos + 1);
}

void Logger::ConsoleLog(const LogLevel log_level, const string& message) {
  switch (log_level) {
    case DEBUG_L: {
      cout << "\033[90m" << message << "\033[0m" << endl;  // Gray
      break;
    }

    case INFO_L: {
      cout << "\033[38;2;200;200;200m" << message << "\033[0m"
           << endl;  // White
      break;
    }

    case WARN_L: {
      cout << "\033[33m" << message << "\033[0m" << endl;  // Yellow
      break;
    }

    case ERROR_L: {
      cout << "\033[31m" << message << "\033[0m" << endl;  // Red
      break;
    }
  }
}

}  // namespace tradesim::logger
