#include "revgate/log.h"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace revgate::log {

namespace {
std::mutex g_log_mutex;
std::ofstream g_log_file;
std::deque<std::string> g_ring;
constexpr size_t kRingMax = 200;
std::string g_app_name = "revgate";
bool g_console_echo = true;
// Raw descriptor onto the current log file; the only thing the crash handler touches.
volatile int g_crash_fd = -1;

std::tm local_now() {
  const auto tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&tt, &tm);
  return tm;
}

std::string timestamp_now() {
  const std::tm tm = local_now();
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

std::string timestamp_for_filename() {
  const std::tm tm = local_now();
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
  return oss.str();
}

void log_line(const char* level, std::string_view msg) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const std::string line = "[" + timestamp_now() + "][" + level + "] " + std::string(msg);
  if (g_console_echo) {
    std::cout << line << "\n";
  }
  if (g_log_file.is_open()) {
    g_log_file << line << "\n";
    g_log_file.flush();
  }
  g_ring.push_back(line);
  if (g_ring.size() > kRingMax) {
    g_ring.pop_front();
  }
}
} // namespace

void init() {
  init("revgate", std::filesystem::current_path() / ".revgate" / "logs");
}

void init(const std::string& app_name, const std::filesystem::path& logs_dir) {
  {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_app_name = app_name;
    if (g_log_file.is_open()) {
      g_log_file.close();
    }
    if (g_crash_fd >= 0) {
      ::close(g_crash_fd);
      g_crash_fd = -1;
    }
    std::error_code ec;
    std::filesystem::create_directories(logs_dir, ec);
    if (!ec) {
      const std::string file_name = g_app_name + "_" + timestamp_for_filename() + ".log";
      const auto log_path = logs_dir / file_name;
      g_log_file.open(log_path, std::ios::out | std::ios::app);
      g_crash_fd = ::open(log_path.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC);
    }
  }
  log_line("INFO", "log init");
#ifdef REVGATE_DEBUG
  log_line("INFO", "build: debug");
#else
  log_line("INFO", "build: release");
#endif
}

void shutdown() {
  log_line("INFO", "log shutdown");
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (g_log_file.is_open()) {
    g_log_file.close();
  }
  if (g_crash_fd >= 0) {
    ::close(g_crash_fd);
    g_crash_fd = -1;
  }
}

void set_console_echo(bool enabled) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_console_echo = enabled;
}

void info(std::string_view msg) {
  log_line("INFO", msg);
}

void warn(std::string_view msg) {
  log_line("WARN", msg);
}

void error(std::string_view msg) {
  log_line("ERROR", msg);
}

std::vector<std::string> recent(size_t max_entries) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const size_t count = std::min(max_entries, g_ring.size());
  return std::vector<std::string>(g_ring.end() - count, g_ring.end());
}

namespace {
// Async-signal-safe: no locks, no allocation, only write(2).
void signal_handler(int sig) {
  char msg[] = "[crash][ERROR] signal ??\n";
  const size_t digits = sizeof("[crash][ERROR] signal ") - 1;
  msg[digits] = static_cast<char>('0' + (sig / 10) % 10);
  msg[digits + 1] = static_cast<char>('0' + sig % 10);
  const size_t len = sizeof(msg) - 1;
  ssize_t rc = ::write(STDERR_FILENO, msg, len);
  const int fd = g_crash_fd;
  if (fd >= 0) {
    rc = ::write(fd, msg, len);
  }
  (void)rc;
  std::_Exit(1);
}
} // namespace

void install_crash_handlers() {
  std::signal(SIGSEGV, signal_handler);
  std::signal(SIGABRT, signal_handler);
  std::signal(SIGFPE, signal_handler);
  std::signal(SIGILL, signal_handler);
}

} // namespace revgate::log
