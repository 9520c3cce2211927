#include "ui/Terminal.hpp"
#include <unistd.h>
#include <termios.h>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace rcpu::ui {

std::atomic<bool> g_stop{false};
static std::atomic<bool> g_cursor_hidden{false};

void best_effort_write(int fd, const char* buf, size_t len) {
  if (len == 0) return;
  if (::write(fd, buf, len) < 0) { /* nothing useful to do from a signal context */ }
}

void restore_terminal_minimal() {
  // Async-signal-safe: show cursor, reset SGR
  const char* show_cur = "\x1B[?25h";
  const char* reset = "\x1B[0m";
  if (!g_cursor_hidden.load()) return;
  best_effort_write(STDOUT_FILENO, show_cur, std::char_traits<char>::length(show_cur));
  best_effort_write(STDOUT_FILENO, reset, std::char_traits<char>::length(reset));
}

void on_stop_signal(int) { g_stop.store(true); }

void on_atexit_restore() {
  std::fflush(stdout);
  restore_terminal_minimal();
  if (::isatty(STDOUT_FILENO) == 1) {
    tcdrain(STDOUT_FILENO);
  }
}

bool tty_stdout() {
  return ::isatty(STDOUT_FILENO) == 1;
}

bool use_unicode() {
  const char* lc = std::getenv("LC_ALL");
  if (!lc || !*lc) lc = std::getenv("LC_CTYPE");
  if (!lc || !*lc) lc = std::getenv("LANG");
  if (!lc || !*lc) return false;
  std::string s = lc;
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s.find("utf-8") != std::string::npos || s.find("utf8") != std::string::npos;
}

std::string sgr(const char* code, bool enabled) {
  if (!enabled) return {};
  return std::string("\x1B[") + code + "m";
}

std::string sgr_reset(bool enabled) {
  if (!enabled) return {};
  return std::string("\x1B[0m");
}

CursorGuard::CursorGuard(bool enable) {
  if (enable && tty_stdout()) {
    best_effort_write(STDOUT_FILENO, "\x1B[?25l", 6);
    g_cursor_hidden.store(true);
    active_ = true;
  }
}

CursorGuard::~CursorGuard() {
  if (active_) {
    best_effort_write(STDOUT_FILENO, "\x1B[?25h", 6);
    g_cursor_hidden.store(false);
  }
}

} // namespace rcpu::ui
