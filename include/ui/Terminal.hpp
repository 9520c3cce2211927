#pragma once

#include <atomic>
#include <cstddef>
#include <string>

namespace rcpu::ui {

// Set by SIGINT/SIGTERM; polled by the main thread.
extern std::atomic<bool> g_stop;

void restore_terminal_minimal();
void on_stop_signal(int);
void on_atexit_restore();

// Terminal capability detection
[[nodiscard]] bool tty_stdout();
[[nodiscard]] bool use_unicode();

// SGR code generation; empty strings when disabled
[[nodiscard]] std::string sgr(const char* code, bool enabled);
[[nodiscard]] std::string sgr_reset(bool enabled);

// Best-effort terminal write (async-signal-safe)
void best_effort_write(int fd, const char* buf, size_t len);

// Hides the cursor on a tty for the guard's lifetime
class CursorGuard {
  bool active_{false};
public:
  explicit CursorGuard(bool enable);
  ~CursorGuard();
};

} // namespace rcpu::ui
