#include "ui/Formatting.hpp"
#include <cstdio>
#include <ctime>

namespace rcpu::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

int display_cols(const std::string& s){
  int cols = 0;
  for (size_t i=0; i<s.size();){
    // Skip ANSI escape sequences
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++; // skip final byte
      continue;
    }
    i += u8_len((unsigned char)s[i]);
    cols += 1;
  }
  return cols;
}

std::string pad_right(const std::string& s, int w) {
  int cols = display_cols(s);
  if (cols >= w) return s;
  return s + std::string(w - cols, ' ');
}

std::string pad_center(const std::string& s, int w) {
  int cols = display_cols(s);
  if (cols >= w) return s;
  int left = (w - cols) / 2;
  return std::string(left, ' ') + s + std::string(w - cols - left, ' ');
}

std::string format_clock(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm lt{};
  ::localtime_r(&t, &lt);
  char buf[16];
  if (std::strftime(buf, sizeof(buf), "%H:%M:%S", &lt) == 0) return std::string();
  return std::string(buf);
}

std::string format_pct(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f%%", v);
  return std::string(buf);
}

} // namespace rcpu::ui
