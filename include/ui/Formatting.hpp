#pragma once

#include <chrono>
#include <string>

namespace rcpu::ui {

// UTF-8 text width utilities (ANSI escapes take no columns)
int u8_len(unsigned char c);
int display_cols(const std::string& s);

// Pad to w columns; never truncates
std::string pad_right(const std::string& s, int w);
std::string pad_center(const std::string& s, int w);

// Local wall-clock time as HH:MM:SS
std::string format_clock(std::chrono::system_clock::time_point tp);

// Two decimals and a percent sign, e.g. "42.17%"
std::string format_pct(double v);

} // namespace rcpu::ui
