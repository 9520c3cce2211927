#include "ui/TableRenderer.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include <algorithm>

namespace rcpu::ui {

static constexpr const char* kHeaders[TableRenderer::kColumns] = {
  "Time", "Avg CPU Usage", "Adjusted CPU Usage", "Avg Remaining CPU", "RCPU", "Difference"
};

// SGR per column: naive yellow, adjusted green, difference bold red
static constexpr const char* kColors[TableRenderer::kColumns] = {
  nullptr, "33", "32", "33", "32", "1;31"
};

static std::string repeat_str(const std::string& ch, int n){
  std::string r;
  r.reserve(std::max(0, n * (int)ch.size()));
  for (int i=0;i<n;i++) r += ch;
  return r;
}

TableRenderer::TableRenderer(TableStyle style) : style_(style) {
  if (style_.max_rows < 1) style_.max_rows = 1;
}

TableRenderer::Row TableRenderer::cells_for(const rcpu::model::UtilizationSample& s) {
  return Row{
    format_clock(s.timestamp),
    format_pct(s.naive_usage_pct),
    format_pct(s.adjusted_usage_pct),
    format_pct(s.naive_remaining_pct),
    format_pct(s.adjusted_remaining_pct),
    format_pct(s.difference_pct),
  };
}

void TableRenderer::add(const rcpu::model::UtilizationSample& s) {
  rows_.push_back(cells_for(s));
  while ((int)rows_.size() > style_.max_rows) rows_.pop_front();
}

std::string TableRenderer::render() const {
  const bool uni = style_.unicode;
  const std::string H  = uni ? "─" : "-";
  const std::string V  = uni ? "│" : "|";
  const std::string TL = uni ? "╭" : "+", TM = uni ? "┬" : "+", TR = uni ? "╮" : "+";
  const std::string ML = uni ? "├" : "+", MM = uni ? "┼" : "+", MR = uni ? "┤" : "+";
  const std::string BL = uni ? "╰" : "+", BM = uni ? "┴" : "+", BR = uni ? "╯" : "+";
  const std::string border = sgr("34", style_.color);
  const std::string reset = sgr_reset(style_.color);

  std::array<int, kColumns> w{};
  for (size_t c = 0; c < kColumns; ++c) {
    w[c] = display_cols(kHeaders[c]);
    for (const auto& r : rows_) w[c] = std::max(w[c], display_cols(r[c]));
    w[c] += 2; // one space each side
  }

  auto rule = [&](const std::string& l, const std::string& m, const std::string& r) {
    std::string out = border + l;
    for (size_t c = 0; c < kColumns; ++c) {
      out += repeat_str(H, w[c]);
      out += (c + 1 < kColumns) ? m : r;
    }
    return out + reset + "\n";
  };

  std::string out;
  out += rule(TL, TM, TR);
  out += border + V + reset;
  for (size_t c = 0; c < kColumns; ++c) {
    std::string cell = (c == 0) ? pad_right(std::string(" ") + kHeaders[c], w[c]) : pad_center(kHeaders[c], w[c]);
    out += sgr("1", style_.color) + cell + reset + border + V + reset;
  }
  out += "\n";
  out += rule(ML, MM, MR);
  for (const auto& r : rows_) {
    out += border + V + reset;
    for (size_t c = 0; c < kColumns; ++c) {
      std::string cell = (c == 0) ? pad_right(" " + r[c], w[c]) : pad_center(r[c], w[c]);
      if (kColors[c]) cell = sgr(kColors[c], style_.color) + cell + reset;
      out += cell + border + V + reset;
    }
    out += "\n";
  }
  out += rule(BL, BM, BR);
  return out;
}

std::string TableRenderer::plain_line(const rcpu::model::UtilizationSample& s) {
  auto r = cells_for(s);
  std::string out;
  for (size_t c = 0; c < kColumns; ++c) {
    if (c) out += " | ";
    if (c) { out += kHeaders[c]; out += ' '; }
    out += r[c];
  }
  return out + "\n";
}

void TableRenderer::emit(const rcpu::model::UtilizationSample& s, std::FILE* out, bool table_mode) {
  add(s);
  std::string text;
  if (table_mode) {
    if (style_.clear_screen) text = "\x1B[H\x1B[2J";
    text += render();
  } else {
    text = plain_line(s);
  }
  std::fwrite(text.data(), 1, text.size(), out);
  std::fflush(out);
}

} // namespace rcpu::ui
