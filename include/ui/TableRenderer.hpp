#pragma once

#include <array>
#include <cstddef>
#include <cstdio>
#include <deque>
#include <string>
#include "model/Cpu.hpp"

namespace rcpu::ui {

struct TableStyle {
  bool color{true};
  bool unicode{true};
  bool clear_screen{true};
  int max_rows{20};
};

// Rolling table of utilization samples, newest at the bottom.
class TableRenderer {
public:
  static constexpr size_t kColumns = 6;

  explicit TableRenderer(TableStyle style);

  void add(const rcpu::model::UtilizationSample& s);
  size_t rows() const { return rows_.size(); }

  // Whole table including borders and header, newline-terminated lines
  std::string render() const;

  // Single pipe-separated line for non-tty output
  static std::string plain_line(const rcpu::model::UtilizationSample& s);

  // add() then write either the redrawn table or a plain line
  void emit(const rcpu::model::UtilizationSample& s, std::FILE* out, bool table_mode);

private:
  using Row = std::array<std::string, kColumns>;
  static Row cells_for(const rcpu::model::UtilizationSample& s);

  TableStyle style_;
  std::deque<Row> rows_;
};

} // namespace rcpu::ui
