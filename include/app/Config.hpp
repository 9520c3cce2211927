#pragma once

#include <string>
#include <vector>

namespace rcpu::app {

struct Config {
  struct Sampling {
    int interval_ms{1000};
    int channel_capacity{64};
    bool skip_on_integrity_error{true};
  } sampling;

  struct Gate {
    bool require_intel{true};
    bool require_smt{true};
  } gate;

  struct Ui {
    int max_rows{20};
    bool color{true};
    bool clear_screen{true};
  } ui;

  struct Log {
    bool quiet{false};
  } log;

  std::string source_path;    // TOML file that was loaded, empty if none
  std::vector<int> bad_lines; // unparseable lines in that file
};

// Environment variable helpers (RCPU_X and rcpu_x spellings)
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
bool env_flag(const char* name, bool defv);

// $XDG_CONFIG_HOME/rcpu/config.toml, else ~/.config/rcpu/config.toml
std::string config_file_path();

// Resolve every key TOML -> env -> compiled default, then clamp.
// path_override replaces the default file location when non-empty.
Config load_config(const std::string& path_override = {});

} // namespace rcpu::app
