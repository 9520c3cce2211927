#include "app/Config.hpp"
#include "util/TomlReader.hpp"

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <string>

namespace rcpu::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("RCPU_", 0) == 0) {
    alt = std::string("rcpu_") + n.substr(5);
  } else if (n.rfind("rcpu_", 0) == 0) {
    alt = std::string("RCPU_") + n.substr(5);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/rcpu/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/rcpu/config.toml";
  return {};
}

static int resolve_int(const rcpu::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  return getenv_int(env_name, def);
}

static bool resolve_bool(const rcpu::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  return env_flag(env_name, def);
}

Config load_config(const std::string& path_override) {
  Config c{};
  rcpu::util::TomlReader toml;
  auto path = path_override.empty() ? config_file_path() : path_override;
  bool have_toml = !path.empty() && toml.load(path);
  if (have_toml) {
    c.source_path = path;
    c.bad_lines = toml.bad_lines();
  }

  // --- [sampling] ---
  c.sampling.interval_ms      = resolve_int(toml, have_toml, "sampling", "interval_ms",      "RCPU_INTERVAL_MS", 1000);
  c.sampling.channel_capacity = resolve_int(toml, have_toml, "sampling", "channel_capacity", "RCPU_CHANNEL_CAPACITY", 64);
  c.sampling.skip_on_integrity_error =
      resolve_bool(toml, have_toml, "sampling", "skip_on_integrity_error", "RCPU_SKIP_ON_INTEGRITY_ERROR", true);

  // --- [gate] ---
  c.gate.require_intel = resolve_bool(toml, have_toml, "gate", "require_intel", "RCPU_REQUIRE_INTEL", true);
  c.gate.require_smt   = resolve_bool(toml, have_toml, "gate", "require_smt",   "RCPU_REQUIRE_SMT", true);

  // --- [ui] ---
  c.ui.max_rows     = resolve_int(toml, have_toml, "ui", "max_rows",     "RCPU_MAX_ROWS", 20);
  c.ui.color        = resolve_bool(toml, have_toml, "ui", "color",        "RCPU_COLOR", true);
  c.ui.clear_screen = resolve_bool(toml, have_toml, "ui", "clear_screen", "RCPU_CLEAR_SCREEN", true);

  // --- [log] ---
  c.log.quiet = resolve_bool(toml, have_toml, "log", "quiet", "RCPU_LOG_QUIET", false);

  c.sampling.interval_ms      = std::clamp(c.sampling.interval_ms, 50, 60000);
  c.sampling.channel_capacity = std::clamp(c.sampling.channel_capacity, 2, 4096);
  c.ui.max_rows               = std::clamp(c.ui.max_rows, 1, 1000);
  return c;
}

} // namespace rcpu::app
