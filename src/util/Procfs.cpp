#include "util/Procfs.hpp"

#include <sys/types.h>
#include <dirent.h>

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace rcpu::util {

static std::string env_root(const char* name) {
  const char* env = std::getenv(name);
  if (env && *env) return std::string(env);
  return std::string();
}

static std::string remap(const std::string& abs, const char* prefix, const char* env_name) {
  if (abs.rfind(prefix, 0) != 0) return abs;
  auto root = env_root(env_name);
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

static std::string map_any(const std::string& abs) {
  if (abs.rfind("/sys", 0) == 0) return map_sys_path(abs);
  return map_proc_path(abs);
}

auto map_proc_path(const std::string& abs) -> std::string {
  return remap(abs, "/proc", "RCPU_PROC_ROOT");
}

auto map_sys_path(const std::string& abs) -> std::string {
  return remap(abs, "/sys", "RCPU_SYS_ROOT");
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_any(abs));
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  // procfs files can vanish between open and read
  if (in.bad()) return std::nullopt;
  return s;
}

auto read_file_int(const std::string& abs) -> std::optional<int64_t> {
  auto txt = read_file_string(abs);
  if (!txt) return std::nullopt;
  const char* b = txt->data();
  const char* e = b + txt->size();
  while (b < e && (*b == ' ' || *b == '\t')) ++b;
  int64_t v = 0;
  auto [ptr, ec] = std::from_chars(b, e, v);
  if (ec != std::errc() || ptr == b) return std::nullopt;
  return v;
}

auto list_dir(const std::string& abs) -> std::vector<std::string> {
  std::vector<std::string> out;
  auto path = map_any(abs);
  DIR* d = ::opendir(path.c_str());
  if (!d) return out;
  while (auto* ent = ::readdir(d)) {
    const char* name = ent->d_name;
    if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
    out.emplace_back(name);
  }
  ::closedir(d);
  return out;
}

} // namespace rcpu::util
