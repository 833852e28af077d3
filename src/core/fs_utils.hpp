#ifndef NETSTACK_CORE_FS_UTILS_HPP_
#define NETSTACK_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace netstack::core {

namespace detail {

// Hidden sibling in the same directory, so the final rename never crosses a
// filesystem boundary: `dir/.name.partial-<tick>-<seq>`.
inline std::filesystem::path PartialSiblingFor(const std::filesystem::path& target) {
  static std::atomic<std::uint64_t> sequence{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream name;
  name << '.' << target.filename().string() << ".partial-" << tick << '-'
       << sequence.fetch_add(1U, std::memory_order_relaxed);
  return target.parent_path() / name.str();
}

inline bool CreateParentDirs(const std::filesystem::path& target, std::string& error) {
  const std::filesystem::path dir = target.parent_path();
  if (dir.empty()) {
    return true;
  }
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "cannot create directory " + dir.string() + ": " + ec.message();
    return false;
  }
  return true;
}

} // namespace detail

inline bool ReadTextFile(const std::filesystem::path& path, std::string& contents,
                         std::string& error) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    error = "cannot open " + path.string() + " for reading";
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    error = "read error on " + path.string();
    return false;
  }
  contents = buffer.str();
  return true;
}

// Readers of `path` see either its previous contents or all of `text`, never
// a torn write. Missing parent directories are created.
inline bool WriteTextFileAtomic(const std::filesystem::path& path, std::string_view text,
                                std::string& error) {
  if (path.empty() || path.filename().empty()) {
    error = "output path must name a file";
    return false;
  }
  if (!detail::CreateParentDirs(path, error)) {
    return false;
  }

  const std::filesystem::path partial = detail::PartialSiblingFor(path);
  std::ofstream out(partial, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    error = "cannot open " + partial.string() + " for writing";
    return false;
  }
  out.write(text.data(), static_cast<std::streamsize>(text.size()));
  out.close();

  std::error_code ec;
  if (out.fail()) {
    error = "write error on " + partial.string();
    std::filesystem::remove(partial, ec);
    return false;
  }

  std::filesystem::rename(partial, path, ec);
  if (ec) {
    error = "cannot replace " + path.string() + ": " + ec.message();
    std::error_code ignored;
    std::filesystem::remove(partial, ignored);
    return false;
  }
  return true;
}

} // namespace netstack::core

#endif // NETSTACK_CORE_FS_UTILS_HPP_
