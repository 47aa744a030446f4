#ifndef NORMA_CORE_FS_UTILS_HPP_
#define NORMA_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace norma::core {

namespace detail {

inline std::filesystem::path TempSiblingPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

inline bool EnsureDirectory(const std::filesystem::path& dir, std::string& error) {
  if (dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "failed to create output directory '" + dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

// Reads a whole input file (config, plan, corpus).
inline bool ReadTextFile(const std::filesystem::path& path, std::string& text,
                         std::string& error) {
  std::ifstream in_file(path, std::ios::binary);
  if (!in_file) {
    error = "unable to open file '" + path.string() + "'";
    return false;
  }
  std::ostringstream buffer;
  buffer << in_file.rdbuf();
  if (in_file.bad()) {
    error = "failed while reading file '" + path.string() + "'";
    return false;
  }
  text = buffer.str();
  return true;
}

// Snapshot files are written to a temporary sibling and renamed into place so
// a reader never sees a half-written session_state.json. When rename cannot
// overwrite, the destination is removed and the rename retried once.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }
  if (output_path.has_parent_path() && !EnsureDirectory(output_path.parent_path(), error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::TempSiblingPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }
    out_file << text;
    if (!out_file) {
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code remove_ec;
  (void)std::filesystem::remove(output_path, remove_ec);
  rename_ec.clear();
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

} // namespace norma::core

#endif // NORMA_CORE_FS_UTILS_HPP_
