#ifndef CAMSCOUT_CORE_FS_UTILS_HPP_
#define CAMSCOUT_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace camscout::core {

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

// Reads a whole regular file. Missing, non-regular or unreadable paths fail
// with a message naming the path.
inline bool ReadTextFile(const std::filesystem::path& path, std::string& contents,
                         std::string& error) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec) || ec) {
    error = "file not found or not a regular file: " + path.string();
    return false;
  }
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to open file: " + path.string();
    return false;
  }
  contents.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
  if (input.bad()) {
    error = "failed while reading file: " + path.string();
    return false;
  }
  return true;
}

// Writes `text` to a unique sibling temp file, then renames it over
// `output_path`, so readers of artifacts such as `cameras.json` never see a
// half-written file.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  const std::filesystem::path parent_dir = output_path.parent_path();
  if (!parent_dir.empty() && !EnsureDirectory(parent_dir, error)) {
    return false;
  }

  static std::atomic<std::uint64_t> counter{0};
  const std::filesystem::path temp_path =
      output_path.string() + ".tmp." +
      std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "." +
      std::to_string(counter.fetch_add(1U, std::memory_order_relaxed));
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

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

} // namespace camscout::core

#endif // CAMSCOUT_CORE_FS_UTILS_HPP_
