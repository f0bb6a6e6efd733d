#ifndef PICAM_CORE_FS_UTILS_HPP_
#define PICAM_CORE_FS_UTILS_HPP_

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace picam::core {

namespace detail {

// "<name>.partial.<pid>.<n>" beside the target, so the final rename never
// crosses a filesystem and two captures in one process never collide.
inline std::filesystem::path PartialCapturePath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const std::uint64_t n = counter.fetch_add(1U, std::memory_order_relaxed);
  std::filesystem::path partial = output_path;
  partial += ".partial." + std::to_string(::getpid()) + "." + std::to_string(n);
  return partial;
}

} // namespace detail

// Creates the directory that will hold a capture file. A bare file name
// needs nothing.
inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path capture_dir = output_path.parent_path();
  if (capture_dir.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(capture_dir, ec);
  if (ec) {
    error = "cannot create capture directory '" + capture_dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

// Publishes captured image bytes at `output_path`. Readers of the path see
// either the previous image or the complete new one, never a truncated
// frame; the partial file is removed when anything fails.
inline bool WriteBinaryFileAtomic(const std::filesystem::path& output_path,
                                  const std::vector<std::uint8_t>& bytes, std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path partial_path = detail::PartialCapturePath(output_path);
  std::error_code cleanup_ec;

  std::ofstream image_file(partial_path, std::ios::binary | std::ios::trunc);
  if (!image_file) {
    error = "cannot open '" + partial_path.string() + "' for the captured image";
    return false;
  }
  image_file.write(reinterpret_cast<const char*>(bytes.data()),
                   static_cast<std::streamsize>(bytes.size()));
  image_file.close();
  if (!image_file) {
    (void)std::filesystem::remove(partial_path, cleanup_ec);
    error = "short write of " + std::to_string(bytes.size()) + " image bytes to '" +
            partial_path.string() + "'";
    return false;
  }

  // rename(2) replaces an existing image in one step on POSIX.
  std::error_code rename_ec;
  std::filesystem::rename(partial_path, output_path, rename_ec);
  if (rename_ec) {
    (void)std::filesystem::remove(partial_path, cleanup_ec);
    error = "cannot publish image '" + output_path.string() + "': " + rename_ec.message();
    return false;
  }
  return true;
}

} // namespace picam::core

#endif // PICAM_CORE_FS_UTILS_HPP_
