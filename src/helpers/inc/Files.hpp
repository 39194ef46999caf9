#ifndef MODSCOUT_HELPERS_FILES_HPP
#define MODSCOUT_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief Whole-file reads and path utilities.
 *
 * Reads go through open/read/close with O_CLOEXEC. Kernel images can be
 * hundreds of MiB, so the byte reader sizes its buffer from fstat() and
 * falls back to growing reads for files whose size is not known up front
 * (procfs reports 0).
 */

#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <sys/stat.h> // stat, fstat, S_ISDIR, S_ISREG
#include <unistd.h>   // read, close

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring> // strerror
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace modscout {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Read chunk used when the file size is unknown.
inline constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;

/* ----------------------------- Internal ----------------------------- */

namespace detail {

/// Read an open descriptor to EOF, appending to out. Returns errno or 0.
template <typename Buffer> [[nodiscard]] int readAll(int fd, Buffer& out) {
  struct stat st{};
  if (::fstat(fd, &st) == 0 && S_ISREG(st.st_mode) && st.st_size > 0) {
    out.reserve(static_cast<std::size_t>(st.st_size) + 1);
  }

  std::size_t total = out.size();
  for (;;) {
    if (out.size() - total < READ_CHUNK_SIZE) {
      out.resize(total + READ_CHUNK_SIZE);
    }
    const ssize_t N = ::read(fd, out.data() + total, out.size() - total);
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      const int ERR = errno;
      out.resize(total);
      return ERR;
    }
    if (N == 0) {
      break;
    }
    total += static_cast<std::size_t>(N);
  }
  out.resize(total);
  return 0;
}

template <typename Buffer>
[[nodiscard]] bool readFileInto(const std::string& path, Buffer& out, std::string& error) {
  out.clear();
  const int FD = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    error = fmt::format("cannot open '{}': {}", path, std::strerror(errno));
    return false;
  }

  const int ERR = readAll(FD, out);
  ::close(FD);
  if (ERR != 0) {
    error = fmt::format("cannot read '{}': {}", path, std::strerror(ERR));
    out.clear();
    return false;
  }
  return true;
}

} // namespace detail

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read an entire file as bytes.
 * @param path File to read.
 * @param out Receives the contents (cleared first).
 * @param error Set to "cannot open/read '<path>': <reason>" on failure.
 * @return true on success.
 * @note Allocates. Not RT-safe.
 */
[[nodiscard]] inline bool readFileBytes(const std::string& path, std::vector<std::uint8_t>& out,
                                        std::string& error) {
  return detail::readFileInto(path, out, error);
}

/**
 * @brief Read an entire file as text. Contents are not modified.
 * @note Allocates. Not RT-safe.
 */
[[nodiscard]] inline bool readFileText(const std::string& path, std::string& out,
                                       std::string& error) {
  return detail::readFileInto(path, out, error);
}

/* ----------------------------- Path Utilities ----------------------------- */

/// @brief Final path component ("a/b/c.ko" -> "c.ko"). Trailing slashes are ignored.
[[nodiscard]] inline std::string_view baseName(std::string_view path) noexcept {
  while (path.size() > 1 && path.back() == '/') {
    path.remove_suffix(1);
  }
  const std::size_t POS = path.rfind('/');
  return (POS == std::string_view::npos) ? path : path.substr(POS + 1);
}

/// @brief True if path exists and is a directory.
[[nodiscard]] inline bool isDirectory(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  struct stat st{};
  if (::stat(path, &st) != 0) {
    return false;
  }
  return S_ISDIR(st.st_mode);
}

/// @brief True if path exists and is a regular file (symlinks followed).
[[nodiscard]] inline bool isRegularFile(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  struct stat st{};
  if (::stat(path, &st) != 0) {
    return false;
  }
  return S_ISREG(st.st_mode);
}

} // namespace files
} // namespace helpers
} // namespace modscout

#endif // MODSCOUT_HELPERS_FILES_HPP
