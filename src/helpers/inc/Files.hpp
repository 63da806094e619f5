#ifndef IFSCAN_HELPERS_FILES_HPP
#define IFSCAN_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief Whole-file reads using C-style I/O (open/read/close).
 *
 * The descriptor is opened, drained and closed inside one call, so no file
 * handle outlives the read. Errors are reported through FileReadStatus.
 *
 * @note Cold-path: Grows a std::string to the file size.
 */

#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <sys/stat.h> // fstat, S_ISDIR
#include <unistd.h>   // read, close

#include <cerrno>
#include <cstddef>
#include <exception>
#include <string>

namespace ifscan {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Chunk size for each read() call.
inline constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;

/* ----------------------------- FileReadStatus ----------------------------- */

/**
 * @brief Outcome of readWholeFile().
 */
enum class FileReadStatus : unsigned char {
  OK = 0,
  OPEN_FAILED, ///< Path missing, not permitted, or a directory
  READ_FAILED, ///< read() failed after a successful open
};

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read an entire file into a string.
 * @param path File path to read.
 * @param out Receives the file contents (cleared first).
 * @param errNo Receives errno of the failing call (0 on success).
 * @return Status code; out is empty on failure.
 * @note Retries read() on EINTR.
 */
[[nodiscard]] inline FileReadStatus readWholeFile(const char* path, std::string& out,
                                                  int& errNo) noexcept {
  out.clear();
  errNo = 0;

  if (path == nullptr || path[0] == '\0') {
    errNo = ENOENT;
    return FileReadStatus::OPEN_FAILED;
  }

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    errNo = errno;
    return FileReadStatus::OPEN_FAILED;
  }

  struct stat st{};
  if (::fstat(FD, &st) == 0 && S_ISDIR(st.st_mode)) {
    ::close(FD);
    errNo = EISDIR;
    return FileReadStatus::OPEN_FAILED;
  }

  try {
    if (st.st_size > 0) {
      out.reserve(static_cast<std::size_t>(st.st_size));
    }

    char buf[READ_CHUNK_SIZE];
    for (;;) {
      const ssize_t N = ::read(FD, buf, sizeof(buf));
      if (N == 0) {
        break;
      }
      if (N < 0) {
        if (errno == EINTR) {
          continue;
        }
        errNo = errno;
        ::close(FD);
        out.clear();
        return FileReadStatus::READ_FAILED;
      }
      out.append(buf, static_cast<std::size_t>(N));
    }
  } catch (const std::exception&) {
    errNo = ENOMEM;
    ::close(FD);
    out.clear();
    return FileReadStatus::READ_FAILED;
  }

  ::close(FD);
  return FileReadStatus::OK;
}

} // namespace files
} // namespace helpers
} // namespace ifscan

#endif // IFSCAN_HELPERS_FILES_HPP
