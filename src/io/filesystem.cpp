#include "fsgate/io/filesystem.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace fsgate::io {

namespace {

std::string errno_message() {
  const int err = errno;
  return err == 0 ? std::string("unknown error") : std::string(std::strerror(err));
}

bool is_valid_utf8(const std::string &text) {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    std::size_t extra = 0;
    std::uint32_t code_point = 0;
    if (lead < 0x80) {
      ++i;
      continue;
    }
    if ((lead & 0xE0) == 0xC0) {
      extra = 1;
      code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      extra = 2;
      code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      extra = 3;
      code_point = lead & 0x07;
    } else {
      return false;
    }
    if (extra >= text.size() - i) {
      return false;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      const auto cont = static_cast<unsigned char>(text[i + k]);
      if ((cont & 0xC0) != 0x80) {
        return false;
      }
      code_point = (code_point << 6) | (cont & 0x3F);
    }
    // Overlong forms, surrogates and values past U+10FFFF.
    if ((extra == 1 && code_point < 0x80) || (extra == 2 && code_point < 0x800) ||
        (extra == 3 && code_point < 0x10000) || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

} // namespace

common::Status LocalFileSystem::write(const std::filesystem::path &path,
                                      const std::string_view bytes) {
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC, 0644);
  if (fd < 0) {
    return common::Status::error(common::ErrorCode::IoFailure,
                                 path.string() + ": " + errno_message());
  }

  std::size_t offset = 0;
  while (offset < bytes.size()) {
    const ssize_t n = ::write(fd, bytes.data() + offset, bytes.size() - offset);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      const std::string message = errno_message();
      ::close(fd);
      return common::Status::error(common::ErrorCode::IoFailure, path.string() + ": " + message);
    }
    offset += static_cast<std::size_t>(n);
  }

  if (::close(fd) != 0) {
    return common::Status::error(common::ErrorCode::IoFailure,
                                 path.string() + ": " + errno_message());
  }
  return common::Status::success();
}

common::Result<std::string> LocalFileSystem::read_to_string(const std::filesystem::path &path) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    return common::Result<std::string>::failure(common::ErrorCode::IoFailure,
                                                path.string() + ": Is a directory");
  }

  errno = 0;
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return common::Result<std::string>::failure(common::ErrorCode::IoFailure,
                                                path.string() + ": " + errno_message());
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return common::Result<std::string>::failure(common::ErrorCode::IoFailure,
                                                path.string() + ": read failed");
  }
  std::string content = buffer.str();
  if (!is_valid_utf8(content)) {
    return common::Result<std::string>::failure(common::ErrorCode::IoFailure,
                                                "stream did not contain valid UTF-8");
  }
  return common::Result<std::string>::success(std::move(content));
}

common::Result<std::uint64_t> LocalFileSystem::file_size(const std::filesystem::path &path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    return common::Result<std::uint64_t>::failure(common::ErrorCode::IoFailure,
                                                  path.string() + ": " + ec.message());
  }
  return common::Result<std::uint64_t>::success(static_cast<std::uint64_t>(size));
}

common::Result<std::filesystem::path>
LocalFileSystem::canonicalize(const std::filesystem::path &path) {
  std::error_code ec;
  auto canonical = std::filesystem::canonical(path, ec);
  if (ec) {
    return common::Result<std::filesystem::path>::failure(common::ErrorCode::IoFailure,
                                                          path.string() + ": " + ec.message());
  }
  return common::Result<std::filesystem::path>::success(std::move(canonical));
}

bool LocalFileSystem::is_directory(const std::filesystem::path &path) {
  std::error_code ec;
  return std::filesystem::is_directory(path, ec);
}

bool LocalFileSystem::is_symlink(const std::filesystem::path &path) {
  std::error_code ec;
  return std::filesystem::is_symlink(std::filesystem::symlink_status(path, ec));
}

} // namespace fsgate::io
