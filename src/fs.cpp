#include "rnoecfg/fs.hpp"

#include "rnoecfg/consts.hpp"
#include "rnoecfg/error.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace stdfs = std::filesystem;

namespace {

using rnoecfg::ConfigError;
using rnoecfg::ErrorKind;

[[noreturn]] void io_failure(const std::string &what, int err) {
  throw ConfigError(ErrorKind::IoFailure, what + ": " + std::strerror(err));
}

// Temp file beside the target so the final rename stays on one filesystem.
// Unlinked on destruction unless renamed into place.
class TempFile {
public:
  explicit TempFile(const stdfs::path &target) {
    const std::string name =
        "." + target.filename().string() + std::string(rnoecfg::consts::kTempSuffix);
    const std::string tmpl = (target.parent_path() / name).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    fd_ = ::mkstemp(buf.data());
    if (fd_ < 0) {
      io_failure("create temp for " + target.string() + " failed", errno);
    }
    path_ = buf.data();
  }

  TempFile(const TempFile &) = delete;
  TempFile &operator=(const TempFile &) = delete;

  ~TempFile() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    if (!committed_) {
      std::error_code ec;
      stdfs::remove(path_, ec);
    }
  }

  void write_all(std::string_view data) {
    const char *p = data.data();
    std::size_t left = data.size();
    while (left > 0) {
      const ssize_t n = ::write(fd_, p, left);
      if (n < 0) {
        if (errno == EINTR)
          continue;
        io_failure("write temp failed: " + path_.string(), errno);
      }
      p += n;
      left -= static_cast<std::size_t>(n);
    }
  }

  void finish(stdfs::perms mode) {
    if (::fchmod(fd_, static_cast<mode_t>(mode)) != 0) {
      io_failure("chmod temp failed: " + path_.string(), errno);
    }
    if (::fsync(fd_) != 0) {
      io_failure("fsync temp failed: " + path_.string(), errno);
    }
    const int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
      io_failure("close temp failed: " + path_.string(), errno);
    }
  }

  void commit_to(const stdfs::path &target) {
    std::error_code ec;
    stdfs::rename(path_, target, ec);
    if (ec) {
      throw ConfigError(ErrorKind::IoFailure,
                        "atomic replace failed: " + target.string() + ": " + ec.message());
    }
    committed_ = true;
  }

private:
  stdfs::path path_;
  int fd_ = -1;
  bool committed_ = false;
};

} // namespace

namespace rnoecfg::fs {

bool exists(const stdfs::path &p) {
  std::error_code ec;
  return stdfs::exists(p, ec);
}

void ensure_parent_dir(const stdfs::path &p) {
  if (p.parent_path().empty())
    return;
  std::error_code ec;
  stdfs::create_directories(p.parent_path(), ec);
  if (ec)
    throw ConfigError(ErrorKind::IoFailure, "mkdir -p failed: " + ec.message());
}

std::string read_file(const stdfs::path &p) {
  std::error_code ec;
  const auto st = stdfs::status(p, ec);
  if (st.type() == stdfs::file_type::not_found) {
    throw ConfigError(ErrorKind::NotFound, "config file not found: " + p.string());
  }
  if (ec) {
    throw ConfigError(ErrorKind::IoFailure, "stat failed: " + p.string() + ": " + ec.message());
  }
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw ConfigError(ErrorKind::IoFailure, "open for read failed: " + p.string());
  }
  std::string text{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
  if (ifs.bad()) {
    throw ConfigError(ErrorKind::IoFailure, "read failed: " + p.string());
  }
  return text;
}

void write_file_atomic(const stdfs::path &p, std::string_view data, stdfs::perms mode) {
  ensure_parent_dir(p);
  TempFile tmp{p};
  tmp.write_all(data);
  tmp.finish(mode);
  tmp.commit_to(p);
}

} // namespace rnoecfg::fs
