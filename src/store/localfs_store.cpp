#include "iolat/store/store.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <format>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "iolat/core/error.hpp"

namespace iolat {
namespace {

constexpr size_t kReadChunk = 64 * 1024;

ErrorCode code_for_errno(int err) {
  return err == ENOENT ? ErrorCode::NotFound : ErrorCode::IoError;
}

[[noreturn]] void throw_errno(const char* op, const std::string& key, int err) {
  throw BackendError{code_for_errno(err), op, key, std::strerror(err)};
}

// Closes the descriptor on scope exit unless release() was called.
class ScopedFd {
 public:
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  int get() const noexcept { return fd_; }
  int release() noexcept { return std::exchange(fd_, -1); }

 private:
  int fd_{-1};
};

void close_checked(ScopedFd& fd, const char* op, const std::string& key) {
  if (::close(fd.release()) != 0) {
    throw_errno(op, key, errno);
  }
}

class LocalFsHandler final : public IStoreHandler {
 public:
  void write(const std::string& key, std::string_view value) const override {
    ScopedFd fd{::open(key.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644)};
    if (fd.get() < 0) {
      throw_errno("create", key, errno);
    }

    size_t done = 0;
    while (done < value.size()) {
      const ssize_t n = ::write(fd.get(), value.data() + done, value.size() - done);
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        throw_errno("write", key, errno);
      }
      done += static_cast<size_t>(n);
    }
    close_checked(fd, "write", key);
  }

  std::string read(const std::string& key) const override {
    ScopedFd fd{::open(key.c_str(), O_RDONLY | O_CLOEXEC)};
    if (fd.get() < 0) {
      throw_errno("open", key, errno);
    }

    std::string out;
    struct stat st {};
    if (::fstat(fd.get(), &st) == 0 && st.st_size > 0) {
      out.reserve(static_cast<size_t>(st.st_size));
    }

    char buf[kReadChunk];
    for (;;) {
      const ssize_t n = ::read(fd.get(), buf, sizeof(buf));
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        throw_errno("read", key, errno);
      }
      if (n == 0) {
        break;
      }
      out.append(buf, static_cast<size_t>(n));
    }
    close_checked(fd, "read", key);
    return out;
  }

  void remove(const std::string& key) const override {
    if (::unlink(key.c_str()) != 0) {
      throw_errno("delete", key, errno);
    }
  }
};

class LocalFsClient final : public IStoreClient {
 public:
  explicit LocalFsClient(const StoreConfig& cfg)
      : prefix_((std::filesystem::path(cfg.root_dir) /
                 std::format("iolat_{}", static_cast<long>(::getpid())))
                    .string() +
                "/"),
        handler_(std::make_shared<LocalFsHandler>()) {}

  StoreKind kind() const noexcept override { return StoreKind::LocalFs; }

  std::string describe() const override { return std::format("localfs prefix={}", prefix_); }

  void init() override {
    std::error_code ec;
    std::filesystem::create_directories(prefix_, ec);
    if (ec) {
      throw Error{ErrorCode::IoError,
                  std::format("create directory failed: {}: {}", prefix_, ec.message())};
    }
  }

  std::string gen_unique_key() override { return prefix_ + std::to_string(next_id_++); }

  std::shared_ptr<const IStoreHandler> handler() const override { return handler_; }

 private:
  std::string prefix_;
  uint64_t next_id_{0};
  std::shared_ptr<const LocalFsHandler> handler_;
};

}  // namespace

std::unique_ptr<IStoreClient> make_localfs_store(const StoreConfig& cfg) {
  if (cfg.root_dir.empty()) {
    throw Error{ErrorCode::InvalidArgument, "localfs root directory must not be empty"};
  }
  return std::make_unique<LocalFsClient>(cfg);
}

std::unique_ptr<IStoreClient> make_store(const StoreConfig& cfg) {
  switch (cfg.kind) {
    case StoreKind::LocalFs:
      return make_localfs_store(cfg);
  }
  throw Error{ErrorCode::InvalidArgument, "unsupported store kind"};
}

}  // namespace iolat
