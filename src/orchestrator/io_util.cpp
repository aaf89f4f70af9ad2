#include "gv/orchestrator/io_util.h"

#include "gv/common.h"
#include "gv/encoding.h"
#include "gv/crypto/random.h"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <type_traits>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace gv::orchestrator {
namespace {

constexpr const char* kAtomicReplaceErrorMessage = "Atomic file replace failed";

class ErrorContext {
 public:
  void Push(std::string context) { context_stack_.push_back(std::move(context)); }
  void Pop() {
    if (!context_stack_.empty()) {
      context_stack_.pop_back();
    }
  }
  [[nodiscard]] std::vector<std::string> Stack() const { return context_stack_; }
  [[nodiscard]] std::string Format(std::string_view message) const {
    std::ostringstream oss;
    oss << message;
    for (auto it = context_stack_.rbegin(); it != context_stack_.rend(); ++it) {
      oss << "\n  while: " << *it;
    }
    return oss.str();
  }

 private:
  std::vector<std::string> context_stack_;
};

class ScopedErrorContext {
 public:
  ScopedErrorContext(ErrorContext& ctx, std::string description) : ctx_(ctx) {
    ctx_.Push(std::move(description));
  }
  ScopedErrorContext(const ScopedErrorContext&) = delete;
  ScopedErrorContext& operator=(const ScopedErrorContext&) = delete;
  ~ScopedErrorContext() { ctx_.Pop(); }

 private:
  ErrorContext& ctx_;
};

gv::Retryability ClassifyNativeError(int native) {
  switch (native) {
    case EINTR:
    case EAGAIN:
#if defined(EWOULDBLOCK) && EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
      return gv::Retryability::kRetryable;
    case EBUSY:
    case ETIMEDOUT:
      return gv::Retryability::kTransient;
    default:
      break;
  }
  return gv::Retryability::kFatal;
}

[[noreturn]] void ThrowIoError(const ErrorContext& ctx, int code, std::string message,
                               std::optional<int> native = std::nullopt,
                               gv::Retryability retry = gv::Retryability::kFatal) {
  throw Error{ErrorDomain::IO, code, ctx.Format(std::move(message)), native, retry, ctx.Stack()};
}

// errno-carrying failure of one atomic replace step.
[[noreturn]] void ThrowErrno(const ErrorContext& ctx, int code, std::string_view step, int native) {
  ThrowIoError(ctx, code, std::string(kAtomicReplaceErrorMessage) + ": " + std::string(step), native,
               ClassifyNativeError(native));
}

Error AugmentError(const Error& err, const ErrorContext& ctx) {
  auto merged = err.context;
  auto stack = ctx.Stack();
  merged.insert(merged.end(), stack.begin(), stack.end());
  return Error{err.domain, err.code, ctx.Format(err.what()), err.native_code, err.retryability,
               std::move(merged)};
}

[[noreturn]] void RethrowSystemError(const std::system_error& sys_err, const ErrorContext& ctx) {
  throw Error{ErrorDomain::IO,
              errors::io::kWriteFailed,
              ctx.Format(sys_err.what()),
              sys_err.code().value(),
              ClassifyNativeError(sys_err.code().value()),
              ctx.Stack()};
}

template <typename Func>
auto WithContext(ErrorContext& ctx, std::string description, Func&& fn)
    -> std::invoke_result_t<Func&> {
  ScopedErrorContext scoped(ctx, std::move(description));
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Func&>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const Error& err) {
    if (err.context.empty()) {
      throw AugmentError(err, ctx);
    }
    throw;
  } catch (const std::system_error& sys_err) {
    RethrowSystemError(sys_err, ctx);
  }
}

void SyncDirectory(const std::filesystem::path& dir, const ErrorContext& ctx) {
  int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dir_fd < 0) {
    ThrowErrno(ctx, errors::io::kOpenFailed, "open directory failed", errno);
  }
  if (::fsync(dir_fd) != 0) {
    const int err = errno;
    ::close(dir_fd);
    ThrowErrno(ctx, errors::io::kWriteFailed, "directory flush failed", err);
  }
  ::close(dir_fd);
}

void SyncFileWithRetry(int fd, const ErrorContext& ctx) {
  constexpr int kMaxRetries = 4;
  std::chrono::milliseconds backoff{5};
  for (int attempt = 0;; ++attempt) {
    if (::fsync(fd) == 0) {
      return;
    }
    const int saved_errno = errno;
    if (saved_errno == EINTR) {
      continue;
    }
    if (attempt >= kMaxRetries || (saved_errno != EAGAIN && saved_errno != EBUSY)) {
      ThrowErrno(ctx, errors::io::kWriteFailed, "fsync failed", saved_errno);
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

void WriteAll(int fd, std::span<const uint8_t> payload, const ErrorContext& ctx) {
  size_t written = 0;
  while (written < payload.size()) {
    auto chunk = ::write(fd, payload.data() + written, payload.size() - written);
    if (chunk < 0) {
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      ThrowErrno(ctx, errors::io::kWriteFailed, "write failed", saved_errno);
    }
    if (chunk == 0) {
      ThrowIoError(ctx, errors::io::kWriteFailed,
                   std::string(kAtomicReplaceErrorMessage) + ": short write");
    }
    written += static_cast<size_t>(chunk);
  }
}

// Removes the temporary file unless released after a successful rename.
class TempFileGuard {
 public:
  explicit TempFileGuard(std::filesystem::path path) noexcept : path_(std::move(path)) {}
  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;
  ~TempFileGuard() noexcept {
    if (!path_.empty()) {
      std::error_code ec;
      if (!std::filesystem::remove(path_, ec) && ec) {
        std::cerr << "TempFileGuard cleanup failed for " << path_ << ": " << ec.message() << '\n';
      }
    }
  }

  void Release() noexcept { path_.clear(); }

 private:
  std::filesystem::path path_;
};

std::filesystem::path MakeTempPath(const std::filesystem::path& dir,
                                   const std::filesystem::path& base) {
  std::array<uint8_t, 16> random{};
  gv::crypto::SystemRandomBytes(random);
  std::filesystem::path temp_name = base.filename();
  temp_name += ".tmp.";
  temp_name += encoding::ToHex(random);
  return dir / temp_name;
}

}  // namespace

void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks) {
  ErrorContext ctx;
  const std::string target_utf8 = target.empty() ? std::string("<empty>") : gv::PathToUtf8String(target);
  ScopedErrorContext root(ctx, "atomic replace target=" + target_utf8);

  try {
    if (target.empty()) {
      throw Error{ErrorDomain::Validation, 0, ctx.Format("Target path required"), std::nullopt,
                  gv::Retryability::kFatal, ctx.Stack()};
    }

    auto dir = target.parent_path();
    if (dir.empty()) {
      dir = WithContext(ctx, "resolving current working directory",
                        [] { return std::filesystem::current_path(); });
    }

    auto temp_path = MakeTempPath(dir, target);
    TempFileGuard cleanup(temp_path);

    int fd = WithContext(ctx, "opening temporary payload file", [&]() {
      int handle = ::open(temp_path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0600);
      if (handle < 0) {
        ThrowErrno(ctx, errors::io::kOpenFailed, "open failed", errno);
      }
      return handle;
    });

    try {
      WithContext(ctx, "writing payload", [&] { WriteAll(fd, payload, ctx); });
      WithContext(ctx, "syncing payload", [&] { SyncFileWithRetry(fd, ctx); });
    } catch (const Error&) {
      ::close(fd);
      throw;
    }

    WithContext(ctx, "closing temporary payload file", [&] {
      if (::close(fd) != 0) {
        ThrowErrno(ctx, errors::io::kWriteFailed, "close failed", errno);
      }
    });

    if (hooks.before_rename) {
      WithContext(ctx, "executing before_rename hook", [&] { hooks.before_rename(temp_path, target); });
    }

    WithContext(ctx, "renaming temporary file into place", [&] {
      if (::rename(temp_path.c_str(), target.c_str()) != 0) {
        ThrowErrno(ctx, errors::io::kWriteFailed, "rename failed", errno);
      }
    });
    cleanup.Release();

    WithContext(ctx, "syncing directory metadata", [&] { SyncDirectory(dir, ctx); });
  } catch (const Error& err) {
    if (err.context.empty()) {
      throw AugmentError(err, ctx);
    }
    throw;
  } catch (const std::system_error& sys_err) {
    RethrowSystemError(sys_err, ctx);
  }
}

std::vector<uint8_t> ReadWholeFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw Error(ErrorDomain::IO, errors::io::kOpenFailed,
                "Unable to open file: " + gv::PathToUtf8String(path), errno);
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw Error(ErrorDomain::IO, errors::io::kReadFailed,
                "Unable to read file: " + gv::PathToUtf8String(path));
  }
  return bytes;
}

}  // namespace gv::orchestrator
