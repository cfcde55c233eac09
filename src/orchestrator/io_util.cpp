#include "secenv/orchestrator/io_util.h"

#include "secenv/common.h"
#include "secenv/crypto/random.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <type_traits>
#include <vector>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#else
#ifndef NOMINMAX
#define NOMINMAX
#endif
#define WIN32_LEAN_AND_MEAN
#include <Windows.h>
#include <fcntl.h>
#include <io.h>
#include <sys/stat.h>
#endif

namespace secenv::orchestrator {
namespace {

constexpr const char* kAtomicReplaceErrorMessage = "Atomic file replace failed";

// Chunk size for payload writes; the progress hook fires once per chunk.
constexpr size_t kWriteChunkSize = 64 * 1024;

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

Retryability ClassifyNativeError(int native) {
  switch (native) {
#if defined(EINTR)
    case EINTR:
#endif
#if defined(EAGAIN)
    case EAGAIN:
#endif
#if defined(EWOULDBLOCK) && (!defined(EAGAIN) || EWOULDBLOCK != EAGAIN)
    case EWOULDBLOCK:
#endif
      return Retryability::kRetryable;
#if defined(EBUSY)
    case EBUSY:
      return Retryability::kTransient;
#endif
#if defined(ETIMEDOUT)
    case ETIMEDOUT:
      return Retryability::kTransient;
#endif
    default:
      break;
  }
  return Retryability::kFatal;
}

std::vector<std::string> MergeContext(const std::vector<std::string>& existing,
                                      const ErrorContext& ctx) {
  auto merged = existing;
  auto stack = ctx.Stack();
  merged.insert(merged.end(), stack.begin(), stack.end());
  return merged;
}

[[noreturn]] void ThrowIoError(const ErrorContext& ctx, int code, std::string message,
                               std::optional<int> native = std::nullopt,
                               Retryability retry = Retryability::kFatal) {
  throw Error{ErrorDomain::IO, code, ctx.Format(std::move(message)), native, retry, ctx.Stack()};
}

[[noreturn]] void ThrowValidationError(const ErrorContext& ctx, std::string message) {
  throw Error{ErrorDomain::Validation, errors::validation::kInvalidProject,
              ctx.Format(std::move(message)), std::nullopt, Retryability::kFatal, ctx.Stack()};
}

Error AugmentError(const Error& err, const ErrorContext& ctx) {
  return Error{err.domain,
               err.code,
               ctx.Format(err.what()),
               err.native_code,
               err.retryability,
               MergeContext(err.context, ctx)};
}

[[noreturn]] void RethrowSystemError(const std::system_error& sys_err, const ErrorContext& ctx,
                                     int code) {
  throw Error{ErrorDomain::IO,
              code,
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
    RethrowSystemError(sys_err, ctx, errors::io::kWriteFailed);
  }
}

#ifdef _WIN32
int NativeOpen(const std::filesystem::path& path) {
  const std::wstring native = path.wstring();
  return _wopen(native.c_str(), _O_CREAT | _O_WRONLY | _O_TRUNC | _O_BINARY | _O_SEQUENTIAL,
                _S_IREAD | _S_IWRITE);
}

int NativeClose(int fd) { return _close(fd); }

// _commit flushes file contents; metadata durability relies on the rename.
int NativeFsync(int fd) { return _commit(fd); }

int NativeWrite(int fd, const uint8_t* data, size_t size) {
  return _write(fd, data, static_cast<unsigned int>(size));
}

bool NativeRename(const std::filesystem::path& from, const std::filesystem::path& to) {
  return ::MoveFileExW(from.wstring().c_str(), to.wstring().c_str(),
                       MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH) != 0;
}

void SyncDirectory(const std::filesystem::path&) {}

void EnsurePrivatePermissions(int, const std::filesystem::path& path, const ErrorContext& ctx) {
  if (_wchmod(path.wstring().c_str(), _S_IREAD | _S_IWRITE) != 0) {
    const int saved_error = errno;
    ThrowIoError(ctx, errors::io::kWriteFailed,
                 std::string(kAtomicReplaceErrorMessage) + ": failed to harden temp file permissions",
                 saved_error, ClassifyNativeError(saved_error));
  }
}

#else

int NativeOpen(const std::filesystem::path& path) {
  return ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC | O_EXCL, 0600);
}

int NativeClose(int fd) { return ::close(fd); }

int NativeFsync(int fd) { return ::fsync(fd); }

ssize_t NativeWrite(int fd, const uint8_t* data, size_t size) {
  return ::write(fd, data, size);
}

bool NativeRename(const std::filesystem::path& from, const std::filesystem::path& to) {
  return ::rename(from.c_str(), to.c_str()) == 0;
}

void SyncDirectory(const std::filesystem::path& dir) {
  int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (dir_fd < 0) {
    const int saved_errno = errno;
    throw Error{ErrorDomain::IO, errors::io::kDirectoryFailed,
                std::string(kAtomicReplaceErrorMessage) + ": open directory failed", saved_errno,
                ClassifyNativeError(saved_errno)};
  }
  if (::fsync(dir_fd) != 0) {
    const int err = errno;
    ::close(dir_fd);
    // Some filesystems refuse fsync on directories; the rename already landed.
    if (err == EINVAL || err == ENOTSUP) {
      return;
    }
    throw Error{ErrorDomain::IO, errors::io::kDirectoryFailed,
                std::string(kAtomicReplaceErrorMessage) + ": directory flush failed", err,
                ClassifyNativeError(err)};
  }
  ::close(dir_fd);
}

void EnsurePrivatePermissions(int fd, const std::filesystem::path&, const ErrorContext& ctx) {
  if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
    const int saved_errno = errno;
    ThrowIoError(ctx, errors::io::kWriteFailed,
                 std::string(kAtomicReplaceErrorMessage) + ": failed to harden temp file permissions",
                 saved_errno, ClassifyNativeError(saved_errno));
  }
}

#endif

bool IsTransientFsyncError(int err) {
#ifdef _WIN32
  return err == EINTR || err == EAGAIN;
#else
  return err == EINTR || err == EAGAIN || err == EBUSY;
#endif
}

void SyncFileWithRetry(int fd, ErrorContext& ctx) {
  constexpr int kMaxRetries = 4;
  std::chrono::milliseconds backoff{5};
  for (int attempt = 0;; ++attempt) {
    if (NativeFsync(fd) == 0) {
      return;
    }
    const int saved_errno = errno;
    if (saved_errno == EINTR) {
      continue;
    }
    if (attempt >= kMaxRetries || !IsTransientFsyncError(saved_errno)) {
      ThrowIoError(ctx, errors::io::kWriteFailed,
                   std::string(kAtomicReplaceErrorMessage) + ": fsync failed", saved_errno,
                   ClassifyNativeError(saved_errno));
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

void WriteAll(int fd, std::span<const uint8_t> payload, ErrorContext& ctx,
              const AtomicReplaceHooks& hooks) {
  size_t written = 0;
  while (written < payload.size()) {
    const size_t want = std::min(kWriteChunkSize, payload.size() - written);
    auto chunk = NativeWrite(fd, payload.data() + written, want);
    if (chunk < 0) {
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      ThrowIoError(ctx, errors::io::kWriteFailed,
                   std::string(kAtomicReplaceErrorMessage) + ": write failed", saved_errno,
                   ClassifyNativeError(saved_errno));
    }
    if (chunk == 0) {
      ThrowIoError(ctx, errors::io::kWriteFailed,
                   std::string(kAtomicReplaceErrorMessage) + ": short write");
    }
    written += static_cast<size_t>(chunk);
    if (hooks.on_write_progress) {
      hooks.on_write_progress(written, payload.size());
    }
  }
}

class TempFileGuard {
 public:
  explicit TempFileGuard(std::filesystem::path path) noexcept : path_(std::move(path)) {}
  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;
  ~TempFileGuard() noexcept {
    if (!path_.empty()) {
      std::error_code ec;
      if (!std::filesystem::remove(path_, ec) && ec) {
        std::cerr << "TempFileGuard cleanup failed for " << path_ << ": " << ec.message()
                  << '\n';
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
  crypto::SystemRandomBytes(std::span<uint8_t>(random.data(), random.size()));
  std::filesystem::path temp_name = base.filename();
  temp_name += ".tmp.";
  temp_name += ToHex(std::span<const uint8_t>(random.data(), random.size()));
  return dir / temp_name;
}

// Closes the descriptor if an exception unwinds past the write stage.
class FdGuard {
 public:
  explicit FdGuard(int fd) noexcept : fd_(fd) {}
  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;
  ~FdGuard() noexcept {
    if (fd_ >= 0) {
      NativeClose(fd_);
    }
  }
  int Release() noexcept {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }

 private:
  int fd_;
};

}  // namespace

void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks) {
  ErrorContext ctx;
  const std::string target_utf8 = target.empty() ? std::string("<empty>") : PathToUtf8String(target);
  ScopedErrorContext root(ctx, "atomic replace target=" + target_utf8);

  try {
    if (target.empty()) {
      ThrowValidationError(ctx, "Target path required");
    }

    auto dir = target.parent_path();
    if (dir.empty()) {
      dir = WithContext(ctx, "resolving current working directory", [] {
        return std::filesystem::current_path();
      });
    }

    auto temp_path = MakeTempPath(dir, target);
    TempFileGuard cleanup(temp_path);

    int fd = WithContext(ctx, "opening temporary payload file", [&]() {
      int handle = NativeOpen(temp_path);
      if (handle < 0) {
        const int saved_errno = errno;
        ThrowIoError(ctx, errors::io::kWriteFailed,
                     std::string(kAtomicReplaceErrorMessage) + ": open failed", saved_errno,
                     ClassifyNativeError(saved_errno));
      }
      return handle;
    });
    FdGuard fd_guard(fd);

    EnsurePrivatePermissions(fd, temp_path, ctx);

    WithContext(ctx, "writing payload", [&] { WriteAll(fd, payload, ctx, hooks); });
    WithContext(ctx, "syncing payload", [&] { SyncFileWithRetry(fd, ctx); });

    WithContext(ctx, "closing temporary payload file", [&] {
      if (NativeClose(fd_guard.Release()) != 0) {
        const int saved_errno = errno;
        ThrowIoError(ctx, errors::io::kWriteFailed,
                     std::string(kAtomicReplaceErrorMessage) + ": close failed", saved_errno,
                     ClassifyNativeError(saved_errno));
      }
    });

    if (hooks.before_rename) {
      WithContext(ctx, "executing before_rename hook", [&] { hooks.before_rename(temp_path, target); });
    }

    WithContext(ctx, "renaming temporary file into place", [&] {
      if (!NativeRename(temp_path, target)) {
        int err = errno;
#ifdef _WIN32
        if (err == 0) {
          err = static_cast<int>(::GetLastError());
        }
#endif
        ThrowIoError(ctx, errors::io::kWriteFailed,
                     std::string(kAtomicReplaceErrorMessage) + ": rename failed", err,
                     ClassifyNativeError(err));
      }
    });

    cleanup.Release();

    WithContext(ctx, "syncing directory metadata", [&] { SyncDirectory(dir); });
  } catch (const Error& err) {
    if (err.context.empty()) {
      throw AugmentError(err, ctx);
    }
    throw;
  } catch (const std::system_error& sys_err) {
    RethrowSystemError(sys_err, ctx, errors::io::kWriteFailed);
  }
}

std::vector<uint8_t> ReadFileBytes(const std::filesystem::path& path) {
  ErrorContext ctx;
  ScopedErrorContext root(ctx, "reading " + PathToUtf8String(path));

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    ThrowIoError(ctx, errors::io::kSourceMissing, "File not found: " + PathToUtf8String(path),
                 ec ? std::optional<int>(ec.value()) : std::nullopt);
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    const int saved_errno = errno;
    ThrowIoError(ctx, errors::io::kReadFailed, "Unable to open " + PathToUtf8String(path),
                 saved_errno, ClassifyNativeError(saved_errno));
  }
  std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    const int saved_errno = errno;
    ThrowIoError(ctx, errors::io::kReadFailed, "Read failed for " + PathToUtf8String(path),
                 saved_errno, ClassifyNativeError(saved_errno));
  }
  return data;
}

void EnsurePrivateDirectory(const std::filesystem::path& dir) {
  ErrorContext ctx;
  ScopedErrorContext root(ctx, "creating directory " + PathToUtf8String(dir));

  std::error_code ec;
  if (std::filesystem::is_directory(dir, ec)) {
    return;
  }
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    ThrowIoError(ctx, errors::io::kDirectoryFailed,
                 "Unable to create directory " + PathToUtf8String(dir), ec.value(),
                 ClassifyNativeError(ec.value()));
  }
  std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    ThrowIoError(ctx, errors::io::kDirectoryFailed,
                 "Unable to restrict permissions on " + PathToUtf8String(dir), ec.value());
  }
}

}  // namespace secenv::orchestrator
