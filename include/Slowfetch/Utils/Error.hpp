#pragma once

#include <cerrno>          // ENOENT, EACCES, ...
#include <format>          // std::format (ERR_FMT)
#include <matchit.hpp>     // matchit::{match, is, _}
#include <source_location> // std::source_location
#include <utility>         // std::move

#include "Types.hpp"

namespace slowfetch::utils::error {
  /**
   * @enum SlowErrorCode
   * @brief Error categories reported by probes, configuration and argument parsing.
   */
  enum class SlowErrorCode : types::u8 {
    ApiUnavailable,   ///< A required OS interface failed unexpectedly at runtime.
    InternalError,    ///< An error occurred within slowfetch's own logic.
    InvalidArgument,  ///< An invalid argument was passed on the command line or to a function.
    IoError,          ///< General I/O error (filesystem, pipes, etc.).
    NotFound,         ///< A required resource (file, variable, device) was not found.
    NotSupported,     ///< The requested operation is not supported on this platform.
    ParseError,       ///< Failed to parse data (file content, environment value, config).
    PermissionDenied, ///< Insufficient permissions to perform the operation.
    PlatformSpecific, ///< An unmapped error specific to the underlying OS occurred (check message).
  };

  /**
   * @brief Maps an errno value onto the closest SlowErrorCode.
   */
  inline auto FromErrno(const int errnum) -> SlowErrorCode {
    using matchit::match, matchit::is, matchit::or_, matchit::_;

    return match(errnum)(
      is | or_(ENOENT, ENODEV, ENXIO) = SlowErrorCode::NotFound,
      is | or_(EACCES, EPERM)         = SlowErrorCode::PermissionDenied,
      is | or_(ENOTTY, ENOSYS)        = SlowErrorCode::NotSupported,
      is | or_(EIO, EBADF)            = SlowErrorCode::IoError,
      is | EINVAL                     = SlowErrorCode::InvalidArgument,
      is | _                          = SlowErrorCode::PlatformSpecific
    );
  }

  /**
   * @struct SlowError
   * @brief Holds structured information about an error.
   *
   * Used as the error type in Result throughout slowfetch.
   */
  struct SlowError {
    types::String        message;  ///< A descriptive error message, potentially including platform details.
    std::source_location location; ///< The source location where the error occurred (file, line, function).
    SlowErrorCode        code;     ///< The general category of the error.

    SlowError(const SlowErrorCode errc, types::String msg, const std::source_location& loc = std::source_location::current())
      : message(std::move(msg)), location(loc), code(errc) {}
  };
} // namespace slowfetch::utils::error

#define ERR(errc, msg)          return ::slowfetch::utils::types::Err(::slowfetch::utils::error::SlowError(errc, msg))
#define ERR_FROM(err)           return ::slowfetch::utils::types::Err(::slowfetch::utils::error::SlowError(err))
#define ERR_FMT(errc, fmt, ...) return ::slowfetch::utils::types::Err(::slowfetch::utils::error::SlowError(errc, std::format(fmt, __VA_ARGS__)))

/**
 * @brief Rust-style error propagation.
 *
 * Evaluates an expression returning Result<T>. On error, returns that error from
 * the enclosing function; otherwise yields the success value.
 *
 * @code
 * auto ReadKernel() -> Result<String> {
 *   String line = TRY(ReadFirstLine("/proc/sys/kernel/osrelease"));
 *   return line;
 * }
 * @endcode
 *
 * @note Uses GNU statement expressions (GCC/Clang).
 */
#define TRY(expr)                                                                             \
  _Pragma("clang diagnostic push")                                                            \
    _Pragma("clang diagnostic ignored \"-Wgnu-statement-expression-from-macro-expansion\"")({ \
      auto&& _slow_try_result = (expr);                                                       \
      if (!_slow_try_result)                                                                  \
        return ::slowfetch::utils::types::Err(_slow_try_result.error());                      \
      std::move(*_slow_try_result);                                                           \
    })                                                                                        \
      _Pragma("clang diagnostic pop")

/**
 * @brief Rust-style error propagation for Result<void>.
 */
#define TRY_VOID(expr)                                                                        \
  _Pragma("clang diagnostic push")                                                            \
    _Pragma("clang diagnostic ignored \"-Wgnu-statement-expression-from-macro-expansion\"")({ \
      auto&& _slow_try_result = (expr);                                                       \
      if (!_slow_try_result)                                                                  \
        return ::slowfetch::utils::types::Err(_slow_try_result.error());                      \
    })                                                                                        \
      _Pragma("clang diagnostic pop")
