#pragma once

#include <charconv>     // std::from_chars
#include <concepts>     // std::integral
#include <cstdlib>      // std::getenv, setenv, unsetenv
#include <string>       // std::basic_string
#include <system_error> // std::errc
#include <type_traits>  // std::is_same_v

#include "Error.hpp"
#include "Types.hpp"

namespace slowfetch::utils::env {
  namespace types = ::slowfetch::utils::types;
  namespace error = ::slowfetch::utils::error;

  using enum error::SlowErrorCode;

  /**
   * @brief Safely retrieves an environment variable.
   * @tparam CharT Character type (char only for POSIX)
   * @param name The name of the environment variable to retrieve.
   * @return A Result containing the value of the environment variable.
   */
  template <typename CharT>
  [[nodiscard]] inline auto GetEnv(const CharT* name) -> types::Result<std::basic_string<CharT>> {
    static_assert(std::is_same_v<CharT, char>, "Only char is supported on POSIX systems");

    const CharT* value = std::getenv(name);

    if (!value)
      ERR_FMT(NotFound, "Environment variable '{}' not found", name);

    return std::basic_string<CharT>(value);
  }

  /**
   * @brief Retrieves an environment variable and parses it as a decimal integer.
   * @tparam T Integral type to parse into
   * @param name The name of the environment variable.
   * @return The parsed value, NotFound if unset, or ParseError if the whole value
   *         is not a valid number for @p T.
   */
  template <std::integral T>
  [[nodiscard]] inline auto GetEnvAs(const char* name) -> types::Result<T> {
    types::String raw = TRY(GetEnv(name));

    T value {};

    const char* first = raw.data();
    const char* last  = raw.data() + raw.size();

    const auto [ptr, errc] = std::from_chars(first, last, value);

    if (errc != std::errc() || ptr != last || raw.empty())
      ERR_FMT(ParseError, "Environment variable '{}' has non-numeric value '{}'", name, raw);

    return value;
  }

  /**
   * @brief Safely sets an environment variable.
   * @param name The name of the environment variable to set.
   * @param value The value to set the environment variable to.
   */
  template <typename CharT>
  inline auto SetEnv(const CharT* name, const CharT* value) -> types::Result<> {
    static_assert(std::is_same_v<CharT, char>, "Only char is supported on POSIX systems");

    if (setenv(name, value, 1) != 0)
      ERR_FMT(error::FromErrno(errno), "Failed to set environment variable '{}'", name);

    return {};
  }

  /**
   * @brief Safely unsets an environment variable.
   * @param name The name of the environment variable to unset.
   */
  template <typename CharT>
  inline auto UnsetEnv(const CharT* name) -> types::Result<> {
    static_assert(std::is_same_v<CharT, char>, "Only char is supported on POSIX systems");

    if (unsetenv(name) != 0)
      ERR_FMT(error::FromErrno(errno), "Failed to unset environment variable '{}'", name);

    return {};
  }
} // namespace slowfetch::utils::env
