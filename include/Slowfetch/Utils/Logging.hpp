#pragma once

#include <algorithm>  // std::copy_n
#include <chrono>     // std::chrono::system_clock
#include <ctime>      // localtime_r, strftime, time_t, tm
#include <filesystem> // std::filesystem::path
#include <format>     // std::format
#include <mutex>      // std::mutex, std::lock_guard
#include <utility>    // std::forward

#ifdef __cpp_lib_print
  #include <print> // std::print
#else
  #include <iostream> // std::cout, std::cerr
#endif

#include <source_location> // std::source_location
#include <type_traits>     // std::decay_t, std::is_same_v, std::is_base_of_v

#include "Error.hpp"
#include "Types.hpp"

namespace slowfetch::utils::logging {
  namespace types = ::slowfetch::utils::types;

  inline auto GetLogMutex() -> std::mutex& {
    static std::mutex LogMutexInstance;
    return LogMutexInstance;
  }

  /**
   * @brief Writes raw text to stdout or stderr.
   * @param text The text to write
   * @param useStderr Whether to write to stderr instead of stdout
   */
  inline auto WriteToConsole(const types::StringView text, bool useStderr = false) -> void {
#ifdef __cpp_lib_print
    if (useStderr)
      std::print(stderr, "{}", text);
    else
      std::print("{}", text);
#else
    if (useStderr)
      std::cerr << text;
    else
      std::cout << text;
#endif
  }

  enum class LogColor : types::u8 {
    Black         = 0,
    Red           = 1,
    Green         = 2,
    Yellow        = 3,
    Blue          = 4,
    Magenta       = 5,
    Cyan          = 6,
    White         = 7,
    Gray          = 8,
    BrightRed     = 9,
    BrightGreen   = 10,
    BrightYellow  = 11,
    BrightBlue    = 12,
    BrightMagenta = 13,
    BrightCyan    = 14,
    BrightWhite   = 15,
  };

  struct LogLevelConst {
    // clang-format off
    static constexpr types::Array<types::StringView, 16> COLOR_CODE_LITERALS = {
      "\033[38;5;0m",  "\033[38;5;1m",  "\033[38;5;2m",  "\033[38;5;3m",
      "\033[38;5;4m",  "\033[38;5;5m",  "\033[38;5;6m",  "\033[38;5;7m",
      "\033[38;5;8m",  "\033[38;5;9m",  "\033[38;5;10m", "\033[38;5;11m",
      "\033[38;5;12m", "\033[38;5;13m", "\033[38;5;14m", "\033[38;5;15m",
    };
    // clang-format on

    static constexpr const char* RESET_CODE   = "\033[0m";
    static constexpr const char* BOLD_START   = "\033[1m";
    static constexpr const char* ITALIC_START = "\033[3m";
    static constexpr const char* DIM_START    = "\033[2m";

    // BOLD + COLOR + TEXT + RESET
    static constexpr types::StringView TRACE_STYLED = "\033[1m\033[38;5;5mTRACE\033[0m";
    static constexpr types::StringView DEBUG_STYLED = "\033[1m\033[38;5;4mDEBUG\033[0m";
    static constexpr types::StringView INFO_STYLED  = "\033[1m\033[38;5;2mINFO \033[0m";
    static constexpr types::StringView WARN_STYLED  = "\033[1m\033[38;5;3mWARN \033[0m";
    static constexpr types::StringView ERROR_STYLED = "\033[1m\033[38;5;1mERROR\033[0m";

    static constexpr types::PCStr TIMESTAMP_FORMAT = "%Y-%m-%dT%H:%M:%S";
  };

  /**
   * @enum LogLevel
   * @brief Represents different log levels (tracing-style).
   */
  enum class LogLevel : types::u8 {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
  };

  inline auto GetRuntimeLogLevel() -> LogLevel& {
    static LogLevel Level = LogLevel::Info;
    return Level;
  }

  inline auto SetRuntimeLogLevel(const LogLevel level) -> void {
    GetRuntimeLogLevel() = level;
  }

  /**
   * @struct Style
   * @brief Options for text styling with ANSI codes.
   */
  struct Style {
    LogColor color  = LogColor::White;
    bool     bold   = false;
    bool     italic = false;
    bool     dim    = false;
  };

  /**
   * @brief Applies 256-colour ANSI styling to text.
   */
  inline auto Stylize(const types::StringView text, const Style& style) -> types::String {
    const bool hasStyle = style.bold || style.italic || style.dim || style.color != LogColor::White;

    if (!hasStyle)
      return types::String(text);

    types::String result;
    result.reserve(text.size() + 32);

    if (style.bold)
      result += LogLevelConst::BOLD_START;
    if (style.italic)
      result += LogLevelConst::ITALIC_START;
    if (style.dim)
      result += LogLevelConst::DIM_START;
    if (style.color != LogColor::White)
      result += LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<types::usize>(style.color));

    result += text;
    result += LogLevelConst::RESET_CODE;

    return result;
  }

  /**
   * @struct Rgb
   * @brief A 24-bit foreground colour.
   */
  struct Rgb {
    types::u8 red   = 0;
    types::u8 green = 0;
    types::u8 blue  = 0;

    auto operator==(const Rgb&) const -> bool = default;
  };

  /**
   * @brief Returns the SGR sequence selecting @p rgb as the foreground colour.
   */
  inline auto TrueColorCode(const Rgb& rgb) -> types::String {
    return std::format("\033[38;2;{};{};{}m", rgb.red, rgb.green, rgb.blue);
  }

  /**
   * @brief Wraps text in a 24-bit foreground colour followed by a reset.
   */
  inline auto Colorize(const types::StringView text, const Rgb& rgb) -> types::String {
    types::String result = TrueColorCode(rgb);
    result.reserve(result.size() + text.size() + 4);
    result += text;
    result += LogLevelConst::RESET_CODE;
    return result;
  }

  constexpr auto GetLevelInfo() -> const types::Array<types::StringView, 5>& {
    static constexpr types::Array<types::StringView, 5> LEVEL_INFO_INSTANCE = {
      LogLevelConst::TRACE_STYLED,
      LogLevelConst::DEBUG_STYLED,
      LogLevelConst::INFO_STYLED,
      LogLevelConst::WARN_STYLED,
      LogLevelConst::ERROR_STYLED,
    };
    return LEVEL_INFO_INSTANCE;
  }

  constexpr auto ShouldUseStderr(const LogLevel level) -> bool {
    return level == LogLevel::Warn || level == LogLevel::Error;
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Print Helpers
  // ─────────────────────────────────────────────────────────────────────────────

  template <typename... Args>
  inline auto Print(std::format_string<Args...> fmt, Args&&... args) {
    WriteToConsole(std::format(fmt, std::forward<Args>(args)...));
  }

  inline auto Print(const types::StringView text) {
    WriteToConsole(text);
  }

  template <typename... Args>
  inline auto Println(std::format_string<Args...> fmt, Args&&... args) {
    WriteToConsole(std::format(fmt, std::forward<Args>(args)...) + '\n');
  }

  inline auto Println(const types::StringView text) {
    types::String textWithNewline(text);
    textWithNewline += '\n';
    WriteToConsole(textWithNewline);
  }

  inline auto Println() {
    WriteToConsole("\n");
  }

  /**
   * @brief Returns a ISO8601-like timestamp string (YYYY-MM-DDTHH:MM:SS).
   */
  inline auto GetCachedTimestamp(const std::time_t timeT) -> types::StringView {
    thread_local auto                   LastTt   = static_cast<std::time_t>(-1);
    thread_local types::Array<char, 20> TsBuffer = { '\0' };

    if (timeT != LastTt) {
      std::tm localTm {};

      if (localtime_r(&timeT, &localTm) != nullptr) {
        if (std::strftime(TsBuffer.data(), TsBuffer.size(), LogLevelConst::TIMESTAMP_FORMAT, &localTm) == 0)
          std::copy_n("????-??-??T??:??:??", 20, TsBuffer.data());
      } else
        std::copy_n("????-??-??T??:??:??", 20, TsBuffer.data());

      LastTt = timeT;
    }

    return { TsBuffer.data(), 19 };
  }

  /**
   * @brief Extracts a target string from a function name.
   * @details Converts "void slowfetch::render::Render()" to "slowfetch::render"
   */
  inline auto ExtractTarget(const char* funcName) -> types::String {
    types::StringView func(funcName);

    auto parenPos = func.rfind('(');
    if (parenPos == types::StringView::npos)
      parenPos = func.size();

    auto lastColonPos = func.rfind("::", parenPos);
    if (lastColonPos == types::StringView::npos)
      return types::String(func.substr(0, parenPos));

    auto         spacePos = func.rfind(' ', lastColonPos);
    types::usize startPos = (spacePos != types::StringView::npos) ? spacePos + 1 : 0;

    return types::String(func.substr(startPos, lastColonPos - startPos));
  }

  /**
   * @brief Core logging implementation.
   *
   * Compact format: timestamp LEVEL [file:line] target: message
   */
  template <typename... Args>
  auto LogImpl(
    const LogLevel              level,
    const std::source_location& loc,
    const types::StringView     target,
    std::format_string<Args...> fmt,
    Args&&... args
  ) {
    using namespace std::chrono;
    using std::filesystem::path;

    if (level < GetRuntimeLogLevel())
      return;

    const std::time_t       nowTt     = system_clock::to_time_t(system_clock::now());
    const types::StringView timestamp = GetCachedTimestamp(nowTt);
    const types::String     message   = std::format(fmt, std::forward<Args>(args)...);
    const bool              useStderr = ShouldUseStderr(level);

    types::String line;
    line.reserve(message.size() + 96);

    line += Stylize(timestamp, { .color = LogColor::Gray, .dim = true });
    line += ' ';
    line += GetLevelInfo().at(static_cast<types::usize>(level));
    line += ' ';
#ifndef NDEBUG
    line += Stylize(std::format("{}:{}", path(loc.file_name()).filename().string(), loc.line()), { .color = LogColor::Gray, .italic = true });
    line += ' ';
#else
    (void)loc;
#endif
    line += Stylize(target, { .bold = true });
    line += ": ";
    line += message;
    line += '\n';

    const std::lock_guard<std::mutex> lock(GetLogMutex());
    WriteToConsole(line, useStderr);
  }

  /**
   * @brief Log an error object at the specified level.
   */
  template <typename ErrorType>
  auto LogError(
    const LogLevel          level,
    const types::StringView target,
    const ErrorType&        errorObj
  ) {
    using DecayedErrorType = std::decay_t<ErrorType>;

    std::source_location logLocation;
    types::String        errorMessagePart;

    if constexpr (std::is_same_v<DecayedErrorType, error::SlowError>) {
      logLocation      = errorObj.location;
      errorMessagePart = errorObj.message;
    } else {
      logLocation = std::source_location::current();
      if constexpr (std::is_base_of_v<std::exception, DecayedErrorType>)
        errorMessagePart = errorObj.what();
      else if constexpr (requires { errorObj.message; })
        errorMessagePart = errorObj.message;
      else
        errorMessagePart = "Unknown error type logged";
    }

    LogImpl(level, logLocation, target, "{}", errorMessagePart);
  }
} // namespace slowfetch::utils::logging

// ─────────────────────────────────────────────────────────────────────────────
// Macros
// ─────────────────────────────────────────────────────────────────────────────

#define SLOW_LOG_TARGET ::slowfetch::utils::logging::ExtractTarget(__PRETTY_FUNCTION__)

#define trace_log(fmt, ...) \
  ::slowfetch::utils::logging::LogImpl(::slowfetch::utils::logging::LogLevel::Trace, std::source_location::current(), SLOW_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)

#define debug_log(fmt, ...) \
  ::slowfetch::utils::logging::LogImpl(::slowfetch::utils::logging::LogLevel::Debug, std::source_location::current(), SLOW_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)

#define info_log(fmt, ...) \
  ::slowfetch::utils::logging::LogImpl(::slowfetch::utils::logging::LogLevel::Info, std::source_location::current(), SLOW_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)

#define warn_log(fmt, ...) \
  ::slowfetch::utils::logging::LogImpl(::slowfetch::utils::logging::LogLevel::Warn, std::source_location::current(), SLOW_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)

#define error_log(fmt, ...) \
  ::slowfetch::utils::logging::LogImpl(::slowfetch::utils::logging::LogLevel::Error, std::source_location::current(), SLOW_LOG_TARGET, fmt __VA_OPT__(, ) __VA_ARGS__)

#define debug_at(error_obj) \
  ::slowfetch::utils::logging::LogError(::slowfetch::utils::logging::LogLevel::Debug, SLOW_LOG_TARGET, error_obj)

#define warn_at(error_obj) \
  ::slowfetch::utils::logging::LogError(::slowfetch::utils::logging::LogLevel::Warn, SLOW_LOG_TARGET, error_obj)

#define error_at(error_obj) \
  ::slowfetch::utils::logging::LogError(::slowfetch::utils::logging::LogLevel::Error, SLOW_LOG_TARGET, error_obj)
