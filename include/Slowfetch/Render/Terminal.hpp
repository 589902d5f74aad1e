/**
 * @file Terminal.hpp
 * @brief Terminal window-size discovery.
 */

#pragma once

#include "../Utils/Types.hpp"

namespace slowfetch::render {
  namespace types = ::slowfetch::utils::types;

  /**
   * @struct TerminalGeometry
   * @brief Size of the terminal in character cells. Both fields are > 0.
   */
  struct TerminalGeometry {
    types::usize columns;
    types::usize rows;

    auto operator==(const TerminalGeometry&) const -> bool = default;
  };

  inline constexpr TerminalGeometry DEFAULT_GEOMETRY = { .columns = 80, .rows = 24 };

  /**
   * @brief Asks the kernel for the window size of the terminal behind @p fd.
   * @return The geometry, NotSupported when @p fd is not a terminal, or
   *         PlatformSpecific when the reported size has a zero dimension.
   */
  auto QueryWindowSize(int fd) -> types::Result<TerminalGeometry>;

  /**
   * @brief Reads the geometry from the COLUMNS and LINES environment variables.
   * @return NotFound if either is unset, ParseError if either is not a positive decimal.
   */
  auto GeometryFromEnv() -> types::Result<TerminalGeometry>;

  /**
   * @brief Current terminal geometry for stdout. Never fails.
   *
   * Tries QueryWindowSize(STDOUT_FILENO), then GeometryFromEnv(), then
   * returns DEFAULT_GEOMETRY. Not cached; call it once per render.
   */
  auto ProbeTerminal() -> TerminalGeometry;
} // namespace slowfetch::render
