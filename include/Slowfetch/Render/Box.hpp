/**
 * @file Box.hpp
 * @brief Rounded-corner bordered boxes of uniform visible width.
 */

#pragma once

#include "../Utils/Types.hpp"
#include "Theme.hpp"

namespace slowfetch::render {
  namespace types = ::slowfetch::utils::types;

  namespace glyph {
    inline constexpr types::StringView TOP_LEFT     = "╭";
    inline constexpr types::StringView TOP_RIGHT    = "╮";
    inline constexpr types::StringView BOTTOM_LEFT  = "╰";
    inline constexpr types::StringView BOTTOM_RIGHT = "╯";
    inline constexpr types::StringView HORIZONTAL   = "─";
    inline constexpr types::StringView VERTICAL     = "│";
  } // namespace glyph

  /**
   * @struct Box
   * @brief Rendered rows of a box, top border first. Every row has the same visible width.
   */
  struct Box {
    types::Vec<types::String> lines;

    [[nodiscard]] auto height() const -> types::usize {
      return lines.size();
    }

    /// Visible width of a row, 0 for an empty box.
    [[nodiscard]] auto width() const -> types::usize;
  };

  struct BoxOptions {
    types::Option<types::String> title;     ///< Centered in the top border.
    types::Option<types::usize>  minWidth;  ///< Lower bound for the inner width.
    types::Option<types::usize>  minHeight; ///< Lower bound for the total row count, borders included.
    bool                         centerContent = false;
  };

  /**
   * @brief Builds a bordered box around @p lines.
   *
   * The inner width is the largest of the widest line, the title's scalar
   * count and `minWidth`. Each row is `innerWidth + 4` columns wide: two
   * border glyphs plus one space of margin on each side. Extra height from
   * `minHeight` becomes blank rows split evenly above and below the content,
   * with any odd row going below.
   *
   * @code{.cpp}
   * Box box = BuildBox(std::array<String, 2> { "a", "bb" });
   * // ╭────╮
   * // │ a  │
   * // │ bb │
   * // ╰────╯
   * @endcode
   */
  auto BuildBox(types::Span<const types::String> lines, const BoxOptions& options = {}, const Theme& theme = {}) -> Box;
} // namespace slowfetch::render
