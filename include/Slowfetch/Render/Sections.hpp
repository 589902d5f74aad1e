/**
 * @file Sections.hpp
 * @brief Titled key/value groups rendered as a stack of equal-width boxes.
 */

#pragma once

#include "../Utils/Types.hpp"
#include "Theme.hpp"

namespace slowfetch::render {
  namespace types = ::slowfetch::utils::types;

  /**
   * @struct Section
   * @brief A titled group of display rows, e.g. "Hardware" with CPU, GPU and Memory.
   */
  struct Section {
    types::String                                       title;
    types::Vec<types::Pair<types::String, types::String>> lines;
  };

  /**
   * @brief Formats one row as `key: value`, painting key and value separately.
   */
  auto FormatSectionLine(types::StringView key, types::StringView value, const Theme& theme = {}) -> types::String;

  /**
   * @brief Widest title (scalar count) or `key: value` row (visible width) over all sections.
   */
  auto SectionsContentWidth(types::Span<const Section> sections) -> types::usize;

  /**
   * @brief Total rows of the stacked section boxes, borders included.
   */
  auto SectionsHeight(types::Span<const Section> sections) -> types::usize;

  /**
   * @brief Renders every section as a left-aligned box, all sharing one inner width.
   *
   * The shared width is SectionsContentWidth(), raised to @p sharedWidth when
   * that is larger. Boxes are concatenated in input order without separators.
   */
  auto FormatSections(types::Span<const Section> sections, types::Option<types::usize> sharedWidth = types::None, const Theme& theme = {}) -> types::Vec<types::String>;
} // namespace slowfetch::render
