/**
 * @file Layout.hpp
 * @brief Chooses how art and sections share the terminal and composes the final output.
 */

#pragma once

#include "../Utils/Types.hpp"
#include "Sections.hpp"
#include "Terminal.hpp"
#include "Theme.hpp"

namespace slowfetch::render {
  namespace types = ::slowfetch::utils::types;

  using ArtLines = types::Vec<types::String>;

  /**
   * @struct ArtVariants
   * @brief The same logo at several sizes. Lines may carry SGR colour sequences.
   */
  struct ArtVariants {
    ArtLines                wide;
    ArtLines                medium;
    ArtLines                narrow;
    types::Option<ArtLines> compact; ///< Small OS logo, only present for OS art.
  };

  /**
   * @enum LayoutChoice
   * @brief Composition strategies, in the order they are tried.
   */
  enum class LayoutChoice : types::u8 {
    SideBySideWide,
    SideBySideCompact,
    SideBySideMedium,
    StackedCompact,
    StackedNarrow,
    SectionsOnly,
  };

  /**
   * @brief Columns needed to put @p art beside the section stack.
   * @details art box (`artWidth + 4`) + 1 column gap + sections box (`sectionsContentWidth + 4`).
   */
  auto SideBySideWidth(types::Span<const types::String> art, types::usize sectionsContentWidth) -> types::usize;

  /**
   * @brief Rows needed to put @p art above the section stack.
   */
  auto StackedHeight(types::Span<const types::String> art, types::usize sectionsHeight) -> types::usize;

  /**
   * @brief Picks the first strategy that fits @p geometry.
   *
   * | # | Condition                                            | Choice            |
   * |---|------------------------------------------------------|-------------------|
   * | 1 | columns >= SideBySideWidth(wide)                     | SideBySideWide    |
   * | 2 | compact present, columns >= SideBySideWidth(compact) | SideBySideCompact |
   * | 3 | columns >= SideBySideWidth(medium)                   | SideBySideMedium  |
   * | 4 | compact present, rows >= StackedHeight(compact)      | StackedCompact    |
   * | 5 | rows >= StackedHeight(narrow)                        | StackedNarrow     |
   * | 6 | otherwise                                            | SectionsOnly      |
   */
  auto SelectLayout(const ArtVariants& art, types::Span<const Section> sections, TerminalGeometry geometry) -> LayoutChoice;

  /**
   * @brief Renders the section stack alone. Returns "\n" when there is nothing to show.
   */
  auto RenderSectionsOnly(types::Span<const Section> sections, const Theme& theme = {}) -> types::String;

  /**
   * @brief Renders art and sections for a terminal of the given size.
   * @return Newline-terminated rows. Never empty.
   */
  auto Render(const ArtVariants& art, types::Span<const Section> sections, TerminalGeometry geometry, const Theme& theme = {}) -> types::String;

  /**
   * @brief Renders for the current terminal, probing its size first.
   */
  auto Render(const ArtVariants& art, types::Span<const Section> sections, const Theme& theme = {}) -> types::String;
} // namespace slowfetch::render
