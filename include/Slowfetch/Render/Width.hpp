/**
 * @file Width.hpp
 * @brief Terminal column measurement for styled text.
 */

#pragma once

#include <algorithm> // std::max

#include "../Utils/Types.hpp"

namespace slowfetch::render {
  namespace types = ::slowfetch::utils::types;

  inline constexpr char ESCAPE_BYTE = '\x1b';

  constexpr auto IsUtf8LeadByte(const types::u8 byte) -> bool {
    return (byte & 0xC0) != 0x80;
  }

  /**
   * @brief Counts the columns @p text occupies on screen.
   *
   * An ESC byte opens an escape sequence that runs up to and including the
   * next 'm'; nothing inside it is counted. Outside escapes every byte that
   * is not a UTF-8 continuation byte counts as one column. An unterminated
   * sequence swallows the rest of the string.
   *
   * @note East-Asian wide and zero-width code points still count as one column.
   */
  constexpr auto VisibleWidth(const types::StringView text) -> types::usize {
    types::usize width    = 0;
    bool         inEscape = false;

    for (const char chr : text) {
      if (chr == ESCAPE_BYTE)
        inEscape = true;
      else if (inEscape) {
        if (chr == 'm')
          inEscape = false;
      } else if (IsUtf8LeadByte(static_cast<types::u8>(chr)))
        ++width;
    }

    return width;
  }

  /**
   * @brief Number of Unicode scalar values in @p text. Escape bytes are not skipped.
   */
  constexpr auto ScalarCount(const types::StringView text) -> types::usize {
    types::usize count = 0;

    for (const char chr : text)
      if (IsUtf8LeadByte(static_cast<types::u8>(chr)))
        ++count;

    return count;
  }

  /**
   * @brief Returns @p text with every escape sequence removed.
   */
  inline auto StripAnsi(const types::StringView text) -> types::String {
    types::String out;
    out.reserve(text.size());

    bool inEscape = false;

    for (const char chr : text) {
      if (chr == ESCAPE_BYTE)
        inEscape = true;
      else if (inEscape) {
        if (chr == 'm')
          inEscape = false;
      } else
        out += chr;
    }

    return out;
  }

  /**
   * @brief Widest line in @p lines, 0 for an empty list.
   */
  inline auto MaxVisibleWidth(const types::Span<const types::String> lines) -> types::usize {
    types::usize widest = 0;

    for (const types::String& line : lines)
      widest = std::max(widest, VisibleWidth(line));

    return widest;
  }
} // namespace slowfetch::render
