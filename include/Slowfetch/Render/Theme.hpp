/**
 * @file Theme.hpp
 * @brief Colour roles applied while rendering boxes and sections.
 */

#pragma once

#include "../Utils/Logging.hpp"
#include "../Utils/Types.hpp"

namespace slowfetch::render {
  namespace types = ::slowfetch::utils::types;

  using Rgb = ::slowfetch::utils::logging::Rgb;

  /**
   * @struct Theme
   * @brief Per-role foreground colours. An unset role is emitted unstyled,
   *        so a default-constructed Theme produces plain text.
   */
  struct Theme {
    types::Option<Rgb> border;
    types::Option<Rgb> title;
    types::Option<Rgb> key;
    types::Option<Rgb> value;
  };

  inline auto Paint(const types::StringView text, const types::Option<Rgb>& color) -> types::String {
    if (!color || text.empty())
      return types::String(text);

    return utils::logging::Colorize(text, *color);
  }
} // namespace slowfetch::render
