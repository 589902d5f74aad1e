#pragma once

#include <Slowfetch/Render/Layout.hpp>
#include <Slowfetch/Render/Sections.hpp>
#include <Slowfetch/Render/Theme.hpp>
#include <Slowfetch/Utils/Types.hpp>

#include "Config/Config.hpp"

namespace slowfetch::ui {
  namespace types  = ::slowfetch::utils::types;
  namespace config = ::slowfetch::config;

  struct UIOptions {
    types::Option<config::OsArt> osOverride; ///< From `--os`; replaces `general.os_art`.
    types::Option<types::String> detectedOs; ///< Used when OS art is in auto mode.
    bool                         noArt   = false;
    bool                         noColor = false;
  };

  /**
   * @brief Maps the configured colours onto render roles. Empty when colour is off.
   */
  auto MakeTheme(const config::Colors& colors, bool color) -> render::Theme;

  /**
   * @brief Picks the art to render.
   *
   * OS art (`--os`, else `general.os_art`) wins when a logo exists for the
   * name; otherwise `general.custom_art` when it loads; otherwise the built-in
   * art. Placeholders are already resolved in the returned lines.
   */
  auto ResolveArt(const config::Config& config, const UIOptions& options) -> render::ArtVariants;

  /**
   * @brief Renders the sections with the resolved art for the current terminal.
   */
  auto CreateUI(const config::Config& config, types::Span<const render::Section> sections, const UIOptions& options) -> types::String;
} // namespace slowfetch::ui
