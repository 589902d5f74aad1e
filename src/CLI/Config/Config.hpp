#pragma once

#include <filesystem> // std::filesystem::path

#include <Slowfetch/Utils/Logging.hpp>
#include <Slowfetch/Utils/Types.hpp>

namespace slowfetch::config {
  namespace types = ::slowfetch::utils::types;

  using Rgb = ::slowfetch::utils::logging::Rgb;

  inline constexpr types::usize ART_COLOR_COUNT = 9;

  /**
   * @brief Parses "#RRGGBB" or "RRGGBB" (surrounding whitespace and quotes ignored).
   */
  auto ParseHexColor(types::StringView hex) -> types::Option<Rgb>;

  /**
   * @brief Replaces a leading "~/" with $HOME. Other paths are returned unchanged.
   */
  auto ExpandHome(types::StringView path) -> types::String;

  enum class OsArtMode : types::u8 {
    Off,   ///< Default art.
    Auto,  ///< Art for the detected distribution.
    Named, ///< Art for a distribution chosen by name.
  };

  struct OsArt {
    OsArtMode                    mode = OsArtMode::Off;
    types::Option<types::String> name;

    /**
     * @brief Interprets a `general.os_art` value: "off"/"false", "auto"/"true", or an OS name.
     */
    static auto parse(types::StringView value) -> OsArt;
  };

  /**
   * @struct General
   * @brief Art selection settings from `[general]`.
   */
  struct General {
    OsArt                        osArt;
    types::Option<types::String> customArt; ///< Already ~-expanded.
  };

  /**
   * @struct Colors
   * @brief Palette from `[colors]`.
   */
  struct Colors {
    Rgb border = { .red = 0xFF, .green = 0x79, .blue = 0xC6 };
    Rgb title  = { .red = 0xFF, .green = 0x79, .blue = 0xC6 };
    Rgb key    = { .red = 0xBD, .green = 0x93, .blue = 0xF9 };
    Rgb value  = { .red = 0x8B, .green = 0xE9, .blue = 0xFD };

    // clang-format off
    types::Array<Rgb, ART_COLOR_COUNT> art = {{
      { .red = 0xFF, .green = 0x00, .blue = 0x00 }, // red
      { .red = 0xFF, .green = 0x80, .blue = 0x00 }, // orange
      { .red = 0xFF, .green = 0xFF, .blue = 0x00 }, // yellow
      { .red = 0x00, .green = 0xFF, .blue = 0x00 }, // green
      { .red = 0x00, .green = 0xFF, .blue = 0xFF }, // cyan
      { .red = 0x00, .green = 0xBF, .blue = 0xFF }, // light blue
      { .red = 0x55, .green = 0x55, .blue = 0xFF }, // blue
      { .red = 0xAA, .green = 0x55, .blue = 0xFF }, // violet
      { .red = 0xFF, .green = 0x55, .blue = 0xFF }, // magenta
    }};
    // clang-format on
  };

  /**
   * @struct Config
   * @brief Holds the application configuration settings.
   */
  struct Config {
    General general;
    Colors  colors;

    Config() = default;

    /**
     * @brief Loads the configuration from the first existing config file.
     *
     * A missing file yields the defaults. A file that cannot be read or parsed
     * is logged and also yields the defaults. No file is ever created.
     */
    static auto getInstance() -> Config;

    /**
     * @brief Returns the first existing path out of `$XDG_CONFIG_HOME/slowfetch/config.toml`,
     *        `$HOME/.config/slowfetch/config.toml` and `./config.toml`.
     */
    static auto getConfigPath() -> types::Option<std::filesystem::path>;

    /**
     * @brief Parses TOML text. Unknown tables and keys are ignored; malformed colours keep their default.
     */
    static auto fromToml(types::StringView toml) -> types::Result<Config>;
  };
} // namespace slowfetch::config
