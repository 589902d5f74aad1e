#include "Config.hpp"

#include <cctype>         // std::tolower
#include <charconv>       // std::from_chars
#include <filesystem>     // std::filesystem::{path, exists}
#include <format>         // std::format
#include <glaze/toml.hpp> // glz::read, glz::format_error
#include <system_error>   // std::error_code
#include <variant>        // std::variant, std::get_if

#include <Slowfetch/Utils/Env.hpp>
#include <Slowfetch/Utils/Error.hpp>
#include <Slowfetch/Utils/Logging.hpp>
#include <Slowfetch/Utils/Types.hpp>

namespace fs = std::filesystem;

using namespace slowfetch::utils::types;
using slowfetch::utils::env::GetEnv;
using enum slowfetch::utils::error::SlowErrorCode;

// Intermediate structs for TOML parsing with glaze.
// Empty strings mean "not provided".
namespace {
  // `os_art = true` and `os_art = "arch"` are both valid.
  using TomlOsArt = std::variant<bool, String>;

  struct TomlGeneral {
    TomlOsArt osArt = false;
    String customArt;
  };

  struct TomlColors {
    String border;
    String title;
    String key;
    String value;
    String art1;
    String art2;
    String art3;
    String art4;
    String art5;
    String art6;
    String art7;
    String art8;
    String art9;
  };

  struct TomlConfig {
    TomlGeneral general;
    TomlColors  colors;
  };
} // namespace

#ifdef __clang__
  #pragma clang diagnostic push
  #pragma clang diagnostic ignored "-Wunused-const-variable"
#endif

template <>
struct glz::meta<TomlGeneral> {
  using T                     = TomlGeneral;
  static constexpr auto value = object("os_art", &T::osArt, "custom_art", &T::customArt);
};

template <>
struct glz::meta<TomlColors> {
  using T = TomlColors;
  // clang-format off
  static constexpr auto value = object(
    "border", &T::border, "title", &T::title, "key", &T::key, "value", &T::value,
    "art_1", &T::art1, "art_2", &T::art2, "art_3", &T::art3,
    "art_4", &T::art4, "art_5", &T::art5, "art_6", &T::art6,
    "art_7", &T::art7, "art_8", &T::art8, "art_9", &T::art9
  );
  // clang-format on
};

template <>
struct glz::meta<TomlConfig> {
  using T                     = TomlConfig;
  static constexpr auto value = object("general", &T::general, "colors", &T::colors);
};

#ifdef __clang__
  #pragma clang diagnostic pop
#endif

namespace {
  auto ApplyColor(const String& raw, slowfetch::config::Rgb& target, const StringView name) -> void {
    if (raw.empty())
      return;

    if (const Option<slowfetch::config::Rgb> color = slowfetch::config::ParseHexColor(raw))
      target = *color;
    else
      warn_log("Ignoring invalid colour '{}' for colors.{}", raw, name);
  }

  auto ResolveOsArt(const TomlOsArt& value) -> slowfetch::config::OsArt {
    using slowfetch::config::OsArt, slowfetch::config::OsArtMode;

    if (const bool* enabled = std::get_if<bool>(&value))
      return *enabled ? OsArt { .mode = OsArtMode::Auto, .name = None } : OsArt {};

    return OsArt::parse(std::get<String>(value));
  }

  auto ToLower(const StringView text) -> String {
    String out(text);
    for (char& chr : out)
      chr = static_cast<char>(std::tolower(static_cast<u8>(chr)));
    return out;
  }
} // namespace

namespace slowfetch::config {
  auto ParseHexColor(StringView hex) -> Option<Rgb> {
    constexpr StringView strip = " \t\"'";

    const usize first = hex.find_first_not_of(strip);
    if (first == StringView::npos)
      return None;

    hex = hex.substr(first, hex.find_last_not_of(strip) - first + 1);

    if (hex.starts_with('#'))
      hex.remove_prefix(1);

    if (hex.size() != 6)
      return None;

    Array<u8, 3> channels {};

    for (usize i = 0; i < channels.size(); ++i) {
      const char* begin = hex.data() + (i * 2);

      const auto [ptr, errc] = std::from_chars(begin, begin + 2, channels.at(i), 16);

      if (errc != std::errc() || ptr != begin + 2)
        return None;
    }

    return Rgb { .red = channels[0], .green = channels[1], .blue = channels[2] };
  }

  auto ExpandHome(const StringView path) -> String {
    if (!path.starts_with("~/"))
      return String(path);

    if (Result<String> home = GetEnv("HOME"))
      return *home + String(path.substr(1));

    return String(path);
  }

  auto OsArt::parse(const StringView value) -> OsArt {
    const String lower = ToLower(value);

    if (lower.empty() || lower == "off" || lower == "false")
      return {};

    if (lower == "auto" || lower == "true")
      return { .mode = OsArtMode::Auto, .name = None };

    return { .mode = OsArtMode::Named, .name = String(value) };
  }

  auto Config::getConfigPath() -> Option<fs::path> {
    Vec<fs::path> possiblePaths;

    if (Result<String> result = GetEnv("XDG_CONFIG_HOME"))
      possiblePaths.emplace_back(fs::path(*result) / "slowfetch" / "config.toml");

    if (Result<String> result = GetEnv("HOME"))
      possiblePaths.emplace_back(fs::path(*result) / ".config" / "slowfetch" / "config.toml");

    possiblePaths.emplace_back(fs::path(".") / "config.toml");

    for (const fs::path& path : possiblePaths)
      if (std::error_code errc; fs::exists(path, errc) && !errc)
        return path;

    return None;
  }

  auto Config::fromToml(const StringView toml) -> Result<Config> {
    TomlConfig tomlCfg;
    String     buffer(toml);

    // Unknown tables (e.g. settings for features this build lacks) are not an error.
    if (const auto readError = glz::read<glz::opts { .format = glz::TOML, .error_on_unknown_keys = false }>(tomlCfg, buffer))
      ERR_FMT(ParseError, "Failed to parse config: {}", glz::format_error(readError, buffer));

    Config cfg;

    cfg.general.osArt = ResolveOsArt(tomlCfg.general.osArt);

    if (!tomlCfg.general.customArt.empty())
      cfg.general.customArt = ExpandHome(tomlCfg.general.customArt);

    const TomlColors& colors = tomlCfg.colors;

    ApplyColor(colors.border, cfg.colors.border, "border");
    ApplyColor(colors.title, cfg.colors.title, "title");
    ApplyColor(colors.key, cfg.colors.key, "key");
    ApplyColor(colors.value, cfg.colors.value, "value");

    const Array<const String*, ART_COLOR_COUNT> artColors = {
      &colors.art1, &colors.art2, &colors.art3, &colors.art4, &colors.art5, &colors.art6, &colors.art7, &colors.art8, &colors.art9
    };

    for (usize i = 0; i < ART_COLOR_COUNT; ++i)
      ApplyColor(*artColors.at(i), cfg.colors.art.at(i), std::format("art_{}", i + 1));

    return cfg;
  }

  auto Config::getInstance() -> Config {
    const Option<fs::path> configPath = getConfigPath();

    if (!configPath) {
      debug_log("No config file found, using defaults.");
      return {};
    }

    String buffer;

    if (const auto fileError = glz::file_to_buffer(buffer, configPath->string()); bool(fileError)) {
      error_log("Failed to read config file: {}", configPath->string());
      return {};
    }

    Result<Config> cfg = fromToml(buffer);

    if (!cfg) {
      error_at(cfg.error());
      return {};
    }

    debug_log("Config loaded from {}", configPath->string());

    return *cfg;
  }
} // namespace slowfetch::config
