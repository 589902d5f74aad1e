#include "UI.hpp"

#include <utility> // std::move

#include <Slowfetch/Utils/Logging.hpp>

#include "AsciiArt.hpp"

namespace slowfetch::ui {
  using namespace utils::types;

  namespace {
    auto MakePalette(const config::Colors& colors, const bool color) -> Option<ascii::Palette> {
      if (!color)
        return None;

      return colors.art;
    }

    auto OsArtName(const config::OsArt& osArt, const UIOptions& options) -> Option<String> {
      using enum config::OsArtMode;

      switch (osArt.mode) {
        case Off:   return None;
        case Auto:  return options.detectedOs;
        case Named: return osArt.name;
      }

      return None;
    }
  } // namespace

  auto MakeTheme(const config::Colors& colors, const bool color) -> render::Theme {
    if (!color)
      return {};

    return {
      .border = colors.border,
      .title  = colors.title,
      .key    = colors.key,
      .value  = colors.value,
    };
  }

  auto ResolveArt(const config::Config& config, const UIOptions& options) -> render::ArtVariants {
    const Option<ascii::Palette> palette = MakePalette(config.colors, !options.noColor);
    const config::OsArt&         osArt   = options.osOverride ? *options.osOverride : config.general.osArt;

    if (const Option<String> osName = OsArtName(osArt, options)) {
      if (Option<render::ArtVariants> art = ascii::OsArt(*osName, palette))
        return std::move(*art);

      debug_log("No OS art for '{}', using the default art", *osName);
    }

    if (config.general.customArt) {
      const Result<Vec<String>> lines = ascii::LoadCustomArt(*config.general.customArt);

      if (lines)
        return ascii::CustomArt(*lines, palette);

      warn_at(lines.error());
    }

    return ascii::DefaultArt(palette);
  }

  auto CreateUI(const config::Config& config, const Span<const render::Section> sections, const UIOptions& options) -> String {
    const render::Theme theme = MakeTheme(config.colors, !options.noColor);

    if (options.noArt)
      return render::RenderSectionsOnly(sections, theme);

    return render::Render(ResolveArt(config, options), sections, theme);
  }
} // namespace slowfetch::ui
