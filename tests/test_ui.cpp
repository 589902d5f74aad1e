#include <boost/ut.hpp>

#include <algorithm>  // std::ranges::count
#include <filesystem> // std::filesystem::{remove, temp_directory_path}
#include <fstream>    // std::ofstream

#include <Slowfetch/Render/Width.hpp>
#include <Slowfetch/Utils/Types.hpp>

#include "Config/Config.hpp"
#include "UI/AsciiArt.hpp"
#include "UI/UI.hpp"

namespace fs = std::filesystem;

auto main() -> int {
  using namespace boost::ut;
  using namespace slowfetch::ui;
  using namespace slowfetch::utils::types;
  using slowfetch::config::Config;
  using slowfetch::config::OsArt;
  using slowfetch::render::Section;
  using slowfetch::render::StripAnsi;

  const Vec<Section> sections = { { .title = "Core", .lines = { { "OS", "Arch Linux" } } } };

  "theme follows the configured colours"_test = [] -> void {
    const Config cfg;

    const slowfetch::render::Theme colored = MakeTheme(cfg.colors, true);

    expect(colored.border == cfg.colors.border);
    expect(colored.key == cfg.colors.key);

    const slowfetch::render::Theme plain = MakeTheme(cfg.colors, false);

    expect(!plain.border && !plain.title && !plain.key && !plain.value);
  };

  "default art without any OS selection"_test = [] -> void {
    const Config cfg;

    const slowfetch::render::ArtVariants art = ResolveArt(cfg, { .noColor = true });

    expect(art.wide == ascii::DefaultArt(None).wide);
    expect(!art.compact.has_value());
  };

  "--os without a name uses the detected distribution"_test = [] -> void {
    const Config cfg;

    const slowfetch::render::ArtVariants art = ResolveArt(cfg, { .osOverride = OsArt::parse("auto"), .detectedOs = "Arch Linux", .noColor = true });

    expect(art.wide == ascii::OsArt("arch", None)->wide);
    expect(art.compact.has_value());
  };

  "--os overrides the configured os_art"_test = [] -> void {
    Config cfg;
    cfg.general.osArt = OsArt::parse("fedora");

    const slowfetch::render::ArtVariants fromConfig = ResolveArt(cfg, { .noColor = true });
    const slowfetch::render::ArtVariants override   = ResolveArt(cfg, { .osOverride = OsArt::parse("nixos"), .noColor = true });
    const slowfetch::render::ArtVariants disabled   = ResolveArt(cfg, { .osOverride = OsArt::parse("off"), .noColor = true });

    expect(fromConfig.wide == ascii::OsArt("fedora", None)->wide);
    expect(override.wide == ascii::OsArt("nixos", None)->wide);
    expect(disabled.wide == ascii::DefaultArt(None).wide);
  };

  "unknown distribution falls back to the default art"_test = [] -> void {
    const Config cfg;

    const slowfetch::render::ArtVariants art = ResolveArt(cfg, { .osOverride = OsArt::parse("haiku"), .noColor = true });

    expect(art.wide == ascii::DefaultArt(None).wide);
    expect(!art.compact.has_value());
  };

  "auto mode without a detected OS uses the default art"_test = [] -> void {
    const Config cfg;

    const slowfetch::render::ArtVariants art = ResolveArt(cfg, { .osOverride = OsArt::parse("auto"), .noColor = true });

    expect(art.wide == ascii::DefaultArt(None).wide);
  };

  "custom art replaces the default but not OS art"_test = [] -> void {
    const fs::path path = fs::temp_directory_path() / "slowfetch-ui-art.txt";
    std::ofstream(path) << "<o>\n";

    Config cfg;
    cfg.general.customArt = path.string();

    expect(ResolveArt(cfg, { .noColor = true }).medium == Vec<String> { "<o>" });
    expect(ResolveArt(cfg, { .osOverride = OsArt::parse("ubuntu"), .noColor = true }).wide == ascii::OsArt("ubuntu", None)->wide);

    fs::remove(path);

    // Unreadable custom art is reported and skipped.
    expect(ResolveArt(cfg, { .noColor = true }).wide == ascii::DefaultArt(None).wide);
  };

  "coloured art keeps the plain text"_test = [] -> void {
    const Config cfg;

    const slowfetch::render::ArtVariants plain   = ResolveArt(cfg, { .noColor = true });
    const slowfetch::render::ArtVariants colored = ResolveArt(cfg, {});

    expect(colored.wide.size() == plain.wide.size());
    expect(colored.wide != plain.wide);

    for (usize i = 0; i < plain.wide.size(); ++i)
      expect(StripAnsi(colored.wide[i]) == plain.wide[i]);
  };

  "--no-art renders sections only"_test = [&] -> void {
    const Config cfg;

    const String output = CreateUI(cfg, sections, { .noArt = true, .noColor = true });

    expect(std::ranges::count(output, '\n') == 3_l);
    expect(output.starts_with("╭"));
    expect(output.find("OS: Arch Linux") != String::npos);
    expect(output.find('\x1b') == String::npos);
  };

  "--no-color output carries no escape sequences"_test = [&] -> void {
    const Config cfg;

    expect(CreateUI(cfg, sections, { .noColor = true }).find('\x1b') == String::npos);
  };

  return 0;
}
