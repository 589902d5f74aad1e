#include <boost/ut.hpp>

#include <filesystem> // std::filesystem::{create_directories, remove_all, temp_directory_path}
#include <fstream>    // std::ofstream

#include <Slowfetch/Utils/Env.hpp>
#include <Slowfetch/Utils/Types.hpp>

#include "Config/Config.hpp"

namespace fs = std::filesystem;

auto main() -> int {
  using namespace boost::ut;
  using namespace slowfetch::config;
  using namespace slowfetch::utils::env;
  using namespace slowfetch::utils::types;

  "hex colours with and without #"_test = [] -> void {
    const Option<Rgb> hashed = ParseHexColor("#FF79C6");

    expect(hashed.has_value());
    expect(*hashed == Rgb { .red = 0xFF, .green = 0x79, .blue = 0xC6 });

    expect(ParseHexColor("8be9fd") == Option<Rgb>(Rgb { .red = 0x8B, .green = 0xE9, .blue = 0xFD }));
    expect(ParseHexColor("  \"#00ff00\" ") == Option<Rgb>(Rgb { .red = 0, .green = 0xFF, .blue = 0 }));
  };

  "malformed hex colours are rejected"_test = [] -> void {
    for (const StringView bad : { "", "#", "#FFF", "#GGGGGG", "#FF79C6AA", "12345", "zzzzzz" })
      expect(!ParseHexColor(bad).has_value()) << bad;
  };

  "os_art values"_test = [] -> void {
    expect(OsArt::parse("off").mode == OsArtMode::Off);
    expect(OsArt::parse("False").mode == OsArtMode::Off);
    expect(OsArt::parse("").mode == OsArtMode::Off);
    expect(OsArt::parse("auto").mode == OsArtMode::Auto);
    expect(OsArt::parse("TRUE").mode == OsArtMode::Auto);

    const OsArt named = OsArt::parse("Fedora");

    expect(named.mode == OsArtMode::Named);
    expect(named.name == Option<String>("Fedora"));
  };

  "empty document yields defaults"_test = [] -> void {
    Result<Config> cfg = Config::fromToml("");

    expect(cfg.has_value());
    expect(cfg->general.osArt.mode == OsArtMode::Off);
    expect(!cfg->general.customArt.has_value());
    expect(cfg->colors.border == Rgb { .red = 0xFF, .green = 0x79, .blue = 0xC6 });
    expect(cfg->colors.art[0] == Rgb { .red = 0xFF, .green = 0, .blue = 0 });
    expect(cfg->colors.art[8] == Rgb { .red = 0xFF, .green = 0x55, .blue = 0xFF });
  };

  "full document is applied"_test = [] -> void {
    constexpr StringView toml = R"(
[general]
os_art = "arch"
custom_art = "/opt/art.txt"

[colors]
border = "#112233"
title = "445566"
key = "#778899"
value = "#AABBCC"
art_1 = "#010203"
art_9 = "#090909"
)";

    Result<Config> cfg = Config::fromToml(toml);

    expect(cfg.has_value());
    expect(cfg->general.osArt.mode == OsArtMode::Named);
    expect(cfg->general.osArt.name == Option<String>("arch"));
    expect(cfg->general.customArt == Option<String>("/opt/art.txt"));
    expect(cfg->colors.border == Rgb { .red = 0x11, .green = 0x22, .blue = 0x33 });
    expect(cfg->colors.title == Rgb { .red = 0x44, .green = 0x55, .blue = 0x66 });
    expect(cfg->colors.key == Rgb { .red = 0x77, .green = 0x88, .blue = 0x99 });
    expect(cfg->colors.value == Rgb { .red = 0xAA, .green = 0xBB, .blue = 0xCC });
    expect(cfg->colors.art[0] == Rgb { .red = 1, .green = 2, .blue = 3 });
    expect(cfg->colors.art[1] == Rgb { .red = 0xFF, .green = 0x80, .blue = 0 });
    expect(cfg->colors.art[8] == Rgb { .red = 9, .green = 9, .blue = 9 });
  };

  "bad colour keeps its default"_test = [] -> void {
    Result<Config> cfg = Config::fromToml("[colors]\nborder = \"not-a-colour\"\nkey = \"#000000\"\n");

    expect(cfg.has_value());
    expect(cfg->colors.border == Rgb { .red = 0xFF, .green = 0x79, .blue = 0xC6 });
    expect(cfg->colors.key == Rgb { .red = 0, .green = 0, .blue = 0 });
  };

  "unknown tables are tolerated"_test = [] -> void {
    Result<Config> cfg = Config::fromToml("[image]\nprotocol = \"kitty\"\n\n[general]\nos_art = \"auto\"\n");

    expect(cfg.has_value());
    expect(cfg->general.osArt.mode == OsArtMode::Auto);
  };

  "os_art accepts bare booleans"_test = [] -> void {
    Result<Config> enabled = Config::fromToml("[general]\nos_art = true\n\n[colors]\nborder = \"#010203\"\n");

    expect(enabled.has_value());
    expect(enabled->general.osArt.mode == OsArtMode::Auto);
    expect(enabled->colors.border == Rgb { .red = 0x01, .green = 0x02, .blue = 0x03 });

    Result<Config> disabled = Config::fromToml("[general]\nos_art = false\n");

    expect(disabled.has_value());
    expect(disabled->general.osArt.mode == OsArtMode::Off);
    expect(!disabled->general.osArt.name.has_value());
  };

  "malformed TOML is a parse error"_test = [] -> void {
    Result<Config> cfg = Config::fromToml("[general\nos_art = ");

    expect(!cfg.has_value());
  };

  "custom_art expands the home directory"_test = [] -> void {
    expect(SetEnv("HOME", "/home/tester").has_value());

    expect(ExpandHome("~/art.txt") == String("/home/tester/art.txt"));
    expect(ExpandHome("/abs/art.txt") == String("/abs/art.txt"));

    Result<Config> cfg = Config::fromToml("[general]\ncustom_art = \"~/.config/slowfetch/art.txt\"\n");

    expect(cfg.has_value());
    expect(cfg->general.customArt == Option<String>("/home/tester/.config/slowfetch/art.txt"));
  };

  "config path prefers XDG_CONFIG_HOME"_test = [] -> void {
    const fs::path root = fs::temp_directory_path() / "slowfetch-config-test";
    fs::remove_all(root);
    fs::create_directories(root / "xdg" / "slowfetch");
    fs::create_directories(root / "home" / ".config" / "slowfetch");

    std::ofstream(root / "home" / ".config" / "slowfetch" / "config.toml") << "[general]\nos_art = \"off\"\n";

    expect(SetEnv("XDG_CONFIG_HOME", (root / "xdg").c_str()).has_value());
    expect(SetEnv("HOME", (root / "home").c_str()).has_value());

    // Only the HOME file exists yet.
    expect(Config::getConfigPath() == Option<fs::path>(root / "home" / ".config" / "slowfetch" / "config.toml"));

    std::ofstream(root / "xdg" / "slowfetch" / "config.toml") << "[general]\nos_art = \"nixos\"\n";

    expect(Config::getConfigPath() == Option<fs::path>(root / "xdg" / "slowfetch" / "config.toml"));

    const Config cfg = Config::getInstance();

    expect(cfg.general.osArt.name == Option<String>("nixos"));

    expect(UnsetEnv("XDG_CONFIG_HOME").has_value());
    fs::remove_all(root);
  };

  return 0;
}
