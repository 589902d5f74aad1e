#include "AsciiArt.hpp"

#include <cctype>       // std::tolower
#include <filesystem>   // std::filesystem::{exists, path}
#include <fstream>      // std::ifstream
#include <iterator>     // std::istreambuf_iterator
#include <ranges>       // std::views::split
#include <system_error> // std::error_code
#include <utility>      // std::move

#include <Slowfetch/Utils/Error.hpp>
#include <Slowfetch/Utils/Logging.hpp>

namespace slowfetch::ui::ascii {
  using namespace utils::types;
  using enum utils::error::SlowErrorCode;

  namespace fs = std::filesystem;

  namespace {
    constexpr StringView RESET = "\033[0m";

    // Keys match by substring, so "cachy" also covers "cachyos" and "nix"
    // covers "nixos". cachy is listed ahead of arch so "CachyOS (Arch based)"
    // picks its own logo.
    // clang-format off
    constexpr Array<Pair<StringView, OsLogo>, 5> LOGOS = {{
      {  "cachy", { .full = logos::CACHYOS, .smol = logos::CACHYOS_SMOL } },
      {   "arch", { .full = logos::ARCH,    .smol = logos::ARCH_SMOL    } },
      { "fedora", { .full = logos::FEDORA,  .smol = logos::FEDORA_SMOL  } },
      { "ubuntu", { .full = logos::UBUNTU,  .smol = logos::UBUNTU_SMOL  } },
      {    "nix", { .full = logos::NIXOS,   .smol = logos::NIXOS_SMOL   } },
    }};
    // clang-format on

    auto ToLower(const StringView text) -> String {
      String out(text);
      for (char& chr : out)
        chr = static_cast<char>(std::tolower(static_cast<u8>(chr)));
      return out;
    }

    // Index into the palette when `text` starts with "{N}", N in 1..9.
    constexpr auto PlaceholderAt(const StringView text) -> Option<usize> {
      if (text.size() < 3 || text[0] != '{' || text[2] != '}')
        return None;

      if (text[1] < '1' || text[1] > '9')
        return None;

      return static_cast<usize>(text[1] - '1');
    }
  } // namespace

  auto FindOsLogo(const StringView osName) -> Option<OsLogo> {
    const String lower = ToLower(osName);

    for (const auto& [key, logo] : LOGOS)
      if (lower.find(key) != String::npos)
        return logo;

    return None;
  }

  auto SplitArt(const StringView art) -> Vec<String> {
    Vec<String> lines;

    for (auto lineRange : art | std::views::split('\n')) {
      String line(lineRange.begin(), lineRange.end());

      if (line.ends_with('\r'))
        line.pop_back();

      lines.push_back(std::move(line));
    }

    if (!lines.empty() && lines.back().empty())
      lines.pop_back();

    return lines;
  }

  auto ColorizeArt(const Span<const String> lines, const Option<Palette>& palette) -> Vec<String> {
    Vec<String> out;
    out.reserve(lines.size());

    Option<usize> active;

    for (const String& line : lines) {
      String result;
      result.reserve(line.size() * 2);

      if (palette && active)
        result += utils::logging::TrueColorCode(palette->at(*active));

      StringView rest = line;

      while (!rest.empty()) {
        if (const Option<usize> index = PlaceholderAt(rest)) {
          active = index;

          if (palette)
            result += utils::logging::TrueColorCode(palette->at(*index));

          rest.remove_prefix(3);
          continue;
        }

        result += rest.front();
        rest.remove_prefix(1);
      }

      if (palette && active)
        result += RESET;

      out.push_back(std::move(result));
    }

    return out;
  }

  auto LoadCustomArt(const fs::path& path) -> Result<Vec<String>> {
    if (std::error_code errc; !fs::exists(path, errc) || errc)
      ERR_FMT(NotFound, "Custom art file not found: {}", path.string());

    std::ifstream file(path, std::ios::binary);

    if (!file.is_open())
      ERR_FMT(IoError, "Failed to open custom art file: {}", path.string());

    const String contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    if (file.bad())
      ERR_FMT(IoError, "Failed to read custom art file: {}", path.string());

    Vec<String> lines = SplitArt(contents);

    if (lines.empty())
      ERR_FMT(ParseError, "Custom art file is empty: {}", path.string());

    return lines;
  }

  auto DefaultArt(const Option<Palette>& palette) -> render::ArtVariants {
    return {
      .wide    = ColorizeArt(SplitArt(logos::DEFAULT_WIDE), palette),
      .medium  = ColorizeArt(SplitArt(logos::DEFAULT_MEDIUM), palette),
      .narrow  = ColorizeArt(SplitArt(logos::DEFAULT_NARROW), palette),
      .compact = None,
    };
  }

  auto OsArt(const StringView osName, const Option<Palette>& palette) -> Option<render::ArtVariants> {
    const Option<OsLogo> logo = FindOsLogo(osName);

    if (!logo) {
      debug_log("No logo for '{}'", osName);
      return None;
    }

    Vec<String> full = ColorizeArt(SplitArt(logo->full), palette);

    return render::ArtVariants {
      .wide    = full,
      .medium  = full,
      .narrow  = full,
      .compact = ColorizeArt(SplitArt(logo->smol), palette),
    };
  }

  auto CustomArt(const Span<const String> lines, const Option<Palette>& palette) -> render::ArtVariants {
    Vec<String> art = ColorizeArt(lines, palette);

    return { .wide = art, .medium = art, .narrow = art, .compact = None };
  }
} // namespace slowfetch::ui::ascii
