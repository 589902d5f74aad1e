#include <algorithm>   // std::ranges::{equal, find_if}
#include <cctype>      // std::isspace, std::tolower, std::toupper
#include <cmath>       // std::round, std::abs
#include <format>      // std::format
#include <matchit.hpp> // matchit::{match, is, _, or_}
#include <ranges>      // std::views::{split, common}

#include <Slowfetch/Core/System.hpp>
#include <Slowfetch/Utils/Error.hpp>

using enum slowfetch::utils::error::SlowErrorCode;
using namespace slowfetch::utils::types;

namespace {
  constexpr auto Trim(StringView text) -> StringView {
    constexpr StringView whitespace = " \t\n\r";

    const usize first = text.find_first_not_of(whitespace);
    if (first == StringView::npos)
      return {};

    return text.substr(first, text.find_last_not_of(whitespace) - first + 1);
  }

  constexpr auto Unquote(StringView value) -> StringView {
    if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') || (value.front() == '\'' && value.back() == '\'')))
      return value.substr(1, value.size() - 2);

    return value;
  }

  auto EqualsIgnoreCase(const StringView lhs, const StringView rhs) -> bool {
    return std::ranges::equal(lhs, rhs, [](const char lchr, const char rchr) {
      return std::tolower(static_cast<u8>(lchr)) == std::tolower(static_cast<u8>(rchr));
    });
  }

  auto ToLower(const StringView text) -> String {
    String out(text);
    for (char& chr : out)
      chr = static_cast<char>(std::tolower(static_cast<u8>(chr)));
    return out;
  }

  template <typename Fn>
  auto ForEachLine(const StringView buffer, Fn&& callback) -> void {
    using std::views::common;
    using std::views::split;

    for (auto lineRange : buffer | split('\n') | common)
      if (callback(StringView(lineRange.begin(), lineRange.end())))
        return;
  }

  auto FormatGigabytes(const u64 bytes) -> String {
    return std::format("{:.0f}GB", static_cast<f64>(bytes) / 1e9);
  }
} // namespace

namespace slowfetch::core::system {
  auto ParseOsRelease(const StringView contents) -> Result<String> {
    Option<String> prettyName;

    ForEachLine(contents, [&](const StringView line) {
      if (!line.starts_with("PRETTY_NAME="))
        return false;

      prettyName = String(Unquote(Trim(line.substr(12))));
      return true;
    });

    if (!prettyName)
      ERR(NotFound, "PRETTY_NAME not found in os-release");

    if (prettyName->empty())
      ERR(ParseError, "PRETTY_NAME is empty in os-release");

    return *prettyName;
  }

  auto ParseCpuModel(const StringView cpuinfo) -> Result<String> {
    Option<String> model;

    ForEachLine(cpuinfo, [&](const StringView line) {
      if (!line.starts_with("model name"))
        return false;

      const usize colon = line.find(':');
      if (colon == StringView::npos)
        return false;

      String cleaned;

      for (auto wordRange : line.substr(colon + 1) | std::views::split(' ')) {
        const StringView word(wordRange.begin(), wordRange.end());

        if (word.empty())
          continue;

        // "with Radeon Graphics", "w/ Intel UHD" describe the iGPU
        if (EqualsIgnoreCase(word, "with") || EqualsIgnoreCase(word, "w/"))
          break;

        if (word.ends_with("-Core") || word == "Processor")
          continue;

        if (!cleaned.empty())
          cleaned += ' ';
        cleaned += Trim(word);
      }

      model = std::move(cleaned);
      return true;
    });

    if (!model)
      ERR(NotFound, "No 'model name' entry in cpuinfo");

    if (model->empty())
      ERR(ParseError, "'model name' entry in cpuinfo is empty");

    return *model;
  }

  auto FormatBoostClock(const u64 kilohertz) -> String {
    return std::format(" @ {:.2f}GHz", static_cast<f64>(kilohertz) / 1'000'000.0);
  }

  auto LookupPciNamesFromBuffer(const StringView buffer, const StringView vendorId, const StringView deviceId) -> Result<Pair<String, String>> {
    const String vendorIdStr = ToLower(vendorId.starts_with("0x") ? vendorId.substr(2) : vendorId);
    const String deviceIdStr = ToLower(deviceId.starts_with("0x") ? deviceId.substr(2) : deviceId);

    bool                         inVendor = false;
    StringView                   vendorName;
    Option<Pair<String, String>> found;

    ForEachLine(buffer, [&](const StringView line) {
      if (line.empty() || line.front() == '#')
        return false;

      if (line.front() != '\t') {
        // A new vendor block ends the previous one.
        if (inVendor)
          return true;

        if (line.starts_with(vendorIdStr) && line.size() > 4 && line[4] == ' ') {
          inVendor   = true;
          vendorName = Trim(line.substr(4));
        }

        return false;
      }

      if (inVendor && line.size() > 1 && line[1] != '\t' && line.substr(1).starts_with(deviceIdStr)) {
        found = Pair(String(vendorName), String(Trim(line.substr(1 + deviceIdStr.size()))));
        return true;
      }

      return false;
    });

    if (!found)
      ERR_FMT(NotFound, "PCI device {}:{} not found in pci.ids", vendorId, deviceId);

    return *found;
  }

  auto CleanGpuModelName(String vendor, String device) -> String {
    if (vendor.find("[AMD/ATI]") != String::npos || vendor.starts_with("Advanced Micro Devices"))
      vendor = "AMD";
    else if (const usize pos = vendor.find(' '); pos != String::npos)
      vendor.resize(pos);

    if (const usize openPos = device.find('['); openPos != String::npos)
      if (const usize closePos = device.find(']', openPos); closePos != String::npos)
        device = device.substr(openPos + 1, closePos - openPos - 1);

    return std::format("{} {}", Trim(vendor), Trim(device));
  }

  auto ParseMemInfo(const StringView meminfo) -> Result<ResourceUsage> {
    Option<u64> totalKb;
    Option<u64> availableKb;

    const auto readKb = [](StringView rest) -> Option<u64> {
      rest = Trim(rest);
      if (rest.ends_with(" kB"))
        rest.remove_suffix(3);
      return TryParse<u64>(Trim(rest));
    };

    ForEachLine(meminfo, [&](const StringView line) {
      if (line.starts_with("MemTotal:"))
        totalKb = readKb(line.substr(9));
      else if (line.starts_with("MemAvailable:"))
        availableKb = readKb(line.substr(13));

      return totalKb && availableKb;
    });

    if (!totalKb || *totalKb == 0)
      ERR(ParseError, "MemTotal missing or zero in meminfo");

    if (!availableKb)
      ERR(ParseError, "MemAvailable missing in meminfo");

    const u64 usedKb = *totalKb > *availableKb ? *totalKb - *availableKb : 0;

    // meminfo's "kB" is read as 1000 bytes so figures come out in decimal GB.
    return ResourceUsage(usedKb * 1000, *totalKb * 1000);
  }

  auto FormatUptime(const std::chrono::seconds uptime) -> String {
    using namespace std::chrono;
    using matchit::match, matchit::is, matchit::_;

    const auto totalMinutes = duration_cast<minutes>(uptime);
    const auto hrs          = duration_cast<hours>(totalMinutes);
    const auto mins         = totalMinutes - hrs;

    return match(hrs.count())(
      is | 0 = [&] { return std::format("{}m", mins.count()); },
      is | _ = [&] { return std::format("{}h {}m", hrs.count(), mins.count()); }
    );
  }

  auto UsageBar(const f64 percent) -> String {
    const f64   clamped = std::clamp(percent, 0.0, 100.0);
    const usize filled  = std::min<usize>(10, static_cast<usize>(std::round(clamped / 10.0)));

    return std::format("[{}{}]", String(filled, '='), String(10 - filled, ' '));
  }

  auto FormatMemory(const ResourceUsage& usage) -> String {
    return std::format("{} {}/{}", UsageBar(usage.percent()), FormatGigabytes(usage.usedBytes), FormatGigabytes(usage.totalBytes));
  }

  auto FormatStorage(const ResourceUsage& usage) -> String {
    const f64 totalGb = static_cast<f64>(usage.totalBytes) / 1e9;

    if (totalGb < 1000.0)
      return FormatMemory(usage);

    const f64 totalTb = totalGb / 1000.0;

    const String total = std::abs(totalTb - std::round(totalTb)) < 0.005
      ? std::format("{}TB", static_cast<u64>(std::round(totalTb)))
      : std::format("{:.2f}TB", totalTb);

    return std::format("{} {}/{}", UsageBar(usage.percent()), FormatGigabytes(usage.usedBytes), total);
  }

  auto CleanTerminalName(const StringView term) -> String {
    StringView name = term;

    for (const StringView suffix : { StringView("-256color"), StringView("-color") })
      if (const usize pos = name.find(suffix); pos != StringView::npos)
        name = name.substr(0, pos);

    return Capitalize(name);
  }

  auto WindowManagerForDesktop(const StringView desktop) -> String {
    using matchit::match, matchit::is, matchit::or_, matchit::_;

    const String lower = ToLower(desktop);

    return match(StringView(lower))(
      is | "hyprland"           = String("Hyprland"),
      is | "sway"               = String("Sway"),
      is | or_("kde", "plasma") = String("KWin"),
      is | "gnome"              = String("Mutter"),
      is | "xfce"               = String("Xfwm4"),
      is | "i3"                 = String("i3"),
      is | "bspwm"              = String("bspwm"),
      is | "awesome"            = String("Awesome"),
      is | "qtile"              = String("Qtile"),
      is | "niri"               = String("Niri"),
      is | _                    = String(desktop)
    );
  }

  auto Capitalize(const StringView text) -> String {
    String out(text);

    if (!out.empty())
      out.front() = static_cast<char>(std::toupper(static_cast<u8>(out.front())));

    return out;
  }
} // namespace slowfetch::core::system
