#ifdef __linux__

  #include <algorithm>     // std::ranges::find_if
  #include <cerrno>        // errno
  #include <cstring>       // std::strlen
  #include <filesystem>    // std::filesystem::{directory_iterator, exists, path}
  #include <format>        // std::format
  #include <fstream>       // std::ifstream
  #include <iterator>      // std::istreambuf_iterator
  #include <sys/statvfs.h> // statvfs
  #include <sys/sysinfo.h> // sysinfo
  #include <sys/utsname.h> // uname
  #include <utility>       // std::move

  #include <Slowfetch/Core/System.hpp>
  #include <Slowfetch/Utils/Env.hpp>
  #include <Slowfetch/Utils/Error.hpp>
  #include <Slowfetch/Utils/Logging.hpp>
  #include <Slowfetch/Utils/Types.hpp>

using enum slowfetch::utils::error::SlowErrorCode;
using namespace slowfetch::utils::types;
namespace fs = std::filesystem;

namespace {
  using slowfetch::utils::env::GetEnv;

  auto ReadFile(const fs::path& path) -> Result<String> {
    std::ifstream file(path, std::ios::binary);

    if (!file.is_open())
      ERR_FMT(slowfetch::utils::error::FromErrno(errno), "Failed to open {}", path.string());

    String contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    if (file.bad())
      ERR_FMT(IoError, "Failed to read {}", path.string());

    return contents;
  }

  auto ReadSysFile(const fs::path& path) -> Result<String> {
    std::ifstream file(path);
    if (!file.is_open())
      ERR_FMT(NotFound, "Failed to open sysfs file: {}", path.string());

    String line;

    if (std::getline(file, line)) {
      if (const usize pos = line.find_last_not_of(" \t\n\r"); pos != String::npos)
        line.erase(pos + 1);

      return line;
    }

    ERR_FMT(IoError, "Failed to read from sysfs file: {}", path.string());
  }

  auto FindPciIDsPath() -> fs::path {
    const Array<fs::path, 3> knownPaths = {
      "/usr/share/hwdata/pci.ids",
      "/usr/share/misc/pci.ids",
      "/usr/share/pci.ids"
    };

    for (const fs::path& path : knownPaths)
      if (fs::exists(path))
        return path;

    return {};
  }

  auto LookupPciNames(const StringView vendorId, const StringView deviceId) -> Result<Pair<String, String>> {
    const fs::path pciIdsPath = FindPciIDsPath();

    if (pciIdsPath.empty())
      ERR(NotFound, "Could not find pci.ids");

    const String contents = TRY(ReadFile(pciIdsPath));

    return slowfetch::core::system::LookupPciNamesFromBuffer(contents, vendorId, deviceId);
  }

  auto GetDiskUsageAt(const char* path) -> Result<ResourceUsage> {
    struct statvfs stat {};

    if (statvfs(path, &stat) == -1)
      ERR_FMT(slowfetch::utils::error::FromErrno(errno), "statvfs('{}') failed: {}", path, std::strerror(errno));

    const u64 blockSize  = stat.f_frsize;
    const u64 totalBytes = stat.f_blocks * blockSize;
    const u64 freeBytes  = stat.f_bfree * blockSize;

    return ResourceUsage(totalBytes - freeBytes, totalBytes);
  }

  /**
   * @brief Returns the first /proc/<pid>/cmdline that contains one of @p needles.
   */
  auto FindProcessMatching(const Span<const Pair<StringView, StringView>> needles) -> Option<StringView> {
    std::error_code errc;

    for (const fs::directory_entry& entry : fs::directory_iterator("/proc", errc)) {
      const String name = entry.path().filename().string();

      if (name.empty() || name.front() < '0' || name.front() > '9')
        continue;

      Result<String> cmdline = ReadFile(entry.path() / "cmdline");

      if (!cmdline)
        continue;

      for (const auto& [needle, display] : needles)
        if (cmdline->find(needle) != String::npos)
          return display;
    }

    return None;
  }
} // namespace

namespace slowfetch::core::system {
  auto GetOSName() -> Result<String> {
    const String contents = TRY(ReadFile("/etc/os-release"));
    return ParseOsRelease(contents);
  }

  auto GetKernelVersion() -> Result<String> {
    utsname uts {};

    if (uname(&uts) == -1)
      ERR_FMT(InternalError, "uname() failed: {}", std::strerror(errno));

    if (std::strlen(uts.release) == 0)
      ERR(ParseError, "uname() returned empty kernel release string");

    return String(uts.release);
  }

  auto GetUptime() -> Result<std::chrono::seconds> {
    struct sysinfo info {};

    if (sysinfo(&info) != 0)
      ERR(ApiUnavailable, "sysinfo call failed");

    return std::chrono::seconds(info.uptime);
  }

  auto GetCPUModel() -> Result<String> {
    const String cpuinfo = TRY(ReadFile("/proc/cpuinfo"));
    String       model   = TRY(ParseCpuModel(cpuinfo));

    if (Result<String> maxFreq = ReadSysFile("/sys/devices/system/cpu/cpu0/cpufreq/cpuinfo_max_freq"))
      if (const Option<u64> khz = TryParse<u64>(*maxFreq); khz && *khz > 0)
        model += FormatBoostClock(*khz);

    return model;
  }

  auto GetGPUModel() -> Result<String> {
    const fs::path pciPath = "/sys/bus/pci/devices";

    if (!fs::exists(pciPath))
      ERR(NotFound, "PCI device path '/sys/bus/pci/devices' not found.");

    // clang-format off
    const Array<Pair<StringView, StringView>, 3> fallbackVendorMap = {{
      { "0x1002", "AMD" },
      { "0x10de", "NVIDIA" },
      { "0x8086", "Intel" },
    }};
    // clang-format on

    std::error_code errc;

    for (const fs::directory_entry& entry : fs::directory_iterator(pciPath, errc)) {
      if (Result<String> classIdRes = ReadSysFile(entry.path() / "class"); !classIdRes || !classIdRes->starts_with("0x03"))
        continue;

      Result<String> vendorIdRes = ReadSysFile(entry.path() / "vendor");
      Result<String> deviceIdRes = ReadSysFile(entry.path() / "device");

      if (vendorIdRes && deviceIdRes) {
        if (Result<Pair<String, String>> pciNames = LookupPciNames(*vendorIdRes, *deviceIdRes))
          return CleanGpuModelName(std::move(pciNames->first), std::move(pciNames->second));
        else
          debug_at(pciNames.error());
      }

      if (vendorIdRes) {
        const auto* iter = std::ranges::find_if(fallbackVendorMap, [&](const auto& pair) {
          return pair.first == *vendorIdRes;
        });

        if (iter != fallbackVendorMap.end())
          return String(iter->second);
      }
    }

    if (errc)
      ERR_FMT(slowfetch::utils::error::FromErrno(errc.value()), "Failed to list {}: {}", pciPath.string(), errc.message());

    ERR(NotFound, "No compatible GPU found in /sys/bus/pci/devices.");
  }

  auto GetMemInfo() -> Result<ResourceUsage> {
    const String meminfo = TRY(ReadFile("/proc/meminfo"));
    return ParseMemInfo(meminfo);
  }

  auto GetDiskUsage() -> Result<ResourceUsage> {
    const String mounts = TRY(ReadFile("/proc/mounts"));

    UnorderedMap<String, bool> seenDevices;
    ResourceUsage              total(0, 0);

    usize start = 0;

    while (start < mounts.size()) {
      usize end = mounts.find('\n', start);
      if (end == String::npos)
        end = mounts.size();

      const StringView line(mounts.data() + start, end - start);
      start = end + 1;

      const usize space1 = line.find(' ');
      if (space1 == StringView::npos)
        continue;

      const usize space2 = line.find(' ', space1 + 1);
      if (space2 == StringView::npos)
        continue;

      const String device(line.substr(0, space1));
      const String mountPoint(line.substr(space1 + 1, space2 - space1 - 1));

      if (!device.starts_with("/dev/") || device.find("/loop") != String::npos)
        continue;

      if (!seenDevices.try_emplace(device, true).second)
        continue;

      if (Result<ResourceUsage> usage = GetDiskUsageAt(mountPoint.c_str())) {
        total.usedBytes += usage->usedBytes;
        total.totalBytes += usage->totalBytes;
      } else
        debug_at(usage.error());
    }

    if (total.totalBytes == 0)
      return GetDiskUsageAt("/");

    return total;
  }

  auto GetPackageCount() -> Result<String> {
    String joined;

    const auto append = [&](const StringView manager, const usize count) {
      if (count == 0)
        return;

      if (!joined.empty())
        joined += " | ";

      joined += std::format("{} {}", manager, count);
    };

    const auto countEntries = [](const fs::path& dir, const bool dirsOnly) -> usize {
      std::error_code errc;
      usize           count = 0;

      for (const fs::directory_entry& entry : fs::directory_iterator(dir, errc))
        if (!dirsOnly || entry.is_directory(errc))
          ++count;

      return count;
    };

    append("pacman", countEntries("/var/lib/pacman/local", false));

    if (Result<String> status = ReadFile("/var/lib/dpkg/status")) {
      constexpr StringView needle = "\nStatus: install ok installed\n";

      usize count = 0;
      for (usize pos = status->find(needle); pos != String::npos; pos = status->find(needle, pos + 1))
        ++count;

      append("dpkg", count);
    }

    append("flatpak", countEntries("/var/lib/flatpak/app", false));
    append("xbps", countEntries("/var/db/xbps", true));

    if (joined.empty())
      ERR(NotFound, "No supported package manager database found");

    return joined;
  }

  auto GetTerminal() -> Result<String> {
    // clang-format off
    constexpr Array<Pair<PCStr, StringView>, 3> markers = {{
      { "KITTY_PID",             "Kitty" },
      { "KONSOLE_VERSION",       "Konsole" },
      { "GNOME_TERMINAL_SCREEN", "Gnome Terminal" },
    }};
    // clang-format on

    for (const auto& [variable, name] : markers)
      if (GetEnv(variable))
        return String(name);

    if (Result<String> program = GetEnv("TERM_PROGRAM"))
      return CleanTerminalName(*program);

    return GetEnv("TERM").transform([](const String& term) { return CleanTerminalName(term); });
  }

  auto GetShell() -> Result<String> {
    const String shellPath = TRY(GetEnv("SHELL"));

    const usize      lastSlash = shellPath.find_last_of('/');
    const StringView name      = lastSlash == String::npos ? StringView(shellPath) : StringView(shellPath).substr(lastSlash + 1);

    if (name.empty())
      ERR_FMT(ParseError, "SHELL '{}' has no executable name", shellPath);

    return Capitalize(name);
  }

  auto GetWindowManager() -> Result<String> {
    if (Result<String> desktop = GetEnv("XDG_CURRENT_DESKTOP"))
      return WindowManagerForDesktop(*desktop);

    if (Result<String> session = GetEnv("DESKTOP_SESSION"))
      return Capitalize(*session);

    // clang-format off
    constexpr Array<Pair<StringView, StringView>, 28> knownWms = {{
      { "mutter",        "Mutter" },        { "kwin",         "KWin" },
      { "sway",          "Sway" },          { "hyprland",     "Hyprland" },
      { "Hyprland",      "Hyprland" },      { "river",        "River" },
      { "wayfire",       "Wayfire" },       { "labwc",        "LabWC" },
      { "dwl",           "dwl" },           { "niri",         "Niri" },
      { "openbox",       "Openbox" },       { "i3",           "i3" },
      { "bspwm",         "bspwm" },         { "dwm",          "dwm" },
      { "awesome",       "Awesome" },       { "xfwm4",        "Xfwm4" },
      { "marco",         "Marco" },         { "metacity",     "Metacity" },
      { "compiz",        "Compiz" },        { "enlightenment", "Enlightenment" },
      { "fluxbox",       "Fluxbox" },       { "icewm",        "IceWM" },
      { "xmonad",        "XMonad" },        { "qtile",        "Qtile" },
      { "herbstluftwm",  "herbstluftwm" },  { "weston",       "Weston" },
      { "cage",          "Cage" },          { "gamescope",    "Gamescope" },
    }};
    // clang-format on

    if (const Option<StringView> found = FindProcessMatching(knownWms))
      return String(*found);

    ERR(NotFound, "No known window manager is running");
  }

  auto GetDesktopShell() -> Result<String> {
    if (Result<String> desktop = GetEnv("XDG_CURRENT_DESKTOP")) {
      const String wm = WindowManagerForDesktop(*desktop);

      if (wm == "KWin")
        return String("Plasma Shell");

      if (wm == "Mutter")
        return String("Gnome Shell");
    }

    // clang-format off
    constexpr Array<Pair<StringView, StringView>, 5> knownShells = {{
      { "noctalia-shell", "Noctalia Shell" },
      { "plasmashell",    "Plasma Shell" },
      { "gnome-shell",    "Gnome Shell" },
      { "waybar",         "Custom Waybar setup" },
      { "dms",            "DMS" },
    }};
    // clang-format on

    if (const Option<StringView> found = FindProcessMatching(knownShells))
      return String(*found);

    ERR(NotFound, "No known desktop shell is running");
  }
} // namespace slowfetch::core::system

#endif // __linux__
