/**
 * @file System.hpp
 * @brief System information probes and the helpers that turn raw readings into display strings.
 */

#pragma once

#include <charconv>     // std::from_chars
#include <chrono>       // std::chrono::seconds
#include <concepts>     // std::integral
#include <system_error> // std::errc

#include "../Utils/DataTypes.hpp"
#include "../Utils/Types.hpp"

namespace slowfetch::core::system {
  namespace types = ::slowfetch::utils::types;

  // ─────────────────────────────────────────────────────────────────────────────
  // Probes
  // ─────────────────────────────────────────────────────────────────────────────

  /**
   * @brief Fetches the distribution name.
   * @return `PRETTY_NAME` from `/etc/os-release` (e.g. "Arch Linux", "Ubuntu 24.04.2 LTS").
   *
   * @warning Fails if `/etc/os-release` cannot be opened or has no usable `PRETTY_NAME`.
   */
  auto GetOSName() -> types::Result<types::String>;

  /**
   * @brief Fetches the kernel release via `uname`.
   */
  auto GetKernelVersion() -> types::Result<types::String>;

  /**
   * @brief Fetches the time since boot via `sysinfo`.
   */
  auto GetUptime() -> types::Result<std::chrono::seconds>;

  /**
   * @brief Fetches the CPU model from `/proc/cpuinfo`, with the boost clock from cpufreq when available.
   * @return e.g. "AMD Ryzen 7 5800X @ 4.85GHz"
   */
  auto GetCPUModel() -> types::Result<types::String>;

  /**
   * @brief Fetches the first display controller under `/sys/bus/pci/devices`, named through `pci.ids`.
   *
   * @details Falls back to a bare vendor name (AMD, NVIDIA, Intel) when the
   * device is missing from `pci.ids`.
   */
  auto GetGPUModel() -> types::Result<types::String>;

  /**
   * @brief Fetches RAM usage from `/proc/meminfo` (MemTotal - MemAvailable).
   */
  auto GetMemInfo() -> types::Result<types::ResourceUsage>;

  /**
   * @brief Sums usage over every real block device listed in `/proc/mounts`.
   *
   * Loop devices are skipped and each device is counted once, even when it is
   * mounted in several places.
   */
  auto GetDiskUsage() -> types::Result<types::ResourceUsage>;

  /**
   * @brief Counts installed packages for pacman, dpkg, flatpak and xbps.
   * @return e.g. "pacman 1204 | flatpak 12"
   */
  auto GetPackageCount() -> types::Result<types::String>;

  /**
   * @brief Detects the terminal emulator from its environment markers, then `TERM_PROGRAM` / `TERM`.
   */
  auto GetTerminal() -> types::Result<types::String>;

  /**
   * @brief Returns the login shell name from `$SHELL`, capitalized.
   */
  auto GetShell() -> types::Result<types::String>;

  /**
   * @brief Detects the window manager or compositor.
   *
   * @details Tries `XDG_CURRENT_DESKTOP`, then `DESKTOP_SESSION`, then scans
   * `/proc/<pid>/cmdline` for known window managers.
   */
  auto GetWindowManager() -> types::Result<types::String>;

  /**
   * @brief Detects the desktop shell / bar (Plasma Shell, Gnome Shell, Waybar, ...).
   */
  auto GetDesktopShell() -> types::Result<types::String>;

  // ─────────────────────────────────────────────────────────────────────────────
  // Parsing and formatting
  // ─────────────────────────────────────────────────────────────────────────────

  /**
   * @brief Parses a whole string as a decimal integer. Trailing characters fail the parse.
   */
  template <std::integral T>
  constexpr auto TryParse(const types::StringView sview) -> types::Option<T> {
    T value {};

    auto [ptr, ec] = std::from_chars(sview.data(), sview.data() + sview.size(), value);

    if (ec == std::errc() && ptr == sview.data() + sview.size())
      return value;

    return types::None;
  }

  /**
   * @brief Extracts the unquoted `PRETTY_NAME` value from os-release contents.
   */
  auto ParseOsRelease(types::StringView contents) -> types::Result<types::String>;

  /**
   * @brief Extracts the `model name` of the first processor from cpuinfo contents.
   *
   * Drops integrated-graphics suffixes ("with Radeon Graphics", "w/ ..."),
   * "N-Core" tokens and the word "Processor", and collapses whitespace.
   */
  auto ParseCpuModel(types::StringView cpuinfo) -> types::Result<types::String>;

  /**
   * @brief Formats a cpufreq maximum in kHz as " @ X.XXGHz".
   */
  auto FormatBoostClock(types::u64 kilohertz) -> types::String;

  /**
   * @brief Looks a PCI vendor/device pair up in the contents of a `pci.ids` file.
   * @param vendorId Hex id, with or without a `0x` prefix.
   * @param deviceId Hex id, with or without a `0x` prefix.
   * @return The vendor and device names.
   */
  auto LookupPciNamesFromBuffer(types::StringView buffer, types::StringView vendorId, types::StringView deviceId)
    -> types::Result<types::Pair<types::String, types::String>>;

  /**
   * @brief Shortens `pci.ids` names, e.g. "Advanced Micro Devices, Inc. [AMD/ATI]" + "Navi 21 [Radeon RX 6800]" -> "AMD Radeon RX 6800".
   */
  auto CleanGpuModelName(types::String vendor, types::String device) -> types::String;

  /**
   * @brief Reads used/total kB from meminfo contents.
   */
  auto ParseMemInfo(types::StringView meminfo) -> types::Result<types::ResourceUsage>;

  /// "Xh Ym" when at least an hour, otherwise "Ym".
  auto FormatUptime(std::chrono::seconds uptime) -> types::String;

  /**
   * @brief Ten-cell ASCII usage bar, e.g. "[====      ]" for 40%.
   */
  auto UsageBar(types::f64 percent) -> types::String;

  /// Bar followed by used/total in decimal GB.
  auto FormatMemory(const types::ResourceUsage& usage) -> types::String;

  /// Like FormatMemory, but totals of 1000 GB or more are shown in TB.
  auto FormatStorage(const types::ResourceUsage& usage) -> types::String;

  /**
   * @brief Turns a `TERM_PROGRAM` / `TERM` value into a display name ("xterm-256color" -> "Xterm").
   */
  auto CleanTerminalName(types::StringView term) -> types::String;

  /**
   * @brief Maps an `XDG_CURRENT_DESKTOP` value to its window manager ("KDE" -> "KWin").
   *
   * Unknown desktops are returned unchanged.
   */
  auto WindowManagerForDesktop(types::StringView desktop) -> types::String;

  /// Uppercases the first ASCII letter.
  auto Capitalize(types::StringView text) -> types::String;
} // namespace slowfetch::core::system
