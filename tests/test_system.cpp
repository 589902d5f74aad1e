#include <boost/ut.hpp>

#include <chrono> // std::chrono::{hours, minutes, seconds}

#include <Slowfetch/Core/System.hpp>
#include <Slowfetch/Utils/Error.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace slowfetch::core::system;
  using namespace slowfetch::utils::error;
  using namespace slowfetch::utils::types;
  using namespace std::chrono_literals;

  "os-release PRETTY_NAME is unquoted"_test = [] -> void {
    constexpr StringView osRelease =
      "NAME=\"Arch Linux\"\n"
      "PRETTY_NAME=\"Arch Linux\"\n"
      "ID=arch\n";

    Result<String> name = ParseOsRelease(osRelease);

    expect(name.has_value());
    expect(*name == String("Arch Linux"));

    expect(*ParseOsRelease("PRETTY_NAME='Ubuntu 24.04.2 LTS'\n") == String("Ubuntu 24.04.2 LTS"));
    expect(*ParseOsRelease("PRETTY_NAME=NixOS") == String("NixOS"));
  };

  "os-release without PRETTY_NAME fails"_test = [] -> void {
    Result<String> missing = ParseOsRelease("NAME=Fedora\nID=fedora\n");

    expect(!missing.has_value());
    expect(missing.error().code == SlowErrorCode::NotFound);

    Result<String> empty = ParseOsRelease("PRETTY_NAME=\"\"\n");

    expect(!empty.has_value());
    expect(empty.error().code == SlowErrorCode::ParseError);
  };

  "cpu model drops graphics and core-count noise"_test = [] -> void {
    constexpr StringView amd =
      "processor\t: 0\n"
      "vendor_id\t: AuthenticAMD\n"
      "model name\t: AMD Ryzen 7 7840U w/ Radeon  780M Graphics\n"
      "processor\t: 1\n"
      "model name\t: ignored\n";

    expect(*ParseCpuModel(amd) == String("AMD Ryzen 7 7840U"));
    expect(*ParseCpuModel("model name : AMD Ryzen 5 5600G with Radeon Graphics\n") == String("AMD Ryzen 5 5600G"));
    expect(*ParseCpuModel("model name\t: AMD Ryzen 9 5950X 16-Core Processor\n") == String("AMD Ryzen 9 5950X"));
    expect(*ParseCpuModel("model name\t: Intel(R) Core(TM) i7-9700K CPU @ 3.60GHz\n") == String("Intel(R) Core(TM) i7-9700K CPU @ 3.60GHz"));
  };

  "cpu model missing fails"_test = [] -> void {
    expect(ParseCpuModel("processor\t: 0\n").error().code == SlowErrorCode::NotFound);
  };

  "boost clock is formatted in GHz"_test = [] -> void {
    expect(FormatBoostClock(4'850'000) == String(" @ 4.85GHz"));
    expect(FormatBoostClock(3'000'000) == String(" @ 3.00GHz"));
  };

  "pci.ids lookup finds vendor and device"_test = [] -> void {
    constexpr StringView pciIds =
      "# comment\n"
      "1002  Advanced Micro Devices, Inc. [AMD/ATI]\n"
      "\t73bf  Navi 21 [Radeon RX 6800/6800 XT / 6900 XT]\n"
      "\t\t1002 0e3a  Radeon RX 6900 XT\n"
      "10de  NVIDIA Corporation\n"
      "\t2684  AD102 [GeForce RTX 4090]\n";

    Result<Pair<String, String>> amd = LookupPciNamesFromBuffer(pciIds, "0x1002", "0x73BF");

    expect(amd.has_value());
    expect(amd->first == String("Advanced Micro Devices, Inc. [AMD/ATI]"));
    expect(amd->second == String("Navi 21 [Radeon RX 6800/6800 XT / 6900 XT]"));

    Result<Pair<String, String>> nvidia = LookupPciNamesFromBuffer(pciIds, "10de", "2684");

    expect(nvidia.has_value());
    expect(CleanGpuModelName(nvidia->first, nvidia->second) == String("NVIDIA GeForce RTX 4090"));

    // Devices are only searched inside their own vendor block.
    expect(!LookupPciNamesFromBuffer(pciIds, "0x1002", "0x2684").has_value());
  };

  "gpu names are shortened"_test = [] -> void {
    expect(CleanGpuModelName("Advanced Micro Devices, Inc. [AMD/ATI]", "Navi 21 [Radeon RX 6800]") == String("AMD Radeon RX 6800"));
    expect(CleanGpuModelName("Intel Corporation", "Alder Lake-P GT2 [Iris Xe Graphics]") == String("Intel Iris Xe Graphics"));
  };

  "meminfo gives used and total bytes"_test = [] -> void {
    constexpr StringView meminfo =
      "MemTotal:       16000000 kB\n"
      "MemFree:         1000000 kB\n"
      "MemAvailable:    6000000 kB\n";

    Result<ResourceUsage> usage = ParseMemInfo(meminfo);

    expect(usage.has_value());
    expect(usage->totalBytes == 16'000'000'000ULL);
    expect(usage->usedBytes == 10'000'000'000ULL);

    expect(ParseMemInfo("MemTotal: 0 kB\nMemAvailable: 0 kB\n").error().code == SlowErrorCode::ParseError);
    expect(ParseMemInfo("MemTotal: 100 kB\n").error().code == SlowErrorCode::ParseError);
  };

  "meminfo is shown in decimal gigabytes"_test = [] -> void {
    constexpr StringView meminfo = "MemTotal:       32000000 kB\n"
                                   "MemFree:         2000000 kB\n"
                                   "MemAvailable:   16000000 kB\n";

    Result<ResourceUsage> usage = ParseMemInfo(meminfo);

    expect(usage.has_value());
    expect(FormatMemory(*usage) == String("[=====     ] 16GB/32GB"));
  };

  "integers parse only when the whole text is a number"_test = [] -> void {
    expect(TryParse<u64>("4200000") == Option<u64>(4'200'000));
    expect(TryParse<i32>("-7") == Option<i32>(-7));
    expect(!TryParse<u64>("").has_value());
    expect(!TryParse<u64>("12 kB").has_value());
    expect(!TryParse<u64>("-1").has_value());
  };

  "uptime shows hours only when nonzero"_test = [] -> void {
    expect(FormatUptime(45min) == String("45m"));
    expect(FormatUptime(0s) == String("0m"));
    expect(FormatUptime(3h + 7min + 59s) == String("3h 7m"));
    expect(FormatUptime(50h) == String("50h 0m"));
  };

  "usage bar has ten cells"_test = [] -> void {
    expect(UsageBar(0.0) == String("[          ]"));
    expect(UsageBar(40.0) == String("[====      ]"));
    expect(UsageBar(100.0) == String("[==========]"));
    expect(UsageBar(250.0) == String("[==========]"));
  };

  "memory and storage use decimal units"_test = [] -> void {
    expect(FormatMemory(ResourceUsage(8'000'000'000, 16'000'000'000)) == String("[=====     ] 8GB/16GB"));
    expect(FormatStorage(ResourceUsage(500'000'000'000, 2'000'000'000'000)) == String("[===       ] 500GB/2TB"));
    expect(FormatStorage(ResourceUsage(100'000'000'000, 1'500'000'000'000)) == String("[=         ] 100GB/1.50TB"));
    expect(FormatStorage(ResourceUsage(250'000'000'000, 500'000'000'000)) == String("[=====     ] 250GB/500GB"));
  };

  "terminal names are cleaned"_test = [] -> void {
    expect(CleanTerminalName("xterm-256color") == String("Xterm"));
    expect(CleanTerminalName("alacritty") == String("Alacritty"));
    expect(CleanTerminalName("WezTerm") == String("WezTerm"));
  };

  "desktops map to their window manager"_test = [] -> void {
    expect(WindowManagerForDesktop("KDE") == String("KWin"));
    expect(WindowManagerForDesktop("GNOME") == String("Mutter"));
    expect(WindowManagerForDesktop("Hyprland") == String("Hyprland"));
    expect(WindowManagerForDesktop("Budgie") == String("Budgie"));
  };

  return 0;
}
