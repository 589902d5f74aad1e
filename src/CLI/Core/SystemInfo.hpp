#pragma once

#include <chrono> // std::chrono::seconds

#include <Slowfetch/Render/Sections.hpp>
#include <Slowfetch/Utils/DataTypes.hpp>
#include <Slowfetch/Utils/Types.hpp>

namespace slowfetch::core::system {
  namespace types = ::slowfetch::utils::types;

  using std::chrono::seconds;

  inline constexpr types::StringView UNKNOWN = "unknown";

  /**
   * @brief Results of every system probe.
   *
   * @details All probes run concurrently during construction. A failed probe
   * keeps its error here and is shown as "unknown".
   */
  struct SystemInfo {
    types::Result<types::String>        osName;
    types::Result<types::String>        kernelVersion;
    types::Result<seconds>              uptime;
    types::Result<types::String>        cpuModel;
    types::Result<types::String>        gpuModel;
    types::Result<types::ResourceUsage> memInfo;
    types::Result<types::ResourceUsage> diskUsage;
    types::Result<types::String>        packages;
    types::Result<types::String>        terminal;
    types::Result<types::String>        shell;
    types::Result<types::String>        windowMgr;
    types::Result<types::String>        desktopShell;

    SystemInfo();

    /**
     * @brief Groups the display values into the Core, Hardware and Userspace sections.
     */
    [[nodiscard]] auto toSections() const -> types::Vec<render::Section>;
  };
} // namespace slowfetch::core::system
