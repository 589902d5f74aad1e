#include "SystemInfo.hpp"

#include <exception> // std::exception
#include <future>    // std::async, std::launch
#include <utility>   // std::move

#include <Slowfetch/Core/System.hpp>
#include <Slowfetch/Utils/Error.hpp>
#include <Slowfetch/Utils/Logging.hpp>

namespace slowfetch::core::system {
  namespace {
    using namespace slowfetch::utils::types;

    using enum slowfetch::utils::error::SlowErrorCode;

    // A probe that throws is reported like one that failed.
    template <typename T>
    auto Await(Future<Result<T>>& future, const StringView probe) -> Result<T> {
      try {
        return future.get();
      } catch (const std::exception& exc) {
        ERR_FMT(InternalError, "{} probe threw: {}", probe, exc.what());
      }
    }

    template <typename T, typename Fn>
    auto Display(const Result<T>& result, Fn&& format) -> String {
      if (result)
        return format(*result);

      debug_at(result.error());
      return String(UNKNOWN);
    }

    auto Display(const Result<String>& result) -> String {
      return Display(result, [](const String& value) { return value; });
    }
  } // namespace

  SystemInfo::SystemInfo() {
    using std::async, std::launch;

    debug_log("SystemInfo: Starting probes");

    // Intel reports trademarks in ASCII; show the real symbols instead.
    auto replaceTrademarkSymbols = [](Result<String> str) -> Result<String> {
      String value = TRY(str);

      usize pos = 0;

      while ((pos = value.find("(TM)")) != String::npos)
        value.replace(pos, 4, "™");

      while ((pos = value.find("(R)")) != String::npos)
        value.replace(pos, 3, "®");

      return value;
    };

    Future<Result<String>>        osFut       = async(launch::async, GetOSName);
    Future<Result<String>>        kernelFut   = async(launch::async, GetKernelVersion);
    Future<Result<seconds>>       uptimeFut   = async(launch::async, GetUptime);
    Future<Result<String>>        cpuFut      = async(launch::async, GetCPUModel);
    Future<Result<String>>        gpuFut      = async(launch::async, GetGPUModel);
    Future<Result<ResourceUsage>> memFut      = async(launch::async, GetMemInfo);
    Future<Result<ResourceUsage>> diskFut     = async(launch::async, GetDiskUsage);
    Future<Result<String>>        packagesFut = async(launch::async, GetPackageCount);
    Future<Result<String>>        terminalFut = async(launch::async, GetTerminal);
    Future<Result<String>>        shellFut    = async(launch::async, GetShell);
    Future<Result<String>>        wmFut       = async(launch::async, GetWindowManager);
    Future<Result<String>>        uiFut       = async(launch::async, GetDesktopShell);

    this->osName        = Await(osFut, "OS");
    this->kernelVersion = Await(kernelFut, "Kernel");
    this->uptime        = Await(uptimeFut, "Uptime");
    this->cpuModel      = replaceTrademarkSymbols(Await(cpuFut, "CPU"));
    this->gpuModel      = Await(gpuFut, "GPU");
    this->memInfo       = Await(memFut, "Memory");
    this->diskUsage     = Await(diskFut, "Storage");
    this->packages      = Await(packagesFut, "Packages");
    this->terminal      = Await(terminalFut, "Terminal");
    this->shell         = Await(shellFut, "Shell");
    this->windowMgr     = Await(wmFut, "WM");
    this->desktopShell  = Await(uiFut, "UI");

    debug_log("SystemInfo: All probes finished");
  }

  auto SystemInfo::toSections() const -> Vec<render::Section> {
    return {
      render::Section {
        .title = "Core",
        .lines = {
          { "OS", Display(osName) },
          { "Kernel", Display(kernelVersion) },
          { "Uptime", Display(uptime, FormatUptime) },
        },
      },
      render::Section {
        .title = "Hardware",
        .lines = {
          { "CPU", Display(cpuModel) },
          { "GPU", Display(gpuModel) },
          { "Memory", Display(memInfo, FormatMemory) },
          { "Storage", Display(diskUsage, FormatStorage) },
        },
      },
      render::Section {
        .title = "Userspace",
        .lines = {
          { "Packages", Display(packages) },
          { "Terminal", Display(terminal) },
          { "Shell", Display(shell) },
          { "WM", Display(windowMgr) },
          { "UI", Display(desktopShell) },
        },
      },
    };
  }
} // namespace slowfetch::core::system
