#include <cstdlib>    // EXIT_SUCCESS, EXIT_FAILURE
#include <filesystem> // std::filesystem::path
#include <format>     // std::format

#include <Slowfetch/Utils/ArgumentParser.hpp>
#include <Slowfetch/Utils/Error.hpp>
#include <Slowfetch/Utils/Logging.hpp>
#include <Slowfetch/Utils/Types.hpp>

#include "Config/Config.hpp"
#include "Core/SystemInfo.hpp"
#include "UI/UI.hpp"

#ifndef SLOW_VERSION
  #define SLOW_VERSION "0.0.0"
#endif

using namespace slowfetch::utils::types;
using namespace slowfetch::utils::logging;
using namespace slowfetch::core::system;
using namespace slowfetch::config;
using namespace slowfetch::ui;

struct CliOptions {
  // Art
  Option<String> osArt;
  bool           noArt   = false;
  bool           noColor = false;

  // Misc
  bool showConfigPath = false;
};

auto main(const i32 argc, char* argv[]) -> i32 try {
  CliOptions opts;

  {
    using slowfetch::utils::argparse::ArgumentParser;

    ArgumentParser parser("slowfetch", std::format("slowfetch {}", SLOW_VERSION));

    parser
      .addArguments("-V", "--verbose")
      .help("Enable verbose logging. Overrides --log-level.")
      .flag();

    parser
      .addArguments("-l", "--log-level")
      .help("Set the minimum log level.")
      .defaultValue(LogLevel::Info);

    parser
      .addArguments("--os")
      .help("Use distribution art. Without a name the detected distribution is used.")
      .implicitValue("auto")
      .bindTo(opts.osArt);

    parser
      .addArguments("--no-art")
      .help("Show only the information sections.")
      .flag()
      .bindTo(opts.noArt);

    parser
      .addArguments("--no-color")
      .help("Disable all colour output.")
      .flag()
      .bindTo(opts.noColor);

    parser
      .addArguments("--show-config-path")
      .help("Display the active configuration file location.")
      .flag()
      .bindTo(opts.showConfigPath);

    const Vec<String> args(argv, argv + argc);

    if (Result<> result = parser.parseInto(args); !result) {
      error_at(result.error());
      return EXIT_FAILURE;
    }

    if (parser.helpRequested()) {
      parser.printHelp();
      return EXIT_SUCCESS;
    }

    if (parser.versionRequested()) {
      Println(parser.getVersion());
      return EXIT_SUCCESS;
    }

    SetRuntimeLogLevel(
      parser.get<bool>("--verbose")
        ? LogLevel::Debug
        : parser.getEnum<LogLevel>("--log-level")
    );
  }

  if (opts.showConfigPath) {
    if (const Option<std::filesystem::path> path = Config::getConfigPath())
      Println(path->string());
    else
      Println("No configuration file found; using defaults.");

    return EXIT_SUCCESS;
  }

  const Config     config = Config::getInstance();
  const SystemInfo data;

  UIOptions uiOptions {
    .osOverride = None,
    .detectedOs = None,
    .noArt      = opts.noArt,
    .noColor    = opts.noColor,
  };

  if (opts.osArt)
    uiOptions.osOverride = OsArt::parse(*opts.osArt);

  if (data.osName)
    uiOptions.detectedOs = *data.osName;

  Print(CreateUI(config, data.toSections(), uiOptions));

  return EXIT_SUCCESS;
} catch (const Exception& e) {
  error_log("Unhandled exception: {}", e.what());
  return EXIT_FAILURE;
}
