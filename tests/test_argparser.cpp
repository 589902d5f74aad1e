#include <boost/ut.hpp>

#include <Slowfetch/Utils/ArgumentParser.hpp>
#include <Slowfetch/Utils/Logging.hpp>
#include <Slowfetch/Utils/Types.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace slowfetch::utils::argparse;
  using namespace slowfetch::utils::error;
  using namespace slowfetch::utils::types;

  using slowfetch::utils::logging::LogLevel;

  "flag"_test = [] -> void {
    ArgumentParser parser("slowfetch", "0.1.0");
    bool           verbose = false;
    parser.addArguments("-V", "--verbose").flag().bindTo(verbose);

    Vec<String> args   = { "slowfetch", "--verbose" };
    Result<>    result = parser.parseInto(args);

    expect(result.has_value());
    expect(verbose);
    expect(parser.isUsed("-V"));
  };

  "string value"_test = [] -> void {
    ArgumentParser parser("slowfetch", "0.1.0");
    String         output;
    parser.addArguments("-o", "--output").bindTo(output);

    Vec<String> args   = { "slowfetch", "-o", "out.txt" };
    Result<>    result = parser.parseInto(args);

    expect(result.has_value());
    expect(output == String("out.txt"));
  };

  "inline --name=value"_test = [] -> void {
    ArgumentParser parser("slowfetch", "0.1.0");
    String         output;
    parser.addArguments("--output").bindTo(output);

    Vec<String> args = { "slowfetch", "--output=a=b" };

    expect(parser.parseInto(args).has_value());
    expect(output == String("a=b"));
  };

  "integer conversion and default"_test = [] -> void {
    ArgumentParser parser("slowfetch", "0.1.0");
    i32            count = 0;
    parser.addArguments("-c", "--count").defaultValue(i32(10)).bindTo(count);

    Vec<String> none = { "slowfetch" };
    expect(parser.parseInto(none).has_value());
    expect(count == 10);

    Vec<String> given = { "slowfetch", "--count", "42" };
    expect(parser.parseInto(given).has_value());
    expect(count == 42);
  };

  "bad integer is an error"_test = [] -> void {
    ArgumentParser parser("slowfetch", "0.1.0");
    parser.addArguments("--count").defaultValue(i32(1));

    Vec<String> args   = { "slowfetch", "--count", "many" };
    Result<>    result = parser.parseInto(args);

    expect(!result.has_value());
    expect(result.error().code == SlowErrorCode::InvalidArgument);
  };

  "missing value is an error"_test = [] -> void {
    ArgumentParser parser("slowfetch", "0.1.0");
    parser.addArguments("--output");

    Vec<String> args = { "slowfetch", "--output" };

    expect(!parser.parseInto(args).has_value());
  };

  "unknown argument is an error"_test = [] -> void {
    ArgumentParser parser("slowfetch", "0.1.0");

    Vec<String> args   = { "slowfetch", "--bogus" };
    Result<>    result = parser.parseInto(args);

    expect(!result.has_value());
    expect(result.error().message.find("--bogus") != String::npos);
  };

  "flag rejects an inline value"_test = [] -> void {
    ArgumentParser parser("slowfetch", "0.1.0");
    parser.addArguments("--no-art").flag();

    Vec<String> args = { "slowfetch", "--no-art=yes" };

    expect(!parser.parseInto(args).has_value());
  };

  "implicit value when the option stands alone"_test = [] -> void {
    ArgumentParser parser("slowfetch", "0.1.0");
    Option<String> osArt;
    bool           noColor = false;
    parser.addArguments("--os").implicitValue("auto").bindTo(osArt);
    parser.addArguments("--no-color").flag().bindTo(noColor);

    Vec<String> args = { "slowfetch", "--os", "--no-color" };

    expect(parser.parseInto(args).has_value());
    expect(osArt.has_value());
    expect(*osArt == String("auto"));
    expect(noColor);
  };

  "implicit option still takes an explicit value"_test = [] -> void {
    ArgumentParser parser("slowfetch", "0.1.0");
    Option<String> osArt;
    parser.addArguments("--os").implicitValue("auto").bindTo(osArt);

    Vec<String> args = { "slowfetch", "--os", "fedora" };

    expect(parser.parseInto(args).has_value());
    expect(*osArt == String("fedora"));
  };

  "optional binding stays empty when unused"_test = [] -> void {
    ArgumentParser parser("slowfetch", "0.1.0");
    Option<String> osArt;
    parser.addArguments("--os").implicitValue("auto").bindTo(osArt);

    Vec<String> args = { "slowfetch" };

    expect(parser.parseInto(args).has_value());
    expect(!osArt.has_value());
  };

  "enum option resolves through its names"_test = [] -> void {
    ArgumentParser parser("slowfetch", "0.1.0");
    LogLevel       level = LogLevel::Info;
    parser.addArguments("-l", "--log-level").defaultValue(LogLevel::Info).bindToEnum(level);

    Vec<String> args = { "slowfetch", "--log-level", "WARN" };

    expect(parser.parseInto(args).has_value());
    expect(level == LogLevel::Warn);
    expect(parser.getEnum<LogLevel>("-l") == LogLevel::Warn);
  };

  "enum option rejects unknown names"_test = [] -> void {
    ArgumentParser parser("slowfetch", "0.1.0");
    parser.addArguments("--log-level").defaultValue(LogLevel::Info);

    Vec<String> args   = { "slowfetch", "--log-level", "loud" };
    Result<>    result = parser.parseInto(args);

    expect(!result.has_value());
    expect(result.error().message.find("trace") != String::npos);
  };

  "enum default applies when unused"_test = [] -> void {
    ArgumentParser parser("slowfetch", "0.1.0");
    parser.addArguments("--log-level").defaultValue(LogLevel::Error);

    Vec<String> args = { "slowfetch" };

    expect(parser.parseInto(args).has_value());
    expect(parser.getEnum<LogLevel>("--log-level") == LogLevel::Error);
  };

  "help and version are recorded"_test = [] -> void {
    ArgumentParser parser("slowfetch", "slowfetch 0.1.0");

    Vec<String> args = { "slowfetch", "-h", "--version" };

    expect(parser.parseInto(args).has_value());
    expect(parser.helpRequested());
    expect(parser.versionRequested());
    expect(parser.getVersion() == String("slowfetch 0.1.0"));
  };

  "help text lists options and choices"_test = [] -> void {
    ArgumentParser parser("slowfetch", "0.1.0");
    parser.addArguments("--os").help("Use distribution art.").implicitValue("auto");
    parser.addArguments("--log-level").defaultValue(LogLevel::Info);

    const String help = parser.helpText();

    expect(help.starts_with("Usage: slowfetch"));
    expect(help.find("--os [VALUE]") != String::npos);
    expect(help.find("Use distribution art.") != String::npos);
    expect(help.find("Available values: trace, debug, info, warn, error") != String::npos);
  };

  return 0;
}
