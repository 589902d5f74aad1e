#include <boost/ut.hpp>

#include <Slowfetch/Render/Terminal.hpp>
#include <Slowfetch/Utils/Env.hpp>

namespace {
  using namespace slowfetch::utils::types;
  using namespace slowfetch::utils::env;

  auto SetGeometryEnv(const PCStr columns, const PCStr lines) -> bool {
    return SetEnv("COLUMNS", columns).has_value() && SetEnv("LINES", lines).has_value();
  }

  auto ClearGeometryEnv() -> bool {
    return UnsetEnv("COLUMNS").has_value() && UnsetEnv("LINES").has_value();
  }
} // namespace

auto main() -> int {
  using namespace boost::ut;
  using namespace slowfetch::render;
  using namespace slowfetch::utils::error;

  "window size query fails on a non-terminal"_test = [] -> void {
    Result<TerminalGeometry> result = QueryWindowSize(-1);

    expect(!result.has_value());
  };

  "geometry is read from COLUMNS and LINES"_test = [] -> void {
    expect(SetGeometryEnv("132", "43"));

    Result<TerminalGeometry> result = GeometryFromEnv();

    expect(result.has_value());
    expect(*result == TerminalGeometry { .columns = 132, .rows = 43 });

    expect(ClearGeometryEnv());
  };

  "missing variables are NotFound"_test = [] -> void {
    expect(ClearGeometryEnv());
    expect(SetEnv("COLUMNS", "100").has_value());

    Result<TerminalGeometry> result = GeometryFromEnv();

    expect(!result.has_value());
    expect(result.error().code == SlowErrorCode::NotFound);

    expect(ClearGeometryEnv());
  };

  "malformed or zero values are rejected"_test = [] -> void {
    // clang-format off
    const Array<Pair<PCStr, PCStr>, 4> cases = {{
      { "wide", "24" },
      {   "80",   "" },
      {    "0", "24" },
      {   "80",  "0" },
    }};
    // clang-format on

    for (const auto& [columns, lines] : cases) {
      expect(SetGeometryEnv(columns, lines));

      Result<TerminalGeometry> result = GeometryFromEnv();

      expect(!result.has_value()) << columns << "x" << lines;
      expect(result.error().code == SlowErrorCode::ParseError);
    }

    expect(ClearGeometryEnv());
  };

  "probe always yields a usable geometry"_test = [] -> void {
    expect(ClearGeometryEnv());

    const TerminalGeometry first = ProbeTerminal();

    expect(first.columns > 0_u);
    expect(first.rows > 0_u);

    // Without a terminal on stdout (as under ctest) the environment tier is used.
    if (!QueryWindowSize(1)) {
      expect(first == DEFAULT_GEOMETRY);

      expect(SetGeometryEnv("120", "40"));
      expect(ProbeTerminal() == TerminalGeometry { .columns = 120, .rows = 40 });

      expect(SetGeometryEnv("0", "40"));
      expect(ProbeTerminal() == DEFAULT_GEOMETRY);
    }

    expect(ClearGeometryEnv());
  };

  return 0;
}
