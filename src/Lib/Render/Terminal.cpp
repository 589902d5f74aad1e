#include <Slowfetch/Render/Terminal.hpp>

#include <cerrno>      // errno
#include <sys/ioctl.h> // ioctl, TIOCGWINSZ, winsize
#include <unistd.h>    // STDOUT_FILENO

#include <Slowfetch/Utils/Env.hpp>
#include <Slowfetch/Utils/Error.hpp>
#include <Slowfetch/Utils/Logging.hpp>

namespace slowfetch::render {
  using namespace utils::types;
  using enum utils::error::SlowErrorCode;

  auto QueryWindowSize(const int fd) -> Result<TerminalGeometry> {
    winsize size {};

    if (ioctl(fd, TIOCGWINSZ, &size) == -1)
      ERR_FMT(utils::error::FromErrno(errno), "TIOCGWINSZ failed on fd {}", fd);

    if (size.ws_col == 0 || size.ws_row == 0)
      ERR_FMT(PlatformSpecific, "Terminal reported {}x{}", size.ws_col, size.ws_row);

    return TerminalGeometry { .columns = size.ws_col, .rows = size.ws_row };
  }

  auto GeometryFromEnv() -> Result<TerminalGeometry> {
    const usize columns = TRY(utils::env::GetEnvAs<usize>("COLUMNS"));
    const usize rows    = TRY(utils::env::GetEnvAs<usize>("LINES"));

    if (columns == 0 || rows == 0)
      ERR_FMT(ParseError, "COLUMNS/LINES must be positive, got {}x{}", columns, rows);

    return TerminalGeometry { .columns = columns, .rows = rows };
  }

  auto ProbeTerminal() -> TerminalGeometry {
    Result<TerminalGeometry> geometry = QueryWindowSize(STDOUT_FILENO);

    if (geometry)
      return *geometry;

    debug_at(geometry.error());

    geometry = GeometryFromEnv();

    if (geometry)
      return *geometry;

    debug_at(geometry.error());

    return DEFAULT_GEOMETRY;
  }
} // namespace slowfetch::render
