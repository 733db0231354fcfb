#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace braid::util::cli
{
  struct options
  {
    /* Server. */
    std::string bind_address{ "127.0.0.1" };
    std::uint16_t port{};
    std::size_t threads{};
    std::string port_file{ ".nrepl-port" };

    /* Middleware appended to the default stack, by registered name. */
    std::vector<std::string> middleware;

    /* Logging. */
    std::string log_level{ "info" };
  };

  /* NOLINTNEXTLINE */
  extern options opts;

  /* Fills `opts`. Returns the exit code when the process should stop here, either
   * because the arguments were bad or because help was requested. */
  std::optional<int> parse(int const argc, char const **argv);
}
