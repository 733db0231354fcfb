#include <algorithm>
#include <thread>

#include <CLI/CLI.hpp>

#include <braid/util/cli.hpp>
#include <braid/version.hpp>

namespace braid::util::cli
{
  /* NOLINTNEXTLINE */
  options opts;

  static std::string make_default(std::string const &input)
  {
    return "default: " + input;
  }

  std::optional<int> parse(int const argc, char const **argv)
  {
    CLI::App cli{ "braid nREPL server" };

    cli.set_help_flag("-h,--help", "Print this help message and exit.");
    cli.set_version_flag("--version", BRAID_VERSION_STRING);

    opts.threads = std::max<std::size_t>(1, std::thread::hardware_concurrency());

    cli.add_option("-b,--bind", opts.bind_address, "The address to listen on.")
      ->default_str(make_default(opts.bind_address));
    cli.add_option("-p,--port", opts.port, "The port to listen on. 0 picks a free port.")
      ->default_str(make_default("0"));
    cli
      .add_option("-t,--threads",
                  opts.threads,
                  "Worker threads shared by every session's evaluations.")
      ->check(CLI::PositiveNumber)
      ->default_str(make_default(std::to_string(opts.threads)));
    cli
      .add_option("--port-file",
                  opts.port_file,
                  "Where to write the bound port. An empty path disables the file.")
      ->default_str(make_default(opts.port_file));
    cli.add_option("-m,--middleware",
                   opts.middleware,
                   "Registered middleware to add to the default stack. May be repeated.");
    cli
      .add_option("--log-level", opts.log_level, "The minimum level written to the log.")
      ->check(CLI::IsMember({ "trace", "debug", "info", "warn", "error", "critical", "off" }))
      ->default_str(make_default(opts.log_level));

    cli.failure_message(CLI::FailureMessage::help);

    try
    {
      cli.parse(argc, argv);
    }
    catch(CLI::ParseError const &e)
    {
      return cli.exit(e);
    }

    return std::nullopt;
  }
}
