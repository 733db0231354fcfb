#include <csignal>
#include <exception>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/system_error.hpp>

#include <braid/nrepl_server/server.hpp>
#include <braid/util/cli.hpp>
#include <braid/util/log.hpp>

// NOLINTNEXTLINE(bugprone-exception-escape): This can only happen if we fail to report an error.
int main(int const argc, char const **argv)
{
  using namespace braid;

  auto const parse_result(util::cli::parse(argc, argv));
  if(parse_result.has_value())
  {
    return *parse_result;
  }

  auto const &opts(util::cli::opts);
  util::log::configure(opts.log_level);

  nrepl_server::server_config config;
  config.bind_address = opts.bind_address;
  config.port = opts.port;
  config.threads = opts.threads;
  config.port_file = opts.port_file;
  config.middleware = opts.middleware;

  try
  {
    nrepl_server::server srv{ std::move(config) };

    /* The server runs on its own threads; this one only waits for a signal. */
    boost::asio::io_context signals_ctx;
    boost::asio::signal_set signals{ signals_ctx, SIGINT, SIGTERM };
    signals.async_wait([&srv](boost::system::error_code const ec, int const signal) {
      if(!ec)
      {
        util::log::get()->info("received signal {}, shutting down", signal);
      }
      srv.stop();
    });
    signals_ctx.run();
  }
  catch(nrepl_server::config_error const &e)
  {
    util::log::get()->critical("invalid middleware configuration: {}", e.what());
    return 1;
  }
  catch(boost::system::system_error const &e)
  {
    util::log::get()->critical("unable to start the server: {}", e.what());
    return 1;
  }

  return 0;
}
