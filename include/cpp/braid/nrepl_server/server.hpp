#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <folly/Synchronized.h>

#include <braid/nrepl_server/handler.hpp>

namespace braid::nrepl_server
{
  class connection;

  struct server_config
  {
    std::string bind_address{ "127.0.0.1" };
    /* 0 picks a free port. */
    std::uint16_t port{};
    std::size_t threads{ 1 };
    /* Empty disables the port file. */
    std::string port_file{ ".nrepl-port" };
    /* Registered middleware appended to the default stack. */
    std::vector<std::string> middleware;
  };

  /* A TCP nREPL endpoint. Accepting and socket I/O happen on one io thread;
   * evaluations run on the worker pool. Throws `config_error` when the middleware
   * stack does not compose, and `boost::system::system_error` when it cannot bind. */
  class server
  {
  public:
    explicit server(server_config config);
    server(server const &) = delete;
    server(server &&) = delete;
    ~server();

    /* Closes the acceptor and every open connection, interrupts running
     * evaluations and removes the port file. Safe to call more than once. */
    void stop();

    std::uint16_t port() const;
    handler_context &handlers();

  private:
    void accept_connection();
    void write_port_file() const;
    void remove_port_file() const;

    server_config config_;
    boost::asio::io_context io_context_;
    runtime::context rt_;
    middleware_registry registry_;
    pipeline_slot pipeline_;
    session_registry sessions_;
    evaluation_engine engine_;
    handler_context ctx_;
    /* Destroyed first, so running tasks finish while everything they use is alive. */
    worker_pool pool_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    folly::Synchronized<std::vector<std::weak_ptr<connection>>> connections_;
    std::uint16_t actual_port_{};
    std::atomic<bool> running_{ true };
    std::thread io_thread_;
  };
}
