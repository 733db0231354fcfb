#include <array>
#include <atomic>
#include <deque>
#include <fstream>
#include <string>
#include <system_error>

#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <fmt/format.h>

#include <braid/nrepl_server/server.hpp>
#include <braid/util/log.hpp>

namespace braid::nrepl_server
{
  using boost::asio::ip::tcp;

  /* One client. Reads bencode frames and dispatches each through the active
   * pipeline on the io thread. Sends may come from any thread; they are posted to
   * the socket's executor, which keeps one caller's responses in order. */
  class connection
    : public transport
    , public std::enable_shared_from_this<connection>
  {
  public:
    connection(tcp::socket &&socket, pipeline_slot const &pipeline)
      : socket_{ std::move(socket) }
      , pipeline_{ pipeline }
    {
      boost::system::error_code ec;
      auto const endpoint(socket_.remote_endpoint(ec));
      peer_ = ec ? std::string{ "unknown" }
                 : fmt::format("{}:{}", endpoint.address().to_string(), endpoint.port());
    }

    void start()
    {
      util::log::get()->debug("accepted connection from {}", peer_);
      do_read();
    }

    void send(response payload) override
    {
      if(!open_)
      {
        return;
      }
      auto encoded(bencode::encode(bencode::value{ std::move(payload) }));
      boost::asio::post(socket_.get_executor(),
                        [self = shared_from_this(), encoded = std::move(encoded)]() mutable {
                          self->enqueue_write(std::move(encoded));
                        });
    }

    void close() override
    {
      boost::asio::post(socket_.get_executor(), [self = shared_from_this()] { self->shutdown(); });
    }

    bool is_open() const override
    {
      return open_;
    }

  private:
    void do_read()
    {
      auto self(shared_from_this());
      socket_.async_read_some(
        boost::asio::buffer(read_buffer_),
        [this, self](boost::system::error_code const ec, std::size_t const length) {
          on_read(ec, length);
        });
    }

    void on_read(boost::system::error_code const ec, std::size_t const length)
    {
      if(ec)
      {
        if(ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted)
        {
          util::log::get()->warn("read from {} failed: {}", peer_, ec.message());
        }
        shutdown();
        return;
      }

      buffer_.append(read_buffer_.data(), length);
      if(process_buffer())
      {
        do_read();
      }
    }

    /* False once the connection has been torn down. */
    bool process_buffer()
    {
      while(!buffer_.empty())
      {
        auto const decoded(bencode::decode(std::string_view{ buffer_.data(), buffer_.size() }));
        if(decoded.state == bencode::parse_state::need_more)
        {
          return true;
        }
        if(decoded.state != bencode::parse_state::ok || !decoded.data.is_dict())
        {
          util::log::get()->warn("closing {}: invalid nREPL payload ({})",
                                 peer_,
                                 decoded.error.empty() ? "not a dictionary" : decoded.error);
          shutdown();
          return false;
        }

        message msg{ decoded.data.as_dict(), shared_from_this(), nullptr };
        buffer_.erase(0, decoded.consumed);
        dispatch(msg);
      }
      return true;
    }

    void dispatch(message const &msg) const
    {
      try
      {
        pipeline_.dispatch(msg);
      }
      catch(std::exception const &e)
      {
        util::log::get()->error("handler for op '{}' failed: {}", msg.op(), e.what());
      }
    }

    void enqueue_write(std::string encoded)
    {
      if(!open_)
      {
        return;
      }
      write_queue_.push_back(std::move(encoded));
      if(!writing_)
      {
        do_write();
      }
    }

    void do_write()
    {
      if(write_queue_.empty())
      {
        writing_ = false;
        return;
      }

      writing_ = true;
      auto self(shared_from_this());
      boost::asio::async_write(socket_,
                               boost::asio::buffer(write_queue_.front()),
                               [this, self](boost::system::error_code const ec, std::size_t) {
                                 on_write(ec);
                               });
    }

    void on_write(boost::system::error_code const ec)
    {
      if(ec)
      {
        util::log::get()->error("write to {} failed: {}", peer_, ec.message());
        shutdown();
        return;
      }

      write_queue_.pop_front();
      do_write();
    }

    void shutdown()
    {
      if(!open_.exchange(false))
      {
        return;
      }

      util::log::get()->debug("closing connection from {}", peer_);
      write_queue_.clear();
      writing_ = false;
      boost::system::error_code ec;
      socket_.shutdown(tcp::socket::shutdown_both, ec);
      socket_.close(ec);
      if(ec)
      {
        util::log::get()->warn("socket close error: {}", ec.message());
      }
    }

    tcp::socket socket_;
    pipeline_slot const &pipeline_;
    std::string peer_;
    std::string buffer_;
    std::array<char, 4096> read_buffer_{};
    std::deque<std::string> write_queue_;
    bool writing_{ false };
    std::atomic<bool> open_{ true };
  };

  server::server(server_config config)
    : config_{ std::move(config) }
    , sessions_{ rt_, pool_ }
    , engine_{ rt_ }
    , ctx_{ rt_, pool_, sessions_, engine_, pipeline_, registry_ }
    , pool_{ config_.threads }
    , work_guard_{ boost::asio::make_work_guard(io_context_) }
  {
    register_builtin_middleware(ctx_);
    default_handler(ctx_, config_.middleware);

    auto const address(boost::asio::ip::make_address(config_.bind_address));
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_, tcp::endpoint{ address, config_.port });
    actual_port_ = acceptor_->local_endpoint().port();

    write_port_file();
    accept_connection();
    io_thread_ = std::thread([this] { io_context_.run(); });

    util::log::get()->info("nREPL server started on {}:{}", config_.bind_address, actual_port_);
  }

  server::~server()
  {
    stop();
  }

  void server::stop()
  {
    if(!running_.exchange(false))
    {
      return;
    }

    boost::asio::post(io_context_, [this] {
      boost::system::error_code ec;
      acceptor_->close(ec);
      if(ec)
      {
        util::log::get()->warn("acceptor close error: {}", ec.message());
      }

      auto const locked_connections(connections_.rlock());
      for(auto const &weak : *locked_connections)
      {
        if(auto const conn = weak.lock())
        {
          conn->close();
        }
      }
    });

    sessions_.interrupt_all();
    work_guard_.reset();
    if(io_thread_.joinable())
    {
      io_thread_.join();
    }

    remove_port_file();
    util::log::get()->info("nREPL server on port {} stopped", actual_port_);
  }

  std::uint16_t server::port() const
  {
    return actual_port_;
  }

  handler_context &server::handlers()
  {
    return ctx_;
  }

  void server::accept_connection()
  {
    acceptor_->async_accept([this](boost::system::error_code const ec, tcp::socket socket) {
      if(ec)
      {
        if(ec != boost::asio::error::operation_aborted)
        {
          util::log::get()->error("accept error: {}", ec.message());
        }
      }
      else if(running_)
      {
        auto conn(std::make_shared<connection>(std::move(socket), pipeline_));
        {
          auto locked_connections(connections_.wlock());
          std::erase_if(*locked_connections, [](auto const &weak) { return weak.expired(); });
          locked_connections->push_back(conn);
        }
        conn->start();
      }

      if(running_ && acceptor_->is_open())
      {
        accept_connection();
      }
    });
  }

  void server::write_port_file() const
  {
    if(config_.port_file.empty())
    {
      return;
    }

    std::ofstream ofs{ config_.port_file };
    if(!ofs)
    {
      util::log::get()->warn("unable to write port file {}", config_.port_file);
      return;
    }
    ofs << actual_port_;
  }

  void server::remove_port_file() const
  {
    if(config_.port_file.empty())
    {
      return;
    }

    std::error_code ec;
    [[maybe_unused]] bool const removed(std::filesystem::remove(config_.port_file, ec));
    if(ec)
    {
      util::log::get()->warn("failed to remove port file: {}", ec.message());
    }
  }
}
