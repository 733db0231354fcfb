#include <array>
#include <filesystem>
#include <fstream>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include <braid/nrepl_server/server.hpp>

#include "common.hpp"

namespace braid::nrepl_server
{
  namespace
  {
    using boost::asio::ip::tcp;

    /* A blocking bencode client. */
    class test_client
    {
    public:
      explicit test_client(std::uint16_t const port)
        : socket_{ io_ }
      {
        socket_.connect(tcp::endpoint{ boost::asio::ip::make_address("127.0.0.1"), port });
      }

      void send(bencode::value::dict const &payload)
      {
        send_raw(bencode::encode(payload));
      }

      void send_raw(std::string const &bytes)
      {
        boost::asio::write(socket_, boost::asio::buffer(bytes));
      }

      response receive()
      {
        while(true)
        {
          if(!buffer_.empty())
          {
            auto const decoded(bencode::decode(buffer_));
            if(decoded.state == bencode::parse_state::ok)
            {
              buffer_.erase(0, decoded.consumed);
              return decoded.data.as_dict();
            }
            REQUIRE(decoded.state == bencode::parse_state::need_more);
          }

          std::array<char, 1024> chunk{};
          auto const read(socket_.read_some(boost::asio::buffer(chunk)));
          buffer_.append(chunk.data(), read);
        }
      }

      /* Everything up to and including the response carrying `done`. */
      std::vector<response> until_done()
      {
        std::vector<response> ret;
        while(true)
        {
          ret.push_back(receive());
          if(has_status(ret.back(), "done"))
          {
            return ret;
          }
        }
      }

    private:
      boost::asio::io_context io_;
      tcp::socket socket_;
      std::string buffer_;
    };

    server_config test_config()
    {
      server_config config;
      config.threads = 2;
      config.port_file.clear();
      return config;
    }
  }

  TEST_SUITE("nREPL server")
  {
    TEST_CASE("clone and eval over TCP")
    {
      server srv{ test_config() };
      REQUIRE(srv.port() != 0);

      test_client client{ srv.port() };
      client.send({
        { "op", "clone" },
        { "id",     "1" }
      });
      auto const cloned(client.until_done());
      REQUIRE(cloned.size() == 1);
      auto const session(field(cloned.front(), "new-session"));
      REQUIRE(!session.empty());

      client.send({
        {      "op",                    "eval" },
        {      "id",                       "2" },
        { "session",                   session },
        {    "code", "(println \"hi\") (+ 40 2)" }
      });
      auto const responses(client.until_done());
      REQUIRE(responses.size() == 4);
      CHECK(field(responses[0], "out") == "hi\n");
      CHECK(field(responses[1], "value") == "nil");
      CHECK(field(responses[2], "value") == "42");
      CHECK(field(responses[2], "id") == "2");
      CHECK(extract_status(responses[3]) == std::vector<std::string>{ "done" });
    }

    TEST_CASE("frames split across writes are reassembled")
    {
      server srv{ test_config() };
      test_client client{ srv.port() };

      auto const encoded(bencode::encode(bencode::value::dict{
        { "op", "describe" },
        { "id",        "d" }
      }));
      auto const half(encoded.size() / 2);
      client.send_raw(encoded.substr(0, half));
      std::this_thread::sleep_for(20ms);
      client.send_raw(encoded.substr(half));

      auto const responses(client.until_done());
      REQUIRE(responses.size() == 1);
      CHECK(field(responses.front(), "id") == "d");
      CHECK(responses.front().contains("ops"));
    }

    TEST_CASE("several frames in one write")
    {
      server srv{ test_config() };
      test_client client{ srv.port() };

      client.send_raw(bencode::encode(bencode::value::dict{
                        { "op", "ls-sessions" },
                        { "id",           "a" }
      })
                      + bencode::encode(bencode::value::dict{
                        { "op", "ls-middleware" },
                        { "id",             "b" }
      }));

      auto const first(client.until_done());
      auto const second(client.until_done());
      CHECK(field(first.front(), "id") == "a");
      CHECK(field(second.front(), "id") == "b");
    }

    TEST_CASE("port file is written and removed")
    {
      auto const path(std::filesystem::temp_directory_path() / "braid-test-nrepl-port");
      auto config(test_config());
      config.port_file = path.string();
      {
        server srv{ config };
        REQUIRE(std::filesystem::exists(path));
        std::ifstream ifs{ path };
        std::uint16_t written{};
        ifs >> written;
        CHECK(written == srv.port());
      }
      CHECK_FALSE(std::filesystem::exists(path));
    }

    TEST_CASE("unknown startup middleware fails construction")
    {
      auto config(test_config());
      config.middleware = { "no.such/middleware" };
      CHECK_THROWS_AS(server{ config }, config_error);
    }
  }
}
