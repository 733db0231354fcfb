#pragma once

#include <mutex>
#include <string>

#include <braid/nrepl_server/message.hpp>
#include <braid/nrepl_server/session.hpp>
#include <braid/runtime/bindings.hpp>

namespace braid::nrepl_server
{
  /* `*out*` / `*err*` for one request: text is buffered and sent as a single
   * `{out ...}` or `{err ...}` response on flush. */
  class response_stream : public runtime::output_stream
  {
  public:
    response_stream(message origin, std::string key);

    void write(std::string_view chunk) override;
    void flush() override;

  private:
    message origin_;
    std::string key_;
    std::mutex mutex_;
    std::string pending_;
  };

  /* `*in*` for one request: reads from the session's stdin buffer and asks the
   * client for more with a `need-input` status when it runs dry. */
  class session_input : public runtime::input_stream
  {
  public:
    explicit session_input(message origin);

    std::string read_line(runtime::cancellation const &cancel) override;

  private:
    message origin_;
  };
}
