#include <braid/nrepl_server/io.hpp>
#include <braid/runtime/error.hpp>

namespace braid::nrepl_server
{
  response_stream::response_stream(message origin, std::string key)
    : origin_{ std::move(origin) }
    , key_{ std::move(key) }
  {
  }

  void response_stream::write(std::string_view const chunk)
  {
    std::lock_guard<std::mutex> const lock{ mutex_ };
    pending_.append(chunk);
  }

  void response_stream::flush()
  {
    std::string chunk;
    {
      std::lock_guard<std::mutex> const lock{ mutex_ };
      chunk.swap(pending_);
    }
    if(chunk.empty())
    {
      return;
    }
    reply(origin_, response_for(origin_, { { key_, std::move(chunk) } }));
  }

  session_input::session_input(message origin)
    : origin_{ std::move(origin) }
  {
  }

  std::string session_input::read_line(runtime::cancellation const &cancel)
  {
    if(!origin_.attached_session)
    {
      runtime::throw_error(runtime::error_type::illegal_state, "No session to read input from");
    }
    return origin_.attached_session->input().read_line(cancel,
                                                       [this] { reply_status(origin_, { "need-input" }); });
  }
}
