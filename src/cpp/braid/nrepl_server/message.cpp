#include <charconv>
#include <system_error>

#include <braid/nrepl_server/message.hpp>
#include <braid/nrepl_server/session.hpp>

namespace braid::nrepl_server
{
  std::string message::get(std::string const &key, std::string default_value) const
  {
    auto const found(data.find(key));
    if(found == data.end() || !found->second.is_string())
    {
      return default_value;
    }
    return found->second.as_string();
  }

  std::optional<std::int64_t> message::get_integer(std::string const &key) const
  {
    auto const found(data.find(key));
    if(found == data.end())
    {
      return std::nullopt;
    }

    auto const &val(found->second);
    if(val.is_integer())
    {
      return val.as_integer();
    }
    if(!val.is_string() || val.as_string().empty())
    {
      return std::nullopt;
    }

    auto const &str(val.as_string());
    std::int64_t parsed{};
    auto const * const end(str.data() + str.size());
    auto const result(std::from_chars(str.data(), end, parsed));
    if(result.ec == std::errc{} && result.ptr == end)
    {
      return parsed;
    }
    return std::nullopt;
  }

  bencode::value const *message::find_value(std::string const &key) const
  {
    auto const found(data.find(key));
    if(found == data.end())
    {
      return nullptr;
    }
    return &found->second;
  }

  std::optional<std::vector<std::string>> message::get_string_list(std::string const &key) const
  {
    auto const * const found(find_value(key));
    if(!found || !found->is_list())
    {
      return std::nullopt;
    }

    std::vector<std::string> items;
    items.reserve(found->as_list().size());
    for(auto const &entry : found->as_list())
    {
      if(!entry.is_string())
      {
        return std::nullopt;
      }
      items.push_back(entry.as_string());
    }
    return items;
  }

  std::string message::id() const
  {
    return get("id");
  }

  std::string message::op() const
  {
    return get("op");
  }

  std::string message::session_id() const
  {
    if(attached_session)
    {
      return attached_session->id;
    }
    return get("session");
  }

  message message::assoc(std::string const &key, bencode::value v) const
  {
    auto ret(*this);
    ret.data.insert_or_assign(key, std::move(v));
    return ret;
  }

  message message::with_session(std::shared_ptr<session> s) const
  {
    auto ret(*this);
    ret.attached_session = std::move(s);
    return ret;
  }

  response response_for(message const &msg, response fields)
  {
    auto const id(msg.id());
    if(!id.empty())
    {
      fields.insert_or_assign("id", id);
    }
    auto const session(msg.session_id());
    if(!session.empty())
    {
      fields.insert_or_assign("session", session);
    }
    return fields;
  }

  response status_response(message const &msg, std::vector<std::string> const &statuses)
  {
    return response_for(msg, { { "status", bencode::list_of_strings(statuses) } });
  }

  void reply(message const &msg, response payload)
  {
    if(msg.channel)
    {
      msg.channel->send(std::move(payload));
    }
  }

  void reply_status(message const &msg, std::vector<std::string> const &statuses)
  {
    reply(msg, status_response(msg, statuses));
  }

  message make_message(std::initializer_list<std::pair<std::string, std::string>> fields,
                       std::shared_ptr<transport> channel)
  {
    message msg;
    for(auto const &entry : fields)
    {
      msg.data.emplace(entry.first, bencode::value{ entry.second });
    }
    msg.channel = std::move(channel);
    return msg;
  }
}
