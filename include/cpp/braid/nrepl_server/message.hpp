#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <braid/nrepl_server/bencode.hpp>
#include <braid/nrepl_server/transport.hpp>

namespace braid::nrepl_server
{
  class session;

  /* A request as handlers see it: the decoded wire dict plus what the receiving
   * layer attaches to it. Treated as immutable once dispatched; `assoc` and
   * `with_session` return modified copies. */
  struct message
  {
    bencode::value::dict data;
    std::shared_ptr<transport> channel;
    std::shared_ptr<session> attached_session;

    /* The string at `key`, or `default_value` when missing or not a string. */
    std::string get(std::string const &key, std::string default_value = {}) const;
    /* Accepts both bencode integers and numeric strings. */
    std::optional<std::int64_t> get_integer(std::string const &key) const;
    bencode::value const *find_value(std::string const &key) const;
    /* Nothing when missing or when any entry is not a string. */
    std::optional<std::vector<std::string>> get_string_list(std::string const &key) const;

    std::string id() const;
    std::string op() const;
    /* The attached session's id if there is one, otherwise the wire `session`. */
    std::string session_id() const;

    message assoc(std::string const &key, bencode::value v) const;
    message with_session(std::shared_ptr<session> s) const;
  };

  /* A response carrying the request's `id` and session, plus `fields`. */
  response response_for(message const &msg, response fields = {});
  response status_response(message const &msg, std::vector<std::string> const &statuses);

  /* Sends through the message's transport. A message without one is dropped. */
  void reply(message const &msg, response payload);
  void reply_status(message const &msg, std::vector<std::string> const &statuses);

  message make_message(std::initializer_list<std::pair<std::string, std::string>> fields,
                       std::shared_ptr<transport> channel = nullptr);
}
