#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <braid/nrepl_server/handler.hpp>
#include <braid/nrepl_server/message.hpp>
#include <braid/nrepl_server/transport.hpp>

/* This must go last; doctest defines CHECK and family. */
#include <doctest/doctest.h>

namespace braid::nrepl_server
{
  using namespace std::chrono_literals;

  inline std::vector<std::string> extract_status(bencode::value::dict const &payload)
  {
    std::vector<std::string> statuses;
    auto const status_iter(payload.find("status"));
    if(status_iter == payload.end())
    {
      return statuses;
    }

    auto const &list(status_iter->second.as_list());
    statuses.reserve(list.size());
    for(auto const &entry : list)
    {
      statuses.push_back(entry.as_string());
    }
    return statuses;
  }

  inline bool has_status(bencode::value::dict const &payload, std::string const &status)
  {
    auto const statuses(extract_status(payload));
    return std::ranges::find(statuses, status) != statuses.end();
  }

  /* The string at `key`, or empty. */
  inline std::string field(bencode::value::dict const &payload, std::string const &key)
  {
    auto const found(payload.find(key));
    if(found == payload.end() || !found->second.is_string())
    {
      return {};
    }
    return found->second.as_string();
  }

  inline std::string dict_keys(bencode::value::dict const &dict)
  {
    std::string joined;
    for(auto const &entry : dict)
    {
      if(!joined.empty())
      {
        joined += ',';
      }
      joined += entry.first;
    }
    return joined;
  }

  /* Collects everything sent to one client. */
  class recording_transport : public transport
  {
  public:
    void send(response payload) override
    {
      {
        std::lock_guard<std::mutex> const lock{ mutex_ };
        responses_.push_back(std::move(payload));
      }
      cv_.notify_all();
    }

    void close() override
    {
      std::lock_guard<std::mutex> const lock{ mutex_ };
      open_ = false;
    }

    bool is_open() const override
    {
      std::lock_guard<std::mutex> const lock{ mutex_ };
      return open_;
    }

    std::vector<response> all() const
    {
      std::lock_guard<std::mutex> const lock{ mutex_ };
      return responses_;
    }

    std::vector<response> for_id(std::string const &id) const
    {
      std::lock_guard<std::mutex> const lock{ mutex_ };
      std::vector<response> ret;
      for(auto const &r : responses_)
      {
        if(field(r, "id") == id)
        {
          ret.push_back(r);
        }
      }
      return ret;
    }

    /* Waits until a response for `id` carries `status`. */
    bool wait_for_status(std::string const &id,
                         std::string const &status,
                         std::chrono::milliseconds const timeout = 5s) const
    {
      std::unique_lock<std::mutex> lock{ mutex_ };
      return cv_.wait_for(lock, timeout, [&] {
        return std::ranges::any_of(responses_, [&](response const &r) {
          return field(r, "id") == id && has_status(r, status);
        });
      });
    }

    bool wait_for_count(std::size_t const count,
                        std::chrono::milliseconds const timeout = 5s) const
    {
      std::unique_lock<std::mutex> lock{ mutex_ };
      return cv_.wait_for(lock, timeout, [&] { return responses_.size() >= count; });
    }

  private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::vector<response> responses_;
    bool open_{ true };
  };

  /* A server without the network: the default pipeline over an in-process
   * transport. */
  struct harness
  {
    explicit harness(std::vector<std::string> const &extra = {})
    {
      register_builtin_middleware(ctx);
      default_handler(ctx, extra);
    }

    /* Dispatches on the calling thread, the way a connection does. */
    void send(message const &msg) const
    {
      pipeline.dispatch(msg);
    }

    message request(std::initializer_list<std::pair<std::string, std::string>> fields) const
    {
      return make_message(fields, client);
    }

    std::string clone()
    {
      auto const id(next_id());
      send(request({
        {   "op", "clone" },
        {   "id",      id }
      }));
      auto const responses(client->for_id(id));
      REQUIRE(responses.size() == 1);
      return field(responses.front(), "new-session");
    }

    /* Sends an eval and waits for its terminal status. */
    std::vector<response> eval(std::string const &session, std::string const &code)
    {
      auto const id(next_id());
      send(request({
        {      "op",    "eval" },
        {      "id",        id },
        { "session",   session },
        {    "code",      code }
      }));
      REQUIRE(client->wait_for_status(id, "done"));
      return client->for_id(id);
    }

    std::string next_id()
    {
      return "req-" + std::to_string(++counter);
    }

    runtime::context rt;
    middleware_registry registry;
    pipeline_slot pipeline;
    session_registry sessions{ rt, pool };
    evaluation_engine engine{ rt };
    handler_context ctx{ rt, pool, sessions, engine, pipeline, registry };
    worker_pool pool{ 4 };
    std::shared_ptr<recording_transport> client{ std::make_shared<recording_transport>() };
    int counter{};
  };

  /* The `value` of every response that has one, in order. */
  inline std::vector<std::string> values_of(std::vector<response> const &responses)
  {
    std::vector<std::string> ret;
    for(auto const &r : responses)
    {
      if(r.contains("value"))
      {
        ret.push_back(field(r, "value"));
      }
    }
    return ret;
  }

  inline std::string joined_field(std::vector<response> const &responses, std::string const &key)
  {
    std::string ret;
    for(auto const &r : responses)
    {
      ret += field(r, key);
    }
    return ret;
  }
}
