#include <algorithm>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <braid/nrepl_server/session_registry.hpp>

namespace braid::nrepl_server
{
  std::string next_session_id()
  {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
  }

  session_registry::session_registry(runtime::context &rt, worker_pool &pool)
    : rt_{ rt }
    , pool_{ pool }
    , sessions_{ std::make_shared<map_type const>() }
    , ephemeral_{ std::make_shared<weak_map_type const>() }
  {
  }

  session_ref session_registry::make(std::optional<runtime::bindings> initial) const
  {
    return std::make_shared<session>(next_session_id(),
                                     initial.has_value() ? std::move(*initial)
                                                         : rt_.initial_bindings(),
                                     pool_);
  }

  session_ref session_registry::create(std::optional<runtime::bindings> initial)
  {
    auto created(make(std::move(initial)));
    auto current(sessions_.load());
    std::shared_ptr<map_type const> next;
    do
    {
      next = std::make_shared<map_type const>(current->set(created->id, created));
    } while(!sessions_.compare_exchange_weak(current, next));
    return created;
  }

  session_ref session_registry::ephemeral()
  {
    auto created(make(std::nullopt));
    auto current(ephemeral_.load());
    std::shared_ptr<weak_map_type const> next;
    do
    {
      /* Expired entries are dropped on the way, so the map only holds live work. */
      auto pruned(*current);
      for(auto const &entry : *current)
      {
        if(entry.second.expired())
        {
          pruned = pruned.erase(entry.first);
        }
      }
      next = std::make_shared<weak_map_type const>(pruned.set(created->id, created));
    } while(!ephemeral_.compare_exchange_weak(current, next));
    return created;
  }

  std::size_t session_registry::ephemeral_count() const
  {
    auto const current(ephemeral_.load());
    return static_cast<std::size_t>(
      std::count_if(current->begin(), current->end(), [](auto const &entry) {
        return !entry.second.expired();
      }));
  }

  session_ref session_registry::find(std::string const &id) const
  {
    auto const current(sessions_.load());
    if(auto const * const found = current->find(id))
    {
      return *found;
    }
    return nullptr;
  }

  session_ref session_registry::remove(std::string const &id)
  {
    auto current(sessions_.load());
    std::shared_ptr<map_type const> next;
    session_ref removed;
    do
    {
      auto const * const found(current->find(id));
      if(!found)
      {
        return nullptr;
      }
      removed = *found;
      next = std::make_shared<map_type const>(current->erase(id));
    } while(!sessions_.compare_exchange_weak(current, next));
    return removed;
  }

  std::vector<std::string> session_registry::ids() const
  {
    auto const current(sessions_.load());
    std::vector<std::string> ret;
    ret.reserve(current->size());
    for(auto const &entry : *current)
    {
      ret.push_back(entry.first);
    }
    std::ranges::sort(ret);
    return ret;
  }

  std::size_t session_registry::size() const
  {
    return sessions_.load()->size();
  }

  void session_registry::interrupt_all()
  {
    closing_.store(true);

    auto const interrupt([](session &s) {
      auto const result(s.close());
      if(result.outcome == interrupt_outcome::interrupted)
      {
        announce_interrupted(*result.task);
      }
    });

    auto const registered(sessions_.load());
    for(auto const &entry : *registered)
    {
      interrupt(*entry.second);
    }

    auto const unregistered(ephemeral_.load());
    for(auto const &entry : *unregistered)
    {
      if(auto const live = entry.second.lock())
      {
        interrupt(*live);
      }
    }
  }

  bool session_registry::closing() const
  {
    return closing_.load();
  }
}
