#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <immer/map.hpp>

#include <braid/nrepl_server/session.hpp>
#include <braid/runtime/context.hpp>

namespace braid::nrepl_server
{
  /* The live sessions of a server, keyed by id. Membership changes are
   * compare-and-set swaps of a persistent map; lookups never block.
   *
   * Unregistered sessions are tracked too, weakly, so that shutdown reaches work
   * no client can name. */
  class session_registry
  {
  public:
    using map_type = immer::map<std::string, session_ref>;
    using weak_map_type = immer::map<std::string, std::weak_ptr<session>>;

    session_registry(runtime::context &rt, worker_pool &pool);

    /* Registers a new session starting from `initial`, or from a fresh snapshot in
     * `user` when nothing is given. */
    session_ref create(std::optional<runtime::bindings> initial = std::nullopt);
    /* A session that is never registered; used for requests that name none. */
    session_ref ephemeral();

    session_ref find(std::string const &id) const;
    /* Unregisters the session and returns it, or null for an unknown id. */
    session_ref remove(std::string const &id);

    /* Sorted. */
    std::vector<std::string> ids() const;
    std::size_t size() const;

    /* Ephemeral sessions still referenced by a request or a queued task. */
    std::size_t ephemeral_count() const;

    /* Marks the registry as closing and interrupts whatever every live session,
     * registered or not, is executing. Tasks that start afterwards see `closing()`. */
    void interrupt_all();
    bool closing() const;

  private:
    session_ref make(std::optional<runtime::bindings> initial) const;

    runtime::context &rt_;
    worker_pool &pool_;
    std::atomic<std::shared_ptr<map_type const>> sessions_;
    std::atomic<std::shared_ptr<weak_map_type const>> ephemeral_;
    std::atomic<bool> closing_{ false };
  };

  std::string next_session_id();
}
