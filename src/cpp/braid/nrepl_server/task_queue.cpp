#include <braid/nrepl_server/task_queue.hpp>
#include <braid/util/log.hpp>
#include <braid/util/scope_exit.hpp>

namespace braid::nrepl_server
{
  task_queue::task_queue(worker_pool &pool, std::string owner)
    : owner{ std::move(owner) }
    , pool_{ pool }
    , state_{ std::make_shared<queue_type const>() }
  {
  }

  void task_queue::submit(task t)
  {
    auto current(state_.load());
    std::shared_ptr<queue_type const> next;
    do
    {
      next = std::make_shared<queue_type const>(current->push_back(t));
    } while(!state_.compare_exchange_weak(current, next));

    /* `current` is what our CAS replaced; only the empty -> non-empty transition
     * kicks off execution. */
    if(current->empty())
    {
      schedule(next->front());
    }
  }

  std::size_t task_queue::pending() const
  {
    return state_.load()->size();
  }

  bool task_queue::idle() const
  {
    return state_.load()->empty();
  }

  void task_queue::schedule(task const &t)
  {
    pool_.submit([self = shared_from_this(), t] { self->run(t); });
  }

  void task_queue::run(task const &t)
  {
    util::scope_exit const finally{ [this] { advance(); } };
    try
    {
      t.thunk();
    }
    catch(std::exception const &e)
    {
      util::log::get()->error("task {} in session {} failed: {}", t.id, owner, e.what());
    }
  }

  void task_queue::advance()
  {
    auto current(state_.load());
    std::shared_ptr<queue_type const> next;
    do
    {
      next = std::make_shared<queue_type const>(current->drop(1));
    } while(!state_.compare_exchange_weak(current, next));

    if(!next->empty())
    {
      schedule(next->front());
    }
  }
}
