#include <braid/nrepl_server/interrupt_slot.hpp>

namespace braid::nrepl_server
{
  void announce_interrupted(active_task const &task)
  {
    reply_status(task.origin, { "interrupted", "done" });
  }

  std::shared_ptr<runtime::cancellation>
  interrupt_slot::begin(std::string task_id, message origin)
  {
    auto signal(std::make_shared<runtime::cancellation>());
    active_.store(std::make_shared<active_task const>(
      active_task{ std::move(task_id), signal, std::move(origin) }));
    return signal;
  }

  void interrupt_slot::end()
  {
    active_.store(nullptr);
  }

  interrupt_result interrupt_slot::interrupt(std::optional<std::string> const &requested_id)
  {
    auto const task(active_.load());
    if(!task)
    {
      return { interrupt_outcome::idle, nullptr };
    }
    if(requested_id.has_value() && *requested_id != task->id)
    {
      return { interrupt_outcome::no_match, nullptr };
    }

    /* The task may have claimed its own completion since we loaded it. In that case
     * it has already reported `done`, and as far as the caller is concerned the
     * session is idle. */
    if(!task->signal->try_cancel())
    {
      return { interrupt_outcome::idle, nullptr };
    }
    return { interrupt_outcome::interrupted, task };
  }

  std::optional<std::string> interrupt_slot::current_id() const
  {
    auto const task(active_.load());
    if(!task)
    {
      return std::nullopt;
    }
    return task->id;
  }
}
