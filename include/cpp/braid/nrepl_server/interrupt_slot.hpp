#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <braid/nrepl_server/message.hpp>
#include <braid/runtime/cancellation.hpp>

namespace braid::nrepl_server
{
  struct active_task
  {
    std::string id;
    std::shared_ptr<runtime::cancellation> signal;
    /* The request that started the task, so interruption is reported to its client. */
    message origin;
  };

  enum class interrupt_outcome : std::uint8_t
  {
    idle,
    no_match,
    interrupted
  };

  struct interrupt_result
  {
    interrupt_outcome outcome{ interrupt_outcome::idle };
    /* Set for `interrupted`. */
    std::shared_ptr<active_task const> task;
  };

  /* Sends `{status [interrupted done]}` to the client that started `task`, under
   * that request's id. */
  void announce_interrupted(active_task const &task);

  /* Records which task of a session is executing. The id, the signal and the origin
   * are published together as one immutable value, so an interrupter never sees the
   * id of one task paired with the signal of another. */
  class interrupt_slot
  {
  public:
    std::shared_ptr<runtime::cancellation> begin(std::string task_id, message origin = {});
    void end();

    /* An absent `requested_id` matches whatever task is executing. */
    interrupt_result interrupt(std::optional<std::string> const &requested_id);

    std::optional<std::string> current_id() const;

  private:
    std::atomic<std::shared_ptr<active_task const>> active_;
  };
}
