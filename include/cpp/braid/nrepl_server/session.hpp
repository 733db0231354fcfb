#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <braid/nrepl_server/interrupt_slot.hpp>
#include <braid/nrepl_server/task_queue.hpp>
#include <braid/runtime/bindings.hpp>

namespace braid::nrepl_server
{
  /* Text a client sent with the `stdin` op, waiting to be read by `read-line`. */
  class stdin_buffer
  {
  public:
    void append(std::string const &chunk);

    /* Blocks until a full line is buffered, then returns it without its newline.
     * `on_empty` runs (without the lock held) each time the reader finds nothing
     * to read. Throws `runtime::interrupted` once `cancel` fires. */
    std::string read_line(runtime::cancellation const &cancel, std::function<void()> const &on_empty);

    std::string unread() const;

  private:
    mutable std::mutex mutex_;
    std::condition_variable_any ready_;
    std::string buffer_;
  };

  class session
  {
  public:
    session(std::string id, runtime::bindings initial, worker_pool &pool);
    session(session const &) = delete;
    session(session &&) = delete;

    runtime::bindings snapshot() const;
    void set_snapshot(runtime::bindings next);

    task_queue &queue();
    interrupt_slot &slot();
    stdin_buffer &input();

    /* Interrupts the executing task, if any. Queued tasks still run. */
    interrupt_result close();

    std::string const id;

  private:
    std::atomic<std::shared_ptr<runtime::bindings const>> bindings_;
    std::shared_ptr<task_queue> queue_;
    interrupt_slot slot_;
    stdin_buffer input_;
  };

  using session_ref = std::shared_ptr<session>;
}
