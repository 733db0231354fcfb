#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include <immer/flex_vector.hpp>

#include <braid/nrepl_server/worker_pool.hpp>

namespace braid::nrepl_server
{
  struct task
  {
    std::string id;
    std::function<void()> thunk;
  };

  /* A session's execution queue.
   *
   * The pending tasks are a persistent vector swapped in with compare-and-set, so
   * `submit` never waits on another submitter or on a running task. The head of the
   * vector is the task that is running (or about to run); at most one task per queue
   * is ever on the pool. The submitter whose CAS takes the queue from empty to
   * non-empty schedules the head; after that, each completed task schedules its
   * successor. */
  class task_queue : public std::enable_shared_from_this<task_queue>
  {
  public:
    using queue_type = immer::flex_vector<task>;

    task_queue(worker_pool &pool, std::string owner);

    void submit(task t);

    /* Tasks that have not completed yet, including the running one. */
    std::size_t pending() const;
    bool idle() const;

    std::string const owner;

  private:
    void schedule(task const &t);
    void run(task const &t);
    void advance();

    worker_pool &pool_;
    std::atomic<std::shared_ptr<queue_type const>> state_;
  };
}
