#pragma once

#include <cstddef>
#include <functional>

#include <boost/asio/thread_pool.hpp>

namespace braid::nrepl_server
{
  /* The shared pool every session's queued work runs on. Fire and forget: there is
   * no ordering between unrelated submissions. */
  class worker_pool
  {
  public:
    using thunk_type = std::function<void()>;

    explicit worker_pool(std::size_t threads);
    worker_pool(worker_pool const &) = delete;
    worker_pool(worker_pool &&) = delete;
    ~worker_pool();

    void submit(thunk_type thunk);
    std::size_t size() const;

    /* Waits for outstanding work once no more will be submitted. */
    void join();

  private:
    std::size_t size_;
    boost::asio::thread_pool pool_;
  };
}
