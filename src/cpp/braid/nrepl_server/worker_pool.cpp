#include <algorithm>

#include <boost/asio/post.hpp>

#include <braid/nrepl_server/worker_pool.hpp>

namespace braid::nrepl_server
{
  worker_pool::worker_pool(std::size_t const threads)
    : size_{ std::max<std::size_t>(threads, 1) }
    , pool_{ size_ }
  {
  }

  worker_pool::~worker_pool()
  {
    pool_.stop();
    pool_.join();
  }

  void worker_pool::submit(thunk_type thunk)
  {
    boost::asio::post(pool_, std::move(thunk));
  }

  std::size_t worker_pool::size() const
  {
    return size_;
  }

  void worker_pool::join()
  {
    pool_.join();
  }
}
