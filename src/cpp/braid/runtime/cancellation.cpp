#include <braid/runtime/cancellation.hpp>
#include <braid/runtime/error.hpp>

namespace braid::runtime
{
  bool cancellation::try_cancel()
  {
    auto expected(state::running);
    if(!state_.compare_exchange_strong(expected, state::cancelled))
    {
      return false;
    }
    source_.request_stop();
    return true;
  }

  bool cancellation::try_finish()
  {
    auto expected(state::running);
    return state_.compare_exchange_strong(expected, state::finished);
  }

  bool cancellation::cancelled() const
  {
    return state_.load() == state::cancelled;
  }

  cancellation::state cancellation::current() const
  {
    return state_.load();
  }

  void cancellation::throw_if_cancelled() const
  {
    if(cancelled())
    {
      throw interrupted{};
    }
  }

  std::stop_token cancellation::token() const
  {
    return source_.get_token();
  }
}
