#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>

namespace braid::runtime
{
  /* The cancellation signal of one evaluation task.
   *
   * The task and an interrupter race to settle it exactly once: the task claims it
   * with `try_finish` before announcing its own completion, the interrupter claims it
   * with `try_cancel` before announcing the interruption. Whoever wins is the only one
   * that reports a terminal status for the task.
   *
   * Blocking operations inside an evaluation wait on `token()` so a successful
   * `try_cancel` wakes them immediately. */
  class cancellation
  {
  public:
    enum class state : std::uint8_t
    {
      running,
      cancelled,
      finished
    };

    bool try_cancel();
    bool try_finish();

    bool cancelled() const;
    state current() const;

    /* Throws `runtime::interrupted` once cancelled. */
    void throw_if_cancelled() const;

    std::stop_token token() const;

    /* Sleeps for `duration`, waking early and throwing `runtime::interrupted` when
     * cancelled. A duration past the steady clock's range sleeps until cancelled. */
    template <typename Rep, typename Period>
    void sleep_for(std::chrono::duration<Rep, Period> const duration) const
    {
      using clock = std::chrono::steady_clock;
      using requested = std::chrono::duration<Rep, Period>;

      std::mutex mutex;
      std::condition_variable_any cv;
      std::unique_lock<std::mutex> lock{ mutex };
      auto const now(clock::now());
      /* Compared in the caller's units; widening `duration` to the clock's could overflow. */
      if(duration >= std::chrono::duration_cast<requested>(clock::time_point::max() - now))
      {
        cv.wait(lock, source_.get_token(), [] { return false; });
      }
      else
      {
        cv.wait_until(lock,
                      source_.get_token(),
                      now + std::chrono::ceil<clock::duration>(duration),
                      [] { return false; });
      }
      throw_if_cancelled();
    }

  private:
    std::atomic<state> state_{ state::running };
    std::stop_source source_;
  };
}
