#pragma once

#include <exception>
#include <functional>

#include <braid/nrepl_server/message.hpp>
#include <braid/runtime/bindings.hpp>
#include <braid/runtime/cancellation.hpp>
#include <braid/runtime/context.hpp>

namespace braid::nrepl_server
{
  /* Recognizes exceptions that mean "stop quietly": no value, no error report. */
  using termination_predicate = std::function<bool(std::exception const &)>;

  bool is_interruption(std::exception const &e);

  struct evaluation_options
  {
    termination_predicate is_termination{ &is_interruption };
  };

  /* Drives `code` through read, eval and print for one request.
   *
   * One `{value ns}` response is sent per top-level form. The first failure sends
   * `{status [eval-error] ex root-ex}`, writes a report to `*err*` and abandons the
   * rest of the request. Terminations, and failures after the task was already
   * interrupted, are absorbed without a response. `code` that is neither a string
   * nor a list of strings is rejected with `{status [error malformed-code done]}`.
   *
   * The returned snapshot is what the session's next request starts from. An
   * explicit `ns` in the request does not survive into it. */
  class evaluation_engine
  {
  public:
    explicit evaluation_engine(runtime::context &rt, evaluation_options opts = {});

    runtime::bindings evaluate(runtime::bindings const &snapshot,
                               message const &msg,
                               runtime::cancellation &cancel);

    runtime::context &rt;

  private:
    evaluation_options opts_;
  };

  /* The human-readable error report written to `*err*`, e.g.
   * `Execution error (ArithmeticException) at user/eval (REPL:1:1).` */
  std::string format_error_report(runtime::exception_info const &ex,
                                  std::string const &ns_name,
                                  std::string const &location);
}
