#pragma once

#include <braid/nrepl_server/handler.hpp>
#include <braid/util/scope_exit.hpp>

namespace braid::nrepl_server::ops
{
  /* The body of a queued `eval`. Whoever settles the task's cancellation first
   * reports its end: this task with `done`, or an interrupter with `interrupted`. */
  inline void run_eval(handler_context &ctx, session_ref const &target, message const &msg)
  {
    auto const signal(target->slot().begin(msg.id(), msg));
    util::scope_exit const finally{ [&target] { target->slot().end(); } };

    /* Work that starts after shutdown began ends at once, as if interrupted. */
    if(ctx.sessions.closing() && signal->try_cancel())
    {
      reply_status(msg, { "interrupted", "done" });
      return;
    }

    target->set_snapshot(ctx.engine.evaluate(target->snapshot(), msg, *signal));
    if(signal->try_finish())
    {
      reply_status(msg, { "done" });
    }
  }

  inline void handle_eval(handler_context &ctx, message const &msg)
  {
    if(!msg.find_value("code"))
    {
      reply_status(msg, { "error", "no-code", "done" });
      return;
    }

    auto const target(msg.attached_session ? msg.attached_session : ctx.sessions.ephemeral());
    auto const attached(msg.with_session(target));
    target->queue().submit(
      task{ msg.id(), [&ctx, target, attached] { run_eval(ctx, target, attached); } });
  }

  inline void handle_interrupt(message const &msg)
  {
    std::optional<std::string> requested;
    if(msg.find_value("interrupt-id"))
    {
      requested = msg.get("interrupt-id");
    }

    auto const result(msg.attached_session->slot().interrupt(requested));
    switch(result.outcome)
    {
      case interrupt_outcome::idle:
        reply_status(msg, { "session-idle", "done" });
        break;
      case interrupt_outcome::no_match:
        reply_status(msg, { "error", "interrupt-id-mismatch", "done" });
        break;
      case interrupt_outcome::interrupted:
        /* The task can no longer claim `done`, so this is its only terminal status. */
        announce_interrupted(*result.task);
        reply_status(msg, { "done" });
        break;
    }
  }

  inline descriptor_ref make_interruptible_eval_middleware(handler_context &ctx)
  {
    auto d(std::make_shared<descriptor>());
    d->name = middleware_names::interruptible_eval;
    d->required = { "clone", "close" };
    d->handles.emplace(
      "eval",
      op_doc{ "Evaluates code.",
              { { "code", "The code to be evaluated." },
                { "session", "The ID of the session within which to evaluate the code." } },
              { { "id",
                  "An opaque message ID that will be included in responses related to the "
                  "evaluation, and which may be used to restrict the scope of a later "
                  "\"interrupt\" operation." },
                { "eval",
                  "A fully-qualified symbol naming a var whose function value will be used to "
                  "evaluate [code], instead of `braid.core/eval` (the default)." },
                { "file",
                  "The path to the file containing [code]. `braid.core/*file*` will be bound to "
                  "this." },
                { "line", "The line number in [file] at which [code] starts." },
                { "column", "The column number in [file] at which [code] starts." } },
              { { "ns", "*ns*, after successful evaluation of `code`." },
                { "value", "The result of evaluating `code`, readable where possible." },
                { "ex", "The type of exception thrown, if any." },
                { "root-ex", "The type of the root exception thrown, if any." } } });
    d->handles.emplace(
      "interrupt",
      op_doc{ "Attempts to interrupt some code evaluation.",
              { { "session", "The ID of the session used to start the evaluation to be interrupted." } },
              { { "interrupt-id", "The opaque message ID sent with the original \"eval\" request." } },
              { { "status",
                  "'interrupted' if an evaluation was identified and interruption will be attempted\n"
                  "'session-idle' if the session is not currently evaluating any code\n"
                  "'interrupt-id-mismatch' if the session is currently evaluating code sent using a "
                  "different ID than specified by the \"interrupt-id\" value" } } });

    d->wrap = [&ctx](handler next) -> handler {
      return [&ctx, next = std::move(next)](message const &msg) {
        auto const op(msg.op());
        if(op == "eval")
        {
          handle_eval(ctx, msg);
          return;
        }
        if(op == "interrupt")
        {
          handle_interrupt(msg);
          return;
        }
        next(msg);
      };
    };
    return d;
  }
}
