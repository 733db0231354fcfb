#pragma once

#include <braid/nrepl_server/handler.hpp>

namespace braid::nrepl_server::ops
{
  inline void handle_clone(handler_context &ctx, message const &msg)
  {
    std::optional<runtime::bindings> initial;
    if(auto const parent = ctx.sessions.find(msg.get("session")); parent)
    {
      initial = parent->snapshot();
    }
    auto const created(ctx.sessions.create(std::move(initial)));

    auto payload(status_response(msg, { "done" }));
    payload.emplace("new-session", created->id);
    reply(msg, std::move(payload));
  }

  inline void handle_close(handler_context &ctx, message const &msg)
  {
    auto const removed(ctx.sessions.remove(msg.get("session")));
    if(!removed)
    {
      reply_status(msg, { "error", "unknown-session", "done" });
      return;
    }

    auto const interrupted(removed->close());
    if(interrupted.outcome == interrupt_outcome::interrupted)
    {
      announce_interrupted(*interrupted.task);
    }
    reply_status(msg, { "session-closed", "done" });
  }

  inline void handle_ls_sessions(handler_context &ctx, message const &msg)
  {
    auto payload(status_response(msg, { "done" }));
    payload.emplace("sessions", bencode::list_of_strings(ctx.sessions.ids()));
    reply(msg, std::move(payload));
  }

  /* Owns session lifecycle and attaches the session named by each request before
   * passing it on. Requests naming no session get a throwaway one. */
  inline descriptor_ref make_session_middleware(handler_context &ctx)
  {
    auto d(std::make_shared<descriptor>());
    d->name = middleware_names::session;
    d->handles.emplace("clone",
                       op_doc{ "Clones the current session, returning the ID of the newly-created "
                               "session.",
                               {},
                               { { "session", "The ID of the session to be cloned." } },
                               { { "new-session", "The ID of the new session." } } });
    d->handles.emplace("close",
                       op_doc{ "Closes the specified session.",
                               { { "session", "The ID of the session to be closed." } },
                               {},
                               {} });
    d->handles.emplace("ls-sessions",
                       op_doc{ "Lists the IDs of all active sessions.",
                               {},
                               {},
                               { { "sessions", "A list of all available session IDs." } } });

    d->wrap = [&ctx](handler next) -> handler {
      return [&ctx, next = std::move(next)](message const &msg) {
        auto const op(msg.op());
        if(op == "clone")
        {
          handle_clone(ctx, msg);
          return;
        }
        if(op == "close")
        {
          handle_close(ctx, msg);
          return;
        }
        if(op == "ls-sessions")
        {
          handle_ls_sessions(ctx, msg);
          return;
        }

        auto const id(msg.get("session"));
        if(id.empty())
        {
          next(msg.with_session(ctx.sessions.ephemeral()));
          return;
        }

        auto const found(ctx.sessions.find(id));
        if(!found)
        {
          reply_status(msg, { "error", "unknown-session", "done" });
          return;
        }
        next(msg.with_session(found));
      };
    };
    return d;
  }
}
