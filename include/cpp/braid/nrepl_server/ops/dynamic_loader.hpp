#pragma once

#include <algorithm>

#include <braid/nrepl_server/handler.hpp>
#include <braid/util/log.hpp>

namespace braid::nrepl_server::ops
{
  inline std::vector<std::string> active_middleware(handler_context const &ctx)
  {
    auto const active(ctx.pipeline.load());
    if(!active)
    {
      return {};
    }
    return active->names();
  }

  inline void reply_middleware(handler_context const &ctx, message const &msg)
  {
    auto payload(status_response(msg, { "done" }));
    payload.emplace("middleware", bencode::list_of_strings(active_middleware(ctx)));
    reply(msg, std::move(payload));
  }

  /* Recomposes the pipeline from `names` and installs it, or reports why not. */
  inline void install_middleware(handler_context &ctx,
                                 message const &msg,
                                 std::vector<std::string> const &names)
  {
    std::vector<std::string> unknown;
    for(auto const &name : names)
    {
      if(!ctx.registry.find(name))
      {
        unknown.push_back(name);
      }
    }
    if(!unknown.empty())
    {
      auto payload(status_response(msg, { "error", "unknown-middleware", "done" }));
      payload.emplace("unknown-middleware", bencode::list_of_strings(unknown));
      reply(msg, std::move(payload));
      return;
    }

    try
    {
      ctx.pipeline.replace(resolve_middleware(ctx, names));
    }
    catch(config_error const &e)
    {
      util::log::get()->error("middleware change rejected: {}", e.what());
      auto payload(status_response(msg, { "error", "middleware-config-error", "done" }));
      payload.emplace("err", std::string{ e.what() });
      reply(msg, std::move(payload));
      return;
    }
    reply_middleware(ctx, msg);
  }

  inline void append_unique(std::vector<std::string> &names, std::vector<std::string> const &extra)
  {
    for(auto const &name : extra)
    {
      if(std::ranges::find(names, name) == names.end())
      {
        names.push_back(name);
      }
    }
  }

  inline descriptor_ref make_dynamic_loader_middleware(handler_context &ctx)
  {
    auto d(std::make_shared<descriptor>());
    d->name = middleware_names::dynamic_loader;
    d->handles.emplace("ls-middleware",
                       op_doc{ "List of current middleware",
                               {},
                               {},
                               { { "middleware", "list of middleware" } } });
    d->handles.emplace(
      "add-middleware",
      op_doc{ "Adds middleware to the stack, recomposing it",
              { { "middleware", "a list of middleware names" } },
              {},
              { { "unknown-middleware", "a list of middleware that could not be found" } } });
    d->handles.emplace(
      "swap-middleware",
      op_doc{ "Replace the whole middleware stack. The dynamic loader is always kept.",
              { { "middleware", "a list of middleware names" } },
              {},
              { { "unknown-middleware", "a list of middleware that could not be found" } } });

    d->wrap = [&ctx](handler next) -> handler {
      return [&ctx, next = std::move(next)](message const &msg) {
        auto const op(msg.op());
        if(op == "ls-middleware")
        {
          reply_middleware(ctx, msg);
          return;
        }
        if(op != "add-middleware" && op != "swap-middleware")
        {
          next(msg);
          return;
        }

        auto const requested(msg.get_string_list("middleware"));
        if(!requested.has_value())
        {
          reply_status(msg, { "error", "missing-middleware", "done" });
          return;
        }

        std::vector<std::string> names;
        if(op == "add-middleware")
        {
          names = active_middleware(ctx);
          append_unique(names, *requested);
        }
        else
        {
          append_unique(names, *requested);
          append_unique(names, { middleware_names::dynamic_loader });
        }
        install_middleware(ctx, msg, names);
      };
    };
    return d;
  }
}
