#include <fmt/format.h>
#include <fmt/ranges.h>

#include <braid/nrepl_server/handler.hpp>
#include <braid/nrepl_server/ops/describe.hpp>
#include <braid/nrepl_server/ops/dynamic_loader.hpp>
#include <braid/nrepl_server/ops/interruptible_eval.hpp>
#include <braid/nrepl_server/ops/load_file.hpp>
#include <braid/nrepl_server/ops/session.hpp>
#include <braid/nrepl_server/ops/stdin.hpp>

namespace braid::nrepl_server
{
  std::vector<std::string> default_stack()
  {
    return { middleware_names::describe,          middleware_names::session,
             middleware_names::load_file,         middleware_names::interruptible_eval,
             middleware_names::add_stdin,         middleware_names::dynamic_loader };
  }

  void register_builtin_middleware(handler_context &ctx)
  {
    ctx.registry.add(ops::make_describe_middleware(ctx));
    ctx.registry.add(ops::make_session_middleware(ctx));
    ctx.registry.add(ops::make_load_file_middleware());
    ctx.registry.add(ops::make_interruptible_eval_middleware(ctx));
    ctx.registry.add(ops::make_stdin_middleware());
    ctx.registry.add(ops::make_dynamic_loader_middleware(ctx));
  }

  std::vector<descriptor_ref> resolve_middleware(handler_context const &ctx,
                                                 std::vector<std::string> const &names)
  {
    std::vector<descriptor_ref> ret;
    std::vector<std::string> unknown;
    for(auto const &name : names)
    {
      auto found(ctx.registry.find(name));
      if(!found)
      {
        unknown.push_back(name);
        continue;
      }
      ret.push_back(std::move(found));
    }

    if(!unknown.empty())
    {
      throw config_error{ fmt::format("unknown middleware: {}", fmt::join(unknown, ", ")) };
    }
    return ret;
  }

  pipeline_ref default_handler(handler_context &ctx, std::vector<std::string> const &extra)
  {
    ctx.pipeline.replace(resolve_middleware(ctx, { middleware_names::dynamic_loader }));

    auto names(default_stack());
    ops::append_unique(names, extra);
    return ctx.pipeline.replace(resolve_middleware(ctx, names));
  }
}
