#pragma once

#include <string>
#include <vector>

#include <braid/nrepl_server/evaluate.hpp>
#include <braid/nrepl_server/middleware.hpp>
#include <braid/nrepl_server/session_registry.hpp>
#include <braid/nrepl_server/worker_pool.hpp>
#include <braid/runtime/context.hpp>

namespace braid::nrepl_server
{
  /* Everything the built-in middleware reach into. Must outlive every pipeline
   * composed from them. */
  struct handler_context
  {
    runtime::context &rt;
    worker_pool &pool;
    session_registry &sessions;
    evaluation_engine &engine;
    pipeline_slot &pipeline;
    middleware_registry &registry;
  };

  namespace middleware_names
  {
    constexpr char const *describe{ "braid.middleware/wrap-describe" };
    constexpr char const *session{ "braid.middleware.session/session" };
    constexpr char const *add_stdin{ "braid.middleware.session/add-stdin" };
    constexpr char const *load_file{ "braid.middleware.load-file/wrap-load-file" };
    constexpr char const *interruptible_eval{
      "braid.middleware.interruptible-eval/interruptible-eval"
    };
    constexpr char const *dynamic_loader{ "braid.middleware.dynamic-loader/wrap-dynamic-loader" };
  }

  std::vector<std::string> default_stack();

  /* Adds the built-in middleware to `ctx.registry`. */
  void register_builtin_middleware(handler_context &ctx);

  /* Looks every name up in `ctx.registry`. Throws `config_error` for unknown names. */
  std::vector<descriptor_ref> resolve_middleware(handler_context const &ctx,
                                                 std::vector<std::string> const &names);

  /* Installs a pipeline holding just the dynamic loader, then swaps in the default
   * stack plus `extra`. Throws `config_error` when that does not compose. */
  pipeline_ref default_handler(handler_context &ctx, std::vector<std::string> const &extra = {});
}
