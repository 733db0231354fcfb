#pragma once

#include <braid/nrepl_server/handler.hpp>
#include <braid/version.hpp>

namespace braid::nrepl_server::ops
{
  inline bencode::value doc_strings(std::map<std::string, std::string> const &docs)
  {
    bencode::value::dict ret;
    for(auto const &[key, doc] : docs)
    {
      ret.emplace(key, doc);
    }
    return ret;
  }

  inline bencode::value describe_op(op_doc const &doc)
  {
    bencode::value::dict ret;
    ret.emplace("doc", doc.doc);
    ret.emplace("requires", doc_strings(doc.required));
    ret.emplace("optional", doc_strings(doc.optional));
    ret.emplace("returns", doc_strings(doc.returns));
    return ret;
  }

  inline bencode::value version_info()
  {
    bencode::value::dict braid;
    braid.emplace("major", std::int64_t{ BRAID_VERSION_MAJOR });
    braid.emplace("minor", std::int64_t{ BRAID_VERSION_MINOR });
    braid.emplace("incremental", std::int64_t{ BRAID_VERSION_INCREMENTAL });
    braid.emplace("version-string", BRAID_VERSION_STRING);

    bencode::value::dict versions;
    versions.emplace("braid", std::move(braid));
    return versions;
  }

  inline void handle_describe(handler_context const &ctx, message const &msg)
  {
    bencode::value::dict ops;
    if(auto const active = ctx.pipeline.load(); active)
    {
      for(auto const &[op, doc] : active->ops())
      {
        ops.emplace(op, describe_op(doc));
      }
    }

    auto payload(status_response(msg, { "done" }));
    payload.emplace("ops", std::move(ops));
    payload.emplace("versions", version_info());
    reply(msg, std::move(payload));
  }

  inline descriptor_ref make_describe_middleware(handler_context &ctx)
  {
    auto d(std::make_shared<descriptor>());
    d->name = middleware_names::describe;
    d->handles.emplace("describe",
                       op_doc{ "Produce a machine- and human-readable directory and documentation "
                               "for the operations supported by an nREPL endpoint.",
                               {},
                               {},
                               { { "ops", "Map of operations supported by this nREPL server" },
                                 { "versions",
                                   "Map containing version maps, e.g. {\"braid\" {\"major\" 0 ...}}" } } });

    d->wrap = [&ctx](handler next) -> handler {
      return [&ctx, next = std::move(next)](message const &msg) {
        if(msg.op() != "describe")
        {
          next(msg);
          return;
        }
        handle_describe(ctx, msg);
      };
    };
    return d;
  }
}
