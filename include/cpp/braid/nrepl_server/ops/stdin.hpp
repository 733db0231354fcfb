#pragma once

#include <braid/nrepl_server/handler.hpp>

namespace braid::nrepl_server::ops
{
  inline descriptor_ref make_stdin_middleware()
  {
    auto d(std::make_shared<descriptor>());
    d->name = middleware_names::add_stdin;
    d->required = { "clone" };
    d->handles.emplace("stdin",
                       op_doc{ "Add content from the value of \"stdin\" to *in* in the current "
                               "session.",
                               { { "stdin", "Content to add to *in*." } },
                               {},
                               { { "status", "A status of \"need-input\" will be sent if a session's "
                                             "*in* requires content in order to satisfy an attempted "
                                             "read operation." } } });

    d->wrap = [](handler next) -> handler {
      return [next = std::move(next)](message const &msg) {
        if(msg.op() != "stdin")
        {
          next(msg);
          return;
        }

        msg.attached_session->input().append(msg.get("stdin"));
        reply_status(msg, { "done" });
      };
    };
    return d;
  }
}
