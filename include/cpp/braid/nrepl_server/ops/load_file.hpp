#pragma once

#include <braid/nrepl_server/handler.hpp>

namespace braid::nrepl_server::ops
{
  /* `load-file` is `eval` of the file's contents with the file's name as
   * provenance. */
  inline message load_file_as_eval(message const &msg)
  {
    auto eval_msg(msg);
    auto const contents(msg.get("file"));
    auto const path(msg.get("file-path", msg.get("file-name")));

    eval_msg.data.erase("file");
    eval_msg.data.erase("column");
    eval_msg.data.insert_or_assign("op", "eval");
    eval_msg.data.insert_or_assign("code", contents);
    eval_msg.data.insert_or_assign("line", std::int64_t{ 1 });
    if(!path.empty())
    {
      eval_msg.data.insert_or_assign("file", path);
    }
    return eval_msg;
  }

  inline descriptor_ref make_load_file_middleware()
  {
    auto d(std::make_shared<descriptor>());
    d->name = middleware_names::load_file;
    d->expected = { "eval" };
    d->handles.emplace(
      "load-file",
      op_doc{ "Loads a body of code, using supplied path and filename info to set source file and "
              "line number metadata. Delegates to underlying \"eval\" middleware/handler.",
              { { "file", "Full contents of a file of code." } },
              { { "file-path", "Source-path-relative path of the source file, e.g. braid/io.braid" },
                { "file-name", "Name of source file, e.g. io.braid" } },
              { { "ns", "*ns*, after successful evaluation of `code`." },
                { "value", "The result of evaluating `code`." },
                { "ex", "The type of exception thrown, if any." },
                { "root-ex", "The type of the root exception thrown, if any." } } });

    d->wrap = [](handler next) -> handler {
      return [next = std::move(next)](message const &msg) {
        if(msg.op() != "load-file")
        {
          next(msg);
          return;
        }

        auto const * const file(msg.find_value("file"));
        if(!file || !file->is_string())
        {
          reply_status(msg, { "error", "no-file", "done" });
          return;
        }
        next(load_file_as_eval(msg));
      };
    };
    return d;
  }
}
