#include <algorithm>
#include <cstdint>
#include <optional>
#include <typeinfo>

#include <fmt/format.h>

#include <braid/nrepl_server/evaluate.hpp>
#include <braid/nrepl_server/io.hpp>
#include <braid/runtime/error.hpp>
#include <braid/runtime/ns.hpp>
#include <braid/runtime/read/reader.hpp>
#include <braid/util/scope_exit.hpp>

namespace braid::nrepl_server
{
  namespace
  {
    std::string simple_type_name(std::string const &type)
    {
      auto const dot(type.rfind('.'));
      if(dot == std::string::npos)
      {
        return type;
      }
      return type.substr(dot + 1);
    }

    std::string format_location(std::string const &file,
                                std::size_t const line,
                                std::size_t const column)
    {
      return fmt::format("{}:{}:{}", file.empty() ? "REPL" : file, line, column);
    }

    runtime::object call_evaluator(runtime::var_ref const &evaluator,
                                   runtime::object const &form,
                                   runtime::eval_frame &frame)
    {
      auto const fn(evaluator->deref());
      if(!fn.is<runtime::obj::native_function_ref>())
      {
        runtime::throw_error(runtime::error_type::class_cast,
                             fmt::format("{} cannot be cast to braid.lang.IFn",
                                         runtime::type_name(fn)));
      }
      return fn.as<runtime::obj::native_function_ref>()->fn(frame, { form });
    }

    /* A request rejected before any form runs. The response carries `done` itself,
     * so the task's own completion is claimed here. */
    void reject(message const &msg,
                runtime::cancellation &cancel,
                std::string const &reason,
                response fields = {})
    {
      if(!cancel.try_finish())
      {
        return;
      }
      fields.insert_or_assign("status", bencode::list_of_strings({ "error", reason, "done" }));
      reply(msg, response_for(msg, std::move(fields)));
    }

    /* `code` is either one string or a list of strings. Nothing for anything else. */
    std::optional<std::vector<std::string>> code_sources(message const &msg)
    {
      auto const * const code(msg.find_value("code"));
      if(!code)
      {
        return std::vector<std::string>{ std::string{} };
      }
      if(code->is_string())
      {
        return std::vector<std::string>{ code->as_string() };
      }
      if(code->is_list())
      {
        return msg.get_string_list("code");
      }
      return std::nullopt;
    }

    /* Lines and columns are 1-based; anything smaller starts at 1. */
    std::size_t source_offset(message const &msg, std::string const &key)
    {
      return static_cast<std::size_t>(std::max<std::int64_t>(msg.get_integer(key).value_or(1), 1));
    }
  }

  bool is_interruption(std::exception const &e)
  {
    return dynamic_cast<runtime::interrupted const *>(&e) != nullptr;
  }

  std::string format_error_report(runtime::exception_info const &ex,
                                  std::string const &ns_name,
                                  std::string const &location)
  {
    if(ex.type == runtime::error_type::reader)
    {
      return fmt::format("Syntax error reading source at ({}).\n{}\n", location, ex.message);
    }
    if(ex.type == runtime::error_type::compiler)
    {
      return fmt::format("Syntax error compiling at ({}).\n{}\n", location, ex.message);
    }
    return fmt::format("Execution error ({}) at {}/eval ({}).\n{}\n",
                       simple_type_name(ex.type),
                       ns_name,
                       location,
                       ex.message);
  }

  evaluation_engine::evaluation_engine(runtime::context &rt, evaluation_options opts)
    : rt{ rt }
    , opts_{ std::move(opts) }
  {
  }

  runtime::bindings evaluation_engine::evaluate(runtime::bindings const &snapshot,
                                                message const &msg,
                                                runtime::cancellation &cancel)
  {
    auto current(snapshot);

    auto const sources(code_sources(msg));
    if(!sources.has_value())
    {
      reject(msg, cancel, "malformed-code");
      return snapshot;
    }
    auto const * const code(msg.find_value("code"));
    auto const code_is_list(code && code->is_list());

    auto const requested_ns(msg.get("ns"));
    if(!requested_ns.empty())
    {
      auto const target(rt.find_ns(requested_ns));
      if(!target)
      {
        reject(msg, cancel, "namespace-not-found", { { "ns", requested_ns } });
        return snapshot;
      }
      current = current.with_ns(target);
    }

    runtime::var_ref evaluator;
    if(auto const eval_name = msg.get("eval"); !eval_name.empty())
    {
      evaluator = rt.find_var(eval_name);
      if(!evaluator || !evaluator->is_bound())
      {
        reject(msg, cancel, "eval-not-found", { { "eval", eval_name } });
        return snapshot;
      }
    }

    auto const file(msg.get("file"));
    if(!file.empty())
    {
      current = current.assoc(runtime::var_names::current_file, file);
    }

    auto const out(std::make_shared<response_stream>(msg, "out"));
    auto const err(std::make_shared<response_stream>(msg, "err"));
    current = current.with_streams(out, err, std::make_shared<session_input>(msg));

    auto const flush_streams([&out, &err] {
      err->flush();
      out->flush();
    });

    auto const line(source_offset(msg, "line"));
    auto const column(source_offset(msg, "column"));

    runtime::eval_frame frame{ rt, current, cancel };
    runtime::read::source_position form_start;
    {
      util::scope_exit const flush_on_exit{ flush_streams };
      try
      {
        for(auto const &source : *sources)
        {
          runtime::read::reader reader(source,
                                       file,
                                       code_is_list ? 1 : line,
                                       code_is_list ? 1 : column);
          while(true)
          {
            cancel.throw_if_cancelled();
            auto const form(reader.next());
            if(!form.has_value())
            {
              break;
            }
            form_start = reader.form_start();

            auto const value(evaluator ? call_evaluator(evaluator, *form, frame)
                                       : rt.eval(*form, frame));
            flush_streams();
            cancel.throw_if_cancelled();

            current = current.with_result(value);
            reply(msg,
                  response_for(msg,
                               { { "value", runtime::to_code_string(value) },
                                 { "ns", current.current_ns_name() } }));
          }
        }
      }
      catch(std::exception const &e)
      {
        /* An interrupter that already won has reported the task's end. */
        if(!opts_.is_termination(e) && !cancel.cancelled())
        {
          runtime::exception_ref ex;
          std::string root_type;
          if(auto const * const braid_error = dynamic_cast<runtime::error const *>(&e))
          {
            ex = braid_error->info;
            root_type = runtime::root_cause(ex)->type;
          }
          else
          {
            ex = runtime::make_exception(typeid(e).name(), e.what());
            root_type = ex->type;
          }

          current = current.with_exception(ex);
          flush_streams();
          reply(msg,
                response_for(msg,
                             { { "status", bencode::list_of_strings({ "eval-error" }) },
                               { "ex", ex->type },
                               { "root-ex", root_type } }));

          auto const location(ex->line != 0
                                ? format_location(ex->file, ex->line, ex->column)
                                : format_location(file, form_start.line, form_start.column));
          err->write(format_error_report(*ex, current.current_ns_name(), location));
        }
      }
    }

    auto ret(current.with_streams(snapshot.out, snapshot.err, snapshot.in));
    if(!requested_ns.empty())
    {
      ret = ret.with_ns(snapshot.current_ns());
    }
    return ret;
  }
}
