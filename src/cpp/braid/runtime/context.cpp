#include <fmt/format.h>

#include <braid/runtime/context.hpp>
#include <braid/runtime/error.hpp>
#include <braid/runtime/ns.hpp>

namespace braid::runtime
{
  namespace
  {
    using local_map = immer::map<std::string, object>;

    object eval_form(object const &form, eval_frame &frame, local_map const &locals);

    [[noreturn]] void unresolved(obj::symbol const &sym)
    {
      auto const message(
        fmt::format("Unable to resolve symbol: {} in this context", sym.to_string()));
      throw_error(error_type::compiler, message, make_exception(error_type::runtime, message));
    }

    void check_arity(std::string const &form_name,
                     std::vector<object> const &items,
                     std::size_t const min,
                     std::size_t const max)
    {
      /* items includes the head. */
      auto const count(items.size() - 1);
      if(count < min || count > max)
      {
        throw_error(error_type::compiler,
                    fmt::format("Wrong number of args ({}) passed to {}", count, form_name));
      }
    }

    obj::symbol const &expect_symbol(object const &o, std::string const &form_name)
    {
      if(!o.is<obj::symbol>())
      {
        throw_error(error_type::compiler,
                    fmt::format("{} expects a symbol, got {}", form_name, type_name(o)));
      }
      return o.as<obj::symbol>();
    }

    object resolve(obj::symbol const &sym, eval_frame &frame, local_map const &locals)
    {
      if(sym.ns.empty())
      {
        if(auto const * const local = locals.find(sym.name))
        {
          return *local;
        }
        if(frame.current.is_dynamic(sym.name))
        {
          return frame.current.get(sym.name);
        }
      }

      var_ref found;
      if(!sym.ns.empty())
      {
        found = frame.rt.find_var(sym.to_string());
      }
      else
      {
        auto const current_ns(frame.current.current_ns());
        if(current_ns)
        {
          found = current_ns->find_var(sym.name);
        }
        if(!found)
        {
          found = frame.rt.core_ns->find_var(sym.name);
        }
      }

      if(!found)
      {
        unresolved(sym);
      }
      return found->deref();
    }

    object eval_do(std::vector<object> const &items,
                   std::size_t const first,
                   eval_frame &frame,
                   local_map const &locals)
    {
      object ret;
      for(auto i(first); i < items.size(); ++i)
      {
        ret = eval_form(items[i], frame, locals);
      }
      return ret;
    }

    object eval_let(std::vector<object> const &items, eval_frame &frame, local_map locals)
    {
      if(items.size() < 2 || !items[1].is<obj::vector>())
      {
        throw_error(error_type::compiler, "let requires a vector for its binding");
      }
      auto const &binding_forms(*items[1].as<obj::vector>().items);
      if(binding_forms.size() % 2 != 0)
      {
        throw_error(error_type::compiler, "let requires an even number of forms in binding vector");
      }

      for(std::size_t i{}; i < binding_forms.size(); i += 2)
      {
        auto const &name(expect_symbol(binding_forms[i], "let"));
        auto value(eval_form(binding_forms[i + 1], frame, locals));
        locals = locals.set(name.name, std::move(value));
      }
      return eval_do(items, 2, frame, locals);
    }

    object eval_def(std::vector<object> const &items, eval_frame &frame, local_map const &locals)
    {
      check_arity("def", items, 1, 2);
      auto const &name(expect_symbol(items[1], "def"));
      auto const current_ns(frame.current.current_ns());
      if(!current_ns)
      {
        throw_error(error_type::illegal_state, "No current namespace to def into");
      }

      auto const v(current_ns->intern_var(name.name));
      if(items.size() == 3)
      {
        v->bind_root(eval_form(items[2], frame, locals));
      }
      return v;
    }

    object eval_ns(std::vector<object> const &items, eval_frame &frame)
    {
      check_arity("ns", items, 1, 1);
      auto const &name(expect_symbol(items[1], "ns"));
      frame.current = frame.current.with_ns(frame.rt.intern_ns(name.to_string()));
      return {};
    }

    object eval_throw(std::vector<object> const &items, eval_frame &frame, local_map const &locals)
    {
      check_arity("throw", items, 1, 1);
      auto const thrown(eval_form(items[1], frame, locals));
      if(!thrown.is<exception_ref>())
      {
        throw_error(error_type::class_cast,
                    fmt::format("{} cannot be cast to braid.lang.Throwable", type_name(thrown)));
      }
      throw error{ thrown.as<exception_ref>() };
    }

    object eval_list(obj::list const &list, eval_frame &frame, local_map const &locals)
    {
      auto const &items(*list.items);
      if(items.empty())
      {
        return list;
      }

      if(items[0].is<obj::symbol>() && items[0].as<obj::symbol>().ns.empty())
      {
        auto const &head(items[0].as<obj::symbol>().name);
        if(head == "quote")
        {
          check_arity("quote", items, 1, 1);
          return items[1];
        }
        if(head == "do")
        {
          return eval_do(items, 1, frame, locals);
        }
        if(head == "if")
        {
          check_arity("if", items, 2, 3);
          if(truthy(eval_form(items[1], frame, locals)))
          {
            return eval_form(items[2], frame, locals);
          }
          return items.size() == 4 ? eval_form(items[3], frame, locals) : object{};
        }
        if(head == "let")
        {
          return eval_let(items, frame, locals);
        }
        if(head == "def")
        {
          return eval_def(items, frame, locals);
        }
        if(head == "ns")
        {
          return eval_ns(items, frame);
        }
        if(head == "throw")
        {
          return eval_throw(items, frame, locals);
        }
      }

      auto const fn(eval_form(items[0], frame, locals));
      if(!fn.is<obj::native_function_ref>())
      {
        throw_error(error_type::class_cast,
                    fmt::format("{} cannot be cast to braid.lang.IFn", type_name(fn)));
      }

      std::vector<object> args;
      args.reserve(items.size() - 1);
      for(std::size_t i{ 1 }; i < items.size(); ++i)
      {
        args.emplace_back(eval_form(items[i], frame, locals));
      }

      frame.cancel.throw_if_cancelled();
      return fn.as<obj::native_function_ref>()->fn(frame, args);
    }

    object eval_form(object const &form, eval_frame &frame, local_map const &locals)
    {
      if(form.is<obj::symbol>())
      {
        return resolve(form.as<obj::symbol>(), frame, locals);
      }
      if(form.is<obj::list>())
      {
        return eval_list(form.as<obj::list>(), frame, locals);
      }
      if(form.is<obj::vector>())
      {
        std::vector<object> evaluated;
        for(auto const &item : *form.as<obj::vector>().items)
        {
          evaluated.emplace_back(eval_form(item, frame, locals));
        }
        return make_vector(std::move(evaluated));
      }
      if(form.is<obj::map>())
      {
        std::vector<std::pair<object, object>> evaluated;
        for(auto const &[k, v] : *form.as<obj::map>().entries)
        {
          evaluated.emplace_back(eval_form(k, frame, locals), eval_form(v, frame, locals));
        }
        return make_map(std::move(evaluated));
      }
      return form;
    }
  }

  context::context()
  {
    core_ns = intern_ns(core_ns_name);
    intern_ns(user_ns_name);
    load_core(*this);
  }

  ns_ref context::intern_ns(std::string const &name)
  {
    auto locked_namespaces(namespaces.wlock());
    if(auto const * const found = locked_namespaces->find(name))
    {
      return *found;
    }

    auto const created(std::make_shared<ns>(name));
    *locked_namespaces = locked_namespaces->set(name, created);
    return created;
  }

  ns_ref context::find_ns(std::string const &name) const
  {
    auto const locked_namespaces(namespaces.rlock());
    if(auto const * const found = locked_namespaces->find(name))
    {
      return *found;
    }
    return nullptr;
  }

  var_ref context::find_var(std::string const &qualified_name) const
  {
    auto const sym(obj::symbol::parse(qualified_name));
    if(sym.ns.empty())
    {
      return nullptr;
    }
    auto const target(find_ns(sym.ns));
    if(!target)
    {
      return nullptr;
    }
    return target->find_var(sym.name);
  }

  var_ref context::intern_native(std::string const &ns_name,
                                 std::string const &name,
                                 obj::native_function::function_type fn)
  {
    auto const v(intern_ns(ns_name)->intern_var(name));
    v->bind_root(std::make_shared<obj::native_function const>(
      obj::native_function{ fmt::format("{}/{}", ns_name, name), std::move(fn) }));
    return v;
  }

  object context::eval(object const &form, eval_frame &frame)
  {
    frame.cancel.throw_if_cancelled();
    return eval_form(form, frame, {});
  }

  bindings context::initial_bindings() const
  {
    return bindings::fresh(find_ns(user_ns_name));
  }
}
