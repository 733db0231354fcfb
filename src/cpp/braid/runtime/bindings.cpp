#include <braid/runtime/bindings.hpp>
#include <braid/runtime/ns.hpp>

namespace braid::runtime
{
  bindings bindings::fresh(ns_ref initial_ns)
  {
    bindings ret;
    ret.vars = ret.vars.set(var_names::current_ns, object{ std::move(initial_ns) })
                 .set(var_names::result_1, object{})
                 .set(var_names::result_2, object{})
                 .set(var_names::result_3, object{})
                 .set(var_names::last_exception, object{})
                 .set(var_names::current_file, object{});
    return ret;
  }

  bool bindings::is_dynamic(std::string const &name) const
  {
    return vars.find(name) != nullptr;
  }

  object bindings::get(std::string const &name) const
  {
    if(auto const * const found = vars.find(name))
    {
      return *found;
    }
    return {};
  }

  bindings bindings::assoc(std::string const &name, object value) const
  {
    auto ret(*this);
    ret.vars = vars.set(name, std::move(value));
    return ret;
  }

  ns_ref bindings::current_ns() const
  {
    auto const found(get(var_names::current_ns));
    if(!found.is<ns_ref>())
    {
      return nullptr;
    }
    return found.as<ns_ref>();
  }

  std::string bindings::current_ns_name() const
  {
    auto const current(current_ns());
    return current ? current->name : "user";
  }

  bindings bindings::with_ns(ns_ref target) const
  {
    return assoc(var_names::current_ns, object{ std::move(target) });
  }

  bindings bindings::with_result(object value) const
  {
    auto ret(*this);
    ret.vars = vars.set(var_names::result_3, get(var_names::result_2))
                 .set(var_names::result_2, get(var_names::result_1))
                 .set(var_names::result_1, std::move(value));
    return ret;
  }

  bindings bindings::with_exception(exception_ref ex) const
  {
    return assoc(var_names::last_exception, object{ std::move(ex) });
  }

  bindings bindings::with_streams(std::shared_ptr<output_stream> out,
                                  std::shared_ptr<output_stream> err,
                                  std::shared_ptr<input_stream> in) const
  {
    auto ret(*this);
    ret.out = std::move(out);
    ret.err = std::move(err);
    ret.in = std::move(in);
    return ret;
  }
}
