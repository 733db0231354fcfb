#include <fmt/format.h>

#include <braid/runtime/ns.hpp>
#include <braid/runtime/error.hpp>

namespace braid::runtime
{
  var::var(std::string ns_name, std::string name)
    : ns_name{ std::move(ns_name) }
    , name{ std::move(name) }
  {
  }

  object var::deref() const
  {
    auto const locked_root(root.rlock());
    if(!locked_root->has_value())
    {
      throw_error(error_type::illegal_state,
                  fmt::format("Attempting to deref unbound var #'{}/{}", ns_name, name));
    }
    return locked_root->value();
  }

  void var::bind_root(object value)
  {
    *root.wlock() = std::move(value);
  }

  bool var::is_bound() const
  {
    return root.rlock()->has_value();
  }

  ns::ns(std::string name)
    : name{ std::move(name) }
  {
  }

  var_ref ns::intern_var(std::string const &var_name)
  {
    auto locked_vars(vars.wlock());
    if(auto const * const found = locked_vars->find(var_name))
    {
      return *found;
    }

    auto const new_var(std::make_shared<var>(name, var_name));
    *locked_vars = locked_vars->set(var_name, new_var);
    return new_var;
  }

  var_ref ns::find_var(std::string const &var_name) const
  {
    auto const locked_vars(vars.rlock());
    if(auto const * const found = locked_vars->find(var_name))
    {
      return *found;
    }
    return nullptr;
  }

  immer::map<std::string, var_ref> ns::mappings() const
  {
    return *vars.rlock();
  }
}
