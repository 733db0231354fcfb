#pragma once

#include <string>
#include <vector>

#include <folly/Synchronized.h>
#include <immer/map.hpp>

#include <braid/runtime/object.hpp>
#include <braid/runtime/bindings.hpp>
#include <braid/runtime/cancellation.hpp>

namespace braid::runtime
{
  struct context;

  /* Everything a single evaluation can touch besides the namespaces: the dynamic
   * bindings it may rebind (`ns`, `in-ns`) and the signal it must honour. */
  struct eval_frame
  {
    context &rt;
    bindings &current;
    cancellation const &cancel;
  };

  struct context
  {
    static constexpr char const *core_ns_name{ "braid.core" };
    static constexpr char const *user_ns_name{ "user" };

    /* Creates `braid.core` with its native functions and an empty `user`. */
    context();
    context(context const &) = delete;
    context(context &&) = delete;

    ns_ref intern_ns(std::string const &name);
    ns_ref find_ns(std::string const &name) const;
    /* Resolves `ns/name`. Null when either part is missing. */
    var_ref find_var(std::string const &qualified_name) const;

    var_ref intern_native(std::string const &ns_name,
                          std::string const &name,
                          obj::native_function::function_type fn);

    object eval(object const &form, eval_frame &frame);

    /* A snapshot positioned in `user`. */
    bindings initial_bindings() const;

    folly::Synchronized<immer::map<std::string, ns_ref>> namespaces;
    ns_ref core_ns;
  };

  /* Installs the `braid.core` native functions. */
  void load_core(context &rt);
}
