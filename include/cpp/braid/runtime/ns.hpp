#pragma once

#include <optional>
#include <string>

#include <folly/Synchronized.h>
#include <immer/map.hpp>

#include <braid/runtime/object.hpp>

namespace braid::runtime
{
  struct var
  {
    var(std::string ns_name, std::string name);

    /* Throws an IllegalStateException for an unbound var. */
    object deref() const;
    void bind_root(object value);
    bool is_bound() const;

    std::string const ns_name;
    std::string const name;
    folly::Synchronized<std::optional<object>> root;
  };

  struct ns
  {
    ns() = delete;
    explicit ns(std::string name);

    /* Returns the existing var for `name`, or creates an unbound one. */
    var_ref intern_var(std::string const &name);
    var_ref find_var(std::string const &name) const;
    immer::map<std::string, var_ref> mappings() const;

    std::string const name;
    folly::Synchronized<immer::map<std::string, var_ref>> vars;
  };
}
