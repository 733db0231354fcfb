#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <immer/map.hpp>

#include <braid/runtime/object.hpp>

namespace braid::runtime
{
  class cancellation;

  struct output_stream
  {
    virtual ~output_stream() = default;

    virtual void write(std::string_view chunk) = 0;
    virtual void flush() = 0;
  };

  struct input_stream
  {
    virtual ~input_stream() = default;

    /* Blocks until a full line is available. Throws `runtime::interrupted` when the
     * evaluation is cancelled while waiting. */
    virtual std::string read_line(cancellation const &cancel) = 0;
  };

  namespace var_names
  {
    constexpr char const *current_ns{ "*ns*" };
    constexpr char const *result_1{ "*1" };
    constexpr char const *result_2{ "*2" };
    constexpr char const *result_3{ "*3" };
    constexpr char const *last_exception{ "*e" };
    constexpr char const *current_file{ "*file*" };
  }

  /* An immutable snapshot of the dynamic context an evaluation runs in. Every
   * update returns a new snapshot; sessions hand these from one task to the next. */
  struct bindings
  {
    static bindings fresh(ns_ref initial_ns);

    bool is_dynamic(std::string const &name) const;
    /* Nil when unbound. */
    object get(std::string const &name) const;
    bindings assoc(std::string const &name, object value) const;

    ns_ref current_ns() const;
    std::string current_ns_name() const;
    bindings with_ns(ns_ref target) const;
    /* Pushes `value` into the `*1`, `*2`, `*3` history. */
    bindings with_result(object value) const;
    bindings with_exception(exception_ref ex) const;
    bindings with_streams(std::shared_ptr<output_stream> out,
                          std::shared_ptr<output_stream> err,
                          std::shared_ptr<input_stream> in) const;

    immer::map<std::string, object> vars;
    std::shared_ptr<output_stream> out;
    std::shared_ptr<output_stream> err;
    std::shared_ptr<input_stream> in;
  };
}
