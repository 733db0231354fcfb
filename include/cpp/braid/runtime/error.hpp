#pragma once

#include <cstddef>
#include <exception>
#include <string>

#include <braid/runtime/object.hpp>

namespace braid::runtime
{
  namespace error_type
  {
    constexpr char const *arithmetic{ "braid.lang.ArithmeticException" };
    constexpr char const *arity{ "braid.lang.ArityException" };
    constexpr char const *class_cast{ "braid.lang.ClassCastException" };
    constexpr char const *compiler{ "braid.lang.CompilerException" };
    constexpr char const *ex_info{ "braid.lang.ExceptionInfo" };
    constexpr char const *illegal_argument{ "braid.lang.IllegalArgumentException" };
    constexpr char const *illegal_state{ "braid.lang.IllegalStateException" };
    constexpr char const *reader{ "braid.lang.ReaderException" };
    constexpr char const *runtime{ "braid.lang.RuntimeException" };
  }

  struct exception_info
  {
    std::string type;
    std::string message;
    object data;
    exception_ref cause;
    /* Provenance of the form being evaluated, when known. Line 0 means unknown. */
    std::string file;
    std::size_t line{};
    std::size_t column{};
  };

  exception_ref make_exception(std::string type,
                               std::string message,
                               exception_ref cause = nullptr,
                               object data = {});

  /* Follows the cause chain to its deepest entry. */
  exception_ref root_cause(exception_ref const &ex);

  /* The C++ carrier for a braid exception value. Everything thrown by user code or
   * by the runtime on behalf of user code is one of these. */
  class error : public std::exception
  {
  public:
    explicit error(exception_ref info);

    char const *what() const noexcept override;

    exception_ref info;
  };

  [[noreturn]] void throw_error(std::string type, std::string message, exception_ref cause = nullptr);

  /* Raised at a safe point once an evaluation has been cancelled. Not an error:
   * the evaluation engine absorbs it without reporting anything. */
  class interrupted : public std::exception
  {
  public:
    char const *what() const noexcept override;
  };
}
