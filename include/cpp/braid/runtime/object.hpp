#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace braid::runtime
{
  struct object;
  struct eval_frame;
  struct ns;
  struct var;
  struct exception_info;

  using ns_ref = std::shared_ptr<ns>;
  using var_ref = std::shared_ptr<var>;
  using exception_ref = std::shared_ptr<exception_info const>;

  namespace obj
  {
    struct nil
    {
      bool operator==(nil const &) const = default;
    };

    struct keyword
    {
      std::string name;

      bool operator==(keyword const &) const = default;
    };

    struct symbol
    {
      symbol() = default;

      explicit symbol(std::string name)
        : name{ std::move(name) }
      {
      }

      symbol(std::string ns, std::string name)
        : ns{ std::move(ns) }
        , name{ std::move(name) }
      {
      }

      /* Splits `ns/name`. A lone `/` is the division symbol, not a qualifier. */
      static symbol parse(std::string const &raw);

      std::string to_string() const;
      bool operator==(symbol const &) const = default;

      std::string ns;
      std::string name;
    };

    struct list
    {
      std::shared_ptr<std::vector<object> const> items;
    };

    struct vector
    {
      std::shared_ptr<std::vector<object> const> items;
    };

    struct map
    {
      std::shared_ptr<std::vector<std::pair<object, object>> const> entries;
    };

    struct native_function
    {
      using function_type = std::function<object(eval_frame &, std::vector<object> const &)>;

      std::string name;
      function_type fn;
    };

    using native_function_ref = std::shared_ptr<native_function const>;
  }

  struct object
  {
    using variant_type = std::variant<obj::nil,
                                      bool,
                                      std::int64_t,
                                      double,
                                      std::string,
                                      obj::keyword,
                                      obj::symbol,
                                      obj::list,
                                      obj::vector,
                                      obj::map,
                                      obj::native_function_ref,
                                      ns_ref,
                                      var_ref,
                                      exception_ref>;

    object() = default;

    template <typename T>
    requires std::is_constructible_v<variant_type, T &&>
    object(T &&value)
      : data{ std::forward<T>(value) }
    {
    }

    object(char const * const value)
      : data{ std::string{ value } }
    {
    }

    template <typename T>
    bool is() const
    {
      return std::holds_alternative<T>(data);
    }

    template <typename T>
    T const &as() const
    {
      return std::get<T>(data);
    }

    bool is_nil() const
    {
      return is<obj::nil>();
    }

    variant_type data;
  };

  object make_list(std::vector<object> items);
  object make_vector(std::vector<object> items);
  object make_map(std::vector<std::pair<object, object>> entries);
  object make_keyword(std::string name);
  object make_symbol(std::string const &raw);

  /* Everything except nil and false is truthy. */
  bool truthy(object const &o);
  bool equal(object const &lhs, object const &rhs);

  /* The class-like identity reported for values and errors, e.g. `braid.lang.Long`. */
  std::string type_name(object const &o);

  /* Readable representation, as `pr` prints it. */
  std::string to_code_string(object const &o);
  /* Human representation, as `str` and `print` produce it. */
  std::string to_string(object const &o);

  /* Items of a list or vector. Throws a ClassCastException otherwise. */
  std::vector<object> const &sequence_items(object const &o);
}
