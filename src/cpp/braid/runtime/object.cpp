#include <cmath>
#include <string_view>

#include <fmt/format.h>

#include <braid/runtime/object.hpp>
#include <braid/runtime/error.hpp>
#include <braid/runtime/ns.hpp>

namespace braid::runtime
{
  obj::symbol obj::symbol::parse(std::string const &raw)
  {
    auto const slash(raw.find('/'));
    if(slash == std::string::npos || slash == 0 || slash == raw.size() - 1)
    {
      return symbol{ raw };
    }
    return { raw.substr(0, slash), raw.substr(slash + 1) };
  }

  std::string obj::symbol::to_string() const
  {
    if(ns.empty())
    {
      return name;
    }
    return ns + "/" + name;
  }

  object make_list(std::vector<object> items)
  {
    return obj::list{ std::make_shared<std::vector<object> const>(std::move(items)) };
  }

  object make_vector(std::vector<object> items)
  {
    return obj::vector{ std::make_shared<std::vector<object> const>(std::move(items)) };
  }

  object make_map(std::vector<std::pair<object, object>> entries)
  {
    return obj::map{ std::make_shared<std::vector<std::pair<object, object>> const>(
      std::move(entries)) };
  }

  object make_keyword(std::string name)
  {
    return obj::keyword{ std::move(name) };
  }

  object make_symbol(std::string const &raw)
  {
    return obj::symbol::parse(raw);
  }

  bool truthy(object const &o)
  {
    if(o.is_nil())
    {
      return false;
    }
    if(o.is<bool>())
    {
      return o.as<bool>();
    }
    return true;
  }

  namespace
  {
    bool equal_items(std::vector<object> const &lhs, std::vector<object> const &rhs)
    {
      if(lhs.size() != rhs.size())
      {
        return false;
      }
      for(std::size_t i{}; i < lhs.size(); ++i)
      {
        if(!equal(lhs[i], rhs[i]))
        {
          return false;
        }
      }
      return true;
    }

    bool is_sequential(object const &o)
    {
      return o.is<obj::list>() || o.is<obj::vector>();
    }

    std::string escape_string(std::string const &value)
    {
      std::string escaped{ "\"" };
      escaped.reserve(value.size() + 2);
      for(char const ch : value)
      {
        switch(ch)
        {
          case '\\':
          case '"':
            escaped.push_back('\\');
            escaped.push_back(ch);
            break;
          case '\n':
            escaped.append("\\n");
            break;
          case '\r':
            escaped.append("\\r");
            break;
          case '\t':
            escaped.append("\\t");
            break;
          default:
            escaped.push_back(ch);
            break;
        }
      }
      escaped.push_back('"');
      return escaped;
    }

    std::string format_double(double const value)
    {
      if(std::isnan(value))
      {
        return "##NaN";
      }
      if(std::isinf(value))
      {
        return value > 0 ? "##Inf" : "##-Inf";
      }

      auto formatted(fmt::format("{}", value));
      if(formatted.find_first_of(".eE") == std::string::npos)
      {
        formatted += ".0";
      }
      return formatted;
    }

    template <typename F>
    std::string join_items(std::vector<object> const &items, F const &printer)
    {
      std::string out;
      for(auto const &item : items)
      {
        if(!out.empty())
        {
          out.push_back(' ');
        }
        out += printer(item);
      }
      return out;
    }

    std::string print(object const &o, bool const readably)
    {
      /* Nested values always print readably, even under `str`. */
      auto const recurse([](object const &item) { return print(item, true); });

      return std::visit(
        [&](auto const &value) -> std::string {
          using T = std::decay_t<decltype(value)>;
          if constexpr(std::is_same_v<T, obj::nil>)
          {
            return readably ? "nil" : "";
          }
          else if constexpr(std::is_same_v<T, bool>)
          {
            return value ? "true" : "false";
          }
          else if constexpr(std::is_same_v<T, std::int64_t>)
          {
            return std::to_string(value);
          }
          else if constexpr(std::is_same_v<T, double>)
          {
            return format_double(value);
          }
          else if constexpr(std::is_same_v<T, std::string>)
          {
            return readably ? escape_string(value) : value;
          }
          else if constexpr(std::is_same_v<T, obj::keyword>)
          {
            return ":" + value.name;
          }
          else if constexpr(std::is_same_v<T, obj::symbol>)
          {
            return value.to_string();
          }
          else if constexpr(std::is_same_v<T, obj::list>)
          {
            return "(" + join_items(*value.items, recurse) + ")";
          }
          else if constexpr(std::is_same_v<T, obj::vector>)
          {
            return "[" + join_items(*value.items, recurse) + "]";
          }
          else if constexpr(std::is_same_v<T, obj::map>)
          {
            std::string out{ "{" };
            bool first{ true };
            for(auto const &[k, v] : *value.entries)
            {
              if(!first)
              {
                out += ", ";
              }
              first = false;
              out += recurse(k);
              out.push_back(' ');
              out += recurse(v);
            }
            out.push_back('}');
            return out;
          }
          else if constexpr(std::is_same_v<T, obj::native_function_ref>)
          {
            return fmt::format("#function[{}]", value->name);
          }
          else if constexpr(std::is_same_v<T, ns_ref>)
          {
            return readably ? fmt::format("#namespace[{}]", value->name) : value->name;
          }
          else if constexpr(std::is_same_v<T, var_ref>)
          {
            return fmt::format("#'{}/{}", value->ns_name, value->name);
          }
          else
          {
            return fmt::format("#error {{:type {}, :message {}}}",
                               escape_string(value->type),
                               escape_string(value->message));
          }
        },
        o.data);
    }
  }

  bool equal(object const &lhs, object const &rhs)
  {
    if(is_sequential(lhs) && is_sequential(rhs))
    {
      return equal_items(sequence_items(lhs), sequence_items(rhs));
    }

    /* Clojure's `=` keeps integers and doubles apart. */
    if(lhs.data.index() != rhs.data.index())
    {
      return false;
    }

    return std::visit(
      [&](auto const &l) -> bool {
        using T = std::decay_t<decltype(l)>;
        auto const &r(std::get<T>(rhs.data));
        if constexpr(std::is_same_v<T, obj::map>)
        {
          if(l.entries->size() != r.entries->size())
          {
            return false;
          }
          for(auto const &[k, v] : *l.entries)
          {
            bool found{};
            for(auto const &[rk, rv] : *r.entries)
            {
              if(equal(k, rk))
              {
                found = equal(v, rv);
                break;
              }
            }
            if(!found)
            {
              return false;
            }
          }
          return true;
        }
        else if constexpr(std::is_same_v<T, obj::list> || std::is_same_v<T, obj::vector>)
        {
          return equal_items(*l.items, *r.items);
        }
        else
        {
          return l == r;
        }
      },
      lhs.data);
  }

  std::string type_name(object const &o)
  {
    return std::visit(
      [](auto const &value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr(std::is_same_v<T, obj::nil>)
        {
          return "nil";
        }
        else if constexpr(std::is_same_v<T, bool>)
        {
          return "braid.lang.Boolean";
        }
        else if constexpr(std::is_same_v<T, std::int64_t>)
        {
          return "braid.lang.Long";
        }
        else if constexpr(std::is_same_v<T, double>)
        {
          return "braid.lang.Double";
        }
        else if constexpr(std::is_same_v<T, std::string>)
        {
          return "braid.lang.String";
        }
        else if constexpr(std::is_same_v<T, obj::keyword>)
        {
          return "braid.lang.Keyword";
        }
        else if constexpr(std::is_same_v<T, obj::symbol>)
        {
          return "braid.lang.Symbol";
        }
        else if constexpr(std::is_same_v<T, obj::list>)
        {
          return "braid.lang.PersistentList";
        }
        else if constexpr(std::is_same_v<T, obj::vector>)
        {
          return "braid.lang.PersistentVector";
        }
        else if constexpr(std::is_same_v<T, obj::map>)
        {
          return "braid.lang.PersistentArrayMap";
        }
        else if constexpr(std::is_same_v<T, obj::native_function_ref>)
        {
          return "braid.lang.NativeFunction";
        }
        else if constexpr(std::is_same_v<T, ns_ref>)
        {
          return "braid.lang.Namespace";
        }
        else if constexpr(std::is_same_v<T, var_ref>)
        {
          return "braid.lang.Var";
        }
        else
        {
          return value->type;
        }
      },
      o.data);
  }

  std::string to_code_string(object const &o)
  {
    return print(o, true);
  }

  std::string to_string(object const &o)
  {
    return print(o, false);
  }

  std::vector<object> const &sequence_items(object const &o)
  {
    if(o.is<obj::list>())
    {
      return *o.as<obj::list>().items;
    }
    if(o.is<obj::vector>())
    {
      return *o.as<obj::vector>().items;
    }
    throw_error(error_type::class_cast,
                fmt::format("{} cannot be cast to braid.lang.ISeq", type_name(o)));
  }
}
