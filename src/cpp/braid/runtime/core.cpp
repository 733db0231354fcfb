#include <chrono>
#include <cstdint>
#include <limits>

#include <fmt/format.h>

#include <braid/runtime/context.hpp>
#include <braid/runtime/error.hpp>
#include <braid/runtime/ns.hpp>

namespace braid::runtime
{
  namespace
  {
    using args_type = std::vector<object>;

    void expect_arity(std::string const &name,
                      args_type const &args,
                      std::size_t const min,
                      std::size_t const max = std::numeric_limits<std::size_t>::max())
    {
      if(args.size() < min || args.size() > max)
      {
        throw_error(error_type::arity,
                    fmt::format("Wrong number of args ({}) passed to: braid.core/{}",
                                args.size(),
                                name));
      }
    }

    bool is_number(object const &o)
    {
      return o.is<std::int64_t>() || o.is<double>();
    }

    double to_double(object const &o)
    {
      return o.is<double>() ? o.as<double>() : static_cast<double>(o.as<std::int64_t>());
    }

    object const &expect_number(object const &o)
    {
      if(!is_number(o))
      {
        throw_error(error_type::class_cast,
                    fmt::format("{} cannot be cast to braid.lang.Number", type_name(o)));
      }
      return o;
    }

    std::string const &expect_string(object const &o, std::string const &fn_name)
    {
      if(!o.is<std::string>())
      {
        throw_error(error_type::class_cast,
                    fmt::format("{} cannot be cast to braid.lang.String in {}",
                                type_name(o),
                                fn_name));
      }
      return o.as<std::string>();
    }

    enum class arith_op : std::uint8_t
    {
      add,
      sub,
      mul,
      div
    };

    object apply_arith(arith_op const op, object const &lhs, object const &rhs)
    {
      expect_number(lhs);
      expect_number(rhs);

      if(lhs.is<std::int64_t>() && rhs.is<std::int64_t>())
      {
        auto const l(lhs.as<std::int64_t>());
        auto const r(rhs.as<std::int64_t>());
        std::int64_t ret{};
        bool overflow{};
        switch(op)
        {
          case arith_op::add:
            overflow = __builtin_add_overflow(l, r, &ret);
            break;
          case arith_op::sub:
            overflow = __builtin_sub_overflow(l, r, &ret);
            break;
          case arith_op::mul:
            overflow = __builtin_mul_overflow(l, r, &ret);
            break;
          case arith_op::div:
            if(r == 0)
            {
              throw_error(error_type::arithmetic, "Divide by zero");
            }
            if(l == std::numeric_limits<std::int64_t>::min() && r == -1)
            {
              overflow = true;
              break;
            }
            /* No ratios; inexact integer division produces a double. */
            if(l % r != 0)
            {
              return static_cast<double>(l) / static_cast<double>(r);
            }
            ret = l / r;
            break;
        }
        if(overflow)
        {
          throw_error(error_type::arithmetic, "integer overflow");
        }
        return ret;
      }

      auto const l(to_double(lhs));
      auto const r(to_double(rhs));
      switch(op)
      {
        case arith_op::add:
          return l + r;
        case arith_op::sub:
          return l - r;
        case arith_op::mul:
          return l * r;
        case arith_op::div:
          if(r == 0.0)
          {
            throw_error(error_type::arithmetic, "Divide by zero");
          }
          return l / r;
      }
      return {};
    }

    object fold_arith(arith_op const op, object init, args_type const &args, std::size_t const first)
    {
      for(auto i(first); i < args.size(); ++i)
      {
        init = apply_arith(op, init, args[i]);
      }
      return init;
    }

    template <typename Compare>
    object compare_chain(std::string const &name, args_type const &args, Compare const &cmp)
    {
      expect_arity(name, args, 1);
      for(std::size_t i{}; i + 1 < args.size(); ++i)
      {
        if(!cmp(to_double(expect_number(args[i])), to_double(expect_number(args[i + 1]))))
        {
          return false;
        }
      }
      expect_number(args.back());
      return true;
    }

    std::string join_printed(args_type const &args, bool const readably)
    {
      std::string out;
      for(std::size_t i{}; i < args.size(); ++i)
      {
        if(i != 0)
        {
          out.push_back(' ');
        }
        out += readably ? to_code_string(args[i]) : to_string(args[i]);
      }
      return out;
    }

    void write_out(eval_frame &frame, std::string_view const text)
    {
      if(frame.current.out)
      {
        frame.current.out->write(text);
      }
    }

    exception_ref expect_exception(object const &o)
    {
      if(o.is<exception_ref>())
      {
        return o.as<exception_ref>();
      }
      return nullptr;
    }
  }

  void load_core(context &rt)
  {
    auto const def([&rt](std::string const &name, obj::native_function::function_type fn) {
      rt.intern_native(context::core_ns_name, name, std::move(fn));
    });

    def("+", [](eval_frame &, args_type const &args) -> object {
      return fold_arith(arith_op::add, std::int64_t{}, args, 0);
    });
    def("*", [](eval_frame &, args_type const &args) -> object {
      return fold_arith(arith_op::mul, std::int64_t{ 1 }, args, 0);
    });
    def("-", [](eval_frame &, args_type const &args) -> object {
      expect_arity("-", args, 1);
      if(args.size() == 1)
      {
        return apply_arith(arith_op::sub, std::int64_t{}, args[0]);
      }
      return fold_arith(arith_op::sub, args[0], args, 1);
    });
    def("/", [](eval_frame &, args_type const &args) -> object {
      expect_arity("/", args, 1);
      if(args.size() == 1)
      {
        return apply_arith(arith_op::div, std::int64_t{ 1 }, args[0]);
      }
      return fold_arith(arith_op::div, args[0], args, 1);
    });
    def("inc", [](eval_frame &, args_type const &args) -> object {
      expect_arity("inc", args, 1, 1);
      return apply_arith(arith_op::add, args[0], std::int64_t{ 1 });
    });
    def("dec", [](eval_frame &, args_type const &args) -> object {
      expect_arity("dec", args, 1, 1);
      return apply_arith(arith_op::sub, args[0], std::int64_t{ 1 });
    });

    def("=", [](eval_frame &, args_type const &args) -> object {
      expect_arity("=", args, 1);
      for(std::size_t i{}; i + 1 < args.size(); ++i)
      {
        if(!equal(args[i], args[i + 1]))
        {
          return false;
        }
      }
      return true;
    });
    def("<", [](eval_frame &, args_type const &args) -> object {
      return compare_chain("<", args, [](double const l, double const r) { return l < r; });
    });
    def(">", [](eval_frame &, args_type const &args) -> object {
      return compare_chain(">", args, [](double const l, double const r) { return l > r; });
    });
    def("<=", [](eval_frame &, args_type const &args) -> object {
      return compare_chain("<=", args, [](double const l, double const r) { return l <= r; });
    });
    def(">=", [](eval_frame &, args_type const &args) -> object {
      return compare_chain(">=", args, [](double const l, double const r) { return l >= r; });
    });
    def("not", [](eval_frame &, args_type const &args) -> object {
      expect_arity("not", args, 1, 1);
      return !truthy(args[0]);
    });

    def("str", [](eval_frame &, args_type const &args) -> object {
      std::string out;
      for(auto const &arg : args)
      {
        out += to_string(arg);
      }
      return out;
    });
    def("pr-str", [](eval_frame &, args_type const &args) -> object {
      return join_printed(args, true);
    });
    def("print", [](eval_frame &frame, args_type const &args) -> object {
      write_out(frame, join_printed(args, false));
      return {};
    });
    def("println", [](eval_frame &frame, args_type const &args) -> object {
      write_out(frame, join_printed(args, false) + "\n");
      return {};
    });
    def("prn", [](eval_frame &frame, args_type const &args) -> object {
      write_out(frame, join_printed(args, true) + "\n");
      return {};
    });
    def("flush", [](eval_frame &frame, args_type const &) -> object {
      if(frame.current.out)
      {
        frame.current.out->flush();
      }
      return {};
    });

    def("list", [](eval_frame &, args_type const &args) -> object { return make_list(args); });
    def("vector", [](eval_frame &, args_type const &args) -> object { return make_vector(args); });
    def("count", [](eval_frame &, args_type const &args) -> object {
      expect_arity("count", args, 1, 1);
      auto const &o(args[0]);
      if(o.is_nil())
      {
        return std::int64_t{};
      }
      if(o.is<std::string>())
      {
        return static_cast<std::int64_t>(o.as<std::string>().size());
      }
      if(o.is<obj::map>())
      {
        return static_cast<std::int64_t>(o.as<obj::map>().entries->size());
      }
      return static_cast<std::int64_t>(sequence_items(o).size());
    });

    def("ex-info", [](eval_frame &, args_type const &args) -> object {
      expect_arity("ex-info", args, 2, 3);
      auto const &message(expect_string(args[0], "ex-info"));
      if(!args[1].is<obj::map>() && !args[1].is_nil())
      {
        throw_error(error_type::illegal_argument, "ex-info data must be a map");
      }
      exception_ref cause;
      if(args.size() == 3)
      {
        cause = expect_exception(args[2]);
      }
      return make_exception(error_type::ex_info, message, cause, args[1]);
    });
    def("ex-message", [](eval_frame &, args_type const &args) -> object {
      expect_arity("ex-message", args, 1, 1);
      auto const ex(expect_exception(args[0]));
      if(!ex)
      {
        return {};
      }
      return ex->message;
    });
    def("ex-data", [](eval_frame &, args_type const &args) -> object {
      expect_arity("ex-data", args, 1, 1);
      auto const ex(expect_exception(args[0]));
      if(!ex)
      {
        return {};
      }
      return ex->data;
    });
    def("ex-cause", [](eval_frame &, args_type const &args) -> object {
      expect_arity("ex-cause", args, 1, 1);
      auto const ex(expect_exception(args[0]));
      if(!ex || !ex->cause)
      {
        return {};
      }
      return ex->cause;
    });

    def("eval", [](eval_frame &frame, args_type const &args) -> object {
      expect_arity("eval", args, 1, 1);
      return frame.rt.eval(args[0], frame);
    });
    def("in-ns", [](eval_frame &frame, args_type const &args) -> object {
      expect_arity("in-ns", args, 1, 1);
      if(!args[0].is<obj::symbol>())
      {
        throw_error(error_type::class_cast,
                    fmt::format("{} cannot be cast to braid.lang.Symbol", type_name(args[0])));
      }
      auto const target(frame.rt.intern_ns(args[0].as<obj::symbol>().to_string()));
      frame.current = frame.current.with_ns(target);
      return target;
    });
    def("sleep", [](eval_frame &frame, args_type const &args) -> object {
      expect_arity("sleep", args, 1, 1);
      if(!args[0].is<std::int64_t>() || args[0].as<std::int64_t>() < 0)
      {
        throw_error(error_type::illegal_argument, "sleep expects a non-negative number of milliseconds");
      }
      frame.cancel.sleep_for(std::chrono::milliseconds{ args[0].as<std::int64_t>() });
      return {};
    });
    def("read-line", [](eval_frame &frame, args_type const &args) -> object {
      expect_arity("read-line", args, 0, 0);
      if(!frame.current.in)
      {
        throw_error(error_type::illegal_state, "No input stream bound to *in*");
      }
      return frame.current.in->read_line(frame.cancel);
    });
  }
}
