#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>
#include <string_view>
#include <thread>

#include <braid/runtime/context.hpp>
#include <braid/runtime/error.hpp>
#include <braid/runtime/ns.hpp>
#include <braid/runtime/read/reader.hpp>

/* This must go last; doctest defines CHECK and family. */
#include <doctest/doctest.h>

namespace braid::runtime
{
  namespace
  {
    struct string_output : output_stream
    {
      void write(std::string_view const chunk) override
      {
        text.append(chunk);
      }

      void flush() override
      {
        ++flushes;
      }

      std::string text;
      int flushes{};
    };

    struct evaluator
    {
      /* Evaluates every form, returning the last value printed readably. */
      std::string eval(std::string_view const code)
      {
        read::reader r{ code };
        object last;
        eval_frame frame{ rt, current, cancel };
        while(auto const form = r.next())
        {
          last = rt.eval(*form, frame);
        }
        return to_code_string(last);
      }

      /* The type of the error `code` raises, or empty. */
      std::string error_of(std::string_view const code)
      {
        try
        {
          static_cast<void>(eval(code));
        }
        catch(error const &e)
        {
          return e.info->type;
        }
        return {};
      }

      context rt;
      bindings current{ rt.initial_bindings() };
      cancellation cancel;
    };
  }

  TEST_SUITE("evaluation")
  {
    TEST_CASE("arithmetic")
    {
      evaluator e;
      CHECK(e.eval("(+ 1 2 3)") == "6");
      CHECK(e.eval("(+)") == "0");
      CHECK(e.eval("(* 2 3.5)") == "7.0");
      CHECK(e.eval("(- 5)") == "-5");
      CHECK(e.eval("(/ 6 3)") == "2");
      CHECK(e.eval("(/ 1 2)") == "0.5");
      CHECK(e.eval("(inc 41)") == "42");
      CHECK(e.eval("(dec 0)") == "-1");
      CHECK(e.error_of("(/ 1 0)") == error_type::arithmetic);
      CHECK(e.error_of("(+ 9223372036854775807 1)") == error_type::arithmetic);
      CHECK(e.error_of("(+ 1 \"a\")") == error_type::class_cast);
    }

    TEST_CASE("comparison and logic")
    {
      evaluator e;
      CHECK(e.eval("(< 1 2 3)") == "true");
      CHECK(e.eval("(< 1 3 2)") == "false");
      CHECK(e.eval("(>= 3 3 1)") == "true");
      CHECK(e.eval("(= [1 2] (list 1 2))") == "true");
      CHECK(e.eval("(= 1 1.0)") == "false");
      CHECK(e.eval("(not nil)") == "true");
      CHECK(e.eval("(if false 1 2)") == "2");
      CHECK(e.eval("(if nil 1)") == "nil");
    }

    TEST_CASE("let, do and quote")
    {
      evaluator e;
      CHECK(e.eval("(let [a 1 b (+ a 1)] (* a b))") == "2");
      CHECK(e.eval("(do 1 2 3)") == "3");
      CHECK(e.eval("'(a b)") == "(a b)");
      CHECK(e.error_of("(let [a] a)") == error_type::compiler);
    }

    TEST_CASE("strings")
    {
      evaluator e;
      CHECK(e.eval("(str \"a\" 1 nil :k)") == "\"a1:k\"");
      CHECK(e.eval("(pr-str \"a\" 1)") == "\"\\\"a\\\" 1\"");
      CHECK(e.eval("(count \"abc\")") == "3");
      CHECK(e.eval("(count [1 2])") == "2");
      CHECK(e.eval("(count nil)") == "0");
    }

    TEST_CASE("vars and namespaces")
    {
      evaluator e;
      CHECK(e.eval("(def x 10)") == "#'user/x");
      CHECK(e.eval("x") == "10");
      CHECK(e.eval("user/x") == "10");
      CHECK(e.eval("(ns other) (def x 20) x") == "20");
      CHECK(e.current.current_ns_name() == "other");
      CHECK(e.eval("user/x") == "10");
      CHECK(e.eval("(in-ns 'user) x") == "10");
      CHECK(e.current.current_ns_name() == "user");
      CHECK(e.eval("(braid.core/inc 1)") == "2");
    }

    TEST_CASE("unresolvable symbols")
    {
      evaluator e;
      try
      {
        static_cast<void>(e.eval("nope"));
        FAIL("expected an error");
      }
      catch(error const &ex)
      {
        CHECK(ex.info->type == error_type::compiler);
        CHECK(ex.info->message == "Unable to resolve symbol: nope in this context");
        CHECK(root_cause(ex.info)->type == error_type::runtime);
      }
    }

    TEST_CASE("exceptions as values")
    {
      evaluator e;
      CHECK(e.eval("(ex-message (ex-info \"m\" {}))") == "\"m\"");
      CHECK(e.eval("(ex-data (ex-info \"m\" {:a 1}))") == "{:a 1}");
      CHECK(e.eval("(ex-message (ex-cause (ex-info \"outer\" {} (ex-info \"inner\" nil))))")
            == "\"inner\"");
      CHECK(e.error_of("(throw (ex-info \"m\" {}))") == error_type::ex_info);
      CHECK(e.error_of("(throw 1)") == error_type::class_cast);
      CHECK(e.error_of("(inc)") == error_type::arity);
    }

    TEST_CASE("printing goes to *out*")
    {
      evaluator e;
      auto const out(std::make_shared<string_output>());
      e.current = e.current.with_streams(out, out, nullptr);
      CHECK(e.eval("(println \"a\" 1) (prn \"b\") (print :c)") == "nil");
      CHECK(out->text == "a 1\n\"b\"\n:c");
      CHECK(e.error_of("(read-line)") == error_type::illegal_state);
    }

    TEST_CASE("eval of data")
    {
      evaluator e;
      CHECK(e.eval("(eval '(+ 1 2))") == "3");
      CHECK(e.eval("(eval (list (quote inc) 1))") == "2");
    }

    TEST_CASE("cancellation stops evaluation")
    {
      evaluator e;
      REQUIRE(e.cancel.try_cancel());
      CHECK_THROWS_AS(e.eval("(+ 1 1)"), interrupted);
      CHECK_THROWS_AS(e.cancel.sleep_for(std::chrono::hours{ 1 }), interrupted);
    }

    TEST_CASE("sleeping past the clock's range waits for cancellation")
    {
      cancellation cancel;
      std::atomic<bool> returned{ false };
      std::atomic<bool> was_interrupted{ false };
      std::thread sleeper{ [&cancel, &returned, &was_interrupted] {
        try
        {
          cancel.sleep_for(std::chrono::milliseconds{ std::numeric_limits<std::int64_t>::max() });
        }
        catch(interrupted const &)
        {
          was_interrupted = true;
        }
        returned = true;
      } };

      std::this_thread::sleep_for(std::chrono::milliseconds{ 100 });
      CHECK_FALSE(returned.load());

      REQUIRE(cancel.try_cancel());
      sleeper.join();
      CHECK(was_interrupted.load());
    }

    TEST_CASE("sleep with a huge duration is interruptible")
    {
      evaluator e;
      std::thread interrupter{ [&e] {
        std::this_thread::sleep_for(std::chrono::milliseconds{ 100 });
        static_cast<void>(e.cancel.try_cancel());
      } };
      CHECK_THROWS_AS(e.eval("(sleep 9223372036854775807)"), interrupted);
      interrupter.join();
    }
  }
}
