#include "common.hpp"

namespace braid::nrepl_server
{
  TEST_SUITE("nREPL eval op")
  {
    TEST_CASE("eval returns value, ns and done")
    {
      harness h;
      auto const session(h.clone());
      auto const responses(h.eval(session, "(+ 1 2)"));

      REQUIRE(responses.size() == 2);
      auto const &value_payload(responses.front());
      INFO("value payload keys: " << dict_keys(value_payload));
      CHECK(field(value_payload, "value") == "3");
      CHECK(field(value_payload, "ns") == "user");
      CHECK(field(value_payload, "session") == session);
      CHECK(extract_status(responses.back()) == std::vector<std::string>{ "done" });
    }

    TEST_CASE("one value per top-level form")
    {
      harness h;
      auto const session(h.clone());
      auto const responses(h.eval(session, "1 \"two\" :three [4 5]"));
      CHECK(values_of(responses) == std::vector<std::string>{ "1", "\"two\"", ":three", "[4 5]" });
    }

    TEST_CASE("definitions persist within a session")
    {
      harness h;
      auto const session(h.clone());
      CHECK(values_of(h.eval(session, "(def x 41)")) == std::vector<std::string>{ "#'user/x" });
      CHECK(values_of(h.eval(session, "(inc x)")) == std::vector<std::string>{ "42" });
    }

    TEST_CASE("result history")
    {
      harness h;
      auto const session(h.clone());
      h.eval(session, "1");
      h.eval(session, "2");
      h.eval(session, "3");
      CHECK(values_of(h.eval(session, "[*1 *2 *3]")) == std::vector<std::string>{ "[3 2 1]" });
    }

    TEST_CASE("thrown exceptions are reported")
    {
      harness h;
      auto const session(h.clone());
      auto const responses(h.eval(session, "(throw (ex-info \"boom\" {:a 1}))"));

      REQUIRE(responses.size() == 3);
      auto const &error_payload(responses[0]);
      CHECK(extract_status(error_payload) == std::vector<std::string>{ "eval-error" });
      CHECK(field(error_payload, "ex") == "braid.lang.ExceptionInfo");
      CHECK(field(error_payload, "root-ex") == "braid.lang.ExceptionInfo");
      CHECK(field(responses[1], "err")
            == "Execution error (ExceptionInfo) at user/eval (REPL:1:1).\nboom\n");
      CHECK(extract_status(responses[2]) == std::vector<std::string>{ "done" });

      CHECK(values_of(h.eval(session, "(ex-message *e)")) == std::vector<std::string>{ "\"boom\"" });
    }

    TEST_CASE("unresolved symbols are compile errors")
    {
      harness h;
      auto const session(h.clone());
      auto const responses(h.eval(session, "(printjln 4)"));
      REQUIRE(!responses.empty());
      CHECK(field(responses.front(), "ex") == "braid.lang.CompilerException");
      CHECK(field(responses.front(), "root-ex") == "braid.lang.RuntimeException");
      auto const err(joined_field(responses, "err"));
      CHECK(err.find("Syntax error compiling at (REPL:1:1).") != std::string::npos);
      CHECK(err.find("Unable to resolve symbol: printjln") != std::string::npos);
    }

    TEST_CASE("reader errors are syntax errors")
    {
      harness h;
      auto const session(h.clone());
      auto const responses(h.eval(session, "(+ 1"));
      REQUIRE(!responses.empty());
      CHECK(field(responses.front(), "ex") == "braid.lang.ReaderException");
      CHECK(joined_field(responses, "err").starts_with("Syntax error reading source"));
    }

    TEST_CASE("an error abandons the rest of the request")
    {
      harness h;
      auto const session(h.clone());
      auto const responses(h.eval(session, "1 (/ 1 0) 3"));
      CHECK(values_of(responses) == std::vector<std::string>{ "1" });
      CHECK(std::ranges::any_of(responses, [](auto const &r) { return has_status(r, "eval-error"); }));
      CHECK(joined_field(responses, "err").find("Divide by zero") != std::string::npos);
    }

    TEST_CASE("values, then an error, then nothing")
    {
      harness h;
      auto const session(h.clone());
      auto const responses(h.eval(session, "1 (+ 1 1) (throw (ex-info \"x\" {})) 4"));

      CHECK(values_of(responses) == std::vector<std::string>{ "1", "2" });
      auto const errors(std::ranges::count_if(responses,
                                              [](auto const &r) { return has_status(r, "eval-error"); }));
      CHECK(errors == 1);
      CHECK(has_status(responses.back(), "done"));

      /* History reflects the two forms that completed. */
      CHECK(values_of(h.eval(session, "[*1 *2]")) == std::vector<std::string>{ "[2 1]" });
    }

    TEST_CASE("output precedes the value it was printed for")
    {
      harness h;
      auto const session(h.clone());
      auto const responses(h.eval(session, "(println \"hello\") (print \"a\" \"b\") 7"));

      std::vector<std::string> kinds;
      for(auto const &r : responses)
      {
        if(r.contains("out"))
        {
          kinds.push_back("out:" + field(r, "out"));
        }
        else if(r.contains("value"))
        {
          kinds.push_back("value:" + field(r, "value"));
        }
      }
      CHECK(kinds
            == std::vector<std::string>{ "out:hello\n", "value:nil", "out:a b", "value:nil", "value:7" });
    }

    TEST_CASE("explicit ns does not stick to the session")
    {
      harness h;
      auto const session(h.clone());
      h.eval(session, "(ns my-lib) (def helper 100) (ns user)");

      auto const id(h.next_id());
      h.send(h.request({
        {      "op",   "eval" },
        {      "id",       id },
        { "session",  session },
        {    "code", "helper" },
        {      "ns", "my-lib" }
      }));
      REQUIRE(h.client->wait_for_status(id, "done"));
      auto const responses(h.client->for_id(id));
      REQUIRE(!responses.empty());
      CHECK(field(responses.front(), "value") == "100");
      CHECK(field(responses.front(), "ns") == "my-lib");

      CHECK(values_of(h.eval(session, "(str *ns*)")) == std::vector<std::string>{ "\"user\"" });
    }

    TEST_CASE("ns changes in code persist")
    {
      harness h;
      auto const session(h.clone());
      auto const responses(h.eval(session, "(ns other)"));
      REQUIRE(!responses.empty());
      CHECK(field(responses.front(), "ns") == "other");
      auto const later(h.eval(session, "(+ 1 1)"));
      CHECK(field(later.front(), "ns") == "other");
    }

    TEST_CASE("unknown ns is rejected")
    {
      harness h;
      auto const session(h.clone());
      auto const id(h.next_id());
      h.send(h.request({
        {      "op",      "eval" },
        {      "id",          id },
        { "session",     session },
        {    "code",         "1" },
        {      "ns", "not-there" }
      }));
      REQUIRE(h.client->wait_for_status(id, "done"));
      auto const responses(h.client->for_id(id));
      REQUIRE(responses.size() == 1);
      CHECK(extract_status(responses.front())
            == std::vector<std::string>{ "error", "namespace-not-found", "done" });
      CHECK(field(responses.front(), "ns") == "not-there");
    }

    TEST_CASE("missing code is rejected")
    {
      harness h;
      auto const session(h.clone());
      h.send(h.request({
        {      "op",  "eval" },
        {      "id", "empty" },
        { "session", session }
      }));
      auto const responses(h.client->for_id("empty"));
      REQUIRE(responses.size() == 1);
      CHECK(extract_status(responses.front()) == std::vector<std::string>{ "error", "no-code", "done" });
    }

    TEST_CASE("unknown session is rejected")
    {
      harness h;
      h.send(h.request({
        {      "op",    "eval" },
        {      "id",      "u" },
        { "session", "nope" },
        {    "code",       "1" }
      }));
      auto const responses(h.client->for_id("u"));
      REQUIRE(responses.size() == 1);
      CHECK(extract_status(responses.front())
            == std::vector<std::string>{ "error", "unknown-session", "done" });
    }

    TEST_CASE("requests without a session run in a throwaway one")
    {
      harness h;
      auto const first(h.next_id());
      h.send(h.request({
        {   "op",        "eval" },
        {   "id",         first },
        { "code", "(def y 5) y" }
      }));
      REQUIRE(h.client->wait_for_status(first, "done"));
      auto const responses(h.client->for_id(first));
      CHECK(values_of(responses) == std::vector<std::string>{ "#'user/y", "5" });
      CHECK(h.sessions.size() == 0);
    }

    TEST_CASE("custom evaluator")
    {
      harness h;
      auto const session(h.clone());
      h.rt.intern_native("user",
                         "quote-it",
                         [](runtime::eval_frame &, std::vector<runtime::object> const &args) {
                           return runtime::object{ "evaluated: " + runtime::to_code_string(args[0]) };
                         });

      auto const id(h.next_id());
      h.send(h.request({
        {      "op",          "eval" },
        {      "id",              id },
        { "session",         session },
        {    "code",       "(+ 1 2)" },
        {    "eval", "user/quote-it" }
      }));
      REQUIRE(h.client->wait_for_status(id, "done"));
      CHECK(values_of(h.client->for_id(id))
            == std::vector<std::string>{ "\"evaluated: (+ 1 2)\"" });

      auto const missing(h.next_id());
      h.send(h.request({
        {      "op",         "eval" },
        {      "id",        missing },
        { "session",        session },
        {    "code",            "1" },
        {    "eval", "user/missing" }
      }));
      REQUIRE(h.client->wait_for_status(missing, "done"));
      CHECK(has_status(h.client->for_id(missing).front(), "eval-not-found"));
    }

    TEST_CASE("code may be a list of forms")
    {
      harness h;
      auto const session(h.clone());
      auto msg(h.request({
        {      "op",  "eval" },
        {      "id",  "list" },
        { "session", session }
      }));
      msg.data.emplace("code", bencode::list_of_strings({ "(+ 1 1)", "(* 2 3)" }));
      h.send(msg);
      REQUIRE(h.client->wait_for_status("list", "done"));
      CHECK(values_of(h.client->for_id("list")) == std::vector<std::string>{ "2", "6" });
    }

    TEST_CASE("deeply nested code is a reader error")
    {
      harness h;
      auto const session(h.clone());
      auto const responses(h.eval(session, std::string(500000, '[')));
      REQUIRE(!responses.empty());
      CHECK(has_status(responses.front(), "eval-error"));
      CHECK(field(responses.front(), "ex") == "braid.lang.ReaderException");
      CHECK(joined_field(responses, "err").starts_with("Syntax error reading source"));

      CHECK(values_of(h.eval(session, "(+ 1 2)")) == std::vector<std::string>{ "3" });
    }

    TEST_CASE("code that is not text is rejected")
    {
      harness h;
      auto const session(h.clone());
      std::vector<bencode::value> const bad_code{
        bencode::value{ std::int64_t{ 42 } },
        bencode::value{ bencode::value::dict{ { "form", "(+ 1 2)" } } },
        bencode::value{ bencode::value::list{ "(+ 1 2)", std::int64_t{ 3 } } },
      };
      for(auto const &code : bad_code)
      {
        auto const id(h.next_id());
        auto msg(h.request({
          {      "op",    "eval" },
          {      "id",        id },
          { "session",   session }
        }));
        msg.data.emplace("code", code);
        h.send(msg);
        REQUIRE(h.client->wait_for_status(id, "done"));
        auto const responses(h.client->for_id(id));
        REQUIRE(responses.size() == 1);
        CHECK(extract_status(responses.front())
              == std::vector<std::string>{ "error", "malformed-code", "done" });
      }
    }

    TEST_CASE("line and column below one start at one")
    {
      harness h;
      auto const session(h.clone());
      auto const id(h.next_id());
      h.send(h.request({
        {      "op",      "eval" },
        {      "id",          id },
        { "session",     session },
        {    "code",   "(/ 1 0)" },
        {    "file", "neg.braid" },
        {    "line",        "-5" },
        {  "column",         "0" }
      }));
      REQUIRE(h.client->wait_for_status(id, "done"));
      CHECK(joined_field(h.client->for_id(id), "err").find("(neg.braid:1:1)") != std::string::npos);
    }

    TEST_CASE("an error after a winning interrupt is not reported")
    {
      harness h;
      runtime::cancellation cancel;
      h.rt.intern_native("user",
                         "cancel-then-throw",
                         [&cancel](runtime::eval_frame &, std::vector<runtime::object> const &) -> runtime::object {
                           REQUIRE(cancel.try_cancel());
                           runtime::throw_error(runtime::error_type::illegal_state, "too late");
                         });

      auto const msg(h.request({
        { "op",                      "eval" },
        { "id",                      "raced" },
        { "code", "(user/cancel-then-throw)" }
      }));
      auto const after(h.engine.evaluate(h.rt.initial_bindings(), msg, cancel));

      CHECK(h.client->for_id("raced").empty());
      CHECK(after.get(runtime::var_names::last_exception).is_nil());
    }

    TEST_CASE("requests in one session run in order")
    {
      harness h;
      auto const session(h.clone());
      h.eval(session, "(def counter 0)");
      for(int i{}; i < 20; ++i)
      {
        h.send(h.request({
          {      "op",                          "eval" },
          {      "id",          "n" + std::to_string(i) },
          { "session",                         session },
          {    "code", "(def counter (inc counter)) counter" }
        }));
      }
      REQUIRE(h.client->wait_for_status("n19", "done"));
      for(int i{}; i < 20; ++i)
      {
        auto const id("n" + std::to_string(i));
        REQUIRE(h.client->wait_for_status(id, "done"));
        auto const values(values_of(h.client->for_id(id)));
        REQUIRE(values.size() == 2);
        CHECK(values[1] == std::to_string(i + 1));
      }
    }
  }
}
