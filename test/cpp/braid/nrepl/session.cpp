#include "common.hpp"

namespace braid::nrepl_server
{
  namespace
  {
    std::vector<std::string> listed_sessions(harness &h)
    {
      auto const id(h.next_id());
      h.send(h.request({
        { "op", "ls-sessions" },
        { "id",            id }
      }));
      auto const responses(h.client->for_id(id));
      REQUIRE(responses.size() == 1);
      std::vector<std::string> ret;
      for(auto const &entry : responses.front().at("sessions").as_list())
      {
        ret.push_back(entry.as_string());
      }
      return ret;
    }
  }

  TEST_SUITE("nREPL session ops")
  {
    TEST_CASE("clone creates distinct sessions")
    {
      harness h;
      auto const first(h.clone());
      auto const second(h.clone());
      CHECK(!first.empty());
      CHECK(first != second);

      auto expected(std::vector<std::string>{ first, second });
      std::ranges::sort(expected);
      CHECK(listed_sessions(h) == expected);
    }

    TEST_CASE("clone copies the parent's dynamic state")
    {
      harness h;
      auto const parent(h.clone());
      h.eval(parent, "(ns cloned-ns) 42");

      h.send(h.request({
        {      "op",  "clone" },
        {      "id",      "c" },
        { "session",   parent }
      }));
      auto const responses(h.client->for_id("c"));
      REQUIRE(responses.size() == 1);
      auto const child(field(responses.front(), "new-session"));
      REQUIRE(!child.empty());

      CHECK(values_of(h.eval(child, "*1")) == std::vector<std::string>{ "42" });
      CHECK(field(h.eval(child, "1").front(), "ns") == "cloned-ns");

      /* Later changes in the child do not leak back. */
      h.eval(child, "(ns elsewhere)");
      CHECK(field(h.eval(parent, "1").front(), "ns") == "cloned-ns");
    }

    TEST_CASE("sessions do not share history")
    {
      harness h;
      auto const first(h.clone());
      auto const second(h.clone());
      h.eval(first, "10");
      CHECK(values_of(h.eval(second, "*1")) == std::vector<std::string>{ "nil" });
    }

    TEST_CASE("close removes the session")
    {
      harness h;
      auto const session(h.clone());
      h.send(h.request({
        {      "op",   "close" },
        {      "id",   "close" },
        { "session",  session }
      }));
      auto const responses(h.client->for_id("close"));
      REQUIRE(responses.size() == 1);
      CHECK(extract_status(responses.front())
            == std::vector<std::string>{ "session-closed", "done" });
      CHECK(listed_sessions(h).empty());

      h.send(h.request({
        {      "op",  "close" },
        {      "id", "again" },
        { "session", session }
      }));
      auto const again(h.client->for_id("again"));
      REQUIRE(again.size() == 1);
      CHECK(extract_status(again.front())
            == std::vector<std::string>{ "error", "unknown-session", "done" });
    }

    TEST_CASE("close interrupts a running eval")
    {
      harness h;
      auto const session(h.clone());
      h.send(h.request({
        {      "op",          "eval" },
        {      "id",       "sleepy" },
        { "session",         session },
        {    "code", "(sleep 60000)" }
      }));

      auto const target(h.sessions.find(session));
      REQUIRE(target);
      auto const deadline(std::chrono::steady_clock::now() + 5s);
      while(target->slot().current_id() != "sleepy")
      {
        REQUIRE(std::chrono::steady_clock::now() < deadline);
        std::this_thread::sleep_for(1ms);
      }

      h.send(h.request({
        {      "op",   "close" },
        {      "id",       "bye" },
        { "session",  session }
      }));
      REQUIRE(h.client->wait_for_status("sleepy", "interrupted"));
      CHECK(has_status(h.client->for_id("bye").front(), "session-closed"));
    }
  }
}
