#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <braid/runtime/object.hpp>

namespace braid::runtime::read
{
  struct source_position
  {
    std::size_t offset{};
    std::size_t line{ 1 };
    std::size_t column{ 1 };
  };

  /* Reads top-level forms one at a time from a source blob.
   *
   * `line` and `column` describe where the blob starts in its file, so positions
   * reported for forms and reader errors are file positions, not blob positions.
   * Reader errors are thrown as `braid.lang.ReaderException`, including forms nested
   * deeper than `max_depth`. */
  class reader
  {
  public:
    static constexpr std::size_t max_depth{ 256 };

    reader(std::string_view code, std::string file = {}, std::size_t line = 1, std::size_t column = 1);

    /* The next form, or nothing once the input is exhausted. */
    std::optional<object> next();

    /* Where the most recently returned form started. */
    source_position form_start() const;
    std::string const &file() const;

  private:
    object read_form();
    object read_delimited(char close, char const *kind);
    object read_string();
    object read_token();
    object parse_token(std::string const &token) const;
    void skip_whitespace();
    bool at_end() const;
    char peek() const;
    char advance();
    [[noreturn]] void fail(std::string const &message) const;

    std::string_view code_;
    std::string file_;
    std::size_t first_column_;
    source_position position_;
    source_position form_start_;
    std::size_t depth_{};
  };
}
