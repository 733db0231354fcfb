#include <cctype>
#include <charconv>
#include <cstdint>
#include <system_error>
#include <vector>

#include <fmt/format.h>

#include <braid/runtime/read/reader.hpp>
#include <braid/runtime/error.hpp>
#include <braid/util/scope_exit.hpp>

namespace braid::runtime::read
{
  namespace
  {
    bool is_whitespace(char const ch)
    {
      return std::isspace(static_cast<unsigned char>(ch)) || ch == ',';
    }

    bool is_delimiter(char const ch)
    {
      return is_whitespace(ch) || ch == '(' || ch == ')' || ch == '[' || ch == ']' || ch == '{'
        || ch == '}' || ch == '"' || ch == ';';
    }

    bool looks_numeric(std::string const &token)
    {
      auto const start((token[0] == '-' || token[0] == '+') ? 1 : 0);
      return token.size() > static_cast<std::size_t>(start)
        && std::isdigit(static_cast<unsigned char>(token[start]));
    }
  }

  reader::reader(std::string_view const code,
                 std::string file,
                 std::size_t const line,
                 std::size_t const column)
    : code_{ code }
    , file_{ std::move(file) }
    , first_column_{ column == 0 ? 1 : column }
  {
    position_.line = line == 0 ? 1 : line;
    position_.column = first_column_;
    form_start_ = position_;
  }

  std::optional<object> reader::next()
  {
    skip_whitespace();
    if(at_end())
    {
      return std::nullopt;
    }
    form_start_ = position_;
    return read_form();
  }

  source_position reader::form_start() const
  {
    return form_start_;
  }

  std::string const &reader::file() const
  {
    return file_;
  }

  object reader::read_form()
  {
    if(depth_ >= max_depth)
    {
      fail(fmt::format("Forms nested too deep, the limit is {}", max_depth));
    }
    ++depth_;
    util::scope_exit const finally{ [this] { --depth_; } };

    skip_whitespace();
    if(at_end())
    {
      fail("EOF while reading");
    }

    auto const ch(peek());
    switch(ch)
    {
      case '(':
        advance();
        return read_delimited(')', "list");
      case '[':
        advance();
        return read_delimited(']', "vector");
      case '{':
        advance();
        return read_delimited('}', "map");
      case ')':
      case ']':
      case '}':
        fail(fmt::format("Unmatched delimiter: {}", ch));
      case '"':
        advance();
        return read_string();
      case '\'':
        {
          advance();
          auto quoted(read_form());
          return make_list({ obj::symbol{ "quote" }, std::move(quoted) });
        }
      default:
        return read_token();
    }
  }

  object reader::read_delimited(char const close, char const * const kind)
  {
    std::vector<object> items;
    while(true)
    {
      skip_whitespace();
      if(at_end())
      {
        fail(fmt::format("EOF while reading {}", kind));
      }
      if(peek() == close)
      {
        advance();
        break;
      }
      items.emplace_back(read_form());
    }

    if(close == ')')
    {
      return make_list(std::move(items));
    }
    if(close == ']')
    {
      return make_vector(std::move(items));
    }

    if(items.size() % 2 != 0)
    {
      fail("Map literal must contain an even number of forms");
    }
    std::vector<std::pair<object, object>> entries;
    entries.reserve(items.size() / 2);
    for(std::size_t i{}; i < items.size(); i += 2)
    {
      entries.emplace_back(std::move(items[i]), std::move(items[i + 1]));
    }
    return make_map(std::move(entries));
  }

  object reader::read_string()
  {
    std::string value;
    while(true)
    {
      if(at_end())
      {
        fail("EOF while reading string");
      }
      auto const ch(advance());
      if(ch == '"')
      {
        return value;
      }
      if(ch != '\\')
      {
        value.push_back(ch);
        continue;
      }

      if(at_end())
      {
        fail("EOF while reading string");
      }
      auto const escaped(advance());
      switch(escaped)
      {
        case 'n':
          value.push_back('\n');
          break;
        case 't':
          value.push_back('\t');
          break;
        case 'r':
          value.push_back('\r');
          break;
        case '\\':
        case '"':
          value.push_back(escaped);
          break;
        default:
          fail(fmt::format("Unsupported escape character: \\{}", escaped));
      }
    }
  }

  object reader::read_token()
  {
    std::string token;
    while(!at_end() && !is_delimiter(peek()))
    {
      token.push_back(advance());
    }
    if(token.empty())
    {
      fail(fmt::format("Unexpected character: {}", peek()));
    }
    return parse_token(token);
  }

  object reader::parse_token(std::string const &token) const
  {
    if(token == "nil")
    {
      return {};
    }
    if(token == "true")
    {
      return true;
    }
    if(token == "false")
    {
      return false;
    }

    if(looks_numeric(token))
    {
      auto const * const begin(token.data() + (token[0] == '+' ? 1 : 0));
      auto const * const end(token.data() + token.size());
      std::int64_t integer{};
      auto const int_result(std::from_chars(begin, end, integer));
      if(int_result.ec == std::errc{} && int_result.ptr == end)
      {
        return integer;
      }
      if(int_result.ec == std::errc::result_out_of_range)
      {
        fail(fmt::format("Integer literal out of range: {}", token));
      }

      double real{};
      auto const real_result(std::from_chars(begin, end, real));
      if(real_result.ec == std::errc{} && real_result.ptr == end)
      {
        return real;
      }
      fail(fmt::format("Invalid number: {}", token));
    }

    if(token[0] == ':')
    {
      if(token.size() == 1)
      {
        fail("Invalid token: :");
      }
      return make_keyword(token.substr(1));
    }

    return make_symbol(token);
  }

  void reader::skip_whitespace()
  {
    while(!at_end())
    {
      auto const ch(peek());
      if(ch == ';')
      {
        while(!at_end() && peek() != '\n')
        {
          advance();
        }
        continue;
      }
      if(!is_whitespace(ch))
      {
        return;
      }
      advance();
    }
  }

  bool reader::at_end() const
  {
    return position_.offset >= code_.size();
  }

  char reader::peek() const
  {
    return code_[position_.offset];
  }

  char reader::advance()
  {
    auto const ch(code_[position_.offset++]);
    if(ch == '\n')
    {
      ++position_.line;
      position_.column = 1;
    }
    else
    {
      ++position_.column;
    }
    return ch;
  }

  void reader::fail(std::string const &message) const
  {
    auto info(std::make_shared<exception_info>());
    info->type = error_type::reader;
    info->message = message;
    info->file = file_;
    info->line = position_.line;
    info->column = position_.column;
    throw error{ std::move(info) };
  }
}
