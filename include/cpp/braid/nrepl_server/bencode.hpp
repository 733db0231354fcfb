#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace braid::nrepl_server::bencode
{
  struct value
  {
    using list = std::vector<value>;
    /* Keys stay sorted, which is also the canonical encoding order. */
    using dict = std::map<std::string, value>;

    std::variant<std::int64_t, std::string, list, dict> data;

    value() = default;

    value(std::int64_t v)
      : data{ v }
    {
    }

    value(std::string v)
      : data{ std::move(v) }
    {
    }

    value(char const * const v)
      : data{ std::string{ v } }
    {
    }

    value(list v)
      : data{ std::move(v) }
    {
    }

    value(dict v)
      : data{ std::move(v) }
    {
    }

    bool is_string() const
    {
      return std::holds_alternative<std::string>(data);
    }

    bool is_list() const
    {
      return std::holds_alternative<list>(data);
    }

    bool is_dict() const
    {
      return std::holds_alternative<dict>(data);
    }

    bool is_integer() const
    {
      return std::holds_alternative<std::int64_t>(data);
    }

    std::string const &as_string() const
    {
      return std::get<std::string>(data);
    }

    std::int64_t as_integer() const
    {
      return std::get<std::int64_t>(data);
    }

    list const &as_list() const
    {
      return std::get<list>(data);
    }

    dict const &as_dict() const
    {
      return std::get<dict>(data);
    }

    bool operator==(value const &) const = default;
  };

  enum class parse_state : std::uint8_t
  {
    ok,
    need_more,
    error
  };

  struct decode_result
  {
    parse_state state{ parse_state::error };
    /* Bytes making up the decoded value. Only meaningful when `state` is `ok`. */
    std::size_t consumed{};
    value data{};
    std::string error{};
  };

  /* Decodes the first value in `input`. Trailing bytes are left for the next call,
   * so a stream buffer can be drained one frame at a time. */
  decode_result decode(std::string_view input);

  void encode_value(value const &val, std::string &out);
  std::string encode(value const &val);

  value list_of_strings(std::vector<std::string> const &items);
}
