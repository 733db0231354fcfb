#include <cctype>
#include <charconv>
#include <system_error>

#include <braid/nrepl_server/bencode.hpp>

namespace braid::nrepl_server::bencode
{
  namespace
  {
    /* Nested containers beyond this depth are rejected rather than recursed into. */
    constexpr std::size_t max_depth{ 128 };

    parse_state decode_value(std::string_view const input,
                             std::size_t &offset,
                             value &out,
                             std::string &err,
                             std::size_t const depth)
    {
      if(offset >= input.size())
      {
        return parse_state::need_more;
      }
      if(depth > max_depth)
      {
        err = "nesting too deep";
        return parse_state::error;
      }

      auto const current(input[offset]);
      if(current == 'i')
      {
        auto const end(input.find('e', offset + 1));
        if(end == std::string_view::npos)
        {
          return parse_state::need_more;
        }

        std::int64_t parsed{};
        auto const * const first(input.data() + offset + 1);
        auto const * const last(input.data() + end);
        auto const res(std::from_chars(first, last, parsed));
        if(first == last || res.ec != std::errc{} || res.ptr != last)
        {
          err = "invalid integer";
          return parse_state::error;
        }
        out = value{ parsed };
        offset = end + 1;
        return parse_state::ok;
      }

      if(current == 'l' || current == 'd')
      {
        auto const is_dict(current == 'd');
        auto cursor(offset + 1);
        value::list items;
        value::dict entries;
        while(true)
        {
          if(cursor >= input.size())
          {
            return parse_state::need_more;
          }
          if(input[cursor] == 'e')
          {
            ++cursor;
            break;
          }

          value element;
          auto state(decode_value(input, cursor, element, err, depth + 1));
          if(state != parse_state::ok)
          {
            return state;
          }
          if(!is_dict)
          {
            items.emplace_back(std::move(element));
            continue;
          }

          if(!element.is_string())
          {
            err = "dictionary key must be string";
            return parse_state::error;
          }
          value entry;
          state = decode_value(input, cursor, entry, err, depth + 1);
          if(state != parse_state::ok)
          {
            return state;
          }
          entries.insert_or_assign(element.as_string(), std::move(entry));
        }

        if(is_dict)
        {
          out = value{ std::move(entries) };
        }
        else
        {
          out = value{ std::move(items) };
        }
        offset = cursor;
        return parse_state::ok;
      }

      if(!std::isdigit(static_cast<unsigned char>(current)))
      {
        err = "unsupported token";
        return parse_state::error;
      }

      auto const colon(input.find(':', offset));
      if(colon == std::string_view::npos)
      {
        return parse_state::need_more;
      }

      std::int64_t size{};
      auto const size_res(std::from_chars(input.data() + offset, input.data() + colon, size));
      if(size_res.ec != std::errc{} || size_res.ptr != input.data() + colon || size < 0)
      {
        err = "invalid string length";
        return parse_state::error;
      }

      auto const start(colon + 1);
      auto const length(static_cast<std::size_t>(size));
      if(length > input.size() - start)
      {
        return parse_state::need_more;
      }

      out = value{ std::string{ input.substr(start, length) } };
      offset = start + length;
      return parse_state::ok;
    }

    void encode_string(std::string const &s, std::string &out)
    {
      out += std::to_string(s.size());
      out.push_back(':');
      out += s;
    }
  }

  decode_result decode(std::string_view const input)
  {
    decode_result res;
    std::size_t offset{};
    res.state = decode_value(input, offset, res.data, res.error, 0);
    if(res.state == parse_state::ok)
    {
      res.consumed = offset;
    }
    return res;
  }

  void encode_value(value const &val, std::string &out)
  {
    if(val.is_string())
    {
      encode_string(val.as_string(), out);
      return;
    }

    if(val.is_integer())
    {
      out.push_back('i');
      out += std::to_string(val.as_integer());
      out.push_back('e');
      return;
    }

    if(val.is_list())
    {
      out.push_back('l');
      for(auto const &entry : val.as_list())
      {
        encode_value(entry, out);
      }
      out.push_back('e');
      return;
    }

    out.push_back('d');
    for(auto const &[key, entry] : val.as_dict())
    {
      encode_string(key, out);
      encode_value(entry, out);
    }
    out.push_back('e');
  }

  std::string encode(value const &val)
  {
    std::string out;
    out.reserve(256);
    encode_value(val, out);
    return out;
  }

  value list_of_strings(std::vector<std::string> const &items)
  {
    value::list list;
    list.reserve(items.size());
    for(auto const &item : items)
    {
      list.emplace_back(item);
    }
    return value{ std::move(list) };
  }
}
