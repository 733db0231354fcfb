#include <braid/runtime/error.hpp>

namespace braid::runtime
{
  exception_ref make_exception(std::string type,
                               std::string message,
                               exception_ref cause,
                               object data)
  {
    auto info(std::make_shared<exception_info>());
    info->type = std::move(type);
    info->message = std::move(message);
    info->cause = std::move(cause);
    info->data = std::move(data);
    return info;
  }

  exception_ref root_cause(exception_ref const &ex)
  {
    auto current(ex);
    while(current && current->cause)
    {
      current = current->cause;
    }
    return current;
  }

  error::error(exception_ref info)
    : info{ std::move(info) }
  {
  }

  char const *error::what() const noexcept
  {
    return info ? info->message.c_str() : "unknown error";
  }

  void throw_error(std::string type, std::string message, exception_ref cause)
  {
    throw error{ make_exception(std::move(type), std::move(message), std::move(cause)) };
  }

  char const *interrupted::what() const noexcept
  {
    return "evaluation interrupted";
  }
}
