#pragma once

#include <functional>

namespace braid::util
{
  /* Runs the stored function when the scope ends, regardless of how it ends. */
  struct scope_exit
  {
    using function_type = std::function<void()>;

    scope_exit(function_type &&f)
      : func{ std::move(f) }
    {
    }

    scope_exit(scope_exit const &) = delete;
    scope_exit(scope_exit &&) = delete;

    ~scope_exit()
    {
      if(func)
      {
        func();
      }
    }

    function_type func;
  };
}
