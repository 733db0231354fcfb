#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <braid/util/log.hpp>

namespace braid::util::log
{
  namespace
  {
    constexpr char const *logger_name{ "braid" };

    std::shared_ptr<spdlog::logger> &instance()
    {
      /* NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables) */
      static std::shared_ptr<spdlog::logger> logger;
      return logger;
    }

    std::once_flag &init_flag()
    {
      static std::once_flag flag;
      return flag;
    }

    void create(spdlog::level::level_enum const level)
    {
      auto logger(spdlog::get(logger_name));
      if(!logger)
      {
        logger = spdlog::stderr_color_mt(logger_name);
        logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%n] %v");
      }
      logger->set_level(level);
      instance() = std::move(logger);
    }
  }

  void configure(std::string_view const level)
  {
    auto parsed(spdlog::level::from_str(std::string{ level }));
    /* from_str maps unknown names to `off`, which would silently hide everything. */
    if(parsed == spdlog::level::off && level != "off")
    {
      parsed = spdlog::level::info;
    }

    std::call_once(init_flag(), [parsed] { create(parsed); });
    instance()->set_level(parsed);
  }

  std::shared_ptr<spdlog::logger> const &get()
  {
    std::call_once(init_flag(), [] { create(spdlog::level::info); });
    return instance();
  }
}
