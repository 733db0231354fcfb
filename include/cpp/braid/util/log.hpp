#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace braid::util::log
{
  /* Creates (or reconfigures) the shared `braid` logger. Accepts any spdlog level
   * name; unknown names fall back to `info`. */
  void configure(std::string_view level);

  /* The shared logger. Configured lazily with the default level if `configure`
   * was never called. */
  std::shared_ptr<spdlog::logger> const &get();
}
