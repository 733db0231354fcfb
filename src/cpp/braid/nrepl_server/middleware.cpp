#include <algorithm>
#include <optional>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <braid/nrepl_server/middleware.hpp>
#include <braid/util/log.hpp>

namespace braid::nrepl_server
{
  namespace
  {
    std::set<std::string> capabilities_of(descriptor const &d)
    {
      std::set<std::string> ret{ d.name };
      for(auto const &entry : d.handles)
      {
        ret.insert(entry.first);
      }
      return ret;
    }

    /* The index of the one descriptor providing `capability`. */
    std::size_t provider_of(std::string const &capability,
                            std::string const &needed_by,
                            std::vector<std::set<std::string>> const &capabilities,
                            std::vector<descriptor_ref> const &descriptors)
    {
      std::vector<std::size_t> providers;
      for(std::size_t i{}; i < capabilities.size(); ++i)
      {
        if(capabilities[i].contains(capability))
        {
          providers.push_back(i);
        }
      }

      if(providers.empty())
      {
        throw config_error{
          fmt::format("{} needs \"{}\", which no middleware provides", needed_by, capability)
        };
      }
      if(providers.size() > 1)
      {
        std::vector<std::string> names;
        for(auto const i : providers)
        {
          names.push_back(descriptors[i]->name);
        }
        throw config_error{ fmt::format("{} needs \"{}\", which is provided by more than one "
                                        "middleware: {}",
                                        needed_by,
                                        capability,
                                        fmt::join(names, ", ")) };
      }
      return providers.front();
    }
  }

  std::vector<descriptor_ref> linearize(std::vector<descriptor_ref> const &descriptors)
  {
    std::set<std::string> seen;
    for(auto const &d : descriptors)
    {
      if(!seen.insert(d->name).second)
      {
        throw config_error{ fmt::format("middleware {} is listed more than once", d->name) };
      }
    }

    auto const count(descriptors.size());
    std::vector<std::set<std::string>> capabilities;
    capabilities.reserve(count);
    for(auto const &d : descriptors)
    {
      capabilities.push_back(capabilities_of(*d));
    }

    /* successors[p] holds every descriptor that must come after p. */
    std::vector<std::set<std::size_t>> successors(count);
    std::vector<std::size_t> in_degree(count);
    for(std::size_t i{}; i < count; ++i)
    {
      for(auto const &capability : descriptors[i]->expected)
      {
        provider_of(capability, descriptors[i]->name, capabilities, descriptors);
      }
      for(auto const &capability : descriptors[i]->required)
      {
        auto const provider(provider_of(capability, descriptors[i]->name, capabilities, descriptors));
        if(provider == i)
        {
          throw config_error{ fmt::format("{} requires \"{}\", which it provides itself",
                                          descriptors[i]->name,
                                          capability) };
        }
        if(successors[provider].insert(i).second)
        {
          ++in_degree[i];
        }
      }
    }

    std::vector<descriptor_ref> ordered;
    ordered.reserve(count);
    std::vector<bool> placed(count);
    while(ordered.size() < count)
    {
      /* Lowest submission index first keeps the order stable. */
      std::optional<std::size_t> next;
      for(std::size_t i{}; i < count; ++i)
      {
        if(!placed[i] && in_degree[i] == 0)
        {
          next = i;
          break;
        }
      }

      if(!next.has_value())
      {
        std::vector<std::string> stuck;
        for(std::size_t i{}; i < count; ++i)
        {
          if(!placed[i])
          {
            stuck.push_back(descriptors[i]->name);
          }
        }
        throw config_error{ fmt::format("middleware ordering cycle among: {}",
                                        fmt::join(stuck, ", ")) };
      }

      placed[*next] = true;
      ordered.push_back(descriptors[*next]);
      for(auto const successor : successors[*next])
      {
        --in_degree[successor];
      }
    }
    return ordered;
  }

  void handle_unknown_op(message const &msg)
  {
    auto payload(status_response(msg, { "error", "unknown-op", "done" }));
    payload.insert_or_assign("op", msg.op());
    reply(msg, std::move(payload));
  }

  std::vector<std::string> pipeline::names() const
  {
    std::vector<std::string> ret;
    ret.reserve(stack.size());
    for(auto const &d : stack)
    {
      ret.push_back(d->name);
    }
    return ret;
  }

  std::map<std::string, op_doc> pipeline::ops() const
  {
    std::map<std::string, op_doc> ret;
    for(auto const &d : stack)
    {
      for(auto const &[op, doc] : d->handles)
      {
        ret.emplace(op, doc);
      }
    }
    return ret;
  }

  pipeline_ref compose(std::vector<descriptor_ref> const &descriptors)
  {
    auto ret(std::make_shared<pipeline>());
    ret->stack = linearize(descriptors);

    handler entry{ &handle_unknown_op };
    for(auto it(ret->stack.rbegin()); it != ret->stack.rend(); ++it)
    {
      entry = (*it)->wrap(std::move(entry));
    }
    ret->entry = std::move(entry);
    return ret;
  }

  pipeline_ref pipeline_slot::load() const
  {
    return active_.load();
  }

  void pipeline_slot::install(pipeline_ref next)
  {
    util::log::get()->info("installing middleware: {}", fmt::join(next->names(), ", "));
    active_.store(std::move(next));
  }

  pipeline_ref pipeline_slot::replace(std::vector<descriptor_ref> const &descriptors)
  {
    auto next(compose(descriptors));
    install(next);
    return next;
  }

  void pipeline_slot::dispatch(message const &msg) const
  {
    auto const current(active_.load());
    if(!current)
    {
      handle_unknown_op(msg);
      return;
    }
    current->entry(msg);
  }

  void middleware_registry::add(descriptor_ref d)
  {
    auto locked_entries(entries_.wlock());
    auto const name(d->name);
    if(!locked_entries->emplace(name, std::move(d)).second)
    {
      throw config_error{ fmt::format("middleware {} is already registered", name) };
    }
  }

  descriptor_ref middleware_registry::find(std::string const &name) const
  {
    auto const locked_entries(entries_.rlock());
    auto const found(locked_entries->find(name));
    if(found == locked_entries->end())
    {
      return nullptr;
    }
    return found->second;
  }

  std::vector<std::string> middleware_registry::names() const
  {
    auto const locked_entries(entries_.rlock());
    std::vector<std::string> ret;
    ret.reserve(locked_entries->size());
    for(auto const &entry : *locked_entries)
    {
      ret.push_back(entry.first);
    }
    return ret;
  }
}
