#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <folly/Synchronized.h>

#include <braid/nrepl_server/message.hpp>

namespace braid::nrepl_server
{
  using handler = std::function<void(message const &)>;
  /* Wraps the next handler in the pipeline. */
  using middleware_fn = std::function<handler(handler next)>;

  struct op_doc
  {
    std::string doc;
    std::map<std::string, std::string> required;
    std::map<std::string, std::string> optional;
    std::map<std::string, std::string> returns;
  };

  /* A middleware and what it declares about itself. Capabilities are the names of
   * the ops a descriptor handles plus the descriptor's own name. */
  struct descriptor
  {
    std::string name;
    middleware_fn wrap;
    /* Capabilities that must be provided by a middleware ordered before this one. */
    std::set<std::string> required;
    /* Capabilities that must be present somewhere in the pipeline. */
    std::set<std::string> expected;
    std::map<std::string, op_doc> handles;
  };

  using descriptor_ref = std::shared_ptr<descriptor const>;

  /* A middleware set that cannot be composed. */
  class config_error : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  /* Orders `descriptors` so every middleware follows the providers of what it
   * requires. Ties keep submission order. Throws `config_error` for duplicate
   * names, missing or ambiguous capabilities and cycles. */
  std::vector<descriptor_ref> linearize(std::vector<descriptor_ref> const &descriptors);

  /* Replies `{status [error unknown-op done] op}`. */
  void handle_unknown_op(message const &msg);

  struct pipeline
  {
    /* Outermost first. */
    std::vector<descriptor_ref> stack;
    handler entry;

    std::vector<std::string> names() const;
    std::map<std::string, op_doc> ops() const;
  };

  using pipeline_ref = std::shared_ptr<pipeline const>;

  pipeline_ref compose(std::vector<descriptor_ref> const &descriptors);

  /* The active pipeline. Each dispatch runs entirely against the pipeline it
   * loaded; installs replace the whole pipeline in one store. */
  class pipeline_slot
  {
  public:
    pipeline_ref load() const;
    void install(pipeline_ref next);
    /* Composes and installs. On `config_error` the active pipeline is untouched. */
    pipeline_ref replace(std::vector<descriptor_ref> const &descriptors);

    void dispatch(message const &msg) const;

  private:
    std::atomic<pipeline_ref> active_;
  };

  /* Middleware known by name, for the dynamic loader and the CLI. */
  class middleware_registry
  {
  public:
    /* Throws `config_error` when the name is taken. */
    void add(descriptor_ref d);
    descriptor_ref find(std::string const &name) const;
    std::vector<std::string> names() const;

  private:
    folly::Synchronized<std::map<std::string, descriptor_ref>> entries_;
  };
}
