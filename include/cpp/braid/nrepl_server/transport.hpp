#pragma once

#include <braid/nrepl_server/bencode.hpp>

namespace braid::nrepl_server
{
  using response = bencode::value::dict;

  /* The sending half of a client connection. Responses sent by a single caller
   * arrive in the order they were sent. Safe to call from any thread. */
  struct transport
  {
    virtual ~transport() = default;

    virtual void send(response payload) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
  };
}
