#pragma once

#include <iosfwd>

#include "rpc/jsonrpc.h"

namespace scriptbox {

/**
 * Line-delimited JSON-RPC over a pair of streams (stdin/stdout in the CLI).
 * Blank lines are skipped; returns when the input reaches EOF.
 */
class StdioServer {
 public:
  StdioServer(const JsonRpcDispatcher& dispatcher, std::istream& in, std::ostream& out);

  // Serve until EOF. Returns the number of messages handled.
  size_t Serve();

 private:
  const JsonRpcDispatcher& dispatcher_;
  std::istream& in_;
  std::ostream& out_;
};

}  // namespace scriptbox
