#include "rpc/stdio_server.h"

#include <istream>
#include <ostream>
#include <string>

namespace scriptbox {

StdioServer::StdioServer(const JsonRpcDispatcher& dispatcher, std::istream& in,
                         std::ostream& out)
    : dispatcher_(dispatcher), in_(in), out_(out) {}

size_t StdioServer::Serve() {
  size_t handled = 0;
  std::string line;
  while (std::getline(in_, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t") == std::string::npos) continue;

    ++handled;
    auto response = dispatcher_.HandleLine(line);
    if (response) {
      out_ << response->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
           << '\n';
      out_.flush();
    }
  }
  return handled;
}

}  // namespace scriptbox
