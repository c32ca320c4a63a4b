#pragma once
#include <string>

namespace httplib { class Server; }

namespace alib {
  class Librarian;

  // Registers the JSON endpoints on svr.
  // apiKey: if empty, auth is disabled (local use).
  void install_routes(httplib::Server& svr, Librarian& lib, const std::string& apiKey);

  // Start a blocking HTTP server exposing the librarian.
  void run_http_server(Librarian& lib, int port, const std::string& apiKey);
}
