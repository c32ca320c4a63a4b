// src/main.cpp
#include <cstdlib>
#include <string>
#include <iostream>
#include <filesystem>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "core/EngineConfig.hpp"
#include "core/Librarian.hpp"
#include "core/remote/HttpArchiveRemote.hpp"
#include "services/api/HttpServer.hpp"

// ---------- helpers ----------

static std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

static std::string repositoryRoot() {
  return get_env_or("ALIB_ROOT", "data/library");
}

// ALIB_SCHEMA wins; otherwise schema.sql in CWD (the build copies it there),
// then the source tree.
static std::string findSchemaPath() {
  namespace fs = std::filesystem;
  const std::string fromEnv = get_env_or("ALIB_SCHEMA", "");
  if (!fromEnv.empty()) {
    if (!fs::exists(fromEnv)) throw std::runtime_error("ALIB_SCHEMA points at a missing file: " + fromEnv);
    return fromEnv;
  }
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/ledger/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in CWD and src/core/ledger)");
}

static int envPortOrDefault() {
  const std::string s = get_env_or("ALIB_PORT", "8080");
  if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos || s.size() > 5) {
    spdlog::warn("ALIB_PORT={} is not a port number, using 8080", s);
    return 8080;
  }
  return std::stoi(s);
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init        # create the archive repository (ALIB_ROOT)\n"
            << "  " << argv0 << " --serve       # start HTTP server (ALIB_PORT or 8080)\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    if (get_env_or("ALIB_DEBUG", "") == "1") spdlog::set_level(spdlog::level::debug);

    if (argc > 1 && std::string(argv[1]) == "--init") {
      const std::string root = repositoryRoot();
      alib::Librarian::initRepository(root, findSchemaPath());
      std::cout << "Repository initialized at: " << root << "\n";
      return 0;
    }

    if (argc > 1 && std::string(argv[1]) == "--serve") {
      const std::string root = repositoryRoot();
      const std::string remoteUrl = get_env_or("ALIB_REMOTE_URL", "");
      if (remoteUrl.empty()) throw std::runtime_error("ALIB_REMOTE_URL is not set");

      alib::EngineConfig config;
      config.vault_name = get_env_or("ALIB_VAULT", config.vault_name);

      // Same key guards our API and is forwarded to the vault.
      const std::string apiKey = get_env_or("ALIB_API_KEY", ""); // empty = auth disabled

      alib::HttpArchiveRemote remote(remoteUrl, config.vault_name, apiKey);
      alib::Librarian lib(root, findSchemaPath(), config, remote);

      const int port = envPortOrDefault();
      alib::run_http_server(lib, port, apiKey);
      return 0;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
