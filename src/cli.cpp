#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "helios/config.hpp"
#include "helios/hash.hpp"
#include "helios/jsonlite.hpp"
#include "helios/observability.hpp"
#include "helios/service.hpp"
#include "helios/version.hpp"
#include "helios/worker.hpp"

namespace {

std::string read_file(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

std::string read_stdin() {
  std::ostringstream oss;
  oss << std::cin.rdbuf();
  return oss.str();
}

std::string arg_value(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string(argv[i]) == flag) return argv[i + 1];
  }
  return "";
}

void usage() {
  std::cerr << "usage: helios <command> [options]\n"
               "  serve [--config <file>]                 NDJSON requests on stdin\n"
               "  call <op> [--body <file>|-] [--config <file>]\n"
               "  config show|validate [--config <file>]\n"
               "  health\n"
               "  version\n";
}

// defaults -> policy file ($HELIOS_CONFIG or --config) -> HELIOS_* env.
bool build_config(int argc, char** argv, helios::HeliosConfig& cfg, std::string& err) {
  cfg = helios::default_config();
  std::string path = arg_value(argc, argv, "--config");
  if (path.empty()) {
    if (const char* env = std::getenv("HELIOS_CONFIG")) path = env;
  }
  if (!path.empty() && !helios::load_config(path, cfg, &err)) return false;
  helios::apply_env_overrides(cfg);
  helios::set_log_level(helios::parse_log_level(cfg.log_level));
  return true;
}

int start_service(int argc, char** argv, std::unique_ptr<helios::HeliosService>& out) {
  helios::HeliosConfig cfg;
  std::string err;
  if (!build_config(argc, argv, cfg, err)) {
    std::cerr << "{\"error\":\"config_invalid\",\"message\":" << helios::jsonlite::to_json(helios::jsonlite::Value{err})
              << "}\n";
    return 2;
  }
  const auto validation = helios::validate_config(cfg);
  if (!validation.ok) {
    std::cerr << helios::config_validation_to_json(validation) << "\n";
    return 2;
  }
  for (const auto& w : validation.warnings) helios::log_warn("cli", w);
  helios::init_worker_identity();
  out = std::make_unique<helios::HeliosService>(std::move(cfg));
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  std::string cmd;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]).rfind("--", 0) == 0) continue;
    cmd = argv[i];
    break;
  }
  if (cmd.empty()) {
    usage();
    return 1;
  }

  if (cmd == "version") {
    std::cout << helios::version::manifest_to_json(helios::version::current_manifest()) << "\n";
    return 0;
  }

  if (cmd == "health") {
    const auto h = helios::hash_runtime_info();
    std::cout << "{\"hash_primitive\":\"" << h.primitive << "\",\"hash_version\":\"" << h.version
              << "\",\"hash_available\":" << (h.blake3_available ? "true" : "false");
    std::cout << ",\"store_backends\":[\"memory\",\"file\"]";
    std::cout << ",\"compression_capabilities\":[\"identity\"";
#if defined(HELIOS_WITH_ZSTD)
    std::cout << ",\"zstd\"";
#endif
    std::cout << "]";
    std::cout << "}" << "\n";
    return h.blake3_available ? 0 : 2;
  }

  if (cmd == "config") {
    const std::string sub = argc >= 3 ? argv[2] : "";
    helios::HeliosConfig cfg;
    std::string err;
    if (!build_config(argc, argv, cfg, err)) {
      std::cerr << "{\"error\":\"config_invalid\",\"message\":"
                << helios::jsonlite::to_json(helios::jsonlite::Value{err}) << "}\n";
      return 2;
    }
    if (sub == "show") {
      std::cout << helios::config_to_json(cfg) << "\n";
      return 0;
    }
    if (sub == "validate") {
      const auto r = helios::validate_config(cfg);
      std::cout << helios::config_validation_to_json(r) << "\n";
      return r.ok ? 0 : 2;
    }
    usage();
    return 1;
  }

  if (cmd == "call") {
    if (argc < 3) {
      usage();
      return 1;
    }
    const std::string op = argv[2];
    const std::string body_arg = arg_value(argc, argv, "--body");
    const std::string body = body_arg.empty() ? "" : (body_arg == "-" ? read_stdin() : read_file(body_arg));

    std::unique_ptr<helios::HeliosService> service;
    if (int rc = start_service(argc, argv, service); rc != 0) return rc;
    const std::string resp = service->handle(op, body);
    std::cout << resp << "\n";
    std::optional<helios::jsonlite::JsonError> perr;
    const auto obj = helios::jsonlite::parse(resp, &perr);
    return !perr && helios::jsonlite::get_bool(obj, "ok", false) ? 0 : 2;
  }

  if (cmd == "serve") {
    std::unique_ptr<helios::HeliosService> service;
    if (int rc = start_service(argc, argv, service); rc != 0) return rc;
    helios::log_info("cli", "serving NDJSON on stdin/stdout, worker " + helios::global_worker_identity().worker_id);
    helios::LineServer server(*service, [](const std::string& resp) { std::cout << resp << "\n" << std::flush; });
    std::string line;
    while (std::getline(std::cin, line)) {
      if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
      server.submit(line);
    }
    server.drain();
    return 0;
  }

  usage();
  return 1;
}
