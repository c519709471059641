#include "common/cli_config.hpp"
#include "common/logger.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

#include <fmt/format.h>

namespace po = boost::program_options;

namespace rkv {

namespace {

// Validate the fully populated CliConfig.
void validate(const CliConfig& cfg) {
    if (cfg.engine != "memory" && cfg.engine != "rocksdb") {
        throw std::runtime_error(
            fmt::format("--engine must be 'memory' or 'rocksdb', got '{}'", cfg.engine));
    }
    if (cfg.engine == "rocksdb" && cfg.data_dir.empty()) {
        throw std::runtime_error("--data-dir must not be empty");
    }
    if (cfg.version == 0) {
        throw std::runtime_error("--version must be > 0");
    }
    if (cfg.name.empty()) {
        throw std::runtime_error("--name must not be empty");
    }
    if (!parse_log_level(cfg.log_level)) {
        throw std::runtime_error(fmt::format(
            "--log-level must be one of trace|debug|info|warn|error|critical|off, got '{}'",
            cfg.log_level));
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("data-dir",
            po::value<std::string>()->default_value("./data"),
            "Directory for the RocksDB database files")
        ("engine",
            po::value<std::string>()->default_value("memory"),
            "Storage engine: memory (default) or rocksdb")
        ("schema",
            po::value<std::string>()->default_value(""),
            "JSON database config: {name, version, stores: [...]}")
        ("name",
            po::value<std::string>()->default_value("idb"),
            "Database name (ignored when --schema is given)")
        ("version",
            po::value<uint32_t>()->default_value(1),
            "Schema version (ignored when --schema is given)")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical|off");
}

// ── parse_config ──────────────────────────────────────────────────────────────

CliConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("rkv-cli options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(
            po::parse_command_line(argc, argv, desc),
            vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    CliConfig cfg;
    cfg.data_dir    = vm["data-dir"].as<std::string>();
    cfg.engine      = vm["engine"].as<std::string>();
    cfg.schema_path = vm["schema"].as<std::string>();
    cfg.name        = vm["name"].as<std::string>();
    cfg.version     = vm["version"].as<uint32_t>();
    cfg.log_level   = vm["log-level"].as<std::string>();

    validate(cfg);
    return cfg;
}

} // namespace rkv
