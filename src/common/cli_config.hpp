#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

namespace rkv {

// ── CliConfig ─────────────────────────────────────────────────────────────────
// Configuration of one rkv-cli session.
// Populated by parse_config() from CLI arguments.

struct CliConfig {
    std::string data_dir;      // RocksDB directory (rocksdb engine only)
    std::string engine;        // Storage engine: "memory" (default) or "rocksdb"
    std::string schema_path;   // JSON DatabaseConfig file; empty → built from --name/--version
    std::string name;          // Database name when no schema file is given
    uint32_t    version;       // Schema version when no schema file is given
    std::string log_level;     // spdlog level string
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a CliConfig.
//
// On success: returns a fully validated CliConfig.
// On error  : throws std::runtime_error with a human-readable message
//             (--help throws with the help text).
//
// Validates:
//   - engine is "memory" or "rocksdb"
//   - data_dir is non-empty for the rocksdb engine
//   - version > 0
//   - name is non-empty

[[nodiscard]] CliConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with rkv-cli options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace rkv
