#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>

namespace space {

enum class Verbosity { Silent, Normal, Verbose, Debug };

struct LogOptions {
  Verbosity verbosity{Verbosity::Normal};
  std::optional<std::filesystem::path> log_file;
  std::size_t rotate_max_bytes{5 * 1024 * 1024};
  std::size_t rotate_files{3};
};

// Installs the default logger: colored stderr, plus a rotating file when
// log_file is set. Safe to call again (e.g. after options are parsed).
void setup_logging(const LogOptions &opts);

} // namespace space
