#include <space/logging.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <vector>

namespace space {

static constexpr const char *kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

static spdlog::level::level_enum level_for(Verbosity v) {
  switch (v) {
  case Verbosity::Silent:
    return spdlog::level::err;
  case Verbosity::Verbose:
    return spdlog::level::debug;
  case Verbosity::Debug:
    return spdlog::level::trace;
  case Verbosity::Normal:
    break;
  }
  return spdlog::level::info;
}

void setup_logging(const LogOptions &opts) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  std::string file_error;
  if (opts.log_file) {
    std::error_code ec;
    if (opts.log_file->has_parent_path())
      std::filesystem::create_directories(opts.log_file->parent_path(), ec);
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          opts.log_file->string(), opts.rotate_max_bytes, opts.rotate_files));
    } catch (const spdlog::spdlog_ex &e) {
      file_error = e.what();
    }
  }

  auto logger =
      std::make_shared<spdlog::logger>("space", sinks.begin(), sinks.end());
  logger->set_pattern(kPattern);
  logger->set_level(level_for(opts.verbosity));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);

  if (!file_error.empty())
    spdlog::warn("[log] cannot open log file {}, logging to stderr only: {}",
                 opts.log_file->string(), file_error);
}

} // namespace space
