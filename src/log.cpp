#include "log.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>
#include <zlib.h>

#include <spdlog/details/os.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

namespace fs = std::filesystem;

constexpr const char *kDefaultLoggerName = "ghtp";
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;

/**
 * Path of the rotated log file with the given index, following the
 * `name.N.ext` convention used by spdlog's rotating sink.
 */
fs::path rotated_path(const std::string &base, std::size_t index) {
  fs::path base_path(base);
  if (index == 0) {
    return base_path;
  }
  fs::path stem = base_path.stem();
  fs::path ext = base_path.extension();
  std::string rotated = stem.string() + "." + std::to_string(index) +
                        ext.string();
  return base_path.parent_path() / rotated;
}

/// Shift existing `.gz` archives up by one slot, dropping the oldest.
void shift_compressed_logs(const std::string &base, std::size_t max_files) {
  std::error_code ec;
  fs::remove(rotated_path(base, max_files).string() + ".gz", ec);
  for (std::size_t i = max_files; i > 1; --i) {
    fs::path from(rotated_path(base, i - 1).string() + ".gz");
    if (!fs::exists(from, ec)) {
      continue;
    }
    fs::path to(rotated_path(base, i).string() + ".gz");
    fs::remove(to, ec);
    fs::rename(from, to, ec);
  }
}

/// Gzip @p path into `path.gz` and remove the original on success.
bool gzip_file(const std::string &path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    return false;
  }
  const std::string target = path + ".gz";
  gzFile gz = gzopen(target.c_str(), "wb");
  if (gz == nullptr) {
    return false;
  }
  char buffer[16 * 1024];
  bool ok = true;
  while (input && ok) {
    input.read(buffer, sizeof(buffer));
    std::streamsize n = input.gcount();
    if (n > 0 && gzwrite(gz, buffer, static_cast<unsigned>(n)) != n) {
      ok = false;
    }
  }
  gzclose(gz);
  input.close();
  std::error_code ec;
  if (!ok) {
    fs::remove(target, ec);
    return false;
  }
  fs::remove(path, ec);
  return true;
}

std::vector<spdlog::sink_ptr> make_sinks(const std::string &file,
                                         std::size_t rotate_files,
                                         bool compress_rotations) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (file.empty()) {
    return sinks;
  }
  if (rotate_files == 0) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, true));
    return sinks;
  }
  spdlog::file_event_handlers handlers;
  if (compress_rotations) {
    handlers.before_open = [rotate_files](const spdlog::filename_t &filename) {
      const auto base = spdlog::details::os::filename_to_str(filename);
      shift_compressed_logs(base, rotate_files);
      fs::path newest = rotated_path(base, 1);
      std::error_code ec;
      if (fs::exists(newest, ec)) {
        gzip_file(newest.string());
      }
    };
  }
  sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      file, kMaxLogFileSize, rotate_files, false, handlers));
  return sinks;
}

bool is_project_logger(const std::string &name) {
  return name == kDefaultLoggerName ||
         name.rfind(std::string(kDefaultLoggerName) + ".", 0) == 0;
}

} // namespace

namespace ghtp {

void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files,
                 bool compress_rotations) {
  auto sinks = make_sinks(file, rotate_files, compress_rotations);
  auto logger = std::make_shared<spdlog::logger>(kDefaultLoggerName,
                                                 sinks.begin(), sinks.end());
  logger->set_level(level);
  spdlog::drop(kDefaultLoggerName);
  spdlog::set_default_logger(logger);
  // Category loggers created before initialization follow the new sinks.
  spdlog::apply_all([&](const std::shared_ptr<spdlog::logger> &l) {
    if (l.get() != logger.get() && is_project_logger(l->name())) {
      l->sinks() = sinks;
      l->set_level(level);
    }
  });
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->debug("Logger initialised (level={}, file='{}', rotate={}, "
                "compress={})",
                spdlog::level::to_string_view(level), file, rotate_files,
                compress_rotations);
}

void ensure_default_logger() {
  auto logger = spdlog::default_logger();
  if (!logger || logger->name() != kDefaultLoggerName) {
    init_logger(spdlog::level::info);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  const std::string name = std::string(kDefaultLoggerName) + "." + category;
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  ensure_default_logger();
  auto base = spdlog::default_logger();
  auto logger = std::make_shared<spdlog::logger>(name, base->sinks().begin(),
                                                 base->sinks().end());
  logger->set_level(base->level());
  spdlog::register_logger(logger);
  return logger;
}

} // namespace ghtp
