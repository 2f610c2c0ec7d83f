#include "app.hpp"
#include "log.hpp"

#include <exception>
#include <memory>
#include <spdlog/spdlog.h>

namespace {
std::shared_ptr<spdlog::logger> main_log() {
  static auto logger = [] {
    ghtp::ensure_default_logger();
    return ghtp::category_logger("main");
  }();
  return logger;
}
} // namespace

/**
 * Program entry point.
 *
 * @param argc Number of CLI arguments received from the OS.
 * @param argv Null-terminated array containing the raw CLI arguments.
 * @return Process exit code forwarded from the application.
 */
int main(int argc, char **argv) {
  int ret = 1;
  try {
    ghtp::App app;
    ret = app.run(argc, argv);
  } catch (const std::exception &e) {
    main_log()->critical("Unhandled error: {}", e.what());
    ret = 1;
  }
  spdlog::shutdown();
  return ret;
}
