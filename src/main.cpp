#include "cli/StegoCli.hpp"
#include "config/StegoConfig.hpp"
#include "stego/StegoEngine.hpp"
#include "video/FrameStore.hpp"

#include <iostream>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <string>

using namespace stegomotion;

namespace {
void printUsage(const char *program) {
  std::cerr << "Usage: " << program
            << " <video_file> [--config <file.json>]\n";
}
} // namespace

int main(int argc, char *argv[]) {
  std::string videoPath;
  std::string configPath;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      configPath = argv[++i];
    } else if (videoPath.empty() && arg.rfind("--", 0) != 0) {
      videoPath = arg;
    } else {
      printUsage(argv[0]);
      return 1;
    }
  }
  if (videoPath.empty()) {
    printUsage(argv[0]);
    return 1;
  }

  AppConfig config;
  if (!configPath.empty()) {
    auto loaded = loadConfig(configPath);
    if (!loaded) {
      std::cerr << "Error: " << errorToString(loaded.error()) << ": "
                << configPath << '\n';
      return 1;
    }
    config = *loaded;
  }

  // Set up the default file logger
  try {
    auto fileLogger = spdlog::basic_logger_mt("file_logger", config.logging.file);
    spdlog::set_default_logger(fileLogger);
    spdlog::set_level(spdlog::level::from_str(config.logging.level));
  } catch (const spdlog::spdlog_ex &e) {
    std::cerr << "Error: cannot open log file " << config.logging.file << ": "
              << e.what() << '\n';
    return 1;
  }
  spdlog::info("StegoMotion started on {}", videoPath);

  auto engine = StegoEngine::create(config.engine);
  if (!engine) {
    std::cerr << "Error: " << errorToString(engine.error()) << '\n';
    return 1;
  }

  VideoFileStore store(config.video.fourcc);
  StegoCli cli(config, *engine, store, std::cin, std::cout);
  const int status = cli.run(videoPath);

  spdlog::info("StegoMotion finished with status {}", status);
  return status;
}
