#include <fstream>
#include <iostream>
#include <string>

#include "cleaning_engine.hpp"
#include "cleaning_session.hpp"
#include "config_manager.hpp"
#include "dataset_summary.hpp"
#include "exceptions.hpp"
#include "logger.hpp"
#include "pipeline_loader.hpp"

namespace {

struct CommandLine {
  std::string jobPath;
  std::string configPath;
  std::string outputPath;
};

void printUsage(const char *program) {
  std::cerr << "Usage: " << program
            << " <job.json> [--config <config.json>] [--output <result.json>]"
            << std::endl;
}

bool parseArguments(int argc, char *argv[], CommandLine &args) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" || arg == "--output") {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << arg << std::endl;
        return false;
      }
      (arg == "--config" ? args.configPath : args.outputPath) = argv[++i];
    } else if (!arg.empty() && arg.front() == '-') {
      std::cerr << "Unknown option: " << arg << std::endl;
      return false;
    } else if (args.jobPath.empty()) {
      args.jobPath = arg;
    } else {
      std::cerr << "Unexpected argument: " << arg << std::endl;
      return false;
    }
  }
  return !args.jobPath.empty();
}

// 2 for a malformed job, 3 for configuration problems, 1 otherwise
int exitCodeFor(const std::exception &e) {
  if (scrub::isValidationError(e)) {
    return 2;
  }
  if (scrub::isConfigError(e)) {
    return 3;
  }
  return 1;
}

} // namespace

int main(int argc, char *argv[]) {
  CommandLine args;
  if (!parseArguments(argc, argv, args)) {
    printUsage(argv[0]);
    return 1;
  }

  auto &config = scrub::ConfigManager::getInstance();
  auto &logger = scrub::Logger::getInstance();

  try {
    if (!args.configPath.empty() && !config.loadConfig(args.configPath)) {
      throw scrub::ConfigException(scrub::ErrorCode::CONFIGURATION_ERROR,
                                   "Failed to load configuration",
                                   args.configPath);
    }
    logger.configure(config.getLoggingConfig());

    scrub::CleaningJob job = scrub::PipelineLoader::loadFile(args.jobPath);

    scrub::CleaningEngine engine(config.getEngineConfig());
    scrub::CleaningSession session(job.dataset);
    engine.run(session, job.operations);

    auto before = scrub::DatasetSummary::of(session.original());
    auto after = scrub::DatasetSummary::of(session.current());
    nlohmann::json result = scrub::PipelineLoader::resultToJson(
        session.current(), session.changeLog(), before, after);

    if (args.outputPath.empty()) {
      std::cout << result.dump(2) << std::endl;
    } else {
      std::ofstream out(args.outputPath);
      if (!out.is_open()) {
        throw scrub::ScrubException(scrub::ErrorCode::FILE_ERROR,
                                    "Cannot write output file: " +
                                        args.outputPath);
      }
      out << result.dump(2) << std::endl;
      LOG_INFO("Main", "Result written to " + args.outputPath);
    }
  } catch (const scrub::ScrubException &e) {
    LOG_FATAL("Main", e.toLogString());
    logger.shutdown();
    return exitCodeFor(e);
  } catch (const std::exception &e) {
    LOG_FATAL("Main", std::string("Unexpected error: ") + e.what());
    logger.shutdown();
    return 1;
  }

  logger.shutdown();
  return 0;
}
