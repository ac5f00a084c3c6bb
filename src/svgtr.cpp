// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <svgtr/svgtr.hpp>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#define SVGTR_DEFAULT_CONFIG_FILE_PATH "/etc/svgtr/svgtr.toml"

namespace
{
  constexpr int kExitOk = 0;
  constexpr int kExitUsage = 1;
  constexpr int kExitBatchFailures = 2;

  std::atomic<bool> g_cancelRequested{false};

  struct CliConfig
  {
    std::string command;
    std::vector<std::string> inputs;
    std::optional<std::string> configFile;
    struct
    {
      std::optional<std::string> level;
      std::optional<std::string> file;
      std::optional<std::string> format;
    } log;
    std::vector<std::string> mappingFiles;
    std::optional<bool> caseInsensitive;
    std::optional<bool> overwrite;
    std::optional<std::string> output;
    std::optional<std::string> outputDir;
    std::optional<std::size_t> workers;
  };

  /// \brief Print help message
  void printHelp()
  {
    std::cout
      << "Usage: svgtr [options] <command> <file>...\n"
      << "\n"
      << "Commands:\n"
      << "  prepare <svg>...                 Normalize documents for translation\n"
      << "  extract <svg>                    Print or save the translations of a document\n"
      << "  inject <svg>...                  Merge mapping files into documents\n"
      << "\n"
      << "Options:\n"
      << "  -h, --help                       Show this help message\n"
      << "  -c, --config <file>              Configuration file path\n"
      << "  -l, --log-level <level>          Log level (trace, debug, info, "
         "warning, error, fatal)\n"
      << "  -f, --log-file <file>            Log file path\n"
      << "  -m, --mapping <file>             Mapping file (repeatable, first wins)\n"
      << "  -o, --output <file>              Output file (mapping for extract, "
         "document otherwise)\n"
      << "      --output-dir <dir>           Write documents to this directory\n"
      << "      --overwrite                  Replace existing translations\n"
      << "      --case-sensitive             Match texts case-sensitively\n"
      << "      --workers <n>                Documents processed in parallel "
         "(default: 1)\n";
  }

  std::size_t parseCount(const std::string &value, const char *what)
  {
    try
    {
      long long n = std::stoll(value);
      if (n < 1)
      {
        throw std::out_of_range(value);
      }
      return static_cast<std::size_t>(n);
    }
    catch (const std::exception &)
    {
      throw std::runtime_error(std::string("Invalid ") + what + ": " + value);
    }
  }

  /// \brief Parse command-line arguments into the internal config
  void parseCliArgs(int argc, char **argv, CliConfig &config,
                    std::unique_ptr<svgtr::core::ConfigLoader> &configLoader)
  {
    for (int i = 1; i < argc; ++i)
    {
      std::string arg = argv[i];
      if ((arg == "-c" || arg == "--config") && i + 1 < argc)
      {
        config.configFile = argv[++i];
        configLoader = std::make_unique<svgtr::core::ConfigLoader>(*config.configFile);
      }
      else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc)
      {
        config.log.level = argv[++i];
      }
      else if ((arg == "-f" || arg == "--log-file") && i + 1 < argc)
      {
        config.log.file = argv[++i];
      }
      else if ((arg == "-m" || arg == "--mapping") && i + 1 < argc)
      {
        config.mappingFiles.push_back(argv[++i]);
      }
      else if ((arg == "-o" || arg == "--output") && i + 1 < argc)
      {
        config.output = argv[++i];
      }
      else if (arg == "--output-dir" && i + 1 < argc)
      {
        config.outputDir = argv[++i];
      }
      else if (arg == "--workers" && i + 1 < argc)
      {
        config.workers = parseCount(argv[++i], "worker count");
      }
      else if (arg == "--overwrite")
      {
        config.overwrite = true;
      }
      else if (arg == "--case-sensitive")
      {
        config.caseInsensitive = false;
      }
      else if (arg == "-h" || arg == "--help")
      {
        printHelp();
        std::exit(kExitOk);
      }
      else if (arg.length() > 0 && arg[0] == '-')
      {
        throw std::runtime_error("Unknown option: " + arg);
      }
      else if (config.command.empty())
      {
        config.command = arg;
      }
      else
      {
        config.inputs.push_back(arg);
      }
    }
    if (config.command.empty())
    {
      throw std::runtime_error("No command given");
    }
    if (config.command != "prepare" && config.command != "extract" && config.command != "inject")
    {
      throw std::runtime_error("Unknown command: " + config.command);
    }
    if (config.inputs.empty())
    {
      throw std::runtime_error("No input documents given");
    }
  }

  /// \brief Fill the settings not given on the command line from the TOML
  /// configuration file
  void parseTomlConfig(CliConfig &config, std::unique_ptr<svgtr::core::ConfigLoader> &configLoader)
  {
    if (!configLoader)
    {
      std::error_code ec;
      if (!std::filesystem::exists(SVGTR_DEFAULT_CONFIG_FILE_PATH, ec))
      {
        return;
      }
      configLoader = std::make_unique<svgtr::core::ConfigLoader>(SVGTR_DEFAULT_CONFIG_FILE_PATH);
    }
    if (!config.log.level)
    {
      config.log.level = configLoader->getString("svgtr.log.level");
    }
    if (!config.log.file)
    {
      config.log.file = configLoader->getString("svgtr.log.file");
    }
    if (!config.log.format)
    {
      config.log.format = configLoader->getString("svgtr.log.format");
    }
    if (config.mappingFiles.empty())
    {
      if (auto files = configLoader->getStringArray("svgtr.mapping.files"))
      {
        config.mappingFiles = *files;
      }
    }
    if (!config.caseInsensitive)
    {
      config.caseInsensitive = configLoader->getBool("svgtr.mapping.caseInsensitive");
    }
    if (!config.overwrite)
    {
      config.overwrite = configLoader->getBool("svgtr.inject.overwrite");
    }
    if (!config.outputDir)
    {
      config.outputDir = configLoader->getString("svgtr.batch.outputDir");
    }
    if (!config.workers)
    {
      if (auto workers = configLoader->getInt("svgtr.batch.workers"))
      {
        config.workers = static_cast<std::size_t>(*workers < 1 ? 1 : *workers);
      }
    }
  }

  void initLogging(const CliConfig &config)
  {
    using svgtr::core::Logger;
    Logger::Level level = Logger::Level::Info;
    if (config.log.level)
    {
      auto parsed = Logger::parseLevel(*config.log.level);
      if (!parsed)
      {
        throw std::runtime_error("Invalid log level: " + *config.log.level);
      }
      level = *parsed;
    }
    Logger::init(level, config.log.file.value_or(""));
    if (config.log.format)
    {
      Logger::setLogFormat(*config.log.format);
    }
  }

  svgtr::translate::OutputTarget outputTarget(const CliConfig &config)
  {
    svgtr::translate::OutputTarget target;
    if (config.output)
    {
      target.file = *config.output;
    }
    if (config.outputDir)
    {
      target.directory = *config.outputDir;
    }
    return target;
  }

  int runPrepare(const CliConfig &config)
  {
    if (config.output && config.inputs.size() > 1)
    {
      SVGTR_LOG_WARN("Ignoring --output for " << config.inputs.size() << " documents");
    }
    svgtr::translate::OutputTarget target = outputTarget(config);
    if (config.inputs.size() > 1)
    {
      target.file.clear();
    }
    int failures = 0;
    for (const auto &input : config.inputs)
    {
      if (g_cancelRequested.load())
      {
        break;
      }
      auto outcome = svgtr::translate::prepareFile(input, target);
      if (!outcome.ok())
      {
        SVGTR_LOG_WARN(input << ": " << *outcome.error);
        ++failures;
      }
      else if (outcome.savedTo)
      {
        SVGTR_LOG_INFO(input << ": prepared, saved to " << outcome.savedTo->string());
      }
      else
      {
        SVGTR_LOG_INFO(input << ": already prepared");
      }
    }
    return failures > 0 ? kExitBatchFailures : kExitOk;
  }

  int runExtract(const CliConfig &config)
  {
    if (config.inputs.size() != 1)
    {
      throw std::runtime_error("extract takes exactly one document");
    }
    auto result = svgtr::translate::extractFile(config.inputs.front(),
                                                config.caseInsensitive.value_or(true));
    if (!result)
    {
      return kExitUsage;
    }
    SVGTR_LOG_INFO("Extracted " << result->mapping.translations.size() << " texts from "
                                << result->switchCount << " switches");
    if (config.output)
    {
      if (!svgtr::translate::saveMappingFile(*config.output, result->mapping))
      {
        return kExitUsage;
      }
      return kExitOk;
    }
    svgtr::parsers::SerializeOptions options;
    options.pretty = true;
    std::cout << svgtr::translate::toJson(result->mapping).dump(options) << std::endl;
    return kExitOk;
  }

  int runInject(const CliConfig &config)
  {
    if (config.mappingFiles.empty())
    {
      throw std::runtime_error("inject needs at least one mapping file (-m)");
    }
    std::vector<std::filesystem::path> mappingPaths(config.mappingFiles.begin(),
                                                    config.mappingFiles.end());
    svgtr::translate::MappingBundle bundle = svgtr::translate::loadMappingFiles(mappingPaths);
    if (bundle.empty())
    {
      SVGTR_LOG_ERROR("No translations loaded from the mapping files");
      return kExitUsage;
    }

    svgtr::translate::BatchOptions options;
    if (config.output)
    {
      options.outputFile = *config.output;
    }
    if (config.outputDir)
    {
      options.outputDir = *config.outputDir;
    }
    options.inject.overwrite = config.overwrite.value_or(false);
    options.inject.caseInsensitive = config.caseInsensitive.value_or(true);
    options.workers = config.workers.value_or(1);
    options.cancel = &g_cancelRequested;

    std::vector<std::filesystem::path> files(config.inputs.begin(), config.inputs.end());
    svgtr::translate::BatchResult result = svgtr::translate::runBatch(files, bundle, options);
    return result.hasFailures() ? kExitBatchFailures : kExitOk;
  }
} // namespace

int main(int argc, char **argv)
{
  CliConfig config;
  try
  {
    std::unique_ptr<svgtr::core::ConfigLoader> configLoader;
    parseCliArgs(argc, argv, config, configLoader);
    parseTomlConfig(config, configLoader);
    initLogging(config);
    if (config.configFile)
    {
      SVGTR_LOG_DEBUG("Using config file: " << *config.configFile);
    }
  }
  catch (const std::exception &ex)
  {
    std::cerr << "svgtr: " << ex.what() << "\n\n";
    printHelp();
    return kExitUsage;
  }

  std::signal(SIGINT, [](int) { g_cancelRequested.store(true); });

  int status = kExitOk;
  try
  {
    if (config.command == "prepare")
    {
      status = runPrepare(config);
    }
    else if (config.command == "extract")
    {
      status = runExtract(config);
    }
    else
    {
      status = runInject(config);
    }
  }
  catch (const std::exception &ex)
  {
    SVGTR_LOG_FATAL(ex.what());
    status = kExitUsage;
  }
  svgtr::core::Logger::flush();
  return status;
}
