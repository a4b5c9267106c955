#include "../lib/Logger.h"
#include "../lib/Utilities.h"
#include "Replay.h"

#include <nlohmann/json.hpp>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>

namespace {

void printUsage() {
  std::cout << "Usage: ws-sync -c <config.json> -b <batches.json> [-o <out.json>] [--flush]\n";
  std::cout << "  -c <config.json>   - Chain and wallet configuration (required)\n";
  std::cout << "  -b <batches.json>  - Apply/rollback batches to replay (required)\n";
  std::cout << "  -o <out.json>      - Output file (default: stdout)\n";
  std::cout << "  --flush            - Flush the modifier buffer into the wallet store after each batch\n";
  std::cout << "\n";
  std::cout << "The config.json file should contain:\n";
  std::cout << "  {\n";
  std::cout << "    \"logLevel\": \"INFO\",       // DEBUG, INFO, WARNING, ERROR, CRITICAL\n";
  std::cout << "    \"logFile\": \"sync.log\",    // optional\n";
  std::cout << "    \"systemStart\": 0,          // ms since the Unix epoch\n";
  std::cout << "    \"slotsPerEpoch\": 10,\n";
  std::cout << "    \"slotDuration\": 1000,      // ms\n";
  std::cout << "    \"epochs\": [ { \"epoch\": 0, \"slotDuration\": 1000 } ],\n";
  std::cout << "    \"wallets\": [\n";
  std::cout << "      { \"id\": \"W1\", \"publicKey\": \"pk1\", \"synced\": true,\n";
  std::cout << "        \"addresses\": [ { \"account\": 0, \"index\": 0 } ] }\n";
  std::cout << "    ]\n";
  std::cout << "  }\n";
  std::cout << "\n";
  std::cout << "Note: 'epochs' is optional; without it 'epochCount' (default 1) uniform\n";
  std::cout << "      epochs of 'slotDuration' are used. Synced wallets start at the genesis tip.\n";
}

} // namespace

int main(int argc, char *argv[]) {
  auto logger = ws::logging::getLogger("ws-sync");

  std::string configPath;
  std::string batchesPath;
  std::string outputPath;
  bool isFlushEnabled = false;

  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "-c") == 0) {
      if (i + 1 < argc) {
        configPath = argv[++i];
      } else {
        std::cerr << "Error: -c option requires a config file path.\n";
        printUsage();
        return 1;
      }
    } else if (strcmp(argv[i], "-b") == 0) {
      if (i + 1 < argc) {
        batchesPath = argv[++i];
      } else {
        std::cerr << "Error: -b option requires a batch file path.\n";
        printUsage();
        return 1;
      }
    } else if (strcmp(argv[i], "-o") == 0) {
      if (i + 1 < argc) {
        outputPath = argv[++i];
      } else {
        std::cerr << "Error: -o option requires an output file path.\n";
        printUsage();
        return 1;
      }
    } else if (strcmp(argv[i], "--flush") == 0) {
      isFlushEnabled = true;
    } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
      printUsage();
      return 0;
    } else {
      std::cerr << "Error: Unknown argument: " << argv[i] << "\n";
      printUsage();
      return 1;
    }
  }

  if (configPath.empty() || batchesPath.empty()) {
    std::cerr << "Error: Both -c and -b are required.\n";
    printUsage();
    return 1;
  }

  auto configJson = ws::utl::loadJsonFile(configPath);
  if (!configJson) {
    std::cerr << "Error: Failed to load config file: " << configJson.error().message << "\n";
    return 1;
  }
  auto config = ws::app::Replay::parseConfig(configJson.value());
  if (!config) {
    std::cerr << "Error: " << config.error().message << "\n";
    return 1;
  }

  auto batchesJson = ws::utl::loadJsonFile(batchesPath);
  if (!batchesJson) {
    std::cerr << "Error: Failed to load batch file: " << batchesJson.error().message << "\n";
    return 1;
  }

  try {
    ws::app::Replay replay;
    auto initResult = replay.init(config.value());
    if (!initResult) {
      logger.error << "Failed to initialize: " << initResult.error().message;
      std::cerr << "Error: " << initResult.error().message << "\n";
      return 1;
    }

    auto runResult = replay.runBatches(batchesJson.value(), isFlushEnabled);
    if (!runResult) {
      logger.error << "Replay failed: " << runResult.error().message;
      std::cerr << "Error: " << runResult.error().message << "\n";
      return 1;
    }

    std::string output = replay.toJson().dump(2) + "\n";
    if (outputPath.empty()) {
      std::cout << output;
    } else {
      auto written = ws::utl::writeToFile(outputPath, output);
      if (!written) {
        std::cerr << "Error: " << written.error().message << "\n";
        return 1;
      }
      logger.info << "Wrote result to " << outputPath;
    }
  } catch (const std::exception &e) {
    logger.critical << "Unexpected failure: " << e.what();
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
