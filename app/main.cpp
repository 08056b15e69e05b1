#include "../lib/Logger.h"
#include "../lib/Utilities.h"
#include "../runtime/Builder.h"
#include "../runtime/CounterState.h"
#include "../runtime/Executor.h"
#include "../runtime/MemoryStore.h"
#include "../runtime/RuntimeConfig.h"
#include "../runtime/Sealer.h"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

namespace {
std::atomic<bool> g_stopSealing{false};

void signalHandler(int signal) {
  if (signal == SIGINT) {
    g_stopSealing = true;
  }
}

struct RunOptions {
  uint64_t blocks{1};
  std::vector<std::string> adds;
  bool sealStats{false};
};

// Produce blocks on one store, replay them on another, compare the counters
int runChain(const tally::RuntimeConfig &config, const RunOptions &options) {
  auto logger = tally::logging::getLogger("tally");

  std::vector<tally::Operation> operations;
  for (const auto &add : options.adds) {
    tally::uint128 magnitude = 0;
    if (!tally::utl::parseUInt128(add, magnitude)) {
      logger.error << "Invalid --add value: " << add;
      return 1;
    }
    operations.push_back(tally::Operation::add(magnitude));
  }

  tally::Builder builder;
  tally::Sealer sealer(config);
  if (options.sealStats) {
    sealer.setLogLevel(tally::logging::Level::INFO);
  }
  tally::Executor executor(config);
  tally::MemoryStore producerStore;
  tally::MemoryStore verifierStore;

  tally::Block parent = tally::Block::genesis();
  auto rootResult = executor.validateRoot(parent);
  if (!rootResult) {
    logger.error << "Genesis rejected: " << rootResult.error().message;
    return 1;
  }

  nlohmann::json chain = nlohmann::json::array();
  chain.push_back(parent.toJson());

  for (uint64_t i = 0; i < options.blocks; ++i) {
    tally::UnsealedBlock building = builder.begin(parent);
    for (const auto &op : operations) {
      auto applyResult = builder.applyOperation(building, op, producerStore);
      if (!applyResult) {
        logger.error << "Block " << (i + 1) << ": " << applyResult.error().message;
        return 1;
      }
    }
    auto finalizeResult = builder.finalize(building, producerStore);
    if (!finalizeResult) {
      logger.error << "Block " << (i + 1) << ": " << finalizeResult.error().message;
      return 1;
    }

    auto sealResult = sealer.seal(std::move(building), &g_stopSealing);
    if (!sealResult) {
      logger.error << "Block " << (i + 1) << ": " << sealResult.error().message;
      return 1;
    }
    const tally::Block &block = sealResult.value();

    // The verifier only sees the wire form
    auto decoded = tally::Block::decode(block.encode());
    if (!decoded) {
      logger.error << "Block " << (i + 1) << ": " << decoded.error().message;
      return 1;
    }
    auto execResult = executor.executeBlock(decoded.value(), verifierStore);
    if (!execResult) {
      logger.error << "Block " << (i + 1) << ": " << execResult.error().message;
      return 1;
    }

    chain.push_back(block.toJson());
    parent = block;
  }

  auto produced = tally::CounterState(producerStore).load();
  auto replayed = tally::CounterState(verifierStore).load();
  if (!produced || !replayed) {
    logger.error << "Failed to read final counters";
    return 1;
  }

  nlohmann::json out;
  out["config"] = config.toJson();
  out["blocks"] = chain;
  out["producerCounter"] = tally::utl::toString(produced.value());
  out["verifierCounter"] = tally::utl::toString(replayed.value());
  std::cout << out.dump(2) << std::endl;

  if (produced.value() != replayed.value()) {
    logger.error << "Producer and verifier disagree on the counter";
    return 2;
  }
  return 0;
}

// Decode a hex wire-form block and report whether it meets the difficulty
int inspectBlock(const tally::RuntimeConfig &config, const std::string &hex) {
  auto logger = tally::logging::getLogger("tally");

  auto bytes = tally::utl::hexDecode(hex);
  if (!bytes) {
    logger.error << "Invalid hex: " << bytes.error().message;
    return 1;
  }
  auto block = tally::Block::decode(bytes.value());
  if (!block) {
    logger.error << block.error().message;
    return 1;
  }

  tally::Executor executor(config);
  nlohmann::json out = block->toJson();
  out["isRoot"] = block->isRoot();
  out["meetsDifficulty"] = executor.meetsDifficulty(block.value());
  std::cout << out.dump(2) << std::endl;
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"tally - proof-of-work counter runtime"};
  app.require_subcommand(1);

  bool debugMode = false;
  app.add_flag("--debug", debugMode, "Enable debug logging (default: warning level)");

  std::string logLevel;
  app.add_option("--log-level", logLevel,
                 "One of debug, info, warning, error, critical (overrides --debug)");

  std::string logFile;
  app.add_option("--log-file", logFile, "Also write log records to this file");

  std::string configPath;
  app.add_option("-c,--config", configPath, "Runtime config JSON file");

  uint32_t difficulty = 0;
  auto *difficultyOpt = app.add_option("--difficulty", difficulty,
                                       "Required leading zero bytes (overrides config)")
                            ->check(CLI::Range(0u, tally::RuntimeConfig::MAX_DIFFICULTY));

  uint64_t maxAttempts = 0;
  auto *maxAttemptsOpt = app.add_option("--max-attempts", maxAttempts,
                                        "Give up sealing after this many nonces (0 = never)");

  RunOptions runOptions;
  auto *runCmd = app.add_subcommand("run", "Build, seal and replay a chain of blocks");
  runCmd->add_option("-n,--blocks", runOptions.blocks, "Number of blocks to produce")
      ->capture_default_str();
  runCmd->add_option("-a,--add", runOptions.adds,
                     "Add operation magnitude, repeatable (applied in order in every block)");
  runCmd->add_flag("--seal-stats", runOptions.sealStats,
                   "Log nonce search time and attempts for each block");

  auto *genesisCmd = app.add_subcommand("genesis", "Print the genesis block");

  std::string blockHex;
  auto *inspectCmd = app.add_subcommand("inspect", "Decode a hex-encoded block");
  inspectCmd->add_option("block", blockHex, "Block wire form as hex")->required();

  app.footer("Example:\n"
             "  tally run -n 3 -a 3 -a 5 --difficulty 2\n");

  CLI11_PARSE(app, argc, argv);

  auto rootLogger = tally::logging::getRootLogger();
  tally::logging::Level level =
      debugMode ? tally::logging::Level::DEBUG : tally::logging::Level::WARNING;
  if (!logLevel.empty() && !tally::logging::parseLevel(logLevel, level)) {
    std::cerr << "Error: unknown log level: " << logLevel << "\n";
    return 1;
  }
  rootLogger.setLevel(level);
  if (!logFile.empty()) {
    try {
      rootLogger.addFileHandler(logFile);
    } catch (const std::runtime_error &e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 1;
    }
  }

  tally::RuntimeConfig config;
  if (!configPath.empty()) {
    auto loaded = tally::RuntimeConfig::loadFile(configPath);
    if (!loaded) {
      rootLogger.error << "Config: " << loaded.error().message;
      return 1;
    }
    config = loaded.value();
  }
  if (difficultyOpt->count() > 0) {
    config.difficulty = difficulty;
  }
  if (maxAttemptsOpt->count() > 0) {
    config.maxSealAttempts = maxAttempts;
  }
  auto valid = config.validate();
  if (!valid) {
    rootLogger.error << "Config: " << valid.error().message;
    return 1;
  }
  rootLogger.info << "Using " << config;

  std::signal(SIGINT, signalHandler);

  if (genesisCmd->parsed()) {
    tally::Block genesis = tally::Block::genesis();
    nlohmann::json out = genesis.toJson();
    out["wire"] = tally::utl::hexEncode(genesis.encode());
    std::cout << out.dump(2) << std::endl;
    return 0;
  }
  if (inspectCmd->parsed()) {
    return inspectBlock(config, blockHex);
  }
  if (runCmd->parsed()) {
    return runChain(config, runOptions);
  }
  return 1;
}
