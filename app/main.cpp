#include "../consensus/Simulator.h"
#include "../ledger/BlockChain.h"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"

#include <CLI/CLI.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

const char *VERSION = "0.1.0";

std::atomic<bool> g_stop{ false };

void signalHandler(int signal) {
  if (signal == SIGINT) {
    g_stop = true;
  }
}

struct RunOptions {
  std::string configFile;
  uint64_t validatorCount{ 0 };
  double baseStake{ 0 };
  uint64_t rounds{ 5 };
  uint64_t delayMs{ 2000 };
  uint64_t seed{ 0 };
  bool remote{ false };
  std::string url;
  std::string exportFile;
};

void printChainSummary(const pos::BlockChain &chain) {
  std::cout << "\n--- Blockchain State ---\n";
  for (const auto &block : chain.getBlocks()) {
    std::cout << "  -> " << block << "  ["
              << pos::utl::formatTimestamp(block.getTimestamp()) << "]\n";
  }
  std::cout << "------------------------\n" << std::endl;
}

int exportChain(const pos::BlockChain &chain, const std::string &path,
                pos::logging::Logger &logger) {
  nlohmann::json blocks = nlohmann::json::array();
  for (const auto &block : chain.getBlocks()) {
    blocks.push_back(block.toJson());
  }
  nlohmann::json jd;
  jd["version"] = VERSION;
  jd["blocks"] = blocks;

  auto written = pos::utl::writeToNewFile(path, jd.dump(2) + "\n");
  if (!written) {
    logger.error << "Failed to export chain: " << written.error().message;
    return 1;
  }
  logger.info << "Exported " << chain.getSize() << " blocks to " << path;
  return 0;
}

int runSimulation(const RunOptions &options, CLI::App &cmd) {
  auto logger = pos::logging::getLogger("pos");

  pos::consensus::Simulator::Config config;
  if (!options.configFile.empty()) {
    auto jd = pos::utl::loadJsonFile(options.configFile);
    if (!jd) {
      logger.error << "Failed to load config: " << jd.error().message;
      return 1;
    }
    auto parsed = config.ltsFromJson(jd.value());
    if (!parsed) {
      logger.error << parsed.error().message;
      return 1;
    }
  }

  // Command line values override the file
  bool overridesStakes =
      cmd.count("--validators") > 0 || cmd.count("--stake") > 0;
  if (overridesStakes && !config.stakes.empty()) {
    logger.warning << "Ignoring the " << config.stakes.size()
                   << " explicit stakes from " << options.configFile
                   << ": --validators/--stake select generated stakes";
  }
  if (cmd.count("--validators") > 0) {
    config.setValidatorCount(options.validatorCount);
  }
  if (cmd.count("--stake") > 0) {
    config.setBaseStake(options.baseStake);
  }
  if (cmd.count("--seed") > 0) {
    config.seed = options.seed;
  }
  if (options.remote) {
    config.feed.enabled = true;
  }
  if (!options.url.empty()) {
    config.feed.enabled = true;
    config.feed.baseUrl = options.url;
  }

  std::cout << config;

  pos::consensus::Simulator simulator("pos.Sim");
  auto initialized = simulator.init(config);
  if (!initialized) {
    logger.error << "Failed to initialize simulator: "
                 << initialized.error().message;
    return 1;
  }

  std::signal(SIGINT, signalHandler);

  uint64_t committed = 0;
  for (uint64_t i = 0; i < options.rounds && !g_stop; ++i) {
    if (options.delayMs > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(options.delayMs));
    }
    if (g_stop) {
      break;
    }

    auto round = simulator.runRound();
    if (!round) {
      logger.critical << "Simulation aborted: " << round.error().message;
      return 2;
    }
    if (round.value().isCommitted()) {
      ++committed;
    }
    logger.debug << round.value();
    printChainSummary(simulator.getChain());
  }

  logger.info << "Simulation finished. " << committed << " blocks committed.";
  printChainSummary(simulator.getChain());

  if (!options.exportFile.empty()) {
    return exportChain(simulator.getChain(), options.exportFile, logger);
  }
  return 0;
}

int verifyChain(const std::string &path) {
  auto logger = pos::logging::getLogger("pos");

  auto jd = pos::utl::loadJsonFile(path);
  if (!jd) {
    logger.error << "Failed to load chain: " << jd.error().message;
    return 1;
  }
  if (!jd.value().is_object() || !jd.value().contains("blocks") ||
      !jd.value()["blocks"].is_array()) {
    logger.error << "Chain file has no 'blocks' array: " << path;
    return 1;
  }

  std::vector<pos::Block> blocks;
  for (const auto &jb : jd.value()["blocks"]) {
    auto block = pos::Block::ltsFromJson(jb);
    if (!block) {
      logger.error << "Malformed block #" << blocks.size() << ": "
                   << block.error().message;
      return 1;
    }
    blocks.push_back(block.value());
  }

  auto checked = pos::BlockChain::checkSequence(blocks);
  if (!checked) {
    std::cout << "INVALID: " << checked.error().message << std::endl;
    return 1;
  }
  std::cout << "OK: " << blocks.size() << " blocks verified" << std::endl;
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{ "pos-sim - Proof-of-Stake consensus simulator" };
  app.set_version_flag("-V,--version", VERSION);
  app.require_subcommand(1);
  app.fallthrough(); // global flags are accepted after the subcommand too

  bool debugMode = false;
  app.add_flag("--debug", debugMode, "Enable debug logging (default: info level)");

  std::string logFile;
  app.add_option("--log-file", logFile, "Also write the log to this file");

  RunOptions options;
  auto *runCmd = app.add_subcommand("run", "Run consensus rounds");
  runCmd->add_option("-c,--config", options.configFile, "JSON configuration file")
      ->check(CLI::ExistingFile);
  runCmd->add_option("-n,--validators", options.validatorCount,
                     "Number of validators (default: 10)")
      ->check(CLI::PositiveNumber);
  runCmd->add_option("-s,--stake", options.baseStake,
                     "Base stake per validator (default: 1000)")
      ->check(CLI::PositiveNumber);
  runCmd->add_option("-r,--rounds", options.rounds, "Number of rounds")
      ->capture_default_str();
  runCmd->add_option("--delay-ms", options.delayMs, "Delay before each round")
      ->capture_default_str();
  runCmd->add_option("--seed", options.seed, "Seed for reproducible runs");
  runCmd->add_flag("--remote", options.remote,
                   "Pull transactions from the default remote feed");
  runCmd->add_option("--url", options.url, "Remote feed base URL (implies --remote)");
  runCmd->add_option("--export", options.exportFile,
                     "Write the final chain as JSON (file must not exist)");

  std::string verifyFile;
  auto *verifyCmd = app.add_subcommand("verify", "Verify an exported chain");
  verifyCmd->add_option("-f,--file", verifyFile, "Exported chain file")
      ->required()
      ->check(CLI::ExistingFile);

  app.footer("Examples:\n"
             "  pos-sim run -n 10 -s 1000 -r 5\n"
             "  pos-sim run --seed 42 --delay-ms 0 --export chain.json\n"
             "  pos-sim verify -f chain.json\n");

  CLI11_PARSE(app, argc, argv);

  auto logger = pos::logging::getRootLogger();
  logger.setLevel(debugMode ? pos::logging::Level::DEBUG
                            : pos::logging::Level::INFO);
  if (!logFile.empty()) {
    try {
      logger.addFileHandler(logFile, pos::logging::Level::DEBUG);
    } catch (const std::runtime_error &e) {
      std::cerr << e.what() << std::endl;
      return 1;
    }
  }
  logger.info << "pos-sim v" << VERSION;

  if (*runCmd) {
    return runSimulation(options, *runCmd);
  }
  return verifyChain(verifyFile);
}
