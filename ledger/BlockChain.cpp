#include "BlockChain.h"

namespace pos {

BlockChain::BlockChain() : Module("pos.BlockChain") {
  chain_.push_back(createGenesisBlock());
}

std::string BlockChain::getGenesisPreviousHash() {
  return std::string(Block::HASH_SIZE, '0');
}

Block BlockChain::createGenesisBlock() {
  return Block(0, GENESIS_TIMESTAMP, {}, getGenesisPreviousHash(),
               GENESIS_PROPOSER);
}

BlockChain::Roe<void> BlockChain::checkBlock(const Block &candidate,
                                             const Block &previous) {
  if (candidate.getIndex() != previous.getIndex() + 1) {
    return Error(E_BLOCK_INDEX, "Invalid index: expected " +
                                    std::to_string(previous.getIndex() + 1) +
                                    ", got " +
                                    std::to_string(candidate.getIndex()));
  }

  if (candidate.getPreviousHash() != previous.getHash()) {
    return Error(E_BLOCK_CHAIN, "Invalid previous hash for block #" +
                                    std::to_string(candidate.getIndex()));
  }

  if (candidate.getHash() != candidate.calculateHash()) {
    return Error(E_BLOCK_HASH, "Invalid block hash for block #" +
                                   std::to_string(candidate.getIndex()));
  }

  return {};
}

bool BlockChain::isValidBlock(const Block &candidate,
                              const Block &previous) const {
  auto result = checkBlock(candidate, previous);
  if (!result) {
    log().warning << result.error().message;
    return false;
  }
  return true;
}

BlockChain::Roe<void> BlockChain::checkSequence(const std::vector<Block> &blocks) {
  if (blocks.empty()) {
    return Error(E_BLOCK_GENESIS, "Chain has no genesis block");
  }

  const Block &genesis = blocks.front();
  if (genesis.getIndex() != 0 ||
      genesis.getPreviousHash() != getGenesisPreviousHash() ||
      genesis.getProposer() != GENESIS_PROPOSER ||
      !genesis.getTransactions().empty()) {
    return Error(E_BLOCK_GENESIS, "First block is not a genesis block");
  }
  if (genesis.getHash() != genesis.calculateHash()) {
    return Error(E_BLOCK_HASH, "Invalid block hash for block #0");
  }

  for (size_t i = 1; i < blocks.size(); ++i) {
    auto result = checkBlock(blocks[i], blocks[i - 1]);
    if (!result) {
      return result;
    }
  }
  return {};
}

bool BlockChain::addBlock(const Block &candidate) {
  if (!isValidBlock(candidate, getLatestBlock())) {
    return false;
  }

  chain_.push_back(candidate);
  log().debug << "Appended " << candidate;
  return true;
}

BlockChain::Roe<Block> BlockChain::getBlock(uint64_t index) const {
  if (index >= chain_.size()) {
    return Error(E_BLOCK_NOT_FOUND, "Block not found: " + std::to_string(index));
  }
  return chain_[index];
}

bool BlockChain::isValid() const {
  auto result = checkSequence(chain_);
  if (!result) {
    log().error << "Chain integrity check failed: " << result.error().message;
    return false;
  }
  return true;
}

} // namespace pos
