#pragma once

#include "Block.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace pos {

/**
 * BlockChain - append-only sequence of blocks
 *
 * Starts with the fixed genesis block. addBlock() is the only way the
 * sequence changes, and it accepts a block only when checkBlock() passes
 * against the current tip:
 * - index is the tip index plus one
 * - previous hash is the tip hash
 * - stored hash matches the recomputed hash
 */
class BlockChain : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Block validation errors
  constexpr static int32_t E_BLOCK_NOT_FOUND = 10; // No block at index
  constexpr static int32_t E_BLOCK_HASH = 12;      // Hash does not match fields
  constexpr static int32_t E_BLOCK_INDEX = 13;     // Index not sequential
  constexpr static int32_t E_BLOCK_CHAIN = 14;     // Previous hash mismatch
  constexpr static int32_t E_BLOCK_GENESIS = 16;   // Not the genesis block

  constexpr static const char *GENESIS_PROPOSER = "SYSTEM_GENESIS";
  constexpr static double GENESIS_TIMESTAMP = 0.0;

  BlockChain();
  ~BlockChain() override = default;

  /** Previous hash of the genesis block: 64 '0' characters */
  static std::string getGenesisPreviousHash();
  static Block createGenesisBlock();

  /**
   * Check a candidate against the block it claims to extend.
   * Checks run in order (index, previous hash, hash) and stop at the first
   * failure, whose code is returned.
   */
  static Roe<void> checkBlock(const Block &candidate, const Block &previous);

  /**
   * Boolean form of checkBlock(); logs the failing criterion, never throws
   */
  bool isValidBlock(const Block &candidate, const Block &previous) const;

  /**
   * Check a whole sequence: the first block must be the genesis block and
   * every following block must pass checkBlock() against its predecessor.
   */
  static Roe<void> checkSequence(const std::vector<Block> &blocks);

  /**
   * Append a block extending the tip
   * @return true if appended, false (chain unchanged) if it fails validation
   */
  bool addBlock(const Block &candidate);

  const Block &getLatestBlock() const { return chain_.back(); }
  size_t getSize() const { return chain_.size(); }
  Roe<Block> getBlock(uint64_t index) const;
  const std::vector<Block> &getBlocks() const { return chain_; }

  /** Re-check every block of this chain */
  bool isValid() const;

private:
  std::vector<Block> chain_;
};

} // namespace pos
