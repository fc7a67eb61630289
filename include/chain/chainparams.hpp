// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_CHAIN_CHAINPARAMS_HPP
#define STAKENODE_CHAIN_CHAINPARAMS_HPP

#include "chain/block.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace stakenode {
namespace chain {

enum class ChainType {
  MAIN,    // Production mainnet
  TESTNET, // Public test network
  SANDBOX  // Local network with the in-process sandbox engine
};

// 4-byte chain identifier: first bytes of the genesis hash, big-endian
using ChainId = uint32_t;

/**
 * ChainParams - network-specific constants
 *
 * Selected once at startup from the network identifier. The lookback bound
 * and PoW difficulty here are defaults; NodeConfig may override both.
 */
class ChainParams {
public:
  ChainParams() = default;
  virtual ~ChainParams() = default;

  ChainType GetChainType() const { return chainType; }
  std::string GetChainTypeString() const;

  // Version triple exchanged in the connection message
  const std::string &GetChainName() const { return chainName; }
  uint16_t GetDistributedDbVersion() const { return distributedDbVersion; }
  uint16_t GetP2PVersion() const { return p2pVersion; }

  ChainId GetChainId() const;
  const BlockHeader &GenesisBlock() const { return genesis; }
  const uint256 &GenesisHash() const { return hashGenesisBlock; }
  const uint256 &GenesisContext() const { return genesisContext; }

  uint16_t GetDefaultPort() const { return nDefaultPort; }
  int32_t GetMaxLookback() const { return nMaxLookback; }
  unsigned int GetPowDifficulty() const { return nPowDifficulty; }
  const std::vector<std::string> &FixedSeeds() const { return vFixedSeeds; }

  static std::unique_ptr<ChainParams> CreateMainNet();
  static std::unique_ptr<ChainParams> CreateTestNet();
  static std::unique_ptr<ChainParams> CreateSandbox();

  // "main" / "test" / "sandbox"; nullptr for an unknown name
  static std::unique_ptr<ChainParams> FromName(const std::string &name);

protected:
  ChainType chainType{ChainType::MAIN};
  std::string chainName;
  uint16_t distributedDbVersion{0};
  uint16_t p2pVersion{0};
  BlockHeader genesis;
  uint256 hashGenesisBlock;
  uint256 genesisContext;
  uint16_t nDefaultPort{};
  int32_t nMaxLookback{0};
  unsigned int nPowDifficulty{0};
  std::vector<std::string> vFixedSeeds; // host:port
};

class CMainParams : public ChainParams {
public:
  CMainParams();
};

class CTestNetParams : public ChainParams {
public:
  CTestNetParams();
};

class CSandboxParams : public ChainParams {
public:
  CSandboxParams();
};

// Genesis header: level 0, null predecessor, no operations
BlockHeader CreateGenesisBlock(int64_t timestamp, uint8_t proto,
                               const std::string &marker);

} // namespace chain
} // namespace stakenode

#endif // STAKENODE_CHAIN_CHAINPARAMS_HPP
