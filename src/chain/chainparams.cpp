// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "chain/chainparams.hpp"
#include "crypto/hash.hpp"
#include "util/endian.hpp"

namespace stakenode {
namespace chain {

BlockHeader CreateGenesisBlock(int64_t timestamp, uint8_t proto,
                               const std::string &marker) {
  BlockHeader genesis;
  genesis.level = 0;
  genesis.proto = proto;
  genesis.predecessor.SetNull();
  genesis.timestamp = timestamp;
  genesis.validation_passes = 0;
  genesis.fitness.push_back({0x00});
  genesis.priority = 0;
  // The marker makes each network's genesis hash distinct
  genesis.signature.assign(marker.begin(), marker.end());
  return genesis;
}

namespace {

uint256 GenesisContextFor(const std::string &chain_name) {
  crypto::HashWriter hw;
  hw.Write("stakenode/genesis-context/").Write(chain_name);
  return hw.GetHash();
}

} // namespace

std::string ChainParams::GetChainTypeString() const {
  switch (chainType) {
  case ChainType::MAIN:
    return "main";
  case ChainType::TESTNET:
    return "test";
  case ChainType::SANDBOX:
    return "sandbox";
  }
  return "unknown";
}

ChainId ChainParams::GetChainId() const {
  return endian::ReadBE32(hashGenesisBlock.data());
}

std::unique_ptr<ChainParams> ChainParams::CreateMainNet() {
  return std::make_unique<CMainParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateTestNet() {
  return std::make_unique<CTestNetParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateSandbox() {
  return std::make_unique<CSandboxParams>();
}

std::unique_ptr<ChainParams> ChainParams::FromName(const std::string &name) {
  if (name == "main" || name == "mainnet")
    return CreateMainNet();
  if (name == "test" || name == "testnet")
    return CreateTestNet();
  if (name == "sandbox")
    return CreateSandbox();
  return nullptr;
}

// ============================================================================
// MainNet Parameters
// ============================================================================

CMainParams::CMainParams() {
  chainType = ChainType::MAIN;
  chainName = "STAKENODE_MAINNET_2024-06-01";
  distributedDbVersion = 2;
  p2pVersion = 1;

  genesis = CreateGenesisBlock(1717200000, 0, chainName);
  hashGenesisBlock = genesis.GetHash();
  genesisContext = GenesisContextFor(chainName);

  nDefaultPort = 9732;
  nMaxLookback = 4096;
  nPowDifficulty = 26;

  vFixedSeeds.clear();
}

// ============================================================================
// TestNet Parameters
// ============================================================================

CTestNetParams::CTestNetParams() {
  chainType = ChainType::TESTNET;
  chainName = "STAKENODE_TESTNET_2024-06-01";
  distributedDbVersion = 2;
  p2pVersion = 1;

  genesis = CreateGenesisBlock(1717200000, 0, chainName);
  hashGenesisBlock = genesis.GetHash();
  genesisContext = GenesisContextFor(chainName);

  nDefaultPort = 19732;
  nMaxLookback = 4096;
  // Cheap identities for test infrastructure
  nPowDifficulty = 16;

  vFixedSeeds.clear();
}

// ============================================================================
// Sandbox Parameters (local networks and tests)
// ============================================================================

CSandboxParams::CSandboxParams() {
  chainType = ChainType::SANDBOX;
  chainName = "STAKENODE_SANDBOX";
  distributedDbVersion = 2;
  p2pVersion = 1;

  genesis = CreateGenesisBlock(1700000000, 0, chainName);
  hashGenesisBlock = genesis.GetHash();
  genesisContext = GenesisContextFor(chainName);

  nDefaultPort = 29732;
  nMaxLookback = 512;
  nPowDifficulty = 0;

  vFixedSeeds.clear();
}

} // namespace chain
} // namespace stakenode
