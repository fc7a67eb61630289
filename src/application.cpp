// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "application.hpp"
#include "storage/rocksdb_store.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "validation/ipc_engine.hpp"
#include "validation/sandbox_engine.hpp"
#include "version.hpp"
#include <chrono>
#include <iostream> // Keep for signal handler and the banner
#include <thread>

namespace stakenode {
namespace app {

namespace {
constexpr const char *LOCK_FILE = ".lock";
constexpr const char *IDENTITY_FILE = "identity.json";
constexpr const char *CHAINDATA_DIR = "chaindata";
} // namespace

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const NodeConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  if (datadir_locked_) {
    util::UnlockDirectory(config_.datadir, LOCK_FILE);
  }
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

std::string Application::failure_reason() const {
  std::lock_guard<std::mutex> lock(fatal_mutex_);
  return fatal_reason_;
}

bool Application::initialize() {
  if (!init_chain_params()) {
    return false;
  }

  std::string banner_name = "MAINNET";
  if (chain_params_->GetChainType() == chain::ChainType::TESTNET) {
    banner_name = "TESTNET";
  } else if (chain_params_->GetChainType() == chain::ChainType::SANDBOX) {
    banner_name = "SANDBOX";
  }
  std::cout << GetStartupBanner(banner_name) << std::endl;

  LOG_INFO("Initializing StakeNode {}...", GetFullVersionString());

  if (!init_datadir()) {
    LOG_ERROR("Failed to initialize data directory");
    return false;
  }
  if (!init_identity()) {
    LOG_ERROR("Failed to initialize node identity");
    return false;
  }
  if (!init_storage()) {
    LOG_ERROR("Failed to open chain storage");
    return false;
  }
  if (!init_validation()) {
    LOG_ERROR("Failed to initialize validation engine");
    return false;
  }
  if (!init_network()) {
    LOG_ERROR("Failed to initialize network manager");
    return false;
  }
  if (!init_chain_manager()) {
    LOG_ERROR("Failed to initialize chain manager");
    return false;
  }

  // Storage failures and exhausted engine restarts stop the node
  fatal_sub_ = Notifications().SubscribeFatalError(
      [this](const std::string &reason) {
        {
          std::lock_guard<std::mutex> lock(fatal_mutex_);
          if (fatal_reason_.empty()) {
            fatal_reason_ = reason;
          }
        }
        fatal_ = true;
        LOG_CRITICAL("Fatal error: {}. Initiating shutdown.", reason);
        request_shutdown();
      });

  head_sub_ = Notifications().SubscribeHeadAdvanced(
      [](const uint256 &hash, int32_t level) {
        LOG_INFO("New head {} at level {}", hash.ToShortString(), level);
      });

  banned_sub_ = Notifications().SubscribePeerBanned(
      [](const std::string &identity, const std::string &reason) {
        LOG_INFO("Peer {} banned: {}", identity.substr(0, 16), reason);
      });

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }

  LOG_INFO("Starting StakeNode...");
  setup_signal_handlers();

  if (!chain_manager_->Start()) {
    LOG_ERROR("Failed to start chain manager");
    return false;
  }

  if (!network_manager_->start()) {
    LOG_ERROR("Failed to start network manager");
    return false;
  }

  running_ = true;

  LOG_INFO("StakeNode started, peer id {}", identity_->PeerId());
  LOG_INFO("Data directory: {}", config_.datadir.string());
  if (config_.listen) {
    LOG_INFO("Listening on port: {}", config_.port ? config_.port
                                                   : chain_params_->GetDefaultPort());
  } else {
    LOG_INFO("Inbound connections disabled");
  }
  LOG_INFO("Press Ctrl+C to stop");
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_.exchange(false)) {
    return;
  }

  LOG_INFO("Shutting down StakeNode...");

  // No more session events or timers reach the chain manager after this
  if (network_manager_) {
    LOG_INFO("Stopping network manager...");
    network_manager_->stop();
  }

  // An in-flight application is not cancellable; wait for it
  if (dispatcher_) {
    LOG_INFO("Waiting for block application to finish...");
    dispatcher_->Shutdown();
  }

  if (banman_) {
    LOG_INFO("Saving ban list...");
    if (!banman_->Save()) {
      LOG_ERROR("Failed to save ban list");
    }
  }

  fatal_sub_.Unsubscribe();
  head_sub_.Unsubscribe();
  banned_sub_.Unsubscribe();

  LOG_INFO("Releasing data directory lock...");
  if (datadir_locked_) {
    util::UnlockDirectory(config_.datadir, LOCK_FILE);
    datadir_locked_ = false;
  }

  LOG_INFO("Shutdown complete");
}

bool Application::init_chain_params() {
  chain_params_ = chain::ChainParams::FromName(config_.network);
  if (!chain_params_) {
    LOG_ERROR("Unknown network '{}'", config_.network);
    return false;
  }
  return true;
}

bool Application::init_datadir() {
  LOG_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }

  // Lock the data directory to prevent multiple instances
  util::LockResult lock_result = util::LockDirectory(config_.datadir, LOCK_FILE);

  if (lock_result == util::LockResult::ErrorWrite) {
    LOG_ERROR("Cannot write to data directory: {}", config_.datadir.string());
    return false;
  }

  if (lock_result == util::LockResult::ErrorLock) {
    LOG_ERROR("Cannot obtain a lock on data directory {}. "
              "StakeNode is probably already running.",
              config_.datadir.string());
    return false;
  }

  datadir_locked_ = true;
  LOG_DEBUG("Successfully locked data directory");
  return true;
}

bool Application::init_identity() {
  const unsigned int difficulty =
      config_.pow_difficulty.value_or(chain_params_->GetPowDifficulty());
  const auto path = config_.datadir / IDENTITY_FILE;

  if (std::filesystem::exists(path)) {
    identity_ = crypto::NodeIdentity::Load(path, difficulty);
    if (!identity_) {
      LOG_ERROR("Identity file {} is unusable; move it away to generate a "
                "new identity",
                path.string());
      return false;
    }
    LOG_INFO("Loaded node identity {}", identity_->PeerId());
    return true;
  }

  LOG_INFO("Generating node identity (proof-of-work difficulty {})...",
           difficulty);
  identity_ = crypto::NodeIdentity::Generate(difficulty);
  if (!identity_) {
    LOG_ERROR("Failed to generate node identity");
    return false;
  }
  if (!identity_->Save(path)) {
    return false;
  }
  LOG_INFO("Generated node identity {}", identity_->PeerId());
  return true;
}

bool Application::init_storage() {
  const auto path = config_.datadir / CHAINDATA_DIR;
  LOG_INFO("Opening chain storage at {}", path.string());

  try {
    store_ = std::make_unique<storage::RocksDbStore>(path);
  } catch (const storage::StorageError &e) {
    LOG_ERROR("Cannot open chain storage: {}", e.what());
    return false;
  }

  storage_ = std::make_unique<storage::ChainStorage>(
      *store_, chain_params_->GetChainId());
  if (!storage_->Initialize(*chain_params_)) {
    LOG_ERROR("Chain storage at {} does not belong to network '{}'",
              path.string(), chain_params_->GetChainName());
    return false;
  }

  auto state = storage_->GetChainState();
  if (!state) {
    LOG_ERROR("Chain storage has no head after initialization");
    return false;
  }
  LOG_INFO("Chain head {} at level {}", state->head_hash.ToShortString(),
           state->head_level);
  return true;
}

bool Application::init_validation() {
  validation::EngineFactory factory;

  if (config_.engine == "sandbox") {
    if (chain_params_->GetChainType() == chain::ChainType::MAIN) {
      LOG_WARN("Using the sandbox validation engine on mainnet; blocks are "
               "not checked against the real protocol");
    }
    factory = []() -> std::unique_ptr<validation::ValidationEngine> {
      return std::make_unique<validation::SandboxEngine>();
    };
  } else {
    const std::filesystem::path socket_path = config_.engine.substr(4);
    const std::chrono::milliseconds timeout(config_.engine_timeout_ms);
    factory = [socket_path,
               timeout]() -> std::unique_ptr<validation::ValidationEngine> {
      return std::make_unique<validation::IpcValidationEngine>(socket_path,
                                                               timeout);
    };
    LOG_INFO("Using external validation engine at {}", socket_path.string());
  }

  validation::EngineHandleConfig handle_config;
  handle_config.gc_interval = config_.gc_interval;
  handle_config.max_restarts = config_.engine_restarts;
  engine_ = std::make_unique<validation::EngineHandle>(std::move(factory),
                                                       handle_config);
  return true;
}

bool Application::init_network() {
  LOG_INFO("Initializing network manager...");

  banman_ = std::make_unique<network::BanMan>(config_.datadir);
  if (!banman_->Load()) {
    LOG_WARN("Could not load ban list, starting with an empty one");
  }

  auto peer_config = std::make_shared<network::PeerConfig>();
  peer_config->identity = *identity_;
  peer_config->version.chain_name = chain_params_->GetChainName();
  peer_config->version.distributed_db_version =
      chain_params_->GetDistributedDbVersion();
  peer_config->version.p2p_version = chain_params_->GetP2PVersion();
  peer_config->chain_id = chain_params_->GetChainId();
  peer_config->pow_difficulty =
      config_.pow_difficulty.value_or(chain_params_->GetPowDifficulty());
  peer_config->disable_mempool = config_.disable_mempool;
  peer_config->private_node = config_.private_node;
  peer_config->max_outstanding = config_.max_outstanding;

  network::NetworkManager::Config net_config;
  net_config.listen_port =
      config_.port ? config_.port : chain_params_->GetDefaultPort();
  net_config.listen_enabled = config_.listen;
  net_config.io_threads = config_.io_threads;
  net_config.seeds =
      config_.seeds.empty() ? chain_params_->FixedSeeds() : config_.seeds;
  net_config.connect = config_.connect;
  net_config.ban_duration_sec = config_.ban_duration;
  net_config.peers.low_water = config_.min_connections;
  net_config.peers.high_water = config_.max_connections;
  if (config_.replay) {
    net_config.replay_path = config_.ReplayFilePath();
    LOG_INFO("Recording received messages to {}",
             net_config.replay_path.string());
  }
  peer_config->listen_port = config_.listen ? net_config.listen_port : 0;

  network_manager_ = std::make_unique<network::NetworkManager>(
      net_config, std::move(peer_config), *storage_, *banman_);
  return true;
}

bool Application::init_chain_manager() {
  validation::DispatcherConfig dispatcher_config;
  dispatcher_config.worker_threads = config_.workers;
  dispatcher_config.history_window = config_.history_window;

  network::NetworkManager *net = network_manager_.get();
  dispatcher_ = std::make_unique<validation::ValidationDispatcher>(
      *storage_, *engine_, dispatcher_config,
      [net](const validation::ApplyOutcome &outcome) {
        net->post_apply_outcome(outcome);
      });

  sync::ChainManagerConfig chain_config;
  chain_config.max_missing_blocks = config_.max_missing;
  chain_config.max_lookback =
      config_.lookback > 0 ? config_.lookback : chain_params_->GetMaxLookback();
  chain_config.max_outstanding_per_peer = config_.max_outstanding;
  chain_config.fetch_timeout = std::chrono::seconds(config_.fetch_timeout_sec);
  chain_config.ban_threshold = config_.ban_threshold;

  chain_manager_ = std::make_unique<sync::ChainManager>(
      *storage_, *dispatcher_, *network_manager_, chain_config);
  network_manager_->attach_chain_manager(chain_manager_.get());
  return true;
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  if (instance_) {
    std::cout << "\nReceived signal " << signal << std::endl;
    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace stakenode
