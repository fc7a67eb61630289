// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_VALIDATION_IPC_ENGINE_HPP
#define STAKENODE_VALIDATION_IPC_ENGINE_HPP

#include "validation/validation_engine.hpp"
#include <utility> // boost 1.74 asio uses std::exchange without including it
#include <boost/asio.hpp>
#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>

namespace stakenode {
namespace validation {

/**
 * IpcValidationEngine - talks to an external validator process over a
 * Unix-domain socket.
 *
 * Framing: 4-byte big-endian length, then a UTF-8 JSON object.
 *
 *   -> {"method":"apply_block","chain_id":N,"header":"<hex>",
 *       "operations":[["<hex op>",...],...],"predecessor_context":"<hex>"}
 *   <- {"status":"applied","context_hash":"<hex>","operation_results":[...]}
 *   <- {"status":"invalid","reason":"..."}
 *
 *   -> {"method":"collect_garbage"}
 *   <- {"status":"ok"}
 *
 * Connection loss, timeouts and unparsable replies are call failures
 * (ValidationState::Error); the engine handle restarts the connection.
 */
class IpcValidationEngine : public ValidationEngine {
public:
  IpcValidationEngine(std::filesystem::path socket_path,
                      std::chrono::milliseconds call_timeout);
  ~IpcValidationEngine() override;

  // Connects eagerly; false if the validator is not listening
  bool Connect();

  bool ApplyBlock(const ApplyRequest &request, ApplyResult &result,
                  ValidationState &state) override;
  bool CollectGarbage(ValidationState &state) override;
  std::string Name() const override { return "ipc:" + socket_path_.string(); }

  static nlohmann::json EncodeApplyRequest(const ApplyRequest &request);
  // Returns false and sets state on invalid/garbled replies
  static bool DecodeApplyReply(const nlohmann::json &reply,
                               ApplyResult &result, ValidationState &state);

private:
  std::optional<nlohmann::json> Call(const nlohmann::json &request,
                                     ValidationState &state);

  std::filesystem::path socket_path_;
  std::chrono::milliseconds call_timeout_;
  boost::asio::io_context io_;
  boost::asio::local::stream_protocol::socket socket_;
  bool connected_{false};
};

} // namespace validation
} // namespace stakenode

#endif // STAKENODE_VALIDATION_IPC_ENGINE_HPP
