// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#include "validation/ipc_engine.hpp"
#include "util/endian.hpp"
#include "util/logging.hpp"
#include "util/strencodings.hpp"

using json = nlohmann::json;

namespace stakenode {
namespace validation {

namespace {

constexpr size_t MAX_REPLY_SIZE = 64 * 1024 * 1024;

} // namespace

IpcValidationEngine::IpcValidationEngine(std::filesystem::path socket_path,
                                         std::chrono::milliseconds call_timeout)
    : socket_path_(std::move(socket_path)), call_timeout_(call_timeout),
      socket_(io_) {}

IpcValidationEngine::~IpcValidationEngine() {
  boost::system::error_code ec;
  socket_.close(ec);
}

bool IpcValidationEngine::Connect() {
  if (connected_) {
    return true;
  }
  boost::system::error_code ec;
  socket_.connect(
      boost::asio::local::stream_protocol::endpoint(socket_path_.string()), ec);
  if (ec) {
    LOG_CHAIN_WARN("Cannot reach validator at {}: {}", socket_path_.string(),
                   ec.message());
    return false;
  }
  connected_ = true;
  LOG_CHAIN_INFO("Connected to validator at {}", socket_path_.string());
  return true;
}

json IpcValidationEngine::EncodeApplyRequest(const ApplyRequest &request) {
  json ops = json::array();
  for (const auto &pass : request.operations) {
    json list = json::array();
    for (const auto &op : pass) {
      util::Serializer s;
      op.Serialize(s);
      list.push_back(util::HexStr(s.data()));
    }
    ops.push_back(std::move(list));
  }

  json j;
  j["method"] = "apply_block";
  j["chain_id"] = request.chain_id;
  j["header"] = util::HexStr(request.header.Serialize());
  j["operations"] = std::move(ops);
  j["predecessor_context"] = request.predecessor_context.GetHex();
  return j;
}

bool IpcValidationEngine::DecodeApplyReply(const json &reply,
                                           ApplyResult &result,
                                           ValidationState &state) {
  try {
    const std::string status = reply.at("status").get<std::string>();
    if (status == "invalid") {
      return state.Invalid(reply.value("reason", std::string("rejected")));
    }
    if (status != "applied") {
      return state.Error("engine-bad-status", status);
    }
    auto ctx = uint256::FromHex(reply.at("context_hash").get<std::string>());
    if (!ctx) {
      return state.Error("engine-bad-context-hash");
    }
    result.context_hash = *ctx;
    result.operation_results.clear();
    if (reply.contains("operation_results")) {
      for (const auto &r : reply["operation_results"]) {
        result.operation_results.push_back(r.get<std::string>());
      }
    }
    return true;
  } catch (const json::exception &e) {
    return state.Error("engine-bad-reply", e.what());
  }
}

std::optional<json> IpcValidationEngine::Call(const json &request,
                                              ValidationState &state) {
  if (!Connect()) {
    state.Error("engine-unreachable", socket_path_.string());
    return std::nullopt;
  }

  const std::string body = request.dump();
  std::vector<uint8_t> frame(4 + body.size());
  endian::WriteBE32(frame.data(), static_cast<uint32_t>(body.size()));
  std::copy(body.begin(), body.end(), frame.begin() + 4);

  std::array<uint8_t, 4> len_buf{};
  std::vector<uint8_t> reply_buf;
  boost::system::error_code result_ec;
  bool done = false;

  boost::asio::async_write(
      socket_, boost::asio::buffer(frame),
      [&](const boost::system::error_code &ec, size_t) {
        if (ec) {
          result_ec = ec;
          done = true;
          return;
        }
        boost::asio::async_read(
            socket_, boost::asio::buffer(len_buf),
            [&](const boost::system::error_code &ec2, size_t) {
              if (ec2) {
                result_ec = ec2;
                done = true;
                return;
              }
              uint32_t len = endian::ReadBE32(len_buf.data());
              if (len > MAX_REPLY_SIZE) {
                result_ec = boost::asio::error::message_size;
                done = true;
                return;
              }
              reply_buf.resize(len);
              boost::asio::async_read(
                  socket_, boost::asio::buffer(reply_buf),
                  [&](const boost::system::error_code &ec3, size_t) {
                    result_ec = ec3;
                    done = true;
                  });
            });
      });

  io_.restart();
  io_.run_for(call_timeout_);

  if (!done) {
    boost::system::error_code ignored;
    socket_.close(ignored);
    connected_ = false;
    // Let the cancelled handlers run before the buffers go out of scope
    io_.restart();
    io_.run();
    state.Error("engine-timeout");
    return std::nullopt;
  }
  if (result_ec) {
    boost::system::error_code ignored;
    socket_.close(ignored);
    connected_ = false;
    state.Error("engine-io", result_ec.message());
    return std::nullopt;
  }

  try {
    return json::parse(reply_buf.begin(), reply_buf.end());
  } catch (const json::exception &e) {
    state.Error("engine-bad-reply", e.what());
    return std::nullopt;
  }
}

bool IpcValidationEngine::ApplyBlock(const ApplyRequest &request,
                                     ApplyResult &result,
                                     ValidationState &state) {
  auto reply = Call(EncodeApplyRequest(request), state);
  if (!reply) {
    return false;
  }
  return DecodeApplyReply(*reply, result, state);
}

bool IpcValidationEngine::CollectGarbage(ValidationState &state) {
  json request;
  request["method"] = "collect_garbage";
  auto reply = Call(request, state);
  if (!reply) {
    return false;
  }
  if (reply->value("status", std::string()) != "ok") {
    return state.Error("engine-gc-failed");
  }
  return true;
}

} // namespace validation
} // namespace stakenode
