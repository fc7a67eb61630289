// Copyright (c) 2024 StakeNode
// Distributed under the MIT software license

#ifndef STAKENODE_VALIDATION_VALIDATION_HPP
#define STAKENODE_VALIDATION_VALIDATION_HPP

#include <string>

namespace stakenode {
namespace validation {

/**
 * Validation state - tracks why an application failed
 *
 * INVALID: the block itself is bad (permanent; quarantine and penalize)
 * ERROR:   the call could not be completed (engine crash, storage failure)
 */
class ValidationState {
public:
  enum class Result {
    VALID,
    INVALID, // Invalid block (permanent failure)
    ERROR    // System error (temporary failure)
  };

  ValidationState() : result_(Result::VALID) {}

  bool IsValid() const { return result_ == Result::VALID; }
  bool IsInvalid() const { return result_ == Result::INVALID; }
  bool IsError() const { return result_ == Result::ERROR; }

  bool Invalid(const std::string &reject_reason,
               const std::string &debug_message = "") {
    result_ = Result::INVALID;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  bool Error(const std::string &reject_reason,
             const std::string &debug_message = "") {
    result_ = Result::ERROR;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  void Reset() {
    result_ = Result::VALID;
    reject_reason_.clear();
    debug_message_.clear();
  }

  std::string GetRejectReason() const { return reject_reason_; }
  std::string GetDebugMessage() const { return debug_message_; }

  std::string ToString() const {
    if (IsValid())
      return "valid";
    std::string s = reject_reason_;
    if (!debug_message_.empty())
      s += " (" + debug_message_ + ")";
    return s;
  }

private:
  Result result_;
  std::string reject_reason_;
  std::string debug_message_;
};

} // namespace validation
} // namespace stakenode

#endif // STAKENODE_VALIDATION_VALIDATION_HPP
