#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace txasm {

enum class ErrorCode {
  // codec
  MalformedVarint,
  UnexpectedEof,
  MalformedTransaction,
  // compiler
  MissingPayer,
  MissingBlockhash,
  EmptyInstructionList,
  TooManyAccounts,
  InstructionDataTooLarge,
  // builder
  MissingSigner,
  UnexpectedSigner,
  SigningFailed,
  SignatureSlotFilled,
  BuilderConsumed,
  // optimizer
  UnsafeOptimization,
  // misc
  InvalidConfig,
  InvalidArgument,
  InvalidPublicKey,
};

std::string to_string(ErrorCode code);

/**
 * Every failure raised by txasm. Carries the error kind and, where it
 * applies, the offending byte offset, account (base58) or count.
 */
class Error : public std::runtime_error {
 public:
  Error(ErrorCode code, const std::string &message);

  ErrorCode code() const { return code_; }
  const std::optional<size_t> &offset() const { return offset_; }
  const std::optional<std::string> &account() const { return account_; }
  const std::optional<size_t> &count() const { return count_; }

  Error &withOffset(size_t offset);
  Error &withAccount(const std::string &account);
  Error &withCount(size_t count);

 private:
  ErrorCode code_;
  std::optional<size_t> offset_;
  std::optional<std::string> account_;
  std::optional<size_t> count_;
};

}  // namespace txasm
