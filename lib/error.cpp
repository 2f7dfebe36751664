#include "txasm/error.hpp"

#include <fmt/format.h>

namespace txasm {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::MalformedVarint:
      return "MalformedVarint";
    case ErrorCode::UnexpectedEof:
      return "UnexpectedEof";
    case ErrorCode::MalformedTransaction:
      return "MalformedTransaction";
    case ErrorCode::MissingPayer:
      return "MissingPayer";
    case ErrorCode::MissingBlockhash:
      return "MissingBlockhash";
    case ErrorCode::EmptyInstructionList:
      return "EmptyInstructionList";
    case ErrorCode::TooManyAccounts:
      return "TooManyAccounts";
    case ErrorCode::InstructionDataTooLarge:
      return "InstructionDataTooLarge";
    case ErrorCode::MissingSigner:
      return "MissingSigner";
    case ErrorCode::UnexpectedSigner:
      return "UnexpectedSigner";
    case ErrorCode::SigningFailed:
      return "SigningFailed";
    case ErrorCode::SignatureSlotFilled:
      return "SignatureSlotFilled";
    case ErrorCode::BuilderConsumed:
      return "BuilderConsumed";
    case ErrorCode::UnsafeOptimization:
      return "UnsafeOptimization";
    case ErrorCode::InvalidConfig:
      return "InvalidConfig";
    case ErrorCode::InvalidArgument:
      return "InvalidArgument";
    case ErrorCode::InvalidPublicKey:
      return "InvalidPublicKey";
  }
  return "Unknown";
}

Error::Error(ErrorCode code, const std::string &message)
    : std::runtime_error(fmt::format("{}: {}", to_string(code), message)),
      code_(code) {}

Error &Error::withOffset(size_t offset) {
  offset_ = offset;
  return *this;
}

Error &Error::withAccount(const std::string &account) {
  account_ = account;
  return *this;
}

Error &Error::withCount(size_t count) {
  count_ = count;
  return *this;
}

}  // namespace txasm
