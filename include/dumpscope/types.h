#ifndef DUMPSCOPE_TYPES_H
#define DUMPSCOPE_TYPES_H

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace dumpscope {

// Error codes surfaced by the inspection pipeline
enum class ErrorCode : int {
  NotPrimed = 1,         // No config dump was supplied
  RetrievalFailure = 2,  // Dump has no listeners section of the expected shape
  DecodeFailure = 3,     // A listener payload could not be decoded
  EmptyResult = 4,       // Extraction produced zero listeners
  RenderFailure = 5,     // Serialization or output flush failed
  InvalidDump = 6        // Raw bytes are not a config dump document
};

inline const char* errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::NotPrimed: return "NotPrimed";
    case ErrorCode::RetrievalFailure: return "RetrievalFailure";
    case ErrorCode::DecodeFailure: return "DecodeFailure";
    case ErrorCode::EmptyResult: return "EmptyResult";
    case ErrorCode::RenderFailure: return "RenderFailure";
    case ErrorCode::InvalidDump: return "InvalidDump";
    default: return "Unknown";
  }
}

struct Error {
  ErrorCode code{ErrorCode::NotPrimed};
  std::string message;

  Error() = default;
  Error(ErrorCode c, const std::string& m) : code(c), message(m) {}
};

// Result/Error pattern
template <typename T>
using Result = std::variant<T, Error>;

using VoidResult = Result<std::nullptr_t>;

inline VoidResult makeVoidSuccess() { return VoidResult(nullptr); }

inline VoidResult makeVoidError(const Error& error) {
  return VoidResult(error);
}

template <typename T>
Result<T> makeSuccess(T&& value) {
  return Result<T>(std::forward<T>(value));
}

template <typename T>
Result<T> makeError(ErrorCode code, const std::string& message) {
  return Result<T>(Error(code, message));
}

template <typename T>
bool is_success(const Result<T>& result) {
  return std::holds_alternative<T>(result);
}

template <typename T>
bool is_error(const Result<T>& result) {
  return std::holds_alternative<Error>(result);
}

template <typename T>
const T* get_value(const Result<T>& result) {
  return std::get_if<T>(&result);
}

template <typename T>
T* get_value(Result<T>& result) {
  return std::get_if<T>(&result);
}

template <typename T>
const Error* get_error(const Result<T>& result) {
  return std::get_if<Error>(&result);
}

}  // namespace dumpscope

#endif  // DUMPSCOPE_TYPES_H
