#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace radish {

enum class ErrorKind {
  kNotFound,
  kFormat,
  kSchema,
  kDecode
};

const char* error_kind_name(ErrorKind kind);

// Base of every error raised by the decoding engine. what() carries the kind,
// the file path, and the sweep index / variable name when they apply.
class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, std::string path, std::string message,
        std::optional<int32_t> sweep = std::nullopt, std::string variable = {});

  ErrorKind kind() const { return kind_; }
  const std::string& path() const { return path_; }
  const std::string& message() const { return message_; }
  std::optional<int32_t> sweep() const { return sweep_; }
  const std::string& variable() const { return variable_; }

 private:
  ErrorKind kind_;
  std::string path_;
  std::string message_;
  std::optional<int32_t> sweep_;
  std::string variable_;
};

class NotFoundError : public Error {
 public:
  NotFoundError(std::string path, std::string message)
      : Error(ErrorKind::kNotFound, std::move(path), std::move(message)) {}
};

class FormatError : public Error {
 public:
  FormatError(std::string path, std::string message)
      : Error(ErrorKind::kFormat, std::move(path), std::move(message)) {}
};

class SchemaError : public Error {
 public:
  SchemaError(std::string path, std::string message, std::string variable = {},
              std::optional<int32_t> sweep = std::nullopt)
      : Error(ErrorKind::kSchema, std::move(path), std::move(message), sweep,
              std::move(variable)) {}
};

class DecodeError : public Error {
 public:
  DecodeError(std::string path, std::string message, std::string variable,
              std::optional<int32_t> sweep = std::nullopt)
      : Error(ErrorKind::kDecode, std::move(path), std::move(message), sweep,
              std::move(variable)) {}
};

}  // namespace radish
