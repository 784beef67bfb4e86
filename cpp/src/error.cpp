#include "radish/error.hpp"

#include <sstream>

namespace radish {

namespace {

std::string format_error(ErrorKind kind, const std::string& path, const std::string& message,
                         std::optional<int32_t> sweep, const std::string& variable) {
  std::ostringstream os;
  os << error_kind_name(kind) << ": " << message;
  if (!variable.empty()) {
    os << " [variable=" << variable << "]";
  }
  if (sweep.has_value()) {
    os << " [sweep=" << *sweep << "]";
  }
  if (!path.empty()) {
    os << " in " << path;
  }
  return os.str();
}

}  // namespace

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNotFound:
      return "NotFoundError";
    case ErrorKind::kFormat:
      return "FormatError";
    case ErrorKind::kSchema:
      return "SchemaError";
    case ErrorKind::kDecode:
      return "DecodeError";
  }
  return "Error";
}

Error::Error(ErrorKind kind, std::string path, std::string message, std::optional<int32_t> sweep,
             std::string variable)
    : std::runtime_error(format_error(kind, path, message, sweep, variable)),
      kind_(kind),
      path_(std::move(path)),
      message_(std::move(message)),
      sweep_(sweep),
      variable_(std::move(variable)) {}

}  // namespace radish
