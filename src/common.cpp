#include "idkit/common.hpp"

#include <sstream>

namespace idkit {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kValidationError:
      return "Validation error";
    case ErrorCode::kWrongIdType:
      return "Wrong identifier type";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kFileWriteError:
      return "File write error";
  }
  return "Unknown error";
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
  return Version{0, 1, 0, ""};
}

}  // namespace idkit
