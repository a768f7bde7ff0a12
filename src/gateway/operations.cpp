#include "fsgate/gateway/operations.hpp"

#include <algorithm>

namespace fsgate::gateway {

bool OperationSpec::allows_extension(const std::string &lowercase_ext) const {
  return std::find(extensions.begin(), extensions.end(), lowercase_ext) != extensions.end();
}

const OperationSpec &write_text_operation() {
  static const OperationSpec spec{"save_file_secure", OperationMode::Write, {"json", "xml"}};
  return spec;
}

const OperationSpec &write_binary_operation() {
  static const OperationSpec spec{"save_file_binary", OperationMode::Write, {"xlsx"}};
  return spec;
}

const OperationSpec &read_text_operation() {
  static const OperationSpec spec{"read_file_secure", OperationMode::Read, {"json", "xml"}};
  return spec;
}

std::string_view stage_name(const Stage stage) {
  switch (stage) {
  case Stage::Rate:
    return "rate";
  case Stage::Size:
    return "size";
  case Stage::Extension:
    return "extension";
  case Stage::Containment:
    return "containment";
  case Stage::Io:
    return "io";
  case Stage::Done:
    return "done";
  }
  return "unknown";
}

} // namespace fsgate::gateway
