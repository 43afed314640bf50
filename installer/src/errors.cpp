#include "errors.hpp"

namespace bedrock {

namespace {

std::string describe(const std::string& stage, const std::string& device,
                     const std::string& message) {
    std::string text = stage;
    if (!device.empty()) {
        text += " (" + device + ")";
    }
    return text + ": " + message;
}

}  // namespace

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ToolMissing:         return "ToolMissing";
        case ErrorKind::InvalidTarget:       return "InvalidTarget";
        case ErrorKind::DestructiveOpFailed: return "DestructiveOpFailed";
        case ErrorKind::DiscoveryMismatch:   return "DiscoveryMismatch";
        case ErrorKind::RequiredMountFailed: return "RequiredMountFailed";
        case ErrorKind::OptionalMountFailed: return "OptionalMountFailed";
        case ErrorKind::ConfigInvalid:       return "ConfigInvalid";
        case ErrorKind::InstallFailed:       return "InstallFailed";
    }
    return "Unknown";
}

InstallError::InstallError(ErrorKind kind, const std::string& stage,
                           const std::string& device, const std::string& message)
    : std::runtime_error(describe(stage, device, message)),
      kind_(kind),
      stage_(stage),
      device_(device) {}

}  // namespace bedrock
