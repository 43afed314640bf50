#pragma once

#include <stdexcept>
#include <string>

namespace bedrock {

// Failure categories of the disk preparation pipeline
enum class ErrorKind {
    ToolMissing,          // partitioning/formatting/mount utility absent
    InvalidTarget,        // selection is not a usable block device
    DestructiveOpFailed,  // wipe, partition or format command failed
    DiscoveryMismatch,    // fewer partitions found than planned
    RequiredMountFailed,  // root or boot could not be mounted
    OptionalMountFailed,  // secondary volume could not be mounted (warning only)
    ConfigInvalid,        // configuration file rejected
    InstallFailed         // a step outside the disk pipeline failed
};

const char* to_string(ErrorKind kind);

// Fatal pipeline error. Carries the stage and device it happened on so the
// message shown to the operator names both.
class InstallError : public std::runtime_error {
public:
    InstallError(ErrorKind kind, const std::string& stage,
                 const std::string& device, const std::string& message);

    ErrorKind kind() const { return kind_; }
    const std::string& stage() const { return stage_; }
    const std::string& device() const { return device_; }

private:
    ErrorKind kind_;
    std::string stage_;
    std::string device_;
};

}  // namespace bedrock
