#pragma once

#include <optional>
#include <string>
#include "disk.hpp"

namespace bedrock {

// Key the bootloader stage reads from the shared vars file
constexpr const char* kFirmwareModeKey = "FIRMWARE_MODE";

std::optional<disk::FirmwareMode> parse_firmware_mode(const std::string& value);

// Persists the firmware decision into the shell-sourceable KEY=VALUE file
// shared with the later install stages. Other keys are left untouched.
class StateRecorder {
public:
    explicit StateRecorder(std::string path);

    // Replace any previous FIRMWARE_MODE line. Throws InstallError on I/O failure.
    void record(disk::FirmwareMode mode) const;

    std::optional<disk::FirmwareMode> read() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

}  // namespace bedrock
