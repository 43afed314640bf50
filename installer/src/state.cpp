#include "state.hpp"
#include "errors.hpp"
#include <fstream>
#include <utility>

namespace bedrock {

namespace {

const std::string kPrefix = std::string(kFirmwareModeKey) + "=";

bool is_mode_line(const std::string& line) {
    return line.compare(0, kPrefix.size(), kPrefix) == 0;
}

}  // namespace

std::optional<disk::FirmwareMode> parse_firmware_mode(const std::string& value) {
    std::string v = value;
    if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
        v = v.substr(1, v.size() - 2);
    }
    if (v == "UEFI") return disk::FirmwareMode::UEFI;
    if (v == "BIOS") return disk::FirmwareMode::BIOS;
    return std::nullopt;
}

StateRecorder::StateRecorder(std::string path) : path_(std::move(path)) {}

void StateRecorder::record(disk::FirmwareMode mode) const {
    // Keep everything else the earlier stages wrote
    std::string kept;
    {
        std::ifstream in(path_);
        std::string line;
        while (std::getline(in, line)) {
            if (!is_mode_line(line)) {
                kept += line + "\n";
            }
        }
    }

    std::ofstream out(path_, std::ios::trunc);
    if (!out) {
        throw InstallError(ErrorKind::InstallFailed, "recording firmware mode", "",
                           "failed to write " + path_);
    }
    out << kept << kPrefix << disk::to_string(mode) << "\n";
    if (!out.flush()) {
        throw InstallError(ErrorKind::InstallFailed, "recording firmware mode", "",
                           "failed to write " + path_);
    }
}

std::optional<disk::FirmwareMode> StateRecorder::read() const {
    std::ifstream in(path_);
    std::string line;
    std::optional<disk::FirmwareMode> mode;

    while (std::getline(in, line)) {
        if (is_mode_line(line)) {
            mode = parse_firmware_mode(line.substr(kPrefix.size()));
        }
    }
    return mode;
}

}  // namespace bedrock
