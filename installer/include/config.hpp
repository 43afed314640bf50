#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include "disk.hpp"
#include "partition.hpp"

namespace bedrock {

struct InstallConfig {
    // Installation target
    std::string target_disk;
    std::string mount_point = "/mnt";

    // Shared KEY=VALUE file read by the later stages (firmware mode lands here)
    std::string state_file = "vars.sh";

    // Handed to pacstrap as-is
    std::vector<std::string> packages = {"base", "linux", "linux-firmware"};

    // Script run inside the new root after the base install, empty = none
    std::string chroot_script;
};

// Upper bound for [disk] settle_seconds; larger values are clamped
constexpr int kMaxSettleSeconds = 60;

struct DiskConfig {
    std::uint64_t efi_size_mib = 512;
    std::string efi_label = "EFI";
    std::string root_label = "ROOT";
    int settle_seconds = 2;
};

struct Config {
    InstallConfig install;
    DiskConfig disk;

    // [secondary] storage = "/dev/sdc1", windows = "/dev/nvme1n1p3"
    std::map<disk::SecondaryRole, std::string> secondary;

    // True when config was successfully loaded from a TOML file
    bool loaded_from_file = false;

    // Load config from TOML file. Throws InstallError(ConfigInvalid).
    static Config load(const std::string& path);

    // Same, from a string
    static Config parse(std::string_view text);

    disk::PartitionOptions partition_options() const;
};

}  // namespace bedrock
