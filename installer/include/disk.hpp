#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bedrock {

class System;

namespace disk {

enum class DeviceKind {
    Disk,
    Partition
};

// One row of the kernel's block device listing
struct BlockDevice {
    std::string name;                       // sda, nvme0n1p2
    std::uint64_t size_bytes = 0;
    std::string model;
    DeviceKind kind = DeviceKind::Disk;
    std::optional<std::string> mountpoint;
    std::string parent;                     // kernel name of the parent, empty for disks
    bool read_only = false;

    std::string path() const { return "/dev/" + name; }
};

// Boot firmware of the running machine
enum class FirmwareMode {
    UEFI,
    BIOS
};

const char* to_string(FirmwareMode mode);

// Marker directory that only exists when booted through UEFI
constexpr const char* kEfiVarsPath = "/sys/firmware/efi/efivars";

// Check if system booted in UEFI mode
FirmwareMode detect_firmware(System& sys);

// Optional extra volumes mounted into the new system
enum class SecondaryRole {
    Storage,
    Windows
};

constexpr SecondaryRole kSecondaryRoles[] = {SecondaryRole::Storage, SecondaryRole::Windows};

// Key used in the [secondary] config table ("storage", "windows")
const char* role_key(SecondaryRole role);

// Directory under the mount root ("Storage", "Windows")
const char* role_directory(SecondaryRole role);

std::optional<SecondaryRole> role_from_key(const std::string& key);

struct SecondaryVolume {
    SecondaryRole role;
    BlockDevice device;
};

// What the operator picked
struct TargetSelection {
    BlockDevice root;
    std::vector<SecondaryVolume> secondary;
};

// Root must be a writable whole disk that no secondary volume lives on,
// directly or through LVM/crypt layers. Secondary volumes that are present
// must resolve through lsblk; absent ones are left to the mount stage.
// Throws InstallError(InvalidTarget).
void validate_selection(const TargetSelection& selection, System& sys);

// Parse `lsblk --pairs` output into device records.
// Rows of other types (loop, rom, crypt...) are dropped.
std::vector<BlockDevice> parse_lsblk_pairs(const std::string& output);

// Read-only view of the kernel's block devices. Every call re-queries lsblk;
// results must not be kept across partition table changes.
class DeviceCatalog {
public:
    explicit DeviceCatalog(System& sys);

    // Whole disks
    std::vector<BlockDevice> list_disks() const;

    // Partitions whose kernel parent is `parent`, in kernel order
    std::vector<BlockDevice> list_partition_children(const BlockDevice& parent) const;

    // Every partition on the machine
    std::vector<BlockDevice> list_partitions() const;

    // Look up a device by its /dev path
    std::optional<BlockDevice> find_device(const std::string& path) const;

    // Kernel names of the device at `path` and everything it is stacked on
    // (partition, disk, LVM and crypt layers), device first.
    // nullopt if lsblk cannot resolve the path.
    std::optional<std::vector<std::string>> ancestry(const std::string& path) const;

private:
    std::vector<BlockDevice> query(const std::string& args) const;

    System& sys_;
};

// Get disk size in human-readable format (e.g. "476.9G")
std::string human_size(std::uint64_t bytes);

}  // namespace disk
}  // namespace bedrock
