#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "disk.hpp"

namespace bedrock {

class System;

namespace disk {

struct PartitionOptions {
    std::uint64_t efi_size_mib = 512;
    std::string efi_label = "EFI";
    std::string root_label = "ROOT";
    std::chrono::seconds settle_delay{2};
};

// One partition to create
struct PlanEntry {
    int index = 1;                          // partition number, 1-based
    std::uint64_t start_mib = 0;            // 0 = next free aligned sector
    std::optional<std::uint64_t> size_mib;  // nullopt = rest of the disk
    std::string type_code;                  // ef00/8300 on GPT, 83 on MBR
    std::string label;
    bool bootable = false;                  // MBR active flag
};

using PartitionPlan = std::vector<PlanEntry>;

// UEFI: [EFI, ROOT]. BIOS: [ROOT].
PartitionPlan make_plan(FirmwareMode mode, const PartitionOptions& options = {});

// Utilities the pipeline needs for `mode`
std::vector<std::string> required_tools(FirmwareMode mode);

// Throws InstallError(ToolMissing) naming the first absent tool
void check_tools(System& sys, FirmwareMode mode);

enum class PlannerState {
    Unpartitioned,
    TableCleared,
    Planned,
    Committed,
    Rediscovered
};

const char* to_string(PlannerState state);

// Unpartitioned -> TableCleared -> Planned -> Committed -> Rediscovered
//
// Every run starts by destroying whatever is on the device, so running it
// again against a disk it already partitioned gives the same result.
// Rediscovered partitions are matched to plan entries by position only.
class PartitionPlanner {
public:
    PartitionPlanner(System& sys, const DeviceCatalog& catalog, PartitionOptions options = {});

    // All four transitions. Returns one partition per plan entry, in plan order.
    std::vector<BlockDevice> run(const BlockDevice& device, FirmwareMode mode);

    void clear_table(const BlockDevice& device);
    const PartitionPlan& build_plan(FirmwareMode mode);
    void commit(const BlockDevice& device);
    std::vector<BlockDevice> rediscover(const BlockDevice& device);

    PlannerState state() const { return state_; }
    const PartitionPlan& plan() const { return plan_; }
    FirmwareMode mode() const { return mode_; }

private:
    void expect(PlannerState state, const char* step) const;
    void destructive(const std::string& cmd, const BlockDevice& device, const std::string& what);
    void commit_gpt(const BlockDevice& device);
    void commit_mbr(const BlockDevice& device);

    System& sys_;
    const DeviceCatalog& catalog_;
    PartitionOptions options_;
    PlannerState state_ = PlannerState::Unpartitioned;
    FirmwareMode mode_ = FirmwareMode::BIOS;
    PartitionPlan plan_;
};

enum class FilesystemKind {
    Fat32,
    Ext4
};

const char* to_string(FilesystemKind kind);

class Formatter {
public:
    explicit Formatter(System& sys);

    // Create a filesystem. Throws InstallError(DestructiveOpFailed).
    void format(const BlockDevice& partition, FilesystemKind kind, const std::string& label);

    // Format the partitions of a freshly committed plan
    void format_layout(FirmwareMode mode, const std::vector<BlockDevice>& partitions,
                       const PartitionOptions& options = {});

private:
    System& sys_;
};

}  // namespace disk
}  // namespace bedrock
