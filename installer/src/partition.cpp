#include "partition.hpp"
#include "errors.hpp"
#include "system.hpp"
#include "tui.hpp"
#include <iterator>
#include <stdexcept>
#include <utility>

namespace bedrock {
namespace disk {

namespace {

const char* kCommonTools[] = {"lsblk", "wipefs", "partprobe", "mkfs.ext4", "mount", "umount"};
const char* kUefiTools[] = {"sgdisk", "mkfs.fat"};
const char* kBiosTools[] = {"sfdisk"};

std::string mib(std::uint64_t value) {
    return std::to_string(value) + "M";
}

}  // namespace

PartitionPlan make_plan(FirmwareMode mode, const PartitionOptions& options) {
    PartitionPlan plan;

    if (mode == FirmwareMode::UEFI) {
        PlanEntry efi;
        efi.index = 1;
        efi.size_mib = options.efi_size_mib;
        efi.type_code = "ef00";
        efi.label = options.efi_label;
        plan.push_back(efi);

        // Root takes what is left after the ESP
        PlanEntry root;
        root.index = 2;
        root.type_code = "8300";
        root.label = options.root_label;
        plan.push_back(root);
    } else {
        PlanEntry root;
        root.index = 1;
        root.type_code = "83";
        root.label = options.root_label;
        root.bootable = true;
        plan.push_back(root);
    }

    return plan;
}

std::vector<std::string> required_tools(FirmwareMode mode) {
    std::vector<std::string> tools(std::begin(kCommonTools), std::end(kCommonTools));
    if (mode == FirmwareMode::UEFI) {
        tools.insert(tools.end(), std::begin(kUefiTools), std::end(kUefiTools));
    } else {
        tools.insert(tools.end(), std::begin(kBiosTools), std::end(kBiosTools));
    }
    return tools;
}

void check_tools(System& sys, FirmwareMode mode) {
    for (const auto& tool : required_tools(mode)) {
        if (!sys.has_command(tool)) {
            throw InstallError(ErrorKind::ToolMissing, "pre-flight check", "",
                               "required command '" + tool + "' not found");
        }
    }
}

const char* to_string(PlannerState state) {
    switch (state) {
        case PlannerState::Unpartitioned: return "Unpartitioned";
        case PlannerState::TableCleared:  return "TableCleared";
        case PlannerState::Planned:       return "Planned";
        case PlannerState::Committed:     return "Committed";
        case PlannerState::Rediscovered:  return "Rediscovered";
    }
    return "Unknown";
}

PartitionPlanner::PartitionPlanner(System& sys, const DeviceCatalog& catalog,
                                   PartitionOptions options)
    : sys_(sys), catalog_(catalog), options_(std::move(options)) {}

std::vector<BlockDevice> PartitionPlanner::run(const BlockDevice& device, FirmwareMode mode) {
    clear_table(device);
    build_plan(mode);
    commit(device);
    return rediscover(device);
}

void PartitionPlanner::expect(PlannerState state, const char* step) const {
    if (state_ != state) {
        throw std::logic_error(std::string(step) + " called in state " + to_string(state_) +
                               ", expected " + to_string(state));
    }
}

void PartitionPlanner::destructive(const std::string& cmd, const BlockDevice& device,
                                   const std::string& what) {
    if (sys_.run(cmd) != 0) {
        tui::print_error(what + " failed on " + device.path());
        throw InstallError(ErrorKind::DestructiveOpFailed, "partitioning", device.path(),
                           what + " failed");
    }
}

void PartitionPlanner::clear_table(const BlockDevice& device) {
    // Allowed from any state: a new run always starts from a clean slate
    state_ = PlannerState::Unpartitioned;
    plan_.clear();

    // Release anything still using the disk (a previous run's mounts, swap).
    // A busy disk keeps its old table in the kernel, so nothing gets wiped
    // until every child is released.
    tui::print_info("Checking for mounted partitions on " + device.path() + "...");
    for (const auto& part : catalog_.list_partition_children(device)) {
        if (!part.mountpoint) continue;
        std::string failure;
        if (*part.mountpoint == "[SWAP]") {
            if (sys_.run("swapoff " + shell_quote(part.path()) + " 2>/dev/null") != 0) {
                failure = "could not disable swap";
            }
        } else if (sys_.run("umount -R " + shell_quote(*part.mountpoint) + " 2>/dev/null") != 0) {
            failure = "could not unmount " + *part.mountpoint;
        }
        if (!failure.empty()) {
            tui::print_error(part.path() + " is still in use: " + failure);
            throw InstallError(ErrorKind::DestructiveOpFailed, "partitioning", part.path(),
                               failure + "; refusing to wipe " + device.path());
        }
    }

    tui::print_info("Wiping filesystem signatures on " + device.path() + " (this will destroy data!)");
    destructive("wipefs --all --force " + shell_quote(device.path()), device, "wipefs");

    state_ = PlannerState::TableCleared;
}

const PartitionPlan& PartitionPlanner::build_plan(FirmwareMode mode) {
    expect(PlannerState::TableCleared, "build_plan");
    mode_ = mode;
    plan_ = disk::make_plan(mode, options_);
    state_ = PlannerState::Planned;
    return plan_;
}

void PartitionPlanner::commit(const BlockDevice& device) {
    expect(PlannerState::Planned, "commit");

    if (mode_ == FirmwareMode::UEFI) {
        commit_gpt(device);
    } else {
        commit_mbr(device);
    }

    state_ = PlannerState::Committed;
}

void PartitionPlanner::commit_gpt(const BlockDevice& device) {
    const std::string dev = shell_quote(device.path());

    tui::print_info("Creating GPT layout on " + device.path() + ": EFI " +
                    mib(options_.efi_size_mib) + " + root (remaining)");
    destructive("sgdisk --zap-all " + dev + " >/dev/null 2>&1", device, "sgdisk --zap-all");
    destructive("sgdisk -o " + dev + " >/dev/null 2>&1", device, "sgdisk -o");

    for (const auto& entry : plan_) {
        const std::string num = std::to_string(entry.index);
        std::string start = entry.start_mib == 0 ? "0" : mib(entry.start_mib);
        std::string end = entry.size_mib ? "+" + mib(*entry.size_mib) : "0";

        std::string cmd = "sgdisk -n " + num + ":" + start + ":" + end +
                          " -t " + num + ":" + entry.type_code +
                          " -c " + shell_quote(num + ":" + entry.label) +
                          " " + dev + " >/dev/null 2>&1";
        destructive(cmd, device, "creating partition " + num + " (" + entry.label + ")");
    }
}

void PartitionPlanner::commit_mbr(const BlockDevice& device) {
    tui::print_info("Creating MBR layout on " + device.path());

    // sfdisk script: one "start, size, type[, *]" line per entry
    std::string script = "label: dos\\n";
    for (const auto& entry : plan_) {
        std::string start = entry.start_mib == 0 ? "" : std::to_string(entry.start_mib) + "MiB";
        std::string size = entry.size_mib ? std::to_string(*entry.size_mib) + "MiB" : "";
        script += start + "," + size + "," + entry.type_code;
        if (entry.bootable) script += ",*";
        script += "\\n";
    }

    destructive("printf '" + script + "' | sfdisk --wipe always --wipe-partitions always " +
                shell_quote(device.path()) + " >/dev/null 2>&1",
                device, "sfdisk");
}

std::vector<BlockDevice> PartitionPlanner::rediscover(const BlockDevice& device) {
    expect(PlannerState::Committed, "rediscover");

    // Force kernel to re-read partition table. Node creation is asynchronous,
    // so give udev a fixed window rather than assuming the names exist.
    if (sys_.run("partprobe " + shell_quote(device.path()) + " 2>/dev/null") != 0) {
        tui::print_warning("partprobe returned non-zero for " + device.path());
    }
    sys_.settle(options_.settle_delay);

    std::vector<BlockDevice> children;
    try {
        children = catalog_.list_partition_children(device);
    } catch (const InstallError& err) {
        if (err.kind() != ErrorKind::InvalidTarget) throw;
        tui::print_error("Could not list partitions on " + device.path());
        throw InstallError(ErrorKind::DiscoveryMismatch, "partition rediscovery", device.path(),
                           "lsblk failed after the new table was written");
    }
    if (children.size() < plan_.size()) {
        tui::print_error("Failed to detect new partitions on " + device.path());
        throw InstallError(ErrorKind::DiscoveryMismatch, "partition rediscovery", device.path(),
                           "expected " + std::to_string(plan_.size()) + " partitions, found " +
                           std::to_string(children.size()));
    }

    // The Nth child is the Nth plan entry
    children.resize(plan_.size());
    state_ = PlannerState::Rediscovered;

    tui::print_success("Partitioning complete");
    return children;
}

const char* to_string(FilesystemKind kind) {
    return kind == FilesystemKind::Fat32 ? "FAT32" : "ext4";
}

Formatter::Formatter(System& sys) : sys_(sys) {}

void Formatter::format(const BlockDevice& partition, FilesystemKind kind, const std::string& label) {
    const std::string dev = shell_quote(partition.path());
    std::string cmd;

    if (kind == FilesystemKind::Fat32) {
        cmd = "mkfs.fat -F32 -n " + shell_quote(label) + " " + dev;
    } else {
        cmd = "mkfs.ext4 -F -L " + shell_quote(label) + " " + dev;
    }

    tui::print_info("Formatting " + partition.path() + " (" + to_string(kind) +
                    ", label=" + label + ")");
    if (sys_.run(cmd + " >/dev/null") != 0) {
        tui::print_error(std::string(kind == FilesystemKind::Fat32 ? "mkfs.fat" : "mkfs.ext4") +
                         " failed on " + partition.path());
        throw InstallError(ErrorKind::DestructiveOpFailed, "formatting", partition.path(),
                           std::string("could not create ") + to_string(kind) + " filesystem");
    }
}

void Formatter::format_layout(FirmwareMode mode, const std::vector<BlockDevice>& partitions,
                              const PartitionOptions& options) {
    const size_t expected = mode == FirmwareMode::UEFI ? 2 : 1;
    if (partitions.size() < expected) {
        throw InstallError(ErrorKind::DiscoveryMismatch, "formatting", "",
                           "expected " + std::to_string(expected) + " partitions, got " +
                           std::to_string(partitions.size()));
    }

    if (mode == FirmwareMode::UEFI) {
        format(partitions[0], FilesystemKind::Fat32, options.efi_label);
        format(partitions[1], FilesystemKind::Ext4, options.root_label);
    } else {
        format(partitions[0], FilesystemKind::Ext4, options.root_label);
    }

    tui::print_success("Formatting complete");
}

}  // namespace disk
}  // namespace bedrock
