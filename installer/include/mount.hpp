#pragma once

#include <optional>
#include <string>
#include <vector>
#include "disk.hpp"
#include "errors.hpp"

namespace bedrock {

class System;

namespace disk {

struct MountTask {
    BlockDevice source;
    std::string target;
    bool required = true;
};

struct MountResult {
    MountTask task;
    bool mounted = false;
    std::optional<ErrorKind> error;   // OptionalMountFailed when skipped
    std::string message;
};

// Root, then /boot (UEFI), then the secondary volumes.
// `partitions` are the rediscovered partitions in plan order.
std::vector<MountTask> build_mount_tasks(FirmwareMode mode,
                                         const std::vector<BlockDevice>& partitions,
                                         const std::vector<SecondaryVolume>& secondary,
                                         const std::string& mount_root = "/mnt");

class MountOrchestrator {
public:
    explicit MountOrchestrator(System& sys);

    // Mount tasks in order. The first task must be the required root mount
    // and every other target must live beneath it.
    //
    // Optional failures come back as results with mounted == false.
    // A required failure unmounts what this call mounted and throws
    // InstallError(RequiredMountFailed).
    std::vector<MountResult> mount(const std::vector<MountTask>& tasks);

    // Recursive unmount of the whole hierarchy
    bool unmount_all(const std::string& mount_root);

private:
    void rollback(const std::vector<MountResult>& results);

    System& sys_;
};

// Append "nofail" to the options of fstab entries mounted at `mountpoints`
std::string add_nofail(const std::string& fstab, const std::vector<std::string>& mountpoints);

}  // namespace disk
}  // namespace bedrock
