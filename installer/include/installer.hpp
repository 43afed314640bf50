#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "disk.hpp"
#include "errors.hpp"
#include "mount.hpp"
#include "partition.hpp"

namespace bedrock {

class System;

// What the disk preparation produced
struct PreparedTarget {
    disk::FirmwareMode mode = disk::FirmwareMode::BIOS;
    disk::PartitionPlan plan;
    std::vector<disk::BlockDevice> partitions;   // one per plan entry
    std::vector<disk::MountResult> mounts;

    // True if any optional volume was left out
    bool degraded() const;
};

class Installer {
public:
    using ProgressCallback = std::function<void(int step, int total, const std::string& message)>;

    Installer(const Config& config, disk::TargetSelection selection, System& sys);

    // Set progress callback
    void set_progress_callback(ProgressCallback callback);

    // Run the full installation
    bool install();

    // Individual installation steps
    bool prepare_disk();
    bool install_base_system();
    bool generate_fstab();
    bool handoff();
    bool finalize();

    const std::optional<PreparedTarget>& prepared() const { return prepared_; }

    // Get error message if installation failed
    std::string get_error() const { return error_message_; }
    std::optional<ErrorKind> get_error_kind() const { return error_kind_; }

private:
    Config config_;
    disk::TargetSelection selection_;
    System& sys_;
    ProgressCallback progress_callback_;
    std::string error_message_;
    std::optional<ErrorKind> error_kind_;
    std::optional<PreparedTarget> prepared_;

    bool run_command(const std::string& cmd);
    bool run_chroot(const std::string& cmd);
    bool fail(const InstallError& err);
    bool fail(const std::string& stage, const std::string& message);
    void report_progress(int step, int total, const std::string& message);
    std::string target_path(const std::string& sub) const;
};

}  // namespace bedrock
