#include "installer.hpp"
#include "state.hpp"
#include "system.hpp"
#include "tui.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace bedrock {

namespace {

bool read_file(const std::string& path, std::string& content) {
    std::ifstream file(path);
    if (!file) return false;
    std::ostringstream oss;
    oss << file.rdbuf();
    content = oss.str();
    return true;
}

bool write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::trunc);
    if (!file) return false;
    file << content;
    return static_cast<bool>(file.flush());
}

}  // namespace

bool PreparedTarget::degraded() const {
    for (const auto& m : mounts) {
        if (!m.mounted) return true;
    }
    return false;
}

Installer::Installer(const Config& config, disk::TargetSelection selection, System& sys)
    : config_(config), selection_(std::move(selection)), sys_(sys) {}

void Installer::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = callback;
}

void Installer::report_progress(int step, int total, const std::string& message) {
    if (progress_callback_) {
        progress_callback_(step, total, message);
    } else {
        tui::print_step(step, total, message);
    }
}

bool Installer::run_command(const std::string& cmd) {
    return sys_.run(cmd) == 0;
}

bool Installer::run_chroot(const std::string& cmd) {
    return run_command("arch-chroot " + shell_quote(config_.install.mount_point) + " " + cmd);
}

bool Installer::fail(const InstallError& err) {
    error_kind_ = err.kind();
    error_message_ = std::string(to_string(err.kind())) + ": " + err.what();
    tui::print_error(error_message_);
    return false;
}

bool Installer::fail(const std::string& stage, const std::string& message) {
    return fail(InstallError(ErrorKind::InstallFailed, stage, "", message));
}

std::string Installer::target_path(const std::string& sub) const {
    std::string root = config_.install.mount_point;
    while (root.size() > 1 && root.back() == '/') root.pop_back();
    return root + "/" + sub;
}

bool Installer::install() {
    const int total_steps = 5;

    // Step 1: Prepare disk
    report_progress(1, total_steps, "Preparing disk...");
    if (!prepare_disk()) {
        return false;
    }

    // Step 2: Install base system
    report_progress(2, total_steps, "Installing base system...");
    if (!install_base_system()) {
        return false;
    }

    // Step 3: Generate fstab
    report_progress(3, total_steps, "Generating fstab...");
    if (!generate_fstab()) {
        return false;
    }

    // Step 4: Configure the new root from inside
    report_progress(4, total_steps, "Handing off to the installed system...");
    if (!handoff()) {
        return false;
    }

    // Step 5: Finalize
    report_progress(5, total_steps, "Finalizing...");
    return finalize();
}

bool Installer::prepare_disk() {
    prepared_.reset();

    disk::FirmwareMode mode = disk::FirmwareMode::BIOS;
    disk::PartitionOptions options = config_.partition_options();
    std::vector<disk::BlockDevice> partitions;
    disk::PartitionPlan plan;
    std::vector<disk::MountResult> mounts;

    try {
        disk::validate_selection(selection_, sys_);

        // Decided once; everything below depends on it
        tui::print_info("Detected firmware: checking for UEFI...");
        mode = disk::detect_firmware(sys_);
        tui::print_info(std::string("System appears to be ") + disk::to_string(mode) + ".");

        // Nothing destructive happens until every tool is known to exist
        disk::check_tools(sys_, mode);

        disk::DeviceCatalog catalog(sys_);
        disk::PartitionPlanner planner(sys_, catalog, options);
        partitions = planner.run(selection_.root, mode);
        plan = planner.plan();

        disk::Formatter formatter(sys_);
        formatter.format_layout(mode, partitions, options);

        auto tasks = disk::build_mount_tasks(mode, partitions, selection_.secondary,
                                             config_.install.mount_point);
        disk::MountOrchestrator orchestrator(sys_);
        mounts = orchestrator.mount(tasks);
    } catch (const InstallError& err) {
        return fail(err);
    }

    try {
        StateRecorder(config_.install.state_file).record(mode);
    } catch (const InstallError& err) {
        if (!disk::MountOrchestrator(sys_).unmount_all(config_.install.mount_point)) {
            tui::print_warning(config_.install.mount_point + " is still mounted");
        }
        return fail(err);
    }

    prepared_ = PreparedTarget{mode, plan, partitions, mounts};

    for (const auto& m : mounts) {
        if (m.error) {
            tui::print_warning(std::string(to_string(*m.error)) + ": " + m.message);
        }
    }
    tui::print_success(std::string(disk::to_string(mode)) + " partitioning and mounting done.");
    return true;
}

bool Installer::install_base_system() {
    const std::string& root = config_.install.mount_point;

    if (!run_command("mountpoint -q " + shell_quote(root))) {
        return fail("base install", root + " is not mounted");
    }
    if (config_.install.packages.empty()) {
        return fail("base install", "package list is empty");
    }

    // Build pacstrap command
    std::string cmd = "pacstrap -K " + shell_quote(root);
    for (const auto& pkg : config_.install.packages) {
        cmd += " " + shell_quote(pkg);
    }

    tui::print_info("Installing packages with pacstrap...");
    tui::print_info("This may take several minutes...");

    if (!run_command(cmd)) {
        return fail("base install", "pacstrap failed");
    }
    return true;
}

bool Installer::generate_fstab() {
    const std::string etc = target_path("etc");
    const std::string fstab = target_path("etc/fstab");

    if (!sys_.create_directories(etc)) {
        return fail("fstab", "could not create " + etc);
    }
    if (!run_command("genfstab -U " + shell_quote(config_.install.mount_point) +
                     " > " + shell_quote(fstab))) {
        return fail("fstab", "genfstab failed");
    }

    // A missing Storage/Windows volume must not stop the new system booting
    std::vector<std::string> optional_targets;
    for (disk::SecondaryRole role : disk::kSecondaryRoles) {
        optional_targets.push_back(std::string("/") + disk::role_directory(role));
    }

    std::string content;
    if (!read_file(fstab, content)) {
        return fail("fstab", "could not read " + fstab);
    }
    if (!write_file(fstab, disk::add_nofail(content, optional_targets))) {
        return fail("fstab", "could not write " + fstab);
    }
    return true;
}

bool Installer::handoff() {
    namespace fs = std::filesystem;

    // Files copied into the new root; removed again whatever happens
    std::vector<std::string> copied;
    auto copy_in = [&](const std::string& src) -> bool {
        std::error_code ec;
        std::string dst = target_path(fs::path(src).filename().string());
        fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            tui::print_error("Failed to copy " + src + " into " + config_.install.mount_point +
                             ": " + ec.message());
            return false;
        }
        copied.push_back(dst);
        return true;
    };
    auto cleanup = [&]() {
        for (const auto& path : copied) {
            std::error_code ec;
            fs::remove(path, ec);
            if (ec) tui::print_warning("Could not remove " + path);
        }
    };

    if (!copy_in(config_.install.state_file)) {
        cleanup();
        return fail("handoff", "could not copy state file");
    }

    bool ok = true;
    if (!config_.install.chroot_script.empty()) {
        if (!copy_in(config_.install.chroot_script)) {
            cleanup();
            return fail("handoff", "could not copy chroot script");
        }
        std::string script = "/" + fs::path(config_.install.chroot_script).filename().string();
        tui::print_info("Running " + script + " inside " + config_.install.mount_point);
        ok = run_chroot("/bin/bash " + shell_quote(script));
    }

    cleanup();
    if (!ok) {
        return fail("handoff", "chroot script failed");
    }
    return true;
}

bool Installer::finalize() {
    // Unmount politely; a leftover mount is not an install failure
    if (!disk::MountOrchestrator(sys_).unmount_all(config_.install.mount_point)) {
        tui::print_info("Run 'umount -R " + config_.install.mount_point + "' before rebooting.");
    }
    tui::print_success("Installation finished.");
    return true;
}

}  // namespace bedrock
