#include "mount.hpp"
#include "system.hpp"
#include "tui.hpp"
#include <algorithm>
#include <filesystem>
#include <sstream>

namespace bedrock {
namespace disk {

namespace {

std::string strip_trailing_slash(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

std::string join(const std::string& root, const std::string& sub) {
    return strip_trailing_slash(root) + "/" + sub;
}

bool same_path(const std::string& a, const std::string& b) {
    namespace fs = std::filesystem;
    return fs::path(strip_trailing_slash(a)).lexically_normal() ==
           fs::path(strip_trailing_slash(b)).lexically_normal();
}

bool is_beneath(const std::string& root, const std::string& target) {
    namespace fs = std::filesystem;
    fs::path rel = fs::path(strip_trailing_slash(target)).lexically_normal()
                       .lexically_relative(fs::path(strip_trailing_slash(root)).lexically_normal());
    if (rel.empty() || rel == ".") return false;
    return *rel.begin() != "..";
}

bool has_option(const std::string& options, const std::string& name) {
    std::istringstream iss(options);
    std::string opt;
    while (std::getline(iss, opt, ',')) {
        if (opt == name) return true;
    }
    return false;
}

}  // namespace

std::vector<MountTask> build_mount_tasks(FirmwareMode mode,
                                         const std::vector<BlockDevice>& partitions,
                                         const std::vector<SecondaryVolume>& secondary,
                                         const std::string& mount_root) {
    const size_t expected = mode == FirmwareMode::UEFI ? 2 : 1;
    if (partitions.size() < expected) {
        throw InstallError(ErrorKind::DiscoveryMismatch, "mount planning", "",
                           "expected " + std::to_string(expected) + " partitions, got " +
                           std::to_string(partitions.size()));
    }

    std::vector<MountTask> tasks;
    const std::string root = strip_trailing_slash(mount_root);

    if (mode == FirmwareMode::UEFI) {
        tasks.push_back({partitions[1], root, true});
        tasks.push_back({partitions[0], join(root, "boot"), true});
    } else {
        tasks.push_back({partitions[0], root, true});
    }

    // Fixed role order keeps the hierarchy the same whatever order the
    // volumes were picked in
    for (SecondaryRole role : kSecondaryRoles) {
        for (const auto& vol : secondary) {
            if (vol.role == role) {
                tasks.push_back({vol.device, join(root, role_directory(role)), false});
            }
        }
    }

    return tasks;
}

MountOrchestrator::MountOrchestrator(System& sys) : sys_(sys) {}

std::vector<MountResult> MountOrchestrator::mount(const std::vector<MountTask>& tasks) {
    if (tasks.empty()) {
        throw InstallError(ErrorKind::InvalidTarget, "mounting", "", "nothing to mount");
    }

    // Everything hangs off the root mount, so it has to come first
    const MountTask& root = tasks.front();
    if (!root.required) {
        throw InstallError(ErrorKind::InvalidTarget, "mounting", root.source.path(),
                           "first mount task must be the required root mount");
    }
    for (size_t i = 1; i < tasks.size(); ++i) {
        if (!is_beneath(root.target, tasks[i].target)) {
            throw InstallError(ErrorKind::InvalidTarget, "mounting", tasks[i].source.path(),
                               tasks[i].target + " is not beneath " + root.target);
        }
    }

    std::vector<MountResult> results;

    for (const auto& task : tasks) {
        MountResult result;
        result.task = task;
        const std::string src = task.source.path();

        // Optional volumes may have gone away since they were picked
        if (!task.required && !sys_.is_block_device(src)) {
            result.error = ErrorKind::OptionalMountFailed;
            result.message = src + " is not a block device; skipping " + task.target;
            tui::print_warning(result.message);
            results.push_back(result);
            continue;
        }

        tui::print_info("Mounting " + src + " to " + task.target);

        std::string failure;
        if (!sys_.create_directories(task.target)) {
            failure = "could not create " + task.target;
        } else if (sys_.run("mount " + shell_quote(src) + " " + shell_quote(task.target)) != 0) {
            failure = "failed to mount " + src + " to " + task.target;
        }

        if (!failure.empty()) {
            if (task.required) {
                tui::print_error(failure);
                rollback(results);
                throw InstallError(ErrorKind::RequiredMountFailed, "mounting", src, failure);
            }
            result.error = ErrorKind::OptionalMountFailed;
            result.message = failure;
            tui::print_warning(failure);
            results.push_back(result);
            continue;
        }

        result.mounted = true;
        results.push_back(result);
    }

    tui::print_success("Partitions mounted");
    return results;
}

void MountOrchestrator::rollback(const std::vector<MountResult>& results) {
    // Unmount in reverse order, children before the root
    for (auto it = results.rbegin(); it != results.rend(); ++it) {
        if (!it->mounted) continue;
        if (sys_.run("umount " + shell_quote(it->task.target) + " 2>/dev/null") != 0) {
            tui::print_warning("Could not unmount " + it->task.target + " during cleanup");
        }
    }
}

bool MountOrchestrator::unmount_all(const std::string& mount_root) {
    if (sys_.run("umount -R " + shell_quote(mount_root)) != 0) {
        tui::print_warning("Unmount of " + mount_root + " failed; you may need to unmount manually.");
        return false;
    }
    return true;
}

std::string add_nofail(const std::string& fstab, const std::vector<std::string>& mountpoints) {
    std::istringstream iss(fstab);
    std::ostringstream out;
    std::string line;

    while (std::getline(iss, line)) {
        std::istringstream fields_stream(line);
        std::vector<std::string> fields;
        std::string field;
        while (fields_stream >> field) {
            fields.push_back(field);
        }

        bool matches = fields.size() >= 4 && fields[0][0] != '#' &&
                       std::any_of(mountpoints.begin(), mountpoints.end(),
                                   [&](const std::string& mp) { return same_path(mp, fields[1]); });

        if (matches && !has_option(fields[3], "nofail")) {
            fields[3] += ",nofail";
            std::string rebuilt;
            for (size_t i = 0; i < fields.size(); ++i) {
                if (i > 0) rebuilt += "\t";
                rebuilt += fields[i];
            }
            out << rebuilt << "\n";
        } else {
            out << line << "\n";
        }
    }

    return out.str();
}

}  // namespace disk
}  // namespace bedrock
