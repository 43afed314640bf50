#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "disk.hpp"
#include "system.hpp"

namespace bedrock {
namespace fake {

// One lsblk --pairs row
inline std::string lsblk_row(const std::string& name, std::uint64_t size, const std::string& type,
                             const std::string& parent = "", const std::string& mountpoint = "",
                             const std::string& model = "", bool ro = false) {
    return "NAME=\"" + name + "\" SIZE=\"" + std::to_string(size) + "\" TYPE=\"" + type +
           "\" RO=\"" + (ro ? "1" : "0") + "\" PKNAME=\"" + parent + "\" MOUNTPOINT=\"" +
           mountpoint + "\" MODEL=\"" + model + "\"\n";
}

// Scripted host. Commands succeed unless they contain one of `failing`;
// every command is recorded in order.
class FakeSystem : public System {
public:
    std::vector<std::string> commands;
    std::vector<std::string> failing;
    std::set<std::string> missing_tools;
    std::set<std::string> block_devices;
    std::set<std::string> paths;
    std::vector<std::string> created_dirs;
    std::vector<std::chrono::seconds> settles;

    // Device path -> kernel names it is stacked on, below the device itself.
    // Present block devices not listed here stand on their own.
    std::map<std::string, std::vector<std::string>> stacks;

    // Answers lsblk queries; receives the full command line
    std::function<std::optional<std::string>(const std::string&)> lsblk;

    int run(const std::string& cmd) override {
        commands.push_back(cmd);
        for (const auto& f : failing) {
            if (cmd.find(f) != std::string::npos) return 1;
        }
        return 0;
    }

    std::optional<std::string> capture(const std::string& cmd) override {
        commands.push_back(cmd);
        for (const auto& f : failing) {
            if (cmd.find(f) != std::string::npos) return std::nullopt;
        }
        if (cmd.rfind("lsblk --inverse", 0) == 0) {
            return inverse_listing(cmd);
        }
        if (cmd.rfind("lsblk", 0) == 0 && lsblk) {
            return lsblk(cmd);
        }
        return std::string();
    }

    bool exists(const std::string& path) override {
        return paths.count(path) > 0;
    }

    bool is_block_device(const std::string& path) override {
        return block_devices.count(path) > 0;
    }

    bool has_command(const std::string& name) override {
        return missing_tools.count(name) == 0;
    }

    bool create_directories(const std::string& path) override {
        created_dirs.push_back(path);
        return true;
    }

    void settle(std::chrono::seconds delay) override {
        settles.push_back(delay);
    }

    // lsblk --inverse: the device, then what it sits on
    std::optional<std::string> inverse_listing(const std::string& cmd) const {
        for (const auto& path : block_devices) {
            if (cmd.find(" " + path + " ") == std::string::npos) continue;
            std::string out = lsblk_row(path.substr(5), 0, "part");
            auto stack = stacks.find(path);
            if (stack != stacks.end()) {
                for (const auto& name : stack->second) out += lsblk_row(name, 0, "disk");
            }
            return out;
        }
        return std::nullopt;
    }

    // Index of the first recorded command containing `needle`, -1 if none
    int index_of(const std::string& needle) const {
        for (size_t i = 0; i < commands.size(); ++i) {
            if (commands[i].find(needle) != std::string::npos) return static_cast<int>(i);
        }
        return -1;
    }

    bool ran(const std::string& needle) const { return index_of(needle) >= 0; }

    int count(const std::string& needle) const {
        return static_cast<int>(std::count_if(commands.begin(), commands.end(),
            [&](const std::string& c) { return c.find(needle) != std::string::npos; }));
    }
};

// A disk whose partitions appear once it has been partitioned.
// `part_names` are the kernel names the fake kernel hands out.
struct FakeDisk {
    std::string name;
    std::vector<std::string> part_names;
    bool partitioned = false;
    std::map<std::string, std::string> mounted;   // partition -> mountpoint

    disk::BlockDevice device() const {
        disk::BlockDevice dev;
        dev.name = name;
        dev.size_bytes = 500107862016ULL;
        dev.model = "Test Disk";
        dev.kind = disk::DeviceKind::Disk;
        return dev;
    }

    std::string listing() const {
        std::string out = lsblk_row(name, 500107862016ULL, "disk", "", "", "Test Disk");
        if (partitioned) {
            for (const auto& part : part_names) {
                auto m = mounted.find(part);
                out += lsblk_row(part, 1000, "part", name, m == mounted.end() ? "" : m->second);
            }
        }
        return out;
    }
};

// Wire `target` into `sys`: partitioning commands on the disk make its
// partitions show up in later listings.
inline void attach(FakeSystem& sys, FakeDisk& target, std::size_t visible = SIZE_MAX) {
    sys.block_devices.insert("/dev/" + target.name);
    sys.lsblk = [&sys, &target, visible](const std::string& cmd) -> std::optional<std::string> {
        if (sys.ran("sgdisk -o") || sys.ran("sfdisk")) {
            target.partitioned = true;
        }
        if (cmd.find("/dev/" + target.name) == std::string::npos) {
            return target.listing();
        }
        FakeDisk shown = target;
        if (shown.part_names.size() > visible) shown.part_names.resize(visible);
        return shown.listing();
    };
}

}  // namespace fake
}  // namespace bedrock
