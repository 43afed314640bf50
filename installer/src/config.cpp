#include "config.hpp"
#include "errors.hpp"
#include <toml++/toml.hpp>
#include <algorithm>
#include <sstream>

namespace bedrock {

namespace {

[[noreturn]] void reject(const std::string& message) {
    throw InstallError(ErrorKind::ConfigInvalid, "configuration", "", message);
}

Config from_table(const toml::table& data) {
    Config cfg;

    // [install] section
    if (auto install = data["install"].as_table()) {
        if (auto v = (*install)["target_disk"].value<std::string>())
            cfg.install.target_disk = *v;
        if (auto v = (*install)["mount_point"].value<std::string>())
            cfg.install.mount_point = *v;
        if (auto v = (*install)["state_file"].value<std::string>())
            cfg.install.state_file = *v;
        if (auto v = (*install)["chroot_script"].value<std::string>())
            cfg.install.chroot_script = *v;
        if (auto arr = (*install)["packages"].as_array()) {
            cfg.install.packages.clear();
            for (const auto& item : *arr) {
                if (auto v = item.value<std::string>())
                    cfg.install.packages.push_back(*v);
            }
        }
    }

    // [disk] section
    if (auto disk = data["disk"].as_table()) {
        if (auto v = (*disk)["efi_size_mib"].value<int64_t>()) {
            if (*v <= 0) reject("disk.efi_size_mib must be positive");
            cfg.disk.efi_size_mib = static_cast<std::uint64_t>(*v);
        }
        if (auto v = (*disk)["efi_label"].value<std::string>())
            cfg.disk.efi_label = *v;
        if (auto v = (*disk)["root_label"].value<std::string>())
            cfg.disk.root_label = *v;
        if (auto v = (*disk)["settle_seconds"].value<int64_t>()) {
            // udev needs a moment after the table re-read; longer waits buy nothing
            if (*v < 1) reject("disk.settle_seconds must be at least 1");
            cfg.disk.settle_seconds = static_cast<int>(std::min<int64_t>(*v, kMaxSettleSeconds));
        }
    }

    // [secondary] section, keyed by role. Unknown roles are an error rather
    // than silently ignored volumes.
    if (auto secondary = data["secondary"].as_table()) {
        for (auto&& [key, node] : *secondary) {
            std::string name(key.str());
            auto role = disk::role_from_key(name);
            if (!role) {
                reject("unknown secondary volume '" + name + "' (expected storage or windows)");
            }
            auto path = node.value<std::string>();
            if (!path) {
                reject("secondary." + name + " must be a device path");
            }
            if (!path->empty()) {
                cfg.secondary[*role] = *path;
            }
        }
    }

    if (cfg.install.mount_point.empty()) reject("install.mount_point must not be empty");
    if (cfg.disk.root_label.empty()) reject("disk.root_label must not be empty");
    if (cfg.disk.efi_label.size() > 11) reject("disk.efi_label is longer than a FAT label allows");

    return cfg;
}

std::string describe(const toml::parse_error& err) {
    std::ostringstream oss;
    oss << err.description() << " (line " << err.source().begin.line << ")";
    return oss.str();
}

}  // namespace

Config Config::load(const std::string& path) {
    try {
        Config cfg = from_table(toml::parse_file(path));
        cfg.loaded_from_file = true;
        return cfg;
    } catch (const toml::parse_error& err) {
        reject("error parsing " + path + ": " + describe(err));
    }
}

Config Config::parse(std::string_view text) {
    try {
        return from_table(toml::parse(text));
    } catch (const toml::parse_error& err) {
        reject("error parsing config: " + describe(err));
    }
}

disk::PartitionOptions Config::partition_options() const {
    disk::PartitionOptions options;
    options.efi_size_mib = disk.efi_size_mib;
    options.efi_label = disk.efi_label;
    options.root_label = disk.root_label;
    options.settle_delay = std::chrono::seconds(disk.settle_seconds);
    return options;
}

}  // namespace bedrock
