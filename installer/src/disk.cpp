#include "disk.hpp"
#include "errors.hpp"
#include "system.hpp"
#include <cstdio>
#include <sstream>

namespace bedrock {
namespace disk {

namespace {

const std::string kLsblk = "lsblk --pairs --bytes --output NAME,SIZE,TYPE,RO,PKNAME,MOUNTPOINT,MODEL";
const std::string kLsblkInverse = "lsblk --inverse --pairs --output NAME,TYPE,PKNAME";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// lsblk escapes unsafe characters as \xNN
std::string unescape(const std::string& value) {
    std::string out;
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '\\' && i + 3 < value.size() && value[i + 1] == 'x') {
            int hi = hex_value(value[i + 2]);
            int lo = hex_value(value[i + 3]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 3;
                continue;
            }
        }
        out += value[i];
    }
    return out;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Value of KEY="..." in one --pairs row, empty if absent
std::string pair_value(const std::string& line, const std::string& key) {
    const std::string needle = key + "=\"";
    size_t pos = 0;
    while ((pos = line.find(needle, pos)) != std::string::npos) {
        if (pos == 0 || line[pos - 1] == ' ') {
            size_t start = pos + needle.size();
            size_t close = line.find('"', start);
            if (close == std::string::npos) return "";
            return unescape(line.substr(start, close - start));
        }
        pos += needle.size();
    }
    return "";
}

std::optional<BlockDevice> parse_row(const std::string& line) {
    BlockDevice dev;
    std::string type;
    size_t pos = 0;

    while (pos < line.size()) {
        size_t eq = line.find("=\"", pos);
        if (eq == std::string::npos) break;
        size_t close = line.find('"', eq + 2);
        if (close == std::string::npos) break;

        std::string key = trim(line.substr(pos, eq - pos));
        std::string value = unescape(line.substr(eq + 2, close - eq - 2));
        pos = close + 1;

        if (key == "NAME") {
            dev.name = value;
        } else if (key == "SIZE") {
            try {
                dev.size_bytes = value.empty() ? 0 : std::stoull(value);
            } catch (const std::exception&) {
                dev.size_bytes = 0;
            }
        } else if (key == "TYPE") {
            type = value;
        } else if (key == "RO") {
            dev.read_only = (value == "1");
        } else if (key == "PKNAME") {
            dev.parent = value;
        } else if (key == "MOUNTPOINT") {
            if (!value.empty()) dev.mountpoint = value;
        } else if (key == "MODEL") {
            dev.model = trim(value);
        }
    }

    if (dev.name.empty()) {
        return std::nullopt;
    }
    if (type == "disk") {
        dev.kind = DeviceKind::Disk;
    } else if (type == "part") {
        dev.kind = DeviceKind::Partition;
    } else {
        return std::nullopt;
    }
    return dev;
}

}  // namespace

const char* to_string(FirmwareMode mode) {
    return mode == FirmwareMode::UEFI ? "UEFI" : "BIOS";
}

FirmwareMode detect_firmware(System& sys) {
    return sys.exists(kEfiVarsPath) ? FirmwareMode::UEFI : FirmwareMode::BIOS;
}

const char* role_key(SecondaryRole role) {
    switch (role) {
        case SecondaryRole::Storage: return "storage";
        case SecondaryRole::Windows: return "windows";
    }
    return "";
}

const char* role_directory(SecondaryRole role) {
    switch (role) {
        case SecondaryRole::Storage: return "Storage";
        case SecondaryRole::Windows: return "Windows";
    }
    return "";
}

std::optional<SecondaryRole> role_from_key(const std::string& key) {
    for (SecondaryRole role : kSecondaryRoles) {
        if (key == role_key(role)) {
            return role;
        }
    }
    return std::nullopt;
}

void validate_selection(const TargetSelection& selection, System& sys) {
    const BlockDevice& root = selection.root;
    const std::string stage = "target selection";

    if (root.name.empty()) {
        throw InstallError(ErrorKind::InvalidTarget, stage, "", "no root device selected");
    }
    if (!sys.is_block_device(root.path())) {
        throw InstallError(ErrorKind::InvalidTarget, stage, root.path(), "not a block device");
    }
    if (root.kind != DeviceKind::Disk) {
        throw InstallError(ErrorKind::InvalidTarget, stage, root.path(),
                           "root must be a whole disk, not a partition");
    }
    if (root.read_only) {
        throw InstallError(ErrorKind::InvalidTarget, stage, root.path(), "device is read-only");
    }

    for (size_t i = 0; i < selection.secondary.size(); ++i) {
        const SecondaryVolume& vol = selection.secondary[i];
        const BlockDevice& dev = vol.device;

        if (dev.name.empty()) {
            throw InstallError(ErrorKind::InvalidTarget, stage, "",
                               std::string(role_directory(vol.role)) + " volume has no device");
        }
        if (dev.name == root.name) {
            throw InstallError(ErrorKind::InvalidTarget, stage, dev.path(),
                               std::string(role_directory(vol.role)) + " volume is the root disk");
        }
        if (dev.parent == root.name || root.parent == dev.name) {
            throw InstallError(ErrorKind::InvalidTarget, stage, dev.path(),
                               std::string(role_directory(vol.role)) +
                               " volume lives on the root disk, which will be erased");
        }

        // Catch volumes stacked on the root disk (LV on sda3, crypt on sda2)
        if (sys.is_block_device(dev.path())) {
            auto chain = DeviceCatalog(sys).ancestry(dev.path());
            if (!chain) {
                throw InstallError(ErrorKind::InvalidTarget, stage, dev.path(),
                                   "could not resolve what " + dev.path() + " is stacked on");
            }
            for (const auto& name : *chain) {
                if (name == root.name) {
                    throw InstallError(ErrorKind::InvalidTarget, stage, dev.path(),
                                       std::string(role_directory(vol.role)) +
                                       " volume is stacked on the root disk, which will be erased");
                }
            }
        }

        for (size_t j = 0; j < i; ++j) {
            const SecondaryVolume& other = selection.secondary[j];
            if (other.role == vol.role) {
                throw InstallError(ErrorKind::InvalidTarget, stage, dev.path(),
                                   std::string("more than one ") + role_directory(vol.role) + " volume");
            }
            if (other.device.name == dev.name) {
                throw InstallError(ErrorKind::InvalidTarget, stage, dev.path(),
                                   "same device selected for two volumes");
            }
        }
    }
}

std::vector<BlockDevice> parse_lsblk_pairs(const std::string& output) {
    std::vector<BlockDevice> devices;
    std::istringstream iss(output);
    std::string line;

    while (std::getline(iss, line)) {
        if (trim(line).empty()) continue;
        if (auto dev = parse_row(line)) {
            devices.push_back(*dev);
        }
    }
    return devices;
}

DeviceCatalog::DeviceCatalog(System& sys) : sys_(sys) {}

std::vector<BlockDevice> DeviceCatalog::query(const std::string& args) const {
    if (!sys_.has_command("lsblk")) {
        throw InstallError(ErrorKind::ToolMissing, "device listing", "",
                           "lsblk is not available");
    }

    auto output = sys_.capture(kLsblk + args + " 2>/dev/null");
    if (!output) {
        throw InstallError(ErrorKind::InvalidTarget, "device listing", "",
                           "lsblk" + args + " failed");
    }
    return parse_lsblk_pairs(*output);
}

std::vector<BlockDevice> DeviceCatalog::list_disks() const {
    std::vector<BlockDevice> disks;
    for (const auto& dev : query(" --nodeps")) {
        if (dev.kind == DeviceKind::Disk) {
            disks.push_back(dev);
        }
    }
    return disks;
}

std::vector<BlockDevice> DeviceCatalog::list_partition_children(const BlockDevice& parent) const {
    // lsblk reports the device itself first, then its descendants. Only
    // direct children by kernel parent name count; the names themselves
    // are never pattern-matched (sda1 vs nvme0n1p1).
    std::vector<BlockDevice> children;
    for (const auto& dev : query(" " + shell_quote(parent.path()))) {
        if (dev.kind == DeviceKind::Partition && dev.parent == parent.name) {
            children.push_back(dev);
        }
    }
    return children;
}

std::vector<BlockDevice> DeviceCatalog::list_partitions() const {
    std::vector<BlockDevice> parts;
    for (const auto& dev : query("")) {
        if (dev.kind == DeviceKind::Partition) {
            parts.push_back(dev);
        }
    }
    return parts;
}

std::optional<BlockDevice> DeviceCatalog::find_device(const std::string& path) const {
    if (!sys_.has_command("lsblk")) {
        throw InstallError(ErrorKind::ToolMissing, "device listing", path,
                           "lsblk is not available");
    }

    auto output = sys_.capture(kLsblk + " --nodeps " + shell_quote(path) + " 2>/dev/null");
    if (!output) {
        return std::nullopt;
    }
    auto devices = parse_lsblk_pairs(*output);
    if (devices.empty()) {
        return std::nullopt;
    }
    return devices.front();
}

std::optional<std::vector<std::string>> DeviceCatalog::ancestry(const std::string& path) const {
    if (!sys_.has_command("lsblk")) {
        throw InstallError(ErrorKind::ToolMissing, "device listing", path,
                           "lsblk is not available");
    }

    auto output = sys_.capture(kLsblkInverse + " " + shell_quote(path) + " 2>/dev/null");
    if (!output) {
        return std::nullopt;
    }

    // Every row counts here, whatever its TYPE
    std::vector<std::string> names;
    std::istringstream iss(*output);
    std::string line;
    while (std::getline(iss, line)) {
        std::string name = pair_value(line, "NAME");
        if (!name.empty()) names.push_back(name);
    }
    if (names.empty()) {
        return std::nullopt;
    }
    return names;
}

std::string human_size(std::uint64_t bytes) {
    const char* units[] = {"B", "K", "M", "G", "T", "P"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 5) {
        value /= 1024.0;
        ++unit;
    }

    char buf[32];
    if (unit == 0) {
        std::snprintf(buf, sizeof(buf), "%lluB", static_cast<unsigned long long>(bytes));
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f%s", value, units[unit]);
    }
    return buf;
}

}  // namespace disk
}  // namespace bedrock
