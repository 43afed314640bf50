#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <filesystem>
#include <unistd.h>

#include "config.hpp"
#include "disk.hpp"
#include "errors.hpp"
#include "installer.hpp"
#include "system.hpp"
#include "tui.hpp"

using namespace bedrock;

namespace {

struct Options {
    std::string config_path;
    bool prepare_only = false;
    bool assume_yes = false;
};

void print_usage(const char* program) {
    std::cout << "\n";
    std::cout << tui::colors::BOLD << "Usage:" << tui::colors::RESET << "\n";
    std::cout << "  " << program << " [options] [config.toml]\n\n";
    std::cout << tui::colors::BOLD << "Options:" << tui::colors::RESET << "\n";
    std::cout << "  --help, -h       Show this help message\n";
    std::cout << "  --version, -v    Show version information\n";
    std::cout << "  --prepare-only   Partition, format and mount, then stop\n";
    std::cout << "  --yes, -y        Don't ask before erasing the configured target disk\n\n";
    std::cout << tui::colors::BOLD << "Examples:" << tui::colors::RESET << "\n";
    std::cout << "  " << program << "                    # Interactive mode\n";
    std::cout << "  " << program << " config.toml        # Use config file\n";
    std::cout << "\n";
}

bool check_root() {
    if (getuid() != 0) {
        tui::print_error("This installer must be run as root!");
        std::cout << "Please run: sudo " << tui::colors::BOLD << "bedrock-installer"
                  << tui::colors::RESET << "\n";
        return false;
    }
    return true;
}

std::string select_config_file() {
    // Check for config files in /etc/bedrock, /root and the current directory
    std::vector<std::string> config_paths = {
        "/etc/bedrock/config.toml",
        "/root/config.toml",
        "./config.toml"
    };

    for (const auto& path : config_paths) {
        if (std::filesystem::exists(path)) {
            return path;
        }
    }

    return "";
}

// Config may name a volume that lsblk no longer reports; keep it so the
// mount stage can report it as skipped
std::optional<disk::BlockDevice> resolve_secondary(const disk::DeviceCatalog& catalog,
                                                   const std::string& path) {
    if (auto dev = catalog.find_device(path)) {
        return dev;
    }
    const std::string prefix = "/dev/";
    if (path.compare(0, prefix.size(), prefix) != 0) {
        tui::print_warning(path + " is not a /dev path; ignoring it");
        return std::nullopt;
    }
    tui::print_warning(path + " is not listed by lsblk");
    disk::BlockDevice dev;
    dev.name = path.substr(prefix.size());
    dev.kind = disk::DeviceKind::Partition;
    return dev;
}

disk::TargetSelection select_targets(const Config& cfg, const disk::DeviceCatalog& catalog) {
    disk::TargetSelection selection;

    // Root device
    if (!cfg.install.target_disk.empty()) {
        auto dev = catalog.find_device(cfg.install.target_disk);
        if (!dev) {
            throw InstallError(ErrorKind::InvalidTarget, "target selection",
                               cfg.install.target_disk, "device not found");
        }
        selection.root = *dev;
        tui::print_info("Target disk: " + selection.root.path() + " (from config.toml)");
    } else {
        tui::print_info("Choose the device you want to install on:");
        tui::print_error("NOTE: The chosen device will be completely erased and all its data will be lost!");
        auto dev = tui::choose_device("Select installation disk:", catalog.list_disks(), false);
        if (!dev) {
            throw InstallError(ErrorKind::InvalidTarget, "target selection", "",
                               "no root device selected");
        }
        selection.root = *dev;
    }
    tui::print_success("Root device -> " + selection.root.path());

    // Optional volumes
    for (disk::SecondaryRole role : disk::kSecondaryRoles) {
        const std::string name = disk::role_directory(role);

        auto configured = cfg.secondary.find(role);
        if (configured != cfg.secondary.end()) {
            if (auto dev = resolve_secondary(catalog, configured->second)) {
                selection.secondary.push_back({role, *dev});
                tui::print_success(name + " partition -> " + dev->path() + " (from config.toml)");
            }
            continue;
        }
        if (cfg.loaded_from_file) {
            continue;
        }

        // Nothing on the disk about to be erased, nothing already picked
        std::vector<disk::BlockDevice> candidates;
        for (const auto& part : catalog.list_partitions()) {
            bool taken = part.parent == selection.root.name;
            for (const auto& vol : selection.secondary) {
                if (vol.device.name == part.name) taken = true;
            }
            if (!taken) candidates.push_back(part);
        }
        if (candidates.empty()) {
            tui::print_info("No partitions available for " + name + ".");
            continue;
        }

        auto dev = tui::choose_device("Select " + name + " partition (or None):", candidates, true);
        if (dev) {
            selection.secondary.push_back({role, *dev});
            tui::print_success(name + " partition -> " + dev->path());
        } else {
            tui::print_info("No " + name + " partition selected.");
        }
    }

    return selection;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse command line arguments
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--version" || arg == "-v") {
            std::cout << "Bedrock Installer v1.0.0\n";
            return 0;
        }
        if (arg == "--prepare-only") {
            opts.prepare_only = true;
        } else if (arg == "--yes" || arg == "-y") {
            opts.assume_yes = true;
        } else if (!arg.empty() && arg[0] != '-') {
            opts.config_path = arg;
        } else {
            tui::print_error("Unknown option: " + arg);
            print_usage(argv[0]);
            return 1;
        }
    }

    // Check root privileges
    if (!check_root()) {
        return 1;
    }

    tui::clear_screen();
    tui::print_banner();

    // Load or create configuration
    Config config;

    if (opts.config_path.empty()) {
        opts.config_path = select_config_file();
    }

    if (!opts.config_path.empty() && std::filesystem::exists(opts.config_path)) {
        tui::print_info("Loading configuration from: " + opts.config_path);
        try {
            config = Config::load(opts.config_path);
            tui::print_success("Configuration loaded successfully");
        } catch (const InstallError& e) {
            tui::print_error("Failed to load config: " + std::string(e.what()));
            tui::print_info("Falling back to interactive mode...");
            config = Config();
        }
    } else {
        tui::print_info("No configuration file found. Using interactive mode.");
    }

    HostSystem sys;
    disk::DeviceCatalog catalog(sys);
    disk::TargetSelection selection;

    try {
        selection = select_targets(config, catalog);
    } catch (const InstallError& e) {
        tui::print_error(std::string(to_string(e.kind())) + ": " + e.what());
        return 1;
    }

    // Show installation summary
    std::cout << "\n";
    tui::show_summary(selection, config.install.mount_point);

    // Final confirmation. --yes only counts when the disk came from the config.
    bool skip_confirm = opts.assume_yes && !config.install.target_disk.empty();
    std::cout << "\n";
    tui::print_warning("This will ERASE ALL DATA on " + selection.root.path());
    if (!skip_confirm && !tui::confirm("Start installation?", false)) {
        tui::print_info("Installation cancelled.");
        return 0;
    }

    // Start installation
    std::cout << "\n";
    tui::print_info("Starting installation...\n");

    Installer installer(config, selection, sys);
    installer.set_progress_callback([](int step, int total, const std::string& msg) {
        tui::print_step(step, total, msg);
    });

    bool success = opts.prepare_only ? installer.prepare_disk() : installer.install();

    std::cout << "\n";
    if (!success) {
        tui::print_error("Installation failed: " + installer.get_error());
        tui::print_info("Please check the error message and try again.");
        return 1;
    }

    if (opts.prepare_only) {
        tui::print_success("Disk prepared and mounted at " + config.install.mount_point);
        return 0;
    }

    std::vector<std::string> lines = {
        "",
        "  The base system has been installed successfully!",
        "",
        "  Please remove the installation media and reboot.",
        "",
        "  Command: reboot",
        ""
    };
    if (installer.prepared() && installer.prepared()->degraded()) {
        lines.insert(lines.end() - 1, "  Some optional volumes were not mounted.");
    }
    tui::draw_box("Installation Complete!", lines);

    // Ask to reboot
    if (tui::confirm("Reboot now?", false)) {
        if (sys.run("reboot") != 0) {
            tui::print_error("reboot failed; reboot manually when ready.");
        }
    } else {
        tui::print_info("Reboot skipped. You can reboot manually when ready.");
    }

    return 0;
}
