#include "tui.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>

namespace bedrock {
namespace tui {

void print_banner() {
    std::cout << colors::CYAN << R"(
    ╔══════════════════════════════════════════════════════════╗
    ║)" << colors::BOLD << "         Bedrock Installer v1.0" << colors::RESET << colors::CYAN << R"(                       ║
    ║        Arch Linux base system bootstrap                  ║
    ╚══════════════════════════════════════════════════════════╝
)" << colors::RESET << std::endl;
}

void print_info(const std::string& msg) {
    std::cout << colors::BLUE << "[*] " << colors::RESET << msg << std::endl;
}

void print_success(const std::string& msg) {
    std::cout << colors::GREEN << "[✓] " << colors::RESET << msg << std::endl;
}

void print_error(const std::string& msg) {
    std::cout << colors::RED << "[✗] " << colors::RESET << msg << std::endl;
}

void print_warning(const std::string& msg) {
    std::cout << colors::YELLOW << "[!] " << colors::RESET << msg << std::endl;
}

void print_step(int step, int total, const std::string& msg) {
    std::cout << colors::MAGENTA << "[" << step << "/" << total << "] "
              << colors::RESET << msg << std::endl;
}

void clear_screen() {
    std::cout << "\033[2J\033[H";
}

void draw_box(const std::string& title, const std::vector<std::string>& lines) {
    const int width = 60;

    // Top border
    std::cout << colors::CYAN << "╔";
    for (int i = 0; i < width - 2; ++i) std::cout << "═";
    std::cout << "╗" << colors::RESET << std::endl;

    // Title
    std::cout << colors::CYAN << "║ " << colors::BOLD << std::left
              << std::setw(width - 4) << title << colors::RESET
              << colors::CYAN << " ║" << colors::RESET << std::endl;

    // Separator
    std::cout << colors::CYAN << "╠";
    for (int i = 0; i < width - 2; ++i) std::cout << "═";
    std::cout << "╣" << colors::RESET << std::endl;

    // Content lines
    for (const auto& line : lines) {
        std::cout << colors::CYAN << "║ " << colors::RESET
                  << std::left << std::setw(width - 4) << line
                  << colors::CYAN << " ║" << colors::RESET << std::endl;
    }

    // Bottom border
    std::cout << colors::CYAN << "╚";
    for (int i = 0; i < width - 2; ++i) std::cout << "═";
    std::cout << "╝" << colors::RESET << std::endl;
}

bool confirm(const std::string& question, bool default_yes) {
    std::cout << std::endl;
    std::cout << colors::YELLOW << question << colors::RESET;
    if (default_yes) {
        std::cout << " [Y/n]: ";
    } else {
        std::cout << " [y/N]: ";
    }

    std::string input_str;
    if (!std::getline(std::cin, input_str)) {
        return false;
    }

    if (input_str.empty()) {
        return default_yes;
    }

    char c = std::tolower(static_cast<unsigned char>(input_str[0]));
    return (c == 'y');
}

std::string describe_device(const disk::BlockDevice& dev) {
    std::string text = dev.path() + " - " + disk::human_size(dev.size_bytes);
    if (!dev.model.empty()) {
        text += " (" + dev.model + ")";
    }
    if (dev.mountpoint) {
        text += " [" + *dev.mountpoint + "]";
    }
    return text;
}

std::optional<disk::BlockDevice> choose_device(const std::string& prompt,
                                               const std::vector<disk::BlockDevice>& candidates,
                                               bool allow_none,
                                               std::istream& in,
                                               std::ostream& out) {
    if (candidates.empty()) {
        throw InstallError(ErrorKind::InvalidTarget, "device selection", "", "no devices found");
    }

    out << std::endl;
    out << colors::BOLD << prompt << colors::RESET << std::endl;
    out << std::string(60, '-') << std::endl;

    for (size_t i = 0; i < candidates.size(); ++i) {
        out << "  " << colors::CYAN << "[" << (i + 1) << "]"
            << colors::RESET << " " << describe_device(candidates[i]) << std::endl;
    }
    if (allow_none) {
        out << "  " << colors::RED << "[0]" << colors::RESET << " None" << std::endl;
    }

    // No retry limit: the operator gets asked until the answer is valid
    while (true) {
        out << std::endl << "Enter selection: " << std::flush;

        std::string input_str;
        if (!std::getline(in, input_str)) {
            throw InstallError(ErrorKind::InvalidTarget, "device selection", "",
                               "input closed before a device was chosen");
        }

        input_str.erase(0, input_str.find_first_not_of(" \t"));
        input_str.erase(input_str.find_last_not_of(" \t\r") + 1);

        bool numeric = !input_str.empty() && input_str.size() < 10 &&
                       std::all_of(input_str.begin(), input_str.end(),
                                   [](unsigned char c) { return std::isdigit(c); });
        if (numeric) {
            size_t selection = std::stoul(input_str);
            if (selection == 0 && allow_none) {
                return std::nullopt;
            }
            if (selection >= 1 && selection <= candidates.size()) {
                return candidates[selection - 1];
            }
        }

        out << colors::YELLOW << "[!] " << colors::RESET
            << "Invalid selection. Please choose a valid number." << std::endl;
    }
}

void show_summary(const disk::TargetSelection& selection, const std::string& mount_point) {
    std::vector<std::string> lines = {
        "",
        "  Target disk:    " + describe_device(selection.root),
        "  Mount point:    " + mount_point,
    };

    for (disk::SecondaryRole role : disk::kSecondaryRoles) {
        std::string label = std::string(disk::role_directory(role)) + ":";
        std::string value = "None";
        for (const auto& vol : selection.secondary) {
            if (vol.role == role) value = vol.device.path();
        }
        lines.push_back("  " + label + std::string(16 - label.size(), ' ') + value);
    }
    lines.push_back("");

    draw_box("Installation Summary", lines);
}

}  // namespace tui
}  // namespace bedrock
