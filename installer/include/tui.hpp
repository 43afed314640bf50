#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "disk.hpp"

namespace bedrock {
namespace tui {

// ANSI color codes
namespace colors {
    constexpr const char* RESET   = "\033[0m";
    constexpr const char* BOLD    = "\033[1m";
    constexpr const char* RED     = "\033[31m";
    constexpr const char* GREEN   = "\033[32m";
    constexpr const char* YELLOW  = "\033[33m";
    constexpr const char* BLUE    = "\033[34m";
    constexpr const char* MAGENTA = "\033[35m";
    constexpr const char* CYAN    = "\033[36m";
}

// Display banner
void print_banner();

// Print colored messages
void print_info(const std::string& msg);
void print_success(const std::string& msg);
void print_error(const std::string& msg);
void print_warning(const std::string& msg);
void print_step(int step, int total, const std::string& msg);

// Clear screen
void clear_screen();

// Draw a box around text
void draw_box(const std::string& title, const std::vector<std::string>& lines);

// Yes/No prompt
bool confirm(const std::string& question, bool default_yes = true);

// One menu line: "/dev/sda - 476.9G (Samsung SSD)"
std::string describe_device(const disk::BlockDevice& dev);

// Numbered device menu. Keeps asking until the answer is one of the listed
// numbers (or 0 for "None" when allow_none is set).
// Throws InstallError(InvalidTarget) if `candidates` is empty or input ends.
std::optional<disk::BlockDevice> choose_device(const std::string& prompt,
                                               const std::vector<disk::BlockDevice>& candidates,
                                               bool allow_none,
                                               std::istream& in = std::cin,
                                               std::ostream& out = std::cout);

// Display installation summary
void show_summary(const disk::TargetSelection& selection, const std::string& mount_point);

}  // namespace tui
}  // namespace bedrock
