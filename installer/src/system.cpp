#include "system.hpp"
#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <thread>
#include <sys/stat.h>
#include <sys/wait.h>

namespace bedrock {

namespace {

int exit_status(int raw) {
    if (raw == -1) return -1;
    if (WIFEXITED(raw)) return WEXITSTATUS(raw);
    return -1;
}

}  // namespace

int HostSystem::run(const std::string& cmd) {
    return exit_status(std::system(cmd.c_str()));
}

std::optional<std::string> HostSystem::capture(const std::string& cmd) {
    std::array<char, 128> buffer;
    std::string result;

    FILE* raw = popen(cmd.c_str(), "r");
    if (!raw) {
        return std::nullopt;
    }
    std::unique_ptr<FILE, decltype(&pclose)> pipe(raw, pclose);
    while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
        result += buffer.data();
    }

    // pclose gives us the exit status, so close explicitly
    if (exit_status(pclose(pipe.release())) != 0) {
        return std::nullopt;
    }
    return result;
}

bool HostSystem::exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

bool HostSystem::is_block_device(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return false;
    }
    return S_ISBLK(st.st_mode);
}

bool HostSystem::has_command(const std::string& name) {
    return run("command -v " + shell_quote(name) + " >/dev/null 2>&1") == 0;
}

bool HostSystem::create_directories(const std::string& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec && std::filesystem::is_directory(path, ec);
}

void HostSystem::settle(std::chrono::seconds delay) {
    std::this_thread::sleep_for(delay);
}

std::string shell_quote(const std::string& arg) {
    if (arg.empty()) {
        return "''";
    }

    bool plain = true;
    for (char c : arg) {
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') ||
                    std::string("_@%+=:,./-").find(c) != std::string::npos;
        if (!safe) {
            plain = false;
            break;
        }
    }
    if (plain) {
        return arg;
    }

    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

}  // namespace bedrock
