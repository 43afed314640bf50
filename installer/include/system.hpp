#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace bedrock {

// Everything the installer does to the host goes through this interface:
// shell commands, filesystem probes and the partition settle delay.
class System {
public:
    virtual ~System() = default;

    // Run a shell command, returns its exit status
    virtual int run(const std::string& cmd) = 0;

    // Run a shell command and capture stdout.
    // Returns nullopt if it could not be started or exited non-zero.
    virtual std::optional<std::string> capture(const std::string& cmd) = 0;

    virtual bool exists(const std::string& path) = 0;
    virtual bool is_block_device(const std::string& path) = 0;

    // True if `name` resolves to an executable in PATH
    virtual bool has_command(const std::string& name) = 0;

    // mkdir -p
    virtual bool create_directories(const std::string& path) = 0;

    // Block while the kernel settles after a partition table re-read
    virtual void settle(std::chrono::seconds delay) = 0;
};

// The live machine
class HostSystem : public System {
public:
    int run(const std::string& cmd) override;
    std::optional<std::string> capture(const std::string& cmd) override;
    bool exists(const std::string& path) override;
    bool is_block_device(const std::string& path) override;
    bool has_command(const std::string& name) override;
    bool create_directories(const std::string& path) override;
    void settle(std::chrono::seconds delay) override;
};

// Quote a word for /bin/sh. Plain words are returned unchanged.
std::string shell_quote(const std::string& arg);

}  // namespace bedrock
