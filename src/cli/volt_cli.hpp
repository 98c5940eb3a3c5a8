#pragma once

#include <string>
#include <map>
#include <memory>
#include <optional>
#include <functional>
#include <filesystem>
#include <core/config.hpp>
#include <managers/cache_client.hpp>

namespace fs = std::filesystem;

class VoltCLI {
public:
    // An empty path means ./volt.yaml
    explicit VoltCLI(fs::path config_path = {});

    using CommandHandler = std::function<int(VoltCLI&)>;

    // Returns the process exit code.
    int execute_command(const std::string& command);
    void print_usage() const;

    int run_init();
    int run_wrapped();      // pull, build, push
    int run_push();
    int run_pull();
    int run_status();
    int run_ping();
    int run_servers();

private:
    fs::path config_path_;
    std::optional<Config> config_;
    std::unique_ptr<CacheClient> client_;
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;

    void add_command(const std::string& name, CommandHandler handler,
                     const std::string& help);

    // Load volt.yaml and resolve its server profile. Prints the reason on failure.
    bool require_client();

    void report(const std::string& label, const SyncOutcome& outcome) const;
};
