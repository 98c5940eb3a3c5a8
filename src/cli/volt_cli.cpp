#include "volt_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/profiles.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <iostream>
#include <chrono>

namespace {

void print_status(const std::string& msg) {
    std::cout << theme::dim("    · " + msg) << "\n";
}

} // namespace

VoltCLI::VoltCLI(fs::path config_path) : config_path_(std::move(config_path)) {
    add_command("run",     [](VoltCLI& cli) { return cli.run_wrapped(); },
                "Pull, run the wrapped build, push");
    add_command("push",    [](VoltCLI& cli) { return cli.run_push(); },
                "Upload the cache directories");
    add_command("pull",    [](VoltCLI& cli) { return cli.run_pull(); },
                "Restore the cache directories");
    add_command("status",  [](VoltCLI& cli) { return cli.run_status(); },
                "Compare local state with the server");
    add_command("ping",    [](VoltCLI& cli) { return cli.run_ping(); },
                "Check that the server is reachable");
    add_command("servers", [](VoltCLI& cli) { return cli.run_servers(); },
                "List configured server profiles");
    add_command("init",    [](VoltCLI& cli) { return cli.run_init(); },
                "Create volt.yaml in this directory");
}

void VoltCLI::add_command(const std::string& name, CommandHandler handler,
                          const std::string& help) {
    commands_[name] = {std::move(handler), help};
}

int VoltCLI::execute_command(const std::string& command) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        print_usage();
        return 1;
    }

    volt_logf(LogLevel::Info, "volt {}", command);
    try {
        return it->second.first(*this);
    } catch (const std::exception& e) {
        volt_logf(LogLevel::Error, "{}: {}", command, e.what());
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

void VoltCLI::print_usage() const {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::usage("volt", "[command]", "Defaults to 'run'");
    for (const auto& [name, entry] : commands_) {
        std::cout << theme::usage("volt " + name, "", entry.second);
    }
    std::cout << "\n";
    std::cout << theme::usage("-c, --config", "<path>", "Use another volt.yaml");
    std::cout << theme::usage("--version", "", "Show version");
    std::cout << theme::usage("--help", "", "Show this help");
    std::cout << "\n";
}

bool VoltCLI::require_client() {
    if (client_) return true;

    if (!config_) {
        fs::path path = config_path_.empty() ? get_project_config_path() : config_path_;
        if (!fs::exists(path)) {
            std::cout << theme::fail(fmt::format("No {} found.", path.filename().string()));
            std::cout << theme::step("Run 'volt init' first.");
            return false;
        }
        auto loaded = Config::load_file(path);
        if (loaded.is_err()) {
            std::cout << theme::fail(loaded.error);
            return false;
        }
        config_ = loaded.value;
    }

    const ProjectConfig& project = config_->project();
    ProfileStore profiles;
    auto profile = profiles.get(project.server);
    if (profile.is_err()) {
        std::cout << theme::fail(profile.error);
        std::cout << theme::step(fmt::format("Profiles are read from {}", profiles.dir().string()));
        return false;
    }

    SyncSettings settings;
    settings.root = config_->project_dir();
    settings.slot_id = project.volt_id;
    settings.cache_dirs = project.cache;
    settings.hash_dirs = project.hash;
    settings.timeout_secs = project.timeout;

    client_ = std::make_unique<CacheClient>(settings, make_endpoint(profile.value));
    return true;
}

void VoltCLI::report(const std::string& label, const SyncOutcome& outcome) const {
    std::string line = fmt::format("{}: {}", label, outcome.describe());
    if (outcome.ok()) {
        std::cout << theme::ok(line);
        volt_log(LogLevel::Info, line);
    } else {
        std::cout << theme::fail(line);
        volt_log(LogLevel::Warn, line);
    }
}

// ── Commands ────────────────────────────────────────────

int VoltCLI::run_init() {
    fs::path path = config_path_.empty() ? get_project_config_path() : config_path_;
    auto created = create_default_project_config(path);
    if (created.is_err()) {
        std::cout << theme::fail(created.error);
        return 1;
    }
    std::cout << theme::ok(fmt::format("Created {}", path.string()));
    std::cout << theme::kv("volt_id", created.value);
    std::cout << theme::step("Set server, cache and wrap before the first build.");
    return 0;
}

int VoltCLI::run_pull() {
    if (!require_client()) return 1;
    auto outcome = client_->pull(print_status);
    report("pull", outcome);
    return outcome.ok() ? 0 : 1;
}

int VoltCLI::run_push() {
    if (!require_client()) return 1;
    auto outcome = client_->push(print_status);
    report("push", outcome);
    return outcome.ok() ? 0 : 1;
}

int VoltCLI::run_wrapped() {
    if (!require_client()) return 1;
    const ProjectConfig& project = config_->project();
    if (project.wrap.empty()) {
        std::cout << theme::fail("No build command: set 'wrap' in volt.yaml.");
        return 1;
    }

    auto start = std::chrono::steady_clock::now();

    // Cache failures never stop the build.
    report("pull", client_->pull(print_status));

    std::cout << theme::step(project.wrap);
    volt_logf(LogLevel::Info, "running: {}", project.wrap);
    int code = platform::run_shell(project.wrap);
    if (code != 0) {
        std::cout << theme::fail(fmt::format("build failed with exit code {}", code));
        volt_logf(LogLevel::Warn, "build exited with {}, cache not pushed", code);
        return code;
    }

    report("push", client_->push(print_status));

    std::cout << theme::ok(fmt::format("done in {}",
        format_duration(std::chrono::steady_clock::now() - start)));
    return 0;
}

int VoltCLI::run_status() {
    if (!require_client()) return 1;
    const ProjectConfig& project = config_->project();

    std::cout << theme::section("Project");
    std::cout << theme::kv("volt_id", project.volt_id);
    std::cout << theme::kv("server", project.server);
    std::cout << theme::kv("cache", fmt::format("{}", fmt::join(project.cache, ", ")));
    if (!project.hash.empty()) {
        std::cout << theme::kv("hash", fmt::format("{}", fmt::join(project.hash, ", ")));
    }
    std::cout << theme::kv("wrap", project.wrap.empty() ? "-" : project.wrap);
    std::cout << theme::kv("local", client_->fingerprint());
    std::cout << theme::kv("log", volt_log_path().string());
    std::cout << "\n";

    auto outcome = client_->check();
    report("server", outcome);
    return outcome.ok() ? 0 : 1;
}

int VoltCLI::run_ping() {
    if (!require_client()) return 1;
    auto outcome = client_->ping();
    report(config_->project().server, outcome);
    return outcome.ok() ? 0 : 1;
}

int VoltCLI::run_servers() {
    ProfileStore profiles;
    auto all = profiles.load_all();
    if (all.is_err()) {
        std::cout << theme::fail(all.error);
        return 1;
    }
    if (all.value.empty()) {
        std::cout << theme::info(fmt::format("No server profiles in {}", profiles.dir().string()));
        return 0;
    }

    std::cout << theme::section("Servers");
    for (const auto& [name, profile] : all.value) {
        std::string detail = fmt::format("{}://{}", profile.tls ? "https" : "http", profile.address);
        if (profile.token) detail += theme::dim("  (token)");
        std::cout << theme::kv(name, detail);
    }
    std::cout << "\n";
    return 0;
}
