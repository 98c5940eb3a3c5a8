#include <iostream>
#include <string>
#include <csignal>
#include <thread>
#include <boost/asio/signal_set.hpp>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <server/cache_store.hpp>
#include <server/http_server.hpp>

namespace {

void print_usage() {
    std::cout << "usage: volt-server [config.yaml]\n"
              << "       volt-server --version\n";
}

} // namespace

int main(int argc, char** argv) {
    fs::path config_path = SERVER_CONFIG_FILE;
    if (argc >= 2) {
        std::string arg = argv[1];
        if (arg == "--version") {
            std::cout << "volt-server version " << VOLT_VERSION << "\n";
            return 0;
        }
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        }
        config_path = arg;
    }

    auto loaded = load_server_config(config_path);
    if (loaded.is_err()) {
        std::cerr << "volt-server: " << loaded.error << "\n";
        return 1;
    }
    const ServerConfig& config = loaded.value;

    if (!config.log_file.empty()) set_log_path(config.log_file);
    set_log_echo(true);

    auto addr = parse_listen_address(config.address);
    if (addr.is_err()) {
        volt_log(LogLevel::Error, addr.error);
        return 1;
    }

    try {
        CacheStore store(config.cache_dir);
        int stale = store.remove_stale_staging();
        if (stale > 0) volt_logf(LogLevel::Info, "removed {} stale upload(s)", stale);

        HttpServer server(store, config.auth_token, config.threads,
                          std::chrono::seconds(config.idle_timeout));
        unsigned short port = server.listen(addr.value.host, addr.value.port);

        volt_logf(LogLevel::Info, "volt-server {} listening on {}:{} ({} threads)",
                  VOLT_VERSION, addr.value.host, port, config.threads);
        volt_logf(LogLevel::Info, "cache dir: {}", config.cache_dir.string());

        boost::asio::io_context signals_ctx;
        boost::asio::signal_set signals(signals_ctx, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int sig) {
            if (ec) return;
            volt_logf(LogLevel::Info, "signal {}, shutting down", sig);
            server.stop();
        });
        std::thread signal_thread([&] { signals_ctx.run(); });

        server.run();

        signals_ctx.stop();
        signal_thread.join();
    } catch (const std::exception& e) {
        volt_logf(LogLevel::Error, "fatal: {}", e.what());
        return 1;
    }

    return 0;
}
