#pragma once

#include <string>
#include <vector>
#include <thread>
#include <chrono>
#include <mutex>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>
#include <core/constants.hpp>
#include <server/cache_store.hpp>

// HTTP front end of the cache store. Requests are served by a pool of
// threads running one io_context; each connection is handled by its own
// session object. A connection that makes no progress for `idle_timeout`
// is dropped; a long transfer that keeps moving is never cut off.
class HttpServer {
public:
    HttpServer(CacheStore& store, std::string auth_token, int threads = 4,
               std::chrono::seconds idle_timeout = std::chrono::seconds(DEFAULT_IDLE_TIMEOUT_SECS));
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind and start accepting. Port 0 picks an ephemeral port.
    // Returns the bound port; throws boost::system::system_error.
    unsigned short listen(const std::string& host, unsigned short port);

    // Serve on the calling thread plus threads-1 workers until stop().
    void run();

    // Serve on background threads only.
    void start();

    // Safe to call from any thread, including a signal watcher.
    void stop();

private:
    CacheStore& store_;
    std::string auth_token_;
    int threads_;
    std::chrono::seconds idle_timeout_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::vector<std::thread> workers_;
    std::mutex workers_mutex_;

    void do_accept();
    void on_accept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);
};
