#include "http_server.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/none.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

// Largest request body read and thrown away before answering a rejection
constexpr std::uint64_t MAX_DRAIN_BYTES = 64ULL * 1024 * 1024;

enum class Route { Push, Pull, Check, Health, Unknown };

struct Target {
    Route route = Route::Unknown;
    std::string slot;
};

std::string to_string(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

// "/<route>/<slot>", query string ignored
Target parse_target(beast::string_view raw) {
    std::string path = to_string(raw);
    auto q = path.find('?');
    if (q != std::string::npos) path.resize(q);

    Target t;
    if (path.empty() || path[0] != '/') return t;

    auto slash = path.find('/', 1);
    std::string route = path.substr(1, slash == std::string::npos ? std::string::npos : slash - 1);
    if (slash != std::string::npos) t.slot = path.substr(slash + 1);

    if (route == "push")        t.route = Route::Push;
    else if (route == "pull")   t.route = Route::Pull;
    else if (route == "check")  t.route = Route::Check;
    else if (route == "health") t.route = Route::Health;
    return t;
}

http::status to_http(StoreStatus s) {
    switch (s) {
        case StoreStatus::Ok:           return http::status::ok;
        case StoreStatus::NotModified:  return http::status::not_modified;
        case StoreStatus::Changed:      return http::status::ok;
        case StoreStatus::NotFound:     return http::status::not_found;
        case StoreStatus::BadRequest:   return http::status::bad_request;
        default:                        return http::status::internal_server_error;
    }
}

// ── Session ─────────────────────────────────────────────────

class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket&& socket, CacheStore& store, const std::string& auth_token,
            std::chrono::seconds idle_timeout)
        : stream_(std::move(socket)), store_(store), auth_token_(auth_token),
          idle_timeout_(idle_timeout) {}

    void start() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&Session::do_read, shared_from_this()));
    }

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    CacheStore& store_;
    const std::string& auth_token_;
    std::chrono::seconds idle_timeout_;

    std::optional<http::request_parser<http::empty_body>> header_;
    std::optional<http::request_parser<http::file_body>> upload_;
    std::optional<http::request_parser<http::buffer_body>> drain_;
    std::array<char, 8192> drain_buf_;
    http::status pending_status_ = http::status::ok;
    StagedUpload staged_;
    std::string upload_fingerprint_;

    std::string method_;
    std::string target_;
    unsigned version_ = 11;
    bool keep_alive_ = false;
    std::chrono::steady_clock::time_point started_;

    void do_read() {
        upload_.reset();
        drain_.reset();
        header_.emplace();
        staged_ = StagedUpload{};
        stream_.expires_after(idle_timeout_);
        http::async_read_header(stream_, buffer_, *header_,
            beast::bind_front_handler(&Session::on_header, shared_from_this()));
    }

    void on_header(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) return do_close();
        if (ec) {
            if (ec != beast::error::timeout && ec != net::error::operation_aborted) {
                volt_logf(LogLevel::Warn, "read failed: {}", ec.message());
            }
            return;
        }

        started_ = std::chrono::steady_clock::now();
        auto& req = header_->get();
        method_ = to_string(req.method_string());
        target_ = to_string(req.target());
        version_ = req.version();
        keep_alive_ = req.keep_alive();

        // Authentication comes before anything else about the request.
        auto auth = to_string(req[http::field::authorization]);
        const std::string prefix = "Bearer ";
        if (auth.compare(0, prefix.size(), prefix) != 0) {
            return reject(http::status::unauthorized);
        }
        if (auth.substr(prefix.size()) != auth_token_) {
            return reject(http::status::forbidden);
        }

        Target t = parse_target(req.target());
        if (t.route == Route::Unknown) return reject(http::status::not_found);

        auto expected = t.route == Route::Push ? http::verb::post : http::verb::get;
        if (req.method() != expected) return reject(http::status::method_not_allowed);

        if (!is_valid_uuid(t.slot)) return reject(http::status::bad_request);

        std::optional<std::string> fingerprint;
        auto it = req.find(HASH_HEADER);
        if (it != req.end()) {
            fingerprint = to_string(it->value());
            trim(*fingerprint);
        }

        // Bodies on the other routes are never read
        if (t.route != Route::Push && !header_->is_done()) keep_alive_ = false;

        switch (t.route) {
            case Route::Push:   return begin_upload(t.slot, fingerprint.value_or(""));
            case Route::Pull:   return handle_pull(t.slot, fingerprint);
            case Route::Check:  return reply(to_http(store_.check(t.slot, fingerprint)));
            case Route::Health: return handle_health(t.slot);
            default:            return reply(http::status::not_found);
        }
    }

    // ── Push ────────────────────────────────────────────────

    void begin_upload(const std::string& slot, const std::string& fingerprint) {
        StoreStatus status = store_.begin_push(slot, staged_);
        if (status != StoreStatus::Ok) return reject(to_http(status));

        keep_alive_ = header_->get().keep_alive();
        upload_fingerprint_ = fingerprint;
        upload_.emplace(std::move(*header_));
        upload_->body_limit(boost::none);

        beast::error_code ec;
        upload_->get().body().open(staged_.path.c_str(), beast::file_mode::write, ec);
        if (ec) {
            volt_logf(LogLevel::Error, "cannot create {}: {}", staged_.path.string(), ec.message());
            store_.abort_push(staged_);
            keep_alive_ = false;
            return reply(http::status::internal_server_error);
        }

        do_upload_read();
    }

    // Body goes straight to the staging file as it arrives. The deadline is
    // renewed for every chunk.
    void do_upload_read() {
        if (upload_->is_done()) return on_upload({});
        stream_.expires_after(idle_timeout_);
        http::async_read_some(stream_, buffer_, *upload_,
            beast::bind_front_handler(&Session::on_upload_chunk, shared_from_this()));
    }

    void on_upload_chunk(beast::error_code ec, std::size_t) {
        if (!ec && !upload_->is_done()) return do_upload_read();
        on_upload(ec);
    }

    void on_upload(beast::error_code ec) {
        upload_->get().body().close();

        if (ec) {
            volt_logf(LogLevel::Warn, "upload for {} failed: {}", staged_.slot_id, ec.message());
            store_.abort_push(staged_);
            keep_alive_ = false;
            if (ec == http::error::end_of_stream || ec == beast::error::timeout) return;
            return reply(http::status::bad_request);
        }

        StoreStatus status = store_.commit_push(staged_, upload_fingerprint_);
        staged_ = StagedUpload{};
        reply(to_http(status));
    }

    // ── Pull / health ───────────────────────────────────────

    void handle_pull(const std::string& slot, const std::optional<std::string>& fingerprint) {
        PullResult result = store_.pull(slot, fingerprint);
        if (result.status != StoreStatus::Ok) return reply(to_http(result.status));

        beast::file file;
        file.native_handle(result.archive.release());

        http::response<http::file_body> res{http::status::ok, version_};
        beast::error_code ec;
        res.body().reset(std::move(file), ec);
        if (ec) {
            volt_logf(LogLevel::Error, "cannot stream archive for {}: {}", slot, ec.message());
            return reply(http::status::internal_server_error);
        }
        res.set(http::field::content_type, "application/octet-stream");
        res.set(http::field::content_encoding, ARCHIVE_ENCODING);
        res.prepare_payload();
        send(std::move(res));
    }

    void handle_health(const std::string& slot) {
        http::response<http::string_body> res{http::status::ok, version_};
        res.set(http::field::content_type, "text/plain");
        res.body() = slot;
        res.prepare_payload();
        send(std::move(res));
    }

    // ── Rejection ───────────────────────────────────────────

    // Answer without acting on the request. A body the client is still
    // sending is read and discarded first, then the connection closes.
    void reject(http::status status) {
        if (header_->is_done()) return reply(status);

        pending_status_ = status;
        keep_alive_ = false;
        drain_.emplace(std::move(*header_));
        drain_->body_limit(MAX_DRAIN_BYTES);
        do_drain();
    }

    void do_drain() {
        stream_.expires_after(idle_timeout_);
        drain_->get().body().data = drain_buf_.data();
        drain_->get().body().size = drain_buf_.size();
        http::async_read_some(stream_, buffer_, *drain_,
            beast::bind_front_handler(&Session::on_drain, shared_from_this()));
    }

    void on_drain(beast::error_code ec, std::size_t) {
        if (ec == http::error::need_buffer) ec = {};
        if (ec) {
            volt_logf(LogLevel::Warn, "discarding request body: {}", ec.message());
            return reply(pending_status_);
        }
        if (!drain_->is_done()) return do_drain();
        reply(pending_status_);
    }

    // ── Responses ───────────────────────────────────────────

    void reply(http::status status) {
        http::response<http::empty_body> res{status, version_};
        res.prepare_payload();
        send(std::move(res));
    }

    template <class Body>
    void send(http::response<Body>&& res) {
        res.keep_alive(keep_alive_);
        log_request(res.result_int());

        auto msg = std::make_shared<http::response<Body>>(std::move(res));
        auto sr = std::make_shared<http::response_serializer<Body>>(*msg);
        write_next(msg, sr);
    }

    // One write_some per step so that the deadline follows progress.
    template <class Body>
    void write_next(std::shared_ptr<http::response<Body>> msg,
                    std::shared_ptr<http::response_serializer<Body>> sr) {
        stream_.expires_after(idle_timeout_);
        http::async_write_some(stream_, *sr,
            [self = shared_from_this(), msg, sr](beast::error_code ec, std::size_t) {
                if (!ec && !sr->is_done()) return self->write_next(msg, sr);
                self->on_write(msg->need_eof(), ec);
            });
    }

    void on_write(bool close, beast::error_code ec) {
        if (ec) {
            volt_logf(LogLevel::Warn, "write failed: {}", ec.message());
            return;
        }
        if (close) return do_close();
        do_read();
    }

    void log_request(unsigned status) {
        auto elapsed = std::chrono::steady_clock::now() - started_;
        LogLevel level = LogLevel::Info;
        if (status >= 500) level = LogLevel::Error;
        else if (status == 400 || status == 401 || status == 403 || status == 405) level = LogLevel::Warn;
        volt_logf(level, "{} {} {} {}", method_, target_, status, format_duration(elapsed));
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }
};

} // namespace

// ── HttpServer ──────────────────────────────────────────────

HttpServer::HttpServer(CacheStore& store, std::string auth_token, int threads,
                       std::chrono::seconds idle_timeout)
    : store_(store),
      auth_token_(std::move(auth_token)),
      threads_(threads < 1 ? 1 : threads),
      idle_timeout_(idle_timeout),
      ioc_(threads_),
      acceptor_(net::make_strand(ioc_)) {}

HttpServer::~HttpServer() {
    stop();
}

unsigned short HttpServer::listen(const std::string& host, unsigned short port) {
    tcp::resolver resolver(ioc_);
    auto results = resolver.resolve(host, std::to_string(port),
                                    tcp::resolver::passive | tcp::resolver::numeric_service);
    tcp::endpoint endpoint = results.begin()->endpoint();

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);

    do_accept();
    return acceptor_.local_endpoint().port();
}

void HttpServer::run() {
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (int i = 1; i < threads_; i++) {
            workers_.emplace_back([this] { ioc_.run(); });
        }
    }
    ioc_.run();
    stop();
}

void HttpServer::start() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (int i = 0; i < threads_; i++) {
        workers_.emplace_back([this] { ioc_.run(); });
    }
}

void HttpServer::stop() {
    ioc_.stop();
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto& t : workers_) {
        if (t.joinable() && t.get_id() != std::this_thread::get_id()) t.join();
    }
    workers_.clear();
}

void HttpServer::do_accept() {
    acceptor_.async_accept(net::make_strand(ioc_),
        beast::bind_front_handler(&HttpServer::on_accept, this));
}

void HttpServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == net::error::operation_aborted) return;
        volt_logf(LogLevel::Warn, "accept failed: {}", ec.message());
    } else {
        std::make_shared<Session>(std::move(socket), store_, auth_token_, idle_timeout_)->start();
    }
    do_accept();
}
