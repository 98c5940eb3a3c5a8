#include "cache_client.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fingerprint/fingerprint.hpp>
#include <platform/archive.hpp>
#include <fmt/format.h>
#include <stdexcept>

using Clock = std::chrono::steady_clock;

namespace {

SyncOutcome make(SyncStatus status, Clock::time_point start, std::uint64_t bytes = 0) {
    SyncOutcome o;
    o.status = status;
    o.elapsed = Clock::now() - start;
    o.bytes = bytes;
    return o;
}

SyncOutcome fail(SyncError kind, const std::string& message, Clock::time_point start) {
    SyncOutcome o;
    o.status = SyncStatus::Error;
    o.error = kind;
    o.message = message;
    o.elapsed = Clock::now() - start;
    return o;
}

std::string describe_status(long status) {
    switch (status) {
        case 400: return "server rejected the request (400 bad request)";
        case 401: return "server requires a token (401 unauthorized)";
        case 403: return "server rejected the token (403 forbidden)";
        case 500: return "server storage failure (500)";
        default:  return fmt::format("server responded with status {}", status);
    }
}

} // namespace

std::string SyncOutcome::describe() const {
    switch (status) {
        case SyncStatus::UpToDate: return "up to date";
        case SyncStatus::Restored: return fmt::format("restored in {}", format_duration(elapsed));
        case SyncStatus::Miss:     return "cache miss";
        case SyncStatus::Changed:  return "changed";
        case SyncStatus::Cached:   return fmt::format("cached {} in {}", format_size(bytes), format_duration(elapsed));
        case SyncStatus::Alive:    return fmt::format("alive ({})", format_duration(elapsed));
        case SyncStatus::Error:    break;
    }
    return "error: " + message;
}

CacheClient::CacheClient(SyncSettings settings, ServerEndpoint endpoint)
    : settings_(std::move(settings)), endpoint_(std::move(endpoint)),
      http_(settings_.timeout_secs) {
    if (!is_valid_uuid(settings_.slot_id)) {
        throw std::invalid_argument(fmt::format("invalid cache slot id '{}'", settings_.slot_id));
    }
}

std::string CacheClient::url_for(const std::string& route) const {
    return fmt::format("{}/{}/{}", endpoint_.base_url, route, settings_.slot_id);
}

std::vector<std::string> CacheClient::headers(const std::string& fingerprint) const {
    std::vector<std::string> h;
    if (!endpoint_.authorization.empty()) h.push_back("Authorization: " + endpoint_.authorization);
    if (!fingerprint.empty()) h.push_back(fmt::format("{}: {}", HASH_HEADER, fingerprint));
    return h;
}

std::string CacheClient::fingerprint() const {
    const auto& dirs = settings_.hash_dirs.empty() ? settings_.cache_dirs : settings_.hash_dirs;
    return fingerprint::compute_fingerprint(dirs, settings_.root);
}

SyncOutcome CacheClient::pull(StatusCallback cb) {
    auto start = Clock::now();

    if (cb) cb("Fingerprinting...");
    std::string fp = fingerprint();

    if (cb) cb("Checking server...");
    auto resp = http_.get(url_for("pull"), headers(fp));
    if (resp.is_err()) return fail(SyncError::Transport, resp.error, start);

    switch (resp.value.status) {
        case 304:
            return make(SyncStatus::UpToDate, start);
        case 404:
            return make(SyncStatus::Miss, start);
        case 200:
            break;
        default:
            return fail(SyncError::Protocol, describe_status(resp.value.status), start);
    }

    if (!resp.value.content_encoding.empty() && resp.value.content_encoding != ARCHIVE_ENCODING) {
        return fail(SyncError::Protocol,
                    fmt::format("unexpected content encoding '{}'", resp.value.content_encoding), start);
    }

    if (cb) cb(fmt::format("Extracting {}...", format_size(resp.value.body.size())));
    try {
        platform::unpack_dirs(resp.value.body, settings_.root, settings_.cache_dirs);
    } catch (const platform::ArchiveError& e) {
        volt_logf(LogLevel::Error, "pull: {}", e.what());
        return fail(SyncError::Codec, e.what(), start);
    }

    return make(SyncStatus::Restored, start, resp.value.body.size());
}

SyncOutcome CacheClient::push(StatusCallback cb) {
    auto start = Clock::now();

    if (cb) cb("Creating archive...");
    std::string archive;
    try {
        archive = platform::pack_dirs(settings_.root, settings_.cache_dirs);
    } catch (const platform::ArchiveError& e) {
        volt_logf(LogLevel::Error, "push: {}", e.what());
        return fail(SyncError::Codec, e.what(), start);
    }

    if (cb) cb("Fingerprinting...");
    std::string fp = fingerprint();

    if (cb) cb(fmt::format("Uploading {}...", format_size(archive.size())));
    auto resp = http_.post(url_for("push"), headers(fp), archive);
    if (resp.is_err()) return fail(SyncError::Transport, resp.error, start);

    long status = resp.value.status;
    if (status < 200 || status >= 300) {
        return fail(SyncError::Protocol, describe_status(status), start);
    }

    return make(SyncStatus::Cached, start, archive.size());
}

SyncOutcome CacheClient::check() {
    auto start = Clock::now();
    std::string fp = fingerprint();

    auto resp = http_.get(url_for("check"), headers(fp));
    if (resp.is_err()) return fail(SyncError::Transport, resp.error, start);

    switch (resp.value.status) {
        case 304: return make(SyncStatus::UpToDate, start);
        case 200: return make(SyncStatus::Changed, start);
        case 404: return make(SyncStatus::Miss, start);
        default:  return fail(SyncError::Protocol, describe_status(resp.value.status), start);
    }
}

SyncOutcome CacheClient::ping() {
    auto start = Clock::now();

    auto resp = http_.get(url_for("health"), headers(""));
    if (resp.is_err()) return fail(SyncError::Transport, resp.error, start);

    if (resp.value.status != 200) {
        return fail(SyncError::Protocol, describe_status(resp.value.status), start);
    }
    if (resp.value.body != settings_.slot_id) {
        return fail(SyncError::Protocol, "server answered with an unexpected body", start);
    }
    return make(SyncStatus::Alive, start);
}
