#include "remote_session.hpp"
#include "command_channel.hpp"
#include "remote_listing.hpp"
#include "remote_path.hpp"
#include "ssh_args.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

// Absolute paths are normalized so "/a/b/" and "/a//b" share an entry.
static std::string cache_key(const std::string& path) {
    if (!path.empty() && path[0] == '/') return normalize_remote_path(path);
    return path;
}

static std::string parent_key(const std::string& path) {
    std::string key = cache_key(path);
    auto slash = key.rfind('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return key.substr(0, slash);
}

RemoteSession::RemoteSession(ConnectionTarget target, CommandChannel& channel,
                             Prompter& prompter, Timeouts timeouts, Clock clock)
    : target_(std::move(target)), channel_(channel), timeouts_(timeouts),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); })),
      negotiator_(channel, prompter, target_, timeouts.command_ms) {}

RemoteSession::~RemoteSession() {
    dispose();
}

void RemoteSession::ensure_authenticated() {
    std::lock_guard<std::mutex> lock(mutex_);
    negotiator_.ensure_authenticated();
}

bool RemoteSession::is_authenticated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return negotiator_.authenticated();
}

std::string RemoteSession::exec_locked(const std::string& command, int timeout_ms,
                                       const std::string& stdin_data) {
    negotiator_.ensure_authenticated();
    return channel_.execute(target_, command, negotiator_.credential(), timeout_ms, stdin_data);
}

std::vector<RemoteEntry> RemoteSession::list_directory(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key = cache_key(path);

    auto it = cache_.find(key);
    if (it != cache_.end() &&
        clock_() - it->second.captured < std::chrono::milliseconds(DIR_CACHE_TTL_MS)) {
        return it->second.entries;
    }

    std::string raw = exec_locked(
        fmt::format("ls -la --time-style=+%s -- {} 2>/dev/null", shell_quote(path)),
        timeouts_.command_ms);

    auto entries = parse_ls_output(raw);
    cache_[key] = CacheEntry{entries, clock_()};
    return entries;
}

RemoteStat RemoteSession::stat(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string q = shell_quote(path);
    std::string raw = exec_locked(
        fmt::format("stat --format='%F %s %Y' -- {} 2>/dev/null || stat -f '%HT %z %m' -- {}", q, q),
        timeouts_.command_ms);
    return parse_stat_output(raw);
}

std::string RemoteSession::read_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string raw = exec_locked("base64 -- " + shell_quote(path), timeouts_.transfer_ms);
    return base64_decode(raw);
}

void RemoteSession::write_file(const std::string& path, const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    exec_locked("base64 -d > " + shell_quote(path), timeouts_.transfer_ms,
                base64_encode(content) + "\n");
    cache_.erase(parent_key(path));
}

std::string RemoteSession::run(const std::string& command) {
    std::lock_guard<std::mutex> lock(mutex_);
    return exec_locked(command, timeouts_.command_ms);
}

void RemoteSession::create_directory(const std::string& path) {
    throw NotSupportedError("Creating remote directories is not supported: " + path);
}

void RemoteSession::remove(const std::string& path) {
    throw NotSupportedError("Deleting remote files is not supported: " + path);
}

void RemoteSession::rename(const std::string& from, const std::string& to) {
    throw NotSupportedError(fmt::format("Renaming remote files is not supported: {} -> {}", from, to));
}

std::map<std::string, std::string> RemoteSession::askpass_environment() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const AskpassHelper* helper = negotiator_.credential();
    if (!helper) return {};
    return helper->environment();
}

bool RemoteSession::uses_password() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return negotiator_.credential() != nullptr;
}

void RemoteSession::clear_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

void RemoteSession::dispose() {
    std::lock_guard<std::mutex> lock(mutex_);
    negotiator_.reset();
    cache_.clear();
}
