#include "credential_negotiator.hpp"
#include "command_channel.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/prompter.hpp>
#include <algorithm>
#include <fmt/format.h>

const char* to_string(AuthState state) {
    switch (state) {
        case AuthState::UNAUTHENTICATED: return "unauthenticated";
        case AuthState::KEY_ATTEMPTED:   return "key-attempted";
        case AuthState::AWAITING_SECRET: return "awaiting-secret";
        case AuthState::AUTHENTICATED:   return "authenticated";
        case AuthState::FAILED:          return "failed";
    }
    return "unknown";
}

// ── TargetLocks ─────────────────────────────────────────────

std::mutex TargetLocks::registry_mutex_;
std::map<std::string, std::unique_ptr<std::mutex>> TargetLocks::locks_;

std::mutex& TargetLocks::for_target(const std::string& key) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto& slot = locks_[key];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

// ── CredentialNegotiator ────────────────────────────────────

CredentialNegotiator::CredentialNegotiator(CommandChannel& channel, Prompter& prompter,
                                           ConnectionTarget target, int probe_timeout_ms)
    : channel_(channel), prompter_(prompter), target_(std::move(target)),
      probe_timeout_ms_(probe_timeout_ms) {}

CredentialNegotiator::~CredentialNegotiator() {
    reset();
}

void CredentialNegotiator::reset() {
    helper_.reset();
    state_ = AuthState::UNAUTHENTICATED;
}

void CredentialNegotiator::ensure_authenticated() {
    if (state_ == AuthState::AUTHENTICATED) return;

    std::lock_guard<std::mutex> target_lock(TargetLocks::for_target(target_.key()));
    helper_.reset();

    // Key (or agent) auth
    state_ = AuthState::KEY_ATTEMPTED;
    try {
        channel_.execute(target_, AUTH_PROBE_CMD, nullptr, probe_timeout_ms_);
        state_ = AuthState::AUTHENTICATED;
        hpcsync_log("auth: key auth ok for " + target_.key());
        return;
    } catch (const TimeoutError&) {
        state_ = AuthState::FAILED;
        throw;
    } catch (const RemoteError& e) {
        hpcsync_log(fmt::format("auth: key auth failed for {}: {}", target_.key(), e.what()));
    }

    // Password, asked exactly once
    state_ = AuthState::AWAITING_SECRET;
    auto secret = prompter_.secret(fmt::format("Password for {}", target_.destination()));
    if (!secret || secret->empty()) {
        state_ = AuthState::FAILED;
        throw AuthError("Authentication cancelled");
    }

    std::unique_ptr<AskpassHelper> helper;
    try {
        helper = std::make_unique<AskpassHelper>(*secret);
    } catch (const std::runtime_error& e) {
        std::fill(secret->begin(), secret->end(), '\0');
        state_ = AuthState::FAILED;
        throw AuthError(e.what());
    }
    std::fill(secret->begin(), secret->end(), '\0');

    try {
        channel_.execute(target_, AUTH_PROBE_CMD, helper.get(), probe_timeout_ms_);
    } catch (const RemoteError& e) {
        helper.reset();
        state_ = AuthState::FAILED;
        throw AuthError(fmt::format("SSH authentication failed: {}", e.what()));
    }

    helper_ = std::move(helper);
    state_ = AuthState::AUTHENTICATED;
    hpcsync_log("auth: password auth ok for " + target_.key());
}
