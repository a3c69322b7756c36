#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <map>
#include <core/types.hpp>
#include "askpass.hpp"

class CommandChannel;
class Prompter;

enum class AuthState {
    UNAUTHENTICATED,
    KEY_ATTEMPTED,
    AWAITING_SECRET,
    AUTHENTICATED,
    FAILED,
};

const char* to_string(AuthState state);

// Process-wide locks keyed by "user@host:port". Held for a whole
// negotiation so one target never shows two password prompts at once.
class TargetLocks {
public:
    static std::mutex& for_target(const std::string& key);

private:
    static std::mutex registry_mutex_;
    static std::map<std::string, std::unique_ptr<std::mutex>> locks_;
};

// Key auth first, then exactly one password prompt. The password only ever
// lives in the AskpassHelper, which this object owns.
// Not thread-safe on its own: the owning session serializes calls.
class CredentialNegotiator {
public:
    CredentialNegotiator(CommandChannel& channel, Prompter& prompter,
                         ConnectionTarget target, int probe_timeout_ms);
    ~CredentialNegotiator();

    CredentialNegotiator(const CredentialNegotiator&) = delete;
    CredentialNegotiator& operator=(const CredentialNegotiator&) = delete;

    // No-op when already authenticated. Throws AuthError or TimeoutError.
    void ensure_authenticated();

    // Drop the helper and start over from key auth next time.
    void reset();

    AuthState state() const { return state_; }
    bool authenticated() const { return state_ == AuthState::AUTHENTICATED; }

    // nullptr when authenticated by key (or not at all).
    const AskpassHelper* credential() const { return helper_.get(); }

    const ConnectionTarget& target() const { return target_; }

private:
    CommandChannel& channel_;
    Prompter& prompter_;
    ConnectionTarget target_;
    int probe_timeout_ms_;
    AuthState state_ = AuthState::UNAUTHENTICATED;
    std::unique_ptr<AskpassHelper> helper_;
};
