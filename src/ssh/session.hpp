#pragma once

#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/credentials.hpp>
#include "host_key_policy.hpp"
#include "transport.hpp"

struct SessionTarget {
    std::string host;
    int port = 22;
    std::string user;
    fs::path private_key_path;
    std::optional<fs::path> certificate_path;
    std::string key_passphrase;
    int inactivity_timeout_secs = 5;
    std::string kex_algorithms;          // empty = DEFAULT_KEX_ALGORITHMS
    std::string host_key_algorithms;     // empty = library default
    std::string disconnect_message;      // empty = DEFAULT_DISCONNECT_MESSAGE

    // Null means AcceptAnyHostKey.
    std::shared_ptr<HostKeyPolicy> host_key_policy;
};

enum class SessionState {
    Idle,          // authenticated, no channel open
    ChannelOpen,   // a call() is draining its channel
    Closed,        // close() ran or the transport failed
};

const char* session_state_name(SessionState state);

// One authenticated connection. Runs one command at a time: each call()
// opens a channel, drains it to end-of-stream and reports the exit status.
class Session {
public:
    // Load credentials, connect, verify the server and authenticate.
    // With a certificate the certificate method is used, never plain
    // public key, and the reverse without one. A null transport means libssh2.
    static Result<std::unique_ptr<Session>> connect(const SessionTarget& target,
                                                    std::unique_ptr<Transport> transport = nullptr,
                                                    StatusCallback callback = nullptr);

    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Run one command. Remote stdout goes to out, flushed per chunk.
    Result<ExecutionResult> call(const std::string& command, std::ostream& out = std::cout);

    // Best-effort disconnect, then release the transport. Never fails.
    void close();

    SessionState state() const { return state_; }
    bool is_open() const { return state_ != SessionState::Closed; }
    const std::string& target() const { return target_str_; }

private:
    Session(std::unique_ptr<Transport> transport, std::string target_str,
            std::string disconnect_message);

    std::unique_ptr<Transport> transport_;
    std::atomic<SessionState> state_;
    std::mutex call_mutex_;
    std::string target_str_;
    std::string disconnect_message_;
};
