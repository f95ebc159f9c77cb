#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/credentials.hpp>
#include "channel_event.hpp"

class HostKeyPolicy;

struct TransportOptions {
    std::string host;
    int port = 22;
    int inactivity_timeout_secs = 5;
    std::string kex_algorithms;          // comma-separated, required
    std::string host_key_algorithms;     // comma-separated, empty = library default
};

// One exec channel. Destroying it closes and frees the channel.
class ExecChannel {
public:
    virtual ~ExecChannel() = default;

    // Request non-interactive execution of the command string.
    virtual Result<void> exec(const std::string& command) = 0;

    // Next event, or std::nullopt once the stream is exhausted.
    virtual std::optional<ChannelEvent> wait() = 0;
};

// Secure transport collaborator: handshake, authentication, channels.
class Transport {
public:
    virtual ~Transport() = default;

    // TCP connect, key exchange restricted to opts.kex_algorithms, then the
    // server identity is handed to the policy. Errors are Handshake or Timeout.
    virtual Result<void> connect(const TransportOptions& opts, HostKeyPolicy& policy) = 0;

    // value == false means the server rejected the key. An error result is a
    // transport failure, not a rejection.
    virtual Result<bool> authenticate_publickey(const std::string& user,
                                                const Credentials& creds) = 0;
    virtual Result<bool> authenticate_certificate(const std::string& user,
                                                  const Credentials& creds,
                                                  const Certificate& cert) = 0;

    virtual Result<std::unique_ptr<ExecChannel>> open_channel() = 0;

    // SSH_MSG_DISCONNECT with reason "by application".
    virtual Result<void> disconnect(const std::string& description) = 0;
};
