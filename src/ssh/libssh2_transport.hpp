#pragma once

#include <deque>
#include <memory>
#include <string>
#include <platform/socket_util.hpp>
#include "host_key_policy.hpp"
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// libssh2_init() once per process. Returns false if it failed.
bool libssh2_global_init();

// KEX preference string handed to libssh2: the configured methods followed by
// the client extension markers (ext-info-c, strict kex) unless already listed.
std::string kex_method_pref(const std::string& configured);

// Transport backed by a non-blocking libssh2 session. Every EAGAIN waits on
// the socket for at most the inactivity timeout.
class Libssh2Transport : public Transport {
public:
    Libssh2Transport();
    ~Libssh2Transport() override;

    Libssh2Transport(const Libssh2Transport&) = delete;
    Libssh2Transport& operator=(const Libssh2Transport&) = delete;

    Result<void> connect(const TransportOptions& opts, HostKeyPolicy& policy) override;
    Result<bool> authenticate_publickey(const std::string& user,
                                        const Credentials& creds) override;
    Result<bool> authenticate_certificate(const std::string& user,
                                          const Credentials& creds,
                                          const Certificate& cert) override;
    Result<std::unique_ptr<ExecChannel>> open_channel() override;
    Result<void> disconnect(const std::string& description) override;

private:
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    int timeout_ms_;
    std::string target_str_;

    Result<bool> authenticate(const std::string& user, const Credentials& creds,
                              const std::string& public_key, const char* method);
    ServerIdentity server_identity(const TransportOptions& opts) const;
    std::string last_error() const;
    void release();
};

// One exec channel on a Libssh2Transport. Must not outlive its transport.
class Libssh2ExecChannel : public ExecChannel {
public:
    Libssh2ExecChannel(LIBSSH2_CHANNEL* ch, LIBSSH2_SESSION* session,
                       socket_t sock, int timeout_ms);
    ~Libssh2ExecChannel() override;

    Libssh2ExecChannel(const Libssh2ExecChannel&) = delete;
    Libssh2ExecChannel& operator=(const Libssh2ExecChannel&) = delete;

    Result<void> exec(const std::string& command) override;
    std::optional<ChannelEvent> wait() override;

private:
    LIBSSH2_CHANNEL* ch_;
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    int timeout_ms_;
    bool closed_ = false;
    bool finished_ = false;
    std::deque<ChannelEvent> pending_;

    // Remote EOF seen: close the channel and queue the terminal events.
    void finish();
    void lose(const std::string& reason);
};
