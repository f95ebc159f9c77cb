#include "libssh2_transport.hpp"
#include "host_key_policy.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <algorithm>
#include <cstring>
#include <vector>

namespace {

enum class WaitResult { Ready, TimedOut, Failed };

// Poll the socket in whichever direction libssh2 is blocked on.
WaitResult wait_socket(LIBSSH2_SESSION* session, socket_t sock, int timeout_ms) {
    int dir = libssh2_session_block_directions(session);
    short events = 0;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;

    int revents = platform::poll_socket(sock, events, timeout_ms);
    if (revents == 0) return WaitResult::TimedOut;
    if (revents < 0 || (revents & POLLNVAL)) return WaitResult::Failed;
    // POLLERR/POLLHUP: let libssh2 read the socket and report the error itself.
    return WaitResult::Ready;
}

// Call fn until it stops returning LIBSSH2_ERROR_EAGAIN.
template <typename Fn>
int call_nonblocking(LIBSSH2_SESSION* session, socket_t sock, int timeout_ms,
                     Fn&& fn, bool& timed_out) {
    timed_out = false;
    int rc;
    while ((rc = fn()) == LIBSSH2_ERROR_EAGAIN) {
        auto w = wait_socket(session, sock, timeout_ms);
        if (w == WaitResult::TimedOut) {
            timed_out = true;
            return rc;
        }
        if (w == WaitResult::Failed) return LIBSSH2_ERROR_SOCKET_RECV;
    }
    return rc;
}

HostKeyType to_host_key_type(int libssh2_type) {
    switch (libssh2_type) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:       return HostKeyType::Rsa;
    case LIBSSH2_HOSTKEY_TYPE_DSS:       return HostKeyType::Dss;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return HostKeyType::Ecdsa256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return HostKeyType::Ecdsa384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return HostKeyType::Ecdsa521;
    case LIBSSH2_HOSTKEY_TYPE_ED25519:   return HostKeyType::Ed25519;
    default:                             return HostKeyType::Unknown;
    }
}

} // namespace

bool libssh2_global_init() {
    static const int rc = libssh2_init(0);
    return rc == 0;
}

std::string kex_method_pref(const std::string& configured) {
    std::vector<std::string> methods;
    auto add_list = [&](const std::string& list) {
        size_t start = 0;
        while (start <= list.size()) {
            size_t comma = list.find(',', start);
            std::string m = list.substr(start, comma == std::string::npos ? std::string::npos
                                                                          : comma - start);
            trim(m);
            if (!m.empty() && std::find(methods.begin(), methods.end(), m) == methods.end()) {
                methods.push_back(m);
            }
            if (comma == std::string::npos) break;
            start = comma + 1;
        }
    };
    add_list(configured);
    add_list(KEX_CLIENT_EXTENSIONS);

    std::string out;
    for (const auto& m : methods) {
        if (!out.empty()) out += ",";
        out += m;
    }
    return out;
}

// ── Libssh2Transport ─────────────────────────────────────────────────

Libssh2Transport::Libssh2Transport()
    : session_(nullptr), sock_(REXEC_INVALID_SOCKET), timeout_ms_(-1) {
}

Libssh2Transport::~Libssh2Transport() {
    release();
}

void Libssh2Transport::release() {
    if (session_) {
        bool timed_out = false;
        call_nonblocking(session_, sock_, timeout_ms_,
                         [&] { return libssh2_session_free(session_); }, timed_out);
        session_ = nullptr;
    }
    if (sock_ != REXEC_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = REXEC_INVALID_SOCKET;
    }
}

std::string Libssh2Transport::last_error() const {
    if (!session_) return "no session";
    char* msg = nullptr;
    int len = 0;
    int code = libssh2_session_last_error(session_, &msg, &len, 0);
    std::string text = (msg && len > 0) ? std::string(msg, len) : "unknown error";
    return fmt::format("{} (libssh2 error {})", text, code);
}

Result<void> Libssh2Transport::connect(const TransportOptions& opts, HostKeyPolicy& policy) {
    if (session_) {
        return Result<void>::Err(ErrorKind::Handshake, "Transport is already connected");
    }
    if (!libssh2_global_init()) {
        return Result<void>::Err(ErrorKind::Handshake, "Failed to initialize libssh2");
    }
    platform::init_networking();

    timeout_ms_ = opts.inactivity_timeout_secs > 0 ? opts.inactivity_timeout_secs * 1000 : -1;
    target_str_ = fmt::format("{}:{}", opts.host, opts.port);

    // Resolve and connect
    std::string net_error;
    bool timed_out = false;
    sock_ = platform::connect_tcp(opts.host, opts.port, timeout_ms_, net_error, timed_out);
    if (sock_ == REXEC_INVALID_SOCKET) {
        return Result<void>::Err(timed_out ? ErrorKind::Timeout : ErrorKind::Handshake, net_error);
    }
    rexec_logf("TCP connected to {}", target_str_);

    // Create SSH session
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        release();
        return Result<void>::Err(ErrorKind::Handshake, "Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 0);

    // Only the configured key exchange methods may be negotiated.
    std::string kex_pref = kex_method_pref(opts.kex_algorithms);
    rexec_logf("KEX preference: {}", kex_pref);
    if (libssh2_session_method_pref(session_, LIBSSH2_METHOD_KEX, kex_pref.c_str()) != 0) {
        std::string err = "No supported key exchange algorithm in '" + kex_pref +
                          "': " + last_error();
        release();
        return Result<void>::Err(ErrorKind::Handshake, err);
    }
    if (!opts.host_key_algorithms.empty() &&
        libssh2_session_method_pref(session_, LIBSSH2_METHOD_HOSTKEY,
                                    opts.host_key_algorithms.c_str()) != 0) {
        std::string err = "No supported host key algorithm in '" + opts.host_key_algorithms +
                          "': " + last_error();
        release();
        return Result<void>::Err(ErrorKind::Handshake, err);
    }

    // SSH handshake (key exchange)
    int rc = call_nonblocking(session_, sock_, timeout_ms_,
                              [&] { return libssh2_session_handshake(session_, sock_); },
                              timed_out);
    if (rc != 0) {
        std::string err = timed_out ? "SSH handshake timed out with " + target_str_
                                    : "SSH handshake failed: " + last_error();
        release();
        return Result<void>::Err(timed_out ? ErrorKind::Timeout : ErrorKind::Handshake, err);
    }

    const char* kex = libssh2_session_methods(session_, LIBSSH2_METHOD_KEX);
    const char* hostkey = libssh2_session_methods(session_, LIBSSH2_METHOD_HOSTKEY);
    rexec_logf("Handshake complete: kex={} hostkey={}", kex ? kex : "?", hostkey ? hostkey : "?");

    ServerIdentity identity = server_identity(opts);
    std::string reason;
    bool trusted = policy.verify(identity, reason);
    rexec_logf("Host key {} {} for {}: {} ({}, policy {})",
               host_key_type_name(identity.key_type), identity.fingerprint, target_str_,
               trusted ? "accepted" : "rejected", reason, policy.describe());
    if (!trusted) {
        bool ignored = false;
        call_nonblocking(session_, sock_, timeout_ms_, [&] {
            return libssh2_session_disconnect_ex(session_, SSH_DISCONNECT_HOST_KEY_NOT_VERIFIABLE,
                                                 "Host key verification failed",
                                                 DISCONNECT_LANGUAGE);
        }, ignored);
        release();
        return Result<void>::Err(ErrorKind::Handshake, "Server identity rejected: " + reason);
    }

    return Result<void>::Ok();
}

ServerIdentity Libssh2Transport::server_identity(const TransportOptions& opts) const {
    ServerIdentity identity;
    identity.host = opts.host;
    identity.port = opts.port;

    size_t key_len = 0;
    int key_type = LIBSSH2_HOSTKEY_TYPE_UNKNOWN;
    const char* key = libssh2_session_hostkey(session_, &key_len, &key_type);
    if (key && key_len > 0) {
        identity.key.assign(key, key_len);
    }
    identity.key_type = to_host_key_type(key_type);

    // SHA-256 digest is 32 raw bytes
    const char* digest = libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256);
    if (digest) {
        identity.fingerprint = sha256_fingerprint(std::string(digest, 32));
    }
    return identity;
}

Result<bool> Libssh2Transport::authenticate(const std::string& user, const Credentials& creds,
                                            const std::string& public_key, const char* method) {
    if (!session_) {
        return Result<bool>::Err(ErrorKind::Handshake, "Transport is not connected");
    }

    const char* passphrase = creds.passphrase.empty() ? nullptr : creds.passphrase.c_str();
    const char* pub = public_key.empty() ? nullptr : public_key.data();

    bool timed_out = false;
    int rc = call_nonblocking(session_, sock_, timeout_ms_, [&] {
        return libssh2_userauth_publickey_frommemory(
            session_, user.c_str(), user.length(),
            pub, public_key.size(),
            creds.private_key.data(), creds.private_key.size(),
            passphrase);
    }, timed_out);

    if (rc == 0) {
        rexec_logf("Authenticated as {} with {}", user, method);
        return Result<bool>::Ok(true);
    }
    if (timed_out) {
        return Result<bool>::Err(ErrorKind::Timeout,
            fmt::format("Authentication ({}) timed out", method));
    }

    std::string err = last_error();
    switch (rc) {
    case LIBSSH2_ERROR_AUTHENTICATION_FAILED:
    case LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED:
        rexec_logf("Server rejected {} for {}: {}", method, user, err);
        return Result<bool>::Ok(false);
    case LIBSSH2_ERROR_FILE:
    case LIBSSH2_ERROR_METHOD_NOT_SUPPORTED:
        return Result<bool>::Err(ErrorKind::Credential,
            "Unable to use key " + creds.private_key_path.string() + ": " + err);
    default:
        return Result<bool>::Err(ErrorKind::Handshake,
            fmt::format("Transport failure during authentication ({}): {}", method, err));
    }
}

Result<bool> Libssh2Transport::authenticate_publickey(const std::string& user,
                                                      const Credentials& creds) {
    // libssh2 picks rsa-sha2-512/256 from the server's server-sig-algs.
    return authenticate(user, creds, creds.public_key, "publickey");
}

Result<bool> Libssh2Transport::authenticate_certificate(const std::string& user,
                                                        const Credentials& creds,
                                                        const Certificate& cert) {
    // The certificate takes the place of the public key blob.
    return authenticate(user, creds, cert.data, "publickey+cert");
}

Result<std::unique_ptr<ExecChannel>> Libssh2Transport::open_channel() {
    using R = Result<std::unique_ptr<ExecChannel>>;
    if (!session_) {
        return R::Err(ErrorKind::SessionState, "Transport is not connected");
    }

    LIBSSH2_CHANNEL* ch = nullptr;
    bool timed_out = false;
    call_nonblocking(session_, sock_, timeout_ms_, [&] {
        ch = libssh2_channel_open_session(session_);
        if (ch) return 0;
        return libssh2_session_last_errno(session_);
    }, timed_out);

    if (!ch) {
        if (timed_out) return R::Err(ErrorKind::Timeout, "Timed out opening channel");
        return R::Err(ErrorKind::Channel, "Failed to open SSH channel: " + last_error());
    }

    rexec_log("Channel opened");
    return R::Ok(std::make_unique<Libssh2ExecChannel>(ch, session_, sock_, timeout_ms_));
}

Result<void> Libssh2Transport::disconnect(const std::string& description) {
    if (!session_) {
        return Result<void>::Err(ErrorKind::SessionState, "Transport is not connected");
    }

    bool timed_out = false;
    int rc = call_nonblocking(session_, sock_, timeout_ms_, [&] {
        return libssh2_session_disconnect_ex(session_, SSH_DISCONNECT_BY_APPLICATION,
                                             description.c_str(), DISCONNECT_LANGUAGE);
    }, timed_out);

    if (rc != 0) {
        return Result<void>::Err(timed_out ? ErrorKind::Timeout : ErrorKind::Other,
                                 "Disconnect failed: " + last_error());
    }
    return Result<void>::Ok();
}

// ── Libssh2ExecChannel ───────────────────────────────────────────────

Libssh2ExecChannel::Libssh2ExecChannel(LIBSSH2_CHANNEL* ch, LIBSSH2_SESSION* session,
                                       socket_t sock, int timeout_ms)
    : ch_(ch), session_(session), sock_(sock), timeout_ms_(timeout_ms) {}

Libssh2ExecChannel::~Libssh2ExecChannel() {
    if (!ch_) return;
    bool timed_out = false;
    if (!closed_) {
        call_nonblocking(session_, sock_, timeout_ms_,
                         [&] { return libssh2_channel_close(ch_); }, timed_out);
    }
    call_nonblocking(session_, sock_, timeout_ms_,
                     [&] { return libssh2_channel_free(ch_); }, timed_out);
    ch_ = nullptr;
}

Result<void> Libssh2ExecChannel::exec(const std::string& command) {
    bool timed_out = false;
    int rc = call_nonblocking(session_, sock_, timeout_ms_,
                              [&] { return libssh2_channel_exec(ch_, command.c_str()); },
                              timed_out);
    if (rc == 0) return Result<void>::Ok();
    if (timed_out) return Result<void>::Err(ErrorKind::Timeout, "Timed out sending exec request");
    if (rc == LIBSSH2_ERROR_CHANNEL_REQUEST_DENIED) {
        return Result<void>::Err(ErrorKind::Channel, "Server refused the exec request");
    }
    return Result<void>::Err(ErrorKind::Channel,
                             fmt::format("Failed to exec command on channel (libssh2 error {})", rc));
}

void Libssh2ExecChannel::lose(const std::string& reason) {
    pending_.push_back(ChannelLostEvent{reason});
    finished_ = true;
}

void Libssh2ExecChannel::finish() {
    pending_.push_back(EofEvent{});

    bool timed_out = false;
    int rc = call_nonblocking(session_, sock_, timeout_ms_,
                              [&] { return libssh2_channel_close(ch_); }, timed_out);
    if (rc == 0) {
        rc = call_nonblocking(session_, sock_, timeout_ms_,
                              [&] { return libssh2_channel_wait_closed(ch_); }, timed_out);
    }
    if (rc != 0) {
        lose(timed_out ? "timed out waiting for channel close"
                       : fmt::format("channel close failed (libssh2 error {})", rc));
        return;
    }
    closed_ = true;

    // libssh2 has no "exit-status received" flag; a signal exit is the only
    // case it can tell apart from a status report.
    char* sig = nullptr;
    size_t sig_len = 0;
    char* msg = nullptr;
    size_t msg_len = 0;
    libssh2_channel_get_exit_signal(ch_, &sig, &sig_len, &msg, &msg_len, nullptr, nullptr);
    if (sig) {
        ExitSignalEvent ev;
        ev.signal.assign(sig, sig_len);
        if (msg) ev.message.assign(msg, msg_len);
        libssh2_free(session_, sig);
        if (msg) libssh2_free(session_, msg);
        pending_.push_back(std::move(ev));
    } else {
        if (msg) libssh2_free(session_, msg);
        // Reads 0 when the peer closed without sending exit-status, so a
        // silent clean close is reported as success on this transport.
        pending_.push_back(ExitStatusEvent{libssh2_channel_get_exit_status(ch_)});
    }
    finished_ = true;
}

std::optional<ChannelEvent> Libssh2ExecChannel::wait() {
    char buf[SSH_READ_BUF_SIZE];

    while (true) {
        if (!pending_.empty()) {
            ChannelEvent ev = std::move(pending_.front());
            pending_.pop_front();
            return ev;
        }
        if (finished_) return std::nullopt;

        ssize_t n = libssh2_channel_read(ch_, buf, sizeof(buf));
        if (n > 0) return DataEvent{std::string(buf, static_cast<size_t>(n))};
        if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            lose(fmt::format("channel read failed (libssh2 error {})", n));
            continue;
        }

        ssize_t e = libssh2_channel_read_stderr(ch_, buf, sizeof(buf));
        if (e > 0) return ExtendedDataEvent{SSH_EXTENDED_DATA_STDERR,
                                            std::string(buf, static_cast<size_t>(e))};
        if (e < 0 && e != LIBSSH2_ERROR_EAGAIN) {
            lose(fmt::format("channel stderr read failed (libssh2 error {})", e));
            continue;
        }

        if (libssh2_channel_eof(ch_)) {
            finish();
            continue;
        }

        switch (wait_socket(session_, sock_, timeout_ms_)) {
        case WaitResult::Ready:
            break;
        case WaitResult::TimedOut:
            lose(fmt::format("no traffic for {}s (inactivity timeout)", timeout_ms_ / 1000));
            break;
        case WaitResult::Failed:
            lose("socket error while waiting for channel data");
            break;
        }
    }
}
