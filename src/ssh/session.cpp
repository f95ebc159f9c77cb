#include "session.hpp"
#include "libssh2_transport.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

const char* session_state_name(SessionState state) {
    switch (state) {
    case SessionState::Idle:        return "idle";
    case SessionState::ChannelOpen: return "channel-open";
    case SessionState::Closed:      return "closed";
    }
    return "unknown";
}

Session::Session(std::unique_ptr<Transport> transport, std::string target_str,
                 std::string disconnect_message)
    : transport_(std::move(transport)), state_(SessionState::Idle),
      target_str_(std::move(target_str)), disconnect_message_(std::move(disconnect_message)) {
}

Session::~Session() {
    close();
}

Result<std::unique_ptr<Session>> Session::connect(const SessionTarget& target,
                                                  std::unique_ptr<Transport> transport,
                                                  StatusCallback callback) {
    using R = Result<std::unique_ptr<Session>>;

    auto status = [&](const std::string& msg) {
        rexec_log(msg);
        if (callback) callback(msg);
    };

    std::string target_str = target.user + "@" + fmt::format("{}:{}", target.host, target.port);

    if (target.host.empty()) {
        return R::Err(ErrorKind::Config, "No host given");
    }
    if (target.user.empty()) {
        return R::Err(ErrorKind::Config, "No user name given");
    }

    status(fmt::format("Connecting to {}:{}", target.host, target.port));
    status("Key path: " + target.private_key_path.string());
    if (target.certificate_path) {
        status("OpenSSH certificate path: " + target.certificate_path->string());
    }

    // Credentials first: a bad key never touches the network.
    auto creds = CredentialLoader::load(target.private_key_path, target.certificate_path,
                                        target.key_passphrase);
    if (creds.is_err()) return propagate<std::unique_ptr<Session>>(creds);

    if (!transport) transport = std::make_unique<Libssh2Transport>();

    TransportOptions opts;
    opts.host = target.host;
    opts.port = target.port;
    opts.inactivity_timeout_secs = target.inactivity_timeout_secs;
    opts.kex_algorithms = target.kex_algorithms.empty() ? DEFAULT_KEX_ALGORITHMS
                                                        : target.kex_algorithms;
    opts.host_key_algorithms = target.host_key_algorithms;

    std::shared_ptr<HostKeyPolicy> policy = target.host_key_policy;
    if (!policy) policy = std::make_shared<AcceptAnyHostKey>();

    auto connected = transport->connect(opts, *policy);
    if (connected.is_err()) return propagate<std::unique_ptr<Session>>(connected);

    status("SSH handshake complete, authenticating...");

    // Exactly one strategy per connect.
    const bool with_cert = creds.value.has_certificate();
    const char* method = with_cert ? "publickey+cert" : "publickey";
    Result<bool> auth = with_cert
        ? transport->authenticate_certificate(target.user, creds.value, *creds.value.certificate)
        : transport->authenticate_publickey(target.user, creds.value);

    if (auth.is_err() || !auth.value) {
        auto bye = transport->disconnect("Authentication failed");
        if (bye.is_err()) rexec_logf("Ignoring disconnect failure after auth: {}", bye.error);
        if (auth.is_err()) return propagate<std::unique_ptr<Session>>(auth);
        return R::Err(ErrorKind::Authentication,
                      fmt::format("Authentication (with {}) failed", method));
    }

    status("Connected to " + target_str);

    std::string disconnect_message = target.disconnect_message.empty()
        ? DEFAULT_DISCONNECT_MESSAGE : target.disconnect_message;
    return R::Ok(std::unique_ptr<Session>(
        new Session(std::move(transport), target_str, disconnect_message)));
}

Result<ExecutionResult> Session::call(const std::string& command, std::ostream& out) {
    using R = Result<ExecutionResult>;

    if (state_ == SessionState::ChannelOpen) {
        return R::Err(ErrorKind::SessionState, "A command is already running on this session");
    }
    std::unique_lock<std::mutex> lock(call_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return R::Err(ErrorKind::SessionState, "A command is already running on this session");
    }
    if (state_ == SessionState::Closed || !transport_) {
        return R::Err(ErrorKind::SessionState,
                      fmt::format("Session {} is {}", target_str_, session_state_name(state_)));
    }

    auto opened = transport_->open_channel();
    if (opened.is_err()) {
        if (opened.kind == ErrorKind::Timeout) state_ = SessionState::Closed;
        return propagate<ExecutionResult>(opened);
    }
    std::unique_ptr<ExecChannel> channel = std::move(opened.value);
    state_ = SessionState::ChannelOpen;

    rexec_logf("exec on {}: {}", target_str_, command);
    auto started = channel->exec(command);
    if (started.is_err()) {
        channel.reset();
        state_ = started.kind == ErrorKind::Timeout ? SessionState::Closed : SessionState::Idle;
        return propagate<ExecutionResult>(started);
    }

    std::optional<int> exit_status;
    ExecutionResult result;
    std::string io_error;
    std::string exit_signal;
    std::string lost_reason;

    // Drain until the stream ends. An exit status does not end the loop:
    // data may still follow it.
    while (auto event = channel->wait()) {
        std::visit(overloaded{
            [&](const DataEvent& ev) {
                out.write(ev.bytes.data(), static_cast<std::streamsize>(ev.bytes.size()));
                out.flush();
                if (!out) {
                    io_error = fmt::format("Failed writing {} bytes to local output",
                                           ev.bytes.size());
                    return;
                }
                result.bytes_written += ev.bytes.size();
            },
            [&](const ExtendedDataEvent& ev) {
                rexec_logf("Ignoring {} bytes of extended data (stream {})",
                           ev.bytes.size(), ev.stream_id);
            },
            [&](const EofEvent&) {
                rexec_log("Remote EOF");
            },
            [&](const ExitStatusEvent& ev) {
                if (exit_status) {
                    rexec_logf("Duplicate exit status {} (keeping {})", ev.code, *exit_status);
                    return;
                }
                exit_status = ev.code;
                rexec_logf("Exit status {}", ev.code);
            },
            [&](const ExitSignalEvent& ev) {
                exit_signal = ev.signal + (ev.core_dumped ? " (core dumped)" : "");
                if (!ev.message.empty()) exit_signal += ": " + ev.message;
                rexec_logf("Remote command killed by signal {}", exit_signal);
            },
            [&](const ChannelLostEvent& ev) {
                lost_reason = ev.reason;
                rexec_logf("Channel lost: {}", ev.reason);
            },
        }, *event);

        if (!io_error.empty()) break;
    }

    channel.reset();
    state_ = lost_reason.empty() ? SessionState::Idle : SessionState::Closed;

    if (!io_error.empty()) {
        return R::Err(ErrorKind::LocalIO, io_error);
    }

    if (!exit_status) {
        std::string err = "Remote command ended without reporting an exit status";
        if (!exit_signal.empty()) err += " (killed by signal " + exit_signal + ")";
        if (!lost_reason.empty()) err += " (" + lost_reason + ")";
        return R::Err(ErrorKind::ProtocolConsistency, err);
    }

    result.exit_status = *exit_status;
    return R::Ok(result);
}

void Session::close() {
    std::lock_guard<std::mutex> lock(call_mutex_);
    if (transport_) {
        // A broken transport may refuse the disconnect; release it anyway.
        auto r = transport_->disconnect(disconnect_message_);
        if (r.is_err()) {
            rexec_logf("Ignoring disconnect failure on {}: {}", target_str_, r.error);
        }
        transport_.reset();
        rexec_logf("Session {} closed", target_str_);
    }
    state_ = SessionState::Closed;
}
