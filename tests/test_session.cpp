#include <gtest/gtest.h>
#include <core/constants.hpp>
#include <ssh/session.hpp>
#include <sstream>
#include "fake_transport.hpp"
#include "test_util.hpp"

class SessionTest : public ::testing::Test {
protected:
    TempDir dir;
    std::shared_ptr<FakeState> state = std::make_shared<FakeState>();
    SessionTarget target;

    void SetUp() override {
        target.host = "build01.example";
        target.port = 2222;
        target.user = "deploy";
        target.private_key_path = dir.write("id_ed25519", FAKE_PRIVATE_KEY);
    }

    void with_certificate() {
        target.certificate_path = dir.write("id_ed25519-cert.pub", FAKE_CERTIFICATE);
    }

    std::unique_ptr<Session> connect_ok() {
        auto r = Session::connect(target, std::make_unique<FakeTransport>(state));
        EXPECT_TRUE(r.is_ok()) << r.error;
        return std::move(r.value);
    }

    void script(std::vector<ChannelEvent> events) {
        state->channel_scripts.push_back(std::move(events));
    }
};

// ── connect ─────────────────────────────────────────────────

TEST_F(SessionTest, ConnectPlainKeyUsesPublickeyOnly) {
    auto session = connect_ok();
    ASSERT_TRUE(session);
    EXPECT_EQ(state->publickey_calls, 1);
    EXPECT_EQ(state->certificate_calls, 0);
    EXPECT_EQ(state->auth_user, "deploy");
    EXPECT_EQ(session->state(), SessionState::Idle);
}

TEST_F(SessionTest, ConnectWithCertificateUsesCertificateOnly) {
    with_certificate();
    auto session = connect_ok();
    ASSERT_TRUE(session);
    EXPECT_EQ(state->certificate_calls, 1);
    EXPECT_EQ(state->publickey_calls, 0);
    EXPECT_EQ(state->auth_cert_type, "ssh-ed25519-cert-v01@openssh.com");
}

TEST_F(SessionTest, ConnectPassesRestrictedKexAndTarget) {
    auto session = connect_ok();
    EXPECT_EQ(state->options.host, "build01.example");
    EXPECT_EQ(state->options.port, 2222);
    EXPECT_EQ(state->options.kex_algorithms, DEFAULT_KEX_ALGORITHMS);
    EXPECT_EQ(state->options.inactivity_timeout_secs, 5);
}

TEST_F(SessionTest, ConnectHonorsConfiguredKex) {
    target.kex_algorithms = "curve25519-sha256";
    target.inactivity_timeout_secs = 30;
    auto session = connect_ok();
    EXPECT_EQ(state->options.kex_algorithms, "curve25519-sha256");
    EXPECT_EQ(state->options.inactivity_timeout_secs, 30);
}

TEST_F(SessionTest, ConnectDefaultsToAcceptAnyPolicy) {
    auto session = connect_ok();
    EXPECT_EQ(state->policy_name, "accept-any");
}

TEST_F(SessionTest, ConnectRejectedServerIdentityIsHandshakeError) {
    target.host_key_policy = std::make_shared<FingerprintPolicy>(
        std::vector<std::string>{"SHA256:somethingelse"});
    auto r = Session::connect(target, std::make_unique<FakeTransport>(state));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Handshake);
    EXPECT_EQ(state->publickey_calls, 0);
}

TEST_F(SessionTest, ConnectPinnedFingerprintAccepted) {
    target.host_key_policy = std::make_shared<FingerprintPolicy>(
        std::vector<std::string>{"SHA256:fake"});
    auto session = connect_ok();
    EXPECT_TRUE(session);
}

TEST_F(SessionTest, MissingKeyFailsBeforeNetwork) {
    target.private_key_path = dir.path() / "missing";
    auto r = Session::connect(target, std::make_unique<FakeTransport>(state));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Credential);
    EXPECT_EQ(state->connect_calls, 0);
}

TEST_F(SessionTest, BadCertificateFailsBeforeNetwork) {
    target.certificate_path = dir.write("bogus-cert.pub", FAKE_PUBLIC_KEY);
    auto r = Session::connect(target, std::make_unique<FakeTransport>(state));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Credential);
    EXPECT_EQ(state->connect_calls, 0);
}

TEST_F(SessionTest, HandshakeFailurePropagates) {
    state->connect_result = Result<void>::Err(ErrorKind::Handshake, "no common kex");
    auto r = Session::connect(target, std::make_unique<FakeTransport>(state));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Handshake);
    EXPECT_EQ(r.error, "no common kex");
    EXPECT_EQ(state->publickey_calls, 0);
    EXPECT_TRUE(state->destroyed);
}

TEST_F(SessionTest, RejectedPublickeyIsAuthenticationError) {
    state->auth_result = Result<bool>::Ok(false);
    auto r = Session::connect(target, std::make_unique<FakeTransport>(state));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Authentication);
    EXPECT_EQ(r.error, "Authentication (with publickey) failed");
    EXPECT_EQ(state->publickey_calls, 1);
    EXPECT_TRUE(state->destroyed);
}

TEST_F(SessionTest, RejectedCertificateIsAuthenticationError) {
    with_certificate();
    state->auth_result = Result<bool>::Ok(false);
    auto r = Session::connect(target, std::make_unique<FakeTransport>(state));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Authentication);
    EXPECT_EQ(r.error, "Authentication (with publickey+cert) failed");
    EXPECT_EQ(state->publickey_calls, 0);
}

TEST_F(SessionTest, TransportFailureDuringAuthKeepsItsKind) {
    state->auth_result = Result<bool>::Err(ErrorKind::Timeout, "Authentication (publickey) timed out");
    auto r = Session::connect(target, std::make_unique<FakeTransport>(state));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Timeout);
}

TEST_F(SessionTest, EmptyUserRejected) {
    target.user.clear();
    auto r = Session::connect(target, std::make_unique<FakeTransport>(state));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Config);
    EXPECT_EQ(state->connect_calls, 0);
}

TEST_F(SessionTest, StatusCallbackReportsProgress) {
    std::vector<std::string> messages;
    auto r = Session::connect(target, std::make_unique<FakeTransport>(state),
                              [&](const std::string& m) { messages.push_back(m); });
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_FALSE(messages.empty());
    EXPECT_EQ(messages.front(), "Connecting to build01.example:2222");
    EXPECT_EQ(messages.back(), "Connected to deploy@build01.example:2222");
}

// ── call ────────────────────────────────────────────────────

TEST_F(SessionTest, CallWritesDataInOrderIncludingAfterExitStatus) {
    auto session = connect_ok();
    script({DataEvent{"foo"}, DataEvent{"bar"}, ExitStatusEvent{0}, DataEvent{"baz"}});

    std::ostringstream out;
    auto r = session->call("echo hi", out);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(out.str(), "foobarbaz");
    EXPECT_EQ(r.value.exit_status, 0);
    EXPECT_EQ(r.value.bytes_written, 9u);
    EXPECT_EQ(state->commands, std::vector<std::string>{"echo hi"});
}

TEST_F(SessionTest, CallReturnsNonZeroExitStatus) {
    auto session = connect_ok();
    script({DataEvent{"oops\n"}, EofEvent{}, ExitStatusEvent{42}});

    std::ostringstream out;
    auto r = session->call("false", out);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.exit_status, 42);
    EXPECT_EQ(out.str(), "oops\n");
}

TEST_F(SessionTest, CallWithoutExitStatusIsProtocolConsistencyError) {
    auto session = connect_ok();
    script({DataEvent{"x"}});

    std::ostringstream out;
    auto r = session->call("true", out);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ProtocolConsistency);
    EXPECT_EQ(out.str(), "x");
    EXPECT_EQ(session->state(), SessionState::Idle);
}

TEST_F(SessionTest, CallIgnoresOtherEvents) {
    auto session = connect_ok();
    script({ExtendedDataEvent{1, "warning\n"}, DataEvent{"out"}, EofEvent{},
            ExitStatusEvent{3}, EofEvent{}});

    std::ostringstream out;
    auto r = session->call("cmd", out);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(out.str(), "out");
    EXPECT_EQ(r.value.exit_status, 3);
}

TEST_F(SessionTest, CallKeepsFirstExitStatus) {
    auto session = connect_ok();
    script({ExitStatusEvent{1}, ExitStatusEvent{2}});

    std::ostringstream out;
    auto r = session->call("cmd", out);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.exit_status, 1);
}

TEST_F(SessionTest, CallKilledBySignalIsProtocolConsistencyError) {
    auto session = connect_ok();
    script({DataEvent{"partial"}, ExitSignalEvent{"KILL", "", false}});

    std::ostringstream out;
    auto r = session->call("sleep 100", out);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ProtocolConsistency);
    EXPECT_NE(r.error.find("KILL"), std::string::npos);
}

TEST_F(SessionTest, ChannelLostClosesSession) {
    auto session = connect_ok();
    script({DataEvent{"a"}, ChannelLostEvent{"no traffic for 5s (inactivity timeout)"}});

    std::ostringstream out;
    auto r = session->call("cmd", out);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ProtocolConsistency);
    EXPECT_NE(r.error.find("inactivity timeout"), std::string::npos);
    EXPECT_EQ(session->state(), SessionState::Closed);

    auto again = session->call("cmd", out);
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.kind, ErrorKind::SessionState);
}

TEST_F(SessionTest, LocalWriteFailureIsLocalIOError) {
    auto session = connect_ok();
    script({DataEvent{"a"}, DataEvent{"b"}, ExitStatusEvent{0}});

    std::ostream broken(nullptr);
    auto r = session->call("cmd", broken);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::LocalIO);
    EXPECT_EQ(state->channels_alive, 0);
}

TEST_F(SessionTest, ChannelReleasedAfterEachCall) {
    auto session = connect_ok();
    script({DataEvent{"1"}, ExitStatusEvent{0}});
    script({DataEvent{"2"}, ExitStatusEvent{0}});

    std::ostringstream out;
    ASSERT_TRUE(session->call("first", out).is_ok());
    EXPECT_EQ(state->channels_alive, 0);
    ASSERT_TRUE(session->call("second", out).is_ok());
    EXPECT_EQ(state->channels_alive, 0);
    EXPECT_EQ(state->open_calls, 2);
    EXPECT_EQ(out.str(), "12");
}

TEST_F(SessionTest, SecondCallWhileDrainingIsRejected) {
    auto session = connect_ok();
    script({DataEvent{"a"}, ExitStatusEvent{0}});

    Result<ExecutionResult> nested = Result<ExecutionResult>::Ok({});
    bool tried = false;
    state->on_wait = [&] {
        if (tried) return;
        tried = true;
        EXPECT_EQ(session->state(), SessionState::ChannelOpen);
        std::ostringstream inner;
        nested = session->call("nested", inner);
    };

    std::ostringstream out;
    auto r = session->call("outer", out);
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_TRUE(nested.is_err());
    EXPECT_EQ(nested.kind, ErrorKind::SessionState);
    EXPECT_EQ(state->open_calls, 1);
}

TEST_F(SessionTest, OpenChannelFailurePropagates) {
    auto session = connect_ok();
    state->open_error_kind = ErrorKind::Channel;

    std::ostringstream out;
    auto r = session->call("cmd", out);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Channel);
    EXPECT_EQ(session->state(), SessionState::Idle);
}

TEST_F(SessionTest, ExecRefusedPropagates) {
    auto session = connect_ok();
    script({ExitStatusEvent{0}});
    state->exec_result = Result<void>::Err(ErrorKind::Channel, "Server refused the exec request");

    std::ostringstream out;
    auto r = session->call("cmd", out);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Channel);
    EXPECT_EQ(state->channels_alive, 0);
    EXPECT_EQ(session->state(), SessionState::Idle);
}

// ── close ───────────────────────────────────────────────────

TEST_F(SessionTest, CloseSendsDisconnectAndReleasesTransport) {
    auto session = connect_ok();
    session->close();
    EXPECT_EQ(state->disconnect_calls, 1);
    EXPECT_EQ(state->disconnect_descriptions.back(), DEFAULT_DISCONNECT_MESSAGE);
    EXPECT_TRUE(state->destroyed);
    EXPECT_FALSE(session->is_open());
}

TEST_F(SessionTest, CloseUsesConfiguredDisconnectMessage) {
    target.disconnect_message = "bye";
    auto session = connect_ok();
    session->close();
    EXPECT_EQ(state->disconnect_descriptions.back(), "bye");
}

TEST_F(SessionTest, CloseSwallowsDisconnectFailure) {
    auto session = connect_ok();
    state->disconnect_result = Result<void>::Err(ErrorKind::Other, "socket closed");
    EXPECT_NO_THROW(session->close());
    EXPECT_TRUE(state->destroyed);
    EXPECT_EQ(session->state(), SessionState::Closed);
}

TEST_F(SessionTest, CloseIsIdempotent) {
    auto session = connect_ok();
    session->close();
    session->close();
    session.reset();
    EXPECT_EQ(state->disconnect_calls, 1);
}

TEST_F(SessionTest, DestructorClosesSession) {
    {
        auto session = connect_ok();
    }
    EXPECT_EQ(state->disconnect_calls, 1);
    EXPECT_TRUE(state->destroyed);
}

TEST_F(SessionTest, CallAfterCloseIsRejected) {
    auto session = connect_ok();
    session->close();
    std::ostringstream out;
    auto r = session->call("cmd", out);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::SessionState);
    EXPECT_EQ(state->open_calls, 0);
}
