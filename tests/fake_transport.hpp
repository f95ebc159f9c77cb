#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <ssh/host_key_policy.hpp>
#include <ssh/transport.hpp>

// Everything the fake saw, plus the script it plays back. Shared with the
// test because the transport itself is owned by the Session.
struct FakeState {
    // Script
    Result<void> connect_result = Result<void>::Ok();
    Result<bool> auth_result = Result<bool>::Ok(true);
    Result<void> disconnect_result = Result<void>::Ok();
    Result<void> exec_result = Result<void>::Ok();
    ErrorKind open_error_kind = ErrorKind::None;   // None = open succeeds
    std::deque<std::vector<ChannelEvent>> channel_scripts;
    std::function<void()> on_wait;
    ServerIdentity identity{"fake.example", 22, HostKeyType::Ed25519, "blob", "SHA256:fake"};

    // Recorded
    int connect_calls = 0;
    int publickey_calls = 0;
    int certificate_calls = 0;
    int open_calls = 0;
    int disconnect_calls = 0;
    int channels_alive = 0;
    bool destroyed = false;
    TransportOptions options;
    std::string policy_name;
    std::string auth_user;
    std::string auth_cert_type;
    std::vector<std::string> commands;
    std::vector<std::string> disconnect_descriptions;
};

class FakeChannel : public ExecChannel {
public:
    FakeChannel(std::shared_ptr<FakeState> state, std::vector<ChannelEvent> events)
        : state_(std::move(state)), events_(std::move(events)) {
        state_->channels_alive++;
    }
    ~FakeChannel() override { state_->channels_alive--; }

    Result<void> exec(const std::string& command) override {
        state_->commands.push_back(command);
        return state_->exec_result;
    }

    std::optional<ChannelEvent> wait() override {
        if (state_->on_wait) state_->on_wait();
        if (next_ >= events_.size()) return std::nullopt;
        return events_[next_++];
    }

private:
    std::shared_ptr<FakeState> state_;
    std::vector<ChannelEvent> events_;
    size_t next_ = 0;
};

class FakeTransport : public Transport {
public:
    explicit FakeTransport(std::shared_ptr<FakeState> state) : state_(std::move(state)) {}
    ~FakeTransport() override { state_->destroyed = true; }

    Result<void> connect(const TransportOptions& opts, HostKeyPolicy& policy) override {
        state_->connect_calls++;
        state_->options = opts;
        state_->policy_name = policy.describe();
        if (state_->connect_result.is_err()) return state_->connect_result;

        std::string reason;
        if (!policy.verify(state_->identity, reason)) {
            return Result<void>::Err(ErrorKind::Handshake, "Server identity rejected: " + reason);
        }
        return Result<void>::Ok();
    }

    Result<bool> authenticate_publickey(const std::string& user, const Credentials&) override {
        state_->publickey_calls++;
        state_->auth_user = user;
        return state_->auth_result;
    }

    Result<bool> authenticate_certificate(const std::string& user, const Credentials&,
                                          const Certificate& cert) override {
        state_->certificate_calls++;
        state_->auth_user = user;
        state_->auth_cert_type = cert.key_type;
        return state_->auth_result;
    }

    Result<std::unique_ptr<ExecChannel>> open_channel() override {
        state_->open_calls++;
        if (state_->open_error_kind != ErrorKind::None) {
            return Result<std::unique_ptr<ExecChannel>>::Err(state_->open_error_kind,
                                                             "scripted open failure");
        }
        std::vector<ChannelEvent> events;
        if (!state_->channel_scripts.empty()) {
            events = std::move(state_->channel_scripts.front());
            state_->channel_scripts.pop_front();
        }
        return Result<std::unique_ptr<ExecChannel>>::Ok(
            std::make_unique<FakeChannel>(state_, std::move(events)));
    }

    Result<void> disconnect(const std::string& description) override {
        state_->disconnect_calls++;
        state_->disconnect_descriptions.push_back(description);
        return state_->disconnect_result;
    }

private:
    std::shared_ptr<FakeState> state_;
};
