#pragma once

#include <memory>
#include <string>
#include <vector>

enum class HostKeyType {
    Unknown,
    Rsa,
    Dss,
    Ecdsa256,
    Ecdsa384,
    Ecdsa521,
    Ed25519,
};

const char* host_key_type_name(HostKeyType type);

// What the server presented during the handshake.
struct ServerIdentity {
    std::string host;
    int port = 22;
    HostKeyType key_type = HostKeyType::Unknown;
    std::string key;            // raw host key blob
    std::string fingerprint;    // "SHA256:..." (unpadded base64)
};

// Decides whether to trust a server identity. Invoked once per connect,
// after key exchange and before authentication.
class HostKeyPolicy {
public:
    virtual ~HostKeyPolicy() = default;

    virtual bool verify(const ServerIdentity& identity, std::string& reason) = 0;
    virtual std::string describe() const = 0;
};

// Accepts every server. This is the default and it is not safe against a
// man in the middle; every acceptance is logged.
class AcceptAnyHostKey : public HostKeyPolicy {
public:
    bool verify(const ServerIdentity& identity, std::string& reason) override;
    std::string describe() const override { return "accept-any"; }
};

// Accepts only servers whose SHA-256 fingerprint is in the pinned set.
class FingerprintPolicy : public HostKeyPolicy {
public:
    explicit FingerprintPolicy(std::vector<std::string> fingerprints);

    bool verify(const ServerIdentity& identity, std::string& reason) override;
    std::string describe() const override;

private:
    std::vector<std::string> fingerprints_;
};

// Checks an OpenSSH known_hosts file (plain and hashed entries).
class KnownHostsPolicy : public HostKeyPolicy {
public:
    explicit KnownHostsPolicy(std::string path);

    bool verify(const ServerIdentity& identity, std::string& reason) override;
    std::string describe() const override { return "known-hosts:" + path_; }

private:
    std::string path_;
};

// Accepts if any of the inner policies accepts.
class AnyOfPolicy : public HostKeyPolicy {
public:
    explicit AnyOfPolicy(std::vector<std::unique_ptr<HostKeyPolicy>> policies);

    bool verify(const ServerIdentity& identity, std::string& reason) override;
    std::string describe() const override;

private:
    std::vector<std::unique_ptr<HostKeyPolicy>> policies_;
};
