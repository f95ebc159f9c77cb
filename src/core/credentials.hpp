#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "types.hpp"

namespace fs = std::filesystem;

// OpenSSH user certificate, kept as the text of its .pub-style file.
struct Certificate {
    fs::path path;
    std::string key_type;   // e.g. "ssh-ed25519-cert-v01@openssh.com"
    std::string data;
};

// In-memory key material handed to the transport. Parsing the key itself is
// the transport's job; the loader only checks that the files look right.
struct Credentials {
    fs::path private_key_path;
    std::string private_key;
    std::string public_key;     // sibling "<key>.pub" if present, else empty
    std::string passphrase;
    std::optional<Certificate> certificate;

    bool has_certificate() const { return certificate.has_value(); }
};

class CredentialLoader {
public:
    // Load the private key and, when cert_path is set, the certificate.
    // Every failure is ErrorKind::Credential.
    static Result<Credentials> load(const fs::path& key_path,
                                    const std::optional<fs::path>& cert_path,
                                    const std::string& passphrase = "");

    static Result<Certificate> load_certificate(const fs::path& cert_path);

private:
    static Result<std::string> read_file(const fs::path& path, const char* what);
};
