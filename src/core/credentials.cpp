#include "credentials.hpp"
#include "constants.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <fstream>
#include <sstream>

static const std::string CERT_SUFFIX = "-cert-v01@openssh.com";

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static bool looks_like_private_key(const std::string& text) {
    auto begin = text.find("-----BEGIN ");
    if (begin == std::string::npos) return false;
    auto tag_end = text.find("PRIVATE KEY-----", begin);
    if (tag_end == std::string::npos) return false;
    return text.find("-----END ", tag_end) != std::string::npos;
}

static bool is_base64_blob(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                  (c >= '0' && c <= '9') || c == '+' || c == '/' || c == '=';
        if (!ok) return false;
    }
    return true;
}

Result<std::string> CredentialLoader::read_file(const fs::path& path, const char* what) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Result<std::string>::Err(ErrorKind::Credential,
            std::string(what) + " not found: " + path.string());
    }
    auto size = fs::file_size(path, ec);
    if (ec) {
        return Result<std::string>::Err(ErrorKind::Credential,
            std::string("Cannot stat ") + what + ": " + path.string() + " (" + ec.message() + ")");
    }
    if (size == 0 || size > static_cast<uintmax_t>(MAX_KEY_FILE_BYTES)) {
        return Result<std::string>::Err(ErrorKind::Credential,
            std::string(what) + " has an implausible size (" + std::to_string(size) +
            " bytes): " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<std::string>::Err(ErrorKind::Credential,
            std::string("Cannot read ") + what + ": " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    return Result<std::string>::Ok(content);
}

Result<Certificate> CredentialLoader::load_certificate(const fs::path& cert_path) {
    auto data = read_file(cert_path, "Certificate");
    if (data.is_err()) return propagate<Certificate>(data);

    std::istringstream in(data.value);
    std::string key_type, blob;
    in >> key_type >> blob;

    if (!ends_with(key_type, CERT_SUFFIX)) {
        return Result<Certificate>::Err(ErrorKind::Credential,
            "Not an OpenSSH certificate (type '" + key_type + "'): " + cert_path.string());
    }
    if (!is_base64_blob(blob)) {
        return Result<Certificate>::Err(ErrorKind::Credential,
            "Certificate body is not base64: " + cert_path.string());
    }

    Certificate cert;
    cert.path = cert_path;
    cert.key_type = key_type;
    cert.data = data.value;
    trim(cert.data);
    return Result<Certificate>::Ok(cert);
}

Result<Credentials> CredentialLoader::load(const fs::path& key_path,
                                           const std::optional<fs::path>& cert_path,
                                           const std::string& passphrase) {
    auto key = read_file(key_path, "Private key");
    if (key.is_err()) return propagate<Credentials>(key);

    if (!looks_like_private_key(key.value)) {
        return Result<Credentials>::Err(ErrorKind::Credential,
            "Not a PEM or OpenSSH private key: " + key_path.string());
    }

    Credentials creds;
    creds.private_key_path = key_path;
    creds.private_key = std::move(key.value);
    creds.passphrase = passphrase;

    // The public half is optional; the transport can derive it from the key.
    fs::path pub_path = key_path;
    pub_path += ".pub";
    std::error_code ec;
    if (fs::is_regular_file(pub_path, ec)) {
        auto pub = read_file(pub_path, "Public key");
        if (pub.is_ok()) {
            creds.public_key = pub.value;
            trim(creds.public_key);
        } else {
            rexec_logf("Ignoring unreadable public key {}: {}", pub_path.string(), pub.error);
        }
    }

    if (cert_path) {
        auto cert = load_certificate(*cert_path);
        if (cert.is_err()) return propagate<Credentials>(cert);
        creds.certificate = std::move(cert.value);
    }

    rexec_logf("Loaded private key {}{}", key_path.string(),
               creds.certificate ? " with certificate " + creds.certificate->path.string() : "");
    return Result<Credentials>::Ok(std::move(creds));
}
