#include "host_key_policy.hpp"
#include "libssh2_transport.hpp"
#include <core/log.hpp>
#include <libssh2.h>
#include <algorithm>

const char* host_key_type_name(HostKeyType type) {
    switch (type) {
    case HostKeyType::Rsa:      return "ssh-rsa";
    case HostKeyType::Dss:      return "ssh-dss";
    case HostKeyType::Ecdsa256: return "ecdsa-sha2-nistp256";
    case HostKeyType::Ecdsa384: return "ecdsa-sha2-nistp384";
    case HostKeyType::Ecdsa521: return "ecdsa-sha2-nistp521";
    case HostKeyType::Ed25519:  return "ssh-ed25519";
    case HostKeyType::Unknown:  break;
    }
    return "unknown";
}

// ── AcceptAnyHostKey ─────────────────────────────────────────────────

bool AcceptAnyHostKey::verify(const ServerIdentity& identity, std::string& reason) {
    rexec_logf("WARNING: accepting unverified host key for {}:{} ({} {})",
               identity.host, identity.port,
               host_key_type_name(identity.key_type), identity.fingerprint);
    reason = "host key not verified (accept-any policy)";
    return true;
}

// ── FingerprintPolicy ────────────────────────────────────────────────

// "SHA256:abc=" and "abc" both name the same fingerprint.
static std::string normalize_fingerprint(std::string fp) {
    if (fp.rfind("SHA256:", 0) == 0) fp.erase(0, 7);
    while (!fp.empty() && fp.back() == '=') fp.pop_back();
    return fp;
}

FingerprintPolicy::FingerprintPolicy(std::vector<std::string> fingerprints) {
    for (auto& fp : fingerprints) {
        fingerprints_.push_back(normalize_fingerprint(fp));
    }
}

bool FingerprintPolicy::verify(const ServerIdentity& identity, std::string& reason) {
    auto presented = normalize_fingerprint(identity.fingerprint);
    bool ok = !presented.empty() &&
              std::find(fingerprints_.begin(), fingerprints_.end(), presented) != fingerprints_.end();
    reason = ok ? "fingerprint pinned"
                : "fingerprint " + identity.fingerprint + " is not pinned";
    return ok;
}

std::string FingerprintPolicy::describe() const {
    return "fingerprint(" + std::to_string(fingerprints_.size()) + " pinned)";
}

// ── KnownHostsPolicy ─────────────────────────────────────────────────

KnownHostsPolicy::KnownHostsPolicy(std::string path) : path_(std::move(path)) {}

static int known_host_key_mask(HostKeyType type) {
    switch (type) {
    case HostKeyType::Rsa:      return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case HostKeyType::Dss:      return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
    case HostKeyType::Ecdsa256: return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case HostKeyType::Ecdsa384: return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case HostKeyType::Ecdsa521: return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
    case HostKeyType::Ed25519:  return LIBSSH2_KNOWNHOST_KEY_ED25519;
    case HostKeyType::Unknown:  break;
    }
    return LIBSSH2_KNOWNHOST_KEY_UNKNOWN;
}

bool KnownHostsPolicy::verify(const ServerIdentity& identity, std::string& reason) {
    if (!libssh2_global_init()) {
        reason = "libssh2 initialization failed";
        return false;
    }

    // The known-hosts collection needs a session for allocation only.
    std::unique_ptr<LIBSSH2_SESSION, decltype(&libssh2_session_free)>
        scratch(libssh2_session_init(), &libssh2_session_free);
    if (!scratch) {
        reason = "cannot allocate libssh2 session";
        return false;
    }

    std::unique_ptr<LIBSSH2_KNOWNHOSTS, decltype(&libssh2_knownhost_free)>
        hosts(libssh2_knownhost_init(scratch.get()), &libssh2_knownhost_free);
    if (!hosts) {
        reason = "cannot allocate known hosts collection";
        return false;
    }

    int loaded = libssh2_knownhost_readfile(hosts.get(), path_.c_str(),
                                            LIBSSH2_KNOWNHOST_FILE_OPENSSH);
    if (loaded < 0) {
        reason = "cannot read known hosts file " + path_;
        return false;
    }

    int typemask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW |
                   known_host_key_mask(identity.key_type);
    struct libssh2_knownhost* match = nullptr;
    int check = libssh2_knownhost_checkp(hosts.get(), identity.host.c_str(), identity.port,
                                         identity.key.data(), identity.key.size(),
                                         typemask, &match);

    switch (check) {
    case LIBSSH2_KNOWNHOST_CHECK_MATCH:
        reason = "matched " + path_;
        return true;
    case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
        reason = "HOST KEY MISMATCH for " + identity.host + " in " + path_ +
                 " (presented " + identity.fingerprint + ")";
        return false;
    case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
        reason = "no entry for " + identity.host + " in " + path_;
        return false;
    default:
        reason = "known hosts check failed for " + identity.host;
        return false;
    }
}

// ── AnyOfPolicy ──────────────────────────────────────────────────────

AnyOfPolicy::AnyOfPolicy(std::vector<std::unique_ptr<HostKeyPolicy>> policies)
    : policies_(std::move(policies)) {}

bool AnyOfPolicy::verify(const ServerIdentity& identity, std::string& reason) {
    std::string reasons;
    for (auto& policy : policies_) {
        std::string r;
        if (policy->verify(identity, r)) {
            reason = r;
            return true;
        }
        if (!reasons.empty()) reasons += "; ";
        reasons += r;
    }
    reason = reasons.empty() ? "no host key policy configured" : reasons;
    return false;
}

std::string AnyOfPolicy::describe() const {
    std::string out = "any-of(";
    for (size_t i = 0; i < policies_.size(); i++) {
        if (i > 0) out += ", ";
        out += policies_[i]->describe();
    }
    return out + ")";
}
