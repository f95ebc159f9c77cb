#pragma once

#include <string>

// Local login name from $USER or $LOGNAME. Empty if neither is set.
std::string local_username();

// Standard base64 with '=' padding.
std::string base64_encode(const std::string& input);

// OpenSSH-style fingerprint of a raw host key blob: "SHA256:" + unpadded base64.
std::string sha256_fingerprint(const std::string& sha256_digest);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
