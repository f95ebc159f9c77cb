#include "shell_escape.hpp"
#include <set>

static bool is_shell_safe(char c) {
    if (c >= 'a' && c <= 'z') return true;
    if (c >= 'A' && c <= 'Z') return true;
    if (c >= '0' && c <= '9') return true;
    switch (c) {
    case '-': case '_': case '=': case '/': case ',': case '.': case '+':
        return true;
    default:
        return false;
    }
}

std::string shell_escape(const std::string& token) {
    bool safe = !token.empty();
    for (char c : token) {
        if (!is_shell_safe(c)) { safe = false; break; }
    }
    if (safe) return token;

    std::string out;
    out.reserve(token.size() + 2);
    out += '\'';
    for (char c : token) {
        if (c == '\'' || c == '!') {
            // close quote, backslash-escape, reopen
            out += "'\\";
            out += c;
            out += '\'';
        } else {
            out += c;
        }
    }
    out += '\'';
    return out;
}

static bool is_reserved_word(const std::string& token) {
    static const std::set<std::string> reserved = {
        "!", "{", "}", "case", "do", "done", "elif", "else", "esac", "fi",
        "for", "if", "in", "then", "until", "while",
    };
    return reserved.count(token) > 0;
}

std::string escape_command_word(const std::string& token) {
    std::string escaped = shell_escape(token);
    // A bare NAME=value or reserved word in command position is not a command name.
    if (escaped == token && (token.find('=') != std::string::npos || is_reserved_word(token))) {
        return "'" + token + "'";
    }
    return escaped;
}

std::string join_command(const std::vector<std::string>& tokens) {
    std::string cmd;
    for (size_t i = 0; i < tokens.size(); i++) {
        if (i > 0) cmd += ' ';
        cmd += i == 0 ? escape_command_word(tokens[i]) : shell_escape(tokens[i]);
    }
    return cmd;
}
