#pragma once

#include <string>
#include <vector>

// The exec request carries one opaque string, so argument boundaries only
// survive if every token is quoted for the remote POSIX shell.

// Quote a single token. Tokens made only of [A-Za-z0-9-_=/,.+] pass through
// unchanged; everything else is single-quoted ('\'' for quotes, '\!' for '!').
std::string shell_escape(const std::string& token);

// Like shell_escape, but also quotes words the shell would not treat as a
// command name in first position (FOO=bar, if, then, ...).
std::string escape_command_word(const std::string& token);

// Escape each token and join with single spaces. The first token goes
// through escape_command_word.
std::string join_command(const std::vector<std::string>& tokens);
