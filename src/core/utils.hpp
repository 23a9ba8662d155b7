#pragma once

#include <optional>
#include <string>
#include <vector>
#include "constants.hpp"

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Parse a TCP/UDP port. Accepts decimal digits only (surrounding whitespace
// ignored). Returns nullopt for anything outside 1..65535.
std::optional<int> parse_port(const std::string& s);

inline bool is_valid_port(long long port) {
    return port >= MIN_PORT && port <= MAX_PORT;
}

// "http://host:port"
std::string make_url(const std::string& host, int port);

// Split text into lines, dropping '\r' and (optionally) blank lines.
std::vector<std::string> split_lines(const std::string& text, bool skip_blank = true);

// Remove later duplicates, keeping first-seen order.
void dedupe_in_place(std::vector<std::string>& items);

// Single-quote a string for a POSIX shell. "~" and "~/..." are left
// unquoted at the front so the remote shell still expands them.
std::string shell_quote(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}
