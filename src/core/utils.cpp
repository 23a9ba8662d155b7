#include "utils.hpp"
#include <fmt/format.h>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::optional<int> parse_port(const std::string& s) {
    std::string digits = trimmed(s);
    // More than 9 digits can't be a port and would overflow stoi
    if (digits.empty() || digits.size() > 9) return std::nullopt;
    for (char c : digits) {
        if (c < '0' || c > '9') return std::nullopt;
    }
    int port = safe_stoi(digits, 0);
    if (!is_valid_port(port)) return std::nullopt;
    return port;
}

std::string make_url(const std::string& host, int port) {
    return fmt::format("http://{}:{}", host, port);
}

std::vector<std::string> split_lines(const std::string& text, bool skip_blank) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (skip_blank && line.find_first_not_of(" \t") == std::string::npos) continue;
        lines.push_back(line);
    }
    return lines;
}

void dedupe_in_place(std::vector<std::string>& items) {
    std::unordered_set<std::string> seen;
    std::vector<std::string> unique;
    unique.reserve(items.size());
    for (auto& item : items) {
        if (seen.insert(item).second) unique.push_back(std::move(item));
    }
    items = std::move(unique);
}

static std::string single_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    return out + "'";
}

std::string shell_quote(const std::string& s) {
    if (s == "~") return s;
    if (s.rfind("~/", 0) == 0) {
        std::string rest = s.substr(2);
        return rest.empty() ? s : "~/" + single_quote(rest);
    }
    return single_quote(s);
}
