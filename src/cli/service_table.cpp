#include "service_table.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace {

// Box drawing and glyphs (UTF-8). Widths below are terminal columns.
const char* const H  = "\xe2\x94\x80";  // ─
const char* const V  = "\xe2\x94\x82";  // │
const char* const TL = "\xe2\x94\x8c";  // ┌
const char* const TM = "\xe2\x94\xac";  // ┬
const char* const TR = "\xe2\x94\x90";  // ┐
const char* const ML = "\xe2\x94\x9c";  // ├
const char* const MM = "\xe2\x94\xbc";  // ┼
const char* const MR = "\xe2\x94\xa4";  // ┤
const char* const BL = "\xe2\x94\x94";  // └
const char* const BM = "\xe2\x94\xb4";  // ┴
const char* const BR = "\xe2\x94\x98";  // ┘

const char* const OK_GLYPH      = "\xe2\x9c\x85";              // ✅
const char* const WARN_GLYPH    = "\xe2\x9a\xa0\xef\xb8\x8f";  // ⚠️
const char* const LIST_GLYPH    = "\xf0\x9f\x93\x8b";          // 📋
const char* const HINT_GLYPH    = "\xf0\x9f\x92\xa1";          // 💡
const char* const NO_PORTS_TEXT = "(no exposed ports)";

// Warning cell: glyph (2 columns) + space + text
const size_t WARNING_COLUMNS = 3 + std::char_traits<char>::length(NO_PORTS_TEXT);

struct ServiceRow {
    std::string display;
    std::string name;
    std::vector<std::string> urls;
};

std::string repeat(const char* s, size_t n) {
    std::string out;
    for (size_t i = 0; i < n; i++) out += s;
    return out;
}

// Pad text whose visible width is `columns` out to `width` columns.
std::string pad(const std::string& text, size_t columns, size_t width) {
    return columns >= width ? text : text + std::string(width - columns, ' ');
}

// Service names are counted in UTF-8 code points, one column each.
size_t columns_of(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) n++;
    }
    return n;
}

// Byte offset of the code point that starts column `columns`.
size_t byte_offset(const std::string& s, size_t columns) {
    size_t seen = 0;
    for (size_t i = 0; i < s.size(); i++) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
            if (seen == columns) return i;
            seen++;
        }
    }
    return s.size();
}

std::string fit_name(const std::string& name, size_t width) {
    size_t columns = columns_of(name);
    if (columns > width) return name.substr(0, byte_offset(name, width - 3)) + "...";
    return pad(name, columns, width);
}

std::string border(const char* left, const char* mid, const char* right,
                   size_t name_width, size_t url_width) {
    return std::string(left) + repeat(H, name_width + 2) + mid +
           repeat(H, url_width + 2) + right;
}

std::string row(const std::string& name_cell, const std::string& url_cell) {
    return fmt::format("{} {} {} {} {}", V, name_cell, V, url_cell, V);
}

std::string display_name(const std::string& name, const std::string& prefix) {
    if (prefix.empty() || name.compare(0, prefix.size(), prefix) != 0) return name;
    std::string rest = name.substr(prefix.size());
    rest.erase(0, rest.find_first_not_of("-_."));
    return rest.empty() ? name : rest;
}

} // namespace

std::string common_prefix(const std::vector<std::string>& names) {
    if (names.size() < 2) return "";

    std::string prefix = names[0];
    for (size_t i = 1; i < names.size() && !prefix.empty(); i++) {
        size_t n = 0;
        size_t limit = std::min(prefix.size(), names[i].size());
        while (n < limit && prefix[n] == names[i][n]) n++;
        prefix.resize(n);
    }
    return prefix;
}

std::string format_service_table(const EndpointMap& services) {
    if (services.empty()) return NO_EXPOSED_PORTS_MESSAGE;

    std::vector<std::string> names;
    for (const auto& entry : services) names.push_back(entry.first);

    std::string prefix = common_prefix(names);
    if (prefix.size() < static_cast<size_t>(TABLE_MIN_PREFIX_STRIP) || names.size() <= 1) {
        prefix.clear();
    }

    std::vector<ServiceRow> rows;
    for (const auto& [name, urls] : services) {
        ServiceRow r{display_name(name, prefix), name, urls};
        dedupe_in_place(r.urls);
        std::sort(r.urls.begin(), r.urls.end());
        rows.push_back(std::move(r));
    }
    std::stable_sort(rows.begin(), rows.end(), [](const ServiceRow& a, const ServiceRow& b) {
        return a.display < b.display;
    });

    size_t longest_name = 0;
    size_t longest_cell = 0;
    for (const auto& r : rows) {
        longest_name = std::max(longest_name, columns_of(r.display));
        if (r.urls.empty()) {
            longest_cell = std::max(longest_cell, WARNING_COLUMNS);
        }
        for (const auto& url : r.urls) {
            longest_cell = std::max(longest_cell, TABLE_GLYPH_COLUMNS + url.size());
        }
    }
    size_t name_width = std::min<size_t>(
        std::max<size_t>(TABLE_MIN_SERVICE_WIDTH, longest_name), TABLE_MAX_SERVICE_WIDTH);
    size_t url_width = std::max<size_t>(TABLE_MIN_URL_WIDTH, longest_cell);

    std::vector<std::string> lines;
    lines.push_back("");
    lines.push_back(fmt::format("{} Service URLs:", LIST_GLYPH));
    lines.push_back(border(TL, TM, TR, name_width, url_width));
    lines.push_back(row(pad("Service", 7, name_width), pad("URL", 3, url_width)));
    lines.push_back(border(ML, MM, MR, name_width, url_width));

    bool has_any_urls = false;
    for (const auto& r : rows) {
        if (r.urls.empty()) {
            std::string cell = fmt::format("{} {}", WARN_GLYPH, NO_PORTS_TEXT);
            lines.push_back(row(fit_name(r.display, name_width),
                                pad(cell, WARNING_COLUMNS, url_width)));
            continue;
        }

        has_any_urls = true;
        for (size_t i = 0; i < r.urls.size(); i++) {
            std::string name_cell = i == 0 ? fit_name(r.display, name_width)
                                           : std::string(name_width, ' ');
            std::string cell = i == 0 ? fmt::format("{} {}", OK_GLYPH, r.urls[i])
                                      : "   " + r.urls[i];
            lines.push_back(row(name_cell,
                                pad(cell, TABLE_GLYPH_COLUMNS + r.urls[i].size(), url_width)));
        }
    }

    lines.push_back(border(BL, BM, BR, name_width, url_width));
    if (has_any_urls) {
        lines.push_back(fmt::format("{} Click or copy URLs above to access your deployed services!",
                                    HINT_GLYPH));
    }

    std::string out;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i > 0) out += "\n";
        out += lines[i];
    }
    return out;
}
