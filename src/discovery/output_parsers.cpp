#include "output_parsers.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <regex>
#include <set>

using nlohmann::json;

namespace {

void dedupe_all(EndpointMap& map) {
    for (auto& entry : map) {
        dedupe_in_place(entry.second);
    }
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

bool ends_with(const std::string& s, char c) {
    return !s.empty() && s.back() == c;
}

// ── compose ps JSON ─────────────────────────────────────────

// Field lookup ignoring case ("Name", "name", "NAME" all match).
const json* field(const json& obj, const std::string& key) {
    if (!obj.is_object()) return nullptr;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (iequals(it.key(), key)) return &it.value();
    }
    return nullptr;
}

long long int_field(const json& obj, const std::string& key) {
    const json* v = field(obj, key);
    if (!v || !v->is_number_integer()) return 0;
    return v->get<long long>();
}

std::vector<PortPublisher> read_publishers(const json& record) {
    std::vector<PortPublisher> publishers;
    const json* list = field(record, "Publishers");
    if (!list || !list->is_array()) return publishers;

    for (const auto& entry : *list) {
        if (!entry.is_object()) continue;
        PortPublisher p;
        p.target_port = static_cast<int>(int_field(entry, "TargetPort"));
        p.published_port = int_field(entry, "PublishedPort");
        const json* proto = field(entry, "Protocol");
        if (proto && proto->is_string()) p.protocol = proto->get<std::string>();
        publishers.push_back(p);
    }
    return publishers;
}

void add_container_record(const json& record, const std::string& host, EndpointMap& map) {
    const json* name = field(record, "Name");
    if (!name || !name->is_string()) return;
    std::string container = name->get<std::string>();
    if (container.empty()) return;

    std::vector<std::string> urls;
    for (const auto& p : read_publishers(record)) {
        if (is_valid_port(p.published_port)) {
            urls.push_back(make_url(host, static_cast<int>(p.published_port)));
        }
    }
    if (urls.empty()) return;

    auto& target = map[container];
    target.insert(target.end(), urls.begin(), urls.end());
}

// ── docker-compose.yml scanner ──────────────────────────────

constexpr size_t INDENT_UNIT = 2;

enum class ComposeScanState {
    TopLevel,           // outside services:
    InServicesSection,  // under services:, no current service
    InServiceBlock,     // inside a service's properties
    InPortsBlock,       // inside that service's ports: list
};

// The service name is only carried by the two states that need one.
struct ComposeScanCursor {
    ComposeScanState state = ComposeScanState::TopLevel;
    std::string service;

    void reset(ComposeScanState next) {
        state = next;
        service.clear();
    }

    void enter_service(std::string name) {
        state = ComposeScanState::InServiceBlock;
        service = std::move(name);
    }
};

size_t leading_spaces(const std::string& line) {
    size_t n = 0;
    while (n < line.size() && line[n] == ' ') n++;
    return n;
}

std::string unquote(std::string s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// "- 8080:80", "- \"8080:80\"", "- '127.0.0.1:8080:80'", "- 53:53/udp"
std::optional<int> host_port_from_item(const std::string& item) {
    static const std::regex item_re(
        R"re(^-\s*["']?(?:[0-9.]+:)?(\d+):\d+(?:/[A-Za-z]+)?["']?\s*$)re");
    std::smatch m;
    if (!std::regex_match(item, m, item_re)) return std::nullopt;
    return parse_port(m[1].str());
}

} // namespace

EndpointMap parse_compose_ps_json(const std::string& output, const std::string& host) {
    EndpointMap map;

    for (const auto& line : split_lines(output)) {
        json doc;
        try {
            doc = json::parse(line);
        } catch (const json::exception&) {
            continue;  // one bad line never spoils the rest
        }

        if (doc.is_array()) {
            for (const auto& record : doc) add_container_record(record, host, map);
        } else {
            add_container_record(doc, host, map);
        }
    }

    dedupe_all(map);
    return map;
}

EndpointMap parse_docker_ps_table(const std::string& output, const std::string& host) {
    static const std::regex mapping_re(R"([^\s,]*:(\d+)->)");
    EndpointMap map;

    auto lines = split_lines(output);
    for (size_t i = 1; i < lines.size(); i++) {
        const std::string& line = lines[i];

        // Split on the first tab; rows rendered by tabwriter fall back to the
        // first whitespace run (container names never contain spaces).
        auto sep = line.find('\t');
        if (sep == std::string::npos) sep = line.find_first_of(" \t");
        if (sep == std::string::npos) continue;

        std::string name = trimmed(line.substr(0, sep));
        std::string ports = trimmed(line.substr(sep + 1));
        if (name.empty() || ports.empty()) continue;
        if (ports.find("->") == std::string::npos) continue;

        std::vector<std::string> urls;
        for (std::sregex_iterator it(ports.begin(), ports.end(), mapping_re), end; it != end; ++it) {
            if (auto port = parse_port((*it)[1].str())) {
                urls.push_back(make_url(host, *port));
            }
        }
        if (urls.empty()) continue;

        auto& target = map[name];
        target.insert(target.end(), urls.begin(), urls.end());
    }

    dedupe_all(map);
    return map;
}

EndpointMap parse_compose_file(const std::string& content, const std::string& host) {
    EndpointMap map;
    ComposeScanCursor cursor;

    for (const auto& raw : split_lines(content)) {
        std::string line = trimmed(raw);
        if (line.empty() || line[0] == '#') continue;

        size_t indent = leading_spaces(raw);
        bool list_item = line[0] == '-';

        // Any top-level key leaves the previous section behind
        if (indent == 0) {
            cursor.reset(line == "services:" ? ComposeScanState::InServicesSection
                                             : ComposeScanState::TopLevel);
            continue;
        }
        if (cursor.state == ComposeScanState::TopLevel) continue;

        // Service-level key: starts a new service block
        if (indent == INDENT_UNIT && !list_item) {
            if (ends_with(line, ':')) {
                cursor.enter_service(unquote(trimmed(line.substr(0, line.size() - 1))));
            } else {
                cursor.reset(ComposeScanState::InServicesSection);
            }
            continue;
        }
        if (cursor.state == ComposeScanState::InServicesSection) continue;

        if (cursor.state == ComposeScanState::InPortsBlock) {
            if (indent <= 2 * INDENT_UNIT && !list_item) {
                // A sibling property began; ports list is over
                cursor.state = ComposeScanState::InServiceBlock;
            } else {
                if (list_item) {
                    if (auto port = host_port_from_item(line)) {
                        map[cursor.service].push_back(make_url(host, *port));
                    }
                }
                continue;
            }
        }

        if (line == "ports:") {
            cursor.state = ComposeScanState::InPortsBlock;
            map.try_emplace(cursor.service);
        }
    }

    dedupe_all(map);
    return map;
}

EndpointMap parse_listener_ports(const std::string& output, const std::string& host) {
    std::set<int> ports;
    for (const auto& line : split_lines(output)) {
        if (auto port = parse_port(line)) ports.insert(*port);
    }

    EndpointMap map;
    if (ports.empty()) return map;

    auto& urls = map[UNKNOWN_SERVICES_KEY];
    for (int port : ports) {
        urls.push_back(make_url(host, port));
    }
    return map;
}
