#pragma once

#include <string>
#include <core/types.hpp>

// Parsers for the text each discovery strategy gets back from the remote
// host. All of them build "http://{host}:{port}" URLs, drop ports outside
// 1..65535, dedupe each service's list as a final pass, and skip (never
// throw on) malformed lines.

// One entry of a compose "Publishers" array.
struct PortPublisher {
    int target_port = 0;
    long long published_port = 0;
    std::string protocol;
};

// `docker compose ps --format json`: one JSON object per line. A line holding
// an array of objects (older compose releases) is also accepted. Records need
// a non-empty Name and at least one valid PublishedPort.
EndpointMap parse_compose_ps_json(const std::string& output, const std::string& host);

// `docker ps --format 'table {{.Names}}\t{{.Ports}}'`: header row, then
// "name<TAB>ports". Only published mappings ("addr:port->...") count.
EndpointMap parse_docker_ps_table(const std::string& output, const std::string& host);

// docker-compose.yml text. Recovers "host:container" entries under each
// service's ports: list. A service whose ports block yields nothing valid is
// kept with an empty list.
EndpointMap parse_compose_file(const std::string& content, const std::string& host);

// Bare port numbers, one per line (already filtered to docker-proxy
// listeners). Everything lands under UNKNOWN_SERVICES_KEY, ascending.
EndpointMap parse_listener_ports(const std::string& output, const std::string& host);
