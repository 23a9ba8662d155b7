#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Message returned for an empty map.
inline constexpr const char* NO_EXPOSED_PORTS_MESSAGE = "No exposed ports detected";

// Render discovered endpoints as a boxed two-column table:
//
//   📋 Service URLs:
//   ┌─────────────────┬───────────────────────────┐
//   │ Service         │ URL                       │
//   ├─────────────────┼───────────────────────────┤
//   │ db-1            │ ✅ http://host:5432       │
//   │ web-1           │ ✅ http://host:8080       │
//   │                 │    http://host:8443       │
//   └─────────────────┴───────────────────────────┘
//   💡 Click or copy URLs above to access your deployed services!
//
// URLs are deduped and sorted per service. A shared name prefix of three or
// more characters is stripped when there is more than one service. A service
// with no URLs gets a warning row. Pure: same map, same text.
std::string format_service_table(const EndpointMap& services);

// Longest case-sensitive prefix shared by all names ("" for fewer than two).
std::string common_prefix(const std::vector<std::string>& names);
