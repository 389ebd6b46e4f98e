#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace query_stream {

/// Opaque, service-issued resume token.
struct Cursor {
    std::string token;

    bool operator==(const Cursor& other) const { return token == other.token; }
    bool operator!=(const Cursor& other) const { return token != other.token; }
};

/// Per-record cursor slot. An empty slot means "start of the query"
/// (or "no cursor available for this record").
using CursorSlot = std::optional<Cursor>;

/// A single result record.
struct Entity {
    std::string    key;         // e.g. "Task/1042"
    nlohmann::json properties = nlohmann::json::object();
};

/// Name of a projected property.
using Projection = std::string;

/// Composite index the service consulted while executing a page.
struct Index {
    int64_t                  id = 0;
    std::string              kind;
    bool                     onlyUseIfRequired = false;
    std::vector<std::string> properties;

    bool operator<(const Index& other) const { return id < other.id; }
    bool operator==(const Index& other) const { return id == other.id; }
};

/// Passed to the post-load hook with every record.
struct TransactionContext {
    std::optional<std::string> transactionId;
};

/// Logical query handed to the remote service.
struct QuerySpec {
    std::string             kind;
    std::vector<Projection> projections;
    nlohmann::json          filter;   // opaque, forwarded as-is

    /// Stable description of the query without filter values.
    std::string shape() const;
};

} // namespace query_stream
