#include "models.hpp"

namespace query_stream {

namespace {

// Keep object keys and array layout, drop every scalar value.
nlohmann::json stripValues(const nlohmann::json& node) {
    if (node.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (auto it = node.begin(); it != node.end(); ++it) {
            out[it.key()] = stripValues(it.value());
        }
        return out;
    }
    if (node.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& item : node) {
            out.push_back(stripValues(item));
        }
        return out;
    }
    return nullptr;
}

} // namespace

std::string QuerySpec::shape() const {
    std::string out = kind;
    out += "|";
    for (std::size_t i = 0; i < projections.size(); ++i) {
        if (i > 0) out += ",";
        out += projections[i];
    }
    out += "|";
    if (!filter.is_null()) {
        out += stripValues(filter).dump();
    }
    return out;
}

} // namespace query_stream
