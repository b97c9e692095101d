#include <diagram_model/properties.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace diagram_model {

namespace {

const nlohmann::json* lookup(const nlohmann::json& props, const std::string& key) {
    if (!props.is_object()) return nullptr;
    auto it = props.find(key);
    if (it == props.end()) return nullptr;
    return &*it;
}

} // namespace

bool has_key(const nlohmann::json& props, const std::string& key) {
    return lookup(props, key) != nullptr;
}

std::string get_string(const nlohmann::json& props, const std::string& key) {
    const nlohmann::json* v = lookup(props, key);
    if (!v || !v->is_string()) return {};
    return v->get<std::string>();
}

bool get_bool(const nlohmann::json& props, const std::string& key) {
    const nlohmann::json* v = lookup(props, key);
    if (!v || !v->is_boolean()) return false;
    return v->get<bool>();
}

int get_int(const nlohmann::json& props, const std::string& key) {
    constexpr int kMin = std::numeric_limits<int>::min();
    constexpr int kMax = std::numeric_limits<int>::max();
    const nlohmann::json* v = lookup(props, key);
    if (!v || !v->is_number()) return 0;
    if (v->is_number_unsigned()) {
        const auto u = v->get<std::uint64_t>();
        return u > static_cast<std::uint64_t>(kMax) ? kMax : static_cast<int>(u);
    }
    if (v->is_number_integer()) {
        const auto i = v->get<std::int64_t>();
        return static_cast<int>(std::clamp<std::int64_t>(i, kMin, kMax));
    }
    const double d = v->get<double>();
    if (std::isnan(d)) return 0;
    if (d >= static_cast<double>(kMax)) return kMax;
    if (d <= static_cast<double>(kMin)) return kMin;
    return static_cast<int>(d);
}

std::map<std::string, std::string> get_string_map(const nlohmann::json& props, const std::string& key) {
    std::map<std::string, std::string> out;
    const nlohmann::json* v = lookup(props, key);
    if (!v || !v->is_object()) return out;
    for (auto it = v->begin(); it != v->end(); ++it) {
        if (it.value().is_string()) out[it.key()] = it.value().get<std::string>();
    }
    return out;
}

const nlohmann::json& get_array(const nlohmann::json& props, const std::string& key) {
    static const nlohmann::json empty = nlohmann::json::array();
    const nlohmann::json* v = lookup(props, key);
    if (!v || !v->is_array()) return empty;
    return *v;
}

} // namespace diagram_model
