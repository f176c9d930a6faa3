#include "readygate/source/endpoint_source.hpp"

#include <set>
#include <utility>

extern char** environ;

namespace readygate::source {

namespace {

constexpr std::string_view kPortSuffix = "_PORT";

bool all_digits(std::string_view text) noexcept {
    if (text.empty()) {
        return false;
    }
    for (const char ch : text) {
        if (ch < '0' || ch > '9') {
            return false;
        }
    }
    return true;
}

} // namespace

endpoint_source from_arguments(std::vector<std::string> endpoints) {
    return [endpoints = std::move(endpoints)]() { return endpoints; };
}

bool is_service_port_key(std::string_view key) noexcept {
    if (!key.ends_with(kPortSuffix)) {
        return false;
    }
    key.remove_suffix(kPortSuffix.size());

    const std::size_t separator = key.rfind('_');
    if (separator == std::string_view::npos || separator == 0) {
        return false;
    }
    return all_digits(key.substr(separator + 1));
}

endpoint_source from_environment(std::vector<std::string> entries) {
    return [entries = std::move(entries)]() {
        std::set<std::string> unique;
        for (const std::string& entry : entries) {
            const std::size_t equals = entry.find('=');
            if (equals == std::string::npos) {
                continue;
            }
            const std::string_view key{entry.data(), equals};
            if (!is_service_port_key(key) || equals + 1 == entry.size()) {
                continue;
            }
            unique.insert(entry.substr(equals + 1));
        }
        return std::vector<std::string>{unique.begin(), unique.end()};
    };
}

std::vector<std::string> capture_environment() {
    std::vector<std::string> entries;
    if (environ == nullptr) {
        return entries;
    }
    for (char** cursor = environ; *cursor != nullptr; ++cursor) {
        entries.emplace_back(*cursor);
    }
    return entries;
}

} // namespace readygate::source
