#include "endpoint.hpp"
#include <algorithm>

namespace {

constexpr std::array<EndpointResolver::Entry, 7> endpointTable{{
    {"ovh-ca", "ca.api.ovh.com"},               // OVH North America
    {"ovh-eu", "eu.api.ovh.com"},               // OVH Europe
    {"ovh-us", "us.api.ovh.com"},               // OVH US
    {"soyoustart-ca", "ca.api.soyoustart.com"},
    {"soyoustart-eu", "eu.api.soyoustart.com"},
    {"kimsufi-ca", "ca.api.kimsufi.com"},
    {"kimsufi-eu", "eu.api.kimsufi.com"},
}};

const EndpointResolver::Entry* findEndpoint(std::string_view endpoint) {
    auto it = std::find_if(endpointTable.begin(), endpointTable.end(),
                           [endpoint](const auto& entry) { return entry.first == endpoint; });
    return it == endpointTable.end() ? nullptr : &*it;
}

}

std::string EndpointResolver::resolve(std::string_view endpoint) {
    if (const auto* entry = findEndpoint(endpoint)) {
        return std::string(entry->second);
    }
    return DEFAULT_HOST;
}

bool EndpointResolver::isKnown(std::string_view endpoint) {
    return findEndpoint(endpoint) != nullptr;
}

const std::array<EndpointResolver::Entry, 7>& EndpointResolver::knownEndpoints() {
    return endpointTable;
}
