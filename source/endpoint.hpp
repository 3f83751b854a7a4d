#ifndef ENDPOINT_HPP
#define ENDPOINT_HPP

#include <array>
#include <string>
#include <string_view>
#include <utility>

class EndpointResolver {
public:
    static inline const char* DEFAULT_HOST = "api.ovh.com";

    using Entry = std::pair<std::string_view, std::string_view>;

    // Unknown endpoints fall back to DEFAULT_HOST.
    static std::string resolve(std::string_view endpoint);
    static bool isKnown(std::string_view endpoint);
    static const std::array<Entry, 7>& knownEndpoints();
};

#endif
