#include "tailroute/types.hpp"

#include <algorithm>
#include <cctype>

namespace tailroute {

std::string_view to_string(Protocol protocol) noexcept {
    switch (protocol) {
        case Protocol::Http:
            return "http";
        case Protocol::Tcp:
            return "tcp";
        case Protocol::Udp:
            return "udp";
    }
    return "http";
}

std::optional<Protocol> parse_protocol(std::string_view name) {
    std::string lowered{name};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "http" || lowered == "https") {
        return Protocol::Http;
    }
    if (lowered == "tcp") {
        return Protocol::Tcp;
    }
    if (lowered == "udp") {
        return Protocol::Udp;
    }
    return std::nullopt;
}

}  // namespace tailroute
