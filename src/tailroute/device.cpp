#include "tailroute/device.hpp"

#include <algorithm>

namespace tailroute {

bool Device::has_tag(const std::string& tag) const {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

std::string Device::preferred_address() const {
    const auto iterator_v4 = std::find_if(addresses.begin(), addresses.end(), [](const std::string& address) {
        return address.find(':') == std::string::npos;
    });
    if (iterator_v4 != addresses.end()) {
        return *iterator_v4;
    }
    if (addresses.empty()) {
        return {};
    }
    return addresses.front();
}

}  // namespace tailroute
