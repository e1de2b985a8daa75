#include "core/types/Profile.hpp"

#include <algorithm>
#include <cctype>

namespace customrpc::core {

bool isValidApplicationId(const std::string& appId) {
    if (appId.size() < 17 || appId.size() > 20) {
        return false;
    }
    return std::all_of(appId.begin(), appId.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool Profile::hasValidAppId() const {
    return isValidApplicationId(appId);
}

} // namespace customrpc::core
