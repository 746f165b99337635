#include "input/ButtonMapping.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace tenfoot {

namespace {

// Indices are listed in ButtonAction order.
const ButtonMapping kStandardMapping{{
    0,  1,  2,  3,      // confirm, back, option1, option2
    4,  5,  6,  7,      // lb, rb, lt, rt
    8,  9,              // select, start
    10, 11,             // l3, r3
    12, 13, 14, 15,     // dpad up, down, left, right
    16,                 // home
}};

const ButtonMapping kNintendoMapping{{
    1,  0,  3,  2,      // confirm = A (east), back = B (south), option1 = Y, option2 = X
    4,  5,  6,  7,
    8,  9,
    10, 11,
    12, 13, 14, 15,
    16,
}};

struct VendorTokens {
    ControllerType type;
    std::vector<const char*> tokens;
};

// First matching family wins.
const VendorTokens kVendorTokens[] = {
    {ControllerType::Xbox,        {"xbox", "xinput", "microsoft", "045e"}},
    {ControllerType::PlayStation, {"playstation", "dualshock", "dualsense", "sony", "054c"}},
    {ControllerType::Nintendo,    {"nintendo", "pro controller", "joy-con", "switch", "057e"}},
};

std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(s.begin(), s.end(), notSpace);
    auto end = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // anonymous namespace

const ButtonMapping& getDefaultMapping(ControllerType type) {
    return type == ControllerType::Nintendo ? kNintendoMapping : kStandardMapping;
}

int getButtonIndex(ButtonAction action, ControllerType type) {
    return getDefaultMapping(type).indexOf(action);
}

ControllerType classifyController(const std::string& rawId) {
    const std::string id = toLower(rawId);
    for (const auto& vendor : kVendorTokens) {
        for (const char* token : vendor.tokens) {
            if (id.find(token) != std::string::npos) {
                return vendor.type;
            }
        }
    }
    return ControllerType::Generic;
}

std::string controllerDisplayName(const std::string& rawId, ControllerType type) {
    std::string name = trim(rawId.substr(0, rawId.find('(')));
    if (!name.empty() && name.size() < 50) {
        return name;
    }

    switch (type) {
        case ControllerType::Xbox:        return "Xbox Controller";
        case ControllerType::PlayStation: return "PlayStation Controller";
        case ControllerType::Nintendo:    return "Nintendo Controller";
        case ControllerType::Generic:     break;
    }
    return "Controller";
}

} // namespace tenfoot
