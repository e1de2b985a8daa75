#include "core/types/PresencePayload.hpp"

namespace customrpc::core {

namespace {

bool isContinuationByte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

size_t utf8Length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if (!isContinuationByte(c)) {
            ++count;
        }
    }
    return count;
}

std::optional<std::string> boundedText(const std::optional<std::string>& text, size_t maxChars) {
    if (!text || text->empty()) {
        return std::nullopt;
    }
    return truncateUtf8(*text, maxChars);
}

bool hasHttpScheme(const std::string& url) {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

} // namespace

std::string truncateUtf8(const std::string& text, size_t maxChars) {
    size_t chars = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (isContinuationByte(static_cast<unsigned char>(text[i]))) {
            continue;
        }
        if (chars == maxChars) {
            return text.substr(0, i);
        }
        ++chars;
    }
    return text;
}

bool PresenceButton::isValid() const {
    if (label.empty() || utf8Length(label) > PresenceLimits::MaxButtonLabelLength) {
        return false;
    }
    if (url.size() > PresenceLimits::MaxButtonUrlLength || !hasHttpScheme(url)) {
        return false;
    }
    // Scheme alone is not a URL
    return url.find("://") + 3 < url.size();
}

bool PresenceParty::isValid() const {
    return current >= 0 && max > 0 && current <= max;
}

PresencePayload PresencePayload::normalized() const {
    PresencePayload out;
    out.displayName = boundedText(displayName, PresenceLimits::MaxTextLength);
    out.details = boundedText(details, PresenceLimits::MaxTextLength);
    out.state = boundedText(state, PresenceLimits::MaxTextLength);

    if (startTimestamp && *startTimestamp >= 0) {
        out.startTimestamp = startTimestamp;
    }
    if (endTimestamp && *endTimestamp >= 0) {
        if (!out.startTimestamp || *endTimestamp >= *out.startTimestamp) {
            out.endTimestamp = endTimestamp;
        }
    }

    out.largeImage.key = boundedText(largeImage.key, PresenceLimits::MaxTextLength);
    out.largeImage.text = boundedText(largeImage.text, PresenceLimits::MaxTextLength);
    out.smallImage.key = boundedText(smallImage.key, PresenceLimits::MaxTextLength);
    out.smallImage.text = boundedText(smallImage.text, PresenceLimits::MaxTextLength);

    if (party && party->isValid()) {
        out.party = party;
    }

    for (const auto& button : buttons) {
        if (out.buttons.size() == PresenceLimits::MaxButtons) {
            break;
        }
        if (button.isValid()) {
            out.buttons.push_back(button);
        }
    }

    out.instance = instance;
    return out;
}

bool PresencePayload::isEmpty() const {
    return !displayName && !details && !state && !startTimestamp && !endTimestamp &&
           largeImage.isEmpty() && smallImage.isEmpty() && !party && buttons.empty();
}

nlohmann::json PresencePayload::toActivityJson() const {
    const auto p = normalized();
    nlohmann::json activity = nlohmann::json::object();

    if (p.displayName) {
        activity["name"] = *p.displayName;
    }
    if (p.details) {
        activity["details"] = *p.details;
    }
    if (p.state) {
        activity["state"] = *p.state;
    }

    if (p.startTimestamp || p.endTimestamp) {
        auto& timestamps = activity["timestamps"];
        if (p.startTimestamp) {
            timestamps["start"] = *p.startTimestamp;
        }
        if (p.endTimestamp) {
            timestamps["end"] = *p.endTimestamp;
        }
    }

    if (!p.largeImage.isEmpty() || !p.smallImage.isEmpty()) {
        auto& assets = activity["assets"];
        if (p.largeImage.key) {
            assets["large_image"] = *p.largeImage.key;
        }
        if (p.largeImage.text) {
            assets["large_text"] = *p.largeImage.text;
        }
        if (p.smallImage.key) {
            assets["small_image"] = *p.smallImage.key;
        }
        if (p.smallImage.text) {
            assets["small_text"] = *p.smallImage.text;
        }
    }

    if (p.party) {
        activity["party"]["size"] = {p.party->current, p.party->max};
    }

    if (!p.buttons.empty()) {
        auto buttonsJson = nlohmann::json::array();
        for (const auto& button : p.buttons) {
            buttonsJson.push_back({{"label", button.label}, {"url", button.url}});
        }
        activity["buttons"] = std::move(buttonsJson);
    }

    if (p.instance) {
        activity["instance"] = *p.instance;
    }

    return activity;
}

} // namespace customrpc::core
