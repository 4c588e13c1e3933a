#include "location.hpp"
#include <format>
#include <charconv>
#include <optional>

namespace {

std::unexpected<Error> invalidLocation(std::string_view location, std::string_view reason) {
    return std::unexpected(Error{ErrorKind::InvalidLocation,
        std::format("Unrecognized location '{}': {}", location, reason)});
}

bool isOctet(std::string_view text) {
    if (text.empty() || text.size() > 3) {
        return false;
    }
    int value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    return ec == std::errc() && end == text.data() + text.size() && value <= 255;
}

struct SchemeMatch {
    size_t position;
    size_t length;
};

// earliest object-store marker in the string, if any
std::optional<SchemeMatch> findObjectStoreScheme(std::string_view location) {
    std::optional<SchemeMatch> match;
    for (auto scheme : kObjectStoreSchemes) {
        auto pos = location.find(scheme);
        if (pos != std::string_view::npos && (!match || pos < match->position)) {
            match = SchemeMatch{pos, scheme.size()};
        }
    }
    return match;
}

bool escapesShare(std::string_view share, std::string_view path) {
    if (share == "." || share == ".." || (!path.empty() && path.front() == '/')) {
        return true;
    }
    while (!path.empty()) {
        auto slash = path.find('/');
        if (path.substr(0, slash) == "..") {
            return true;
        }
        if (slash == std::string_view::npos) {
            break;
        }
        path.remove_prefix(slash + 1);
    }
    return false;
}

std::string_view lastSegment(std::string_view path) {
    auto slash = path.rfind('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

} // namespace

bool isIpv4Address(std::string_view text) {
    int octets = 0;
    while (true) {
        auto dot = text.find('.');
        auto octet = text.substr(0, dot);
        // from_chars alone would accept a leading '-'
        for (char c : octet) {
            if (c < '0' || c > '9') {
                return false;
            }
        }
        if (!isOctet(octet)) {
            return false;
        }
        ++octets;
        if (dot == std::string_view::npos) {
            break;
        }
        text.remove_prefix(dot + 1);
    }
    return octets == 4;
}

std::expected<LocationKind, Error> classify(std::string_view location) {
    if (findObjectStoreScheme(location)) {
        return LocationKind::ObjectStore;
    }

    auto slash = location.find('/');
    auto root = location.substr(0, slash);
    if (!isIpv4Address(root)) {
        return invalidLocation(location, "expected s3://bucket/key or <IPv4>/<share>/<path>");
    }
    if (slash == std::string_view::npos) {
        return invalidLocation(location, "no share specified after the server address");
    }
    auto rest = location.substr(slash + 1);
    if (rest.substr(0, rest.find('/')).empty()) {
        return invalidLocation(location, "no share specified after the server address");
    }
    return LocationKind::OnPrem;
}

std::expected<Location, Error> parseLocation(std::string_view location) {
    auto kind = classify(location);
    if (!kind) {
        return std::unexpected(kind.error());
    }

    if (*kind == LocationKind::ObjectStore) {
        auto scheme = *findObjectStoreScheme(location);
        auto rest = location.substr(scheme.position + scheme.length);
        auto slash = rest.find('/');
        ObjectStoreLocation parsed;
        parsed.bucket = std::string(rest.substr(0, slash));
        if (slash != std::string_view::npos) {
            parsed.key = std::string(rest.substr(slash + 1));
        }
        if (parsed.bucket.empty()) {
            return invalidLocation(location, "no bucket specified");
        }
        return parsed;
    }

    auto first = location.find('/');
    auto rest = location.substr(first + 1);
    auto second = rest.find('/');
    OnPremLocation parsed;
    parsed.address = std::string(location.substr(0, first));
    parsed.share = std::string(rest.substr(0, second));
    if (second != std::string_view::npos) {
        parsed.path = std::string(rest.substr(second + 1));
    }
    if (escapesShare(parsed.share, parsed.path)) {
        return invalidLocation(location, "path must stay inside the share");
    }
    return parsed;
}

LocationKind kindOf(const Location& location) {
    return std::holds_alternative<ObjectStoreLocation>(location) ? LocationKind::ObjectStore : LocationKind::OnPrem;
}

std::string toString(const Location& location) {
    if (const auto* store = std::get_if<ObjectStoreLocation>(&location)) {
        return store->key.empty()
            ? std::format("{}{}", kObjectStoreSchemes[0], store->bucket)
            : std::format("{}{}/{}", kObjectStoreSchemes[0], store->bucket, store->key);
    }
    const auto& share = std::get<OnPremLocation>(location);
    return share.path.empty()
        ? std::format("{}/{}", share.address, share.share)
        : std::format("{}/{}/{}", share.address, share.share, share.path);
}

std::string fileNameOf(const Location& location) {
    if (const auto* store = std::get_if<ObjectStoreLocation>(&location)) {
        return std::string(lastSegment(store->key));
    }
    return std::string(lastSegment(std::get<OnPremLocation>(location).path));
}
