#include "UriTranslator.hpp"
#include "ErrorHandler.hpp"
#include <array>
#include <cctype>
#include <vector>

namespace dbscope {

namespace {

constexpr std::array<std::string_view, 3> kFamilies = {"sqlite", "postgresql", "mysql"};

std::vector<std::string> splitQuery(std::string_view query) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : query) {
        if (c == '&') {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

}  // namespace

std::string modeToString(EngineMode mode) {
    return mode == EngineMode::Blocking ? "blocking" : "non-blocking";
}

bool isSupportedFamily(std::string_view family) {
    for (auto f : kFamilies) {
        if (f == family) return true;
    }
    return false;
}

// ============================================================================
// Translation
// ============================================================================

std::string_view UriTranslator::schemeOf(std::string_view uri) {
    auto pos = uri.find("://");
    if (pos == std::string_view::npos) {
        throw UnsupportedSchemeError(std::string(uri.substr(0, uri.find(':'))));
    }
    return uri.substr(0, pos);
}

std::string UriTranslator::asyncDriver(std::string_view family) {
    if (!isSupportedFamily(family)) {
        throw UnsupportedSchemeError(std::string(family));
    }
    return "asio";
}

std::string UriTranslator::toAsync(std::string_view uri) {
    std::string_view scheme = schemeOf(uri);
    std::string_view family = scheme.substr(0, scheme.find('+'));

    if (!isSupportedFamily(family)) {
        throw UnsupportedSchemeError(std::string(scheme));
    }

    // An explicit blocking driver (postgresql+psycopg) is replaced; an already
    // translated URI comes out unchanged.
    std::string result(family);
    result += '+';
    result += asyncDriver(family);
    result.append(uri.substr(scheme.size()));
    return result;
}

bool UriTranslator::isAsync(std::string_view uri) {
    auto pos = uri.find("://");
    if (pos == std::string_view::npos) return false;
    std::string_view scheme = uri.substr(0, pos);
    auto plus = scheme.find('+');
    if (plus == std::string_view::npos) return false;
    std::string_view family = scheme.substr(0, plus);
    return isSupportedFamily(family) && scheme.substr(plus + 1) == asyncDriver(family);
}

// ============================================================================
// Parsing
// ============================================================================

std::string UriTranslator::percentDecode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size() &&
            std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            out += static_cast<char>(std::stoi(std::string(text.substr(i + 1, 2)), nullptr, 16));
            i += 2;
        } else {
            out += text[i];
        }
    }
    return out;
}

DatabaseUrl UriTranslator::parse(std::string_view uri) {
    DatabaseUrl url;

    std::string_view scheme = schemeOf(uri);
    auto plus = scheme.find('+');
    url.family = std::string(scheme.substr(0, plus));
    if (plus != std::string_view::npos) {
        url.driver = std::string(scheme.substr(plus + 1));
    }
    if (!isSupportedFamily(url.family)) {
        throw UnsupportedSchemeError(std::string(scheme));
    }

    std::string_view rest = uri.substr(scheme.size() + 3);

    auto qpos = rest.find('?');
    if (qpos != std::string_view::npos) {
        for (const auto& pair : splitQuery(rest.substr(qpos + 1))) {
            auto eq = pair.find('=');
            if (eq == std::string::npos) {
                url.query[pair] = "";
            } else {
                url.query[pair.substr(0, eq)] = percentDecode(pair.substr(eq + 1));
            }
        }
        rest = rest.substr(0, qpos);
    }

    auto slash = rest.find('/');
    std::string_view authority = rest.substr(0, slash);
    if (slash != std::string_view::npos) {
        url.database = std::string(rest.substr(slash + 1));
    }

    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        std::string_view userinfo = authority.substr(0, at);
        auto colon = userinfo.find(':');
        url.user = percentDecode(userinfo.substr(0, colon));
        if (colon != std::string_view::npos) {
            url.password = percentDecode(userinfo.substr(colon + 1));
        }
        authority = authority.substr(at + 1);
    }

    std::string_view portText;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            throw DatabaseError("Malformed IPv6 host in URL: " + std::string(uri));
        }
        url.host = std::string(authority.substr(1, close - 1));
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            portText = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        url.host = std::string(authority.substr(0, colon));
        if (colon != std::string_view::npos) {
            portText = authority.substr(colon + 1);
        }
    }

    if (!portText.empty()) {
        int port = 0;
        for (char c : portText) {
            if (!std::isdigit(static_cast<unsigned char>(c)) || port > 65535) {
                throw DatabaseError("Invalid port in URL: " + std::string(portText));
            }
            port = port * 10 + (c - '0');
        }
        if (port == 0 || port > 65535) {
            throw DatabaseError("Invalid port in URL: " + std::string(portText));
        }
        url.port = static_cast<uint16_t>(port);
    }

    return url;
}

// ============================================================================
// DatabaseUrl helpers
// ============================================================================

std::string DatabaseUrl::redacted() const {
    std::string out = family;
    if (!driver.empty()) {
        out += "+" + driver;
    }
    out += "://";
    if (!user.empty()) {
        out += user;
        if (!password.empty()) out += ":***";
        out += "@";
    }
    out += host;
    if (port) out += ":" + std::to_string(*port);
    if (!database.empty() || family == "sqlite") out += "/" + database;

    char sep = '?';
    for (const auto& [key, value] : query) {
        out += sep + key + "=" + value;
        sep = '&';
    }
    return out;
}

bool DatabaseUrl::isMemorySqlite() const {
    return family == "sqlite" && (database.empty() || database == ":memory:");
}

}  // namespace dbscope
