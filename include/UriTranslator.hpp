#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace dbscope {

enum class EngineMode {
    Blocking,
    NonBlocking
};

std::string modeToString(EngineMode mode);

// Components of `family[+driver]://[user[:pass]@]host[:port]/database[?k=v&...]`
struct DatabaseUrl {
    std::string family;      // sqlite, postgresql, mysql
    std::string driver;      // part after '+', empty if absent
    std::string user;        // percent-decoded
    std::string password;    // percent-decoded
    std::string host;
    std::optional<uint16_t> port;
    std::string database;    // for sqlite: the file path, or ":memory:" / empty
    std::map<std::string, std::string> query;

    // Same URL with the password masked, for log lines
    std::string redacted() const;

    bool isMemorySqlite() const;
};

class UriTranslator {
public:
    // Map a blocking-mode URI to its non-blocking equivalent.
    // Only the scheme is rewritten; the rest is copied byte-for-byte.
    static std::string toAsync(std::string_view uri);

    // Driver component used by non-blocking engines of a family, e.g. "asio"
    static std::string asyncDriver(std::string_view family);

    static bool isAsync(std::string_view uri);

    static DatabaseUrl parse(std::string_view uri);

private:
    static std::string_view schemeOf(std::string_view uri);
    static std::string percentDecode(std::string_view text);
};

bool isSupportedFamily(std::string_view family);

inline std::string toAsyncUri(std::string_view uri) { return UriTranslator::toAsync(uri); }
inline DatabaseUrl parseDatabaseUrl(std::string_view uri) { return UriTranslator::parse(uri); }

}  // namespace dbscope
