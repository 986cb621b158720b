#pragma once

#include <string>
#include <string_view>

#include <learnvault/core/status.h>

#include <chjson/chjson.hpp>

namespace learnvault::config {

// Read-only view over a JSON configuration object. Keys are dotted paths into nested objects,
// e.g. "breaker.failure_threshold".
class Config {
public:
    static learnvault::Result<Config> LoadFile(std::string path);
    static learnvault::Result<Config> Parse(std::string text);

    bool Has(std::string_view key) const;

    learnvault::Result<std::string> GetString(std::string_view key) const;
    learnvault::Result<int> GetInt(std::string_view key) const;

    const chjson::sv_value& raw() const { return doc_.root(); }

private:
    const chjson::sv_value* Find(std::string_view key) const;

    chjson::document doc_;
};

} // namespace learnvault::config
