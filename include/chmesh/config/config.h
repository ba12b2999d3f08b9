#pragma once

#include <string>
#include <string_view>

#include <chmesh/core/status.h>

#include <chjson/chjson.hpp>

namespace chmesh::config {

// Read-only view over a JSON config document.
//
// Keys are dotted paths. "gateway.retry_budget" resolves either a flat member
// named "gateway.retry_budget" or the nested {"gateway": {"retry_budget": ...}},
// and any mix of the two. Lists are objects keyed by position ("0", "1", ...);
// JSON arrays are not addressable.
class Config {
public:
    static chmesh::Result<Config> LoadFile(std::string path);
    static chmesh::Result<Config> Parse(std::string text);

    bool Has(std::string_view key) const;
    bool IsObject(std::string_view key) const;

    chmesh::Result<std::string> GetString(std::string_view key) const;
    chmesh::Result<int> GetInt(std::string_view key) const;
    chmesh::Result<bool> GetBool(std::string_view key) const;

    const chjson::sv_value& raw() const { return doc_.root(); }

private:
    const chjson::sv_value* Find(std::string_view key) const;

    chjson::document doc_;
};

} // namespace chmesh::config
