#include <chmesh/config/config.h>

#include <fstream>
#include <limits>
#include <sstream>

namespace chmesh::config {

namespace {

const char* ErrorCodeToString(chjson::error_code code) {
    switch (code) {
        case chjson::error_code::ok: return "ok";
        case chjson::error_code::unexpected_eof: return "unexpected_eof";
        case chjson::error_code::invalid_value: return "invalid_value";
        case chjson::error_code::invalid_number: return "invalid_number";
        case chjson::error_code::invalid_string: return "invalid_string";
        case chjson::error_code::invalid_escape: return "invalid_escape";
        case chjson::error_code::invalid_unicode_escape: return "invalid_unicode_escape";
        case chjson::error_code::invalid_utf16_surrogate: return "invalid_utf16_surrogate";
        case chjson::error_code::expected_colon: return "expected_colon";
        case chjson::error_code::expected_comma_or_end: return "expected_comma_or_end";
        case chjson::error_code::expected_key_string: return "expected_key_string";
        case chjson::error_code::trailing_characters: return "trailing_characters";
        case chjson::error_code::nesting_too_deep: return "nesting_too_deep";
        case chjson::error_code::out_of_memory: return "out_of_memory";
    }
    return "unknown";
}

std::string FormatParseError(const chjson::error& e) {
    std::ostringstream oss;
    oss << "invalid json: " << ErrorCodeToString(e.code)
        << " at line " << e.line << ", col " << e.column;
    return oss.str();
}

// Tries the whole key first, then every split point where the left part names an object.
const chjson::sv_value* Lookup(const chjson::sv_value& node, std::string_view key) {
    if (!node.is_object()) {
        return nullptr;
    }
    if (const auto* v = node.find(key)) {
        return v;
    }
    for (auto dot = key.find('.'); dot != std::string_view::npos; dot = key.find('.', dot + 1)) {
        const auto* child = node.find(key.substr(0, dot));
        if (child == nullptr) {
            continue;
        }
        if (const auto* v = Lookup(*child, key.substr(dot + 1))) {
            return v;
        }
    }
    return nullptr;
}

} // namespace

chmesh::Result<Config> Config::LoadFile(std::string path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return chmesh::Status(chmesh::StatusCode::not_found, "config file not found: " + path);
    }

    std::ostringstream ss;
    ss << ifs.rdbuf();
    return Parse(ss.str());
}

chmesh::Result<Config> Config::Parse(std::string text) {
    auto r = chjson::parse(text);
    if (r.err) {
        return chmesh::Status(chmesh::StatusCode::invalid_argument, FormatParseError(r.err));
    }
    if (!r.doc.root().is_object()) {
        return chmesh::Status(chmesh::StatusCode::invalid_argument, "config root must be a JSON object");
    }

    Config c;
    c.doc_ = std::move(r.doc);
    return c;
}

const chjson::sv_value* Config::Find(std::string_view key) const {
    return Lookup(doc_.root(), key);
}

bool Config::Has(std::string_view key) const {
    return Find(key) != nullptr;
}

bool Config::IsObject(std::string_view key) const {
    const auto* v = Find(key);
    return v != nullptr && v->is_object();
}

chmesh::Result<std::string> Config::GetString(std::string_view key) const {
    const auto* v = Find(key);
    if (v == nullptr) {
        return chmesh::Status(chmesh::StatusCode::not_found, "missing key");
    }
    if (!v->is_string()) {
        return chmesh::Status(chmesh::StatusCode::invalid_argument, "not a string");
    }
    return std::string(v->as_string_view());
}

chmesh::Result<int> Config::GetInt(std::string_view key) const {
    const auto* v = Find(key);
    if (v == nullptr) {
        return chmesh::Status(chmesh::StatusCode::not_found, "missing key");
    }
    if (!v->is_number() || !v->is_int()) {
        return chmesh::Status(chmesh::StatusCode::invalid_argument, "not an int");
    }
    auto n = v->as_int();
    if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
        return chmesh::Status(chmesh::StatusCode::invalid_argument, "int out of range");
    }
    return static_cast<int>(n);
}

chmesh::Result<bool> Config::GetBool(std::string_view key) const {
    const auto* v = Find(key);
    if (v == nullptr) {
        return chmesh::Status(chmesh::StatusCode::not_found, "missing key");
    }
    if (!v->is_bool()) {
        return chmesh::Status(chmesh::StatusCode::invalid_argument, "not a bool");
    }
    return v->as_bool();
}

} // namespace chmesh::config
