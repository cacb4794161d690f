#include "tenant/schema_name.hpp"

#include <algorithm>
#include <format>

namespace pgtenant {

namespace {

constexpr bool is_safe_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
}

} // anonymous namespace

bool is_safe_identifier(std::string_view name) noexcept {
    if (name.empty() || name.size() > kMaxSchemaNameLength) {
        return false;
    }
    for (const char c : name) {
        if (!is_safe_char(c)) return false;
    }
    return true;
}

Status validate_schema_name(std::string_view name, std::string_view shared_schema) {
    if (name.empty()) {
        return Status::error(ErrorCode::INVALID_IDENTIFIER, "schema name must not be empty");
    }
    if (name.size() > kMaxSchemaNameLength) {
        return Status::error(ErrorCode::INVALID_IDENTIFIER,
            std::format("schema name exceeds {} characters ({})", kMaxSchemaNameLength, name.size()));
    }
    if (!is_safe_identifier(name)) {
        return Status::error(ErrorCode::INVALID_IDENTIFIER,
            std::format("schema name '{}' may only contain [a-z0-9_]", name));
    }
    if (name == shared_schema || name == "information_schema" || name.starts_with("pg_")) {
        return Status::error(ErrorCode::INVALID_IDENTIFIER,
            std::format("schema name '{}' is reserved", name));
    }
    return Status::ok();
}

std::string derive_schema_name(std::string_view identifier) {
    std::string result;
    result.reserve(std::min(identifier.size(), kMaxSchemaNameLength));
    for (const char raw : identifier) {
        if (result.size() == kMaxSchemaNameLength) break;
        const char c = (raw >= 'A' && raw <= 'Z') ? static_cast<char>(raw - 'A' + 'a') : raw;
        result += is_safe_char(c) ? c : '_';
    }
    return result;
}

std::string quote_identifier(std::string_view name) {
    std::string result;
    result.reserve(name.size() + 2);
    result += '"';
    for (const char c : name) {
        if (c == '"') result += '"';
        result += c;
    }
    result += '"';
    return result;
}

std::string qualified_name(std::string_view schema, std::string_view table) {
    return quote_identifier(schema) + "." + quote_identifier(table);
}

} // namespace pgtenant
