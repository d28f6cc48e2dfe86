#pragma once

#include <confbind/field.hpp>
#include <confbind/result.hpp>
#include <confbind/schema.hpp>
#include <optional>
#include <string>
#include <vector>

namespace confbind {

// One supported field of the record being bound, with its derived lookup
// keys. Built fresh for every bind call.
struct FieldBinding {
    std::string name;
    std::string file_key;   // empty: no file lookup
    std::string env_key;
    std::string flag_key;
    FieldKind kind = FieldKind::Text;
    FieldTarget target;
    std::optional<std::string> default_value;
    std::string usage;
    bool mandatory = false;
    bool is_set = false;

    // Coerce and store `raw`; marks the binding set on success.
    Status set(const std::string& raw, SourceKind source, const std::string& key);
};

// Derive the bindings of every usable field, in declaration order.
// File keys are only derived when `with_files` is true (a config directory
// was given); otherwise file lookup is disabled for every field.
// Errors: InvalidArg for an empty name, a malformed flag key, or two fields
// sharing a flag key.
Result<std::vector<FieldBinding>> discover_fields(const Schema& schema, bool with_files);

std::string to_lower(std::string s);
std::string to_upper(std::string s);

} // namespace confbind
