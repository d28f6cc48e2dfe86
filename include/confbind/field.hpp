#pragma once

#include <confbind/result.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace confbind {

enum class FieldKind { Text, Integer, Boolean };

const char* kind_name(FieldKind kind);

// Parses "text", "integer" or "boolean" (as written in schema files).
std::optional<FieldKind> parse_kind(const std::string& name);

// Borrowed, typed reference to a field's storage inside the caller's record.
// int and int64_t are both Integer fields; an int target rejects values
// outside its range.
using FieldTarget = std::variant<std::string*, int*, std::int64_t*, bool*>;

FieldKind target_kind(const FieldTarget& target);
bool target_is_null(const FieldTarget& target);

// Where a raw value came from. Named in coercion errors.
enum class SourceKind { File, Environment, Flag, Default };

const char* source_name(SourceKind source);

// Declarative description of one record field. Unset keys are derived from
// `name` during discovery.
struct FieldSpec {
    std::string name;
    FieldTarget target;
    std::optional<std::string> file_key;
    std::optional<std::string> env_key;
    std::optional<std::string> flag_key;
    std::optional<std::string> default_value;
    std::string usage;
    bool mandatory = false;

    FieldKind kind() const { return target_kind(target); }
};

// Base-10 signed integer, optional sign, no surrounding whitespace.
Result<std::int64_t> parse_integer(const std::string& raw, SourceKind source,
                                   const std::string& key);

// "0", "f", "false", "n", "no" (any case) are false; anything else is true.
bool parse_boolean(const std::string& raw);

// Coerce `raw` to the target's kind and store it. On error the target is
// left unchanged.
Status assign(const FieldTarget& target, const std::string& raw,
              SourceKind source, const std::string& key);

// Store the zero value of the target's kind ("", 0 or false).
void reset(const FieldTarget& target);

// Current value of the target as text ("true"/"false" for booleans).
std::string render(const FieldTarget& target);

} // namespace confbind
