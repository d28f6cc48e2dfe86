#include <confbind/binding.hpp>
#include <confbind/log.hpp>
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace confbind {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return s;
}

Status FieldBinding::set(const std::string& raw, SourceKind source, const std::string& key) {
    CONFBIND_TRY(assign(target, raw, source, key));
    is_set = true;
    return ok_status();
}

static bool valid_flag_key(const std::string& key) {
    if (key.empty() || key[0] == '-') return false;
    for (unsigned char c : key) {
        if (c == '=' || std::isspace(c)) return false;
    }
    return true;
}

Result<std::vector<FieldBinding>> discover_fields(const Schema& schema, bool with_files) {
    std::vector<FieldBinding> bindings;
    bindings.reserve(schema.size());
    std::unordered_set<std::string> flag_keys;

    for (const auto& spec : schema.fields()) {
        if (spec.name.empty()) {
            return BindError{BindError::InvalidArg, "field without a name in schema"};
        }
        if (target_is_null(spec.target)) {
            log::warn("skipping field %s because it has no storage", spec.name.c_str());
            continue;
        }

        FieldBinding b;
        b.name = spec.name;
        b.kind = spec.kind();
        b.target = spec.target;
        b.default_value = spec.default_value;
        b.usage = spec.usage;
        b.mandatory = spec.mandatory;

        if (with_files) {
            b.file_key = spec.file_key.value_or(to_lower(spec.name));
        }
        b.env_key = spec.env_key ? *spec.env_key : to_upper(spec.name);
        b.flag_key = spec.flag_key ? *spec.flag_key : to_lower(spec.name);

        if (!valid_flag_key(b.flag_key)) {
            return BindError{BindError::InvalidArg,
                "field " + spec.name + " has an invalid flag name '" + b.flag_key + "'",
                "flag names must be non-empty, must not start with '-' and must not contain '=' or spaces"};
        }
        if (!flag_keys.insert(b.flag_key).second) {
            return BindError{BindError::InvalidArg,
                "flag -" + b.flag_key + " is used by more than one field",
                "give one of the fields an explicit flag name"};
        }

        bindings.push_back(std::move(b));
    }

    return Result<std::vector<FieldBinding>>::ok(std::move(bindings));
}

} // namespace confbind
