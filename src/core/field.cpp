#include <confbind/field.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>

namespace confbind {

const char* kind_name(FieldKind kind) {
    switch (kind) {
        case FieldKind::Text:    return "text";
        case FieldKind::Integer: return "integer";
        case FieldKind::Boolean: return "boolean";
    }
    return "unknown";
}

std::optional<FieldKind> parse_kind(const std::string& name) {
    if (name == "text") return FieldKind::Text;
    if (name == "integer") return FieldKind::Integer;
    if (name == "boolean") return FieldKind::Boolean;
    return std::nullopt;
}

FieldKind target_kind(const FieldTarget& target) {
    switch (target.index()) {
        case 0: return FieldKind::Text;
        case 1:
        case 2: return FieldKind::Integer;
        default: return FieldKind::Boolean;
    }
}

bool target_is_null(const FieldTarget& target) {
    return std::visit([](auto* p) { return p == nullptr; }, target);
}

const char* source_name(SourceKind source) {
    switch (source) {
        case SourceKind::File:        return "file";
        case SourceKind::Environment: return "environment variable";
        case SourceKind::Flag:        return "command line flag";
        case SourceKind::Default:     return "default value";
    }
    return "source";
}

static BindError not_an_integer(const std::string& raw, SourceKind source,
                                const std::string& key) {
    return BindError{BindError::Coercion,
        std::string(source_name(source)) + " " + key +
        " must be an integer - instead it is: " + raw};
}

Result<std::int64_t> parse_integer(const std::string& raw, SourceKind source,
                                   const std::string& key) {
    // from_chars rejects a leading '+'
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    if (first != last && *first == '+') {
        ++first;
        if (first != last && *first == '-') return not_an_integer(raw, source, key);
    }
    if (first == last) return not_an_integer(raw, source, key);

    std::int64_t val = 0;
    auto [ptr, ec] = std::from_chars(first, last, val);
    if (ec != std::errc() || ptr != last) {
        return not_an_integer(raw, source, key);
    }
    return Result<std::int64_t>::ok(val);
}

bool parse_boolean(const std::string& raw) {
    std::string lower = raw;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return !(lower == "0" || lower == "f" || lower == "false" ||
             lower == "n" || lower == "no");
}

Status assign(const FieldTarget& target, const std::string& raw,
              SourceKind source, const std::string& key) {
    if (auto* s = std::get_if<std::string*>(&target)) {
        **s = raw;
        return ok_status();
    }
    if (auto* b = std::get_if<bool*>(&target)) {
        **b = parse_boolean(raw);
        return ok_status();
    }

    auto parsed = parse_integer(raw, source, key);
    if (parsed.is_err()) return std::move(parsed).error();
    std::int64_t val = parsed.value();

    if (auto* i64 = std::get_if<std::int64_t*>(&target)) {
        **i64 = val;
        return ok_status();
    }
    if (val < std::numeric_limits<int>::min() || val > std::numeric_limits<int>::max()) {
        return not_an_integer(raw, source, key);
    }
    *std::get<int*>(target) = static_cast<int>(val);
    return ok_status();
}

void reset(const FieldTarget& target) {
    if (target_is_null(target)) return;
    std::visit([](auto* ptr) { *ptr = {}; }, target);
}

std::string render(const FieldTarget& target) {
    if (target_is_null(target)) return "";
    switch (target.index()) {
        case 0: return *std::get<std::string*>(target);
        case 1: return std::to_string(*std::get<int*>(target));
        case 2: return std::to_string(*std::get<std::int64_t*>(target));
        default: return *std::get<bool*>(target) ? "true" : "false";
    }
}

} // namespace confbind
