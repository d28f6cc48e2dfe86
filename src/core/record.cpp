#include <confbind/record.hpp>
#include <confbind/file_index.hpp>
#include <confbind/log.hpp>
#include <toml++/toml.hpp>

namespace confbind {

static BindError schema_error(std::string msg, std::string hint,
                              const std::string& source_name, const toml::node& node) {
    return BindError{BindError::Parse, std::move(msg), std::move(hint),
        source_name, static_cast<int>(node.source().begin.line)};
}

Result<Record> Record::parse(const std::string& toml_str, const std::string& source_name) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, source_name);
    } catch (const toml::parse_error& e) {
        return BindError{BindError::Parse,
            std::string("schema TOML parse error: ") + std::string(e.description()),
            "", source_name, static_cast<int>(e.source().begin.line)};
    }

    Record rec;

    auto* fields = doc["field"].as_array();
    if (!fields) {
        if (auto* node = doc.get("field")) {
            return schema_error("'field' must be an array of tables",
                "declare each field in its own [[field]] block", source_name, *node);
        }
        return Result<Record>::ok(std::move(rec));
    }

    for (auto& node : *fields) {
        auto* tbl = node.as_table();
        if (!tbl) {
            return schema_error("'field' entries must be tables",
                "declare each field in its own [[field]] block", source_name, node);
        }

        auto name = (*tbl)["name"].value<std::string>();
        if (!name || name->empty()) {
            return schema_error("field without a name", "add name = \"...\"",
                source_name, node);
        }
        if (rec.values_.count(*name)) {
            return schema_error("field " + *name + " declared twice", "",
                source_name, node);
        }

        auto kind_text = (*tbl)["kind"].value<std::string>();
        if (!kind_text) {
            return schema_error("field " + *name + " has no kind",
                "kind must be \"text\", \"integer\" or \"boolean\"", source_name, node);
        }
        auto kind = parse_kind(*kind_text);
        if (!kind) {
            log::info("skipping field %s because %s is not a supported type",
                      name->c_str(), kind_text->c_str());
            continue;
        }

        FieldSpec spec;
        spec.name = *name;
        switch (*kind) {
            case FieldKind::Text:
                spec.target = &std::get<std::string>(
                    rec.values_.emplace(*name, Value{std::string()}).first->second);
                break;
            case FieldKind::Integer:
                spec.target = &std::get<std::int64_t>(
                    rec.values_.emplace(*name, Value{std::int64_t{0}}).first->second);
                break;
            case FieldKind::Boolean:
                spec.target = &std::get<bool>(
                    rec.values_.emplace(*name, Value{false}).first->second);
                break;
        }

        if (auto v = (*tbl)["file"].value<std::string>()) spec.file_key = *v;
        if (auto v = (*tbl)["env"].value<std::string>()) spec.env_key = *v;
        if (auto v = (*tbl)["flag"].value<std::string>()) spec.flag_key = *v;
        if (auto v = (*tbl)["usage"].value<std::string>()) spec.usage = *v;

        if (auto* def = tbl->get("default")) {
            if (def->is_string()) {
                spec.default_value = *def->value<std::string>();
            } else if (def->is_integer()) {
                spec.default_value = std::to_string(*def->value<std::int64_t>());
            } else if (def->is_boolean()) {
                spec.default_value = *def->value<bool>() ? "true" : "false";
            } else {
                return schema_error("default of field " + *name + " must be a string, integer or boolean",
                    "", source_name, *def);
            }
        }

        spec.mandatory = tbl->contains("mandatory");
        rec.schema_.add(std::move(spec));
    }

    return Result<Record>::ok(std::move(rec));
}

Result<Record> Record::load(const std::string& path) {
    return read_file(path).and_then([&path](std::string& text) {
        return Record::parse(text, path);
    });
}

std::vector<std::string> Record::names() const {
    std::vector<std::string> out;
    out.reserve(schema_.size());
    for (const auto& f : schema_.fields()) {
        out.push_back(f.name);
    }
    return out;
}

bool Record::has(const std::string& name) const {
    return values_.count(name) > 0;
}

std::optional<std::string> Record::text(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) return std::nullopt;
    if (auto* s = std::get_if<std::string>(&it->second)) return *s;
    return std::nullopt;
}

std::optional<std::int64_t> Record::integer(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) return std::nullopt;
    if (auto* i = std::get_if<std::int64_t>(&it->second)) return *i;
    return std::nullopt;
}

std::optional<bool> Record::boolean(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) return std::nullopt;
    if (auto* b = std::get_if<bool>(&it->second)) return *b;
    return std::nullopt;
}

std::string Record::render(const std::string& name) const {
    const FieldSpec* spec = schema_.find(name);
    if (!spec) return "";
    return confbind::render(spec->target);
}

} // namespace confbind
