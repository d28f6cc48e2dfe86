#pragma once

#include <confbind/field.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace confbind {

class Schema;

// Sets the optional annotations of the field it was returned for.
//
//     schema.text("Hostname", cfg.hostname)
//         .env("HOST").flag("host").usage("hostname of the server").mandatory();
class FieldBuilder {
public:
    FieldBuilder(Schema& schema, size_t index) : schema_(schema), index_(index) {}

    // Base name of the file in the config directory.
    FieldBuilder& file(std::string key);
    FieldBuilder& env(std::string key);
    FieldBuilder& flag(std::string key);
    // Applied through the normal coercion path before flags are parsed.
    FieldBuilder& default_value(std::string text);
    FieldBuilder& usage(std::string text);
    FieldBuilder& mandatory();

private:
    FieldSpec& spec();

    Schema& schema_;
    size_t index_;
};

// Ordered field descriptors of one record. The schema borrows the record's
// storage; the record must outlive every bind call made with the schema.
class Schema {
public:
    FieldBuilder text(std::string name, std::string& target);
    FieldBuilder integer(std::string name, int& target);
    FieldBuilder integer(std::string name, std::int64_t& target);
    FieldBuilder boolean(std::string name, bool& target);

    // Append a fully described field.
    FieldBuilder add(FieldSpec spec);

    const std::vector<FieldSpec>& fields() const { return fields_; }
    size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }

    const FieldSpec* find(const std::string& name) const;

private:
    friend class FieldBuilder;
    std::vector<FieldSpec> fields_;
};

} // namespace confbind
