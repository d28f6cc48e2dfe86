#include <confbind/schema.hpp>

namespace confbind {

FieldSpec& FieldBuilder::spec() {
    return schema_.fields_[index_];
}

FieldBuilder& FieldBuilder::file(std::string key) {
    spec().file_key = std::move(key);
    return *this;
}

FieldBuilder& FieldBuilder::env(std::string key) {
    spec().env_key = std::move(key);
    return *this;
}

FieldBuilder& FieldBuilder::flag(std::string key) {
    spec().flag_key = std::move(key);
    return *this;
}

FieldBuilder& FieldBuilder::default_value(std::string text) {
    spec().default_value = std::move(text);
    return *this;
}

FieldBuilder& FieldBuilder::usage(std::string text) {
    spec().usage = std::move(text);
    return *this;
}

FieldBuilder& FieldBuilder::mandatory() {
    spec().mandatory = true;
    return *this;
}

FieldBuilder Schema::add(FieldSpec spec) {
    fields_.push_back(std::move(spec));
    return FieldBuilder(*this, fields_.size() - 1);
}

FieldBuilder Schema::text(std::string name, std::string& target) {
    FieldSpec spec;
    spec.name = std::move(name);
    spec.target = &target;
    return add(std::move(spec));
}

FieldBuilder Schema::integer(std::string name, int& target) {
    FieldSpec spec;
    spec.name = std::move(name);
    spec.target = &target;
    return add(std::move(spec));
}

FieldBuilder Schema::integer(std::string name, std::int64_t& target) {
    FieldSpec spec;
    spec.name = std::move(name);
    spec.target = &target;
    return add(std::move(spec));
}

FieldBuilder Schema::boolean(std::string name, bool& target) {
    FieldSpec spec;
    spec.name = std::move(name);
    spec.target = &target;
    return add(std::move(spec));
}

const FieldSpec* Schema::find(const std::string& name) const {
    for (const auto& f : fields_) {
        if (f.name == name) return &f;
    }
    return nullptr;
}

} // namespace confbind
