#pragma once

#include <confbind/result.hpp>
#include <confbind/schema.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace confbind {

// A record declared in a TOML schema file. Unlike a hand-written struct
// described with Schema, a Record owns the storage its schema points into:
//
//     [[field]]
//     name = "Hostname"
//     kind = "text"            # text | integer | boolean
//     env = "HOST"
//     flag = "host"
//     file = "hostname"
//     default = "localhost"
//     usage = "hostname of the server"
//     mandatory = true         # the key's presence is what counts
//
// Fields keep the array order. Fields of any other kind are skipped.
// Records move but do not copy.
class Record {
public:
    using Value = std::variant<std::string, std::int64_t, bool>;

    static Result<Record> parse(const std::string& toml_str,
                                const std::string& source_name = "");
    static Result<Record> load(const std::string& path);

    Record(Record&&) = default;
    Record& operator=(Record&&) = default;
    Record(const Record&) = delete;
    Record& operator=(const Record&) = delete;

    const Schema& schema() const { return schema_; }

    std::vector<std::string> names() const;
    bool has(const std::string& name) const;

    std::optional<std::string> text(const std::string& name) const;
    std::optional<std::int64_t> integer(const std::string& name) const;
    std::optional<bool> boolean(const std::string& name) const;

    // Current value as text, or "" for an unknown name.
    std::string render(const std::string& name) const;

private:
    Record() = default;

    // std::map nodes stay put across inserts and moves, so the schema's
    // targets remain valid.
    std::map<std::string, Value> values_;
    Schema schema_;
};

} // namespace confbind
