#pragma once

#include <confbind/result.hpp>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace confbind {

// Command-line flag registry.
//
// Flags may be written Go-style with one dash or with two:
// -port 8000, -port=8000, --port 8000, --port=8000. Boolean flags never
// consume the following argument; -async=false is accepted.
// Unregistered flags and positional arguments are not errors; they are
// collected in remaining(). Everything after "--" is positional.
class FlagSet {
public:
    // Receives the raw text of a flag. An error aborts parse() with it.
    using Setter = std::function<Status(const std::string&)>;

    explicit FlagSet(std::string program_name);
    ~FlagSet();

    FlagSet(FlagSet&&) noexcept;
    FlagSet& operator=(FlagSet&&) noexcept;

    // default_text is shown in the usage output only; it is not applied.
    Status add(const std::string& name, bool is_bool, const std::string& default_text,
               const std::string& usage, Setter setter);

    bool has(const std::string& name) const;

    // When disabled, -h/--help is an ordinary unregistered flag.
    void set_help_enabled(bool enabled);

    // args excludes the program name. Parse and help errors are written to
    // `err` together with the usage text.
    Status parse(const std::vector<std::string>& args, std::ostream& err);

    void print_usage(std::ostream& out) const;

    // Unrecognised flags and positionals from the last parse(), in order.
    std::vector<std::string> remaining() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace confbind
