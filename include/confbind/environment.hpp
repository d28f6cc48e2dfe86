#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace confbind {

// Key/value lookup over environment variables.
// A variable that is set to the empty string is present (returns "").
class Environment {
public:
    virtual ~Environment() = default;
    virtual std::optional<std::string> lookup(const std::string& key) const = 0;
};

// Reads the environment of the running process.
class ProcessEnvironment : public Environment {
public:
    std::optional<std::string> lookup(const std::string& key) const override;
};

// Explicit set of variables, independent of the process environment.
class MapEnvironment : public Environment {
public:
    MapEnvironment() = default;
    MapEnvironment(std::initializer_list<std::pair<const std::string, std::string>> vars);

    void set(const std::string& key, std::string value);
    void unset(const std::string& key);

    std::optional<std::string> lookup(const std::string& key) const override;

private:
    std::unordered_map<std::string, std::string> vars_;
};

// Shared ProcessEnvironment instance.
const Environment& process_environment();

} // namespace confbind
