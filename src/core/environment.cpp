#include <confbind/environment.hpp>
#include <cstdlib>

namespace confbind {

std::optional<std::string> ProcessEnvironment::lookup(const std::string& key) const {
    if (key.empty()) return std::nullopt;
    const char* val = std::getenv(key.c_str());
    if (!val) return std::nullopt;
    return std::string(val);
}

MapEnvironment::MapEnvironment(
    std::initializer_list<std::pair<const std::string, std::string>> vars)
    : vars_(vars) {}

void MapEnvironment::set(const std::string& key, std::string value) {
    vars_[key] = std::move(value);
}

void MapEnvironment::unset(const std::string& key) {
    vars_.erase(key);
}

std::optional<std::string> MapEnvironment::lookup(const std::string& key) const {
    auto it = vars_.find(key);
    if (it == vars_.end()) return std::nullopt;
    return it->second;
}

const Environment& process_environment() {
    static const ProcessEnvironment env;
    return env;
}

} // namespace confbind
