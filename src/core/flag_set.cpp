#include <confbind/flag_set.hpp>
#include <CLI/CLI.hpp>
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <unordered_map>
#include <utility>
#include <vector>

namespace confbind {

struct FlagSet::Impl {
    CLI::App app;
    // flag name -> is boolean
    std::unordered_map<std::string, bool> flags;
    // boolean options; their raw values are handed over after parsing
    std::vector<std::pair<CLI::Option*, Setter>> bool_flags;
    std::optional<BindError> pending;
    bool help_enabled = true;

    void record(Status st) {
        if (st.is_err() && !pending) pending = std::move(st).error();
    }

    std::vector<std::string> normalize(const std::vector<std::string>& args) const;
};

static bool is_negative_number(const std::string& arg) {
    if (arg.size() < 2 || arg[0] != '-') return false;
    bool digit = false;
    for (size_t i = 1; i < arg.size(); i++) {
        if (std::isdigit(static_cast<unsigned char>(arg[i]))) digit = true;
        else if (arg[i] != '.') return false;
    }
    return digit;
}

// Rewrite every flag token to CLI11's --name[=value] form. A registered
// non-boolean flag written without '=' takes the next argument as its
// value, whatever it looks like.
std::vector<std::string> FlagSet::Impl::normalize(const std::vector<std::string>& args) const {
    std::vector<std::string> out;
    out.reserve(args.size());

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--") {
            out.insert(out.end(), args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
            break;
        }
        if (arg.size() < 2 || arg[0] != '-' || is_negative_number(arg)) {
            out.push_back(arg);
            continue;
        }

        size_t dashes = arg[1] == '-' ? 2 : 1;
        std::string body = arg.substr(dashes);
        if (body.empty() || body[0] == '-' || body[0] == '=') {
            out.push_back(arg);
            continue;
        }

        auto eq = body.find('=');
        std::string name = body.substr(0, eq);
        auto it = flags.find(name);
        if (it == flags.end()) {
            if (help_enabled && (name == "h" || name == "help")) {
                out.push_back("--help");
            } else {
                out.push_back("--" + body);
            }
            continue;
        }
        if (it->second || eq != std::string::npos) {
            out.push_back("--" + body);
            continue;
        }
        if (i + 1 < args.size()) {
            out.push_back("--" + name + "=" + args[++i]);
        } else {
            out.push_back("--" + name);
        }
    }
    return out;
}

FlagSet::FlagSet(std::string program_name) : impl_(std::make_unique<Impl>()) {
    impl_->app.name(std::move(program_name));
    impl_->app.allow_extras();
}

FlagSet::~FlagSet() = default;
FlagSet::FlagSet(FlagSet&&) noexcept = default;
FlagSet& FlagSet::operator=(FlagSet&&) noexcept = default;

Status FlagSet::add(const std::string& name, bool is_bool, const std::string& default_text,
                    const std::string& usage, Setter setter) {
    if (impl_->flags.count(name)) {
        return BindError{BindError::InvalidArg, "flag redefined: " + name};
    }
    if (impl_->help_enabled && (name == "h" || name == "help")) {
        return BindError{BindError::InvalidArg, "flag -" + name + " is reserved for help"};
    }

    Impl* self = impl_.get();
    try {
        CLI::Option* opt = nullptr;
        if (is_bool) {
            // No callback: CLI11 would convert "-name=value" with its own
            // boolean rules. The raw result goes to the setter instead.
            opt = impl_->app.add_flag("--" + name);
            opt->description(usage);
            opt->multi_option_policy(CLI::MultiOptionPolicy::TakeLast);
            impl_->bool_flags.emplace_back(opt, setter);
        } else {
            opt = impl_->app.add_option_function<std::string>("--" + name,
                [self, setter](const std::string& val) {
                    self->record(setter(val));
                },
                usage);
            opt->multi_option_policy(CLI::MultiOptionPolicy::TakeLast);
        }
        if (!is_bool && !default_text.empty()) {
            opt->default_str(default_text);
        }
    } catch (const CLI::ConstructionError& e) {
        return BindError{BindError::InvalidArg,
            "cannot register flag " + name + ": " + e.what()};
    }

    impl_->flags.emplace(name, is_bool);
    return ok_status();
}

bool FlagSet::has(const std::string& name) const {
    return impl_->flags.count(name) > 0;
}

void FlagSet::set_help_enabled(bool enabled) {
    impl_->help_enabled = enabled;
    if (enabled) {
        impl_->app.set_help_flag("-h,--help", "Print this help message and exit");
    } else {
        impl_->app.set_help_flag();
    }
}

Status FlagSet::parse(const std::vector<std::string>& args, std::ostream& err) {
    impl_->pending.reset();

    // CLI11 consumes its argument vector from the back
    auto tokens = impl_->normalize(args);
    std::reverse(tokens.begin(), tokens.end());

    try {
        impl_->app.clear();
        impl_->app.parse(tokens);
    } catch (const CLI::CallForHelp&) {
        err << impl_->app.help();
        return BindError{BindError::Help, "help requested"};
    } catch (const CLI::ParseError& e) {
        err << e.what() << "\n" << impl_->app.help();
        return BindError{BindError::Parse, std::string("invalid command line: ") + e.what(),
            "run with -h to list the accepted flags"};
    }

    for (auto& [opt, setter] : impl_->bool_flags) {
        if (opt->count() == 0) continue;
        const std::string& raw = opt->results().back();
        impl_->record(setter(raw.empty() ? "true" : raw));
    }

    if (impl_->pending) {
        BindError e = std::move(*impl_->pending);
        impl_->pending.reset();
        return e;
    }
    return ok_status();
}

void FlagSet::print_usage(std::ostream& out) const {
    out << impl_->app.help();
}

std::vector<std::string> FlagSet::remaining() const {
    return impl_->app.remaining();
}

} // namespace confbind
