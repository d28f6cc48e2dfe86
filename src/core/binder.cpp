#include <confbind/binder.hpp>
#include <confbind/binding.hpp>
#include <confbind/file_index.hpp>
#include <confbind/flag_set.hpp>
#include <confbind/log.hpp>
#include <iostream>
#include <sstream>

namespace confbind {

namespace {

// Everything one bind call needs. Owned by bind_config_with_dir's stack frame, so
// nothing survives the call on any return path.
struct BindContext {
    const Environment& env;
    std::ostream& out;
    FlagSet flags;
    FileIndex files;
    std::vector<FieldBinding> bindings;

    BindContext(const Environment& e, std::ostream& o, const std::string& program)
        : env(e), out(o), flags(program) {}
};

// Zero every target and apply declared defaults, then register one flag per binding. Flag
// callbacks write through the binding, so `bindings` must not be resized
// after this point.
Status register_flags(BindContext& ctx) {
    for (auto& b : ctx.bindings) {
        reset(b.target);
        if (b.default_value) {
            auto st = b.set(*b.default_value, SourceKind::Default, b.name);
            if (st.is_err()) {
                log::warn("ignoring default of field %s: %s",
                          b.name.c_str(), st.error().message.c_str());
            }
        }

        FieldBinding* binding = &b;
        CONFBIND_TRY(ctx.flags.add(b.flag_key, b.kind == FieldKind::Boolean,
            b.default_value.value_or(""), b.usage,
            [binding](const std::string& raw) {
                return binding->set(raw, SourceKind::Flag, binding->flag_key);
            }));
    }
    return ok_status();
}

// File, then environment, on top of whatever flag parsing left behind.
Status resolve_sources(BindContext& ctx) {
    for (auto& b : ctx.bindings) {
        if (!b.file_key.empty()) {
            auto it = ctx.files.find(b.file_key);
            if (it != ctx.files.end()) {
                auto contents = read_file(it->second);
                if (contents.is_ok()) {
                    CONFBIND_TRY(b.set(contents.value(), SourceKind::File, b.file_key));
                    log::debug("field %s set from file %s",
                               b.name.c_str(), it->second.string().c_str());
                    continue;
                }
                if (contents.error().code != BindError::NotFound) {
                    return std::move(contents).error();
                }
                // removed since the directory was indexed
            }
        }

        auto val = ctx.env.lookup(b.env_key);
        if (!val) continue;
        CONFBIND_TRY(b.set(*val, SourceKind::Environment, b.env_key));
        log::debug("field %s set from environment variable %s",
                   b.name.c_str(), b.env_key.c_str());
    }
    return ok_status();
}

Status check_mandatory(BindContext& ctx) {
    int missing = 0;
    for (const auto& b : ctx.bindings) {
        if (!b.mandatory || b.is_set) continue;
        missing++;
        ctx.out << "Mandatory flag -" << b.flag_key
                << " (or environment variable " << b.env_key << ") does not exist.\n";
    }
    if (missing == 0) return ok_status();

    ctx.flags.print_usage(ctx.out);
    return BindError{BindError::MandatoryMissing,
        std::to_string(missing) + " mandatory parameters missing"};
}

} // namespace

std::vector<std::string> args_from_argv(int argc, const char* const* argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        if (argv[i]) args.emplace_back(argv[i]);
    }
    return args;
}

Status bind_config_with_dir(const Schema& schema, const std::vector<std::string>& args,
                     const std::string& config_dir, const BindOptions& options) {
    const Environment& env = options.env ? *options.env : process_environment();
    std::ostream& out = options.output ? *options.output : std::cerr;

    BindContext ctx(env, out, options.program_name);

    auto bindings = discover_fields(schema, !config_dir.empty());
    if (bindings.is_err()) return std::move(bindings).error();
    ctx.bindings = std::move(bindings).value();

    auto files = index_directory(config_dir);
    if (files.is_err()) return std::move(files).error();
    ctx.files = std::move(files).value();

    CONFBIND_TRY(register_flags(ctx));
    CONFBIND_TRY(ctx.flags.parse(args, ctx.out));
    CONFBIND_TRY(resolve_sources(ctx));
    return check_mandatory(ctx);
}

Status bind_config_with_dir(const Schema& schema, int argc, const char* const* argv,
                     const std::string& config_dir, const BindOptions& options) {
    return bind_config_with_dir(schema, args_from_argv(argc, argv), config_dir, options);
}

Status bind_config(const Schema& schema, const std::vector<std::string>& args,
            const BindOptions& options) {
    return bind_config_with_dir(schema, args, "", options);
}

Status bind_config(const Schema& schema, int argc, const char* const* argv,
            const BindOptions& options) {
    return bind_config_with_dir(schema, args_from_argv(argc, argv), "", options);
}

std::string retrieve_config_directory(const std::string& env_key,
                                      const std::string& flag_key,
                                      const std::string& fallback,
                                      const std::vector<std::string>& args,
                                      const Environment& env) {
    if (!env_key.empty()) {
        auto val = env.lookup(env_key);
        if (val && !val->empty()) return *val;
    }
    if (flag_key.empty()) return fallback;

    std::string dir = fallback;
    FlagSet flags("config-directory");
    flags.set_help_enabled(false);
    auto added = flags.add(flag_key, false, fallback, "",
        [&dir](const std::string& raw) {
            dir = raw;
            return ok_status();
        });
    if (added.is_err()) {
        log::warn("%s", added.error().message.c_str());
        return fallback;
    }

    std::ostringstream discard;
    auto parsed = flags.parse(args, discard);
    if (parsed.is_err()) {
        log::warn("cannot read -%s from the command line: %s",
                  flag_key.c_str(), parsed.error().message.c_str());
        return fallback;
    }
    return dir.empty() ? fallback : dir;
}

} // namespace confbind
