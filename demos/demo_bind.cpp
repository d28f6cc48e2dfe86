// demo_bind.cpp
//
// Binds a small server configuration from files, environment variables and
// flags. Try:
//
//     ./demo_bind                          # Hostname is mandatory -> error + usage
//     ./demo_bind -host abc -port 8000 -async
//     HOST=def PORT=7000 ./demo_bind -host abc
//     CONFIGDIR=/tmp/conf ./demo_bind      # with /tmp/conf/hostname on disk
//
// Set CONFBIND_LOG=debug to see which source set each field.

#include <confbind/binder.hpp>
#include <confbind/log.hpp>

#include <cstdint>
#include <iostream>
#include <string>

using namespace confbind;

struct ServerConfig {
    std::string hostname;
    int port = 0;
    bool async = false;
    std::int64_t max_body = 0;
};

int main(int argc, char** argv) {
    log::init_from_env(process_environment(), "CONFBIND_LOG");

    auto args = args_from_argv(argc, argv);

    // Config files live in $CONFIGDIR, -configdir, or /config, in that order.
    std::string dir = retrieve_config_directory("CONFIGDIR", "configdir", "/config", args);
    log::debug("config directory: %s", dir.c_str());

    ServerConfig cfg;
    Schema schema;
    schema.text("Hostname", cfg.hostname)
        .env("HOST").flag("host").usage("hostname of the server").mandatory();
    schema.integer("Port", cfg.port).default_value("8080").usage("listen port");
    schema.boolean("Async", cfg.async).usage("serve requests asynchronously");
    schema.integer("MaxBody", cfg.max_body)
        .file("max-body").env("MAX_BODY").flag("max-body")
        .default_value("1048576").usage("largest accepted request body in bytes");
    // Only here so -configdir is not reported as unknown in the usage text.
    std::string configdir;
    schema.text("ConfigDir", configdir).file("").env("CONFIGDIR").usage("config directory");

    BindOptions opts;
    opts.program_name = "demo_bind";

    auto st = bind_config_with_dir(schema, args, dir, opts);
    if (st.is_err()) {
        if (st.error().code == BindError::Help) return 0;
        std::cerr << "\n" << st.error().format() << "\n";
        return 1;
    }

    std::cout << "Hostname: " << cfg.hostname << "\n"
              << "Port:     " << cfg.port << "\n"
              << "Async:    " << (cfg.async ? "true" : "false") << "\n"
              << "MaxBody:  " << cfg.max_body << "\n";
    return 0;
}
