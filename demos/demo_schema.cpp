// demo_schema.cpp
//
// Loads a record declaration from a TOML schema file and binds it:
//
//     ./demo_schema ../demos/server.toml -host example.org -workers 4
//
// Remaining arguments after the schema path are treated as flags.

#include <confbind/binder.hpp>
#include <confbind/log.hpp>
#include <confbind/record.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace confbind;

int main(int argc, char** argv) {
    log::init_from_env(process_environment(), "CONFBIND_LOG");

    if (argc < 2) {
        BindError e{BindError::InvalidArg, "no schema file specified",
            "usage: demo_schema <schema.toml> [flags...]"};
        std::cerr << e.format() << "\n";
        return 2;
    }

    auto rec = Record::load(argv[1]);
    if (rec.is_err()) {
        std::cerr << rec.error().format() << "\n";
        return 1;
    }

    std::vector<std::string> args(argv + 2, argv + argc);
    std::string dir = retrieve_config_directory("CONFIGDIR", "", "", args);

    BindOptions opts;
    opts.program_name = "demo_schema";
    auto st = bind_config_with_dir(rec.value().schema(), args, dir, opts);
    if (st.is_err()) {
        if (st.error().code == BindError::Help) return 0;
        std::cerr << "\n" << st.error().format() << "\n";
        return 1;
    }

    for (const auto& name : rec.value().names()) {
        std::cout << name << " = " << rec.value().render(name) << "\n";
    }
    return 0;
}
