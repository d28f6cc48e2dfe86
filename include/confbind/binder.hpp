#pragma once

#include <confbind/environment.hpp>
#include <confbind/result.hpp>
#include <confbind/schema.hpp>
#include <iosfwd>
#include <string>
#include <vector>

namespace confbind {

struct BindOptions {
    // Shown in the usage text.
    std::string program_name = "program";
    // nullptr: the process environment.
    const Environment* env = nullptr;
    // Flag errors, missing mandatory fields and usage go here.
    // nullptr: std::cerr.
    std::ostream* output = nullptr;
};

// Populate the fields described by `schema` from, in order of precedence:
//   1. a file named after the field anywhere under `config_dir`,
//   2. an environment variable,
//   3. a command-line flag in `args`,
// falling back to the field's declared default. `args` excludes the program
// name. An empty `config_dir` disables file lookup.
//
// Errors:
//   Coercion          a value does not convert to the field's kind
//   SourceRead        a config file exists but cannot be read
//   MandatoryMissing  one or more mandatory fields were set by no source;
//                     every one of them is listed on the output stream
//   Parse / Help      bad command line, or help requested
//   InvalidArg        malformed schema
//   IO                the config directory cannot be traversed
//
// Must be called from a single thread; nothing persists between calls.
Status bind_config_with_dir(const Schema& schema, const std::vector<std::string>& args,
                     const std::string& config_dir, const BindOptions& options = {});

Status bind_config_with_dir(const Schema& schema, int argc, const char* const* argv,
                     const std::string& config_dir, const BindOptions& options = {});

// bind_config_with_dir() without file lookup.
Status bind_config(const Schema& schema, const std::vector<std::string>& args,
            const BindOptions& options = {});

Status bind_config(const Schema& schema, int argc, const char* const* argv,
            const BindOptions& options = {});

// Locate the config directory before binding: the environment variable
// `env_key` if set and non-empty, else the flag `flag_key` in `args`, else
// `fallback`. Either key may be empty to skip that source. Other arguments
// in `args` are ignored.
std::string retrieve_config_directory(const std::string& env_key,
                                      const std::string& flag_key,
                                      const std::string& fallback,
                                      const std::vector<std::string>& args,
                                      const Environment& env = process_environment());

// Arguments after the program name.
std::vector<std::string> args_from_argv(int argc, const char* const* argv);

} // namespace confbind
