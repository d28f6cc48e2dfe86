#include <catch2/catch.hpp>
#include <confbind/flag_set.hpp>
#include <sstream>
#include <string>
#include <vector>

using namespace confbind;

namespace {

// Records what each flag callback received.
struct Captured {
    std::string host;
    std::string port;
    std::string async;
    int host_calls = 0;
};

FlagSet make_flags(Captured& c) {
    FlagSet flags("test");
    REQUIRE(flags.add("host", false, "localhost", "hostname of the server",
        [&c](const std::string& v) { c.host = v; c.host_calls++; return ok_status(); }).is_ok());
    REQUIRE(flags.add("port", false, "8080", "listen port",
        [&c](const std::string& v) { c.port = v; return ok_status(); }).is_ok());
    REQUIRE(flags.add("async", true, "", "",
        [&c](const std::string& v) { c.async = v; return ok_status(); }).is_ok());
    return flags;
}

} // namespace

TEST_CASE("single-dash flags with separate values", "[flag_set]") {
    Captured c;
    auto flags = make_flags(c);
    std::ostringstream err;
    REQUIRE(flags.parse({"-host", "abc", "-port", "8000", "-async"}, err).is_ok());
    REQUIRE(c.host == "abc");
    REQUIRE(c.port == "8000");
    REQUIRE(c.async == "true");
    REQUIRE(err.str().empty());
}

TEST_CASE("double-dash and inline values", "[flag_set]") {
    Captured c;
    auto flags = make_flags(c);
    std::ostringstream err;
    REQUIRE(flags.parse({"--host=abc", "-port=8000", "--async"}, err).is_ok());
    REQUIRE(c.host == "abc");
    REQUIRE(c.port == "8000");
    REQUIRE(c.async == "true");
}

TEST_CASE("boolean flag with explicit false", "[flag_set]") {
    Captured c;
    auto flags = make_flags(c);
    std::ostringstream err;
    REQUIRE(flags.parse({"-async=false"}, err).is_ok());
    REQUIRE(c.async == "false");
}

TEST_CASE("boolean flag values reach the setter unconverted", "[flag_set]") {
    Captured c;
    auto flags = make_flags(c);
    std::ostringstream err;

    REQUIRE(flags.parse({"-async=off"}, err).is_ok());
    REQUIRE(c.async == "off");
    REQUIRE(flags.parse({"-async=abc"}, err).is_ok());
    REQUIRE(c.async == "abc");
    REQUIRE(flags.parse({"--async=NO"}, err).is_ok());
    REQUIRE(c.async == "NO");
    REQUIRE(flags.parse({"-async=-1"}, err).is_ok());
    REQUIRE(c.async == "-1");
    REQUIRE(err.str().empty());
}

TEST_CASE("repeated boolean flag keeps the last value", "[flag_set]") {
    Captured c;
    auto flags = make_flags(c);
    std::ostringstream err;
    REQUIRE(flags.parse({"-async=no", "-async"}, err).is_ok());
    REQUIRE(c.async == "true");
}

TEST_CASE("boolean flag does not consume the next argument", "[flag_set]") {
    Captured c;
    auto flags = make_flags(c);
    std::ostringstream err;
    REQUIRE(flags.parse({"-async", "input.txt"}, err).is_ok());
    REQUIRE(c.async == "true");
    REQUIRE(flags.remaining() == std::vector<std::string>{"input.txt"});
}

TEST_CASE("value flag takes a dash-prefixed value", "[flag_set]") {
    Captured c;
    auto flags = make_flags(c);
    std::ostringstream err;
    REQUIRE(flags.parse({"-port", "-50", "-host", "-weird"}, err).is_ok());
    REQUIRE(c.port == "-50");
    REQUIRE(c.host == "-weird");
}

TEST_CASE("flags not given do not run their callback", "[flag_set]") {
    Captured c;
    auto flags = make_flags(c);
    std::ostringstream err;
    REQUIRE(flags.parse({"-port", "1"}, err).is_ok());
    REQUIRE(c.host_calls == 0);
    REQUIRE(c.host.empty());
    REQUIRE(c.async.empty());
}

TEST_CASE("repeated value flag: last one wins", "[flag_set]") {
    Captured c;
    auto flags = make_flags(c);
    std::ostringstream err;
    REQUIRE(flags.parse({"-host", "a", "-host", "b"}, err).is_ok());
    REQUIRE(c.host == "b");
}

TEST_CASE("unregistered flags are tolerated", "[flag_set]") {
    Captured c;
    auto flags = make_flags(c);
    std::ostringstream err;
    auto st = flags.parse({"-verbose", "-host", "abc", "--other=1"}, err);
    REQUIRE(st.is_ok());
    REQUIRE(c.host == "abc");
    auto rest = flags.remaining();
    REQUIRE(rest.size() == 2);
}

TEST_CASE("double dash ends flag parsing", "[flag_set]") {
    Captured c;
    auto flags = make_flags(c);
    std::ostringstream err;
    REQUIRE(flags.parse({"-host", "abc", "--", "-port", "9"}, err).is_ok());
    REQUIRE(c.host == "abc");
    REQUIRE(c.port.empty());
}

TEST_CASE("missing value is a parse error with usage", "[flag_set]") {
    Captured c;
    auto flags = make_flags(c);
    std::ostringstream err;
    auto st = flags.parse({"-port"}, err);
    REQUIRE(st.is_err());
    REQUIRE(st.error().code == BindError::Parse);
    REQUIRE(err.str().find("--port") != std::string::npos);
}

TEST_CASE("setter error is returned from parse", "[flag_set]") {
    FlagSet flags("test");
    REQUIRE(flags.add("port", false, "", "",
        [](const std::string& v) -> Status {
            return BindError{BindError::Coercion, "bad port " + v};
        }).is_ok());
    std::ostringstream err;
    auto st = flags.parse({"-port", "text"}, err);
    REQUIRE(st.is_err());
    REQUIRE(st.error().code == BindError::Coercion);
    REQUIRE(st.error().message == "bad port text");
}

TEST_CASE("help flag prints usage", "[flag_set]") {
    Captured c;
    auto flags = make_flags(c);
    std::ostringstream err;
    auto st = flags.parse({"-h"}, err);
    REQUIRE(st.is_err());
    REQUIRE(st.error().code == BindError::Help);
    REQUIRE(err.str().find("hostname of the server") != std::string::npos);
}

TEST_CASE("help can be disabled", "[flag_set]") {
    FlagSet flags("test");
    flags.set_help_enabled(false);
    std::string dir;
    REQUIRE(flags.add("configdir", false, "", "",
        [&dir](const std::string& v) { dir = v; return ok_status(); }).is_ok());
    std::ostringstream err;
    REQUIRE(flags.parse({"-help", "-configdir", "/etc/app"}, err).is_ok());
    REQUIRE(dir == "/etc/app");
    REQUIRE(err.str().empty());
}

TEST_CASE("registering a flag twice fails", "[flag_set]") {
    FlagSet flags("test");
    auto noop = [](const std::string&) { return ok_status(); };
    REQUIRE(flags.add("host", false, "", "", noop).is_ok());
    REQUIRE(flags.has("host"));
    auto st = flags.add("host", true, "", "", noop);
    REQUIRE(st.is_err());
    REQUIRE(st.error().code == BindError::InvalidArg);
}

TEST_CASE("usage lists flags, usage text and defaults", "[flag_set]") {
    Captured c;
    auto flags = make_flags(c);
    std::ostringstream out;
    flags.print_usage(out);
    auto text = out.str();
    REQUIRE(text.find("--host") != std::string::npos);
    REQUIRE(text.find("listen port") != std::string::npos);
    REQUIRE(text.find("8080") != std::string::npos);
}

TEST_CASE("single-character flag names", "[flag_set]") {
    FlagSet flags("test");
    std::string v;
    REQUIRE(flags.add("v", false, "", "",
        [&v](const std::string& s) { v = s; return ok_status(); }).is_ok());
    std::ostringstream err;
    REQUIRE(flags.parse({"-v", "3"}, err).is_ok());
    REQUIRE(v == "3");
}

TEST_CASE("a flag set can be parsed again", "[flag_set]") {
    Captured c;
    auto flags = make_flags(c);
    std::ostringstream err;
    REQUIRE(flags.parse({"-host", "first"}, err).is_ok());
    REQUIRE(flags.parse({"-host", "second"}, err).is_ok());
    REQUIRE(c.host == "second");
}

TEST_CASE("help names are reserved while help is enabled", "[flag_set]") {
    auto noop = [](const std::string&) { return ok_status(); };
    FlagSet flags("test");
    REQUIRE(flags.add("help", true, "", "", noop).error().code == BindError::InvalidArg);
    REQUIRE(flags.add("h", false, "", "", noop).error().code == BindError::InvalidArg);

    FlagSet quiet("test");
    quiet.set_help_enabled(false);
    REQUIRE(quiet.add("h", false, "", "", noop).is_ok());
}
