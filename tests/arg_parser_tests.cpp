#include "arg_parser.hpp"
#include "test_common.hpp"

TEST_CASE("ArgParser basic parsing") {
    const char* argv[] = {"prog", "--foo", "--opt", "42", "pos", "--unknown"};
    ArgParser parser(6, const_cast<char**>(argv), {"--foo", "--bar", "--opt"});
    REQUIRE(parser.has_flag("--foo"));
    REQUIRE(parser.get_option("--opt") == "42");
    REQUIRE(parser.positional().size() == 1);
    REQUIRE(parser.positional()[0] == "pos");
    REQUIRE(parser.unknown_flags().size() == 1);
    REQUIRE(parser.unknown_flags()[0] == "--unknown");
}

TEST_CASE("ArgParser option with equals") {
    const char* argv[] = {"prog", "--remote-url=https://example.com/m.git"};
    ArgParser parser(2, const_cast<char**>(argv), {"--remote-url"});
    REQUIRE(parser.has_flag("--remote-url"));
    REQUIRE(parser.get_option("--remote-url") == "https://example.com/m.git");
}

TEST_CASE("ArgParser switches keep commands positional") {
    const char* argv[] = {"prog", "--json", "status", "--enable-sync", "sync", "m1", "m1.md"};
    ArgParser parser(7, const_cast<char**>(argv), {"--json", "--enable-sync"},
                     {"--json", "--enable-sync"});
    REQUIRE(parser.has_flag("--json"));
    REQUIRE(parser.get_option("--json").empty());
    REQUIRE(parser.has_flag("--enable-sync"));
    REQUIRE(parser.positional() == std::vector<std::string>{"status", "sync", "m1", "m1.md"});
}

TEST_CASE("ArgParser without switches lets flags swallow a value") {
    const char* argv[] = {"prog", "--json", "status"};
    ArgParser parser(3, const_cast<char**>(argv), {"--json"});
    REQUIRE(parser.get_option("--json") == "status");
    REQUIRE(parser.positional().empty());
}

TEST_CASE("ArgParser short options") {
    const char* argv[] = {"prog", "-h", "-r", "/tmp/remote.git", "-j", "branch"};
    ArgParser parser(6, const_cast<char**>(argv), {"--help", "--remote-url", "--json"},
                     {"--help", "--json"},
                     {{'h', "--help"}, {'r', "--remote-url"}, {'j', "--json"}});
    REQUIRE(parser.has_flag("--help"));
    REQUIRE(parser.get_option("--remote-url") == "/tmp/remote.git");
    REQUIRE(parser.has_flag("--json"));
    REQUIRE(parser.positional() == std::vector<std::string>{"branch"});
}

TEST_CASE("ArgParser unknown flag detection") {
    const char* argv[] = {"prog", "--foo", "-x", "-abc"};
    ArgParser parser(4, const_cast<char**>(argv), {"--bar"}, {}, {{'a', "--bar"}});
    REQUIRE_FALSE(parser.has_flag("--foo"));
    REQUIRE(parser.positional().empty());
    REQUIRE(parser.unknown_flags() == std::vector<std::string>{"--foo", "-x", "-abc"});
}

TEST_CASE("ArgParser unknown flag with value still consumes it") {
    const char* argv[] = {"prog", "--mystery", "value", "status"};
    ArgParser parser(4, const_cast<char**>(argv), {"--json"});
    REQUIRE(parser.unknown_flags() == std::vector<std::string>{"--mystery"});
    REQUIRE(parser.positional() == std::vector<std::string>{"status"});
}

TEST_CASE("ArgParser double dash ends options") {
    const char* argv[] = {"prog", "--verbose", "--", "sync", "--weird-id", "-file.md"};
    ArgParser parser(6, const_cast<char**>(argv), {"--verbose"}, {"--verbose"});
    REQUIRE(parser.has_flag("--verbose"));
    REQUIRE(parser.unknown_flags().empty());
    REQUIRE(parser.positional() ==
            std::vector<std::string>{"sync", "--weird-id", "-file.md"});
}

TEST_CASE("ArgParser accepts everything without a known list") {
    const char* argv[] = {"prog", "--anything", "1", "--else"};
    ArgParser parser(4, const_cast<char**>(argv));
    REQUIRE(parser.get_option("--anything") == "1");
    REQUIRE(parser.has_flag("--else"));
    REQUIRE(parser.unknown_flags().empty());
    REQUIRE(parser.flags().size() == 2);
    REQUIRE(parser.options().size() == 1);
}
