#include "test_util.hpp"
#include "util/cli_parser.hpp"

#include <string>
#include <vector>

using namespace genotrack;

// CliParser takes a mutable argv; keep the strings alive for the call.
static CliParser make_cli(std::vector<std::string> args,
                          const std::vector<std::string>& flags = {}) {
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return CliParser(static_cast<int>(argv.size()), argv.data(), flags);
}

static void test_key_values() {
    std::fprintf(stderr, "-- test_key_values\n");

    auto cli = make_cli({"prog", "-threads", "4", "--out=x.tsv", "a.fa", "b.fa.gz"});
    CHECK_STR_EQ(cli.program(), "prog");
    CHECK(cli.has("-threads"));
    CHECK_EQ(cli.get_int("-threads"), 4);
    CHECK_STR_EQ(cli.get_string("--out"), "x.tsv");
    CHECK_EQ(cli.positional().size(), 2u);
    CHECK_STR_EQ(cli.positional()[1], "b.fa.gz");
}

static void test_flags() {
    std::fprintf(stderr, "-- test_flags\n");

    auto cli = make_cli({"prog", "-strict", "in.fa", "-v"}, {"-strict", "-v"});
    CHECK(cli.has("-strict"));
    CHECK(cli.has("-v"));
    CHECK_EQ(cli.positional().size(), 1u);
    CHECK_STR_EQ(cli.positional()[0], "in.fa");

    // Without the flag list the next argument is taken as its value
    auto greedy = make_cli({"prog", "-strict", "in.fa"});
    CHECK(greedy.positional().empty());
    CHECK_STR_EQ(greedy.get_string("-strict"), "in.fa");
}

static void test_stdin_dash_is_positional() {
    std::fprintf(stderr, "-- test_stdin_dash_is_positional\n");

    auto cli = make_cli({"prog", "-threads", "2", "-"});
    CHECK_EQ(cli.positional().size(), 1u);
    CHECK_STR_EQ(cli.positional()[0], "-");

    auto as_value = make_cli({"prog", "-in", "-"});
    CHECK_STR_EQ(as_value.get_string("-in"), "-");
}

static void test_repeated_and_defaults() {
    std::fprintf(stderr, "-- test_repeated_and_defaults\n");

    auto cli = make_cli({"prog", "-track", "a", "-track", "b", "-threads", "lots"});
    auto tracks = cli.get_strings("-track");
    CHECK_EQ(tracks.size(), 2u);
    CHECK_STR_EQ(cli.get_string("-track"), "b");
    CHECK_EQ(cli.get_int("-threads", 3), 3);
    CHECK_EQ(cli.get_int("-missing", 7), 7);
    CHECK_STR_EQ(cli.get_string("-missing", "dflt"), "dflt");
    CHECK(cli.get_strings("-missing").empty());
}

int main() {
    test_key_values();
    test_flags();
    test_stdin_dash_is_positional();
    test_repeated_and_defaults();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
