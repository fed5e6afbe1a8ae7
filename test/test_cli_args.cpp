#include "test_util.hpp"
#include "cli_args.hpp"

#include <stdexcept>
#include <string>
#include <vector>

static void parse(CliArgs& args, std::vector<std::string> words) {
    std::vector<char*> argv;
    static char prog[] = "kfe";
    argv.push_back(prog);
    for (auto& w : words) argv.push_back(&w[0]);
    args.parse(static_cast<int>(argv.size()), argv.data());
}

static void test_positionals_and_options() {
    CliArgs args({"v", "verbose"});
    parse(args, {"-v", "capture", "out.kfe", "--device", "2", "--frames", "10"});
    CHECK_EQ(args.positional().size(), 2u);
    CHECK(args.positional()[0] == "capture");
    CHECK(args.positional()[1] == "out.kfe");
    CHECK(args.has("v"));
    CHECK_EQ(args.get_int("device", 0, 0, 100), 2);
    CHECK_EQ(args.get_int("frames", 30, 0, 100), 10);
    CHECK_EQ(args.get_int("fps", 30, 1, 240), 30);
}

static void test_string_option_defaults() {
    CliArgs args({"verbose"});
    parse(args, {"display", "in.kfe", "--output", "out.h264", "--verbose"});
    CHECK(args.get("output") == "out.h264");
    CHECK(args.get("window", "KFE Display") == "KFE Display");
    CHECK(args.has("verbose"));
    CHECK(!args.has("fps"));
}

static void test_bad_numbers() {
    CliArgs args;
    parse(args, {"loopback", "--packets", "12x", "--device", "-3"});

    bool thrown = false;
    try {
        args.get_int("packets", 100, 0, 1000);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    CHECK(thrown);

    thrown = false;
    try {
        args.get_int("device", 0, 0, 10);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    CHECK(thrown);
}

static void test_missing_value() {
    CliArgs args;
    bool thrown = false;
    try {
        parse(args, {"capture", "out.kfe", "--frames"});
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    CHECK(thrown);
}

int main() {
    std::printf("test_cli_args:\n");
    test_positionals_and_options();
    test_string_option_defaults();
    test_bad_numbers();
    test_missing_value();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
