#include <doctest/doctest.h>
#include <clawrun/clawrun.hpp>

#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

#include <chrono>

using namespace clawrun;
using namespace std::chrono_literals;
using clawrun::testing::TempTestDir;
using clawrun::testing::write_file;
using clawrun::testing::write_script;

namespace {

// A stub CLI that answers each status form the way some release did
std::string stub_cli(const TempTestDir& tmp, const std::string& rel, const std::string& cases) {
    return write_script(tmp.sub(rel),
                        "case \"$*\" in\n" + cases +
                        "  *) echo \"unknown command: $*\" >&2; exit 1 ;;\n"
                        "esac\n");
}

SearchRoots roots_for(const TempTestDir& tmp) {
    SearchRoots roots;
    roots.home = tmp.path;
    roots.version_manager_root = tmp.sub(".nvm/versions/node");
    roots.common_dirs = {tmp.sub(".local/bin")};
    return roots;
}

} // namespace

// ============================================================================
// Library End to End
// ============================================================================

TEST_CASE("status of a JSON-speaking CLI installed under a version manager") {
    TempTestDir tmp;
    stub_cli(tmp, ".nvm/versions/node/v18.20.1/bin/clawdbot",
             "  'status --json') echo '{\"gateway\":{\"state\":\"down\"}}' ;;\n");
    stub_cli(tmp, ".nvm/versions/node/v22.3.0/bin/openclaw",
             "  'status --json') cat <<'EOF'\n"
             "{\"gateway\":{\"state\":\"ok\"},\n"
             " \"channels\":[{\"channel\":\"telegram\",\"state\":\"up\"},{\"channel\":\"whatsapp\",\"state\":\"down\"}],\n"
             " \"sessions\":{\"active\":3}}\n"
             "EOF\n"
             "  ;;\n");

    auto exe = resolve_executable("clawdbot", default_cli_aliases(), roots_for(tmp));
    REQUIRE(exe.found);
    CHECK(exe.path == tmp.sub(".nvm/versions/node/v22.3.0/bin/openclaw"));

    CHECK(summarize_status(exe) == "Gateway OK \xC2\xB7 TG OK \xC2\xB7 WA DOWN \xC2\xB7 Sessions 3");
}

TEST_CASE("status of an older CLI that only prints tables") {
    TempTestDir tmp;
    stub_cli(tmp, ".local/bin/moltbot",
             "  'status') cat <<'EOF'\n"
             "Gateway: running\n"
             "Sessions: 1 active\n"
             "│ Channel  │ Enabled │ State │ Detail    │\n"
             "│ Telegram │ ON      │ OK    │ bot ready │\n"
             "│ WhatsApp │ ON      │ OFF   │ unlinked  │\n"
             "EOF\n"
             "  ;;\n");

    auto exe = resolve_executable("clawdbot", default_cli_aliases(), roots_for(tmp));
    REQUIRE(exe.found);
    CHECK(summarize_status(exe) == "Gateway OK \xC2\xB7 TG OK \xC2\xB7 WA OFF \xC2\xB7 Sessions 1");
}

TEST_CASE("status of a CLI whose plain status fails") {
    TempTestDir tmp;
    auto path = stub_cli(tmp, "bin/claw", "  'status') echo 'gateway token missing' >&2; exit 2 ;;\n");

    auto exe = resolve_executable(path, {}, roots_for(tmp));
    REQUIRE(exe.found);
    CHECK(summarize_status(exe) == "Status: gateway token missing");
}

TEST_CASE("verbose status against a real CLI") {
    TempTestDir tmp;
    auto path = stub_cli(tmp, "bin/claw", "  'status --all') echo all ;;\n");

    auto exe = resolve_executable(path, {}, roots_for(tmp));
    CHECK(verbose_status_argv(exe) == std::vector<std::string>{path, "status", "--all"});
}

// ============================================================================
// CLI Binary
// ============================================================================

#ifdef CLAWRUN_CLI_PATH

namespace {

ProcessResult run_cli(const std::vector<std::string>& args) {
    std::vector<std::string> argv = {CLAWRUN_CLI_PATH};
    argv.insert(argv.end(), args.begin(), args.end());
    return run_process(argv, 20000ms);
}

} // namespace

TEST_CASE("clawrun resolve and status with a config file") {
    TempTestDir tmp;
    auto cli = stub_cli(tmp, "bin/claw",
                        "  'status --json') echo '{\"gateway\": true, \"sessionCount\": 0}' ;;\n");
    auto config = write_file(tmp.sub("config.json"),
                             nlohmann::json{{"cli", cli}, {"terminal", "kitty"}}.dump());

    auto resolved = run_cli({"--config", config, "--json", "resolve"});
    REQUIRE(resolved.ok());
    auto j = nlohmann::json::parse(resolved.out);
    CHECK(j["found"] == true);
    CHECK(j["path"] == cli);

    auto status = run_cli({"--config", config, "status"});
    REQUIRE(status.ok());
    CHECK(status.out == "Gateway OK \xC2\xB7 TG ? \xC2\xB7 WA ? \xC2\xB7 Sessions 0\n");
}

TEST_CASE("clawrun reports a CLI that cannot be found") {
    TempTestDir tmp;
    auto config = write_file(tmp.sub("config.json"), R"({"cli": "/nonexistent/claw"})");

    auto r = run_cli({"--config", config, "status"});
    CHECK(r.outcome == ProcessOutcome::Exited);
    CHECK(r.exit_code == 1);
    CHECK(r.out == "CLI not found (/nonexistent/claw). Set 'cli' in ~/.config/claw-runner/config.json\n");
}

TEST_CASE("clawrun terminal --dry-run prints the terminal command") {
    TempTestDir tmp;
    auto config = write_file(tmp.sub("config.json"), R"({"terminal": "xterm -fa Mono"})");

    auto r = run_cli({"--config", config, "--json", "terminal", "--dry-run", "--", "echo", "hi there"});
    REQUIRE(r.ok());
    auto j = nlohmann::json::parse(r.out);
    CHECK(j["program"] == "xterm");
    REQUIRE(j["argv"].size() == 8);
    CHECK(j["argv"][1] == "-fa");
    CHECK(j["argv"][3] == "-hold");
    CHECK(j["argv"][7] == "echo 'hi there'; echo; exec \"${SHELL:-bash}\" -l");
}

#endif
