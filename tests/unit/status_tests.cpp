#include <doctest/doctest.h>
#include <clawrun/resolver.hpp>
#include <clawrun/status.hpp>

#include "test_helpers.hpp"

using namespace clawrun;
using clawrun::testing::FakeRunner;

namespace {

ResolvedExecutable found_cli() {
    return {"/opt/claw/bin/clawdbot", true, "clawdbot"};
}

const char* kJsonStatus =
    R"({"gateway":{"state":"ok"},"channels":[{"channel":"telegram","state":"up"},)"
    R"({"channel":"whatsapp","state":"down"}],"sessions":{"active":3}})";

} // namespace

// ============================================================================
// Structured Forms
// ============================================================================

TEST_CASE("summarize_status renders the first structured form") {
    FakeRunner fake;
    fake.on("/opt/claw/bin/clawdbot status --json", FakeRunner::exited(0, kJsonStatus));

    auto summary = summarize_status(found_cli(), fake.runner());
    CHECK(summary == "Gateway OK \xC2\xB7 TG OK \xC2\xB7 WA DOWN \xC2\xB7 Sessions 3");
    REQUIRE(fake.calls.size() == 1);
    CHECK(fake.timeouts[0] == kStructuredStatusTimeout);
}

TEST_CASE("summarize_status moves on to --format json") {
    FakeRunner fake;
    fake.on("/opt/claw/bin/clawdbot status --json",
            FakeRunner::exited(1, "", "error: unknown option '--json'"));
    fake.on("/opt/claw/bin/clawdbot status --format json", FakeRunner::exited(0, kJsonStatus));

    auto summary = summarize_status(found_cli(), fake.runner());
    CHECK(summary == "Gateway OK \xC2\xB7 TG OK \xC2\xB7 WA DOWN \xC2\xB7 Sessions 3");
    CHECK(fake.calls.size() == 2);
}

TEST_CASE("summarize_status skips structured forms that are not JSON objects") {
    FakeRunner fake;
    fake.on("/opt/claw/bin/clawdbot status --json", FakeRunner::exited(0, "   \n"));
    fake.on("/opt/claw/bin/clawdbot status --format json", FakeRunner::exited(0, "Gateway: OK\n"));
    fake.on("/opt/claw/bin/clawdbot status",
            FakeRunner::exited(0, "Gateway: OK\nTelegram: UP\nWhatsApp: DOWN\nSessions: 2\n"));

    auto summary = summarize_status(found_cli(), fake.runner());
    CHECK(summary == "Gateway OK \xC2\xB7 TG OK \xC2\xB7 WA DOWN \xC2\xB7 Sessions 2");
    REQUIRE(fake.calls.size() == 3);
    CHECK(fake.timeouts[2] == kPlainStatusTimeout);
}

TEST_CASE("summarize_status moves past a timed out structured form") {
    FakeRunner fake;
    fake.on("/opt/claw/bin/clawdbot status --json", FakeRunner::timed_out());
    fake.on("/opt/claw/bin/clawdbot status --format json", FakeRunner::exited(0, R"({"gateway": true})"));

    auto summary = summarize_status(found_cli(), fake.runner());
    CHECK(summary == "Gateway OK \xC2\xB7 TG ? \xC2\xB7 WA ?");
}

// ============================================================================
// Plain Fallback
// ============================================================================

TEST_CASE("summarize_status falls back to plain text") {
    FakeRunner fake;
    fake.on("/opt/claw/bin/clawdbot status",
            FakeRunner::exited(0, "Gateway: OK\nTelegram: UP\nWhatsApp: DOWN\nSessions: 2\n"));

    auto summary = summarize_status(found_cli(), fake.runner());
    CHECK(summary == "Gateway OK \xC2\xB7 TG OK \xC2\xB7 WA DOWN \xC2\xB7 Sessions 2");
}

TEST_CASE("summarize_status explains a failing plain status") {
    FakeRunner fake;

    SUBCASE("timeout") {
        fake.on("/opt/claw/bin/clawdbot status", FakeRunner::timed_out());
        CHECK(summarize_status(found_cli(), fake.runner()) == "Status: timed out after 4s");
    }

    SUBCASE("nonzero exit with stderr") {
        fake.on("/opt/claw/bin/clawdbot status",
                FakeRunner::exited(2, "partial", "  gateway token missing\n"));
        CHECK(summarize_status(found_cli(), fake.runner()) == "Status: gateway token missing");
    }

    SUBCASE("nonzero exit with stdout only") {
        fake.on("/opt/claw/bin/clawdbot status", FakeRunner::exited(2, "config invalid\n"));
        CHECK(summarize_status(found_cli(), fake.runner()) == "Status: config invalid");
    }

    SUBCASE("silent nonzero exit") {
        fake.on("/opt/claw/bin/clawdbot status", FakeRunner::exited(3, ""));
        CHECK(summarize_status(found_cli(), fake.runner()) == "Status: exit code 3");
    }

    SUBCASE("program vanished") {
        ProcessResult gone;
        gone.outcome = ProcessOutcome::NotFound;
        gone.error = "No such file or directory";
        fake.on("/opt/claw/bin/clawdbot status", gone);
        CHECK(summarize_status(found_cli(), fake.runner()) ==
              "Status: program not found (No such file or directory)");
    }
}

// ============================================================================
// Resolution Failures
// ============================================================================

TEST_CASE("summarize_status does not run a CLI that was not found") {
    FakeRunner fake;
    ResolvedExecutable missing{"nosuchcli", false, "nosuchcli"};

    auto summary = summarize_status(missing, fake.runner());
    CHECK(summary == "CLI not found (nosuchcli). Set 'cli' in ~/.config/claw-runner/config.json");
    CHECK(fake.calls.empty());
}

TEST_CASE("cli_not_found_message names the effective program for a blank reference") {
    CHECK(cli_not_found_message({"clawdbot", false, ""}) ==
          "CLI not found (clawdbot). Set 'cli' in ~/.config/claw-runner/config.json");
    CHECK(cli_not_found_message({"clawdbot", false, "  "}) ==
          "CLI not found (clawdbot). Set 'cli' in ~/.config/claw-runner/config.json");

    auto blank = resolve_executable("", {}, SearchRoots{});
    CHECK_FALSE(blank.found);
    CHECK(summarize_status(blank) ==
          "CLI not found (clawdbot). Set 'cli' in ~/.config/claw-runner/config.json");
}

TEST_CASE("summarize_status is idempotent for identical output") {
    FakeRunner fake;
    fake.on("/opt/claw/bin/clawdbot status --json", FakeRunner::exited(0, kJsonStatus));

    auto first = summarize_status(found_cli(), fake.runner());
    auto second = summarize_status(found_cli(), fake.runner());
    CHECK(first == second);
}

// ============================================================================
// Verbose Status
// ============================================================================

TEST_CASE("verbose_status_argv probes status --all") {
    FakeRunner fake;

    SUBCASE("supported") {
        fake.on("/opt/claw/bin/clawdbot status --all", FakeRunner::exited(0, "everything\n"));
        auto argv = verbose_status_argv(found_cli(), fake.runner());
        CHECK(argv == std::vector<std::string>{"/opt/claw/bin/clawdbot", "status", "--all"});
        REQUIRE(fake.timeouts.size() == 1);
        CHECK(fake.timeouts[0] == kVerboseProbeTimeout);
    }

    SUBCASE("unsupported") {
        auto argv = verbose_status_argv(found_cli(), fake.runner());
        CHECK(argv == std::vector<std::string>{"/opt/claw/bin/clawdbot", "status"});
    }

    SUBCASE("missing cli") {
        ResolvedExecutable missing{"clawdbot", false, ""};
        CHECK(verbose_status_argv(missing, fake.runner()).empty());
        CHECK(fake.calls.empty());
    }
}
