#include <catch2/catch.hpp>
#include <relpack/git.hpp>
#include "test_helpers.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace relpack;
using relpack::testing::CapturedLog;
using relpack::testing::FakeRunner;
using relpack::testing::TempDir;

// ===== run_command =====

TEST_CASE("run_command captures stdout and exit code", "[git]") {
    auto r = run_command({"sh", "-c", "echo out; echo err >&2; exit 3"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 3);
    REQUIRE(r.value().stdout_str == "out\n");
    REQUIRE(r.value().stderr_str == "err\n");
}

TEST_CASE("run_command honours the working directory", "[git]") {
    TempDir tmp;
    auto r = run_command({"pwd"}, tmp.path().string());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str.find(tmp.path().filename().string()) != std::string::npos);
}

TEST_CASE("run_command reports a missing executable as 127", "[git]") {
    auto r = run_command({"relpack-no-such-tool-xyz"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 127);
}

TEST_CASE("run_command kills a command that runs too long", "[git]") {
    auto start = std::chrono::steady_clock::now();
    auto r = run_command({"sleep", "30"}, "", 1);
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == RelpackError::Timeout);
    REQUIRE(elapsed < std::chrono::seconds(10));
}

TEST_CASE("run_command handles output larger than a pipe buffer", "[git]") {
    auto r = run_command({"sh", "-c", "head -c 200000 /dev/zero | tr '\\0' x"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str.size() == 200000);
}

TEST_CASE("run_command rejects empty args", "[git]") {
    auto r = run_command({});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == RelpackError::InvalidArg);
}

// ===== run_checked =====

TEST_CASE("run_checked turns a non-zero exit into ExternalTool", "[git]") {
    FakeRunner runner;
    runner.on({"goreleaser"}, 1, "", "line1\nline2\nline3\nline4\nline5\nline6\nline7\n");
    auto r = run_checked(runner, {"goreleaser", "release"}, "", 10);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == RelpackError::ExternalTool);
    REQUIRE(r.error().message.find("goreleaser release exited with status 1") == 0);
    REQUIRE(r.error().message.find("line7") != std::string::npos);
    REQUIRE(r.error().message.find("line3") != std::string::npos);
    REQUIRE(r.error().message.find("line2") == std::string::npos);
}

TEST_CASE("describe_command joins arguments", "[git]") {
    REQUIRE(describe_command({"git", "tag", "-d", "v1.0.0"}) == "git tag -d v1.0.0");
}

// ===== Tags =====

TEST_CASE("parse_tag_list keeps strict release tags in order", "[git]") {
    auto tags = parse_tag_list("v1.10.0\nv1.9.0\n  v1.2.0-SNAPSHOT\nnightly\nv1.2\n\nv0.1.0\r\n");
    REQUIRE(tags == std::vector<std::string>{"v1.10.0", "v1.9.0", "v0.1.0"});
}

TEST_CASE("GitCli issues the expected commands", "[git]") {
    FakeRunner runner;
    runner.on({"git", "tag", "-l"}, 0, "v2.0.0\nv1.0.0\n");
    runner.on({"git", "rev-parse", "--short"}, 0, "abc1234\n");
    GitCli git(runner, "/repo", 15);

    REQUIRE(git.is_repository().value());
    REQUIRE(git.create_tag("v1.0.0").is_ok());
    REQUIRE(git.list_release_tags().value() == std::vector<std::string>{"v2.0.0", "v1.0.0"});
    REQUIRE(git.short_head().value() == "abc1234");

    REQUIRE(runner.calls[1] == std::vector<std::string>{"git", "tag", "v1.0.0"});
    REQUIRE(runner.dirs[1] == "/repo");
    REQUIRE(runner.timeouts[1] == 15);
}

TEST_CASE("GitCli failures carry stderr and hints", "[git]") {
    FakeRunner runner;
    runner.on({"git", "rev-parse", "--git-dir"}, 128, "", "fatal: not a git repository");
    runner.on({"git", "tag", "-d"}, 1, "", "error: tag 'v1.0.0' not found.");
    runner.on({"git", "rev-parse", "-q"}, 1);
    GitCli git(runner, ".");

    REQUIRE_FALSE(git.is_repository().value());
    REQUIRE_FALSE(git.tag_exists("v1.0.0").value());

    auto del = git.delete_tag("v1.0.0");
    REQUIRE(del.is_err());
    REQUIRE(del.error().code == RelpackError::ExternalTool);
    REQUIRE(del.error().hint == "remove it manually with: git tag -d v1.0.0");
}

// ===== TemporaryTag =====

TEST_CASE("TemporaryTag release deletes the tag once", "[git]") {
    FakeRunner runner;
    CapturedLog log;
    GitCli git(runner, ".");

    auto tag = TemporaryTag::create(git, "v1.2.3", log.logger());
    REQUIRE(tag.is_ok());
    REQUIRE(tag.value().active());
    REQUIRE(runner.called({"git", "tag", "v1.2.3"}));

    REQUIRE(tag.value().release().is_ok());
    REQUIRE_FALSE(tag.value().active());
    REQUIRE(tag.value().release().is_ok());
    REQUIRE(runner.count({"git", "tag", "-d", "v1.2.3"}) == 1);
}

TEST_CASE("TemporaryTag is removed when it goes out of scope", "[git]") {
    FakeRunner runner;
    CapturedLog log;
    GitCli git(runner, ".");
    {
        auto tag = TemporaryTag::create(git, "v0.1.0", log.logger());
        REQUIRE(tag.is_ok());
        TemporaryTag moved = std::move(tag).value();
        REQUIRE(moved.active());
    }
    REQUIRE(runner.count({"git", "tag", "-d", "v0.1.0"}) == 1);
}

TEST_CASE("TemporaryTag destructor reports a failed delete", "[git]") {
    FakeRunner runner;
    runner.on({"git", "tag", "-d"}, 1, "", "permission denied");
    CapturedLog log;
    GitCli git(runner, ".");
    {
        auto tag = TemporaryTag::create(git, "v3.0.0", log.logger());
        REQUIRE(tag.is_ok());
    }
    REQUIRE(log.contains("git tag -d v3.0.0 failed"));
    REQUIRE(log.contains("remove it manually"));
}

TEST_CASE("TemporaryTag::create fails when the tag cannot be created", "[git]") {
    FakeRunner runner;
    runner.on({"git", "tag", "v1.0.0"}, 128, "", "fatal: tag 'v1.0.0' already exists");
    CapturedLog log;
    GitCli git(runner, ".");

    auto tag = TemporaryTag::create(git, "v1.0.0", log.logger());
    REQUIRE(tag.is_err());
    REQUIRE_FALSE(runner.called({"git", "tag", "-d"}));
}
