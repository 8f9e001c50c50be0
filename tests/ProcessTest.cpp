#include "TestDoubles.hpp"
#include "utils/Process.hpp"
#include "utils/Shutdown.hpp"

#include <chrono>
#include <string>
#include <thread>

#include <doctest/doctest.h>

TEST_CASE("run_command captures output and exit status")
{
    auto ok = folio::utils::run_command({"sh", "-c", "echo out; echo err >&2"});
    CHECK(ok.launched);
    CHECK(ok.exit_code == 0);
    CHECK(ok.output.find("out") != std::string::npos);
    CHECK(ok.output.find("err") != std::string::npos);

    auto failing = folio::utils::run_command({"sh", "-c", "exit 3"});
    CHECK(failing.launched);
    CHECK(failing.exit_code == 3);

    auto missing = folio::utils::run_command({"folio-no-such-tool-xyz"});
    CHECK_FALSE(missing.launched);
    CHECK(missing.output.find("command not found") != std::string::npos);
}

TEST_CASE("run_command stops a child that outlives its deadline")
{
    auto const started = std::chrono::steady_clock::now();
    auto hung = folio::utils::run_command(
        {"sh", "-c", "echo started; sleep 30"}, {},
        std::chrono::milliseconds(300));
    auto elapsed = std::chrono::steady_clock::now() - started;
    CHECK(hung.launched);
    CHECK(hung.timed_out);
    CHECK_FALSE(hung.cancelled);
    CHECK(hung.output.find("started") != std::string::npos);
    CHECK(elapsed < std::chrono::seconds(10));

    // Closing stdout does not let a child escape the deadline.
    auto detached = folio::utils::run_command(
        {"sh", "-c", "exec >/dev/null 2>&1; sleep 30"}, {},
        std::chrono::milliseconds(300));
    CHECK(detached.timed_out);

    auto quick = folio::utils::run_command({"sh", "-c", "exit 0"}, {},
                                           std::chrono::seconds(10));
    CHECK_FALSE(quick.timed_out);
    CHECK(quick.exit_code == 0);
}

TEST_CASE("run_command stops its child on a shutdown request")
{
    folio::runtime::request_shutdown();
    auto stopped = folio::utils::run_command({"sleep", "30"});
    folio::runtime::reset_shutdown();
    CHECK(stopped.cancelled);
    CHECK_FALSE(stopped.timed_out);
}

TEST_CASE("run_command honours the working directory")
{
    folio::test::ScratchDir scratch("process");
    auto result = folio::utils::run_command({"sh", "-c", "touch marker"},
                                            scratch.path());
    CHECK(result.exit_code == 0);
    CHECK(std::filesystem::exists(scratch / "marker"));
}

TEST_CASE("executables are looked up on PATH")
{
    CHECK(folio::utils::tool_available("sh"));
    CHECK_FALSE(folio::utils::tool_available("folio-no-such-tool-xyz"));
    CHECK_FALSE(folio::utils::find_executable(""));
}

TEST_CASE("ChildProcess terminates its process group")
{
    folio::utils::ChildProcess child;
    REQUIRE(child.spawn({"sleep", "30"}));
    CHECK(child.running());
    CHECK(child.pid() > 0);

    child.terminate(std::chrono::milliseconds(2000));
    CHECK_FALSE(child.running());
    child.terminate();
}

TEST_CASE("reserved loopback ports are usable numbers")
{
    auto port = folio::utils::reserve_loopback_port();
    REQUIRE(port);
    CHECK(*port > 0);
}
