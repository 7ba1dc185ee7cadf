// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file test_process_runner.cpp
 * @brief PosixProcessRunner against /bin/sh
 */

#include "process_runner.h"

#include "../temp_dir_fixture.h"

#include <catch2/catch_test_macros.hpp>

using namespace hil;

namespace {

ProcessRequest shell(const std::string& script, bool capture = true) {
    ProcessRequest request;
    request.argv = {"/bin/sh", "-c", script};
    request.capture_output = capture;
    return request;
}

} // namespace

TEST_CASE("ProcessRunner: exit codes", "[process_runner]") {
    PosixProcessRunner runner;

    REQUIRE(runner.run(shell("exit 0")).success());

    auto failed = runner.run(shell("exit 3"));
    REQUIRE(failed.exit_code == 3);
    REQUIRE_FALSE(failed.success());
    REQUIRE_FALSE(failed.launch_failed);
}

TEST_CASE("ProcessRunner: captures stdout and stderr separately", "[process_runner]") {
    PosixProcessRunner runner;

    auto result = runner.run(shell("echo 'Port 1: 0100 off'; echo oops >&2"));
    REQUIRE(result.success());
    REQUIRE(result.std_out == "Port 1: 0100 off\n");
    REQUIRE(result.std_err == "oops\n");
}

TEST_CASE("ProcessRunner: output is not captured unless asked", "[process_runner]") {
    PosixProcessRunner runner;

    auto result = runner.run(shell("true", false));
    REQUIRE(result.success());
    REQUIRE(result.std_out.empty());
}

TEST_CASE("ProcessRunner: large output does not block", "[process_runner]") {
    PosixProcessRunner runner;

    auto result = runner.run(shell("i=0; while [ $i -lt 5000 ]; do echo line$i; "
                                   "echo err$i >&2; i=$((i+1)); done"));
    REQUIRE(result.success());
    REQUIRE(result.std_out.size() > 40000);
    REQUIRE(result.std_err.size() > 30000);
}

TEST_CASE_METHOD(TempDirFixture, "ProcessRunner: runs in the working directory",
                 "[process_runner]") {
    PosixProcessRunner runner;
    write_file("marker.txt", "here");

    ProcessRequest request = shell("cat marker.txt");
    request.working_dir = path();

    auto result = runner.run(request);
    REQUIRE(result.success());
    REQUIRE(result.std_out == "here");
}

TEST_CASE("ProcessRunner: launch problems", "[process_runner]") {
    PosixProcessRunner runner;

    SECTION("executable not found") {
        ProcessRequest request;
        request.argv = {"hil-runner-no-such-tool"};
        request.capture_output = true;
        REQUIRE(runner.run(request).exit_code == 127);
    }

    SECTION("working directory missing") {
        ProcessRequest request = shell("exit 0");
        request.working_dir = "/nonexistent/hil-runner";
        REQUIRE(runner.run(request).exit_code == 127);
    }

    SECTION("empty argv") {
        auto result = runner.run(ProcessRequest{});
        REQUIRE(result.launch_failed);
        REQUIRE_FALSE(result.error_message.empty());
    }
}

TEST_CASE("ProcessRunner: command line rendering", "[process_runner]") {
    REQUIRE(format_command_line({"uhubctl", "--search", "KitProg3 CMSIS-DAP"}) ==
            "uhubctl --search 'KitProg3 CMSIS-DAP'");
    REQUIRE(format_command_line({"python", ""}) == "python ''");
}
