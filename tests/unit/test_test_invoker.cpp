// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file test_test_invoker.cpp
 * @brief Command lines built for each test type
 */

#include "test_invoker.h"

#include "../mocks/mock_process_runner.h"
#include "../temp_dir_fixture.h"

#include <catch2/catch_test_macros.hpp>

using namespace std::chrono_literals;

namespace {

using Argv = std::vector<std::string>;

TestCase make_test(const std::string& name, TestType type, std::vector<std::string> scripts) {
    TestCase test;
    test.name = name;
    test.type = type;
    test.scripts = std::move(scripts);
    return test;
}

} // namespace

class TestInvokerFixture : public TempDirFixture {
  protected:
    TestInvokerFixture()
        : invoker(runner, InvokerSettings{"python3", make_dir("micropython/tests")},
                  [this](std::chrono::milliseconds delay) { sleeps.push_back(delay); }) {
        write_file("micropython/tests/basics/b.py", "");
        write_file("micropython/tests/basics/a.py", "");
        write_file("micropython/tests/basics/sub/c.py", "");
        write_file("micropython/tests/basics/notes.txt", "");
    }

    std::string tests_dir() const {
        return path("micropython/tests");
    }

    MockProcessRunner runner;
    std::vector<std::chrono::milliseconds> sleeps;
    TestInvoker invoker;
};

// ============================================================================
// single
// ============================================================================

TEST_CASE_METHOD(TestInvokerFixture, "TestInvoker: single marks directories and excludes",
                 "[test_invoker]") {
    auto test = make_test("basics", TestType::SINGLE, {"basics", "misc/print.py"});
    test.excludes = {"basics/a.py"};

    REQUIRE(invoker.run(test, "/dev/ttyACM0", std::nullopt) == 0);

    REQUIRE(runner.requests().size() == 1);
    const ProcessRequest& request = runner.requests()[0];
    REQUIRE(request.argv == Argv{"python3", "run-tests.py", "-t", "port:/dev/ttyACM0", "-d",
                                 "basics", "misc/print.py", "-e", "basics/a.py"});
    REQUIRE(request.working_dir == tests_dir());
    REQUIRE_FALSE(request.capture_output);
}

TEST_CASE_METHOD(TestInvokerFixture, "TestInvoker: single failure prints and cleans failures",
                 "[test_invoker]") {
    runner.queue_result(MockProcessRunner::exit_code(1));
    runner.queue_result(MockProcessRunner::exit_code(0));
    runner.queue_result(MockProcessRunner::exit_code(2));

    auto test = make_test("pin", TestType::SINGLE, {"ports/pin.py"});
    REQUIRE(invoker.run(test, "/dev/ttyACM0", std::nullopt) == 1);

    auto commands = runner.commands();
    REQUIRE(commands.size() == 3);
    REQUIRE(commands[1] == Argv{"python3", "run-tests.py", "--print-failures"});
    REQUIRE(commands[2] == Argv{"python3", "run-tests.py", "--clean-failures"});
}

TEST_CASE_METHOD(TestInvokerFixture, "TestInvoker: launch failure and signals count as failure",
                 "[test_invoker]") {
    auto test = make_test("pin", TestType::SINGLE, {"ports/pin.py"});

    SECTION("launch failure") {
        runner.queue_result(MockProcessRunner::launch_failure("fork failed"));
        REQUIRE(invoker.run(test, "/dev/ttyACM0", std::nullopt) == 1);
    }

    SECTION("killed by signal") {
        runner.queue_result(MockProcessRunner::exit_code(-1));
        REQUIRE(invoker.run(test, "/dev/ttyACM0", std::nullopt) == 1);
    }
}

// ============================================================================
// single_post_delay
// ============================================================================

TEST_CASE_METHOD(TestInvokerFixture, "TestInvoker: directories expand to sorted .py files",
                 "[test_invoker]") {
    auto scripts = invoker.expand_scripts({"basics", "other/x.py"});
    REQUIRE(scripts == Argv{"basics/a.py", "basics/b.py", "basics/sub/c.py", "other/x.py"});
}

TEST_CASE_METHOD(TestInvokerFixture, "TestInvoker: post delay runs one script at a time",
                 "[test_invoker]") {
    auto test = make_test("delayed", TestType::SINGLE_POST_DELAY, {"basics"});
    test.post_test_delay_ms = 250;
    test.excludes = {"basics/b.py"};

    REQUIRE(invoker.run(test, "/dev/ttyACM1", std::nullopt) == 0);

    auto commands = runner.commands();
    REQUIRE(commands.size() == 2);
    REQUIRE(commands[0] == Argv{"python3", "run-tests.py", "-t", "port:/dev/ttyACM1",
                                "basics/a.py"});
    REQUIRE(commands[1].back() == "basics/sub/c.py");
    REQUIRE(sleeps == std::vector<std::chrono::milliseconds>{250ms, 250ms});
}

TEST_CASE_METHOD(TestInvokerFixture, "TestInvoker: post delay stops at the first failure",
                 "[test_invoker]") {
    runner.queue_result(MockProcessRunner::exit_code(0));
    runner.queue_result(MockProcessRunner::exit_code(1));

    auto test = make_test("delayed", TestType::SINGLE_POST_DELAY, {"basics"});
    test.post_test_delay_ms = 100;

    REQUIRE(invoker.run(test, "/dev/ttyACM1", std::nullopt) == 1);

    auto commands = runner.commands();
    // a.py, b.py (fails), then the two failure report commands
    REQUIRE(commands.size() == 4);
    REQUIRE(commands[1].back() == "basics/b.py");
    REQUIRE(sleeps.size() == 1);
}

// ============================================================================
// multi and multi_stub
// ============================================================================

TEST_CASE_METHOD(TestInvokerFixture, "TestInvoker: multi passes both targets",
                 "[test_invoker]") {
    auto test = make_test("net", TestType::MULTI, {"multi_net/tcp.py"});

    REQUIRE(invoker.run(test, "/dev/ttyACM0", std::string("/dev/ttyACM1")) == 0);
    REQUIRE(runner.commands()[0] == Argv{"python3", "run-multitests.py", "-t", "/dev/ttyACM0",
                                         "-t", "/dev/ttyACM1", "multi_net/tcp.py"});
}

TEST_CASE_METHOD(TestInvokerFixture, "TestInvoker: multi without stub port fails",
                 "[test_invoker]") {
    auto test = make_test("net", TestType::MULTI, {"multi_net/tcp.py"});
    REQUIRE(invoker.run(test, "/dev/ttyACM0", std::nullopt) == 1);
    REQUIRE(runner.requests().empty());
}

TEST_CASE_METHOD(TestInvokerFixture, "TestInvoker: multi_stub starts the stub first",
                 "[test_invoker]") {
    auto test = make_test("uart", TestType::MULTI_STUB, {"ports/uart.py"});
    test.stub_script = "ports/uart_stub.py";
    test.post_stub_delay_ms = 1000;

    REQUIRE(invoker.run(test, "/dev/ttyACM0", std::string("/dev/ttyACM1")) == 0);

    auto commands = runner.commands();
    REQUIRE(commands.size() == 2);
    std::string mpremote =
        (fs::path(tests_dir()) / ".." / "tools" / "mpremote" / "mpremote.py").string();
    REQUIRE(commands[0] == Argv{mpremote, "connect", "/dev/ttyACM1", "run", "--no-follow",
                                "ports/uart_stub.py"});
    REQUIRE(commands[1] == Argv{"python3", "run-tests.py", "-t", "port:/dev/ttyACM0",
                                "ports/uart.py"});
    REQUIRE(sleeps == std::vector<std::chrono::milliseconds>{1000ms});
}

TEST_CASE_METHOD(TestInvokerFixture, "TestInvoker: failed stub skips the DUT run",
                 "[test_invoker]") {
    runner.queue_result(MockProcessRunner::exit_code(4));

    auto test = make_test("uart", TestType::MULTI_STUB, {"ports/uart.py"});
    test.stub_script = "ports/uart_stub.py";

    REQUIRE(invoker.run(test, "/dev/ttyACM0", std::string("/dev/ttyACM1")) == 4);
    REQUIRE(runner.requests().size() == 1);
}

// ============================================================================
// custom
// ============================================================================

TEST_CASE_METHOD(TestInvokerFixture, "TestInvoker: custom runs every script",
                 "[test_invoker]") {
    runner.queue_result(MockProcessRunner::exit_code(3));
    runner.queue_result(MockProcessRunner::exit_code(0));

    auto test = make_test("fs", TestType::CUSTOM, {"custom/fs.py", "custom/vfs.py"});
    test.custom_args = {"--small", "-v"};

    REQUIRE(invoker.run(test, "/dev/ttyACM0", std::nullopt) == 1);

    auto commands = runner.commands();
    REQUIRE(commands.size() == 2);
    REQUIRE(commands[0] == Argv{"python3", "custom/fs.py", "/dev/ttyACM0", "--small", "-v"});
    REQUIRE(commands[1] == Argv{"python3", "custom/vfs.py", "/dev/ttyACM0", "--small", "-v"});
}
