// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file test_plan_runner.cpp
 * @brief Plan execution: availability gate, power resets and retry passes
 */

#include "plan_runner.h"

#include "../mocks/fake_test_executor.h"
#include "../mocks/mock_process_runner.h"

#include <catch2/catch_test_macros.hpp>

#include <map>

using namespace std::chrono_literals;

namespace {

/// Resolver returning preset devices per test name, empty devices otherwise
class FakeDeviceResolver : public DeviceResolver {
  public:
    ResolvedDevices resolve(const TestCase& test) override {
        resolve_count_++;
        auto it = devices_.find(test.name);
        return it == devices_.end() ? ResolvedDevices{} : it->second;
    }

    void set(const std::string& test_name, ResolvedDevices devices) {
        devices_[test_name] = std::move(devices);
    }

    int resolve_count() const {
        return resolve_count_;
    }

  private:
    std::map<std::string, ResolvedDevices> devices_;
    int resolve_count_ = 0;
};

Device connected(const std::string& name, const std::string& address) {
    Device device;
    device.name = name;
    device.access = SerialAccess{address};
    return device;
}

Device switched(const std::string& name, const std::string& address, const std::string& hub,
                int port) {
    Device device = connected(name, address);
    device.power_switch = SwitchRef{hub, port};
    return device;
}

TestCase make_test(const std::string& name, TestType type = TestType::SINGLE) {
    TestCase test;
    test.name = name;
    test.type = type;
    test.scripts = {name + ".py"};
    return test;
}

std::string port_line(int port, bool on) {
    return "Current status for hub 1-1 [USB2 hub]\n  Port " + std::to_string(port) +
           (on ? ": 0103 power enable connect [KitProg3]\n" : ": 0100 off\n");
}

} // namespace

class PlanRunnerFixture {
  protected:
    PlanRunnerFixture()
        : power(runner),
          plan_runner(resolver, executor, power, ResetSettings{3, 100ms, 2000ms},
                      [this](std::chrono::milliseconds delay) { sleeps.push_back(delay); }) {}

    MockProcessRunner runner;
    FakeDeviceResolver resolver;
    FakeTestExecutor executor;
    PowerController power;
    std::vector<std::chrono::milliseconds> sleeps;
    PlanRunner plan_runner;
};

// ============================================================================
// Availability and results
// ============================================================================

TEST_CASE_METHOD(PlanRunnerFixture, "PlanRunner: unavailable test is skipped, others run",
                 "[plan_runner]") {
    resolver.set("T2", {connected("board", "/dev/ttyACM0"), Device{}});

    auto result = plan_runner.run({make_test("T1"), make_test("T2")}, 1);

    REQUIRE(result.skipped == std::vector<std::string>{"T1"});
    REQUIRE(result.passed == std::vector<std::string>{"T2"});
    REQUIRE(result.failed.empty());
    REQUIRE(result.passes == 1);
    REQUIRE(result.exit_code() == 0);
    REQUIRE(executor.call_count("T1") == 0);
    REQUIRE(executor.calls()[0].dut_port == "/dev/ttyACM0");
    REQUIRE_FALSE(executor.calls()[0].stub_port.has_value());
}

TEST_CASE_METHOD(PlanRunnerFixture, "PlanRunner: multi-board tests need both devices",
                 "[plan_runner]") {
    SECTION("missing stub skips") {
        resolver.set("net", {connected("board", "/dev/ttyACM0"), Device{}});
        auto result = plan_runner.run({make_test("net", TestType::MULTI)}, 1);
        REQUIRE(result.skipped == std::vector<std::string>{"net"});
        REQUIRE(executor.calls().empty());
    }

    SECTION("both present passes the stub port") {
        resolver.set("net", {connected("board", "/dev/ttyACM0"),
                             connected("board", "/dev/ttyACM1")});
        auto result = plan_runner.run({make_test("net", TestType::MULTI_STUB)}, 0);
        REQUIRE(result.passed == std::vector<std::string>{"net"});
        REQUIRE(executor.calls()[0].stub_port == std::string("/dev/ttyACM1"));
    }
}

TEST_CASE_METHOD(PlanRunnerFixture, "PlanRunner: single test ignores an extra stub",
                 "[plan_runner]") {
    resolver.set("solo", {connected("board", "/dev/ttyACM0"), Device{}});
    REQUIRE(plan_runner.run({make_test("solo")}, 0).exit_code() == 0);
}

// ============================================================================
// Retries
// ============================================================================

TEST_CASE_METHOD(PlanRunnerFixture, "PlanRunner: always failing test exhausts its retries",
                 "[plan_runner]") {
    resolver.set("T3", {connected("board", "/dev/ttyACM0"), Device{}});
    executor.set_exit_codes("T3", {1});

    auto result = plan_runner.run({make_test("T3")}, 2);

    REQUIRE(result.passes == 3);
    REQUIRE(executor.call_count("T3") == 3);
    REQUIRE(result.failed == std::vector<std::string>{"T3"});
    REQUIRE(result.exit_code() == 1);
}

TEST_CASE_METHOD(PlanRunnerFixture, "PlanRunner: flaky test passes on retry", "[plan_runner]") {
    resolver.set("flaky", {connected("board", "/dev/ttyACM0"), Device{}});
    resolver.set("stable", {connected("board", "/dev/ttyACM0"), Device{}});
    executor.set_exit_codes("flaky", {1, 0});

    auto result = plan_runner.run({make_test("flaky"), make_test("stable")}, 3);

    REQUIRE(result.passes == 2);
    REQUIRE(executor.call_count("stable") == 1);
    REQUIRE(executor.call_count("flaky") == 2);
    REQUIRE(result.failed.empty());
    REQUIRE(result.passed == std::vector<std::string>{"stable", "flaky"});
    REQUIRE(result.exit_code() == 0);
}

TEST_CASE_METHOD(PlanRunnerFixture, "PlanRunner: board lost after a failure is not retried",
                 "[plan_runner]") {
    resolver.set("T", {connected("board", "/dev/ttyACM0"), Device{}});
    executor.set_exit_codes("T", {1});
    // Board disappears once the first attempt has run
    executor.on_run([this](const std::string&) { resolver.set("T", ResolvedDevices{}); });

    auto result = plan_runner.run({make_test("T")}, 3);

    REQUIRE(result.passes == 2);
    REQUIRE(resolver.resolve_count() == 2);
    REQUIRE(executor.call_count("T") == 1);
    REQUIRE(result.failed == std::vector<std::string>{"T"});
    REQUIRE(result.skipped.empty());
    REQUIRE(result.passed.empty());
    REQUIRE(result.exit_code() == 1);
}

TEST_CASE_METHOD(PlanRunnerFixture, "PlanRunner: no retries means a single pass",
                 "[plan_runner]") {
    resolver.set("T", {connected("board", "/dev/ttyACM0"), Device{}});
    executor.set_exit_codes("T", {3});

    auto result = plan_runner.run({make_test("T")}, 0);
    REQUIRE(result.passes == 1);
    REQUIRE(result.exit_code() == 1);
}

TEST_CASE_METHOD(PlanRunnerFixture, "PlanRunner: empty plan", "[plan_runner]") {
    auto result = plan_runner.run({}, 2);
    REQUIRE(result.passes == 0);
    REQUIRE(result.exit_code() == 0);
    REQUIRE(resolver.resolve_count() == 0);
}

// ============================================================================
// Power reset
// ============================================================================

TEST_CASE_METHOD(PlanRunnerFixture, "PlanRunner: device without switch is not reset",
                 "[plan_runner]") {
    plan_runner.reset_device(connected("board", "/dev/ttyACM0"));
    REQUIRE(runner.requests().empty());
    REQUIRE(sleeps.empty());
}

TEST_CASE_METHOD(PlanRunnerFixture, "PlanRunner: reset polls until connected then settles",
                 "[plan_runner]") {
    int status_queries = 0;
    runner.set_handler([&](const ProcessRequest& request) {
        if (request.argv.size() > 1 && request.argv[1] == "--action") {
            return MockProcessRunner::exit_code(0);
        }
        status_queries++;
        return MockProcessRunner::output(port_line(2, status_queries >= 3));
    });

    plan_runner.reset_device(switched("board", "/dev/ttyACM0", "1-1", 2));

    auto commands = runner.commands();
    REQUIRE(commands[0] == std::vector<std::string>{"uhubctl", "--action", "cycle",
                                                    "--location", "1-1", "--port", "2"});
    REQUIRE(status_queries == 3);
    REQUIRE(sleeps == std::vector<std::chrono::milliseconds>{100ms, 100ms, 2000ms});
}

TEST_CASE_METHOD(PlanRunnerFixture, "PlanRunner: reset poll is bounded", "[plan_runner]") {
    int status_queries = 0;
    runner.set_handler([&](const ProcessRequest& request) {
        if (request.argv.size() > 1 && request.argv[1] == "--action") {
            return MockProcessRunner::exit_code(0);
        }
        status_queries++;
        return MockProcessRunner::output(port_line(2, false));
    });

    plan_runner.reset_device(switched("board", "/dev/ttyACM0", "1-1", 2));

    REQUIRE(status_queries == 4);
    REQUIRE(sleeps == std::vector<std::chrono::milliseconds>{100ms, 100ms, 100ms, 2000ms});
}

TEST_CASE_METHOD(PlanRunnerFixture, "PlanRunner: DUT and stub are reset before the test",
                 "[plan_runner]") {
    runner.set_handler([](const ProcessRequest& request) {
        if (request.argv.size() > 1 && request.argv[1] == "--action") {
            return MockProcessRunner::exit_code(0);
        }
        std::string port = request.argv.back();
        return MockProcessRunner::output(port_line(std::stoi(port), true));
    });
    resolver.set("uart", {switched("dut", "/dev/ttyACM0", "1-1", 1),
                          switched("stub", "/dev/ttyACM1", "1-1", 3)});

    auto result = plan_runner.run({make_test("uart", TestType::MULTI_STUB)}, 0);

    REQUIRE(result.exit_code() == 0);
    auto commands = runner.commands();
    REQUIRE(commands.size() == 4);
    REQUIRE(commands[0].back() == "1");
    REQUIRE(commands[2].back() == "3");
    REQUIRE(sleeps == std::vector<std::chrono::milliseconds>{2000ms, 2000ms});
}
