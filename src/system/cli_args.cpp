// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include "config.h"

#include <spdlog/spdlog.h>

#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace hil {

namespace {

enum class ArgMatch { NO_MATCH, CONSUMED, ERROR };

// Helper to parse integer with validation
bool parse_int(const char* str, long min_val, long max_val, int& out, const char* name) {
    char* endptr;
    long val = strtol(str, &endptr, 10);
    if (*endptr != '\0' || str[0] == '\0' || val < min_val || val > max_val) {
        printf("Error: invalid %s (must be %ld-%ld): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

bool is_flag(const char* arg, const char* short_name, const char* long_name) {
    return (short_name && strcmp(arg, short_name) == 0) || strcmp(arg, long_name) == 0;
}

/// Value following option argv[i]; advances i
const char* option_value(int argc, char** argv, int& i) {
    if (i + 1 >= argc) {
        printf("Error: %s requires an argument\n", argv[i]);
        return nullptr;
    }
    return argv[++i];
}

std::string absolute_path(const std::string& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        return path;
    }
    fs::path normal = absolute.lexically_normal();
    // "a/b/.." normalizes to "a/"
    if (!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal.string();
}

/// Options every executable understands
ArgMatch parse_common_arg(int argc, char** argv, int& i, CommonCliArgs& common) {
    const char* arg = argv[i];

    // -v, -vv, -vvv, ... (any run of v after a single dash)
    if (arg[0] == '-' && arg[1] == 'v' && strspn(arg + 1, "v") == strlen(arg + 1)) {
        common.verbosity += static_cast<int>(strlen(arg + 1));
        return ArgMatch::CONSUMED;
    }
    if (strcmp(arg, "--verbose") == 0) {
        common.verbosity++;
        return ArgMatch::CONSUMED;
    }
    if (strcmp(arg, "--config") == 0) {
        const char* value = option_value(argc, argv, i);
        if (!value)
            return ArgMatch::ERROR;
        common.config_path = value;
        return ArgMatch::CONSUMED;
    }
    if (strcmp(arg, "--log-dest") == 0) {
        const char* value = option_value(argc, argv, i);
        if (!value)
            return ArgMatch::ERROR;
        if (strcmp(value, "auto") != 0 && strcmp(value, "syslog") != 0 &&
            strcmp(value, "file") != 0 && strcmp(value, "console") != 0) {
            printf("Error: --log-dest must be one of auto, syslog, file, console\n");
            return ArgMatch::ERROR;
        }
        common.log_dest = value;
        return ArgMatch::CONSUMED;
    }
    if (strcmp(arg, "--log-file") == 0) {
        const char* value = option_value(argc, argv, i);
        if (!value)
            return ArgMatch::ERROR;
        common.log_file = value;
        return ArgMatch::CONSUMED;
    }
    return ArgMatch::NO_MATCH;
}

void print_common_help() {
    printf("  --config <path>      JSON config file (default: $%s)\n", Config::ENV_CONFIG_PATH);
    printf("  -v, --verbose        Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>    Log destination: auto, syslog, file, console\n");
    printf("  --log-file <path>    Log file path (when --log-dest=file)\n");
    printf("  -h, --help           Show this help message\n");
}

void print_runner_help(const char* program_name) {
    printf("Usage: %s [options] [test_name...]\n", program_name);
    printf("Run a MicroPython hardware-in-the-loop test plan.\n");
    printf("Without test names every test of the plan runs.\n\n");
    printf("Options:\n");
    printf("  --test-plan <path>   Test plan YAML (default: test-plan.yml next to this binary)\n");
    printf("  --hil-devs <path>    HIL device registry YAML (requires --board)\n");
    printf("  -b, --board <name>   Board under test (requires --hil-devs)\n");
    printf("  -d, --dut-port <p>   DUT serial port (default: /dev/ttyACM0)\n");
    printf("  -s, --stub-port <p>  Stub serial port (default: /dev/ttyACM1)\n");
    printf("  --max-retries <n>    Extra attempts for failing tests (default: 0)\n");
    printf("  --mpy-root-dir <p>   MicroPython root (default: two levels above this binary)\n");
    print_common_help();
    printf("\nExit status: 0 all tests passed or skipped, 1 tests failed or bad input, "
           "2 usage error\n");
}

void print_devs_query_help(const char* program_name) {
    printf("Usage: %s [options] <field>\n", program_name);
    printf("Print the <field> value of every matching device, space separated.\n\n");
    printf("Fields:");
    for (const auto& name : device_field_names()) {
        printf(" %s", name.c_str());
    }
    printf("\n\nOptions:\n");
    printf("  -f, --filter <f>...  Filter as field=value (exact) or field~=value (substring)\n");
    printf("  -y, --devs-yml <p>   Device registry YAML (default: scan serial ports)\n");
    printf("  --not-connected      Include registry devices that are not connected\n");
    print_common_help();
}

void print_switch_help(const char* program_name) {
    printf("Usage: %s [options] <command> [arguments]\n", program_name);
    printf("Control USB hub port power through uhubctl.\n\n");
    printf("Commands:\n");
    printf("  scan                       List every switchable hub/port\n");
    printf("  status <hub> <port>        Power status of one port\n");
    printf("  on|off|cycle|toggle <hub> [port]\n");
    printf("                             Apply a power action (all ports without <port>)\n");
    printf("  locate <uid>               Hub/port of the device with serial number <uid>\n");
    printf("  reset-all                  Power cycle every hub\n\n");
    printf("Options:\n");
    print_common_help();
}

} // namespace

bool parse_runner_cli_args(int argc, char** argv, RunnerCliArgs& args,
                           const std::string& exe_dir) {
    std::optional<std::string> test_plan;
    std::optional<std::string> mpy_root;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (is_flag(arg, "-h", "--help")) {
            print_runner_help(argv[0]);
            args.common.help_requested = true;
            return false;
        }

        ArgMatch common = parse_common_arg(argc, argv, i, args.common);
        if (common == ArgMatch::ERROR)
            return false;
        if (common == ArgMatch::CONSUMED)
            continue;

        if (strcmp(arg, "--test-plan") == 0) {
            const char* value = option_value(argc, argv, i);
            if (!value)
                return false;
            test_plan = value;
        } else if (strcmp(arg, "--hil-devs") == 0) {
            const char* value = option_value(argc, argv, i);
            if (!value)
                return false;
            args.hil_devs = absolute_path(value);
        } else if (is_flag(arg, "-b", "--board")) {
            const char* value = option_value(argc, argv, i);
            if (!value)
                return false;
            args.board = value;
        } else if (is_flag(arg, "-d", "--dut-port")) {
            const char* value = option_value(argc, argv, i);
            if (!value)
                return false;
            args.dut_port = value;
        } else if (is_flag(arg, "-s", "--stub-port")) {
            const char* value = option_value(argc, argv, i);
            if (!value)
                return false;
            args.stub_port = value;
        } else if (strcmp(arg, "--max-retries") == 0) {
            const char* value = option_value(argc, argv, i);
            if (!value || !parse_int(value, 0, INT_MAX, args.max_retries, "--max-retries"))
                return false;
        } else if (strcmp(arg, "--mpy-root-dir") == 0) {
            const char* value = option_value(argc, argv, i);
            if (!value)
                return false;
            mpy_root = value;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            printf("Unknown argument: %s\n", arg);
            printf("Use --help for usage information\n");
            return false;
        } else {
            args.test_names.emplace_back(arg);
        }
    }

    if (args.hil_devs) {
        if (!args.board) {
            printf("Error: --board is required when --hil-devs is provided\n");
            return false;
        }
        if (args.dut_port || args.stub_port) {
            printf("Error: --dut-port and --stub-port are not supported when --hil-devs is "
                   "provided\n");
            return false;
        }
    } else if (args.board) {
        printf("Error: --hil-devs is required when --board is provided\n");
        return false;
    }

    args.test_plan =
        absolute_path(test_plan ? *test_plan : (fs::path(exe_dir) / "test-plan.yml").string());
    args.mpy_root_dir =
        absolute_path(mpy_root ? *mpy_root : (fs::path(exe_dir) / ".." / "..").string());

    return true;
}

bool parse_devs_query_cli_args(int argc, char** argv, DevsQueryCliArgs& args) {
    bool field_seen = false;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (is_flag(arg, "-h", "--help")) {
            print_devs_query_help(argv[0]);
            args.common.help_requested = true;
            return false;
        }

        ArgMatch common = parse_common_arg(argc, argv, i, args.common);
        if (common == ArgMatch::ERROR)
            return false;
        if (common == ArgMatch::CONSUMED)
            continue;

        if (is_flag(arg, "-f", "--filter")) {
            // Accepts several filters after one -f, as well as repeated -f
            int consumed = 0;
            while (i + 1 < argc && argv[i + 1][0] != '-') {
                const char* text = argv[++i];
                auto filter = parse_field_filter(text);
                if (!filter) {
                    printf("Error: invalid filter '%s' (expected field=value or field~=value)\n",
                           text);
                    return false;
                }
                args.filters.push_back(*filter);
                consumed++;
            }
            if (consumed == 0) {
                printf("Error: %s requires an argument\n", arg);
                return false;
            }
        } else if (is_flag(arg, "-y", "--devs-yml")) {
            const char* value = option_value(argc, argv, i);
            if (!value)
                return false;
            args.devs_yml = value;
        } else if (strcmp(arg, "--not-connected") == 0) {
            args.include_not_connected = true;
        } else if (arg[0] == '-') {
            printf("Unknown argument: %s\n", arg);
            printf("Use --help for usage information\n");
            return false;
        } else if (!field_seen) {
            auto field = parse_device_field(arg);
            if (!field) {
                printf("Error: unknown field '%s'\n", arg);
                return false;
            }
            args.field = *field;
            field_seen = true;
        } else {
            printf("Error: unexpected argument: %s\n", arg);
            return false;
        }
    }

    if (!field_seen) {
        printf("Error: a field to query is required\n");
        printf("Use --help for usage information\n");
        return false;
    }
    return true;
}

bool parse_switch_cli_args(int argc, char** argv, SwitchCliArgs& args) {
    std::vector<std::string> words;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (is_flag(arg, "-h", "--help")) {
            print_switch_help(argv[0]);
            args.common.help_requested = true;
            return false;
        }

        ArgMatch common = parse_common_arg(argc, argv, i, args.common);
        if (common == ArgMatch::ERROR)
            return false;
        if (common == ArgMatch::CONSUMED)
            continue;

        if (arg[0] == '-') {
            printf("Unknown argument: %s\n", arg);
            printf("Use --help for usage information\n");
            return false;
        }
        words.emplace_back(arg);
    }

    if (words.empty()) {
        printf("Error: a command is required\n");
        printf("Use --help for usage information\n");
        return false;
    }

    const std::string& command = words[0];
    size_t params = words.size() - 1;

    if (command == "scan" || command == "reset-all") {
        if (params != 0) {
            printf("Error: %s takes no arguments\n", command.c_str());
            return false;
        }
        args.command = command == "scan" ? SwitchCommand::SCAN : SwitchCommand::RESET_ALL;
        return true;
    }

    if (command == "locate") {
        if (params != 1) {
            printf("Error: locate requires <uid>\n");
            return false;
        }
        args.command = SwitchCommand::LOCATE;
        args.uid = words[1];
        return true;
    }

    if (command == "status") {
        int port = 0;
        if (params != 2) {
            printf("Error: status requires <hub> <port>\n");
            return false;
        }
        if (!parse_int(words[2].c_str(), 0, INT_MAX, port, "port"))
            return false;
        args.command = SwitchCommand::STATUS;
        args.hub = words[1];
        args.port = port;
        return true;
    }

    auto action = parse_power_action(command);
    if (!action) {
        printf("Error: unknown command '%s'\n", command.c_str());
        printf("Use --help for usage information\n");
        return false;
    }
    if (params < 1 || params > 2) {
        printf("Error: %s requires <hub> [port]\n", command.c_str());
        return false;
    }
    args.command = SwitchCommand::ACTION;
    args.action = *action;
    args.hub = words[1];
    if (params == 2) {
        int port = 0;
        if (!parse_int(words[2].c_str(), 0, INT_MAX, port, "port"))
            return false;
        args.port = port;
    }
    return true;
}

std::string executable_dir(const char* argv0) {
    char buffer[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (len > 0) {
        buffer[len] = '\0';
        return fs::path(buffer).parent_path().string();
    }

    spdlog::debug("[CLI] /proc/self/exe unavailable, using argv[0]");
    fs::path from_argv = absolute_path(argv0 ? argv0 : ".");
    return from_argv.parent_path().string();
}

} // namespace hil
