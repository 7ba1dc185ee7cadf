// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <functional>
#include <thread>

namespace hil {

/// Blocking delay hook; tests substitute a recorder for the real sleep
using SleepFunction = std::function<void(std::chrono::milliseconds)>;

inline SleepFunction real_sleep() {
    return [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
}

} // namespace hil
