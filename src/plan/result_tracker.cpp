// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "result_tracker.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace hil {

namespace {

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace

ResultTracker::ResultTracker(int max_retries) : max_retries_(std::max(0, max_retries)) {}

void ResultTracker::register_skip(const std::string& test_name) {
    // A failed test whose board vanished keeps its failure and is not retried
    retry_ledger_.erase(test_name);
    if (contains(failed_, test_name)) {
        spdlog::debug("[ResultTracker] {} unavailable after a failure, retries dropped",
                      test_name);
        return;
    }

    if (!contains(skipped_, test_name)) {
        skipped_.push_back(test_name);
    }
}

void ResultTracker::register_fail(const std::string& test_name) {
    if (!contains(failed_, test_name)) {
        failed_.push_back(test_name);
        retry_ledger_[test_name] = max_retries_;
        return;
    }

    auto it = retry_ledger_.find(test_name);
    if (it != retry_ledger_.end()) {
        --it->second;
        spdlog::debug("[ResultTracker] {} failed again, {} retries left", test_name, it->second);
    }
}

void ResultTracker::register_pass(const std::string& test_name) {
    auto it = std::find(failed_.begin(), failed_.end(), test_name);
    if (it != failed_.end()) {
        failed_.erase(it);
        retry_ledger_.erase(test_name);
    }

    if (!contains(passed_, test_name)) {
        passed_.push_back(test_name);
    }
}

std::vector<TestCase> ResultTracker::filter_retries(const std::vector<TestCase>& tests) const {
    std::vector<TestCase> retries;
    for (const auto& test : tests) {
        auto it = retry_ledger_.find(test.name);
        if (it != retry_ledger_.end() && it->second > 0) {
            retries.push_back(test);
        }
    }
    return retries;
}

std::optional<int> ResultTracker::remaining_retries(const std::string& test_name) const {
    auto it = retry_ledger_.find(test_name);
    if (it == retry_ledger_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace hil
