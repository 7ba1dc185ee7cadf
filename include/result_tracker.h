// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file result_tracker.h
 * @brief Pass/fail/skip bookkeeping and per-test retry budget
 *
 * Retry ledger rules:
 * - first failure of a name: add to failed, ledger entry = max_retries
 * - later failure of the same name: decrement its ledger entry
 * - pass: drop from failed and from the ledger, add to passed (once)
 * - skip: terminal, never retried. A name already in failed stays in
 *   failed (its ledger entry is dropped) and is not added to skipped, so
 *   the three name lists stay disjoint and the loop converges.
 *
 * The next pass runs exactly the tests whose ledger entry is still > 0.
 */

#include "test_catalog.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hil {

class ResultTracker {
  public:
    explicit ResultTracker(int max_retries);

    void register_skip(const std::string& test_name);
    void register_fail(const std::string& test_name);
    void register_pass(const std::string& test_name);

    /// Subset of @p tests (order kept) that still has retries left
    std::vector<TestCase> filter_retries(const std::vector<TestCase>& tests) const;

    /// Remaining retries for @p test_name, std::nullopt without a ledger entry
    std::optional<int> remaining_retries(const std::string& test_name) const;

    const std::vector<std::string>& passed() const {
        return passed_;
    }
    const std::vector<std::string>& failed() const {
        return failed_;
    }
    const std::vector<std::string>& skipped() const {
        return skipped_;
    }

  private:
    int max_retries_;
    std::vector<std::string> passed_;
    std::vector<std::string> failed_;
    std::vector<std::string> skipped_;
    std::map<std::string, int> retry_ledger_;
};

} // namespace hil
