// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace hil {

/**
 * @brief A registry or test plan document could not be used
 *
 * Raised for missing files, YAML syntax errors and documents whose shape
 * does not match what the loader expects. Fatal for the run.
 */
class DocumentError : public std::runtime_error {
  public:
    DocumentError(const std::string& path, const std::string& message)
        : std::runtime_error(path.empty() ? message : path + ": " + message), path_(path) {}

    const std::string& path() const {
        return path_;
    }

  private:
    std::string path_;
};

/**
 * @brief Load a YAML document whose top level must be a sequence
 *
 * An empty file is accepted and yields an empty sequence.
 *
 * @throws DocumentError if the file is missing, unparsable or not a list
 */
YAML::Node load_yaml_list(const std::string& path);

/// Same as load_yaml_list() for in-memory content (@p origin used in messages)
YAML::Node parse_yaml_list(const std::string& content, const std::string& origin);

/**
 * @brief Read a node that may be a scalar or a list of scalars
 *
 * Missing/null => empty list, scalar => one element.
 *
 * @throws DocumentError on maps or nested lists
 */
std::vector<std::string> scalar_or_list(const YAML::Node& node, const std::string& path,
                                        const std::string& what);

} // namespace hil
