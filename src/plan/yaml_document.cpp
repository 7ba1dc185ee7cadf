// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "yaml_document.h"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace hil {

namespace {

YAML::Node require_list(const YAML::Node& root, const std::string& origin) {
    if (!root || root.IsNull()) {
        return YAML::Node(YAML::NodeType::Sequence);
    }
    if (!root.IsSequence()) {
        throw DocumentError(origin, "top level must be a list");
    }
    return root;
}

} // namespace

YAML::Node load_yaml_list(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw DocumentError(path, "file does not exist");
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw DocumentError(path, "unable to open file");
    } catch (const YAML::Exception& e) {
        throw DocumentError(path, std::string("invalid YAML: ") + e.what());
    }

    spdlog::debug("[YamlDocument] Loaded {}", path);
    return require_list(root, path);
}

YAML::Node parse_yaml_list(const std::string& content, const std::string& origin) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        throw DocumentError(origin, std::string("invalid YAML: ") + e.what());
    }
    return require_list(root, origin);
}

std::vector<std::string> scalar_or_list(const YAML::Node& node, const std::string& path,
                                        const std::string& what) {
    std::vector<std::string> values;
    if (!node || node.IsNull()) {
        return values;
    }

    if (node.IsScalar()) {
        values.push_back(node.as<std::string>());
        return values;
    }

    if (!node.IsSequence()) {
        throw DocumentError(path, what + " must be a string or a list of strings");
    }

    for (const auto& item : node) {
        if (!item.IsScalar()) {
            throw DocumentError(path, what + " entries must be strings");
        }
        values.push_back(item.as<std::string>());
    }
    return values;
}

} // namespace hil
