/**
 * @file Policy.cpp
 * @brief Default merge policy and policy-file loading
 *
 * TOML files are converted to nlohmann::json first so both formats share a
 * single field validator.
 */

#include "inimerge/Policy.hpp"
#include "inimerge/Errors.hpp"
#include "inimerge/Util.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace inimerge {

Lines AppendUniqueStrategy::combine(const Lines& existing, const Lines& incoming) const {
    Lines out = existing;
    std::set<std::string> seen;
    for (const auto& line : existing) {
        seen.insert(trim(line));
    }
    for (const auto& line : incoming) {
        std::string t = trim(line);
        if (t.empty() || seen.count(t) > 0) continue;
        seen.insert(t);
        out.push_back(t);
    }
    return out;
}

MergePolicy default_policy() {
    MergePolicy policy;
    policy.multiline_keys = default_multiline_keys();
    policy.line_merge = std::make_shared<AppendUniqueStrategy>();
    policy.scalar_insert = ScalarInsertMode::Append;
    policy.max_reference_passes = 100;
    policy.external_reference_sections = {"sysenv"};
    return policy;
}

// ============================================================================
// Policy file loading
// ============================================================================

namespace {

nlohmann::json toml_node_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return nlohmann::json(node.as_string()->get());

        case toml::node_type::integer:
            return nlohmann::json(node.as_integer()->get());

        case toml::node_type::floating_point:
            return nlohmann::json(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return nlohmann::json(node.as_boolean()->get());

        case toml::node_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_node_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_node_to_json(val);
            }
            return obj;
        }

        default:
            // Dates and times have no meaning in a policy
            return nlohmann::json(nullptr);
    }
}

std::set<std::string> string_set(const std::string& path, const std::string& field,
                                 const nlohmann::json& value) {
    if (!value.is_array()) {
        throw PolicyError(path, "'" + field + "' must be an array of strings");
    }
    std::set<std::string> out;
    for (const auto& elem : value) {
        if (!elem.is_string()) {
            throw PolicyError(path, "'" + field + "' must be an array of strings");
        }
        std::string s = trim(elem.get<std::string>());
        if (!s.empty()) out.insert(s);
    }
    return out;
}

MergePolicy policy_from_json(const std::string& path, const nlohmann::json& j) {
    if (!j.is_object()) {
        throw PolicyError(path, "top level must be a table/object");
    }

    MergePolicy policy = default_policy();
    std::set<std::string> extra_keys;
    bool have_keys = false;
    bool extend = true;

    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& field = it.key();
        const nlohmann::json& v = it.value();

        if (field == "multiline_keys") {
            extra_keys = string_set(path, field, v);
            have_keys = true;
        } else if (field == "extend_default_keys") {
            if (!v.is_boolean()) throw PolicyError(path, "'extend_default_keys' must be a boolean");
            extend = v.get<bool>();
        } else if (field == "scalar_insert") {
            if (!v.is_string()) throw PolicyError(path, "'scalar_insert' must be a string");
            const std::string mode = to_lower(v.get<std::string>());
            if (mode == "append") {
                policy.scalar_insert = ScalarInsertMode::Append;
            } else if (mode == "overwrite") {
                policy.scalar_insert = ScalarInsertMode::Overwrite;
            } else {
                throw PolicyError(path, "'scalar_insert' must be \"append\" or \"overwrite\", got \"" + mode + "\"");
            }
        } else if (field == "max_reference_passes") {
            if (!v.is_number_integer() || v.get<long long>() < 1 ||
                v.get<long long>() > std::numeric_limits<int>::max()) {
                throw PolicyError(path, "'max_reference_passes' must be a positive integer");
            }
            policy.max_reference_passes = static_cast<int>(v.get<long long>());
        } else if (field == "external_reference_sections") {
            policy.external_reference_sections = string_set(path, field, v);
        } else {
            throw PolicyError(path, "unknown field '" + field + "'");
        }
    }

    if (!extend) {
        policy.multiline_keys = extra_keys;
    } else if (have_keys) {
        policy.multiline_keys.insert(extra_keys.begin(), extra_keys.end());
    }
    return policy;
}

} // anonymous namespace

MergePolicy load_policy_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = to_lower(fs::path(path).extension().string());

    if (ext == ".toml") {
        toml::table table;
        try {
            table = toml::parse_file(path);
        } catch (const toml::parse_error& e) {
            std::ostringstream details;
            details << "line " << e.source().begin.line << ": " << e.description();
            throw PolicyError(path, details.str());
        }
        return policy_from_json(path, toml_node_to_json(table));
    }

    if (ext == ".json") {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw FileReadError(path);
        }
        nlohmann::json j;
        try {
            in >> j;
        } catch (const nlohmann::json::parse_error& e) {
            throw PolicyError(path, e.what());
        }
        return policy_from_json(path, j);
    }

    throw PolicyError(path, "unsupported policy file type '" + ext + "' (expected .toml or .json)");
}

} // namespace inimerge
