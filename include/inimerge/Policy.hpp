/**
 * @file Policy.hpp
 * @brief Merge policy configuration
 *
 * The policy is passed explicitly into merge_documents(); there is no
 * global mutable default. default_policy() returns the built-in settings.
 *
 * A policy file may adjust them. Format is detected by extension:
 * - `.toml` (toml++)
 * - `.json` (nlohmann::json)
 *
 * Recognized fields:
 * ```toml
 * multiline_keys = ["custom_flags"]
 * extend_default_keys = true      # false replaces the built-in key set
 * scalar_insert = "append"        # or "overwrite"
 * max_reference_passes = 100
 * external_reference_sections = ["sysenv"]
 * ```
 */

#ifndef INIMERGE_POLICY_HPP
#define INIMERGE_POLICY_HPP

#include "inimerge/Document.hpp"

#include <memory>
#include <set>
#include <string>

namespace inimerge {

/**
 * @brief Combines the existing lines of a value with inserted lines
 */
class LineMergeStrategy {
public:
    virtual ~LineMergeStrategy() = default;

    /**
     * @param existing Lines already stored in the base value
     * @param incoming Lines supplied by the INSERT partition
     * @return The combined line list
     */
    virtual Lines combine(const Lines& existing, const Lines& incoming) const = 0;
};

/**
 * @brief Appends every incoming line not already present
 *
 * Comparison is case-sensitive on trimmed text. Existing order is kept and
 * duplicates inside @p incoming are added once.
 */
class AppendUniqueStrategy : public LineMergeStrategy {
public:
    Lines combine(const Lines& existing, const Lines& incoming) const override;
};

/**
 * @brief What INSERT does with a single line aimed at an existing scalar
 */
enum class ScalarInsertMode {
    Append,    ///< Promote to multi-line and append the new line
    Overwrite, ///< Replace the scalar
};

struct MergePolicy {
    /// Keys that are always parsed as multi-line values.
    std::set<std::string> multiline_keys;

    /// Line combination used by the INSERT phase.
    std::shared_ptr<const LineMergeStrategy> line_merge;

    ScalarInsertMode scalar_insert = ScalarInsertMode::Append;

    /// Upper bound on reference-resolution passes.
    int max_reference_passes = 100;

    /// Sections whose references are always considered resolved.
    std::set<std::string> external_reference_sections;
};

/**
 * @brief Built-in policy
 *
 * default_multiline_keys(), AppendUniqueStrategy, ScalarInsertMode::Append,
 * 100 reference passes, `sysenv` treated as external.
 */
MergePolicy default_policy();

/**
 * @brief Load a policy file on top of default_policy()
 *
 * @param path Path to a `.toml` or `.json` policy file
 * @return Resulting policy
 * @throws FileNotFoundError if the file does not exist
 * @throws PolicyError on syntax errors, unknown fields or bad field types
 */
MergePolicy load_policy_file(const std::string& path);

} // namespace inimerge

#endif // INIMERGE_POLICY_HPP
