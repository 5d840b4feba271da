/**
 * @file Result.hpp
 * @brief Merge outcome: statistics, warnings, errors and merged text
 *
 * Phase-level anomalies are warnings. Only fatal conditions (parse
 * failures, unreadable input, unwritable output) are errors, and any error
 * makes the result unsuccessful.
 */

#ifndef INIMERGE_RESULT_HPP
#define INIMERGE_RESULT_HPP

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace inimerge {

/**
 * @brief Per-phase counters
 */
struct MergeStats {
    // REMOVE
    int keys_removed = 0;
    int lines_removed = 0;
    int sections_removed = 0;

    // SUBSTITUTE
    int keys_substituted = 0;
    int keys_created_by_substitute = 0;

    // INSERT
    int keys_inserted = 0;
    int lines_appended = 0;
    int sections_created = 0;

    // Reference resolution
    int references_cleaned = 0;
    int reference_passes = 0;

    // Cleanup
    int keys_dropped = 0;
    int sections_dropped = 0;
};

struct MergeResult {
    bool success = true;
    MergeStats stats;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;

    /// Merged INI text; empty when success is false.
    std::string output;

    void warn(std::string message) { warnings.push_back(std::move(message)); }

    void fail(std::string message) {
        errors.push_back(std::move(message));
        success = false;
    }
};

/**
 * @brief Process exit codes used by the command-line tool
 */
enum class ExitCode : int {
    Success = 0,
    Failure = 1,      ///< File, parse or merge failure
    Usage = 2,        ///< Bad arguments
    OutputExists = 3, ///< Destination exists and --force was not given
};

/// Success or Failure depending on result.success.
ExitCode exit_code_for(const MergeResult& result);

nlohmann::json to_json(const MergeStats& stats);

/**
 * @brief Machine-readable report
 *
 * ```json
 * {"success": true, "stats": {...}, "warnings": [...], "errors": [...]}
 * ```
 * The merged text is not included.
 */
nlohmann::json to_json(const MergeResult& result);

/**
 * @brief Human-readable summary
 * @param verbose Include every counter, not only the non-zero ones
 */
std::string format_report(const MergeResult& result, bool verbose = false);

} // namespace inimerge

#endif // INIMERGE_RESULT_HPP
