/**
 * @file Merge.hpp
 * @brief Overlay merge engine
 *
 * Applies an overlay to a base document in a fixed order:
 *
 * 1. REMOVE: delete keys (empty directive), delete matching lines of
 *    multi-line values (substring match), delete scalars whose value equals
 *    the directive, delete whole sections (section with no keys).
 * 2. SUBSTITUTE: replace values outright, creating sections and keys as
 *    needed.
 * 3. INSERT: create missing sections and keys, append unseen lines to
 *    existing values.
 * 4. Dangling ${section.key} references are removed to a fixed point.
 * 5. Empty keys and sections are dropped.
 *
 * Anomalies inside the phases are recorded as warnings; they never stop
 * the merge.
 */

#ifndef INIMERGE_MERGE_HPP
#define INIMERGE_MERGE_HPP

#include "inimerge/Document.hpp"
#include "inimerge/Overlay.hpp"
#include "inimerge/Policy.hpp"
#include "inimerge/Result.hpp"

#include <optional>
#include <string>

namespace inimerge {

/**
 * @brief Parsed overlay partitions; a missing partition is a no-op
 */
struct Overlay {
    std::optional<Document> remove;
    std::optional<Document> substitute;
    std::optional<Document> insert;
};

/**
 * @brief Parse each partition with the policy's multi-line keys
 * @throws IniParseError naming the partition and the overlay line
 */
Overlay parse_overlay(const OverlayPartitions& partitions, const MergePolicy& policy);

/// REMOVE phase.
void apply_remove(Document& base, const Document& directives, MergeResult& result);

/// SUBSTITUTE phase.
void apply_substitute(Document& base, const Document& directives, MergeResult& result);

/// INSERT phase.
void apply_insert(Document& base, const Document& directives,
                  const MergePolicy& policy, MergeResult& result);

/**
 * @brief Run all phases, reference resolution and cleanup on @p base
 */
void apply_overlay(Document& base, const Overlay& overlay,
                   const MergePolicy& policy, MergeResult& result);

/**
 * @brief Merge overlay text into base text
 *
 * Never throws: parse failures and unexpected exceptions become errors in
 * the returned result, and result.output stays empty.
 *
 * @param base_text INI text of the base document
 * @param overlay_text INI text of the overlay, with optional partition markers
 * @param policy Merge policy
 * @return Result with merged text in output on success
 *
 * Example:
 * ```cpp
 * auto r = merge_documents("[env]\nlib_deps = lib1#1.0.0\n",
 *                          "[env]\nlib_deps = lib2#2.0.0\n",
 *                          default_policy());
 * // r.output == "[env]\nlib_deps =\n\tlib1#1.0.0\n\tlib2#2.0.0\n"
 * ```
 */
MergeResult merge_documents(const std::string& base_text,
                            const std::string& overlay_text,
                            const MergePolicy& policy);

} // namespace inimerge

#endif // INIMERGE_MERGE_HPP
