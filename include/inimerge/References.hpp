/**
 * @file References.hpp
 * @brief Removal of dangling ${section.key} references
 */

#ifndef INIMERGE_REFERENCES_HPP
#define INIMERGE_REFERENCES_HPP

#include "inimerge/Document.hpp"
#include "inimerge/Policy.hpp"
#include "inimerge/Result.hpp"

#include <string>
#include <vector>

namespace inimerge {

/**
 * @brief A `${section.key}` occurrence
 */
struct Reference {
    std::string section;
    std::string key;

    bool operator==(const Reference& other) const {
        return section == other.section && key == other.key;
    }
};

/**
 * @brief Find every `${section.key}` in a piece of text
 *
 * The section name ends at the last '.' inside the braces, so names like
 * `env:esp32` are fine. Placeholders without a '.' are not references.
 */
std::vector<Reference> find_references(const std::string& text);

/**
 * @brief Check whether a reference points to an existing non-empty item
 *
 * @param doc Document to look in
 * @param ref The reference
 * @param owner Section that contains the reference (target of `this`)
 * @param policy Supplies the external sections that always resolve
 */
bool reference_resolves(const Document& doc, const Reference& ref,
                        const std::string& owner, const MergePolicy& policy);

/**
 * @brief Remove values that contain dangling references, to a fixed point
 *
 * Every pass checks all references against the document as it was at the
 * start of the pass, then drops each offending line (multi-line value) or
 * clears each offending scalar. Passes repeat until one removes nothing, or
 * until policy.max_reference_passes passes have removed something, which is
 * reported as a warning.
 *
 * Updates result.stats.references_cleaned and result.stats.reference_passes.
 *
 * @return true if a fixed point was reached
 */
bool resolve_references(Document& doc, const MergePolicy& policy, MergeResult& result);

} // namespace inimerge

#endif // INIMERGE_REFERENCES_HPP
