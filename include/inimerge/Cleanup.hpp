#ifndef INIMERGE_CLEANUP_HPP
#define INIMERGE_CLEANUP_HPP

#include "inimerge/Document.hpp"
#include "inimerge/Result.hpp"

namespace inimerge {

/**
 * @brief Drop empty keys, then empty sections, until nothing changes
 *
 * Idempotent: a second call on the same document removes nothing.
 * Updates result.stats.keys_dropped and result.stats.sections_dropped.
 *
 * @return Number of keys and sections removed
 */
int cleanup_document(Document& doc, MergeResult& result);

} // namespace inimerge

#endif // INIMERGE_CLEANUP_HPP
