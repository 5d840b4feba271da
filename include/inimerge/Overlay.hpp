/**
 * @file Overlay.hpp
 * @brief Splits overlay text into REMOVE / SUBSTITUTE / INSERT partitions
 *
 * Partitions are introduced by marker comment lines such as
 * `; === REMOVE ===`, matched case-insensitively with flexible spacing.
 * Text after a marker belongs to that partition up to the next marker or
 * end of input. Without any marker the whole overlay is the INSERT
 * partition.
 */

#ifndef INIMERGE_OVERLAY_HPP
#define INIMERGE_OVERLAY_HPP

#include <optional>
#include <string>

namespace inimerge {

enum class Partition {
    Remove,
    Substitute,
    Insert,
};

std::string to_string(Partition p);

/**
 * @brief Raw text of one partition
 */
struct PartitionText {
    std::string text;
    /// Line number (1-based, in the overlay) of the first line of @ref text.
    int first_line = 1;
};

struct OverlayPartitions {
    std::optional<PartitionText> remove;
    std::optional<PartitionText> substitute;
    std::optional<PartitionText> insert;

    /// False when no marker was found and everything went to INSERT.
    bool has_markers = false;

    /// Non-comment text found before the first marker (ignored).
    std::string preamble;
};

/**
 * @brief Match a marker line
 * @return The partition it opens, or std::nullopt if @p line is not a marker
 *
 * Examples:
 * ```cpp
 * match_marker("; === REMOVE ===");     // Partition::Remove
 * match_marker("#==substitute==");       // Partition::Substitute
 * match_marker("  ;;  ===  Insert  === "); // Partition::Insert
 * match_marker("; REMOVE");              // nullopt
 * ```
 */
std::optional<Partition> match_marker(const std::string& line);

/**
 * @brief Split overlay text into partitions
 *
 * A partition named by more than one marker collects all of its segments,
 * in order.
 */
OverlayPartitions partition_overlay(const std::string& overlay_text);

} // namespace inimerge

#endif // INIMERGE_OVERLAY_HPP
