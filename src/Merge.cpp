/**
 * @file Merge.cpp
 * @brief Implementation of the overlay phases
 */

#include "inimerge/Merge.hpp"
#include "inimerge/Cleanup.hpp"
#include "inimerge/Errors.hpp"
#include "inimerge/References.hpp"
#include "inimerge/Util.hpp"

namespace inimerge {

namespace {

std::string where(const std::string& phase, const std::string& section, const std::string& key) {
    return phase + " [" + section + "] " + key;
}

std::optional<Document> parse_partition(const std::optional<PartitionText>& part,
                                        Partition which,
                                        const MergePolicy& policy) {
    if (!part) return std::nullopt;
    return parse_document(part->text, policy.multiline_keys,
                          "overlay " + to_string(which) + " partition",
                          part->first_line);
}

} // anonymous namespace

Overlay parse_overlay(const OverlayPartitions& partitions, const MergePolicy& policy) {
    Overlay overlay;
    overlay.remove = parse_partition(partitions.remove, Partition::Remove, policy);
    overlay.substitute = parse_partition(partitions.substitute, Partition::Substitute, policy);
    overlay.insert = parse_partition(partitions.insert, Partition::Insert, policy);
    return overlay;
}

// ============================================================================
// REMOVE
// ============================================================================

void apply_remove(Document& base, const Document& directives, MergeResult& result) {
    for (const auto& sname : directives.section_names()) {
        const Section* wanted = directives.find_section(sname);
        Section* target = base.find_section(sname);

        if (!target) {
            result.warn("REMOVE [" + sname + "]: section not found in base");
            continue;
        }

        // A bare section header removes the whole section
        if (wanted->empty()) {
            base.remove_section(sname);
            ++result.stats.sections_removed;
            continue;
        }

        for (const auto& key : wanted->keys()) {
            const Value* directive = wanted->find(key);
            Value* current = target->find(key);

            if (!current) {
                result.warn(where("REMOVE", sname, key) + ": key not found in base");
                continue;
            }

            if (directive->empty()) {
                target->remove(key);
                ++result.stats.keys_removed;
                continue;
            }

            const Lines patterns = directive->entries();

            if (current->is_scalar()) {
                const std::string value = trim(current->as_scalar());
                bool matched = false;
                for (const auto& p : patterns) {
                    if (trim(p) == value) matched = true;
                }
                if (matched) {
                    target->remove(key);
                    ++result.stats.keys_removed;
                } else {
                    result.warn(where("REMOVE", sname, key) + ": value '" + value +
                                "' does not match '" + join(patterns, "', '") + "'");
                }
                continue;
            }

            Lines& lines = current->as_lines();
            for (const auto& p : patterns) {
                const std::string pattern = trim(p);
                size_t before = lines.size();
                Lines kept;
                for (auto& line : lines) {
                    if (trim(line).find(pattern) == std::string::npos) kept.push_back(std::move(line));
                }
                lines = std::move(kept);
                size_t removed = before - lines.size();
                if (removed == 0) {
                    result.warn(where("REMOVE", sname, key) + ": no line contains '" + pattern + "'");
                }
                result.stats.lines_removed += static_cast<int>(removed);
            }
        }
    }
}

// ============================================================================
// SUBSTITUTE
// ============================================================================

void apply_substitute(Document& base, const Document& directives, MergeResult& result) {
    for (const auto& sname : directives.section_names()) {
        const Section* wanted = directives.find_section(sname);

        if (!base.has_section(sname)) {
            ++result.stats.sections_created;
        }
        Section& target = base.add_section(sname);

        for (const auto& key : wanted->keys()) {
            const Value& replacement = *wanted->find(key);
            if (target.has(key)) {
                ++result.stats.keys_substituted;
            } else {
                ++result.stats.keys_created_by_substitute;
                result.warn(where("SUBSTITUTE", sname, key) + ": key not found in base, inserted");
            }
            target.set(key, replacement);
        }
    }
}

// ============================================================================
// INSERT
// ============================================================================

void apply_insert(Document& base, const Document& directives,
                  const MergePolicy& policy, MergeResult& result) {
    static const AppendUniqueStrategy fallback{};
    const LineMergeStrategy& strategy = policy.line_merge ? *policy.line_merge : fallback;

    for (const auto& sname : directives.section_names()) {
        const Section* wanted = directives.find_section(sname);

        if (!base.has_section(sname)) {
            ++result.stats.sections_created;
        }
        Section& target = base.add_section(sname);

        for (const auto& key : wanted->keys()) {
            const Value& incoming = *wanted->find(key);
            Value* current = target.find(key);

            if (!current) {
                target.set(key, incoming);
                ++result.stats.keys_inserted;
                continue;
            }

            if (incoming.empty()) {
                result.warn(where("INSERT", sname, key) + ": empty value ignored for existing key");
                continue;
            }

            if (current->empty()) {
                *current = incoming;
                ++result.stats.keys_inserted;
                continue;
            }

            if (current->is_scalar() && incoming.is_scalar() &&
                policy.scalar_insert == ScalarInsertMode::Overwrite) {
                if (*current != incoming) {
                    *current = incoming;
                    ++result.stats.keys_substituted;
                }
                continue;
            }

            const Lines existing = current->entries();
            Lines combined = strategy.combine(existing, incoming.entries());
            if (combined == existing) {
                continue;
            }
            if (combined.size() > existing.size()) {
                result.stats.lines_appended += static_cast<int>(combined.size() - existing.size());
            }
            *current = Value::multiline(std::move(combined));
        }
    }
}

// ============================================================================
// Entry points
// ============================================================================

void apply_overlay(Document& base, const Overlay& overlay,
                   const MergePolicy& policy, MergeResult& result) {
    if (overlay.remove) apply_remove(base, *overlay.remove, result);
    if (overlay.substitute) apply_substitute(base, *overlay.substitute, result);
    if (overlay.insert) apply_insert(base, *overlay.insert, policy, result);
    resolve_references(base, policy, result);
    cleanup_document(base, result);
}

MergeResult merge_documents(const std::string& base_text,
                            const std::string& overlay_text,
                            const MergePolicy& policy) {
    MergeResult result;
    try {
        Document base = parse_document(base_text, policy.multiline_keys, "base");

        const OverlayPartitions partitions = partition_overlay(overlay_text);
        if (!partitions.preamble.empty()) {
            result.warn("Overlay content before the first partition marker was ignored");
        }
        const Overlay overlay = parse_overlay(partitions, policy);

        apply_overlay(base, overlay, policy, result);
        result.output = serialize_document(base);
    } catch (const MergeError& e) {
        result.fail(e.what());
    } catch (const std::exception& e) {
        result.fail(std::string("Unexpected error: ") + e.what());
    }
    return result;
}

} // namespace inimerge
