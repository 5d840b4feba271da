/**
 * @file References.cpp
 * @brief Dangling reference cleanup
 */

#include "inimerge/References.hpp"

#include <regex>
#include <set>

namespace inimerge {

std::vector<Reference> find_references(const std::string& text) {
    static const std::regex placeholder(R"(\$\{([^{}\s]+)\})");

    std::vector<Reference> refs;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), placeholder);
         it != std::sregex_iterator(); ++it) {
        const std::string body = (*it)[1].str();
        const auto dot = body.rfind('.');
        if (dot == std::string::npos || dot == 0 || dot + 1 == body.size()) continue;
        refs.push_back(Reference{body.substr(0, dot), body.substr(dot + 1)});
    }
    return refs;
}

bool reference_resolves(const Document& doc, const Reference& ref,
                        const std::string& owner, const MergePolicy& policy) {
    if (policy.external_reference_sections.count(ref.section) > 0) {
        return true;
    }
    const std::string& section = ref.section == "this" ? owner : ref.section;
    const Value* target = doc.find_value(section, ref.key);
    return target != nullptr && !target->empty();
}

namespace {

bool has_dangling(const Document& doc, const std::string& text,
                  const std::string& owner, const MergePolicy& policy) {
    for (const auto& ref : find_references(text)) {
        if (!reference_resolves(doc, ref, owner, policy)) return true;
    }
    return false;
}

/**
 * @brief Value entries scheduled for removal in one pass
 */
struct Removal {
    std::string section;
    std::string key;
    bool clear_scalar = false;
    std::set<size_t> lines;
};

std::vector<Removal> scan(const Document& doc, const MergePolicy& policy) {
    std::vector<Removal> removals;
    for (const auto& sname : doc.section_names()) {
        const Section* section = doc.find_section(sname);
        for (const auto& key : section->keys()) {
            const Value* value = section->find(key);
            Removal r{sname, key, false, {}};

            if (value->is_scalar()) {
                r.clear_scalar = has_dangling(doc, value->as_scalar(), sname, policy);
            } else {
                const Lines& lines = value->as_lines();
                for (size_t i = 0; i < lines.size(); ++i) {
                    if (has_dangling(doc, lines[i], sname, policy)) r.lines.insert(i);
                }
            }

            if (r.clear_scalar || !r.lines.empty()) removals.push_back(std::move(r));
        }
    }
    return removals;
}

int apply_removals(Document& doc, const std::vector<Removal>& removals) {
    int count = 0;
    for (const auto& r : removals) {
        Value* value = doc.find_section(r.section)->find(r.key);
        if (r.clear_scalar) {
            *value = Value::scalar("");
            ++count;
            continue;
        }
        Lines kept;
        const Lines& lines = value->as_lines();
        for (size_t i = 0; i < lines.size(); ++i) {
            if (r.lines.count(i) == 0) kept.push_back(lines[i]);
        }
        count += static_cast<int>(r.lines.size());
        value->as_lines() = std::move(kept);
    }
    return count;
}

} // anonymous namespace

bool resolve_references(Document& doc, const MergePolicy& policy, MergeResult& result) {
    int passes = 0;
    while (true) {
        auto removals = scan(doc, policy);
        if (removals.empty()) {
            return true;
        }
        if (passes >= policy.max_reference_passes) {
            result.warn("Reference cleanup stopped after " + std::to_string(passes) +
                        " passes without reaching a fixed point (possible reference cycle)");
            return false;
        }
        ++passes;
        result.stats.reference_passes = passes;
        result.stats.references_cleaned += apply_removals(doc, removals);
    }
}

} // namespace inimerge
