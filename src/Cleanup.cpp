#include "inimerge/Cleanup.hpp"

#include <string>
#include <vector>

namespace inimerge {

int cleanup_document(Document& doc, MergeResult& result) {
    int total = 0;
    bool changed = true;
    while (changed) {
        changed = false;

        // Copy the name lists: removal mutates them
        const std::vector<std::string> sections = doc.section_names();
        for (const auto& sname : sections) {
            Section* section = doc.find_section(sname);
            const std::vector<std::string> keys = section->keys();
            for (const auto& key : keys) {
                if (section->find(key)->empty()) {
                    section->remove(key);
                    ++result.stats.keys_dropped;
                    ++total;
                    changed = true;
                }
            }
            if (section->empty()) {
                doc.remove_section(sname);
                ++result.stats.sections_dropped;
                ++total;
                changed = true;
            }
        }
    }
    return total;
}

} // namespace inimerge
