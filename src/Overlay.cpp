/**
 * @file Overlay.cpp
 * @brief Overlay partitioning
 */

#include "inimerge/Overlay.hpp"
#include "inimerge/Util.hpp"

#include <regex>
#include <vector>

namespace inimerge {

std::string to_string(Partition p) {
    switch (p) {
        case Partition::Remove: return "REMOVE";
        case Partition::Substitute: return "SUBSTITUTE";
        case Partition::Insert: return "INSERT";
    }
    return "UNKNOWN";
}

std::optional<Partition> match_marker(const std::string& line) {
    static const std::regex marker(
        R"(^\s*[;#]+\s*=+\s*(REMOVE|SUBSTITUTE|INSERT)\s*=+\s*$)",
        std::regex_constants::ECMAScript | std::regex_constants::icase);

    std::smatch m;
    if (!std::regex_match(line, m, marker)) return std::nullopt;

    const std::string name = to_lower(m[1].str());
    if (name == "remove") return Partition::Remove;
    if (name == "substitute") return Partition::Substitute;
    return Partition::Insert;
}

OverlayPartitions partition_overlay(const std::string& overlay_text) {
    OverlayPartitions out;
    const auto lines = split_lines(overlay_text);

    std::optional<Partition> current;
    std::vector<std::string> preamble;

    auto slot = [&out](Partition p) -> std::optional<PartitionText>& {
        switch (p) {
            case Partition::Remove: return out.remove;
            case Partition::Substitute: return out.substitute;
            case Partition::Insert: break;
        }
        return out.insert;
    };

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        const int lineno = static_cast<int>(i) + 1;

        if (auto p = match_marker(line)) {
            out.has_markers = true;
            current = *p;
            auto& part = slot(*p);
            if (!part) {
                part = PartitionText{"", lineno + 1};
            } else {
                // Repeated marker: keep line numbers aligned by padding with
                // blank lines up to the new segment.
                const int next = part->first_line +
                                 static_cast<int>(split_lines(part->text).size());
                for (int n = next; n <= lineno; ++n) part->text += "\n";
            }
            continue;
        }

        if (!current) {
            if (!is_blank(line) && !is_comment_line(line)) {
                preamble.push_back(line);
            }
            continue;
        }
        slot(*current)->text += line + "\n";
    }

    if (!out.has_markers) {
        out.insert = PartitionText{overlay_text, 1};
        return out;
    }

    out.preamble = join(preamble, "\n");
    return out;
}

} // namespace inimerge
