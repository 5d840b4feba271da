#include "inimerge/Result.hpp"

#include <sstream>
#include <utility>

namespace inimerge {

ExitCode exit_code_for(const MergeResult& result) {
    return result.success ? ExitCode::Success : ExitCode::Failure;
}

namespace {

std::vector<std::pair<const char*, int>> stat_fields(const MergeStats& s) {
    return {
        {"keys_removed", s.keys_removed},
        {"lines_removed", s.lines_removed},
        {"sections_removed", s.sections_removed},
        {"keys_substituted", s.keys_substituted},
        {"keys_created_by_substitute", s.keys_created_by_substitute},
        {"keys_inserted", s.keys_inserted},
        {"lines_appended", s.lines_appended},
        {"sections_created", s.sections_created},
        {"references_cleaned", s.references_cleaned},
        {"reference_passes", s.reference_passes},
        {"keys_dropped", s.keys_dropped},
        {"sections_dropped", s.sections_dropped},
    };
}

} // anonymous namespace

nlohmann::json to_json(const MergeStats& stats) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [name, value] : stat_fields(stats)) {
        j[name] = value;
    }
    return j;
}

nlohmann::json to_json(const MergeResult& result) {
    return {
        {"success", result.success},
        {"stats", to_json(result.stats)},
        {"warnings", result.warnings},
        {"errors", result.errors},
    };
}

std::string format_report(const MergeResult& result, bool verbose) {
    std::ostringstream oss;
    oss << (result.success ? "Merge succeeded" : "Merge failed");
    oss << " (" << result.warnings.size() << " warning"
        << (result.warnings.size() == 1 ? "" : "s") << ", "
        << result.errors.size() << " error"
        << (result.errors.size() == 1 ? "" : "s") << ")\n";

    for (const auto& [name, value] : stat_fields(result.stats)) {
        if (value == 0 && !verbose) continue;
        oss << "  " << name << ": " << value << "\n";
    }
    return oss.str();
}

} // namespace inimerge
