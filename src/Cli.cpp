#include "inimerge/Cli.hpp"
#include "inimerge/Errors.hpp"
#include "inimerge/Loader.hpp"
#include "inimerge/Merge.hpp"
#include "inimerge/Policy.hpp"
#include "inimerge/Result.hpp"

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

namespace inimerge {

namespace {

int code(ExitCode c) { return static_cast<int>(c); }

} // anonymous namespace

int run_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    // cxxopts wants mutable argc/argv
    std::vector<std::string> storage = args;
    std::vector<char*> argv_vec;
    for (auto& a : storage) argv_vec.push_back(a.data());
    argv_vec.push_back(nullptr);
    int argc = static_cast<int>(storage.size());
    char** argv = argv_vec.data();

    cxxopts::Options options("inimerge", "Merge an overlay (REMOVE / SUBSTITUTE / INSERT) into a PlatformIO-style INI file");
    options.positional_help("BASE OVERLAY OUTPUT");

    options.add_options()
        ("f,force", "Overwrite OUTPUT (or example files) if it exists")
        ("p,policy", "Merge policy file (.toml or .json)", cxxopts::value<std::string>())
        ("n,dry-run", "Print the merged document to stdout instead of writing OUTPUT")
        ("report", "Report format: text or json", cxxopts::value<std::string>()->default_value("text"))
        ("q,quiet", "Suppress warnings and the summary")
        ("v,verbose", "Show every statistic in the summary")
        ("create-example", "Write example platformio.ini and overlay.ini into DIR", cxxopts::value<std::string>())
        ("version", "Print version")
        ("h,help", "Show help");

    options.add_options()
        ("base", "Base INI file", cxxopts::value<std::string>())
        ("overlay", "Overlay INI file", cxxopts::value<std::string>())
        ("output", "Destination file", cxxopts::value<std::string>());

    options.parse_positional({"base", "overlay", "output"});

    std::string base_path, overlay_path, output_path, report;
    bool force = false, dry_run = false, quiet = false, verbose = false;
    std::string policy_path, example_dir;

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            out << options.help() << "\n";
            return code(ExitCode::Success);
        }
        if (result.count("version")) {
            out << "inimerge " << INIMERGE_VERSION << "\n";
            return code(ExitCode::Success);
        }

        if (!result.unmatched().empty()) {
            err << "Error: unexpected argument '" << result.unmatched().front() << "'\n";
            err << "Run 'inimerge --help' for usage.\n";
            return code(ExitCode::Usage);
        }

        force = result.count("force") > 0;
        dry_run = result.count("dry-run") > 0;
        quiet = result.count("quiet") > 0;
        verbose = result.count("verbose") > 0;
        report = result["report"].as<std::string>();
        if (result.count("policy")) policy_path = result["policy"].as<std::string>();
        if (result.count("create-example")) example_dir = result["create-example"].as<std::string>();
        if (result.count("base")) base_path = result["base"].as<std::string>();
        if (result.count("overlay")) overlay_path = result["overlay"].as<std::string>();
        if (result.count("output")) output_path = result["output"].as<std::string>();
    } catch (const std::exception& ex) {
        err << "Error: " << ex.what() << "\n";
        err << "Run 'inimerge --help' for usage.\n";
        return code(ExitCode::Usage);
    }

    if (quiet && verbose) {
        err << "Error: --quiet and --verbose are mutually exclusive\n";
        return code(ExitCode::Usage);
    }
    if (report != "text" && report != "json") {
        err << "Error: --report must be 'text' or 'json', got '" << report << "'\n";
        return code(ExitCode::Usage);
    }

    // EXAMPLE GENERATION
    if (!example_dir.empty()) {
        if (!base_path.empty()) {
            err << "Error: --create-example does not take BASE/OVERLAY/OUTPUT arguments\n";
            return code(ExitCode::Usage);
        }
        try {
            for (const auto& path : create_example_files(example_dir, force)) {
                if (!quiet) out << "Wrote " << path << "\n";
            }
        } catch (const OutputExistsError& ex) {
            err << "Error: " << ex.what() << "\n";
            return code(ExitCode::OutputExists);
        } catch (const MergeError& ex) {
            err << "Error: " << ex.what() << "\n";
            return code(ExitCode::Failure);
        }
        return code(ExitCode::Success);
    }

    if (base_path.empty() || overlay_path.empty() || (output_path.empty() && !dry_run)) {
        err << "Error: expected BASE OVERLAY OUTPUT (OUTPUT optional with --dry-run)\n";
        err << "Run 'inimerge --help' for usage.\n";
        return code(ExitCode::Usage);
    }

    // Fail fast before doing any work
    if (!dry_run && !force && path_exists(output_path)) {
        err << "Error: " << OutputExistsError(output_path).what() << "\n";
        return code(ExitCode::OutputExists);
    }

    MergePolicy policy = default_policy();
    std::string base_text, overlay_text;
    try {
        if (!policy_path.empty()) policy = load_policy_file(policy_path);
        base_text = read_text_file(base_path);
        overlay_text = read_text_file(overlay_path);
    } catch (const MergeError& ex) {
        err << "Error: " << ex.what() << "\n";
        return code(ExitCode::Failure);
    }

    MergeResult merged = merge_documents(base_text, overlay_text, policy);

    if (merged.success) {
        try {
            if (dry_run) {
                out << merged.output;
            } else {
                write_text_file(output_path, merged.output, force);
            }
        } catch (const OutputExistsError& ex) {
            err << "Error: " << ex.what() << "\n";
            return code(ExitCode::OutputExists);
        } catch (const MergeError& ex) {
            merged.fail(ex.what());
        }
    }

    if (!quiet) {
        for (const auto& w : merged.warnings) err << "Warning: " << w << "\n";
    }
    for (const auto& e : merged.errors) err << "Error: " << e << "\n";

    // Keep stdout clean for the merged text on --dry-run
    std::ostream& report_out = dry_run ? err : out;
    if (report == "json") {
        report_out << to_json(merged).dump(2) << "\n";
    } else if (!quiet) {
        report_out << format_report(merged, verbose);
        if (merged.success && !dry_run) report_out << "Wrote " << output_path << "\n";
    }

    return code(exit_code_for(merged));
}

} // namespace inimerge
