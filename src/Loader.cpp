/**
 * @file Loader.cpp
 * @brief File reading, writing and example generation
 */

#include "inimerge/Loader.hpp"
#include "inimerge/Errors.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace inimerge {

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

std::string read_text_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw FileNotFoundError(path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileReadError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        throw FileReadError(path);
    }
    return ss.str();
}

void write_text_file(const std::string& path, const std::string& text, bool overwrite) {
    if (!overwrite && path_exists(path)) {
        throw OutputExistsError(path);
    }

    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        throw FileWriteError(path, "is a directory");
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw FileWriteError(path, "cannot open for writing");
    }
    out << text;
    out.flush();
    if (!out) {
        throw FileWriteError(path, "write failed");
    }
}

// ============================================================================
// Examples
// ============================================================================

const std::string& example_base_text() {
    static const std::string text =
        "; Base PlatformIO project configuration\n"
        "[platformio]\n"
        "default_envs = esp32dev\n"
        "\n"
        "[common]\n"
        "lib_deps =\n"
        "\tbblanchon/ArduinoJson#6.21.3\n"
        "\tknolleary/PubSubClient#2.8\n"
        "build_flags =\n"
        "\t-DDEBUG\n"
        "\t-DVERBOSE\n"
        "\n"
        "[env:esp32dev]\n"
        "platform = espressif32\n"
        "board = esp32dev\n"
        "framework = arduino\n"
        "monitor_speed = 9600\n"
        "lib_deps =\n"
        "\t${common.lib_deps}\n"
        "build_flags =\n"
        "\t${common.build_flags}\n"
        "\t${legacy.build_flags}\n"
        "\n"
        "[legacy]\n"
        "build_flags = -DLEGACY_API\n";
    return text;
}

const std::string& example_overlay_text() {
    static const std::string text =
        "; Overlay applied on top of platformio.ini\n"
        "; Empty value removes the key, a value removes matching lines.\n"
        "; A section header with no keys removes the whole section.\n"
        "; === REMOVE ===\n"
        "[common]\n"
        "build_flags = -DDEBUG\n"
        "\n"
        "[legacy]\n"
        "\n"
        "; Replace values outright.\n"
        "; === SUBSTITUTE ===\n"
        "[env:esp32dev]\n"
        "monitor_speed = 115200\n"
        "\n"
        "; Add keys, sections and list entries.\n"
        "; === INSERT ===\n"
        "[common]\n"
        "lib_deps =\n"
        "\tadafruit/Adafruit NeoPixel#1.12.0\n"
        "\n"
        "[env:esp32dev]\n"
        "monitor_filters = esp32_exception_decoder\n";
    return text;
}

std::vector<std::string> create_example_files(const std::string& directory, bool overwrite) {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw FileWriteError(directory, ec.message());
    }

    const fs::path dir(directory);
    const std::string base_path = (dir / "platformio.ini").string();
    const std::string overlay_path = (dir / "overlay.ini").string();

    // Check both before writing either
    if (!overwrite) {
        if (path_exists(base_path)) throw OutputExistsError(base_path);
        if (path_exists(overlay_path)) throw OutputExistsError(overlay_path);
    }

    write_text_file(base_path, example_base_text(), overwrite);
    write_text_file(overlay_path, example_overlay_text(), overwrite);
    return {base_path, overlay_path};
}

} // namespace inimerge
