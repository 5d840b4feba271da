/**
 * @file Errors.hpp
 * @brief Exception types for inimerge
 *
 * Error taxonomy:
 * - MergeError: Base class
 * - IniParseError: Malformed section or key syntax (fatal for that document)
 * - FileNotFoundError: Input file does not exist
 * - FileReadError: Input exists but cannot be read
 * - FileWriteError: Destination cannot be written
 * - OutputExistsError: Destination exists and overwriting was not allowed
 * - PolicyError: Invalid merge policy file
 *
 * The merge core throws these internally; merge_documents() converts them
 * into MergeResult errors so nothing escapes the core.
 */

#ifndef INIMERGE_ERRORS_HPP
#define INIMERGE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace inimerge {

/**
 * @brief Base class for all inimerge exceptions
 */
class MergeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief INI syntax error
 */
class IniParseError : public MergeError {
public:
    /**
     * @brief Construct with source name, line number and details
     * @param source Document name used in messages (e.g. "base", "overlay")
     * @param line 1-based line number in the source text
     * @param details What was wrong with the line
     */
    IniParseError(std::string source, int line, std::string details)
        : MergeError("Parse error in " + source + " at line " +
                     std::to_string(line) + ": " + details)
        , source_(std::move(source))
        , line_(line)
        , details_(std::move(details))
    {}

    const std::string& source() const noexcept { return source_; }
    int line() const noexcept { return line_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string source_;
    int line_;
    std::string details_;
};

/**
 * @brief Input file not found
 */
class FileNotFoundError : public MergeError {
public:
    explicit FileNotFoundError(std::string path)
        : MergeError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief Input file exists but could not be read
 */
class FileReadError : public MergeError {
public:
    explicit FileReadError(std::string path)
        : MergeError("Cannot read file: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief Destination could not be written
 */
class FileWriteError : public MergeError {
public:
    FileWriteError(std::string path, const std::string& reason)
        : MergeError("Cannot write file: " + path + (reason.empty() ? "" : " (" + reason + ")"))
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief Destination exists and overwriting was not requested
 */
class OutputExistsError : public MergeError {
public:
    explicit OutputExistsError(std::string path)
        : MergeError("Output file already exists: " + path + " (use --force to overwrite)")
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief Merge policy file is malformed or has invalid fields
 */
class PolicyError : public MergeError {
public:
    PolicyError(std::string file, const std::string& details)
        : MergeError("Invalid policy '" + file + "': " + details)
        , file_(std::move(file))
    {}

    const std::string& file() const noexcept { return file_; }

private:
    std::string file_;
};

} // namespace inimerge

#endif // INIMERGE_ERRORS_HPP
