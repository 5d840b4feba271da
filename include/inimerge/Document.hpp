/**
 * @file Document.hpp
 * @brief In-memory model of an INI document
 *
 * A Document is an ordered collection of uniquely named Sections. Each
 * Section maps unique key names to Values, preserving insertion order.
 * A Value is either a scalar string or an ordered list of lines
 * (PlatformIO-style multi-line option).
 *
 * Grammar accepted by parse_document():
 * - `[name]` section header
 * - `key = value` item (first '=' splits)
 * - indented continuation lines after an item, one entry per line
 * - `;` / `#` full-line comments, and inline comments after whitespace
 */

#ifndef INIMERGE_DOCUMENT_HPP
#define INIMERGE_DOCUMENT_HPP

#include "inimerge/OrderedMap.hpp"

#include <set>
#include <string>
#include <variant>
#include <vector>

namespace inimerge {

using Lines = std::vector<std::string>;

/**
 * @brief Scalar-or-lines value of an item
 *
 * A default-constructed Value is an empty scalar, i.e. "present but empty".
 */
class Value {
public:
    Value() = default;

    static Value scalar(std::string text);
    static Value multiline(Lines lines);

    bool is_scalar() const noexcept { return std::holds_alternative<std::string>(data_); }
    bool is_multiline() const noexcept { return std::holds_alternative<Lines>(data_); }

    /// @throws std::bad_variant_access if the value is multi-line
    const std::string& as_scalar() const { return std::get<std::string>(data_); }

    /// @throws std::bad_variant_access if the value is scalar
    const Lines& as_lines() const { return std::get<Lines>(data_); }
    Lines& as_lines() { return std::get<Lines>(data_); }

    /**
     * @brief Value content as a list of entries
     *
     * A non-empty scalar yields one entry, an empty scalar yields none.
     */
    Lines entries() const;

    /// True for an empty scalar or a multi-line value without lines.
    bool empty() const noexcept;

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    std::variant<std::string, Lines> data_;
};

/**
 * @brief Named group of items
 */
class Section {
public:
    Section() = default;
    explicit Section(std::string name) : name_(std::move(name)) {}

    const std::string& name() const noexcept { return name_; }

    bool has(const std::string& key) const { return items_.contains(key); }
    Value* find(const std::string& key) { return items_.find(key); }
    const Value* find(const std::string& key) const { return items_.find(key); }

    /// Insert or replace; a replaced key keeps its position.
    Value& set(const std::string& key, Value value) { return items_.set(key, std::move(value)); }

    bool remove(const std::string& key) { return items_.erase(key); }

    const std::vector<std::string>& keys() const noexcept { return items_.names(); }
    size_t size() const noexcept { return items_.size(); }
    bool empty() const noexcept { return items_.empty(); }

    bool operator==(const Section& other) const {
        return name_ == other.name_ && items_ == other.items_;
    }
    bool operator!=(const Section& other) const { return !(*this == other); }

private:
    std::string name_;
    OrderedMap<Value> items_;
};

/**
 * @brief Ordered set of sections
 */
class Document {
public:
    bool has_section(const std::string& name) const { return sections_.contains(name); }
    Section* find_section(const std::string& name) { return sections_.find(name); }
    const Section* find_section(const std::string& name) const { return sections_.find(name); }

    /// Return the named section, appending an empty one if absent.
    Section& add_section(const std::string& name);

    bool remove_section(const std::string& name) { return sections_.erase(name); }

    /// Look up section.key; nullptr if either is missing.
    const Value* find_value(const std::string& section, const std::string& key) const;

    const std::vector<std::string>& section_names() const noexcept { return sections_.names(); }
    size_t size() const noexcept { return sections_.size(); }
    bool empty() const noexcept { return sections_.empty(); }

    bool operator==(const Document& other) const { return sections_ == other.sections_; }
    bool operator!=(const Document& other) const { return !(*this == other); }

private:
    OrderedMap<Section> sections_;
};

/**
 * @brief Key names that are always stored as multi-line values
 *
 * Library dependencies, build flags, platform packages and the other
 * list-valued PlatformIO options.
 */
const std::set<std::string>& default_multiline_keys();

/**
 * @brief Parse INI text into a Document
 *
 * A key is stored multi-line if it is listed in @p multiline_keys or if it
 * has at least one continuation line in the source.
 *
 * @param text INI text
 * @param multiline_keys Key names always treated as multi-line
 * @param source Name used in error messages
 * @param first_line Line number of the first line of @p text
 * @return Parsed document
 * @throws IniParseError on malformed syntax, duplicate sections or keys
 *
 * Example:
 * ```cpp
 * auto doc = parse_document("[env]\nlib_deps =\n\tlib1#1.0.0\n");
 * doc.find_value("env", "lib_deps")->as_lines();  // {"lib1#1.0.0"}
 * ```
 */
Document parse_document(const std::string& text,
                        const std::set<std::string>& multiline_keys,
                        const std::string& source = "document",
                        int first_line = 1);

/// Parse with default_multiline_keys().
Document parse_document(const std::string& text);

/**
 * @brief Render a Document as INI text
 *
 * Sections are separated by a blank line. Multi-line values are written as
 * `key =` followed by one tab-indented line per entry.
 */
std::string serialize_document(const Document& doc);

} // namespace inimerge

#endif // INIMERGE_DOCUMENT_HPP
