/**
 * @file Document.cpp
 * @brief INI parsing and serialization
 */

#include "inimerge/Document.hpp"
#include "inimerge/Errors.hpp"
#include "inimerge/Util.hpp"

namespace inimerge {

// ============================================================================
// Value
// ============================================================================

Value Value::scalar(std::string text) {
    Value v;
    v.data_ = std::move(text);
    return v;
}

Value Value::multiline(Lines lines) {
    Value v;
    v.data_ = std::move(lines);
    return v;
}

Lines Value::entries() const {
    if (is_multiline()) return as_lines();
    const auto& s = as_scalar();
    if (s.empty()) return {};
    return {s};
}

bool Value::empty() const noexcept {
    if (const auto* s = std::get_if<std::string>(&data_)) return s->empty();
    return std::get<Lines>(data_).empty();
}

// ============================================================================
// Document
// ============================================================================

Section& Document::add_section(const std::string& name) {
    if (auto* existing = sections_.find(name)) return *existing;
    return sections_.set(name, Section(name));
}

const Value* Document::find_value(const std::string& section, const std::string& key) const {
    const Section* sec = sections_.find(section);
    if (!sec) return nullptr;
    return sec->find(key);
}

const std::set<std::string>& default_multiline_keys() {
    static const std::set<std::string> keys = {
        "build_flags",
        "build_src_filter",
        "build_src_flags",
        "build_unflags",
        "check_flags",
        "check_src_filters",
        "debug_build_flags",
        "extra_scripts",
        "lib_deps",
        "lib_extra_dirs",
        "lib_ignore",
        "monitor_filters",
        "platform_packages",
        "src_filter",
        "upload_flags",
    };
    return keys;
}

// ============================================================================
// Parsing
// ============================================================================

namespace {

/**
 * @brief Item whose continuation lines are still being collected
 */
struct PendingItem {
    Section* section = nullptr;
    std::string key;
    std::string inline_value;
    Lines continuation;
    bool open = false;
};

void commit_item(PendingItem& item, const std::set<std::string>& multiline_keys) {
    if (!item.open) return;
    item.open = false;

    if (multiline_keys.count(item.key) > 0 || !item.continuation.empty()) {
        Lines lines;
        if (!item.inline_value.empty()) lines.push_back(item.inline_value);
        for (auto& l : item.continuation) {
            if (!l.empty()) lines.push_back(std::move(l));
        }
        item.section->set(item.key, Value::multiline(std::move(lines)));
    } else {
        item.section->set(item.key, Value::scalar(item.inline_value));
    }
    item.continuation.clear();
}

} // anonymous namespace

Document parse_document(const std::string& text,
                        const std::set<std::string>& multiline_keys,
                        const std::string& source,
                        int first_line) {
    Document doc;
    Section* current = nullptr;
    PendingItem pending;

    const auto lines = split_lines(text);
    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& raw = lines[i];
        const int lineno = first_line + static_cast<int>(i);

        if (is_blank(raw)) {
            commit_item(pending, multiline_keys);
            continue;
        }
        if (is_comment_line(raw)) {
            continue;
        }
        if (is_indented(raw) && pending.open) {
            pending.continuation.push_back(strip_inline_comment(raw));
            continue;
        }

        commit_item(pending, multiline_keys);
        const std::string line = trim(raw);

        if (line.front() == '[') {
            auto close = line.find(']');
            if (close == std::string::npos) {
                throw IniParseError(source, lineno, "unterminated section header '" + line + "'");
            }
            const std::string rest = trim(line.substr(close + 1));
            if (!rest.empty() && rest.front() != ';' && rest.front() != '#') {
                throw IniParseError(source, lineno, "unexpected text after section header '" + line + "'");
            }
            const std::string name = trim(line.substr(1, close - 1));
            if (name.empty()) {
                throw IniParseError(source, lineno, "empty section name");
            }
            if (doc.has_section(name)) {
                throw IniParseError(source, lineno, "duplicate section [" + name + "]");
            }
            current = &doc.add_section(name);
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            if (is_indented(raw)) {
                throw IniParseError(source, lineno, "continuation line without a preceding key: '" + line + "'");
            }
            throw IniParseError(source, lineno, "expected 'key = value', got '" + line + "'");
        }
        const std::string key = trim(line.substr(0, eq));
        if (key.empty()) {
            throw IniParseError(source, lineno, "missing key name before '='");
        }
        if (!current) {
            throw IniParseError(source, lineno, "key '" + key + "' appears before any section header");
        }
        if (current->has(key)) {
            throw IniParseError(source, lineno, "duplicate key '" + key + "' in section [" + current->name() + "]");
        }

        pending.section = current;
        pending.key = key;
        pending.inline_value = strip_inline_comment(line.substr(eq + 1));
        pending.open = true;
    }
    commit_item(pending, multiline_keys);

    return doc;
}

Document parse_document(const std::string& text) {
    return parse_document(text, default_multiline_keys());
}

// ============================================================================
// Serialization
// ============================================================================

namespace {

// Escape comment characters that the parser would otherwise strip, and a
// backslash that the parser would otherwise read as an escape.
std::string escape_entry(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        const bool before_comment_char = i + 1 < s.size() && (s[i + 1] == ';' || s[i + 1] == '#');
        if ((c == ';' || c == '#') && (i == 0 || s[i - 1] == ' ' || s[i - 1] == '\t')) {
            out += '\\';
        } else if (c == '\\' && before_comment_char) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

} // anonymous namespace

std::string serialize_document(const Document& doc) {
    std::string out;
    bool first = true;
    for (const auto& name : doc.section_names()) {
        const Section* section = doc.find_section(name);
        if (!first) out += "\n";
        first = false;

        out += "[" + name + "]\n";
        for (const auto& key : section->keys()) {
            const Value* value = section->find(key);
            if (value->is_multiline()) {
                out += key + " =\n";
                for (const auto& line : value->as_lines()) {
                    out += "\t" + escape_entry(line) + "\n";
                }
            } else if (value->as_scalar().empty()) {
                out += key + " =\n";
            } else {
                out += key + " = " + escape_entry(value->as_scalar()) + "\n";
            }
        }
    }
    return out;
}

} // namespace inimerge
