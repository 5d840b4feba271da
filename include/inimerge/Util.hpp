#ifndef INIMERGE_UTIL_HPP
#define INIMERGE_UTIL_HPP

#include <string>
#include <vector>

namespace inimerge {

// Strip spaces, tabs and line terminators from both ends.
std::string trim(const std::string& s);

std::string to_lower(std::string s);

// Split text into lines. Accepts "\n" and "\r\n"; a trailing newline does not
// produce an extra empty line.
std::vector<std::string> split_lines(const std::string& text);

// True if the line is empty or only whitespace.
bool is_blank(const std::string& line);

// True if the first non-blank character is ';' or '#'.
bool is_comment_line(const std::string& line);

// True if the line starts with a space or a tab.
bool is_indented(const std::string& line);

// Remove an inline comment: a ';' or '#' preceded by whitespace starts a
// comment. "\;" and "\#" are unescaped and kept. The result is trimmed.
std::string strip_inline_comment(const std::string& s);

// Join with a separator.
std::string join(const std::vector<std::string>& parts, const std::string& sep);

} // namespace inimerge

#endif // INIMERGE_UTIL_HPP
