/**
 * @file Loader.hpp
 * @brief File boundary of the merge tool
 *
 * Reading inputs, writing the merged output without clobbering, and
 * generating example input files. The merge core never touches files.
 */

#ifndef INIMERGE_LOADER_HPP
#define INIMERGE_LOADER_HPP

#include <string>
#include <vector>

namespace inimerge {

/**
 * @brief Read a whole text file
 * @throws FileNotFoundError if @p path is not an existing regular file
 * @throws FileReadError if the file cannot be opened or read
 */
std::string read_text_file(const std::string& path);

/**
 * @brief Write text to a file
 *
 * @param path Destination path
 * @param text Content to write
 * @param overwrite Replace an existing file
 * @throws OutputExistsError if @p path exists and @p overwrite is false
 * @throws FileWriteError if the file cannot be written
 */
void write_text_file(const std::string& path, const std::string& text, bool overwrite);

/// True if something (file or directory) exists at @p path.
bool path_exists(const std::string& path);

/// Example base file written by create_example_files().
const std::string& example_base_text();

/// Example overlay file written by create_example_files().
const std::string& example_overlay_text();

/**
 * @brief Write `platformio.ini` and `overlay.ini` examples into a directory
 *
 * The directory is created if needed.
 *
 * @param directory Target directory
 * @param overwrite Replace existing example files
 * @return Paths of the files written
 * @throws OutputExistsError if a target exists and @p overwrite is false
 * @throws FileWriteError if the directory or a file cannot be written
 */
std::vector<std::string> create_example_files(const std::string& directory, bool overwrite);

} // namespace inimerge

#endif // INIMERGE_LOADER_HPP
