/*
* If not stated otherwise in this file or this component's LICENSE file the
* following copyright and licenses apply:
*
* Copyright 2024 Sky UK
*
* Licensed under the Apache License, Version 2.0 (the "License");
* you may not use this file except in compliance with the License.
* You may obtain a copy of the License at
*
* http://www.apache.org/licenses/LICENSE-2.0
*
* Unless required by applicable law or agreed to in writing, software
* distributed under the License is distributed on an "AS IS" BASIS,
* WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
* See the License for the specific language governing permissions and
* limitations under the License.
*/
/*
 * File:   FileUtilities.h
 *
 */

#ifndef QUAY_FILEUTILITIES_H
#define QUAY_FILEUTILITIES_H

#include <string>
#include <vector>
#include <sys/stat.h>

#include <boost/optional.hpp>


namespace QuayCommon
{

/**
 * @brief splits /a/path/to/somewhere to {a, path, to, somewhere}
 * @note This function works for both absolute and relative paths.
 */
std::vector<std::string> splitPath(const std::string& path);

/**
 * @brief Returns the directory part of a path, i.e. /a/b/c -> /a/b
 */
std::string dirName(const std::string& path);

/**
 * @brief Recursively creates directories. Equivalent of mkdir -p in bash.
 * @param path - a path to the directory to be created. Can be relative or absolute
 * @param mode - the file access mode to create the directory with (only applied to created directories)
 * @return true if the directories were created successfully.
 * @note Existing directories are not a cause for error.
 */
bool mkdirRecursive(const std::string& path, mode_t mode = S_IRWXU);

/**
 * @brief Returns true if path points to a file, directory or symlink.
 */
bool exists(const std::string& path);

/**
 * @brief Deletes the directory and all the sub files/directories.
 *
 * @param   directoryName   The name of the directory.
 */
void deleteDirectory(const std::string& directoryName);

/**
 * @brief deleteFile
 * @param filePath
 * @return Remove the file at the given location
 */
bool deleteFile(const std::string& filePath);

/**
 * @brief Reads the entire contents of a text file.
 *
 * @return boost::none if the file couldn't be opened or read, or if it is
 * bigger than @a maxSize bytes.
 */
boost::optional<std::string> readTextFile(const std::string& filePath,
                                          size_t maxSize = 4 * 1024 * 1024);

/**
 * @brief Creates a simple text file at the given path with the given contents, will truncate the file if it exists
 * @param filePath
 * @param contents
 * @param mode
 * @return true if the file was written
 */
bool createTextFile(const std::string& filePath, const std::string& contents, mode_t mode = S_IRUSR | S_IWUSR);

/**
 * @brief Replaces the contents of a file so that readers either see the old
 * contents or the new, never a partially written file.
 *
 * The contents are written to a temporary file in the same directory, synced
 * to disk and then renamed over @a filePath.
 *
 * @return true if the file was replaced, on failure the original file is
 * untouched.
 */
bool replaceFileAtomically(const std::string& filePath, const std::string& contents, mode_t mode = S_IRUSR | S_IWUSR);

} // namespace QuayCommon

#endif // !defined(QUAY_FILEUTILITIES_H)
