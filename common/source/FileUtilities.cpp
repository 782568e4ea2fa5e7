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
 * File:   FileUtilities.cpp
 *
 */

#include "FileUtilities.h"

#include <Logging.h>

#include <unistd.h>
#include <sstream>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <errno.h>
#include <ftw.h>
#include <stdio.h>
#include <string.h>
#include <cstdlib>
#include <limits.h>


std::vector<std::string> QuayCommon::splitPath(const std::string& path)
{
    std::stringstream ss(path);
    std::vector<std::string> directories;
    std::string token;
    while(getline(ss, token, '/'))
    {
        if(!token.empty())
        {
            directories.emplace_back(std::move(token));
        }
    }
    return directories;
}

std::string QuayCommon::dirName(const std::string& path)
{
    const size_t slash = path.find_last_of('/');
    if (slash == std::string::npos)
        return std::string(".");
    else if (slash == 0)
        return std::string("/");
    else
        return path.substr(0, slash);
}

bool QuayCommon::mkdirRecursive(const std::string& path, mode_t mode /*= S_IRWXU*/)
{
    auto directories = QuayCommon::splitPath(path);
    if(!directories.empty())
    {
        //start with / if it's an absolute path
        std::string partial = path[0] == '/' ? "/" : "";
        for(size_t i = 0; i < directories.size(); ++i)
        {
            bool created = true;

            partial += directories[i] + "/";
            if(mkdir(partial.c_str(), mode) != 0)
            {
                //if the directory already exists errno is EEXIST. We're ignoring that.
                //if there's file where we want to create directory, errno is set to ENOTDIR.
                if(errno == EEXIST)
                {
                    created = false;
                }
                else
                {
                    return false;
                }
            }

            // the umask may have stripped some of the mode bits
            if (created && (chmod(partial.c_str(), mode) != 0))
            {
                return false;
            }
        }
    }

    return true;
}

bool QuayCommon::exists(const std::string& path)
{
    struct stat buffer;
    return stat (path.c_str(), &buffer) == 0;
}

static int delete_all(const char *fpath, const struct stat *, int tflag, struct FTW *)
{
    switch (tflag)
    {
    case FTW_DP:
        if (rmdir(fpath) != 0)
        {
            QUAY_LOG_SYS_ERROR(errno, "failed to remove directory '%s'", fpath);
            return 1;
        }
        break;

    case FTW_F:     // file
    case FTW_SL:    // un-followed sym-link
        if (unlink(fpath) != 0)
            QUAY_LOG_SYS_WARN(errno, "failed to unlink '%s'", fpath);
        break;

    default:
        QUAY_LOG_ERROR("Un-expected file type found in directory %s type(%d) exiting.", fpath, tflag);
        return 1;
    };

    return 0;
}

void QuayCommon::deleteDirectory(const std::string &directoryName)
{
    QUAY_LOG_FN_ENTRY();

    // walk depth first so the directories are empty by the time we get to them
    if (nftw(directoryName.c_str(), delete_all, 20, (FTW_PHYS | FTW_DEPTH)) == -1)
    {
        QUAY_LOG_WARN("failed to delete %s", directoryName.c_str());
    }

    QUAY_LOG_FN_EXIT();
}

bool QuayCommon::deleteFile(const std::string & filePath)
{
    return unlink(filePath.c_str()) == 0;
}

boost::optional<std::string> QuayCommon::readTextFile(const std::string& filePath,
                                                      size_t maxSize)
{
    int fd = open(filePath.c_str(), O_CLOEXEC | O_RDONLY);
    if (fd < 0)
    {
        if (errno != ENOENT)
            QUAY_LOG_SYS_ERROR(errno, "failed to open '%s'", filePath.c_str());
        return boost::none;
    }

    std::string contents;
    contents.reserve(1024);

    ssize_t n;
    char buf[512];

    while ((n = TEMP_FAILURE_RETRY(read(fd, buf, sizeof(buf)))) > 0)
    {
        contents.append(buf, n);

        if (contents.size() > maxSize)
        {
            n = -1;
            errno = EFBIG;
            break;
        }
    }

    if (n < 0)
    {
        QUAY_LOG_SYS_ERROR(errno, "failed to read '%s'", filePath.c_str());
        close(fd);
        return boost::none;
    }

    if (close(fd) != 0)
    {
        QUAY_LOG_SYS_ERROR(errno, "failed to close '%s'", filePath.c_str());
    }

    return contents;
}

static bool writeAll(int fd, const std::string& contents, const std::string& filePath)
{
    const char* dataPtr = contents.data();
    size_t remaining = contents.size();

    while (remaining > 0)
    {
        ssize_t ret = TEMP_FAILURE_RETRY(write(fd, dataPtr, remaining));
        if (ret < 0)
        {
            QUAY_LOG_SYS_ERROR(errno, "failed to write %zu bytes to '%s' file", remaining, filePath.c_str());
            break;
        }
        else if (ret == 0)
        {
            QUAY_LOG_ERROR("didn't write any data, odd");
            break;
        }

        remaining -= static_cast<size_t>(ret);
        dataPtr += ret;
    }

    return (remaining == 0);
}

bool QuayCommon::createTextFile(const std::string& filePath, const std::string& contents, mode_t mode)
{
    int fd = open(filePath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0)
    {
        QUAY_LOG_SYS_ERROR(errno, "failed to create '%s'", filePath.c_str());
        return false;
    }

    bool success = writeAll(fd, contents, filePath);

    // the umask may have stripped some of the bits, so enforce the mode
    if (fchmod(fd, mode) < 0)
    {
        QUAY_LOG_SYS_WARN(errno, "failed to set mode on file to 0%03o", mode);
    }

    if (close(fd) != 0)
    {
        QUAY_LOG_SYS_WARN(errno, "failed to close file '%s'", filePath.c_str());
    }

    return success;
}

bool QuayCommon::replaceFileAtomically(const std::string& filePath, const std::string& contents, mode_t mode)
{
    QUAY_LOG_FN_ENTRY();

    // the temporary file must be on the same file system for the rename to
    // be atomic, so create it beside the target
    std::string tmpPath = filePath + ".XXXXXX";
    int fd = mkostemp(&tmpPath[0], O_CLOEXEC);
    if (fd < 0)
    {
        QUAY_LOG_SYS_ERROR_EXIT(errno, "failed to create temporary file for '%s'",
                                filePath.c_str());
        return false;
    }

    bool success = writeAll(fd, contents, tmpPath);

    if (success && (fchmod(fd, mode) != 0))
    {
        QUAY_LOG_SYS_ERROR(errno, "failed to set mode 0%03o on '%s'", mode,
                           tmpPath.c_str());
        success = false;
    }

    if (success && (fsync(fd) != 0))
    {
        QUAY_LOG_SYS_ERROR(errno, "failed to sync '%s'", tmpPath.c_str());
        success = false;
    }

    if (close(fd) != 0)
    {
        QUAY_LOG_SYS_ERROR(errno, "failed to close '%s'", tmpPath.c_str());
        success = false;
    }

    if (success && (rename(tmpPath.c_str(), filePath.c_str()) != 0))
    {
        QUAY_LOG_SYS_ERROR(errno, "failed to rename '%s' to '%s'",
                           tmpPath.c_str(), filePath.c_str());
        success = false;
    }

    if (!success)
    {
        unlink(tmpPath.c_str());
        QUAY_LOG_FN_EXIT();
        return false;
    }

    // sync the directory so the rename itself survives a power cut
    const std::string dirPath = dirName(filePath);
    int dirFd = open(dirPath.c_str(), O_CLOEXEC | O_DIRECTORY | O_RDONLY);
    if (dirFd < 0)
    {
        QUAY_LOG_SYS_WARN(errno, "failed to open directory '%s'", dirPath.c_str());
    }
    else
    {
        if (fsync(dirFd) != 0)
            QUAY_LOG_SYS_WARN(errno, "failed to sync directory '%s'", dirPath.c_str());
        close(dirFd);
    }

    QUAY_LOG_FN_EXIT();
    return true;
}
