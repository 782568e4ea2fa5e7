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
 * File:   FileLock.cpp
 *
 */

#include "FileLock.h"

#include <Logging.h>

#include <cerrno>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>


using namespace QuayCommon;


FileLock::FileLock(const std::string& filePath)
    : mFilePath(filePath)
    , mFd(-1)
{
    int fd = open(mFilePath.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
    if (fd < 0)
    {
        QUAY_LOG_SYS_ERROR(errno, "failed to open lock file '%s'", mFilePath.c_str());
        return;
    }

    int ret;
    do
    {
        ret = flock(fd, LOCK_EX);
    } while ((ret != 0) && (errno == EINTR));

    if (ret != 0)
    {
        QUAY_LOG_SYS_ERROR(errno, "failed to lock '%s'", mFilePath.c_str());
        if (close(fd) != 0)
            QUAY_LOG_SYS_ERROR(errno, "failed to close lock file");
        return;
    }

    mFd = fd;
}

FileLock::~FileLock()
{
    if (mFd < 0)
        return;

    if (flock(mFd, LOCK_UN) != 0)
        QUAY_LOG_SYS_ERROR(errno, "failed to unlock '%s'", mFilePath.c_str());
    if (close(mFd) != 0)
        QUAY_LOG_SYS_ERROR(errno, "failed to close lock file '%s'", mFilePath.c_str());
}
