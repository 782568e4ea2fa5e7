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
 * File:   FileLock.h
 *
 */

#ifndef QUAY_FILELOCK_H
#define QUAY_FILELOCK_H

#include <string>


namespace QuayCommon
{

// -----------------------------------------------------------------------------
/**
 *  @class FileLock
 *  @brief Holds an exclusive flock() on a lock file for its lifetime.
 *
 *  The lock file is created if it doesn't exist and is never deleted.  Each
 *  instance opens its own descriptor, so two instances in the same process
 *  exclude each other as well as other processes.
 *
 */
class FileLock
{
public:
    explicit FileLock(const std::string& filePath);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

public:
    bool isLocked() const
    {
        return (mFd >= 0);
    }

    const std::string& path() const
    {
        return mFilePath;
    }

private:
    const std::string mFilePath;
    int mFd;
};

} // namespace QuayCommon

#endif // !defined(QUAY_FILELOCK_H)
