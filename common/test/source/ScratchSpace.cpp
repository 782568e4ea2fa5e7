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
 * File:   ScratchSpace.cpp
 *
 */

#include "ScratchSpace.h"
#include <FileUtilities.h>


#include <stdexcept>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>


using namespace QuayCommon;


ScratchSpace::ScratchSpace(const std::string& parentDir)
{
    initialise(parentDir);
}

ScratchSpace::ScratchSpace(const FixedPath& fixedPath)
{
    initialise(fixedPath);
}

ScratchSpace::ScratchSpace(ScratchSpace&& other)
    : mPath(std::move(other.mPath))
{
    other.mPath.clear();
}

ScratchSpace::~ScratchSpace()
{
    if (!mPath.empty())
    {
        deleteDirectory(mPath);
    }
}

void ScratchSpace::initialise(const std::string& parentDir)
{
    std::string templ = parentDir + "/scratch.XXXXXX";
    if (mkdtemp(&templ[0]) == nullptr)
    {
        throw std::runtime_error("failed to create scratch space in '" +
                                 parentDir + "' - " + strerror(errno));
    }

    mPath = templ;
}

void ScratchSpace::initialise(const FixedPath& fixedPath)
{
    if (!mkdirRecursive(fixedPath.path, S_IRWXU))
    {
        throw std::runtime_error("failed to create scratch space '" +
                                 fixedPath.path + "' - " + strerror(errno));
    }

    mPath = fixedPath.path;
}

const std::string& ScratchSpace::path() const
{
    return mPath;
}
