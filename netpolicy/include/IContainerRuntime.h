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
 * File:   IContainerRuntime.h
 *
 */
#ifndef ICONTAINERRUNTIME_H
#define ICONTAINERRUNTIME_H

#include <list>
#include <string>


// -----------------------------------------------------------------------------
/**
 *  @class IContainerRuntime
 *  @brief The bits of the container runtime the policy engine needs.
 *
 */
class IContainerRuntime
{
public:
    virtual ~IContainerRuntime() = default;

    // -------------------------------------------------------------------------
    /**
     *  @brief Returns the addresses currently bound to the container, in the
     *  order the runtime reports them.  Empty if the container isn't running.
     */
    virtual std::list<std::string> listAddresses(const std::string& containerName) = 0;

    virtual bool containerExists(const std::string& containerName) = 0;
};

#endif // !defined(ICONTAINERRUNTIME_H)
