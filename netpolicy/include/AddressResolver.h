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
 * File:   AddressResolver.h
 *
 */
#ifndef ADDRESSRESOLVER_H
#define ADDRESSRESOLVER_H

#include <boost/optional.hpp>

#include <memory>
#include <string>

class IContainerRuntime;


// -----------------------------------------------------------------------------
/**
 *  @class AddressResolver
 *  @brief Looks up the current addresses of a container from the runtime.
 *
 *  Returns boost::none if the container has no address of the requested
 *  family, i.e. because it's stopped.
 */
class AddressResolver
{
public:
    explicit AddressResolver(const std::shared_ptr<IContainerRuntime>& runtime);
    ~AddressResolver() = default;

public:
    boost::optional<std::string> resolveIPv4(const std::string& containerName) const;
    boost::optional<std::string> resolveIPv6(const std::string& containerName) const;

    bool containerExists(const std::string& containerName) const;

private:
    const std::shared_ptr<IContainerRuntime> mRuntime;
};

#endif // !defined(ADDRESSRESOLVER_H)
