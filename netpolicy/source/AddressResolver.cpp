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
 * File:   AddressResolver.cpp
 *
 */
#include "AddressResolver.h"
#include "AddressUtils.h"
#include "IContainerRuntime.h"

#include <Logging.h>

#include <list>


AddressResolver::AddressResolver(const std::shared_ptr<IContainerRuntime>& runtime)
    : mRuntime(runtime)
{
}

// -----------------------------------------------------------------------------
/**
 *  @brief Returns the first IPv4 address bound to the container.
 *
 */
boost::optional<std::string> AddressResolver::resolveIPv4(const std::string& containerName) const
{
    const std::list<std::string> addresses = mRuntime->listAddresses(containerName);
    for (const std::string& address : addresses)
    {
        boost::optional<std::string> valid =
            AddressUtils::validateAddress(address, AF_INET);
        if (valid && !AddressUtils::isLinkLocal(*valid))
        {
            QUAY_LOG_DEBUG("container '%s' has IPv4 address %s",
                           containerName.c_str(), valid->c_str());
            return valid;
        }
    }

    QUAY_LOG_INFO("no IPv4 address found for container '%s'", containerName.c_str());
    return boost::none;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Returns the first routable IPv6 address bound to the container,
 *  link-local addresses are skipped as they can't be reached from outside.
 *
 */
boost::optional<std::string> AddressResolver::resolveIPv6(const std::string& containerName) const
{
    const std::list<std::string> addresses = mRuntime->listAddresses(containerName);
    for (const std::string& address : addresses)
    {
        boost::optional<std::string> valid =
            AddressUtils::validateAddress(address, AF_INET6);
        if (valid && !AddressUtils::isLinkLocal(*valid))
        {
            QUAY_LOG_DEBUG("container '%s' has IPv6 address %s",
                           containerName.c_str(), valid->c_str());
            return valid;
        }
    }

    QUAY_LOG_INFO("no IPv6 address found for container '%s'", containerName.c_str());
    return boost::none;
}

bool AddressResolver::containerExists(const std::string& containerName) const
{
    return mRuntime->containerExists(containerName);
}
