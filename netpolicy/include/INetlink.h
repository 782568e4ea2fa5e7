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
 * File:   INetlink.h
 *
 */
#ifndef INETLINK_H
#define INETLINK_H

#include <boost/optional.hpp>

#include <string>


// -----------------------------------------------------------------------------
/**
 *  @class INetlink
 *  @brief The kernel networking operations used by the engine.
 *
 *  Addresses and prefixes are passed in their text form, i.e. "2001:db8::/64".
 *  All functions return false on failure, having logged the reason.
 */
class INetlink
{
public:
    virtual ~INetlink() = default;

public:
    virtual bool ifaceExists(const std::string& ifaceName) const = 0;
    virtual bool ifaceUp(const std::string& ifaceName) = 0;

    // -------------------------------------------------------------------------
    /**
     *  @brief Returns the interface the default route for @a family goes out
     *  of, picking the lowest metric if there is more than one.
     */
    virtual boost::optional<std::string> defaultRouteIface(int family) const = 0;

public:
    virtual bool createSitTunnel(const std::string& ifaceName,
                                 const std::string& localV4,
                                 const std::string& remoteV4) = 0;
    virtual bool deleteLink(const std::string& ifaceName) = 0;

    virtual bool addIfaceAddress(const std::string& ifaceName,
                                 const std::string& addressWithPrefix) = 0;

    virtual bool addRoute6(const std::string& ifaceName,
                           const std::string& destination,
                           const std::string& gateway) = 0;
    virtual bool delRoute6(const std::string& ifaceName,
                           const std::string& destination) = 0;

public:
    virtual bool setProxyNdp(const std::string& ifaceName, bool enable) = 0;
    virtual bool addProxyNeighbour(const std::string& ifaceName,
                                   const std::string& address) = 0;
    virtual bool delProxyNeighbour(const std::string& ifaceName,
                                   const std::string& address) = 0;
};

#endif // !defined(INETLINK_H)
