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
 * File:   Netlink.h
 *
 */
#ifndef NETLINK_H
#define NETLINK_H

#include "INetlink.h"

#include <mutex>
#include <string>

struct nl_sock;


// -----------------------------------------------------------------------------
/**
 *  @class Netlink
 *  @brief Basic wrapper around the libnl netlink library
 *
 *  There is only expected to be one of these objects (i.e. a shared_ptr is
 *  passed around).  The object represents a single netlink socket.
 *
 *  At construction time a new netlink socket is opened, on destruction it is
 *  closed.
 *
 */
class Netlink : public INetlink
{
public:
    Netlink();
    ~Netlink() override;

    Netlink(const Netlink&) = delete;
    Netlink& operator=(const Netlink&) = delete;

public:
    bool isValid() const;

public:
    bool ifaceExists(const std::string& ifaceName) const override;
    bool ifaceUp(const std::string& ifaceName) override;

    boost::optional<std::string> defaultRouteIface(int family) const override;

public:
    bool createSitTunnel(const std::string& ifaceName,
                         const std::string& localV4,
                         const std::string& remoteV4) override;
    bool deleteLink(const std::string& ifaceName) override;

    bool addIfaceAddress(const std::string& ifaceName,
                         const std::string& addressWithPrefix) override;

    bool addRoute6(const std::string& ifaceName,
                   const std::string& destination,
                   const std::string& gateway) override;
    bool delRoute6(const std::string& ifaceName,
                   const std::string& destination) override;

public:
    bool setProxyNdp(const std::string& ifaceName, bool enable) override;
    bool addProxyNeighbour(const std::string& ifaceName,
                           const std::string& address) override;
    bool delProxyNeighbour(const std::string& ifaceName,
                           const std::string& address) override;

private:
    bool changeProxyNeighbour(const std::string& ifaceName,
                              const std::string& address, bool add);

private:
    struct nl_sock* mSocket;
    mutable std::mutex mLock;
};

#endif // !defined(NETLINK_H)
