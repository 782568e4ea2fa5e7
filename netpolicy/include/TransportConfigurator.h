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
 * File:   TransportConfigurator.h
 *
 */
#ifndef TRANSPORTCONFIGURATOR_H
#define TRANSPORTCONFIGURATOR_H

#include "NetworkPolicyTypes.h"

#include <list>
#include <memory>
#include <string>

class INetlink;
class IProcessRunner;

#define QUAY_SIT_TUNNEL_IFACE       "quay6in4"
#define QUAY_RA_DROPIN_NAME         "quay-ipv6.conf"


// -----------------------------------------------------------------------------
/**
 *  @struct TransportRequest
 *  @brief The parameters for switching the IPv6 uplink method.
 *
 *  For the native method @a routedPrefix is the delegated prefix.
 */
struct TransportRequest
{
    TransportMethod method = TransportMethod::None;
    std::string routedPrefix;

    // 6in4
    std::string localV4;
    std::string serverV4;
    std::string clientV6;
    std::string serverV6;

    // wireguard, @a wgConfig is the complete wg-quick config file including
    // the private key
    std::string wgIface;
    std::string wgConfig;
};

// -----------------------------------------------------------------------------
/**
 *  @class TransportConfigurator
 *  @brief Brings up and tears down the IPv6 uplink methods.
 *
 *  Only one method is active at a time, the persisted TransportRecord says
 *  which one so it can be torn down before the next is brought up.  Router
 *  advertisement of the prefix on the bridge is done with a systemd-networkd
 *  drop-in.
 *
 */
class TransportConfigurator
{
public:
    TransportConfigurator(const std::shared_ptr<IProcessRunner>& runner,
                          const std::shared_ptr<INetlink>& netlink,
                          const std::string& systemctlPath,
                          const std::string& networkctlPath,
                          const std::string& wireguardDir,
                          const std::string& networkdDir);
    ~TransportConfigurator() = default;

public:
    PolicyResult validate(const TransportRequest& request,
                          TransportRecord* record) const;

    PolicyResult tearDown(const NetworkConfig& current);
    PolicyResult bringUp(const TransportRecord& record,
                         const TransportRequest& request,
                         const std::string& bridge);

    PolicyResult syncProxyNeighbours(const PolicyState* previous,
                                     const PolicyState& current);

public:
    std::string raDropInPath(const std::string& bridge) const;
    std::string wireguardConfigPath(const std::string& iface) const;

    static std::string renderRaDropIn(const std::string& prefix);

private:
    PolicyResult configureRouterAdvert(const std::string& bridge,
                                       const std::string& prefix);
    PolicyResult removeRouterAdvert(const std::string& bridge);

    PolicyResult run(const std::string& tool, const std::list<std::string>& args);

private:
    const std::shared_ptr<IProcessRunner> mRunner;
    const std::shared_ptr<INetlink> mNetlink;
    const std::string mSystemctlPath;
    const std::string mNetworkctlPath;
    const std::string mWireguardDir;
    const std::string mNetworkdDir;
};

#endif // !defined(TRANSPORTCONFIGURATOR_H)
