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
 * File:   TransportConfigurator.cpp
 *
 */
#include "TransportConfigurator.h"
#include "AddressUtils.h"
#include "IProcessRunner.h"
#include "INetlink.h"

#include <Logging.h>
#include <FileUtilities.h>

#include <set>
#include <utility>


namespace
{

typedef std::set<std::pair<std::string, std::string>> ProxyEntries;

// the (upstream iface, address) pairs that should be published for the state
ProxyEntries wantedProxyEntries(const PolicyState& state)
{
    ProxyEntries entries;

    const NetworkConfig& config = state.config;
    if (!config.ipv6ProxyEnabled || config.ipv6Prefix.empty() ||
        config.ipv6ProxyUpstreamIface.empty())
        return entries;

    boost::optional<Cidr> prefix = AddressUtils::validateCidr(config.ipv6Prefix, AF_INET6);
    if (!prefix)
        return entries;

    for (const Ipv6AclEntry& acl : state.acls)
    {
        if (AddressUtils::cidrContains(*prefix, acl.containerIpv6))
            entries.emplace(config.ipv6ProxyUpstreamIface, acl.containerIpv6);
    }

    return entries;
}

} // namespace


TransportConfigurator::TransportConfigurator(const std::shared_ptr<IProcessRunner>& runner,
                                             const std::shared_ptr<INetlink>& netlink,
                                             const std::string& systemctlPath,
                                             const std::string& networkctlPath,
                                             const std::string& wireguardDir,
                                             const std::string& networkdDir)
    : mRunner(runner)
    , mNetlink(netlink)
    , mSystemctlPath(systemctlPath)
    , mNetworkctlPath(networkctlPath)
    , mWireguardDir(wireguardDir)
    , mNetworkdDir(networkdDir)
{
}

// -----------------------------------------------------------------------------
/**
 *  @brief Checks all the parameters for the requested method and fills in
 *  the record that will be persisted if the switch succeeds.
 *
 */
PolicyResult TransportConfigurator::validate(const TransportRequest& request,
                                             TransportRecord* record) const
{
    TransportRecord result;
    result.method = request.method;

    if (request.method == TransportMethod::None)
    {
        *record = result;
        return PolicyResult::success();
    }

    boost::optional<Cidr> prefix = AddressUtils::validateCidr(request.routedPrefix, AF_INET6);
    if (!prefix)
    {
        return PolicyResult::failure(PolicyError::Validation,
                                     "invalid IPv6 prefix '" + request.routedPrefix + "'");
    }
    result.routedPrefix = prefix->toString();

    if (request.method == TransportMethod::SixInFour)
    {
        boost::optional<std::string> localV4 = AddressUtils::validateAddress(request.localV4, AF_INET);
        boost::optional<std::string> serverV4 = AddressUtils::validateAddress(request.serverV4, AF_INET);
        boost::optional<Cidr> clientV6 = AddressUtils::validateCidr(request.clientV6, AF_INET6);
        boost::optional<std::string> serverV6 = AddressUtils::validateAddress(request.serverV6, AF_INET6);

        if (!localV4 || !serverV4)
            return PolicyResult::failure(PolicyError::Validation,
                                         "invalid 6in4 tunnel endpoint address");
        if (!clientV6)
            return PolicyResult::failure(PolicyError::Validation,
                                         "invalid 6in4 client address '" + request.clientV6 + "', expected <address>/<length>");
        if (!serverV6)
            return PolicyResult::failure(PolicyError::Validation,
                                         "invalid 6in4 server address '" + request.serverV6 + "'");

        result.tunnelIface = QUAY_SIT_TUNNEL_IFACE;
        result.localV4 = *localV4;
        result.serverV4 = *serverV4;
        result.clientV6 = clientV6->addressWithPrefix();
        result.serverV6 = *serverV6;
    }
    else if (request.method == TransportMethod::Wireguard)
    {
        if (!AddressUtils::isValidIfaceName(request.wgIface))
            return PolicyResult::failure(PolicyError::Validation,
                                         "invalid WireGuard interface name '" + request.wgIface + "'");

        if ((request.wgConfig.find("[Interface]") == std::string::npos) ||
            (request.wgConfig.find("[Peer]") == std::string::npos))
            return PolicyResult::failure(PolicyError::Validation,
                                         "WireGuard config needs an [Interface] and a [Peer] section");

        result.wgIface = request.wgIface;
    }

    *record = result;
    return PolicyResult::success();
}

// -----------------------------------------------------------------------------
/**
 *  @brief Removes everything the currently active method set up.
 *
 */
PolicyResult TransportConfigurator::tearDown(const NetworkConfig& current)
{
    QUAY_LOG_FN_ENTRY();

    const TransportRecord& record = current.transport;

    switch (record.method)
    {
        case TransportMethod::None:
        case TransportMethod::Native:
            break;

        case TransportMethod::SixInFour:
            if (!mNetlink->deleteLink(record.tunnelIface))
            {
                QUAY_LOG_FN_EXIT();
                return PolicyResult::failure(PolicyError::ExternalTool,
                                             "failed to delete tunnel '" + record.tunnelIface + "'");
            }
            break;

        case TransportMethod::Wireguard:
        {
            PolicyResult result = run(mSystemctlPath,
                                      { "disable", "--now", "wg-quick@" + record.wgIface });
            if (!result.ok())
            {
                QUAY_LOG_FN_EXIT();
                return result;
            }
            break;
        }
    }

    // the tunnel methods route the prefix to the bridge themselves
    if (((record.method == TransportMethod::SixInFour) ||
         (record.method == TransportMethod::Wireguard)) &&
        !record.routedPrefix.empty())
    {
        if (!mNetlink->delRoute6(current.bridge, record.routedPrefix))
        {
            QUAY_LOG_FN_EXIT();
            return PolicyResult::failure(PolicyError::ExternalTool,
                                         "failed to remove route for " + record.routedPrefix);
        }
    }

    if (record.method != TransportMethod::None)
    {
        QUAY_LOG_MILESTONE("tore down IPv6 transport '%s'",
                           transportMethodName(record.method));
    }

    QUAY_LOG_FN_EXIT();
    return PolicyResult::success();
}

// -----------------------------------------------------------------------------
/**
 *  @brief Brings up the method described by @a record.
 *
 *  @param[in]  record      The validated record.
 *  @param[in]  request     The original request, for the parts that aren't
 *                          persisted (i.e. the WireGuard config).
 *  @param[in]  bridge      The bridge the routed prefix is advertised on.
 */
PolicyResult TransportConfigurator::bringUp(const TransportRecord& record,
                                            const TransportRequest& request,
                                            const std::string& bridge)
{
    QUAY_LOG_FN_ENTRY();

    PolicyResult result;

    switch (record.method)
    {
        case TransportMethod::None:
            result = removeRouterAdvert(bridge);
            QUAY_LOG_FN_EXIT();
            return result;

        case TransportMethod::Native:
            break;

        case TransportMethod::SixInFour:
            if (!mNetlink->createSitTunnel(record.tunnelIface, record.localV4, record.serverV4) ||
                !mNetlink->ifaceUp(record.tunnelIface) ||
                !mNetlink->addIfaceAddress(record.tunnelIface, record.clientV6) ||
                !mNetlink->addRoute6(record.tunnelIface, "::/0", record.serverV6))
            {
                QUAY_LOG_FN_EXIT();
                return PolicyResult::failure(PolicyError::ExternalTool,
                                             "failed to set up 6in4 tunnel to " + record.serverV4);
            }
            break;

        case TransportMethod::Wireguard:
        {
            // with no config supplied the file already installed is reused,
            // this is how a previous tunnel is restored
            const std::string confPath = wireguardConfigPath(record.wgIface);
            if (!request.wgConfig.empty())
            {
                if (!QuayCommon::mkdirRecursive(mWireguardDir, 0700) ||
                    !QuayCommon::replaceFileAtomically(confPath, request.wgConfig, 0600))
                {
                    QUAY_LOG_FN_EXIT();
                    return PolicyResult::failure(PolicyError::ExternalTool,
                                                 "failed to write " + confPath);
                }
            }
            else if (!QuayCommon::exists(confPath))
            {
                QUAY_LOG_FN_EXIT();
                return PolicyResult::failure(PolicyError::NotFound,
                                             "no WireGuard config at " + confPath);
            }

            const std::string unit = "wg-quick@" + record.wgIface;
            result = run(mSystemctlPath, { "enable", unit });
            if (result.ok())
                result = run(mSystemctlPath, { "restart", unit });
            if (!result.ok())
            {
                QUAY_LOG_FN_EXIT();
                return result;
            }
            break;
        }
    }

    if ((record.method == TransportMethod::SixInFour) ||
        (record.method == TransportMethod::Wireguard))
    {
        if (!mNetlink->addRoute6(bridge, record.routedPrefix, std::string()))
        {
            QUAY_LOG_FN_EXIT();
            return PolicyResult::failure(PolicyError::ExternalTool,
                                         "failed to route " + record.routedPrefix + " to " + bridge);
        }
    }

    result = configureRouterAdvert(bridge, record.routedPrefix);
    if (result.ok())
    {
        QUAY_LOG_MILESTONE("IPv6 transport '%s' up, routing %s to '%s'",
                           transportMethodName(record.method),
                           record.routedPrefix.c_str(), bridge.c_str());
    }

    QUAY_LOG_FN_EXIT();
    return result;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Publishes the ACL addresses as proxy neighbours on the upstream
 *  interface, and withdraws any that are no longer wanted.
 *
 *  @param[in]  previous    The state before the change, or nullptr if not
 *                          known in which case nothing is withdrawn.
 *  @param[in]  current     The state now in force.
 */
PolicyResult TransportConfigurator::syncProxyNeighbours(const PolicyState* previous,
                                                        const PolicyState& current)
{
    const ProxyEntries wanted = wantedProxyEntries(current);
    const ProxyEntries existing = previous ? wantedProxyEntries(*previous) : ProxyEntries();

    for (const auto& entry : existing)
    {
        if (wanted.count(entry) != 0)
            continue;

        if (!mNetlink->delProxyNeighbour(entry.first, entry.second))
        {
            return PolicyResult::failure(PolicyError::ExternalTool,
                                         "failed to withdraw proxy entry for " + entry.second);
        }
    }

    // turn proxying off on an upstream that is no longer used
    if (previous && previous->config.ipv6ProxyEnabled &&
        !previous->config.ipv6ProxyUpstreamIface.empty() &&
        (!current.config.ipv6ProxyEnabled ||
         (previous->config.ipv6ProxyUpstreamIface != current.config.ipv6ProxyUpstreamIface)))
    {
        if (!mNetlink->setProxyNdp(previous->config.ipv6ProxyUpstreamIface, false))
            QUAY_LOG_WARN("failed to disable proxy_ndp on '%s'",
                          previous->config.ipv6ProxyUpstreamIface.c_str());
    }

    if (current.config.ipv6ProxyEnabled && !current.config.ipv6ProxyUpstreamIface.empty() &&
        !current.config.ipv6Prefix.empty())
    {
        if (!mNetlink->setProxyNdp(current.config.ipv6ProxyUpstreamIface, true))
        {
            return PolicyResult::failure(PolicyError::ExternalTool,
                                         "failed to enable proxy_ndp on " + current.config.ipv6ProxyUpstreamIface);
        }
    }

    for (const auto& entry : wanted)
    {
        if (!mNetlink->addProxyNeighbour(entry.first, entry.second))
        {
            return PolicyResult::failure(PolicyError::ExternalTool,
                                         "failed to publish proxy entry for " + entry.second);
        }
    }

    return PolicyResult::success();
}

std::string TransportConfigurator::raDropInPath(const std::string& bridge) const
{
    return mNetworkdDir + "/" + bridge + ".network.d/" QUAY_RA_DROPIN_NAME;
}

std::string TransportConfigurator::wireguardConfigPath(const std::string& iface) const
{
    return mWireguardDir + "/" + iface + ".conf";
}

// -----------------------------------------------------------------------------
/**
 *  @brief Returns the networkd drop-in that advertises @a prefix.
 */
std::string TransportConfigurator::renderRaDropIn(const std::string& prefix)
{
    return "# generated by quay, do not edit\n"
           "[Network]\n"
           "IPv6SendRA=yes\n"
           "\n"
           "[IPv6Prefix]\n"
           "Prefix=" + prefix + "\n";
}

PolicyResult TransportConfigurator::configureRouterAdvert(const std::string& bridge,
                                                          const std::string& prefix)
{
    const std::string path = raDropInPath(bridge);

    if (!QuayCommon::mkdirRecursive(QuayCommon::dirName(path), 0755) ||
        !QuayCommon::replaceFileAtomically(path, renderRaDropIn(prefix), 0644))
    {
        return PolicyResult::failure(PolicyError::ExternalTool,
                                     "failed to write " + path);
    }

    return run(mNetworkctlPath, { "reload" });
}

PolicyResult TransportConfigurator::removeRouterAdvert(const std::string& bridge)
{
    const std::string path = raDropInPath(bridge);
    if (!QuayCommon::exists(path))
        return PolicyResult::success();

    if (!QuayCommon::deleteFile(path))
    {
        return PolicyResult::failure(PolicyError::ExternalTool,
                                     "failed to remove " + path);
    }

    return run(mNetworkctlPath, { "reload" });
}

PolicyResult TransportConfigurator::run(const std::string& tool,
                                        const std::list<std::string>& args)
{
    const ProcessResult result = mRunner->run(tool, args);
    if (!result.succeeded())
    {
        std::string cmdLine = tool;
        for (const std::string& arg : args)
            cmdLine += " " + arg;

        QUAY_LOG_ERROR("'%s' failed - %s", cmdLine.c_str(), result.diagnostic().c_str());
        return PolicyResult::failure(PolicyError::ExternalTool,
                                     cmdLine + ": " + result.diagnostic());
    }

    return PolicyResult::success();
}
