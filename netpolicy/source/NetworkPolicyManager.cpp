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
 * File:   NetworkPolicyManager.cpp
 *
 */
#include "NetworkPolicyManager.h"
#include "AddressResolver.h"
#include "AddressUtils.h"
#include "ConfigStore.h"
#include "IFirewallBackend.h"
#include "INetlink.h"
#include "IptablesBackend.h"
#include "LifecycleSynchronizer.h"
#include "NftablesBackend.h"

#include <FileLock.h>
#include <FileUtilities.h>
#include <IQuaySettings.h>
#include <Logging.h>

#include <algorithm>


NetworkPolicyManager::NetworkPolicyManager(const std::shared_ptr<const IQuaySettings>& settings,
                                           const std::shared_ptr<IProcessRunner>& runner,
                                           const std::shared_ptr<IContainerRuntime>& runtime,
                                           const std::shared_ptr<INetlink>& netlink)
    : mSettings(settings)
    , mNetlink(netlink)
    , mStore(new ConfigStore(settings->stateDir(), settings->networkDefaults()))
    , mResolver(new AddressResolver(runtime))
{
    const IQuaySettings::ToolPaths& tools = settings->toolPaths();

    mTransport.reset(new TransportConfigurator(runner, netlink,
                                               tools.systemctl, tools.networkctl,
                                               settings->wireguardDir(),
                                               settings->networkdDir()));

    mBackends[NatBackend::Nftables].reset(
        new NftablesBackend(runner, tools.nft, settings->nftRulesetPath()));
    mBackends[NatBackend::Iptables].reset(
        new IptablesBackend(runner, tools.iptables, tools.iptablesSave));
}

NetworkPolicyManager::~NetworkPolicyManager()
{
}

// -----------------------------------------------------------------------------
/**
 *  @brief Returns the persisted state with the WAN interface resolved.
 *
 */
PolicyState NetworkPolicyManager::getState()
{
    std::lock_guard<std::mutex> locker(mLock);
    std::unique_ptr<QuayCommon::FileLock> stateLock = lockStateDir();
    if (!stateLock)
        QUAY_LOG_WARN("reading network state without holding the state lock");

    return loadState();
}

// -----------------------------------------------------------------------------
/**
 *  @brief Renders the persisted state with the active backend without
 *  installing anything.
 *
 */
PolicyResult NetworkPolicyManager::renderActive(std::string* rendered)
{
    std::lock_guard<std::mutex> locker(mLock);
    std::unique_ptr<QuayCommon::FileLock> stateLock = lockStateDir();
    if (!stateLock)
        return stateLockFailure();

    const PolicyState state = loadState();
    *rendered = backend(state.config.natBackend)->render(state);

    return PolicyResult::success();
}

// -----------------------------------------------------------------------------
/**
 *  @brief Re-installs the rules for the persisted state.
 *
 *  This is the recovery path after a failed apply.  The iptables backend is
 *  flushed first so anything left over from the failed attempt is removed,
 *  an nftables load replaces the owned tables in one transaction so needs
 *  no flush.
 *
 */
PolicyResult NetworkPolicyManager::reapply()
{
    QUAY_LOG_FN_ENTRY();

    std::lock_guard<std::mutex> locker(mLock);
    std::unique_ptr<QuayCommon::FileLock> stateLock = lockStateDir();
    if (!stateLock)
    {
        QUAY_LOG_FN_EXIT();
        return stateLockFailure();
    }

    const PolicyState state = loadState();
    IFirewallBackend* active = backend(state.config.natBackend);

    PolicyResult result;
    if (active->type() == NatBackend::Iptables)
        result = active->flush();
    if (result.ok())
        result = active->apply(state, nullptr);
    if (result.ok())
        result = mTransport->syncProxyNeighbours(nullptr, state);

    if (result.ok())
        QUAY_LOG_MILESTONE("re-applied %s rules", natBackendName(active->type()));

    QUAY_LOG_FN_EXIT();
    return result;
}

PolicyResult NetworkPolicyManager::setBridge(const std::string& bridge)
{
    if (!AddressUtils::isValidIfaceName(bridge))
    {
        return PolicyResult::failure(PolicyError::Validation,
                                     "invalid bridge name '" + bridge + "'");
    }

    std::lock_guard<std::mutex> locker(mLock);
    std::unique_ptr<QuayCommon::FileLock> stateLock = lockStateDir();
    if (!stateLock)
        return stateLockFailure();

    const PolicyState previous = loadState();

    // the prefix route and router advert are bound to the bridge
    if (previous.config.transport.method != TransportMethod::None)
    {
        return PolicyResult::failure(PolicyError::Validation,
                                     "disable the IPv6 transport before changing the bridge");
    }

    PolicyState next = previous;
    next.config.bridge = bridge;

    return commit(previous, next);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Sets the IPv4 addressing plan for the bridge.
 *
 *  The gateway must be a host address inside @a cidr.
 */
PolicyResult NetworkPolicyManager::setLan4(const std::string& cidr,
                                           const std::string& gateway)
{
    boost::optional<Cidr> lan = AddressUtils::validateCidr(cidr, AF_INET);
    if (!lan)
    {
        return PolicyResult::failure(PolicyError::Validation,
                                     "invalid IPv4 CIDR '" + cidr + "'");
    }

    boost::optional<std::string> gw = AddressUtils::validateAddress(gateway, AF_INET);
    if (!gw || !AddressUtils::cidrContains(*lan, *gw) || (*gw == lan->network))
    {
        return PolicyResult::failure(PolicyError::Validation,
                                     "gateway '" + gateway + "' is not a host address in " +
                                     lan->toString());
    }

    std::lock_guard<std::mutex> locker(mLock);
    std::unique_ptr<QuayCommon::FileLock> stateLock = lockStateDir();
    if (!stateLock)
        return stateLockFailure();

    const PolicyState previous = loadState();
    PolicyState next = previous;
    next.config.lan4Cidr = lan->toString();
    next.config.lan4Gateway = *gw;

    for (const PortMapEntry& entry : next.portMaps)
    {
        if (!AddressUtils::cidrContains(*lan, entry.containerIpv4))
        {
            QUAY_LOG_WARN("port map %s/%u targets %s which is outside %s",
                          protocolName(entry.protocol), entry.hostPort,
                          entry.containerIpv4.c_str(), next.config.lan4Cidr.c_str());
        }
    }

    return commit(previous, next);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Sets the WAN interface, 'auto' (or an empty string) goes back to
 *  detecting it from the default route.
 *
 */
PolicyResult NetworkPolicyManager::setWanInterface(const std::string& iface)
{
    const bool automatic = iface.empty() || (iface == "auto");

    if (!automatic)
    {
        if (!AddressUtils::isValidIfaceName(iface))
        {
            return PolicyResult::failure(PolicyError::Validation,
                                         "invalid interface name '" + iface + "'");
        }
        if (!mNetlink->ifaceExists(iface))
        {
            return PolicyResult::failure(PolicyError::NotFound,
                                         "no interface called '" + iface + "'");
        }
    }

    std::lock_guard<std::mutex> locker(mLock);
    std::unique_ptr<QuayCommon::FileLock> stateLock = lockStateDir();
    if (!stateLock)
        return stateLockFailure();

    const PolicyState previous = loadState();
    PolicyState next = previous;
    if (automatic)
        next.config.wanIface.reset();
    else
        next.config.wanIface = iface;

    return commit(previous, next);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Changes the authoritative firewall backend.
 *
 *  The outgoing backend's rules are flushed before the new one is applied,
 *  if the flush fails the switch is refused with BackendConflict.
 */
PolicyResult NetworkPolicyManager::setNatBackend(NatBackend type)
{
    std::lock_guard<std::mutex> locker(mLock);
    std::unique_ptr<QuayCommon::FileLock> stateLock = lockStateDir();
    if (!stateLock)
        return stateLockFailure();

    const PolicyState previous = loadState();
    PolicyState next = previous;
    next.config.natBackend = type;

    return commit(previous, next);
}

PolicyResult NetworkPolicyManager::setIpv6Proxy(bool enabled,
                                                const std::string& upstreamIface)
{
    if (!upstreamIface.empty() && !AddressUtils::isValidIfaceName(upstreamIface))
    {
        return PolicyResult::failure(PolicyError::Validation,
                                     "invalid interface name '" + upstreamIface + "'");
    }

    std::lock_guard<std::mutex> locker(mLock);
    std::unique_ptr<QuayCommon::FileLock> stateLock = lockStateDir();
    if (!stateLock)
        return stateLockFailure();

    const PolicyState previous = loadState();
    PolicyState next = previous;

    if (enabled)
    {
        if (previous.config.ipv6Prefix.empty())
        {
            return PolicyResult::failure(PolicyError::Validation,
                                         "the IPv6 proxy needs a routed IPv6 prefix");
        }

        std::string upstream = upstreamIface;
        if (upstream.empty() && previous.config.wanIface)
            upstream = previous.config.wanIface.get();
        if (upstream.empty())
        {
            return PolicyResult::failure(PolicyError::Validation,
                                         "no upstream interface given and no WAN interface known");
        }

        next.config.ipv6ProxyUpstreamIface = upstream;
    }
    else if (!upstreamIface.empty())
    {
        next.config.ipv6ProxyUpstreamIface = upstreamIface;
    }

    next.config.ipv6ProxyEnabled = enabled;

    return commit(previous, next);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Adds a port forward from @a hostPort on the host to
 *  @a containerPort in the container.
 *
 *  If @a containerIpv4 is empty the address is looked up from the runtime,
 *  it is a snapshot and needs refreshPortMaps() if the container's address
 *  changes.  An existing entry with the same protocol and host port is
 *  replaced.
 */
PolicyResult NetworkPolicyManager::addPortMap(const std::string& containerName,
                                              Protocol protocol,
                                              unsigned long hostPort,
                                              unsigned long containerPort,
                                              const std::string& containerIpv4)
{
    QUAY_LOG_FN_ENTRY();

    if (!AddressUtils::isValidContainerName(containerName))
    {
        QUAY_LOG_FN_EXIT();
        return PolicyResult::failure(PolicyError::Validation,
                                     "invalid container name '" + containerName + "'");
    }

    boost::optional<uint16_t> host = AddressUtils::validatePort(hostPort);
    boost::optional<uint16_t> target = AddressUtils::validatePort(containerPort);
    if (!host || !target)
    {
        QUAY_LOG_FN_EXIT();
        return PolicyResult::failure(PolicyError::Validation,
                                     "ports must be in the range 1-65535");
    }

    boost::optional<std::string> address;
    if (!containerIpv4.empty())
    {
        address = AddressUtils::validateAddress(containerIpv4, AF_INET);
        if (!address)
        {
            QUAY_LOG_FN_EXIT();
            return PolicyResult::failure(PolicyError::Validation,
                                         "invalid IPv4 address '" + containerIpv4 + "'");
        }
    }

    std::lock_guard<std::mutex> locker(mLock);
    std::unique_ptr<QuayCommon::FileLock> stateLock = lockStateDir();
    if (!stateLock)
    {
        QUAY_LOG_FN_EXIT();
        return stateLockFailure();
    }

    PolicyResult result = checkContainer(containerName);
    if (!result.ok())
    {
        QUAY_LOG_FN_EXIT();
        return result;
    }

    if (!address)
    {
        address = mResolver->resolveIPv4(containerName);
        if (!address)
        {
            QUAY_LOG_FN_EXIT();
            return PolicyResult::failure(PolicyError::NotFound,
                                         "container '" + containerName + "' has no IPv4 address");
        }
    }

    PortMapEntry entry;
    entry.containerName = containerName;
    entry.protocol = protocol;
    entry.hostPort = host.get();
    entry.containerPort = target.get();
    entry.containerIpv4 = address.get();

    const PolicyState previous = loadState();
    PolicyState next = previous;

    auto it = std::find_if(next.portMaps.begin(), next.portMaps.end(),
                           [&](const PortMapEntry& existing)
                           {
                               return existing.sameKey(entry);
                           });
    if (it != next.portMaps.end())
    {
        QUAY_LOG_INFO("replacing port map %s/%u (was to '%s')",
                      protocolName(entry.protocol), entry.hostPort,
                      it->containerName.c_str());
        *it = entry;
    }
    else
    {
        next.portMaps.push_back(entry);
    }

    result = commit(previous, next);
    if (result.ok())
    {
        QUAY_LOG_MILESTONE("port map %s/%u -> %s:%u (%s) added",
                           protocolName(entry.protocol), entry.hostPort,
                           entry.containerIpv4.c_str(), entry.containerPort,
                           containerName.c_str());
    }

    QUAY_LOG_FN_EXIT();
    return result;
}

PolicyResult NetworkPolicyManager::removePortMap(Protocol protocol,
                                                 unsigned long hostPort)
{
    boost::optional<uint16_t> port = AddressUtils::validatePort(hostPort);
    if (!port)
    {
        return PolicyResult::failure(PolicyError::Validation,
                                     "ports must be in the range 1-65535");
    }

    std::lock_guard<std::mutex> locker(mLock);
    std::unique_ptr<QuayCommon::FileLock> stateLock = lockStateDir();
    if (!stateLock)
        return stateLockFailure();

    const PolicyState previous = loadState();
    PolicyState next = previous;

    auto it = std::find_if(next.portMaps.begin(), next.portMaps.end(),
                           [&](const PortMapEntry& entry)
                           {
                               return (entry.protocol == protocol) &&
                                      (entry.hostPort == port.get());
                           });
    if (it == next.portMaps.end())
    {
        return PolicyResult::failure(PolicyError::NotFound,
                                     std::string("no port map for ") +
                                     protocolName(protocol) + "/" + std::to_string(hostPort));
    }

    next.portMaps.erase(it);

    return commit(previous, next);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Re-resolves the container's IPv4 address and updates all of its
 *  port maps to point at it.
 *
 */
PolicyResult NetworkPolicyManager::refreshPortMaps(const std::string& containerName)
{
    if (!AddressUtils::isValidContainerName(containerName))
    {
        return PolicyResult::failure(PolicyError::Validation,
                                     "invalid container name '" + containerName + "'");
    }

    std::lock_guard<std::mutex> locker(mLock);
    std::unique_ptr<QuayCommon::FileLock> stateLock = lockStateDir();
    if (!stateLock)
        return stateLockFailure();

    const PolicyState previous = loadState();
    PolicyState next = previous;

    const size_t owned = std::count_if(next.portMaps.begin(), next.portMaps.end(),
                                       [&](const PortMapEntry& entry)
                                       {
                                           return (entry.containerName == containerName);
                                       });
    if (owned == 0)
    {
        return PolicyResult::failure(PolicyError::NotFound,
                                     "container '" + containerName + "' has no port maps");
    }

    boost::optional<std::string> address = mResolver->resolveIPv4(containerName);
    if (!address)
    {
        return PolicyResult::failure(PolicyError::NotFound,
                                     "container '" + containerName + "' has no IPv4 address");
    }

    for (PortMapEntry& entry : next.portMaps)
    {
        if (entry.containerName == containerName)
            entry.containerIpv4 = address.get();
    }

    QUAY_LOG_INFO("refreshing %zu port maps of '%s' to %s",
                  owned, containerName.c_str(), address->c_str());

    return commit(previous, next);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Allows inbound IPv6 traffic to @a destPort on the container.
 *
 *  The address doesn't have to be inside the routed prefix, it only has to
 *  be reachable.
 */
PolicyResult NetworkPolicyManager::addAcl(const std::string& containerName,
                                          Protocol protocol,
                                          unsigned long destPort,
                                          const std::string& containerIpv6)
{
    QUAY_LOG_FN_ENTRY();

    if (!AddressUtils::isValidContainerName(containerName))
    {
        QUAY_LOG_FN_EXIT();
        return PolicyResult::failure(PolicyError::Validation,
                                     "invalid container name '" + containerName + "'");
    }

    boost::optional<uint16_t> port = AddressUtils::validatePort(destPort);
    if (!port)
    {
        QUAY_LOG_FN_EXIT();
        return PolicyResult::failure(PolicyError::Validation,
                                     "ports must be in the range 1-65535");
    }

    boost::optional<std::string> address;
    if (!containerIpv6.empty())
    {
        address = AddressUtils::validateAddress(containerIpv6, AF_INET6);
        if (!address)
        {
            QUAY_LOG_FN_EXIT();
            return PolicyResult::failure(PolicyError::Validation,
                                         "invalid IPv6 address '" + containerIpv6 + "'");
        }
    }

    std::lock_guard<std::mutex> locker(mLock);
    std::unique_ptr<QuayCommon::FileLock> stateLock = lockStateDir();
    if (!stateLock)
    {
        QUAY_LOG_FN_EXIT();
        return stateLockFailure();
    }

    PolicyResult result = checkContainer(containerName);
    if (!result.ok())
    {
        QUAY_LOG_FN_EXIT();
        return result;
    }

    if (!address)
    {
        address = mResolver->resolveIPv6(containerName);
        if (!address)
        {
            QUAY_LOG_FN_EXIT();
            return PolicyResult::failure(PolicyError::NotFound,
                                         "container '" + containerName + "' has no IPv6 address");
        }
    }

    Ipv6AclEntry entry;
    entry.containerName = containerName;
    entry.protocol = protocol;
    entry.destPort = port.get();
    entry.containerIpv6 = address.get();

    const PolicyState previous = loadState();
    PolicyState next = previous;

    if (next.config.natBackend == NatBackend::Iptables)
    {
        QUAY_LOG_WARN("the iptables backend doesn't enforce IPv6 ACLs, "
                      "the entry is stored but has no effect");
    }

    auto it = std::find_if(next.acls.begin(), next.acls.end(),
                           [&](const Ipv6AclEntry& existing)
                           {
                               return existing.sameKey(entry);
                           });
    if (it != next.acls.end())
        *it = entry;
    else
        next.acls.push_back(entry);

    result = commit(previous, next);
    if (result.ok())
    {
        QUAY_LOG_MILESTONE("IPv6 ACL %s/%u to [%s] (%s) added",
                           protocolName(entry.protocol), entry.destPort,
                           entry.containerIpv6.c_str(), containerName.c_str());
    }

    QUAY_LOG_FN_EXIT();
    return result;
}

PolicyResult NetworkPolicyManager::removeAcl(Protocol protocol,
                                             unsigned long destPort,
                                             const std::string& containerIpv6)
{
    boost::optional<uint16_t> port = AddressUtils::validatePort(destPort);
    if (!port)
    {
        return PolicyResult::failure(PolicyError::Validation,
                                     "ports must be in the range 1-65535");
    }

    boost::optional<std::string> address = AddressUtils::validateAddress(containerIpv6, AF_INET6);
    if (!address)
    {
        return PolicyResult::failure(PolicyError::Validation,
                                     "invalid IPv6 address '" + containerIpv6 + "'");
    }

    std::lock_guard<std::mutex> locker(mLock);
    std::unique_ptr<QuayCommon::FileLock> stateLock = lockStateDir();
    if (!stateLock)
        return stateLockFailure();

    const PolicyState previous = loadState();
    PolicyState next = previous;

    auto it = std::find_if(next.acls.begin(), next.acls.end(),
                           [&](const Ipv6AclEntry& entry)
                           {
                               return (entry.protocol == protocol) &&
                                      (entry.destPort == port.get()) &&
                                      (entry.containerIpv6 == address.get());
                           });
    if (it == next.acls.end())
    {
        return PolicyResult::failure(PolicyError::NotFound,
                                     std::string("no ACL for ") + protocolName(protocol) +
                                     "/" + std::to_string(destPort) + " to " + address.get());
    }

    next.acls.erase(it);

    return commit(previous, next);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Called when a container has been deleted, removes all the port
 *  maps and ACLs that reference it and re-applies.
 *
 */
PolicyResult NetworkPolicyManager::onContainerDeleted(const std::string& containerName)
{
    if (!AddressUtils::isValidContainerName(containerName))
    {
        return PolicyResult::failure(PolicyError::Validation,
                                     "invalid container name '" + containerName + "'");
    }

    std::lock_guard<std::mutex> locker(mLock);
    std::unique_ptr<QuayCommon::FileLock> stateLock = lockStateDir();
    if (!stateLock)
        return stateLockFailure();

    const PolicyState previous = loadState();
    PolicyState next = previous;

    if (LifecycleSynchronizer::purgeContainer(containerName, &next) == 0)
    {
        QUAY_LOG_DEBUG("container '%s' had no network policy", containerName.c_str());
        return PolicyResult::success();
    }

    return commit(previous, next);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Switches the IPv6 uplink to the requested method.
 *
 *  The current method is torn down, the new one brought up and then the
 *  rules re-applied with the new prefix.  If bringing up the new method or
 *  applying fails the previous method is restored and nothing is persisted.
 *
 *  ACLs for addresses outside the new prefix are left in place.
 */
PolicyResult NetworkPolicyManager::configureIpv6Transport(const TransportRequest& request)
{
    QUAY_LOG_FN_ENTRY();

    TransportRecord record;
    PolicyResult result = mTransport->validate(request, &record);
    if (!result.ok())
    {
        QUAY_LOG_FN_EXIT();
        return result;
    }

    std::lock_guard<std::mutex> locker(mLock);
    std::unique_ptr<QuayCommon::FileLock> stateLock = lockStateDir();
    if (!stateLock)
    {
        QUAY_LOG_FN_EXIT();
        return stateLockFailure();
    }

    const PolicyState previous = loadState();

    // bringing up WireGuard on the same interface overwrites the installed
    // config, keep it so a failed change can put it back
    std::string previousWgConfig;
    if (previous.config.transport.method == TransportMethod::Wireguard)
    {
        const std::string confPath =
            mTransport->wireguardConfigPath(previous.config.transport.wgIface);
        boost::optional<std::string> contents = QuayCommon::readTextFile(confPath);
        if (contents)
            previousWgConfig = contents.get();
        else
            QUAY_LOG_WARN("can't read the installed WireGuard config '%s'", confPath.c_str());
    }

    result = mTransport->tearDown(previous.config);
    if (!result.ok())
    {
        QUAY_LOG_ERROR_EXIT("failed to tear down the current IPv6 transport");
        return result;
    }

    result = mTransport->bringUp(record, request, previous.config.bridge);
    if (!result.ok())
    {
        restoreTransport(previous.config, record, previousWgConfig);
        QUAY_LOG_FN_EXIT();
        return result;
    }

    PolicyState next = previous;
    next.config.transport = record;
    next.config.ipv6Prefix = record.routedPrefix;
    if (next.config.ipv6Prefix.empty())
        next.config.ipv6ProxyEnabled = false;

    boost::optional<Cidr> prefix = AddressUtils::validateCidr(next.config.ipv6Prefix, AF_INET6);
    if (prefix)
    {
        for (const Ipv6AclEntry& acl : next.acls)
        {
            if (!AddressUtils::cidrContains(*prefix, acl.containerIpv6))
            {
                QUAY_LOG_WARN("ACL to [%s] is outside the new prefix %s",
                              acl.containerIpv6.c_str(), prefix->toString().c_str());
            }
        }
    }

    result = commit(previous, next);
    if (!result.ok())
        restoreTransport(previous.config, record, previousWgConfig);

    QUAY_LOG_FN_EXIT();
    return result;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Loads the persisted state and fills in the WAN interface if it's
 *  not configured.
 *
 */
PolicyState NetworkPolicyManager::loadState() const
{
    PolicyState state;
    state.config = mStore->load();
    state.portMaps = mStore->loadPortMaps();
    state.acls = mStore->loadAcls();

    resolveWan(&state.config);

    return state;
}

void NetworkPolicyManager::resolveWan(NetworkConfig* config) const
{
    if (config->wanIface)
        return;

    config->wanIface = mNetlink->defaultRouteIface(AF_INET);
    if (config->wanIface)
    {
        QUAY_LOG_INFO("using '%s' as the WAN interface", config->wanIface->c_str());
    }
    else
    {
        QUAY_LOG_WARN("no IPv4 default route, masquerade rules will be omitted");
    }
}

// -----------------------------------------------------------------------------
/**
 *  @brief Takes the exclusive lock on the state directory.
 *
 *  Every load, change, apply and persist sequence runs under this lock so
 *  that separate processes (and separate manager instances) don't lose each
 *  other's updates.
 *
 *  @return the held lock, or nullptr if it couldn't be taken.
 */
std::unique_ptr<QuayCommon::FileLock> NetworkPolicyManager::lockStateDir() const
{
    const std::string& stateDir = mSettings->stateDir();
    if (!QuayCommon::mkdirRecursive(stateDir, 0700))
    {
        QUAY_LOG_ERROR("failed to create state dir @ '%s'", stateDir.c_str());
        return nullptr;
    }

    std::unique_ptr<QuayCommon::FileLock> lock(new QuayCommon::FileLock(stateDir + "/.lock"));
    if (!lock->isLocked())
        return nullptr;

    return lock;
}

PolicyResult NetworkPolicyManager::stateLockFailure() const
{
    return PolicyResult::failure(PolicyError::Storage,
                                 "failed to lock network state in " + mSettings->stateDir());
}

IFirewallBackend* NetworkPolicyManager::backend(NatBackend type) const
{
    return mBackends.at(type).get();
}

// -----------------------------------------------------------------------------
/**
 *  @brief Installs the rules for @a desired and, if that worked, persists it.
 *
 *  If persisting fails the previous rules are put back and Storage is
 *  returned.  Once the state is persisted the change has taken effect, a
 *  failure to sync the proxy neighbours after that is only logged and is
 *  retried by reapply().
 *
 */
PolicyResult NetworkPolicyManager::commit(const PolicyState& previous,
                                          const PolicyState& desired)
{
    PolicyState next = desired;
    resolveWan(&next.config);

    PolicyResult result = installRules(previous, next);
    if (!result.ok())
    {
        QUAY_LOG_ERROR("failed to apply firewall rules - %s", result.detail.c_str());
        return result;
    }

    if (!persist(next))
    {
        QUAY_LOG_ERROR("failed to persist network state, reverting rules");

        restoreRules(previous, next);
        if (!persist(previous))
            QUAY_LOG_ERROR("failed to restore persisted network state");

        return PolicyResult::failure(PolicyError::Storage,
                                     "failed to write network state to " +
                                     mSettings->stateDir());
    }

    result = mTransport->syncProxyNeighbours(&previous, next);
    if (!result.ok())
    {
        QUAY_LOG_WARN("failed to update IPv6 proxy entries, run apply to retry - %s",
                      result.detail.c_str());
    }

    return PolicyResult::success();
}

PolicyResult NetworkPolicyManager::installRules(const PolicyState& previous,
                                                const PolicyState& next)
{
    IFirewallBackend* incoming = backend(next.config.natBackend);

    if (previous.config.natBackend != next.config.natBackend)
    {
        return LifecycleSynchronizer::switchBackend(backend(previous.config.natBackend),
                                                    incoming, previous, next);
    }

    return incoming->apply(next, &previous);
}

bool NetworkPolicyManager::persist(const PolicyState& state) const
{
    return mStore->save(state.config) &&
           mStore->savePortMaps(state.portMaps) &&
           mStore->saveAcls(state.acls);
}

void NetworkPolicyManager::restoreRules(const PolicyState& previous,
                                        const PolicyState& next)
{
    PolicyResult result;

    if (previous.config.natBackend != next.config.natBackend)
    {
        result = backend(next.config.natBackend)->flush();
        if (result.ok())
            result = backend(previous.config.natBackend)->apply(previous, nullptr);
    }
    else
    {
        result = backend(previous.config.natBackend)->apply(previous, &next);
    }

    if (!result.ok())
        QUAY_LOG_ERROR("failed to restore previous rules - %s", result.detail.c_str());
}

// -----------------------------------------------------------------------------
/**
 *  @brief Removes whatever of @a failed got set up and brings the previous
 *  transport method back.
 *
 *  A WireGuard tunnel is brought back with @a previousWgConfig, the config
 *  that was installed before the change.  If that is empty the file still
 *  installed is reused.
 */
void NetworkPolicyManager::restoreTransport(const NetworkConfig& previous,
                                            const TransportRecord& failed,
                                            const std::string& previousWgConfig)
{
    NetworkConfig partial = previous;
    partial.transport = failed;

    PolicyResult result = mTransport->tearDown(partial);
    if (!result.ok())
        QUAY_LOG_ERROR("failed to remove partial IPv6 transport - %s", result.detail.c_str());

    TransportRequest request;
    request.method = previous.transport.method;
    request.routedPrefix = previous.transport.routedPrefix;
    request.wgConfig = previousWgConfig;

    result = mTransport->bringUp(previous.transport, request, previous.bridge);
    if (!result.ok())
    {
        QUAY_LOG_ERROR("failed to restore IPv6 transport '%s' - %s",
                       transportMethodName(previous.transport.method),
                       result.detail.c_str());
    }
}

PolicyResult NetworkPolicyManager::checkContainer(const std::string& containerName) const
{
    if (!mResolver->containerExists(containerName))
    {
        return PolicyResult::failure(PolicyError::NotFound,
                                     "no container called '" + containerName + "'");
    }

    return PolicyResult::success();
}
