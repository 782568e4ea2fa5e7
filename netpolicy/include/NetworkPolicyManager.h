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
 * File:   NetworkPolicyManager.h
 *
 */
#ifndef NETWORKPOLICYMANAGER_H
#define NETWORKPOLICYMANAGER_H

#include "NetworkPolicyTypes.h"
#include "TransportConfigurator.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>

class IQuaySettings;
class IProcessRunner;
class IContainerRuntime;
class INetlink;
class IFirewallBackend;
class ConfigStore;
class AddressResolver;

namespace QuayCommon
{
    class FileLock;
}


// -----------------------------------------------------------------------------
/**
 *  @class NetworkPolicyManager
 *  @brief The entry point for all network policy mutations.
 *
 *  Every mutation runs the same sequence under one lock: load the persisted
 *  state, change it, apply it with the active backend and only then persist
 *  it.  If the apply fails nothing is persisted, so the declared state always
 *  matches what was last installed successfully.
 *
 *  The lock is a mutex plus an exclusive flock() on @c .lock in the state
 *  directory, which also serialises concurrent quay-netctl processes.
 *
 *  The WAN interface is auto-detected from the IPv4 default route when not
 *  configured, the detected value is stored with the next successful change.
 *
 */
class NetworkPolicyManager
{
public:
    NetworkPolicyManager(const std::shared_ptr<const IQuaySettings>& settings,
                         const std::shared_ptr<IProcessRunner>& runner,
                         const std::shared_ptr<IContainerRuntime>& runtime,
                         const std::shared_ptr<INetlink>& netlink);
    ~NetworkPolicyManager();

    NetworkPolicyManager(const NetworkPolicyManager&) = delete;
    NetworkPolicyManager& operator=(const NetworkPolicyManager&) = delete;

public:
    PolicyState getState();
    PolicyResult renderActive(std::string* rendered);
    PolicyResult reapply();

public:
    PolicyResult setBridge(const std::string& bridge);
    PolicyResult setLan4(const std::string& cidr, const std::string& gateway);
    PolicyResult setWanInterface(const std::string& iface);
    PolicyResult setNatBackend(NatBackend backend);
    PolicyResult setIpv6Proxy(bool enabled, const std::string& upstreamIface);

public:
    PolicyResult addPortMap(const std::string& containerName,
                            Protocol protocol,
                            unsigned long hostPort,
                            unsigned long containerPort,
                            const std::string& containerIpv4 = std::string());
    PolicyResult removePortMap(Protocol protocol, unsigned long hostPort);
    PolicyResult refreshPortMaps(const std::string& containerName);

    PolicyResult addAcl(const std::string& containerName,
                        Protocol protocol,
                        unsigned long destPort,
                        const std::string& containerIpv6 = std::string());
    PolicyResult removeAcl(Protocol protocol, unsigned long destPort,
                           const std::string& containerIpv6);

public:
    PolicyResult onContainerDeleted(const std::string& containerName);

    PolicyResult configureIpv6Transport(const TransportRequest& request);

private:
    std::unique_ptr<QuayCommon::FileLock> lockStateDir() const;
    PolicyResult stateLockFailure() const;

    PolicyState loadState() const;
    void resolveWan(NetworkConfig* config) const;

    IFirewallBackend* backend(NatBackend type) const;

    PolicyResult commit(const PolicyState& previous, const PolicyState& desired);
    PolicyResult installRules(const PolicyState& previous, const PolicyState& next);
    bool persist(const PolicyState& state) const;
    void restoreRules(const PolicyState& previous, const PolicyState& next);

    void restoreTransport(const NetworkConfig& previous,
                          const TransportRecord& failed,
                          const std::string& previousWgConfig);

    PolicyResult checkContainer(const std::string& containerName) const;

private:
    std::mutex mLock;

    const std::shared_ptr<const IQuaySettings> mSettings;
    const std::shared_ptr<INetlink> mNetlink;

    std::unique_ptr<ConfigStore> mStore;
    std::unique_ptr<AddressResolver> mResolver;
    std::unique_ptr<TransportConfigurator> mTransport;

    std::map<NatBackend, std::unique_ptr<IFirewallBackend>> mBackends;
};

#endif // !defined(NETWORKPOLICYMANAGER_H)
