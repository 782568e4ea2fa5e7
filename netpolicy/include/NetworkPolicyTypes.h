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
 * File:   NetworkPolicyTypes.h
 *
 */
#ifndef NETWORKPOLICYTYPES_H
#define NETWORKPOLICYTYPES_H

#include <boost/optional.hpp>

#include <cstdint>
#include <string>
#include <vector>


enum class Protocol
{
    Tcp,
    Udp
};

enum class NatBackend
{
    Nftables,
    Iptables
};

enum class TransportMethod
{
    None,
    Native,
    SixInFour,
    Wireguard
};

// -----------------------------------------------------------------------------
/**
 *  @struct TransportRecord
 *  @brief The active IPv6 uplink method and the parameters it was brought up
 *  with, stored so that it can be torn down again when the method changes.
 *
 *  Keys and other secrets are never part of this record.
 */
struct TransportRecord
{
    TransportMethod method = TransportMethod::None;
    std::string routedPrefix;

    // 6in4
    std::string tunnelIface;
    std::string localV4;
    std::string serverV4;
    std::string clientV6;
    std::string serverV6;

    // wireguard
    std::string wgIface;

    bool operator==(const TransportRecord& rhs) const;
    bool operator!=(const TransportRecord& rhs) const { return !(*this == rhs); }
};

// -----------------------------------------------------------------------------
/**
 *  @struct NetworkConfig
 *  @brief The singleton network configuration record.
 *
 */
struct NetworkConfig
{
    std::string bridge;
    std::string lan4Cidr;
    std::string lan4Gateway;

    // explicitly configured, or auto-detected from the default route and
    // cached
    boost::optional<std::string> wanIface;

    // empty if no IPv6 prefix is routed to the bridge
    std::string ipv6Prefix;

    NatBackend natBackend = NatBackend::Nftables;

    bool ipv6ProxyEnabled = false;
    std::string ipv6ProxyUpstreamIface;

    TransportRecord transport;

    bool operator==(const NetworkConfig& rhs) const;
    bool operator!=(const NetworkConfig& rhs) const { return !(*this == rhs); }
};

// -----------------------------------------------------------------------------
/**
 *  @struct PortMapEntry
 *  @brief An IPv4 DNAT port mapping, keyed by (protocol, hostPort).
 *
 *  The container address is a snapshot taken when the entry was added.
 */
struct PortMapEntry
{
    std::string containerName;
    Protocol protocol = Protocol::Tcp;
    uint16_t hostPort = 0;
    uint16_t containerPort = 0;
    std::string containerIpv4;

    bool sameKey(const PortMapEntry& other) const
    {
        return (protocol == other.protocol) && (hostPort == other.hostPort);
    }

    bool operator==(const PortMapEntry& rhs) const;
    bool operator!=(const PortMapEntry& rhs) const { return !(*this == rhs); }
};

// -----------------------------------------------------------------------------
/**
 *  @struct Ipv6AclEntry
 *  @brief An inbound IPv6 accept rule, keyed by (protocol, destPort,
 *  containerIpv6).
 */
struct Ipv6AclEntry
{
    std::string containerName;
    Protocol protocol = Protocol::Tcp;
    uint16_t destPort = 0;
    std::string containerIpv6;

    bool sameKey(const Ipv6AclEntry& other) const
    {
        return (protocol == other.protocol) && (destPort == other.destPort) &&
               (containerIpv6 == other.containerIpv6);
    }

    bool operator==(const Ipv6AclEntry& rhs) const;
    bool operator!=(const Ipv6AclEntry& rhs) const { return !(*this == rhs); }
};

// -----------------------------------------------------------------------------
/**
 *  @struct PolicyState
 *  @brief Everything the rule renderer consumes.
 */
struct PolicyState
{
    NetworkConfig config;
    std::vector<PortMapEntry> portMaps;
    std::vector<Ipv6AclEntry> acls;
};

// -----------------------------------------------------------------------------
/**
 *  @enum PolicyError
 *  @brief Error codes returned from the mutation API, the numeric values are
 *  part of the quay-netctl exit status so don't reorder them.
 */
enum class PolicyError : int
{
    None = 0,
    Validation = 1,
    NotFound = 2,
    ExternalTool = 3,
    BackendConflict = 4,
    Storage = 5
};

struct PolicyResult
{
    PolicyError error = PolicyError::None;
    std::string detail;

    static PolicyResult success()
    {
        return PolicyResult();
    }

    static PolicyResult failure(PolicyError err, const std::string& why)
    {
        PolicyResult result;
        result.error = err;
        result.detail = why;
        return result;
    }

    bool ok() const
    {
        return (error == PolicyError::None);
    }
};

const char* protocolName(Protocol protocol);
boost::optional<Protocol> protocolFromString(const std::string& str);

const char* natBackendName(NatBackend backend);
boost::optional<NatBackend> natBackendFromString(const std::string& str);

const char* transportMethodName(TransportMethod method);
boost::optional<TransportMethod> transportMethodFromString(const std::string& str);

const char* policyErrorName(PolicyError error);

#endif // !defined(NETWORKPOLICYTYPES_H)
