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
 * File:   NetworkPolicyTypes.cpp
 *
 */
#include "NetworkPolicyTypes.h"

#include <strings.h>


bool TransportRecord::operator==(const TransportRecord& rhs) const
{
    return (method == rhs.method) &&
           (routedPrefix == rhs.routedPrefix) &&
           (tunnelIface == rhs.tunnelIface) &&
           (localV4 == rhs.localV4) &&
           (serverV4 == rhs.serverV4) &&
           (clientV6 == rhs.clientV6) &&
           (serverV6 == rhs.serverV6) &&
           (wgIface == rhs.wgIface);
}

bool NetworkConfig::operator==(const NetworkConfig& rhs) const
{
    return (bridge == rhs.bridge) &&
           (lan4Cidr == rhs.lan4Cidr) &&
           (lan4Gateway == rhs.lan4Gateway) &&
           (wanIface == rhs.wanIface) &&
           (ipv6Prefix == rhs.ipv6Prefix) &&
           (natBackend == rhs.natBackend) &&
           (ipv6ProxyEnabled == rhs.ipv6ProxyEnabled) &&
           (ipv6ProxyUpstreamIface == rhs.ipv6ProxyUpstreamIface) &&
           (transport == rhs.transport);
}

bool PortMapEntry::operator==(const PortMapEntry& rhs) const
{
    return (containerName == rhs.containerName) &&
           (protocol == rhs.protocol) &&
           (hostPort == rhs.hostPort) &&
           (containerPort == rhs.containerPort) &&
           (containerIpv4 == rhs.containerIpv4);
}

bool Ipv6AclEntry::operator==(const Ipv6AclEntry& rhs) const
{
    return (containerName == rhs.containerName) &&
           (protocol == rhs.protocol) &&
           (destPort == rhs.destPort) &&
           (containerIpv6 == rhs.containerIpv6);
}

const char* protocolName(Protocol protocol)
{
    switch (protocol)
    {
        case Protocol::Tcp:     return "tcp";
        case Protocol::Udp:     return "udp";
    }

    return "unknown";
}

boost::optional<Protocol> protocolFromString(const std::string& str)
{
    if (strcasecmp(str.c_str(), "tcp") == 0)
        return Protocol::Tcp;
    if (strcasecmp(str.c_str(), "udp") == 0)
        return Protocol::Udp;

    return boost::none;
}

const char* natBackendName(NatBackend backend)
{
    switch (backend)
    {
        case NatBackend::Nftables:  return "nftables";
        case NatBackend::Iptables:  return "iptables";
    }

    return "unknown";
}

boost::optional<NatBackend> natBackendFromString(const std::string& str)
{
    if (strcasecmp(str.c_str(), "nftables") == 0)
        return NatBackend::Nftables;
    if (strcasecmp(str.c_str(), "iptables") == 0)
        return NatBackend::Iptables;

    return boost::none;
}

const char* transportMethodName(TransportMethod method)
{
    switch (method)
    {
        case TransportMethod::None:         return "none";
        case TransportMethod::Native:       return "native";
        case TransportMethod::SixInFour:    return "6in4";
        case TransportMethod::Wireguard:    return "wireguard";
    }

    return "unknown";
}

boost::optional<TransportMethod> transportMethodFromString(const std::string& str)
{
    if (str == "none")
        return TransportMethod::None;
    if (str == "native")
        return TransportMethod::Native;
    if (str == "6in4")
        return TransportMethod::SixInFour;
    if (str == "wireguard")
        return TransportMethod::Wireguard;

    return boost::none;
}

const char* policyErrorName(PolicyError error)
{
    switch (error)
    {
        case PolicyError::None:             return "none";
        case PolicyError::Validation:       return "validation error";
        case PolicyError::NotFound:         return "not found";
        case PolicyError::ExternalTool:     return "external tool error";
        case PolicyError::BackendConflict:  return "backend conflict";
        case PolicyError::Storage:          return "storage error";
    }

    return "unknown";
}
