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
 * File:   ConfigStore.cpp
 *
 */
#include "ConfigStore.h"
#include "AddressUtils.h"

#include <Logging.h>
#include <FileUtilities.h>

#include <memory>


namespace
{

bool readString(const Json::Value& obj, const char* key, std::string* value)
{
    if (!obj.isObject() || !obj.isMember(key))
        return false;

    const Json::Value& field = obj[key];
    if (!field.isString())
    {
        QUAY_LOG_WARN("ignoring non-string field '%s'", key);
        return false;
    }

    *value = field.asString();
    return true;
}

bool readPort(const Json::Value& obj, const char* key, uint16_t* port)
{
    if (!obj.isObject() || !obj.isMember(key))
        return false;

    const Json::Value& field = obj[key];
    if (!field.isUInt())
        return false;

    boost::optional<uint16_t> valid = AddressUtils::validatePort(field.asUInt());
    if (!valid)
        return false;

    *port = *valid;
    return true;
}

} // namespace


ConfigStore::ConfigStore(const std::string& stateDir,
                         const IQuaySettings::NetworkDefaults& defaults)
    : mStateDir(stateDir)
    , mNetworkPath(stateDir + "/network.json")
    , mPortMapsPath(stateDir + "/portmaps.json")
    , mAclsPath(stateDir + "/acls.json")
    , mDefaults(defaults)
{
}

// -----------------------------------------------------------------------------
/**
 *  @brief Returns the config record used when nothing has been persisted.
 *
 *  The values come from the settings file, any that are invalid are replaced
 *  with the built in defaults.
 */
NetworkConfig ConfigStore::defaults() const
{
    NetworkConfig config;

    config.bridge = "br0";
    config.lan4Cidr = "10.0.0.0/24";
    config.lan4Gateway = "10.0.0.1";
    config.natBackend = NatBackend::Nftables;

    if (AddressUtils::isValidIfaceName(mDefaults.bridge))
        config.bridge = mDefaults.bridge;
    else
        QUAY_LOG_WARN("invalid default bridge name '%s'", mDefaults.bridge.c_str());

    boost::optional<Cidr> cidr = AddressUtils::validateCidr(mDefaults.lan4Cidr, AF_INET);
    boost::optional<std::string> gateway = AddressUtils::validateAddress(mDefaults.lan4Gateway, AF_INET);
    if (cidr && gateway && AddressUtils::cidrContains(*cidr, *gateway))
    {
        config.lan4Cidr = cidr->toString();
        config.lan4Gateway = *gateway;
    }
    else
    {
        QUAY_LOG_WARN("invalid default LAN plan '%s' / '%s'",
                      mDefaults.lan4Cidr.c_str(), mDefaults.lan4Gateway.c_str());
    }

    boost::optional<NatBackend> backend = natBackendFromString(mDefaults.natBackend);
    if (backend)
        config.natBackend = *backend;
    else
        QUAY_LOG_WARN("invalid default NAT backend '%s'", mDefaults.natBackend.c_str());

    return config;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Loads the network config record, merged over the defaults.
 *
 */
NetworkConfig ConfigStore::load() const
{
    NetworkConfig config = defaults();

    boost::optional<Json::Value> root = readJson(mNetworkPath);
    if (root)
        mergeConfig(*root, &config);

    return config;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Overlays the fields from the persisted JSON onto @a config.
 *
 *  Each field is validated on it's own, a bad field keeps the default rather
 *  than failing the whole record.
 */
void ConfigStore::mergeConfig(const Json::Value& root, NetworkConfig* config) const
{
    if (!root.isObject())
    {
        QUAY_LOG_ERROR("'%s' doesn't contain a JSON object, using defaults",
                       mNetworkPath.c_str());
        return;
    }

    std::string str;

    if (readString(root, "bridge", &str))
    {
        if (AddressUtils::isValidIfaceName(str))
            config->bridge = str;
        else
            QUAY_LOG_WARN("ignoring invalid persisted bridge name '%s'", str.c_str());
    }

    std::string cidrStr = config->lan4Cidr;
    std::string gatewayStr = config->lan4Gateway;
    readString(root, "lan4Cidr", &cidrStr);
    readString(root, "lan4Gateway", &gatewayStr);
    {
        boost::optional<Cidr> cidr = AddressUtils::validateCidr(cidrStr, AF_INET);
        boost::optional<std::string> gateway = AddressUtils::validateAddress(gatewayStr, AF_INET);
        if (cidr && gateway && AddressUtils::cidrContains(*cidr, *gateway))
        {
            config->lan4Cidr = cidr->toString();
            config->lan4Gateway = *gateway;
        }
        else
        {
            QUAY_LOG_WARN("ignoring invalid persisted LAN plan '%s' / '%s'",
                          cidrStr.c_str(), gatewayStr.c_str());
        }
    }

    if (readString(root, "wanIface", &str))
    {
        if (AddressUtils::isValidIfaceName(str))
            config->wanIface = str;
        else
            QUAY_LOG_WARN("ignoring invalid persisted WAN iface '%s'", str.c_str());
    }

    if (readString(root, "ipv6Prefix", &str))
    {
        boost::optional<Cidr> prefix = AddressUtils::validateCidr(str, AF_INET6);
        if (str.empty())
            config->ipv6Prefix.clear();
        else if (prefix)
            config->ipv6Prefix = prefix->toString();
        else
            QUAY_LOG_WARN("ignoring invalid persisted IPv6 prefix '%s'", str.c_str());
    }

    if (readString(root, "natBackend", &str))
    {
        boost::optional<NatBackend> backend = natBackendFromString(str);
        if (backend)
            config->natBackend = *backend;
        else
            QUAY_LOG_WARN("ignoring unknown persisted NAT backend '%s'", str.c_str());
    }

    const Json::Value& proxy = root["ipv6Proxy"];
    if (proxy.isObject())
    {
        if (proxy["enabled"].isBool())
            config->ipv6ProxyEnabled = proxy["enabled"].asBool();

        if (readString(proxy, "upstreamIface", &str) &&
            (str.empty() || AddressUtils::isValidIfaceName(str)))
            config->ipv6ProxyUpstreamIface = str;
    }

    const Json::Value& transport = root["ipv6Transport"];
    if (transport.isObject())
    {
        TransportRecord record;

        if (readString(transport, "method", &str))
        {
            boost::optional<TransportMethod> method = transportMethodFromString(str);
            if (method)
                record.method = *method;
            else
                QUAY_LOG_WARN("ignoring unknown persisted transport '%s'", str.c_str());
        }

        readString(transport, "routedPrefix", &record.routedPrefix);
        readString(transport, "tunnelIface", &record.tunnelIface);
        readString(transport, "localV4", &record.localV4);
        readString(transport, "serverV4", &record.serverV4);
        readString(transport, "clientV6", &record.clientV6);
        readString(transport, "serverV6", &record.serverV6);
        readString(transport, "wgIface", &record.wgIface);

        config->transport = record;
    }

    // the proxy is only meaningful with a routed prefix
    if (config->ipv6ProxyEnabled && config->ipv6Prefix.empty())
    {
        QUAY_LOG_WARN("IPv6 proxy enabled without a prefix, disabling it");
        config->ipv6ProxyEnabled = false;
    }
}

bool ConfigStore::save(const NetworkConfig& config) const
{
    return writeJson(mNetworkPath, toJson(config));
}

std::vector<PortMapEntry> ConfigStore::loadPortMaps() const
{
    std::vector<PortMapEntry> portMaps;

    boost::optional<Json::Value> root = readJson(mPortMapsPath);
    if (!root)
        return portMaps;

    const Json::Value& entries = root->isObject() ? (*root)["portMaps"] : Json::Value::nullSingleton();
    if (!entries.isArray())
    {
        QUAY_LOG_ERROR("'%s' has no 'portMaps' array", mPortMapsPath.c_str());
        return portMaps;
    }

    for (const Json::Value& value : entries)
    {
        boost::optional<PortMapEntry> entry = portMapFromJson(value);
        if (!entry)
        {
            QUAY_LOG_WARN("skipping malformed port-map record in '%s'",
                          mPortMapsPath.c_str());
            continue;
        }

        bool duplicate = false;
        for (const PortMapEntry& existing : portMaps)
            duplicate = duplicate || existing.sameKey(*entry);

        if (duplicate)
        {
            QUAY_LOG_WARN("skipping duplicate port-map %s/%hu",
                          protocolName(entry->protocol), entry->hostPort);
            continue;
        }

        portMaps.push_back(*entry);
    }

    return portMaps;
}

bool ConfigStore::savePortMaps(const std::vector<PortMapEntry>& portMaps) const
{
    Json::Value entries(Json::arrayValue);
    for (const PortMapEntry& entry : portMaps)
        entries.append(toJson(entry));

    Json::Value root(Json::objectValue);
    root["portMaps"] = entries;

    return writeJson(mPortMapsPath, root);
}

std::vector<Ipv6AclEntry> ConfigStore::loadAcls() const
{
    std::vector<Ipv6AclEntry> acls;

    boost::optional<Json::Value> root = readJson(mAclsPath);
    if (!root)
        return acls;

    const Json::Value& entries = root->isObject() ? (*root)["acls"] : Json::Value::nullSingleton();
    if (!entries.isArray())
    {
        QUAY_LOG_ERROR("'%s' has no 'acls' array", mAclsPath.c_str());
        return acls;
    }

    for (const Json::Value& value : entries)
    {
        boost::optional<Ipv6AclEntry> entry = aclFromJson(value);
        if (!entry)
        {
            QUAY_LOG_WARN("skipping malformed ACL record in '%s'", mAclsPath.c_str());
            continue;
        }

        bool duplicate = false;
        for (const Ipv6AclEntry& existing : acls)
            duplicate = duplicate || existing.sameKey(*entry);

        if (!duplicate)
            acls.push_back(*entry);
    }

    return acls;
}

bool ConfigStore::saveAcls(const std::vector<Ipv6AclEntry>& acls) const
{
    Json::Value entries(Json::arrayValue);
    for (const Ipv6AclEntry& entry : acls)
        entries.append(toJson(entry));

    Json::Value root(Json::objectValue);
    root["acls"] = entries;

    return writeJson(mAclsPath, root);
}

Json::Value ConfigStore::toJson(const NetworkConfig& config)
{
    Json::Value root(Json::objectValue);

    root["bridge"] = config.bridge;
    root["lan4Cidr"] = config.lan4Cidr;
    root["lan4Gateway"] = config.lan4Gateway;
    if (config.wanIface)
        root["wanIface"] = *config.wanIface;
    root["ipv6Prefix"] = config.ipv6Prefix;
    root["natBackend"] = natBackendName(config.natBackend);

    Json::Value proxy(Json::objectValue);
    proxy["enabled"] = config.ipv6ProxyEnabled;
    proxy["upstreamIface"] = config.ipv6ProxyUpstreamIface;
    root["ipv6Proxy"] = proxy;

    const TransportRecord& record = config.transport;
    Json::Value transport(Json::objectValue);
    transport["method"] = transportMethodName(record.method);
    transport["routedPrefix"] = record.routedPrefix;
    if (record.method == TransportMethod::SixInFour)
    {
        transport["tunnelIface"] = record.tunnelIface;
        transport["localV4"] = record.localV4;
        transport["serverV4"] = record.serverV4;
        transport["clientV6"] = record.clientV6;
        transport["serverV6"] = record.serverV6;
    }
    else if (record.method == TransportMethod::Wireguard)
    {
        transport["wgIface"] = record.wgIface;
    }
    root["ipv6Transport"] = transport;

    return root;
}

Json::Value ConfigStore::toJson(const PortMapEntry& entry)
{
    Json::Value value(Json::objectValue);
    value["container"] = entry.containerName;
    value["protocol"] = protocolName(entry.protocol);
    value["hostPort"] = entry.hostPort;
    value["containerPort"] = entry.containerPort;
    value["containerIpv4"] = entry.containerIpv4;
    return value;
}

Json::Value ConfigStore::toJson(const Ipv6AclEntry& entry)
{
    Json::Value value(Json::objectValue);
    value["container"] = entry.containerName;
    value["protocol"] = protocolName(entry.protocol);
    value["destPort"] = entry.destPort;
    value["containerIpv6"] = entry.containerIpv6;
    return value;
}

boost::optional<PortMapEntry> ConfigStore::portMapFromJson(const Json::Value& value)
{
    PortMapEntry entry;
    std::string protocol;
    std::string address;

    if (!readString(value, "container", &entry.containerName) ||
        !AddressUtils::isValidContainerName(entry.containerName))
        return boost::none;

    if (!readString(value, "protocol", &protocol))
        return boost::none;
    boost::optional<Protocol> proto = protocolFromString(protocol);
    if (!proto)
        return boost::none;
    entry.protocol = *proto;

    if (!readPort(value, "hostPort", &entry.hostPort) ||
        !readPort(value, "containerPort", &entry.containerPort))
        return boost::none;

    if (!readString(value, "containerIpv4", &address))
        return boost::none;
    boost::optional<std::string> ipv4 = AddressUtils::validateAddress(address, AF_INET);
    if (!ipv4)
        return boost::none;
    entry.containerIpv4 = *ipv4;

    return entry;
}

boost::optional<Ipv6AclEntry> ConfigStore::aclFromJson(const Json::Value& value)
{
    Ipv6AclEntry entry;
    std::string protocol;
    std::string address;

    if (!readString(value, "container", &entry.containerName) ||
        !AddressUtils::isValidContainerName(entry.containerName))
        return boost::none;

    if (!readString(value, "protocol", &protocol))
        return boost::none;
    boost::optional<Protocol> proto = protocolFromString(protocol);
    if (!proto)
        return boost::none;
    entry.protocol = *proto;

    if (!readPort(value, "destPort", &entry.destPort))
        return boost::none;

    if (!readString(value, "containerIpv6", &address))
        return boost::none;
    boost::optional<std::string> ipv6 = AddressUtils::validateAddress(address, AF_INET6);
    if (!ipv6)
        return boost::none;
    entry.containerIpv6 = *ipv6;

    return entry;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Reads and parses a JSON state file.
 *
 *  @return boost::none if the file doesn't exist or can't be parsed.
 */
boost::optional<Json::Value> ConfigStore::readJson(const std::string& filePath) const
{
    if (!QuayCommon::exists(filePath))
    {
        QUAY_LOG_DEBUG("no state file @ '%s'", filePath.c_str());
        return boost::none;
    }

    boost::optional<std::string> contents = QuayCommon::readTextFile(filePath);
    if (!contents)
    {
        QUAY_LOG_ERROR("failed to read state file @ '%s'", filePath.c_str());
        return boost::none;
    }

    Json::CharReaderBuilder builder;
    builder["allowComments"] = false;
    builder["collectComments"] = false;

    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    const char* begin = contents->data();
    const char* end = begin + contents->size();
    if (!reader->parse(begin, end, &root, &errs))
    {
        QUAY_LOG_ERROR("failed to parse state file @ '%s' due to - %s",
                       filePath.c_str(), errs.c_str());
        return boost::none;
    }

    return root;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Serialises the JSON and atomically replaces the file.
 *
 */
bool ConfigStore::writeJson(const std::string& filePath, const Json::Value& root) const
{
    if (!QuayCommon::mkdirRecursive(mStateDir, 0700))
    {
        QUAY_LOG_ERROR("failed to create state dir @ '%s'", mStateDir.c_str());
        return false;
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "    ";

    std::string contents = Json::writeString(builder, root);
    contents += '\n';

    if (!QuayCommon::replaceFileAtomically(filePath, contents, 0600))
    {
        QUAY_LOG_ERROR("failed to write state file @ '%s'", filePath.c_str());
        return false;
    }

    return true;
}
