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
 * File:   ConfigStore.h
 *
 */
#ifndef CONFIGSTORE_H
#define CONFIGSTORE_H

#include "NetworkPolicyTypes.h"

#include <IQuaySettings.h>

#include <json/json.h>

#include <string>
#include <vector>


// -----------------------------------------------------------------------------
/**
 *  @class ConfigStore
 *  @brief Persists the network config record and the port-map and ACL
 *  collections as JSON files in the state directory.
 *
 *  Every save writes a temporary file alongside the target and renames it
 *  over the top, so a crash never leaves a partially written record.  Nothing
 *  is cached, every load reads from disk.
 *
 *  Loads never fail; missing or unreadable files give the defaults / empty
 *  collections, unknown or malformed fields are ignored and malformed
 *  collection items are skipped.
 */
class ConfigStore
{
public:
    ConfigStore(const std::string& stateDir,
                const IQuaySettings::NetworkDefaults& defaults);
    ~ConfigStore() = default;

public:
    NetworkConfig load() const;
    bool save(const NetworkConfig& config) const;

    std::vector<PortMapEntry> loadPortMaps() const;
    bool savePortMaps(const std::vector<PortMapEntry>& portMaps) const;

    std::vector<Ipv6AclEntry> loadAcls() const;
    bool saveAcls(const std::vector<Ipv6AclEntry>& acls) const;

    NetworkConfig defaults() const;

public:
    static Json::Value toJson(const NetworkConfig& config);
    static Json::Value toJson(const PortMapEntry& entry);
    static Json::Value toJson(const Ipv6AclEntry& entry);

    static boost::optional<PortMapEntry> portMapFromJson(const Json::Value& value);
    static boost::optional<Ipv6AclEntry> aclFromJson(const Json::Value& value);

private:
    void mergeConfig(const Json::Value& root, NetworkConfig* config) const;

    boost::optional<Json::Value> readJson(const std::string& filePath) const;
    bool writeJson(const std::string& filePath, const Json::Value& root) const;

private:
    const std::string mStateDir;
    const std::string mNetworkPath;
    const std::string mPortMapsPath;
    const std::string mAclsPath;

    const IQuaySettings::NetworkDefaults mDefaults;
};

#endif // !defined(CONFIGSTORE_H)
