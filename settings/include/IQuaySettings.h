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
 * File:   IQuaySettings.h
 *
 */
#ifndef IQUAYSETTINGS_H
#define IQUAYSETTINGS_H

#include <chrono>
#include <string>


// -----------------------------------------------------------------------------
/**
 *  @class IQuaySettings
 *  @brief Interface provided to the library at startup, contains the
 *  host specific configuration options for Quay.
 *
 */
class IQuaySettings
{
public:
    virtual ~IQuaySettings() = default;

public:
    // -------------------------------------------------------------------------
    /**
     *  @brief Should return the path to the directory that holds the persisted
     *  network state records.
     *
     *  If the directory doesn't exist the library will try and create it with
     *  0700 permissions.
     */
    virtual std::string stateDir() const = 0;

    // -------------------------------------------------------------------------
    /**
     *  @brief The well-known path the rendered nftables document is written
     *  to before it is loaded.
     */
    virtual std::string nftRulesetPath() const = 0;

    // -------------------------------------------------------------------------
    /**
     *  @brief Directories the IPv6 transport writes it's config files into.
     */
    virtual std::string wireguardDir() const = 0;
    virtual std::string networkdDir() const = 0;

public:
    // -------------------------------------------------------------------------
    /**
     *  @brief Absolute paths of the external tools.
     */
    struct ToolPaths
    {
        std::string nft;
        std::string iptables;
        std::string iptablesSave;
        std::string machinectl;
        std::string systemctl;
        std::string networkctl;
    };

    virtual const ToolPaths& toolPaths() const = 0;

    // -------------------------------------------------------------------------
    /**
     *  @brief The maximum time any external tool is allowed to run for before
     *  it is killed and treated as failed.
     */
    virtual std::chrono::milliseconds toolTimeout() const = 0;

public:
    // -------------------------------------------------------------------------
    /**
     *  @brief Values used for the network config record before anything has
     *  been persisted.
     */
    struct NetworkDefaults
    {
        std::string bridge;
        std::string lan4Cidr;
        std::string lan4Gateway;
        std::string natBackend;
    };

    virtual const NetworkDefaults& networkDefaults() const = 0;

    // -------------------------------------------------------------------------
    /**
     *  @brief The log level name, empty if not set.
     */
    virtual std::string logLevel() const = 0;
};

#endif // !defined(IQUAYSETTINGS_H)
