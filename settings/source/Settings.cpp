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
 * File:   Settings.cpp
 *
 */

#include "Settings.h"

#include <Logging.h>

#include <cstring>
#include <strings.h>
#include <cerrno>
#include <fstream>
#include <ext/stdio_filebuf.h>

#include <fcntl.h>
#include <unistd.h>
#include <wordexp.h>


// -----------------------------------------------------------------------------
/**
 *  @brief Returns a settings object populated with just the default values.
 *
 */
std::shared_ptr<Settings> Settings::defaultSettings()
{
    return std::shared_ptr<Settings>(new Settings());
}

// -----------------------------------------------------------------------------
/**
 *  @brief Parses the JSON file at @a filePath and returns a settings object
 *  populated from it.
 *
 *  @return nullptr if the file couldn't be opened or isn't valid JSON.
 */
std::shared_ptr<Settings> Settings::fromJsonFile(const std::string& filePath)
{
    // try and open the config file
    int configFileFd = open(filePath.c_str(), O_CLOEXEC | O_RDONLY);
    if (configFileFd < 0)
    {
        QUAY_LOG_SYS_ERROR(errno, "failed to open config file @ '%s'",
                           filePath.c_str());
        return nullptr;
    }

    // wrap the fd in a c++ file buf, it will close the fd on destruction
    __gnu_cxx::stdio_filebuf<char> fileBuf(configFileFd, std::ios::in);
    std::istream fileStream(&fileBuf);

    Json::CharReaderBuilder builder;
    builder["allowComments"] = true;
    builder["collectComments"] = false;

    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(builder, fileStream, &root, &errs))
    {
        QUAY_LOG_ERROR("failed to parse JSON config file @ '%s' due to - %s",
                       filePath.c_str(), errs.c_str());
        return nullptr;
    }

    if (!root.isObject())
    {
        QUAY_LOG_ERROR("config file @ '%s' is not a JSON object",
                       filePath.c_str());
        return nullptr;
    }

    return std::shared_ptr<Settings>(new Settings(root));
}

// -----------------------------------------------------------------------------
/**
 *  @brief Returns a settings object populated from an already parsed JSON
 *  object.
 *
 */
std::shared_ptr<Settings> Settings::fromJson(const Json::Value& settings)
{
    if (!settings.isObject() && !settings.isNull())
    {
        QUAY_LOG_ERROR("settings JSON is not an object");
        return nullptr;
    }

    return std::shared_ptr<Settings>(new Settings(settings));
}

Settings::Settings()
    : mToolTimeout(10000)
{
    setDefaults();
}

// -----------------------------------------------------------------------------
/**
 *  @brief Constructs the settings sourcing the data from the supplied JSON
 *  object, anything not in the JSON keeps it's default.
 *
 */
Settings::Settings(const Json::Value& settings)
    : mToolTimeout(10000)
{
    // defaults first
    setDefaults();

    // process the paths
    getPath(settings, ".paths.stateDir", &mStateDir);
    getPath(settings, ".paths.nftRuleset", &mNftRulesetPath);
    getPath(settings, ".paths.wireguardDir", &mWireguardDir);
    getPath(settings, ".paths.networkdDir", &mNetworkdDir);

    // process the tool locations
    getPath(settings, ".tools.nft", &mToolPaths.nft);
    getPath(settings, ".tools.iptables", &mToolPaths.iptables);
    getPath(settings, ".tools.iptablesSave", &mToolPaths.iptablesSave);
    getPath(settings, ".tools.machinectl", &mToolPaths.machinectl);
    getPath(settings, ".tools.systemctl", &mToolPaths.systemctl);
    getPath(settings, ".tools.networkctl", &mToolPaths.networkctl);

    {
        const Json::Value timeout = Json::Path(".tools.timeoutMs").resolve(settings);
        if (timeout.isNull())
        {
            // not an error if missing
        }
        else if (!timeout.isIntegral() || (timeout.asInt64() <= 0))
        {
            QUAY_LOG_ERROR("invalid 'tools.timeoutMs' value in settings, "
                           "keeping the default");
        }
        else
        {
            mToolTimeout = std::chrono::milliseconds(timeout.asInt64());
        }
    }

    // process the network defaults
    getString(settings, ".network.bridge", &mNetworkDefaults.bridge);
    getString(settings, ".network.lan4Cidr", &mNetworkDefaults.lan4Cidr);
    getString(settings, ".network.lan4Gateway", &mNetworkDefaults.lan4Gateway);
    getString(settings, ".network.natBackend", &mNetworkDefaults.natBackend);

    getString(settings, ".logLevel", &mLogLevel);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Sets the default values for all settings.
 *
 */
void Settings::setDefaults()
{
    mStateDir = "/var/lib/quay";
    mNftRulesetPath = "/etc/quay/quay.nft";
    mWireguardDir = "/etc/wireguard";
    mNetworkdDir = "/etc/systemd/network";

    mToolPaths.nft = "/usr/sbin/nft";
    mToolPaths.iptables = "/usr/sbin/iptables";
    mToolPaths.iptablesSave = "/usr/sbin/iptables-save";
    mToolPaths.machinectl = "/usr/bin/machinectl";
    mToolPaths.systemctl = "/usr/bin/systemctl";
    mToolPaths.networkctl = "/usr/bin/networkctl";

    mToolTimeout = std::chrono::milliseconds(10000);

    mNetworkDefaults.bridge = "br0";
    mNetworkDefaults.lan4Cidr = "10.0.0.0/24";
    mNetworkDefaults.lan4Gateway = "10.0.0.1";
    mNetworkDefaults.natBackend = "nftables";

    mLogLevel.clear();
}

// -----------------------------------------------------------------------------
/**
 *  @brief Reads a plain string value from the JSON, @a value is only modified
 *  if the field exists and is a string.
 *
 */
void Settings::getString(const Json::Value& root, const char* path,
                         std::string* value)
{
    const Json::Value field = Json::Path(path).resolve(root);
    if (field.isNull())
    {
        // it's not an error if the value does not exist in the JSON
        return;
    }

    if (!field.isString())
    {
        QUAY_LOG_ERROR("settings field '%s' is not a string", path);
        return;
    }

    *value = field.asString();
}

// -----------------------------------------------------------------------------
/**
 *  @brief Attempts to read a path from the JSON object.
 *
 *  The path is expanded using the wordexp() function, meaning environment
 *  variables in the string are expanded.  If the expansion produces anything
 *  other than a single word the value is rejected.
 *
 */
void Settings::getPath(const Json::Value& root, const char* path,
                       std::string* value)
{
    std::string raw;
    getString(root, path, &raw);
    if (raw.empty())
        return;

    // perform path expansion (without the $(command) processing)
    wordexp_t exp;
    bzero(&exp, sizeof(exp));

    int rc = wordexp(raw.c_str(), &exp, WRDE_NOCMD | WRDE_UNDEF);
    if (rc != 0)
    {
        QUAY_LOG_ERROR("failed to expand settings path string '%s'",
                       raw.c_str());
        return;
    }

    if (exp.we_wordc != 1)
    {
        QUAY_LOG_ERROR("settings path '%s' expanded to %zu words",
                       raw.c_str(), exp.we_wordc);
    }
    else
    {
        *value = exp.we_wordv[0];
    }

    wordfree(&exp);
}

std::string Settings::stateDir() const
{
    return mStateDir;
}

std::string Settings::nftRulesetPath() const
{
    return mNftRulesetPath;
}

std::string Settings::wireguardDir() const
{
    return mWireguardDir;
}

std::string Settings::networkdDir() const
{
    return mNetworkdDir;
}

const IQuaySettings::ToolPaths& Settings::toolPaths() const
{
    return mToolPaths;
}

std::chrono::milliseconds Settings::toolTimeout() const
{
    return mToolTimeout;
}

const IQuaySettings::NetworkDefaults& Settings::networkDefaults() const
{
    return mNetworkDefaults;
}

std::string Settings::logLevel() const
{
    return mLogLevel;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Debugging function to dump the settings to the log.
 *
 */
void Settings::dump(int logLevel) const
{
    if (logLevel < 0)
        logLevel = QUAY_LOG_LEVEL_INFO;

    __QUAY_LOG_PRINTF(logLevel, "settings.paths.stateDir='%s'", mStateDir.c_str());
    __QUAY_LOG_PRINTF(logLevel, "settings.paths.nftRuleset='%s'", mNftRulesetPath.c_str());
    __QUAY_LOG_PRINTF(logLevel, "settings.paths.wireguardDir='%s'", mWireguardDir.c_str());
    __QUAY_LOG_PRINTF(logLevel, "settings.paths.networkdDir='%s'", mNetworkdDir.c_str());

    __QUAY_LOG_PRINTF(logLevel, "settings.tools.nft='%s'", mToolPaths.nft.c_str());
    __QUAY_LOG_PRINTF(logLevel, "settings.tools.iptables='%s'", mToolPaths.iptables.c_str());
    __QUAY_LOG_PRINTF(logLevel, "settings.tools.iptablesSave='%s'", mToolPaths.iptablesSave.c_str());
    __QUAY_LOG_PRINTF(logLevel, "settings.tools.machinectl='%s'", mToolPaths.machinectl.c_str());
    __QUAY_LOG_PRINTF(logLevel, "settings.tools.systemctl='%s'", mToolPaths.systemctl.c_str());
    __QUAY_LOG_PRINTF(logLevel, "settings.tools.networkctl='%s'", mToolPaths.networkctl.c_str());
    __QUAY_LOG_PRINTF(logLevel, "settings.tools.timeoutMs=%lld",
                      static_cast<long long>(mToolTimeout.count()));

    __QUAY_LOG_PRINTF(logLevel, "settings.network.bridge='%s'", mNetworkDefaults.bridge.c_str());
    __QUAY_LOG_PRINTF(logLevel, "settings.network.lan4Cidr='%s'", mNetworkDefaults.lan4Cidr.c_str());
    __QUAY_LOG_PRINTF(logLevel, "settings.network.lan4Gateway='%s'", mNetworkDefaults.lan4Gateway.c_str());
    __QUAY_LOG_PRINTF(logLevel, "settings.network.natBackend='%s'", mNetworkDefaults.natBackend.c_str());

    __QUAY_LOG_PRINTF(logLevel, "settings.logLevel='%s'", mLogLevel.c_str());
}
