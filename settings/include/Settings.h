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
 * File:   Settings.h
 *
 */

#ifndef SETTINGS_H
#define SETTINGS_H

#include <IQuaySettings.h>

#include <json/json.h>

#include <memory>


// -----------------------------------------------------------------------------
/**
 *  @class Settings
 *  @brief Object containing the settings to pass to the network policy
 *  engine.
 *
 *  Usually this is the parsed content of a JSON file, any field missing from
 *  the file keeps it's default value.
 *
 */

class Settings final : public IQuaySettings
{
private:
    Settings();
    explicit Settings(const Json::Value& settings);

public:
    ~Settings() final = default;

    static std::shared_ptr<Settings> fromJsonFile(const std::string& filePath);
    static std::shared_ptr<Settings> fromJson(const Json::Value& settings);
    static std::shared_ptr<Settings> defaultSettings();

public:
    std::string stateDir() const override;
    std::string nftRulesetPath() const override;
    std::string wireguardDir() const override;
    std::string networkdDir() const override;

    const ToolPaths& toolPaths() const override;
    std::chrono::milliseconds toolTimeout() const override;

    const NetworkDefaults& networkDefaults() const override;

    std::string logLevel() const override;

    void dump(int logLevel = -1) const;

private:
    void setDefaults();

    static void getString(const Json::Value& root, const char* path,
                          std::string* value);
    static void getPath(const Json::Value& root, const char* path,
                        std::string* value);

private:
    std::string mStateDir;
    std::string mNftRulesetPath;
    std::string mWireguardDir;
    std::string mNetworkdDir;

    ToolPaths mToolPaths;
    std::chrono::milliseconds mToolTimeout;

    NetworkDefaults mNetworkDefaults;

    std::string mLogLevel;
};

#endif // !defined(SETTINGS_H)
