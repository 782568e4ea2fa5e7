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
 * File:   MachinectlRuntime.h
 *
 */
#ifndef MACHINECTLRUNTIME_H
#define MACHINECTLRUNTIME_H

#include "IContainerRuntime.h"

#include <memory>

class IProcessRunner;


// -----------------------------------------------------------------------------
/**
 *  @class MachinectlRuntime
 *  @brief IContainerRuntime implementation that queries systemd-machined
 *  through the machinectl tool.
 *
 */
class MachinectlRuntime : public IContainerRuntime
{
public:
    MachinectlRuntime(const std::shared_ptr<IProcessRunner>& runner,
                      const std::string& machinectlPath);
    ~MachinectlRuntime() override = default;

public:
    std::list<std::string> listAddresses(const std::string& containerName) override;
    bool containerExists(const std::string& containerName) override;

public:
    static std::list<std::string> parseStatusAddresses(const std::string& status);

private:
    const std::shared_ptr<IProcessRunner> mRunner;
    const std::string mMachinectlPath;
};

#endif // !defined(MACHINECTLRUNTIME_H)
