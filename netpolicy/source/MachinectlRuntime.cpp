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
 * File:   MachinectlRuntime.cpp
 *
 */
#include "MachinectlRuntime.h"
#include "IProcessRunner.h"
#include "AddressUtils.h"

#include <Logging.h>

#include <cctype>
#include <sstream>


MachinectlRuntime::MachinectlRuntime(const std::shared_ptr<IProcessRunner>& runner,
                                     const std::string& machinectlPath)
    : mRunner(runner)
    , mMachinectlPath(machinectlPath)
{
}

// -----------------------------------------------------------------------------
/**
 *  @brief Gets the addresses of a running machine.
 *
 *  This is the equivalent of the following on the command line
 *
 *      machinectl --no-pager --no-legend status <name>
 *
 *  and then picking out the address block.  A stopped or unknown machine
 *  returns an empty list.
 */
std::list<std::string> MachinectlRuntime::listAddresses(const std::string& containerName)
{
    const ProcessResult result =
        mRunner->run(mMachinectlPath, { "--no-pager", "--no-legend", "status",
                                        containerName });
    if (!result.succeeded())
    {
        QUAY_LOG_INFO("no status for machine '%s' (%s)", containerName.c_str(),
                      result.diagnostic().c_str());
        return std::list<std::string>();
    }

    return parseStatusAddresses(result.stdOut);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Returns true if the runtime knows about the container image,
 *  regardless of whether it's running or not.
 *
 *      machinectl --no-pager show-image <name>
 */
bool MachinectlRuntime::containerExists(const std::string& containerName)
{
    const ProcessResult result =
        mRunner->run(mMachinectlPath, { "--no-pager", "show-image", containerName });
    if (!result.started || result.timedOut)
    {
        QUAY_LOG_ERROR("failed to query machine image '%s' (%s)",
                       containerName.c_str(), result.diagnostic().c_str());
        return false;
    }

    return (result.exitCode == 0);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Parses the address block out of 'machinectl status' output.
 *
 *  The output looks like the following, where the addresses after the first
 *  are on continuation lines with no label
 *
 *      web1(3c5e...)
 *                 Since: Mon 2024-03-11 10:02:11 UTC; 2h ago
 *                Leader: 4127 (systemd)
 *                 Iface: ve-web1
 *               Address: 10.0.0.10
 *                        fe80::4c1e:8aff:fe2b:11d0
 *                    OS: Debian GNU/Linux 12 (bookworm)
 *
 */
std::list<std::string> MachinectlRuntime::parseStatusAddresses(const std::string& status)
{
    std::list<std::string> addresses;

    std::istringstream stream(status);
    std::string line;
    bool inBlock = false;

    while (std::getline(stream, line))
    {
        // strip the leading whitespace
        const size_t start = line.find_first_not_of(" \t");
        if (start == std::string::npos)
        {
            if (inBlock)
                break;
            continue;
        }

        std::string text = line.substr(start);
        while (!text.empty() && isspace(static_cast<unsigned char>(text.back())))
            text.pop_back();

        if (!inBlock)
        {
            static const std::string labels[] = { "Address:", "Addresses:" };
            for (const std::string& label : labels)
            {
                if (text.compare(0, label.size(), label) == 0)
                {
                    inBlock = true;
                    text = text.substr(label.size());
                    break;
                }
            }

            if (!inBlock)
                continue;
        }

        // each line in the block holds one or more whitespace separated
        // addresses, the block ends at the first line that isn't an address
        std::istringstream words(text);
        std::string word;
        bool anyAddress = false;
        while (words >> word)
        {
            if (AddressUtils::addressFamily(word) == AF_UNSPEC)
                break;

            addresses.push_back(word);
            anyAddress = true;
        }

        if (!anyAddress && !addresses.empty())
            break;
    }

    return addresses;
}
