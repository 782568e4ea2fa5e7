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
 * File:   IProcessRunner.h
 *
 */
#ifndef IPROCESSRUNNER_H
#define IPROCESSRUNNER_H

#include <list>
#include <string>


// -----------------------------------------------------------------------------
/**
 *  @struct ProcessResult
 *  @brief The outcome of running an external tool.
 *
 */
struct ProcessResult
{
    bool started = false;
    bool timedOut = false;
    int exitCode = -1;
    std::string stdOut;
    std::string stdErr;

    bool succeeded() const
    {
        return started && !timedOut && (exitCode == 0);
    }

    // short human readable description of why the tool failed
    std::string diagnostic() const
    {
        if (!started)
            return "failed to launch";
        if (timedOut)
            return "timed out";

        std::string str = "exit code " + std::to_string(exitCode);
        if (!stdErr.empty())
        {
            str += ": ";
            str += stdErr;
            while (!str.empty() && (str.back() == '\n'))
                str.pop_back();
        }
        return str;
    }
};

// -----------------------------------------------------------------------------
/**
 *  @class IProcessRunner
 *  @brief Runs an external tool to completion, or until the timeout.
 *
 */
class IProcessRunner
{
public:
    virtual ~IProcessRunner() = default;

    virtual ProcessResult run(const std::string& execFile,
                              const std::list<std::string>& args,
                              const std::string& stdinData = std::string()) = 0;
};

#endif // !defined(IPROCESSRUNNER_H)
