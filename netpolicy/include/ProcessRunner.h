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
 * File:   ProcessRunner.h
 *
 */
#ifndef PROCESSRUNNER_H
#define PROCESSRUNNER_H

#include "IProcessRunner.h"

#include <chrono>

#include <sys/types.h>


// -----------------------------------------------------------------------------
/**
 *  @class ProcessRunner
 *  @brief Fork / exec based implementation of IProcessRunner.
 *
 *  The tool is run with an empty environment, in it's own process group, with
 *  stdout and stderr captured into memfds.  If the tool hasn't exited within
 *  the timeout the whole process group is sent SIGKILL.
 *
 */
class ProcessRunner : public IProcessRunner
{
public:
    explicit ProcessRunner(std::chrono::milliseconds timeout);
    ~ProcessRunner() override = default;

public:
    ProcessResult run(const std::string& execFile,
                      const std::list<std::string>& args,
                      const std::string& stdinData = std::string()) override;

private:
    enum class WaitResult { Exited, TimedOut, Failed };
    WaitResult waitForExit(pid_t pid, int* status) const;

private:
    const std::chrono::milliseconds mTimeout;
};

#endif // !defined(PROCESSRUNNER_H)
