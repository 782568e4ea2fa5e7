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
 * File:   ProcessRunner.cpp
 *
 */
#include "ProcessRunner.h"

#include <Logging.h>

#include <thread>
#include <vector>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <libgen.h>
#include <signal.h>
#include <unistd.h>
#include <sys/mman.h>
#include <sys/wait.h>


namespace
{

// -----------------------------------------------------------------------------
/**
 *  @class MemFd
 *  @brief Anonymous in-memory file used for a child's standard streams, the
 *  fd is closed on destruction.
 */
class MemFd
{
public:
    explicit MemFd(const char* name)
        : mFd(memfd_create(name, MFD_CLOEXEC))
    {
        if (mFd < 0)
            QUAY_LOG_SYS_ERROR(errno, "failed to create memfd '%s'", name);
    }

    ~MemFd()
    {
        if ((mFd >= 0) && (close(mFd) != 0))
            QUAY_LOG_SYS_ERROR(errno, "failed to close memfd");
    }

    MemFd(const MemFd&) = delete;
    MemFd& operator=(const MemFd&) = delete;

public:
    explicit operator bool() const
    {
        return (mFd >= 0);
    }

    int fd() const
    {
        return mFd;
    }

    bool write(const std::string& data)
    {
        const char* ptr = data.data();
        size_t remaining = data.size();
        while (remaining > 0)
        {
            ssize_t wr = TEMP_FAILURE_RETRY(::write(mFd, ptr, remaining));
            if (wr < 0)
            {
                QUAY_LOG_SYS_ERROR(errno, "failed to write to memfd");
                return false;
            }

            ptr += wr;
            remaining -= wr;
        }

        if (lseek(mFd, 0, SEEK_SET) < 0)
        {
            QUAY_LOG_SYS_ERROR(errno, "failed to seek memfd");
            return false;
        }

        return true;
    }

    std::string readAll() const
    {
        std::string contents;
        if (lseek(mFd, 0, SEEK_SET) < 0)
        {
            QUAY_LOG_SYS_ERROR(errno, "failed to seek memfd");
            return contents;
        }

        char buf[1024];
        while (true)
        {
            ssize_t rd = TEMP_FAILURE_RETRY(read(mFd, buf, sizeof(buf)));
            if (rd < 0)
            {
                QUAY_LOG_SYS_ERROR(errno, "failed to read memfd");
                break;
            }
            else if (rd == 0)
            {
                break;
            }

            contents.append(buf, rd);
        }

        return contents;
    }

private:
    const int mFd;
};

} // namespace


ProcessRunner::ProcessRunner(std::chrono::milliseconds timeout)
    : mTimeout(timeout)
{
}

// -----------------------------------------------------------------------------
/**
 *  @brief Runs the tool with the given args and waits for it to exit.
 *
 *  @param[in]  execFile    The absolute path of the tool.
 *  @param[in]  args        The args to supply to the tool, not including the
 *                          the exe name.
 *  @param[in]  stdinData   Data to supply to the tool on stdin, if empty the
 *                          tool's stdin is /dev/null.
 *
 *  @return the exit status and captured output.
 */
ProcessResult ProcessRunner::run(const std::string& execFile,
                                 const std::list<std::string>& args,
                                 const std::string& stdinData)
{
    QUAY_LOG_FN_ENTRY();

    ProcessResult result;

    MemFd stdinBuf("quay-stdin");
    MemFd stdoutBuf("quay-stdout");
    MemFd stderrBuf("quay-stderr");
    if (!stdinBuf || !stdoutBuf || !stderrBuf)
    {
        QUAY_LOG_ERROR_EXIT("failed to create buffers for '%s'", execFile.c_str());
        return result;
    }

    int stdinFd = -1;
    if (!stdinData.empty())
    {
        if (!stdinBuf.write(stdinData))
        {
            QUAY_LOG_FN_EXIT();
            return result;
        }
        stdinFd = stdinBuf.fd();
    }

    std::string cmdLine = execFile;
    for (const std::string& arg : args)
    {
        cmdLine += ' ';
        cmdLine += arg;
    }
    QUAY_LOG_DEBUG("running '%s'", cmdLine.c_str());

    // get the executable name
    char *execFileCopy = strdup(execFile.c_str());
    char *execFileName = strdup(basename(execFileCopy));
    free(execFileCopy);

    // create the args vector (the first arg is always the exe name the last
    // is always nullptr)
    std::vector<char*> execArgs;
    execArgs.reserve(args.size() + 2);
    execArgs.push_back(execFileName);

    for (const std::string &arg : args)
        execArgs.push_back(strdup(arg.c_str()));

    execArgs.push_back(nullptr);

    // set an empty environment list so we don't leak info
    std::vector<char*> execEnvs(1, nullptr);

    const int stdoutFd = stdoutBuf.fd();
    const int stderrFd = stderrBuf.fd();

    pid_t pid = vfork();
    if (pid == 0)
    {
        // within forked child

        // put ourselves in a new process group so that on timeout the tool
        // and anything it spawned can be killed together
        setpgid(0, 0);

        int devNull = open("/dev/null", O_RDWR);
        if (devNull < 0)
            _exit(127);

        if (stdinFd < 0)
            stdinFd = devNull;

        // nb: dup2 removes the O_CLOEXEC flag which is what we want
        if (dup2(stdinFd, STDIN_FILENO) != STDIN_FILENO)
            _exit(127);
        if (dup2(stdoutFd, STDOUT_FILENO) != STDOUT_FILENO)
            _exit(127);
        if (dup2(stderrFd, STDERR_FILENO) != STDERR_FILENO)
            _exit(127);

        if (devNull > STDERR_FILENO)
            close(devNull);

        // reset the signal mask, it's inherited from the caller
        sigset_t set;
        sigemptyset(&set);
        if (sigprocmask(SIG_SETMASK, &set, nullptr) != 0)
            _exit(127);

        if (chdir("/") < 0)
            _exit(127);

        execvpe(execFile.c_str(), execArgs.data(), execEnvs.data());

        // exec failed, can't log as stderr is redirected
        _exit(127);
    }

    // clean up dup'ed args
    for (char *arg : execArgs)
    {
        free(arg);
    }

    if (pid < 0)
    {
        QUAY_LOG_SYS_ERROR_EXIT(errno, "vfork failed");
        return result;
    }

    result.started = true;

    int status = 0;
    switch (waitForExit(pid, &status))
    {
        case WaitResult::Exited:
            if (WIFEXITED(status))
                result.exitCode = WEXITSTATUS(status);
            else if (WIFSIGNALED(status))
                result.exitCode = 128 + WTERMSIG(status);
            break;

        case WaitResult::TimedOut:
            result.timedOut = true;
            QUAY_LOG_ERROR("'%s' didn't exit within %lldms, killed it",
                           cmdLine.c_str(),
                           static_cast<long long>(mTimeout.count()));
            break;

        case WaitResult::Failed:
            result.started = false;
            break;
    }

    result.stdOut = stdoutBuf.readAll();
    result.stdErr = stderrBuf.readAll();

    if (result.started && !result.timedOut && (result.exitCode != 0))
    {
        QUAY_LOG_DEBUG("'%s' exited with %d", cmdLine.c_str(), result.exitCode);
    }

    QUAY_LOG_FN_EXIT();
    return result;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Polls for the child to exit until the timeout expires.
 *
 *  On timeout the child's process group is killed and the child reaped, so
 *  there are never any zombies left behind.
 */
ProcessRunner::WaitResult ProcessRunner::waitForExit(pid_t pid, int* status) const
{
    const auto deadline = std::chrono::steady_clock::now() + mTimeout;
    std::chrono::milliseconds pollInterval(1);

    while (true)
    {
        pid_t ret = TEMP_FAILURE_RETRY(waitpid(pid, status, WNOHANG));
        if (ret == pid)
        {
            return WaitResult::Exited;
        }
        else if (ret < 0)
        {
            QUAY_LOG_SYS_ERROR(errno, "waitpid failed");
            return WaitResult::Failed;
        }

        if (std::chrono::steady_clock::now() >= deadline)
            break;

        std::this_thread::sleep_for(pollInterval);
        if (pollInterval < std::chrono::milliseconds(20))
            pollInterval *= 2;
    }

    if ((killpg(pid, SIGKILL) != 0) && (kill(pid, SIGKILL) != 0))
    {
        QUAY_LOG_SYS_ERROR(errno, "failed to kill pid %d", pid);
    }

    if (TEMP_FAILURE_RETRY(waitpid(pid, status, 0)) < 0)
    {
        QUAY_LOG_SYS_ERROR(errno, "waitpid failed");
    }

    return WaitResult::TimedOut;
}
