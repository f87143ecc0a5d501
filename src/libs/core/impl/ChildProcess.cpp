/*
 * Copyright (C) 2026 MTS contributors
 *
 * This file is part of MTS.
 *
 * MTS is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * MTS is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with MTS.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "ChildProcess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <mutex>
#include <system_error>

#include <boost/asio/buffer.hpp>

#include "core/ILogger.hpp"

namespace mts::core
{
    namespace
    {
        class SystemException : public ChildProcessException
        {
        public:
            SystemException(std::error_code err, const std::string& errMsg)
                : ChildProcessException{ errMsg + ": " + err.message() }
            {
            }

            SystemException(boost::system::error_code ec, const std::string& errMsg)
                : ChildProcessException{ errMsg + ": " + ec.message() }
            {
            }
        };

        std::error_code lastError()
        {
            return std::error_code{ errno, std::generic_category() };
        }
    } // namespace

    ChildProcess::ChildProcess(boost::asio::io_context& ioContext, const std::filesystem::path& path, const Args& args, bool captureStderr)
        : _childStdout{ ioContext }
    {
        if (!std::filesystem::exists(path))
            throw ChildProcessException{ "File '" + path.string() + "' does not exist" };

        // build argv before forking, no allocation allowed in the child
        std::vector<const char*> execArgs;
        std::transform(std::cbegin(args), std::cend(args), std::back_inserter(execArgs), [](const std::string& arg) { return arg.c_str(); });
        execArgs.push_back(nullptr);
        const std::string pathStr{ path.string() };

        // make sure only one thread is forking at a time, so that pipes are not inherited by other children
        static std::mutex mutex;
        const std::scoped_lock lock{ mutex };

        int pipefd[2];
        if (::pipe(pipefd) == -1)
            throw SystemException{ lastError(), "pipe failed!" };

        // Only set O_NONBLOCK on read end - usually programs don't expect stdout to be non-blocking
        if (::fcntl(pipefd[0], F_SETFL, O_NONBLOCK) == -1)
            throw SystemException{ lastError(), "fcntl failed to set O_NONBLOCK!" };

        if (::fcntl(pipefd[0], F_SETFD, FD_CLOEXEC) == -1)
            throw SystemException{ lastError(), "fcntl failed to set FD_CLOEXEC!" };

        const ::pid_t res{ ::fork() };
        if (res == -1)
            throw SystemException{ lastError(), "fork failed!" };

        if (res == 0) // CHILD
        {
            // Never close stdin/out/err, most programs expect these to exist;
            // rather connect them to /dev/null if unwanted
            const int nullFd{ ::open("/dev/null", O_RDWR) };
            if (nullFd != -1)
            {
                ::dup2(nullFd, STDIN_FILENO);
                if (!captureStderr)
                    ::dup2(nullFd, STDERR_FILENO);
                ::close(nullFd);
            }

            if (::dup2(pipefd[1], STDOUT_FILENO) == -1)
                ::_exit(127);
            if (captureStderr && ::dup2(pipefd[1], STDERR_FILENO) == -1)
                ::_exit(127);

            ::close(pipefd[1]);

            ::execv(pathStr.c_str(), const_cast<char* const*>(execArgs.data()));
            ::_exit(127);
        }

        // PARENT
        ::close(pipefd[1]);
        _childPID = res;

        boost::system::error_code assignError;
        _childStdout.assign(pipefd[0], assignError);
        if (assignError)
        {
            ::close(pipefd[0]);
            kill();
            wait();
            throw SystemException{ assignError, "assigning read end of pipe to asio stream failed!" };
        }

        MTS_LOG(CHILDPROCESS, DEBUG, "Spawned '" << path.string() << "', pid = " << _childPID);
    }

    ChildProcess::~ChildProcess()
    {
        boost::system::error_code closeError;
        _childStdout.close(closeError);
        if (closeError)
            MTS_LOG(CHILDPROCESS, ERROR, "Close failed: " << closeError.message());

        if (!_exitStatus)
        {
            kill();
            try
            {
                wait();
            }
            catch (const ChildProcessException& e)
            {
                MTS_LOG(CHILDPROCESS, ERROR, "Cannot reap child process " << _childPID << ": " << e.what());
            }
        }
    }

    void ChildProcess::kill()
    {
        if (_exitStatus)
            return;

        // process may already have finished
        MTS_LOG(CHILDPROCESS, DEBUG, "Killing child process " << _childPID << "...");
        if (::kill(_childPID, SIGKILL) == -1)
        {
            const std::error_code ec{ lastError() };
            MTS_LOG(CHILDPROCESS, DEBUG, "Kill failed: " << ec.message());
        }
    }

    IChildProcess::ExitStatus ChildProcess::wait()
    {
        if (_exitStatus)
            return *_exitStatus;

        int wstatus{};
        ::pid_t pid;
        do
        {
            pid = ::waitpid(_childPID, &wstatus, 0);
        } while (pid == -1 && errno == EINTR);

        if (pid == -1)
            throw SystemException{ lastError(), "waitpid failed!" };

        ExitStatus status;
        if (WIFEXITED(wstatus))
            status.exitCode = WEXITSTATUS(wstatus);
        else if (WIFSIGNALED(wstatus))
            status.signal = WTERMSIG(wstatus);

        MTS_LOG(CHILDPROCESS, DEBUG, "Child process " << _childPID << " terminated, exit code = " << (status.exitCode ? std::to_string(*status.exitCode) : "none") << ", signal = " << (status.signal ? std::to_string(*status.signal) : "none"));

        _exitStatus = status;
        return status;
    }

    IChildProcess::ReadResult ChildProcess::readSome(std::span<std::byte> buffer, std::chrono::milliseconds timeout, std::size_t& bytesRead)
    {
        bytesRead = 0;

        if (!_childStdout.is_open())
            return ReadResult::EndOfFile;

        ::pollfd pfd{};
        pfd.fd = _childStdout.native_handle();
        pfd.events = POLLIN;

        const int pollRes{ ::poll(&pfd, 1, static_cast<int>(timeout.count())) };
        if (pollRes == -1)
        {
            if (errno == EINTR)
                return ReadResult::Timeout;

            const std::error_code ec{ lastError() };
            MTS_LOG(CHILDPROCESS, ERROR, "poll failed: " << ec.message());
            return ReadResult::Error;
        }
        if (pollRes == 0)
            return ReadResult::Timeout;

        boost::system::error_code ec;
        bytesRead = _childStdout.read_some(boost::asio::buffer(buffer.data(), buffer.size()), ec);
        if (ec == boost::asio::error::would_block || ec == boost::asio::error::try_again)
            return ReadResult::Timeout;

        if (ec == boost::asio::error::eof)
        {
            _childStdout.close(ec);
            return ReadResult::EndOfFile;
        }

        if (ec)
        {
            MTS_LOG(CHILDPROCESS, ERROR, "read failed: " << ec.message());
            _childStdout.close(ec);
            return ReadResult::Error;
        }

        return ReadResult::Success;
    }
} // namespace mts::core
