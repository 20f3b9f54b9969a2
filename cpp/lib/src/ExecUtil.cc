/** \file    ExecUtil.cc
 *  \brief   Implementation of the ExecUtil class.
 *  \author  Dr. Gordon W. Paynter
 *  \author  Dr. Johannes Ruscheinski
 */

/*
 *  Copyright 2004-2008 Project iVia.
 *  Copyright 2004-2008 The Regents of The University of California.
 *  Copyright 2017-2026 Universitätsbibliothek Tübingen
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as published
 *  by the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software
 *  Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */
#include "ExecUtil.h"
#include <stdexcept>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>


namespace {


const int EXECVE_FAILURE(248);
const int REDIRECTION_FAILURE(249);
const int CHDIR_FAILURE(250);


void RedirectOrExit(const std::string &new_path, const int old_fd) {
    if (new_path.empty())
        return;

    const int new_fd(::open(new_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
    if (new_fd == -1)
        ::_exit(REDIRECTION_FAILURE);
    if (::dup2(new_fd, old_fd) == -1)
        ::_exit(REDIRECTION_FAILURE);
    ::close(new_fd);
}


} // unnamed namespace


namespace ExecUtil {


int Exec(const std::string &command, const std::vector<std::string> &args, const std::string &new_stdout,
         const std::string &new_stderr, const std::unordered_map<std::string, std::string> &envs,
         const std::string &working_directory)
{
    errno = 0;
    if (::access(command.c_str(), X_OK) != 0)
        throw std::runtime_error("in ExecUtil::Exec: can't execute \"" + command + "\"!");

    const pid_t pid = ::fork();
    if (pid == -1)
        throw std::runtime_error("in ExecUtil::Exec: ::fork() failed: " + std::string(std::strerror(errno)) + "!");

    // The child process:
    else if (pid == 0) {
        RedirectOrExit(new_stdout, STDOUT_FILENO);
        RedirectOrExit(new_stderr, STDERR_FILENO);

        for (const auto &env : envs)
            ::setenv(env.first.c_str(), env.second.c_str(), 1);

        if (not working_directory.empty() and ::chdir(working_directory.c_str()) == -1)
            ::_exit(CHDIR_FAILURE);

// Build the argument list for execv(2):
#pragma GCC diagnostic ignored "-Wvla"
        char *argv[1 + args.size() + 1];
        unsigned arg_no(0);
        argv[arg_no++] = ::strdup(command.c_str());
        for (const auto &arg : args)
            argv[arg_no++] = ::strdup(arg.c_str());
        argv[arg_no] = nullptr;
        ::execv(command.c_str(), argv);

        ::_exit(EXECVE_FAILURE); // We typically never get here.
    }

    // The parent of the fork:
    int child_exit_status;
    pid_t wait_retval;
    do {
        errno = 0;
        wait_retval = ::wait4(pid, &child_exit_status, 0, nullptr);
    } while (wait_retval == -1 and errno == EINTR);
    if (wait_retval != pid)
        throw std::runtime_error("in ExecUtil::Exec: wait4(2) failed: " + std::string(std::strerror(errno)) + "!");

    // Now process the child's various exit status values:
    if (WIFEXITED(child_exit_status)) {
        switch (WEXITSTATUS(child_exit_status)) {
        case EXECVE_FAILURE:
            throw std::runtime_error("in ExecUtil::Exec: failed to execve(2) in child!");
        case REDIRECTION_FAILURE:
            throw std::runtime_error("in ExecUtil::Exec: failed to redirect stdout or stderr in child!");
        case CHDIR_FAILURE:
            throw std::runtime_error("in ExecUtil::Exec: failed to change to \"" + working_directory + "\" in child!");
        default:
            return WEXITSTATUS(child_exit_status);
        }
    } else if (WIFSIGNALED(child_exit_status))
        throw std::runtime_error("in ExecUtil::Exec: \"" + command + "\" killed by signal "
                                 + std::to_string(WTERMSIG(child_exit_status)) + "!");

    throw std::runtime_error("in ExecUtil::Exec: dazed and confused!");
}


} // namespace ExecUtil
