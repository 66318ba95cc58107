/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "process.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <limits.h>
#include <unistd.h>
#include <sys/wait.h>

#include <boost/format.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/utility/logging.hpp"


namespace libocmirror {
namespace process {

static void readCStream(FILE* const in, std::iostream* const out) {
    char buffer[1024];
    while(!feof(in)) {
        if(fgets(buffer, sizeof(buffer), in)) {
            *out << buffer;
        }
        else if(!feof(in)) {
            OCMIRROR_THROW_ERROR("Failed to read C stream: call to fgets() failed.");
        }
    }
}

int forkExecWait(const libocmirror::CLIArguments& args,
                 const boost::optional<std::function<void()>>& preExecChildActions,
                 const boost::optional<std::function<void(int)>>& postForkParentActions,
                 std::iostream* const childStdoutStream) {
    logMessage(boost::format("Forking and executing '%s'") % args, libocmirror::LogLevel::DEBUG);

    int pipefd[2];
    if(childStdoutStream) {
        if(pipe(pipefd) == -1) {
            auto message = boost::format("Failed to open pipe to execute subprocess %s: %s")
                % args % strerror(errno);
            OCMIRROR_THROW_ERROR(message.str());
        }
    }

    auto pid = fork();
    if(pid == -1) {
        auto message = boost::format("Failed to fork to execute subprocess %s: %s")
            % args % strerror(errno);
        OCMIRROR_THROW_ERROR(message.str());
    }

    bool isChild = pid == 0;
    if(isChild) {
        if(childStdoutStream) {
            dup2(pipefd[1], STDOUT_FILENO);
            close(pipefd[0]);
            close(pipefd[1]);
        }
        if(preExecChildActions) {
            (*preExecChildActions)();
        }
        execvp(args.argv()[0], args.argv());
        // only async-signal-safe calls from here on
        const char prefix[] = "Failed to execvp subprocess ";
        write(STDERR_FILENO, prefix, sizeof(prefix)-1);
        write(STDERR_FILENO, args.argv()[0], strlen(args.argv()[0]));
        write(STDERR_FILENO, "\n", 1);
        _exit(127);
    }

    if(postForkParentActions) {
        (*postForkParentActions)(pid);
    }
    if(childStdoutStream) {
        close(pipefd[1]);

        FILE *childStdoutPipe = fdopen(pipefd[0], "r");
        if(childStdoutPipe == nullptr) {
            auto message = boost::format("Failed to open stdout pipe of subprocess %s: %s") % args % strerror(errno);
            OCMIRROR_THROW_ERROR(message.str());
        }
        try {
            readCStream(childStdoutPipe, childStdoutStream);
        } catch(libocmirror::Error& e) {
            fclose(childStdoutPipe);
            auto message = boost::format("Failed to read stdout from subprocess %s") % args;
            OCMIRROR_RETHROW_ERROR(e, message.str());
        }
        fclose(childStdoutPipe);
    }

    int status = 0;
    while(true) {
        if(waitpid(pid, &status, 0) == -1) {
            if(errno == EINTR) {
                continue;
            }
            auto message = boost::format("Failed to waitpid subprocess %s: %s")
                % args % strerror(errno);
            OCMIRROR_THROW_ERROR(message.str());
        }
        if(WIFEXITED(status) || WIFSIGNALED(status)) {
            break;
        }
    }

    if(!WIFEXITED(status)) {
        auto message = boost::format("Subprocess %s terminated abnormally") % args;
        OCMIRROR_THROW_ERROR(message.str());
    }

    logMessage( boost::format("%s (pid %d) exited with status %d") % args % pid % WEXITSTATUS(status),
                libocmirror::LogLevel::DEBUG);

    return WEXITSTATUS(status);
}

std::string getHostname() {
    char hostname[HOST_NAME_MAX];
    if(gethostname(hostname, HOST_NAME_MAX) != 0) {
        auto message = boost::format("failed to retrieve hostname (%s)") % strerror(errno);
        OCMIRROR_THROW_ERROR(message.str());
    }
    hostname[HOST_NAME_MAX-1] = '\0';
    return hostname;
}

}}
