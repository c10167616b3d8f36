/* Copyright © 2007-2022 Jakub Wilk <jwilk@jwilk.net>
 * Copyright © 2009 Mateusz Turcza
 * Copyright © 2026 The pdfdetext authors
 *
 * This file is part of pdfdetext.
 *
 * pdfdetext is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 *
 * pdfdetext is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * General Public License for more details.
 */

#include "autoconf.hh"
#include "system.hh"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <csignal>
#include <sstream>
#include <string>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

#if _OPENMP
#include <omp.h>
#endif

#include "i18n.hh"
#include "string-utils.hh"

typedef std::chrono::steady_clock clock_type;

Command::Command(const std::string& command)
: command(command), timeout(0)
{
    this->argv.push_back(command);
}

Command &Command::operator <<(const std::string& arg)
{
    this->argv.push_back(arg);
    return *this;
}

Command &Command::operator <<(const File& arg)
{
    this->argv.push_back(arg);
    return *this;
}

Command &Command::operator <<(int i)
{
    std::ostringstream stream;
    stream << i;
    return *this << stream.str();
}

static int get_max_fd()
{
    int max_fd_per_thread = 16; // rough estimate
    int max_fd = 16;
#if _OPENMP
    max_fd += max_fd_per_thread * omp_get_num_threads();
#else
    max_fd += max_fd_per_thread;
#endif
    return max_fd;
}

static void fd_close(int fd)
{
    int rc = close(fd);
    if (rc < 0)
        throw_posix_error("close()");
}

static void mkfifo(int fd[2])
{
    int rc = pipe(fd);
    if (rc < 0)
        throw_posix_error("pipe()");
    for (int i = 0; i < 2; i++) {
        int rc = fcntl(fd[i], F_SETFD, FD_CLOEXEC);
        if (rc < 0)
            throw_posix_error("fcntl(fd, F_SETFD, FD_CLOEXEC)");
    }
}

static int fd_close_range(int fd_from, int fd_to, int fd_except=-1)
{
    for (int fd = fd_from; fd <= fd_to; fd++) {
        if (fd == fd_except)
            continue;
        int rc = close(fd);
        if (rc == 0 || errno == EBADF)
            continue;
        else
            return rc;
    }
    return 0;
}

static void report_posix_error(int fd, const char *context)
{
    int errno_copy = errno;
    ssize_t n = write(fd, &errno_copy, sizeof errno_copy);
    if (n != sizeof errno_copy)
        return;
    n = write(fd, context, strlen(context));
    // There isn't much we can do here about write() failing,
    // so let's silence the compiler warning.
    (void) n;
}

static const char * get_signal_name(int sig)
{
    switch (sig) {
#define s(n) case n: return #n;
    s(SIGHUP);
    s(SIGINT);
    s(SIGQUIT);
    s(SIGILL);
    s(SIGABRT);
    s(SIGFPE);
    s(SIGKILL);
    s(SIGSEGV);
    s(SIGPIPE);
    s(SIGALRM);
    s(SIGTERM);
    s(SIGUSR1);
    s(SIGUSR2);
    s(SIGBUS);
    s(SIGSYS);
    s(SIGTRAP);
    s(SIGXCPU);
    s(SIGXFSZ);
#undef s
    default:
        return nullptr;
    }
}

/* Milliseconds left until the deadline, as expected by poll(). */
static int get_poll_timeout(bool has_deadline, clock_type::time_point deadline)
{
    if (!has_deadline)
        return -1;
    clock_type::duration left = deadline - clock_type::now();
    if (left <= clock_type::duration::zero())
        return 0;
    long long ms = std::chrono::duration_cast<std::chrono::milliseconds>(left).count() + 1;
    if (ms > 60 * 60 * 1000)
        ms = 60 * 60 * 1000;
    return static_cast<int>(ms);
}

static void kill_child(pid_t pid)
{
    // The child is the leader of its own process group,
    // so that its descendants are killed, too.
    if (kill(-pid, SIGKILL) < 0) {
        if (errno != ESRCH)
            throw_posix_error("kill()");
        if (kill(pid, SIGKILL) < 0 && errno != ESRCH)
            throw_posix_error("kill()");
    }
    int wait_status;
    pid_t rc;
    do
        rc = waitpid(pid, &wait_status, 0);
    while (rc < 0 && errno == EINTR);
    if (rc < 0)
        throw_posix_error("waitpid()");
}

/* Returns false if the deadline passed before the child terminated. */
static bool wait_for_child(pid_t pid, int &wait_status, bool has_deadline, clock_type::time_point deadline)
{
    while (true) {
        pid_t rc = waitpid(pid, &wait_status, has_deadline ? WNOHANG : 0);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            throw_posix_error("waitpid()");
        }
        if (rc == pid)
            return true;
        if (clock_type::now() >= deadline)
            return false;
        struct timespec delay = { 0, 10 * 1000 * 1000 };
        nanosleep(&delay, nullptr);
    }
}

std::string Command::repr()
{
    return string_printf(
        // L10N: "<command> ..."
        _("%s ..."),
        this->command.c_str()
    );
}

void Command::call(std::ostream *stdout_, bool stderr_)
{
    int rc;
    int max_fd = get_max_fd();
    int stdout_pipe[2];
    int error_pipe[2];
    size_t argc = this->argv.size();
    std::vector<const char *> c_argv(argc + 1);
    for (size_t i = 0; i < argc; i++)
        c_argv[i] = argv[i].c_str();
    c_argv[argc] = nullptr;
    bool has_deadline = this->timeout > 0;
    clock_type::time_point deadline = clock_type::now();
    if (has_deadline)
        deadline += std::chrono::duration_cast<clock_type::duration>(
            std::chrono::duration<double>(this->timeout)
        );
    mkfifo(stdout_pipe);
    mkfifo(error_pipe);
    pid_t pid = fork();
    if (pid < 0)
        throw_posix_error("fork()");
    if (pid == 0) {
        // The child:
        // At this point, only async-signal-safe functions can be used.
        // See the signal(7) manpage for the full list.
        rc = setpgid(0, 0);
        if (rc < 0) {
            report_posix_error(error_pipe[1], "setpgid()");
            abort();
        }
        int fd = open("/dev/null", O_RDONLY);
        if (fd < 0) {
            report_posix_error(error_pipe[1], "open()");
            abort();
        }
        rc = dup2(fd, STDIN_FILENO);
        if (rc < 0) {
            report_posix_error(error_pipe[1], "dup2()");
            abort();
        }
        rc = dup2(stdout_pipe[1], STDOUT_FILENO);
        if (rc < 0) {
            report_posix_error(error_pipe[1], "dup2()");
            abort();
        }
        if (!stderr_) {
            int fd = open("/dev/null", O_WRONLY);
            if (fd < 0) {
                report_posix_error(error_pipe[1], "open()");
                abort();
            }
            rc = dup2(fd, STDERR_FILENO);
            if (rc < 0) {
                report_posix_error(error_pipe[1], "dup2()");
                abort();
            }
        }
        int rc = fd_close_range(STDERR_FILENO + 1, max_fd, error_pipe[1]);
        if (rc < 0) {
            report_posix_error(error_pipe[1], "close()");
            abort();
        }
        execvp(c_argv[0],
            const_cast<char * const *>(c_argv.data())
        );
        report_posix_error(error_pipe[1], "\xFF");
        _exit(127);
    }
    // The parent:
    // Both sides set the process group, so that it exists before any kill().
    // EACCES means that the child has already called execvp().
    if (setpgid(pid, pid) < 0 && errno != EACCES && errno != ESRCH)
        throw_posix_error("setpgid()");
    fd_close(stdout_pipe[1]);
    fd_close(error_pipe[1]);
    char buffer[BUFSIZ];
    struct pollfd fds[1];
    fds[0].fd = stdout_pipe[0];
    fds[0].events = POLLIN;
    bool timed_out = false;
    while (1) {
        rc = poll(fds, 1, get_poll_timeout(has_deadline, deadline));
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            throw_posix_error("poll()");
        }
        if (rc == 0) {
            timed_out = true;
            break;
        }
        ssize_t nbytes = read(stdout_pipe[0], buffer, sizeof buffer);
        if (nbytes < 0)
            throw_posix_error("read()");
        if (nbytes == 0)
            break;
        if (stdout_)
            stdout_->write(buffer, nbytes);
    }
    fd_close(stdout_pipe[0]);
    int wait_status = 0;
    if (!timed_out)
        timed_out = !wait_for_child(pid, wait_status, has_deadline, deadline);
    if (timed_out) {
        fd_close(error_pipe[0]);
        kill_child(pid);
        std::string message = string_printf(
            _("External command \"%s\" did not finish within %g seconds"),
            this->repr().c_str(),
            this->timeout
        );
        throw Timeout(message);
    }
    int child_errno = 0;
    ssize_t nbytes = read(error_pipe[0], &child_errno, sizeof child_errno);
    if (nbytes < 0)
        throw_posix_error("read()");
    if (nbytes > 0 && static_cast<size_t>(nbytes) < sizeof child_errno) {
        errno = EIO;
        throw_posix_error("read()");
    }
    if (child_errno > 0) {
        char child_error_reason[BUFSIZ];
        ssize_t nbytes = read(
            error_pipe[0],
            child_error_reason,
            (sizeof child_error_reason) - 1
        );
        if (nbytes < 0)
            throw_posix_error("read()");
        fd_close(error_pipe[0]);
        child_error_reason[nbytes] = '\0';
        errno = child_errno;
        if (child_error_reason[0] != '\xFF')
            throw_posix_error(child_error_reason);
        std::string child_error = POSIXError::error_message("");
        std::string message = string_printf(
            _("External command \"%s\" failed: %s"),
            this->repr().c_str(),
            child_error.c_str()
        );
        throw NotFound(message);
    }
    fd_close(error_pipe[0]);
    if (WIFEXITED(wait_status)) {
        unsigned long exit_status = WEXITSTATUS(wait_status);
        if (exit_status != 0) {
            std::string message = string_printf(
                _("External command \"%s\" failed with exit status %lu"),
                this->repr().c_str(),
                exit_status
            );
            throw CommandFailed(message);
        }
    } else if (WIFSIGNALED(wait_status)) {
        int sig = WTERMSIG(wait_status);
        const char * signame = get_signal_name(sig);
        std::string message;
        if (signame)
            message = string_printf(
                // L10N: the latter argument is an untranslated signal name
                // (such as "SIGSEGV")
                _("External command \"%s\" was terminated by %s"),
                this->repr().c_str(),
                signame
            );
        else
            message = string_printf(
                _("External command \"%s\" was terminated by signal %d"),
                this->repr().c_str(),
                sig
            );
        throw CommandFailed(message);
    } else {
        // should not happen
        errno = EINVAL;
        throw_posix_error("waitpid()");
    }
}

// vim:ts=4 sts=4 sw=4 et
