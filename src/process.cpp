/*
 *    This file is part of Camgate.
 *
 *    Camgate is free software: you can redistribute it and/or modify
 *    it under the terms of the GNU General Public License as published by
 *    the Free Software Foundation, either version 3 of the License, or
 *    (at your option) any later version.
 *
 *    Camgate is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    GNU General Public License for more details.
 *
 *    You should have received a copy of the GNU General Public License
 *    along with Camgate.  If not, see <https://www.gnu.org/licenses/>.
 *
 */

#include "camgate.hpp"
#include "util.hpp"
#include "logger.hpp"
#include "process.hpp"

std::string cls_process::cmdline()
{
    std::string retcd;
    size_t indx;

    retcd = "";
    for (indx = 0; indx < args.size(); indx++) {
        if (indx > 0) {
            retcd += " ";
        }
        if (mystarts(args[indx], "rtsp")) {
            retcd += util_url_mask(args[indx]);
        } else if ((indx > 0) && (args[indx-1] == "--token")) {
            retcd += "<redacted>";
        } else {
            retcd += args[indx];
        }
    }
    return retcd;
}

int cls_process::spawn()
{
    int outpipe[2], errpipe[2], devnull, child_err;
    ssize_t rdcnt;
    size_t indx;
    std::vector<char*> argv;

    if (args.size() == 0) {
        err = CG_ERR_SPAWN;
        return -1;
    }

    if (pipe2(outpipe, O_CLOEXEC) != 0) {
        CAMGATE_LOG(ERR, logtype, SHOW_ERRNO, _("%s: pipe failed"), name.c_str());
        err = CG_ERR_SPAWN;
        return -1;
    }
    if (pipe2(errpipe, O_CLOEXEC) != 0) {
        CAMGATE_LOG(ERR, logtype, SHOW_ERRNO, _("%s: pipe failed"), name.c_str());
        close(outpipe[0]);
        close(outpipe[1]);
        err = CG_ERR_SPAWN;
        return -1;
    }

    for (indx = 0; indx < args.size(); indx++) {
        argv.push_back((char*)args[indx].c_str());
    }
    argv.push_back(nullptr);

    pid = fork();
    if (pid < 0) {
        CAMGATE_LOG(ERR, logtype, SHOW_ERRNO, _("%s: fork failed"), name.c_str());
        close(outpipe[0]);
        close(outpipe[1]);
        close(errpipe[0]);
        close(errpipe[1]);
        pid = -1;
        err = CG_ERR_SPAWN;
        return -1;
    }

    if (pid == 0) {
        /* Child */
        setpgid(0, 0);
        ::signal(SIGPIPE, SIG_DFL);
        ::signal(SIGINT, SIG_DFL);
        ::signal(SIGTERM, SIG_DFL);
        ::signal(SIGHUP, SIG_DFL);
        devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(outpipe[1], STDOUT_FILENO);
        dup2(outpipe[1], STDERR_FILENO);
        execvp(argv[0], argv.data());
        child_err = errno;
        if (write(errpipe[1], &child_err, sizeof(child_err)) < 0) {
            _exit(126);
        }
        _exit(127);
    }

    close(outpipe[1]);
    close(errpipe[1]);

    /* The status pipe closes on a successful exec */
    do {
        rdcnt = read(errpipe[0], &child_err, sizeof(child_err));
    } while ((rdcnt < 0) && (errno == EINTR));
    close(errpipe[0]);

    if (rdcnt == (ssize_t)sizeof(child_err)) {
        close(outpipe[0]);
        reap(true);
        errno = child_err;
        CAMGATE_LOG(ERR, logtype, SHOW_ERRNO
            , _("%s: unable to run %s"), name.c_str(), args[0].c_str());
        err = CG_ERR_SPAWN;
        return -1;
    }

    fd_out = outpipe[0];
    fcntl(fd_out, F_SETFL, fcntl(fd_out, F_GETFL) | O_NONBLOCK);
    linebuf = "";

    return 0;
}

int cls_process::start()
{
    if (running()) {
        return 0;
    }

    stop_requested = false;
    restart_at = 0;
    err = CG_ERR_NONE;
    exit_code = 0;
    state = PROC_STARTING;

    start_times.push_back(util_mono_ms());
    if (start_times.size() > PROC_HISTORY_MAX) {
        start_times.pop_front();
    }

    if (spawn() != 0) {
        state = PROC_CRASHED;
        if ((oneshot == false) &&
            ((restart_max == 0) || (restart_cnt < restart_max))) {
            restart_at = util_mono_ms() + restart_delay;
        }
        return -1;
    }

    CAMGATE_LOG(INF, logtype, NO_ERRNO, "%s: started pid %d: %s"
        , name.c_str(), (int)pid, cmdline().c_str());
    state = PROC_RUNNING;

    return 0;
}

void cls_process::read_output()
{
    char buf[4096];
    ssize_t rdcnt;
    size_t indx;
    std::string line;

    if (fd_out < 0) {
        return;
    }

    while ((rdcnt = read(fd_out, buf, sizeof(buf))) > 0) {
        for (indx = 0; indx < (size_t)rdcnt; indx++) {
            if ((buf[indx] == '\n') || (buf[indx] == '\r')) {
                if (linebuf != "") {
                    line = linebuf;
                    linebuf = "";
                    if (on_line) {
                        on_line(line);
                    }
                }
            } else if (linebuf.length() < 65536) {
                linebuf += buf[indx];
            }
        }
    }

    if (rdcnt == 0) {
        close_output();
    }
}

void cls_process::close_output()
{
    std::string line;

    if (fd_out >= 0) {
        close(fd_out);
        fd_out = -1;
    }
    if (linebuf != "") {
        line = linebuf;
        linebuf = "";
        if (on_line) {
            on_line(line);
        }
    }
}

bool cls_process::reap(bool block)
{
    int status;
    pid_t retcd;

    if (pid <= 0) {
        return true;
    }

    do {
        retcd = waitpid(pid, &status, block ? 0 : WNOHANG);
    } while ((retcd < 0) && (errno == EINTR));

    if (retcd == 0) {
        return false;
    }
    if (retcd < 0) {
        exit_code = -1;
    } else if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code = 128 + WTERMSIG(status);
    } else {
        exit_code = -1;
    }
    pid = -1;
    return true;
}

void cls_process::poll(int64_t now_mono)
{
    read_output();

    if ((pid > 0) && reap(false)) {
        read_output();
        close_output();

        if (stop_requested) {
            state = PROC_STOPPED;
        } else if (oneshot) {
            state = (exit_code == 0) ? PROC_STOPPED : PROC_CRASHED;
            if (exit_code != 0) {
                err = CG_ERR_CRASHED;
            }
        } else {
            state = PROC_CRASHED;
            err = CG_ERR_CRASHED;
            if ((restart_max == 0) || (restart_cnt < restart_max)) {
                restart_at = now_mono + restart_delay;
                CAMGATE_LOG(WRN, logtype, NO_ERRNO
                    , _("%s: exited with code %d, restarting in %d ms")
                    , name.c_str(), exit_code, restart_delay);
            } else {
                CAMGATE_LOG(ERR, logtype, NO_ERRNO
                    , _("%s: exited with code %d after %d restarts, giving up")
                    , name.c_str(), exit_code, restart_cnt);
            }
        }
        if (on_exit) {
            on_exit(exit_code);
        }
    }

    if ((state == PROC_CRASHED) && (restart_at > 0) && (now_mono >= restart_at)) {
        restart_at = 0;
        restart_cnt++;
        start();
    }
}

void cls_process::signal(int sig)
{
    if (pid > 0) {
        kill(pid, sig);
    }
}

/* Graceful terminate, then kill once wait_ms has passed */
void cls_process::stop(int sig, int wait_ms)
{
    int64_t deadline;

    stop_requested = true;
    restart_at = 0;

    if (pid > 0) {
        kill(pid, sig);
        deadline = util_mono_ms() + wait_ms;
        while (reap(false) == false) {
            if (util_mono_ms() >= deadline) {
                CAMGATE_LOG(WRN, logtype, NO_ERRNO
                    , _("%s: no exit after %d ms, killing"), name.c_str(), wait_ms);
                kill(pid, SIGKILL);
                reap(true);
                break;
            }
            read_output();
            SLEEP(0, 50000000L);
        }
        read_output();
        close_output();
        CAMGATE_LOG(INF, logtype, NO_ERRNO
            , "%s: stopped (code %d)", name.c_str(), exit_code);
    } else {
        close_output();
    }
    state = PROC_STOPPED;
}

bool cls_process::running()
{
    return (pid > 0);
}

bool cls_process::finished()
{
    return ((pid <= 0) && (restart_at == 0) &&
        ((state == PROC_STOPPED) || (state == PROC_CRASHED)));
}

int cls_process::wait_exit(int timeout_ms)
{
    int64_t deadline;

    deadline = util_mono_ms() + timeout_ms;
    while (running()) {
        poll(util_mono_ms());
        if (running() == false) {
            break;
        }
        if (util_mono_ms() >= deadline) {
            CAMGATE_LOG(WRN, logtype, NO_ERRNO
                , _("%s: timed out after %d ms"), name.c_str(), timeout_ms);
            stop(SIGKILL, 1000);
            err = CG_ERR_TIMEOUT;
            return -1;
        }
        SLEEP(0, 20000000L);
    }
    return exit_code;
}

/* Run a child to completion, collecting its output */
int process_run(std::vector<std::string> args, int timeout_ms
    , int logtype, std::string *output)
{
    cls_process proc("run", logtype);
    int retcd;

    if (args.size() > 0) {
        proc.name = args[0];
    }
    proc.oneshot = true;
    proc.args = args;
    if (output != nullptr) {
        proc.on_line = [output](const std::string &line) {
            *output += line + "\n";
        };
    }
    if (proc.start() != 0) {
        return -1;
    }
    retcd = proc.wait_exit(timeout_ms);
    if (retcd != 0) {
        CAMGATE_LOG(DBG, logtype, NO_ERRNO, "%s: exit %d", proc.name.c_str(), retcd);
        return -1;
    }
    return 0;
}

cls_process::cls_process(std::string p_name, int p_logtype)
{
    name = p_name;
    logtype = p_logtype;
    oneshot = false;
    restart_max = 0;
    restart_delay = 5000;
    state = PROC_STOPPED;
    pid = -1;
    exit_code = 0;
    restart_cnt = 0;
    err = CG_ERR_NONE;
    fd_out = -1;
    linebuf = "";
    restart_at = 0;
    stop_requested = false;
}

cls_process::~cls_process()
{
    if (pid > 0) {
        stop(SIGTERM, 2000);
    }
    close_output();
}
