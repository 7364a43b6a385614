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

#ifndef _INCLUDE_PROCESS_HPP_
#define _INCLUDE_PROCESS_HPP_

#define PROC_HISTORY_MAX    50

enum PROC_STATE {
    PROC_STOPPED,
    PROC_STARTING,
    PROC_RUNNING,
    PROC_CRASHED
};

/*
 * A child program with merged stdout/stderr read line by line.
 * Long running children are restarted after restart_delay when they
 * exit without being asked to.  One-shot children just finish.
 */
class cls_process {
    public:
        cls_process(std::string p_name, int p_logtype);
        ~cls_process();

        std::string             name;
        std::vector<std::string> args;      /* args[0] is the program */
        bool                    oneshot;
        int                     restart_max;    /* 0 means unbounded */
        int                     restart_delay;  /* ms */

        enum PROC_STATE         state;
        pid_t                   pid;
        int                     exit_code;
        int                     restart_cnt;
        enum CG_ERR             err;
        std::deque<int64_t>     start_times;    /* Monotonic ms of each spawn */

        std::function<void(const std::string &)>   on_line;
        std::function<void(int)>                   on_exit;

        int start();
        void stop(int sig = SIGTERM, int wait_ms = 5000);
        void signal(int sig);
        void poll(int64_t now_mono);
        bool running();
        bool finished();
        int wait_exit(int timeout_ms);
        std::string cmdline();

    private:
        int         logtype;
        int         fd_out;
        std::string linebuf;
        int64_t     restart_at;
        bool        stop_requested;

        int spawn();
        void read_output();
        void close_output();
        bool reap(bool block);
};

    int process_run(std::vector<std::string> args, int timeout_ms
        , int logtype, std::string *output);

#endif /* _INCLUDE_PROCESS_HPP_ */
