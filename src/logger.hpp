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
#ifndef _INCLUDE_LOGGER_HPP_
#define _INCLUDE_LOGGER_HPP_
    extern cls_log *cglog;

    #define LOGMODE_NONE            0   /* No logging             */
    #define LOGMODE_FILE            1   /* Log messages to file   */
    #define LOGMODE_SYSLOG          2   /* Log messages to syslog */

    #define NO_ERRNO                0   /* Do not append the errno text */
    #define SHOW_ERRNO              1   /* Append the errno text */

    #define EMG                     1
    #define ALR                     2
    #define CRT                     3
    #define ERR                     4
    #define WRN                     5
    #define NTC                     6
    #define INF                     7
    #define DBG                     8
    #define ALL                     9
    #define LEVEL_DEFAULT           NTC

    /* Log types */
    #define TYPE_CORE               1             /* Application and gateway loop */
    #define TYPE_STREAM             2             /* Transcoder and relay */
    #define TYPE_ONVIF              3             /* Discovery and control protocol */
    #define TYPE_PTZ                4             /* PTZ backends and presets */
    #define TYPE_NET                5             /* HTTP client and web control */
    #define TYPE_DB                 6             /* Database */
    #define TYPE_EVENTS             7             /* Recording, motion and notifications */
    #define TYPE_TUNNEL             8             /* Tunnel process */
    #define TYPE_ALL                9
    #define TYPE_DEFAULT            TYPE_ALL
    #define TYPE_DEFAULT_STR        "ALL"

    #define CAMGATE_LOG(x, y, z, ...) cglog->write_msg(x, y, z, 1, __FUNCTION__, __VA_ARGS__)
    #define CAMGATE_SHT(x, y, z, ...) cglog->write_msg(x, y, z, 0, __VA_ARGS__)

    #define LOG_HISTORY_SIZE        200

    struct ctx_log_item {
        uint64_t    log_nbr;
        std::string log_msg;
    };

    class cls_log {
        public:
            cls_log(cls_camgate *p_app);
            ~cls_log();
            int     log_level;
            int     log_fflevel;
            int     log_type;
            void set_log_file(std::string pname);
            void write_msg(int loglvl, int msg_type, int flgerr, int flgfnc, ...);
            pthread_mutex_t     mutex_log;
            void shutdown();
            void startup();
            bool restart;
            std::deque<ctx_log_item> log_vec;
        private:
            cls_camgate         *app;
            int                 log_mode;
            FILE                *log_file_ptr;
            std::string         log_file_name;
            uint64_t            log_nbr;
            char                msg_prefix[512];
            char                msg_flood[1024];
            char                msg_full[1024];
            int                 flood_cnt;

            void set_mode(int mode);
            void write_out(int loglvl, const char *msg);
            void write_flood(int loglvl);
            void write_norm(int loglvl, uint prefixlen);
            void add_errmsg(int flgerr, int err_save);
            void log_history_add(std::string msg);
    };

    const char *log_type_name(int msg_type);
    int log_type_nbr(std::string type_name);

#endif /* _INCLUDE_LOGGER_HPP_ */
