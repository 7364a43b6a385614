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
#include "conf.hpp"
#include "logger.hpp"

cls_log *cglog;

static const char *log_type_str[]  = {NULL, "COR", "STR", "ONV", "PTZ", "NET", "DBS", "EVT", "TUN", "ALL"};
static const char *log_level_str[] = {NULL, "EMG", "ALR", "CRT", "ERR", "WRN", "NTC", "INF", "DBG", "ALL"};

const char *log_type_name(int msg_type)
{
    if ((msg_type < TYPE_CORE) || (msg_type > TYPE_ALL)) {
        return log_type_str[TYPE_ALL];
    }
    return log_type_str[msg_type];
}

int log_type_nbr(std::string type_name)
{
    int indx;

    for (indx = TYPE_CORE; indx <= TYPE_ALL; indx++) {
        if (mystrceq(type_name.c_str(), log_type_str[indx])) {
            return indx;
        }
    }
    return TYPE_DEFAULT;
}

/* Receive the messages from the libav probe */
static void ff_log(void *var1, int errnbr, const char *fmt, va_list vlist)
{
    (void)var1;
    char buff[1024];
    size_t blen;
    int fflvl;

    vsnprintf(buff, sizeof(buff), fmt, vlist);
    blen = strlen(buff);
    if ((blen > 0) && (buff[blen-1] == '\n')) {
        buff[blen-1] = 0;
    }
    if (buff[0] == 0) {
        return;
    }

    /* av levels are multiples of 8 starting at panic=0 */
    fflvl = ((cglog->log_fflevel -2) * 8);

    if (errnbr <= fflvl ) {
        CAMGATE_LOG(INF, TYPE_STREAM, NO_ERRNO,"%s",buff );
    }
}

void cls_log::log_history_add(std::string msg)
{
    ctx_log_item log_item;

    log_nbr++;
    log_item.log_nbr = log_nbr;
    log_item.log_msg = msg;
    log_vec.push_back(log_item);
    while (log_vec.size() > LOG_HISTORY_SIZE) {
        log_vec.pop_front();
    }
}

void cls_log::write_out(int loglvl, const char *msg)
{
    if (log_mode == LOGMODE_FILE) {
        fputs(msg, log_file_ptr);
        fflush(log_file_ptr);
    } else {
        /* The syslog level values are one less*/
        syslog(loglvl-1, "%s", msg);
        fputs(msg, stderr);
        fflush(stderr);
    }
}

void cls_log::write_flood(int loglvl)
{
    char flood_repeats[1024];

    if (flood_cnt <= 1) {
        return;
    }

    snprintf(flood_repeats, sizeof(flood_repeats)
        , "%s Above message repeats %d times\n"
        , msg_prefix, flood_cnt-1);

    write_out(loglvl, flood_repeats);
    log_history_add(flood_repeats);
}

void cls_log::write_norm(int loglvl, uint prefixlen)
{
    size_t mlen;

    flood_cnt = 1;

    snprintf(msg_flood, sizeof(msg_flood), "%s", &msg_full[prefixlen]);
    snprintf(msg_prefix, prefixlen, "%s", msg_full);

    mlen = strlen(msg_full);
    if (mlen >= sizeof(msg_full) - 1) {
        mlen = sizeof(msg_full) - 2;
    }
    msg_full[mlen] = '\n';
    msg_full[mlen + 1] = 0;

    write_out(loglvl, msg_full);
    log_history_add(msg_full);
}

void cls_log::add_errmsg(int flgerr, int err_save)
{
    size_t errsz, msgsz;
    char err_buf[90];

    if (flgerr == NO_ERRNO) {
        return;
    }

    memset(err_buf, 0, sizeof(err_buf));
    #if not defined(_GNU_SOURCE)
        (void)strerror_r(err_save, err_buf, sizeof(err_buf));
    #else
        (void)snprintf(err_buf, sizeof(err_buf),"%s"
            , strerror_r(err_save, err_buf, sizeof(err_buf)));
    #endif
    errsz = strlen(err_buf);
    msgsz = strlen(msg_full);

    if ((msgsz + errsz + 3) >= sizeof(msg_full)) {
        return;
    }
    snprintf(msg_full + msgsz, sizeof(msg_full) - msgsz, ": %s", err_buf);
}

void cls_log::set_mode(int mode_new)
{
    if ((log_mode != LOGMODE_SYSLOG) && (mode_new == LOGMODE_SYSLOG)) {
        openlog("camgate", LOG_PID, LOG_USER);
    }
    if ((log_mode == LOGMODE_SYSLOG) && (mode_new != LOGMODE_SYSLOG)) {
        closelog();
    }
    log_mode = mode_new;
}

void cls_log::set_log_file(std::string pname)
{
    if ((pname == "") || (pname == "syslog")) {
        if (log_file_ptr != nullptr) {
            myfclose(log_file_ptr);
            log_file_ptr = nullptr;
        }
        if (log_file_name != "syslog") {
            set_mode(LOGMODE_SYSLOG);
            log_file_name = "syslog";
            CAMGATE_LOG(NTC, TYPE_ALL, NO_ERRNO, _("Logging to syslog"));
        }
        return;
    }

    if ((pname == log_file_name) && (log_file_ptr != nullptr)) {
        return;
    }

    if (log_file_ptr != nullptr) {
        myfclose(log_file_ptr);
        log_file_ptr = nullptr;
    }
    log_file_ptr = myfopen(pname.c_str(), "ae");
    if (log_file_ptr != nullptr) {
        log_file_name = pname;
        set_mode(LOGMODE_SYSLOG);
        CAMGATE_LOG(NTC, TYPE_ALL, NO_ERRNO, _("Logging to file (%s)")
            ,pname.c_str());
        set_mode(LOGMODE_FILE);
    } else {
        log_file_name = "syslog";
        set_mode(LOGMODE_SYSLOG);
        CAMGATE_LOG(EMG, TYPE_ALL, SHOW_ERRNO, _("Cannot create log file %s")
            , pname.c_str());
    }
}

void cls_log::write_msg(int loglvl, int msg_type, int flgerr, int flgfnc, ...)
{
    int err_save, n;
    uint prefixlen;
    std::string usrfmt;
    char msg_time[32];
    char threadname[32];
    va_list ap;
    time_t now;
    struct tm tm_now;

    if (loglvl > log_level) {
        return;
    }
    if ((log_type != TYPE_ALL) && (msg_type != TYPE_ALL) &&
        (msg_type != log_type) && (loglvl > ERR)) {
        return;
    }

    pthread_mutex_lock(&mutex_log);

    err_save = errno;
    memset(msg_full, 0, sizeof(msg_full));

    mythreadname_get(threadname);

    now = time(NULL);
    localtime_r(&now, &tm_now);
    strftime(msg_time, sizeof(msg_time), "%b %d %H:%M:%S", &tm_now);

    if (log_mode == LOGMODE_FILE) {
        n = snprintf(msg_full, sizeof(msg_full)
            , "%s [%s][%s][%s] ", msg_time
            , log_level_str[loglvl], log_type_name(msg_type), threadname );
    } else {
        n = snprintf(msg_full, sizeof(msg_full)
            , "[%s][%s][%s] "
            , log_level_str[loglvl], log_type_name(msg_type), threadname );
    }
    prefixlen = (uint)n;

    /* flgfnc must be an int.  Bool has compile error*/
    va_start(ap, flgfnc);
        usrfmt = va_arg(ap, char *);
        if (flgfnc == 1) {
            usrfmt.append(": ").append(va_arg(ap, char *));
        }
        vsnprintf(msg_full + n, sizeof(msg_full) - (uint)n - 1
            , usrfmt.c_str(), ap);
    va_end(ap);

    add_errmsg(flgerr, err_save);

    if ((flood_cnt <= 5000) &&
        mystreq(msg_flood, &msg_full[prefixlen])) {
        flood_cnt++;
        pthread_mutex_unlock(&mutex_log);
        return;
    }

    write_flood(loglvl);
    write_norm(loglvl, prefixlen);

    pthread_mutex_unlock(&mutex_log);
}

void cls_log::shutdown()
{
    if (log_file_ptr != nullptr) {
        myfclose(log_file_ptr);
        log_file_ptr = nullptr;
    }
    log_file_name = "";
}

void cls_log::startup()
{
    log_level = app->cfg->log_level;
    log_fflevel = app->cfg->log_fflevel;
    log_type = log_type_nbr(app->cfg->log_type);
    set_log_file(app->cfg->log_file);
}

cls_log::cls_log(cls_camgate *p_app)
{
    app = p_app;
    log_mode = LOGMODE_NONE;
    log_level = LEVEL_DEFAULT;
    log_fflevel = 4;
    log_type = TYPE_ALL;
    log_file_ptr  = nullptr;
    log_file_name = "";
    log_nbr = 0;
    flood_cnt = 0;
    restart = false;
    set_mode(LOGMODE_SYSLOG);
    pthread_mutex_init(&mutex_log, NULL);
    memset(msg_prefix,0,sizeof(msg_prefix));
    memset(msg_flood,0,sizeof(msg_flood));
    memset(msg_full,0,sizeof(msg_full));
    av_log_set_callback(ff_log);
}

cls_log::~cls_log()
{
    shutdown();
    pthread_mutex_destroy(&mutex_log);
}
