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
#include "conf.hpp"
#include "json_parse.hpp"
#include "xml.hpp"
#include "http.hpp"
#include "evtbus.hpp"
#include "process.hpp"
#include "discovery.hpp"
#include "onvif.hpp"
#include "ptz.hpp"
#include "dbse.hpp"
#include "preset.hpp"
#include "settings.hpp"
#include "stream.hpp"
#include "tunnel.hpp"
#include "recorder.hpp"
#include "pipeline.hpp"
#include "analyzer.hpp"
#include "notify.hpp"
#include "gateway.hpp"
#include "webu.hpp"

volatile enum CAMGATE_SIGNAL cgsignal;

/* Stop the web control before the gateways so no request holds one */
void cls_camgate::signal_process()
{
    int indx;
    ctx_trigger trg;
    ctx_snapshot snap;

    switch(cgsignal){
    case CAMGATE_SIGNAL_ALARM:       /* Snapshot from every camera */
        for (indx=0; indx<gw_cnt; indx++) {
            if ((gw_list[indx]->status == GATEWAY_RUNNING) &&
                (gw_list[indx]->recorder != nullptr)) {
                if (gw_list[indx]->recorder->snapshot(snap) != 0) {
                    CAMGATE_LOG(WRN, TYPE_CORE, NO_ERRNO
                        , _("Snapshot failed for %s"), gw_list[indx]->device_id.c_str());
                }
            }
        }
        break;
    case CAMGATE_SIGNAL_USR1:        /* Manual trigger on every camera */
        trg.source = TRIGGER_MANUAL;
        trg.timestamp = util_now_ms();
        trg.confidence = -1;
        trg.species = "";
        for (indx=0; indx<gw_cnt; indx++) {
            if (gw_list[indx]->status == GATEWAY_RUNNING) {
                gw_list[indx]->queue_trigger(trg);
            }
        }
        break;
    case CAMGATE_SIGNAL_SIGHUP:      /* Reload the parameters and restart*/
        CAMGATE_LOG(NTC, TYPE_CORE, NO_ERRNO, _("Reloading configuration"));
        reload_all = true;
        if (webu != nullptr) {
            webu->wb_finish = true;
        }
        for (indx=0; indx<gw_cnt; indx++) {
            gw_list[indx]->handler_shutdown();
        }
        break;
    case CAMGATE_SIGNAL_SIGTERM:     /* Quit application */
        CAMGATE_LOG(NTC, TYPE_CORE, NO_ERRNO, _("Shutdown requested"));
        if (webu != nullptr) {
            webu->wb_finish = true;
        }
        for (indx=0; indx<gw_cnt; indx++) {
            gw_list[indx]->handler_shutdown();
        }
        break;
    default:
        break;
    }
    cgsignal = CAMGATE_SIGNAL_NONE;
}

void cls_camgate::pid_write()
{
    FILE *pidf = NULL;

    if (cfg->pid_file != "") {
        pidf = myfopen(cfg->pid_file.c_str(), "w+e");
        if (pidf) {
            (void)fprintf(pidf, "%d\n", getpid());
            myfclose(pidf);
            CAMGATE_LOG(NTC, TYPE_ALL, NO_ERRNO
                ,_("Created process id file %s. Process ID is %d")
                ,cfg->pid_file.c_str(), getpid());
        } else {
            CAMGATE_LOG(EMG, TYPE_ALL, SHOW_ERRNO
                , _("Cannot create process id file (pid file) %s")
                , cfg->pid_file.c_str());
        }
    }

    CAMGATE_LOG(NTC, TYPE_ALL, NO_ERRNO,_("Camgate pid: %d"), getpid());
}

/** Remove the process id file ( pid file ) before Camgate exit. */
void cls_camgate::pid_remove()
{
    if ((cfg == nullptr) || (cfg->pid_file == "") || reload_all) {
        return;
    }
    if (util_file_exists(cfg->pid_file) == false) {
        return;
    }
    if (!unlink(cfg->pid_file.c_str())) {
        CAMGATE_LOG(NTC, TYPE_ALL, NO_ERRNO, _("Removed process id file (pid file)."));
    } else{
        CAMGATE_LOG(ERR, TYPE_ALL, SHOW_ERRNO, _("Error removing pid file"));
    }
}

void cls_camgate::daemon()
{
    int fd;
    struct sigaction sig_ign_action;

    #ifdef SA_RESTART
        sig_ign_action.sa_flags = SA_RESTART;
    #else
        sig_ign_action.sa_flags = 0;
    #endif

    sig_ign_action.sa_handler = SIG_IGN;
    sigemptyset(&sig_ign_action.sa_mask);

    if (fork()) {
        CAMGATE_LOG(NTC, TYPE_ALL, NO_ERRNO, _("Camgate going to daemon mode"));
        exit(0);
    }

    if (chdir("/")) {
        CAMGATE_LOG(ERR, TYPE_ALL, SHOW_ERRNO, _("Could not change directory"));
    }

    setsid();

    fd = open("/dev/null", O_RDONLY|O_CLOEXEC);
    if (fd != -1) {
        dup2(fd, STDIN_FILENO);
        close(fd);
    }

    fd = open("/dev/null", O_WRONLY|O_CLOEXEC);
    if (fd != -1) {
        dup2(fd, STDOUT_FILENO);
        dup2(fd, STDERR_FILENO);
        close(fd);
    }

    sigaction(SIGTTOU, &sig_ign_action, NULL);
    sigaction(SIGTTIN, &sig_ign_action, NULL);
    sigaction(SIGTSTP, &sig_ign_action, NULL);
}

void cls_camgate::av_init()
{
    CAMGATE_LOG(NTC, TYPE_STREAM, NO_ERRNO, _("libavcodec  version %d.%d.%d")
        , LIBAVCODEC_VERSION_MAJOR, LIBAVCODEC_VERSION_MINOR, LIBAVCODEC_VERSION_MICRO);
    CAMGATE_LOG(NTC, TYPE_STREAM, NO_ERRNO, _("libavformat version %d.%d.%d")
        , LIBAVFORMAT_VERSION_MAJOR, LIBAVFORMAT_VERSION_MINOR, LIBAVFORMAT_VERSION_MICRO);

    avformat_network_init();
}

void cls_camgate::av_deinit()
{
    avformat_network_deinit();
}

void cls_camgate::ntc()
{
    #ifdef HAVE_GETTEXT
        CAMGATE_LOG(DBG, TYPE_ALL, NO_ERRNO,_("nls    : available"));
    #else
        CAMGATE_LOG(DBG, TYPE_ALL, NO_ERRNO,_("nls    : not available"));
    #endif
    CAMGATE_LOG(DBG, TYPE_ALL, NO_ERRNO,_("microhttpd %s"), MHD_get_version());
    CAMGATE_LOG(DBG, TYPE_ALL, NO_ERRNO,_("zlib %s"), zlibVersion());
}

cls_gateway *cls_camgate::gateway_find(std::string device_id)
{
    int indx;
    cls_gateway *gw;

    gw = nullptr;
    pthread_mutex_lock(&mutex_gwlst);
        for (indx=0; indx<(int)gw_list.size(); indx++) {
            if (gw_list[indx]->device_id == device_id) {
                gw = gw_list[indx];
                break;
            }
        }
    pthread_mutex_unlock(&mutex_gwlst);

    return gw;
}

/* Restart gateway loops that stopped without being asked to */
bool cls_camgate::check_devices()
{
    int indx;
    bool retcd;

    retcd = false;
    for (indx=0; indx<gw_cnt; indx++) {
        if (gw_list[indx]->status != GATEWAY_RUNNING) {
            continue;
        }
        if (gw_list[indx]->handler_running) {
            retcd = true;
        } else if (gw_list[indx]->handler_stop == false) {
            CAMGATE_LOG(WRN, TYPE_CORE, NO_ERRNO
                , _("Restarting gateway loop for %s")
                , gw_list[indx]->device_id.c_str());
            gw_list[indx]->handler_startup();
            retcd = true;
        }
    }

    return retcd;
}

/* Duplicate device ids would share clip and preset rows */
void cls_camgate::check_restart()
{
    int indx, indx2;

    for (indx=0; indx<gw_cnt; indx++) {
        for (indx2=indx+1; indx2<gw_cnt; indx2++) {
            if ((gw_list[indx]->status == GATEWAY_RUNNING) &&
                (gw_list[indx]->device_id == gw_list[indx2]->device_id)) {
                CAMGATE_LOG(WRN, TYPE_ALL, NO_ERRNO
                    ,_("Device id %s is used by more than one camera")
                    , gw_list[indx]->device_id.c_str());
            }
        }
    }
}

int cls_camgate::init(int p_argc, char *p_argv[])
{
    int indx, running;
    std::string dbname;
    std::vector<std::string> errs;
    size_t indx_err;

    argc = p_argc;
    argv = p_argv;

    reload_all = false;
    gw_cnt = 0;
    gw_list.clear();
    conf_src = nullptr;
    cfg = nullptr;
    dbse = nullptr;
    webu = nullptr;

    conf_src = new cls_config(this);
    conf_src->init();

    cfg = new cls_config(this);
    cfg->parms_copy(conf_src);

    cglog->startup();

    mytranslate_init();

    mytranslate_text("",cfg->native_language);

    for (indx=0; indx<gw_cnt; indx++) {
        if (gw_list[indx]->cfg->validate(errs) != 0) {
            for (indx_err=0; indx_err<errs.size(); indx_err++) {
                CAMGATE_LOG(CRT, TYPE_ALL, NO_ERRNO, "%s: %s"
                    , gw_list[indx]->conf_src->conf_filename.c_str()
                    , errs[indx_err].c_str());
            }
            return -1;
        }
    }

    if (cfg->daemon) {
        daemon();
        CAMGATE_LOG(NTC, TYPE_ALL, NO_ERRNO, _("Camgate running as daemon process"));
    }

    cfg->parms_log();

    pid_write();

    ntc();

    av_init();

    if (mycreate_path((cfg->data_dir + "/").c_str()) != 0) {
        CAMGATE_LOG(ERR, TYPE_ALL, NO_ERRNO
            , _("Unable to create data directory %s"), cfg->data_dir.c_str());
    }

    dbname = cfg->database_dbname;
    if (dbname == "") {
        dbname = cfg->data_dir + "/camgate.db";
    }
    dbse = new cls_dbse(dbname, cfg->database_busy_timeout);
    if (dbse->is_ready()) {
        dbse->handler_startup();
    } else {
        CAMGATE_LOG(ERR, TYPE_DB, NO_ERRNO
            , _("Database %s unavailable.  Clips and presets will not be catalogued")
            , dbname.c_str());
    }

    running = 0;
    for (indx=0; indx<gw_cnt; indx++) {
        gw_list[indx]->dbse = dbse;
        if (gw_list[indx]->init() == 0) {
            gw_list[indx]->handler_startup();
            running++;
        } else {
            CAMGATE_LOG(CRT, TYPE_CORE, NO_ERRNO
                , _("Camera %s refused to start: no usable stream url")
                , gw_list[indx]->cfg->camera_name.c_str());
        }
    }

    check_restart();

    if (running == 0) {
        CAMGATE_LOG(CRT, TYPE_ALL, NO_ERRNO, _("No camera could be started"));
        return -1;
    }

    /* Start web control last */
    webu = new cls_webu(this);

    return 0;
}

void cls_camgate::deinit()
{
    int indx;

    mydelete(webu);

    for (indx = 0; indx < (int)gw_list.size(); indx++) {
        gw_list[indx]->handler_shutdown();
    }
    pthread_mutex_lock(&mutex_gwlst);
        for (indx = 0; indx < (int)gw_list.size(); indx++) {
            mydelete(gw_list[indx]);
        }
        gw_list.clear();
        gw_cnt = 0;
    pthread_mutex_unlock(&mutex_gwlst);

    mydelete(dbse);

    if (cfg != nullptr) {
        av_deinit();
    }
    pid_remove();

    mydelete(conf_src);
    mydelete(cfg);
}

/** Main entry point of Camgate. */
cls_camgate::cls_camgate()
{
    reload_all = false;
    gw_cnt = 0;
    argc = 0;
    argv = nullptr;
    conf_src = nullptr;
    cfg = nullptr;
    webu = nullptr;
    dbse = nullptr;
    pthread_mutex_init(&mutex_gwlst, NULL);
    pthread_mutex_init(&mutex_post, NULL);
}

cls_camgate::~cls_camgate()
{
    pthread_mutex_destroy(&mutex_gwlst);
    pthread_mutex_destroy(&mutex_post);
}
