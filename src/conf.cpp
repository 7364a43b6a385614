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
#include "gateway.hpp"

/*Configuration parameters */
struct ctx_parm config_parms[] = {
    {"daemon",                    PARM_TYP_BOOL,   PARM_CAT_00, false },
    {"conf_filename",             PARM_TYP_STRING, PARM_CAT_00, false },
    {"pid_file",                  PARM_TYP_STRING, PARM_CAT_00, false },
    {"log_file",                  PARM_TYP_STRING, PARM_CAT_00, false },
    {"log_level",                 PARM_TYP_LIST,   PARM_CAT_00, false },
    {"log_fflevel",               PARM_TYP_LIST,   PARM_CAT_00, false },
    {"log_type",                  PARM_TYP_LIST,   PARM_CAT_00, false },
    {"native_language",           PARM_TYP_BOOL,   PARM_CAT_00, false },
    {"data_dir",                  PARM_TYP_STRING, PARM_CAT_00, false },

    {"device_id",                 PARM_TYP_STRING, PARM_CAT_01, false },
    {"camera_name",               PARM_TYP_STRING, PARM_CAT_01, false },
    {"camera_location",           PARM_TYP_STRING, PARM_CAT_01, false },
    {"rtsp_url",                  PARM_TYP_STRING, PARM_CAT_01, true },
    {"ffmpeg_path",               PARM_TYP_STRING, PARM_CAT_01, false },

    {"onvif_enabled",             PARM_TYP_BOOL,   PARM_CAT_02, false },
    {"onvif_auto_discover",       PARM_TYP_BOOL,   PARM_CAT_02, false },
    {"onvif_host",                PARM_TYP_STRING, PARM_CAT_02, false },
    {"onvif_port",                PARM_TYP_INT,    PARM_CAT_02, false },
    {"onvif_user",                PARM_TYP_STRING, PARM_CAT_02, false },
    {"onvif_password",            PARM_TYP_STRING, PARM_CAT_02, true },
    {"onvif_profile_token",       PARM_TYP_STRING, PARM_CAT_02, false },
    {"onvif_discover_timeout",    PARM_TYP_INT,    PARM_CAT_02, false },
    {"onvif_timeout",             PARM_TYP_INT,    PARM_CAT_02, false },

    {"ptz_mode",                  PARM_TYP_LIST,   PARM_CAT_03, false },
    {"ptz_channel",               PARM_TYP_INT,    PARM_CAT_03, false },
    {"patrol_dwell",              PARM_TYP_INT,    PARM_CAT_03, false },

    {"stream_mode",               PARM_TYP_LIST,   PARM_CAT_04, false },
    {"hls_dir",                   PARM_TYP_STRING, PARM_CAT_04, false },
    {"stream_restart_delay",      PARM_TYP_INT,    PARM_CAT_04, false },
    {"stream_max_restarts",       PARM_TYP_INT,    PARM_CAT_04, false },
    {"relay_path",                PARM_TYP_STRING, PARM_CAT_04, false },
    {"relay_port",                PARM_TYP_INT,    PARM_CAT_04, false },
    {"relay_rtsp_port",           PARM_TYP_INT,    PARM_CAT_04, false },

    {"tunnel_enabled",            PARM_TYP_BOOL,   PARM_CAT_05, false },
    {"tunnel_token",              PARM_TYP_STRING, PARM_CAT_05, true },
    {"tunnel_hostname",           PARM_TYP_STRING, PARM_CAT_05, false },
    {"tunnel_quick",              PARM_TYP_BOOL,   PARM_CAT_05, false },
    {"tunnel_path",               PARM_TYP_STRING, PARM_CAT_05, false },

    {"record_enabled",            PARM_TYP_BOOL,   PARM_CAT_06, false },
    {"record_dir",                PARM_TYP_STRING, PARM_CAT_06, false },
    {"snapshot_dir",              PARM_TYP_STRING, PARM_CAT_06, false },
    {"clip_duration",             PARM_TYP_INT,    PARM_CAT_06, false },
    {"pre_buffer",                PARM_TYP_INT,    PARM_CAT_06, false },
    {"post_buffer",               PARM_TYP_INT,    PARM_CAT_06, false },
    {"max_concurrent_clips",      PARM_TYP_INT,    PARM_CAT_06, false },
    {"record_cooldown",           PARM_TYP_INT,    PARM_CAT_06, false },
    {"max_clips",                 PARM_TYP_INT,    PARM_CAT_06, false },
    {"max_storage_mb",            PARM_TYP_INT,    PARM_CAT_06, false },
    {"max_age_days",              PARM_TYP_INT,    PARM_CAT_06, false },
    {"record_thumbnail",          PARM_TYP_BOOL,   PARM_CAT_06, false },
    {"record_rolling",            PARM_TYP_BOOL,   PARM_CAT_06, false },

    {"motion_enabled",            PARM_TYP_BOOL,   PARM_CAT_07, false },
    {"motion_sensitivity",        PARM_TYP_INT,    PARM_CAT_07, false },
    {"motion_min_duration",       PARM_TYP_INT,    PARM_CAT_07, false },
    {"motion_cooldown",           PARM_TYP_INT,    PARM_CAT_07, false },
    {"motion_record",             PARM_TYP_BOOL,   PARM_CAT_07, false },
    {"motion_notify",             PARM_TYP_BOOL,   PARM_CAT_07, false },

    {"notify_file",               PARM_TYP_STRING, PARM_CAT_08, false },

    {"webcontrol_port",           PARM_TYP_INT,    PARM_CAT_09, false },
    {"webcontrol_localhost",      PARM_TYP_BOOL,   PARM_CAT_09, false },
    {"webcontrol_ipv6",           PARM_TYP_BOOL,   PARM_CAT_09, false },
    {"webcontrol_api_key",        PARM_TYP_STRING, PARM_CAT_09, true },
    {"webcontrol_actions",        PARM_TYP_STRING, PARM_CAT_09, false },

    {"database_dbname",           PARM_TYP_STRING, PARM_CAT_10, false },
    {"database_busy_timeout",     PARM_TYP_INT,    PARM_CAT_10, false },

    { "", (enum PARM_TYP)0, (enum PARM_CAT)0, false }
};

void cls_config::edit_set_bool(bool &parm_dest, std::string &parm_in)
{
    parm_dest = mtob(parm_in);
}

void cls_config::edit_get_bool(std::string &parm_dest, bool &parm_in)
{
    if (parm_in == true) {
        parm_dest = "on";
    } else {
        parm_dest = "off";
    }
}

void cls_config::edit_generic_bool(bool &parm_dest, std::string &parm
    , enum PARM_ACT pact, bool dflt)
{
    if (pact == PARM_ACT_DFLT) {
        parm_dest = dflt;
    } else if (pact == PARM_ACT_SET) {
        edit_set_bool(parm_dest, parm);
    } else if (pact == PARM_ACT_GET) {
        edit_get_bool(parm, parm_dest);
    } else if (pact == PARM_ACT_LIST) {
        parm = "[\"on\",\"off\"]";
    }
}

void cls_config::edit_generic_int(int &parm_dest, std::string &parm
    , enum PARM_ACT pact, int dflt, int min, int max, const char *parm_nm)
{
    int parm_in;

    if (pact == PARM_ACT_DFLT) {
        parm_dest = dflt;
    } else if (pact == PARM_ACT_SET) {
        parm_in = mtoi(parm);
        if ((parm_in < min) || (parm_in > max)) {
            CAMGATE_LOG(NTC, TYPE_ALL, NO_ERRNO
                , _("Invalid %s %d"), parm_nm, parm_in);
        } else {
            parm_dest = parm_in;
        }
    } else if (pact == PARM_ACT_GET) {
        parm = std::to_string(parm_dest);
    }
}

void cls_config::edit_generic_str(std::string &parm_dest, std::string &parm
    , enum PARM_ACT pact, std::string dflt)
{
    if (pact == PARM_ACT_DFLT) {
        parm_dest = dflt;
    } else if (pact == PARM_ACT_SET) {
        parm_dest = parm;
    } else if (pact == PARM_ACT_GET) {
        parm = parm_dest;
    }
}

void cls_config::edit_log_file(std::string &parm, enum PARM_ACT pact)
{
    char    lognm[4096];
    struct tm logtm;
    time_t  logt;

    if (pact == PARM_ACT_DFLT) {
        log_file = "";
    } else if (pact == PARM_ACT_SET) {
        time(&logt);
        localtime_r(&logt, &logtm);
        strftime(lognm, sizeof(lognm), parm.c_str(), &logtm);
        log_file = lognm;
    } else if (pact == PARM_ACT_GET) {
        parm = log_file;
    }
}

void cls_config::edit_log_level(std::string &parm, enum PARM_ACT pact)
{
    int parm_in;
    if (pact == PARM_ACT_DFLT) {
        log_level = LEVEL_DEFAULT;
    } else if (pact == PARM_ACT_SET) {
        parm_in = mtoi(parm);
        if ((parm_in < 1) || (parm_in > 9)) {
            CAMGATE_LOG(NTC, TYPE_ALL, NO_ERRNO, _("Invalid log_level %d"),parm_in);
        } else {
            log_level = parm_in;
        }
    } else if (pact == PARM_ACT_GET) {
        parm = std::to_string(log_level);
    } else if (pact == PARM_ACT_LIST) {
        parm = "[\"1\",\"2\",\"3\",\"4\",\"5\",\"6\",\"7\",\"8\",\"9\"]";
    }
}

void cls_config::edit_log_fflevel(std::string &parm, enum PARM_ACT pact)
{
    int parm_in;
    if (pact == PARM_ACT_DFLT) {
        log_fflevel = 3;
    } else if (pact == PARM_ACT_SET) {
        parm_in = mtoi(parm);
        if ((parm_in < 1) || (parm_in > 9)) {
            CAMGATE_LOG(NTC, TYPE_ALL, NO_ERRNO, _("Invalid log_fflevel %d"),parm_in);
        } else {
            log_fflevel = parm_in;
        }
    } else if (pact == PARM_ACT_GET) {
        parm = std::to_string(log_fflevel);
    } else if (pact == PARM_ACT_LIST) {
        parm = "[\"1\",\"2\",\"3\",\"4\",\"5\",\"6\",\"7\",\"8\",\"9\"]";
    }
}

void cls_config::edit_log_type(std::string &parm, enum PARM_ACT pact)
{
    if (pact == PARM_ACT_DFLT) {
        log_type = TYPE_DEFAULT_STR;
    } else if (pact == PARM_ACT_SET) {
        if ((parm == "ALL") || (parm == "COR") ||
            (parm == "STR") || (parm == "ONV") ||
            (parm == "PTZ") || (parm == "NET") ||
            (parm == "DBS") || (parm == "EVT") ||
            (parm == "TUN")) {
            log_type = parm;
        } else {
            CAMGATE_LOG(NTC, TYPE_ALL, NO_ERRNO, _("Invalid log_type %s"),parm.c_str());
        }
    } else if (pact == PARM_ACT_GET) {
        parm = log_type;
    } else if (pact == PARM_ACT_LIST) {
        parm = "[\"ALL\",\"COR\",\"STR\",\"ONV\",\"PTZ\",\"NET\",\"DBS\",\"EVT\",\"TUN\"]";
    }
}

void cls_config::edit_data_dir(std::string &parm, enum PARM_ACT pact)
{
    const char *home;

    if (pact == PARM_ACT_DFLT) {
        home = getenv("HOME");
        if ((home == nullptr) || (strlen(home) == 0)) {
            data_dir = "/var/lib/camgate";
        } else {
            data_dir = std::string(home) + "/.camgate";
        }
    } else if (pact == PARM_ACT_SET) {
        data_dir = parm;
        while ((data_dir.length() > 1) &&
            (data_dir[data_dir.length()-1] == '/')) {
            data_dir.erase(data_dir.length()-1);
        }
    } else if (pact == PARM_ACT_GET) {
        parm = data_dir;
    }
}

void cls_config::edit_device_id(std::string &parm, enum PARM_ACT pact)
{
    size_t indx;

    if (pact == PARM_ACT_DFLT) {
        device_id = "";
    } else if (pact == PARM_ACT_SET) {
        for (indx = 0; indx < parm.length(); indx++) {
            if (!isalnum((unsigned char)parm[indx]) &&
                (parm[indx] != '-') && (parm[indx] != '_')) {
                CAMGATE_LOG(NTC, TYPE_ALL, NO_ERRNO
                    , _("Invalid device_id %s"), parm.c_str());
                return;
            }
        }
        device_id = parm;
    } else if (pact == PARM_ACT_GET) {
        parm = device_id;
    }
}

void cls_config::edit_rtsp_url(std::string &parm, enum PARM_ACT pact)
{
    if (pact == PARM_ACT_DFLT) {
        rtsp_url = "";
    } else if (pact == PARM_ACT_SET) {
        if ((parm != "") && !mystarts(parm, "rtsp://") &&
            !mystarts(parm, "rtsps://")) {
            CAMGATE_LOG(NTC, TYPE_ALL, NO_ERRNO
                , _("Invalid rtsp_url %s"), util_url_mask(parm).c_str());
        } else {
            rtsp_url = parm;
        }
    } else if (pact == PARM_ACT_GET) {
        parm = rtsp_url;
    }
}

void cls_config::edit_ptz_mode(std::string &parm, enum PARM_ACT pact)
{
    if (pact == PARM_ACT_DFLT) {
        ptz_mode = "auto";
    } else if (pact == PARM_ACT_SET) {
        if ((parm == "auto") || (parm == "cgi") || (parm == "onvif")) {
            ptz_mode = parm;
        } else if (parm == "amcrest") {
            ptz_mode = "cgi";
        } else {
            CAMGATE_LOG(NTC, TYPE_ALL, NO_ERRNO, _("Invalid ptz_mode %s"),parm.c_str());
        }
    } else if (pact == PARM_ACT_GET) {
        parm = ptz_mode;
    } else if (pact == PARM_ACT_LIST) {
        parm = "[\"auto\",\"cgi\",\"onvif\"]";
    }
}

void cls_config::edit_stream_mode(std::string &parm, enum PARM_ACT pact)
{
    if (pact == PARM_ACT_DFLT) {
        stream_mode = "hls";
    } else if (pact == PARM_ACT_SET) {
        if ((parm == "hls") || (parm == "relay") || (parm == "auto")) {
            stream_mode = parm;
        } else {
            CAMGATE_LOG(NTC, TYPE_ALL, NO_ERRNO, _("Invalid stream_mode %s"),parm.c_str());
        }
    } else if (pact == PARM_ACT_GET) {
        parm = stream_mode;
    } else if (pact == PARM_ACT_LIST) {
        parm = "[\"hls\",\"relay\",\"auto\"]";
    }
}

void cls_config::edit_cat00(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact)
{
    if (parm_nm == "daemon") {                     edit_generic_bool(daemon, parm_val, pact, false);
    } else if (parm_nm == "conf_filename") {       edit_generic_str(conf_filename, parm_val, pact, "");
    } else if (parm_nm == "pid_file") {            edit_generic_str(pid_file, parm_val, pact, "");
    } else if (parm_nm == "log_file") {            edit_log_file(parm_val, pact);
    } else if (parm_nm == "log_level") {           edit_log_level(parm_val, pact);
    } else if (parm_nm == "log_fflevel") {         edit_log_fflevel(parm_val, pact);
    } else if (parm_nm == "log_type") {            edit_log_type(parm_val, pact);
    } else if (parm_nm == "native_language") {     edit_generic_bool(native_language, parm_val, pact, true);
    } else if (parm_nm == "data_dir") {            edit_data_dir(parm_val, pact);
    }
}

void cls_config::edit_cat01(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact)
{
    if (parm_nm == "device_id") {                  edit_device_id(parm_val, pact);
    } else if (parm_nm == "camera_name") {         edit_generic_str(camera_name, parm_val, pact, "Pi Camera");
    } else if (parm_nm == "camera_location") {     edit_generic_str(camera_location, parm_val, pact, "");
    } else if (parm_nm == "rtsp_url") {            edit_rtsp_url(parm_val, pact);
    } else if (parm_nm == "ffmpeg_path") {         edit_generic_str(ffmpeg_path, parm_val, pact, "ffmpeg");
    }
}

void cls_config::edit_cat02(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact)
{
    if (parm_nm == "onvif_enabled") {              edit_generic_bool(onvif_enabled, parm_val, pact, false);
    } else if (parm_nm == "onvif_auto_discover") { edit_generic_bool(onvif_auto_discover, parm_val, pact, false);
    } else if (parm_nm == "onvif_host") {          edit_generic_str(onvif_host, parm_val, pact, "");
    } else if (parm_nm == "onvif_port") {          edit_generic_int(onvif_port, parm_val, pact, 80, 1, 65535, "onvif_port");
    } else if (parm_nm == "onvif_user") {          edit_generic_str(onvif_user, parm_val, pact, "");
    } else if (parm_nm == "onvif_password") {      edit_generic_str(onvif_password, parm_val, pact, "");
    } else if (parm_nm == "onvif_profile_token") { edit_generic_str(onvif_profile_token, parm_val, pact, "");
    } else if (parm_nm == "onvif_discover_timeout") {
        edit_generic_int(onvif_discover_timeout, parm_val, pact, 5, 1, 60, "onvif_discover_timeout");
    } else if (parm_nm == "onvif_timeout") {       edit_generic_int(onvif_timeout, parm_val, pact, 10, 1, 120, "onvif_timeout");
    }
}

void cls_config::edit_cat03(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact)
{
    if (parm_nm == "ptz_mode") {                   edit_ptz_mode(parm_val, pact);
    } else if (parm_nm == "ptz_channel") {         edit_generic_int(ptz_channel, parm_val, pact, 0, 0, 16, "ptz_channel");
    } else if (parm_nm == "patrol_dwell") {        edit_generic_int(patrol_dwell, parm_val, pact, 30, 5, 3600, "patrol_dwell");
    }
}

void cls_config::edit_cat04(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact)
{
    if (parm_nm == "stream_mode") {                edit_stream_mode(parm_val, pact);
    } else if (parm_nm == "hls_dir") {             edit_generic_str(hls_dir, parm_val, pact, "/tmp/camgate-hls");
    } else if (parm_nm == "stream_restart_delay") {
        edit_generic_int(stream_restart_delay, parm_val, pact, 5, 1, 300, "stream_restart_delay");
    } else if (parm_nm == "stream_max_restarts") {
        edit_generic_int(stream_max_restarts, parm_val, pact, 0, 0, 100000, "stream_max_restarts");
    } else if (parm_nm == "relay_path") {          edit_generic_str(relay_path, parm_val, pact, "go2rtc");
    } else if (parm_nm == "relay_port") {          edit_generic_int(relay_port, parm_val, pact, 1984, 1, 65535, "relay_port");
    } else if (parm_nm == "relay_rtsp_port") {     edit_generic_int(relay_rtsp_port, parm_val, pact, 8554, 1, 65535, "relay_rtsp_port");
    }
}

void cls_config::edit_cat05(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact)
{
    if (parm_nm == "tunnel_enabled") {             edit_generic_bool(tunnel_enabled, parm_val, pact, false);
    } else if (parm_nm == "tunnel_token") {        edit_generic_str(tunnel_token, parm_val, pact, "");
    } else if (parm_nm == "tunnel_hostname") {     edit_generic_str(tunnel_hostname, parm_val, pact, "");
    } else if (parm_nm == "tunnel_quick") {        edit_generic_bool(tunnel_quick, parm_val, pact, false);
    } else if (parm_nm == "tunnel_path") {         edit_generic_str(tunnel_path, parm_val, pact, "cloudflared");
    }
}

void cls_config::edit_cat06(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact)
{
    if (parm_nm == "record_enabled") {             edit_generic_bool(record_enabled, parm_val, pact, true);
    } else if (parm_nm == "record_dir") {          edit_generic_str(record_dir, parm_val, pact, "");
    } else if (parm_nm == "snapshot_dir") {        edit_generic_str(snapshot_dir, parm_val, pact, "");
    } else if (parm_nm == "clip_duration") {       edit_generic_int(clip_duration, parm_val, pact, 15, 1, 600, "clip_duration");
    } else if (parm_nm == "pre_buffer") {          edit_generic_int(pre_buffer, parm_val, pact, 3, 0, 30, "pre_buffer");
    } else if (parm_nm == "post_buffer") {         edit_generic_int(post_buffer, parm_val, pact, 5, 1, 120, "post_buffer");
    } else if (parm_nm == "max_concurrent_clips") {
        edit_generic_int(max_concurrent_clips, parm_val, pact, 1, 1, 8, "max_concurrent_clips");
    } else if (parm_nm == "record_cooldown") {
        edit_generic_int(record_cooldown, parm_val, pact, 15000, 0, 3600000, "record_cooldown");
    } else if (parm_nm == "max_clips") {           edit_generic_int(max_clips, parm_val, pact, 100, 1, 100000, "max_clips");
    } else if (parm_nm == "max_storage_mb") {      edit_generic_int(max_storage_mb, parm_val, pact, 1024, 1, 10000000, "max_storage_mb");
    } else if (parm_nm == "max_age_days") {        edit_generic_int(max_age_days, parm_val, pact, 7, 1, 3650, "max_age_days");
    } else if (parm_nm == "record_thumbnail") {    edit_generic_bool(record_thumbnail, parm_val, pact, true);
    } else if (parm_nm == "record_rolling") {      edit_generic_bool(record_rolling, parm_val, pact, true);
    }
}

void cls_config::edit_cat07(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact)
{
    if (parm_nm == "motion_enabled") {             edit_generic_bool(motion_enabled, parm_val, pact, false);
    } else if (parm_nm == "motion_sensitivity") {  edit_generic_int(motion_sensitivity, parm_val, pact, 50, 0, 100, "motion_sensitivity");
    } else if (parm_nm == "motion_min_duration") {
        edit_generic_int(motion_min_duration, parm_val, pact, 500, 0, 60000, "motion_min_duration");
    } else if (parm_nm == "motion_cooldown") {
        edit_generic_int(motion_cooldown, parm_val, pact, 5000, 0, 600000, "motion_cooldown");
    } else if (parm_nm == "motion_record") {       edit_generic_bool(motion_record, parm_val, pact, true);
    } else if (parm_nm == "motion_notify") {       edit_generic_bool(motion_notify, parm_val, pact, true);
    }
}

void cls_config::edit_cat08(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact)
{
    if (parm_nm == "notify_file") {                edit_generic_str(notify_file, parm_val, pact, "");
    }
}

void cls_config::edit_cat09(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact)
{
    if (parm_nm == "webcontrol_port") {            edit_generic_int(webcontrol_port, parm_val, pact, 8080, 0, 65535, "webcontrol_port");
    } else if (parm_nm == "webcontrol_localhost") {edit_generic_bool(webcontrol_localhost, parm_val, pact, true);
    } else if (parm_nm == "webcontrol_ipv6") {     edit_generic_bool(webcontrol_ipv6, parm_val, pact, false);
    } else if (parm_nm == "webcontrol_api_key") {  edit_generic_str(webcontrol_api_key, parm_val, pact, "");
    } else if (parm_nm == "webcontrol_actions") {  edit_generic_str(webcontrol_actions, parm_val, pact, "");
    }
}

void cls_config::edit_cat10(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact)
{
    if (parm_nm == "database_dbname") {            edit_generic_str(database_dbname, parm_val, pact, "");
    } else if (parm_nm == "database_busy_timeout") {
        edit_generic_int(database_busy_timeout, parm_val, pact, 1000, 0, 60000, "database_busy_timeout");
    }
}

void cls_config::edit_cat(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact, enum PARM_CAT pcat)
{
    if (pcat == PARM_CAT_00) {          edit_cat00(parm_nm, parm_val, pact);
    } else if (pcat == PARM_CAT_01) {   edit_cat01(parm_nm, parm_val, pact);
    } else if (pcat == PARM_CAT_02) {   edit_cat02(parm_nm, parm_val, pact);
    } else if (pcat == PARM_CAT_03) {   edit_cat03(parm_nm, parm_val, pact);
    } else if (pcat == PARM_CAT_04) {   edit_cat04(parm_nm, parm_val, pact);
    } else if (pcat == PARM_CAT_05) {   edit_cat05(parm_nm, parm_val, pact);
    } else if (pcat == PARM_CAT_06) {   edit_cat06(parm_nm, parm_val, pact);
    } else if (pcat == PARM_CAT_07) {   edit_cat07(parm_nm, parm_val, pact);
    } else if (pcat == PARM_CAT_08) {   edit_cat08(parm_nm, parm_val, pact);
    } else if (pcat == PARM_CAT_09) {   edit_cat09(parm_nm, parm_val, pact);
    } else if (pcat == PARM_CAT_10) {   edit_cat10(parm_nm, parm_val, pact);
    }
}

void cls_config::defaults()
{
    int indx;
    std::string dflt = "";

    indx = 0;
    while (config_parms[indx].parm_name != "") {
        edit_cat(config_parms[indx].parm_name, dflt
            , PARM_ACT_DFLT, config_parms[indx].parm_cat);
        indx++;
    }
}

int cls_config::edit_set_active(std::string parm_nm, std::string parm_val)
{
    int indx;

    indx = 0;
    while (config_parms[indx].parm_name != "") {
        if (parm_nm ==  config_parms[indx].parm_name) {
            edit_cat(parm_nm, parm_val, PARM_ACT_SET, config_parms[indx].parm_cat);
            return 0;
        }
        indx++;
    }
    return -1;
}

void cls_config::edit_get(std::string parm_nm, std::string &parm_val, enum PARM_CAT parm_cat)
{
    edit_cat(parm_nm, parm_val, PARM_ACT_GET, parm_cat);
}

void cls_config::edit_set(std::string parm_nm, std::string parm_val)
{
    if (edit_set_active(parm_nm, parm_val) == 0) {
        return;
    }
    CAMGATE_LOG(ALR, TYPE_ALL, NO_ERRNO, _("Unknown config option \"%s\""), parm_nm.c_str());
}

void cls_config::edit_list(std::string parm_nm, std::string &parm_val, enum PARM_CAT parm_cat)
{
    edit_cat(parm_nm, parm_val, PARM_ACT_LIST, parm_cat);
}

std::string cls_config::type_desc(enum PARM_TYP ptype)
{
    if (ptype == PARM_TYP_BOOL) {           return "bool";
    } else if (ptype == PARM_TYP_INT) {     return "int";
    } else if (ptype == PARM_TYP_LIST) {    return "list";
    } else if (ptype == PARM_TYP_STRING) {  return "string";
    } else {                                return "error";
    }
}

std::string cls_config::cat_desc(enum PARM_CAT pcat, bool shrt) {

    if (shrt) {
        if (pcat == PARM_CAT_00)        { return "system";
        } else if (pcat == PARM_CAT_01) { return "camera";
        } else if (pcat == PARM_CAT_02) { return "onvif";
        } else if (pcat == PARM_CAT_03) { return "ptz";
        } else if (pcat == PARM_CAT_04) { return "stream";
        } else if (pcat == PARM_CAT_05) { return "tunnel";
        } else if (pcat == PARM_CAT_06) { return "recording";
        } else if (pcat == PARM_CAT_07) { return "motion";
        } else if (pcat == PARM_CAT_08) { return "notify";
        } else if (pcat == PARM_CAT_09) { return "webcontrol";
        } else if (pcat == PARM_CAT_10) { return "database";
        } else { return "unk";
        }
    } else {
        if (pcat == PARM_CAT_00)        { return "System";
        } else if (pcat == PARM_CAT_01) { return "Camera";
        } else if (pcat == PARM_CAT_02) { return "ONVIF";
        } else if (pcat == PARM_CAT_03) { return "PTZ";
        } else if (pcat == PARM_CAT_04) { return "Live Stream";
        } else if (pcat == PARM_CAT_05) { return "Tunnel";
        } else if (pcat == PARM_CAT_06) { return "Recording";
        } else if (pcat == PARM_CAT_07) { return "Motion";
        } else if (pcat == PARM_CAT_08) { return "Notifications";
        } else if (pcat == PARM_CAT_09) { return "Web Control";
        } else if (pcat == PARM_CAT_10) { return "Database";
        } else { return "Other";
        }
    }
}

void cls_config::usage(void)
{
    printf("Camgate version %s\n",VERSION);
    printf("\nusage:\tcamgate [options]\n");
    printf("\n\n");
    printf("Possible options:\n\n");
    printf("-b\t\t\tRun in background (daemon) mode.\n");
    printf("-n\t\t\tRun in non-daemon mode.\n");
    printf("-c config\t\tFull path and filename of config file.\n");
    printf("-d level\t\tLog level (1-9) (EMG, ALR, CRT, ERR, WRN, NTC, INF, DBG, ALL). default: 6 / NTC.\n");
    printf("-k type\t\t\tType of log (COR, STR, ONV, PTZ, NET, DBS, EVT, TUN, ALL). default: ALL.\n");
    printf("-p process_id_file\tFull path and filename of process id file (pid file).\n");
    printf("-l log file \t\tFull path and filename of log file.\n");
    printf("-h\t\t\tShow this screen.\n");
    printf("\n");
}

void cls_config::cmdline()
{
    int c;

    while ((c = getopt(app->argc, app->argv, "bc:d:hn?p:k:l:")) != EOF)
        switch (c) {
        case 'c':
            edit_set("conf_filename", optarg);
            break;
        case 'b':
            edit_set("daemon", "on");
            break;
        case 'n':
            edit_set("daemon", "off");
            break;
        case 'd':
            edit_set("log_level", optarg);
            break;
        case 'k':
            edit_set("log_type", optarg);
            break;
        case 'p':
            edit_set("pid_file", optarg);
            break;
        case 'l':
            edit_set("log_file", optarg);
            break;
        case 'h':
        case '?':
        default:
             usage();
             exit(1);
        }

    optind = 1;
}

/* Create a gateway from a camera file layered over the main file */
void cls_config::camera_add(std::string fname)
{
    struct stat statbuf;
    int indx;
    std::string parm_val, parm_nm;
    cls_gateway *gw;

    gw = new cls_gateway(app);
    gw->conf_src = new cls_config(app);

    indx = 0;
    while (config_parms[indx].parm_name != "") {
        parm_nm =config_parms[indx].parm_name;
        if (parm_nm != "device_id") {
            app->conf_src->edit_get(parm_nm, parm_val, config_parms[indx].parm_cat);
            gw->conf_src->edit_set(parm_nm, parm_val);
        }
        indx++;
    }

    gw->conf_src->conf_filename = fname;
    if (fname != "") {
        if (stat(fname.c_str(), &statbuf) != 0) {
            CAMGATE_LOG(ALR, TYPE_ALL, SHOW_ERRNO
                ,_("Camera config file %s not found"), fname.c_str());
        } else {
            gw->conf_src->process();
        }
    }

    gw->cfg = new cls_config(app);
    gw->cfg->parms_copy(gw->conf_src);

    pthread_mutex_lock(&app->mutex_gwlst);
        gw->threadnr = (int)app->gw_list.size();
        app->gw_list.push_back(gw);
        app->gw_cnt = (int)app->gw_list.size();
    pthread_mutex_unlock(&app->mutex_gwlst);
}

void cls_config::process()
{
    size_t stpos;
    std::string line, parm_nm, parm_vl;
    std::ifstream ifs;

    ifs.open(conf_filename);
    if (ifs.is_open() == false) {
        CAMGATE_LOG(ERR, TYPE_ALL, NO_ERRNO
            , _("Config file not found: %s")
            , conf_filename.c_str());
        return;
    }

    CAMGATE_LOG(NTC, TYPE_ALL, NO_ERRNO
        , _("Processing config file %s")
        , conf_filename.c_str());

    while (std::getline(ifs, line)) {
        mytrim(line);
        if ((line == "") || (line[0] == ';') || (line[0] == '#')) {
            continue;
        }
        stpos = line.find_first_of(" \t=");
        if ((stpos == std::string::npos) ||
            (stpos == 0) || (stpos == line.length()-1)) {
            CAMGATE_LOG(ERR, TYPE_ALL, NO_ERRNO
                , _("Unable to parse line: %s"), line.c_str());
            continue;
        }
        parm_nm = line.substr(0, stpos);
        parm_vl = line.substr(stpos+1);
        myunquote(parm_nm);
        mytrim(parm_vl);
        if ((parm_vl != "") && (parm_vl[0] == '=')) {
            parm_vl = parm_vl.substr(1);
        }
        myunquote(parm_vl);
        if (parm_nm == "camera") {
            if (app->conf_src == this) {
                camera_add(parm_vl);
            }
        } else {
            edit_set(parm_nm, parm_vl);
        }
    }
    ifs.close();
}

void cls_config::parms_log_parm(std::string parm_nm, std::string parm_vl, bool secret)
{
    if (secret && (parm_vl != "")) {
        CAMGATE_SHT(INF, TYPE_ALL, NO_ERRNO
            ,_("%-25s <redacted>"), parm_nm.c_str());
    } else if ((parm_vl == "") || (parm_vl.find(" ") == std::string::npos)) {
        CAMGATE_SHT(INF, TYPE_ALL, NO_ERRNO
            , "%-25s %s", parm_nm.c_str(), parm_vl.c_str());
    } else {
        CAMGATE_SHT(INF, TYPE_ALL, NO_ERRNO
            , "%-25s \"%s\"", parm_nm.c_str(), parm_vl.c_str());
    }
}

void cls_config::parms_log()
{
    int indx, gwindx;
    std::string parm_vl, parm_main, parm_nm;
    cls_config *gwcfg;

    CAMGATE_LOG(INF, TYPE_ALL, NO_ERRNO
        ,_("Logging configuration parameters from all files"));

    CAMGATE_SHT(INF, TYPE_ALL, NO_ERRNO
        , _("Config file: %s"), app->conf_src->conf_filename.c_str());

    indx = 0;
    while (config_parms[indx].parm_name != "") {
        parm_nm = config_parms[indx].parm_name;
        app->conf_src->edit_get(parm_nm, parm_vl, config_parms[indx].parm_cat);
        parms_log_parm(parm_nm, parm_vl, config_parms[indx].parm_secret);
        indx++;
    }

    for (gwindx = 0; gwindx < app->gw_cnt; gwindx++) {
        gwcfg = app->gw_list[gwindx]->conf_src;
        if (gwcfg->conf_filename == "") {
            continue;
        }
        CAMGATE_SHT(INF, TYPE_ALL, NO_ERRNO
            , _("Camera config file: %s"), gwcfg->conf_filename.c_str());
        indx = 0;
        while (config_parms[indx].parm_name != "") {
            parm_nm = config_parms[indx].parm_name;
            app->conf_src->edit_get(parm_nm, parm_main, config_parms[indx].parm_cat);
            gwcfg->edit_get(parm_nm, parm_vl, config_parms[indx].parm_cat);
            if (parm_main != parm_vl) {
                parms_log_parm(parm_nm, parm_vl, config_parms[indx].parm_secret);
            }
            indx++;
        }
    }
}

void cls_config::parms_copy(cls_config *src)
{
    int indx;
    std::string parm_nm, parm_val;

    indx = 0;
    while (config_parms[indx].parm_name != "") {
        parm_nm =config_parms[indx].parm_name;
        src->edit_get(parm_nm, parm_val, config_parms[indx].parm_cat);
        edit_set(parm_nm, parm_val);
        indx++;
    }
}

void cls_config::parms_copy(cls_config *src, PARM_CAT p_cat)
{
    int indx;
    std::string parm_nm, parm_val;

    indx = 0;
    while (config_parms[indx].parm_name != "") {
        if (config_parms[indx].parm_cat == p_cat) {
            parm_nm =config_parms[indx].parm_name;
            src->edit_get(parm_nm, parm_val, p_cat);
            edit_set(parm_nm, parm_val);
        }
        indx++;
    }
}

/* Report every reason this camera cannot start */
int cls_config::validate(std::vector<std::string> &errs)
{
    errs.clear();

    if ((rtsp_url == "") && (onvif_enabled == false)) {
        errs.push_back("rtsp_url is required (or enable onvif_enabled)");
    }
    if (onvif_enabled && !onvif_auto_discover && (onvif_host == "")) {
        errs.push_back("onvif_host is required when onvif_enabled is on "
            "and onvif_auto_discover is off");
    }
    if (tunnel_enabled && !tunnel_quick && (tunnel_token == "")) {
        errs.push_back("tunnel_token is required when tunnel_enabled is on "
            "and tunnel_quick is off");
    }
    if (pre_buffer + post_buffer <= 0) {
        errs.push_back("pre_buffer plus post_buffer must be positive");
    }

    if (errs.size() > 0) {
        return -1;
    }
    return 0;
}

void cls_config::init()
{
    std::string filename;
    char path[PATH_MAX];
    struct stat statbuf;
    const char *home;

    defaults();

    cmdline();

    filename = "";
    if (conf_filename != "") {
        filename = conf_filename;
        if (stat(filename.c_str(), &statbuf) != 0) {
            filename="";
        }
    }

    if (filename == "") {
        if (getcwd(path, sizeof(path)) == NULL) {
            CAMGATE_LOG(ERR, TYPE_ALL, SHOW_ERRNO, _("Error getcwd"));
            exit(-1);
        }
        filename = path + std::string("/camgate.conf");
        if (stat(filename.c_str(), &statbuf) != 0) {
            filename = "";
        }
    }

    home = getenv("HOME");
    if ((filename == "") && (home != nullptr)) {
        filename = std::string(home) + std::string("/.camgate/camgate.conf");
        if (stat(filename.c_str(), &statbuf) != 0) {
            filename = "";
        }
    }

    if (filename == "") {
        filename = std::string( configdir ) + std::string("/camgate.conf");
        if (stat(filename.c_str(), &statbuf) != 0) {
            filename = "";
        }
    }

    if (filename == "") {
        CAMGATE_LOG(ALR, TYPE_ALL, SHOW_ERRNO
            ,_("Could not open configuration file"));
        exit(-1);
    }

    edit_set("conf_filename", filename);

    process();

    cmdline();

    /* A file without camera lines describes a single camera */
    if (app->gw_cnt == 0) {
        camera_add("");
    }
}

cls_config::cls_config(cls_camgate *p_app)
{
    app = p_app;
    defaults();
}

cls_config::~cls_config()
{

}
