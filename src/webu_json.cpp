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
#include "webu_ans.hpp"
#include "webu_json.hpp"

std::string webu_bool(bool val)
{
    return (val ? "true" : "false");
}

std::string webu_num(double val)
{
    char buf[64];

    if (std::isfinite(val) == false) {
        return "null";
    }
    snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

std::string webu_clip_json(const ctx_clip &clip)
{
    std::string resp;

    resp  = "{\"id\":\"" + util_json_escape(clip.id) + "\"";
    resp += ",\"deviceId\":\"" + util_json_escape(clip.device_id) + "\"";
    resp += ",\"startedAt\":\"" + util_iso_time(clip.started_at) + "\"";
    resp += ",\"endedAt\":\"" + util_iso_time(clip.ended_at) + "\"";
    resp += ",\"durationMs\":" + std::to_string(clip.duration_ms);
    resp += ",\"file\":\"" + util_json_escape(clip.file_path) + "\"";
    if (clip.thumb_path != "") {
        resp += ",\"thumbnail\":\"" + util_json_escape(clip.thumb_path) + "\"";
    } else {
        resp += ",\"thumbnail\":null";
    }
    if (clip.snapshot_path != "") {
        resp += ",\"snapshot\":\"" + util_json_escape(clip.snapshot_path) + "\"";
    } else {
        resp += ",\"snapshot\":null";
    }
    resp += ",\"sizeBytes\":" + std::to_string(clip.size_bytes);
    resp += ",\"trigger\":{\"source\":\"";
    resp += trigger_source_str(clip.trigger.source);
    resp += "\"";
    if (clip.trigger.confidence >= 0) {
        resp += ",\"confidence\":" + webu_num(clip.trigger.confidence);
    }
    if (clip.trigger.species != "") {
        resp += ",\"species\":\"" + util_json_escape(clip.trigger.species) + "\"";
    }
    resp += "}}";

    return resp;
}

std::string webu_preset_json(const ctx_saved_preset &pset)
{
    std::string resp;
    size_t indx;

    resp  = "{\"id\":\"" + util_json_escape(pset.id) + "\"";
    resp += ",\"name\":\"" + util_json_escape(pset.name) + "\"";
    resp += ",\"description\":\"" + util_json_escape(pset.description) + "\"";
    resp += ",\"ptzToken\":\"" + util_json_escape(pset.ptz_token) + "\"";
    resp += ",\"createdAt\":\"" + util_iso_time(pset.created_at) + "\"";
    if (pset.last_used > 0) {
        resp += ",\"lastUsed\":\"" + util_iso_time(pset.last_used) + "\"";
    } else {
        resp += ",\"lastUsed\":null";
    }
    resp += ",\"tags\":[";
    for (indx=0; indx<pset.tags.size(); indx++) {
        if (indx > 0) {
            resp += ",";
        }
        resp += "\"" + util_json_escape(pset.tags[indx]) + "\"";
    }
    resp += "]}";

    return resp;
}

std::string webu_patrol_json(const ctx_patrol &patrol)
{
    std::string resp;
    size_t indx;

    resp  = "{\"enabled\":" + webu_bool(patrol.enabled);
    resp += ",\"dwellSeconds\":" + std::to_string(patrol.dwell_sec);
    resp += ",\"loop\":" + webu_bool(patrol.loop);
    resp += ",\"presetIds\":[";
    for (indx=0; indx<patrol.preset_ids.size(); indx++) {
        if (indx > 0) {
            resp += ",";
        }
        resp += "\"" + util_json_escape(patrol.preset_ids[indx]) + "\"";
    }
    resp += "]}";

    return resp;
}

int cls_webu_json::limit_get()
{
    int lmt;

    lmt = mtoi(webua->arg_get("limit"));
    if (lmt <= 0) {
        lmt = WEBUI_LIST_LIMIT;
    }
    return MIN(lmt, 1000);
}

/* Every gateway regardless of the camid requested */
void cls_webu_json::status()
{
    int indx;

    webua->resp_page  = "{\"version\":\"" VERSION "\"";
    pthread_mutex_lock(&app->mutex_gwlst);
        webua->resp_page += ",\"count\":" + std::to_string(app->gw_list.size());
        webua->resp_page += ",\"cameras\":[";
        for (indx=0; indx<(int)app->gw_list.size(); indx++) {
            if (indx > 0) {
                webua->resp_page += ",";
            }
            webua->resp_page += app->gw_list[indx]->status_json();
        }
        webua->resp_page += "]";
    pthread_mutex_unlock(&app->mutex_gwlst);
    webua->resp_page += "}";
}

void cls_webu_json::stream()
{
    cls_gateway *gw = webua->gw;

    webua->resp_page  = "{\"deviceId\":\"" + util_json_escape(gw->device_id) + "\"";
    if (gw->stream != nullptr) {
        webua->resp_page += ",\"stream\":" + gw->stream->json();
    } else {
        webua->resp_page += ",\"stream\":null";
    }
    if (gw->tunnel != nullptr) {
        webua->resp_page += ",\"tunnel\":" + gw->tunnel->json();
        webua->resp_page += ",\"url\":\"" + util_json_escape(gw->tunnel->url_any()) + "\"";
    } else {
        webua->resp_page += ",\"tunnel\":null";
    }
    webua->resp_page += "}";
}

void cls_webu_json::capabilities()
{
    webua->resp_page = webua->gw->capabilities_json();
}

void cls_webu_json::ptz_status()
{
    cls_gateway *gw = webua->gw;
    ctx_ptz_caps caps;
    ctx_ptz_pos pos;

    if (gw->ptz == nullptr) {
        webua->resp_page = "{\"supported\":false}";
        return;
    }

    caps = gw->ptz->get_capabilities();
    webua->resp_page  = "{\"supported\":" + webu_bool(caps.supported);
    webua->resp_page += ",\"backend\":\"";
    webua->resp_page += ptz_backend_str(gw->ptz->backend);
    webua->resp_page += "\"";
    if (caps.supported && gw->ptz->get_position(pos)) {
        webua->resp_page += ",\"position\":{\"pan\":" + webu_num(pos.pan);
        webua->resp_page += ",\"tilt\":" + webu_num(pos.tilt);
        webua->resp_page += ",\"zoom\":" + webu_num(pos.zoom) + "}";
    } else {
        webua->resp_page += ",\"position\":null";
    }
    webua->resp_page += ",\"moving\":" + webu_bool(gw->ptz->stop_pending() != 0);
    webua->resp_page += ",\"patrol\":" + webu_bool(gw->preset->patrol_active());
    webua->resp_page += "}";
}

void cls_webu_json::ptz_presets()
{
    cls_gateway *gw = webua->gw;
    vec_ptz_preset list;
    size_t indx;

    if ((gw->ptz != nullptr) && (gw->ptz->get_capabilities().supported)) {
        if (gw->ptz->get_presets(list) == false) {
            CAMGATE_LOG(WRN, TYPE_PTZ, NO_ERRNO
                , _("Unable to list camera presets: %s"), gw->ptz->errmsg.c_str());
        }
    }

    webua->resp_page = "{\"presets\":[";
    for (indx=0; indx<list.size(); indx++) {
        if (indx > 0) {
            webua->resp_page += ",";
        }
        webua->resp_page += "{\"token\":\"" + util_json_escape(list[indx].token) + "\"";
        webua->resp_page += ",\"name\":\"" + util_json_escape(list[indx].name) + "\"}";
    }
    webua->resp_page += "]}";
}

void cls_webu_json::clips()
{
    vec_clip list;
    size_t indx;

    webua->gw->recorder->list_clips(list);

    webua->resp_page  = "{\"count\":" + std::to_string(list.size());
    webua->resp_page += ",\"clips\":[";
    for (indx=0; indx<list.size(); indx++) {
        if (indx > 0) {
            webua->resp_page += ",";
        }
        webua->resp_page += webu_clip_json(list[indx]);
    }
    webua->resp_page += "]}";
}

void cls_webu_json::snapshots()
{
    vec_snapshot list;
    size_t indx;

    webua->gw->recorder->list_snapshots(list);

    webua->resp_page  = "{\"count\":" + std::to_string(list.size());
    webua->resp_page += ",\"snapshots\":[";
    for (indx=0; indx<list.size(); indx++) {
        if (indx > 0) {
            webua->resp_page += ",";
        }
        webua->resp_page += "{\"id\":\"" + util_json_escape(list[indx].id) + "\"";
        webua->resp_page += ",\"path\":\"" + util_json_escape(list[indx].path) + "\"";
        webua->resp_page += ",\"timestamp\":\"" + util_iso_time(list[indx].timestamp) + "\"";
        webua->resp_page += ",\"size\":" + std::to_string(list[indx].size) + "}";
    }
    webua->resp_page += "]}";
}

void cls_webu_json::storage()
{
    webua->resp_page = webua->gw->recorder->storage_json();
}

void cls_webu_json::settings()
{
    cls_gateway *gw = webua->gw;

    if (webua->uri_cmd2 == "video") {
        webua->resp_page = gw->settings->video_json();
    } else if (webua->uri_cmd2 == "camera") {
        webua->resp_page = gw->settings->camera_json();
    } else if (webua->uri_cmd2 == "notify") {
        webua->resp_page = gw->notify->json();
    } else if (webua->uri_cmd2 == "") {
        webua->resp_page  = "{\"video\":" + gw->settings->video_json();
        webua->resp_page += ",\"camera\":" + gw->settings->camera_json();
        webua->resp_page += ",\"notify\":" + gw->notify->json();
        webua->resp_page += "}";
    } else {
        webua->resp_code = MHD_HTTP_NOT_FOUND;
        webua->resp_page = "{\"success\":false,\"error\":\"Unknown settings section\"}";
    }
}

void cls_webu_json::presets()
{
    cls_gateway *gw = webua->gw;
    vec_saved_preset list;
    vec_sched_preset scheds;
    size_t indx;

    gw->preset->list(list);
    scheds = gw->preset->schedules();

    webua->resp_page = "{\"presets\":[";
    for (indx=0; indx<list.size(); indx++) {
        if (indx > 0) {
            webua->resp_page += ",";
        }
        webua->resp_page += webu_preset_json(list[indx]);
    }
    webua->resp_page += "]";
    webua->resp_page += ",\"patrol\":" + webu_patrol_json(gw->preset->patrol_config());
    webua->resp_page += ",\"patrolActive\":" + webu_bool(gw->preset->patrol_active());
    webua->resp_page += ",\"schedules\":[";
    for (indx=0; indx<scheds.size(); indx++) {
        if (indx > 0) {
            webua->resp_page += ",";
        }
        webua->resp_page += "{\"id\":\"" + util_json_escape(scheds[indx].id) + "\"";
        webua->resp_page += ",\"presetId\":\"" + util_json_escape(scheds[indx].preset_id) + "\"";
        webua->resp_page += ",\"cron\":\"" + util_json_escape(scheds[indx].cron) + "\"}";
    }
    webua->resp_page += "]}";
}

void cls_webu_json::camera_time()
{
    cls_gateway *gw = webua->gw;
    ctx_camera_time ct;
    ctx_time_sync ts;

    if ((gw->onvif == nullptr) || (gw->onvif->connected == false)) {
        webua->resp_code = MHD_HTTP_BAD_REQUEST;
        webua->resp_page = "{\"success\":false,\"error\":\"ONVIF not configured\"}";
        return;
    }

    if (gw->onvif->get_camera_time(ct) != 0) {
        webua->resp_code = MHD_HTTP_INTERNAL_SERVER_ERROR;
        webua->resp_page = "{\"success\":false,\"error\":\"Failed to get camera time\"}";
        return;
    }

    webua->resp_page  = "{\"utc\":\"" + util_iso_time(ct.utc_ms) + "\"";
    webua->resp_page += ",\"timezone\":\"" + util_json_escape(ct.timezone) + "\"";
    webua->resp_page += ",\"ntp\":" + webu_bool(ct.ntp);
    webua->resp_page += ",\"dst\":" + webu_bool(ct.dst);
    webua->resp_page += ",\"clockOffsetMs\":" + std::to_string(gw->onvif->clock_offset);
    if (gw->onvif->check_time_sync(ts) == 0) {
        webua->resp_page += ",\"syncStatus\":{\"synced\":" + webu_bool(ts.synced);
        webua->resp_page += ",\"diffSeconds\":" + std::to_string(ts.diff_sec);
        webua->resp_page += ",\"systemTime\":\"" + util_iso_time(ts.local_ms) + "\"}";
    } else {
        webua->resp_page += ",\"syncStatus\":null";
    }
    webua->resp_page += "}";
}

void cls_webu_json::sightings()
{
    vec_sighting list;
    size_t indx;

    webua->gw->dbse->sighting_list(webua->gw->device_id, limit_get(), list);

    webua->resp_page  = "{\"count\":" + std::to_string(list.size());
    webua->resp_page += ",\"sightings\":[";
    for (indx=0; indx<list.size(); indx++) {
        if (indx > 0) {
            webua->resp_page += ",";
        }
        webua->resp_page += "{\"species\":\"" + util_json_escape(list[indx].species) + "\"";
        webua->resp_page += ",\"confidence\":" + webu_num(list[indx].confidence);
        webua->resp_page += ",\"timestamp\":\"" + util_iso_time(list[indx].timestamp) + "\"";
        if (list[indx].clip_id != "") {
            webua->resp_page += ",\"clipId\":\"" + util_json_escape(list[indx].clip_id) + "\"}";
        } else {
            webua->resp_page += ",\"clipId\":null}";
        }
    }
    webua->resp_page += "]}";
}

void cls_webu_json::notify_log()
{
    vec_notify_log list;
    size_t indx;

    webua->gw->notify->log_list(limit_get(), list);

    webua->resp_page  = "{\"count\":" + std::to_string(list.size());
    webua->resp_page += ",\"notifications\":[";
    for (indx=0; indx<list.size(); indx++) {
        if (indx > 0) {
            webua->resp_page += ",";
        }
        webua->resp_page += "{\"type\":\"" + util_json_escape(list[indx].type) + "\"";
        webua->resp_page += ",\"title\":\"" + util_json_escape(list[indx].title) + "\"";
        webua->resp_page += ",\"timestamp\":\"" + util_iso_time(list[indx].timestamp) + "\"";
        webua->resp_page += ",\"sent\":" + webu_bool(list[indx].sent) + "}";
    }
    webua->resp_page += "]}";
}

/* Lines newer than the number given in cmd2 */
void cls_webu_json::loghistory()
{
    size_t indx;
    int cnt;
    uint64_t after;
    std::string msg;

    after = (uint64_t)MAX(mtol(webua->uri_cmd2), 0L);

    webua->resp_page = "{\"lines\":[";
    cnt = 0;
    pthread_mutex_lock(&cglog->mutex_log);
        for (indx=0; indx<cglog->log_vec.size(); indx++) {
            if (cglog->log_vec[indx].log_nbr <= after) {
                continue;
            }
            msg = cglog->log_vec[indx].log_msg;
            if ((msg.length() > 0) && (msg[msg.length()-1] == '\n')) {
                msg = msg.substr(0, msg.length()-1);
            }
            if (cnt > 0) {
                webua->resp_page += ",";
            }
            webua->resp_page += "{\"lognbr\":" + std::to_string(cglog->log_vec[indx].log_nbr);
            webua->resp_page += ",\"logmsg\":\"" + util_json_escape(msg) + "\"}";
            cnt++;
        }
    pthread_mutex_unlock(&cglog->mutex_log);
    webua->resp_page += "],\"count\":" + std::to_string(cnt) + "}";
}

void cls_webu_json::main()
{
    std::string cmd;

    webua->resp_type = WEBUI_RESP_JSON;
    webua->resp_code = MHD_HTTP_OK;
    cmd = webua->uri_route;

    if (cmd == "status.json") {
        status();
        webua->mhd_send();
        return;
    }
    if (webua->uri_cmd1 == "log") {
        loghistory();
        webua->mhd_send();
        return;
    }

    if (webua->gw == nullptr) {
        webua->error_resp(MHD_HTTP_NOT_FOUND, "Unknown camera: " + webua->uri_camid);
        return;
    }

    pthread_mutex_lock(&app->mutex_post);
        if (webua->gw->status != GATEWAY_RUNNING) {
            webua->resp_code = MHD_HTTP_SERVICE_UNAVAILABLE;
            webua->resp_page = "{\"success\":false,\"error\":\"Camera not running\"}";
        } else if (cmd == "stream") {
            stream();
        } else if (cmd == "capabilities") {
            capabilities();
        } else if (cmd == "ptz/status") {
            ptz_status();
        } else if (cmd == "ptz/presets") {
            ptz_presets();
        } else if (cmd == "clips") {
            clips();
        } else if (cmd == "snapshots") {
            snapshots();
        } else if (cmd == "storage") {
            storage();
        } else if (webua->uri_cmd1 == "settings") {
            settings();
        } else if (cmd == "presets") {
            presets();
        } else if (cmd == "camera/time") {
            camera_time();
        } else if (cmd == "sightings") {
            sightings();
        } else if (cmd == "notify/log") {
            notify_log();
        } else {
            pthread_mutex_unlock(&app->mutex_post);
            webua->not_found();
            return;
        }
    pthread_mutex_unlock(&app->mutex_post);
    webua->mhd_send();
}

cls_webu_json::cls_webu_json(cls_webu_ans *p_webua)
{
    app    = p_webua->app;
    webu   = p_webua->webu;
    webua  = p_webua;
}

cls_webu_json::~cls_webu_json()
{
    app    = nullptr;
    webu   = nullptr;
    webua  = nullptr;
}
