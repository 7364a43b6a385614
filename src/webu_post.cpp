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
#include "webu_post.hpp"

/* An empty body is an empty object */
bool cls_webu_post::parse_body()
{
    std::string body;

    body = webua->post_body;
    mytrim(body);
    if (body == "") {
        body = "{}";
    }
    if (jp.parse(body) == false) {
        resp_error(MHD_HTTP_BAD_REQUEST, "Invalid JSON: " + jp.getError());
        return false;
    }
    return true;
}

std::string cls_webu_post::action_group(std::string cmd)
{
    if ((cmd == "motion") || (cmd == "detection")) {
        return "trigger";
    } else if (mystarts(cmd, "ptz/")) {
        return "ptz";
    } else if ((cmd == "snapshot") || mystarts(cmd, "recording/")) {
        return "recording";
    } else if (mystarts(cmd, "clips/")) {
        return "clips";
    } else if (mystarts(cmd, "settings/")) {
        return "settings";
    } else if (mystarts(cmd, "presets") || mystarts(cmd, "patrol/")) {
        return "presets";
    } else if (cmd == "camera/time/sync") {
        return "camera_time";
    } else if (mystarts(cmd, "notify/")) {
        return "notify";
    }
    return "";
}

void cls_webu_post::resp_result(bool success, std::string extra)
{
    webua->resp_page = "{\"success\":" + webu_bool(success);
    if (extra != "") {
        webua->resp_page += "," + extra;
    }
    webua->resp_page += "}";
}

void cls_webu_post::resp_error(unsigned int code, std::string msg)
{
    webua->resp_code = code;
    webua->resp_page = "{\"success\":false,\"error\":\"" + util_json_escape(msg) + "\"}";
}

bool cls_webu_post::ptz_check()
{
    if (gw->ptz == nullptr) {
        resp_error(MHD_HTTP_BAD_REQUEST, "PTZ not available");
        return false;
    }
    return true;
}

/* Optional ISO timestamp in the body, now otherwise */
int64_t cls_webu_post::ts_get()
{
    int64_t ts;

    ts = util_parse_iso(jp.getString("timestamp"));
    if (ts <= 0) {
        ts = util_now_ms();
    }
    return ts;
}

void cls_webu_post::action_motion()
{
    ctx_motion_evt evt;

    evt.active = true;
    evt.timestamp = ts_get();
    evt.confidence = MIN(MAX(jp.getNumber("confidence", 100.0), 0.0), 100.0);
    evt.score = evt.confidence / 100.0;

    CAMGATE_LOG(INF, TYPE_EVENTS, NO_ERRNO
        , _("Motion reported from %s"), webua->clientip.c_str());
    gw->bus_motion.publish(evt);
    resp_result(true, "\"queued\":" + std::to_string(gw->queued()));
}

void cls_webu_post::action_detection()
{
    std::string species;
    double conf;

    species = jp.getString("species");
    mytrim(species);
    conf = jp.getNumber("confidence", -1.0);
    if ((conf > 1.0) && (conf <= 100.0)) {
        conf = conf / 100.0;
    }
    if (conf > 1.0) {
        resp_error(MHD_HTTP_BAD_REQUEST, "confidence must be 0..1");
        return;
    }

    gw->on_detection(species, conf, ts_get());
    resp_result(true, "\"queued\":" + std::to_string(gw->queued()));
}

void cls_webu_post::action_ptz_move()
{
    std::string mtype, dir;
    double pan, tilt, zoom, speed;
    bool ok;

    if (ptz_check() == false) {
        return;
    }

    dir = jp.getString("direction");
    if (dir != "") {
        speed = MIN(MAX(jp.getNumber("speed", PTZ_CONVENIENCE_SPEED), 0.0), 1.0);
        if (dir == "left") {
            ok = gw->ptz->pan_left(speed);
        } else if (dir == "right") {
            ok = gw->ptz->pan_right(speed);
        } else if (dir == "up") {
            ok = gw->ptz->tilt_up(speed);
        } else if (dir == "down") {
            ok = gw->ptz->tilt_down(speed);
        } else if (dir == "in") {
            ok = gw->ptz->zoom_in(speed);
        } else if (dir == "out") {
            ok = gw->ptz->zoom_out(speed);
        } else {
            resp_error(MHD_HTTP_BAD_REQUEST, "Unknown direction: " + dir);
            return;
        }
        resp_result(ok);
        return;
    }

    mtype = jp.getString("type", "continuous");
    pan  = MIN(MAX(jp.getNumber("pan", 0.0), -1.0), 1.0);
    tilt = MIN(MAX(jp.getNumber("tilt", 0.0), -1.0), 1.0);
    zoom = jp.getNumber("zoom", 0.0);

    if (mtype == "continuous") {
        zoom = MIN(MAX(zoom, -1.0), 1.0);
        ok = gw->ptz->continuous_move(pan, tilt, zoom);
    } else if (mtype == "absolute") {
        zoom = MIN(MAX(zoom, 0.0), 1.0);
        ok = gw->ptz->absolute_move(pan, tilt, zoom);
    } else if (mtype == "relative") {
        zoom = MIN(MAX(zoom, -1.0), 1.0);
        ok = gw->ptz->relative_move(pan, tilt, zoom);
    } else {
        resp_error(MHD_HTTP_BAD_REQUEST, "Unknown move type: " + mtype);
        return;
    }

    if (ok == false) {
        resp_result(false, "\"error\":\"" + util_json_escape(gw->ptz->errmsg) + "\"");
    } else {
        resp_result(true);
    }
}

void cls_webu_post::action_ptz_stop()
{
    if (ptz_check() == false) {
        return;
    }
    resp_result(gw->ptz->stop());
}

void cls_webu_post::action_ptz_home()
{
    if (ptz_check() == false) {
        return;
    }
    if (jp.getBool("set", false)) {
        resp_result(gw->ptz->set_home());
    } else {
        resp_result(gw->ptz->go_home());
    }
}

void cls_webu_post::action_ptz_preset()
{
    std::string token;

    if (ptz_check() == false) {
        return;
    }
    token = jp.getString("token");
    if (token == "") {
        resp_error(MHD_HTTP_BAD_REQUEST, "token required");
        return;
    }
    resp_result(gw->ptz->goto_preset(token));
}

void cls_webu_post::action_ptz_preset_set()
{
    std::string token;

    if (ptz_check() == false) {
        return;
    }
    token = gw->ptz->set_preset(jp.getString("name"));
    if (token == "") {
        resp_result(false, "\"error\":\"" + util_json_escape(gw->ptz->errmsg) + "\"");
    } else {
        resp_result(true, "\"token\":\"" + util_json_escape(token) + "\"");
    }
}

void cls_webu_post::action_ptz_preset_delete()
{
    std::string token;

    if (ptz_check() == false) {
        return;
    }
    token = jp.getString("token");
    if (token == "") {
        resp_error(MHD_HTTP_BAD_REQUEST, "token required");
        return;
    }
    resp_result(gw->ptz->remove_preset(token));
}

void cls_webu_post::action_snapshot()
{
    ctx_snapshot snap;

    if (gw->recorder->snapshot(snap) != 0) {
        resp_error(MHD_HTTP_INTERNAL_SERVER_ERROR, "Snapshot failed");
        return;
    }
    resp_result(true, "\"snapshot\":{\"id\":\"" + util_json_escape(snap.id) + "\""
        ",\"path\":\"" + util_json_escape(snap.path) + "\""
        ",\"timestamp\":\"" + util_iso_time(snap.timestamp) + "\""
        ",\"size\":" + std::to_string(snap.size) + "}");
}

void cls_webu_post::action_recording_start()
{
    ctx_trigger trg;
    std::string id;

    trg.source = TRIGGER_MANUAL;
    trg.timestamp = util_now_ms();
    trg.confidence = -1;
    trg.species = "";

    if (gw->pipeline->start_manual(trg, id, util_mono_ms()) != 0) {
        resp_error(MHD_HTTP_CONFLICT, "Recording slots are busy");
        return;
    }
    resp_result(true, "\"clipId\":\"" + util_json_escape(id) + "\"");
}

void cls_webu_post::action_recording_stop()
{
    std::string id;

    id = gw->pipeline->manual_id();
    if (gw->pipeline->stop_manual() != 0) {
        resp_result(false, "\"error\":\"Not recording\"");
        return;
    }
    resp_result(true, "\"clipId\":\"" + util_json_escape(id) + "\"");
}

void cls_webu_post::action_clip_delete()
{
    std::string id;

    id = jp.getString("id");
    if (recorder_valid_id(id) == false) {
        resp_error(MHD_HTTP_BAD_REQUEST, "Invalid clip id");
        return;
    }
    if (gw->recorder->delete_clip(id) != 0) {
        resp_error(MHD_HTTP_NOT_FOUND, "Clip not found");
        return;
    }
    resp_result(true);
}

void cls_webu_post::action_settings()
{
    std::string section;
    int retcd;

    section = webua->uri_cmd2;
    if (section == "video") {
        gw->settings->update_video(jp);
        retcd = gw->settings->save();
        resp_result(retcd == 0, "\"settings\":" + gw->settings->video_json() +
            ",\"message\":\"Settings saved. Apply to restart the stream.\"");
    } else if (section == "camera") {
        gw->settings->update_camera(jp);
        retcd = gw->settings->save();
        resp_result(retcd == 0, "\"settings\":" + gw->settings->camera_json());
    } else {
        gw->notify->update(jp);
        retcd = gw->notify->save();
        resp_result(retcd == 0, "\"settings\":" + gw->notify->json());
    }
}

void cls_webu_post::action_settings_reset()
{
    std::string section;
    int retcd;

    section = jp.getString("section", "video");
    retcd = 0;
    if ((section == "video") || (section == "camera") || (section == "all")) {
        gw->settings->reset();
        retcd = gw->settings->save();
    }
    if ((section == "notify") || (section == "all")) {
        gw->notify->reset();
        if (gw->notify->save() != 0) {
            retcd = -1;
        }
    }
    if ((section != "video") && (section != "camera") &&
        (section != "notify") && (section != "all")) {
        resp_error(MHD_HTTP_BAD_REQUEST, "Unknown settings section: " + section);
        return;
    }
    resp_result(retcd == 0, "\"message\":\"Settings reset to defaults.\"");
}

void cls_webu_post::action_settings_apply()
{
    if (gw->stream->apply_settings() != 0) {
        resp_error(MHD_HTTP_INTERNAL_SERVER_ERROR, "Stream restart failed");
        return;
    }
    resp_result(true, "\"stream\":" + gw->stream->json());
}

/* Create, or update when an id is given */
void cls_webu_post::action_preset_save()
{
    ctx_saved_preset pset;
    std::string id, name;

    id = jp.getString("id");
    name = jp.getString("name");
    mytrim(name);

    if (id != "") {
        if (gw->preset->update(id, name, jp.getString("description")
                , jp.getList("tags")) != 0) {
            resp_error(MHD_HTTP_NOT_FOUND, "Preset not found");
            return;
        }
        if (gw->preset->get(id, pset) == false) {
            resp_error(MHD_HTTP_NOT_FOUND, "Preset not found");
            return;
        }
        resp_result(true, "\"preset\":" + webu_preset_json(pset));
        return;
    }

    if (name == "") {
        resp_error(MHD_HTTP_BAD_REQUEST, "name required");
        return;
    }
    if (gw->preset->create(name, jp.getString("description")
            , jp.getList("tags"), pset) != 0) {
        resp_result(false, "\"error\":\"Unable to save the camera position\"");
        return;
    }
    resp_result(true, "\"preset\":" + webu_preset_json(pset));
}

void cls_webu_post::action_preset_goto()
{
    std::string id;

    id = jp.getString("id");
    if (id == "") {
        resp_error(MHD_HTTP_BAD_REQUEST, "id required");
        return;
    }
    resp_result(gw->preset->go(id) == 0);
}

void cls_webu_post::action_preset_delete()
{
    std::string id;

    id = jp.getString("id");
    if (id == "") {
        resp_error(MHD_HTTP_BAD_REQUEST, "id required");
        return;
    }
    resp_result(gw->preset->remove(id) == 0);
}

void cls_webu_post::action_schedule_add()
{
    ctx_sched_preset sched;

    if (gw->preset->schedule_add(jp.getString("presetId")
            , jp.getString("cron"), sched) != 0) {
        resp_error(MHD_HTTP_BAD_REQUEST, "Invalid preset or schedule");
        return;
    }
    resp_result(true, "\"id\":\"" + util_json_escape(sched.id) + "\"");
}

void cls_webu_post::action_schedule_delete()
{
    resp_result(gw->preset->schedule_remove(jp.getString("id")) == 0);
}

/* Body values win, then the last patrol, then every saved preset */
void cls_webu_post::action_patrol_start()
{
    std::vector<std::string> ids;
    vec_saved_preset list;
    ctx_patrol last;
    size_t indx;
    int dwell;
    bool loop;

    last = gw->preset->patrol_config();
    ids = jp.getList("presetIds");
    if (ids.empty()) {
        ids = last.preset_ids;
    }
    if (ids.empty()) {
        gw->preset->list(list);
        for (indx=0; indx<list.size(); indx++) {
            ids.push_back(list[indx].id);
        }
    }
    dwell = (int)jp.getNumber("dwellSeconds", gw->cfg->patrol_dwell);
    loop = jp.getBool("loop", true);

    if (gw->preset->patrol_start(ids, dwell, loop) != 0) {
        resp_result(false, "\"error\":\"Patrol needs saved presets and PTZ\"");
        return;
    }
    resp_result(true, "\"patrol\":" + webu_patrol_json(gw->preset->patrol_config()));
}

void cls_webu_post::action_patrol_stop()
{
    gw->preset->patrol_stop();
    resp_result(true);
}

void cls_webu_post::action_time_sync()
{
    ctx_camera_time ct;
    bool use_ntp;

    if ((gw->onvif == nullptr) || (gw->onvif->connected == false)) {
        resp_error(MHD_HTTP_BAD_REQUEST, "ONVIF not configured");
        return;
    }

    use_ntp = jp.getBool("useNtp", false);
    if (gw->onvif->set_camera_time(use_ntp) != 0) {
        resp_error(MHD_HTTP_INTERNAL_SERVER_ERROR, "Failed to sync camera time");
        return;
    }

    if (gw->onvif->get_camera_time(ct) == 0) {
        resp_result(true, std::string("\"message\":\"") +
            (use_ntp ? "Camera set to NTP mode" : "Camera time synchronized") +
            "\",\"utc\":\"" + util_iso_time(ct.utc_ms) + "\"");
    } else {
        resp_result(true);
    }
}

/* Gates run under the loop lock, the channels are tried outside it */
void cls_webu_post::action_notify_test()
{
    ctx_notify_payload payload;
    ctx_notify_job job;
    bool ready, ok;
    int attempts;

    payload.type = NOTIFY_CUSTOM;
    payload.title = jp.getString("title", "Test Notification");
    payload.message = jp.getString("message"
        , "This is a test notification from " + gw->cfg->camera_name);
    payload.priority = NOTIFY_PRIO_NORMAL;
    payload.image_url = "";

    pthread_mutex_lock(&app->mutex_post);
        if (gw->status != GATEWAY_RUNNING) {
            pthread_mutex_unlock(&app->mutex_post);
            resp_error(MHD_HTTP_SERVICE_UNAVAILABLE, "Camera not running");
            return;
        }
        ready = gw->notify->prepare(payload, job);
        attempts = gw->notify->attempts;
    pthread_mutex_unlock(&app->mutex_post);

    ok = false;
    if (ready) {
        ok = gw->notify->deliver(job);
    }
    resp_result(ok, "\"attempts\":" + std::to_string(attempts));
}

void cls_webu_post::process_actions(std::string cmd)
{
    if (cmd == "motion") {
        action_motion();
    } else if (cmd == "detection") {
        action_detection();
    } else if (cmd == "ptz/move") {
        action_ptz_move();
    } else if (cmd == "ptz/stop") {
        action_ptz_stop();
    } else if (cmd == "ptz/home") {
        action_ptz_home();
    } else if (cmd == "ptz/preset") {
        action_ptz_preset();
    } else if (cmd == "ptz/preset/set") {
        action_ptz_preset_set();
    } else if (cmd == "ptz/preset/delete") {
        action_ptz_preset_delete();
    } else if (cmd == "recording/start") {
        action_recording_start();
    } else if (cmd == "recording/stop") {
        action_recording_stop();
    } else if (cmd == "clips/delete") {
        action_clip_delete();
    } else if ((cmd == "settings/video") || (cmd == "settings/camera") ||
        (cmd == "settings/notify")) {
        action_settings();
    } else if (cmd == "settings/reset") {
        action_settings_reset();
    } else if (cmd == "settings/apply") {
        action_settings_apply();
    } else if (cmd == "presets") {
        action_preset_save();
    } else if (cmd == "presets/goto") {
        action_preset_goto();
    } else if (cmd == "presets/delete") {
        action_preset_delete();
    } else if (cmd == "presets/schedule") {
        action_schedule_add();
    } else if (cmd == "presets/schedule/delete") {
        action_schedule_delete();
    } else if (cmd == "patrol/start") {
        action_patrol_start();
    } else if (cmd == "patrol/stop") {
        action_patrol_stop();
    } else if (cmd == "camera/time/sync") {
        action_time_sync();
    } else {
        resp_error(MHD_HTTP_NOT_FOUND, "Not found: " + webua->url);
    }
}

void cls_webu_post::main()
{
    std::string cmd, grp;

    webua->resp_type = WEBUI_RESP_JSON;
    webua->resp_code = MHD_HTTP_OK;
    cmd = webua->uri_route;

    CAMGATE_LOG(DBG, TYPE_NET, NO_ERRNO, "processing post: %s", cmd.c_str());

    grp = action_group(cmd);
    if (grp == "") {
        webua->not_found();
        return;
    }
    if (webu->action_enabled(grp) == false) {
        webua->error_resp(MHD_HTTP_FORBIDDEN, "Action disabled: " + grp);
        return;
    }

    gw = webua->gw;
    if (gw == nullptr) {
        webua->error_resp(MHD_HTTP_NOT_FOUND, "Unknown camera: " + webua->uri_camid);
        return;
    }

    if (parse_body() == false) {
        webua->mhd_send();
        return;
    }

    if (cmd == "snapshot") {
        /* Snapshot only runs a child process so it stays outside the loop lock */
        if (gw->status != GATEWAY_RUNNING) {
            resp_error(MHD_HTTP_SERVICE_UNAVAILABLE, "Camera not running");
        } else {
            action_snapshot();
        }
        webua->mhd_send();
        return;
    }
    if (cmd == "notify/test") {
        action_notify_test();
        webua->mhd_send();
        return;
    }

    pthread_mutex_lock(&app->mutex_post);
        if (gw->status != GATEWAY_RUNNING) {
            resp_error(MHD_HTTP_SERVICE_UNAVAILABLE, "Camera not running");
        } else {
            process_actions(cmd);
        }
    pthread_mutex_unlock(&app->mutex_post);

    webua->mhd_send();
}

cls_webu_post::cls_webu_post(cls_webu_ans *p_webua)
{
    app    = p_webua->app;
    webu   = p_webua->webu;
    webua  = p_webua;
    gw     = nullptr;
}

cls_webu_post::~cls_webu_post()
{
    app    = nullptr;
    webu   = nullptr;
    webua  = nullptr;
    gw     = nullptr;
}
