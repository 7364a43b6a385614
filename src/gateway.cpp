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

static void *gateway_handler(void *arg)
{
    ((cls_gateway *)arg)->handler();
    return nullptr;
}

/* Configured id, else the one persisted in data_dir, else a new one */
void cls_gateway::device_id_load()
{
    std::string fname, data;

    if (cfg->device_id != "") {
        device_id = cfg->device_id;
        return;
    }
    fname = cfg->data_dir + "/device-id";
    if (threadnr > 0) {
        fname += "-" + std::to_string(threadnr);
    }
    if (util_file_read(fname, data) == 0) {
        mytrim(data);
        if (data != "") {
            device_id = data;
            return;
        }
    }
    device_id = "pi-" + util_random_hex(4);
    if (util_file_write(fname, device_id + "\n") != 0) {
        CAMGATE_LOG(WRN, TYPE_CORE, NO_ERRNO
            , _("Device id %s could not be saved"), device_id.c_str());
    } else {
        CAMGATE_LOG(NTC, TYPE_CORE, NO_ERRNO
            , _("Generated device id %s"), device_id.c_str());
    }
}

/*
 * The stream URL comes from rtsp_url, a configured ONVIF host or
 * discovery, in that order.  No URL means the gateway cannot start.
 */
int cls_gateway::source_resolve()
{
    cls_discovery disc;
    vec_discovered cams;
    std::string url;

    source_url = "";
    if (cfg->rtsp_url != "") {
        source_url = cfg->rtsp_url;
        if (cfg->onvif_enabled && (cfg->onvif_host != "")) {
            if (onvif->connect(cfg->onvif_host, cfg->onvif_port
                    , cfg->onvif_user, cfg->onvif_password) != 0) {
                CAMGATE_LOG(WRN, TYPE_ONVIF, NO_ERRNO
                    , _("Control connection failed, continuing without it: %s")
                    , onvif->result.errmsg.c_str());
            }
        }
        return 0;
    }

    if (cfg->onvif_enabled == false) {
        CAMGATE_LOG(CRT, TYPE_CORE, NO_ERRNO
            , _("No rtsp_url configured and ONVIF is disabled"));
        return -1;
    }

    if (cfg->onvif_host != "") {
        if (onvif->connect(cfg->onvif_host, cfg->onvif_port
                , cfg->onvif_user, cfg->onvif_password) == 0) {
            if (cfg->onvif_profile_token != "") {
                url = onvif->profile_stream_url(cfg->onvif_profile_token, true);
            }
            if (url == "") {
                url = onvif->best_stream_url(true);
            }
        }
    } else if (cfg->onvif_auto_discover) {
        disc.timeout_sec = cfg->onvif_discover_timeout;
        if (disc.probe(cams) != 0) {
            CAMGATE_LOG(ERR, TYPE_ONVIF, NO_ERRNO, _("Discovery failed"));
        }
        onvif->auto_connect(cams, cfg->onvif_user, cfg->onvif_password, url);
    }

    if (url == "") {
        CAMGATE_LOG(CRT, TYPE_CORE, NO_ERRNO
            , _("No camera source: %s %s")
            , cg_err_str(onvif->result.err), onvif->result.errmsg.c_str());
        return -1;
    }
    source_url = url;
    CAMGATE_LOG(NTC, TYPE_CORE, NO_ERRNO
        , _("Camera source %s"), util_url_mask(source_url).c_str());
    return 0;
}

void cls_gateway::ptz_init()
{
    enum PTZ_BACKEND backend;
    std::string host, profile;
    int port;

    ptz = nullptr;
    if (onvif->connected) {
        host = onvif->host;
        port = onvif->port;
    } else {
        host = cfg->onvif_host;
        port = cfg->onvif_port;
    }
    if (host == "") {
        CAMGATE_LOG(INF, TYPE_PTZ, NO_ERRNO, _("No control host, PTZ unavailable"));
        return;
    }

    backend = ptz_backend_select(cfg->ptz_mode
        , onvif->device.manufacturer, onvif->device.model);
    if (backend == PTZ_BACKEND_CGI) {
        ptz = new cls_ptz_cgi(http, host, port, cfg->onvif_user
            , cfg->onvif_password, cfg->ptz_channel, cfg->onvif_timeout * 1000);
    } else {
        if (onvif->connected == false) {
            CAMGATE_LOG(INF, TYPE_PTZ, NO_ERRNO
                , _("No ONVIF connection, PTZ unavailable"));
            return;
        }
        profile = cfg->onvif_profile_token;
        if ((profile == "") && (onvif->device.profiles.empty() == false)) {
            profile = onvif->device.profiles[0].token;
        }
        ptz = new cls_ptz_onvif(onvif, profile);
    }
    CAMGATE_LOG(NTC, TYPE_PTZ, NO_ERRNO
        , _("PTZ backend %s"), ptz_backend_str(backend));
}

int cls_gateway::init()
{
    std::string fname;

    status = GATEWAY_INIT;
    started_at = util_now_ms();
    if ((dbse == nullptr) && (app != nullptr)) {
        dbse = app->dbse;
    }

    device_id_load();

    http = new cls_http();
    onvif = new cls_onvif(http, cfg->onvif_timeout * 1000);
    if (source_resolve() != 0) {
        status = GATEWAY_FAILED;
        return -1;
    }

    ptz_init();
    preset = new cls_preset(dbse, device_id);
    preset->set_ptz(ptz);

    settings = new cls_settings(cfg->data_dir);
    settings->load();

    stream = new cls_stream(cfg, settings, &bus_stream);
    stream->source_url = source_url;

    tunnel = new cls_tunnel(cfg);

    recorder = new cls_recorder(cfg, dbse, device_id);
    recorder->source_url = source_url;
    pipeline = new cls_pipeline(cfg, recorder, &bus_clip);

    analyzer = new cls_analyzer(cfg, &bus_motion);
    analyzer->source_url = source_url;

    fname = cfg->notify_file;
    if (fname == "") {
        fname = cfg->data_dir + "/notifications.json";
    }
    notify = new cls_notify(fname, http, dbse, device_id);
    notify->load();
    notify->handler_startup();

    sub_trigger = bus_trigger.subscribe([this](const ctx_trigger &trg) {
        queue_trigger(trg);
    });
    sub_motion = bus_motion.subscribe([this](const ctx_motion_evt &evt) {
        on_motion(evt);
    });
    sub_stream = bus_stream.subscribe([this](const ctx_stream_evt &evt) {
        on_stream(evt);
    });
    sub_clip = bus_clip.subscribe([this](const ctx_clip &clip) {
        on_clip(clip);
    });

    if (stream->start() != 0) {
        CAMGATE_LOG(ERR, TYPE_STREAM, NO_ERRNO
            , _("Stream did not start, it will be retried"));
    }
    if (cfg->tunnel_enabled) {
        tunnel->start();
    }
    if (cfg->record_enabled) {
        recorder->ensure_dirs();
        pipeline->buffer_start();
        recorder->sweep_age(util_now_ms());
    }
    if (cfg->motion_enabled) {
        analyzer->start();
    }

    sweep_at = util_mono_ms() + GATEWAY_SWEEP_EVERY;
    storage_check_at = util_mono_ms() + GATEWAY_STORAGE_CHECK;
    status = GATEWAY_RUNNING;

    CAMGATE_LOG(NTC, TYPE_CORE, NO_ERRNO
        , _("Gateway %s (%s) running"), device_id.c_str(), cfg->camera_name.c_str());
    return 0;
}

void cls_gateway::deinit()
{
    if (sub_trigger > 0) {
        bus_trigger.unsubscribe(sub_trigger);
        bus_motion.unsubscribe(sub_motion);
        bus_stream.unsubscribe(sub_stream);
        bus_clip.unsubscribe(sub_clip);
        sub_trigger = 0;
    }

    if (analyzer != nullptr) {
        analyzer->stop();
        delete analyzer;
        analyzer = nullptr;
    }
    if (pipeline != nullptr) {
        pipeline->stop_all();
        delete pipeline;
        pipeline = nullptr;
    }
    if (recorder != nullptr) {
        delete recorder;
        recorder = nullptr;
    }
    if (tunnel != nullptr) {
        tunnel->stop();
        delete tunnel;
        tunnel = nullptr;
    }
    if (stream != nullptr) {
        stream->stop();
        delete stream;
        stream = nullptr;
    }
    if (settings != nullptr) {
        delete settings;
        settings = nullptr;
    }
    if (preset != nullptr) {
        delete preset;
        preset = nullptr;
    }
    if (ptz != nullptr) {
        ptz->stop();
        delete ptz;
        ptz = nullptr;
    }
    if (notify != nullptr) {
        delete notify;
        notify = nullptr;
    }
    if (onvif != nullptr) {
        delete onvif;
        onvif = nullptr;
    }
    if (http != nullptr) {
        delete http;
        http = nullptr;
    }
    status = GATEWAY_STOPPED;
}

void cls_gateway::queue_trigger(const ctx_trigger &trg)
{
    pthread_mutex_lock(&mutex_trg);
        trg_queue.push_back(trg);
    pthread_mutex_unlock(&mutex_trg);
}

size_t cls_gateway::queued()
{
    size_t cnt;

    pthread_mutex_lock(&mutex_trg);
        cnt = trg_queue.size();
    pthread_mutex_unlock(&mutex_trg);
    return cnt;
}

void cls_gateway::on_motion(const ctx_motion_evt &evt)
{
    ctx_trigger trg;

    if (evt.active == false) {
        return;
    }
    if (cfg->motion_record && cfg->record_enabled) {
        trg.source = TRIGGER_MOTION;
        trg.timestamp = evt.timestamp;
        trg.confidence = evt.confidence / 100.0;
        trg.species = "";
        bus_trigger.publish(trg);
    }
    if (cfg->motion_notify && (notify != nullptr)) {
        notify->notify_motion();
    }
}

/* Notified before the sighting is stored so first sightings count as new */
void cls_gateway::on_detection(std::string species, double confidence, int64_t ts)
{
    ctx_trigger trg;

    CAMGATE_LOG(INF, TYPE_EVENTS, NO_ERRNO
        , _("Detection %s %.0f%%"), species.c_str(), confidence * 100.0);
    if ((notify != nullptr) && (species != "")) {
        notify->notify_detection(species, confidence);
    }
    trg.source = TRIGGER_DETECTION;
    trg.timestamp = ts;
    trg.confidence = confidence;
    trg.species = species;
    bus_trigger.publish(trg);
}

/* Triggers are taken in arrival order, the pipeline gate may drop them */
void cls_gateway::triggers_process(int64_t now_mono)
{
    std::deque<ctx_trigger> pending;
    ctx_sighting sight;
    std::string clip_id;

    pthread_mutex_lock(&mutex_trg);
        pending.swap(trg_queue);
    pthread_mutex_unlock(&mutex_trg);

    while (pending.empty() == false) {
        clip_id = "";
        if (cfg->record_enabled && (pipeline != nullptr)) {
            pipeline->trigger(pending.front(), now_mono, &clip_id);
        }
        if ((pending.front().source == TRIGGER_DETECTION) &&
            (pending.front().species != "") && (dbse != nullptr)) {
            sight.device_id = device_id;
            sight.species = pending.front().species;
            sight.confidence = pending.front().confidence;
            sight.timestamp = pending.front().timestamp;
            sight.clip_id = clip_id;
            dbse->sighting_add(sight);
        }
        pending.pop_front();
    }
}

void cls_gateway::on_stream(const ctx_stream_evt &evt)
{
    if (evt.relay) {
        return;
    }
    if ((evt.state == STREAM_CRASHED) && (offline_notified == false)) {
        offline_notified = true;
        CAMGATE_LOG(ERR, TYPE_CORE, NO_ERRNO, _("Camera offline"));
        if (notify != nullptr) {
            notify->notify_offline();
        }
    } else if ((evt.state == STREAM_RUNNING) && offline_notified) {
        offline_notified = false;
        CAMGATE_LOG(NTC, TYPE_CORE, NO_ERRNO, _("Camera back online"));
    }
}

void cls_gateway::on_clip(const ctx_clip &clip)
{
    CAMGATE_LOG(INF, TYPE_EVENTS, NO_ERRNO
        , _("Clip %s ready, %s trigger")
        , clip.id.c_str(), trigger_source_str(clip.trigger.source));
}

void cls_gateway::storage_check(int64_t now_mono)
{
    ctx_storage_stats st;
    double pct;

    if (now_mono >= sweep_at) {
        sweep_at = now_mono + GATEWAY_SWEEP_EVERY;
        recorder->sweep_age(util_now_ms());
    }
    if (now_mono < storage_check_at) {
        return;
    }
    storage_check_at = now_mono + GATEWAY_STORAGE_CHECK;

    st = recorder->storage_stats();
    if (st.max_bytes <= 0) {
        return;
    }
    pct = ((double)st.used_bytes * 100.0) / (double)st.max_bytes;
    if (pct <= GATEWAY_STORAGE_WARN) {
        return;
    }
    if ((storage_warn_at != 0) && ((now_mono - storage_warn_at) < GATEWAY_STORAGE_REPEAT)) {
        return;
    }
    storage_warn_at = now_mono;
    CAMGATE_LOG(WRN, TYPE_EVENTS, NO_ERRNO, _("Storage %.0f%% used"), pct);
    if (notify != nullptr) {
        notify->notify_storage(pct);
    }
}

/* One pass of the control loop */
void cls_gateway::tick(int64_t now_mono, int64_t now_ms)
{
    if (stream != nullptr) {
        stream->poll(now_mono);
    }
    if (tunnel != nullptr) {
        tunnel->poll(now_mono);
    }
    if (analyzer != nullptr) {
        analyzer->poll(now_mono);
    }
    if (ptz != nullptr) {
        ptz->poll(now_mono);
    }
    if (preset != nullptr) {
        preset->poll(now_mono, now_ms);
    }
    triggers_process(now_mono);
    if (pipeline != nullptr) {
        pipeline->poll(now_mono);
    }
    if (recorder != nullptr) {
        storage_check(now_mono);
    }
}

void cls_gateway::handler()
{
    mythreadname_set("gw", threadnr, cfg->camera_name.c_str());

    while (handler_stop == false) {
        if (app != nullptr) {
            pthread_mutex_lock(&app->mutex_post);
                tick(util_mono_ms(), util_now_ms());
            pthread_mutex_unlock(&app->mutex_post);
        } else {
            tick(util_mono_ms(), util_now_ms());
        }
        SLEEP(0, GATEWAY_TICK * 1000000L);
    }

    CAMGATE_LOG(NTC, TYPE_CORE, NO_ERRNO, _("Gateway loop closed"));
    handler_running = false;
    pthread_exit(NULL);
}

void cls_gateway::handler_startup()
{
    int retcd;
    pthread_attr_t thread_attr;

    if (handler_running == false) {
        handler_running = true;
        handler_stop = false;
        restart = false;
        pthread_attr_init(&thread_attr);
        pthread_attr_setdetachstate(&thread_attr, PTHREAD_CREATE_DETACHED);
        retcd = pthread_create(&handler_thread, &thread_attr, &gateway_handler, this);
        if (retcd != 0) {
            CAMGATE_LOG(WRN, TYPE_CORE, NO_ERRNO,_("Unable to start gateway thread."));
            handler_running = false;
            handler_stop = true;
        }
        pthread_attr_destroy(&thread_attr);
    }
}

void cls_gateway::handler_shutdown()
{
    int waitcnt;

    if (handler_running == true) {
        handler_stop = true;
        waitcnt = 0;
        while ((handler_running == true) && (waitcnt < 100)){
            SLEEP(0, 100000000L)
            waitcnt++;
        }
        if (waitcnt == 100) {
            CAMGATE_LOG(ERR, TYPE_CORE, NO_ERRNO
                , _("Normal shutdown of gateway loop failed"));
        }
        handler_running = false;
    }
}

std::string cls_gateway::status_json()
{
    std::string resp;
    char buf[64];

    resp  = "{";
    resp += "\"deviceId\":\"" + util_json_escape(device_id) + "\"";
    resp += ",\"name\":\"" + util_json_escape(cfg->camera_name) + "\"";
    resp += ",\"location\":\"" + util_json_escape(cfg->camera_location) + "\"";
    resp += ",\"status\":\"";
    switch (status) {
    case GATEWAY_RUNNING:   resp += "running"; break;
    case GATEWAY_FAILED:    resp += "failed"; break;
    case GATEWAY_STOPPED:   resp += "stopped"; break;
    default:                resp += "init"; break;
    }
    resp += "\"";
    resp += ",\"source\":\"" + util_json_escape(util_url_mask(source_url)) + "\"";
    resp += ",\"online\":" + std::string(offline_notified ? "false" : "true");
    snprintf(buf, sizeof(buf), "%lld", (long long)((util_now_ms() - started_at) / 1000));
    resp += ",\"uptime\":" + std::string(buf);

    if (onvif != nullptr) {
        resp += ",\"onvif\":{";
        resp += "\"connected\":" + std::string(onvif->connected ? "true" : "false");
        resp += ",\"manufacturer\":\"" + util_json_escape(onvif->device.manufacturer) + "\"";
        resp += ",\"model\":\"" + util_json_escape(onvif->device.model) + "\"";
        resp += ",\"firmware\":\"" + util_json_escape(onvif->device.firmware) + "\"";
        resp += ",\"clockOffsetMs\":" + std::to_string(onvif->clock_offset);
        resp += "}";
    }
    if (ptz != nullptr) {
        resp += ",\"ptz\":{\"backend\":\"" + std::string(ptz_backend_str(ptz->backend)) + "\"";
        resp += ",\"patrol\":" + std::string(preset->patrol_active() ? "true" : "false");
        resp += "}";
    }
    if (stream != nullptr) {
        resp += ",\"stream\":" + stream->json();
    }
    if (tunnel != nullptr) {
        resp += ",\"tunnel\":" + tunnel->json();
    }
    if (pipeline != nullptr) {
        resp += ",\"recording\":" + pipeline->json();
    }
    if (analyzer != nullptr) {
        resp += ",\"motion\":" + analyzer->json();
    }
    if (recorder != nullptr) {
        resp += ",\"storage\":" + recorder->storage_json();
    }
    resp += "}";
    return resp;
}

std::string cls_gateway::capabilities_json()
{
    ctx_ptz_caps caps;
    std::string resp;

    caps.supported = false;
    caps.absolute = false;
    caps.relative = false;
    caps.continuous = false;
    caps.presets = false;
    caps.home = false;
    if (ptz != nullptr) {
        caps = ptz->get_capabilities();
    }

    resp  = "{\"ptz\":{";
    resp += "\"supported\":" + std::string(caps.supported ? "true" : "false");
    resp += ",\"absolute\":" + std::string(caps.absolute ? "true" : "false");
    resp += ",\"relative\":" + std::string(caps.relative ? "true" : "false");
    resp += ",\"continuous\":" + std::string(caps.continuous ? "true" : "false");
    resp += ",\"presets\":" + std::string(caps.presets ? "true" : "false");
    resp += ",\"home\":" + std::string(caps.home ? "true" : "false");
    if (ptz != nullptr) {
        resp += ",\"backend\":\"" + std::string(ptz_backend_str(ptz->backend)) + "\"";
    }
    resp += "}";
    resp += ",\"onvif\":" + std::string(((onvif != nullptr) && onvif->connected) ? "true" : "false");
    resp += ",\"recording\":" + std::string(cfg->record_enabled ? "true" : "false");
    resp += ",\"motion\":" + std::string(cfg->motion_enabled ? "true" : "false");
    resp += ",\"relay\":" + std::string(((stream != nullptr) && stream->relay_wanted) ? "true" : "false");
    resp += ",\"tunnel\":" + std::string(cfg->tunnel_enabled ? "true" : "false");
    resp += "}";
    return resp;
}

cls_gateway::cls_gateway(cls_camgate *p_app)
{
    app = p_app;
    cfg = nullptr;
    conf_src = nullptr;
    dbse = nullptr;
    threadnr = 0;
    device_id = "";
    source_url = "";
    status = GATEWAY_INIT;
    started_at = util_now_ms();

    http = nullptr;
    onvif = nullptr;
    ptz = nullptr;
    preset = nullptr;
    settings = nullptr;
    stream = nullptr;
    tunnel = nullptr;
    recorder = nullptr;
    pipeline = nullptr;
    analyzer = nullptr;
    notify = nullptr;

    handler_stop = true;
    handler_running = false;
    restart = false;

    offline_notified = false;
    storage_check_at = 0;
    storage_warn_at = 0;
    sweep_at = 0;
    sub_trigger = 0;
    sub_motion = 0;
    sub_stream = 0;
    sub_clip = 0;

    pthread_mutex_init(&mutex_trg, NULL);
}

cls_gateway::~cls_gateway()
{
    deinit();
    pthread_mutex_destroy(&mutex_trg);
    delete conf_src;
    delete cfg;
}
