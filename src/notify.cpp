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
#include "json_parse.hpp"
#include "http.hpp"
#include "evtbus.hpp"
#include "dbse.hpp"
#include "notify.hpp"

const char *notify_type_str(enum NOTIFY_TYPE type)
{
    switch (type) {
    case NOTIFY_BIRD_DETECTED:  return "bird_detected";
    case NOTIFY_NEW_SPECIES:    return "new_species";
    case NOTIFY_RARE_BIRD:      return "rare_bird";
    case NOTIFY_MOTION:         return "motion";
    case NOTIFY_CAMERA_OFFLINE: return "camera_offline";
    case NOTIFY_STORAGE_LOW:    return "storage_low";
    default:                    return "custom";
    }
}

const char *notify_priority_str(enum NOTIFY_PRIORITY prio)
{
    switch (prio) {
    case NOTIFY_PRIO_LOW:       return "low";
    case NOTIFY_PRIO_HIGH:      return "high";
    case NOTIFY_PRIO_URGENT:    return "urgent";
    default:                    return "normal";
    }
}

/* "HH:MM" to minutes after midnight, -1 when malformed */
int notify_minutes(std::string hhmm)
{
    int hh, mm;

    if (sscanf(hhmm.c_str(), "%d:%d", &hh, &mm) != 2) {
        return -1;
    }
    if ((hh < 0) || (hh > 23) || (mm < 0) || (mm > 59)) {
        return -1;
    }
    return (hh * 60) + mm;
}

static std::string notify_list_json(const std::vector<std::string> &lst)
{
    std::string resp;
    size_t indx;

    resp = "[";
    for (indx = 0; indx < lst.size(); indx++) {
        if (indx > 0) {
            resp += ",";
        }
        resp += "\"" + util_json_escape(lst[indx]) + "\"";
    }
    resp += "]";
    return resp;
}

static bool notify_list_has(const std::vector<std::string> &lst, std::string species)
{
    size_t indx;

    species = mytolower(species);
    for (indx = 0; indx < lst.size(); indx++) {
        if (mytolower(lst[indx]) == species) {
            return true;
        }
    }
    return false;
}

void cls_notify::defaults()
{
    settings.enabled = true;
    settings.on_bird_detected = true;
    settings.on_new_species = true;
    settings.on_rare_bird = true;
    settings.on_motion = false;
    settings.on_camera_offline = true;
    settings.on_storage_low = true;
    settings.quiet_enabled = true;
    settings.quiet_start = "22:00";
    settings.quiet_end = "07:00";
    settings.min_interval = 60;
    settings.max_per_hour = 20;
    settings.pushover_enabled = false;
    settings.pushover_user = "";
    settings.pushover_token = "";
    settings.pushover_priority = 0;
    settings.ntfy_enabled = false;
    settings.ntfy_topic = "";
    settings.ntfy_server = NOTIFY_NTFY_SERVER;
    settings.webhook_enabled = false;
    settings.webhook_url = "";
    settings.webhook_headers.clear();
    settings.rare_species.clear();
    settings.ignored_species.clear();
}

void cls_notify::reset()
{
    defaults();
}

/* Merge whatever keys are present over the current values */
void cls_notify::update(JsonParser &jp)
{
    std::vector<std::string> hdrs;
    size_t indx;

    settings.enabled = jp.getBool("enabled", settings.enabled);
    settings.on_bird_detected = jp.getBool("onBirdDetected", settings.on_bird_detected);
    settings.on_new_species = jp.getBool("onNewSpecies", settings.on_new_species);
    settings.on_rare_bird = jp.getBool("onRareBird", settings.on_rare_bird);
    settings.on_motion = jp.getBool("onMotion", settings.on_motion);
    settings.on_camera_offline = jp.getBool("onCameraOffline", settings.on_camera_offline);
    settings.on_storage_low = jp.getBool("onStorageLow", settings.on_storage_low);
    settings.quiet_enabled = jp.getBool("quietHoursEnabled", settings.quiet_enabled);
    if (notify_minutes(jp.getString("quietHoursStart")) >= 0) {
        settings.quiet_start = jp.getString("quietHoursStart");
    }
    if (notify_minutes(jp.getString("quietHoursEnd")) >= 0) {
        settings.quiet_end = jp.getString("quietHoursEnd");
    }
    if (jp.has("minIntervalSeconds")) {
        settings.min_interval = MAX((int)jp.getNumber("minIntervalSeconds"), 0);
    }
    if (jp.has("maxPerHour")) {
        settings.max_per_hour = MAX((int)jp.getNumber("maxPerHour"), 0);
    }

    settings.pushover_enabled = jp.getBool("pushover.enabled", settings.pushover_enabled);
    settings.pushover_user = jp.getString("pushover.userKey", settings.pushover_user);
    settings.pushover_token = jp.getString("pushover.apiToken", settings.pushover_token);
    if (jp.has("pushover.priority")) {
        settings.pushover_priority = MIN(MAX((int)jp.getNumber("pushover.priority"), -2), 2);
    }

    settings.ntfy_enabled = jp.getBool("ntfy.enabled", settings.ntfy_enabled);
    settings.ntfy_topic = jp.getString("ntfy.topic", settings.ntfy_topic);
    settings.ntfy_server = jp.getString("ntfy.server", settings.ntfy_server);
    if (settings.ntfy_server == "") {
        settings.ntfy_server = NOTIFY_NTFY_SERVER;
    }

    settings.webhook_enabled = jp.getBool("webhook.enabled", settings.webhook_enabled);
    settings.webhook_url = jp.getString("webhook.url", settings.webhook_url);
    hdrs = jp.children("webhook.headers");
    if (hdrs.empty() == false) {
        settings.webhook_headers.clear();
        for (indx = 0; indx < hdrs.size(); indx++) {
            settings.webhook_headers[hdrs[indx]] =
                jp.getString("webhook.headers." + hdrs[indx]);
        }
    }

    if (jp.has("rareSpecies")) {
        settings.rare_species = jp.getList("rareSpecies");
    }
    if (jp.has("ignoredSpecies")) {
        settings.ignored_species = jp.getList("ignoredSpecies");
    }
}

int cls_notify::load()
{
    std::string data;
    JsonParser jp;

    defaults();
    if (util_file_read(fname, data) != 0) {
        CAMGATE_LOG(INF, TYPE_EVENTS, NO_ERRNO
            , _("No notification settings at %s, using defaults"), fname.c_str());
        return 0;
    }
    if (jp.parse(data) == false) {
        CAMGATE_LOG(ERR, TYPE_EVENTS, NO_ERRNO
            , _("Invalid %s: %s"), fname.c_str(), jp.getError().c_str());
        return -1;
    }
    update(jp);
    return 0;
}

int cls_notify::save()
{
    if (util_file_write(fname, json()) != 0) {
        CAMGATE_LOG(ERR, TYPE_EVENTS, NO_ERRNO
            , _("Unable to save %s"), fname.c_str());
        return -1;
    }
    return 0;
}

std::string cls_notify::json()
{
    std::string resp;
    std::map<std::string, std::string>::iterator it;

    resp  = "{";
    resp += "\"enabled\":" + std::string(settings.enabled ? "true" : "false");
    resp += ",\"onBirdDetected\":" + std::string(settings.on_bird_detected ? "true" : "false");
    resp += ",\"onNewSpecies\":" + std::string(settings.on_new_species ? "true" : "false");
    resp += ",\"onRareBird\":" + std::string(settings.on_rare_bird ? "true" : "false");
    resp += ",\"onMotion\":" + std::string(settings.on_motion ? "true" : "false");
    resp += ",\"onCameraOffline\":" + std::string(settings.on_camera_offline ? "true" : "false");
    resp += ",\"onStorageLow\":" + std::string(settings.on_storage_low ? "true" : "false");
    resp += ",\"quietHoursEnabled\":" + std::string(settings.quiet_enabled ? "true" : "false");
    resp += ",\"quietHoursStart\":\"" + util_json_escape(settings.quiet_start) + "\"";
    resp += ",\"quietHoursEnd\":\"" + util_json_escape(settings.quiet_end) + "\"";
    resp += ",\"minIntervalSeconds\":" + std::to_string(settings.min_interval);
    resp += ",\"maxPerHour\":" + std::to_string(settings.max_per_hour);

    resp += ",\"pushover\":{";
    resp += "\"enabled\":" + std::string(settings.pushover_enabled ? "true" : "false");
    resp += ",\"userKey\":\"" + util_json_escape(settings.pushover_user) + "\"";
    resp += ",\"apiToken\":\"" + util_json_escape(settings.pushover_token) + "\"";
    resp += ",\"priority\":" + std::to_string(settings.pushover_priority);
    resp += "}";

    resp += ",\"ntfy\":{";
    resp += "\"enabled\":" + std::string(settings.ntfy_enabled ? "true" : "false");
    resp += ",\"topic\":\"" + util_json_escape(settings.ntfy_topic) + "\"";
    resp += ",\"server\":\"" + util_json_escape(settings.ntfy_server) + "\"";
    resp += "}";

    resp += ",\"webhook\":{";
    resp += "\"enabled\":" + std::string(settings.webhook_enabled ? "true" : "false");
    resp += ",\"url\":\"" + util_json_escape(settings.webhook_url) + "\"";
    resp += ",\"headers\":{";
    for (it = settings.webhook_headers.begin(); it != settings.webhook_headers.end(); it++) {
        if (it != settings.webhook_headers.begin()) {
            resp += ",";
        }
        resp += "\"" + util_json_escape(it->first) + "\":\"" +
            util_json_escape(it->second) + "\"";
    }
    resp += "}}";

    resp += ",\"rareSpecies\":" + notify_list_json(settings.rare_species);
    resp += ",\"ignoredSpecies\":" + notify_list_json(settings.ignored_species);
    resp += "}";
    return resp;
}

/* The window wraps past midnight when start is later than end */
bool cls_notify::is_quiet_at(int minute_of_day)
{
    int start, end;

    if (settings.quiet_enabled == false) {
        return false;
    }
    start = notify_minutes(settings.quiet_start);
    end = notify_minutes(settings.quiet_end);
    if ((start < 0) || (end < 0) || (start == end)) {
        return false;
    }
    if (start > end) {
        return ((minute_of_day >= start) || (minute_of_day < end));
    }
    return ((minute_of_day >= start) && (minute_of_day < end));
}

bool cls_notify::is_rate_limited(int64_t now_ms)
{
    while ((recent.empty() == false) &&
           (recent.front() <= (now_ms - NOTIFY_RATE_WINDOW))) {
        recent.pop_front();
    }
    if ((int)recent.size() >= settings.max_per_hour) {
        return true;
    }
    if ((recent.empty() == false) &&
        ((now_ms - recent.back()) < ((int64_t)settings.min_interval * 1000))) {
        return true;
    }
    return false;
}

bool cls_notify::is_rare(std::string species)
{
    return notify_list_has(settings.rare_species, species);
}

bool cls_notify::is_ignored(std::string species)
{
    return notify_list_has(settings.ignored_species, species);
}

bool cls_notify::send_pushover(const ctx_notify_job &job)
{
    const ctx_notify_payload &payload = job.payload;
    ctx_http_req req;
    ctx_http_resp resp;
    std::map<std::string, std::string> fields;
    int prio;

    switch (payload.priority) {
    case NOTIFY_PRIO_URGENT:    prio = 2;  break;
    case NOTIFY_PRIO_HIGH:      prio = 1;  break;
    case NOTIFY_PRIO_LOW:       prio = -1; break;
    default:                    prio = 0;  break;
    }

    fields["token"] = job.settings.pushover_token;
    fields["user"] = job.settings.pushover_user;
    fields["title"] = payload.title;
    fields["message"] = payload.message;
    fields["priority"] = std::to_string(prio);
    if (payload.image_url != "") {
        fields["url"] = payload.image_url;
    }

    http_req_init(req, "POST", NOTIFY_PUSHOVER_URL, NOTIFY_TIMEOUT);
    req.content_type = "application/x-www-form-urlencoded";
    req.body = http_form_encode(fields);
    if ((http->request(req, resp) != 0) || (resp.status != 200)) {
        CAMGATE_LOG(WRN, TYPE_EVENTS, NO_ERRNO
            , _("Pushover failed: %d %s"), resp.status, resp.errmsg.c_str());
        return false;
    }
    return true;
}

bool cls_notify::send_ntfy(const ctx_notify_job &job)
{
    const ctx_notify_payload &payload = job.payload;
    ctx_http_req req;
    ctx_http_resp resp;
    std::string server, prio, tags;

    server = job.settings.ntfy_server;
    if (server.find("://") == std::string::npos) {
        server = "https://" + server;
    }
    while ((server != "") && (server.back() == '/')) {
        server.pop_back();
    }

    switch (payload.priority) {
    case NOTIFY_PRIO_URGENT:    prio = "5"; break;
    case NOTIFY_PRIO_HIGH:      prio = "4"; break;
    case NOTIFY_PRIO_LOW:       prio = "2"; break;
    default:                    prio = "3"; break;
    }
    if (payload.type == NOTIFY_BIRD_DETECTED) {
        tags = "bird";
    } else if (payload.type == NOTIFY_NEW_SPECIES) {
        tags = "tada,bird";
    } else {
        tags = "camera";
    }

    http_req_init(req, "POST", server + "/" + job.settings.ntfy_topic, NOTIFY_TIMEOUT);
    req.content_type = "text/plain";
    req.body = payload.message;
    req.headers["Title"] = payload.title;
    req.headers["Priority"] = prio;
    req.headers["Tags"] = tags;
    if ((http->request(req, resp) != 0) || (resp.status != 200)) {
        CAMGATE_LOG(WRN, TYPE_EVENTS, NO_ERRNO
            , _("ntfy failed: %d %s"), resp.status, resp.errmsg.c_str());
        return false;
    }
    return true;
}

std::string cls_notify::payload_json(const ctx_notify_payload &payload, int64_t now_ms)
{
    std::string resp;
    std::map<std::string, std::string>::const_iterator it;

    resp  = "{";
    resp += "\"type\":\"" + std::string(notify_type_str(payload.type)) + "\"";
    resp += ",\"title\":\"" + util_json_escape(payload.title) + "\"";
    resp += ",\"message\":\"" + util_json_escape(payload.message) + "\"";
    resp += ",\"priority\":\"" + std::string(notify_priority_str(payload.priority)) + "\"";
    if (payload.image_url != "") {
        resp += ",\"imageUrl\":\"" + util_json_escape(payload.image_url) + "\"";
    }
    if (payload.data.empty() == false) {
        resp += ",\"data\":{";
        for (it = payload.data.begin(); it != payload.data.end(); it++) {
            if (it != payload.data.begin()) {
                resp += ",";
            }
            resp += "\"" + util_json_escape(it->first) + "\":" + it->second;
        }
        resp += "}";
    }
    resp += ",\"deviceId\":\"" + util_json_escape(device_id) + "\"";
    resp += ",\"timestamp\":\"" + util_iso_time(now_ms) + "\"";
    resp += "}";
    return resp;
}

bool cls_notify::send_webhook(const ctx_notify_job &job)
{
    ctx_http_req req;
    ctx_http_resp resp;
    std::map<std::string, std::string>::const_iterator it;

    http_req_init(req, "POST", job.settings.webhook_url, NOTIFY_TIMEOUT);
    req.content_type = "application/json";
    req.body = payload_json(job.payload, job.now_ms);
    for (it = job.settings.webhook_headers.begin(); it != job.settings.webhook_headers.end(); it++) {
        req.headers[it->first] = it->second;
    }
    if ((http->request(req, resp) != 0) ||
        (resp.status < 200) || (resp.status > 299)) {
        CAMGATE_LOG(WRN, TYPE_EVENTS, NO_ERRNO
            , _("Webhook failed: %d %s"), resp.status, resp.errmsg.c_str());
        return false;
    }
    return true;
}

static void notify_clock(int &minute_of_day, int64_t &now_ms)
{
    struct tm tm_now;
    time_t tnow;

    tnow = time(NULL);
    localtime_r(&tnow, &tm_now);
    minute_of_day = (tm_now.tm_hour * 60) + tm_now.tm_min;
    now_ms = util_now_ms();
}

/*
 * Gate order is enabled, quiet hours and then the rate limit.  A payload
 * that passes is counted for the rate limit right away and captured with
 * the channel settings of the moment.
 */
bool cls_notify::prepare(const ctx_notify_payload &payload
    , int minute_of_day, int64_t now_ms, ctx_notify_job &job)
{
    if (settings.enabled == false) {
        CAMGATE_LOG(DBG, TYPE_EVENTS, NO_ERRNO, _("Notifications disabled"));
        return false;
    }
    if ((payload.priority != NOTIFY_PRIO_URGENT) && is_quiet_at(minute_of_day)) {
        CAMGATE_LOG(INF, TYPE_EVENTS, NO_ERRNO
            , _("Quiet hours, %s not sent"), notify_type_str(payload.type));
        return false;
    }

    pthread_mutex_lock(&mutex_ntf);
        if (is_rate_limited(now_ms)) {
            pthread_mutex_unlock(&mutex_ntf);
            CAMGATE_LOG(INF, TYPE_EVENTS, NO_ERRNO
                , _("Rate limited, %s not sent"), notify_type_str(payload.type));
            return false;
        }
        attempts++;
        recent.push_back(now_ms);
    pthread_mutex_unlock(&mutex_ntf);

    job.payload = payload;
    job.settings = settings;
    job.now_ms = now_ms;

    return true;
}

bool cls_notify::prepare(const ctx_notify_payload &payload, ctx_notify_job &job)
{
    int minute_of_day;
    int64_t now_ms;

    notify_clock(minute_of_day, now_ms);
    return prepare(payload, minute_of_day, now_ms, job);
}

/* Every enabled channel is tried, one success is enough */
bool cls_notify::deliver(const ctx_notify_job &job)
{
    ctx_notify_log itm;
    bool sent;

    sent = false;
    if (job.settings.pushover_enabled && send_pushover(job)) {
        sent = true;
    }
    if (job.settings.ntfy_enabled && (job.settings.ntfy_topic != "") && send_ntfy(job)) {
        sent = true;
    }
    if (job.settings.webhook_enabled && (job.settings.webhook_url != "") &&
        send_webhook(job)) {
        sent = true;
    }

    itm.device_id = device_id;
    itm.timestamp = job.now_ms;
    itm.type = notify_type_str(job.payload.type);
    itm.title = job.payload.title;
    itm.sent = sent;

    pthread_mutex_lock(&mutex_ntf);
        nlog.push_back(itm);
        while (nlog.size() > NOTIFY_LOG_KEEP) {
            nlog.pop_front();
        }
    pthread_mutex_unlock(&mutex_ntf);

    if (dbse != nullptr) {
        dbse->notify_log_add(itm);
    }

    CAMGATE_LOG(NTC, TYPE_EVENTS, NO_ERRNO
        , _("Notification %s %s"), itm.type.c_str(), sent ? "sent" : "not delivered");
    return sent;
}

bool cls_notify::send(const ctx_notify_payload &payload)
{
    int minute_of_day;
    int64_t now_ms;

    notify_clock(minute_of_day, now_ms);
    return send(payload, minute_of_day, now_ms);
}

bool cls_notify::send(const ctx_notify_payload &payload, int minute_of_day, int64_t now_ms)
{
    ctx_notify_job job;

    if (prepare(payload, minute_of_day, now_ms, job) == false) {
        return false;
    }
    return deliver(job);
}

/*
 * Queue for the notifier thread.  Without a running thread the
 * payload is delivered by the caller.
 */
bool cls_notify::post(const ctx_notify_payload &payload, int minute_of_day, int64_t now_ms)
{
    ctx_notify_job job;

    if (prepare(payload, minute_of_day, now_ms, job) == false) {
        return false;
    }
    if (handler_running == false) {
        return deliver(job);
    }

    pthread_mutex_lock(&mutex_ntf);
        if (jobs.size() >= NOTIFY_QUEUE_MAX) {
            CAMGATE_LOG(WRN, TYPE_EVENTS, NO_ERRNO
                , _("Notification queue full, dropping %s")
                , notify_type_str(jobs.front().payload.type));
            jobs.pop_front();
        }
        jobs.push_back(job);
        pthread_cond_signal(&cond_ntf);
    pthread_mutex_unlock(&mutex_ntf);

    return true;
}

bool cls_notify::post(const ctx_notify_payload &payload)
{
    int minute_of_day;
    int64_t now_ms;

    notify_clock(minute_of_day, now_ms);
    return post(payload, minute_of_day, now_ms);
}

size_t cls_notify::pending()
{
    size_t cnt;

    pthread_mutex_lock(&mutex_ntf);
        cnt = jobs.size() + (busy ? 1 : 0);
    pthread_mutex_unlock(&mutex_ntf);
    return cnt;
}

static void *notify_handler(void *arg)
{
    ((cls_notify *)arg)->handler();
    return nullptr;
}

void cls_notify::handler()
{
    ctx_notify_job job;
    struct timespec ts;

    mythreadname_set("nt", 0, device_id.c_str());

    pthread_mutex_lock(&mutex_ntf);
    while (handler_stop == false) {
        if (jobs.empty()) {
            clock_gettime(CLOCK_REALTIME, &ts);
            ts.tv_sec += 1;
            pthread_cond_timedwait(&cond_ntf, &mutex_ntf, &ts);
            continue;
        }
        job = jobs.front();
        jobs.pop_front();
        busy = true;
        pthread_mutex_unlock(&mutex_ntf);

        deliver(job);

        pthread_mutex_lock(&mutex_ntf);
        busy = false;
    }
    pthread_mutex_unlock(&mutex_ntf);

    CAMGATE_LOG(NTC, TYPE_EVENTS, NO_ERRNO, _("Notifier closed"));
    handler_running = false;
    pthread_exit(NULL);
}

void cls_notify::handler_startup()
{
    int retcd;
    pthread_attr_t thread_attr;

    if (handler_running == false) {
        handler_running = true;
        handler_stop = false;
        pthread_attr_init(&thread_attr);
        pthread_attr_setdetachstate(&thread_attr, PTHREAD_CREATE_DETACHED);
        retcd = pthread_create(&handler_thread, &thread_attr, &notify_handler, this);
        if (retcd != 0) {
            CAMGATE_LOG(WRN, TYPE_EVENTS, NO_ERRNO
                ,_("Unable to start notifier thread."));
            handler_running = false;
            handler_stop = true;
        }
        pthread_attr_destroy(&thread_attr);
    }
}

/* Waits out a delivery in progress, queued payloads are dropped */
void cls_notify::handler_shutdown()
{
    int waitcnt;

    if (handler_running == true) {
        pthread_mutex_lock(&mutex_ntf);
            handler_stop = true;
            if (jobs.empty() == false) {
                CAMGATE_LOG(NTC, TYPE_EVENTS, NO_ERRNO
                    , _("Dropping %d queued notifications"), (int)jobs.size());
                jobs.clear();
            }
            pthread_cond_signal(&cond_ntf);
        pthread_mutex_unlock(&mutex_ntf);

        waitcnt = 0;
        while ((handler_running == true) && (waitcnt < NOTIFY_STOP_WAIT)) {
            SLEEP(0, 100000000L);
            waitcnt++;
        }
        if (waitcnt == NOTIFY_STOP_WAIT) {
            CAMGATE_LOG(ERR, TYPE_EVENTS, NO_ERRNO
                , _("Normal shutdown of notifier failed"));
        }
        handler_running = false;
    }
}

bool cls_notify::notify_bird(std::string species, double confidence
    , bool is_new, bool rare)
{
    ctx_notify_payload payload;
    char buf[32];

    if (is_ignored(species)) {
        return false;
    }
    snprintf(buf, sizeof(buf), "%.0f", confidence * 100.0);
    payload.data["species"] = "\"" + util_json_escape(species) + "\"";
    payload.data["confidence"] = std::to_string(confidence);

    if (is_new && settings.on_new_species) {
        payload.type = NOTIFY_NEW_SPECIES;
        payload.title = "New Species!";
        payload.message = "First sighting of " + species + "! (" + buf + "% confidence)";
        payload.priority = NOTIFY_PRIO_HIGH;
        payload.data["isNew"] = "true";
    } else if (rare && settings.on_rare_bird) {
        payload.type = NOTIFY_RARE_BIRD;
        payload.title = "Rare Bird Alert!";
        payload.message = species + " spotted! (" + buf + "% confidence)";
        payload.priority = NOTIFY_PRIO_HIGH;
        payload.data["isRare"] = "true";
    } else if (settings.on_bird_detected) {
        payload.type = NOTIFY_BIRD_DETECTED;
        payload.title = "Bird Detected";
        payload.message = species + " (" + buf + "% confidence)";
        payload.priority = NOTIFY_PRIO_NORMAL;
    } else {
        return false;
    }
    return post(payload);
}

/* Must run before the sighting is stored so a first sighting counts as new */
bool cls_notify::notify_detection(std::string species, double confidence)
{
    bool is_new;

    is_new = false;
    if (dbse != nullptr) {
        is_new = (dbse->species_seen(device_id, species) == false);
    }
    return notify_bird(species, confidence, is_new, is_rare(species));
}

bool cls_notify::notify_motion()
{
    ctx_notify_payload payload;

    if (settings.on_motion == false) {
        return false;
    }
    payload.type = NOTIFY_MOTION;
    payload.title = "Motion Detected";
    payload.message = "Movement detected on camera";
    payload.priority = NOTIFY_PRIO_LOW;
    return post(payload);
}

bool cls_notify::notify_offline()
{
    ctx_notify_payload payload;

    if (settings.on_camera_offline == false) {
        return false;
    }
    payload.type = NOTIFY_CAMERA_OFFLINE;
    payload.title = "Camera Offline";
    payload.message = "The camera has gone offline";
    payload.priority = NOTIFY_PRIO_URGENT;
    return post(payload);
}

bool cls_notify::notify_storage(double used_pct)
{
    ctx_notify_payload payload;
    char buf[32];

    if (settings.on_storage_low == false) {
        return false;
    }
    snprintf(buf, sizeof(buf), "%.0f", used_pct);
    payload.type = NOTIFY_STORAGE_LOW;
    payload.title = "Storage Low";
    payload.message = "Storage is " + std::string(buf) + "% full";
    payload.priority = (used_pct > 95.0) ? NOTIFY_PRIO_HIGH : NOTIFY_PRIO_NORMAL;
    payload.data["usedPercent"] = buf;
    return post(payload);
}

void cls_notify::log_list(int limit, vec_notify_log &nlogs)
{
    std::deque<ctx_notify_log>::reverse_iterator it;

    nlogs.clear();
    if (dbse != nullptr) {
        dbse->notify_log_list(device_id, limit, nlogs);
        return;
    }
    pthread_mutex_lock(&mutex_ntf);
        for (it = nlog.rbegin(); it != nlog.rend(); it++) {
            if ((int)nlogs.size() >= limit) {
                break;
            }
            nlogs.push_back(*it);
        }
    pthread_mutex_unlock(&mutex_ntf);
}

cls_notify::cls_notify(std::string p_fname, cls_http_transport *p_http
    , cls_dbse *p_dbse, std::string p_device_id)
{
    fname = p_fname;
    http = p_http;
    dbse = p_dbse;
    device_id = p_device_id;
    attempts = 0;
    busy = false;
    handler_running = false;
    handler_stop = true;
    pthread_mutex_init(&mutex_ntf, nullptr);
    pthread_cond_init(&cond_ntf, nullptr);
    defaults();
}

cls_notify::~cls_notify()
{
    handler_shutdown();
    pthread_cond_destroy(&cond_ntf);
    pthread_mutex_destroy(&mutex_ntf);
}
