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

#ifndef _INCLUDE_NOTIFY_HPP_
#define _INCLUDE_NOTIFY_HPP_

#define NOTIFY_TIMEOUT          10000       /* ms per channel */
#define NOTIFY_RATE_WINDOW      3600000     /* ms */
#define NOTIFY_LOG_KEEP         100
#define NOTIFY_PUSHOVER_URL     "https://api.pushover.net/1/messages.json"
#define NOTIFY_NTFY_SERVER      "https://ntfy.sh"
#define NOTIFY_QUEUE_MAX        32
#define NOTIFY_STOP_WAIT        350         /* 100 ms steps, covers three channel timeouts */

enum NOTIFY_TYPE {
    NOTIFY_BIRD_DETECTED,
    NOTIFY_NEW_SPECIES,
    NOTIFY_RARE_BIRD,
    NOTIFY_MOTION,
    NOTIFY_CAMERA_OFFLINE,
    NOTIFY_STORAGE_LOW,
    NOTIFY_CUSTOM
};

enum NOTIFY_PRIORITY {
    NOTIFY_PRIO_LOW,
    NOTIFY_PRIO_NORMAL,
    NOTIFY_PRIO_HIGH,
    NOTIFY_PRIO_URGENT
};

struct ctx_notify_payload {
    enum NOTIFY_TYPE        type;
    std::string             title;
    std::string             message;
    enum NOTIFY_PRIORITY    priority;
    std::string             image_url;
    std::map<std::string, std::string>  data;   /* Values are JSON literals */
};

struct ctx_notify_settings {
    bool            enabled;
    bool            on_bird_detected;
    bool            on_new_species;
    bool            on_rare_bird;
    bool            on_motion;
    bool            on_camera_offline;
    bool            on_storage_low;

    bool            quiet_enabled;
    std::string     quiet_start;        /* HH:MM */
    std::string     quiet_end;

    int             min_interval;       /* seconds */
    int             max_per_hour;

    bool            pushover_enabled;
    std::string     pushover_user;
    std::string     pushover_token;
    int             pushover_priority;

    bool            ntfy_enabled;
    std::string     ntfy_topic;
    std::string     ntfy_server;

    bool            webhook_enabled;
    std::string     webhook_url;
    std::map<std::string, std::string>  webhook_headers;

    std::vector<std::string>    rare_species;
    std::vector<std::string>    ignored_species;
};

/* A payload that passed the gates, with the channel settings to use */
struct ctx_notify_job {
    ctx_notify_payload      payload;
    ctx_notify_settings     settings;
    int64_t                 now_ms;
};

/* Gates and fans out notifications to the configured push channels */
class cls_notify {
    public:
        cls_notify(std::string p_fname, cls_http_transport *p_http
            , cls_dbse *p_dbse, std::string p_device_id);
        ~cls_notify();

        ctx_notify_settings     settings;
        int                     attempts;

        int load();
        int save();
        void reset();
        void update(JsonParser &jp);
        std::string json();

        bool is_quiet_at(int minute_of_day);
        bool is_rate_limited(int64_t now_ms);
        bool is_rare(std::string species);
        bool is_ignored(std::string species);

        bool prepare(const ctx_notify_payload &payload, ctx_notify_job &job);
        bool prepare(const ctx_notify_payload &payload
            , int minute_of_day, int64_t now_ms, ctx_notify_job &job);
        bool deliver(const ctx_notify_job &job);
        bool send(const ctx_notify_payload &payload);
        bool send(const ctx_notify_payload &payload, int minute_of_day, int64_t now_ms);
        bool post(const ctx_notify_payload &payload);
        bool post(const ctx_notify_payload &payload, int minute_of_day, int64_t now_ms);
        size_t pending();

        void handler();
        void handler_startup();
        void handler_shutdown();

        bool notify_bird(std::string species, double confidence, bool is_new, bool is_rare);
        bool notify_detection(std::string species, double confidence);
        bool notify_motion();
        bool notify_offline();
        bool notify_storage(double used_pct);

        void log_list(int limit, vec_notify_log &nlogs);

    private:
        std::string             fname;
        cls_http_transport      *http;
        cls_dbse                *dbse;
        std::string             device_id;
        std::deque<int64_t>     recent;
        std::deque<ctx_notify_log>  nlog;
        std::deque<ctx_notify_job>  jobs;
        bool                    busy;
        volatile bool           handler_running;
        volatile bool           handler_stop;
        pthread_t               handler_thread;
        pthread_mutex_t         mutex_ntf;      /* jobs, nlog, recent and attempts */
        pthread_cond_t          cond_ntf;

        void defaults();
        bool send_pushover(const ctx_notify_job &job);
        bool send_ntfy(const ctx_notify_job &job);
        bool send_webhook(const ctx_notify_job &job);
        std::string payload_json(const ctx_notify_payload &payload, int64_t now_ms);
};

    const char *notify_type_str(enum NOTIFY_TYPE type);
    const char *notify_priority_str(enum NOTIFY_PRIORITY prio);
    int notify_minutes(std::string hhmm);

#endif /* _INCLUDE_NOTIFY_HPP_ */
