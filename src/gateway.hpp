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

#ifndef _INCLUDE_GATEWAY_HPP_
#define _INCLUDE_GATEWAY_HPP_

#define GATEWAY_TICK            100         /* ms per loop pass */
#define GATEWAY_SWEEP_EVERY     3600000     /* ms between age sweeps */
#define GATEWAY_STORAGE_CHECK   60000       /* ms between storage checks */
#define GATEWAY_STORAGE_WARN    90.0        /* percent */
#define GATEWAY_STORAGE_REPEAT  3600000     /* ms between storage warnings */

enum GATEWAY_STATUS {
    GATEWAY_INIT,
    GATEWAY_RUNNING,
    GATEWAY_FAILED,
    GATEWAY_STOPPED
};

/* One camera and everything that serves it */
class cls_gateway {
    public:
        cls_gateway(cls_camgate *p_app);
        ~cls_gateway();

        cls_camgate     *app;
        cls_config      *cfg;
        cls_config      *conf_src;
        cls_dbse        *dbse;
        int             threadnr;
        std::string     device_id;
        std::string     source_url;
        enum GATEWAY_STATUS status;
        int64_t         started_at;

        cls_http        *http;
        cls_onvif       *onvif;
        cls_ptz         *ptz;
        cls_preset      *preset;
        cls_settings    *settings;
        cls_stream      *stream;
        cls_tunnel      *tunnel;
        cls_recorder    *recorder;
        cls_pipeline    *pipeline;
        cls_analyzer    *analyzer;
        cls_notify      *notify;

        cls_evtbus<ctx_trigger>     bus_trigger;
        cls_evtbus<ctx_clip>        bus_clip;
        cls_evtbus<ctx_motion_evt>  bus_motion;
        cls_evtbus<ctx_stream_evt>  bus_stream;

        bool            handler_stop;
        bool            handler_running;
        bool            restart;
        pthread_t       handler_thread;
        void            handler();
        void            handler_startup();
        void            handler_shutdown();

        int init();
        void deinit();
        void tick(int64_t now_mono, int64_t now_ms);

        void on_motion(const ctx_motion_evt &evt);
        void on_detection(std::string species, double confidence, int64_t ts);
        void queue_trigger(const ctx_trigger &trg);
        size_t queued();

        std::string status_json();
        std::string capabilities_json();

    private:
        pthread_mutex_t         mutex_trg;
        std::deque<ctx_trigger> trg_queue;
        bool                    offline_notified;
        int64_t                 storage_check_at;
        int64_t                 storage_warn_at;
        int64_t                 sweep_at;
        int                     sub_trigger;
        int                     sub_motion;
        int                     sub_stream;
        int                     sub_clip;

        void device_id_load();
        int source_resolve();
        void ptz_init();
        void triggers_process(int64_t now_mono);
        void storage_check(int64_t now_mono);
        void on_stream(const ctx_stream_evt &evt);
        void on_clip(const ctx_clip &clip);
};

#endif /* _INCLUDE_GATEWAY_HPP_ */
