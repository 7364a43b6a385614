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

#ifndef _INCLUDE_PTZ_HPP_
#define _INCLUDE_PTZ_HPP_

#define PTZ_CGI_SPEED_MAX       8
#define PTZ_CGI_PRESET_MAX      10
#define PTZ_CONVENIENCE_SPEED   0.5

enum PTZ_BACKEND {
    PTZ_BACKEND_ONVIF,
    PTZ_BACKEND_CGI
};

struct ctx_ptz_caps {
    bool    supported;
    bool    absolute;
    bool    relative;
    bool    continuous;
    bool    presets;
    bool    home;
};

/* pan and tilt -1..1, zoom 0..1 */
struct ctx_ptz_pos {
    double  pan;
    double  tilt;
    double  zoom;
};

struct ctx_ptz_preset {
    std::string     token;
    std::string     name;
};
typedef std::vector<ctx_ptz_preset> vec_ptz_preset;

/* Common interface of the PTZ backends */
class cls_ptz {
    public:
        cls_ptz();
        virtual ~cls_ptz();

        enum PTZ_BACKEND    backend;
        std::string         errmsg;

        ctx_ptz_caps get_capabilities();
        bool caps_cached();

        virtual bool continuous_move(double pan, double tilt, double zoom) = 0;
        virtual bool stop() = 0;
        virtual bool absolute_move(double pan, double tilt, double zoom) = 0;
        virtual bool relative_move(double pan, double tilt, double zoom) = 0;
        virtual bool get_position(ctx_ptz_pos &pos) = 0;
        virtual bool get_presets(vec_ptz_preset &presets) = 0;
        virtual bool goto_preset(std::string token) = 0;
        virtual std::string set_preset(std::string name) = 0;
        virtual bool remove_preset(std::string token) = 0;
        virtual bool go_home() = 0;
        virtual bool set_home() = 0;

        bool pan_left(double speed = PTZ_CONVENIENCE_SPEED);
        bool pan_right(double speed = PTZ_CONVENIENCE_SPEED);
        bool tilt_up(double speed = PTZ_CONVENIENCE_SPEED);
        bool tilt_down(double speed = PTZ_CONVENIENCE_SPEED);
        bool zoom_in(double speed = PTZ_CONVENIENCE_SPEED);
        bool zoom_out(double speed = PTZ_CONVENIENCE_SPEED);

        void poll(int64_t now_mono);
        int64_t stop_pending();

    protected:
        pthread_mutex_t     mutex_caps;
        pthread_mutex_t     mutex_stop;
        bool                caps_done;
        ctx_ptz_caps        caps;
        int64_t             stop_at;        /* mono ms of a scheduled stop, 0 when none */

        virtual ctx_ptz_caps probe_capabilities() = 0;
        void schedule_stop(int64_t delay_ms);
        void cancel_stop();
};

/* Dahua/Amcrest style ptz.cgi */
class cls_ptz_cgi : public cls_ptz {
    public:
        cls_ptz_cgi(cls_http_transport *p_http, std::string p_host, int p_port
            , std::string p_user, std::string p_pass, int p_channel, int p_timeout_ms);
        ~cls_ptz_cgi();

        bool continuous_move(double pan, double tilt, double zoom) override;
        bool stop() override;
        bool absolute_move(double pan, double tilt, double zoom) override;
        bool relative_move(double pan, double tilt, double zoom) override;
        bool get_position(ctx_ptz_pos &pos) override;
        bool get_presets(vec_ptz_preset &presets) override;
        bool goto_preset(std::string token) override;
        std::string set_preset(std::string name) override;
        bool remove_preset(std::string token) override;
        bool go_home() override;
        bool set_home() override;

        int command(std::string action, std::string code
            , int arg1, int arg2, int arg3, std::string &body);
        std::string current_code();

    protected:
        ctx_ptz_caps probe_capabilities() override;

    private:
        cls_http_transport  *http;
        std::string         host;
        int                 port;
        std::string         user;
        std::string         pass;
        int                 channel;
        int                 timeout_ms;
        std::string         cur_code;
        pthread_mutex_t     mutex_code;

        int get(std::string path, ctx_http_resp &resp);
        std::string base_url();
};

/* ONVIF PTZ service */
class cls_ptz_onvif : public cls_ptz {
    public:
        cls_ptz_onvif(cls_onvif *p_onvif, std::string p_profile);
        ~cls_ptz_onvif();

        bool continuous_move(double pan, double tilt, double zoom) override;
        bool stop() override;
        bool absolute_move(double pan, double tilt, double zoom) override;
        bool relative_move(double pan, double tilt, double zoom) override;
        bool get_position(ctx_ptz_pos &pos) override;
        bool get_presets(vec_ptz_preset &presets) override;
        bool goto_preset(std::string token) override;
        std::string set_preset(std::string name) override;
        bool remove_preset(std::string token) override;
        bool go_home() override;
        bool set_home() override;

    protected:
        ctx_ptz_caps probe_capabilities() override;

    private:
        cls_onvif           *onvif;
        std::string         profile;

        bool call(const char *action, std::string inner, cls_xml &xml);
        bool call(const char *action, std::string inner);
        std::string vector_xml(double pan, double tilt, double zoom);
};

    std::string ptz_cgi_direction(double pan, double tilt, double zoom);
    int ptz_cgi_speed(double pan, double tilt, double zoom);
    bool ptz_vendor_match(std::string manufacturer, std::string model);
    enum PTZ_BACKEND ptz_backend_select(std::string mode
        , std::string manufacturer, std::string model);
    const char *ptz_backend_str(enum PTZ_BACKEND backend);

#endif /* _INCLUDE_PTZ_HPP_ */
