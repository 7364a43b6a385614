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

#ifndef _INCLUDE_ONVIF_HPP_
#define _INCLUDE_ONVIF_HPP_

#define ONVIF_SVC_DEVICE    "/onvif/device_service"
#define ONVIF_SVC_MEDIA     "/onvif/media_service"
#define ONVIF_SVC_PTZ       "/onvif/ptz_service"

#define ONVIF_NS_DEVICE     "http://www.onvif.org/ver10/device/wsdl"
#define ONVIF_NS_MEDIA      "http://www.onvif.org/ver10/media/wsdl"
#define ONVIF_NS_PTZ        "http://www.onvif.org/ver20/ptz/wsdl"
#define ONVIF_NS_SCHEMA     "http://www.onvif.org/ver10/schema"

#define ONVIF_OFFSET_MIN    5000        /* ms, smaller offsets are ignored */
#define ONVIF_SYNC_MAX      300         /* seconds, larger is not synced */
#define ONVIF_DRIFT_WARN    5           /* seconds */

struct ctx_onvif_profile {
    std::string     token;
    std::string     name;
    int             width;
    int             height;
    std::string     stream_uri;
};

struct ctx_onvif_device {
    std::string     address;
    int             port;
    std::string     manufacturer;
    std::string     model;
    std::string     firmware;
    std::string     service_addr;
    std::vector<ctx_onvif_profile> profiles;
};

struct ctx_camera_time {
    int64_t         utc_ms;
    std::string     timezone;
    bool            ntp;
    bool            dst;
};

struct ctx_time_sync {
    bool            synced;
    int64_t         camera_ms;
    int64_t         local_ms;
    int64_t         diff_sec;
};

struct ctx_onvif_result {
    enum CG_ERR     err;
    std::string     errmsg;
};

class cls_onvif {
    public:
        cls_onvif(cls_http_transport *p_http, int p_timeout_ms);
        ~cls_onvif();

        std::string         host;
        int                 port;
        std::string         user;
        std::string         pass;
        int64_t             clock_offset;   /* ms added to now() for Created */
        ctx_onvif_device    device;
        bool                connected;
        ctx_onvif_result    result;         /* Outcome of the last call */

        int connect(std::string p_host, int p_port, std::string p_user, std::string p_pass);
        int auto_connect(vec_discovered &cams, std::string p_user
            , std::string p_pass, std::string &url);
        int measure_clock();
        std::string best_stream_url(bool with_creds);
        std::string profile_stream_url(std::string token, bool with_creds);
        std::string add_credentials(std::string uri);

        int get_camera_time(ctx_camera_time &ct);
        int set_camera_time(bool use_ntp);
        int check_time_sync(ctx_time_sync &ts);

        int soap_call(const char *svc, std::string body, bool auth, cls_xml &xml);
        std::string service_url(const char *svc);
        std::string envelope(std::string body, bool auth);
        std::string security_header(const uint8_t *nonce, size_t nonce_len
            , std::string created);

    private:
        cls_http_transport  *http;
        int                 timeout_ms;

        int get_device_info();
        int get_profiles();
        int get_stream_uri(ctx_onvif_profile &prof);
        int get_profile_config(ctx_onvif_profile &prof);
        int64_t parse_datetime(cls_xml &xml, pugi::xml_node parent);
        void set_result(enum CG_ERR err, std::string msg);
};

    std::string onvif_password_digest(const uint8_t *nonce, size_t nonce_len
        , std::string created, std::string pass);

#endif /* _INCLUDE_ONVIF_HPP_ */
