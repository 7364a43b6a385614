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
#ifndef _INCLUDE_CONF_HPP_
#define _INCLUDE_CONF_HPP_

    /* Categories for the edits and display on web interface*/
    enum PARM_CAT{
        PARM_CAT_00     /* system */
        ,PARM_CAT_01    /* camera */
        ,PARM_CAT_02    /* onvif */
        ,PARM_CAT_03    /* ptz */
        ,PARM_CAT_04    /* stream */
        ,PARM_CAT_05    /* tunnel */
        ,PARM_CAT_06    /* recording */
        ,PARM_CAT_07    /* motion */
        ,PARM_CAT_08    /* notify */
        ,PARM_CAT_09    /* webcontrol */
        ,PARM_CAT_10    /* database */
        ,PARM_CAT_MAX
    };
    enum PARM_TYP{
        PARM_TYP_STRING
        , PARM_TYP_INT
        , PARM_TYP_LIST
        , PARM_TYP_BOOL
    };

    /** Current parameters in the config file */
    struct ctx_parm {
        const std::string   parm_name;      /* name for this parameter                  */
        enum PARM_TYP       parm_type;      /* enum of parm_typ for bool,int or string. */
        enum PARM_CAT       parm_cat;       /* enum of parm_cat for grouping. */
        bool                parm_secret;    /* Value never logged or reported */
    };

    enum PARM_ACT{
        PARM_ACT_DFLT
        , PARM_ACT_SET
        , PARM_ACT_GET
        , PARM_ACT_LIST
    };

    extern struct ctx_parm config_parms[];

    class cls_config {
        public:
            cls_config(cls_camgate *p_app);
            ~cls_config();

            std::string     conf_filename;

            /* Application parameters */
            bool            daemon;
            std::string     pid_file;
            std::string     log_file;
            int             log_level;
            int             log_fflevel;
            std::string     log_type;
            bool            native_language;
            std::string     data_dir;

            /* Camera source */
            std::string     device_id;
            std::string     camera_name;
            std::string     camera_location;
            std::string     rtsp_url;
            std::string     ffmpeg_path;

            /* Control protocol */
            bool            onvif_enabled;
            bool            onvif_auto_discover;
            std::string     onvif_host;
            int             onvif_port;
            std::string     onvif_user;
            std::string     onvif_password;
            std::string     onvif_profile_token;
            int             onvif_discover_timeout;
            int             onvif_timeout;

            /* PTZ */
            std::string     ptz_mode;
            int             ptz_channel;
            int             patrol_dwell;

            /* Live stream */
            std::string     stream_mode;
            std::string     hls_dir;
            int             stream_restart_delay;
            int             stream_max_restarts;
            std::string     relay_path;
            int             relay_port;
            int             relay_rtsp_port;

            /* Tunnel */
            bool            tunnel_enabled;
            std::string     tunnel_token;
            std::string     tunnel_hostname;
            bool            tunnel_quick;
            std::string     tunnel_path;

            /* Recording */
            bool            record_enabled;
            std::string     record_dir;
            std::string     snapshot_dir;
            int             clip_duration;
            int             pre_buffer;
            int             post_buffer;
            int             max_concurrent_clips;
            int             record_cooldown;
            int             max_clips;
            int             max_storage_mb;
            int             max_age_days;
            bool            record_thumbnail;
            bool            record_rolling;

            /* Motion analyzer */
            bool            motion_enabled;
            int             motion_sensitivity;
            int             motion_min_duration;
            int             motion_cooldown;
            bool            motion_record;
            bool            motion_notify;

            /* Notifications */
            std::string     notify_file;

            /* Web control */
            int             webcontrol_port;
            bool            webcontrol_localhost;
            bool            webcontrol_ipv6;
            std::string     webcontrol_api_key;
            std::string     webcontrol_actions;

            /* Database */
            std::string     database_dbname;
            int             database_busy_timeout;

            void camera_add(std::string fname);
            void process();
            void edit_set(std::string parm_nm, std::string parm_val);
            void edit_get(std::string parm_nm, std::string &parm_val, enum PARM_CAT parm_cat);
            void edit_list(std::string parm_nm, std::string &parm_val, enum PARM_CAT parm_cat);
            std::string type_desc(enum PARM_TYP ptype);
            std::string cat_desc(enum PARM_CAT pcat, bool shrt);
            void usage();
            void init();
            void parms_log();
            void parms_copy(cls_config *src);
            void parms_copy(cls_config *src, PARM_CAT p_cat);
            int validate(std::vector<std::string> &errs);

        private:
            cls_camgate *app;

            void cmdline();
            void defaults();
            void parms_log_parm(std::string parm_nm, std::string parm_vl, bool secret);
            int edit_set_active(std::string parm_nm, std::string parm_val);

            void edit_get_bool(std::string &parm_dest, bool &parm_in);
            void edit_set_bool(bool &parm_dest, std::string &parm_in);
            void edit_generic_bool(bool &parm_dest, std::string &parm, enum PARM_ACT pact, bool dflt);
            void edit_generic_int(int &parm_dest, std::string &parm, enum PARM_ACT pact
                , int dflt, int min, int max, const char *parm_nm);
            void edit_generic_str(std::string &parm_dest, std::string &parm, enum PARM_ACT pact
                , std::string dflt);

            void edit_cat(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact, enum PARM_CAT pcat);
            void edit_cat00(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact);
            void edit_cat01(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact);
            void edit_cat02(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact);
            void edit_cat03(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact);
            void edit_cat04(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact);
            void edit_cat05(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact);
            void edit_cat06(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact);
            void edit_cat07(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact);
            void edit_cat08(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact);
            void edit_cat09(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact);
            void edit_cat10(std::string parm_nm, std::string &parm_val, enum PARM_ACT pact);

            void edit_log_file(std::string &parm, enum PARM_ACT pact);
            void edit_log_level(std::string &parm, enum PARM_ACT pact);
            void edit_log_fflevel(std::string &parm, enum PARM_ACT pact);
            void edit_log_type(std::string &parm, enum PARM_ACT pact);
            void edit_data_dir(std::string &parm, enum PARM_ACT pact);
            void edit_device_id(std::string &parm, enum PARM_ACT pact);
            void edit_rtsp_url(std::string &parm, enum PARM_ACT pact);
            void edit_ptz_mode(std::string &parm, enum PARM_ACT pact);
            void edit_stream_mode(std::string &parm, enum PARM_ACT pact);
    };

#endif /* _INCLUDE_CONF_HPP_ */
