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
#ifndef _INCLUDE_WEBU_HPP_
#define _INCLUDE_WEBU_HPP_

    #define WEBUI_LEN_URLI      512         /* Maximum URL permitted */
    #define WEBUI_MHD_OPTS      10          /* Maximum number of options permitted for MHD */
    #define WEBUI_POST_MAX      1048576     /* Largest accepted request body */
    #define WEBUI_LOCK_ATTEMPTS 5           /* Failed keys before an address is ignored */
    #define WEBUI_LOCK_MINUTES  10
    #define WEBUI_STOP_WAIT     5000        /* ms allowed for open requests to finish */

    enum WEBUI_METHOD {
        WEBUI_METHOD_GET    = 0,
        WEBUI_METHOD_POST   = 1
    };

    enum WEBUI_RESP {
        WEBUI_RESP_JSON     = 0,
        WEBUI_RESP_TEXT     = 1
    };

    struct ctx_webu_clients {
        std::string                 clientip;
        bool                        authenticated;
        int                         conn_nbr;
        struct timespec             conn_time;
        int                         key_fail_nbr;
    };

    /* Listening socket, flags and option list handed to MHD */
    struct ctx_webu_bind {
        struct MHD_OptionItem   ops[WEBUI_MHD_OPTS];
        int                     ops_cnt;
        unsigned int            flags;
        bool                    ipv6;
        struct sockaddr_in      lpbk_ipv4;
        struct sockaddr_in6     lpbk_ipv6;
    };

    class cls_webu {
        public:
            cls_webu(cls_camgate *p_app);
            ~cls_webu();
            bool                        wb_finish;
            ctx_params                  *wb_actions;
            struct MHD_Daemon           *wb_daemon;
            std::list<ctx_webu_clients> wb_clients;
            pthread_mutex_t             mutex_clients;
            int                         cnct_cnt;
            void startup();
            void shutdown();
            bool action_enabled(std::string action);

        private:
            ctx_webu_bind   *wb_bind;
            cls_camgate     *app;
            void init_actions();
            void start_daemon();
    };

    void webu_bind_setup(ctx_webu_bind &wbind, int port, bool localhost
        , bool ipv6, void *app);

#endif /* _INCLUDE_WEBU_HPP_ */
