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

#ifndef _INCLUDE_CAMGATE_HPP_
#define _INCLUDE_CAMGATE_HPP_

#include "config.hpp"

#include <stdio.h>
#include <stdlib.h>
#include <stdarg.h>
#include <syslog.h>
#include <locale.h>
#include <string.h>
#include <strings.h>
#include <unistd.h>
#include <fcntl.h>
#include <time.h>
#include <signal.h>
#include <limits.h>
#include <errno.h>
#include <poll.h>
#include <netdb.h>
#include <sys/time.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <sys/param.h>
#include <sys/socket.h>
#include <sys/statvfs.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <stdint.h>
#include <math.h>
#include <pthread.h>
#include <dirent.h>
#include <microhttpd.h>
#include <string>
#include <list>
#include <map>
#include <set>
#include <vector>
#include <deque>
#include <functional>
#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <regex>
#include "zlib.h"

#if defined(HAVE_PTHREAD_NP_H)
    #include <pthread_np.h>
#endif

#pragma GCC diagnostic push
    #pragma GCC diagnostic ignored "-Wconversion"
    extern "C" {
        #include <libavformat/avformat.h>
        #include <libavcodec/avcodec.h>
        #include <libavutil/avutil.h>
        #include <libavutil/dict.h>
        #include <libavutil/sha.h>
        #include <libavutil/md5.h>
        #include <libavutil/base64.h>
        #include <libavutil/random_seed.h>
        #include <libavutil/mem.h>
        #include "libavutil/error.h"
    }
#pragma GCC diagnostic pop

class cls_camgate;
class cls_gateway;
class cls_config;
class cls_dbse;
class cls_log;
class cls_xml;
class cls_http;
class cls_http_transport;
class cls_onvif;
class cls_ptz;
class cls_ptz_onvif;
class cls_ptz_cgi;
class cls_preset;
class cls_process;
class cls_stream;
class cls_tunnel;
class cls_settings;
class cls_recorder;
class cls_pipeline;
class cls_analyzer;
class cls_notify;
class cls_webu;
class cls_webu_ans;
class cls_webu_json;
class cls_webu_post;

enum CAMGATE_SIGNAL {
    CAMGATE_SIGNAL_NONE,
    CAMGATE_SIGNAL_ALARM,
    CAMGATE_SIGNAL_USR1,
    CAMGATE_SIGNAL_SIGHUP,
    CAMGATE_SIGNAL_SIGTERM
};
extern volatile enum CAMGATE_SIGNAL cgsignal;

/* Failure classes carried in results and log lines */
enum CG_ERR {
    CG_ERR_NONE,
    CG_ERR_DISCOVERY_TIMEOUT,
    CG_ERR_AUTH,
    CG_ERR_PARSE,
    CG_ERR_TIMEOUT,
    CG_ERR_NETWORK,
    CG_ERR_SPAWN,
    CG_ERR_CRASHED,
    CG_ERR_STORAGE,
    CG_ERR_TUNNEL,
    CG_ERR_CLOCK_DRIFT
};

class cls_camgate {
    public:
        cls_camgate();
        ~cls_camgate();

        std::vector<cls_gateway*>   gw_list;

        bool    reload_all;
        int     gw_cnt;

        int     argc;
        char    **argv;

        cls_config          *conf_src;
        cls_config          *cfg;
        cls_webu            *webu;
        cls_dbse            *dbse;

        pthread_mutex_t     mutex_gwlst;    /* Lock the list of gateways while adding/removing */
        pthread_mutex_t     mutex_post;     /* Serializes web requests into the gateways */

        void signal_process();
        bool check_devices();
        void check_restart();
        int  init(int p_argc, char *p_argv[]);
        void deinit();
        cls_gateway *gateway_find(std::string device_id);

    private:
        void pid_write();
        void pid_remove();
        void daemon();
        void av_init();
        void av_deinit();
        void ntc();
};

#endif /* _INCLUDE_CAMGATE_HPP_ */
