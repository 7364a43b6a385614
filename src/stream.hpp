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

#ifndef _INCLUDE_STREAM_HPP_
#define _INCLUDE_STREAM_HPP_

#define STREAM_RELAY_NAME       "camgate"
#define STREAM_STOP_WAIT        5000

struct ctx_stream_stats {
    double          fps;
    std::string     bitrate;
    int64_t         frames;
    std::string     timemark;
};

struct ctx_stream_info {
    std::string     codec;
    int             width;
    int             height;
    double          fps;
};

class cls_stream {
    public:
        cls_stream(cls_config *p_cfg, cls_settings *p_settings
            , cls_evtbus<ctx_stream_evt> *p_bus);
        ~cls_stream();

        std::string     source_url;
        enum STREAM_STATE   state;
        bool            relay_wanted;
        bool            relay_ready;

        int start();
        void stop();
        int restart();
        int apply_settings();
        void poll(int64_t now_mono);

        ctx_stream_stats stats();
        std::string mode();
        std::string playlist();
        std::string json();
        void build_args(std::vector<std::string> &args);
        std::string relay_config();

    private:
        cls_config                  *cfg;
        cls_settings                *settings;
        cls_evtbus<ctx_stream_evt>  *bus;
        cls_process                 *transcoder;
        cls_process                 *relay;
        ctx_stream_stats            cur_stats;
        pthread_mutex_t             mutex_stats;
        int64_t                     relay_check_at;

        void set_state(enum STREAM_STATE st);
        void reset_output();
        void on_line(const std::string &line);
        void on_exit(int code);
        int relay_start();
        void relay_stop();
        void relay_check(int64_t now_mono);
        void relay_line(const std::string &line);
};

    bool stream_parse_stats(const std::string &line, ctx_stream_stats &st);
    bool stream_which(std::string prog);
    int stream_probe(std::string url, int timeout_ms, ctx_stream_info &info);

#endif /* _INCLUDE_STREAM_HPP_ */
