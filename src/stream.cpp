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
#include "evtbus.hpp"
#include "process.hpp"
#include "json_parse.hpp"
#include "settings.hpp"
#include "stream.hpp"

/* Reads the ffmpeg status line "frame= N fps= F ... time=T bitrate=B" */
bool stream_parse_stats(const std::string &line, ctx_stream_stats &st)
{
    std::smatch mtch;
    static const std::regex rx_frame("frame=\\s*([0-9]+)");
    static const std::regex rx_fps("fps=\\s*([0-9.]+)");
    static const std::regex rx_time("time=\\s*(-?[0-9:.]+)");
    static const std::regex rx_rate("bitrate=\\s*([0-9.]+kbits/s|N/A)");

    if (std::regex_search(line, mtch, rx_frame) == false) {
        return false;
    }
    st.frames = atoll(mtch[1].str().c_str());
    if (std::regex_search(line, mtch, rx_fps)) {
        st.fps = atof(mtch[1].str().c_str());
    }
    if (std::regex_search(line, mtch, rx_time)) {
        st.timemark = mtch[1].str();
    }
    if (std::regex_search(line, mtch, rx_rate)) {
        st.bitrate = mtch[1].str();
    }
    return true;
}

/* Whether prog resolves to an executable, directly or through PATH */
bool stream_which(std::string prog)
{
    const char *envpath;
    std::string path, dir;

    if (prog == "") {
        return false;
    }
    if (prog.find('/') != std::string::npos) {
        return (access(prog.c_str(), X_OK) == 0);
    }
    envpath = getenv("PATH");
    if (envpath == nullptr) {
        return false;
    }
    path = envpath;
    while (path != "") {
        dir = mtok(path, ":");
        if (dir == "") {
            continue;
        }
        if (access((dir + "/" + prog).c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

static int stream_probe_interrupt(void *ctx)
{
    int64_t *deadline = (int64_t *)ctx;
    return (util_mono_ms() > *deadline) ? 1 : 0;
}

/* One-shot look at the source.  Failure is reported, never fatal. */
int stream_probe(std::string url, int timeout_ms, ctx_stream_info &info)
{
    AVFormatContext *fmt_ctx;
    AVDictionary *opts;
    AVStream *strm;
    AVRational rate;
    int64_t deadline;
    unsigned int indx;
    int retcd;
    char errstr[128];

    info.codec = "";
    info.width = 0;
    info.height = 0;
    info.fps = 0;

    fmt_ctx = avformat_alloc_context();
    if (fmt_ctx == nullptr) {
        return -1;
    }
    deadline = util_mono_ms() + timeout_ms;
    fmt_ctx->interrupt_callback.callback = stream_probe_interrupt;
    fmt_ctx->interrupt_callback.opaque = &deadline;

    opts = nullptr;
    if (mystarts(url, "rtsp")) {
        av_dict_set(&opts, "rtsp_transport", "tcp", 0);
        av_dict_set(&opts, "timeout", "5000000", 0);
    }

    retcd = avformat_open_input(&fmt_ctx, url.c_str(), nullptr, &opts);
    av_dict_free(&opts);
    if (retcd < 0) {
        av_strerror(retcd, errstr, sizeof(errstr));
        CAMGATE_LOG(WRN, TYPE_STREAM, NO_ERRNO
            , _("Unable to open %s: %s"), util_url_mask(url).c_str(), errstr);
        return -1;
    }

    retcd = avformat_find_stream_info(fmt_ctx, nullptr);
    if (retcd < 0) {
        av_strerror(retcd, errstr, sizeof(errstr));
        CAMGATE_LOG(WRN, TYPE_STREAM, NO_ERRNO
            , _("Unable to find stream info: %s"), errstr);
        avformat_close_input(&fmt_ctx);
        return -1;
    }

    retcd = -1;
    for (indx = 0; indx < fmt_ctx->nb_streams; indx++) {
        strm = fmt_ctx->streams[indx];
        if (strm->codecpar->codec_type != AVMEDIA_TYPE_VIDEO) {
            continue;
        }
        info.codec = avcodec_get_name(strm->codecpar->codec_id);
        info.width = strm->codecpar->width;
        info.height = strm->codecpar->height;
        rate = strm->avg_frame_rate;
        if ((rate.num == 0) || (rate.den == 0)) {
            rate = strm->r_frame_rate;
        }
        if ((rate.num != 0) && (rate.den != 0)) {
            info.fps = round(av_q2d(rate));
        }
        retcd = 0;
        break;
    }
    avformat_close_input(&fmt_ctx);

    if (retcd != 0) {
        CAMGATE_LOG(WRN, TYPE_STREAM, NO_ERRNO, _("Source has no video stream"));
    } else {
        CAMGATE_LOG(INF, TYPE_STREAM, NO_ERRNO, _("Source is %s %dx%d %.0f fps")
            , info.codec.c_str(), info.width, info.height, info.fps);
    }
    return retcd;
}

cls_stream::cls_stream(cls_config *p_cfg, cls_settings *p_settings
    , cls_evtbus<ctx_stream_evt> *p_bus)
{
    cfg = p_cfg;
    settings = p_settings;
    bus = p_bus;
    source_url = cfg->rtsp_url;
    state = STREAM_IDLE;
    relay_ready = false;
    relay_check_at = 0;
    relay = nullptr;

    if (cfg->stream_mode == "relay") {
        relay_wanted = true;
    } else if (cfg->stream_mode == "auto") {
        relay_wanted = stream_which(cfg->relay_path);
    } else {
        relay_wanted = false;
    }

    cur_stats.fps = 0;
    cur_stats.bitrate = "0kbits/s";
    cur_stats.frames = 0;
    cur_stats.timemark = "00:00:00.00";
    pthread_mutex_init(&mutex_stats, nullptr);

    transcoder = new cls_process("ffmpeg", TYPE_STREAM);
    transcoder->restart_delay = cfg->stream_restart_delay * 1000;
    transcoder->restart_max = cfg->stream_max_restarts;
    transcoder->on_line = [this](const std::string &line) {
        on_line(line);
    };
    transcoder->on_exit = [this](int code) {
        on_exit(code);
    };
}

cls_stream::~cls_stream()
{
    stop();
    mydelete(transcoder);
    mydelete(relay);
    pthread_mutex_destroy(&mutex_stats);
}

void cls_stream::set_state(enum STREAM_STATE st)
{
    ctx_stream_evt evt;

    if (state == st) {
        return;
    }
    state = st;
    CAMGATE_LOG(INF, TYPE_STREAM, NO_ERRNO, _("Stream %s"), stream_state_str(st));

    if (bus != nullptr) {
        evt.state = st;
        evt.relay = false;
        evt.timestamp = util_now_ms();
        bus->publish(evt);
    }
}

void cls_stream::reset_output()
{
    vec_file_stat files;
    size_t indx;

    if (mycreate_path((cfg->hls_dir + "/").c_str()) != 0) {
        return;
    }
    util_dir_list(cfg->hls_dir, "", files);
    for (indx = 0; indx < files.size(); indx++) {
        if (myends(files[indx].name, ".ts") || myends(files[indx].name, ".m3u8")) {
            util_file_remove(files[indx].full_nm);
        }
    }
}

std::string cls_stream::playlist()
{
    return cfg->hls_dir + "/stream.m3u8";
}

void cls_stream::build_args(std::vector<std::string> &args)
{
    args.clear();
    args.push_back(cfg->ffmpeg_path);
    args.push_back("-hide_banner");
    args.push_back("-rtsp_transport");
    args.push_back("tcp");
    args.push_back("-stimeout");
    args.push_back("5000000");
    args.push_back("-i");
    args.push_back(source_url);

    settings->output_args(args);

    args.push_back("-hls_segment_filename");
    args.push_back(cfg->hls_dir + "/segment%03d.ts");
    args.push_back(playlist());
}

int cls_stream::start()
{
    if (transcoder->running()) {
        return 0;
    }
    if (source_url == "") {
        CAMGATE_LOG(ERR, TYPE_STREAM, NO_ERRNO, _("No camera source to stream"));
        return -1;
    }

    reset_output();

    pthread_mutex_lock(&mutex_stats);
        cur_stats.fps = 0;
        cur_stats.bitrate = "0kbits/s";
        cur_stats.frames = 0;
        cur_stats.timemark = "00:00:00.00";
    pthread_mutex_unlock(&mutex_stats);

    if (relay_wanted && (relay == nullptr)) {
        if (relay_start() != 0) {
            CAMGATE_LOG(WRN, TYPE_STREAM, NO_ERRNO
                , _("Relay unavailable, using transcode only"));
        }
    }

    build_args(transcoder->args);
    set_state(STREAM_STARTING);
    if (transcoder->start() != 0) {
        set_state(STREAM_CRASHED);
        return -1;
    }
    return 0;
}

void cls_stream::stop()
{
    relay_stop();
    if (transcoder->running()) {
        transcoder->stop(SIGTERM, STREAM_STOP_WAIT);
    } else {
        transcoder->stop(SIGTERM, 0);
    }
    if (state != STREAM_IDLE) {
        set_state(STREAM_STOPPED);
    }
}

int cls_stream::restart()
{
    if (transcoder->running()) {
        transcoder->stop(SIGTERM, STREAM_STOP_WAIT);
    }
    return start();
}

/* New encode settings take effect through a restart */
int cls_stream::apply_settings()
{
    if ((state == STREAM_RUNNING) || (state == STREAM_STARTING) ||
        (state == STREAM_CRASHED)) {
        CAMGATE_LOG(NTC, TYPE_STREAM, NO_ERRNO
            , _("Restarting stream with new settings"));
        return restart();
    }
    return 0;
}

void cls_stream::on_line(const std::string &line)
{
    ctx_stream_stats st;

    pthread_mutex_lock(&mutex_stats);
        st = cur_stats;
    pthread_mutex_unlock(&mutex_stats);

    if (stream_parse_stats(line, st)) {
        pthread_mutex_lock(&mutex_stats);
            cur_stats = st;
        pthread_mutex_unlock(&mutex_stats);
        if (state != STREAM_RUNNING) {
            set_state(STREAM_RUNNING);
        }
        CAMGATE_LOG(DBG, TYPE_STREAM, NO_ERRNO, "%s | %.0f fps | %s"
            , st.timemark.c_str(), st.fps, st.bitrate.c_str());
        return;
    }

    if ((line.find("Error") != std::string::npos) ||
        (line.find("error") != std::string::npos)) {
        CAMGATE_LOG(WRN, TYPE_STREAM, NO_ERRNO, "ffmpeg: %s", line.c_str());
    }
}

/* Stats stay frozen at their last values until the next start */
void cls_stream::on_exit(int code)
{
    if (transcoder->state == PROC_CRASHED) {
        CAMGATE_LOG(ERR, TYPE_STREAM, NO_ERRNO
            , _("Transcoder crashed with code %d"), code);
        set_state(STREAM_CRASHED);
    }
}

void cls_stream::poll(int64_t now_mono)
{
    transcoder->poll(now_mono);
    if ((state == STREAM_CRASHED) && transcoder->running()) {
        set_state(STREAM_STARTING);
    }

    if (relay != nullptr) {
        relay->poll(now_mono);
        if (relay->finished()) {
            CAMGATE_LOG(ERR, TYPE_STREAM, NO_ERRNO
                , _("Relay exited, falling back to transcode"));
            relay_stop();
            relay_wanted = false;
        } else if (relay_ready == false) {
            relay_check(now_mono);
        }
    }
}

ctx_stream_stats cls_stream::stats()
{
    ctx_stream_stats st;
    pthread_mutex_lock(&mutex_stats);
        st = cur_stats;
    pthread_mutex_unlock(&mutex_stats);
    return st;
}

std::string cls_stream::mode()
{
    if ((relay != nullptr) && relay_ready) {
        return "relay";
    }
    return "transcode";
}

std::string cls_stream::json()
{
    ctx_stream_stats st;
    std::string resp;
    char buf[64];

    st = stats();
    snprintf(buf, sizeof(buf), "%.1f", st.fps);

    resp  = "{";
    resp += "\"state\":\"" + std::string(stream_state_str(state)) + "\"";
    resp += ",\"mode\":\"" + mode() + "\"";
    resp += ",\"relayReady\":" + std::string(relay_ready ? "true" : "false");
    resp += ",\"restarts\":" + std::to_string(transcoder->restart_cnt);
    resp += ",\"playlist\":\"" + util_json_escape(playlist()) + "\"";
    resp += ",\"stats\":{";
    resp += "\"fps\":" + std::string(buf);
    resp += ",\"bitrate\":\"" + util_json_escape(st.bitrate) + "\"";
    resp += ",\"frames\":" + std::to_string(st.frames);
    resp += ",\"time\":\"" + util_json_escape(st.timemark) + "\"";
    resp += "}";
    if ((relay != nullptr) && relay_ready) {
        resp += ",\"relay\":{";
        resp += "\"api\":\"http://localhost:" + std::to_string(cfg->relay_port) + "\"";
        resp += ",\"rtsp\":\"rtsp://localhost:" + std::to_string(cfg->relay_rtsp_port) +
            "/" STREAM_RELAY_NAME "\"";
        resp += "}";
    }
    resp += "}";

    return resp;
}

std::string cls_stream::relay_config()
{
    std::string yml;

    yml  = "api:\n";
    yml += "  listen: \":" + std::to_string(cfg->relay_port) + "\"\n";
    yml += "rtsp:\n";
    yml += "  listen: \":" + std::to_string(cfg->relay_rtsp_port) + "\"\n";
    yml += "streams:\n";
    yml += "  " STREAM_RELAY_NAME ": \"" + source_url + "\"\n";

    return yml;
}

int cls_stream::relay_start()
{
    std::string cfgnm;

    cfgnm = cfg->hls_dir + "/relay.yaml";
    if (util_file_write(cfgnm, relay_config()) != 0) {
        return -1;
    }
    chmod(cfgnm.c_str(), S_IRUSR | S_IWUSR);

    relay = new cls_process("go2rtc", TYPE_STREAM);
    relay->oneshot = true;
    relay->args.push_back(cfg->relay_path);
    relay->args.push_back("-config");
    relay->args.push_back(cfgnm);
    relay->on_line = [this](const std::string &line) {
        relay_line(line);
    };

    relay_ready = false;
    relay_check_at = 0;
    if (relay->start() != 0) {
        mydelete(relay);
        return -1;
    }
    return 0;
}

void cls_stream::relay_stop()
{
    ctx_stream_evt evt;

    if (relay == nullptr) {
        return;
    }
    if (relay->running()) {
        relay->stop(SIGTERM, STREAM_STOP_WAIT);
    }
    mydelete(relay);
    relay_ready = false;

    if (bus != nullptr) {
        evt.state = STREAM_STOPPED;
        evt.relay = true;
        evt.timestamp = util_now_ms();
        bus->publish(evt);
    }
}

void cls_stream::relay_line(const std::string &line)
{
    ctx_stream_evt evt;

    if ((relay_ready == false) && (line.find("listen") != std::string::npos)) {
        relay_ready = true;
        CAMGATE_LOG(NTC, TYPE_STREAM, NO_ERRNO, _("Relay ready"));
        if (bus != nullptr) {
            evt.state = STREAM_RUNNING;
            evt.relay = true;
            evt.timestamp = util_now_ms();
            bus->publish(evt);
        }
    }
}

/* The relay is ready once its API port takes connections */
void cls_stream::relay_check(int64_t now_mono)
{
    struct sockaddr_in addr;
    int sockfd;

    if (now_mono < relay_check_at) {
        return;
    }
    relay_check_at = now_mono + 500;

    sockfd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sockfd < 0) {
        return;
    }
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)cfg->relay_port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (connect(sockfd, (struct sockaddr *)&addr, sizeof(addr)) == 0) {
        close(sockfd);
        relay_line("listen");
        return;
    }
    close(sockfd);
}
