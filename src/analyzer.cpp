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
#include "analyzer.hpp"

/* scdet prints "lavfi.scd.mafd=X lavfi.scd.score=Y lavfi.scd.time=Z" */
bool analyzer_parse_score(const std::string &line, double &score)
{
    std::smatch mtch;
    static const std::regex rx_score("lavfi\\.scd\\.score=\\s*([0-9]+\\.?[0-9]*)");

    if (line.find("scd.score") == std::string::npos) {
        return false;
    }
    if (std::regex_search(line, mtch, rx_score) == false) {
        return false;
    }
    score = atof(mtch[1].str().c_str());
    return true;
}

/* Higher sensitivity lowers the scene threshold, 0.5 down to 0.05 */
double cls_analyzer::threshold()
{
    double sens;

    sens = (double)MIN(MAX(sensitivity, 0), 100) / 100.0;
    return MAX(0.05, 0.5 - (sens * 0.45));
}

void cls_analyzer::on_line(const std::string &line)
{
    double score;

    if (analyzer_parse_score(line, score)) {
        on_score(score, util_now_ms());
    }
}

void cls_analyzer::on_score(double score, int64_t now_ms)
{
    ctx_motion_evt evt;

    last_score = score;
    if (score < ANALYZER_MIN_SCORE) {
        return;
    }
    if (in_motion == false) {
        in_motion = true;
        emitted = false;
        motion_start = now_ms;
    }
    last_activity = now_ms;

    if ((min_duration > 0) && ((now_ms - motion_start) < min_duration)) {
        return;
    }
    if ((events > 0) && ((now_ms - last_event) < cooldown)) {
        return;
    }

    last_event = now_ms;
    emitted = true;
    events++;

    evt.active = true;
    evt.timestamp = now_ms;
    evt.score = score;
    evt.confidence = MIN(score * 100.0, 100.0);
    CAMGATE_LOG(INF, TYPE_EVENTS, NO_ERRNO
        , _("Motion detected, confidence %.1f%%"), evt.confidence);
    bus_motion->publish(evt);
}

/* A motion period ends after cooldown ms without activity */
void cls_analyzer::check_end(int64_t now_ms)
{
    ctx_motion_evt evt;

    if ((in_motion == false) || ((now_ms - last_activity) < cooldown)) {
        return;
    }
    in_motion = false;
    if (emitted == false) {
        return;
    }
    emitted = false;
    evt.active = false;
    evt.timestamp = now_ms;
    evt.score = 0;
    evt.confidence = 0;
    CAMGATE_LOG(DBG, TYPE_EVENTS, NO_ERRNO, _("Motion ended"));
    bus_motion->publish(evt);
}

int cls_analyzer::start()
{
    char thr[32];

    if (running()) {
        return 0;
    }
    if (source_url == "") {
        CAMGATE_LOG(ERR, TYPE_EVENTS, NO_ERRNO, _("No source for motion detection"));
        return -1;
    }
    snprintf(thr, sizeof(thr), "%.3f", threshold());

    proc->args.clear();
    proc->args.push_back(cfg->ffmpeg_path);
    proc->args.push_back("-hide_banner");
    proc->args.push_back("-nostats");
    proc->args.push_back("-rtsp_transport");
    proc->args.push_back("tcp");
    proc->args.push_back("-i");
    proc->args.push_back(source_url);
    proc->args.push_back("-an");
    proc->args.push_back("-vf");
    proc->args.push_back("scdet=t=" + std::string(thr) + ":s=1");
    proc->args.push_back("-fps_mode");
    proc->args.push_back("vfr");
    proc->args.push_back("-f");
    proc->args.push_back("null");
    proc->args.push_back("-");

    in_motion = false;
    emitted = false;
    if (proc->start() != 0) {
        return -1;
    }
    CAMGATE_LOG(NTC, TYPE_EVENTS, NO_ERRNO
        , _("Motion detection started, sensitivity %d threshold %s")
        , sensitivity, thr);
    return 0;
}

void cls_analyzer::stop()
{
    if (proc->finished()) {
        return;
    }
    proc->stop(SIGTERM, 3000);
    CAMGATE_LOG(NTC, TYPE_EVENTS, NO_ERRNO, _("Motion detection stopped"));
}

bool cls_analyzer::running()
{
    return (proc->finished() == false);
}

void cls_analyzer::poll(int64_t now_mono)
{
    proc->poll(now_mono);
    check_end(util_now_ms());
}

std::string cls_analyzer::json()
{
    std::string resp;
    char buf[64];

    resp = "{";
    resp += "\"running\":" + std::string(running() ? "true" : "false");
    resp += ",\"sensitivity\":" + std::to_string(sensitivity);
    snprintf(buf, sizeof(buf), "%.3f", threshold());
    resp += ",\"threshold\":" + std::string(buf);
    resp += ",\"inMotion\":" + std::string(in_motion ? "true" : "false");
    snprintf(buf, sizeof(buf), "%.3f", last_score);
    resp += ",\"lastScore\":" + std::string(buf);
    resp += ",\"events\":" + std::to_string(events);
    if (events > 0) {
        resp += ",\"lastMotionAt\":\"" + util_iso_time(last_event) + "\"";
    }
    resp += "}";
    return resp;
}

cls_analyzer::cls_analyzer(cls_config *p_cfg, cls_evtbus<ctx_motion_evt> *p_bus_motion)
{
    cfg = p_cfg;
    bus_motion = p_bus_motion;
    source_url = cfg->rtsp_url;
    sensitivity = cfg->motion_sensitivity;
    min_duration = cfg->motion_min_duration;
    cooldown = cfg->motion_cooldown;
    in_motion = false;
    emitted = false;
    motion_start = 0;
    last_activity = 0;
    last_event = 0;
    last_score = 0;
    events = 0;

    proc = new cls_process("motion", TYPE_EVENTS);
    proc->restart_delay = ANALYZER_RESTART_DELAY;
    proc->on_line = [this](const std::string &line) {
        on_line(line);
    };
}

cls_analyzer::~cls_analyzer()
{
    stop();
    delete proc;
}
