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
#include "process.hpp"
#include "tunnel.hpp"

const char *tunnel_state_str(enum TUNNEL_STATE st)
{
    switch (st) {
    case TUNNEL_DISABLED:       return "disabled";
    case TUNNEL_STARTING:       return "starting";
    case TUNNEL_ESTABLISHED:    return "established";
    case TUNNEL_FAILED:         return "failed";
    }
    return "unknown";
}

cls_tunnel::cls_tunnel(cls_config *p_cfg)
{
    cfg = p_cfg;
    quick = cfg->tunnel_quick;
    state = TUNNEL_DISABLED;
    err = CG_ERR_NONE;
    url = "";
    ready_deadline = 0;
    restart_seen = 0;

    proc = new cls_process("cloudflared", TYPE_TUNNEL);
    proc->restart_delay = 5000;
    proc->on_line = [this](const std::string &line) {
        on_line(line);
    };
    proc->on_exit = [this](int code) {
        CAMGATE_LOG(WRN, TYPE_TUNNEL, NO_ERRNO
            , _("Tunnel process exited with code %d"), code);
        url = "";
        if (state != TUNNEL_DISABLED) {
            state = TUNNEL_FAILED;
            err = CG_ERR_TUNNEL;
        }
    };
}

cls_tunnel::~cls_tunnel()
{
    stop();
    mydelete(proc);
}

std::string cls_tunnel::local_url()
{
    return "http://localhost:" + std::to_string(cfg->webcontrol_port);
}

std::string cls_tunnel::public_url()
{
    if (state == TUNNEL_ESTABLISHED) {
        return url;
    }
    return "";
}

/* Public address when there is one, else the local fallback */
std::string cls_tunnel::url_any()
{
    if (public_url() != "") {
        return url;
    }
    return local_url();
}

void cls_tunnel::build_args(std::vector<std::string> &args)
{
    args.clear();
    args.push_back(cfg->tunnel_path);
    args.push_back("tunnel");
    args.push_back("--no-autoupdate");
    if (quick) {
        args.push_back("--url");
        args.push_back(local_url());
    } else {
        args.push_back("run");
        args.push_back("--token");
        args.push_back(cfg->tunnel_token);
    }
}

int cls_tunnel::start()
{
    if (cfg->tunnel_enabled == false) {
        CAMGATE_LOG(INF, TYPE_TUNNEL, NO_ERRNO, _("Tunnel disabled"));
        state = TUNNEL_DISABLED;
        return 0;
    }
    if ((quick == false) && (cfg->tunnel_token == "")) {
        CAMGATE_LOG(ERR, TYPE_TUNNEL, NO_ERRNO
            , _("Tunnel token not configured, using %s"), local_url().c_str());
        state = TUNNEL_FAILED;
        err = CG_ERR_TUNNEL;
        return -1;
    }

    CAMGATE_LOG(NTC, TYPE_TUNNEL, NO_ERRNO, _("Starting %s tunnel")
        , quick ? "quick" : "named");

    build_args(proc->args);
    url = "";
    err = CG_ERR_NONE;
    state = TUNNEL_STARTING;
    ready_deadline = util_mono_ms() + TUNNEL_READY_WAIT;
    if (proc->start() != 0) {
        CAMGATE_LOG(ERR, TYPE_TUNNEL, NO_ERRNO
            , _("Could not start %s, using %s")
            , cfg->tunnel_path.c_str(), local_url().c_str());
        state = TUNNEL_FAILED;
        err = CG_ERR_TUNNEL;
        return -1;
    }
    return 0;
}

void cls_tunnel::stop()
{
    if (proc->running()) {
        CAMGATE_LOG(NTC, TYPE_TUNNEL, NO_ERRNO, _("Stopping tunnel"));
        proc->stop(SIGTERM, 5000);
    } else {
        proc->stop(SIGTERM, 0);
    }
    url = "";
    if (state != TUNNEL_DISABLED) {
        state = TUNNEL_DISABLED;
    }
}

void cls_tunnel::established(std::string p_url)
{
    url = p_url;
    state = TUNNEL_ESTABLISHED;
    err = CG_ERR_NONE;
    if (url != "") {
        CAMGATE_LOG(NTC, TYPE_TUNNEL, NO_ERRNO, _("Tunnel established: %s"), url.c_str());
    } else {
        CAMGATE_LOG(NTC, TYPE_TUNNEL, NO_ERRNO
            , _("Tunnel established without a public hostname"));
    }
}

void cls_tunnel::on_line(const std::string &line)
{
    std::smatch mtch;
    static const std::regex rx_quick("https://[a-z0-9-]+\\.trycloudflare\\.com");

    if (line.find("ERR") != std::string::npos) {
        CAMGATE_LOG(WRN, TYPE_TUNNEL, NO_ERRNO, "cloudflared: %s", line.c_str());
    } else {
        CAMGATE_LOG(DBG, TYPE_TUNNEL, NO_ERRNO, "cloudflared: %s", line.c_str());
    }

    if (state != TUNNEL_STARTING) {
        return;
    }

    if (quick) {
        if (std::regex_search(line, mtch, rx_quick)) {
            established(mtch[0].str());
        }
    } else if ((line.find("Registered tunnel connection") != std::string::npos) ||
               (line.find("Connection registered") != std::string::npos)) {
        if (cfg->tunnel_hostname != "") {
            established("https://" + cfg->tunnel_hostname);
        } else {
            established("");
        }
    }
}

void cls_tunnel::poll(int64_t now_mono)
{
    if (state == TUNNEL_DISABLED) {
        return;
    }

    proc->poll(now_mono);

    if ((state == TUNNEL_FAILED) && proc->running() &&
        (proc->restart_cnt != restart_seen)) {
        restart_seen = proc->restart_cnt;
        state = TUNNEL_STARTING;
        ready_deadline = now_mono + TUNNEL_READY_WAIT;
    }

    if ((state == TUNNEL_STARTING) && (now_mono >= ready_deadline)) {
        if ((quick == false) && (cfg->tunnel_hostname != "")) {
            CAMGATE_LOG(NTC, TYPE_TUNNEL, NO_ERRNO
                , _("Using configured hostname"));
            established("https://" + cfg->tunnel_hostname);
        } else {
            CAMGATE_LOG(ERR, TYPE_TUNNEL, NO_ERRNO
                , _("Tunnel did not establish in time, using %s")
                , local_url().c_str());
            state = TUNNEL_FAILED;
            err = CG_ERR_TUNNEL;
        }
    }
}

std::string cls_tunnel::json()
{
    std::string resp;

    resp  = "{";
    resp += "\"state\":\"" + std::string(tunnel_state_str(state)) + "\"";
    resp += ",\"mode\":\"" + std::string(quick ? "quick" : "named") + "\"";
    if (public_url() != "") {
        resp += ",\"publicUrl\":\"" + util_json_escape(url) + "\"";
    } else {
        resp += ",\"publicUrl\":null";
    }
    resp += ",\"localUrl\":\"" + util_json_escape(local_url()) + "\"";
    resp += "}";

    return resp;
}
