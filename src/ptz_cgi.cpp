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
#include "http.hpp"
#include "ptz.hpp"

static const char *cgi_stop_codes[] = {
    "Up", "Down", "Left", "Right", "ZoomTele", "ZoomWide"
};

cls_ptz_cgi::cls_ptz_cgi(cls_http_transport *p_http, std::string p_host, int p_port
    , std::string p_user, std::string p_pass, int p_channel, int p_timeout_ms)
{
    backend = PTZ_BACKEND_CGI;
    http = p_http;
    host = p_host;
    port = p_port;
    user = p_user;
    pass = p_pass;
    channel = p_channel;
    timeout_ms = p_timeout_ms;
    cur_code = "";
    pthread_mutex_init(&mutex_code, nullptr);
}

cls_ptz_cgi::~cls_ptz_cgi()
{
    pthread_mutex_destroy(&mutex_code);
}

std::string cls_ptz_cgi::base_url()
{
    if (host.find(':') != std::string::npos) {
        return "http://[" + host + "]:" + std::to_string(port);
    }
    return "http://" + host + ":" + std::to_string(port);
}

std::string cls_ptz_cgi::current_code()
{
    std::string retcd;
    pthread_mutex_lock(&mutex_code);
        retcd = cur_code;
    pthread_mutex_unlock(&mutex_code);
    return retcd;
}

/* Unauthenticated first, then one retry answering a Digest challenge */
int cls_ptz_cgi::get(std::string path, ctx_http_resp &resp)
{
    ctx_http_req req;
    std::string challenge;
    std::map<std::string, std::string>::iterator it;

    http_req_init(req, "GET", base_url() + path, timeout_ms);
    if (http->request(req, resp) != 0) {
        errmsg = resp.errmsg;
        return -1;
    }
    if (resp.status != 401) {
        return 0;
    }

    it = resp.headers.find("www-authenticate");
    if (it != resp.headers.end()) {
        challenge = it->second;
    }
    if (mytolower(challenge).find("digest") == std::string::npos) {
        resp.err = CG_ERR_AUTH;
        errmsg = "Authentication failed for " + host;
        CAMGATE_LOG(ERR, TYPE_PTZ, NO_ERRNO, "%s", errmsg.c_str());
        return -1;
    }

    http_req_init(req, "GET", base_url() + path, timeout_ms);
    req.headers["Authorization"] = http_digest_header(challenge, user, pass
        , "GET", path, util_random_hex(8));
    if (http->request(req, resp) != 0) {
        errmsg = resp.errmsg;
        return -1;
    }
    if (resp.status == 401) {
        resp.err = CG_ERR_AUTH;
        errmsg = "Digest authentication rejected by " + host;
        CAMGATE_LOG(ERR, TYPE_PTZ, NO_ERRNO, "%s", errmsg.c_str());
        return -1;
    }

    return 0;
}

int cls_ptz_cgi::command(std::string action, std::string code
    , int arg1, int arg2, int arg3, std::string &body)
{
    ctx_http_resp resp;
    std::string path;

    path = "/cgi-bin/ptz.cgi?action=" + action +
        "&channel=" + std::to_string(channel) +
        "&code=" + code +
        "&arg1=" + std::to_string(arg1) +
        "&arg2=" + std::to_string(arg2) +
        "&arg3=" + std::to_string(arg3);

    body = "";
    if (get(path, resp) != 0) {
        return -1;
    }
    body = resp.body;
    if (resp.status != 200) {
        errmsg = "ptz.cgi " + action + " " + code + " returned HTTP " +
            std::to_string(resp.status);
        CAMGATE_LOG(WRN, TYPE_PTZ, NO_ERRNO, "%s", errmsg.c_str());
        return -1;
    }
    CAMGATE_LOG(DBG, TYPE_PTZ, NO_ERRNO, "%s %s %d/%d/%d"
        , action.c_str(), code.c_str(), arg1, arg2, arg3);

    return 0;
}

/* A stop of a harmless code tells us whether ptz.cgi is answered at all */
ctx_ptz_caps cls_ptz_cgi::probe_capabilities()
{
    ctx_ptz_caps pc;
    std::string body;
    bool ok;

    ok = (command("stop", "Up", 0, 0, 0, body) == 0) &&
        (body.find("OK") != std::string::npos);

    /* Preset support varies by model and is not inferred from the probe */
    pc.supported = ok;
    pc.continuous = ok;
    pc.presets = false;
    pc.home = false;
    pc.absolute = false;
    pc.relative = false;

    if (ok == false) {
        CAMGATE_LOG(NTC, TYPE_PTZ, NO_ERRNO
            , _("Camera %s does not answer ptz.cgi"), host.c_str());
    }
    return pc;
}

bool cls_ptz_cgi::continuous_move(double pan, double tilt, double zoom)
{
    std::string code, prev, body;
    int spd;

    cancel_stop();

    code = ptz_cgi_direction(pan, tilt, zoom);
    if (code == "") {
        return true;
    }
    spd = ptz_cgi_speed(pan, tilt, zoom);

    prev = current_code();
    if (prev != "") {
        if (command("stop", prev, 0, 0, 0, body) != 0) {
            CAMGATE_LOG(WRN, TYPE_PTZ, NO_ERRNO
                , _("Could not stop %s before moving"), prev.c_str());
        }
    }

    /* A failed start may still have moved the camera */
    pthread_mutex_lock(&mutex_code);
        cur_code = "";
    pthread_mutex_unlock(&mutex_code);

    if (command("start", code, 0, spd, 0, body) != 0) {
        return false;
    }

    pthread_mutex_lock(&mutex_code);
        cur_code = code;
    pthread_mutex_unlock(&mutex_code);

    return true;
}

bool cls_ptz_cgi::stop()
{
    std::string code, body;
    size_t indx;
    int okcnt;

    cancel_stop();

    pthread_mutex_lock(&mutex_code);
        code = cur_code;
        cur_code = "";
    pthread_mutex_unlock(&mutex_code);

    if (code != "") {
        return (command("stop", code, 0, 0, 0, body) == 0);
    }

    okcnt = 0;
    for (indx = 0; indx < sizeof(cgi_stop_codes)/sizeof(cgi_stop_codes[0]); indx++) {
        if (command("stop", cgi_stop_codes[indx], 0, 0, 0, body) == 0) {
            okcnt++;
        }
    }
    return (okcnt > 0);
}

bool cls_ptz_cgi::absolute_move(double pan, double tilt, double zoom)
{
    (void)pan;
    (void)tilt;
    (void)zoom;
    errmsg = "Absolute move is not available through ptz.cgi";
    CAMGATE_LOG(NTC, TYPE_PTZ, NO_ERRNO, "%s", errmsg.c_str());
    return false;
}

/* Uncalibrated: move for a time proportional to the magnitude */
bool cls_ptz_cgi::relative_move(double pan, double tilt, double zoom)
{
    double mag;
    int64_t dur;

    mag = std::max(fabs(pan), std::max(fabs(tilt), fabs(zoom)));
    if (continuous_move(pan, tilt, zoom) == false) {
        return false;
    }
    dur = std::max((int64_t)(mag * 500), (int64_t)100);
    schedule_stop(dur);

    return true;
}

bool cls_ptz_cgi::get_position(ctx_ptz_pos &pos)
{
    ctx_http_resp resp;
    std::smatch mtch;
    std::regex rx_pan("Postion\\[0\\]=([-0-9.]+)");
    std::regex rx_tilt("Postion\\[1\\]=([-0-9.]+)");
    std::regex rx_zoom("Postion\\[2\\]=([-0-9.]+)");

    if (get("/cgi-bin/ptz.cgi?action=getStatus&channel=" +
            std::to_string(channel), resp) != 0) {
        return false;
    }
    if (resp.status != 200) {
        errmsg = "getStatus returned HTTP " + std::to_string(resp.status);
        return false;
    }

    if (std::regex_search(resp.body, mtch, rx_pan) == false) {
        errmsg = "getStatus reply has no position";
        CAMGATE_LOG(WRN, TYPE_PTZ, NO_ERRNO, "%s", errmsg.c_str());
        return false;
    }
    pos.pan = atof(mtch[1].str().c_str()) / 180.0;

    pos.tilt = 0;
    if (std::regex_search(resp.body, mtch, rx_tilt)) {
        pos.tilt = atof(mtch[1].str().c_str()) / 90.0;
    }
    pos.zoom = 0;
    if (std::regex_search(resp.body, mtch, rx_zoom)) {
        pos.zoom = atof(mtch[1].str().c_str());
    }

    return true;
}

/* Slots are numbered and the camera does not list them */
bool cls_ptz_cgi::get_presets(vec_ptz_preset &presets)
{
    ctx_ptz_preset pp;
    int indx;

    presets.clear();
    for (indx = 1; indx <= PTZ_CGI_PRESET_MAX; indx++) {
        pp.token = std::to_string(indx);
        pp.name = "Preset " + pp.token;
        presets.push_back(pp);
    }
    return true;
}

bool cls_ptz_cgi::goto_preset(std::string token)
{
    std::string body;
    int slot;

    slot = mtoi(token);
    if (slot < 1) {
        errmsg = "Invalid preset slot " + token;
        return false;
    }
    return (command("start", "GotoPreset", 0, slot, 0, body) == 0);
}

std::string cls_ptz_cgi::set_preset(std::string name)
{
    std::string body;
    int slot;

    slot = mtoi(name);
    if (slot < 1) {
        slot = 1;
    }
    if (command("start", "SetPreset", 0, slot, 0, body) != 0) {
        return "";
    }
    CAMGATE_LOG(INF, TYPE_PTZ, NO_ERRNO, _("Saved preset slot %d"), slot);
    return std::to_string(slot);
}

bool cls_ptz_cgi::remove_preset(std::string token)
{
    std::string body;
    int slot;

    slot = mtoi(token);
    if (slot < 1) {
        errmsg = "Invalid preset slot " + token;
        return false;
    }
    return (command("start", "ClearPreset", 0, slot, 0, body) == 0);
}

bool cls_ptz_cgi::go_home()
{
    return goto_preset("1");
}

bool cls_ptz_cgi::set_home()
{
    return (set_preset("1") != "");
}
