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

cls_ptz::cls_ptz()
{
    backend = PTZ_BACKEND_ONVIF;
    errmsg = "";
    caps_done = false;
    caps.supported = false;
    caps.absolute = false;
    caps.relative = false;
    caps.continuous = false;
    caps.presets = false;
    caps.home = false;
    stop_at = 0;
    pthread_mutex_init(&mutex_caps, nullptr);
    pthread_mutex_init(&mutex_stop, nullptr);
}

cls_ptz::~cls_ptz()
{
    pthread_mutex_destroy(&mutex_caps);
    pthread_mutex_destroy(&mutex_stop);
}

/*
 * The probe runs at most once.  The lock is held across the probe so
 * callers arriving while it is in flight wait for and share its answer.
 */
ctx_ptz_caps cls_ptz::get_capabilities()
{
    ctx_ptz_caps retcd;

    pthread_mutex_lock(&mutex_caps);
        if (caps_done == false) {
            caps = probe_capabilities();
            caps_done = true;
            CAMGATE_LOG(INF, TYPE_PTZ, NO_ERRNO
                , _("%s capabilities: supported=%d continuous=%d absolute=%d"
                    " relative=%d presets=%d home=%d")
                , ptz_backend_str(backend)
                , caps.supported, caps.continuous, caps.absolute
                , caps.relative, caps.presets, caps.home);
        }
        retcd = caps;
    pthread_mutex_unlock(&mutex_caps);

    return retcd;
}

bool cls_ptz::caps_cached()
{
    bool retcd;
    pthread_mutex_lock(&mutex_caps);
        retcd = caps_done;
    pthread_mutex_unlock(&mutex_caps);
    return retcd;
}

bool cls_ptz::pan_left(double speed)
{
    return continuous_move(-speed, 0, 0);
}

bool cls_ptz::pan_right(double speed)
{
    return continuous_move(speed, 0, 0);
}

bool cls_ptz::tilt_up(double speed)
{
    return continuous_move(0, speed, 0);
}

bool cls_ptz::tilt_down(double speed)
{
    return continuous_move(0, -speed, 0);
}

bool cls_ptz::zoom_in(double speed)
{
    return continuous_move(0, 0, speed);
}

bool cls_ptz::zoom_out(double speed)
{
    return continuous_move(0, 0, -speed);
}

void cls_ptz::schedule_stop(int64_t delay_ms)
{
    pthread_mutex_lock(&mutex_stop);
        stop_at = util_mono_ms() + delay_ms;
    pthread_mutex_unlock(&mutex_stop);
}

void cls_ptz::cancel_stop()
{
    pthread_mutex_lock(&mutex_stop);
        stop_at = 0;
    pthread_mutex_unlock(&mutex_stop);
}

int64_t cls_ptz::stop_pending()
{
    int64_t retcd;
    pthread_mutex_lock(&mutex_stop);
        retcd = stop_at;
    pthread_mutex_unlock(&mutex_stop);
    return retcd;
}

/* Called from the gateway loop to fire a stop scheduled by relative_move */
void cls_ptz::poll(int64_t now_mono)
{
    bool due;

    pthread_mutex_lock(&mutex_stop);
        due = ((stop_at != 0) && (now_mono >= stop_at));
        if (due) {
            stop_at = 0;
        }
    pthread_mutex_unlock(&mutex_stop);

    if (due) {
        if (stop() == false) {
            CAMGATE_LOG(WRN, TYPE_PTZ, NO_ERRNO
                , _("Scheduled stop failed: %s"), errmsg.c_str());
        }
    }
}

const char *ptz_backend_str(enum PTZ_BACKEND backend)
{
    if (backend == PTZ_BACKEND_CGI) {
        return "cgi";
    }
    return "onvif";
}

/* Cameras known to answer the Dahua style ptz.cgi */
bool ptz_vendor_match(std::string manufacturer, std::string model)
{
    std::string mfr, mdl;

    mfr = mytolower(manufacturer);
    mdl = mytolower(model);

    if ((mfr.find("amcrest") != std::string::npos) ||
        (mfr.find("dahua") != std::string::npos) ||
        (mdl.find("amcrest") != std::string::npos) ||
        (mdl.find("dahua") != std::string::npos)) {
        return true;
    }
    if ((mdl.find("ip2m") != std::string::npos) ||
        (mdl.find("ip4m") != std::string::npos) ||
        (mdl.find("ip5m") != std::string::npos) ||
        (mdl.find("ip8m") != std::string::npos)) {
        return true;
    }
    return false;
}

enum PTZ_BACKEND ptz_backend_select(std::string mode
    , std::string manufacturer, std::string model)
{
    if (mode == "cgi") {
        return PTZ_BACKEND_CGI;
    } else if (mode == "onvif") {
        return PTZ_BACKEND_ONVIF;
    }
    if (ptz_vendor_match(manufacturer, model)) {
        return PTZ_BACKEND_CGI;
    }
    return PTZ_BACKEND_ONVIF;
}

/* Diagonals first, then single axes.  Zoom only without pan or tilt. */
std::string ptz_cgi_direction(double pan, double tilt, double zoom)
{
    if ((pan < 0) && (tilt > 0)) {
        return "LeftUp";
    } else if ((pan > 0) && (tilt > 0)) {
        return "RightUp";
    } else if ((pan < 0) && (tilt < 0)) {
        return "LeftDown";
    } else if ((pan > 0) && (tilt < 0)) {
        return "RightDown";
    } else if (pan < 0) {
        return "Left";
    } else if (pan > 0) {
        return "Right";
    } else if (tilt > 0) {
        return "Up";
    } else if (tilt < 0) {
        return "Down";
    } else if (zoom > 0) {
        return "ZoomTele";
    } else if (zoom < 0) {
        return "ZoomWide";
    }
    return "";
}

int ptz_cgi_speed(double pan, double tilt, double zoom)
{
    double mag;
    int spd;

    mag = std::max(fabs(pan), std::max(fabs(tilt), fabs(zoom)));
    spd = (int)lround(mag * PTZ_CGI_SPEED_MAX);
    if (spd > PTZ_CGI_SPEED_MAX) {
        spd = PTZ_CGI_SPEED_MAX;
    }
    if (spd < 1) {
        spd = 1;
    }
    return spd;
}
