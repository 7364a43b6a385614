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
#include "evtbus.hpp"
#include "dbse.hpp"
#include "http.hpp"
#include "ptz.hpp"
#include "preset.hpp"

/* Only daily schedules: fixed minute and hour, wildcards elsewhere */
bool preset_cron_parse(std::string cron, int &minute, int &hour)
{
    std::vector<std::string> toks;
    char *endp;
    long mn, hr;

    util_split_ws(cron, toks);
    if (toks.size() != 5) {
        return false;
    }
    if ((toks[2] != "*") || (toks[3] != "*") || (toks[4] != "*")) {
        return false;
    }

    mn = strtol(toks[0].c_str(), &endp, 10);
    if ((*endp != '\0') || (mn < 0) || (mn > 59)) {
        return false;
    }
    hr = strtol(toks[1].c_str(), &endp, 10);
    if ((*endp != '\0') || (hr < 0) || (hr > 23)) {
        return false;
    }

    minute = (int)mn;
    hour = (int)hr;
    return true;
}

cls_preset::cls_preset(cls_dbse *p_dbse, std::string p_device_id)
{
    dbse = p_dbse;
    device_id = p_device_id;
    ptz = nullptr;

    patrol.enabled = false;
    patrol.dwell_sec = 30;
    patrol.loop = true;
    patrol_indx = 0;
    patrol_next = 0;
    sched_last_min = -1;
}

cls_preset::~cls_preset()
{

}

void cls_preset::set_ptz(cls_ptz *p_ptz)
{
    ptz = p_ptz;
}

int cls_preset::create(std::string name, std::string description
    , std::vector<std::string> tags, ctx_saved_preset &pset)
{
    std::string token;

    if (ptz == nullptr) {
        CAMGATE_LOG(ERR, TYPE_PTZ, NO_ERRNO, _("No PTZ controller available"));
        return -1;
    }
    if ((dbse == nullptr) || (dbse->is_ready() == false)) {
        CAMGATE_LOG(ERR, TYPE_PTZ, NO_ERRNO, _("Database is not open"));
        return -1;
    }

    token = ptz->set_preset(name);
    if (token == "") {
        CAMGATE_LOG(ERR, TYPE_PTZ, NO_ERRNO
            , _("Failed to save preset %s on camera"), name.c_str());
        return -1;
    }

    pset.created_at = util_now_ms();
    pset.id = "preset_" + std::to_string(pset.created_at);
    pset.device_id = device_id;
    pset.name = name;
    pset.description = description;
    pset.ptz_token = token;
    pset.last_used = 0;
    pset.tags = tags;

    if (dbse->preset_add(pset) != 0) {
        return -1;
    }

    CAMGATE_LOG(NTC, TYPE_PTZ, NO_ERRNO, _("Created preset: %s -> %s")
        , name.c_str(), token.c_str());

    return 0;
}

int cls_preset::update(std::string id, std::string name, std::string description
    , std::vector<std::string> tags)
{
    ctx_saved_preset pset;

    if (get(id, pset) == false) {
        CAMGATE_LOG(ERR, TYPE_PTZ, NO_ERRNO, _("Preset not found: %s"), id.c_str());
        return -1;
    }
    if (name != "") {
        pset.name = name;
    }
    pset.description = description;
    pset.tags = tags;

    return dbse->preset_update(pset);
}

int cls_preset::remove(std::string id)
{
    ctx_saved_preset pset;
    std::vector<std::string>::iterator it;
    size_t indx;

    if (get(id, pset) == false) {
        return -1;
    }
    if (dbse->preset_delete(id) != 0) {
        return -1;
    }

    it = std::find(patrol.preset_ids.begin(), patrol.preset_ids.end(), id);
    if (it != patrol.preset_ids.end()) {
        patrol.preset_ids.erase(it);
        if (patrol.preset_ids.size() == 0) {
            patrol_stop();
        } else if (patrol_indx >= patrol.preset_ids.size()) {
            patrol_indx = 0;
        }
    }

    indx = 0;
    while (indx < sched.size()) {
        if (sched[indx].preset_id == id) {
            sched.erase(sched.begin() + (long)indx);
        } else {
            indx++;
        }
    }

    CAMGATE_LOG(NTC, TYPE_PTZ, NO_ERRNO, _("Deleted preset: %s"), id.c_str());
    return 0;
}

int cls_preset::go(std::string id)
{
    ctx_saved_preset pset;

    if (ptz == nullptr) {
        CAMGATE_LOG(ERR, TYPE_PTZ, NO_ERRNO, _("No PTZ controller available"));
        return -1;
    }
    if (get(id, pset) == false) {
        CAMGATE_LOG(ERR, TYPE_PTZ, NO_ERRNO, _("Preset not found: %s"), id.c_str());
        return -1;
    }
    if (ptz->goto_preset(pset.ptz_token) == false) {
        return -1;
    }
    dbse->preset_touch(id, util_now_ms());

    return 0;
}

void cls_preset::list(vec_saved_preset &psets)
{
    psets.clear();
    if (dbse != nullptr) {
        dbse->preset_list(device_id, psets);
    }
}

bool cls_preset::get(std::string id, ctx_saved_preset &pset)
{
    if (dbse == nullptr) {
        return false;
    }
    if (dbse->preset_get(id, pset) == false) {
        return false;
    }
    return (pset.device_id == device_id);
}

int cls_preset::patrol_start(std::vector<std::string> ids, int dwell_sec, bool loop)
{
    if (ptz == nullptr) {
        CAMGATE_LOG(ERR, TYPE_PTZ, NO_ERRNO, _("No PTZ controller available"));
        return -1;
    }
    if (ids.size() == 0) {
        CAMGATE_LOG(ERR, TYPE_PTZ, NO_ERRNO, _("No presets configured for patrol"));
        return -1;
    }

    patrol.preset_ids = ids;
    patrol.dwell_sec = (dwell_sec > 0) ? dwell_sec : 30;
    patrol.loop = loop;
    patrol.enabled = true;
    patrol_indx = 0;
    patrol_next = 0;

    CAMGATE_LOG(NTC, TYPE_PTZ, NO_ERRNO
        , _("Starting patrol with %d presets"), (int)ids.size());

    return 0;
}

void cls_preset::patrol_stop()
{
    if (patrol.enabled) {
        CAMGATE_LOG(NTC, TYPE_PTZ, NO_ERRNO, _("Patrol stopped"));
    }
    patrol.enabled = false;
    patrol_next = 0;
}

bool cls_preset::patrol_active()
{
    return patrol.enabled;
}

ctx_patrol cls_preset::patrol_config()
{
    return patrol;
}

void cls_preset::patrol_step(int64_t now_mono)
{
    std::string id;

    id = patrol.preset_ids[patrol_indx];
    CAMGATE_LOG(INF, TYPE_PTZ, NO_ERRNO, _("Patrol step %d/%d: %s")
        , (int)patrol_indx + 1, (int)patrol.preset_ids.size(), id.c_str());

    if (go(id) != 0) {
        CAMGATE_LOG(WRN, TYPE_PTZ, NO_ERRNO
            , _("Patrol could not reach preset %s"), id.c_str());
    }

    patrol_indx++;
    if (patrol_indx >= patrol.preset_ids.size()) {
        if (patrol.loop) {
            patrol_indx = 0;
        } else {
            patrol_stop();
            return;
        }
    }
    patrol_next = now_mono + (int64_t)patrol.dwell_sec * 1000;
}

int cls_preset::schedule_add(std::string preset_id, std::string cron
    , ctx_sched_preset &item)
{
    ctx_saved_preset pset;

    if (get(preset_id, pset) == false) {
        CAMGATE_LOG(ERR, TYPE_PTZ, NO_ERRNO
            , _("Preset not found: %s"), preset_id.c_str());
        return -1;
    }
    if (preset_cron_parse(cron, item.minute, item.hour) == false) {
        CAMGATE_LOG(ERR, TYPE_PTZ, NO_ERRNO
            , _("Unsupported schedule \"%s\", expected \"M H * * *\""), cron.c_str());
        return -1;
    }
    item.id = "schedule_" + std::to_string(util_now_ms());
    item.preset_id = preset_id;
    item.cron = cron;
    sched.push_back(item);

    CAMGATE_LOG(NTC, TYPE_PTZ, NO_ERRNO, _("Scheduled %s daily at %02d:%02d")
        , pset.name.c_str(), item.hour, item.minute);

    return 0;
}

int cls_preset::schedule_remove(std::string id)
{
    size_t indx;

    for (indx = 0; indx < sched.size(); indx++) {
        if (sched[indx].id == id) {
            sched.erase(sched.begin() + (long)indx);
            return 0;
        }
    }
    return -1;
}

vec_sched_preset cls_preset::schedules()
{
    return sched;
}

/* Each schedule fires once in the minute it matches */
void cls_preset::schedule_check(int64_t now_ms)
{
    time_t tm_now;
    struct tm lcl_tm;
    int64_t cur_min;
    size_t indx;

    cur_min = now_ms / 60000;
    if (cur_min == sched_last_min) {
        return;
    }
    sched_last_min = cur_min;

    tm_now = (time_t)(now_ms / 1000);
    localtime_r(&tm_now, &lcl_tm);

    for (indx = 0; indx < sched.size(); indx++) {
        if ((sched[indx].hour == lcl_tm.tm_hour) &&
            (sched[indx].minute == lcl_tm.tm_min)) {
            CAMGATE_LOG(NTC, TYPE_PTZ, NO_ERRNO
                , _("Executing scheduled preset %s"), sched[indx].preset_id.c_str());
            if (go(sched[indx].preset_id) != 0) {
                CAMGATE_LOG(WRN, TYPE_PTZ, NO_ERRNO
                    , _("Scheduled preset %s failed"), sched[indx].preset_id.c_str());
            }
        }
    }
}

void cls_preset::poll(int64_t now_mono, int64_t now_ms)
{
    if (patrol.enabled && (now_mono >= patrol_next)) {
        patrol_step(now_mono);
    }
    if (sched.size() > 0) {
        schedule_check(now_ms);
    }
}
