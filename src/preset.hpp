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

#ifndef _INCLUDE_PRESET_HPP_
#define _INCLUDE_PRESET_HPP_

struct ctx_patrol {
    bool            enabled;
    std::vector<std::string> preset_ids;
    int             dwell_sec;
    bool            loop;
};

/* Daily move in "M H * * *" form */
struct ctx_sched_preset {
    std::string     id;
    std::string     preset_id;
    std::string     cron;
    int             minute;
    int             hour;
};
typedef std::vector<ctx_sched_preset> vec_sched_preset;

class cls_preset {
    public:
        cls_preset(cls_dbse *p_dbse, std::string p_device_id);
        ~cls_preset();

        void set_ptz(cls_ptz *p_ptz);

        int create(std::string name, std::string description
            , std::vector<std::string> tags, ctx_saved_preset &pset);
        int update(std::string id, std::string name, std::string description
            , std::vector<std::string> tags);
        int remove(std::string id);
        int go(std::string id);
        void list(vec_saved_preset &psets);
        bool get(std::string id, ctx_saved_preset &pset);

        int patrol_start(std::vector<std::string> ids, int dwell_sec, bool loop);
        void patrol_stop();
        bool patrol_active();
        ctx_patrol patrol_config();

        int schedule_add(std::string preset_id, std::string cron, ctx_sched_preset &sched);
        int schedule_remove(std::string id);
        vec_sched_preset schedules();

        void poll(int64_t now_mono, int64_t now_ms);

    private:
        cls_dbse            *dbse;
        cls_ptz             *ptz;
        std::string         device_id;

        ctx_patrol          patrol;
        size_t              patrol_indx;
        int64_t             patrol_next;
        vec_sched_preset    sched;
        int64_t             sched_last_min;

        void patrol_step(int64_t now_mono);
        void schedule_check(int64_t now_ms);
};

    bool preset_cron_parse(std::string cron, int &minute, int &hour);

#endif /* _INCLUDE_PRESET_HPP_ */
