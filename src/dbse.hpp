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

#ifndef _INCLUDE_DBSE_HPP_
#define _INCLUDE_DBSE_HPP_

#include <sqlite3.h>

enum DBSE_ACT {
    DBSE_TBL_CHECK,
    DBSE_CLIP_SELECT,
    DBSE_PRESET_SELECT,
    DBSE_SIGHT_SELECT,
    DBSE_NLOG_SELECT,
    DBSE_COUNT,
    DBSE_END
};

/* Saved PTZ position with its metadata */
struct ctx_saved_preset {
    std::string     id;
    std::string     device_id;
    std::string     name;
    std::string     description;
    std::string     ptz_token;
    int64_t         created_at;
    int64_t         last_used;      /* 0 when never used */
    std::vector<std::string> tags;
};
typedef std::vector<ctx_saved_preset> vec_saved_preset;

struct ctx_sighting {
    std::string     device_id;
    std::string     species;
    double          confidence;
    int64_t         timestamp;
    std::string     clip_id;
};
typedef std::vector<ctx_sighting> vec_sighting;

struct ctx_notify_log {
    std::string     device_id;
    int64_t         timestamp;
    std::string     type;
    std::string     title;
    bool            sent;
};
typedef std::vector<ctx_notify_log> vec_notify_log;

typedef std::vector<ctx_clip> vec_clip;

class cls_dbse {
    public:
        cls_dbse(std::string p_dbname, int p_busy_timeout);
        ~cls_dbse();

        pthread_mutex_t     mutex_dbse;
        bool                finish;

        bool is_ready();
        int exec_sql(std::string sql);
        void sqlite3db_cb(int arg_nb, char **arg_val, char **col_nm);

        int clip_add(const ctx_clip &clip);
        int clip_delete(std::string id);
        int clip_delete_path(std::string fpath);
        void clip_list(std::string device_id, vec_clip &clips);
        int clip_count(std::string device_id);

        int preset_add(const ctx_saved_preset &pset);
        int preset_update(const ctx_saved_preset &pset);
        int preset_delete(std::string id);
        int preset_touch(std::string id, int64_t ts);
        void preset_list(std::string device_id, vec_saved_preset &psets);
        bool preset_get(std::string id, ctx_saved_preset &pset);

        int sighting_add(const ctx_sighting &sight);
        bool species_seen(std::string device_id, std::string species);
        void sighting_list(std::string device_id, int limit, vec_sighting &sights);

        int notify_log_add(const ctx_notify_log &nlog);
        void notify_log_list(std::string device_id, int limit, vec_notify_log &nlogs);

        void clean();

        bool            handler_stop;
        bool            handler_running;
        pthread_t       handler_thread;
        void            handler();
        void            handler_startup();
        void            handler_shutdown();

    private:
        sqlite3             *database_sqlite3db;
        std::string         dbname;
        int                 busy_timeout;
        bool                is_open;
        enum DBSE_ACT       dbse_action;
        std::vector<std::string> tbl_found;
        int64_t             count_val;

        vec_clip            clip_rows;
        vec_saved_preset    preset_rows;
        vec_sighting        sight_rows;
        vec_notify_log      nlog_rows;

        void sqlite3db_init();
        void sqlite3db_close();
        int sqlite3db_exec(std::string sql);
        int sqlite3db_select(std::string sql, enum DBSE_ACT act);
        void sql_create(std::string tbl, std::string &sql);

        void clip_assign(ctx_clip &clip, std::string col_nm, std::string col_val);
        void preset_assign(ctx_saved_preset &pset, std::string col_nm, std::string col_val);
        void sight_assign(ctx_sighting &sight, std::string col_nm, std::string col_val);
        void nlog_assign(ctx_notify_log &nlog, std::string col_nm, std::string col_val);

        bool check_exit();
        void timing();
};

    std::string dbse_quote(std::string parm);

#endif /* _INCLUDE_DBSE_HPP_ */
