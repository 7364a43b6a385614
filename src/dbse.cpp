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

static const char *dbse_tables[] = {
    "clips", "presets", "sightings", "notify_log"
};

/* SQL literal with the quotes doubled, NULL for nothing */
std::string dbse_quote(std::string parm)
{
    char *qt;
    std::string retcd;

    qt = sqlite3_mprintf("%Q", parm.c_str());
    if (qt == nullptr) {
        return "NULL";
    }
    retcd = qt;
    sqlite3_free(qt);
    return retcd;
}

static std::string dbse_tags_join(const std::vector<std::string> &tags)
{
    std::string retcd;
    size_t indx;

    for (indx = 0; indx < tags.size(); indx++) {
        if (indx > 0) {
            retcd += ",";
        }
        retcd += tags[indx];
    }
    return retcd;
}

static void dbse_tags_split(std::string parm, std::vector<std::string> &tags)
{
    std::string tkn;

    tags.clear();
    while (parm != "") {
        tkn = mtok(parm, ",");
        mytrim(tkn);
        if (tkn != "") {
            tags.push_back(tkn);
        }
    }
}

static int dbse_sqlite3db_cb(void *ptr, int arg_nb, char **arg_val, char **col_nm)
{
    cls_dbse *dbse = (cls_dbse*)ptr;
    dbse->sqlite3db_cb(arg_nb, arg_val, col_nm);
    return 0;
}

static void *dbse_handler(void *arg)
{
    ((cls_dbse *)arg)->handler();
    return nullptr;
}

void cls_dbse::sql_create(std::string tbl, std::string &sql)
{
    sql = "";
    if (tbl == "clips") {
        sql  = "create table clips (";
        sql += "  record_id integer primary key autoincrement";
        sql += ", clip_id text unique";
        sql += ", device_id text";
        sql += ", started_at integer";
        sql += ", ended_at integer";
        sql += ", duration_ms integer";
        sql += ", file_path text";
        sql += ", thumb_path text";
        sql += ", snapshot_path text";
        sql += ", trigger_src text";
        sql += ", trigger_ts integer";
        sql += ", confidence real";
        sql += ", species text";
        sql += ", size_bytes integer";
        sql += ");";
    } else if (tbl == "presets") {
        sql  = "create table presets (";
        sql += "  preset_id text primary key";
        sql += ", device_id text";
        sql += ", name text";
        sql += ", description text";
        sql += ", ptz_token text";
        sql += ", created_at integer";
        sql += ", last_used integer";
        sql += ", tags text";
        sql += ");";
    } else if (tbl == "sightings") {
        sql  = "create table sightings (";
        sql += "  record_id integer primary key autoincrement";
        sql += ", device_id text";
        sql += ", species text";
        sql += ", species_lc text";
        sql += ", confidence real";
        sql += ", ts integer";
        sql += ", clip_id text";
        sql += ");";
    } else if (tbl == "notify_log") {
        sql  = "create table notify_log (";
        sql += "  record_id integer primary key autoincrement";
        sql += ", device_id text";
        sql += ", ts integer";
        sql += ", ntype text";
        sql += ", title text";
        sql += ", sent integer";
        sql += ");";
    }
}

void cls_dbse::clip_assign(ctx_clip &clip, std::string col_nm, std::string col_val)
{
    if (col_nm == "clip_id") {
        clip.id = col_val;
    } else if (col_nm == "device_id") {
        clip.device_id = col_val;
    } else if (col_nm == "started_at") {
        clip.started_at = atoll(col_val.c_str());
    } else if (col_nm == "ended_at") {
        clip.ended_at = atoll(col_val.c_str());
    } else if (col_nm == "duration_ms") {
        clip.duration_ms = atoll(col_val.c_str());
    } else if (col_nm == "file_path") {
        clip.file_path = col_val;
    } else if (col_nm == "thumb_path") {
        clip.thumb_path = col_val;
    } else if (col_nm == "snapshot_path") {
        clip.snapshot_path = col_val;
    } else if (col_nm == "trigger_src") {
        clip.trigger.source = trigger_source_nbr(col_val);
    } else if (col_nm == "trigger_ts") {
        clip.trigger.timestamp = atoll(col_val.c_str());
    } else if (col_nm == "confidence") {
        clip.trigger.confidence = atof(col_val.c_str());
    } else if (col_nm == "species") {
        clip.trigger.species = col_val;
    } else if (col_nm == "size_bytes") {
        clip.size_bytes = atoll(col_val.c_str());
    }
}

void cls_dbse::preset_assign(ctx_saved_preset &pset, std::string col_nm, std::string col_val)
{
    if (col_nm == "preset_id") {
        pset.id = col_val;
    } else if (col_nm == "device_id") {
        pset.device_id = col_val;
    } else if (col_nm == "name") {
        pset.name = col_val;
    } else if (col_nm == "description") {
        pset.description = col_val;
    } else if (col_nm == "ptz_token") {
        pset.ptz_token = col_val;
    } else if (col_nm == "created_at") {
        pset.created_at = atoll(col_val.c_str());
    } else if (col_nm == "last_used") {
        pset.last_used = atoll(col_val.c_str());
    } else if (col_nm == "tags") {
        dbse_tags_split(col_val, pset.tags);
    }
}

void cls_dbse::sight_assign(ctx_sighting &sight, std::string col_nm, std::string col_val)
{
    if (col_nm == "device_id") {
        sight.device_id = col_val;
    } else if (col_nm == "species") {
        sight.species = col_val;
    } else if (col_nm == "confidence") {
        sight.confidence = atof(col_val.c_str());
    } else if (col_nm == "ts") {
        sight.timestamp = atoll(col_val.c_str());
    } else if (col_nm == "clip_id") {
        sight.clip_id = col_val;
    }
}

void cls_dbse::nlog_assign(ctx_notify_log &nlog, std::string col_nm, std::string col_val)
{
    if (col_nm == "device_id") {
        nlog.device_id = col_val;
    } else if (col_nm == "ts") {
        nlog.timestamp = atoll(col_val.c_str());
    } else if (col_nm == "ntype") {
        nlog.type = col_val;
    } else if (col_nm == "title") {
        nlog.title = col_val;
    } else if (col_nm == "sent") {
        nlog.sent = (atoi(col_val.c_str()) != 0);
    }
}

void cls_dbse::sqlite3db_cb(int arg_nb, char **arg_val, char **col_nm)
{
    int indx;
    ctx_clip clip;
    ctx_saved_preset pset;
    ctx_sighting sight;
    ctx_notify_log nlog;

    if ((finish == true) || (database_sqlite3db == nullptr) || (is_open == false)) {
        return;
    }

    if (dbse_action == DBSE_TBL_CHECK) {
        for (indx=0; indx < arg_nb; indx++) {
            if (arg_val[indx] != nullptr) {
                tbl_found.push_back(arg_val[indx]);
            }
        }
    } else if (dbse_action == DBSE_COUNT) {
        if ((arg_nb > 0) && (arg_val[0] != nullptr)) {
            count_val = atoll(arg_val[0]);
        }
    } else if (dbse_action == DBSE_CLIP_SELECT) {
        clip.started_at = 0;
        clip.ended_at = 0;
        clip.duration_ms = 0;
        clip.size_bytes = 0;
        clip.trigger.source = TRIGGER_MANUAL;
        clip.trigger.timestamp = 0;
        clip.trigger.confidence = -1;
        for (indx=0; indx < arg_nb; indx++) {
            if (arg_val[indx] != nullptr) {
                clip_assign(clip, col_nm[indx], arg_val[indx]);
            }
        }
        clip_rows.push_back(clip);
    } else if (dbse_action == DBSE_PRESET_SELECT) {
        pset.created_at = 0;
        pset.last_used = 0;
        for (indx=0; indx < arg_nb; indx++) {
            if (arg_val[indx] != nullptr) {
                preset_assign(pset, col_nm[indx], arg_val[indx]);
            }
        }
        preset_rows.push_back(pset);
    } else if (dbse_action == DBSE_SIGHT_SELECT) {
        sight.confidence = 0;
        sight.timestamp = 0;
        for (indx=0; indx < arg_nb; indx++) {
            if (arg_val[indx] != nullptr) {
                sight_assign(sight, col_nm[indx], arg_val[indx]);
            }
        }
        sight_rows.push_back(sight);
    } else if (dbse_action == DBSE_NLOG_SELECT) {
        nlog.timestamp = 0;
        nlog.sent = false;
        for (indx=0; indx < arg_nb; indx++) {
            if (arg_val[indx] != nullptr) {
                nlog_assign(nlog, col_nm[indx], arg_val[indx]);
            }
        }
        nlog_rows.push_back(nlog);
    }
}

int cls_dbse::sqlite3db_exec(std::string sql)
{
    int retcd;
    char *errmsg = nullptr;

    if ((finish == true) || (database_sqlite3db == nullptr) || (is_open == false)) {
        return -1;
    }

    CAMGATE_LOG(DBG, TYPE_DB, NO_ERRNO, "Executing query");
    retcd = sqlite3_exec(database_sqlite3db
        , sql.c_str(), nullptr, 0, &errmsg);
    if (retcd != SQLITE_OK ) {
        CAMGATE_LOG(ERR, TYPE_DB, NO_ERRNO
            , _("SQLite error was %s"), errmsg);
        sqlite3_free(errmsg);
        return -1;
    }
    return 0;
}

int cls_dbse::sqlite3db_select(std::string sql, enum DBSE_ACT act)
{
    int retcd;
    char *errmsg = nullptr;

    if ((finish == true) || (database_sqlite3db == nullptr) || (is_open == false)) {
        return -1;
    }

    dbse_action = act;
    retcd = sqlite3_exec(database_sqlite3db, sql.c_str()
        , dbse_sqlite3db_cb, this, &errmsg);
    dbse_action = DBSE_END;
    if (retcd != SQLITE_OK ) {
        CAMGATE_LOG(ERR, TYPE_DB, NO_ERRNO
            , _("Error retrieving table: %s"), errmsg);
        sqlite3_free(errmsg);
        return -1;
    }
    return 0;
}

void cls_dbse::sqlite3db_init()
{
    int retcd;
    size_t indx;
    const char *err_open  = nullptr;
    std::string sql;

    database_sqlite3db = nullptr;

    CAMGATE_LOG(NTC, TYPE_DB, NO_ERRNO
        , _("SQLite3 Database filename %s"), dbname.c_str());
    retcd = sqlite3_open(dbname.c_str(), &database_sqlite3db);
    if (retcd != SQLITE_OK) {
        err_open = sqlite3_errmsg(database_sqlite3db);
        CAMGATE_LOG(ERR, TYPE_DB, NO_ERRNO
            , _("Can't open database %s : %s")
            , dbname.c_str(), err_open);
        sqlite3_close(database_sqlite3db);
        is_open = false;
        database_sqlite3db = nullptr;
        return;
    }

    is_open = true;
    retcd = sqlite3_busy_timeout(database_sqlite3db, busy_timeout);
    if (retcd != SQLITE_OK) {
        err_open = sqlite3_errmsg(database_sqlite3db);
        CAMGATE_LOG(ERR, TYPE_DB, NO_ERRNO
            , _("database_busy_timeout failed %s"), err_open);
    }

    tbl_found.clear();
    if (sqlite3db_select("select name from sqlite_master where type='table';"
            , DBSE_TBL_CHECK) != 0) {
        return;
    }

    for (indx = 0; indx < sizeof(dbse_tables)/sizeof(dbse_tables[0]); indx++) {
        if (std::find(tbl_found.begin(), tbl_found.end()
                , dbse_tables[indx]) != tbl_found.end()) {
            continue;
        }
        CAMGATE_LOG(INF, TYPE_DB, NO_ERRNO
            , _("Creating table %s"), dbse_tables[indx]);
        sql_create(dbse_tables[indx], sql);
        if (sqlite3db_exec(sql) != 0) {
            CAMGATE_LOG(ERR, TYPE_DB, NO_ERRNO
                , _("Error creating table %s"), dbse_tables[indx]);
        }
    }
}

void cls_dbse::sqlite3db_close()
{
    if (database_sqlite3db != nullptr) {
        sqlite3_close(database_sqlite3db);
        database_sqlite3db = nullptr;
    }
    is_open = false;
}

bool cls_dbse::is_ready()
{
    return is_open;
}

int cls_dbse::exec_sql(std::string sql)
{
    int retcd;

    if (is_open == false) {
        return -1;
    }
    pthread_mutex_lock(&mutex_dbse);
        retcd = sqlite3db_exec(sql);
    pthread_mutex_unlock(&mutex_dbse);

    return retcd;
}

int cls_dbse::clip_add(const ctx_clip &clip)
{
    std::string sql;

    sql  = "insert or replace into clips (clip_id, device_id, started_at";
    sql += ", ended_at, duration_ms, file_path, thumb_path, snapshot_path";
    sql += ", trigger_src, trigger_ts, confidence, species, size_bytes)";
    sql += " values (" + dbse_quote(clip.id);
    sql += ", " + dbse_quote(clip.device_id);
    sql += ", " + std::to_string(clip.started_at);
    sql += ", " + std::to_string(clip.ended_at);
    sql += ", " + std::to_string(clip.duration_ms);
    sql += ", " + dbse_quote(clip.file_path);
    sql += ", " + dbse_quote(clip.thumb_path);
    sql += ", " + dbse_quote(clip.snapshot_path);
    sql += ", " + dbse_quote(trigger_source_str(clip.trigger.source));
    sql += ", " + std::to_string(clip.trigger.timestamp);
    sql += ", " + std::to_string(clip.trigger.confidence);
    sql += ", " + dbse_quote(clip.trigger.species);
    sql += ", " + std::to_string(clip.size_bytes);
    sql += ");";

    return exec_sql(sql);
}

int cls_dbse::clip_delete(std::string id)
{
    return exec_sql("delete from clips where clip_id = " + dbse_quote(id) + ";");
}

int cls_dbse::clip_delete_path(std::string fpath)
{
    return exec_sql("delete from clips where file_path = " + dbse_quote(fpath) + ";");
}

void cls_dbse::clip_list(std::string device_id, vec_clip &clips)
{
    clips.clear();
    if (is_open == false) {
        return;
    }
    pthread_mutex_lock(&mutex_dbse);
        clip_rows.clear();
        if (sqlite3db_select(
                "select * from clips where device_id = " + dbse_quote(device_id) +
                " order by started_at desc;", DBSE_CLIP_SELECT) == 0) {
            clips = clip_rows;
        }
        clip_rows.clear();
    pthread_mutex_unlock(&mutex_dbse);
}

int cls_dbse::clip_count(std::string device_id)
{
    int retcd;

    if (is_open == false) {
        return 0;
    }
    pthread_mutex_lock(&mutex_dbse);
        count_val = 0;
        sqlite3db_select("select count(*) from clips where device_id = " +
            dbse_quote(device_id) + ";", DBSE_COUNT);
        retcd = (int)count_val;
    pthread_mutex_unlock(&mutex_dbse);

    return retcd;
}

int cls_dbse::preset_add(const ctx_saved_preset &pset)
{
    std::string sql;

    sql  = "insert into presets (preset_id, device_id, name, description";
    sql += ", ptz_token, created_at, last_used, tags)";
    sql += " values (" + dbse_quote(pset.id);
    sql += ", " + dbse_quote(pset.device_id);
    sql += ", " + dbse_quote(pset.name);
    sql += ", " + dbse_quote(pset.description);
    sql += ", " + dbse_quote(pset.ptz_token);
    sql += ", " + std::to_string(pset.created_at);
    sql += ", " + std::to_string(pset.last_used);
    sql += ", " + dbse_quote(dbse_tags_join(pset.tags));
    sql += ");";

    return exec_sql(sql);
}

int cls_dbse::preset_update(const ctx_saved_preset &pset)
{
    std::string sql;

    sql  = "update presets set";
    sql += "  name = " + dbse_quote(pset.name);
    sql += ", description = " + dbse_quote(pset.description);
    sql += ", tags = " + dbse_quote(dbse_tags_join(pset.tags));
    sql += " where preset_id = " + dbse_quote(pset.id) + ";";

    return exec_sql(sql);
}

int cls_dbse::preset_delete(std::string id)
{
    return exec_sql("delete from presets where preset_id = " + dbse_quote(id) + ";");
}

int cls_dbse::preset_touch(std::string id, int64_t ts)
{
    return exec_sql("update presets set last_used = " + std::to_string(ts) +
        " where preset_id = " + dbse_quote(id) + ";");
}

void cls_dbse::preset_list(std::string device_id, vec_saved_preset &psets)
{
    psets.clear();
    if (is_open == false) {
        return;
    }
    pthread_mutex_lock(&mutex_dbse);
        preset_rows.clear();
        if (sqlite3db_select(
                "select * from presets where device_id = " + dbse_quote(device_id) +
                " order by created_at;", DBSE_PRESET_SELECT) == 0) {
            psets = preset_rows;
        }
        preset_rows.clear();
    pthread_mutex_unlock(&mutex_dbse);
}

bool cls_dbse::preset_get(std::string id, ctx_saved_preset &pset)
{
    bool retcd;

    if (is_open == false) {
        return false;
    }
    retcd = false;
    pthread_mutex_lock(&mutex_dbse);
        preset_rows.clear();
        if (sqlite3db_select(
                "select * from presets where preset_id = " + dbse_quote(id) + ";"
                , DBSE_PRESET_SELECT) == 0) {
            if (preset_rows.size() > 0) {
                pset = preset_rows[0];
                retcd = true;
            }
        }
        preset_rows.clear();
    pthread_mutex_unlock(&mutex_dbse);

    return retcd;
}

int cls_dbse::sighting_add(const ctx_sighting &sight)
{
    std::string sql;

    sql  = "insert into sightings (device_id, species, species_lc";
    sql += ", confidence, ts, clip_id) values (";
    sql += dbse_quote(sight.device_id);
    sql += ", " + dbse_quote(sight.species);
    sql += ", " + dbse_quote(mytolower(sight.species));
    sql += ", " + std::to_string(sight.confidence);
    sql += ", " + std::to_string(sight.timestamp);
    sql += ", " + dbse_quote(sight.clip_id);
    sql += ");";

    return exec_sql(sql);
}

bool cls_dbse::species_seen(std::string device_id, std::string species)
{
    bool retcd;

    if (is_open == false) {
        return false;
    }
    pthread_mutex_lock(&mutex_dbse);
        count_val = 0;
        sqlite3db_select("select count(*) from sightings where device_id = " +
            dbse_quote(device_id) + " and species_lc = " +
            dbse_quote(mytolower(species)) + ";", DBSE_COUNT);
        retcd = (count_val > 0);
    pthread_mutex_unlock(&mutex_dbse);

    return retcd;
}

void cls_dbse::sighting_list(std::string device_id, int limit, vec_sighting &sights)
{
    sights.clear();
    if (is_open == false) {
        return;
    }
    pthread_mutex_lock(&mutex_dbse);
        sight_rows.clear();
        if (sqlite3db_select(
                "select * from sightings where device_id = " + dbse_quote(device_id) +
                " order by ts desc limit " + std::to_string(limit) + ";"
                , DBSE_SIGHT_SELECT) == 0) {
            sights = sight_rows;
        }
        sight_rows.clear();
    pthread_mutex_unlock(&mutex_dbse);
}

int cls_dbse::notify_log_add(const ctx_notify_log &nlog)
{
    std::string sql;

    sql  = "insert into notify_log (device_id, ts, ntype, title, sent) values (";
    sql += dbse_quote(nlog.device_id);
    sql += ", " + std::to_string(nlog.timestamp);
    sql += ", " + dbse_quote(nlog.type);
    sql += ", " + dbse_quote(nlog.title);
    sql += ", " + std::string(nlog.sent ? "1" : "0");
    sql += ");";

    return exec_sql(sql);
}

void cls_dbse::notify_log_list(std::string device_id, int limit, vec_notify_log &nlogs)
{
    nlogs.clear();
    if (is_open == false) {
        return;
    }
    pthread_mutex_lock(&mutex_dbse);
        nlog_rows.clear();
        if (sqlite3db_select(
                "select * from notify_log where device_id = " + dbse_quote(device_id) +
                " order by ts desc limit " + std::to_string(limit) + ";"
                , DBSE_NLOG_SELECT) == 0) {
            nlogs = nlog_rows;
        }
        nlog_rows.clear();
    pthread_mutex_unlock(&mutex_dbse);
}

/* Drop catalog rows whose clip file is gone */
void cls_dbse::clean()
{
    int delcnt;
    size_t indx;
    std::string sql, delimit;
    vec_clip flst;

    if (is_open == false) {
        return;
    }

    pthread_mutex_lock(&mutex_dbse);
        clip_rows.clear();
        sqlite3db_select("select * from clips;", DBSE_CLIP_SELECT);
        flst = clip_rows;
        clip_rows.clear();
    pthread_mutex_unlock(&mutex_dbse);

    delcnt = 0;
    sql = "";
    for (indx=0; indx<flst.size(); indx++) {
        if (finish == true) {
            return;
        }
        if (util_file_exists(flst[indx].file_path) == false) {
            if (sql == "") {
                sql  = " delete from clips ";
                sql += " where clip_id in (";
                delimit = " ";
                delcnt = 0;
            }
            sql += delimit + dbse_quote(flst[indx].id);
            delimit = ",";
            delcnt++;
        }
        if (delcnt == 20) {
            sql += ");";
            exec_sql(sql);
            sql = "";
            delcnt = 0;
        }
    }
    if (delcnt != 0) {
        sql += ");";
        exec_sql(sql);
    }

    exec_sql(" vacuum;");
}

bool cls_dbse::check_exit()
{
    if ((handler_stop == true) || (finish == true)) {
        return true;
    }
    return false;
}

void cls_dbse::timing()
{
    int waitcnt;

    waitcnt = 0;
    while (waitcnt < 30) {
        if (check_exit() == true) {
            return;
        }
        SLEEP(1,0);
        waitcnt++;
    }
}

void cls_dbse::handler()
{
    time_t tm_now;
    struct tm lcl_tm;
    int hr_cur, hr_prev;

    mythreadname_set("dl", 0, "dbsl");

    hr_prev = -1;
    while (check_exit() == false) {
        tm_now = time(nullptr);
        localtime_r(&tm_now, &lcl_tm);
        hr_cur = lcl_tm.tm_hour;
        if (hr_cur != hr_prev) {
            clean();
            hr_prev = hr_cur;
        }
        timing();
    }

    CAMGATE_LOG(NTC, TYPE_DB, NO_ERRNO, _("Database handler closed"));

    handler_running = false;
    pthread_exit(NULL);
}

void cls_dbse::handler_startup()
{
    int retcd;
    pthread_attr_t thread_attr;

    if ((handler_running == false) && (is_open == true)) {
        handler_running = true;
        handler_stop = false;
        pthread_attr_init(&thread_attr);
        pthread_attr_setdetachstate(&thread_attr, PTHREAD_CREATE_DETACHED);
        retcd = pthread_create(&handler_thread, &thread_attr, &dbse_handler, this);
        if (retcd != 0) {
            CAMGATE_LOG(WRN, TYPE_DB, NO_ERRNO
                ,_("Unable to start database handler thread."));
            handler_running = false;
            handler_stop = true;
        }
        pthread_attr_destroy(&thread_attr);
    }
}

void cls_dbse::handler_shutdown()
{
    int waitcnt;

    if (handler_running == true) {
        handler_stop = true;
        waitcnt = 0;
        while ((handler_running == true) && (waitcnt < 10)){
            SLEEP(1,0)
            waitcnt++;
        }
        if (waitcnt == 10) {
            CAMGATE_LOG(ERR, TYPE_DB, NO_ERRNO
                , _("Normal shutdown of database handler failed"));
        }
        handler_running = false;
    }
}

cls_dbse::cls_dbse(std::string p_dbname, int p_busy_timeout)
{
    dbname = p_dbname;
    busy_timeout = p_busy_timeout;
    database_sqlite3db = nullptr;
    is_open = false;
    finish = false;
    handler_running = false;
    handler_stop = true;
    dbse_action = DBSE_END;
    count_val = 0;

    pthread_mutex_init(&mutex_dbse, nullptr);

    pthread_mutex_lock(&mutex_dbse);
        sqlite3db_init();
    pthread_mutex_unlock(&mutex_dbse);
}

cls_dbse::~cls_dbse()
{
    handler_shutdown();
    finish = true;
    pthread_mutex_lock(&mutex_dbse);
        sqlite3db_close();
    pthread_mutex_unlock(&mutex_dbse);
    pthread_mutex_destroy(&mutex_dbse);
}
