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
#include "dbse.hpp"
#include "recorder.hpp"

static bool recorder_newest(const ctx_file_stat &a, const ctx_file_stat &b)
{
    if (a.mtime_ms != b.mtime_ms) {
        return (a.mtime_ms > b.mtime_ms);
    }
    return (a.name > b.name);
}

static bool recorder_oldest(const ctx_file_stat &a, const ctx_file_stat &b)
{
    return recorder_newest(b, a);
}

static int64_t recorder_size(std::string fname)
{
    struct stat statbuf;

    if (stat(fname.c_str(), &statbuf) != 0) {
        return 0;
    }
    return (int64_t)statbuf.st_size;
}

/* Ids name files in our directories so nothing path-like is accepted */
bool recorder_valid_id(std::string id)
{
    size_t indx;

    if ((id == "") || (id.length() > 64)) {
        return false;
    }
    for (indx = 0; indx < id.length(); indx++) {
        if (!isalnum((unsigned char)id[indx]) &&
            (id[indx] != '_') && (id[indx] != '-')) {
            return false;
        }
    }
    return true;
}

int cls_recorder::ensure_dirs()
{
    if (mycreate_path((clip_dir + "/").c_str()) != 0) {
        CAMGATE_LOG(ERR, TYPE_EVENTS, SHOW_ERRNO
            , _("Unable to create clip directory %s"), clip_dir.c_str());
        return -1;
    }
    if (mycreate_path((snap_dir + "/").c_str()) != 0) {
        CAMGATE_LOG(ERR, TYPE_EVENTS, SHOW_ERRNO
            , _("Unable to create snapshot directory %s"), snap_dir.c_str());
        return -1;
    }
    return 0;
}

std::string cls_recorder::clip_path(std::string id)
{
    return clip_dir + "/" + id + ".mp4";
}

std::string cls_recorder::thumb_path(std::string id)
{
    return clip_dir + "/" + id + "_thumb.jpg";
}

void cls_recorder::snapshot_args(std::string fname, std::vector<std::string> &args)
{
    args.clear();
    args.push_back(cfg->ffmpeg_path);
    args.push_back("-hide_banner");
    args.push_back("-loglevel");
    args.push_back("error");
    args.push_back("-rtsp_transport");
    args.push_back("tcp");
    args.push_back("-i");
    args.push_back(source_url);
    args.push_back("-vframes");
    args.push_back("1");
    args.push_back("-q:v");
    args.push_back("2");
    args.push_back("-y");
    args.push_back(fname);
}

void cls_recorder::thumbnail_args(std::string src, std::string dst
    , std::vector<std::string> &args)
{
    args.clear();
    args.push_back(cfg->ffmpeg_path);
    args.push_back("-hide_banner");
    args.push_back("-loglevel");
    args.push_back("error");
    args.push_back("-i");
    args.push_back(src);
    args.push_back("-vframes");
    args.push_back("1");
    args.push_back("-vf");
    args.push_back("scale=320:-1");
    args.push_back("-q:v");
    args.push_back("5");
    args.push_back("-y");
    args.push_back(dst);
}

/* Fixed length copy of the source, used by manual and fallback clips */
void cls_recorder::capture_args(int seconds, std::string fname
    , std::vector<std::string> &args)
{
    args.clear();
    args.push_back(cfg->ffmpeg_path);
    args.push_back("-hide_banner");
    args.push_back("-loglevel");
    args.push_back("error");
    args.push_back("-rtsp_transport");
    args.push_back("tcp");
    args.push_back("-i");
    args.push_back(source_url);
    args.push_back("-t");
    args.push_back(std::to_string(seconds));
    args.push_back("-c");
    args.push_back("copy");
    args.push_back("-movflags");
    args.push_back("+faststart");
    args.push_back("-y");
    args.push_back(fname);
}

int cls_recorder::snapshot(ctx_snapshot &snap)
{
    std::vector<std::string> args;
    struct stat statbuf;

    if (ensure_dirs() != 0) {
        return -1;
    }
    snap.timestamp = util_now_ms();
    snap.id = "snap_" + std::to_string(snap.timestamp);
    snap.path = snap_dir + "/" + snap.id + ".jpg";
    snap.size = 0;

    snapshot_args(snap.path, args);
    if (process_run(args, RECORDER_SNAPSHOT_WAIT, TYPE_EVENTS, nullptr) != 0) {
        CAMGATE_LOG(WRN, TYPE_EVENTS, NO_ERRNO, _("Snapshot failed"));
        util_file_remove(snap.path);
        return -1;
    }
    if (stat(snap.path.c_str(), &statbuf) != 0) {
        CAMGATE_LOG(WRN, TYPE_EVENTS, SHOW_ERRNO
            , _("Snapshot not written %s"), snap.path.c_str());
        return -1;
    }
    snap.size = (int64_t)statbuf.st_size;
    CAMGATE_LOG(INF, TYPE_EVENTS, NO_ERRNO, _("Snapshot %s"), snap.path.c_str());
    return 0;
}

int cls_recorder::thumbnail(std::string src, std::string dst)
{
    std::vector<std::string> args;

    thumbnail_args(src, dst, args);
    if (process_run(args, RECORDER_THUMB_WAIT, TYPE_EVENTS, nullptr) != 0) {
        CAMGATE_LOG(WRN, TYPE_EVENTS, NO_ERRNO
            , _("Thumbnail failed for %s"), src.c_str());
        util_file_remove(dst);
        return -1;
    }
    return 0;
}

/* Record a finished clip in the database and apply the storage bounds */
int cls_recorder::catalog(ctx_clip &clip)
{
    struct stat statbuf;

    if (stat(clip.file_path.c_str(), &statbuf) != 0) {
        CAMGATE_LOG(ERR, TYPE_EVENTS, SHOW_ERRNO
            , _("Clip file missing %s"), clip.file_path.c_str());
        return -1;
    }
    clip.size_bytes = (int64_t)statbuf.st_size;
    clip.device_id = device_id;
    if ((clip.thumb_path != "") && !util_file_exists(clip.thumb_path)) {
        clip.thumb_path = "";
    }
    if (dbse != nullptr) {
        dbse->clip_add(clip);
    }
    CAMGATE_LOG(NTC, TYPE_EVENTS, NO_ERRNO
        , _("Clip %s %.1fs %lld bytes")
        , clip.id.c_str(), (double)clip.duration_ms / 1000.0
        , (long long)clip.size_bytes);
    evict();
    return 0;
}

/* Directory listing merged with the catalog rows that carry the trigger */
void cls_recorder::list_clips(vec_clip &clips)
{
    vec_file_stat files;
    vec_clip rows;
    std::map<std::string, ctx_clip> byid;
    ctx_clip clip;
    std::string id;
    size_t indx;

    clips.clear();
    if (dbse != nullptr) {
        dbse->clip_list(device_id, rows);
        for (indx = 0; indx < rows.size(); indx++) {
            byid[rows[indx].id] = rows[indx];
        }
    }
    util_dir_list(clip_dir, ".mp4", files);
    std::sort(files.begin(), files.end(), recorder_newest);

    for (indx = 0; indx < files.size(); indx++) {
        id = files[indx].name.substr(0, files[indx].name.length() - 4);
        if (byid.find(id) != byid.end()) {
            clip = byid[id];
        } else {
            clip = ctx_clip();
            clip.id = id;
            clip.device_id = device_id;
            clip.started_at = files[indx].mtime_ms;
            clip.ended_at = files[indx].mtime_ms;
            clip.duration_ms = 0;
            clip.trigger.source = TRIGGER_MANUAL;
            clip.trigger.timestamp = files[indx].mtime_ms;
            clip.trigger.confidence = -1;
        }
        clip.file_path = files[indx].full_nm;
        clip.size_bytes = files[indx].size;
        if (util_file_exists(thumb_path(id))) {
            clip.thumb_path = thumb_path(id);
        } else {
            clip.thumb_path = "";
        }
        clips.push_back(clip);
    }
}

bool cls_recorder::find_clip(std::string id, ctx_clip &clip)
{
    vec_clip clips;
    size_t indx;

    list_clips(clips);
    for (indx = 0; indx < clips.size(); indx++) {
        if (clips[indx].id == id) {
            clip = clips[indx];
            return true;
        }
    }
    return false;
}

int cls_recorder::delete_clip(std::string id)
{
    if (recorder_valid_id(id) == false) {
        CAMGATE_LOG(WRN, TYPE_EVENTS, NO_ERRNO, _("Invalid clip id"));
        return -1;
    }
    if (util_file_exists(clip_path(id)) == false) {
        CAMGATE_LOG(WRN, TYPE_EVENTS, NO_ERRNO, _("No clip %s"), id.c_str());
        return -1;
    }
    if (util_file_remove(clip_path(id)) != 0) {
        return -1;
    }
    util_file_remove(thumb_path(id));
    if (dbse != nullptr) {
        dbse->clip_delete(id);
    }
    CAMGATE_LOG(INF, TYPE_EVENTS, NO_ERRNO, _("Deleted clip %s"), id.c_str());
    return 0;
}

void cls_recorder::list_snapshots(vec_snapshot &snaps)
{
    vec_file_stat files;
    ctx_snapshot snap;
    size_t indx;

    snaps.clear();
    util_dir_list(snap_dir, ".jpg", files);
    std::sort(files.begin(), files.end(), recorder_newest);
    for (indx = 0; indx < files.size(); indx++) {
        snap.id = files[indx].name.substr(0, files[indx].name.length() - 4);
        snap.path = files[indx].full_nm;
        snap.timestamp = files[indx].mtime_ms;
        snap.size = files[indx].size;
        snaps.push_back(snap);
    }
}

ctx_storage_stats cls_recorder::storage_stats()
{
    ctx_storage_stats st;
    vec_file_stat files;
    size_t indx;

    st.used_bytes = 0;
    st.max_bytes = max_bytes;
    st.clip_count = 0;
    st.snapshot_count = 0;

    util_dir_list(clip_dir, "", files);
    for (indx = 0; indx < files.size(); indx++) {
        st.used_bytes += files[indx].size;
        if (myends(files[indx].name, ".mp4")) {
            st.clip_count++;
        }
    }
    util_dir_list(snap_dir, ".jpg", files);
    for (indx = 0; indx < files.size(); indx++) {
        st.used_bytes += files[indx].size;
        st.snapshot_count++;
    }
    return st;
}

std::string cls_recorder::storage_json()
{
    ctx_storage_stats st;
    std::string resp;
    char buf[64];

    st = storage_stats();
    resp = "{";
    snprintf(buf, sizeof(buf), "%.2f", (double)st.used_bytes / (1024.0 * 1024.0));
    resp += "\"usedMb\":" + std::string(buf);
    resp += ",\"maxMb\":" + std::to_string(max_bytes / (1024 * 1024));
    resp += ",\"usedBytes\":" + std::to_string(st.used_bytes);
    resp += ",\"clipCount\":" + std::to_string(st.clip_count);
    resp += ",\"snapshotCount\":" + std::to_string(st.snapshot_count);
    if (max_bytes > 0) {
        snprintf(buf, sizeof(buf), "%.1f"
            , ((double)st.used_bytes * 100.0) / (double)max_bytes);
        resp += ",\"percentUsed\":" + std::string(buf);
    }
    resp += "}";
    return resp;
}

void cls_recorder::remove_file(const ctx_file_stat &fs)
{
    std::string id;

    CAMGATE_LOG(INF, TYPE_EVENTS, NO_ERRNO, _("Evicting %s"), fs.name.c_str());
    util_file_remove(fs.full_nm);
    if (myends(fs.name, ".mp4")) {
        id = fs.name.substr(0, fs.name.length() - 4);
        util_file_remove(thumb_path(id));
        if (dbse != nullptr) {
            dbse->clip_delete(id);
        }
    }
}

/*
 * Remove the oldest files until the clip count and the byte total across
 * clips, thumbnails and snapshots are inside the bounds.  Returns the
 * number of files removed or -1 when the bounds could not be met.
 */
int cls_recorder::evict()
{
    vec_file_stat files, clips, cands;
    std::set<std::string> gone;
    int64_t used;
    int clip_cnt, removed;
    size_t indx;
    std::string id;

    util_dir_list(clip_dir, "", files);
    used = 0;
    for (indx = 0; indx < files.size(); indx++) {
        used += files[indx].size;
        if (myends(files[indx].name, ".mp4")) {
            clips.push_back(files[indx]);
            cands.push_back(files[indx]);
        } else if (myends(files[indx].name, "_thumb.jpg")) {
            /* A thumbnail whose clip is gone goes on its own */
            id = files[indx].name.substr(0, files[indx].name.length() - 10);
            if (util_file_exists(clip_path(id)) == false) {
                cands.push_back(files[indx]);
            }
        }
    }
    util_dir_list(snap_dir, ".jpg", files);
    for (indx = 0; indx < files.size(); indx++) {
        used += files[indx].size;
        cands.push_back(files[indx]);
    }
    std::sort(clips.begin(), clips.end(), recorder_oldest);
    std::sort(cands.begin(), cands.end(), recorder_oldest);

    removed = 0;
    clip_cnt = (int)clips.size();
    for (indx = 0; (indx < clips.size()) && (clip_cnt > max_clips); indx++) {
        id = clips[indx].name.substr(0, clips[indx].name.length() - 4);
        used -= clips[indx].size + recorder_size(thumb_path(id));
        remove_file(clips[indx]);
        gone.insert(clips[indx].full_nm);
        clip_cnt--;
        removed++;
    }

    for (indx = 0; (indx < cands.size()) && (used > max_bytes); indx++) {
        if (gone.find(cands[indx].full_nm) != gone.end()) {
            continue;
        }
        used -= cands[indx].size;
        if (myends(cands[indx].name, ".mp4")) {
            id = cands[indx].name.substr(0, cands[indx].name.length() - 4);
            used -= recorder_size(thumb_path(id));
            clip_cnt--;
        }
        remove_file(cands[indx]);
        removed++;
    }

    if ((clip_cnt > max_clips) || (used > max_bytes)) {
        CAMGATE_LOG(ERR, TYPE_EVENTS, NO_ERRNO
            , _("%s: %d clips %lld bytes remain after eviction")
            , cg_err_str(CG_ERR_STORAGE), clip_cnt, (long long)used);
        return -1;
    }
    if (removed > 0) {
        CAMGATE_LOG(NTC, TYPE_EVENTS, NO_ERRNO
            , _("Evicted %d files, %lld bytes in use"), removed, (long long)used);
    }
    return removed;
}

/* Remove anything older than max_age_days regardless of the bounds */
int cls_recorder::sweep_age(int64_t now_ms)
{
    vec_file_stat files, snaps;
    int64_t cutoff;
    int removed;
    size_t indx;

    if (max_age_days <= 0) {
        return 0;
    }
    cutoff = now_ms - ((int64_t)max_age_days * 86400 * 1000);
    removed = 0;

    util_dir_list(clip_dir, ".mp4", files);
    util_dir_list(snap_dir, ".jpg", snaps);
    files.insert(files.end(), snaps.begin(), snaps.end());
    for (indx = 0; indx < files.size(); indx++) {
        if (files[indx].mtime_ms < cutoff) {
            remove_file(files[indx]);
            removed++;
        }
    }
    if (removed > 0) {
        CAMGATE_LOG(NTC, TYPE_EVENTS, NO_ERRNO
            , _("Removed %d files older than %d days"), removed, max_age_days);
    }
    return removed;
}

cls_recorder::cls_recorder(cls_config *p_cfg, cls_dbse *p_dbse, std::string p_device_id)
{
    cfg = p_cfg;
    dbse = p_dbse;
    device_id = p_device_id;
    source_url = cfg->rtsp_url;

    clip_dir = cfg->record_dir;
    if (clip_dir == "") {
        clip_dir = cfg->data_dir + "/recordings";
    }
    snap_dir = cfg->snapshot_dir;
    if (snap_dir == "") {
        snap_dir = cfg->data_dir + "/snapshots";
    }
    while ((clip_dir.length() > 1) && (clip_dir.back() == '/')) {
        clip_dir.pop_back();
    }
    while ((snap_dir.length() > 1) && (snap_dir.back() == '/')) {
        snap_dir.pop_back();
    }
    max_clips = cfg->max_clips;
    max_bytes = (int64_t)cfg->max_storage_mb * 1024 * 1024;
    max_age_days = cfg->max_age_days;
}

cls_recorder::~cls_recorder()
{

}
