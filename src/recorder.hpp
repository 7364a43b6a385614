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

#ifndef _INCLUDE_RECORDER_HPP_
#define _INCLUDE_RECORDER_HPP_

#define RECORDER_SNAPSHOT_WAIT      10000   /* ms */
#define RECORDER_THUMB_WAIT         5000    /* ms */

struct ctx_snapshot {
    std::string     id;
    std::string     path;
    int64_t         timestamp;
    int64_t         size;
};
typedef std::vector<ctx_snapshot> vec_snapshot;

struct ctx_storage_stats {
    int64_t         used_bytes;
    int64_t         max_bytes;
    int             clip_count;
    int             snapshot_count;
};

/* Clip and snapshot files on disk, their catalog and retention */
class cls_recorder {
    public:
        cls_recorder(cls_config *p_cfg, cls_dbse *p_dbse, std::string p_device_id);
        ~cls_recorder();

        std::string     source_url;
        std::string     clip_dir;
        std::string     snap_dir;
        int             max_clips;
        int64_t         max_bytes;
        int             max_age_days;

        int ensure_dirs();
        std::string clip_path(std::string id);
        std::string thumb_path(std::string id);

        void snapshot_args(std::string fname, std::vector<std::string> &args);
        void thumbnail_args(std::string src, std::string dst, std::vector<std::string> &args);
        void capture_args(int seconds, std::string fname, std::vector<std::string> &args);

        int snapshot(ctx_snapshot &snap);
        int thumbnail(std::string src, std::string dst);

        int catalog(ctx_clip &clip);
        void list_clips(vec_clip &clips);
        bool find_clip(std::string id, ctx_clip &clip);
        int delete_clip(std::string id);
        void list_snapshots(vec_snapshot &snaps);
        ctx_storage_stats storage_stats();
        std::string storage_json();

        int evict();
        int sweep_age(int64_t now_ms);

    private:
        cls_config      *cfg;
        cls_dbse        *dbse;
        std::string     device_id;

        void remove_file(const ctx_file_stat &fs);
};

    bool recorder_valid_id(std::string id);

#endif /* _INCLUDE_RECORDER_HPP_ */
