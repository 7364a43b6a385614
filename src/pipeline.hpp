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

#ifndef _INCLUDE_PIPELINE_HPP_
#define _INCLUDE_PIPELINE_HPP_

#define PIPELINE_CAPTURE_GRACE      30000   /* ms beyond the post buffer */
#define PIPELINE_CHUNK_PREFIX       "chunk"
#define PIPELINE_CHUNK_KEEP         2       /* chunks kept beyond the pre buffer */

enum CLIP_STAGE {
    CLIP_POST_WAIT,     /* Rolling buffer: waiting for the post chunks */
    CLIP_CONCAT,        /* Rolling buffer: concat demuxer running */
    CLIP_CAPTURE,       /* Fixed length capture from the source */
    CLIP_MANUAL,        /* User started capture */
    CLIP_THUMB          /* Clip written, thumbnail running */
};

struct ctx_clip_job {
    ctx_clip        clip;
    enum CLIP_STAGE stage;
    int             first_chunk;
    int64_t         post_due;       /* Monotonic ms */
    int64_t         deadline;       /* Monotonic ms */
    cls_process     *proc;
    std::string     list_file;
    bool            done;
};

struct ctx_snap_job {
    std::string     path;
    int64_t         deadline;
    cls_process     *proc;
};

struct ctx_chunk {
    int             nbr;
    std::string     full_nm;
};
typedef std::vector<ctx_chunk> vec_chunk;

/* Turns accepted triggers into clips and snapshots */
class cls_pipeline {
    public:
        cls_pipeline(cls_config *p_cfg, cls_recorder *p_recorder
            , cls_evtbus<ctx_clip> *p_bus_clip);
        ~cls_pipeline();

        int64_t         cooldown_ms;
        int             max_concurrent;
        int             pre_buffer;
        int             post_buffer;
        int             clip_duration;
        bool            thumbnails;
        bool            rolling;
        std::string     chunk_dir;

        int             active_clips;
        int64_t         last_accept;
        int             dropped;

        bool gate(int64_t ts);
        void release();

        int trigger(const ctx_trigger &trg, int64_t now_mono
            , std::string *clip_id = nullptr);
        int start_manual(const ctx_trigger &trg, std::string &id, int64_t now_mono);
        int stop_manual();
        bool recording();
        std::string manual_id();
        std::string clip_new_id(int64_t now_ms);

        int buffer_start();
        void buffer_stop();
        bool buffer_running();
        void buffer_trim();
        void chunks(vec_chunk &list);

        void poll(int64_t now_mono);
        void stop_all();
        std::string json();

    private:
        cls_config              *cfg;
        cls_recorder            *recorder;
        cls_evtbus<ctx_clip>    *bus_clip;
        cls_process             *buffer;
        bool                    accepted_any;
        int64_t                 id_ms;
        int                     id_seq;
        std::list<ctx_clip_job *>   jobs;
        std::list<ctx_snap_job *>   snaps;

        void buffer_args(int start_nbr);
        int snapshot_start(ctx_clip &clip);
        void snapshot_poll(int64_t now_mono);
        int concat_start(ctx_clip_job *job, int64_t now_mono);
        int thumb_start(ctx_clip_job *job, int64_t now_mono);
        void job_poll(ctx_clip_job *job, int64_t now_mono);
        void job_done(ctx_clip_job *job, bool ok);
};

    int pipeline_chunk_nbr(std::string fname);

#endif /* _INCLUDE_PIPELINE_HPP_ */
