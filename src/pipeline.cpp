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
#include "pipeline.hpp"

/* Number of a chunkNNNNN.ts file, -1 for anything else */
int pipeline_chunk_nbr(std::string fname)
{
    std::string digits;
    size_t indx;

    if ((mystrne(fname.substr(0, 5).c_str(), PIPELINE_CHUNK_PREFIX)) ||
        (myends(fname, ".ts") == false)) {
        return -1;
    }
    digits = fname.substr(5, fname.length() - 8);
    if (digits == "") {
        return -1;
    }
    for (indx = 0; indx < digits.length(); indx++) {
        if (isdigit((unsigned char)digits[indx]) == 0) {
            return -1;
        }
    }
    return mtoi(digits);
}

static bool pipeline_chunk_cmp(const ctx_chunk &a, const ctx_chunk &b)
{
    return (a.nbr < b.nbr);
}

/*
 * Accept or drop a trigger stamped ts.  Drops while the last accepted
 * trigger is inside the cooldown or all clip slots are busy.
 */
bool cls_pipeline::gate(int64_t ts)
{
    if (accepted_any && ((ts - last_accept) < cooldown_ms)) {
        CAMGATE_LOG(DBG, TYPE_EVENTS, NO_ERRNO
            , _("Trigger dropped, cooldown %lld ms remaining")
            , (long long)(cooldown_ms - (ts - last_accept)));
        dropped++;
        return false;
    }
    if (active_clips >= max_concurrent) {
        CAMGATE_LOG(DBG, TYPE_EVENTS, NO_ERRNO
            , _("Trigger dropped, %d clips active"), active_clips);
        dropped++;
        return false;
    }
    accepted_any = true;
    last_accept = ts;
    active_clips++;
    return true;
}

void cls_pipeline::release()
{
    if (active_clips > 0) {
        active_clips--;
    }
}

void cls_pipeline::chunks(vec_chunk &list)
{
    vec_file_stat files;
    ctx_chunk chk;
    size_t indx;

    list.clear();
    util_dir_list(chunk_dir, ".ts", files);
    for (indx = 0; indx < files.size(); indx++) {
        chk.nbr = pipeline_chunk_nbr(files[indx].name);
        if (chk.nbr < 0) {
            continue;
        }
        chk.full_nm = files[indx].full_nm;
        list.push_back(chk);
    }
    std::sort(list.begin(), list.end(), pipeline_chunk_cmp);
}

void cls_pipeline::buffer_args(int start_nbr)
{
    buffer->args.clear();
    buffer->args.push_back(cfg->ffmpeg_path);
    buffer->args.push_back("-hide_banner");
    buffer->args.push_back("-loglevel");
    buffer->args.push_back("error");
    buffer->args.push_back("-rtsp_transport");
    buffer->args.push_back("tcp");
    buffer->args.push_back("-i");
    buffer->args.push_back(recorder->source_url);
    buffer->args.push_back("-c");
    buffer->args.push_back("copy");
    buffer->args.push_back("-f");
    buffer->args.push_back("segment");
    buffer->args.push_back("-segment_time");
    buffer->args.push_back("1");
    buffer->args.push_back("-reset_timestamps");
    buffer->args.push_back("1");
    buffer->args.push_back("-segment_start_number");
    buffer->args.push_back(std::to_string(start_nbr));
    buffer->args.push_back(chunk_dir + "/" + PIPELINE_CHUNK_PREFIX + "%05d.ts");
}

int cls_pipeline::buffer_start()
{
    vec_chunk list;
    size_t indx;

    if (rolling == false) {
        return 0;
    }
    if (buffer_running()) {
        return 0;
    }
    if (mycreate_path((chunk_dir + "/").c_str()) != 0) {
        CAMGATE_LOG(ERR, TYPE_EVENTS, SHOW_ERRNO
            , _("Unable to create buffer directory %s"), chunk_dir.c_str());
        return -1;
    }
    chunks(list);
    for (indx = 0; indx < list.size(); indx++) {
        util_file_remove(list[indx].full_nm);
    }

    buffer_args(0);
    buffer->on_exit = [this](int code) {
        vec_chunk left;
        (void)code;
        chunks(left);
        buffer_args(left.empty() ? 0 : left.back().nbr + 1);
    };
    if (buffer->start() != 0) {
        CAMGATE_LOG(ERR, TYPE_EVENTS, NO_ERRNO
            , _("Rolling buffer did not start, clips use fixed captures"));
        return -1;
    }
    CAMGATE_LOG(NTC, TYPE_EVENTS, NO_ERRNO
        , _("Rolling buffer of %d seconds in %s"), pre_buffer, chunk_dir.c_str());
    return 0;
}

void cls_pipeline::buffer_stop()
{
    vec_chunk list;
    size_t indx;

    if (buffer->running()) {
        buffer->stop(SIGTERM, 5000);
    }
    for (std::list<ctx_clip_job *>::iterator it = jobs.begin(); it != jobs.end(); it++) {
        if (((*it)->stage == CLIP_POST_WAIT) || ((*it)->stage == CLIP_CONCAT)) {
            return;
        }
    }
    chunks(list);
    for (indx = 0; indx < list.size(); indx++) {
        util_file_remove(list[indx].full_nm);
    }
}

bool cls_pipeline::buffer_running()
{
    return (buffer->finished() == false);
}

/* Keep the newest chunks plus any that a pending clip still needs */
void cls_pipeline::buffer_trim()
{
    vec_chunk list;
    int keep_from, protect;
    size_t indx;
    std::list<ctx_clip_job *>::iterator it;

    chunks(list);
    if (list.size() <= (size_t)(pre_buffer + PIPELINE_CHUNK_KEEP)) {
        return;
    }
    keep_from = list[list.size() - (size_t)(pre_buffer + PIPELINE_CHUNK_KEEP)].nbr;

    protect = INT_MAX;
    for (it = jobs.begin(); it != jobs.end(); it++) {
        if (((*it)->stage == CLIP_POST_WAIT) || ((*it)->stage == CLIP_CONCAT)) {
            protect = MIN(protect, (*it)->first_chunk);
        }
    }
    keep_from = MIN(keep_from, protect);

    for (indx = 0; indx < list.size(); indx++) {
        if (list[indx].nbr < keep_from) {
            util_file_remove(list[indx].full_nm);
        }
    }
}

int cls_pipeline::snapshot_start(ctx_clip &clip)
{
    ctx_snap_job *snap;
    std::vector<std::string> args;

    if (recorder->ensure_dirs() != 0) {
        return -1;
    }
    snap = new ctx_snap_job;
    snap->path = recorder->snap_dir + "/snap_" +
        std::to_string(util_now_ms()) + ".jpg";
    snap->deadline = util_mono_ms() + RECORDER_SNAPSHOT_WAIT;
    snap->proc = new cls_process("snapshot", TYPE_EVENTS);
    snap->proc->oneshot = true;
    recorder->snapshot_args(snap->path, snap->proc->args);
    if (snap->proc->start() != 0) {
        delete snap->proc;
        delete snap;
        return -1;
    }
    clip.snapshot_path = snap->path;
    snaps.push_back(snap);
    return 0;
}

void cls_pipeline::snapshot_poll(int64_t now_mono)
{
    std::list<ctx_snap_job *>::iterator it;
    ctx_snap_job *snap;

    it = snaps.begin();
    while (it != snaps.end()) {
        snap = *it;
        snap->proc->poll(now_mono);
        if ((snap->proc->finished() == false) && (now_mono >= snap->deadline)) {
            CAMGATE_LOG(WRN, TYPE_EVENTS, NO_ERRNO
                , _("Snapshot timed out %s"), snap->path.c_str());
            snap->proc->stop(SIGKILL, 1000);
            util_file_remove(snap->path);
        }
        if (snap->proc->finished()) {
            if (snap->proc->exit_code != 0) {
                util_file_remove(snap->path);
            } else {
                CAMGATE_LOG(INF, TYPE_EVENTS, NO_ERRNO
                    , _("Snapshot %s"), snap->path.c_str());
            }
            delete snap->proc;
            delete snap;
            it = snaps.erase(it);
        } else {
            it++;
        }
    }
}

/* Clips started in the same millisecond get a sequence suffix */
std::string cls_pipeline::clip_new_id(int64_t now_ms)
{
    std::string id;

    if (now_ms != id_ms) {
        id_ms = now_ms;
        id_seq = 0;
    }
    for (;;) {
        id = "clip_" + std::to_string(now_ms);
        if (id_seq > 0) {
            id += "_" + std::to_string(id_seq);
        }
        id_seq++;
        if (util_file_exists(recorder->clip_path(id)) == false) {
            return id;
        }
    }
}

/*
 * Handle a trigger from the analyzer, a detector or the web control.
 * A snapshot is always attempted for an accepted trigger; the clip comes
 * from the rolling buffer when it has chunks, else from a fixed capture.
 */
int cls_pipeline::trigger(const ctx_trigger &trg, int64_t now_mono
    , std::string *clip_id)
{
    ctx_clip_job *job;
    vec_chunk list;
    int64_t now_ms;

    if (gate(trg.timestamp) == false) {
        return -1;
    }
    if (recorder->ensure_dirs() != 0) {
        release();
        return -1;
    }

    now_ms = util_now_ms();
    job = new ctx_clip_job;
    job->clip = ctx_clip();
    job->clip.id = clip_new_id(now_ms);
    job->clip.file_path = recorder->clip_path(job->clip.id);
    job->clip.trigger = trg;
    job->clip.started_at = trg.timestamp - ((int64_t)pre_buffer * 1000);
    job->clip.ended_at = 0;
    job->clip.duration_ms = 0;
    job->clip.size_bytes = 0;
    job->proc = nullptr;
    job->done = false;
    job->first_chunk = 0;
    job->post_due = now_mono + ((int64_t)post_buffer * 1000);
    job->deadline = now_mono + ((int64_t)post_buffer * 1000) + PIPELINE_CAPTURE_GRACE;

    snapshot_start(job->clip);

    chunks(list);
    if (rolling && buffer_running() && (list.empty() == false)) {
        job->stage = CLIP_POST_WAIT;
        job->first_chunk = MAX(list.front().nbr, list.back().nbr - pre_buffer);
        CAMGATE_LOG(NTC, TYPE_EVENTS, NO_ERRNO
            , _("%s trigger, clip %s from chunk %d")
            , trigger_source_str(trg.source), job->clip.id.c_str(), job->first_chunk);
    } else {
        job->stage = CLIP_CAPTURE;
        job->proc = new cls_process("capture", TYPE_EVENTS);
        job->proc->oneshot = true;
        recorder->capture_args(pre_buffer + post_buffer
            , job->clip.file_path, job->proc->args);
        if (job->proc->start() != 0) {
            CAMGATE_LOG(ERR, TYPE_EVENTS, NO_ERRNO
                , _("Capture did not start for %s"), job->clip.id.c_str());
            delete job->proc;
            delete job;
            release();
            return -1;
        }
        CAMGATE_LOG(NTC, TYPE_EVENTS, NO_ERRNO
            , _("%s trigger, capturing clip %s")
            , trigger_source_str(trg.source), job->clip.id.c_str());
    }
    jobs.push_back(job);
    if (clip_id != nullptr) {
        *clip_id = job->clip.id;
    }
    return 0;
}

int cls_pipeline::start_manual(const ctx_trigger &trg, std::string &id, int64_t now_mono)
{
    ctx_clip_job *job;
    int64_t now_ms;

    id = manual_id();
    if (id != "") {
        CAMGATE_LOG(INF, TYPE_EVENTS, NO_ERRNO
            , _("Recording already in progress %s"), id.c_str());
        return 0;
    }
    if (active_clips >= max_concurrent) {
        CAMGATE_LOG(WRN, TYPE_EVENTS, NO_ERRNO
            , _("Recording refused, %d clips active"), active_clips);
        return -1;
    }
    if (recorder->ensure_dirs() != 0) {
        return -1;
    }

    now_ms = util_now_ms();
    job = new ctx_clip_job;
    job->clip = ctx_clip();
    job->clip.id = clip_new_id(now_ms);
    job->clip.file_path = recorder->clip_path(job->clip.id);
    job->clip.trigger = trg;
    job->clip.started_at = now_ms;
    job->clip.ended_at = 0;
    job->clip.duration_ms = 0;
    job->clip.size_bytes = 0;
    job->stage = CLIP_MANUAL;
    job->done = false;
    job->first_chunk = 0;
    job->post_due = 0;
    job->deadline = now_mono + ((int64_t)clip_duration * 1000) + PIPELINE_CAPTURE_GRACE;
    job->proc = new cls_process("record", TYPE_EVENTS);
    job->proc->oneshot = true;
    recorder->capture_args(clip_duration, job->clip.file_path, job->proc->args);
    if (job->proc->start() != 0) {
        delete job->proc;
        delete job;
        return -1;
    }
    active_clips++;
    jobs.push_back(job);
    id = job->clip.id;
    CAMGATE_LOG(NTC, TYPE_EVENTS, NO_ERRNO
        , _("Recording %s for %d seconds"), id.c_str(), clip_duration);
    return 0;
}

/* SIGINT lets ffmpeg write the trailer so the file stays playable */
int cls_pipeline::stop_manual()
{
    std::list<ctx_clip_job *>::iterator it;

    for (it = jobs.begin(); it != jobs.end(); it++) {
        if (((*it)->stage == CLIP_MANUAL) && ((*it)->proc != nullptr)) {
            (*it)->proc->signal(SIGINT);
            CAMGATE_LOG(INF, TYPE_EVENTS, NO_ERRNO
                , _("Stopping recording %s"), (*it)->clip.id.c_str());
            return 0;
        }
    }
    return -1;
}

bool cls_pipeline::recording()
{
    return (active_clips > 0);
}

std::string cls_pipeline::manual_id()
{
    std::list<ctx_clip_job *>::iterator it;

    for (it = jobs.begin(); it != jobs.end(); it++) {
        if ((*it)->stage == CLIP_MANUAL) {
            return (*it)->clip.id;
        }
    }
    return "";
}

int cls_pipeline::concat_start(ctx_clip_job *job, int64_t now_mono)
{
    vec_chunk list;
    std::string body;
    size_t indx;
    int cnt;

    (void)now_mono;
    chunks(list);
    cnt = 0;
    for (indx = 0; indx < list.size(); indx++) {
        if (list[indx].nbr >= job->first_chunk) {
            body += "file '" + list[indx].full_nm + "'\n";
            cnt++;
        }
    }
    if (cnt == 0) {
        CAMGATE_LOG(WRN, TYPE_EVENTS, NO_ERRNO
            , _("No chunks for clip %s"), job->clip.id.c_str());
        return -1;
    }
    job->list_file = chunk_dir + "/" + job->clip.id + ".txt";
    if (util_file_write(job->list_file, body) != 0) {
        return -1;
    }

    job->proc = new cls_process("concat", TYPE_EVENTS);
    job->proc->oneshot = true;
    job->proc->args.push_back(cfg->ffmpeg_path);
    job->proc->args.push_back("-hide_banner");
    job->proc->args.push_back("-loglevel");
    job->proc->args.push_back("error");
    job->proc->args.push_back("-f");
    job->proc->args.push_back("concat");
    job->proc->args.push_back("-safe");
    job->proc->args.push_back("0");
    job->proc->args.push_back("-i");
    job->proc->args.push_back(job->list_file);
    job->proc->args.push_back("-c");
    job->proc->args.push_back("copy");
    job->proc->args.push_back("-movflags");
    job->proc->args.push_back("+faststart");
    job->proc->args.push_back("-y");
    job->proc->args.push_back(job->clip.file_path);
    if (job->proc->start() != 0) {
        delete job->proc;
        job->proc = nullptr;
        return -1;
    }
    job->stage = CLIP_CONCAT;
    CAMGATE_LOG(DBG, TYPE_EVENTS, NO_ERRNO
        , _("Joining %d chunks into %s"), cnt, job->clip.id.c_str());
    return 0;
}

int cls_pipeline::thumb_start(ctx_clip_job *job, int64_t now_mono)
{
    job->clip.thumb_path = recorder->thumb_path(job->clip.id);
    job->proc = new cls_process("thumbnail", TYPE_EVENTS);
    job->proc->oneshot = true;
    recorder->thumbnail_args(job->clip.file_path, job->clip.thumb_path
        , job->proc->args);
    if (job->proc->start() != 0) {
        delete job->proc;
        job->proc = nullptr;
        job->clip.thumb_path = "";
        return -1;
    }
    job->stage = CLIP_THUMB;
    job->deadline = now_mono + RECORDER_THUMB_WAIT;
    return 0;
}

/* Every path through here gives back the clip slot */
void cls_pipeline::job_done(ctx_clip_job *job, bool ok)
{
    if (job->list_file != "") {
        util_file_remove(job->list_file);
        job->list_file = "";
    }
    if (ok) {
        if (recorder->catalog(job->clip) == 0) {
            bus_clip->publish(job->clip);
        }
    } else {
        util_file_remove(job->clip.file_path);
        CAMGATE_LOG(WRN, TYPE_EVENTS, NO_ERRNO
            , _("Clip %s failed"), job->clip.id.c_str());
    }
    release();
    job->done = true;
}

void cls_pipeline::job_poll(ctx_clip_job *job, int64_t now_mono)
{
    bool written;

    if (job->stage == CLIP_POST_WAIT) {
        if (now_mono < job->post_due) {
            return;
        }
        if (concat_start(job, now_mono) != 0) {
            job_done(job, false);
        }
        return;
    }
    if (job->proc == nullptr) {
        return;
    }

    job->proc->poll(now_mono);
    if ((job->proc->finished() == false) && (now_mono >= job->deadline)) {
        CAMGATE_LOG(WRN, TYPE_EVENTS, NO_ERRNO
            , _("%s: timed out on %s"), cg_err_str(CG_ERR_TIMEOUT)
            , job->clip.id.c_str());
        job->proc->stop(SIGKILL, 1000);
        if (job->stage == CLIP_THUMB) {
            util_file_remove(job->clip.thumb_path);
            job->clip.thumb_path = "";
        } else {
            job->proc->exit_code = -1;
            util_file_remove(job->clip.file_path);
        }
    }
    if (job->proc->finished() == false) {
        return;
    }

    if (job->stage == CLIP_THUMB) {
        delete job->proc;
        job->proc = nullptr;
        job_done(job, true);
        return;
    }

    /* ffmpeg exits non zero on SIGINT, the file decides for manual clips */
    written = (util_file_exists(job->clip.file_path) &&
        ((job->stage == CLIP_MANUAL) || (job->proc->exit_code == 0)));
    delete job->proc;
    job->proc = nullptr;

    if (written == false) {
        job_done(job, false);
        return;
    }
    job->clip.ended_at = util_now_ms();
    job->clip.duration_ms = job->clip.ended_at - job->clip.started_at;
    if (job->list_file != "") {
        util_file_remove(job->list_file);
        job->list_file = "";
    }
    if (thumbnails && (thumb_start(job, now_mono) == 0)) {
        return;
    }
    job_done(job, true);
}

void cls_pipeline::poll(int64_t now_mono)
{
    std::list<ctx_clip_job *>::iterator it;
    ctx_clip_job *job;

    buffer->poll(now_mono);
    snapshot_poll(now_mono);

    it = jobs.begin();
    while (it != jobs.end()) {
        job = *it;
        job_poll(job, now_mono);
        if (job->done) {
            delete job;
            it = jobs.erase(it);
        } else {
            it++;
        }
    }
    if (rolling) {
        buffer_trim();
    }
}

/* Shutdown: finalize what was captured and give up on the rest */
void cls_pipeline::stop_all()
{
    std::list<ctx_clip_job *>::iterator it;
    ctx_clip_job *job;
    std::list<ctx_snap_job *>::iterator sit;

    for (it = jobs.begin(); it != jobs.end(); it++) {
        job = *it;
        if (job->proc != nullptr) {
            job->proc->stop(SIGINT, 5000);
            if ((job->stage == CLIP_MANUAL) || (job->stage == CLIP_THUMB)) {
                job->clip.ended_at = util_now_ms();
                job->clip.duration_ms = job->clip.ended_at - job->clip.started_at;
                job_done(job, util_file_exists(job->clip.file_path));
            } else {
                job_done(job, false);
            }
            delete job->proc;
        } else {
            job_done(job, false);
        }
        delete job;
    }
    jobs.clear();

    for (sit = snaps.begin(); sit != snaps.end(); sit++) {
        (*sit)->proc->stop(SIGTERM, 1000);
        delete (*sit)->proc;
        delete *sit;
    }
    snaps.clear();

    buffer_stop();
}

std::string cls_pipeline::json()
{
    std::string resp;

    resp = "{";
    resp += "\"activeClips\":" + std::to_string(active_clips);
    resp += ",\"maxConcurrentClips\":" + std::to_string(max_concurrent);
    resp += ",\"recording\":" + std::string(recording() ? "true" : "false");
    resp += ",\"manualId\":\"" + manual_id() + "\"";
    resp += ",\"rollingBuffer\":" + std::string(buffer_running() ? "true" : "false");
    resp += ",\"droppedTriggers\":" + std::to_string(dropped);
    if (accepted_any) {
        resp += ",\"lastTriggerAt\":\"" + util_iso_time(last_accept) + "\"";
    }
    resp += "}";
    return resp;
}

cls_pipeline::cls_pipeline(cls_config *p_cfg, cls_recorder *p_recorder
    , cls_evtbus<ctx_clip> *p_bus_clip)
{
    cfg = p_cfg;
    recorder = p_recorder;
    bus_clip = p_bus_clip;

    cooldown_ms = cfg->record_cooldown;
    max_concurrent = MAX(cfg->max_concurrent_clips, 1);
    pre_buffer = cfg->pre_buffer;
    post_buffer = cfg->post_buffer;
    clip_duration = cfg->clip_duration;
    thumbnails = cfg->record_thumbnail;
    rolling = cfg->record_rolling;
    chunk_dir = recorder->clip_dir + "/.buffer";

    active_clips = 0;
    last_accept = 0;
    dropped = 0;
    accepted_any = false;
    id_ms = 0;
    id_seq = 0;

    buffer = new cls_process("buffer", TYPE_EVENTS);
    buffer->restart_delay = cfg->stream_restart_delay * 1000;
    buffer->restart_max = 0;
}

cls_pipeline::~cls_pipeline()
{
    stop_all();
    delete buffer;
}
