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
#include "json_parse.hpp"
#include "settings.hpp"

static const char *quality_presets[] = {
    "ultrafast", "superfast", "veryfast", "faster", "fast", "medium"
};

bool settings_resolution_preset(std::string name, int &width, int &height)
{
    if (name == "1080p") {
        width = 1920; height = 1080;
    } else if (name == "720p") {
        width = 1280; height = 720;
    } else if (name == "480p") {
        width = 854;  height = 480;
    } else if (name == "360p") {
        width = 640;  height = 360;
    } else {
        return false;
    }
    return true;
}

static int settings_clamp(int val, int minval, int maxval)
{
    if (val < minval) {
        return minval;
    }
    if (val > maxval) {
        return maxval;
    }
    return val;
}

cls_settings::cls_settings(std::string p_dir)
{
    dir = p_dir;
    defaults();
}

cls_settings::~cls_settings()
{

}

void cls_settings::defaults()
{
    video.resolution = "source";
    video.custom_width = 0;
    video.custom_height = 0;
    video.fps = 0;
    video.bitrate = "2000k";
    video.preset = "ultrafast";
    video.segment_duration = 2;
    video.playlist_size = 5;
    video.audio_enabled = true;
    video.audio_bitrate = "128k";

    camera.source_resolution = "";
    camera.source_fps = 0;
    camera.source_gov_length = 0;
    camera.source_bitrate = 0;

    last_modified = util_now_ms();
}

void cls_settings::clamp()
{
    size_t indx;
    bool fnd;
    int wd, ht;

    video.fps = settings_clamp(video.fps, 0, 60);
    video.segment_duration = settings_clamp(video.segment_duration, 1, 10);
    video.playlist_size = settings_clamp(video.playlist_size, 2, 20);
    if (video.custom_width != 0) {
        video.custom_width = settings_clamp(video.custom_width, 320, 3840);
    }
    if (video.custom_height != 0) {
        video.custom_height = settings_clamp(video.custom_height, 240, 2160);
    }

    if ((video.resolution != "source") && (video.resolution != "custom") &&
        (settings_resolution_preset(video.resolution, wd, ht) == false)) {
        CAMGATE_LOG(WRN, TYPE_STREAM, NO_ERRNO
            , _("Unknown resolution %s, using source"), video.resolution.c_str());
        video.resolution = "source";
    }

    fnd = false;
    for (indx = 0; indx < sizeof(quality_presets)/sizeof(quality_presets[0]); indx++) {
        if (video.preset == quality_presets[indx]) {
            fnd = true;
        }
    }
    if (fnd == false) {
        CAMGATE_LOG(WRN, TYPE_STREAM, NO_ERRNO
            , _("Unknown quality preset %s, using ultrafast"), video.preset.c_str());
        video.preset = "ultrafast";
    }

    if (mtoi(video.bitrate) <= 0) {
        video.bitrate = "2000k";
    }
    if (mtoi(video.audio_bitrate) <= 0) {
        video.audio_bitrate = "128k";
    }
}

void cls_settings::update_video(JsonParser &jp)
{
    if (jp.has("outputResolution")) {
        video.resolution = jp.getString("outputResolution", video.resolution);
    }
    if (jp.has("customWidth")) {
        video.custom_width = (int)jp.getNumber("customWidth", video.custom_width);
    }
    if (jp.has("customHeight")) {
        video.custom_height = (int)jp.getNumber("customHeight", video.custom_height);
    }
    if (jp.has("outputFps")) {
        video.fps = (int)jp.getNumber("outputFps", video.fps);
    }
    if (jp.has("outputBitrate")) {
        video.bitrate = jp.getString("outputBitrate", video.bitrate);
    }
    if (jp.has("qualityPreset")) {
        video.preset = jp.getString("qualityPreset", video.preset);
    }
    if (jp.has("hlsSegmentDuration")) {
        video.segment_duration = (int)jp.getNumber("hlsSegmentDuration"
            , video.segment_duration);
    }
    if (jp.has("hlsPlaylistSize")) {
        video.playlist_size = (int)jp.getNumber("hlsPlaylistSize", video.playlist_size);
    }
    if (jp.has("audioEnabled")) {
        video.audio_enabled = jp.getBool("audioEnabled", video.audio_enabled);
    }
    if (jp.has("audioBitrate")) {
        video.audio_bitrate = jp.getString("audioBitrate", video.audio_bitrate);
    }
    clamp();
    last_modified = util_now_ms();
}

void cls_settings::update_camera(JsonParser &jp)
{
    if (jp.has("sourceResolution")) {
        camera.source_resolution = jp.getString("sourceResolution");
    }
    if (jp.has("sourceFps")) {
        camera.source_fps = (int)jp.getNumber("sourceFps");
    }
    if (jp.has("sourceGovLength")) {
        camera.source_gov_length = (int)jp.getNumber("sourceGovLength");
    }
    if (jp.has("sourceBitrate")) {
        camera.source_bitrate = (int)jp.getNumber("sourceBitrate");
    }
    last_modified = util_now_ms();
}

void cls_settings::reset()
{
    defaults();
    CAMGATE_LOG(NTC, TYPE_STREAM, NO_ERRNO, _("Settings reset to defaults"));
}

/* Missing files keep the defaults and are written out */
int cls_settings::load()
{
    std::string data;
    JsonParser jp;
    bool have;

    have = false;
    if (util_file_read(dir + "/video.json", data) == 0) {
        if (jp.parse(data)) {
            update_video(jp);
            have = true;
        } else {
            CAMGATE_LOG(ERR, TYPE_STREAM, NO_ERRNO
                , _("Invalid %s/video.json: %s"), dir.c_str(), jp.getError().c_str());
        }
    }
    if (util_file_read(dir + "/camera.json", data) == 0) {
        jp = JsonParser();
        if (jp.parse(data)) {
            update_camera(jp);
            have = true;
        } else {
            CAMGATE_LOG(ERR, TYPE_STREAM, NO_ERRNO
                , _("Invalid %s/camera.json: %s"), dir.c_str(), jp.getError().c_str());
        }
    }

    if (have == false) {
        CAMGATE_LOG(INF, TYPE_STREAM, NO_ERRNO, _("Created default settings"));
        return save();
    }
    CAMGATE_LOG(INF, TYPE_STREAM, NO_ERRNO, _("Loaded settings from %s"), dir.c_str());
    return 0;
}

int cls_settings::save()
{
    last_modified = util_now_ms();
    if (mycreate_path((dir + "/").c_str()) != 0) {
        return -1;
    }
    if (util_file_write(dir + "/video.json", video_json()) != 0) {
        return -1;
    }
    return util_file_write(dir + "/camera.json", camera_json());
}

bool cls_settings::output_size(int &width, int &height)
{
    width = 0;
    height = 0;
    if (video.resolution == "source") {
        return false;
    }
    if (video.resolution == "custom") {
        if ((video.custom_width > 0) && (video.custom_height > 0)) {
            width = video.custom_width;
            height = video.custom_height;
            return true;
        }
        return false;
    }
    return settings_resolution_preset(video.resolution, width, height);
}

/* Encoder, scaling, audio and HLS options after the input */
void cls_settings::output_args(std::vector<std::string> &args)
{
    int wd, ht;
    char vf[256];

    args.push_back("-c:v");
    args.push_back("libx264");
    args.push_back("-preset");
    args.push_back(video.preset);
    args.push_back("-tune");
    args.push_back("zerolatency");
    args.push_back("-b:v");
    args.push_back(video.bitrate);
    args.push_back("-maxrate");
    args.push_back(video.bitrate);
    args.push_back("-bufsize");
    args.push_back(std::to_string(mtoi(video.bitrate) * 2) + "k");

    if (output_size(wd, ht)) {
        snprintf(vf, sizeof(vf)
            , "scale=%d:%d:force_original_aspect_ratio=decrease"
              ",pad=%d:%d:(ow-iw)/2:(oh-ih)/2"
            , wd, ht, wd, ht);
        args.push_back("-vf");
        args.push_back(vf);
    }

    if (video.fps > 0) {
        args.push_back("-r");
        args.push_back(std::to_string(video.fps));
    }

    if (video.audio_enabled) {
        args.push_back("-c:a");
        args.push_back("aac");
        args.push_back("-b:a");
        args.push_back(video.audio_bitrate);
        args.push_back("-ar");
        args.push_back("44100");
    } else {
        args.push_back("-an");
    }

    args.push_back("-f");
    args.push_back("hls");
    args.push_back("-hls_time");
    args.push_back(std::to_string(video.segment_duration));
    args.push_back("-hls_list_size");
    args.push_back(std::to_string(video.playlist_size));
    args.push_back("-hls_flags");
    args.push_back("delete_segments+append_list");
}

std::string cls_settings::video_json()
{
    std::string resp;

    resp  = "{";
    resp += "\"outputResolution\":\"" + util_json_escape(video.resolution) + "\"";
    if (video.custom_width > 0) {
        resp += ",\"customWidth\":" + std::to_string(video.custom_width);
    }
    if (video.custom_height > 0) {
        resp += ",\"customHeight\":" + std::to_string(video.custom_height);
    }
    resp += ",\"outputFps\":" + std::to_string(video.fps);
    resp += ",\"outputBitrate\":\"" + util_json_escape(video.bitrate) + "\"";
    resp += ",\"qualityPreset\":\"" + util_json_escape(video.preset) + "\"";
    resp += ",\"hlsSegmentDuration\":" + std::to_string(video.segment_duration);
    resp += ",\"hlsPlaylistSize\":" + std::to_string(video.playlist_size);
    resp += ",\"audioEnabled\":" + std::string(video.audio_enabled ? "true" : "false");
    resp += ",\"audioBitrate\":\"" + util_json_escape(video.audio_bitrate) + "\"";
    resp += ",\"lastModified\":\"" + util_iso_time(last_modified) + "\"";
    resp += "}";

    return resp;
}

std::string cls_settings::camera_json()
{
    std::string resp, sep;

    resp = "{";
    sep = "";
    if (camera.source_resolution != "") {
        resp += "\"sourceResolution\":\"" + util_json_escape(camera.source_resolution) + "\"";
        sep = ",";
    }
    if (camera.source_fps > 0) {
        resp += sep + "\"sourceFps\":" + std::to_string(camera.source_fps);
        sep = ",";
    }
    if (camera.source_gov_length > 0) {
        resp += sep + "\"sourceGovLength\":" + std::to_string(camera.source_gov_length);
        sep = ",";
    }
    if (camera.source_bitrate > 0) {
        resp += sep + "\"sourceBitrate\":" + std::to_string(camera.source_bitrate);
    }
    resp += "}";

    return resp;
}
