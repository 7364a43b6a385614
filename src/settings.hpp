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

#ifndef _INCLUDE_SETTINGS_HPP_
#define _INCLUDE_SETTINGS_HPP_

struct ctx_video_settings {
    std::string     resolution;     /* source, custom or a named preset */
    int             custom_width;
    int             custom_height;
    int             fps;            /* 0 keeps the source rate */
    std::string     bitrate;
    std::string     preset;
    int             segment_duration;
    int             playlist_size;
    bool            audio_enabled;
    std::string     audio_bitrate;
};

/* Requested encoder profile on the camera itself, 0/"" when unset */
struct ctx_camera_settings {
    std::string     source_resolution;
    int             source_fps;
    int             source_gov_length;
    int             source_bitrate;
};

class cls_settings {
    public:
        cls_settings(std::string p_dir);
        ~cls_settings();

        ctx_video_settings      video;
        ctx_camera_settings     camera;
        int64_t                 last_modified;

        int load();
        int save();
        void reset();
        void update_video(JsonParser &jp);
        void update_camera(JsonParser &jp);

        bool output_size(int &width, int &height);
        void output_args(std::vector<std::string> &args);

        std::string video_json();
        std::string camera_json();

    private:
        std::string     dir;

        void defaults();
        void clamp();
};

    bool settings_resolution_preset(std::string name, int &width, int &height);

#endif /* _INCLUDE_SETTINGS_HPP_ */
