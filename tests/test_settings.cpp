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

#include "test_support.hpp"

static bool has_pair(const std::vector<std::string> &args, std::string key, std::string val)
{
    size_t indx;

    for (indx = 0; indx + 1 < args.size(); indx++) {
        if ((args[indx] == key) && (args[indx + 1] == val)) {
            return true;
        }
    }
    return false;
}

TEST(Settings, OutOfRangeValuesAreClamped)
{
    cls_settings st("/nonexistent");
    JsonParser jp;

    ASSERT_TRUE(jp.parse("{\"outputFps\":120,\"hlsSegmentDuration\":0"
        ",\"hlsPlaylistSize\":50,\"customWidth\":100,\"customHeight\":9000"
        ",\"outputResolution\":\"4k\",\"qualityPreset\":\"placebo-ish\""
        ",\"outputBitrate\":\"fast\"}"));
    st.update_video(jp);

    EXPECT_EQ(st.video.fps, 60);
    EXPECT_EQ(st.video.segment_duration, 1);
    EXPECT_EQ(st.video.playlist_size, 20);
    EXPECT_EQ(st.video.custom_width, 320);
    EXPECT_EQ(st.video.custom_height, 2160);
    EXPECT_EQ(st.video.resolution, "source");
    EXPECT_EQ(st.video.preset, "ultrafast");
    EXPECT_EQ(st.video.bitrate, "2000k");
}

TEST(Settings, PartialUpdateKeepsOtherFields)
{
    cls_settings st("/nonexistent");
    JsonParser jp;

    ASSERT_TRUE(jp.parse("{\"outputResolution\":\"720p\",\"audioEnabled\":false}"));
    st.update_video(jp);

    EXPECT_EQ(st.video.resolution, "720p");
    EXPECT_FALSE(st.video.audio_enabled);
    EXPECT_EQ(st.video.fps, 0);
    EXPECT_EQ(st.video.preset, "ultrafast");
    EXPECT_EQ(st.video.segment_duration, 2);
}

TEST(Settings, EncoderArguments)
{
    cls_settings st("/nonexistent");
    JsonParser jp;
    std::vector<std::string> args;
    int wd, ht;

    EXPECT_FALSE(st.output_size(wd, ht));

    ASSERT_TRUE(jp.parse("{\"outputResolution\":\"custom\",\"customWidth\":1024"
        ",\"customHeight\":576,\"outputFps\":15,\"outputBitrate\":\"1500k\"}"));
    st.update_video(jp);
    ASSERT_TRUE(st.output_size(wd, ht));
    EXPECT_EQ(wd, 1024);
    EXPECT_EQ(ht, 576);

    st.output_args(args);
    EXPECT_TRUE(has_pair(args, "-b:v", "1500k"));
    EXPECT_TRUE(has_pair(args, "-bufsize", "3000k"));
    EXPECT_TRUE(has_pair(args, "-r", "15"));
    EXPECT_TRUE(has_pair(args, "-f", "hls"));
    EXPECT_TRUE(has_pair(args, "-c:a", "aac"));
}

TEST(Settings, SaveCreatesFilesAndResetRestores)
{
    cls_test_dir tmp;
    cls_settings st(tmp.path + "/settings");
    cls_settings other(tmp.path + "/settings");
    JsonParser jp;

    ASSERT_EQ(st.load(), 0);
    EXPECT_TRUE(util_file_exists(tmp.path + "/settings/video.json"));
    EXPECT_TRUE(util_file_exists(tmp.path + "/settings/camera.json"));

    ASSERT_TRUE(jp.parse("{\"outputResolution\":\"480p\",\"sourceFps\":20}"));
    st.update_video(jp);
    st.update_camera(jp);
    ASSERT_EQ(st.save(), 0);

    ASSERT_EQ(other.load(), 0);
    EXPECT_EQ(other.video.resolution, "480p");
    EXPECT_EQ(other.camera.source_fps, 20);

    other.reset();
    EXPECT_EQ(other.video.resolution, "source");
    EXPECT_EQ(other.camera.source_fps, 0);
}

TEST(Settings, NamedResolutions)
{
    int wd, ht;

    ASSERT_TRUE(settings_resolution_preset("1080p", wd, ht));
    EXPECT_EQ(wd, 1920);
    EXPECT_EQ(ht, 1080);
    ASSERT_TRUE(settings_resolution_preset("360p", wd, ht));
    EXPECT_EQ(wd, 640);
    EXPECT_FALSE(settings_resolution_preset("8k", wd, ht));
}
