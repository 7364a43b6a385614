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

class RecorderTest : public ::testing::Test {
    protected:
        cls_test_dir    tmp;
        cls_config      *cfg;
        cls_recorder    *rec;

        void SetUp() override
        {
            cfg = test_config(tmp.path);
            rec = new cls_recorder(cfg, nullptr, "cam1");
            rec->max_clips = 100;
            rec->max_bytes = 1024 * 1024;
            rec->max_age_days = 0;
            ASSERT_EQ(rec->ensure_dirs(), 0);
        }
        void TearDown() override
        {
            delete rec;
            delete cfg;
        }
        void clip(std::string id, size_t sz, int64_t age_sec)
        {
            test_write_file(rec->clip_path(id), sz, age_sec);
        }
        void snap(std::string id, size_t sz, int64_t age_sec)
        {
            test_write_file(rec->snap_dir + "/" + id + ".jpg", sz, age_sec);
        }
};

TEST_F(RecorderTest, DirectoriesUnderDataDir)
{
    EXPECT_EQ(rec->clip_dir, tmp.path + "/recordings");
    EXPECT_EQ(rec->snap_dir, tmp.path + "/snapshots");
    EXPECT_EQ(rec->clip_path("clip_1"), tmp.path + "/recordings/clip_1.mp4");
    EXPECT_EQ(rec->thumb_path("clip_1"), tmp.path + "/recordings/clip_1_thumb.jpg");
}

TEST_F(RecorderTest, EvictsOldestBeyondClipCount)
{
    vec_clip clips;

    clip("clip_a", 100, 400);
    clip("clip_b", 100, 300);
    clip("clip_c", 100, 200);
    clip("clip_d", 100, 100);
    rec->max_clips = 2;

    EXPECT_EQ(rec->evict(), 2);
    rec->list_clips(clips);
    ASSERT_EQ(clips.size(), 2u);
    EXPECT_EQ(clips[0].id, "clip_d");
    EXPECT_EQ(clips[1].id, "clip_c");
}

TEST_F(RecorderTest, EvictsOldestFilesBeyondByteLimit)
{
    vec_clip clips;
    vec_snapshot snaps;
    ctx_storage_stats st;

    clip("clip_a", 1000, 400);
    snap("snapshot_1", 1000, 300);
    clip("clip_b", 1000, 200);
    clip("clip_c", 1000, 100);
    rec->max_bytes = 2500;

    EXPECT_EQ(rec->evict(), 2);
    rec->list_clips(clips);
    rec->list_snapshots(snaps);
    ASSERT_EQ(clips.size(), 2u);
    EXPECT_EQ(clips[0].id, "clip_c");
    EXPECT_EQ(clips[1].id, "clip_b");
    EXPECT_EQ(snaps.size(), 0u);

    st = rec->storage_stats();
    EXPECT_EQ(st.used_bytes, 2000);
    EXPECT_EQ(st.clip_count, 2);
    EXPECT_LE(st.used_bytes, st.max_bytes);
}

TEST_F(RecorderTest, ThumbnailLeavesWithItsClip)
{
    vec_clip clips;

    clip("clip_a", 100, 300);
    test_write_file(rec->thumb_path("clip_a"), 10, 300);
    clip("clip_b", 100, 100);
    rec->max_clips = 1;

    EXPECT_EQ(rec->evict(), 1);
    EXPECT_FALSE(util_file_exists(rec->thumb_path("clip_a")));
    rec->list_clips(clips);
    ASSERT_EQ(clips.size(), 1u);
    EXPECT_EQ(clips[0].thumb_path, "");
}

TEST_F(RecorderTest, OrphanThumbnailCountsAndEvicts)
{
    vec_clip clips;

    test_write_file(rec->thumb_path("clip_gone"), 1000, 500);
    clip("clip_a", 1000, 300);
    test_write_file(rec->thumb_path("clip_a"), 100, 300);
    clip("clip_b", 1000, 100);
    rec->max_bytes = 2200;

    EXPECT_EQ(rec->evict(), 1);
    EXPECT_FALSE(util_file_exists(rec->thumb_path("clip_gone")));
    EXPECT_TRUE(util_file_exists(rec->thumb_path("clip_a")));
    rec->list_clips(clips);
    EXPECT_EQ(clips.size(), 2u);
    EXPECT_EQ(rec->storage_stats().used_bytes, 2100);
}

TEST_F(RecorderTest, AgeSweepRemovesOldFiles)
{
    clip("clip_old", 100, 3 * 86400);
    snap("snapshot_old", 100, 3 * 86400);
    clip("clip_new", 100, 60);
    rec->max_age_days = 1;

    EXPECT_EQ(rec->sweep_age(util_now_ms()), 2);
    EXPECT_FALSE(util_file_exists(rec->clip_path("clip_old")));
    EXPECT_TRUE(util_file_exists(rec->clip_path("clip_new")));
}

TEST_F(RecorderTest, DeleteValidatesId)
{
    clip("clip_a", 100, 10);

    EXPECT_EQ(rec->delete_clip("../clip_a"), -1);
    EXPECT_EQ(rec->delete_clip("clip_zz"), -1);
    EXPECT_EQ(rec->delete_clip("clip_a"), 0);
    EXPECT_FALSE(util_file_exists(rec->clip_path("clip_a")));
}

TEST(Recorder, ValidIds)
{
    EXPECT_TRUE(recorder_valid_id("clip_1700000000000"));
    EXPECT_TRUE(recorder_valid_id("manual-1"));
    EXPECT_FALSE(recorder_valid_id(""));
    EXPECT_FALSE(recorder_valid_id("a/b"));
    EXPECT_FALSE(recorder_valid_id("a.mp4"));
    EXPECT_FALSE(recorder_valid_id(std::string(65, 'a')));
}
