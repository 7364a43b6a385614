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

static ctx_clip test_clip(std::string id, int64_t started)
{
    ctx_clip clip;

    clip.id = id;
    clip.device_id = "cam1";
    clip.started_at = started;
    clip.ended_at = started + 15000;
    clip.duration_ms = 15000;
    clip.file_path = "/data/recordings/" + id + ".mp4";
    clip.thumb_path = "";
    clip.snapshot_path = "";
    clip.trigger.source = TRIGGER_DETECTION;
    clip.trigger.timestamp = started;
    clip.trigger.confidence = 0.91;
    clip.trigger.species = "Northern Cardinal";
    clip.size_bytes = 123456;
    return clip;
}

TEST(Dbse, ClipsListedNewestFirst)
{
    cls_test_dir tmp;
    cls_dbse dbse(tmp.path + "/camgate.db", 1000);
    vec_clip clips;

    ASSERT_TRUE(dbse.is_ready());
    ASSERT_EQ(dbse.clip_add(test_clip("clip_1", 1000)), 0);
    ASSERT_EQ(dbse.clip_add(test_clip("clip_2", 2000)), 0);

    dbse.clip_list("cam1", clips);
    ASSERT_EQ(clips.size(), 2u);
    EXPECT_EQ(clips[0].id, "clip_2");
    EXPECT_EQ(clips[0].trigger.source, TRIGGER_DETECTION);
    EXPECT_EQ(clips[0].trigger.species, "Northern Cardinal");
    EXPECT_NEAR(clips[0].trigger.confidence, 0.91, 0.0001);
    EXPECT_EQ(clips[0].size_bytes, 123456);
    EXPECT_EQ(dbse.clip_count("cam1"), 2);
    EXPECT_EQ(dbse.clip_count("cam2"), 0);

    ASSERT_EQ(dbse.clip_delete("clip_1"), 0);
    EXPECT_EQ(dbse.clip_count("cam1"), 1);
}

TEST(Dbse, QuotingSurvivesApostrophes)
{
    cls_test_dir tmp;
    cls_dbse dbse(tmp.path + "/camgate.db", 1000);
    ctx_sighting sight;
    vec_sighting sights;

    EXPECT_EQ(dbse_quote("Cooper's Hawk"), "'Cooper''s Hawk'");

    sight.device_id = "cam1";
    sight.species = "Cooper's Hawk";
    sight.confidence = 0.7;
    sight.timestamp = 5000;
    sight.clip_id = "";
    ASSERT_EQ(dbse.sighting_add(sight), 0);

    EXPECT_TRUE(dbse.species_seen("cam1", "cooper's hawk"));
    EXPECT_FALSE(dbse.species_seen("cam1", "Blue Jay"));
    EXPECT_FALSE(dbse.species_seen("cam2", "Cooper's Hawk"));

    dbse.sighting_list("cam1", 10, sights);
    ASSERT_EQ(sights.size(), 1u);
    EXPECT_EQ(sights[0].species, "Cooper's Hawk");
}

TEST(Dbse, NotifyLogLimit)
{
    cls_test_dir tmp;
    cls_dbse dbse(tmp.path + "/camgate.db", 1000);
    ctx_notify_log nlog;
    vec_notify_log nlogs;
    int indx;

    for (indx = 0; indx < 5; indx++) {
        nlog.device_id = "cam1";
        nlog.timestamp = 1000 + indx;
        nlog.type = "motion";
        nlog.title = "Motion " + std::to_string(indx);
        nlog.sent = (indx % 2) == 0;
        ASSERT_EQ(dbse.notify_log_add(nlog), 0);
    }
    dbse.notify_log_list("cam1", 3, nlogs);
    ASSERT_EQ(nlogs.size(), 3u);
    EXPECT_EQ(nlogs[0].title, "Motion 4");
    EXPECT_TRUE(nlogs[0].sent);
    EXPECT_FALSE(nlogs[1].sent);
}

TEST(Dbse, ReopenKeepsData)
{
    cls_test_dir tmp;
    vec_clip clips;

    {
        cls_dbse dbse(tmp.path + "/camgate.db", 1000);
        ASSERT_EQ(dbse.clip_add(test_clip("clip_9", 9000)), 0);
    }
    cls_dbse dbse(tmp.path + "/camgate.db", 1000);
    dbse.clip_list("cam1", clips);
    ASSERT_EQ(clips.size(), 1u);
    EXPECT_EQ(clips[0].id, "clip_9");
}

TEST(Dbse, UnopenableFileIsNotReady)
{
    cls_dbse dbse("/nonexistent/dir/camgate.db", 1000);

    EXPECT_FALSE(dbse.is_ready());
    EXPECT_EQ(dbse.clip_add(test_clip("clip_1", 1000)), -1);
}
