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

static std::vector<std::string> goto_calls(cls_fake_ptz &ptz)
{
    std::vector<std::string> calls, retcd;
    size_t indx;

    calls = ptz.call_list();
    for (indx = 0; indx < calls.size(); indx++) {
        if (mystarts(calls[indx], "goto ")) {
            retcd.push_back(calls[indx].substr(5));
        }
    }
    return retcd;
}

class PresetTest : public ::testing::Test {
    protected:
        cls_test_dir    tmp;
        cls_dbse        *dbse;
        cls_preset      *preset;
        cls_fake_ptz    ptz;

        void SetUp() override
        {
            dbse = new cls_dbse(tmp.path + "/camgate.db", 1000);
            ASSERT_TRUE(dbse->is_ready());
            preset = new cls_preset(dbse, "cam1");
            preset->set_ptz(&ptz);
        }
        void TearDown() override
        {
            delete preset;
            delete dbse;
        }
        std::string make(std::string name)
        {
            ctx_saved_preset pset;
            EXPECT_EQ(preset->create(name, "", {}, pset), 0);
            SLEEP(0, 2000000L);
            return pset.id;
        }
};

TEST(Preset, CronParse)
{
    int mn, hr;

    ASSERT_TRUE(preset_cron_parse("30 6 * * *", mn, hr));
    EXPECT_EQ(mn, 30);
    EXPECT_EQ(hr, 6);
    ASSERT_TRUE(preset_cron_parse("  0   18 * * * ", mn, hr));
    EXPECT_EQ(hr, 18);

    EXPECT_FALSE(preset_cron_parse("60 6 * * *", mn, hr));
    EXPECT_FALSE(preset_cron_parse("0 24 * * *", mn, hr));
    EXPECT_FALSE(preset_cron_parse("*/5 * * * *", mn, hr));
    EXPECT_FALSE(preset_cron_parse("0 6 * * 1", mn, hr));
    EXPECT_FALSE(preset_cron_parse("0 6", mn, hr));
}

TEST(Preset, NeedsPtz)
{
    cls_preset preset(nullptr, "cam1");
    ctx_saved_preset pset;

    EXPECT_EQ(preset.create("Feeder", "", {}, pset), -1);
    EXPECT_EQ(preset.go("preset_1"), -1);
    EXPECT_EQ(preset.patrol_start({"preset_1"}, 10, true), -1);
}

TEST_F(PresetTest, CreateGoAndDelete)
{
    ctx_saved_preset pset;
    vec_saved_preset psets;

    ASSERT_EQ(preset->create("Feeder", "Left feeder", {"feeder", "seed"}, pset), 0);
    EXPECT_EQ(pset.ptz_token, "1");
    EXPECT_EQ(pset.last_used, 0);

    ASSERT_TRUE(preset->get(pset.id, pset));
    EXPECT_EQ(pset.name, "Feeder");
    ASSERT_EQ(pset.tags.size(), 2u);
    EXPECT_EQ(pset.tags[1], "seed");

    ASSERT_EQ(preset->go(pset.id), 0);
    EXPECT_EQ(goto_calls(ptz), std::vector<std::string>({"1"}));
    ASSERT_TRUE(preset->get(pset.id, pset));
    EXPECT_GT(pset.last_used, 0);

    ASSERT_EQ(preset->update(pset.id, "Feeder L", "moved", {}), 0);
    preset->list(psets);
    ASSERT_EQ(psets.size(), 1u);
    EXPECT_EQ(psets[0].name, "Feeder L");
    EXPECT_EQ(psets[0].tags.size(), 0u);

    ASSERT_EQ(preset->remove(pset.id), 0);
    EXPECT_FALSE(preset->get(pset.id, pset));
    EXPECT_EQ(preset->go(pset.id), -1);
}

TEST_F(PresetTest, PatrolVisitsInOrderWithDwell)
{
    std::string id1, id2;

    id1 = make("Feeder");
    id2 = make("Bath");

    ASSERT_EQ(preset->patrol_start({id1, id2}, 10, false), 0);
    EXPECT_TRUE(preset->patrol_active());

    preset->poll(1000, 0);
    EXPECT_EQ(goto_calls(ptz).size(), 1u);
    preset->poll(5000, 0);
    EXPECT_EQ(goto_calls(ptz).size(), 1u);
    preset->poll(11000, 0);
    ASSERT_EQ(goto_calls(ptz).size(), 2u);
    EXPECT_EQ(goto_calls(ptz)[0], "1");
    EXPECT_EQ(goto_calls(ptz)[1], "2");

    EXPECT_FALSE(preset->patrol_active());
    EXPECT_EQ(preset->patrol_config().dwell_sec, 10);
}

TEST_F(PresetTest, DeletingPresetLeavesPatrol)
{
    std::string id1, id2;

    id1 = make("Feeder");
    id2 = make("Bath");

    ASSERT_EQ(preset->patrol_start({id1, id2}, 10, true), 0);
    ASSERT_EQ(preset->remove(id1), 0);
    EXPECT_EQ(preset->patrol_config().preset_ids.size(), 1u);
    ASSERT_EQ(preset->remove(id2), 0);
    EXPECT_FALSE(preset->patrol_active());
}

TEST_F(PresetTest, ScheduleFiresOncePerMinute)
{
    ctx_sched_preset sched;
    std::string id;
    struct tm tm_at;
    time_t tnow;
    int64_t at_ms;

    id = make("Feeder");
    ASSERT_EQ(preset->schedule_add(id, "30 6 * * *", sched), 0);
    EXPECT_EQ(preset->schedule_add("preset_missing", "30 6 * * *", sched), -1);
    EXPECT_EQ(preset->schedule_add(id, "bad", sched), -1);
    ASSERT_EQ(preset->schedules().size(), 1u);

    tnow = time(NULL);
    localtime_r(&tnow, &tm_at);
    tm_at.tm_hour = 6;
    tm_at.tm_min = 30;
    tm_at.tm_sec = 5;
    tm_at.tm_isdst = -1;
    at_ms = (int64_t)mktime(&tm_at) * 1000;

    preset->poll(1000, at_ms - 60000);
    EXPECT_EQ(goto_calls(ptz).size(), 0u);
    preset->poll(2000, at_ms);
    EXPECT_EQ(goto_calls(ptz).size(), 1u);
    preset->poll(3000, at_ms + 20000);
    EXPECT_EQ(goto_calls(ptz).size(), 1u);

    ASSERT_EQ(preset->schedule_remove(preset->schedules()[0].id), 0);
    EXPECT_EQ(preset->schedules().size(), 0u);
}
