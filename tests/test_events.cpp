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

class PipelineTest : public ::testing::Test {
    protected:
        cls_test_dir            tmp;
        cls_config              *cfg;
        cls_recorder            *rec;
        cls_pipeline            *pipe;
        cls_evtbus<ctx_clip>    bus_clip;

        void SetUp() override
        {
            cfg = test_config(tmp.path);
            cfg->edit_set("record_cooldown", "15000");
            cfg->edit_set("max_concurrent_clips", "1");
            rec = new cls_recorder(cfg, nullptr, "cam1");
            pipe = new cls_pipeline(cfg, rec, &bus_clip);
        }
        void TearDown() override
        {
            delete pipe;
            delete rec;
            delete cfg;
        }
};

TEST_F(PipelineTest, CooldownAndConcurrencyGate)
{
    EXPECT_EQ(pipe->cooldown_ms, 15000);
    EXPECT_EQ(pipe->max_concurrent, 1);

    EXPECT_TRUE(pipe->gate(100000));
    EXPECT_EQ(pipe->active_clips, 1);

    /* Inside the cooldown */
    pipe->release();
    EXPECT_FALSE(pipe->gate(105000));

    /* Past the cooldown but a clip is still running */
    EXPECT_TRUE(pipe->gate(116000));
    EXPECT_FALSE(pipe->gate(140000));
    EXPECT_EQ(pipe->dropped, 2);

    pipe->release();
    EXPECT_TRUE(pipe->gate(140000));
    EXPECT_EQ(pipe->last_accept, 140000);
}

TEST_F(PipelineTest, FirstTriggerAlwaysPasses)
{
    pipe->cooldown_ms = 3600000;
    EXPECT_TRUE(pipe->gate(5));
    pipe->release();
    pipe->release();
    EXPECT_EQ(pipe->active_clips, 0);
}

TEST_F(PipelineTest, ClipIdsUniqueWithinOneMillisecond)
{
    std::string first, second, third;

    first = pipe->clip_new_id(1700000000123);
    second = pipe->clip_new_id(1700000000123);
    EXPECT_EQ(first, "clip_1700000000123");
    EXPECT_EQ(second, "clip_1700000000123_1");
    EXPECT_TRUE(recorder_valid_id(second));

    /* A clip already on disk is never overwritten */
    ASSERT_EQ(rec->ensure_dirs(), 0);
    util_file_write(rec->clip_path("clip_1700000000124"), "mp4");
    third = pipe->clip_new_id(1700000000124);
    EXPECT_EQ(third, "clip_1700000000124_1");
    EXPECT_NE(third, first);
}

TEST(Pipeline, ChunkNumbers)
{
    EXPECT_EQ(pipeline_chunk_nbr("chunk00042.ts"), 42);
    EXPECT_EQ(pipeline_chunk_nbr("chunk7.ts"), 7);
    EXPECT_EQ(pipeline_chunk_nbr("chunk.ts"), -1);
    EXPECT_EQ(pipeline_chunk_nbr("chunk12.mp4"), -1);
    EXPECT_EQ(pipeline_chunk_nbr("chunk1a.ts"), -1);
    EXPECT_EQ(pipeline_chunk_nbr("clip_1.ts"), -1);
}

TEST(Analyzer, ScoreLines)
{
    double score;

    ASSERT_TRUE(analyzer_parse_score("lavfi.scd.score=12.500", score));
    EXPECT_DOUBLE_EQ(score, 12.5);
    ASSERT_TRUE(analyzer_parse_score("[Parsed_metadata_1 @ 0x5581] lavfi.scd.score=0.08", score));
    EXPECT_DOUBLE_EQ(score, 0.08);
    EXPECT_FALSE(analyzer_parse_score("lavfi.scd.mafd=3.2", score));
    EXPECT_FALSE(analyzer_parse_score("frame:10 pts:400 pts_time:0.4", score));
}

TEST(Analyzer, MotionPeriodsAndCooldown)
{
    cls_test_dir tmp;
    cls_config *cfg = test_config(tmp.path);
    cls_evtbus<ctx_motion_evt> bus;
    std::vector<ctx_motion_evt> evts;

    cls_analyzer *anl = new cls_analyzer(cfg, &bus);
    anl->min_duration = 0;
    anl->cooldown = 5000;
    bus.subscribe([&evts](const ctx_motion_evt &evt) {
        evts.push_back(evt);
    });

    anl->on_score(0.01, 1000);
    EXPECT_EQ(evts.size(), 0u);
    EXPECT_FALSE(anl->in_motion);

    anl->on_score(0.3, 2000);
    ASSERT_EQ(evts.size(), 1u);
    EXPECT_TRUE(evts[0].active);
    EXPECT_NEAR(evts[0].confidence, 30.0, 0.001);

    anl->on_score(0.4, 3000);
    EXPECT_EQ(evts.size(), 1u);

    anl->check_end(6000);
    EXPECT_EQ(evts.size(), 1u);
    anl->check_end(9000);
    ASSERT_EQ(evts.size(), 2u);
    EXPECT_FALSE(evts[1].active);
    EXPECT_FALSE(anl->in_motion);

    /* New period, the cooldown since the last event has passed */
    anl->on_score(2.0, 9500);
    ASSERT_EQ(evts.size(), 3u);
    EXPECT_TRUE(evts[2].active);
    EXPECT_DOUBLE_EQ(evts[2].confidence, 100.0);

    delete anl;
    delete cfg;
}

TEST(Analyzer, MinimumDurationDelaysEvent)
{
    cls_test_dir tmp;
    cls_config *cfg = test_config(tmp.path);
    cls_evtbus<ctx_motion_evt> bus;
    int cnt = 0;

    cls_analyzer *anl = new cls_analyzer(cfg, &bus);
    anl->min_duration = 1000;
    anl->cooldown = 5000;
    bus.subscribe([&cnt](const ctx_motion_evt &evt) {
        if (evt.active) {
            cnt++;
        }
    });

    anl->on_score(0.2, 1000);
    anl->on_score(0.2, 1500);
    EXPECT_EQ(cnt, 0);
    anl->on_score(0.2, 2000);
    EXPECT_EQ(cnt, 1);

    /* A short burst that ends before the minimum emits nothing */
    anl->check_end(8000);
    anl->on_score(0.2, 20000);
    anl->check_end(26000);
    EXPECT_EQ(cnt, 1);
    EXPECT_FALSE(anl->in_motion);

    delete anl;
    delete cfg;
}

TEST(Analyzer, ThresholdFollowsSensitivity)
{
    cls_test_dir tmp;
    cls_config *cfg = test_config(tmp.path);
    cls_evtbus<ctx_motion_evt> bus;
    cls_analyzer *anl = new cls_analyzer(cfg, &bus);

    anl->sensitivity = 0;
    EXPECT_DOUBLE_EQ(anl->threshold(), 0.5);
    anl->sensitivity = 100;
    EXPECT_NEAR(anl->threshold(), 0.05, 1e-9);
    anl->sensitivity = 250;
    EXPECT_NEAR(anl->threshold(), 0.05, 1e-9);

    delete anl;
    delete cfg;
}

TEST(Stream, ProgressLine)
{
    ctx_stream_stats st;

    st.fps = 0;
    st.frames = 0;
    ASSERT_TRUE(stream_parse_stats("frame=  120 fps= 25 q=28.0 size=     512kB"
        " time=00:00:04.80 bitrate= 873.2kbits/s speed=1.01x", st));
    EXPECT_EQ(st.frames, 120);
    EXPECT_DOUBLE_EQ(st.fps, 25.0);
    EXPECT_EQ(st.timemark, "00:00:04.80");
    EXPECT_EQ(st.bitrate, "873.2kbits/s");

    EXPECT_FALSE(stream_parse_stats("Input #0, rtsp, from 'rtsp://cam/live':", st));
}

TEST(Tunnel, QuickUrlFromOutput)
{
    cls_test_dir tmp;
    cls_config *cfg = test_config(tmp.path);
    cls_tunnel *tun;
    std::vector<std::string> args;

    cfg->tunnel_quick = true;
    tun = new cls_tunnel(cfg);
    tun->build_args(args);
    ASSERT_GE(args.size(), 5u);
    EXPECT_EQ(args[3], "--url");

    tun->state = TUNNEL_STARTING;
    tun->on_line("INF Requesting new quick Tunnel on trycloudflare.com...");
    EXPECT_EQ(tun->state, TUNNEL_STARTING);
    EXPECT_EQ(tun->url_any(), tun->local_url());

    tun->on_line("INF |  https://shy-forest-1a2b.trycloudflare.com  |");
    EXPECT_EQ(tun->state, TUNNEL_ESTABLISHED);
    EXPECT_EQ(tun->public_url(), "https://shy-forest-1a2b.trycloudflare.com");

    delete tun;
    delete cfg;
}

TEST(Tunnel, NamedTunnelUsesHostname)
{
    cls_test_dir tmp;
    cls_config *cfg = test_config(tmp.path);
    cls_tunnel *tun;

    cfg->tunnel_quick = false;
    cfg->tunnel_token = "tok";
    cfg->tunnel_hostname = "feeder.example.org";
    tun = new cls_tunnel(cfg);
    tun->state = TUNNEL_STARTING;
    tun->on_line("INF Registered tunnel connection connIndex=0");
    EXPECT_EQ(tun->state, TUNNEL_ESTABLISHED);
    EXPECT_EQ(tun->public_url(), "https://feeder.example.org");

    delete tun;
    delete cfg;
}

TEST(EventBus, SubscribersAndUnsubscribe)
{
    cls_evtbus<ctx_trigger> bus;
    ctx_trigger trg;
    int cnt_a = 0, cnt_b = 0;
    int id_a;

    id_a = bus.subscribe([&cnt_a](const ctx_trigger &) { cnt_a++; });
    bus.subscribe([&cnt_b](const ctx_trigger &t) {
        EXPECT_EQ(t.source, TRIGGER_MANUAL);
        cnt_b++;
    });
    EXPECT_EQ(bus.count(), 2u);

    trg.source = TRIGGER_MANUAL;
    trg.timestamp = 1;
    trg.confidence = -1;
    bus.publish(trg);
    bus.unsubscribe(id_a);
    bus.publish(trg);

    EXPECT_EQ(cnt_a, 1);
    EXPECT_EQ(cnt_b, 2);
    EXPECT_EQ(trigger_source_nbr(trigger_source_str(TRIGGER_DETECTION)), TRIGGER_DETECTION);
}
