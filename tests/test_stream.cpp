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
#include "gateway.hpp"

/* Shell script standing in for ffmpeg or the relay */
static std::string test_script(std::string dir, std::string name, std::string body)
{
    std::string fname;

    fname = dir + "/" + name;
    util_file_write(fname, "#!/bin/sh\n" + body);
    chmod(fname.c_str(), 0755);
    return fname;
}

/* Poll until pred holds or timeout_ms passes */
static bool test_poll_until(cls_stream &stream, int timeout_ms
    , std::function<bool()> pred)
{
    int64_t deadline;

    deadline = util_mono_ms() + timeout_ms;
    while (util_mono_ms() < deadline) {
        stream.poll(util_mono_ms());
        if (pred()) {
            return true;
        }
        SLEEP(0, 10000000L);
    }
    return false;
}

TEST(Stream, CrashRestartsAfterDelayAndFreezesStats)
{
    cls_test_dir dir;
    cls_config *cfg;
    cls_settings settings(dir.path);
    cls_evtbus<ctx_stream_evt> bus;
    std::vector<ctx_stream_evt> evts;
    ctx_stream_stats st;
    int64_t crashed_at, restarted_at;
    size_t indx;
    int crashes;

    cfg = test_config(dir.path);
    cfg->hls_dir = dir.path + "/hls";
    cfg->stream_mode = "hls";
    cfg->stream_restart_delay = 1;
    cfg->stream_max_restarts = 1;
    cfg->ffmpeg_path = test_script(dir.path, "ffmpeg"
        , "echo 'frame=   10 fps= 15 q=20.0 size=     100kB time=00:00:01.00 "
          "bitrate=1200.5kbits/s speed=1x'\nexit 1\n");

    bus.subscribe([&evts](const ctx_stream_evt &evt) {
        if (evt.relay == false) {
            evts.push_back(evt);
        }
    });

    {
        cls_stream stream(cfg, &settings, &bus);
        EXPECT_EQ(stream.state, STREAM_IDLE);
        ASSERT_EQ(stream.start(), 0);

        crashes = 0;
        EXPECT_TRUE(test_poll_until(stream, 6000, [&evts, &crashes]() {
            crashes = 0;
            for (size_t i = 0; i < evts.size(); i++) {
                if (evts[i].state == STREAM_CRASHED) {
                    crashes++;
                }
            }
            return (crashes == 2);
        }));

        /* The restart budget is spent, so it stays down */
        SLEEP(1, 200000000L);
        stream.poll(util_mono_ms());
        EXPECT_EQ(stream.state, STREAM_CRASHED);

        st = stream.stats();
        EXPECT_EQ(st.frames, 10);
        EXPECT_DOUBLE_EQ(st.fps, 15);
        EXPECT_EQ(st.bitrate, "1200.5kbits/s");
        EXPECT_EQ(st.timemark, "00:00:01.00");
        EXPECT_NE(stream.json().find("\"restarts\":1"), std::string::npos);

        stream.stop();
        EXPECT_EQ(stream.state, STREAM_STOPPED);
    }

    ASSERT_EQ(evts.size(), 7u);
    EXPECT_EQ(evts[0].state, STREAM_STARTING);
    EXPECT_EQ(evts[1].state, STREAM_RUNNING);
    EXPECT_EQ(evts[2].state, STREAM_CRASHED);
    EXPECT_EQ(evts[3].state, STREAM_STARTING);
    EXPECT_EQ(evts[4].state, STREAM_RUNNING);
    EXPECT_EQ(evts[5].state, STREAM_CRASHED);
    EXPECT_EQ(evts[6].state, STREAM_STOPPED);

    crashed_at = 0;
    restarted_at = 0;
    for (indx = 0; indx < evts.size(); indx++) {
        if ((evts[indx].state == STREAM_CRASHED) && (crashed_at == 0)) {
            crashed_at = evts[indx].timestamp;
        } else if ((evts[indx].state == STREAM_STARTING) && (crashed_at != 0)) {
            restarted_at = evts[indx].timestamp;
            break;
        }
    }
    EXPECT_GE(restarted_at - crashed_at, 950);

    delete cfg;
}

TEST(Stream, RelayExitFallsBackToTranscode)
{
    cls_test_dir dir;
    cls_config *cfg;
    cls_settings settings(dir.path);
    cls_evtbus<ctx_stream_evt> bus;
    std::vector<ctx_stream_evt> relay_evts;
    bool was_relay;

    cfg = test_config(dir.path);
    cfg->hls_dir = dir.path + "/hls";
    cfg->stream_mode = "relay";
    cfg->relay_port = 1;
    cfg->stream_restart_delay = 1;
    cfg->ffmpeg_path = test_script(dir.path, "ffmpeg"
        , "echo 'frame=    5 fps= 10 time=00:00:00.50 bitrate=800.0kbits/s'\n"
          "exec sleep 30\n");
    cfg->relay_path = test_script(dir.path, "relay"
        , "echo 'api listen=:1984'\nsleep 1\nexit 1\n");

    bus.subscribe([&relay_evts](const ctx_stream_evt &evt) {
        if (evt.relay) {
            relay_evts.push_back(evt);
        }
    });

    {
        cls_stream stream(cfg, &settings, &bus);
        EXPECT_TRUE(stream.relay_wanted);
        ASSERT_EQ(stream.start(), 0);
        EXPECT_TRUE(util_file_exists(cfg->hls_dir + "/relay.yaml"));

        was_relay = false;
        EXPECT_TRUE(test_poll_until(stream, 6000, [&stream, &was_relay]() {
            if (stream.mode() == "relay") {
                was_relay = true;
            }
            return (stream.relay_wanted == false);
        }));

        EXPECT_TRUE(was_relay);
        EXPECT_EQ(stream.mode(), "transcode");
        EXPECT_FALSE(stream.relay_ready);
        EXPECT_EQ(stream.state, STREAM_RUNNING);
        EXPECT_EQ(stream.json().find("\"relay\":{"), std::string::npos);

        stream.stop();
        EXPECT_EQ(stream.state, STREAM_STOPPED);
    }

    ASSERT_EQ(relay_evts.size(), 2u);
    EXPECT_EQ(relay_evts[0].state, STREAM_RUNNING);
    EXPECT_EQ(relay_evts[1].state, STREAM_STOPPED);

    delete cfg;
}

TEST(Gateway, NoSourceRefusesToStart)
{
    cls_test_dir dir;
    cls_gateway gw(nullptr);

    gw.cfg = test_config(dir.path);
    gw.cfg->rtsp_url = "";
    gw.cfg->onvif_enabled = false;

    EXPECT_EQ(gw.init(), -1);
    EXPECT_EQ(gw.status, GATEWAY_FAILED);
    EXPECT_EQ(gw.stream, nullptr);
    EXPECT_EQ(gw.notify, nullptr);

    gw.deinit();
    EXPECT_NE(gw.status, GATEWAY_RUNNING);
}

TEST(Gateway, EmptyDiscoveryRefusesToStart)
{
    cls_test_dir dir;
    cls_gateway gw(nullptr);

    gw.cfg = test_config(dir.path);
    gw.cfg->rtsp_url = "";
    gw.cfg->onvif_enabled = true;
    gw.cfg->onvif_host = "";
    gw.cfg->onvif_auto_discover = true;
    gw.cfg->onvif_discover_timeout = 1;

    EXPECT_EQ(gw.init(), -1);
    EXPECT_EQ(gw.status, GATEWAY_FAILED);
    EXPECT_EQ(gw.stream, nullptr);

    gw.deinit();
    EXPECT_NE(gw.status, GATEWAY_RUNNING);
}
