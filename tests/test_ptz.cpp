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

TEST(PtzCgi, DirectionFromVector)
{
    EXPECT_EQ(ptz_cgi_direction(-1, 0, 0), "Left");
    EXPECT_EQ(ptz_cgi_direction(0.5, 0, 0), "Right");
    EXPECT_EQ(ptz_cgi_direction(0, 0.5, 0), "Up");
    EXPECT_EQ(ptz_cgi_direction(0, -0.5, 0), "Down");
    EXPECT_EQ(ptz_cgi_direction(-0.5, 0.5, 0), "LeftUp");
    EXPECT_EQ(ptz_cgi_direction(0.5, -0.5, 0), "RightDown");
    EXPECT_EQ(ptz_cgi_direction(0, 0, 0.5), "ZoomTele");
    EXPECT_EQ(ptz_cgi_direction(0, 0, -0.5), "ZoomWide");
    EXPECT_EQ(ptz_cgi_direction(0.05, -0.05, 0), "RightDown");
    EXPECT_EQ(ptz_cgi_direction(0.2, 0, 0.9), "Right");
    EXPECT_EQ(ptz_cgi_direction(0, 0, 0), "");
}

TEST(PtzCgi, SpeedScale)
{
    EXPECT_EQ(ptz_cgi_speed(1.0, 0, 0), 8);
    EXPECT_EQ(ptz_cgi_speed(0.5, 0, 0), 4);
    EXPECT_EQ(ptz_cgi_speed(0, -0.25, 0), 2);
    EXPECT_EQ(ptz_cgi_speed(0.01, 0, 0), 1);
    EXPECT_EQ(ptz_cgi_speed(3.0, 0, 0), 8);
}

TEST(PtzCgi, BackendSelection)
{
    EXPECT_EQ(ptz_backend_select("auto", "Amcrest", "IP5M-1190EW"), PTZ_BACKEND_CGI);
    EXPECT_EQ(ptz_backend_select("auto", "Unknown", "IP4M-1026B"), PTZ_BACKEND_CGI);
    EXPECT_EQ(ptz_backend_select("auto", "Reolink", "RLC-823A"), PTZ_BACKEND_ONVIF);
    EXPECT_EQ(ptz_backend_select("onvif", "Dahua", "SD49225"), PTZ_BACKEND_ONVIF);
    EXPECT_EQ(ptz_backend_select("cgi", "Reolink", "RLC-823A"), PTZ_BACKEND_CGI);
}

TEST(PtzCgi, MoveStopsPreviousDirection)
{
    cls_fake_http fake;
    cls_ptz_cgi ptz(&fake, "10.0.0.5", 80, "admin", "secret", 1, 1000);

    fake.reply = [](const ctx_http_req &, ctx_http_resp &resp) {
        resp.body = "OK\r\n";
    };

    ASSERT_TRUE(ptz.pan_left(1.0));
    ASSERT_EQ(fake.reqs.size(), 1u);
    EXPECT_EQ(fake.reqs[0].url, "http://10.0.0.5:80/cgi-bin/ptz.cgi?action=start"
        "&channel=1&code=Left&arg1=0&arg2=8&arg3=0");
    EXPECT_EQ(ptz.current_code(), "Left");

    ASSERT_TRUE(ptz.tilt_up(0.5));
    ASSERT_EQ(fake.reqs.size(), 3u);
    EXPECT_NE(fake.reqs[1].url.find("action=stop&channel=1&code=Left"), std::string::npos);
    EXPECT_NE(fake.reqs[2].url.find("action=start&channel=1&code=Up&arg1=0&arg2=4")
        , std::string::npos);

    ASSERT_TRUE(ptz.stop());
    EXPECT_NE(fake.reqs.back().url.find("action=stop&channel=1&code=Up"), std::string::npos);
    EXPECT_EQ(ptz.current_code(), "");
}

TEST(PtzCgi, FailedStartLeavesMovementUnknown)
{
    cls_fake_http fake;
    cls_ptz_cgi ptz(&fake, "10.0.0.5", 80, "admin", "secret", 1, 1000);
    std::vector<std::string> stops;
    size_t indx;

    fake.reply = [](const ctx_http_req &req, ctx_http_resp &resp) {
        if (req.url.find("action=start&channel=1&code=Up") != std::string::npos) {
            resp.status = 500;
            resp.body = "Error";
            return;
        }
        resp.body = "OK";
    };

    ASSERT_TRUE(ptz.pan_left(1.0));
    EXPECT_EQ(ptz.current_code(), "Left");

    EXPECT_FALSE(ptz.tilt_up(0.5));
    ASSERT_EQ(fake.reqs.size(), 3u);
    EXPECT_NE(fake.reqs[1].url.find("action=stop&channel=1&code=Left"), std::string::npos);
    EXPECT_EQ(ptz.current_code(), "");

    fake.reqs.clear();
    ASSERT_TRUE(ptz.stop());
    for (indx = 0; indx < fake.reqs.size(); indx++) {
        EXPECT_NE(fake.reqs[indx].url.find("action=stop"), std::string::npos);
        stops.push_back(fake.reqs[indx].url);
    }
    ASSERT_EQ(stops.size(), 6u);
    EXPECT_NE(stops[0].find("code=Up&"), std::string::npos);
    EXPECT_NE(stops[1].find("code=Down&"), std::string::npos);
    EXPECT_NE(stops[2].find("code=Left&"), std::string::npos);
    EXPECT_NE(stops[3].find("code=Right&"), std::string::npos);
    EXPECT_NE(stops[4].find("code=ZoomTele&"), std::string::npos);
    EXPECT_NE(stops[5].find("code=ZoomWide&"), std::string::npos);
}

TEST(PtzCgi, DigestChallengeIsAnswered)
{
    cls_fake_http fake;
    cls_ptz_cgi ptz(&fake, "10.0.0.5", 80, "admin", "secret", 1, 1000);

    fake.reply = [](const ctx_http_req &req, ctx_http_resp &resp) {
        if (req.headers.find("Authorization") == req.headers.end()) {
            resp.status = 401;
            resp.headers["www-authenticate"] =
                "Digest realm=\"Login to 4L0C\", qop=\"auth\", nonce=\"1234\"";
            return;
        }
        resp.body = "OK";
    };

    ASSERT_TRUE(ptz.goto_preset("3"));
    ASSERT_EQ(fake.reqs.size(), 2u);
    EXPECT_EQ(fake.reqs[1].headers["Authorization"].find("Digest username=\"admin\""), 0u);
    EXPECT_NE(fake.reqs[1].headers["Authorization"].find(
        "uri=\"/cgi-bin/ptz.cgi?action=start&channel=1&code=GotoPreset&arg1=0&arg2=3&arg3=0\"")
        , std::string::npos);
}

TEST(PtzCgi, RejectedCredentialsAreAuthError)
{
    cls_fake_http fake;
    cls_ptz_cgi ptz(&fake, "10.0.0.5", 80, "admin", "wrong", 1, 1000);

    fake.reply = [](const ctx_http_req &, ctx_http_resp &resp) {
        resp.status = 401;
        resp.headers["www-authenticate"] = "Digest realm=\"cam\", nonce=\"1\"";
    };

    EXPECT_FALSE(ptz.go_home());
    EXPECT_NE(ptz.errmsg.find("rejected"), std::string::npos);
}

TEST(PtzCgi, CapabilitiesFollowProbeReply)
{
    cls_fake_http fake;
    cls_ptz_cgi ptz(&fake, "10.0.0.5", 80, "admin", "secret", 1, 1000);
    ctx_ptz_caps caps;

    fake.reply = [](const ctx_http_req &, ctx_http_resp &resp) {
        resp.status = 404;
        resp.body = "Error";
    };
    caps = ptz.get_capabilities();
    EXPECT_FALSE(caps.supported);
    EXPECT_FALSE(caps.continuous);
    EXPECT_TRUE(ptz.caps_cached());
}

TEST(PtzCgi, AnsweredCgiClaimsMovementOnly)
{
    cls_fake_http fake;
    cls_ptz_cgi ptz(&fake, "10.0.0.5", 80, "admin", "secret", 1, 1000);
    ctx_ptz_caps caps;

    fake.reply = [](const ctx_http_req &, ctx_http_resp &resp) {
        resp.body = "OK\r\n";
    };
    caps = ptz.get_capabilities();
    EXPECT_TRUE(caps.supported);
    EXPECT_TRUE(caps.continuous);
    EXPECT_FALSE(caps.presets);
    EXPECT_FALSE(caps.home);
    EXPECT_FALSE(caps.absolute);
    ASSERT_EQ(fake.reqs.size(), 1u);
    EXPECT_NE(fake.reqs[0].url.find("action=stop&channel=1&code=Up&arg1=0&arg2=0&arg3=0")
        , std::string::npos);
}

static void *ptz_caps_thread(void *arg)
{
    cls_fake_ptz *ptz = (cls_fake_ptz *)arg;
    ptz->get_capabilities();
    return nullptr;
}

TEST(Ptz, CapabilitiesProbedOnceUnderConcurrency)
{
    cls_fake_ptz ptz;
    pthread_t thrd[4];
    int indx;

    ptz.probe_ms = 50;
    for (indx = 0; indx < 4; indx++) {
        ASSERT_EQ(pthread_create(&thrd[indx], nullptr, ptz_caps_thread, &ptz), 0);
    }
    for (indx = 0; indx < 4; indx++) {
        pthread_join(thrd[indx], nullptr);
    }
    EXPECT_EQ(ptz.probes, 1);
    EXPECT_TRUE(ptz.get_capabilities().continuous);
    EXPECT_EQ(ptz.probes, 1);
}

TEST(Ptz, ConvenienceMovesUseDefaultSpeed)
{
    cls_fake_ptz ptz;
    std::vector<std::string> calls;

    ptz.pan_right();
    ptz.tilt_down();
    ptz.zoom_in();
    ptz.zoom_out();
    calls = ptz.call_list();
    ASSERT_EQ(calls.size(), 4u);
    EXPECT_EQ(calls[0], "move Right");
    EXPECT_EQ(calls[1], "move Down");
    EXPECT_EQ(calls[2], "move ZoomTele");
    EXPECT_EQ(calls[3], "move ZoomWide");
}
