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

static ctx_notify_payload test_payload(enum NOTIFY_PRIORITY prio)
{
    ctx_notify_payload payload;

    payload.type = NOTIFY_CUSTOM;
    payload.title = "Test";
    payload.message = "Hello from the feeder";
    payload.priority = prio;
    return payload;
}

TEST(Notify, MinutesParse)
{
    EXPECT_EQ(notify_minutes("00:00"), 0);
    EXPECT_EQ(notify_minutes("07:30"), 450);
    EXPECT_EQ(notify_minutes("23:59"), 1439);
    EXPECT_EQ(notify_minutes("24:00"), -1);
    EXPECT_EQ(notify_minutes("noon"), -1);
}

TEST(Notify, QuietHoursAcrossMidnight)
{
    cls_notify ntf("", nullptr, nullptr, "cam1");

    ntf.settings.quiet_start = "22:00";
    ntf.settings.quiet_end = "07:00";
    EXPECT_TRUE(ntf.is_quiet_at(23 * 60));
    EXPECT_TRUE(ntf.is_quiet_at(0));
    EXPECT_TRUE(ntf.is_quiet_at(6 * 60 + 59));
    EXPECT_FALSE(ntf.is_quiet_at(7 * 60));
    EXPECT_FALSE(ntf.is_quiet_at(12 * 60));

    ntf.settings.quiet_start = "12:00";
    ntf.settings.quiet_end = "14:00";
    EXPECT_TRUE(ntf.is_quiet_at(13 * 60));
    EXPECT_FALSE(ntf.is_quiet_at(14 * 60));

    ntf.settings.quiet_enabled = false;
    EXPECT_FALSE(ntf.is_quiet_at(13 * 60));
}

TEST(Notify, UrgentBypassesQuietHours)
{
    cls_fake_http fake;
    cls_notify ntf("", &fake, nullptr, "cam1");

    ntf.settings.ntfy_enabled = true;
    ntf.settings.ntfy_topic = "birds";

    EXPECT_FALSE(ntf.send(test_payload(NOTIFY_PRIO_HIGH), 23 * 60, 1000000));
    EXPECT_EQ(fake.reqs.size(), 0u);
    EXPECT_EQ(ntf.attempts, 0);

    EXPECT_TRUE(ntf.send(test_payload(NOTIFY_PRIO_URGENT), 23 * 60, 1000000));
    ASSERT_EQ(fake.reqs.size(), 1u);
    EXPECT_EQ(fake.reqs[0].headers["Priority"], "5");
}

TEST(Notify, RateLimitsByIntervalAndHour)
{
    cls_fake_http fake;
    cls_notify ntf("", &fake, nullptr, "cam1");
    int64_t t0 = 10000000;

    ntf.settings.quiet_enabled = false;
    ntf.settings.ntfy_enabled = true;
    ntf.settings.ntfy_topic = "birds";
    ntf.settings.min_interval = 60;
    ntf.settings.max_per_hour = 3;

    EXPECT_TRUE(ntf.send(test_payload(NOTIFY_PRIO_NORMAL), 600, t0));
    EXPECT_FALSE(ntf.send(test_payload(NOTIFY_PRIO_NORMAL), 600, t0 + 1000));
    EXPECT_TRUE(ntf.send(test_payload(NOTIFY_PRIO_NORMAL), 600, t0 + 61000));
    EXPECT_TRUE(ntf.send(test_payload(NOTIFY_PRIO_NORMAL), 600, t0 + 122000));
    EXPECT_FALSE(ntf.send(test_payload(NOTIFY_PRIO_NORMAL), 600, t0 + 183000));
    EXPECT_EQ(ntf.attempts, 3);

    /* The window slides after an hour */
    EXPECT_TRUE(ntf.send(test_payload(NOTIFY_PRIO_NORMAL), 600, t0 + 3600000 + 1));
    EXPECT_TRUE(ntf.is_rate_limited(t0 + 3600000 + 2));
}

TEST(Notify, FansOutToEveryChannel)
{
    cls_fake_http fake;
    cls_notify ntf("", &fake, nullptr, "cam1");
    vec_notify_log nlogs;
    size_t indx;
    bool pushover, ntfy, hook;

    ntf.settings.quiet_enabled = false;
    ntf.settings.pushover_enabled = true;
    ntf.settings.pushover_user = "u123";
    ntf.settings.pushover_token = "t456";
    ntf.settings.ntfy_enabled = true;
    ntf.settings.ntfy_topic = "birds";
    ntf.settings.ntfy_server = "ntfy.example.org/";
    ntf.settings.webhook_enabled = true;
    ntf.settings.webhook_url = "http://hooks.example.org/in";
    ntf.settings.webhook_headers["X-Token"] = "abc";

    fake.reply = [](const ctx_http_req &req, ctx_http_resp &resp) {
        if (req.url.find("hooks.example.org") != std::string::npos) {
            resp.status = 204;
        }
    };

    EXPECT_TRUE(ntf.send(test_payload(NOTIFY_PRIO_NORMAL), 600, 5000000));
    ASSERT_EQ(fake.reqs.size(), 3u);

    pushover = ntfy = hook = false;
    for (indx = 0; indx < fake.reqs.size(); indx++) {
        if (fake.reqs[indx].url == NOTIFY_PUSHOVER_URL) {
            pushover = true;
            EXPECT_NE(fake.reqs[indx].body.find("t456"), std::string::npos);
        } else if (fake.reqs[indx].url == "https://ntfy.example.org/birds") {
            ntfy = true;
            EXPECT_EQ(fake.reqs[indx].body, "Hello from the feeder");
            EXPECT_EQ(fake.reqs[indx].headers["Title"], "Test");
        } else if (fake.reqs[indx].url == "http://hooks.example.org/in") {
            hook = true;
            EXPECT_EQ(fake.reqs[indx].headers["X-Token"], "abc");
            EXPECT_NE(fake.reqs[indx].body.find("\"type\":\"custom\""), std::string::npos);
            EXPECT_NE(fake.reqs[indx].body.find("\"deviceId\":\"cam1\""), std::string::npos);
        }
    }
    EXPECT_TRUE(pushover);
    EXPECT_TRUE(ntfy);
    EXPECT_TRUE(hook);

    ntf.log_list(10, nlogs);
    ASSERT_EQ(nlogs.size(), 1u);
    EXPECT_TRUE(nlogs[0].sent);
    EXPECT_EQ(nlogs[0].type, "custom");
}

TEST(Notify, OneChannelSuccessIsEnough)
{
    cls_fake_http fake;
    cls_notify ntf("", &fake, nullptr, "cam1");

    ntf.settings.quiet_enabled = false;
    ntf.settings.ntfy_enabled = true;
    ntf.settings.ntfy_topic = "birds";
    ntf.settings.webhook_enabled = true;
    ntf.settings.webhook_url = "http://hooks.example.org/in";
    fake.reply = [](const ctx_http_req &req, ctx_http_resp &resp) {
        if (req.url.find("ntfy") != std::string::npos) {
            resp.status = 500;
        }
    };
    EXPECT_TRUE(ntf.send(test_payload(NOTIFY_PRIO_NORMAL), 600, 5000000));

    fake.reply = [](const ctx_http_req &, ctx_http_resp &resp) {
        resp.status = 503;
    };
    EXPECT_FALSE(ntf.send(test_payload(NOTIFY_PRIO_NORMAL), 600, 9000000));
    EXPECT_EQ(ntf.attempts, 2);
}

TEST(Notify, BirdKindsAndIgnoredSpecies)
{
    cls_fake_http fake;
    cls_notify ntf("", &fake, nullptr, "cam1");

    ntf.settings.quiet_enabled = false;
    ntf.settings.min_interval = 0;
    ntf.settings.ntfy_enabled = true;
    ntf.settings.ntfy_topic = "birds";
    ntf.settings.rare_species = {"Painted Bunting"};
    ntf.settings.ignored_species = {"House Sparrow"};

    EXPECT_TRUE(ntf.is_rare("painted bunting"));
    EXPECT_TRUE(ntf.is_ignored("HOUSE SPARROW"));

    EXPECT_FALSE(ntf.notify_bird("House Sparrow", 0.9, false, false));
    EXPECT_EQ(fake.reqs.size(), 0u);

    EXPECT_TRUE(ntf.notify_bird("Painted Bunting", 0.87, false, true));
    ASSERT_EQ(fake.reqs.size(), 1u);
    EXPECT_EQ(fake.reqs[0].headers["Title"], "Rare Bird Alert!");
    EXPECT_NE(fake.reqs[0].body.find("87%"), std::string::npos);

    EXPECT_TRUE(ntf.notify_bird("Blue Jay", 0.5, true, false));
    EXPECT_EQ(fake.reqs[1].headers["Title"], "New Species!");
    EXPECT_EQ(fake.reqs[1].headers["Tags"], "tada,bird");
}

TEST(Notify, SettingsPersist)
{
    cls_test_dir tmp;
    std::string fname = tmp.path + "/notify.json";
    cls_notify ntf(fname, nullptr, nullptr, "cam1");
    cls_notify reload(fname, nullptr, nullptr, "cam1");
    JsonParser jp;

    ASSERT_TRUE(jp.parse("{\"quietHoursStart\":\"21:30\",\"maxPerHour\":5,"
        "\"ntfy\":{\"enabled\":true,\"topic\":\"yard\"},"
        "\"webhook\":{\"url\":\"http://h/x\",\"headers\":{\"X-Key\":\"k\"}},"
        "\"rareSpecies\":[\"Snowy Owl\"],\"quietHoursEnd\":\"99:00\"}"));
    ntf.update(jp);
    EXPECT_EQ(ntf.settings.quiet_start, "21:30");
    EXPECT_EQ(ntf.settings.quiet_end, "07:00");
    EXPECT_EQ(ntf.settings.max_per_hour, 5);
    EXPECT_TRUE(ntf.settings.ntfy_enabled);
    EXPECT_EQ(ntf.settings.webhook_headers["X-Key"], "k");
    ASSERT_EQ(ntf.save(), 0);

    ASSERT_EQ(reload.load(), 0);
    EXPECT_EQ(reload.settings.ntfy_topic, "yard");
    EXPECT_EQ(reload.settings.quiet_start, "21:30");
    ASSERT_EQ(reload.settings.rare_species.size(), 1u);
    EXPECT_EQ(reload.settings.rare_species[0], "Snowy Owl");
    EXPECT_EQ(reload.settings.webhook_headers["X-Key"], "k");
}

TEST(Notify, PostedAlertsLeaveTheCallerFree)
{
    cls_fake_http fake;
    cls_notify ntf("", &fake, nullptr, "cam1");
    vec_notify_log nlogs;
    int64_t t0, waited;
    int waitcnt;

    ntf.settings.quiet_enabled = false;
    ntf.settings.min_interval = 0;
    ntf.settings.webhook_enabled = true;
    ntf.settings.webhook_url = "http://hooks.example.org/in";

    /* A channel that answers slowly */
    fake.reply = [](const ctx_http_req &, ctx_http_resp &resp) {
        SLEEP(0, 400000000L);
        resp.status = 204;
    };

    ntf.handler_startup();

    t0 = util_mono_ms();
    EXPECT_TRUE(ntf.post(test_payload(NOTIFY_PRIO_HIGH), 600, 5000000));
    waited = util_mono_ms() - t0;
    EXPECT_LT(waited, 200);
    EXPECT_EQ(ntf.attempts, 1);
    EXPECT_EQ(ntf.pending(), 1u);

    waitcnt = 0;
    while ((ntf.pending() > 0) && (waitcnt < 50)) {
        SLEEP(0, 100000000L);
        waitcnt++;
    }
    ASSERT_EQ(ntf.pending(), 0u);
    ASSERT_EQ(fake.reqs.size(), 1u);

    ntf.log_list(10, nlogs);
    ASSERT_EQ(nlogs.size(), 1u);
    EXPECT_TRUE(nlogs[0].sent);

    ntf.handler_shutdown();
}

TEST(Notify, PostedAlertsStillPassTheGates)
{
    cls_fake_http fake;
    cls_notify ntf("", &fake, nullptr, "cam1");

    ntf.settings.ntfy_enabled = true;
    ntf.settings.ntfy_topic = "birds";
    ntf.handler_startup();

    EXPECT_FALSE(ntf.post(test_payload(NOTIFY_PRIO_NORMAL), 23 * 60, 5000000));
    EXPECT_EQ(ntf.pending(), 0u);
    EXPECT_EQ(ntf.attempts, 0);

    ntf.handler_shutdown();
    EXPECT_EQ(fake.reqs.size(), 0u);
}
