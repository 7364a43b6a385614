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
#include "webu.hpp"
#include "webu_ans.hpp"
#include "webu_json.hpp"

TEST(Webu, ApiKeyComparison)
{
    EXPECT_TRUE(webu_key_match("s3cret-key", "s3cret-key"));
    EXPECT_FALSE(webu_key_match("s3cret-key", "s3cret-kez"));
    EXPECT_FALSE(webu_key_match("s3cret-key", "s3cret"));
    EXPECT_FALSE(webu_key_match("s3cret-key", ""));
    EXPECT_TRUE(webu_key_match("", ""));
}

TEST(Webu, Numbers)
{
    EXPECT_EQ(webu_num(0.5), "0.5");
    EXPECT_EQ(webu_num(12), "12");
    EXPECT_EQ(webu_num(0.123456), "0.1235");
    EXPECT_EQ(webu_num(NAN), "null");
    EXPECT_EQ(webu_bool(true), "true");
}

TEST(Webu, ClipDocumentIsValidJson)
{
    ctx_clip clip;
    JsonParser jp;

    clip.id = "clip_1700000000000";
    clip.device_id = "cam1";
    clip.started_at = 1700000000000;
    clip.ended_at = 1700000015000;
    clip.duration_ms = 15000;
    clip.file_path = "/data/recordings/clip_1700000000000.mp4";
    clip.thumb_path = "";
    clip.snapshot_path = "";
    clip.trigger.source = TRIGGER_DETECTION;
    clip.trigger.timestamp = clip.started_at;
    clip.trigger.confidence = 0.875;
    clip.trigger.species = "Carolina \"Wren\"";
    clip.size_bytes = 2048;

    ASSERT_TRUE(jp.parse(webu_clip_json(clip))) << jp.getError();
    EXPECT_EQ(jp.getString("id"), clip.id);
    EXPECT_EQ(jp.getString("startedAt"), "2023-11-14T22:13:20.000Z");
    EXPECT_TRUE(jp.isNull("thumbnail"));
    EXPECT_EQ(jp.getString("trigger.source"), "detection");
    EXPECT_DOUBLE_EQ(jp.getNumber("trigger.confidence"), 0.875);
    EXPECT_EQ(jp.getString("trigger.species"), "Carolina \"Wren\"");
    EXPECT_EQ(jp.getNumber("sizeBytes"), 2048);
}

TEST(Webu, PatrolDocument)
{
    ctx_patrol patrol;
    JsonParser jp;

    patrol.enabled = true;
    patrol.preset_ids = {"preset_1", "preset_2"};
    patrol.dwell_sec = 45;
    patrol.loop = false;

    ASSERT_TRUE(jp.parse(webu_patrol_json(patrol))) << jp.getError();
    EXPECT_EQ(jp.getList("presetIds").size(), 2u);
    EXPECT_EQ(jp.getNumber("dwellSeconds"), 45);
    EXPECT_FALSE(jp.getBool("loop", true));
}

TEST(Webu, BindOptionsForLoopbackOnly)
{
    ctx_webu_bind wbind;
    int indx;
    bool has_addr;

    webu_bind_setup(wbind, 8099, true, false, nullptr);

    EXPECT_FALSE(wbind.ipv6);
    EXPECT_EQ(wbind.flags, (unsigned int)MHD_USE_THREAD_PER_CONNECTION);
    ASSERT_EQ(wbind.ops_cnt, 5);
    EXPECT_EQ(wbind.ops[wbind.ops_cnt - 1].option, MHD_OPTION_END);

    has_addr = false;
    for (indx = 0; indx < wbind.ops_cnt; indx++) {
        if (wbind.ops[indx].option == MHD_OPTION_SOCK_ADDR) {
            has_addr = true;
            EXPECT_EQ(wbind.ops[indx].ptr_value, (void *)&wbind.lpbk_ipv4);
        }
        if (wbind.ops[indx].option == MHD_OPTION_CONNECTION_TIMEOUT) {
            EXPECT_EQ(wbind.ops[indx].value, 120);
        }
    }
    EXPECT_TRUE(has_addr);
    EXPECT_EQ(wbind.lpbk_ipv4.sin_family, AF_INET);
    EXPECT_EQ(ntohs(wbind.lpbk_ipv4.sin_port), 8099);
    EXPECT_EQ(ntohl(wbind.lpbk_ipv4.sin_addr.s_addr), (uint32_t)INADDR_LOOPBACK);
}

TEST(Webu, BindOptionsForAllAddresses)
{
    ctx_webu_bind wbind;
    int indx;
    bool have_ipv6;

    webu_bind_setup(wbind, 8099, false, true, nullptr);

    have_ipv6 = (MHD_is_feature_supported(MHD_FEATURE_IPv6) == MHD_YES);
    EXPECT_EQ(wbind.ipv6, have_ipv6);
    EXPECT_EQ((wbind.flags & MHD_USE_DUAL_STACK) == MHD_USE_DUAL_STACK, have_ipv6);
    ASSERT_EQ(wbind.ops_cnt, 4);
    for (indx = 0; indx < wbind.ops_cnt; indx++) {
        EXPECT_NE(wbind.ops[indx].option, MHD_OPTION_SOCK_ADDR);
    }
}
