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

TEST(JsonParse, NestedObjectsFlatten)
{
    JsonParser jp;

    ASSERT_TRUE(jp.parse("{\"ntfy\":{\"enabled\":true,\"topic\":\"yard\"}"
        ",\"speed\":0.75,\"name\":null,\"tags\":[\"a\",\"b\"]}"));
    EXPECT_TRUE(jp.getBool("ntfy.enabled"));
    EXPECT_EQ(jp.getString("ntfy.topic"), "yard");
    EXPECT_DOUBLE_EQ(jp.getNumber("speed"), 0.75);
    EXPECT_TRUE(jp.isNull("name"));
    EXPECT_EQ(jp.getList("tags"), JsonParser::JsonList({"a", "b"}));
    EXPECT_EQ(jp.children("ntfy").size(), 2u);
    EXPECT_FALSE(jp.has("missing"));
    EXPECT_EQ(jp.getString("missing", "dflt"), "dflt");
}

TEST(JsonParse, ArraysOfObjectsUseIndex)
{
    JsonParser jp;

    ASSERT_TRUE(jp.parse("{\"items\":[{\"token\":\"p1\"},{\"token\":\"p2\"}]}"));
    EXPECT_EQ(jp.getString("items.0.token"), "p1");
    EXPECT_EQ(jp.getString("items.1.token"), "p2");
}

TEST(JsonParse, EscapesAndUnicode)
{
    JsonParser jp;

    ASSERT_TRUE(jp.parse("{\"msg\":\"a\\\"b\\n\\u00e9\"}"));
    EXPECT_EQ(jp.getString("msg"), "a\"b\n\xc3\xa9");
}

TEST(JsonParse, RejectsMalformed)
{
    JsonParser jp;

    EXPECT_FALSE(jp.parse("{\"a\":1,}"));
    EXPECT_NE(jp.getError(), "");
    EXPECT_FALSE(jp.parse("{\"a\":tru}"));
    EXPECT_FALSE(jp.parse("[1,2"));
}

TEST(Util, IsoTime)
{
    EXPECT_EQ(util_iso_time(0), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(util_iso_time(1700000000123), "2023-11-14T22:13:20.123Z");
    EXPECT_EQ(util_parse_iso("2023-11-14T22:13:20.123Z"), 1700000000123);
    EXPECT_EQ(util_parse_iso("yesterday"), -1);
}

TEST(Util, ParmsParse)
{
    ctx_params params;

    util_parms_parse(&params, "test", "codec=h264, width=1280,height=720");
    util_parms_add_default(&params, "width", "640");
    util_parms_add_default(&params, "fps", 15);

    ASSERT_EQ(params.params_cnt, 4);
    EXPECT_EQ(params.params_array[0].param_name, "codec");
    EXPECT_EQ(params.params_array[1].param_value, "1280");
    EXPECT_EQ(params.params_array[3].param_name, "fps");
    EXPECT_EQ(params.params_array[3].param_value, "15");
}
