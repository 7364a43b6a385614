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

TEST(Process, RunCollectsOutput)
{
    std::string out;
    std::vector<std::string> args = {"/bin/sh", "-c", "echo first; echo second 1>&2"};

    ASSERT_EQ(process_run(args, 5000, TYPE_CORE, &out), 0);
    EXPECT_NE(out.find("first\n"), std::string::npos);
    EXPECT_NE(out.find("second\n"), std::string::npos);
}

TEST(Process, RunReportsFailure)
{
    std::vector<std::string> fails = {"/bin/sh", "-c", "exit 3"};
    std::vector<std::string> missing = {"/nonexistent/camgate-prog"};

    EXPECT_EQ(process_run(fails, 5000, TYPE_CORE, nullptr), -1);
    EXPECT_EQ(process_run(missing, 5000, TYPE_CORE, nullptr), -1);
}

TEST(Process, MissingProgramIsSpawnError)
{
    cls_process proc("missing", TYPE_CORE);

    proc.oneshot = true;
    proc.args = {"/nonexistent/camgate-prog"};
    EXPECT_EQ(proc.start(), -1);
    EXPECT_EQ(proc.err, CG_ERR_SPAWN);
    EXPECT_FALSE(proc.running());
}

TEST(Process, CrashedChildRestartsWithDelay)
{
    cls_process proc("crasher", TYPE_CORE);
    int64_t deadline;
    int exits;
    size_t indx;

    proc.args = {"/bin/sh", "-c", "exit 1"};
    proc.restart_delay = 100;
    proc.restart_max = 2;
    exits = 0;
    proc.on_exit = [&exits](int code) {
        EXPECT_EQ(code, 1);
        exits++;
    };

    ASSERT_EQ(proc.start(), 0);
    deadline = util_mono_ms() + 5000;
    while ((proc.finished() == false) && (util_mono_ms() < deadline)) {
        proc.poll(util_mono_ms());
        SLEEP(0, 10000000L);
    }

    EXPECT_TRUE(proc.finished());
    EXPECT_EQ(proc.state, PROC_CRASHED);
    EXPECT_EQ(proc.err, CG_ERR_CRASHED);
    EXPECT_EQ(proc.restart_cnt, 2);
    EXPECT_EQ(exits, 3);
    ASSERT_EQ(proc.start_times.size(), 3u);
    for (indx = 1; indx < proc.start_times.size(); indx++) {
        EXPECT_GE(proc.start_times[indx] - proc.start_times[indx - 1], 100);
    }
}

TEST(Process, StopEndsLongRunningChild)
{
    cls_process proc("sleeper", TYPE_CORE);
    std::vector<std::string> lines;

    proc.args = {"/bin/sh", "-c", "echo ready; exec sleep 30"};
    proc.on_line = [&lines](const std::string &line) {
        lines.push_back(line);
    };
    ASSERT_EQ(proc.start(), 0);
    EXPECT_TRUE(proc.running());

    SLEEP(0, 200000000L);
    proc.poll(util_mono_ms());
    proc.stop(SIGTERM, 2000);

    EXPECT_FALSE(proc.running());
    EXPECT_EQ(proc.state, PROC_STOPPED);
    ASSERT_GE(lines.size(), 1u);
    EXPECT_EQ(lines[0], "ready");
}
