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

#include "camgate.hpp"
#include "util.hpp"
#include "evtbus.hpp"

const char *trigger_source_str(enum TRIGGER_SOURCE src)
{
    if (src == TRIGGER_MOTION) {
        return "motion";
    } else if (src == TRIGGER_DETECTION) {
        return "detection";
    } else {
        return "manual";
    }
}

enum TRIGGER_SOURCE trigger_source_nbr(std::string src)
{
    if (src == "motion") {
        return TRIGGER_MOTION;
    } else if (src == "detection") {
        return TRIGGER_DETECTION;
    } else {
        return TRIGGER_MANUAL;
    }
}

const char *stream_state_str(enum STREAM_STATE st)
{
    switch (st) {
    case STREAM_IDLE:       return "idle";
    case STREAM_STARTING:   return "starting";
    case STREAM_RUNNING:    return "running";
    case STREAM_CRASHED:    return "crashed";
    case STREAM_STOPPED:    return "stopped";
    }
    return "unknown";
}
