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

#ifndef _INCLUDE_ANALYZER_HPP_
#define _INCLUDE_ANALYZER_HPP_

#define ANALYZER_MIN_SCORE      0.05    /* Scene score that counts as activity */
#define ANALYZER_RESTART_DELAY  5000    /* ms */

/* Scene change motion detection from the ffmpeg scdet filter */
class cls_analyzer {
    public:
        cls_analyzer(cls_config *p_cfg, cls_evtbus<ctx_motion_evt> *p_bus_motion);
        ~cls_analyzer();

        std::string     source_url;
        int             sensitivity;
        int             min_duration;   /* ms */
        int             cooldown;       /* ms */
        bool            in_motion;
        int64_t         motion_start;
        int64_t         last_activity;
        int64_t         last_event;
        double          last_score;
        int             events;

        double threshold();
        int start();
        void stop();
        bool running();
        void poll(int64_t now_mono);
        void on_score(double score, int64_t now_ms);
        void check_end(int64_t now_ms);
        std::string json();

    private:
        cls_config                  *cfg;
        cls_evtbus<ctx_motion_evt>  *bus_motion;
        cls_process                 *proc;
        bool                        emitted;

        void on_line(const std::string &line);
};

    bool analyzer_parse_score(const std::string &line, double &score);

#endif /* _INCLUDE_ANALYZER_HPP_ */
