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
#ifndef _INCLUDE_WEBU_POST_HPP_
#define _INCLUDE_WEBU_POST_HPP_

    class cls_webu_post {
        public:
            cls_webu_post(cls_webu_ans *webua);
            ~cls_webu_post();
            void main();

        private:
            cls_camgate     *app;
            cls_webu        *webu;
            cls_webu_ans    *webua;
            cls_gateway     *gw;
            JsonParser      jp;

            bool parse_body();
            std::string action_group(std::string cmd);
            void resp_result(bool success, std::string extra = "");
            void resp_error(unsigned int code, std::string msg);
            bool ptz_check();
            int64_t ts_get();

            void action_motion();
            void action_detection();
            void action_ptz_move();
            void action_ptz_stop();
            void action_ptz_home();
            void action_ptz_preset();
            void action_ptz_preset_set();
            void action_ptz_preset_delete();
            void action_snapshot();
            void action_recording_start();
            void action_recording_stop();
            void action_clip_delete();
            void action_settings();
            void action_settings_reset();
            void action_settings_apply();
            void action_preset_save();
            void action_preset_goto();
            void action_preset_delete();
            void action_schedule_add();
            void action_schedule_delete();
            void action_patrol_start();
            void action_patrol_stop();
            void action_time_sync();
            void action_notify_test();
            void process_actions(std::string cmd);
    };

#endif /* _INCLUDE_WEBU_POST_HPP_ */
