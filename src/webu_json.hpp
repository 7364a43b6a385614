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
#ifndef _INCLUDE_WEBU_JSON_HPP_
#define _INCLUDE_WEBU_JSON_HPP_

    #define WEBUI_LIST_LIMIT    50      /* Default rows for log style listings */

    class cls_webu_json {
        public:
            cls_webu_json(cls_webu_ans *p_webua);
            ~cls_webu_json();
            void main();

        private:
            cls_camgate     *app;
            cls_webu        *webu;
            cls_webu_ans    *webua;

            int  limit_get();
            void status();
            void stream();
            void capabilities();
            void ptz_status();
            void ptz_presets();
            void clips();
            void snapshots();
            void storage();
            void settings();
            void presets();
            void camera_time();
            void sightings();
            void notify_log();
            void loghistory();
    };

    std::string webu_bool(bool val);
    std::string webu_num(double val);
    std::string webu_clip_json(const ctx_clip &clip);
    std::string webu_preset_json(const ctx_saved_preset &pset);
    std::string webu_patrol_json(const ctx_patrol &patrol);

#endif /* _INCLUDE_WEBU_JSON_HPP_ */
