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

#ifndef _INCLUDE_TUNNEL_HPP_
#define _INCLUDE_TUNNEL_HPP_

#define TUNNEL_READY_WAIT       30000       /* ms */

enum TUNNEL_STATE {
    TUNNEL_DISABLED,
    TUNNEL_STARTING,
    TUNNEL_ESTABLISHED,
    TUNNEL_FAILED
};

class cls_tunnel {
    public:
        cls_tunnel(cls_config *p_cfg);
        ~cls_tunnel();

        enum TUNNEL_STATE   state;
        bool                quick;
        enum CG_ERR         err;

        int start();
        void stop();
        void poll(int64_t now_mono);
        void on_line(const std::string &line);

        std::string public_url();
        std::string local_url();
        std::string url_any();
        std::string json();
        void build_args(std::vector<std::string> &args);

    private:
        cls_config      *cfg;
        cls_process     *proc;
        std::string     url;
        int64_t         ready_deadline;
        int             restart_seen;

        void established(std::string p_url);
};

    const char *tunnel_state_str(enum TUNNEL_STATE st);

#endif /* _INCLUDE_TUNNEL_HPP_ */
