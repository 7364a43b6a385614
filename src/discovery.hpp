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

#ifndef _INCLUDE_DISCOVERY_HPP_
#define _INCLUDE_DISCOVERY_HPP_

#define WSD_MCAST_ADDR      "239.255.255.250"
#define WSD_MCAST_PORT      3702

struct ctx_discovered {
    std::string     name;
    std::string     address;
    int             port;
    std::string     xaddr;
    std::string     manufacturer;
    std::string     model;
};
typedef std::vector<ctx_discovered> vec_discovered;

class cls_discovery {
    public:
        cls_discovery();
        ~cls_discovery();

        int     timeout_sec;
        std::string probe_id;           /* MessageID of the last probe */

        int probe(vec_discovered &cams);
        std::string probe_msg();
        int parse_match(const std::string &body, const std::string &srcip
            , ctx_discovered &cam);
        void add_unique(vec_discovered &cams, ctx_discovered &cam);

    private:
        std::string scope_value(std::vector<std::string> &scopes
            , const char *key);
};

#endif /* _INCLUDE_DISCOVERY_HPP_ */
