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

#ifndef _INCLUDE_XML_HPP_
#define _INCLUDE_XML_HPP_

#include <pugixml.hpp>

/* Namespace-agnostic view over a parsed SOAP or WS-Discovery envelope */
class cls_xml {
    public:
        cls_xml();
        ~cls_xml();

        std::string     errmsg;

        bool parse(const std::string &txt);
        pugi::xml_node root();

        pugi::xml_node find(const char *lname);
        pugi::xml_node find(pugi::xml_node parent, const char *lname);
        std::vector<pugi::xml_node> find_all(const char *lname);
        std::vector<pugi::xml_node> find_all(pugi::xml_node parent, const char *lname);

        std::string text(const char *lname, std::string dflt = "");
        std::string text(pugi::xml_node parent, const char *lname, std::string dflt = "");
        std::string attr(pugi::xml_node node, const char *lname, std::string dflt = "");

        bool is_fault();
        std::string fault_text();

    private:
        pugi::xml_document  doc;
        void collect(pugi::xml_node parent, const char *lname
            , std::vector<pugi::xml_node> &nodes);
};

    const char *xml_local_name(const char *qname);
    std::string xml_escape(std::string parm);

#endif /* _INCLUDE_XML_HPP_ */
