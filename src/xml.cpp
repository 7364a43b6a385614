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
#include "logger.hpp"
#include "xml.hpp"

/* Strip any "prefix:" from an element or attribute name */
const char *xml_local_name(const char *qname)
{
    const char *colon;

    colon = strrchr(qname, ':');
    if (colon == nullptr) {
        return qname;
    }
    return colon + 1;
}

std::string xml_escape(std::string parm)
{
    std::string retcd;
    size_t indx;

    retcd = "";
    for (indx = 0; indx < parm.length(); indx++) {
        switch (parm[indx]) {
        case '&':  retcd += "&amp;";  break;
        case '<':  retcd += "&lt;";   break;
        case '>':  retcd += "&gt;";   break;
        case '"':  retcd += "&quot;"; break;
        case '\'': retcd += "&apos;"; break;
        default:   retcd += parm[indx];
        }
    }
    return retcd;
}

bool cls_xml::parse(const std::string &txt)
{
    pugi::xml_parse_result rslt;

    errmsg = "";
    rslt = doc.load_buffer(txt.c_str(), txt.length());
    if (!rslt) {
        errmsg = rslt.description();
        return false;
    }
    return true;
}

pugi::xml_node cls_xml::root()
{
    return doc.document_element();
}

pugi::xml_node cls_xml::find(pugi::xml_node parent, const char *lname)
{
    pugi::xml_node node, fnd;

    for (node = parent.first_child(); node; node = node.next_sibling()) {
        if (node.type() != pugi::node_element) {
            continue;
        }
        if (mystreq(xml_local_name(node.name()), lname)) {
            return node;
        }
        fnd = find(node, lname);
        if (fnd) {
            return fnd;
        }
    }
    return pugi::xml_node();
}

pugi::xml_node cls_xml::find(const char *lname)
{
    return find(doc, lname);
}

void cls_xml::collect(pugi::xml_node parent, const char *lname
    , std::vector<pugi::xml_node> &nodes)
{
    pugi::xml_node node;

    for (node = parent.first_child(); node; node = node.next_sibling()) {
        if (node.type() != pugi::node_element) {
            continue;
        }
        if (mystreq(xml_local_name(node.name()), lname)) {
            nodes.push_back(node);
        } else {
            collect(node, lname, nodes);
        }
    }
}

std::vector<pugi::xml_node> cls_xml::find_all(pugi::xml_node parent, const char *lname)
{
    std::vector<pugi::xml_node> nodes;
    collect(parent, lname, nodes);
    return nodes;
}

std::vector<pugi::xml_node> cls_xml::find_all(const char *lname)
{
    return find_all(doc, lname);
}

std::string cls_xml::text(pugi::xml_node parent, const char *lname, std::string dflt)
{
    pugi::xml_node node;
    std::string retcd;

    node = find(parent, lname);
    if (!node) {
        return dflt;
    }
    retcd = node.child_value();
    mytrim(retcd);
    if (retcd == "") {
        return dflt;
    }
    return retcd;
}

std::string cls_xml::text(const char *lname, std::string dflt)
{
    return text(doc, lname, dflt);
}

std::string cls_xml::attr(pugi::xml_node node, const char *lname, std::string dflt)
{
    pugi::xml_attribute at;

    for (at = node.first_attribute(); at; at = at.next_attribute()) {
        if (mystreq(xml_local_name(at.name()), lname)) {
            return at.value();
        }
    }
    return dflt;
}

bool cls_xml::is_fault()
{
    return (bool)find("Fault");
}

/* Collect the subcode values and reason into one line */
std::string cls_xml::fault_text()
{
    pugi::xml_node fault;
    std::vector<pugi::xml_node> vals;
    std::string retcd;
    size_t indx;

    fault = find("Fault");
    if (!fault) {
        return "";
    }
    retcd = "";
    vals = find_all(fault, "Value");
    for (indx = 0; indx < vals.size(); indx++) {
        if (retcd != "") {
            retcd += " ";
        }
        retcd += vals[indx].child_value();
    }
    if (retcd != "") {
        retcd += ": ";
    }
    retcd += text(fault, "Text", text(fault, "faultstring", ""));
    return retcd;
}

cls_xml::cls_xml()
{
    errmsg = "";
}

cls_xml::~cls_xml()
{

}
