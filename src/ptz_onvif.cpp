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
#include "http.hpp"
#include "discovery.hpp"
#include "onvif.hpp"
#include "ptz.hpp"

cls_ptz_onvif::cls_ptz_onvif(cls_onvif *p_onvif, std::string p_profile)
{
    backend = PTZ_BACKEND_ONVIF;
    onvif = p_onvif;
    profile = p_profile;
}

cls_ptz_onvif::~cls_ptz_onvif()
{

}

bool cls_ptz_onvif::call(const char *action, std::string inner, cls_xml &xml)
{
    std::string body;

    body = std::string("<tptz:") + action + " xmlns:tptz=\"" ONVIF_NS_PTZ "\">"
        "<tptz:ProfileToken>" + xml_escape(profile) + "</tptz:ProfileToken>" +
        inner +
        "</tptz:" + action + ">";

    if (onvif->soap_call(ONVIF_SVC_PTZ, body, true, xml) != 0) {
        errmsg = std::string(action) + ": " + onvif->result.errmsg;
        CAMGATE_LOG(WRN, TYPE_PTZ, NO_ERRNO, "%s", errmsg.c_str());
        return false;
    }
    return true;
}

bool cls_ptz_onvif::call(const char *action, std::string inner)
{
    cls_xml xml;
    return call(action, inner, xml);
}

std::string cls_ptz_onvif::vector_xml(double pan, double tilt, double zoom)
{
    char buf[160];

    snprintf(buf, sizeof(buf)
        , "<tt:PanTilt x=\"%.4f\" y=\"%.4f\"/><tt:Zoom x=\"%.4f\"/>"
        , pan, tilt, zoom);
    return buf;
}

ctx_ptz_caps cls_ptz_onvif::probe_capabilities()
{
    ctx_ptz_caps pc;
    cls_xml xml;
    pugi::xml_node cfg;
    std::string body;

    pc.supported = false;
    pc.absolute = false;
    pc.relative = false;
    pc.continuous = false;
    pc.presets = false;
    pc.home = false;

    body = "<tptz:GetConfigurations xmlns:tptz=\"" ONVIF_NS_PTZ "\"/>";
    if (onvif->soap_call(ONVIF_SVC_PTZ, body, true, xml) != 0) {
        CAMGATE_LOG(WRN, TYPE_PTZ, NO_ERRNO
            , _("Could not get PTZ configurations: %s")
            , onvif->result.errmsg.c_str());
        return pc;
    }

    cfg = xml.find("PTZConfiguration");
    if (!cfg) {
        return pc;
    }

    pc.supported = true;
    pc.continuous =
        xml.find(cfg, "DefaultContinuousPanTiltVelocitySpace") ||
        xml.find(cfg, "DefaultContinuousZoomVelocitySpace");
    /* The schema itself spells it "Pant" */
    pc.absolute =
        xml.find(cfg, "DefaultAbsolutePantTiltPositionSpace") ||
        xml.find(cfg, "DefaultAbsolutePanTiltPositionSpace") ||
        xml.find(cfg, "DefaultAbsoluteZoomPositionSpace");
    pc.relative =
        xml.find(cfg, "DefaultRelativePanTiltTranslationSpace") ||
        xml.find(cfg, "DefaultRelativeZoomTranslationSpace");
    pc.presets = true;
    if (xml.text(cfg, "MaximumNumberOfPresets", "") != "") {
        CAMGATE_LOG(DBG, TYPE_PTZ, NO_ERRNO, "Camera holds %s presets"
            , xml.text(cfg, "MaximumNumberOfPresets").c_str());
    }
    pc.home = true;

    return pc;
}

bool cls_ptz_onvif::continuous_move(double pan, double tilt, double zoom)
{
    cancel_stop();
    return call("ContinuousMove"
        , "<tptz:Velocity>" + vector_xml(pan, tilt, zoom) + "</tptz:Velocity>");
}

bool cls_ptz_onvif::stop()
{
    cancel_stop();
    return call("Stop"
        , "<tptz:PanTilt>true</tptz:PanTilt><tptz:Zoom>true</tptz:Zoom>");
}

bool cls_ptz_onvif::absolute_move(double pan, double tilt, double zoom)
{
    return call("AbsoluteMove"
        , "<tptz:Position>" + vector_xml(pan, tilt, zoom) + "</tptz:Position>");
}

bool cls_ptz_onvif::relative_move(double pan, double tilt, double zoom)
{
    return call("RelativeMove"
        , "<tptz:Translation>" + vector_xml(pan, tilt, zoom) + "</tptz:Translation>");
}

bool cls_ptz_onvif::get_position(ctx_ptz_pos &pos)
{
    cls_xml xml;
    pugi::xml_node node, pt, zm;

    if (call("GetStatus", "", xml) == false) {
        return false;
    }

    node = xml.find("Position");
    if (!node) {
        errmsg = "GetStatus reply has no position";
        return false;
    }
    pt = xml.find(node, "PanTilt");
    zm = xml.find(node, "Zoom");

    pos.pan  = pt ? atof(xml.attr(pt, "x", "0").c_str()) : 0;
    pos.tilt = pt ? atof(xml.attr(pt, "y", "0").c_str()) : 0;
    pos.zoom = zm ? atof(xml.attr(zm, "x", "0").c_str()) : 0;

    return true;
}

bool cls_ptz_onvif::get_presets(vec_ptz_preset &presets)
{
    cls_xml xml;
    std::vector<pugi::xml_node> nodes;
    ctx_ptz_preset pp;
    size_t indx;

    presets.clear();
    if (call("GetPresets", "", xml) == false) {
        return false;
    }

    nodes = xml.find_all("Preset");
    for (indx = 0; indx < nodes.size(); indx++) {
        pp.token = xml.attr(nodes[indx], "token");
        if (pp.token == "") {
            continue;
        }
        pp.name = xml.text(nodes[indx], "Name", "Preset " + pp.token);
        presets.push_back(pp);
    }

    return true;
}

bool cls_ptz_onvif::goto_preset(std::string token)
{
    return call("GotoPreset"
        , "<tptz:PresetToken>" + xml_escape(token) + "</tptz:PresetToken>");
}

std::string cls_ptz_onvif::set_preset(std::string name)
{
    cls_xml xml;
    std::string token;

    if (call("SetPreset"
            , "<tptz:PresetName>" + xml_escape(name) + "</tptz:PresetName>"
            , xml) == false) {
        return "";
    }
    token = xml.text("PresetToken");
    if (token == "") {
        errmsg = "SetPreset reply has no token";
        CAMGATE_LOG(WRN, TYPE_PTZ, NO_ERRNO, "%s", errmsg.c_str());
        return "";
    }
    CAMGATE_LOG(INF, TYPE_PTZ, NO_ERRNO, _("Preset saved: %s -> %s")
        , name.c_str(), token.c_str());

    return token;
}

bool cls_ptz_onvif::remove_preset(std::string token)
{
    return call("RemovePreset"
        , "<tptz:PresetToken>" + xml_escape(token) + "</tptz:PresetToken>");
}

bool cls_ptz_onvif::go_home()
{
    return call("GotoHomePosition", "");
}

bool cls_ptz_onvif::set_home()
{
    return call("SetHomePosition", "");
}
