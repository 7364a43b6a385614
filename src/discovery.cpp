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

std::string cls_discovery::probe_msg()
{
    probe_id = "urn:uuid:" + util_uuid();

    return
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<soap:Envelope xmlns:soap=\"http://www.w3.org/2003/05/soap-envelope\""
        " xmlns:wsa=\"http://schemas.xmlsoap.org/ws/2004/08/addressing\""
        " xmlns:wsd=\"http://schemas.xmlsoap.org/ws/2005/04/discovery\""
        " xmlns:dn=\"http://www.onvif.org/ver10/network/wsdl\">"
        "<soap:Header>"
        "<wsa:Action>http://schemas.xmlsoap.org/ws/2005/04/discovery/Probe</wsa:Action>"
        "<wsa:MessageID>" + probe_id + "</wsa:MessageID>"
        "<wsa:To>urn:schemas-xmlsoap-org:ws:2005:04:discovery</wsa:To>"
        "</soap:Header>"
        "<soap:Body>"
        "<wsd:Probe><wsd:Types>dn:NetworkVideoTransmitter</wsd:Types></wsd:Probe>"
        "</soap:Body>"
        "</soap:Envelope>";
}

std::string cls_discovery::scope_value(std::vector<std::string> &scopes
    , const char *key)
{
    std::string pfx;
    size_t indx;

    pfx = std::string("onvif://www.onvif.org/") + key + "/";
    for (indx = 0; indx < scopes.size(); indx++) {
        if (mystarts(scopes[indx], pfx)) {
            return util_url_decode(scopes[indx].substr(pfx.length()));
        }
    }
    return "";
}

/* Pull one camera out of a ProbeMatch datagram, 0 when usable */
int cls_discovery::parse_match(const std::string &body, const std::string &srcip
    , ctx_discovered &cam)
{
    cls_xml xml;
    std::vector<std::string> xaddrs, scopes;
    ctx_url url;
    size_t indx;

    if (xml.parse(body) == false) {
        CAMGATE_LOG(DBG, TYPE_ONVIF, NO_ERRNO
            , "Unparseable discovery reply from %s: %s"
            , srcip.c_str(), xml.errmsg.c_str());
        return -1;
    }

    util_split_ws(xml.text("XAddrs"), xaddrs);
    if (xaddrs.size() == 0) {
        return -1;
    }

    cam.xaddr = xaddrs[0];
    for (indx = 0; indx < xaddrs.size(); indx++) {
        if (mystarts(xaddrs[indx], "http://")) {
            cam.xaddr = xaddrs[indx];
            break;
        }
    }

    if (http_url_parse(cam.xaddr, url)) {
        cam.address = url.host;
        cam.port = url.port;
    } else {
        cam.address = srcip;
        cam.port = 80;
    }

    util_split_ws(xml.text("Scopes"), scopes);
    cam.name = scope_value(scopes, "name");
    cam.model = scope_value(scopes, "hardware");
    cam.manufacturer = scope_value(scopes, "mfr");
    if (cam.manufacturer == "") {
        cam.manufacturer = scope_value(scopes, "manufacturer");
    }
    if (cam.name == "") {
        cam.name = "Camera at " + cam.address;
    }
    if (cam.manufacturer == "") {
        cam.manufacturer = "Unknown";
    }
    if (cam.model == "") {
        cam.model = "Unknown";
    }

    return 0;
}

void cls_discovery::add_unique(vec_discovered &cams, ctx_discovered &cam)
{
    size_t indx;

    for (indx = 0; indx < cams.size(); indx++) {
        if (cams[indx].xaddr == cam.xaddr) {
            return;
        }
    }
    CAMGATE_LOG(NTC, TYPE_ONVIF, NO_ERRNO
        , _("Found %s (%s %s) at %s")
        , cam.name.c_str(), cam.manufacturer.c_str()
        , cam.model.c_str(), cam.xaddr.c_str());
    cams.push_back(cam);
}

/* Multicast a probe and collect replies for the whole window */
int cls_discovery::probe(vec_discovered &cams)
{
    int sockfd, optval, retcd;
    unsigned char ttl;
    struct sockaddr_in dest, src;
    socklen_t srclen;
    struct pollfd pfd;
    char buf[65536], srcip[INET_ADDRSTRLEN];
    std::string msg;
    ssize_t rdcnt;
    int64_t deadline, remain;
    ctx_discovered cam;

    cams.clear();

    sockfd = socket(AF_INET, SOCK_DGRAM, 0);
    if (sockfd < 0) {
        CAMGATE_LOG(ERR, TYPE_ONVIF, SHOW_ERRNO, _("Unable to open discovery socket"));
        return -1;
    }

    optval = 1;
    setsockopt(sockfd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));
    ttl = 4;
    setsockopt(sockfd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));

    memset(&dest, 0, sizeof(dest));
    dest.sin_family = AF_INET;
    dest.sin_port = htons(WSD_MCAST_PORT);
    inet_pton(AF_INET, WSD_MCAST_ADDR, &dest.sin_addr);

    msg = probe_msg();
    if (sendto(sockfd, msg.c_str(), msg.length(), 0
            , (struct sockaddr *)&dest, sizeof(dest)) < 0) {
        CAMGATE_LOG(ERR, TYPE_ONVIF, SHOW_ERRNO, _("Unable to send discovery probe"));
        close(sockfd);
        return -1;
    }

    CAMGATE_LOG(INF, TYPE_ONVIF, NO_ERRNO
        , _("Discovery probe %s sent, listening %d seconds")
        , probe_id.c_str(), timeout_sec);

    deadline = util_mono_ms() + (int64_t)timeout_sec * 1000;
    while ((remain = deadline - util_mono_ms()) > 0) {
        pfd.fd = sockfd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        retcd = poll(&pfd, 1, (int)remain);
        if (retcd < 0) {
            if (errno == EINTR) {
                continue;
            }
            CAMGATE_LOG(ERR, TYPE_ONVIF, SHOW_ERRNO, _("Discovery poll failed"));
            break;
        }
        if (retcd == 0) {
            break;
        }
        srclen = sizeof(src);
        rdcnt = recvfrom(sockfd, buf, sizeof(buf) - 1, 0
            , (struct sockaddr *)&src, &srclen);
        if (rdcnt <= 0) {
            continue;
        }
        buf[rdcnt] = '\0';
        inet_ntop(AF_INET, &src.sin_addr, srcip, sizeof(srcip));

        if (parse_match(std::string(buf, (size_t)rdcnt), srcip, cam) == 0) {
            add_unique(cams, cam);
        }
    }
    close(sockfd);

    if (cams.size() == 0) {
        CAMGATE_LOG(WRN, TYPE_ONVIF, NO_ERRNO
            , _("%s: no cameras answered within %d seconds")
            , cg_err_str(CG_ERR_DISCOVERY_TIMEOUT), timeout_sec);
    }

    return 0;
}

cls_discovery::cls_discovery()
{
    timeout_sec = 5;
    probe_id = "";
}

cls_discovery::~cls_discovery()
{

}
