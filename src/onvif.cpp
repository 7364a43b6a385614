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

/* Base64(SHA1(nonce + created + password)) */
std::string onvif_password_digest(const uint8_t *nonce, size_t nonce_len
    , std::string created, std::string pass)
{
    std::vector<uint8_t> buf;
    uint8_t digest[20];

    buf.insert(buf.end(), nonce, nonce + nonce_len);
    buf.insert(buf.end(), created.begin(), created.end());
    buf.insert(buf.end(), pass.begin(), pass.end());
    util_sha1(buf.data(), buf.size(), digest);

    return util_base64_encode(digest, sizeof(digest));
}

void cls_onvif::set_result(enum CG_ERR err, std::string msg)
{
    result.err = err;
    result.errmsg = msg;
}

std::string cls_onvif::service_url(const char *svc)
{
    if (host.find(':') != std::string::npos) {
        return "http://[" + host + "]:" + std::to_string(port) + svc;
    }
    return "http://" + host + ":" + std::to_string(port) + svc;
}

std::string cls_onvif::security_header(const uint8_t *nonce, size_t nonce_len
    , std::string created)
{
    return
        "<wsse:Security soap:mustUnderstand=\"1\""
        " xmlns:wsse=\"http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-wssecurity-secext-1.0.xsd\""
        " xmlns:wsu=\"http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-wssecurity-utility-1.0.xsd\">"
        "<wsse:UsernameToken>"
        "<wsse:Username>" + xml_escape(user) + "</wsse:Username>"
        "<wsse:Password Type=\"http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-username-token-profile-1.0#PasswordDigest\">" +
            onvif_password_digest(nonce, nonce_len, created, pass) +
        "</wsse:Password>"
        "<wsse:Nonce EncodingType=\"http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-soap-message-security-1.0#Base64Binary\">" +
            util_base64_encode(nonce, nonce_len) +
        "</wsse:Nonce>"
        "<wsu:Created>" + created + "</wsu:Created>"
        "</wsse:UsernameToken>"
        "</wsse:Security>";
}

/* Fresh nonce and camera-adjusted timestamp on every call */
std::string cls_onvif::envelope(std::string body, bool auth)
{
    uint8_t nonce[16];
    std::string hdr;

    hdr = "";
    if (auth && (user != "")) {
        util_random_bytes(nonce, sizeof(nonce));
        hdr = security_header(nonce, sizeof(nonce)
            , util_iso_time(util_now_ms() + clock_offset));
    }

    return
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<soap:Envelope xmlns:soap=\"http://www.w3.org/2003/05/soap-envelope\""
        " xmlns:tt=\"" ONVIF_NS_SCHEMA "\">"
        "<soap:Header>" + hdr + "</soap:Header>"
        "<soap:Body>" + body + "</soap:Body>"
        "</soap:Envelope>";
}

int cls_onvif::soap_call(const char *svc, std::string body, bool auth, cls_xml &xml)
{
    ctx_http_req req;
    ctx_http_resp resp;
    std::string fault;

    set_result(CG_ERR_NONE, "");

    http_req_init(req, "POST", service_url(svc), timeout_ms);
    req.content_type = "application/soap+xml; charset=utf-8";
    req.body = envelope(body, auth);

    if (http->request(req, resp) != 0) {
        set_result(resp.err, resp.errmsg);
        return -1;
    }

    if (resp.status == 401) {
        set_result(CG_ERR_AUTH, "HTTP 401 from " + host);
        return -1;
    }

    if (xml.parse(resp.body) == false) {
        if (resp.status != 200) {
            set_result(CG_ERR_NETWORK, "HTTP " + std::to_string(resp.status) + " from " + host);
        } else {
            set_result(CG_ERR_PARSE, "Invalid XML from " + host + ": " + xml.errmsg);
        }
        return -1;
    }

    if (xml.is_fault()) {
        fault = xml.fault_text();
        if ((fault.find("NotAuthorized") != std::string::npos) ||
            (fault.find("FailedAuthentication") != std::string::npos)) {
            set_result(CG_ERR_AUTH, "SOAP fault: " + fault);
        } else {
            set_result(CG_ERR_NETWORK, "SOAP fault: " + fault);
        }
        return -1;
    }

    if (resp.status != 200) {
        set_result(CG_ERR_NETWORK, "HTTP " + std::to_string(resp.status) + " from " + host);
        return -1;
    }

    return 0;
}

int64_t cls_onvif::parse_datetime(cls_xml &xml, pugi::xml_node parent)
{
    pugi::xml_node dt, tm;
    struct tm ctm;

    dt = xml.find(parent, "Date");
    tm = xml.find(parent, "Time");
    if (!dt || !tm) {
        return -1;
    }
    memset(&ctm, 0, sizeof(ctm));
    ctm.tm_year = mtoi(xml.text(dt, "Year", "1970")) - 1900;
    ctm.tm_mon  = mtoi(xml.text(dt, "Month", "1")) - 1;
    ctm.tm_mday = mtoi(xml.text(dt, "Day", "1"));
    ctm.tm_hour = mtoi(xml.text(tm, "Hour", "0"));
    ctm.tm_min  = mtoi(xml.text(tm, "Minute", "0"));
    ctm.tm_sec  = mtoi(xml.text(tm, "Second", "0"));

    return (int64_t)timegm(&ctm) * 1000;
}

/* Offset between the camera clock and ours, using the request midpoint */
int cls_onvif::measure_clock()
{
    cls_xml xml;
    pugi::xml_node node;
    int64_t t0, t1, cam, offset;

    t0 = util_now_ms();
    if (soap_call(ONVIF_SVC_DEVICE
            , "<tds:GetSystemDateAndTime xmlns:tds=\"" ONVIF_NS_DEVICE "\"/>"
            , false, xml) != 0) {
        CAMGATE_LOG(WRN, TYPE_ONVIF, NO_ERRNO
            , _("Could not read camera time, using local time: %s")
            , result.errmsg.c_str());
        clock_offset = 0;
        return -1;
    }
    t1 = util_now_ms();

    node = xml.find("UTCDateTime");
    if (!node) {
        node = xml.find("LocalDateTime");
    }
    cam = node ? parse_datetime(xml, node) : -1;
    if (cam < 0) {
        CAMGATE_LOG(WRN, TYPE_ONVIF, NO_ERRNO
            , _("Camera time reply has no date, using local time"));
        clock_offset = 0;
        return -1;
    }

    offset = cam - (t0 + t1) / 2;
    if (llabs(offset) > ONVIF_OFFSET_MIN) {
        clock_offset = offset;
        CAMGATE_LOG(NTC, TYPE_ONVIF, NO_ERRNO
            , _("Camera clock offset %.1f s applied to authentication")
            , (double)offset / 1000.0);
    } else {
        clock_offset = 0;
    }
    return 0;
}

int cls_onvif::get_device_info()
{
    cls_xml xml;

    device.manufacturer = "Unknown";
    device.model = "Unknown";
    device.firmware = "";

    if (soap_call(ONVIF_SVC_DEVICE
            , "<tds:GetDeviceInformation xmlns:tds=\"" ONVIF_NS_DEVICE "\"/>"
            , true, xml) != 0) {
        CAMGATE_LOG(WRN, TYPE_ONVIF, NO_ERRNO
            , _("Could not get device information: %s"), result.errmsg.c_str());
        return -1;
    }

    device.manufacturer = xml.text("Manufacturer", "Unknown");
    device.model = xml.text("Model", "Unknown");
    device.firmware = xml.text("FirmwareVersion", "");

    CAMGATE_LOG(NTC, TYPE_ONVIF, NO_ERRNO, _("Device: %s %s")
        , device.manufacturer.c_str(), device.model.c_str());

    return 0;
}

int cls_onvif::get_profiles()
{
    cls_xml xml;
    std::vector<pugi::xml_node> nodes;
    std::function<void(pugi::xml_node)> scan;
    ctx_onvif_profile prof;
    size_t indx;

    device.profiles.clear();

    if (soap_call(ONVIF_SVC_MEDIA
            , "<trt:GetProfiles xmlns:trt=\"" ONVIF_NS_MEDIA "\"/>"
            , true, xml) != 0) {
        CAMGATE_LOG(ERR, TYPE_ONVIF, NO_ERRNO
            , _("GetProfiles failed: %s"), result.errmsg.c_str());
        return -1;
    }

    prof.width = 0;
    prof.height = 0;
    prof.stream_uri = "";

    nodes = xml.find_all("Profiles");
    for (indx = 0; indx < nodes.size(); indx++) {
        prof.token = xml.attr(nodes[indx], "token");
        if (prof.token == "") {
            continue;
        }
        prof.name = xml.text(nodes[indx], "Name");
        device.profiles.push_back(prof);
    }

    if (device.profiles.size() == 0) {
        /* Any token attribute, as some firmware names the element differently */
        scan = [&](pugi::xml_node parent) {
            pugi::xml_node node;
            std::string tkn;
            for (node = parent.first_child(); node; node = node.next_sibling()) {
                if (device.profiles.size() >= 4) {
                    return;
                }
                if (node.type() != pugi::node_element) {
                    continue;
                }
                tkn = xml.attr(node, "token");
                if (tkn != "") {
                    prof.token = tkn;
                    prof.name = "";
                    device.profiles.push_back(prof);
                }
                scan(node);
            }
        };
        scan(xml.root());
    }

    CAMGATE_LOG(INF, TYPE_ONVIF, NO_ERRNO
        , _("Found %d media profile(s)"), (int)device.profiles.size());

    return 0;
}

int cls_onvif::get_stream_uri(ctx_onvif_profile &prof)
{
    cls_xml xml;

    if (soap_call(ONVIF_SVC_MEDIA,
            "<trt:GetStreamUri xmlns:trt=\"" ONVIF_NS_MEDIA "\">"
            "<trt:StreamSetup>"
            "<tt:Stream>RTP-Unicast</tt:Stream>"
            "<tt:Transport><tt:Protocol>RTSP</tt:Protocol></tt:Transport>"
            "</trt:StreamSetup>"
            "<trt:ProfileToken>" + xml_escape(prof.token) + "</trt:ProfileToken>"
            "</trt:GetStreamUri>"
            , true, xml) != 0) {
        return -1;
    }

    prof.stream_uri = xml.text("Uri");
    if (prof.stream_uri == "") {
        set_result(CG_ERR_PARSE, "GetStreamUri reply has no Uri");
        return -1;
    }
    return 0;
}

int cls_onvif::get_profile_config(ctx_onvif_profile &prof)
{
    cls_xml xml;
    pugi::xml_node enc, res;
    int w, h;

    prof.width = 1920;
    prof.height = 1080;

    if (soap_call(ONVIF_SVC_MEDIA,
            "<trt:GetProfile xmlns:trt=\"" ONVIF_NS_MEDIA "\">"
            "<trt:ProfileToken>" + xml_escape(prof.token) + "</trt:ProfileToken>"
            "</trt:GetProfile>"
            , true, xml) != 0) {
        return -1;
    }

    enc = xml.find("VideoEncoderConfiguration");
    res = enc ? xml.find(enc, "Resolution") : xml.find("Resolution");
    if (res) {
        w = mtoi(xml.text(res, "Width", "0"));
        h = mtoi(xml.text(res, "Height", "0"));
    } else {
        w = mtoi(xml.text("Width", "0"));
        h = mtoi(xml.text("Height", "0"));
    }
    if ((w > 0) && (h > 0)) {
        prof.width = w;
        prof.height = h;
    }
    if (prof.name == "") {
        prof.name = xml.text("Name");
    }
    return 0;
}

int cls_onvif::connect(std::string p_host, int p_port, std::string p_user, std::string p_pass)
{
    std::vector<ctx_onvif_profile> found;
    ctx_onvif_result last_err;
    size_t indx;

    host = p_host;
    port = p_port;
    user = p_user;
    pass = p_pass;
    connected = false;

    device.address = host;
    device.port = port;
    device.service_addr = service_url(ONVIF_SVC_DEVICE);
    device.profiles.clear();

    CAMGATE_LOG(NTC, TYPE_ONVIF, NO_ERRNO, _("Connecting to %s:%d"), host.c_str(), port);

    measure_clock();
    get_device_info();

    if (get_profiles() != 0) {
        return -1;
    }

    last_err.err = CG_ERR_NONE;
    for (indx = 0; indx < device.profiles.size(); indx++) {
        if (get_stream_uri(device.profiles[indx]) != 0) {
            CAMGATE_LOG(WRN, TYPE_ONVIF, NO_ERRNO
                , _("No stream URI for profile %s: %s")
                , device.profiles[indx].token.c_str(), result.errmsg.c_str());
            last_err = result;
            continue;
        }
        if (get_profile_config(device.profiles[indx]) != 0) {
            CAMGATE_LOG(DBG, TYPE_ONVIF, NO_ERRNO
                , "Profile %s configuration unavailable, assuming 1920x1080"
                , device.profiles[indx].token.c_str());
        }
        if (device.profiles[indx].name == "") {
            device.profiles[indx].name = "Profile " + std::to_string(found.size() + 1);
        }
        CAMGATE_LOG(INF, TYPE_ONVIF, NO_ERRNO, _("Profile %s: %dx%d %s")
            , device.profiles[indx].token.c_str()
            , device.profiles[indx].width, device.profiles[indx].height
            , util_url_mask(device.profiles[indx].stream_uri).c_str());
        found.push_back(device.profiles[indx]);
    }
    device.profiles = found;

    if (device.profiles.size() == 0) {
        if (last_err.err != CG_ERR_NONE) {
            result = last_err;
        } else {
            set_result(CG_ERR_PARSE, "No stream profiles found");
        }
        CAMGATE_LOG(ERR, TYPE_ONVIF, NO_ERRNO, _("%s: %s")
            , cg_err_str(result.err), result.errmsg.c_str());
        return -1;
    }

    set_result(CG_ERR_NONE, "");
    connected = true;
    return 0;
}

/* Embed the control credentials unless the URI already has some */
std::string cls_onvif::add_credentials(std::string uri)
{
    size_t pos, slpos, atpos;

    if ((user == "") || (pass == "")) {
        return uri;
    }
    pos = uri.find("://");
    if (pos == std::string::npos) {
        return uri;
    }
    pos += 3;
    slpos = uri.find('/', pos);
    atpos = uri.find('@', pos);
    if ((atpos != std::string::npos) &&
        ((slpos == std::string::npos) || (atpos < slpos))) {
        return uri;
    }
    return uri.substr(0, pos) + util_url_encode(user) + ":" +
        util_url_encode(pass) + "@" + uri.substr(pos);
}

std::string cls_onvif::best_stream_url(bool with_creds)
{
    size_t indx, best;
    int64_t area, best_area;

    if (device.profiles.size() == 0) {
        return "";
    }
    best = 0;
    best_area = -1;
    for (indx = 0; indx < device.profiles.size(); indx++) {
        area = (int64_t)device.profiles[indx].width * device.profiles[indx].height;
        if (area > best_area) {
            best_area = area;
            best = indx;
        }
    }
    if (with_creds) {
        return add_credentials(device.profiles[best].stream_uri);
    }
    return device.profiles[best].stream_uri;
}

std::string cls_onvif::profile_stream_url(std::string token, bool with_creds)
{
    size_t indx;

    for (indx = 0; indx < device.profiles.size(); indx++) {
        if (device.profiles[indx].token == token) {
            if (with_creds) {
                return add_credentials(device.profiles[indx].stream_uri);
            }
            return device.profiles[indx].stream_uri;
        }
    }
    return "";
}

int cls_onvif::auto_connect(vec_discovered &cams, std::string p_user
    , std::string p_pass, std::string &url)
{
    size_t indx;

    url = "";
    for (indx = 0; indx < cams.size(); indx++) {
        if (connect(cams[indx].address, cams[indx].port, p_user, p_pass) == 0) {
            url = best_stream_url(true);
            return 0;
        }
        CAMGATE_LOG(WRN, TYPE_ONVIF, NO_ERRNO, _("Failed to connect to %s: %s")
            , cams[indx].address.c_str(), result.errmsg.c_str());
    }
    if (cams.size() == 0) {
        set_result(CG_ERR_DISCOVERY_TIMEOUT, "No cameras discovered");
    }
    return -1;
}

int cls_onvif::get_camera_time(ctx_camera_time &ct)
{
    cls_xml xml;
    pugi::xml_node node;

    if (soap_call(ONVIF_SVC_DEVICE
            , "<tds:GetSystemDateAndTime xmlns:tds=\"" ONVIF_NS_DEVICE "\"/>"
            , true, xml) != 0) {
        CAMGATE_LOG(ERR, TYPE_ONVIF, NO_ERRNO
            , _("Failed to get camera time: %s"), result.errmsg.c_str());
        return -1;
    }

    ct.ntp = (xml.text("DateTimeType", "Manual") == "NTP");
    ct.dst = (xml.text("DaylightSavings", "false") == "true");
    ct.timezone = xml.text("TZ", "UTC");

    node = xml.find("UTCDateTime");
    ct.utc_ms = node ? parse_datetime(xml, node) : -1;
    if (ct.utc_ms < 0) {
        set_result(CG_ERR_PARSE, "Camera time reply has no UTCDateTime");
        return -1;
    }
    return 0;
}

int cls_onvif::set_camera_time(bool use_ntp)
{
    cls_xml xml;
    std::string body;
    struct tm utm;
    time_t now;

    if (use_ntp) {
        body =
            "<tds:SetSystemDateAndTime xmlns:tds=\"" ONVIF_NS_DEVICE "\">"
            "<tds:DateTimeType>NTP</tds:DateTimeType>"
            "<tds:DaylightSavings>false</tds:DaylightSavings>"
            "</tds:SetSystemDateAndTime>";
    } else {
        now = time(NULL);
        gmtime_r(&now, &utm);
        body =
            "<tds:SetSystemDateAndTime xmlns:tds=\"" ONVIF_NS_DEVICE "\">"
            "<tds:DateTimeType>Manual</tds:DateTimeType>"
            "<tds:DaylightSavings>false</tds:DaylightSavings>"
            "<tds:UTCDateTime>"
            "<tt:Time>"
            "<tt:Hour>" + std::to_string(utm.tm_hour) + "</tt:Hour>"
            "<tt:Minute>" + std::to_string(utm.tm_min) + "</tt:Minute>"
            "<tt:Second>" + std::to_string(utm.tm_sec) + "</tt:Second>"
            "</tt:Time>"
            "<tt:Date>"
            "<tt:Year>" + std::to_string(utm.tm_year + 1900) + "</tt:Year>"
            "<tt:Month>" + std::to_string(utm.tm_mon + 1) + "</tt:Month>"
            "<tt:Day>" + std::to_string(utm.tm_mday) + "</tt:Day>"
            "</tt:Date>"
            "</tds:UTCDateTime>"
            "</tds:SetSystemDateAndTime>";
    }

    if (soap_call(ONVIF_SVC_DEVICE, body, true, xml) != 0) {
        CAMGATE_LOG(ERR, TYPE_ONVIF, NO_ERRNO
            , _("Failed to set camera time: %s"), result.errmsg.c_str());
        return -1;
    }

    CAMGATE_LOG(NTC, TYPE_ONVIF, NO_ERRNO, _("Camera time %s")
        , use_ntp ? "set to NTP" : "synchronized to local time");

    /* The old offset no longer describes the camera */
    measure_clock();

    return 0;
}

int cls_onvif::check_time_sync(ctx_time_sync &ts)
{
    ctx_camera_time ct;

    if (get_camera_time(ct) != 0) {
        return -1;
    }
    ts.camera_ms = ct.utc_ms;
    ts.local_ms = util_now_ms();
    ts.diff_sec = llabs(ts.camera_ms - ts.local_ms) / 1000;
    ts.synced = (ts.diff_sec < ONVIF_SYNC_MAX);

    if (ts.diff_sec > ONVIF_DRIFT_WARN) {
        CAMGATE_LOG(WRN, TYPE_ONVIF, NO_ERRNO
            , _("%s: camera clock differs by %lld seconds")
            , cg_err_str(CG_ERR_CLOCK_DRIFT), (long long)ts.diff_sec);
    }
    return 0;
}

cls_onvif::cls_onvif(cls_http_transport *p_http, int p_timeout_ms)
{
    http = p_http;
    timeout_ms = p_timeout_ms;
    host = "";
    port = 80;
    user = "";
    pass = "";
    clock_offset = 0;
    connected = false;
    device.port = 80;
    result.err = CG_ERR_NONE;
    result.errmsg = "";
}

cls_onvif::~cls_onvif()
{

}
