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

#include <openssl/crypto.h>
#include "camgate.hpp"
#include "util.hpp"
#include "logger.hpp"
#include "conf.hpp"
#include "json_parse.hpp"
#include "xml.hpp"
#include "http.hpp"
#include "evtbus.hpp"
#include "process.hpp"
#include "discovery.hpp"
#include "onvif.hpp"
#include "ptz.hpp"
#include "dbse.hpp"
#include "preset.hpp"
#include "settings.hpp"
#include "stream.hpp"
#include "tunnel.hpp"
#include "recorder.hpp"
#include "pipeline.hpp"
#include "analyzer.hpp"
#include "notify.hpp"
#include "gateway.hpp"
#include "webu.hpp"
#include "webu_ans.hpp"
#include "webu_json.hpp"
#include "webu_post.hpp"

static mhdrslt webua_connection_values (void *cls
    , enum MHD_ValueKind kind, const char *src_key, const char *src_val)
{
    (void) kind;
    std::string parm_val;
    cls_webu_ans *webua =(cls_webu_ans *) cls;

    if (src_val == NULL) {
        return MHD_YES;
    }
    if (mystrceq(src_key,"Accept-Encoding")) {
        parm_val = src_val;
        if (parm_val.find("gzip") != std::string::npos) {
            webua->gzip_encode = true;
        }
    } else if (mystrceq(src_key,"X-API-Key")) {
        webua->api_key = src_val;
    }

  return MHD_YES;
}

/* Constant time comparison of the configured and presented keys */
bool webu_key_match(const std::string &expected, const std::string &given)
{
    if (expected.length() != given.length()) {
        return false;
    }
    if (expected.length() == 0) {
        return true;
    }
    return (CRYPTO_memcmp(expected.c_str(), given.c_str(), expected.length()) == 0);
}

int cls_webu_ans::parseurl()
{
    char *tmpurl;
    size_t  pos_slash1, pos_slash2, pos_qry;

    /* Example:  /camid/cmd1/cmd2/cmd3   */
    uri_camid = "";
    uri_cmd1 = "";
    uri_cmd2 = "";
    uri_cmd3 = "";

    CAMGATE_LOG(DBG, TYPE_NET, NO_ERRNO, _("Sent url: %s"),url.c_str());

    pos_qry = url.find("?");
    if (pos_qry != std::string::npos) {
        url = url.substr(0, pos_qry);
    }

    tmpurl = (char*)mymalloc(url.length()+1);
    memcpy(tmpurl, url.c_str(), url.length());
    tmpurl[url.length()] = '\0';

    MHD_http_unescape(tmpurl);

    url.assign(tmpurl);
    free(tmpurl);

    if ((url.length() == 0) || (url[0] != '/')) {
        return -1;
    }

    if (url == "/favicon.ico") {
        return -1;
    }

    /* Remove any trailing slash to keep parms clean */
    while ((url.length() > 1) && (url.substr(url.length()-1,1) == "/")) {
        url = url.substr(0, url.length()-1);
    }

    if (url == "/") {
        return 0;
    }

    pos_slash1 = url.find("/", 1);
    if (pos_slash1 != std::string::npos) {
        uri_camid = url.substr(1, pos_slash1 - 1);
    } else {
        uri_camid = url.substr(1);
        return 0;
    }

    pos_slash1++;
    if (pos_slash1 >= url.length()) {
        return 0;
    }

    pos_slash2 = url.find("/", pos_slash1);
    if (pos_slash2 != std::string::npos) {
        uri_cmd1 = url.substr(pos_slash1, pos_slash2 - pos_slash1);
    } else {
        uri_cmd1 = url.substr(pos_slash1);
        return 0;
    }

    pos_slash1 = ++pos_slash2;
    if (pos_slash1 >= url.length()) {
        return 0;
    }

    pos_slash2 = url.find("/", pos_slash1);
    if (pos_slash2 != std::string::npos) {
        uri_cmd2 = url.substr(pos_slash1, pos_slash2 - pos_slash1);
    } else {
        uri_cmd2 = url.substr(pos_slash1);
        return 0;
    }

    pos_slash1 = ++pos_slash2;
    if (pos_slash1 >= url.length()) {
        return 0;
    }
    uri_cmd3 = url.substr(pos_slash1);

    return 0;
}

/* camid 0 is the first gateway, otherwise a device id or a thread number */
void cls_webu_ans::gateway_get()
{
    int indx, nbr;

    gw = nullptr;
    nbr = -1;
    if ((uri_camid.length() > 0) &&
        (uri_camid.find_first_not_of("0123456789") == std::string::npos)) {
        nbr = mtoi(uri_camid);
    }

    pthread_mutex_lock(&app->mutex_gwlst);
        for (indx=0; indx<(int)app->gw_list.size(); indx++) {
            if (nbr == 0) {
                gw = app->gw_list[indx];
                break;
            }
            if ((app->gw_list[indx]->device_id == uri_camid) ||
                (app->gw_list[indx]->threadnr == nbr)) {
                gw = app->gw_list[indx];
                break;
            }
        }
    pthread_mutex_unlock(&app->mutex_gwlst);
}

void cls_webu_ans::parms_edit()
{
    if (parseurl() != 0) {
        uri_camid = "";
        uri_cmd1 = "";
        uri_cmd2 = "";
        uri_cmd3 = "";
        url = "";
    }

    uri_route = uri_cmd1;
    if (uri_cmd2 != "") {
        uri_route += "/" + uri_cmd2;
        if (uri_cmd3 != "") {
            uri_route += "/" + uri_cmd3;
        }
    }

    gateway_get();

    CAMGATE_LOG(DBG, TYPE_NET, NO_ERRNO
        , "camid: >%s< cmd1: >%s< cmd2: >%s< cmd3: >%s<"
        , uri_camid.c_str()
        , uri_cmd1.c_str(), uri_cmd2.c_str()
        , uri_cmd3.c_str());
}

void cls_webu_ans::clientip_get()
{
    const union MHD_ConnectionInfo *con_info;
    char client[WEBUI_LEN_URLI];
    const char *ip_dst;
    struct sockaddr_in6 *con_socket6;
    struct sockaddr_in *con_socket4;

    con_info = MHD_get_connection_info(connection, MHD_CONNECTION_INFO_CLIENT_ADDRESS);
    if ((con_info == NULL) || (con_info->client_addr == NULL)) {
        clientip = "Unknown";
        return;
    }

    if (con_info->client_addr->sa_family == AF_INET6) {
        con_socket6 = (struct sockaddr_in6 *)con_info->client_addr;
        ip_dst = inet_ntop(AF_INET6, &con_socket6->sin6_addr, client, WEBUI_LEN_URLI);
        if (ip_dst == NULL) {
            clientip = "Unknown";
        } else {
            clientip.assign(client);
            if (clientip.substr(0, 7) == "::ffff:") {
                clientip = clientip.substr(7);
            }
        }
    } else {
        con_socket4 = (struct sockaddr_in *)con_info->client_addr;
        ip_dst = inet_ntop(AF_INET, &con_socket4->sin_addr, client, WEBUI_LEN_URLI);
        if (ip_dst == NULL) {
            clientip = "Unknown";
        } else {
            clientip.assign(client);
        }
    }
}

void cls_webu_ans::failauth_log()
{
    timespec            tm_cnct;
    ctx_webu_clients    clients;
    std::list<ctx_webu_clients>::iterator   it;

    CAMGATE_LOG(ALR, TYPE_NET, NO_ERRNO
            ,_("Invalid api key from %s"), clientip.c_str());

    clock_gettime(CLOCK_MONOTONIC, &tm_cnct);

    pthread_mutex_lock(&webu->mutex_clients);
        it = webu->wb_clients.begin();
        while (it != webu->wb_clients.end()) {
            if (it->clientip == clientip) {
                it->conn_nbr++;
                it->conn_time.tv_sec =tm_cnct.tv_sec;
                it->authenticated = false;
                it->key_fail_nbr++;
                break;
            }
            it++;
        }
        if (it == webu->wb_clients.end()) {
            clients.clientip = clientip;
            clients.conn_nbr = 1;
            clients.conn_time = tm_cnct;
            clients.authenticated = false;
            clients.key_fail_nbr = 1;
            webu->wb_clients.push_back(clients);
        }
    pthread_mutex_unlock(&webu->mutex_clients);
}

void cls_webu_ans::client_connect()
{
    timespec                                tm_cnct;
    ctx_webu_clients                        clients;
    std::list<ctx_webu_clients>::iterator   it;
    bool                                    known;

    clock_gettime(CLOCK_MONOTONIC, &tm_cnct);

    known = false;
    pthread_mutex_lock(&webu->mutex_clients);
        /* Clean out any old IPs from the list */
        it = webu->wb_clients.begin();
        while (it != webu->wb_clients.end()) {
            if ((tm_cnct.tv_sec - it->conn_time.tv_sec) >= (WEBUI_LOCK_MINUTES*60)) {
                it = webu->wb_clients.erase(it);
            } else {
                it++;
            }
        }

        for (it = webu->wb_clients.begin(); it != webu->wb_clients.end(); it++) {
            if (it->clientip == clientip) {
                if (it->authenticated == false) {
                    CAMGATE_LOG(INF, TYPE_NET, NO_ERRNO, _("Connection from: %s"),clientip.c_str());
                }
                it->authenticated = true;
                it->conn_nbr = 1;
                it->key_fail_nbr = 0;
                it->conn_time.tv_sec = tm_cnct.tv_sec;
                known = true;
                break;
            }
        }

        if (known == false) {
            clients.clientip = clientip;
            clients.conn_nbr = 1;
            clients.key_fail_nbr = 0;
            clients.conn_time = tm_cnct;
            clients.authenticated = true;
            webu->wb_clients.push_back(clients);
        }
    pthread_mutex_unlock(&webu->mutex_clients);

    if (known == false) {
        CAMGATE_LOG(INF, TYPE_NET, NO_ERRNO, _("Connection from: %s"),clientip.c_str());
    }
}

/* Ignore addresses that keep presenting a bad key */
mhdrslt cls_webu_ans::failauth_check()
{
    timespec                                tm_cnct;
    std::list<ctx_webu_clients>::iterator   it;
    mhdrslt                                 retcd;

    retcd = MHD_YES;
    clock_gettime(CLOCK_MONOTONIC, &tm_cnct);

    pthread_mutex_lock(&webu->mutex_clients);
        it = webu->wb_clients.begin();
        while (it != webu->wb_clients.end()) {
            if ((it->clientip == clientip) &&
                ((tm_cnct.tv_sec - it->conn_time.tv_sec) < (WEBUI_LOCK_MINUTES*60)) &&
                (it->authenticated == false) &&
                (it->key_fail_nbr >= WEBUI_LOCK_ATTEMPTS)) {
                it->conn_time = tm_cnct;
                retcd = MHD_NO;
                break;
            } else if ((tm_cnct.tv_sec - it->conn_time.tv_sec) >= (WEBUI_LOCK_MINUTES*60)) {
                it = webu->wb_clients.erase(it);
            } else {
                it++;
            }
        }
    pthread_mutex_unlock(&webu->mutex_clients);

    if (retcd == MHD_NO) {
        CAMGATE_LOG(EMG, TYPE_NET, NO_ERRNO
            , "Ignoring connection from: %s", clientip.c_str());
    }

    return retcd;
}

bool cls_webu_ans::key_check()
{
    if (app->cfg->webcontrol_api_key == "") {
        return true;
    }
    if (api_key == "") {
        api_key = arg_get("api_key");
    }
    if (webu_key_match(app->cfg->webcontrol_api_key, api_key)) {
        return true;
    }
    failauth_log();
    return false;
}

std::string cls_webu_ans::arg_get(const char *name)
{
    const char *val;

    val = MHD_lookup_connection_value(connection, MHD_GET_ARGUMENT_KIND, name);
    if (val == NULL) {
        return "";
    }
    return std::string(val);
}

void cls_webu_ans::gzip_deflate()
{
    uint sz;
    int retcd;

    /* The buffer must hold the whole result of a single deflate call */
    sz = (uint)compressBound((uLong)resp_page.length()) + 32;

    myfree(gzip_resp);
    gzip_resp = (u_char*)mymalloc(sz);
    gzip_size = 0;

    z_stream zs;
    zs.zalloc = Z_NULL;
    zs.zfree = Z_NULL;
    zs.opaque = Z_NULL;
    zs.avail_in = (uint)resp_page.length();
    zs.next_in = (Bytef *)resp_page.c_str();
    zs.avail_out = sz;
    zs.next_out = (Bytef *)gzip_resp;

    retcd = deflateInit2(&zs
        , Z_DEFAULT_COMPRESSION
        , Z_DEFLATED
        , 15 | 16, 8
        , Z_DEFAULT_STRATEGY);
    if (retcd != Z_OK) {
        CAMGATE_LOG(ERR, TYPE_NET, NO_ERRNO
            , _("deflateInit2 failed: %d") ,retcd);
        return;
    }

    retcd = deflate(&zs, Z_FINISH);
    if (retcd != Z_STREAM_END) {
        CAMGATE_LOG(ERR, TYPE_NET, NO_ERRNO
            , _("deflate failed: %d") ,retcd);
        gzip_size = 0;
    } else {
        gzip_size = (ulong)zs.total_out;
    }

    retcd = deflateEnd(&zs);
    if (retcd < Z_OK) {
        CAMGATE_LOG(ERR, TYPE_NET, NO_ERRNO
            , _("deflateEnd failed: %d"), retcd);
        gzip_size = 0;
    }
}

void cls_webu_ans::mhd_send()
{
    mhdrslt retcd;
    struct MHD_Response *response;

    /* Small bodies are not worth compressing */
    if ((gzip_encode == true) && (resp_page.length() > 256)) {
        gzip_deflate();
        if (gzip_size == 0) {
            gzip_encode = false;
        }
    } else {
        gzip_encode = false;
    }

    if (gzip_encode == true) {
        response = MHD_create_response_from_buffer(
            gzip_size, (void *)gzip_resp
            , MHD_RESPMEM_PERSISTENT);
    } else {
        response = MHD_create_response_from_buffer(resp_page.length()
            ,(void *)resp_page.c_str(), MHD_RESPMEM_PERSISTENT);
    }
    if (response == NULL) {
        CAMGATE_LOG(ERR, TYPE_NET, NO_ERRNO, _("Invalid response"));
        return;
    }

    if (resp_type == WEBUI_RESP_TEXT) {
        MHD_add_response_header (response, MHD_HTTP_HEADER_CONTENT_TYPE, "text/plain; charset=utf-8");
    } else {
        MHD_add_response_header (response, MHD_HTTP_HEADER_CONTENT_TYPE, "application/json; charset=utf-8");
    }
    MHD_add_response_header (response, MHD_HTTP_HEADER_CACHE_CONTROL, "no-store");

    if (gzip_encode == true) {
        MHD_add_response_header (response, MHD_HTTP_HEADER_CONTENT_ENCODING, "gzip");
    }

    retcd = MHD_queue_response (connection, resp_code, response);
    MHD_destroy_response (response);

    if (retcd == MHD_NO) {
        CAMGATE_LOG(NTC, TYPE_NET, NO_ERRNO ,_("send page failed."));
    }
}

void cls_webu_ans::error_resp(unsigned int code, std::string msg)
{
    resp_type = WEBUI_RESP_JSON;
    resp_code = code;
    resp_page = "{\"success\":false,\"error\":\"" + util_json_escape(msg) + "\"}";
    mhd_send();
}

void cls_webu_ans::bad_request(std::string msg)
{
    error_resp(MHD_HTTP_BAD_REQUEST, msg);
}

void cls_webu_ans::not_found()
{
    error_resp(MHD_HTTP_NOT_FOUND, "Not found: " + url);
}

void cls_webu_ans::answer_get()
{
    CAMGATE_LOG(DBG, TYPE_NET, NO_ERRNO
        ,"processing get: %s",uri_route.c_str());

    if (webu_json == nullptr) {
        webu_json = new cls_webu_json(this);
    }
    webu_json->main();
}

mhdrslt cls_webu_ans::answer_main(struct MHD_Connection *p_connection
    , const char *method, const char *upload_data, size_t *upload_data_size)
{
    connection = p_connection;

    if (mhd_first) {
        mhd_first = false;

        MHD_get_connection_values (p_connection
            , MHD_HEADER_KIND, webua_connection_values, this);

        if (webu->wb_finish) {
            CAMGATE_LOG(NTC, TYPE_NET, NO_ERRNO ,_("Shutting down webcontrol"));
            return MHD_NO;
        }

        clientip_get();

        if (failauth_check() == MHD_NO) {
            return MHD_NO;
        }

        authenticated = key_check();
        if (authenticated) {
            client_connect();
        }

        if (mystreq(method,"POST")) {
            cnct_method = WEBUI_METHOD_POST;
            /* Body arrives on the following calls */
            return MHD_YES;
        }
        cnct_method = WEBUI_METHOD_GET;
    }

    if (cnct_method == WEBUI_METHOD_POST) {
        if (*upload_data_size != 0) {
            if ((post_body.length() + *upload_data_size) <= WEBUI_POST_MAX) {
                post_body.append(upload_data, *upload_data_size);
            } else {
                post_body = "";
                post_toolarge = true;
            }
            *upload_data_size = 0;
            return MHD_YES;
        }
    }

    if (authenticated == false) {
        error_resp(MHD_HTTP_UNAUTHORIZED, "Unauthorized");
        return MHD_YES;
    }

    if (url.length() == 0) {
        not_found();
        return MHD_YES;
    }

    if (cnct_method == WEBUI_METHOD_POST) {
        if (post_toolarge) {
            error_resp(413, "Request body too large");
            return MHD_YES;
        }
        if (webu_post == nullptr) {
            webu_post = new cls_webu_post(this);
        }
        webu_post->main();
    } else if (mystreq(method,"GET") || mystreq(method,"HEAD")) {
        answer_get();
    } else {
        error_resp(MHD_HTTP_METHOD_NOT_ALLOWED, "Method not allowed");
    }

    return MHD_YES;
}

cls_webu_ans::cls_webu_ans(cls_camgate *p_app, const char *uri)
{
    app = p_app;
    webu = p_app->webu;

    url           = "";
    uri_camid     = "";
    uri_cmd1      = "";
    uri_cmd2      = "";
    uri_cmd3      = "";
    uri_route     = "";
    clientip      = "";
    api_key       = "";
    post_body     = "";
    post_toolarge = false;
    authenticated = false;
    connection    = nullptr;
    gw            = nullptr;

    resp_page     = "";
    resp_code     = MHD_HTTP_OK;
    gzip_resp     = nullptr;
    gzip_size     = 0;
    gzip_encode   = false;

    resp_type     = WEBUI_RESP_JSON;
    cnct_method   = WEBUI_METHOD_GET;
    mhd_first     = true;

    webu_json = nullptr;
    webu_post = nullptr;

    url.assign(uri);

    parms_edit();

    pthread_mutex_lock(&webu->mutex_clients);
        webu->cnct_cnt++;
    pthread_mutex_unlock(&webu->mutex_clients);
}

cls_webu_ans::~cls_webu_ans()
{
    mydelete(webu_json);
    mydelete(webu_post);

    myfree(gzip_resp);

    pthread_mutex_lock(&webu->mutex_clients);
        webu->cnct_cnt--;
    pthread_mutex_unlock(&webu->mutex_clients);
}
