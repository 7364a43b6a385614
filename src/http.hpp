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

#ifndef _INCLUDE_HTTP_HPP_
#define _INCLUDE_HTTP_HPP_

#include <openssl/ssl.h>
#include <openssl/err.h>

#define HTTP_MAX_BODY       (8 * 1024 * 1024)

struct ctx_url {
    std::string     scheme;
    std::string     user;
    std::string     pass;
    std::string     host;
    int             port;
    std::string     path;       /* Path plus query */
};

struct ctx_http_req {
    std::string     method;
    std::string     url;
    std::string     content_type;
    std::string     body;
    std::map<std::string, std::string> headers;
    int             timeout_ms;
};

struct ctx_http_resp {
    int             status;
    std::string     body;
    std::map<std::string, std::string> headers;     /* Lower case names */
    enum CG_ERR     err;
    std::string     errmsg;
};

/* Seam between protocol code and the network */
class cls_http_transport {
    public:
        virtual ~cls_http_transport() {}
        virtual int request(ctx_http_req &req, ctx_http_resp &resp) = 0;
};

class cls_http : public cls_http_transport {
    public:
        cls_http();
        ~cls_http();
        int request(ctx_http_req &req, ctx_http_resp &resp) override;

    private:
        SSL_CTX         *ssl_ctx;
        pthread_mutex_t mutex_ssl;

        int sock_connect(ctx_url &url, int timeout_ms, ctx_http_resp &resp);
        int sock_wait(int sockfd, short events, int64_t deadline);
        int xfer_send(int sockfd, SSL *ssl, const std::string &data, int64_t deadline);
        int xfer_recv(int sockfd, SSL *ssl, std::string &data, int64_t deadline);
        int parse_response(std::string &raw, ctx_http_resp &resp);
        void dechunk(std::string &body);
        SSL *ssl_start(int sockfd, ctx_url &url, int64_t deadline, ctx_http_resp &resp);
};

    bool http_url_parse(std::string url, ctx_url &parsed);
    std::string http_url_host(ctx_url &parsed);
    void http_req_init(ctx_http_req &req, std::string method, std::string url, int timeout_ms);
    void http_resp_init(ctx_http_resp &resp);
    std::string http_auth_param(const std::string &challenge, const std::string &key);
    std::string http_digest_response(std::string user, std::string pass
        , std::string realm, std::string nonce, std::string method, std::string uri
        , std::string qop, std::string nc, std::string cnonce);
    std::string http_digest_header(std::string challenge, std::string user
        , std::string pass, std::string method, std::string uri, std::string cnonce);
    std::string http_form_encode(std::map<std::string, std::string> &fields);

#endif /* _INCLUDE_HTTP_HPP_ */
