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
#include "http.hpp"

bool http_url_parse(std::string url, ctx_url &parsed)
{
    size_t pos, atpos, colpos, slpos;
    std::string auth, hostport;

    parsed.scheme = "";
    parsed.user = "";
    parsed.pass = "";
    parsed.host = "";
    parsed.port = 0;
    parsed.path = "/";

    pos = url.find("://");
    if (pos == std::string::npos) {
        return false;
    }
    parsed.scheme = mytolower(url.substr(0, pos));
    url = url.substr(pos + 3);

    slpos = url.find('/');
    if (slpos == std::string::npos) {
        hostport = url;
    } else {
        hostport = url.substr(0, slpos);
        parsed.path = url.substr(slpos);
    }

    atpos = hostport.rfind('@');
    if (atpos != std::string::npos) {
        auth = hostport.substr(0, atpos);
        hostport = hostport.substr(atpos + 1);
        colpos = auth.find(':');
        if (colpos == std::string::npos) {
            parsed.user = util_url_decode(auth);
        } else {
            parsed.user = util_url_decode(auth.substr(0, colpos));
            parsed.pass = util_url_decode(auth.substr(colpos + 1));
        }
    }

    if ((hostport.length() > 0) && (hostport[0] == '[')) {
        pos = hostport.find(']');
        if (pos == std::string::npos) {
            return false;
        }
        parsed.host = hostport.substr(1, pos - 1);
        if ((pos + 1 < hostport.length()) && (hostport[pos + 1] == ':')) {
            parsed.port = mtoi(hostport.substr(pos + 2));
        }
    } else {
        colpos = hostport.rfind(':');
        if (colpos == std::string::npos) {
            parsed.host = hostport;
        } else {
            parsed.host = hostport.substr(0, colpos);
            parsed.port = mtoi(hostport.substr(colpos + 1));
        }
    }

    if (parsed.port == 0) {
        if (parsed.scheme == "https") {
            parsed.port = 443;
        } else if ((parsed.scheme == "rtsp") || (parsed.scheme == "rtsps")) {
            parsed.port = 554;
        } else {
            parsed.port = 80;
        }
    }

    if (parsed.host == "") {
        return false;
    }
    return true;
}

std::string http_url_host(ctx_url &parsed)
{
    std::string retcd;

    if (parsed.host.find(':') != std::string::npos) {
        retcd = "[" + parsed.host + "]";
    } else {
        retcd = parsed.host;
    }
    if (((parsed.scheme == "http") && (parsed.port != 80)) ||
        ((parsed.scheme == "https") && (parsed.port != 443))) {
        retcd += ":" + std::to_string(parsed.port);
    }
    return retcd;
}

void http_req_init(ctx_http_req &req, std::string method, std::string url, int timeout_ms)
{
    req.method = method;
    req.url = url;
    req.content_type = "";
    req.body = "";
    req.headers.clear();
    req.timeout_ms = timeout_ms;
}

void http_resp_init(ctx_http_resp &resp)
{
    resp.status = 0;
    resp.body = "";
    resp.headers.clear();
    resp.err = CG_ERR_NONE;
    resp.errmsg = "";
}

/* Value of key="value" or key=token inside a WWW-Authenticate header */
std::string http_auth_param(const std::string &challenge, const std::string &key)
{
    std::string lwr, retcd;
    size_t pos, st, en;
    char pc;

    lwr = mytolower(challenge);
    pos = 0;
    while ((pos = lwr.find(mytolower(key) + "=", pos)) != std::string::npos) {
        if (pos > 0) {
            pc = lwr[pos - 1];
            if ((pc != ' ') && (pc != ',') && (pc != '\t')) {
                pos++;
                continue;
            }
        }
        st = pos + key.length() + 1;
        if ((st < challenge.length()) && (challenge[st] == '"')) {
            en = challenge.find('"', st + 1);
            if (en == std::string::npos) {
                return challenge.substr(st + 1);
            }
            return challenge.substr(st + 1, en - st - 1);
        }
        en = challenge.find(',', st);
        if (en == std::string::npos) {
            retcd = challenge.substr(st);
        } else {
            retcd = challenge.substr(st, en - st);
        }
        mytrim(retcd);
        return retcd;
    }
    return "";
}

/* RFC 2617 response value */
std::string http_digest_response(std::string user, std::string pass
    , std::string realm, std::string nonce, std::string method, std::string uri
    , std::string qop, std::string nc, std::string cnonce)
{
    std::string ha1, ha2;

    ha1 = util_md5_hex(user + ":" + realm + ":" + pass);
    ha2 = util_md5_hex(method + ":" + uri);
    if (qop == "") {
        return util_md5_hex(ha1 + ":" + nonce + ":" + ha2);
    }
    return util_md5_hex(ha1 + ":" + nonce + ":" + nc + ":" +
        cnonce + ":" + qop + ":" + ha2);
}

/* Authorization header answering a Digest challenge */
std::string http_digest_header(std::string challenge, std::string user
    , std::string pass, std::string method, std::string uri, std::string cnonce)
{
    std::string realm, nonce, qop, opaque, algorithm, nc, response, retcd;

    realm = http_auth_param(challenge, "realm");
    nonce = http_auth_param(challenge, "nonce");
    qop = http_auth_param(challenge, "qop");
    opaque = http_auth_param(challenge, "opaque");
    algorithm = http_auth_param(challenge, "algorithm");
    nc = "00000001";

    if (qop != "") {
        /* Only auth is offered, never auth-int */
        qop = "auth";
    }

    response = http_digest_response(user, pass, realm, nonce
        , method, uri, qop, nc, cnonce);

    retcd = "Digest username=\"" + user + "\"" +
        ", realm=\"" + realm + "\"" +
        ", nonce=\"" + nonce + "\"" +
        ", uri=\"" + uri + "\"";
    if (algorithm != "") {
        retcd += ", algorithm=" + algorithm;
    }
    if (qop != "") {
        retcd += ", qop=" + qop + ", nc=" + nc + ", cnonce=\"" + cnonce + "\"";
    }
    retcd += ", response=\"" + response + "\"";
    if (opaque != "") {
        retcd += ", opaque=\"" + opaque + "\"";
    }
    return retcd;
}

std::string http_form_encode(std::map<std::string, std::string> &fields)
{
    std::string retcd;
    std::map<std::string, std::string>::iterator it;

    retcd = "";
    for (it = fields.begin(); it != fields.end(); it++) {
        if (retcd != "") {
            retcd += "&";
        }
        retcd += util_url_encode(it->first) + "=" + util_url_encode(it->second);
    }
    return retcd;
}

int cls_http::sock_wait(int sockfd, short events, int64_t deadline)
{
    struct pollfd pfd;
    int64_t remain;
    int retcd;

    remain = deadline - util_mono_ms();
    if (remain <= 0) {
        return -1;
    }
    pfd.fd = sockfd;
    pfd.events = events;
    pfd.revents = 0;
    retcd = poll(&pfd, 1, (int)remain);
    while ((retcd < 0) && (errno == EINTR)) {
        remain = deadline - util_mono_ms();
        if (remain <= 0) {
            return -1;
        }
        retcd = poll(&pfd, 1, (int)remain);
    }
    if (retcd <= 0) {
        return -1;
    }
    return 0;
}

int cls_http::sock_connect(ctx_url &url, int timeout_ms, ctx_http_resp &resp)
{
    struct addrinfo hints, *res, *ai;
    int sockfd, retcd, soerr;
    socklen_t solen;
    int64_t deadline;
    std::string portstr;

    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    portstr = std::to_string(url.port);

    retcd = getaddrinfo(url.host.c_str(), portstr.c_str(), &hints, &res);
    if (retcd != 0) {
        resp.err = CG_ERR_NETWORK;
        resp.errmsg = std::string("resolve ") + url.host + ": " + gai_strerror(retcd);
        return -1;
    }

    deadline = util_mono_ms() + timeout_ms;
    sockfd = -1;
    for (ai = res; ai != nullptr; ai = ai->ai_next) {
        sockfd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sockfd < 0) {
            continue;
        }
        fcntl(sockfd, F_SETFL, fcntl(sockfd, F_GETFL) | O_NONBLOCK);
        retcd = connect(sockfd, ai->ai_addr, ai->ai_addrlen);
        if ((retcd < 0) && (errno == EINPROGRESS)) {
            if (sock_wait(sockfd, POLLOUT, deadline) == 0) {
                soerr = 0;
                solen = sizeof(soerr);
                getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &soerr, &solen);
                retcd = (soerr == 0) ? 0 : -1;
                if (soerr != 0) {
                    errno = soerr;
                }
            } else {
                errno = ETIMEDOUT;
                retcd = -1;
            }
        }
        if (retcd == 0) {
            break;
        }
        close(sockfd);
        sockfd = -1;
    }
    freeaddrinfo(res);

    if (sockfd < 0) {
        resp.err = (errno == ETIMEDOUT) ? CG_ERR_TIMEOUT : CG_ERR_NETWORK;
        resp.errmsg = std::string("connect ") + url.host + ":" +
            portstr + ": " + strerror(errno);
        return -1;
    }
    return sockfd;
}

SSL *cls_http::ssl_start(int sockfd, ctx_url &url, int64_t deadline, ctx_http_resp &resp)
{
    SSL *ssl;
    int retcd, sslerr;
    const char *reason;

    if (ssl_ctx == nullptr) {
        resp.err = CG_ERR_NETWORK;
        resp.errmsg = "TLS is not available";
        return nullptr;
    }
    pthread_mutex_lock(&mutex_ssl);
        ssl = SSL_new(ssl_ctx);
    pthread_mutex_unlock(&mutex_ssl);
    if (ssl == nullptr) {
        resp.err = CG_ERR_NETWORK;
        resp.errmsg = "SSL_new failed";
        return nullptr;
    }
    SSL_set_fd(ssl, sockfd);
    SSL_set_tlsext_host_name(ssl, url.host.c_str());
    SSL_set1_host(ssl, url.host.c_str());

    while ((retcd = SSL_connect(ssl)) != 1) {
        sslerr = SSL_get_error(ssl, retcd);
        if (sslerr == SSL_ERROR_WANT_READ) {
            retcd = sock_wait(sockfd, POLLIN, deadline);
        } else if (sslerr == SSL_ERROR_WANT_WRITE) {
            retcd = sock_wait(sockfd, POLLOUT, deadline);
        } else {
            reason = ERR_reason_error_string(ERR_get_error());
            resp.err = CG_ERR_NETWORK;
            resp.errmsg = std::string("TLS handshake with ") + url.host + " failed: " +
                ((reason == nullptr) ? "unknown" : reason);
            SSL_free(ssl);
            return nullptr;
        }
        if (retcd != 0) {
            resp.err = CG_ERR_TIMEOUT;
            resp.errmsg = "TLS handshake timed out";
            SSL_free(ssl);
            return nullptr;
        }
    }
    return ssl;
}

int cls_http::xfer_send(int sockfd, SSL *ssl, const std::string &data, int64_t deadline)
{
    size_t sent;
    ssize_t retcd;
    int sslerr;

    sent = 0;
    while (sent < data.length()) {
        if (ssl != nullptr) {
            retcd = SSL_write(ssl, data.c_str() + sent, (int)(data.length() - sent));
            if (retcd <= 0) {
                sslerr = SSL_get_error(ssl, (int)retcd);
                if ((sslerr == SSL_ERROR_WANT_WRITE) || (sslerr == SSL_ERROR_WANT_READ)) {
                    if (sock_wait(sockfd, (sslerr == SSL_ERROR_WANT_WRITE) ? POLLOUT : POLLIN
                            , deadline) != 0) {
                        return -1;
                    }
                    continue;
                }
                return -1;
            }
        } else {
            retcd = send(sockfd, data.c_str() + sent, data.length() - sent, MSG_NOSIGNAL);
            if (retcd < 0) {
                if ((errno == EAGAIN) || (errno == EWOULDBLOCK) || (errno == EINTR)) {
                    if (sock_wait(sockfd, POLLOUT, deadline) != 0) {
                        return -1;
                    }
                    continue;
                }
                return -1;
            }
        }
        sent += (size_t)retcd;
    }
    return 0;
}

/* Read until the peer closes or the declared body has arrived */
int cls_http::xfer_recv(int sockfd, SSL *ssl, std::string &data, int64_t deadline)
{
    char buf[8192];
    ssize_t retcd;
    int sslerr;
    size_t hdrend, clen_pos;
    long clen;
    std::string lwr;

    clen = -1;
    hdrend = std::string::npos;
    while (data.length() < HTTP_MAX_BODY) {
        if (ssl != nullptr) {
            retcd = SSL_read(ssl, buf, sizeof(buf));
            if (retcd <= 0) {
                sslerr = SSL_get_error(ssl, (int)retcd);
                if ((sslerr == SSL_ERROR_WANT_READ) || (sslerr == SSL_ERROR_WANT_WRITE)) {
                    if (sock_wait(sockfd, (sslerr == SSL_ERROR_WANT_READ) ? POLLIN : POLLOUT
                            , deadline) != 0) {
                        return -1;
                    }
                    continue;
                }
                if (sslerr == SSL_ERROR_ZERO_RETURN) {
                    return 0;
                }
                /* Many servers drop the connection without close_notify */
                return (data.length() > 0) ? 0 : -1;
            }
        } else {
            retcd = recv(sockfd, buf, sizeof(buf), 0);
            if (retcd < 0) {
                if ((errno == EAGAIN) || (errno == EWOULDBLOCK) || (errno == EINTR)) {
                    if (sock_wait(sockfd, POLLIN, deadline) != 0) {
                        return -1;
                    }
                    continue;
                }
                return -1;
            }
            if (retcd == 0) {
                return 0;
            }
        }
        data.append(buf, (size_t)retcd);

        if (hdrend == std::string::npos) {
            hdrend = data.find("\r\n\r\n");
            if (hdrend != std::string::npos) {
                lwr = mytolower(data.substr(0, hdrend));
                clen_pos = lwr.find("\r\ncontent-length:");
                if (clen_pos != std::string::npos) {
                    clen = atol(lwr.c_str() + clen_pos + 17);
                }
            }
        }
        if ((hdrend != std::string::npos) && (clen >= 0) &&
            (data.length() >= hdrend + 4 + (size_t)clen)) {
            return 0;
        }
    }
    return 0;
}

void cls_http::dechunk(std::string &body)
{
    std::string out;
    size_t pos, eol;
    long chunk;

    pos = 0;
    out = "";
    while (pos < body.length()) {
        eol = body.find("\r\n", pos);
        if (eol == std::string::npos) {
            break;
        }
        chunk = strtol(body.substr(pos, eol - pos).c_str(), nullptr, 16);
        if (chunk <= 0) {
            break;
        }
        pos = eol + 2;
        out += body.substr(pos, (size_t)chunk);
        pos += (size_t)chunk + 2;
    }
    body = out;
}

int cls_http::parse_response(std::string &raw, ctx_http_resp &resp)
{
    size_t hdrend, pos, eol, colon;
    std::string line, nm, vl;

    hdrend = raw.find("\r\n\r\n");
    if ((hdrend == std::string::npos) || (raw.compare(0, 5, "HTTP/") != 0)) {
        resp.err = CG_ERR_PARSE;
        resp.errmsg = "Malformed HTTP response";
        return -1;
    }

    eol = raw.find("\r\n");
    line = raw.substr(0, eol);
    pos = line.find(' ');
    if (pos == std::string::npos) {
        resp.err = CG_ERR_PARSE;
        resp.errmsg = "Malformed status line";
        return -1;
    }
    resp.status = mtoi(line.substr(pos + 1, 3));

    pos = eol + 2;
    while (pos < hdrend) {
        eol = raw.find("\r\n", pos);
        line = raw.substr(pos, eol - pos);
        pos = eol + 2;
        colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        nm = mytolower(line.substr(0, colon));
        vl = line.substr(colon + 1);
        mytrim(vl);
        if (resp.headers.find(nm) != resp.headers.end()) {
            resp.headers[nm] += ", " + vl;
        } else {
            resp.headers[nm] = vl;
        }
    }

    resp.body = raw.substr(hdrend + 4);
    if (mytolower(resp.headers["transfer-encoding"]).find("chunked") != std::string::npos) {
        dechunk(resp.body);
    }
    return 0;
}

int cls_http::request(ctx_http_req &req, ctx_http_resp &resp)
{
    ctx_url url;
    std::string msg, raw;
    std::map<std::string, std::string>::iterator it;
    int sockfd, retcd;
    int64_t deadline;
    SSL *ssl;

    http_resp_init(resp);

    if (http_url_parse(req.url, url) == false) {
        resp.err = CG_ERR_PARSE;
        resp.errmsg = "Invalid URL";
        return -1;
    }
    if ((url.scheme != "http") && (url.scheme != "https")) {
        resp.err = CG_ERR_PARSE;
        resp.errmsg = "Unsupported scheme " + url.scheme;
        return -1;
    }

    deadline = util_mono_ms() + req.timeout_ms;
    sockfd = sock_connect(url, req.timeout_ms, resp);
    if (sockfd < 0) {
        return -1;
    }

    ssl = nullptr;
    if (url.scheme == "https") {
        ssl = ssl_start(sockfd, url, deadline, resp);
        if (ssl == nullptr) {
            close(sockfd);
            return -1;
        }
    }

    msg = req.method + " " + url.path + " HTTP/1.1\r\n";
    msg += "Host: " + http_url_host(url) + "\r\n";
    msg += "User-Agent: " + std::string(PACKAGE) + "/" + VERSION + "\r\n";
    msg += "Connection: close\r\n";
    if (req.content_type != "") {
        msg += "Content-Type: " + req.content_type + "\r\n";
    }
    for (it = req.headers.begin(); it != req.headers.end(); it++) {
        msg += it->first + ": " + it->second + "\r\n";
    }
    if ((req.body != "") || (req.method == "POST") || (req.method == "PUT")) {
        msg += "Content-Length: " + std::to_string(req.body.length()) + "\r\n";
    }
    msg += "\r\n";
    msg += req.body;

    raw = "";
    retcd = xfer_send(sockfd, ssl, msg, deadline);
    if (retcd == 0) {
        retcd = xfer_recv(sockfd, ssl, raw, deadline);
    }

    if (ssl != nullptr) {
        SSL_shutdown(ssl);
        SSL_free(ssl);
    }
    close(sockfd);

    if (retcd != 0) {
        if (util_mono_ms() >= deadline) {
            resp.err = CG_ERR_TIMEOUT;
            resp.errmsg = "Timed out waiting for " + url.host;
        } else {
            resp.err = CG_ERR_NETWORK;
            resp.errmsg = "Transfer with " + url.host + " failed: " + strerror(errno);
        }
        return -1;
    }

    if (parse_response(raw, resp) != 0) {
        return -1;
    }

    CAMGATE_LOG(DBG, TYPE_NET, NO_ERRNO, "%s %s -> %d"
        , req.method.c_str(), util_url_mask(req.url).c_str(), resp.status);

    return 0;
}

cls_http::cls_http()
{
    pthread_mutex_init(&mutex_ssl, NULL);
    ssl_ctx = SSL_CTX_new(TLS_client_method());
    if (ssl_ctx == nullptr) {
        CAMGATE_LOG(ERR, TYPE_NET, NO_ERRNO, _("Unable to create TLS context"));
    } else {
        SSL_CTX_set_default_verify_paths(ssl_ctx);
        SSL_CTX_set_verify(ssl_ctx, SSL_VERIFY_PEER, nullptr);
    }
}

cls_http::~cls_http()
{
    if (ssl_ctx != nullptr) {
        SSL_CTX_free(ssl_ctx);
    }
    pthread_mutex_destroy(&mutex_ssl);
}
