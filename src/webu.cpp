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
#include "conf.hpp"
#include "webu.hpp"
#include "webu_ans.hpp"

/* Initialize the MHD answer */
static void *webu_mhd_init(void *cls, const char *uri, struct MHD_Connection *connection)
{
    (void)connection;
    cls_camgate     *p_app =(cls_camgate *)cls;
    cls_webu_ans    *webua;

    mythreadname_set("wc", 0, NULL);

    webua = new cls_webu_ans(p_app, uri);

    return webua;
}

/* Clean up our variables when the MHD connection closes */
static void webu_mhd_deinit(void *cls, struct MHD_Connection *connection
        , void **con_cls, enum MHD_RequestTerminationCode toe)
{
    (void)connection;
    (void)cls;
    (void)toe;
    cls_webu_ans *webua =(cls_webu_ans *) *con_cls;

    if (webua != nullptr) {
        delete webua;
        *con_cls = nullptr;
    }
}

/* Answer the connection request for the webcontrol*/
static mhdrslt mhd_answer(void *cls
        , struct MHD_Connection *connection
        , const char *url, const char *method, const char *version
        , const char *upload_data, size_t *upload_data_size
        , void **ptr)
{
    (void)cls;
    (void)url;
    (void)version;

    cls_webu_ans *webua =(cls_webu_ans *) *ptr;

    return webua->answer_main(connection, method, upload_data, upload_data_size);
}

static void webu_bind_opt(ctx_webu_bind &wbind, enum MHD_OPTION opt
    , intptr_t val, void *ptr)
{
    wbind.ops[wbind.ops_cnt].option = opt;
    wbind.ops[wbind.ops_cnt].value = val;
    wbind.ops[wbind.ops_cnt].ptr_value = ptr;
    wbind.ops_cnt++;
}

/*
 * Thread per connection, a request timeout and the per request
 * callbacks.  localhost pins the socket to the loopback address.
 * IPv6 is dropped when MHD was built without it.
 */
void webu_bind_setup(ctx_webu_bind &wbind, int port, bool localhost
    , bool ipv6, void *app)
{
    wbind.ops_cnt = 0;
    wbind.ipv6 = ipv6;
    if (ipv6 && (MHD_is_feature_supported(MHD_FEATURE_IPv6) != MHD_YES)) {
        CAMGATE_LOG(NTC, TYPE_NET, NO_ERRNO, _("IPV6: disabled"));
        wbind.ipv6 = false;
    }

    wbind.flags = MHD_USE_THREAD_PER_CONNECTION;
    if (wbind.ipv6) {
        wbind.flags |= MHD_USE_DUAL_STACK;
    }

    webu_bind_opt(wbind, MHD_OPTION_NOTIFY_COMPLETED
        , (intptr_t)webu_mhd_deinit, NULL);
    webu_bind_opt(wbind, MHD_OPTION_URI_LOG_CALLBACK
        , (intptr_t)webu_mhd_init, app);

    if (localhost && wbind.ipv6) {
        memset(&wbind.lpbk_ipv6, 0, sizeof(wbind.lpbk_ipv6));
        wbind.lpbk_ipv6.sin6_family = AF_INET6;
        wbind.lpbk_ipv6.sin6_port = htons((uint16_t)port);
        wbind.lpbk_ipv6.sin6_addr = in6addr_loopback;
        webu_bind_opt(wbind, MHD_OPTION_SOCK_ADDR, 0, &wbind.lpbk_ipv6);
    } else if (localhost) {
        memset(&wbind.lpbk_ipv4, 0, sizeof(wbind.lpbk_ipv4));
        wbind.lpbk_ipv4.sin_family = AF_INET;
        wbind.lpbk_ipv4.sin_port = htons((uint16_t)port);
        wbind.lpbk_ipv4.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        webu_bind_opt(wbind, MHD_OPTION_SOCK_ADDR, 0, &wbind.lpbk_ipv4);
    }

    webu_bind_opt(wbind, MHD_OPTION_CONNECTION_TIMEOUT, 120, NULL);
    webu_bind_opt(wbind, MHD_OPTION_END, 0, NULL);
}

/* Actions the web control may perform.  All default to on */
void cls_webu::init_actions()
{
    wb_actions = new ctx_params;
    util_parms_parse(wb_actions
        ,"webcontrol_actions", app->cfg->webcontrol_actions);

    util_parms_add_default(wb_actions,"trigger","on");
    util_parms_add_default(wb_actions,"ptz","on");
    util_parms_add_default(wb_actions,"recording","on");
    util_parms_add_default(wb_actions,"clips","on");
    util_parms_add_default(wb_actions,"settings","on");
    util_parms_add_default(wb_actions,"presets","on");
    util_parms_add_default(wb_actions,"camera_time","on");
    util_parms_add_default(wb_actions,"notify","on");
}

bool cls_webu::action_enabled(std::string action)
{
    int indx;

    if (wb_actions == nullptr) {
        return false;
    }
    for (indx=0; indx<wb_actions->params_cnt; indx++) {
        if (wb_actions->params_array[indx].param_name == action) {
            return mtob(wb_actions->params_array[indx].param_value);
        }
    }
    return false;
}

void cls_webu::start_daemon()
{
    wb_bind = new ctx_webu_bind;
    webu_bind_setup(*wb_bind, app->cfg->webcontrol_port
        , app->cfg->webcontrol_localhost, app->cfg->webcontrol_ipv6, app);

    wb_daemon = MHD_start_daemon (
        wb_bind->flags
        , (uint16_t)app->cfg->webcontrol_port
        , NULL, NULL
        , &mhd_answer, app
        , MHD_OPTION_ARRAY, wb_bind->ops
        , MHD_OPTION_END);

    if (wb_daemon == nullptr) {
        CAMGATE_LOG(ERR, TYPE_NET, NO_ERRNO
            ,_("Unable to start webcontrol on port %d")
            ,app->cfg->webcontrol_port);
    } else {
        CAMGATE_LOG(NTC, TYPE_NET, NO_ERRNO
            ,_("Started webcontrol on port %d%s")
            ,app->cfg->webcontrol_port
            ,app->cfg->webcontrol_localhost ? " (localhost)" : "");
    }
}

void cls_webu::startup()
{
    wb_daemon = nullptr;
    wb_actions = nullptr;
    wb_finish = false;
    cnct_cnt = 0;
    wb_clients.clear();

    if (app->cfg->webcontrol_port == 0 ) {
        return;
    }

    CAMGATE_LOG(NTC, TYPE_NET, NO_ERRNO
        , _("Starting webcontrol on port %d")
        , app->cfg->webcontrol_port);

    if (app->cfg->webcontrol_api_key == "") {
        CAMGATE_LOG(INF, TYPE_NET, NO_ERRNO
            , _("No api key set.  Web control is open to any client that can connect"));
    }

    init_actions();
    start_daemon();
}

/* Open requests get WEBUI_STOP_WAIT ms before the daemon goes */
void cls_webu::shutdown()
{
    int64_t deadline;
    int cnt;

    wb_finish = true;
    CAMGATE_LOG(NTC, TYPE_NET, NO_ERRNO, _("Closing webcontrol"));

    deadline = util_mono_ms() + WEBUI_STOP_WAIT;
    for (;;) {
        pthread_mutex_lock(&mutex_clients);
            cnt = cnct_cnt;
        pthread_mutex_unlock(&mutex_clients);
        if (cnt <= 0) {
            break;
        }
        if (util_mono_ms() >= deadline) {
            CAMGATE_LOG(WRN, TYPE_NET, NO_ERRNO
                , _("%d requests still open, closing webcontrol anyway"), cnt);
            break;
        }
        SLEEP(0, 5000000L);
    }

    if (wb_daemon != nullptr) {
        MHD_stop_daemon (wb_daemon);
        wb_daemon = nullptr;
    }

    mydelete(wb_bind);
    mydelete(wb_actions);
}

cls_webu::cls_webu(cls_camgate *p_app)
{
    app = p_app;
    wb_bind = nullptr;
    pthread_mutex_init(&mutex_clients, NULL);
    startup();
}

cls_webu::~cls_webu()
{
    shutdown();
    pthread_mutex_destroy(&mutex_clients);
}
