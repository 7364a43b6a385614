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

/** Handle signals sent */
static void sig_handler(int signo)
{
    /*The FALLTHROUGH is a special comment required by compiler.  Do not edit it*/
    switch(signo) {
    case SIGALRM:
        cgsignal = CAMGATE_SIGNAL_ALARM;
        break;
    case SIGUSR1:
        cgsignal = CAMGATE_SIGNAL_USR1;
        break;
    case SIGHUP:
        cgsignal = CAMGATE_SIGNAL_SIGHUP;
        break;
    case SIGINT:
        /*FALLTHROUGH*/
    case SIGQUIT:
        /*FALLTHROUGH*/
    case SIGTERM:
        cgsignal = CAMGATE_SIGNAL_SIGTERM;
        break;
    }
}

/*
 * Children are reaped one pid at a time by their supervisors so there
 * is no SIGCHLD handler here.  A broken pipe to a child is ignored.
 */
static void setup_signals(void)
{
    struct sigaction sig_handler_action;
    struct sigaction sig_ign_action;

    #ifdef SA_RESTART
        sig_handler_action.sa_flags = SA_RESTART;
    #else
        sig_handler_action.sa_flags = 0;
    #endif

    sig_handler_action.sa_handler = sig_handler;
    sigemptyset(&sig_handler_action.sa_mask);

    sig_ign_action.sa_flags = 0;
    sig_ign_action.sa_handler = SIG_IGN;
    sigemptyset(&sig_ign_action.sa_mask);

    sigaction(SIGPIPE, &sig_ign_action, NULL);
    sigaction(SIGALRM, &sig_handler_action, NULL);
    sigaction(SIGHUP, &sig_handler_action, NULL);
    sigaction(SIGINT, &sig_handler_action, NULL);
    sigaction(SIGQUIT, &sig_handler_action, NULL);
    sigaction(SIGTERM, &sig_handler_action, NULL);
    sigaction(SIGUSR1, &sig_handler_action, NULL);
}
int main (int p_argc, char **p_argv)
{
    cls_camgate *app;
    int retcd;

    setup_signals();

    app = new cls_camgate();
    cglog = new cls_log(app);

    mythreadname_set("cg",0,"");

    retcd = 0;
    while (true) {
        cgsignal = CAMGATE_SIGNAL_NONE;
        if (app->init(p_argc, p_argv) != 0) {
            retcd = 1;
            break;
        }
        while (app->check_devices()) {
            SLEEP(1, 0);
            if (cgsignal != CAMGATE_SIGNAL_NONE) {
                app->signal_process();
            }
        }
        CAMGATE_LOG(NTC, TYPE_ALL, NO_ERRNO, _("Camgate devices finished"));
        if (app->reload_all) {
            app->deinit();
        } else {
            break;
        }
    }

    app->reload_all = false;
    app->deinit();

    CAMGATE_LOG(NTC, TYPE_ALL, NO_ERRNO, _("Camgate terminating"));

    mydelete(cglog);
    mydelete(app);

    return retcd;
}
