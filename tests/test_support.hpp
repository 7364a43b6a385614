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

#ifndef _INCLUDE_TEST_SUPPORT_HPP_
#define _INCLUDE_TEST_SUPPORT_HPP_

#include <ftw.h>
#include <gtest/gtest.h>

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

/* Canned replies in place of the network */
class cls_fake_http : public cls_http_transport {
    public:
        std::vector<ctx_http_req>   reqs;
        std::function<void(const ctx_http_req &, ctx_http_resp &)> reply;
        int                         fail;   /* Requests left to fail with a network error */

        cls_fake_http() : fail(0) {}

        int request(ctx_http_req &req, ctx_http_resp &resp) override
        {
            reqs.push_back(req);
            http_resp_init(resp);
            if (fail > 0) {
                fail--;
                resp.err = CG_ERR_NETWORK;
                resp.errmsg = "Connection refused";
                return -1;
            }
            resp.status = 200;
            if (reply) {
                reply(req, resp);
            }
            return 0;
        }
};

/* PTZ backend that records calls and counts capability probes */
class cls_fake_ptz : public cls_ptz {
    public:
        std::vector<std::string>    calls;
        int                         probes;
        int                         probe_ms;
        int                         next_slot;
        pthread_mutex_t             mutex_calls;

        cls_fake_ptz() : probes(0), probe_ms(0), next_slot(1)
        {
            pthread_mutex_init(&mutex_calls, nullptr);
        }
        ~cls_fake_ptz()
        {
            pthread_mutex_destroy(&mutex_calls);
        }

        bool continuous_move(double pan, double tilt, double zoom) override
        {
            return record("move " + ptz_cgi_direction(pan, tilt, zoom));
        }
        bool stop() override { return record("stop"); }
        bool absolute_move(double, double, double) override { return record("absolute"); }
        bool relative_move(double, double, double) override { return record("relative"); }
        bool get_position(ctx_ptz_pos &pos) override
        {
            pos.pan = 0;
            pos.tilt = 0;
            pos.zoom = 0;
            return true;
        }
        bool get_presets(vec_ptz_preset &presets) override
        {
            presets.clear();
            return true;
        }
        bool goto_preset(std::string token) override { return record("goto " + token); }
        std::string set_preset(std::string name)  override
        {
            record("set " + name);
            return std::to_string(next_slot++);
        }
        bool remove_preset(std::string token) override { return record("remove " + token); }
        bool go_home() override { return record("home"); }
        bool set_home() override { return record("sethome"); }

        std::vector<std::string> call_list()
        {
            std::vector<std::string> retcd;
            pthread_mutex_lock(&mutex_calls);
                retcd = calls;
            pthread_mutex_unlock(&mutex_calls);
            return retcd;
        }

    protected:
        ctx_ptz_caps probe_capabilities() override
        {
            ctx_ptz_caps pc;
            pthread_mutex_lock(&mutex_calls);
                probes++;
            pthread_mutex_unlock(&mutex_calls);
            if (probe_ms > 0) {
                SLEEP(0, (long)probe_ms * 1000000L);
            }
            pc.supported = true;
            pc.absolute = true;
            pc.relative = true;
            pc.continuous = true;
            pc.presets = true;
            pc.home = true;
            return pc;
        }

    private:
        bool record(std::string call)
        {
            pthread_mutex_lock(&mutex_calls);
                calls.push_back(call);
            pthread_mutex_unlock(&mutex_calls);
            return true;
        }
};

static inline int test_rm_entry(const char *fpath, const struct stat *sb
    , int typeflag, struct FTW *ftwbuf)
{
    (void)sb;
    (void)typeflag;
    (void)ftwbuf;
    return remove(fpath);
}

/* Scratch directory removed with its contents */
class cls_test_dir {
    public:
        std::string path;

        cls_test_dir()
        {
            char tmpl[] = "/tmp/camgate_test_XXXXXX";
            if (mkdtemp(tmpl) != nullptr) {
                path = tmpl;
            }
        }
        ~cls_test_dir()
        {
            if (path != "") {
                nftw(path.c_str(), test_rm_entry, 16, FTW_DEPTH | FTW_PHYS);
            }
        }
};

static inline void test_write_file(std::string fname, size_t sz, int64_t age_sec)
{
    std::string data(sz, 'x');
    struct timeval tv[2];

    util_file_write(fname, data);
    gettimeofday(&tv[0], nullptr);
    tv[0].tv_sec -= (time_t)age_sec;
    tv[1] = tv[0];
    utimes(fname.c_str(), tv);
}

/* Config holding only defaults, not tied to an application */
static inline cls_config *test_config(std::string data_dir)
{
    cls_config *cfg;

    cfg = new cls_config(nullptr);
    cfg->data_dir = data_dir;
    cfg->rtsp_url = "rtsp://10.0.0.5:554/stream1";
    return cfg;
}

#endif /* _INCLUDE_TEST_SUPPORT_HPP_ */
