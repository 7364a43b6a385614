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

#ifndef _INCLUDE_EVTBUS_HPP_
#define _INCLUDE_EVTBUS_HPP_

enum TRIGGER_SOURCE {
    TRIGGER_MOTION,
    TRIGGER_DETECTION,
    TRIGGER_MANUAL
};

/* One request to record, from the analyzer, a detector or a user */
struct ctx_trigger {
    enum TRIGGER_SOURCE source;
    int64_t         timestamp;      /* Epoch ms */
    double          confidence;     /* 0..1, negative when unknown */
    std::string     species;
};

struct ctx_clip {
    std::string     id;
    std::string     device_id;
    int64_t         started_at;     /* Epoch ms */
    int64_t         ended_at;
    int64_t         duration_ms;
    std::string     file_path;
    std::string     thumb_path;
    std::string     snapshot_path;
    ctx_trigger     trigger;
    int64_t         size_bytes;
};

struct ctx_motion_evt {
    bool            active;         /* false for the end of a motion period */
    int64_t         timestamp;
    double          confidence;     /* 0..100 */
    double          score;
};

enum STREAM_STATE {
    STREAM_IDLE,
    STREAM_STARTING,
    STREAM_RUNNING,
    STREAM_CRASHED,
    STREAM_STOPPED
};

struct ctx_stream_evt {
    enum STREAM_STATE   state;
    bool                relay;      /* Event is about the relay process */
    int64_t             timestamp;
};

/* Typed publish/subscribe channel */
template <typename T>
class cls_evtbus {
    public:
        typedef std::function<void(const T &)> evt_handler;

        cls_evtbus()
        {
            pthread_mutex_init(&mutex, NULL);
            next_id = 1;
        }
        ~cls_evtbus()
        {
            pthread_mutex_destroy(&mutex);
        }

        int subscribe(evt_handler fn)
        {
            int id;
            pthread_mutex_lock(&mutex);
                id = next_id++;
                subs[id] = fn;
            pthread_mutex_unlock(&mutex);
            return id;
        }

        void unsubscribe(int id)
        {
            pthread_mutex_lock(&mutex);
                subs.erase(id);
            pthread_mutex_unlock(&mutex);
        }

        /* Handlers run on the publishing thread, outside the lock */
        void publish(const T &evt)
        {
            std::vector<evt_handler> handlers;
            typename std::map<int, evt_handler>::iterator it;
            size_t indx;

            pthread_mutex_lock(&mutex);
                for (it = subs.begin(); it != subs.end(); it++) {
                    handlers.push_back(it->second);
                }
            pthread_mutex_unlock(&mutex);

            for (indx = 0; indx < handlers.size(); indx++) {
                handlers[indx](evt);
            }
        }

        size_t count()
        {
            size_t cnt;
            pthread_mutex_lock(&mutex);
                cnt = subs.size();
            pthread_mutex_unlock(&mutex);
            return cnt;
        }

    private:
        pthread_mutex_t                 mutex;
        std::map<int, evt_handler>      subs;
        int                             next_id;
};

    const char *trigger_source_str(enum TRIGGER_SOURCE src);
    enum TRIGGER_SOURCE trigger_source_nbr(std::string src);
    const char *stream_state_str(enum STREAM_STATE st);

#endif /* _INCLUDE_EVTBUS_HPP_ */
