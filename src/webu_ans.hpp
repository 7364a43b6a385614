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
#ifndef _INCLUDE_WEBU_ANS_HPP_
#define _INCLUDE_WEBU_ANS_HPP_
    class cls_webu_ans {
        public:
            cls_webu_ans(cls_camgate *p_app, const char *uri);
            ~cls_webu_ans();

            mhdrslt answer_main(struct MHD_Connection *connection, const char *method
                , const char *upload_data, size_t *upload_data_size);

            void            mhd_send();
            void            bad_request(std::string msg = "Bad request");
            void            not_found();
            void            error_resp(unsigned int code, std::string msg);
            std::string     arg_get(const char *name);

            cls_camgate     *app;
            cls_webu        *webu;
            cls_gateway     *gw;

            struct MHD_Connection   *connection;

            std::string     url;            /* The URL sent from the client */
            std::string     uri_camid;      /* Parsed camera id from the url eg /camid/cmd1/cmd2/cmd3 */
            std::string     uri_cmd1;       /* Parsed command1 from the url eg /camid/cmd1/cmd2/cmd3 */
            std::string     uri_cmd2;       /* Parsed command2 from the url eg /camid/cmd1/cmd2/cmd3 */
            std::string     uri_cmd3;       /* Parsed command3 from the url eg /camid/cmd1/cmd2/cmd3 */
            std::string     uri_route;      /* cmd1/cmd2/cmd3 joined */

            enum WEBUI_RESP resp_type;      /* indicator for the type of response to provide. */
            std::string     resp_page;      /* The response that will be sent */
            unsigned int    resp_code;      /* HTTP status of the response */
            std::string     clientip;       /* IP of the connecting client */
            std::string     api_key;        /* Key presented by the client */
            std::string     post_body;      /* Accumulated request body */
            bool            post_toolarge;  /* Body exceeded the accepted size */
            bool            gzip_encode;    /* Bool for whether to gzip response */

        private:
            cls_webu_json   *webu_json;
            cls_webu_post   *webu_post;

            int             mhd_first;      /* Boolean for whether it is the first connection*/
            bool            authenticated;  /* Boolean for whether the key check passed */
            enum WEBUI_METHOD   cnct_method;    /* Connection method.  Get or Post */
            u_char  *gzip_resp;     /* Response in gzip format */
            ulong    gzip_size;     /* Size of response in gzip format */

            int parseurl();
            void parms_edit();
            void gateway_get();
            void clientip_get();
            void failauth_log();
            void client_connect();
            mhdrslt failauth_check();
            bool key_check();
            void answer_get();
            void gzip_deflate();

    };

    bool webu_key_match(const std::string &expected, const std::string &given);

#endif /* _INCLUDE_WEBU_ANS_HPP_ */
