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

#ifndef _INCLUDE_UTIL_HPP_
#define _INCLUDE_UTIL_HPP_

#ifdef HAVE_GETTEXT
    #include <libintl.h>
#endif

#define _(STRING) mytranslate_text(STRING, 2)

#define SLEEP(seconds, nanoseconds) {              \
                struct timespec ts1;                \
                ts1.tv_sec = seconds;             \
                ts1.tv_nsec = (long)nanoseconds;        \
                while (nanosleep(&ts1, &ts1) == -1); \
        }
#define myfree(x)   {if(x!=nullptr) {free(x);  x=nullptr;}}
#define mydelete(x) {if(x!=nullptr) {delete x; x=nullptr;}}

#if MHD_VERSION >= 0x00097002
    typedef enum MHD_Result mhdrslt; /* Version independent return result from MHD */
#else
    typedef int             mhdrslt; /* Version independent return result from MHD */
#endif

struct ctx_params_item {
    std::string     param_name;
    std::string     param_value;
};
typedef std::vector<ctx_params_item> vec_params;
struct ctx_params {
    vec_params  params_array;
    int         params_cnt;
    std::string params_desc;
};

/* One entry of a directory listing */
struct ctx_file_stat {
    std::string     name;
    std::string     full_nm;
    int64_t         size;
    int64_t         mtime_ms;
};
typedef std::vector<ctx_file_stat> vec_file_stat;

    void *mymalloc(size_t nbytes);
    void *myrealloc(void *ptr, size_t size, const char *desc);
    int mycreate_path(const char *path);
    FILE *myfopen(const char *path, const char *mode);
    int myfclose(FILE *fh);

    void mythreadname_set(const char *abbr, int threadnbr, const char *threadname);
    void mythreadname_get(char *threadname);
    void mythreadname_get(std::string &threadname);

    char* mytranslate_text(const char *msgid, int setnls);
    void mytranslate_init(void);

    int mystrceq(const char* var1, const char* var2);
    int mystrcne(const char* var1, const char* var2);
    int mystreq(const char* var1, const char* var2);
    int mystrne(const char* var1, const char* var2);
    void myltrim(std::string &parm);
    void myrtrim(std::string &parm);
    void mytrim(std::string &parm);
    void myunquote(std::string &parm);
    std::string mytolower(std::string parm);
    bool mystarts(const std::string &parm, const std::string &prefix);
    bool myends(const std::string &parm, const std::string &suffix);

    void util_parms_parse(ctx_params *params, std::string parm_desc, std::string confline);
    void util_parms_add_default(ctx_params *params, std::string parm_nm, std::string parm_vl);
    void util_parms_add_default(ctx_params *params, std::string parm_nm, int parm_vl);
    void util_parms_add(ctx_params *params, std::string parm_nm, std::string parm_val);
    void util_parms_update(ctx_params *params, std::string &confline);

    int mtoi(std::string parm);
    int mtoi(char *parm);
    float mtof(char *parm);
    float mtof(std::string parm);
    bool mtob(std::string parm);
    bool mtob(char *parm);
    long mtol(std::string parm);
    long mtol(char *parm);
    std::string mtok(std::string &parm, std::string tok);

    int64_t util_now_ms();
    int64_t util_mono_ms();
    std::string util_iso_time(int64_t epoch_ms);
    int64_t util_parse_iso(std::string isotm);

    std::string util_url_encode(std::string parm);
    std::string util_url_decode(std::string parm);
    std::string util_url_mask(std::string url);
    std::string util_json_escape(std::string parm);

    std::string util_base64_encode(const uint8_t *data, size_t len);
    void util_random_bytes(uint8_t *buf, size_t len);
    std::string util_random_hex(size_t nbytes);
    std::string util_uuid();
    std::string util_md5_hex(std::string parm);
    void util_sha1(const uint8_t *data, size_t len, uint8_t *digest);

    void util_split_ws(std::string parm, std::vector<std::string> &toks);
    int util_dir_list(std::string dirnm, std::string suffix, vec_file_stat &files);
    bool util_file_exists(std::string fname);
    int util_file_remove(std::string fname);
    int util_file_read(std::string fname, std::string &data);
    int util_file_write(std::string fname, const std::string &data);

    const char *cg_err_str(enum CG_ERR err);

#endif /* _INCLUDE_UTIL_HPP_ */
