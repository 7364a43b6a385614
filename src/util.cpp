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

/** Non case sensitive equality check for strings*/
int mystrceq(const char* var1, const char* var2)
{
    if ((var1 == NULL) || (var2 == NULL)) {
        return 0;
    }
    return (strcasecmp(var1,var2) ? 0 : 1);
}

/** Non case sensitive inequality check for strings*/
int mystrcne(const char* var1, const char* var2)
{
    if ((var1 == NULL) || (var2 == NULL)) {
        return 0;
    }
    return (strcasecmp(var1,var2) ? 1: 0);
}

/** Case sensitive equality check for strings*/
int mystreq(const char* var1, const char* var2)
{
    if ((var1 == NULL) || (var2 == NULL)) {
        return 0;
    }
    return (strcmp(var1,var2) ? 0 : 1);
}

/** Case sensitive inequality check for strings*/
int mystrne(const char* var1, const char* var2)
{
    if ((var1 == NULL) ||(var2 == NULL)) {
        return 0;
    }
    return (strcmp(var1,var2) ? 1: 0);
}

void myltrim(std::string &parm)
{
    size_t indx;

    indx = 0;
    while ((indx < parm.length()) && std::isspace((unsigned char)parm[indx])) {
        indx++;
    }
    parm.erase(0, indx);
}

void myrtrim(std::string &parm)
{
    while ((parm.length() > 0) &&
        std::isspace((unsigned char)parm[parm.length()-1])) {
        parm.erase(parm.length()-1);
    }
}

void mytrim(std::string &parm)
{
    myrtrim(parm);
    myltrim(parm);
}

/* Remove surrounding quotes */
void myunquote(std::string &parm)
{
    size_t plen;

    mytrim(parm);

    plen = parm.length();
    while ((plen >= 2) &&
        (((parm[0] == '"') && (parm[plen-1] == '"')) ||
         ((parm[0] == '\'') && (parm[plen-1] == '\'')))) {
        parm = parm.substr(1, plen-2);
        plen = parm.length();
    }
}

std::string mytolower(std::string parm)
{
    std::transform(parm.begin(), parm.end(), parm.begin()
        , [](unsigned char c){ return (char)std::tolower(c); });
    return parm;
}

bool mystarts(const std::string &parm, const std::string &prefix)
{
    return (parm.compare(0, prefix.length(), prefix) == 0);
}

bool myends(const std::string &parm, const std::string &suffix)
{
    if (suffix.length() > parm.length()) {
        return false;
    }
    return (parm.compare(parm.length() - suffix.length()
        , suffix.length(), suffix) == 0);
}

void *mymalloc(size_t nbytes)
{
    void *dummy = calloc(nbytes, 1);

    if (!dummy) {
        CAMGATE_LOG(EMG, TYPE_ALL, SHOW_ERRNO
            , _("Could not allocate %llu bytes of memory!")
            , (unsigned long long)nbytes);
        exit(1);
    }

    return dummy;
}

void *myrealloc(void *ptr, size_t size, const char *desc)
{
    void *dummy = NULL;

    if (size == 0) {
        free(ptr);
        CAMGATE_LOG(WRN, TYPE_ALL, NO_ERRNO
            ,_("Function %s tries to resize 0 bytes"),desc);
    } else {
        dummy = realloc(ptr, size);
        if (!dummy) {
            CAMGATE_LOG(EMG, TYPE_ALL, NO_ERRNO
                ,_("Could not resize memory to %llu bytes (function %s)")
                ,(unsigned long long)size, desc);
            exit(1);
        }
    }

    return dummy;
}

/**
 * mycreate_path
 *   Create every directory of the path.  A final component
 *   without a trailing slash is treated as a file name.
 */
int mycreate_path(const char *path)
{
    std::string tmp;
    mode_t mode = S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH;
    size_t indx_pos;
    struct stat statbuf;

    tmp = std::string(path);
    indx_pos = tmp.find("/", 1);

    while (indx_pos != std::string::npos) {
        if (stat(tmp.substr(0, indx_pos + 1).c_str(), &statbuf) != 0) {
            CAMGATE_LOG(INF, TYPE_ALL, NO_ERRNO
                ,_("Creating %s"), tmp.substr(0, indx_pos + 1).c_str());
            if ((mkdir(tmp.substr(0, indx_pos + 1).c_str(), mode) == -1) &&
                (errno != EEXIST)) {
                CAMGATE_LOG(ERR, TYPE_ALL, SHOW_ERRNO
                    ,_("Problem creating directory %s")
                    , tmp.substr(0, indx_pos + 1).c_str());
                return -1;
            }
        }
        indx_pos = tmp.find("/", indx_pos + 1);
    }

    return 0;
}

FILE *myfopen(const char *path, const char *mode)
{
    FILE *fp;

    fp = fopen(path, mode);
    if (fp) {
        return fp;
    }

    /* If path did not exist, create and try again*/
    if (errno == ENOENT) {
        if (mycreate_path(path) == -1) {
            return NULL;
        }
        fp = fopen(path, mode);
    }
    if (!fp) {
        CAMGATE_LOG(ERR, TYPE_ALL, SHOW_ERRNO
            ,_("Error opening file %s with mode %s"), path, mode);
        return NULL;
    }

    return fp;
}

int myfclose(FILE* fh)
{
    int rval = fclose(fh);

    if (rval != 0) {
        CAMGATE_LOG(ERR, TYPE_ALL, SHOW_ERRNO, _("Error closing file"));
    }

    return rval;
}

void mythreadname_set(const char *abbr, int threadnbr, const char *threadname)
{
    char tname[32];

    /* A null abbreviation means a complete name from mythreadname_get */
    if (abbr != NULL) {
        if ((threadname == nullptr) || (strlen(threadname) == 0)) {
            snprintf(tname, sizeof(tname), "%s%02d",abbr,threadnbr);
        } else {
            snprintf(tname, sizeof(tname), "%s%02d:%s",abbr,threadnbr, threadname);
        }
    } else {
        snprintf(tname, sizeof(tname), "%s",threadname);
    }

    /* Linux limits thread names to 15 characters */
    tname[15] = 0;

    #if defined(__APPLE__)
        pthread_setname_np(tname);
    #elif defined(BSD)
        pthread_set_name_np(pthread_self(), tname);
    #elif HAVE_PTHREAD_SETNAME_NP
        pthread_setname_np(pthread_self(), tname);
    #else
        CAMGATE_LOG(INF, TYPE_ALL, NO_ERRNO, _("Unable to set thread name %s"), tname);
    #endif
}

void mythreadname_get(std::string &threadname)
{
    #if ((!defined(BSD) && HAVE_PTHREAD_GETNAME_NP) || defined(__APPLE__))
        char currname[32];
        pthread_getname_np(pthread_self(), currname, sizeof(currname));
        threadname = currname;
    #else
        threadname = "Unknown";
    #endif
}

void mythreadname_get(char *threadname)
{
    #if ((!defined(BSD) && HAVE_PTHREAD_GETNAME_NP) || defined(__APPLE__))
        char currname[32];
        pthread_getname_np(pthread_self(), currname, sizeof(currname));
        snprintf(threadname, sizeof(currname), "%s",currname);
    #else
        snprintf(threadname, 8, "%s","Unknown");
    #endif
}

void mytranslate_init(void)
{
    #ifdef HAVE_GETTEXT
        mytranslate_text("", 1);
        setlocale (LC_ALL, "");
        bindtextdomain ("camgate", LOCALEDIR);
        bind_textdomain_codeset ("camgate", "UTF-8");
        textdomain ("camgate");
        CAMGATE_LOG(NTC, TYPE_ALL, NO_ERRNO,_("Language: English"));
    #else
        mytranslate_text("", 0);
    #endif
}

char* mytranslate_text(const char *msgid, int setnls)
{
    static bool nls_enabled = true;

    if (setnls == 0) {
        if (nls_enabled) {
            CAMGATE_LOG(NTC, TYPE_ALL, NO_ERRNO,_("Disabling native language support"));
        }
        nls_enabled = false;
        return NULL;

    } else if (setnls == 1) {
        if (!nls_enabled) {
            CAMGATE_LOG(NTC, TYPE_ALL, NO_ERRNO,_("Enabling native language support"));
        }
        nls_enabled = true;
        return NULL;

    } else {
        #ifdef HAVE_GETTEXT
            if (nls_enabled) {
                return (char*)gettext(msgid);
            } else {
                return (char*)msgid;
            }
        #else
            return (char*)msgid;
        #endif
    }
}

void util_parms_add(ctx_params *params, std::string parm_nm, std::string parm_val)
{
    int indx;
    ctx_params_item parm_itm;

    for (indx=0;indx<params->params_cnt;indx++) {
        if (params->params_array[indx].param_name == parm_nm) {
            params->params_array[indx].param_value.assign(parm_val);
            return;
        }
    }

    params->params_cnt++;
    parm_itm.param_name.assign(parm_nm);
    parm_itm.param_value.assign(parm_val);
    params->params_array.push_back(parm_itm);

    CAMGATE_LOG(DBG, TYPE_ALL, NO_ERRNO,"%s:>%s< >%s<"
        ,params->params_desc.c_str(), parm_nm.c_str(),parm_val.c_str());
}

/* Split a line of the form a=1,"b c"=2,d="x,y" into the params array */
void util_parms_parse(ctx_params *params, std::string parm_desc, std::string confline)
{
    std::string itm, parm_nm, parm_vl;
    bool inqte;
    size_t indx, eqpos;

    params->params_array.clear();
    params->params_cnt = 0;
    params->params_desc = parm_desc;

    inqte = false;
    itm = "";
    for (indx = 0; indx <= confline.length(); indx++) {
        if ((indx == confline.length()) ||
            ((confline[indx] == ',') && (inqte == false))) {
            eqpos = std::string::npos;
            inqte = false;
            for (size_t pos = 0; pos < itm.length(); pos++) {
                if (itm[pos] == '"') {
                    inqte = !inqte;
                } else if ((itm[pos] == '=') && (inqte == false)) {
                    eqpos = pos;
                    break;
                }
            }
            inqte = false;
            if (eqpos != std::string::npos) {
                parm_nm = itm.substr(0, eqpos);
                parm_vl = itm.substr(eqpos + 1);
                myunquote(parm_nm);
                myunquote(parm_vl);
                if (parm_nm != "") {
                    util_parms_add(params, parm_nm, parm_vl);
                }
            }
            itm = "";
            continue;
        }
        if (confline[indx] == '"') {
            inqte = !inqte;
        }
        itm += confline[indx];
    }
}

void util_parms_add_default(ctx_params *params, std::string parm_nm, int parm_vl)
{
    util_parms_add_default(params, parm_nm, std::to_string(parm_vl));
}

/* Add the value only when the parm_nm does not have anything yet */
void util_parms_add_default(ctx_params *params, std::string parm_nm, std::string parm_vl)
{
    int indx;

    for (indx=0;indx<params->params_cnt;indx++) {
        if (params->params_array[indx].param_name == parm_nm) {
            return;
        }
    }
    util_parms_add(params, parm_nm, parm_vl);
}

/* Rebuild the config line from the values of the params array */
void util_parms_update(ctx_params *params, std::string &confline)
{
    std::string parmline, comma;
    int indx;

    comma = "";
    parmline = "";
    for (indx=0;indx<params->params_cnt;indx++) {
        parmline += comma;
        comma = ",";
        if (params->params_array[indx].param_name.find(" ") == std::string::npos) {
            parmline += params->params_array[indx].param_name;
        } else {
            parmline += "\"" + params->params_array[indx].param_name + "\"";
        }
        parmline += "=";
        if ((params->params_array[indx].param_value.find(" ") == std::string::npos) &&
            (params->params_array[indx].param_value.find(",") == std::string::npos)) {
            parmline += params->params_array[indx].param_value;
        } else {
            parmline += "\"" + params->params_array[indx].param_value + "\"";
        }
    }
    confline = parmline;

    CAMGATE_LOG(INF, TYPE_ALL, NO_ERRNO
        ,_("New config:%s"), confline.c_str());
}

int mtoi(std::string parm)
{
    return atoi(parm.c_str());
}
int mtoi(char *parm)
{
    return atoi(parm);
}
long mtol(std::string parm)
{
    return atol(parm.c_str());
}
long mtol(char *parm)
{
    return atol(parm);
}
float mtof(char *parm)
{
    return (float)atof(parm);
}
float mtof(std::string parm)
{
    return (float)atof(parm.c_str());
}
bool mtob(std::string parm)
{
    return mtob((char *)parm.c_str());
}
bool mtob(char *parm)
{
    if (mystrceq(parm,"1") ||
        mystrceq(parm,"yes") ||
        mystrceq(parm,"on") ||
        mystrceq(parm,"true") ) {
        return true;
    } else {
        return false;
    }
}
/* Token for strings.  Parm is modified*/
std::string mtok(std::string &parm, std::string tok)
{
    size_t loc;
    std::string tmp;

    if (parm == "") {
        return "";
    }
    loc = parm.find(tok);
    if (loc == std::string::npos) {
        tmp = parm;
        parm = "";
    } else {
        tmp = parm.substr(0, loc);
        parm = parm.substr(loc + tok.length());
    }
    return tmp;
}

int64_t util_now_ms()
{
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return ((int64_t)ts.tv_sec * 1000) + (ts.tv_nsec / 1000000);
}

int64_t util_mono_ms()
{
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return ((int64_t)ts.tv_sec * 1000) + (ts.tv_nsec / 1000000);
}

/* ISO-8601 UTC with milliseconds, e.g. 2024-05-01T10:00:00.000Z */
std::string util_iso_time(int64_t epoch_ms)
{
    char buf[64];
    struct tm tm_utc;
    time_t secs;
    int64_t msecs;

    secs = (time_t)(epoch_ms / 1000);
    msecs = epoch_ms % 1000;
    if (msecs < 0) {
        secs--;
        msecs += 1000;
    }
    gmtime_r(&secs, &tm_utc);
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ"
        , tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday
        , tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec, (int)msecs);
    return buf;
}

int64_t util_parse_iso(std::string isotm)
{
    struct tm tm_utc;
    int msecs;

    memset(&tm_utc, 0, sizeof(tm_utc));
    msecs = 0;
    if (sscanf(isotm.c_str(), "%d-%d-%dT%d:%d:%d.%d"
        , &tm_utc.tm_year, &tm_utc.tm_mon, &tm_utc.tm_mday
        , &tm_utc.tm_hour, &tm_utc.tm_min, &tm_utc.tm_sec, &msecs) < 6) {
        return -1;
    }
    tm_utc.tm_year -= 1900;
    tm_utc.tm_mon -= 1;
    return ((int64_t)timegm(&tm_utc) * 1000) + msecs;
}

std::string util_url_encode(std::string parm)
{
    static const char hexchr[] = "0123456789ABCDEF";
    std::string retval;
    unsigned char ch;

    for (size_t indx = 0; indx < parm.length(); indx++) {
        ch = (unsigned char)parm[indx];
        if (isalnum(ch) || (ch == '-') || (ch == '_') ||
            (ch == '.') || (ch == '~')) {
            retval += (char)ch;
        } else {
            retval += '%';
            retval += hexchr[ch >> 4];
            retval += hexchr[ch & 0x0F];
        }
    }
    return retval;
}

std::string util_url_decode(std::string parm)
{
    std::string retval;
    unsigned int ch;

    for (size_t indx = 0; indx < parm.length(); indx++) {
        if ((parm[indx] == '%') && (indx + 2 < parm.length()) &&
            isxdigit((unsigned char)parm[indx+1]) &&
            isxdigit((unsigned char)parm[indx+2])) {
            sscanf(parm.substr(indx + 1, 2).c_str(), "%x", &ch);
            retval += (char)ch;
            indx += 2;
        } else if (parm[indx] == '+') {
            retval += ' ';
        } else {
            retval += parm[indx];
        }
    }
    return retval;
}

/* Replace the user information of a url for logging */
std::string util_url_mask(std::string url)
{
    size_t pos_st, pos_at;

    pos_st = url.find("://");
    if (pos_st == std::string::npos) {
        return url;
    }
    pos_at = url.find("@", pos_st + 3);
    if ((pos_at == std::string::npos) ||
        (url.find("/", pos_st + 3) < pos_at)) {
        return url;
    }
    return url.substr(0, pos_st + 3) + "***" + url.substr(pos_at);
}

std::string util_json_escape(std::string parm)
{
    std::string retval;
    char buf[8];

    for (size_t indx = 0; indx < parm.length(); indx++) {
        switch (parm[indx]) {
        case '"':   retval += "\\\""; break;
        case '\\':  retval += "\\\\"; break;
        case '\n':  retval += "\\n"; break;
        case '\r':  retval += "\\r"; break;
        case '\t':  retval += "\\t"; break;
        default:
            if ((unsigned char)parm[indx] < 0x20) {
                snprintf(buf, sizeof(buf), "\\u%04x", (unsigned char)parm[indx]);
                retval += buf;
            } else {
                retval += parm[indx];
            }
        }
    }
    return retval;
}

std::string util_base64_encode(const uint8_t *data, size_t len)
{
    std::string retval;
    char *buf;
    int bufsz;

    bufsz = AV_BASE64_SIZE(len);
    buf = (char*)mymalloc((size_t)bufsz);
    if (av_base64_encode(buf, bufsz, data, (int)len) != nullptr) {
        retval = buf;
    }
    free(buf);
    return retval;
}

void util_random_bytes(uint8_t *buf, size_t len)
{
    uint32_t seed;
    size_t indx;

    for (indx = 0; indx < len; indx += 4) {
        seed = av_get_random_seed();
        memcpy(buf + indx, &seed, MIN(sizeof(seed), len - indx));
    }
}

std::string util_random_hex(size_t nbytes)
{
    std::vector<uint8_t> buf(nbytes);
    std::string retval;
    char hx[3];

    util_random_bytes(buf.data(), nbytes);
    for (size_t indx = 0; indx < nbytes; indx++) {
        snprintf(hx, sizeof(hx), "%02x", buf[indx]);
        retval += hx;
    }
    return retval;
}

/* Version 4 uuid */
std::string util_uuid()
{
    uint8_t b[16];
    char buf[40];

    util_random_bytes(b, sizeof(b));
    b[6] = (uint8_t)((b[6] & 0x0F) | 0x40);
    b[8] = (uint8_t)((b[8] & 0x3F) | 0x80);
    snprintf(buf, sizeof(buf)
        , "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x"
        , b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7]
        , b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return buf;
}

std::string util_md5_hex(std::string parm)
{
    uint8_t digest[16];
    char hx[3];
    std::string retval;

    av_md5_sum(digest, (const uint8_t *)parm.c_str(), (int)parm.length());
    for (int indx = 0; indx < 16; indx++) {
        snprintf(hx, sizeof(hx), "%02x", digest[indx]);
        retval += hx;
    }
    return retval;
}

/* digest must hold 20 bytes */
void util_sha1(const uint8_t *data, size_t len, uint8_t *digest)
{
    struct AVSHA *sha;

    sha = av_sha_alloc();
    if (sha == nullptr) {
        CAMGATE_LOG(ERR, TYPE_ALL, NO_ERRNO, _("Unable to allocate sha context"));
        memset(digest, 0, 20);
        return;
    }
    av_sha_init(sha, 160);
    av_sha_update(sha, data, (unsigned int)len);
    av_sha_final(sha, digest);
    av_free(sha);
}

void util_split_ws(std::string parm, std::vector<std::string> &toks)
{
    std::istringstream iss(parm);
    std::string tok;

    toks.clear();
    while (iss >> tok) {
        toks.push_back(tok);
    }
}

/* List regular files of dirnm ending in suffix. */
int util_dir_list(std::string dirnm, std::string suffix, vec_file_stat &files)
{
    DIR *d;
    struct dirent *ent;
    struct stat statbuf;
    ctx_file_stat itm;

    files.clear();
    d = opendir(dirnm.c_str());
    if (d == nullptr) {
        return -1;
    }
    while ((ent = readdir(d)) != nullptr) {
        itm.name = ent->d_name;
        if ((itm.name == ".") || (itm.name == "..")) {
            continue;
        }
        if ((suffix != "") && !myends(itm.name, suffix)) {
            continue;
        }
        itm.full_nm = dirnm + "/" + itm.name;
        if (stat(itm.full_nm.c_str(), &statbuf) != 0) {
            continue;
        }
        if (!S_ISREG(statbuf.st_mode)) {
            continue;
        }
        itm.size = (int64_t)statbuf.st_size;
        itm.mtime_ms = ((int64_t)statbuf.st_mtim.tv_sec * 1000) +
            (statbuf.st_mtim.tv_nsec / 1000000);
        files.push_back(itm);
    }
    closedir(d);
    return 0;
}

bool util_file_exists(std::string fname)
{
    struct stat statbuf;
    return (stat(fname.c_str(), &statbuf) == 0);
}

int util_file_remove(std::string fname)
{
    if (unlink(fname.c_str()) != 0) {
        if (errno == ENOENT) {
            return 0;
        }
        CAMGATE_LOG(WRN, TYPE_ALL, SHOW_ERRNO
            , _("Unable to remove %s"), fname.c_str());
        return -1;
    }
    return 0;
}

int util_file_read(std::string fname, std::string &data)
{
    std::ifstream ifs;
    std::stringstream ss;

    ifs.open(fname.c_str());
    if (ifs.is_open() == false) {
        return -1;
    }
    ss << ifs.rdbuf();
    data = ss.str();
    ifs.close();
    return 0;
}

/* Write through a temporary name so readers never see a partial file */
int util_file_write(std::string fname, const std::string &data)
{
    FILE *fp;
    std::string tmpnm;

    tmpnm = fname + ".tmp";
    fp = myfopen(tmpnm.c_str(), "we");
    if (fp == nullptr) {
        return -1;
    }
    if (fwrite(data.c_str(), 1, data.length(), fp) != data.length()) {
        CAMGATE_LOG(ERR, TYPE_ALL, SHOW_ERRNO
            , _("Error writing %s"), tmpnm.c_str());
        myfclose(fp);
        return -1;
    }
    if (myfclose(fp) != 0) {
        return -1;
    }
    if (rename(tmpnm.c_str(), fname.c_str()) != 0) {
        CAMGATE_LOG(ERR, TYPE_ALL, SHOW_ERRNO
            , _("Error renaming %s"), tmpnm.c_str());
        return -1;
    }
    return 0;
}

const char *cg_err_str(enum CG_ERR err)
{
    switch (err) {
    case CG_ERR_NONE:               return "None";
    case CG_ERR_DISCOVERY_TIMEOUT:  return "DiscoveryTimeout";
    case CG_ERR_AUTH:               return "AuthenticationFailure";
    case CG_ERR_PARSE:              return "ProtocolParseError";
    case CG_ERR_TIMEOUT:            return "Timeout";
    case CG_ERR_NETWORK:            return "NetworkError";
    case CG_ERR_SPAWN:              return "ProcessSpawnFailure";
    case CG_ERR_CRASHED:            return "ProcessCrashed";
    case CG_ERR_STORAGE:            return "StorageExhausted";
    case CG_ERR_TUNNEL:             return "TunnelUnavailable";
    case CG_ERR_CLOCK_DRIFT:        return "ClockDriftDetected";
    }
    return "Unknown";
}
