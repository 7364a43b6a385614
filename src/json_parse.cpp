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
/*
 * json_parse.cpp - Lightweight JSON Parser
 *
 * Minimal parser used for web control POST bodies, the persisted
 * notification settings and replies from the relay and webhooks.
 *
 */

#include "json_parse.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

#define JSON_MAX_DEPTH  32

bool JsonParser::parse(const std::string& json) {
    json_ = json;
    pos_ = 0;
    depth_ = 0;
    values_.clear();
    error_.clear();

    skipWhitespace();
    if (!parseObject("")) {
        return false;
    }

    skipWhitespace();
    if (pos_ < json_.length()) {
        setError("Unexpected content after JSON object");
        return false;
    }

    return true;
}

bool JsonParser::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

bool JsonParser::isNull(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return false;
    }
    return std::holds_alternative<std::nullptr_t>(it->second);
}

JsonParser::JsonValue JsonParser::get(const std::string& key) const {
    return values_.at(key);
}

const std::map<std::string, JsonParser::JsonValue>& JsonParser::getAll() const {
    return values_;
}

std::vector<std::string> JsonParser::children(const std::string& prefix) const {
    std::vector<std::string> result;
    std::string pfx = prefix + ".";
    std::string child;

    for (auto it = values_.lower_bound(pfx); it != values_.end(); ++it) {
        if (it->first.compare(0, pfx.length(), pfx) != 0) {
            break;
        }
        child = it->first.substr(pfx.length());
        child = child.substr(0, child.find('.'));
        if (std::find(result.begin(), result.end(), child) == result.end()) {
            result.push_back(child);
        }
    }
    return result;
}

std::string JsonParser::getString(const std::string& key, const std::string& def) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return def;
    }
    if (auto* str = std::get_if<std::string>(&it->second)) {
        return *str;
    }
    if (auto* num = std::get_if<double>(&it->second)) {
        std::ostringstream oss;
        oss << *num;
        return oss.str();
    }
    if (auto* b = std::get_if<bool>(&it->second)) {
        return *b ? "true" : "false";
    }
    return def;
}

double JsonParser::getNumber(const std::string& key, double def) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return def;
    }
    if (auto* num = std::get_if<double>(&it->second)) {
        return *num;
    }
    if (auto* str = std::get_if<std::string>(&it->second)) {
        char* end;
        double val = std::strtod(str->c_str(), &end);
        if (end != str->c_str() && *end == '\0') {
            return val;
        }
    }
    return def;
}

bool JsonParser::getBool(const std::string& key, bool def) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return def;
    }
    if (auto* b = std::get_if<bool>(&it->second)) {
        return *b;
    }
    if (auto* str = std::get_if<std::string>(&it->second)) {
        return *str == "true" || *str == "1" || *str == "on";
    }
    if (auto* num = std::get_if<double>(&it->second)) {
        return *num != 0.0;
    }
    return def;
}

JsonParser::JsonList JsonParser::getList(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return JsonList();
    }
    if (auto* lst = std::get_if<JsonList>(&it->second)) {
        return *lst;
    }
    if (auto* str = std::get_if<std::string>(&it->second)) {
        return JsonList(1, *str);
    }
    return JsonList();
}

void JsonParser::skipWhitespace() {
    while (pos_ < json_.length() && std::isspace((unsigned char)json_[pos_])) {
        pos_++;
    }
}

bool JsonParser::parseObject(const std::string& prefix) {
    if (!expect('{')) {
        return false;
    }
    if (++depth_ > JSON_MAX_DEPTH) {
        setError("Nesting too deep");
        return false;
    }

    skipWhitespace();
    if (peek() == '}') {
        pos_++;
        depth_--;
        return true;
    }

    while (true) {
        skipWhitespace();
        std::string key = parseString();
        if (!error_.empty()) {
            return false;
        }
        skipWhitespace();
        if (!expect(':')) {
            return false;
        }
        if (!parseMember(prefix.empty() ? key : prefix + "." + key)) {
            return false;
        }

        skipWhitespace();
        char ch = next();
        if (ch == '}') {
            break;
        }
        if (ch != ',') {
            setError("Expected ',' or '}' in object");
            return false;
        }
    }

    depth_--;
    return true;
}

bool JsonParser::parseMember(const std::string& key) {
    skipWhitespace();

    if (peek() == '{') {
        return parseObject(key);
    }
    if (peek() == '[') {
        return parseArray(key);
    }

    JsonValue value = parseScalar();
    if (!error_.empty()) {
        return false;
    }
    values_[key] = value;
    return true;
}

/* Scalars collect into one list, objects flatten by index */
bool JsonParser::parseArray(const std::string& key) {
    JsonList items;
    int indx = 0;

    if (!expect('[')) {
        return false;
    }
    if (++depth_ > JSON_MAX_DEPTH) {
        setError("Nesting too deep");
        return false;
    }

    skipWhitespace();
    if (peek() == ']') {
        pos_++;
        depth_--;
        values_[key] = items;
        return true;
    }

    while (true) {
        skipWhitespace();
        if ((peek() == '{') || (peek() == '[')) {
            if (!parseMember(key + "." + std::to_string(indx))) {
                return false;
            }
        } else {
            JsonValue value = parseScalar();
            if (!error_.empty()) {
                return false;
            }
            if (auto* str = std::get_if<std::string>(&value)) {
                items.push_back(*str);
            } else if (auto* num = std::get_if<double>(&value)) {
                std::ostringstream oss;
                oss << *num;
                items.push_back(oss.str());
            } else if (auto* b = std::get_if<bool>(&value)) {
                items.push_back(*b ? "true" : "false");
            }
        }
        indx++;

        skipWhitespace();
        char ch = next();
        if (ch == ']') {
            break;
        }
        if (ch != ',') {
            setError("Expected ',' or ']' in array");
            return false;
        }
    }

    values_[key] = items;
    depth_--;
    return true;
}

void JsonParser::appendUtf8(std::string& out, unsigned int cp) {
    if (cp < 0x80) {
        out += (char)cp;
    } else if (cp < 0x800) {
        out += (char)(0xC0 | (cp >> 6));
        out += (char)(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += (char)(0xE0 | (cp >> 12));
        out += (char)(0x80 | ((cp >> 6) & 0x3F));
        out += (char)(0x80 | (cp & 0x3F));
    } else {
        out += (char)(0xF0 | (cp >> 18));
        out += (char)(0x80 | ((cp >> 12) & 0x3F));
        out += (char)(0x80 | ((cp >> 6) & 0x3F));
        out += (char)(0x80 | (cp & 0x3F));
    }
}

std::string JsonParser::parseString() {
    unsigned int cp, lo;

    if (!expect('"')) {
        return "";
    }

    std::string result;
    while (pos_ < json_.length()) {
        char ch = json_[pos_++];

        if (ch == '"') {
            return result;
        }

        if (ch == '\\') {
            if (pos_ >= json_.length()) {
                setError("Unterminated escape sequence");
                return "";
            }
            ch = json_[pos_++];
            switch (ch) {
                case '"':  result += '"'; break;
                case '\\': result += '\\'; break;
                case '/':  result += '/'; break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u':
                    if (pos_ + 4 > json_.length()) {
                        setError("Short unicode escape");
                        return "";
                    }
                    cp = (unsigned int)std::strtoul(json_.substr(pos_, 4).c_str(), nullptr, 16);
                    pos_ += 4;
                    /* Surrogate pair */
                    if ((cp >= 0xD800) && (cp <= 0xDBFF) &&
                        (pos_ + 6 <= json_.length()) &&
                        (json_[pos_] == '\\') && (json_[pos_+1] == 'u')) {
                        lo = (unsigned int)std::strtoul(json_.substr(pos_+2, 4).c_str(), nullptr, 16);
                        if ((lo >= 0xDC00) && (lo <= 0xDFFF)) {
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                            pos_ += 6;
                        }
                    }
                    appendUtf8(result, cp);
                    break;
                default:
                    setError("Invalid escape sequence");
                    return "";
            }
        } else {
            result += ch;
        }
    }

    setError("Unterminated string");
    return "";
}

JsonParser::JsonValue JsonParser::parseScalar() {
    skipWhitespace();

    if (pos_ >= json_.length()) {
        setError("Unexpected end of input");
        return nullptr;
    }

    char ch = peek();

    if (ch == '"') {
        return parseString();
    }

    if (ch == 't' || ch == 'f') {
        return parseBool();
    }

    if (ch == 'n') {
        if (json_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return nullptr;
        }
        setError("Invalid literal");
        return nullptr;
    }

    if (ch == '-' || std::isdigit((unsigned char)ch)) {
        return parseNumber();
    }

    setError("Unexpected character in value");
    return nullptr;
}

double JsonParser::parseNumber() {
    size_t start = pos_;

    if (peek() == '-') {
        pos_++;
    }

    if (pos_ >= json_.length() || !std::isdigit((unsigned char)json_[pos_])) {
        setError("Invalid number format");
        return 0.0;
    }

    while (pos_ < json_.length() && std::isdigit((unsigned char)json_[pos_])) {
        pos_++;
    }

    if (pos_ < json_.length() && json_[pos_] == '.') {
        pos_++;
        if (pos_ >= json_.length() || !std::isdigit((unsigned char)json_[pos_])) {
            setError("Invalid number format after decimal point");
            return 0.0;
        }
        while (pos_ < json_.length() && std::isdigit((unsigned char)json_[pos_])) {
            pos_++;
        }
    }

    if (pos_ < json_.length() && (json_[pos_] == 'e' || json_[pos_] == 'E')) {
        pos_++;
        if (pos_ < json_.length() && (json_[pos_] == '+' || json_[pos_] == '-')) {
            pos_++;
        }
        if (pos_ >= json_.length() || !std::isdigit((unsigned char)json_[pos_])) {
            setError("Invalid exponent");
            return 0.0;
        }
        while (pos_ < json_.length() && std::isdigit((unsigned char)json_[pos_])) {
            pos_++;
        }
    }

    std::string numStr = json_.substr(start, pos_ - start);
    char* end;
    double value = std::strtod(numStr.c_str(), &end);

    if (end == numStr.c_str()) {
        setError("Failed to parse number");
        return 0.0;
    }

    return value;
}

bool JsonParser::parseBool() {
    if (json_.compare(pos_, 4, "true") == 0) {
        pos_ += 4;
        return true;
    }

    if (json_.compare(pos_, 5, "false") == 0) {
        pos_ += 5;
        return false;
    }

    setError("Invalid boolean value");
    return false;
}

void JsonParser::setError(const std::string& msg) {
    if (error_.empty()) {
        error_ = msg + " at position " + std::to_string(pos_);
    }
}

bool JsonParser::expect(char ch) {
    skipWhitespace();
    if (pos_ >= json_.length() || json_[pos_] != ch) {
        setError(std::string("Expected '") + ch + "'");
        return false;
    }
    pos_++;
    return true;
}

char JsonParser::peek() const {
    if (pos_ >= json_.length()) {
        return '\0';
    }
    return json_[pos_];
}

char JsonParser::next() {
    if (pos_ >= json_.length()) {
        return '\0';
    }
    return json_[pos_++];
}
