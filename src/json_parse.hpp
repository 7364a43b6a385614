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
 * json_parse.hpp - Lightweight JSON Parser Interface
 *
 * Parses request bodies, settings files and webhook replies. Nested
 * objects are flattened into dotted keys ("ntfy.topic") and arrays of
 * scalars are kept as string lists. Arrays of objects are flattened
 * with their index ("items.0.token").
 *
 */

#ifndef _INCLUDE_JSON_PARSE_HPP_
#define _INCLUDE_JSON_PARSE_HPP_

#include <string>
#include <map>
#include <vector>
#include <variant>

class JsonParser {
public:
    using JsonList  = std::vector<std::string>;
    using JsonValue = std::variant<std::string, double, bool, std::nullptr_t, JsonList>;

    /**
     * Parse JSON text into the flattened map
     * Returns true if parsing succeeded, false otherwise
     */
    bool parse(const std::string& json);

    bool has(const std::string& key) const;
    bool isNull(const std::string& key) const;

    /**
     * Get value by key (may throw std::out_of_range)
     */
    JsonValue get(const std::string& key) const;

    const std::map<std::string, JsonValue>& getAll() const;

    /**
     * Keys directly below a dotted prefix, e.g. children("webhook.headers")
     */
    std::vector<std::string> children(const std::string& prefix) const;

    std::string getString(const std::string& key, const std::string& def = "") const;
    double getNumber(const std::string& key, double def = 0.0) const;
    bool getBool(const std::string& key, bool def = false) const;
    JsonList getList(const std::string& key) const;

    const std::string& getError() const { return error_; }

private:
    std::map<std::string, JsonValue> values_;
    std::string json_;
    size_t pos_ = 0;
    int depth_ = 0;
    std::string error_;

    void skipWhitespace();
    bool parseObject(const std::string& prefix);
    bool parseArray(const std::string& key);
    bool parseMember(const std::string& key);
    std::string parseString();
    JsonValue parseScalar();
    double parseNumber();
    bool parseBool();
    void appendUtf8(std::string& out, unsigned int cp);

    void setError(const std::string& msg);
    bool expect(char ch);
    char peek() const;
    char next();
};

#endif /* _INCLUDE_JSON_PARSE_HPP_ */
