#include <engram/core/json.hpp>
#include <cstdio>

namespace engram {

static const int MAX_PARSE_DEPTH = 256;

Json::Type Json::type() const { return type_; }
bool Json::is_null() const { return type_ == NUL; }
bool Json::is_bool() const { return type_ == BOOL; }
bool Json::is_number() const { return type_ == NUMBER; }
bool Json::is_string() const { return type_ == STRING; }
bool Json::is_array() const { return type_ == ARRAY; }
bool Json::is_object() const { return type_ == OBJECT; }

bool Json::as_bool(bool def) const {
    return type_ == BOOL ? bool_ : def;
}

double Json::as_number(double def) const {
    return type_ == NUMBER ? number_ : def;
}

int64_t Json::as_int(int64_t def) const {
    return type_ == NUMBER ? static_cast<int64_t>(number_) : def;
}

std::string Json::as_string(const std::string& def) const {
    return type_ == STRING ? string_ : def;
}

const std::vector<Json>& Json::as_array() const {
    static const std::vector<Json> empty;
    return type_ == ARRAY ? array_ : empty;
}

const std::map<std::string, Json>& Json::as_object() const {
    static const std::map<std::string, Json> empty;
    return type_ == OBJECT ? object_ : empty;
}

const Json& Json::operator[](const std::string& key) const {
    static const Json null_json;
    if (type_ != OBJECT) return null_json;
    std::map<std::string, Json>::const_iterator it = object_.find(key);
    return it != object_.end() ? it->second : null_json;
}

const Json& Json::operator[](size_t idx) const {
    static const Json null_json;
    if (type_ != ARRAY || idx >= array_.size()) return null_json;
    return array_[idx];
}

bool Json::has(const std::string& key) const {
    return type_ == OBJECT && object_.find(key) != object_.end();
}

size_t Json::size() const {
    if (type_ == ARRAY) return array_.size();
    if (type_ == OBJECT) return object_.size();
    return 0;
}

void Json::set(const std::string& key, const Json& value) {
    if (type_ != OBJECT) {
        type_ = OBJECT;
        object_.clear();
    }
    object_[key] = value;
}

void Json::push(const Json& value) {
    if (type_ != ARRAY) {
        type_ = ARRAY;
        array_.clear();
    }
    array_.push_back(value);
}

std::string Json::get_string(const std::string& key, const std::string& def) const {
    const Json& v = (*this)[key];
    return v.is_string() ? v.string_ : def;
}

int Json::get_int(const std::string& key, int def) const {
    const Json& v = (*this)[key];
    return v.is_number() ? static_cast<int>(v.number_) : def;
}

int64_t Json::get_int64(const std::string& key, int64_t def) const {
    const Json& v = (*this)[key];
    return v.is_number() ? static_cast<int64_t>(v.number_) : def;
}

double Json::get_double(const std::string& key, double def) const {
    const Json& v = (*this)[key];
    return v.is_number() ? v.number_ : def;
}

bool Json::get_bool(const std::string& key, bool def) const {
    const Json& v = (*this)[key];
    return v.is_bool() ? v.bool_ : def;
}

Json Json::object() {
    Json j;
    j.type_ = OBJECT;
    return j;
}

Json Json::array() {
    Json j;
    j.type_ = ARRAY;
    return j;
}

std::string Json::dump(int indent) const {
    std::ostringstream ss;
    dump_impl(ss, indent, 0);
    return ss.str();
}

Json Json::parse(const std::string& str) {
    size_t pos = 0;
    Json result = parse_value(str, pos, 0);
    skip_ws(str, pos);
    if (pos != str.size()) {
        throw std::runtime_error("Unexpected trailing data at position " + std::to_string(pos));
    }
    return result;
}

void Json::newline(std::ostringstream& ss, int indent, int depth) {
    if (indent < 0) return;
    ss << '\n';
    for (int i = 0; i < indent * depth; ++i) ss << ' ';
}

void Json::dump_impl(std::ostringstream& ss, int indent, int depth) const {
    switch (type_) {
        case NUL:
            ss << "null";
            break;
        case BOOL:
            ss << (bool_ ? "true" : "false");
            break;
        case NUMBER: {
            int64_t i = static_cast<int64_t>(number_);
            if (number_ == static_cast<double>(i)) {
                ss << i;
            } else {
                char buf[32];
                snprintf(buf, sizeof(buf), "%.9g", number_);
                ss << buf;
            }
            break;
        }
        case STRING:
            ss << '"';
            escape_string(ss, string_);
            ss << '"';
            break;
        case ARRAY:
            if (array_.empty()) {
                ss << "[]";
                break;
            }
            ss << '[';
            for (size_t i = 0; i < array_.size(); ++i) {
                if (i > 0) ss << ',';
                newline(ss, indent, depth + 1);
                array_[i].dump_impl(ss, indent, depth + 1);
            }
            newline(ss, indent, depth);
            ss << ']';
            break;
        case OBJECT: {
            if (object_.empty()) {
                ss << "{}";
                break;
            }
            ss << '{';
            bool first = true;
            for (std::map<std::string, Json>::const_iterator it = object_.begin();
                 it != object_.end(); ++it) {
                if (!first) ss << ',';
                first = false;
                newline(ss, indent, depth + 1);
                ss << '"';
                escape_string(ss, it->first);
                ss << (indent < 0 ? "\":" : "\": ");
                it->second.dump_impl(ss, indent, depth + 1);
            }
            newline(ss, indent, depth);
            ss << '}';
            break;
        }
    }
}

void Json::escape_string(std::ostringstream& ss, const std::string& s) {
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        switch (c) {
            case '"': ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    ss << buf;
                } else {
                    ss << c;
                }
        }
    }
}

void Json::append_utf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

void Json::skip_ws(const std::string& s, size_t& pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) pos++;
}

Json Json::parse_value(const std::string& s, size_t& pos, int depth) {
    if (depth > MAX_PARSE_DEPTH) {
        throw std::runtime_error("JSON nesting too deep");
    }
    skip_ws(s, pos);
    if (pos >= s.size()) {
        throw std::runtime_error("Unexpected end of JSON input");
    }

    char c = s[pos];
    if (c == 'n' || c == 't' || c == 'f') return parse_literal(s, pos);
    if (c == '"') return Json(parse_string(s, pos));
    if (c == '[') return parse_array(s, pos, depth);
    if (c == '{') return parse_object(s, pos, depth);
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number(s, pos);

    throw std::runtime_error("Invalid JSON at position " + std::to_string(pos));
}

Json Json::parse_literal(const std::string& s, size_t& pos) {
    if (s.compare(pos, 4, "null") == 0) {
        pos += 4;
        return Json();
    }
    if (s.compare(pos, 4, "true") == 0) {
        pos += 4;
        return Json(true);
    }
    if (s.compare(pos, 5, "false") == 0) {
        pos += 5;
        return Json(false);
    }
    throw std::runtime_error("Invalid literal at position " + std::to_string(pos));
}

Json Json::parse_number(const std::string& s, size_t& pos) {
    size_t start = pos;
    if (s[pos] == '-') pos++;
    if (pos >= s.size() || !std::isdigit(static_cast<unsigned char>(s[pos]))) {
        throw std::runtime_error("Invalid number at position " + std::to_string(start));
    }
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
    if (pos < s.size() && s[pos] == '.') {
        pos++;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
    }
    if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
        pos++;
        if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) pos++;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) pos++;
    }
    return Json(std::strtod(s.substr(start, pos - start).c_str(), NULL));
}

std::string Json::parse_string(const std::string& s, size_t& pos) {
    size_t start = pos;
    pos++; // opening quote
    std::string result;
    while (pos < s.size() && s[pos] != '"') {
        if (s[pos] != '\\') {
            result += s[pos++];
            continue;
        }
        if (++pos >= s.size()) break;
        switch (s[pos]) {
            case '"': result += '"'; break;
            case '\\': result += '\\'; break;
            case '/': result += '/'; break;
            case 'b': result += '\b'; break;
            case 'f': result += '\f'; break;
            case 'n': result += '\n'; break;
            case 'r': result += '\r'; break;
            case 't': result += '\t'; break;
            case 'u': {
                if (pos + 4 >= s.size()) {
                    throw std::runtime_error("Truncated \\u escape");
                }
                unsigned long cp = std::strtoul(s.substr(pos + 1, 4).c_str(), NULL, 16);
                pos += 4;
                // Surrogate pair
                if (cp >= 0xD800 && cp <= 0xDBFF && pos + 6 < s.size() &&
                    s[pos + 1] == '\\' && s[pos + 2] == 'u') {
                    unsigned long lo = std::strtoul(s.substr(pos + 3, 4).c_str(), NULL, 16);
                    if (lo >= 0xDC00 && lo <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                        pos += 6;
                    }
                }
                append_utf8(result, cp);
                break;
            }
            default: result += s[pos];
        }
        pos++;
    }
    if (pos >= s.size()) {
        throw std::runtime_error("Unterminated string at position " + std::to_string(start));
    }
    pos++; // closing quote
    return result;
}

Json Json::parse_array(const std::string& s, size_t& pos, int depth) {
    pos++; // [
    Json arr = Json::array();
    skip_ws(s, pos);
    if (pos < s.size() && s[pos] == ']') {
        pos++;
        return arr;
    }
    while (true) {
        arr.push(parse_value(s, pos, depth + 1));
        skip_ws(s, pos);
        if (pos >= s.size()) {
            throw std::runtime_error("Unterminated array");
        }
        if (s[pos] == ']') {
            pos++;
            return arr;
        }
        if (s[pos] != ',') {
            throw std::runtime_error("Expected ',' in array at position " + std::to_string(pos));
        }
        pos++;
    }
}

Json Json::parse_object(const std::string& s, size_t& pos, int depth) {
    pos++; // {
    Json obj = Json::object();
    skip_ws(s, pos);
    if (pos < s.size() && s[pos] == '}') {
        pos++;
        return obj;
    }
    while (true) {
        skip_ws(s, pos);
        if (pos >= s.size() || s[pos] != '"') {
            throw std::runtime_error("Expected object key at position " + std::to_string(pos));
        }
        std::string key = parse_string(s, pos);
        skip_ws(s, pos);
        if (pos >= s.size() || s[pos] != ':') {
            throw std::runtime_error("Expected ':' at position " + std::to_string(pos));
        }
        pos++;
        obj.set(key, parse_value(s, pos, depth + 1));
        skip_ws(s, pos);
        if (pos >= s.size()) {
            throw std::runtime_error("Unterminated object");
        }
        if (s[pos] == '}') {
            pos++;
            return obj;
        }
        if (s[pos] != ',') {
            throw std::runtime_error("Expected ',' in object at position " + std::to_string(pos));
        }
        pos++;
    }
}

} // namespace engram
