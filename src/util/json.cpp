// PYTHCLIENT - JSON Value Implementation
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License

#include "pythclient/util/json.h"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace pythclient {
namespace util {

const JSONValue JSONValue::nullValue_;
const JSONValue::Array JSONValue::emptyArray_;
const JSONValue::Object JSONValue::emptyObject_;
const std::string JSONValue::emptyString_;

// ============================================================================
// Accessors
// ============================================================================

bool JSONValue::GetBool(bool defaultValue) const {
    if (type_ == Type::Bool) return boolValue_;
    return defaultValue;
}

int64_t JSONValue::GetInt(int64_t defaultValue) const {
    if (type_ == Type::Int) return intValue_;
    if (type_ == Type::Double) return static_cast<int64_t>(doubleValue_);
    return defaultValue;
}

double JSONValue::GetDouble(double defaultValue) const {
    if (type_ == Type::Double) return doubleValue_;
    if (type_ == Type::Int) return static_cast<double>(intValue_);
    return defaultValue;
}

const std::string& JSONValue::GetString() const {
    if (type_ == Type::String) return stringValue_;
    return emptyString_;
}

const JSONValue::Array& JSONValue::GetArray() const {
    if (type_ == Type::Array) return arrayValue_;
    return emptyArray_;
}

const JSONValue::Object& JSONValue::GetObject() const {
    if (type_ == Type::Object) return objectValue_;
    return emptyObject_;
}

bool JSONValue::HasKey(const std::string& key) const {
    return type_ == Type::Object && objectValue_.count(key) > 0;
}

const JSONValue& JSONValue::operator[](const std::string& key) const {
    if (type_ != Type::Object) return nullValue_;
    auto it = objectValue_.find(key);
    if (it == objectValue_.end()) return nullValue_;
    return it->second;
}

JSONValue& JSONValue::operator[](const std::string& key) {
    if (type_ != Type::Object) {
        type_ = Type::Object;
        objectValue_.clear();
    }
    return objectValue_[key];
}

size_t JSONValue::Size() const {
    if (type_ == Type::Array) return arrayValue_.size();
    if (type_ == Type::Object) return objectValue_.size();
    return 0;
}

const JSONValue& JSONValue::operator[](size_t index) const {
    if (type_ != Type::Array || index >= arrayValue_.size()) return nullValue_;
    return arrayValue_[index];
}

void JSONValue::Push(JSONValue value) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    arrayValue_.push_back(std::move(value));
}

// ============================================================================
// Serialization
// ============================================================================

namespace {

void WriteEscaped(std::ostringstream& ss, const std::string& str) {
    ss << '"';
    for (char c : str) {
        switch (c) {
            case '"': ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 32) {
                    ss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec;
                } else {
                    ss << c;
                }
        }
    }
    ss << '"';
}

} // namespace

std::string JSONValue::ToJSON(bool pretty, int indent) const {
    std::ostringstream ss;
    std::string indentStr(indent * 2, ' ');
    std::string childIndent((indent + 1) * 2, ' ');
    const char* newline = pretty ? "\n" : "";

    switch (type_) {
        case Type::Null:
            ss << "null";
            break;
        case Type::Bool:
            ss << (boolValue_ ? "true" : "false");
            break;
        case Type::Int:
            ss << intValue_;
            break;
        case Type::Double:
            ss << std::setprecision(17) << doubleValue_;
            break;
        case Type::String:
            WriteEscaped(ss, stringValue_);
            break;
        case Type::Array: {
            if (arrayValue_.empty()) {
                ss << "[]";
                break;
            }
            ss << "[" << newline;
            for (size_t i = 0; i < arrayValue_.size(); ++i) {
                if (pretty) ss << childIndent;
                ss << arrayValue_[i].ToJSON(pretty, indent + 1);
                if (i + 1 < arrayValue_.size()) ss << ",";
                ss << newline;
            }
            if (pretty) ss << indentStr;
            ss << "]";
            break;
        }
        case Type::Object: {
            if (objectValue_.empty()) {
                ss << "{}";
                break;
            }
            ss << "{" << newline;
            size_t i = 0;
            for (const auto& [key, value] : objectValue_) {
                if (pretty) ss << childIndent;
                WriteEscaped(ss, key);
                ss << (pretty ? ": " : ":") << value.ToJSON(pretty, indent + 1);
                if (++i < objectValue_.size()) ss << ",";
                ss << newline;
            }
            if (pretty) ss << indentStr;
            ss << "}";
            break;
        }
    }

    return ss.str();
}

// ============================================================================
// Parsing
// ============================================================================

namespace {

/// Recursive-descent parser over a single document
class Parser {
public:
    explicit Parser(const std::string& json) : json_(json) {}

    std::optional<JSONValue> ParseDocument() {
        auto value = ParseValue(0);
        if (!value) return std::nullopt;
        SkipWhitespace();
        if (pos_ != json_.size()) return std::nullopt;
        return value;
    }

private:
    static constexpr int MAX_DEPTH = 64;

    void SkipWhitespace() {
        while (pos_ < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
            ++pos_;
        }
    }

    bool Consume(const char* literal) {
        size_t len = std::char_traits<char>::length(literal);
        if (json_.compare(pos_, len, literal) != 0) return false;
        pos_ += len;
        return true;
    }

    static void AppendUtf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    std::optional<std::string> ParseString() {
        if (pos_ >= json_.size() || json_[pos_] != '"') return std::nullopt;
        ++pos_;

        std::string result;
        while (pos_ < json_.size() && json_[pos_] != '"') {
            char c = json_[pos_++];
            if (c != '\\') {
                result += c;
                continue;
            }
            if (pos_ >= json_.size()) return std::nullopt;
            switch (json_[pos_++]) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': {
                    if (pos_ + 4 > json_.size()) return std::nullopt;
                    uint32_t cp = 0;
                    for (int i = 0; i < 4; ++i) {
                        char h = json_[pos_++];
                        cp <<= 4;
                        if (h >= '0' && h <= '9') cp |= h - '0';
                        else if (h >= 'a' && h <= 'f') cp |= h - 'a' + 10;
                        else if (h >= 'A' && h <= 'F') cp |= h - 'A' + 10;
                        else return std::nullopt;
                    }
                    // Surrogate halves are not paired up
                    AppendUtf8(result, cp);
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        if (pos_ >= json_.size()) return std::nullopt;
        ++pos_;
        return result;
    }

    std::optional<JSONValue> ParseNumber() {
        size_t start = pos_;
        bool isFloat = false;

        if (json_[pos_] == '-') ++pos_;
        while (pos_ < json_.size() && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;

        if (pos_ < json_.size() && json_[pos_] == '.') {
            isFloat = true;
            ++pos_;
            while (pos_ < json_.size() && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;
        }
        if (pos_ < json_.size() && (json_[pos_] == 'e' || json_[pos_] == 'E')) {
            isFloat = true;
            ++pos_;
            if (pos_ < json_.size() && (json_[pos_] == '+' || json_[pos_] == '-')) ++pos_;
            while (pos_ < json_.size() && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;
        }

        std::string numStr = json_.substr(start, pos_ - start);
        try {
            if (isFloat) {
                return JSONValue(std::stod(numStr));
            }
            return JSONValue(static_cast<int64_t>(std::stoll(numStr)));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    std::optional<JSONValue> ParseArray(int depth) {
        ++pos_;  // '['
        JSONValue::Array arr;
        SkipWhitespace();
        if (pos_ < json_.size() && json_[pos_] == ']') {
            ++pos_;
            return JSONValue(std::move(arr));
        }

        while (true) {
            auto val = ParseValue(depth + 1);
            if (!val) return std::nullopt;
            arr.push_back(std::move(*val));

            SkipWhitespace();
            if (pos_ >= json_.size()) return std::nullopt;
            if (json_[pos_] == ']') {
                ++pos_;
                return JSONValue(std::move(arr));
            }
            if (json_[pos_] != ',') return std::nullopt;
            ++pos_;
        }
    }

    std::optional<JSONValue> ParseObject(int depth) {
        ++pos_;  // '{'
        JSONValue::Object obj;
        SkipWhitespace();
        if (pos_ < json_.size() && json_[pos_] == '}') {
            ++pos_;
            return JSONValue(std::move(obj));
        }

        while (true) {
            SkipWhitespace();
            auto key = ParseString();
            if (!key) return std::nullopt;

            SkipWhitespace();
            if (pos_ >= json_.size() || json_[pos_] != ':') return std::nullopt;
            ++pos_;

            auto val = ParseValue(depth + 1);
            if (!val) return std::nullopt;
            obj[*key] = std::move(*val);

            SkipWhitespace();
            if (pos_ >= json_.size()) return std::nullopt;
            if (json_[pos_] == '}') {
                ++pos_;
                return JSONValue(std::move(obj));
            }
            if (json_[pos_] != ',') return std::nullopt;
            ++pos_;
        }
    }

    std::optional<JSONValue> ParseValue(int depth) {
        if (depth > MAX_DEPTH) return std::nullopt;
        SkipWhitespace();
        if (pos_ >= json_.size()) return std::nullopt;

        char c = json_[pos_];
        if (c == 'n') return Consume("null") ? std::optional<JSONValue>(JSONValue()) : std::nullopt;
        if (c == 't') return Consume("true") ? std::optional<JSONValue>(JSONValue(true)) : std::nullopt;
        if (c == 'f') return Consume("false") ? std::optional<JSONValue>(JSONValue(false)) : std::nullopt;
        if (c == '"') {
            auto str = ParseString();
            if (!str) return std::nullopt;
            return JSONValue(std::move(*str));
        }
        if (c == '[') return ParseArray(depth);
        if (c == '{') return ParseObject(depth);
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return ParseNumber();
        return std::nullopt;
    }

    const std::string& json_;
    size_t pos_{0};
};

} // namespace

JSONValue JSONValue::Parse(const std::string& json) {
    auto result = TryParse(json);
    if (!result) {
        throw std::runtime_error("JSON parse error");
    }
    return std::move(*result);
}

std::optional<JSONValue> JSONValue::TryParse(const std::string& json) {
    return Parser(json).ParseDocument();
}

} // namespace util
} // namespace pythclient
