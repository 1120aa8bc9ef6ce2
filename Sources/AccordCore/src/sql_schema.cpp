#include "accord/sql_schema.hpp"
#include "accord/errors.hpp"
#include <cctype>

namespace accord {

namespace {

bool is_identifier_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Length of the identifier starting at pos, 0 if there is none
size_t identifier_length(const std::string& text, size_t pos) {
    if (pos >= text.size() || !is_identifier_start(text[pos])) return 0;
    size_t end = pos + 1;
    while (end < text.size() && is_identifier_char(text[end])) ++end;
    return end - pos;
}

} // namespace

sql_schema::sql_schema(std::string name) : name_(std::move(name)) {
    if (name_.empty()) {
        throw schema_error("sql_schema needs a name");
    }
}

std::string sql_schema::qualified_name(const std::string& object, const dialect& d) const {
    return d.qualify(name_, object);
}

std::string sql_schema::qualified_name_raw(const std::string& object, const dialect& d) const {
    return d.qualify_raw(name_, object);
}

std::string rewrite_schema_references(const std::string& text, const dialect& d) {
    std::string result;
    result.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        if (text[pos] == '{') {
            size_t schema_len = identifier_length(text, pos + 1);
            size_t dot = pos + 1 + schema_len;
            if (schema_len > 0 && dot < text.size() && text[dot] == '.') {
                size_t object_len = identifier_length(text, dot + 1);
                size_t close = dot + 1 + object_len;
                if (object_len > 0 && close < text.size() && text[close] == '}') {
                    result += d.qualify_raw(text.substr(pos + 1, schema_len),
                                            text.substr(dot + 1, object_len));
                    pos = close + 1;
                    continue;
                }
            }
        }
        result += text[pos++];
    }
    return result;
}

} // namespace accord
