#include "string_utils.hpp"
#include <cctype>

namespace StringUtils {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

static bool is_safe_char(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) return true;
    switch (c) {
    case '_': case '@': case '%': case '+': case '=':
    case ':': case ',': case '.': case '/': case '-':
        return true;
    default:
        return false;
    }
}

std::string quote_argument(const std::string& arg) {
    bool needs_quotes = arg.empty();
    for (char c : arg) {
        if (!is_safe_char(c)) {
            needs_quotes = true;
            break;
        }
    }
    if (!needs_quotes) return arg;

    std::string out;
    out.reserve(arg.size() + 8);
    out += '"';
    for (char c : arg) {
        switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '$':  out += "\\$"; break;
        case '`':  out += "\\`"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        case '\f': out += "\\f"; break;
        case '\b': out += "\\b"; break;
        default:   out += c; break;
        }
    }
    out += '"';
    return out;
}

std::string join_quoted(const std::vector<std::string>& args) {
    std::string out;
    for (size_t i = 0; i < args.size(); i++) {
        if (i > 0) out += ' ';
        out += quote_argument(args[i]);
    }
    return out;
}

static char unescape(char c) {
    switch (c) {
    case 'n': return '\n';
    case 'r': return '\r';
    case 't': return '\t';
    case 'f': return '\f';
    case 'b': return '\b';
    default:  return c;
    }
}

std::vector<std::string> tokenize_quoted(const std::string& command) {
    enum class State { SPACE, WORD, DOUBLE, SINGLE };

    std::vector<std::string> tokens;
    std::string token;
    State state = State::SPACE;

    for (size_t i = 0; i < command.size(); i++) {
        char c = command[i];
        switch (state) {
        case State::SPACE:
        case State::WORD:
            if (std::isspace(static_cast<unsigned char>(c))) {
                if (state == State::WORD) {
                    tokens.push_back(token);
                    token.clear();
                }
                state = State::SPACE;
            } else if (c == '"') {
                state = State::DOUBLE;
            } else if (c == '\'') {
                state = State::SINGLE;
            } else if (c == '\\' && i + 1 < command.size()) {
                token += command[++i];
                state = State::WORD;
            } else {
                token += c;
                state = State::WORD;
            }
            break;

        case State::DOUBLE:
            if (c == '"') {
                state = State::WORD;
            } else if (c == '\\' && i + 1 < command.size()) {
                token += unescape(command[++i]);
            } else {
                token += c;
            }
            break;

        case State::SINGLE:
            if (c == '\'') {
                state = State::WORD;
            } else {
                token += c;
            }
            break;
        }
    }

    // An unterminated quote still yields what was collected
    if (state != State::SPACE) tokens.push_back(token);
    return tokens;
}

} // namespace StringUtils
