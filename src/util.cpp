#include "util.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace fetchkit {

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> result;
    std::istringstream stream(s);
    std::string token;
    while (std::getline(stream, token, delim)) {
        result.push_back(token);
    }
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

std::string url_encode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

static std::string query_value(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

std::string build_query(const nlohmann::json& query) {
    if (!query.is_object()) return {};

    std::string out;
    auto append = [&out](const std::string& key, const nlohmann::json& value) {
        if (value.is_null()) return;
        if (!out.empty()) out += '&';
        out += url_encode(key) + "=" + url_encode(query_value(value));
    };

    for (auto& [key, value] : query.items()) {
        if (value.is_array()) {
            for (const auto& item : value) append(key, item);
        } else {
            append(key, value);
        }
    }
    return out;
}

std::string compose_url(const std::string& base, const std::string& path,
                        const nlohmann::json& query) {
    std::string url = base + path;
    std::string qs = build_query(query);
    if (qs.empty()) return url;
    url += url.find('?') == std::string::npos ? '?' : '&';
    return url + qs;
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

} // namespace fetchkit
