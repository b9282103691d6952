#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace fetchkit {

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

bool starts_with(const std::string& s, const std::string& prefix);

// Case-insensitive ASCII comparison (header names)
bool iequals(const std::string& a, const std::string& b);

// Percent-encode everything outside RFC 3986 unreserved characters
std::string url_encode(const std::string& s);

// Encode a JSON object as a query string ("a=1&b=x"). Keys come out sorted;
// arrays repeat the key; null values are skipped.
std::string build_query(const nlohmann::json& query);

// base + path, then "?query" when the query is non-empty
std::string compose_url(const std::string& base, const std::string& path,
                        const nlohmann::json& query);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

} // namespace fetchkit
