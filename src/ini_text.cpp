#include "ini_text.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

std::string trim(std::string s) {
    const auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    return s;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void stripUtf8Bom(std::string& s) {
    if (s.size() >= 3 && static_cast<unsigned char>(s[0]) == 0xEF && static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s.erase(0, 3);
    }
}

std::string stripComment(const std::string& line) {
    return line.substr(0, line.find_first_of("#;"));
}

bool parseInt(const std::string& raw, int& out) {
    const std::string s = trim(raw);
    if (s.empty()) return false;
    try {
        size_t idx = 0;
        const int v = std::stoi(s, &idx, 10);
        if (idx != s.size()) return false;
        out = v;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

bool parseBool(const std::string& raw, bool& out) {
    const std::string s = toLower(trim(raw));
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    size_t start = 0;
    for (;;) {
        const size_t at = s.find(sep, start);
        out.push_back(trim(s.substr(start, at == std::string::npos ? std::string::npos : at - start)));
        if (at == std::string::npos) break;
        start = at + 1;
    }
    return out;
}

void appendWarning(std::string& w, int lineNo, const std::string& msg, int& warnCount, int warnLimit) {
    if (warnCount < warnLimit) {
        w += "Line " + std::to_string(lineNo) + ": " + msg + "\n";
    } else if (warnCount == warnLimit) {
        w += "(more warnings omitted...)\n";
    }
    ++warnCount;
}
