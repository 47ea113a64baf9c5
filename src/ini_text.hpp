#pragma once

#include <string>
#include <vector>

// Line helpers shared by the campaign and settings readers.

std::string trim(std::string s);
std::string toLower(std::string s);

void stripUtf8Bom(std::string& s);

// Drops everything from the first '#' or ';' on.
std::string stripComment(const std::string& line);

// Whole-token parses: "12abc" and "" are rejected.
bool parseInt(const std::string& raw, int& out);
bool parseBool(const std::string& raw, bool& out);

// Splits on `sep` and trims each piece.
std::vector<std::string> split(const std::string& s, char sep);

// Adds "Line N: msg" to `w`, capped at warnLimit entries.
void appendWarning(std::string& w, int lineNo, const std::string& msg, int& warnCount, int warnLimit = 30);
