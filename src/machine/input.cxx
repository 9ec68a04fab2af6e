/*
    Tapec - An optimizing tape language to C compiler
    Runtime input stream
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <algorithm>
#include <istream>
#include <string>
#include <utility>

#include "machine/executor.hxx"

namespace tapec {

InputStream::InputStream(std::string_view literal, std::istream* lines, EofPolicy eof)
    : buffer(literal), lines(lines), eof(eof) {
    if (!buffer.empty()) buffer.push_back('\0');
}

int InputStream::next() {
    if (cursor >= buffer.size() && !refill()) return -1;
    return static_cast<unsigned char>(buffer[cursor++]);
}

// Same framing as fgets() + strlen() in the generated read helper: at most kLineMax - 1 bytes,
// newline kept, cut at the first NUL, then a zero sentinel.
bool InputStream::refill() {
    if (!lines) return false;
    std::string line;
    char c;
    while (line.size() + 1 < kLineMax && lines->get(c)) {
        line.push_back(c);
        if (c == '\n') break;
    }
    if (line.empty()) return false;
    line.erase(std::find(line.begin(), line.end(), '\0'), line.end());
    line.push_back('\0');
    buffer = std::move(line);
    cursor = 0;
    return true;
}

}  // namespace tapec
