/*
    Tapec - An optimizing tape language to C compiler
    Opcode extensions
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "compiler/extensions.hxx"

#include <algorithm>
#include <utility>

namespace tapec {

bool isCoreSymbol(char c) {
    switch (c) {
        case '+':
        case '-':
        case '>':
        case '<':
        case '[':
        case ']':
        case '.':
        case ',':
            return true;
        default:
            return false;
    }
}

bool ExtensionSet::add(char symbol, Extension ext) {
    if (isCoreSymbol(symbol)) return false;
    return table.emplace(symbol, std::move(ext)).second;
}

const Extension* ExtensionSet::find(char symbol) const {
    auto it = table.find(symbol);
    return it == table.end() ? nullptr : &it->second;
}

std::vector<std::string> ExtensionSet::headers() const {
    std::vector<std::string> all;
    for (const auto& [symbol, ext] : table) {
        for (const auto& h : ext.headers) {
            if (std::find(all.begin(), all.end(), h) == all.end()) all.push_back(h);
        }
    }
    return all;
}

Extension forkExtension() {
    return Extension{"p[0] = fork() == 0 ? 0 : 1;", {"unistd.h"}};
}

}  // namespace tapec
