/*
    Tapec - An optimizing tape language to C compiler
    Reference interpreter
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <ostream>
#include <string_view>
#include <vector>

#include "machine/executor.hxx"

namespace tapec {

template <typename CellT>
int interpret(std::string_view source, std::vector<CellT>& cells, std::size_t& cellPtr,
              InputStream& in, std::ostream& out, Profile* profile) {
    std::vector<std::size_t> braceTable(source.size());
    {
        std::vector<std::size_t> stack;
        for (std::size_t i = 0; i < source.size(); ++i) {
            if (source[i] == '[') {
                stack.push_back(i);
            } else if (source[i] == ']') {
                if (stack.empty()) return kUnmatchedClose;
                braceTable[stack.back()] = i;
                braceTable[i] = stack.back();
                stack.pop_back();
            }
        }
        if (!stack.empty()) return kUnmatchedOpen;
    }

    std::chrono::steady_clock::time_point start;
    if (profile) {
        profile->statements = 0;
        start = std::chrono::steady_clock::now();
    }
    const auto size = static_cast<std::ptrdiff_t>(cells.size());
    auto pos = static_cast<std::ptrdiff_t>(cellPtr);
    int status = pos < size ? kRunOk : kOutOfBounds;
    for (std::size_t pc = 0; status == kRunOk && pc < source.size(); ++pc) {
        switch (source[pc]) {
            case '+':
                ++cells[pos];
                break;
            case '-':
                --cells[pos];
                break;
            case '>':
                if (++pos >= size) status = kOutOfBounds;
                break;
            case '<':
                if (--pos < 0) status = kOutOfBounds;
                break;
            case '[':
                if (!cells[pos]) pc = braceTable[pc];
                break;
            case ']':
                if (cells[pos]) pc = braceTable[pc];
                break;
            case '.':
                out.put(static_cast<char>(cells[pos]));
                break;
            case ',': {
                const int c = in.next();
                if (c >= 0) {
                    cells[pos] = static_cast<CellT>(c);
                } else if (in.policy() == EofPolicy::Zero) {
                    cells[pos] = 0;
                } else if (in.policy() == EofPolicy::Exit) {
                    out.flush();
                    status = kInputExit;
                }
                break;
            }
            default:
                continue;
        }
        if (profile) ++profile->statements;
    }
    if (status == kOutOfBounds) {
        std::cerr << "cell pointer moved outside the tape" << std::endl;
        pos = pos < 0 ? 0 : size - 1;
    }
    cellPtr = static_cast<std::size_t>(pos);
    if (profile)
        profile->seconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return status;
}

template int interpret<std::uint8_t>(std::string_view, std::vector<std::uint8_t>&, std::size_t&,
                                     InputStream&, std::ostream&, Profile*);
template int interpret<std::uint16_t>(std::string_view, std::vector<std::uint16_t>&,
                                      std::size_t&, InputStream&, std::ostream&, Profile*);
template int interpret<std::uint32_t>(std::string_view, std::vector<std::uint32_t>&,
                                      std::size_t&, InputStream&, std::ostream&, Profile*);
template int interpret<std::uint64_t>(std::string_view, std::vector<std::uint64_t>&,
                                      std::size_t&, InputStream&, std::ostream&, Profile*);

}  // namespace tapec
