/*
    Tapec - An optimizing tape language to C compiler
    Run folding and repeat encoding
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>

#include "compiler/passes.hxx"

namespace tapec {

namespace {
inline bool samePair(OpKind a, OpKind b) {
    return (isValueOp(a) && isValueOp(b)) || (isMoveOp(a) && isMoveOp(b));
}

// Appends the net effect of tokens[first, last), all drawn from one opposite pair.
void processBalanced(const TokenStream& tokens, std::size_t first, std::size_t last,
                     TokenStream& out) {
    std::int64_t total = 0;
    for (std::size_t i = first; i < last; ++i) total += signedCount(tokens[i]);
    if (total == 0) return;
    const bool value = isValueOp(tokens[first].kind);
    const OpKind winner = total > 0 ? (value ? OpKind::IncCell : OpKind::MoveRight)
                                    : (value ? OpKind::DecCell : OpKind::MoveLeft);
    out.insert(out.end(), static_cast<std::size_t>(total > 0 ? total : -total), Token{winner});
}

char symbolOf(const Token& t) {
    switch (t.kind) {
        case OpKind::IncCell:
            return '+';
        case OpKind::DecCell:
            return '-';
        case OpKind::ClearCell:
            return 'c';
        case OpKind::MoveRight:
            return '>';
        case OpKind::MoveLeft:
            return '<';
        case OpKind::LoopOpen:
            return '[';
        case OpKind::LoopClose:
            return ']';
        case OpKind::ScanRight:
            return 'r';
        case OpKind::ScanLeft:
            return 'l';
        case OpKind::Input:
            return ',';
        case OpKind::Output:
            return '.';
        case OpKind::Extension:
            return t.symbol;
        case OpKind::Fragment:
            return 'F';
    }
    return '?';
}
}  // namespace

TokenStream foldRuns(const TokenStream& tokens) {
    TokenStream out;
    out.reserve(tokens.size());
    for (std::size_t i = 0; i < tokens.size();) {
        const OpKind kind = tokens[i].kind;
        if (!isValueOp(kind) && !isMoveOp(kind)) {
            out.push_back(tokens[i++]);
            continue;
        }
        std::size_t end = i + 1;
        while (end < tokens.size() && samePair(kind, tokens[end].kind)) ++end;
        processBalanced(tokens, i, end, out);
        i = end;
    }
    return out;
}

TokenStream encodeRepeats(const TokenStream& tokens, std::uint32_t maxRepeat) {
    maxRepeat = std::max<std::uint32_t>(maxRepeat, 1);
    TokenStream out;
    out.reserve(tokens.size());
    for (std::size_t i = 0; i < tokens.size();) {
        const OpKind kind = tokens[i].kind;
        if (!isValueOp(kind) && !isMoveOp(kind)) {
            out.push_back(tokens[i++]);
            continue;
        }
        std::uint64_t run = 0;
        std::size_t end = i;
        while (end < tokens.size() && tokens[end].kind == kind) run += tokens[end++].count;
        while (run > 0) {
            const auto chunk = static_cast<std::uint32_t>(std::min<std::uint64_t>(run, maxRepeat));
            out.push_back(Token{kind, chunk});
            run -= chunk;
        }
        i = end;
    }
    return out;
}

std::size_t expandedLength(const TokenStream& tokens) {
    std::size_t total = 0;
    for (const auto& t : tokens) total += t.count;
    return total;
}

std::string spell(const TokenStream& tokens) {
    std::string s;
    for (const auto& t : tokens) {
        if (t.count != 1) s += std::to_string(t.count);
        s += symbolOf(t);
    }
    return s;
}

}  // namespace tapec
