/*
    Tapec - An optimizing tape language to C compiler
    Sanitizer and opcode encoder
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <cstddef>
#include <string>
#include <string_view>

#include "compiler/passes.hxx"

namespace tapec {

namespace {
struct Idiom {
    std::string_view text;
    OpKind kind;
};

// Checked in this order at every position; all are three symbols long.
constexpr Idiom kIdioms[] = {
    {"[-]", OpKind::ClearCell},
    {"[+]", OpKind::ClearCell},
    {"[<]", OpKind::ScanLeft},
    {"[>]", OpKind::ScanRight},
};

OpKind mapSymbol(char c) {
    switch (c) {
        case '+':
            return OpKind::IncCell;
        case '-':
            return OpKind::DecCell;
        case '>':
            return OpKind::MoveRight;
        case '<':
            return OpKind::MoveLeft;
        case '[':
            return OpKind::LoopOpen;
        case ']':
            return OpKind::LoopClose;
        case '.':
            return OpKind::Output;
        case ',':
            return OpKind::Input;
        default:
            return OpKind::Extension;
    }
}

// Index one past the bracket closing the loop opened at `open`, or the stream size.
std::size_t skipLoop(const TokenStream& tokens, std::size_t open) {
    std::size_t depth = 0;
    for (std::size_t i = open; i < tokens.size(); ++i) {
        if (tokens[i].kind == OpKind::LoopOpen) {
            ++depth;
        } else if (tokens[i].kind == OpKind::LoopClose && --depth == 0) {
            return i + 1;
        }
    }
    return tokens.size();
}
}  // namespace

std::string sanitize(std::string_view source, const ExtensionSet& extensions) {
    std::string out;
    out.reserve(source.size());
    for (char c : source) {
        if (isCoreSymbol(c) || extensions.contains(c)) out.push_back(c);
    }
    return out;
}

TokenStream encode(std::string_view sanitized, const ExtensionSet& extensions) {
    TokenStream tokens;
    tokens.reserve(sanitized.size());
    for (std::size_t i = 0; i < sanitized.size();) {
        bool matched = false;
        for (const auto& idiom : kIdioms) {
            if (sanitized.substr(i, idiom.text.size()) == idiom.text) {
                tokens.push_back(Token{idiom.kind});
                i += idiom.text.size();
                matched = true;
                break;
            }
        }
        if (matched) continue;
        const char c = sanitized[i++];
        const OpKind kind = mapSymbol(c);
        if (kind == OpKind::Extension && !extensions.contains(c)) continue;
        tokens.push_back(Token{kind, 1, kind == OpKind::Extension ? c : '\0'});
    }

    // Every cell is zero on entry, so leading loops can never run.
    std::size_t start = 0;
    while (start < tokens.size() && tokens[start].kind == OpKind::LoopOpen) {
        start = skipLoop(tokens, start);
    }
    if (start) tokens.erase(tokens.begin(), tokens.begin() + static_cast<std::ptrdiff_t>(start));
    return tokens;
}

}  // namespace tapec
