/*
    Tapec - An optimizing tape language to C compiler
    Peephole fusion of move/update neighbours
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <cstddef>
#include <cstdint>
#include <optional>

#include "compiler/passes.hxx"

namespace tapec {

namespace {
inline bool isUpdate(OpKind k) { return isValueOp(k) || k == OpKind::ClearCell; }

inline std::int32_t moveOf(const Token& t) { return static_cast<std::int32_t>(signedCount(t)); }

// >>+<<, <[-]>: the pointer comes back to where it started.
std::optional<Statement> matchOffsetUpdate(const TokenStream& ts, std::size_t i) {
    if (i + 2 >= ts.size()) return std::nullopt;
    const Token& go = ts[i];
    const Token& op = ts[i + 1];
    const Token& back = ts[i + 2];
    if (!isMoveOp(go.kind) || !isUpdate(op.kind) || !isMoveOp(back.kind)) return std::nullopt;
    if (go.kind == back.kind || go.count != back.count) return std::nullopt;
    if (op.kind == OpKind::ClearCell) return Statement{StmtKind::ClearAt, moveOf(go)};
    return Statement{StmtKind::AddAt, moveOf(go), signedCount(op)};
}

// ++>, ---<
std::optional<Statement> matchUpdateAdvance(const TokenStream& ts, std::size_t i) {
    if (i + 1 >= ts.size()) return std::nullopt;
    const Token& op = ts[i];
    const Token& step = ts[i + 1];
    if (!isValueOp(op.kind) || !isMoveOp(step.kind) || step.count != 1) return std::nullopt;
    return Statement{StmtKind::AddThenMove, 0, signedCount(op), moveOf(step)};
}

// >>+, <<<[-]
std::optional<Statement> matchAdvanceUpdate(const TokenStream& ts, std::size_t i) {
    if (i + 1 >= ts.size()) return std::nullopt;
    const Token& go = ts[i];
    const Token& op = ts[i + 1];
    if (!isMoveOp(go.kind) || !isUpdate(op.kind)) return std::nullopt;
    if (op.kind == OpKind::ClearCell) return Statement{StmtKind::MoveThenClear, 0, 0, moveOf(go)};
    return Statement{StmtKind::MoveThenAdd, 0, signedCount(op), moveOf(go)};
}

Statement single(const Token& t) {
    switch (t.kind) {
        case OpKind::IncCell:
        case OpKind::DecCell:
            return Statement{StmtKind::AddAt, 0, signedCount(t)};
        case OpKind::ClearCell:
            return Statement{StmtKind::ClearAt};
        case OpKind::MoveRight:
        case OpKind::MoveLeft:
            return Statement{StmtKind::Move, 0, 0, moveOf(t)};
        case OpKind::LoopOpen:
            return Statement{StmtKind::LoopBegin};
        case OpKind::LoopClose:
            return Statement{StmtKind::LoopEnd};
        case OpKind::ScanRight:
            return Statement{StmtKind::ScanRight};
        case OpKind::ScanLeft:
            return Statement{StmtKind::ScanLeft};
        case OpKind::Input:
            return Statement{StmtKind::Input};
        case OpKind::Output:
            return Statement{StmtKind::Output};
        case OpKind::Extension: {
            Statement s{StmtKind::Extension};
            s.symbol = t.symbol;
            return s;
        }
        case OpKind::Fragment:
            return t.fragment;
    }
    return Statement{};
}
}  // namespace

Program fuse(const TokenStream& tokens, const FuseOptions& opts) {
    Program program;
    program.reserve(tokens.size());
    for (std::size_t i = 0; i < tokens.size();) {
        if (opts.fuse) {
            if (auto s = matchOffsetUpdate(tokens, i)) {
                program.push_back(*s);
                i += 3;
                continue;
            }
            std::optional<Statement> s = matchUpdateAdvance(tokens, i);
            if (!s) s = matchAdvanceUpdate(tokens, i);
            if (s) {
                program.push_back(*s);
                i += 2;
                continue;
            }
        }
        program.push_back(single(tokens[i++]));
    }
    return program;
}

}  // namespace tapec
