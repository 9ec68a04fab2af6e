/*
    Tapec - An optimizing tape language to C compiler
    Loop reduction: closed forms for balanced innermost loops
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <xxhash.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "compiler/passes.hxx"

namespace tapec {

namespace {
// State of one emulated iteration. Offsets are relative to the loop's origin cell.
struct Iteration {
    std::int64_t pos = 0;
    bool started = false;
    std::int64_t originDelta = 0;       // net origin change before any origin clear
    std::int64_t originAfterClear = 0;  // net origin change after the last origin clear
    bool originCleared = false;
    bool clearedAtEnd = true;
    bool addAfterClear = false;  // some offset is written again after being cleared
    std::vector<std::int64_t> clearedOffsets;
    Program fragments;
};

bool eligible(OpKind k) { return isValueOp(k) || isMoveOp(k) || k == OpKind::ClearCell; }
}  // namespace

std::optional<Program> reduceLoop(const TokenStream& body) {
    std::int64_t balance = 0;
    for (const auto& t : body) {
        if (!eligible(t.kind)) return std::nullopt;
        if (isMoveOp(t.kind)) balance += signedCount(t);
    }
    if (balance != 0) return std::nullopt;

    Iteration it;
    for (const auto& t : body) {
        switch (t.kind) {
            case OpKind::MoveRight:
            case OpKind::MoveLeft:
                it.pos += signedCount(t);
                break;
            case OpKind::IncCell:
            case OpKind::DecCell:
                if (it.pos != 0) {
                    if (std::find(it.clearedOffsets.begin(), it.clearedOffsets.end(), it.pos) !=
                        it.clearedOffsets.end())
                        it.addAfterClear = true;
                    it.fragments.push_back(Statement{StmtKind::MulAdd,
                                                     static_cast<std::int32_t>(it.pos),
                                                     signedCount(t)});
                } else {
                    it.started = true;
                    (it.originCleared ? it.originAfterClear : it.originDelta) += signedCount(t);
                }
                break;
            case OpKind::ClearCell:
                if (it.pos != 0) {
                    it.fragments.push_back(
                        Statement{StmtKind::ClearIfNonZero, static_cast<std::int32_t>(it.pos)});
                    it.clearedOffsets.push_back(it.pos);
                } else {
                    it.started = true;
                    it.originCleared = true;
                    it.clearedAtEnd = false;
                    it.originAfterClear = 0;
                }
                break;
            default:
                return std::nullopt;
        }
    }
    if (!it.started) return std::nullopt;

    if (it.originCleared) {
        // The origin is zero after one pass, so the body runs at most once.
        if (it.originAfterClear != 0) return std::nullopt;
        for (auto& f : it.fragments) {
            if (f.kind == StmtKind::MulAdd) f.kind = StmtKind::AddIfNonZero;
        }
        it.fragments.push_back(Statement{StmtKind::ClearAt, 0});
        return std::move(it.fragments);
    }

    if (it.originDelta == 0 || it.addAfterClear) return std::nullopt;
    const auto divisor = static_cast<std::uint32_t>(std::min<std::int64_t>(
        it.originDelta < 0 ? -it.originDelta : it.originDelta, UINT32_MAX));
    for (auto& f : it.fragments) {
        if (f.kind != StmtKind::MulAdd) continue;
        f.divisor = divisor;
        f.negate = it.originDelta > 0;
    }
    // An even step never reaches zero from an origin with any of its low bits set.
    if (const std::uint32_t low = divisor & (0u - divisor); low > 1) {
        Statement guard{StmtKind::SpinUnlessMultiple};
        guard.divisor = low;
        it.fragments.insert(it.fragments.begin(), guard);
    }
    if (it.clearedAtEnd) it.fragments.push_back(Statement{StmtKind::ClearAt, 0});
    return std::move(it.fragments);
}

std::uint64_t ReductionCache::digest(const TokenStream& body) {
    std::vector<std::uint8_t> bytes;
    bytes.reserve(body.size() * 6);
    for (const auto& t : body) {
        bytes.push_back(static_cast<std::uint8_t>(t.kind));
        for (int shift = 0; shift < 32; shift += 8) {
            bytes.push_back(static_cast<std::uint8_t>(t.count >> shift));
        }
        bytes.push_back(static_cast<std::uint8_t>(t.symbol));
    }
    return XXH64(bytes.data(), bytes.size(), 0);
}

const std::optional<Program>* ReductionCache::find(const TokenStream& body) const {
    auto it = entries.find(digest(body));
    if (it == entries.end() || it->second.first != body) return nullptr;
    ++hitCount;
    return &it->second.second;
}

void ReductionCache::store(const TokenStream& body, std::optional<Program> result) {
    entries.insert_or_assign(digest(body), std::make_pair(body, std::move(result)));
}

TokenStream reduceLoops(const TokenStream& tokens, ReductionCache* cache, ReduceStats* stats) {
    TokenStream out;
    out.reserve(tokens.size());
    std::vector<std::size_t> opens;  // positions of pending LoopOpen tokens in `out`
    for (const auto& t : tokens) {
        if (t.kind == OpKind::LoopOpen) {
            opens.push_back(out.size());
        } else if (t.kind == OpKind::LoopClose && !opens.empty()) {
            const std::size_t open = opens.back();
            opens.pop_back();
            const auto first = out.begin() + static_cast<std::ptrdiff_t>(open) + 1;
            const bool innermost = std::none_of(first, out.end(), [](const Token& b) {
                return isLoopMarker(b.kind) || b.kind == OpKind::Fragment;
            });
            if (innermost) {
                if (stats) ++stats->loops;
                TokenStream body(first, out.end());
                std::optional<Program> reduced;
                if (const auto* hit = cache ? cache->find(body) : nullptr) {
                    reduced = *hit;
                } else {
                    reduced = reduceLoop(body);
                    if (cache) cache->store(body, reduced);
                }
                if (reduced) {
                    if (stats) ++stats->reduced;
                    out.erase(first - 1, out.end());
                    for (const auto& f : *reduced) {
                        Token frag{OpKind::Fragment};
                        frag.fragment = f;
                        out.push_back(frag);
                    }
                    continue;
                }
            }
        }
        out.push_back(t);
    }
    return out;
}

}  // namespace tapec
