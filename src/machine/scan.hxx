/*
    Tapec - An optimizing tape language to C compiler
    SIMD zero scans over the tape
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <cstdint>

#include "simde/x86/avx2.h"

namespace tapec::scan {

// One bit per byte of `v` that belongs to a zero cell.
template <unsigned Bytes>
inline std::uint32_t zeroMask(simde__m256i v) {
    const simde__m256i zero = simde_mm256_setzero_si256();
    int m;
    if constexpr (Bytes == 1)
        m = simde_mm256_movemask_epi8(simde_mm256_cmpeq_epi8(v, zero));
    else if constexpr (Bytes == 2)
        m = simde_mm256_movemask_epi8(simde_mm256_cmpeq_epi16(v, zero));
    else if constexpr (Bytes == 4)
        m = simde_mm256_movemask_epi8(simde_mm256_cmpeq_epi32(v, zero));
    else
        m = simde_mm256_movemask_epi8(simde_mm256_cmpeq_epi64(v, zero));
    return static_cast<std::uint32_t>(m);
}

/// Index of the first zero cell in [0, count), or count when there is none.
template <typename CellT>
inline std::size_t forward(const CellT* p, std::size_t count) {
    constexpr unsigned Bytes = sizeof(CellT);
    constexpr std::size_t Lanes = 32 / Bytes;
    std::size_t i = 0;
    for (; i + Lanes <= count; i += Lanes) {
        const auto v = simde_mm256_loadu_si256(reinterpret_cast<const simde__m256i*>(p + i));
        if (const std::uint32_t m = zeroMask<Bytes>(v)) {
            return i + static_cast<std::size_t>(__builtin_ctz(m)) / Bytes;
        }
    }
    for (; i < count; ++i) {
        if (p[i] == 0) return i;
    }
    return count;
}

/// Distance from `index` back to the nearest zero cell in [0, index], or index + 1 when there
/// is none.
template <typename CellT>
inline std::size_t backward(const CellT* base, std::size_t index) {
    constexpr unsigned Bytes = sizeof(CellT);
    constexpr std::size_t Lanes = 32 / Bytes;
    std::size_t hi = index + 1;  // cells [0, hi) remain to be searched
    while (hi >= Lanes) {
        const std::size_t blk = hi - Lanes;
        const auto v = simde_mm256_loadu_si256(reinterpret_cast<const simde__m256i*>(base + blk));
        if (const std::uint32_t m = zeroMask<Bytes>(v)) {
            const unsigned bit = 31u - static_cast<unsigned>(__builtin_clz(m));
            return index - (blk + bit / Bytes);
        }
        hi = blk;
    }
    while (hi > 0) {
        --hi;
        if (base[hi] == 0) return index - hi;
    }
    return index + 1;
}

}  // namespace tapec::scan
