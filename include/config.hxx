/*
    Tapec - An optimizing tape language to C compiler
    Compile-time defaults
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#define TAPEC_DEFAULT_EOF_POLICY 2
#define TAPEC_DEFAULT_TAPE_SIZE 65536
#define TAPEC_DEFAULT_CELL_WIDTH 8
#define TAPEC_OPTIMIZE 1
// Longest run a single count-prefixed token may carry.
#define TAPEC_MAX_REPEAT 99
#define TAPEC_TAPE_WARN_BYTES (1ull << 30)  // 1 GiB
// Hard limit for the generated static tape and the executor tape.
#define TAPEC_TAPE_MAX_BYTES (1ull << 31)  // 2 GiB
