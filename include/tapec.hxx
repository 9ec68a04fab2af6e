/*
    Tapec - An optimizing tape language to C compiler
    Public API declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#include "config.hxx"
#include "compiler/ir.hxx"
#include "compiler/extensions.hxx"
#include "compiler/passes.hxx"
#include "compiler/emitter.hxx"
#include "compiler/compiler.hxx"
#include "machine/executor.hxx"
