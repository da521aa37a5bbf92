/*
 * Command classification table - GLSFS
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <vector>
#include <glsfs/lex/tokenizer.hpp>

namespace glsfs {

enum class CommandClass { ReadOnly, Write, Unknown };

// Which operands of a write-capable command name the paths it modifies.
enum class TargetStrategy {
    None,
    AllOperands,        // rm, rmdir, shred, touch, mkdir, truncate, tee
    LastOperand,        // mv, cp, ln (destination)
    OperandsAfterFirst, // chmod, chown, chgrp, sed -i (first operand is mode/owner/script)
    LeadingOperands     // find (start points before the first expression word)
};

struct CommandInfo {
    CommandClass cls = CommandClass::Unknown;
    TargetStrategy targets = TargetStrategy::None;
    bool destructive = false; // adds a warning when allowed
    bool recursive = false;   // also modifies everything below its targets
};

// Lookup by base command name; unknown commands get {Unknown, None}.
const CommandInfo& lookup_command(const std::string& name);

// First word of the first pipeline segment, skipping env assignments, a
// leading sudo (and its flags) and any directory prefix (/usr/bin/rm -> rm).
std::string base_command(const TokenList& tokens);

// Operands of the first segment of tokens (non-flag words after the command,
// redirections and their targets excluded).
TokenList command_operands(const TokenList& tokens);

// Every word after the command in the first segment, flags included and
// redirections excluded.
TokenList command_words(const TokenList& tokens);

// Apply the strategy to the operand list. LeadingOperands expects
// command_words() and defaults to "." when no start point is given.
TokenList extract_targets(const TokenList& operands, TargetStrategy strategy);

// Table entry for the segment's command, refined by its options: find with
// -delete/-exec/-execdir/-ok/-okdir and sed -i/--in-place become writers,
// rm/chmod/chown/chgrp with -r/-R/--recursive are recursive.
CommandInfo classify_segment(const TokenList& segment);

// Paths the segment writes to according to classify_segment().
TokenList segment_targets(const TokenList& segment);

const char* to_string(CommandClass c);

} // namespace glsfs
