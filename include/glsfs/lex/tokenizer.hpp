/*
 * GLSFS Tokenizer Module
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Splits a generated command line into shell-like words on unquoted
 *   whitespace. Quoted substrings stay inside the word that contains them and
 *   the quote characters are kept, so later stages can tell a quoted search
 *   pattern from a literal path. An unterminated quote swallows the rest of
 *   the line into a single word. An unquoted newline separates commands like
 *   ';' and comes back as a "\n" word of its own. Operators glued to words
 *   (a|b) stay in the word; split_chain_operators() separates them for
 *   callers that need it.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <string>
#include <vector>
#include <cstddef>

namespace glsfs {

using TokenList = std::vector<std::string>;

class Tokenizer {
public:
    explicit Tokenizer(std::string input);
    TokenList run();
private:
    std::string next();
    char peek() const;
    char get();
    bool eof() const;
    void skip_space();

    std::string m_input;
    std::size_t m_pos = 0; // current index
};

// Convenience wrapper: Tokenizer(line).run()
TokenList tokenize(const std::string& line);

// Join words with single spaces (none around a "\n" separator).
std::string join_tokens(const TokenList& tokens);

// Word classification used by the normalizer and the validator.
bool is_flag(const std::string& tok);            // leading '-' (but not a lone "-")
bool is_chain_operator(const std::string& tok);  // | || && ; & and newline
bool is_redirection(const std::string& tok);     // > >> < 2> 2>&1 &> ... (possibly glued to a target)
bool is_fully_quoted(const std::string& tok);    // 'x' or "x"

// Split words on unquoted chain operators glued to them ("ls|wc" -> ls | wc).
// Redirection forms such as 2>&1 and &> are left intact.
TokenList split_chain_operators(const TokenList& tokens);

// Pipeline/list segments between chain operators (operators dropped).
std::vector<TokenList> split_segments(const TokenList& tokens);

// Remove one level of surrounding/embedded quotes: "a b"/c -> a b/c
std::string unquote(const std::string& tok);

// For a redirection word returns the operator length ("2>>file" -> 3), 0 otherwise.
std::size_t redirection_prefix_length(const std::string& tok);

} // namespace glsfs
