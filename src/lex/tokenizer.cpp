/*
 * GLSFS Tokenizer Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Splits a command line into words, keeping quotes. See header for details.
 */
#include <cctype>
#include <glsfs/lex/tokenizer.hpp>

namespace glsfs {

Tokenizer::Tokenizer(std::string input) : m_input(std::move(input)) {}

char Tokenizer::peek() const { return eof() ? '\0' : m_input[m_pos]; }
char Tokenizer::get() { return eof() ? '\0' : m_input[m_pos++]; }
bool Tokenizer::eof() const { return m_pos >= m_input.size(); }

// stops at an unquoted newline, which is a command separator of its own
void Tokenizer::skip_space() {
    while (!eof() && peek()!='\n' && std::isspace(static_cast<unsigned char>(peek()))) get();
}

std::string Tokenizer::next() {
    std::string out; char quote = '\0';
    while (!eof()) {
        char c = peek();
        if (quote == '\0') {
            if (std::isspace(static_cast<unsigned char>(c))) break;
            if (c=='\'' || c=='"') { quote = c; out.push_back(get()); continue; }
            if (c=='\\') { out.push_back(get()); if (!eof()) out.push_back(get()); continue; }
            out.push_back(get());
        } else {
            out.push_back(get());
            if (c=='\\' && quote=='"' && !eof()) { out.push_back(get()); continue; }
            if (c==quote) quote = '\0';
        }
    }
    return out;
}

TokenList Tokenizer::run() {
    TokenList ts;
    while (true) {
        skip_space();
        if (eof()) break;
        if (peek()=='\n') { get(); ts.emplace_back("\n"); continue; }
        ts.push_back(next());
    }
    return ts;
}

TokenList tokenize(const std::string& line) { return Tokenizer(line).run(); }

std::string join_tokens(const TokenList& tokens) {
    std::string out;
    for (std::size_t i=0;i<tokens.size();++i) {
        if (i>0 && tokens[i]!="\n" && tokens[i-1]!="\n") out.push_back(' ');
        out += tokens[i];
    }
    return out;
}

bool is_flag(const std::string& tok) { return tok.size()>1 && tok[0]=='-'; }

bool is_chain_operator(const std::string& tok) {
    return tok=="|" || tok=="||" || tok=="&&" || tok==";" || tok=="&" || tok=="|&" || tok=="\n";
}

std::size_t redirection_prefix_length(const std::string& tok) {
    static const char* ops[] = {"2>&1", "1>&2", "&>>", "2>>", "1>>", "&>", "2>", "1>", ">>", ">", "<<", "<"};
    for (auto op : ops) {
        std::string s(op);
        if (tok.compare(0, s.size(), s)==0) return s.size();
    }
    return 0;
}

bool is_redirection(const std::string& tok) { return redirection_prefix_length(tok) > 0; }

bool is_fully_quoted(const std::string& tok) {
    if (tok.size()<2) return false;
    char q = tok.front();
    if ((q!='\'' && q!='"') || tok.back()!=q) return false;
    // the closing quote must be the first matching one (rules out "a"b"c")
    return tok.find(q, 1) == tok.size()-1;
}

TokenList split_chain_operators(const TokenList& tokens) {
    TokenList out;
    for (auto &tok : tokens) {
        if (is_chain_operator(tok)) { out.push_back(tok); continue; }
        std::string cur; char quote='\0';
        for (std::size_t i=0;i<tok.size();++i) {
            char c = tok[i];
            if (quote!='\0') { cur.push_back(c); if (c==quote) quote='\0'; continue; }
            if (c=='\'' || c=='"') { quote=c; cur.push_back(c); continue; }
            if (c=='\\' && i+1<tok.size()) { cur.push_back(c); cur.push_back(tok[++i]); continue; }
            bool op = (c=='|' || c==';' || c=='&');
            if (c=='&' && ((i>0 && tok[i-1]=='>') || (i+1<tok.size() && tok[i+1]=='>'))) op = false;
            if (!op) { cur.push_back(c); continue; }
            if (!cur.empty()) { out.push_back(cur); cur.clear(); }
            std::string o(1, c);
            if (c!=';' && i+1<tok.size() && tok[i+1]==c) { o.push_back(c); ++i; }
            out.push_back(o);
        }
        if (!cur.empty()) out.push_back(cur);
    }
    return out;
}

std::vector<TokenList> split_segments(const TokenList& tokens) {
    std::vector<TokenList> segs(1);
    for (auto &t : split_chain_operators(tokens)) {
        if (is_chain_operator(t)) { if (!segs.back().empty()) segs.emplace_back(); continue; }
        segs.back().push_back(t);
    }
    if (segs.back().empty()) segs.pop_back();
    return segs;
}

std::string unquote(const std::string& tok) {
    std::string out; char quote='\0';
    for (std::size_t i=0;i<tok.size();++i) {
        char c = tok[i];
        if (quote=='\0') {
            if (c=='\'' || c=='"') { quote=c; continue; }
            if (c=='\\' && i+1<tok.size()) { out.push_back(tok[++i]); continue; }
            out.push_back(c);
        } else {
            if (c==quote) { quote='\0'; continue; }
            out.push_back(c);
        }
    }
    return out;
}

} // namespace glsfs
