/**
 * @file Selector.cpp
 * @brief Selector scanner and parser
 *
 * Parsing works in two layers. The segment layer walks the selector text,
 * splitting on '.' outside parentheses and quotes. Parenthesized content
 * is then tokenized by the instruction layer and classified as a group or
 * a merge instruction.
 */

#include "graft/Selector.hpp"
#include "graft/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace graft {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_quote(char c) {
    return c == '\'' || c == '"';
}

/// Token of the instruction layer.
struct Token {
    enum class Kind { Word, Quoted, Equal, Comma, End };

    Kind kind = Kind::End;
    std::string text;
    std::size_t pos = 0;   // offset into the full selector

    bool is_name() const { return kind == Kind::Word || kind == Kind::Quoted; }
    bool is_keyword(const char* kw) const { return kind == Kind::Word && text == kw; }
};

class SelectorParser {
public:
    explicit SelectorParser(const std::string& text) : text_(text) {}

    Selector parse() {
        Selector result;
        if (text_.empty()) {
            fail(0, "", "selector is empty");
        }

        while (true) {
            const std::size_t seg_start = pos_;
            if (at_end()) {
                fail(pos_, "", "expected a segment after '.'");
            }

            const char c = text_[pos_];
            if (c == '.') {
                fail(pos_, fragment(seg_start, 1), "empty segment");
            } else if (c == '[') {
                parse_wildcard(result);
            } else if (c == '(') {
                parse_parenthesized(result);
            } else if (is_quote(c)) {
                result.segments.emplace_back(Literal{scan_quoted()});
            } else {
                result.segments.emplace_back(Literal{scan_bare_name()});
            }

            if (at_end()) {
                break;
            }
            if (result.instruction) {
                fail(instruction_pos_, fragment(instruction_pos_, pos_ - instruction_pos_),
                     "merge instruction must be the last segment");
            }
            if (text_[pos_] != '.') {
                fail(pos_, fragment(pos_, 1), "expected '.' between segments");
            }
            ++pos_;
        }
        return result;
    }

private:
    const std::string& text_;
    std::size_t pos_ = 0;
    std::size_t instruction_pos_ = 0;

    bool at_end() const { return pos_ >= text_.size(); }

    std::string fragment(std::size_t start, std::size_t len) const {
        return text_.substr(start, len);
    }

    [[noreturn]] void fail(std::size_t pos, const std::string& frag, const std::string& reason) const {
        throw SelectorSyntaxError(text_, pos, frag, reason);
    }

    [[noreturn]] void fail_instruction(std::size_t pos, const std::string& frag,
                                       const std::string& reason) const {
        throw MergeInstructionError(text_, pos, frag, reason);
    }

    void parse_wildcard(Selector& result) {
        const std::size_t start = pos_;
        if (pos_ + 1 >= text_.size() || text_[pos_ + 1] != ']') {
            fail(start, fragment(start, 2), "expected '[]'");
        }
        pos_ += 2;
        result.segments.emplace_back(Wildcard{});
    }

    /// Reads a quoted name starting at pos_; pos_ ends after the closing quote.
    std::string scan_quoted() {
        const std::size_t start = pos_;
        const char q = text_[pos_];
        const std::size_t end = text_.find(q, pos_ + 1);
        if (end == std::string::npos) {
            fail(start, fragment(start, text_.size() - start), "unterminated quote");
        }
        pos_ = end + 1;
        std::string name = text_.substr(start + 1, end - start - 1);
        if (name.empty()) {
            fail(start, fragment(start, 2), "empty name");
        }
        return name;
    }

    std::string scan_bare_name() {
        const std::size_t start = pos_;
        while (!at_end() && text_[pos_] != '.') {
            const char c = text_[pos_];
            if (c == '(' || c == ')' || c == '[' || c == ']') {
                fail(pos_, fragment(pos_, 1),
                     std::string("unexpected '") + c + "' in name (quote the name to use it)");
            }
            ++pos_;
        }
        return text_.substr(start, pos_ - start);
    }

    /// Finds the ')' closing the '(' at pos_, skipping quoted text.
    std::size_t find_close_paren() const {
        const std::size_t open = pos_;
        std::size_t i = open + 1;
        while (i < text_.size()) {
            const char c = text_[i];
            if (is_quote(c)) {
                const std::size_t end = text_.find(c, i + 1);
                if (end == std::string::npos) {
                    fail(i, fragment(i, text_.size() - i), "unterminated quote");
                }
                i = end + 1;
                continue;
            }
            if (c == ')') {
                return i;
            }
            if (c == '(') {
                fail(i, fragment(i, 1), "nested '(' is not allowed");
            }
            ++i;
        }
        fail(open, fragment(open, text_.size() - open), "unterminated '('");
    }

    void parse_parenthesized(Selector& result) {
        const std::size_t open = pos_;
        const std::size_t close = find_close_paren();
        const std::size_t inner_start = open + 1;
        const std::string inner = text_.substr(inner_start, close - inner_start);
        pos_ = close + 1;

        if (std::all_of(inner.begin(), inner.end(), is_space)) {
            fail(open, fragment(open, close - open + 1), "empty parentheses");
        }

        if (has_unquoted(inner, '|')) {
            result.segments.emplace_back(parse_group(inner_start, close));
            return;
        }

        std::vector<Token> tokens = tokenize(inner_start, close);
        if (tokens.size() == 2 && tokens[0].kind == Token::Kind::Quoted && tokens[0].text.empty()) {
            fail(tokens[0].pos, fragment(tokens[0].pos, 2), "empty name");
        }
        if (tokens.size() == 2 && is_operand(tokens[0])) {
            // A single name: one-alternative group
            result.segments.emplace_back(Group{{tokens[0].text}});
            return;
        }

        instruction_pos_ = open;
        result.instruction = parse_instruction(tokens, open, close);
    }

    static bool has_unquoted(const std::string& s, char wanted) {
        char quote = 0;
        for (char c : s) {
            if (quote) {
                if (c == quote) quote = 0;
            } else if (is_quote(c)) {
                quote = c;
            } else if (c == wanted) {
                return true;
            }
        }
        return false;
    }

    Group parse_group(std::size_t begin, std::size_t end) {
        Group group;
        std::size_t alt_start = begin;
        std::size_t i = begin;
        while (i <= end) {
            if (i < end && is_quote(text_[i])) {
                i = text_.find(text_[i], i + 1) + 1;
                continue;
            }
            if (i == end || text_[i] == '|') {
                std::string alt = parse_alternative(alt_start, i);
                if (std::find(group.alternatives.begin(), group.alternatives.end(), alt) ==
                    group.alternatives.end()) {
                    group.alternatives.push_back(std::move(alt));
                }
                alt_start = i + 1;
            }
            ++i;
        }
        return group;
    }

    std::string parse_alternative(std::size_t begin, std::size_t end) {
        std::vector<Token> tokens = tokenize(begin, end);
        if (tokens.size() == 1) {
            fail(begin, fragment(begin, end - begin), "empty alternative in group");
        }
        if (tokens.size() != 2 || !tokens[0].is_name()) {
            fail(begin, fragment(begin, end - begin), "group alternatives must be single names");
        }
        if (tokens[0].text.empty()) {
            fail(tokens[0].pos, fragment(tokens[0].pos, 2), "empty alternative in group");
        }
        return tokens[0].text;
    }

    /// Splits text_[begin, end) into instruction tokens, terminated by End.
    std::vector<Token> tokenize(std::size_t begin, std::size_t end) const {
        std::vector<Token> tokens;
        std::size_t i = begin;
        while (i < end) {
            const char c = text_[i];
            if (is_space(c)) {
                ++i;
            } else if (c == '=') {
                tokens.push_back({Token::Kind::Equal, "=", i});
                ++i;
            } else if (c == ',') {
                tokens.push_back({Token::Kind::Comma, ",", i});
                ++i;
            } else if (is_quote(c)) {
                const std::size_t close = text_.find(c, i + 1);
                if (close == std::string::npos || close >= end) {
                    fail(i, fragment(i, end - i), "unterminated quote");
                }
                tokens.push_back({Token::Kind::Quoted, text_.substr(i + 1, close - i - 1), i});
                i = close + 1;
            } else {
                const std::size_t start = i;
                while (i < end && !is_space(text_[i]) && text_[i] != '=' && text_[i] != ',' &&
                       !is_quote(text_[i])) {
                    ++i;
                }
                tokens.push_back({Token::Kind::Word, text_.substr(start, i - start), start});
            }
        }
        tokens.push_back({Token::Kind::End, "", end});
        return tokens;
    }

    MergeInstruction parse_instruction(const std::vector<Token>& tokens,
                                       std::size_t open, std::size_t close) {
        const bool keyed = std::any_of(tokens.begin(), tokens.end(), [](const Token& t) {
            return t.kind == Token::Kind::Equal;
        });
        if (keyed) {
            return parse_keyed_update(tokens, open, close);
        }
        return parse_direct_assign(tokens);
    }

    /// A name operand: a non-empty quoted word, or a bare word other than a keyword.
    static bool is_operand(const Token& t) {
        return (t.kind == Token::Kind::Quoted && !t.text.empty()) ||
               (t.kind == Token::Kind::Word && t.text != "on" && t.text != "from");
    }

    /// A target value may also be the empty string, written "" or ''.
    static bool is_target(const Token& t) {
        return is_operand(t) || t.kind == Token::Kind::Quoted;
    }

    KeyedUpdate parse_keyed_update(const std::vector<Token>& tokens,
                                   std::size_t open, std::size_t close) {
        const std::string whole = fragment(open, close - open + 1);
        std::size_t i = 0;
        KeyedUpdate ku;

        if (!is_operand(tokens[i])) {
            fail_instruction(tokens[i].pos, whole, "missing key field before '='");
        }
        ku.key_field = tokens[i++].text;

        if (tokens[i].kind != Token::Kind::Equal) {
            fail_instruction(tokens[i].pos, tokens[i].text, "expected '=' after key field");
        }
        ++i;

        if (!is_target(tokens[i])) {
            fail_instruction(tokens[i].pos, whole, "missing target value after '='");
        }
        ku.target_value = tokens[i++].text;

        if (!tokens[i].is_keyword("on")) {
            fail_instruction(tokens[i].pos, tokens[i].kind == Token::Kind::End ? whole : tokens[i].text,
                             "missing 'on'");
        }
        ++i;

        if (!is_operand(tokens[i])) {
            fail_instruction(tokens[i].pos, whole, "missing value field after 'on'");
        }
        ku.value_field = tokens[i++].text;

        if (!tokens[i].is_keyword("from")) {
            fail_instruction(tokens[i].pos, tokens[i].kind == Token::Kind::End ? whole : tokens[i].text,
                             "missing 'from'");
        }
        ++i;

        if (!is_operand(tokens[i])) {
            fail_instruction(tokens[i].pos, whole, "missing source key after 'from'");
        }
        ku.source_key = tokens[i++].text;

        if (tokens[i].kind != Token::Kind::End) {
            fail_instruction(tokens[i].pos, tokens[i].text, "unexpected token in merge instruction");
        }
        return ku;
    }

    DirectAssign parse_direct_assign(const std::vector<Token>& tokens) {
        struct Item {
            std::string dest;
            std::optional<std::string> source;
        };
        std::vector<Item> items;
        std::size_t i = 0;

        while (true) {
            if (!is_operand(tokens[i])) {
                fail_instruction(tokens[i].pos, tokens[i].text, "missing field name");
            }
            Item item{tokens[i++].text, std::nullopt};

            if (tokens[i].is_keyword("from")) {
                ++i;
                if (!is_operand(tokens[i])) {
                    fail_instruction(tokens[i].pos, tokens[i].text, "missing source key after 'from'");
                }
                item.source = tokens[i++].text;
            }
            items.push_back(std::move(item));

            if (tokens[i].kind == Token::Kind::Comma) {
                ++i;
                continue;
            }
            if (tokens[i].kind == Token::Kind::End) {
                break;
            }
            if (!items.back().source && tokens[i].is_name()) {
                fail_instruction(tokens[i].pos, tokens[i].text, "missing 'from'");
            }
            fail_instruction(tokens[i].pos, tokens[i].text, "unexpected token in merge instruction");
        }

        if (!items.back().source) {
            fail_instruction(tokens[i].pos, "", "missing 'from'");
        }

        // Fields without their own source take the next source to their right.
        std::string pending = *items.back().source;
        for (auto it = items.rbegin(); it != items.rend(); ++it) {
            if (it->source) {
                pending = *it->source;
            } else {
                it->source = pending;
            }
        }

        DirectAssign da;
        for (auto& item : items) {
            da.fields.push_back({std::move(item.dest), std::move(*item.source)});
        }
        return da;
    }
};

// ============================================================================
// Rendering
// ============================================================================

bool needs_quotes(const std::string& name, bool in_instruction) {
    if (name.empty() || is_quote(name.front())) {
        return true;
    }
    for (char c : name) {
        if (c == '.' || c == '(' || c == ')' || c == '[' || c == ']' || c == '|') {
            return true;
        }
        if (in_instruction && (is_space(c) || c == '=' || c == ',')) {
            return true;
        }
    }
    return in_instruction && (name == "on" || name == "from");
}

std::string render_name(const std::string& name, bool in_instruction) {
    if (!needs_quotes(name, in_instruction)) {
        return name;
    }
    const bool has_double = name.find('"') != std::string::npos;
    if (has_double && name.find('\'') != std::string::npos) {
        throw std::invalid_argument("name cannot be quoted, it contains both quote characters: " +
                                    name);
    }
    const char q = has_double ? '\'' : '"';
    return q + name + q;
}

} // anonymous namespace

Selector parse_selector(const std::string& text) {
    return SelectorParser(text).parse();
}

std::string to_string(const PathSegment& segment) {
    if (const auto* lit = std::get_if<Literal>(&segment)) {
        return render_name(lit->name, false);
    }
    if (const auto* group = std::get_if<Group>(&segment)) {
        std::string out = "(";
        for (std::size_t i = 0; i < group->alternatives.size(); ++i) {
            if (i > 0) out += '|';
            out += render_name(group->alternatives[i], true);
        }
        return out + ")";
    }
    return "[]";
}

std::string to_string(const MergeInstruction& instruction) {
    std::ostringstream out;
    out << '(';
    if (const auto* ku = std::get_if<KeyedUpdate>(&instruction)) {
        out << render_name(ku->key_field, true) << '=' << render_name(ku->target_value, true)
            << " on " << render_name(ku->value_field, true)
            << " from " << render_name(ku->source_key, true);
    } else {
        const auto& fields = std::get<DirectAssign>(instruction).fields;
        for (std::size_t i = 0; i < fields.size(); ++i) {
            if (i > 0) out << ", ";
            out << render_name(fields[i].dest_field, true);
            const bool last_of_run = i + 1 == fields.size() ||
                                     fields[i + 1].source_key != fields[i].source_key;
            if (last_of_run) {
                out << " from " << render_name(fields[i].source_key, true);
            }
        }
    }
    out << ')';
    return out.str();
}

std::string to_string(const Selector& selector) {
    std::string out;
    for (const auto& seg : selector.segments) {
        if (!out.empty()) out += '.';
        out += to_string(seg);
    }
    if (selector.instruction) {
        if (!out.empty()) out += '.';
        out += to_string(*selector.instruction);
    }
    return out;
}

} // namespace graft
