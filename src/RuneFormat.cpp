/**
 * @file RuneFormat.cpp
 * @brief Section-based record format: hand-written reader and writer
 *
 * Line forms, after the `#!RUNE` shebang and `#` comments are dropped:
 *
 * | Line              | Meaning                                        |
 * |-------------------|------------------------------------------------|
 * | `@a/b`            | start section a.b (nested maps)                |
 * | `key = value`     | typed entry                                    |
 * | `key:`            | start a series; indented `- item` lines follow |
 * | `key {` ... `}`   | map block of `k = v` lines                     |
 * | `+ key = value`   | start a record (list under "record")           |
 * | `key >`           | multi-line string, ended by a blank line       |
 *
 * Values: `"quoted"` strings, `(a b c)` inline lists, `{k = v, ...}`
 * inline maps, `$NAME$` environment lookups, else parse_scalar().
 */

#include "graft/Errors.hpp"
#include "graft/Format.hpp"
#include "graft/Parse.hpp"
#include "graft/Util.hpp"

#include <cstdlib>
#include <sstream>

namespace graft {

namespace {

// ============================================================================
// Values
// ============================================================================

bool is_quoted(const std::string& s) {
    return s.size() >= 2 && s.front() == '"' && s.back() == '"';
}

bool is_env_ref(const std::string& s) {
    return s.size() >= 2 && s.front() == '$' && s.back() == '$';
}

Node env_value(const std::string& ref) {
    const char* value = std::getenv(ref.substr(1, ref.size() - 2).c_str());
    return Node(value ? std::string(value) : std::string());
}

Node parse_atom(const std::string& raw) {
    if (is_quoted(raw)) {
        return Node(raw.substr(1, raw.size() - 2));
    }
    if (is_env_ref(raw)) {
        return env_value(raw);
    }
    return Node(parse_scalar(raw));
}

// Splits on commas outside double quotes.
std::vector<std::string> split_items(const std::string& s) {
    std::vector<std::string> items;
    std::string current;
    bool quoted = false;
    for (char c : s) {
        if (c == '"') {
            quoted = !quoted;
        }
        if (c == ',' && !quoted) {
            items.push_back(trim(current));
            current.clear();
        } else {
            current += c;
        }
    }
    if (!trim(current).empty()) {
        items.push_back(trim(current));
    }
    return items;
}

Node parse_rune_value(const std::string& raw, std::size_t line_no);

Map parse_inline_map(const std::string& body, std::size_t line_no) {
    Map map;
    for (const auto& item : split_items(body)) {
        const auto eq = item.find('=');
        if (eq == std::string::npos || trim(item.substr(0, eq)).empty()) {
            throw FormatParseError("rune", "line " + std::to_string(line_no) +
                                               ": expected 'key = value' in inline map, got '" + item + "'");
        }
        map.insert_or_assign(trim(item.substr(0, eq)), parse_rune_value(trim(item.substr(eq + 1)), line_no));
    }
    return map;
}

Node parse_rune_value(const std::string& raw, std::size_t line_no) {
    if (raw.size() >= 2 && raw.front() == '(' && raw.back() == ')') {
        List items;
        std::istringstream in(raw.substr(1, raw.size() - 2));
        std::string token;
        while (in >> token) {
            items.push_back(parse_atom(token));
        }
        return Node(std::move(items));
    }
    if (raw.size() >= 2 && raw.front() == '{' && raw.back() == '}') {
        return Node(parse_inline_map(raw.substr(1, raw.size() - 2), line_no));
    }
    return parse_atom(raw);
}

// ============================================================================
// Reader
// ============================================================================

class RuneReader {
public:
    explicit RuneReader(const std::string& text) : text_(text) {}

    Node read() {
        std::istringstream in(text_);
        std::string raw;
        while (std::getline(in, raw)) {
            ++line_no_;
            if (!raw.empty() && raw.back() == '\r') {
                raw.pop_back();
            }
            line(raw);
        }
        finish_multiline();
        if (block_) {
            fail("unterminated block '" + block_key_ + "'");
        }
        return std::move(tree_);
    }

private:
    struct Series {
        std::size_t indent;
        Node* list;
    };

    [[noreturn]] void fail(const std::string& message) const {
        throw FormatParseError("rune", "line " + std::to_string(line_no_) + ": " + message);
    }

    void line(const std::string& raw) {
        const std::string t = trim(raw);

        if (!multiline_key_.empty()) {
            if (t.empty()) {
                finish_multiline();
            } else {
                multiline_.push_back(t);
            }
            return;
        }
        if (t.empty() || t.front() == '#') {
            return;
        }
        if (block_) {
            block_line(t);
            return;
        }
        if (t.front() == '@') {
            section(t.substr(1));
            return;
        }
        if (!section_) {
            fail("entry outside of a section: '" + t + "'");
        }

        const std::size_t indent = raw.find_first_not_of(" \t");
        const bool has_eq = t.find('=') != std::string::npos;

        if (t.front() == '-' && !series_.empty() && indent > series_.front().indent) {
            series_item(indent, trim(t.substr(1)));
            return;
        }
        if (!has_eq && t.back() == ':') {
            series_start(indent, trim(t.substr(0, t.size() - 1)));
            return;
        }

        // Any other line ends the open series; the pointers in series_
        // must not outlive a write to the section map.
        series_.clear();

        if (t.front() == '+') {
            start_record();
            const std::string rest = trim(t.substr(1));
            if (!rest.empty()) {
                entry(rest);
            }
            return;
        }
        if (!has_eq && t.back() == '{') {
            block_ = true;
            block_key_ = trim(t.substr(0, t.size() - 1));
            block_map_ = Map();
            if (block_key_.empty()) {
                fail("block without a name");
            }
            return;
        }
        if (!has_eq && t.back() == '>') {
            multiline_key_ = trim(t.substr(0, t.size() - 1));
            if (multiline_key_.empty()) {
                fail("multi-line value without a name");
            }
            return;
        }
        if (has_eq) {
            entry(t);
            return;
        }
        fail("unrecognized line '" + t + "'");
    }

    void section(const std::string& path) {
        finish_multiline();
        series_.clear();
        record_ = false;

        Node* current = &tree_;
        for (const auto& piece : split_keep_empty(path, '/')) {
            const std::string name = trim(piece);
            if (name.empty()) {
                fail("empty section name in '@" + path + "'");
            }
            Node* next = current->as_map().find(name);
            if (!next) {
                next = &current->as_map().insert_or_assign(name, Node::map());
            } else if (!next->is_map()) {
                fail("section '" + name + "' clashes with an entry");
            }
            current = next;
        }
        section_ = current;
    }

    void entry(const std::string& t) {
        const auto eq = t.find('=');
        const std::string key = trim(t.substr(0, eq));
        if (key.empty()) {
            fail("entry without a key: '" + t + "'");
        }
        target().insert_or_assign(key, parse_rune_value(trim(t.substr(eq + 1)), line_no_));
    }

    void series_start(std::size_t indent, const std::string& key) {
        if (key.empty()) {
            fail("series without a name");
        }
        while (!series_.empty() && indent <= series_.back().indent) {
            series_.pop_back();
        }
        if (series_.empty()) {
            Node& list = target().insert_or_assign(key, List{});
            series_.push_back(Series{indent, &list});
            return;
        }
        // Nested series: a one-key map element holding its own list.
        List& parent = series_.back().list->as_list();
        parent.push_back(Node::map({{key, List{}}}));
        series_.push_back(Series{indent, &parent.back().as_map().at(key)});
    }

    void series_item(std::size_t indent, const std::string& text) {
        while (series_.size() > 1 && indent <= series_.back().indent) {
            series_.pop_back();
        }
        series_.back().list->as_list().push_back(parse_rune_value(text, line_no_));
    }

    void start_record() {
        Node* records = section_->as_map().find("record");
        if (!records) {
            records = &section_->as_map().insert_or_assign("record", List{});
        } else if (!records->is_list()) {
            fail("'record' is already an entry of this section");
        }
        records->as_list().push_back(Node::map());
        record_ = true;
    }

    void block_line(const std::string& t) {
        if (t == "}") {
            target().insert_or_assign(block_key_, Node(std::move(block_map_)));
            block_ = false;
            return;
        }
        const auto eq = t.find('=');
        if (eq == std::string::npos || trim(t.substr(0, eq)).empty()) {
            fail("expected 'key = value' in block '" + block_key_ + "'");
        }
        block_map_.insert_or_assign(trim(t.substr(0, eq)), parse_rune_value(trim(t.substr(eq + 1)), line_no_));
    }

    void finish_multiline() {
        if (multiline_key_.empty()) {
            return;
        }
        std::string joined;
        for (std::size_t i = 0; i < multiline_.size(); ++i) {
            if (i > 0) joined += '\n';
            joined += multiline_[i];
        }
        target().insert_or_assign(multiline_key_, Node(joined));
        multiline_key_.clear();
        multiline_.clear();
    }

    Map& target() {
        if (record_) {
            return section_->as_map().at("record").as_list().back().as_map();
        }
        return section_->as_map();
    }

    static std::vector<std::string> split_keep_empty(const std::string& s, char delim) {
        std::vector<std::string> parts;
        std::string current;
        for (char c : s) {
            if (c == delim) {
                parts.push_back(current);
                current.clear();
            } else {
                current += c;
            }
        }
        parts.push_back(current);
        return parts;
    }

    const std::string& text_;
    std::size_t line_no_ = 0;

    Node tree_ = Node::map();

    Node* section_ = nullptr;
    bool record_ = false;
    std::vector<Series> series_;

    bool block_ = false;
    std::string block_key_;
    Map block_map_;

    std::string multiline_key_;
    std::vector<std::string> multiline_;
};

// ============================================================================
// Writer
// ============================================================================

class RuneWriter {
public:
    std::string write(const Node& root) {
        out_ << "#!RUNE\n";
        if (!root.is_map()) {
            throw GraftError("rune output needs a map at the root, got " + kind_name(root));
        }
        const Map& map = root.as_map();
        for (std::size_t i = 0; i < map.size(); ++i) {
            if (!map.value_at(i).is_map()) {
                throw GraftError("rune output: top-level entry '" + map.key_at(i) +
                                 "' must be inside a section");
            }
        }
        section(map, "");
        return out_.str();
    }

private:
    static bool is_records(const std::string& key, const Node& value) {
        if (key != "record" || !value.is_list() || value.as_list().empty()) {
            return false;
        }
        for (const auto& item : value.as_list()) {
            if (!item.is_map()) return false;
        }
        return true;
    }

    static void check_key(const std::string& key) {
        const bool bad_edge = key.empty() || key.front() == '@' || key.front() == '+' ||
                              key.front() == '-' || key.front() == '#' || key.back() == ':' ||
                              key.back() == '{' || key.back() == '>';
        if (bad_edge || key.find_first_of("=\n/") != std::string::npos || trim(key) != key) {
            throw GraftError("rune output: cannot write key '" + key + "'");
        }
    }

    static std::string render(const Scalar& s, bool in_list) {
        switch (s.kind()) {
            case ScalarKind::Null:
            case ScalarKind::Boolean:
            case ScalarKind::Integer:
                return s.to_string();
            case ScalarKind::Float:
                return float_text(s.as_float());
            case ScalarKind::String:
                break;
        }
        const std::string& text = s.as_string();
        if (text.find('\n') != std::string::npos) {
            throw GraftError("rune output: multi-line string not allowed here");
        }
        const bool plain = !text.empty() && trim(text) == text && parse_scalar(text).is_string() &&
                           std::string("\"($${").find(text.front()) == std::string::npos &&
                           (!in_list || text.find_first_of(", \t)}\"") == std::string::npos);
        if (plain) {
            return text;
        }
        if (text.find('"') != std::string::npos || (in_list && text.find_first_of(" \t") != std::string::npos)) {
            throw GraftError("rune output: cannot quote string '" + text + "'");
        }
        return "\"" + text + "\"";
    }

    // Value usable inside `{...}` or `(...)`.
    static std::string render_inline(const Node& value) {
        switch (value.kind()) {
            case NodeKind::Scalar:
                return render(value.scalar(), true);
            case NodeKind::List: {
                std::string text = "(";
                for (const auto& item : value.as_list()) {
                    if (!item.is_scalar()) {
                        throw GraftError("rune output: nested collection in inline list");
                    }
                    if (text.size() > 1) text += ' ';
                    text += render(item.scalar(), true);
                }
                return text + ")";
            }
            case NodeKind::Map: {
                std::string text = "{";
                const Map& map = value.as_map();
                for (std::size_t i = 0; i < map.size(); ++i) {
                    check_key(map.key_at(i));
                    if (map.value_at(i).is_map()) {
                        throw GraftError("rune output: nested map in inline map");
                    }
                    if (i > 0) text += ", ";
                    text += map.key_at(i) + " = " + render_inline(map.value_at(i));
                }
                return text + "}";
            }
        }
        return {};
    }

    void section(const Map& map, const std::string& path) {
        bool has_entries = false;
        for (std::size_t i = 0; i < map.size(); ++i) {
            has_entries = has_entries || !map.value_at(i).is_map();
        }

        if (!path.empty() && (has_entries || map.empty())) {
            out_ << "\n@" << path << "\n";
            const Node* records = nullptr;
            for (std::size_t i = 0; i < map.size(); ++i) {
                const std::string& key = map.key_at(i);
                const Node& value = map.value_at(i);
                if (value.is_map()) {
                    continue;
                }
                if (is_records(key, value)) {
                    records = &value;
                    continue;
                }
                entry(key, value, 0);
            }
            // Everything after a record line belongs to the record.
            if (records) {
                for (const auto& record : records->as_list()) {
                    write_record(record.as_map());
                }
            }
        }

        for (std::size_t i = 0; i < map.size(); ++i) {
            if (map.value_at(i).is_map()) {
                check_key(map.key_at(i));
                section(map.value_at(i).as_map(), path.empty() ? map.key_at(i) : path + "/" + map.key_at(i));
            }
        }
    }

    void write_record(const Map& record) {
        if (record.empty()) {
            out_ << "+\n";
            return;
        }
        for (std::size_t i = 0; i < record.size(); ++i) {
            if (i == 0 && record.value_at(i).is_scalar()) {
                check_key(record.key_at(i));
                out_ << "+ " << record.key_at(i) << " = " << render(record.value_at(i).scalar(), false) << "\n";
                continue;
            }
            if (i == 0) {
                out_ << "+\n";
            }
            entry(record.key_at(i), record.value_at(i), 2);
        }
    }

    void entry(const std::string& key, const Node& value, std::size_t indent) {
        check_key(key);
        const std::string pad(indent, ' ');
        switch (value.kind()) {
            case NodeKind::Scalar: {
                const Scalar& s = value.scalar();
                if (s.is_string() && s.as_string().find('\n') != std::string::npos) {
                    multiline(key, s.as_string(), pad);
                } else {
                    out_ << pad << key << " = " << render(s, false) << "\n";
                }
                break;
            }
            case NodeKind::List:
                out_ << pad << key << ":\n";
                series(value.as_list(), indent + 2);
                break;
            case NodeKind::Map: {
                out_ << pad << key << " {\n";
                const Map& map = value.as_map();
                for (std::size_t i = 0; i < map.size(); ++i) {
                    check_key(map.key_at(i));
                    out_ << pad << "  " << map.key_at(i) << " = " << render_inline(map.value_at(i)) << "\n";
                }
                out_ << pad << "}\n";
                break;
            }
        }
    }

    void multiline(const std::string& key, const std::string& text, const std::string& pad) {
        std::istringstream in(text);
        std::string line;
        std::vector<std::string> lines;
        while (std::getline(in, line)) {
            if (trim(line).empty() || trim(line) != line) {
                throw GraftError("rune output: cannot write multi-line value of '" + key + "'");
            }
            lines.push_back(line);
        }
        out_ << pad << key << " >\n";
        for (const auto& l : lines) {
            out_ << pad << "  " << l << "\n";
        }
        out_ << "\n";
    }

    void series(const List& items, std::size_t indent) {
        const std::string pad(indent, ' ');
        for (const auto& item : items) {
            switch (item.kind()) {
                case NodeKind::Scalar:
                    out_ << pad << "- " << render(item.scalar(), false) << "\n";
                    break;
                case NodeKind::List:
                    throw GraftError("rune output: a list cannot hold a list directly");
                case NodeKind::Map: {
                    const Map& map = item.as_map();
                    if (map.size() == 1 && map.value_at(0).is_list()) {
                        check_key(map.key_at(0));
                        out_ << pad << map.key_at(0) << ":\n";
                        series(map.value_at(0).as_list(), indent + 2);
                    } else {
                        out_ << pad << "- " << render_inline(item) << "\n";
                    }
                    break;
                }
            }
        }
    }

    std::ostringstream out_;
};

} // anonymous namespace

Node RuneFormat::parse(const std::string& text) const {
    return RuneReader(text).read();
}

std::string RuneFormat::serialize(const Node& root) const {
    return RuneWriter().write(root);
}

} // namespace graft
