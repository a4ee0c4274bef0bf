// SPDX-License-Identifier: MIT

#include "bulkload/expression.hpp"
#include "bulkload/error.hpp"
#include "bulkload/value.hpp"
#include <cctype>
#include <charconv>
#include <string>

namespace bulkload {

const rapidjson::Value* Scope::find(std::string_view name) const {
    if (name == "row" && row_) return row_;
    if (!message_.IsObject()) return nullptr;
    auto it = message_.FindMember(
        rapidjson::Value(rapidjson::StringRef(name.data(), name.size())));
    return it == message_.MemberEnd() ? nullptr : &it->value;
}

namespace {

// Result of evaluating a term: a reference into the scope or an owned value
struct Operand {
    const rapidjson::Value* ref = nullptr;
    std::optional<rapidjson::Document> owned;

    const rapidjson::Value* get() const { return owned ? &*owned : ref; }
    bool defined() const { return get() != nullptr; }
};

bool is_name_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

Operand owned_string(std::string_view s) {
    Operand op;
    op.owned.emplace();
    op.owned->SetString(s.data(), static_cast<rapidjson::SizeType>(s.size()),
                        op.owned->GetAllocator());
    return op;
}

class Parser {
public:
    Parser(std::string_view text, const Scope& scope) : text_(text), scope_(scope) {}

    Operand parse() {
        skip_ws();
        if (at_end()) fail("empty expression");
        auto result = parse_expression();
        skip_ws();
        if (!at_end()) fail("unexpected '" + std::string(1, peek()) + "'");
        return result;
    }

private:
    Operand parse_expression() {
        auto first = parse_term();
        skip_ws();
        if (peek() != '&') return first;

        std::string joined = string_form(first);
        while (consume('&')) {
            joined += string_form(parse_term());
            skip_ws();
        }
        return owned_string(joined);
    }

    Operand parse_term() {
        skip_ws();
        if (at_end()) fail("unexpected end of expression");
        char c = peek();
        if (c == '\'' || c == '"') return parse_string(c);
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '-') return parse_number();
        if (c == '(') {
            ++pos_;
            auto inner = parse_expression();
            skip_ws();
            if (!consume(')')) fail("expected ')'");
            return inner;
        }
        if (is_name_start(c) || c == '`') return parse_path();
        fail("unexpected '" + std::string(1, c) + "'");
    }

    Operand parse_path() {
        auto start = pos_;
        auto name = parse_name();
        bool quoted = text_[start] == '`';

        Operand op;
        if (!quoted && (name == "true" || name == "false")) {
            op.owned.emplace();
            op.owned->SetBool(name == "true");
            return op;
        }
        if (!quoted && name == "null") {
            op.owned.emplace();
            return op;
        }

        const rapidjson::Value* cur = scope_.find(name);
        while (!at_end()) {
            if (peek() == '.') {
                ++pos_;
                auto key = parse_name();
                if (cur && cur->IsObject()) {
                    auto it = cur->FindMember(
                        rapidjson::Value(rapidjson::StringRef(key.data(), key.size())));
                    cur = it == cur->MemberEnd() ? nullptr : &it->value;
                } else {
                    cur = nullptr;
                }
            } else if (peek() == '[') {
                ++pos_;
                skip_ws();
                auto digits_start = pos_;
                while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
                if (digits_start == pos_) fail("expected array index");
                std::size_t index = 0;
                auto parsed =
                    std::from_chars(text_.data() + digits_start, text_.data() + pos_, index);
                if (parsed.ec != std::errc{}) fail("array index out of range");
                skip_ws();
                if (!consume(']')) fail("expected ']'");
                if (cur && cur->IsArray() && index < cur->Size()) {
                    cur = &(*cur)[static_cast<rapidjson::SizeType>(index)];
                } else {
                    cur = nullptr;
                }
            } else {
                break;
            }
        }
        op.ref = cur;
        return op;
    }

    std::string parse_name() {
        if (consume('`')) {
            auto end = text_.find('`', pos_);
            if (end == std::string_view::npos) fail("unterminated quoted name");
            std::string name(text_.substr(pos_, end - pos_));
            pos_ = end + 1;
            return name;
        }
        if (at_end() || !is_name_start(peek())) fail("expected name");
        auto start = pos_;
        while (!at_end() && is_name_char(peek())) ++pos_;
        return std::string(text_.substr(start, pos_ - start));
    }

    Operand parse_string(char quote) {
        ++pos_;
        std::string out;
        while (true) {
            if (at_end()) fail("unterminated string");
            char c = text_[pos_++];
            if (c == quote) break;
            if (c == '\\') {
                if (at_end()) fail("unterminated string");
                char e = text_[pos_++];
                switch (e) {
                    case 'n': out += '\n'; break;
                    case 't': out += '\t'; break;
                    case 'r': out += '\r'; break;
                    default: out += e; break;
                }
                continue;
            }
            out += c;
        }
        return owned_string(out);
    }

    Operand parse_number() {
        auto start = pos_;
        if (peek() == '-') ++pos_;
        bool integral = true;
        while (!at_end()) {
            char c = peek();
            if (std::isdigit(static_cast<unsigned char>(c))) {
                ++pos_;
            } else if (c == '.' || c == 'e' || c == 'E') {
                integral = false;
                ++pos_;
                if ((c == 'e' || c == 'E') && !at_end() && (peek() == '+' || peek() == '-')) ++pos_;
            } else {
                break;
            }
        }
        const char* first = text_.data() + start;
        const char* last = text_.data() + pos_;

        Operand op;
        op.owned.emplace();
        if (integral) {
            int64_t i = 0;
            auto [end, ec] = std::from_chars(first, last, i);
            if (ec == std::errc{} && end == last) {
                op.owned->SetInt64(i);
                return op;
            }
        }
        double d = 0;
        auto [end, ec] = std::from_chars(first, last, d);
        if (ec != std::errc{} || end != last) fail("malformed number");
        op.owned->SetDouble(d);
        return op;
    }

    static std::string string_form(const Operand& op) {
        if (!op.defined()) return "";
        return to_string(from_json(op.get()));
    }

    void skip_ws() {
        while (!at_end() && std::isspace(static_cast<unsigned char>(peek()))) ++pos_;
    }

    bool at_end() const { return pos_ >= text_.size(); }
    char peek() const { return at_end() ? '\0' : text_[pos_]; }

    bool consume(char c) {
        if (peek() != c) return false;
        ++pos_;
        return true;
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw BulkLoadError(ErrorCode::ExpressionError,
                            "Expression error at " + std::to_string(pos_) + ": " + what +
                                " in '" + std::string(text_) + "'");
    }

    std::string_view text_;
    const Scope& scope_;
    std::size_t pos_ = 0;
};

}  // namespace

std::optional<rapidjson::Document> PathExpressionEvaluator::evaluate(
        std::string_view expression, const Scope& scope) const {
    Parser parser(expression, scope);
    auto result = parser.parse();
    if (!result.defined()) return std::nullopt;
    if (result.owned) return std::move(result.owned);

    rapidjson::Document doc;
    doc.CopyFrom(*result.ref, doc.GetAllocator());
    return std::optional<rapidjson::Document>(std::move(doc));
}

}  // namespace bulkload
