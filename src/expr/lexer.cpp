#include <pipit/expr/lexer.hpp>

#include <cctype>
#include <string>
#include <unordered_map>

namespace pipit::expr {

auto tokenize(std::string_view source) -> std::vector<Token> {
    std::vector<Token> tokens;

    const auto add_token = [&](TokenKind kind, std::size_t start, std::size_t length) {
        tokens.push_back(Token{
            .kind = kind,
            .lexeme = source.substr(start, length),
            .column = start + 1,
        });
    };

    const std::unordered_map<std::string, TokenKind> keywords = {
        {"true", TokenKind::KeywordTrue}, {"false", TokenKind::KeywordFalse},
        {"null", TokenKind::KeywordNull}, {"and", TokenKind::KeywordAnd},
        {"or", TokenKind::KeywordOr},     {"not", TokenKind::KeywordNot},
        {"is", TokenKind::KeywordIs},
    };

    const auto is_ident_start = [](unsigned char ch) -> bool {
        return std::isalpha(ch) != 0 || ch == '_';
    };
    const auto is_ident_cont = [](unsigned char ch) -> bool {
        return std::isalnum(ch) != 0 || ch == '_';
    };
    const auto is_digit = [](char ch) -> bool {
        return std::isdigit(static_cast<unsigned char>(ch)) != 0;
    };

    std::size_t i = 0;

    const auto at_end = [&]() -> bool { return i >= source.size(); };
    const auto peek = [&](std::size_t offset = 0) -> char {
        if (i + offset >= source.size()) {
            return '\0';
        }
        return source[i + offset];
    };
    const auto advance = [&]() -> char {
        if (at_end()) {
            return '\0';
        }
        return source[i++];
    };
    const auto match = [&](char expected) -> bool {
        if (peek() != expected) {
            return false;
        }
        advance();
        return true;
    };

    while (!at_end()) {
        char ch = peek();
        if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n') {
            advance();
            continue;
        }

        std::size_t start = i;
        ch = advance();

        if (is_ident_start(static_cast<unsigned char>(ch))) {
            while (is_ident_cont(static_cast<unsigned char>(peek()))) {
                advance();
            }
            std::string lowered(source.substr(start, i - start));
            for (auto& c : lowered) {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            if (auto it = keywords.find(lowered); it != keywords.end()) {
                add_token(it->second, start, i - start);
            } else {
                add_token(TokenKind::Identifier, start, i - start);
            }
            continue;
        }

        if (is_digit(ch) || (ch == '.' && is_digit(peek()))) {
            while (is_digit(peek())) {
                advance();
            }
            if (ch != '.' && peek() == '.' && is_digit(peek(1))) {
                advance();
                while (is_digit(peek())) {
                    advance();
                }
            }
            if ((peek() == 'e' || peek() == 'E') &&
                (is_digit(peek(1)) || ((peek(1) == '+' || peek(1) == '-') && is_digit(peek(2))))) {
                advance();
                if (peek() == '+' || peek() == '-') {
                    advance();
                }
                while (is_digit(peek())) {
                    advance();
                }
            }
            if (is_ident_start(static_cast<unsigned char>(peek()))) {
                while (is_ident_cont(static_cast<unsigned char>(peek()))) {
                    advance();
                }
                add_token(TokenKind::Error, start, i - start);
                continue;
            }
            add_token(TokenKind::NumberLiteral, start, i - start);
            continue;
        }

        switch (ch) {
            case '"':
            case '\'':
            case '`': {
                const char quote = ch;
                while (!at_end() && peek() != quote) {
                    if (peek() == '\\' && peek(1) != '\0') {
                        advance();
                    }
                    advance();
                }
                if (at_end()) {
                    add_token(TokenKind::Error, start, i - start);
                    continue;
                }
                advance();
                add_token(quote == '`' ? TokenKind::QuotedIdentifier : TokenKind::StringLiteral,
                          start, i - start);
                continue;
            }
            case '+':
                add_token(TokenKind::Plus, start, 1);
                continue;
            case '-':
                add_token(TokenKind::Minus, start, 1);
                continue;
            case '*':
                add_token(TokenKind::Star, start, 1);
                continue;
            case '/':
                add_token(TokenKind::Slash, start, 1);
                continue;
            case '%':
                add_token(TokenKind::Percent, start, 1);
                continue;
            case '!':
                if (match('=')) {
                    match('=');
                    add_token(TokenKind::BangEq, start, i - start);
                } else {
                    add_token(TokenKind::Bang, start, 1);
                }
                continue;
            case '=':
                if (match('=')) {
                    match('=');
                    add_token(TokenKind::EqEq, start, i - start);
                } else {
                    add_token(TokenKind::Eq, start, 1);
                }
                continue;
            case '<':
                if (match('=')) {
                    add_token(TokenKind::Le, start, 2);
                } else if (match('>')) {
                    add_token(TokenKind::LtGt, start, 2);
                } else {
                    add_token(TokenKind::Lt, start, 1);
                }
                continue;
            case '>':
                if (match('=')) {
                    add_token(TokenKind::Ge, start, 2);
                } else {
                    add_token(TokenKind::Gt, start, 1);
                }
                continue;
            case '&':
                if (match('&')) {
                    add_token(TokenKind::AmpAmp, start, 2);
                } else {
                    add_token(TokenKind::Error, start, 1);
                }
                continue;
            case '|':
                if (match('|')) {
                    add_token(TokenKind::PipePipe, start, 2);
                } else {
                    add_token(TokenKind::Error, start, 1);
                }
                continue;
            case '?':
                add_token(TokenKind::Question, start, 1);
                continue;
            case ':':
                add_token(TokenKind::Colon, start, 1);
                continue;
            case '(':
                add_token(TokenKind::LParen, start, 1);
                continue;
            case ')':
                add_token(TokenKind::RParen, start, 1);
                continue;
            case ',':
                add_token(TokenKind::Comma, start, 1);
                continue;
            case '.':
                add_token(TokenKind::Dot, start, 1);
                continue;
            default:
                add_token(TokenKind::Error, start, 1);
                continue;
        }
    }

    tokens.push_back(Token{
        .kind = TokenKind::Eof,
        .lexeme = source.substr(source.size(), 0),
        .column = source.size() + 1,
    });
    return tokens;
}

}  // namespace pipit::expr
