#include "script-parser.h"

#include <fmt/format.h>

#include <algorithm>
#include <boost/lexical_cast.hpp>
#include <cctype>
#include <utility>
#include <vector>

#include "core/errors.h"

using boost::optional;
using std::string;
using std::vector;

namespace {

enum class TokenType {
    Identifier,
    String,
    // Digits, optionally negative and fractional, optionally followed by a unit such as "ms"
    Number,
    HexColor,
    LeftBrace,
    RightBrace,
    LeftParen,
    RightParen,
    Comma,
    Colon,
    Semicolon,
    Dot,
    Arrow,
    EndOfFile
};

struct Token {
    TokenType type;
    string text;
    // Number tokens only
    string unit;
    SourceLocation location;
};

string describe(const Token& token) {
    switch (token.type) {
        case TokenType::Identifier:
            return fmt::format("'{}'", token.text);
        case TokenType::String:
            return fmt::format("string \"{}\"", token.text);
        case TokenType::Number:
            return fmt::format("number '{}{}'", token.text, token.unit);
        case TokenType::HexColor:
            return fmt::format("color '#{}'", token.text);
        case TokenType::EndOfFile:
            return "end of file";
        default:
            return fmt::format("'{}'", token.text);
    }
}

bool isIdentifierStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

class Lexer {
public:
    explicit Lexer(const string& text) :
        text(text) {}

    vector<Token> tokenize() {
        vector<Token> tokens;
        while (true) {
            skipWhitespaceAndComments();
            const SourceLocation location{line, column};
            if (atEnd()) {
                tokens.push_back({TokenType::EndOfFile, "", "", location});
                return tokens;
            }
            tokens.push_back(readToken(location));
        }
    }

private:
    bool atEnd() const {
        return position >= text.size();
    }

    char peek(size_t offset = 0) const {
        return position + offset < text.size() ? text[position + offset] : '\0';
    }

    char advance() {
        const char c = text[position++];
        if (c == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
        return c;
    }

    void skipWhitespaceAndComments() {
        while (!atEnd()) {
            if (std::isspace(static_cast<unsigned char>(peek()))) {
                advance();
            } else if (peek() == '/' && peek(1) == '/') {
                while (!atEnd() && peek() != '\n') advance();
            } else {
                return;
            }
        }
    }

    Token readToken(SourceLocation location) {
        const char c = peek();
        if (isIdentifierStart(c)) {
            string identifier;
            while (isIdentifierChar(peek())) identifier += advance();
            return {TokenType::Identifier, identifier, "", location};
        }
        if (isDigit(c) || (c == '-' && isDigit(peek(1)))) {
            return readNumber(location);
        }
        if (c == '"') {
            return readString(location);
        }
        if (c == '#') {
            return readHexColor(location);
        }
        if (c == '-' && peek(1) == '>') {
            advance();
            advance();
            return {TokenType::Arrow, "->", "", location};
        }

        advance();
        switch (c) {
            case '{':
                return {TokenType::LeftBrace, "{", "", location};
            case '}':
                return {TokenType::RightBrace, "}", "", location};
            case '(':
                return {TokenType::LeftParen, "(", "", location};
            case ')':
                return {TokenType::RightParen, ")", "", location};
            case ',':
                return {TokenType::Comma, ",", "", location};
            case ':':
                return {TokenType::Colon, ":", "", location};
            case ';':
                return {TokenType::Semicolon, ";", "", location};
            case '.':
                return {TokenType::Dot, ".", "", location};
            default:
                throw ParseError(
                    location.line, location.column, fmt::format("Unexpected character '{}'.", c)
                );
        }
    }

    Token readNumber(SourceLocation location) {
        string number;
        if (peek() == '-') number += advance();
        while (isDigit(peek())) number += advance();
        if (peek() == '.' && isDigit(peek(1))) {
            number += advance();
            while (isDigit(peek())) number += advance();
        }
        string unit;
        while (std::isalpha(static_cast<unsigned char>(peek()))) unit += advance();
        if (isIdentifierChar(peek())) {
            throw ParseError(location.line, location.column, "Malformed number.");
        }
        return {TokenType::Number, number, unit, location};
    }

    Token readString(SourceLocation location) {
        advance();
        string value;
        while (!atEnd() && peek() != '"') {
            if (peek() == '\n') {
                throw ParseError(location.line, location.column, "Unterminated string.");
            }
            value += advance();
        }
        if (atEnd()) {
            throw ParseError(location.line, location.column, "Unterminated string.");
        }
        advance();
        return {TokenType::String, value, "", location};
    }

    Token readHexColor(SourceLocation location) {
        advance();
        string digits;
        while (isIdentifierChar(peek())) digits += advance();
        const bool valid = digits.size() == 6
            && std::all_of(digits.begin(), digits.end(), [](char c) {
                   return std::isxdigit(static_cast<unsigned char>(c)) != 0;
               });
        if (!valid) {
            throw ParseError(
                location.line,
                location.column,
                fmt::format("Invalid hex color '#{}'. Expected 6 hex digits.", digits)
            );
        }
        return {TokenType::HexColor, digits, "", location};
    }

    const string& text;
    size_t position = 0;
    int line = 1;
    int column = 1;
};

class Parser {
public:
    explicit Parser(vector<Token> tokens) :
        tokens(std::move(tokens)) {}

    ScriptDocument parseDocument() {
        ScriptDocument document;
        while (peek().type != TokenType::EndOfFile) {
            const Token& keyword = peek();
            if (isKeyword(keyword, "camera")) {
                if (document.camera) {
                    fail(keyword, "Camera is declared more than once.");
                }
                document.camera = parseCamera();
            } else if (isKeyword(keyword, "scene")) {
                document.scenes.push_back(parseScene());
            } else if (isKeyword(keyword, "timeline")) {
                document.timelines.push_back(parseTimeline());
            } else {
                fail(
                    keyword,
                    fmt::format(
                        "Expected 'camera', 'scene' or 'timeline', got {}.", describe(keyword)
                    )
                );
            }
        }
        return document;
    }

private:
    const Token& peek(size_t offset = 0) const {
        const size_t index = std::min(position + offset, tokens.size() - 1);
        return tokens[index];
    }

    const Token& advance() {
        const Token& token = tokens[position];
        if (token.type != TokenType::EndOfFile) ++position;
        return token;
    }

    static bool isKeyword(const Token& token, const char* keyword) {
        return token.type == TokenType::Identifier && token.text == keyword;
    }

    [[noreturn]] static void fail(const Token& token, const string& message) {
        throw ParseError(token.location.line, token.location.column, message);
    }

    const Token& expect(TokenType type, const char* what) {
        const Token& token = peek();
        if (token.type != type) {
            fail(token, fmt::format("Expected {}, got {}.", what, describe(token)));
        }
        return advance();
    }

    void expectKeyword(const char* keyword) {
        const Token& token = peek();
        if (!isKeyword(token, keyword)) {
            fail(token, fmt::format("Expected '{}', got {}.", keyword, describe(token)));
        }
        advance();
    }

    bool accept(TokenType type) {
        if (peek().type != type) return false;
        advance();
        return true;
    }

    CameraDeclaration parseCamera() {
        CameraDeclaration camera;
        camera.location = advance().location;
        camera.properties = parsePropertyBlock();
        return camera;
    }

    SceneDeclaration parseScene() {
        SceneDeclaration scene;
        scene.location = advance().location;
        scene.name = expect(TokenType::String, "scene name").text;
        expect(TokenType::LeftBrace, "'{'");
        while (!accept(TokenType::RightBrace)) {
            const Token& token = peek();
            if (isKeyword(token, "duration") && peek(1).type == TokenType::Colon) {
                if (scene.duration) {
                    fail(
                        token,
                        fmt::format("Scene \"{}\" declares its duration twice.", scene.name)
                    );
                }
                advance();
                advance();
                scene.duration = parseTime();
                if (!accept(TokenType::Comma)) accept(TokenType::Semicolon);
            } else if (token.type == TokenType::Identifier) {
                scene.objects.push_back(parseObject());
            } else {
                fail(
                    token,
                    fmt::format("Expected object declaration or '}}', got {}.", describe(token))
                );
            }
        }
        return scene;
    }

    ObjectDeclaration parseObject() {
        ObjectDeclaration object;
        const Token& shape = advance();
        object.shape = shape.text;
        object.location = shape.location;
        object.id = expect(TokenType::String, "object id").text;
        object.properties = parsePropertyBlock();
        return object;
    }

    vector<PropertyDeclaration> parsePropertyBlock() {
        vector<PropertyDeclaration> properties;
        expect(TokenType::LeftBrace, "'{'");
        while (!accept(TokenType::RightBrace)) {
            properties.push_back(parseProperty());
            if (!accept(TokenType::Comma)) {
                expect(TokenType::RightBrace, "',' or '}'");
                break;
            }
        }
        return properties;
    }

    PropertyDeclaration parseProperty() {
        PropertyDeclaration property;
        const Token& name = expect(TokenType::Identifier, "property name");
        property.name = name.text;
        property.location = name.location;
        expect(TokenType::Colon, "':'");
        property.value = parseValue();
        return property;
    }

    RawValue parseValue() {
        const Token& token = peek();
        switch (token.type) {
            case TokenType::String:
                return advance().text;
            case TokenType::Number:
                return parseNumber();
            case TokenType::HexColor:
                return HexColorLiteral{advance().text};
            case TokenType::LeftParen: {
                advance();
                const double first = parseNumber();
                expect(TokenType::Comma, "','");
                const double second = parseNumber();
                expect(TokenType::RightParen, "')'");
                return TupleLiteral{first, second};
            }
            default:
                fail(token, fmt::format("Expected a value, got {}.", describe(token)));
        }
    }

    double parseNumber() {
        const Token& token = expect(TokenType::Number, "number");
        if (!token.unit.empty()) {
            fail(token, fmt::format("Unexpected unit '{}' on number.", token.unit));
        }
        try {
            return boost::lexical_cast<double>(token.text);
        } catch (const boost::bad_lexical_cast&) {
            fail(token, fmt::format("Invalid number '{}'.", token.text));
        }
    }

    seconds parseTime() {
        const Token& token = expect(TokenType::Number, "time");
        const bool isInteger = !token.text.empty()
            && std::all_of(token.text.begin(), token.text.end(), isDigit);
        if (!isInteger) {
            fail(token, fmt::format("Time must be a non-negative integer, got '{}'.", token.text));
        }
        long long count = 0;
        try {
            count = boost::lexical_cast<long long>(token.text);
        } catch (const boost::bad_lexical_cast&) {
            fail(token, fmt::format("Time '{}' is out of range.", token.text));
        }
        if (token.unit == "s") return seconds(static_cast<double>(count));
        if (token.unit == "ms") return seconds(static_cast<double>(count) / 1000.0);
        fail(
            token,
            token.unit.empty()
                ? fmt::format("Time '{}' needs a unit ('s' or 'ms').", token.text)
                : fmt::format("Unknown time unit '{}'. Expected 's' or 'ms'.", token.unit)
        );
    }

    TimelineDeclaration parseTimeline() {
        TimelineDeclaration timeline;
        timeline.location = advance().location;
        expectKeyword("for");
        timeline.sceneName = expect(TokenType::String, "scene name").text;
        expect(TokenType::LeftBrace, "'{'");
        while (!accept(TokenType::RightBrace)) {
            timeline.animations.push_back(parseAnimation());
        }
        return timeline;
    }

    AnimationDeclaration parseAnimation() {
        AnimationDeclaration animation;
        const Token& at = peek();
        expectKeyword("at");
        animation.location = at.location;
        animation.start = parseTime();
        if (isKeyword(peek(), "to")) {
            advance();
            animation.end = parseTime();
        }
        expect(TokenType::Comma, "','");
        animation.targetObject = expect(TokenType::String, "object id").text;
        expect(TokenType::Dot, "'.'");
        animation.property = expect(TokenType::Identifier, "property name").text;
        expect(TokenType::Arrow, "'->'");
        animation.endValue = parseValue();
        if (isKeyword(peek(), "with")) {
            advance();
            animation.easing = expect(TokenType::Identifier, "easing name").text;
        }
        expect(TokenType::Semicolon, "';'");
        return animation;
    }

    vector<Token> tokens;
    size_t position = 0;
};

} // namespace

ScriptDocument parseScript(const string& text) {
    Lexer lexer(text);
    Parser parser(lexer.tokenize());
    return parser.parseDocument();
}
