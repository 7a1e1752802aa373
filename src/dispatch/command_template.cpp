#include "command_template.hpp"

#include "../include/errors.hpp"

CommandTemplate::CommandTemplate(const std::string& text) : text_(text) {
    if (text.empty()) throw ConfigError("empty command template");

    std::string literal;
    auto flush_literal = [&]() {
        if (!literal.empty()) {
            pieces_.push_back({Field::Literal, literal});
            literal.clear();
        }
    };

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '{') {
            if (i + 1 < text.size() && text[i + 1] == '{') {
                literal += '{';
                ++i;
                continue;
            }
            size_t close = text.find('}', i + 1);
            if (close == std::string::npos)
                throw ConfigError("unterminated placeholder at position " + std::to_string(i) + " in: " + text);

            std::string name = text.substr(i + 1, close - i - 1);
            Field field;
            if (name == "OFFSET") {
                field = Field::Offset;
            } else if (name == "SIZE") {
                field = Field::Size;
            } else if (name == "SLICE_ID") {
                field = Field::SliceId;
            } else {
                throw ConfigError("unknown placeholder {" + name + "} in command template"
                                  " (known: {OFFSET}, {SIZE}, {SLICE_ID}; use {{ and }} for literal braces)");
            }
            flush_literal();
            pieces_.push_back({field, std::string()});
            i = close;
        } else if (c == '}') {
            if (i + 1 < text.size() && text[i + 1] == '}') {
                literal += '}';
                ++i;
                continue;
            }
            throw ConfigError("single '}' at position " + std::to_string(i) + " in: " + text);
        } else {
            literal += c;
        }
    }
    flush_literal();
}

CommandTemplate CommandTemplate::from_words(const std::vector<std::string>& words) {
    std::string joined;
    for (const auto& w : words) {
        if (!joined.empty()) joined += ' ';
        joined += w;
    }
    return CommandTemplate(joined);
}

std::string CommandTemplate::render(uint64_t offset, uint64_t size, int slice_id) const {
    std::string out;
    for (const auto& piece : pieces_) {
        switch (piece.field) {
            case Field::Literal: out += piece.literal; break;
            case Field::Offset:  out += std::to_string(offset); break;
            case Field::Size:    out += std::to_string(size); break;
            case Field::SliceId: out += std::to_string(slice_id); break;
        }
    }
    return out;
}
