#ifndef COMMAND_TEMPLATE_HPP
#define COMMAND_TEMPLATE_HPP

#include <cstdint>
#include <string>
#include <vector>

// A user command with {OFFSET}, {SIZE} and {SLICE_ID} placeholders.
// "{{" and "}}" stand for literal braces.
//
// The template is parsed once; unknown placeholders and stray braces are
// rejected with ConfigError at construction, before anything is spawned.
class CommandTemplate {
public:
    explicit CommandTemplate(const std::string& text);

    // Join argv-style words with single spaces, then parse
    static CommandTemplate from_words(const std::vector<std::string>& words);

    std::string render(uint64_t offset, uint64_t size, int slice_id) const;

    const std::string& text() const { return text_; }

private:
    enum class Field { Literal, Offset, Size, SliceId };

    struct Piece {
        Field field;
        std::string literal;
    };

    std::string text_;
    std::vector<Piece> pieces_;
};

#endif // COMMAND_TEMPLATE_HPP
