#ifndef WIDEPATH_PARSER_LINE_SCANNER_HPP
#define WIDEPATH_PARSER_LINE_SCANNER_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace widepath {
namespace parser {

// Walks a text stream line by line, skipping blank lines, and turns fields into
// numbers. Every failure is reported as a ParseError naming the source, the
// line number and the offending line.
class LineScanner {
public:
    LineScanner(std::istream& input, std::string source);

    // Advance to the next non-blank line. Returns false at end of input.
    bool next();

    const std::string& line() const { return line_; }
    size_t line_number() const { return line_number_; }
    const std::string& source() const { return source_; }

    // Views into line(); valid until the next call to next()
    std::vector<std::string_view> split_whitespace() const;
    std::vector<std::string_view> split(char delimiter) const;

    int64_t parse_int(std::string_view field, std::string_view what) const;
    double parse_double(std::string_view field, std::string_view what) const;

    // Throw when the line has fewer than `count` fields
    void require_fields(const std::vector<std::string_view>& fields, size_t count) const;

    [[noreturn]] void fail(const std::string& reason) const;

private:
    std::istream& input_;
    std::string source_;
    std::string line_;
    size_t line_number_ = 0;
};

// Strip surrounding blanks and one pair of double quotes
std::string_view trim_field(std::string_view field);

}  // namespace parser
}  // namespace widepath

#endif // WIDEPATH_PARSER_LINE_SCANNER_HPP
