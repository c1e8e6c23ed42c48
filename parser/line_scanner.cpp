#include "line_scanner.hpp"
#include <common/errors.hpp>
#include <charconv>
#include <cmath>
#include <utility>

namespace widepath {
namespace parser {

namespace {

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

}  // namespace

std::string_view trim_field(std::string_view field) {
    while (!field.empty() && is_blank(field.front())) field.remove_prefix(1);
    while (!field.empty() && is_blank(field.back())) field.remove_suffix(1);
    if (field.size() >= 2 && field.front() == '"' && field.back() == '"') {
        field = field.substr(1, field.size() - 2);
    }
    return field;
}

LineScanner::LineScanner(std::istream& input, std::string source)
    : input_(input), source_(std::move(source)) {}

bool LineScanner::next() {
    while (std::getline(input_, line_)) {
        ++line_number_;
        if (!line_.empty() && line_.back() == '\r') {
            line_.pop_back();
        }
        if (!trim_field(line_).empty()) {
            return true;
        }
    }
    line_.clear();
    return false;
}

std::vector<std::string_view> LineScanner::split_whitespace() const {
    std::vector<std::string_view> fields;
    std::string_view rest(line_);
    size_t pos = 0;
    while (pos < rest.size()) {
        while (pos < rest.size() && is_blank(rest[pos])) ++pos;
        size_t start = pos;
        while (pos < rest.size() && !is_blank(rest[pos])) ++pos;
        if (pos > start) {
            fields.push_back(rest.substr(start, pos - start));
        }
    }
    return fields;
}

std::vector<std::string_view> LineScanner::split(char delimiter) const {
    std::vector<std::string_view> fields;
    std::string_view rest(line_);
    size_t start = 0;
    while (true) {
        size_t end = rest.find(delimiter, start);
        if (end == std::string_view::npos) {
            fields.push_back(trim_field(rest.substr(start)));
            break;
        }
        fields.push_back(trim_field(rest.substr(start, end - start)));
        start = end + 1;
    }
    return fields;
}

int64_t LineScanner::parse_int(std::string_view field, std::string_view what) const {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
    if (ec != std::errc() || ptr != field.data() + field.size() || field.empty()) {
        fail("invalid " + std::string(what) + " '" + std::string(field) + "'");
    }
    return value;
}

double LineScanner::parse_double(std::string_view field, std::string_view what) const {
    // from_chars does not accept a leading '+'
    if (!field.empty() && field.front() == '+') {
        field.remove_prefix(1);
    }
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
    if (ec != std::errc() || ptr != field.data() + field.size() || field.empty() ||
        !std::isfinite(value)) {
        fail("invalid " + std::string(what) + " '" + std::string(field) + "'");
    }
    return value;
}

void LineScanner::require_fields(const std::vector<std::string_view>& fields, size_t count) const {
    if (fields.size() < count) {
        fail("expected at least " + std::to_string(count) + " fields, got " +
             std::to_string(fields.size()));
    }
}

void LineScanner::fail(const std::string& reason) const {
    throw ParseError(source_, line_number_, line_, reason);
}

}  // namespace parser
}  // namespace widepath
