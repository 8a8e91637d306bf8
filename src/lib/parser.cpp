#include <xcomb/parser.hpp>

namespace xcomb {

  namespace {

    // ASCII only, independent of the global locale.
    bool
    is_ascii_alpha(char c) {
      return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    }

    bool
    is_ascii_digit(char c) {
      return c >= '0' && c <= '9';
    }

    bool
    is_ascii_space(char c) {
      return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
             c == '\v';
    }

    bool
    is_ident_start(char c) {
      return is_ascii_alpha(c);
    }

    bool
    is_ident_char(char c) {
      return is_ascii_alpha(c) || is_ascii_digit(c) || c == '-';
    }

  } // namespace

  parse_result<char>
  any_char(std::string_view input) {
    if (input.empty()) return failure<char>(input);
    return success(input.substr(1), input.front());
  }

  parse_result<std::string>
  identifier(std::string_view input) {
    if (input.empty() || !is_ident_start(input.front()))
      return failure<std::string>(input);

    std::size_t end = 1;
    while (end < input.size() && is_ident_char(input[end]))
      ++end;
    return success(input.substr(end), std::string(input.substr(0, end)));
  }

  parser<char>
  whitespace_char() {
    return pred(any_char, is_ascii_space);
  }

  parser<std::vector<char>>
  space0() {
    return zero_or_more(whitespace_char());
  }

  parser<std::vector<char>>
  space1() {
    return one_or_more(whitespace_char());
  }

} // namespace xcomb
