#include <xcomb/xml_grammar.hpp>

namespace xcomb {

  parser<std::string>
  quoted_string() {
    auto body = zero_or_more(pred(any_char, [](char c) { return c != '"'; }));
    return map(right(match_literal("\""),
                     left(std::move(body), match_literal("\""))),
               [](std::vector<char> chars) {
                 return std::string(chars.begin(), chars.end());
               });
  }

  parser<attribute>
  attribute_pair() {
    return pair(identifier, right(match_literal("="), quoted_string()));
  }

  parser<std::vector<attribute>>
  attributes() {
    return zero_or_more(right(space1(), attribute_pair()));
  }

  parser<element_head>
  element_start() {
    return right(match_literal("<"), pair(identifier, attributes()));
  }

  namespace {

    element
    make_element(element_head head) {
      return element{std::move(head.first), std::move(head.second), {}};
    }

  } // namespace

  parser<element>
  single_element() {
    return map(left(element_start(), match_literal("/>")), make_element);
  }

  parser<element>
  open_element() {
    return map(left(element_start(), match_literal(">")), make_element);
  }

  parser<std::string>
  close_element(std::string expected_name) {
    return pred(right(match_literal("</"), left(identifier, match_literal(">"))),
                [expected_name = std::move(expected_name)](
                    const std::string& name) { return name == expected_name; });
  }

  parser<element>
  parent_element() {
    return open_element().and_then([](element opened) {
      auto name = opened.name;
      return map(left(zero_or_more(element_parser()),
                      close_element(std::move(name))),
                 [opened = std::move(opened)](std::vector<element> children) {
                   element e = opened;
                   e.children = std::move(children);
                   return e;
                 });
    });
  }

  parser<element>
  element_parser() {
    return whitespace_wrap(either(single_element(), parent_element()));
  }

  element
  parse_document(std::string_view text) {
    auto result = element_parser().parse(text);
    if (!result) {
      throw parse_error("XML parse error: unexpected input", result.remaining());
    }
    if (!result.remaining().empty()) {
      throw parse_error("XML parse error: trailing content after root element",
                        result.remaining());
    }
    return std::move(result).value();
  }

} // namespace xcomb
