#pragma once

#include <xcomb/element.hpp>
#include <xcomb/parser.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xcomb {

  // Grammar for a restricted XML subset: open, close and self-closing tags
  // with double-quoted attribute values and nested children. No text, no
  // comments, no entities, no namespaces.
  //
  //   element        := single_element | parent_element  (whitespace-wrapped)
  //   single_element := "<" identifier attributes "/>"
  //   parent_element := "<" identifier attributes ">" element*
  //                     "</" identifier ">"
  //   attributes     := (whitespace+ attribute_pair)*
  //   attribute_pair := identifier "=" quoted_string
  //   quoted_string  := '"' [^"]* '"'

  using element_head = std::pair<std::string, std::vector<attribute>>;

  parser<std::string>
  quoted_string();

  parser<attribute>
  attribute_pair();

  parser<std::vector<attribute>>
  attributes();

  parser<element_head>
  element_start();

  parser<element>
  single_element();

  parser<element>
  open_element();

  // Matches "</name>" only when name equals expected_name.
  parser<std::string>
  close_element(std::string expected_name);

  parser<element>
  parent_element();

  parser<element>
  element_parser();

  // Thrown by parse_document; carries the unconsumed input at the point
  // the document was rejected.
  class parse_error : public std::runtime_error {
    std::string remaining_;

  public:
    parse_error(const std::string& what, std::string_view remaining)
        : std::runtime_error(what), remaining_(remaining) {}

    const std::string&
    remaining() const {
      return remaining_;
    }
  };

  // Parse a complete document. Unlike element_parser(), trailing input after
  // the root element is an error.
  element
  parse_document(std::string_view text);

} // namespace xcomb
