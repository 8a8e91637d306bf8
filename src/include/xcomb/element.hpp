#pragma once

#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace xcomb {

  using attribute = std::pair<std::string, std::string>;

  // One node of a parsed document. Attributes keep source order, duplicates
  // included.
  struct element {
    std::string name;
    std::vector<attribute> attributes;
    std::vector<element> children;

    bool
    operator==(const element&) const;

    // Writes the element back in the syntax the grammar accepts. Values are
    // written verbatim: the grammar has no entities.
    friend std::ostream&
    operator<<(std::ostream& os, const element& e) {
      os << '<' << e.name;
      for (const auto& [key, value] : e.attributes) {
        os << ' ' << key << "=\"" << value << '"';
      }
      if (e.children.empty()) { return os << "/>"; }
      os << '>';
      for (const auto& child : e.children) {
        os << child;
      }
      return os << "</" << e.name << '>';
    }
  };

  // Defined out-of-line so element is complete when the vector<element>
  // comparison is instantiated.
  inline bool
  element::operator==(const element& other) const {
    return name == other.name && attributes == other.attributes &&
           children == other.children;
  }

} // namespace xcomb
