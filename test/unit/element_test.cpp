#include <xcomb/element.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

using namespace xcomb;

namespace {

  std::string
  to_string(const element& e) {
    std::ostringstream os;
    os << e;
    return os.str();
  }

} // namespace

TEST_CASE("element default construction", "[element]") {
  element e;
  CHECK(e.name.empty());
  CHECK(e.attributes.empty());
  CHECK(e.children.empty());
}

TEST_CASE("element equality compares all fields", "[element]") {
  element a{"item", {{"id", "1"}}, {}};
  element b{"item", {{"id", "1"}}, {}};
  element other_name{"entry", {{"id", "1"}}, {}};
  element other_value{"item", {{"id", "2"}}, {}};

  CHECK(a == b);
  CHECK_FALSE(a == other_name);
  CHECK_FALSE(a == other_value);
}

TEST_CASE("element equality is sensitive to attribute order", "[element]") {
  element a{"p", {{"x", "1"}, {"y", "2"}}, {}};
  element b{"p", {{"y", "2"}, {"x", "1"}}, {}};
  CHECK_FALSE(a == b);
}

TEST_CASE("element equality recurses into children", "[element]") {
  element a{"root", {}, {element{"a", {}, {}}, element{"b", {}, {}}}};
  element b{"root", {}, {element{"a", {}, {}}, element{"b", {}, {}}}};
  element swapped{"root", {}, {element{"b", {}, {}}, element{"a", {}, {}}}};

  CHECK(a == b);
  CHECK_FALSE(a == swapped);
}

TEST_CASE("element writes a childless element self-closed", "[element]") {
  CHECK(to_string(element{"br", {}, {}}) == "<br/>");
  CHECK(to_string(element{"div", {{"class", "float"}}, {}}) ==
        R"(<div class="float"/>)");
}

TEST_CASE("element writes attributes in order", "[element]") {
  element e{"a", {{"one", "1"}, {"two", "2"}, {"one", "3"}}, {}};
  CHECK(to_string(e) == R"(<a one="1" two="2" one="3"/>)");
}

TEST_CASE("element writes nested children", "[element]") {
  element e{"top",
            {{"label", "Top"}},
            {element{"middle", {}, {element{"bottom", {}, {}}}}}};
  CHECK(to_string(e) ==
        R"(<top label="Top"><middle><bottom/></middle></top>)");
}
