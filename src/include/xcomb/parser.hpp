#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace xcomb {

  // Value produced by parsers that only consume input.
  struct unit {
    bool
    operator==(const unit&) const = default;
  };

  // Outcome of one parse step. On success, remaining() is the input left
  // after the parsed value; on failure it is the view at which parsing
  // stopped. Either way it is a suffix of the input handed to the parser.
  template <typename T>
  class parse_result {
    std::string_view remaining_;
    std::optional<T> value_;

    parse_result(std::string_view remaining, std::optional<T> value)
        : remaining_(remaining), value_(std::move(value)) {}

  public:
    using value_type = T;

    static parse_result
    success(std::string_view remaining, T value) {
      return parse_result(remaining, std::optional<T>(std::move(value)));
    }

    static parse_result
    failure(std::string_view at) {
      return parse_result(at, std::nullopt);
    }

    bool
    ok() const {
      return value_.has_value();
    }

    explicit operator bool() const {
      return ok();
    }

    std::string_view
    remaining() const {
      return remaining_;
    }

    const T&
    value() const& {
      return *value_;
    }

    T&&
    value() && {
      return std::move(*value_);
    }

    bool
    operator==(const parse_result&) const = default;
  };

  template <typename T>
  parse_result<T>
  success(std::string_view remaining, T value) {
    return parse_result<T>::success(remaining, std::move(value));
  }

  template <typename T>
  parse_result<T>
  failure(std::string_view at) {
    return parse_result<T>::failure(at);
  }

  // Value type produced by a parser-like callable P.
  template <typename P>
  using parser_value_t =
      typename std::invoke_result_t<const P&, std::string_view>::value_type;

  template <typename P, typename T>
  concept parser_of =
      std::is_invocable_r_v<parse_result<T>, const P&, std::string_view>;

  template <typename T>
  class parser;

  template <typename P, typename F>
  auto
  map(P p, F f);

  template <typename P, typename F>
  auto
  pred(P p, F predicate);

  template <typename P, typename F>
  auto
  and_then(P p, F f);

  // Type-erased, immutable parser value. Copies share one callable, so a
  // parser can be handed around and called from several threads freely.
  template <typename T>
  class parser {
  public:
    using value_type = T;
    using result_type = parse_result<T>;
    using function_type = std::function<result_type(std::string_view)>;

    template <typename F>
      requires(!std::is_same_v<std::decay_t<F>, parser> && parser_of<F, T>)
    parser(F f)
        : fn_(std::make_shared<const function_type>(std::move(f))) {}

    result_type
    parse(std::string_view input) const {
      return (*fn_)(input);
    }

    result_type
    operator()(std::string_view input) const {
      return (*fn_)(input);
    }

    template <typename F>
    auto
    map(F f) const {
      using U = std::decay_t<std::invoke_result_t<const F&, T&&>>;
      return parser<U>(xcomb::map(*this, std::move(f)));
    }

    template <typename F>
    parser<T>
    pred(F predicate) const {
      return parser<T>(xcomb::pred(*this, std::move(predicate)));
    }

    template <typename F>
    auto
    and_then(F f) const {
      using next_type = std::decay_t<std::invoke_result_t<const F&, T&&>>;
      return parser<parser_value_t<next_type>>(
          xcomb::and_then(*this, std::move(f)));
    }

  private:
    std::shared_ptr<const function_type> fn_;
  };

  // -- Primitives ------------------------------------------------------------

  inline auto
  match_literal(std::string expected) {
    return [expected = std::move(expected)](
               std::string_view input) -> parse_result<unit> {
      if (!input.starts_with(expected)) return failure<unit>(input);
      return success(input.substr(expected.size()), unit{});
    };
  }

  parse_result<char>
  any_char(std::string_view input);

  parse_result<std::string>
  identifier(std::string_view input);

  // -- Combinators -----------------------------------------------------------

  template <typename P, typename F>
  auto
  map(P p, F f) {
    using A = parser_value_t<P>;
    using B = std::decay_t<std::invoke_result_t<const F&, A&&>>;
    return [p = std::move(p),
            f = std::move(f)](std::string_view input) -> parse_result<B> {
      auto r = std::invoke(p, input);
      if (!r) return failure<B>(r.remaining());
      auto rest = r.remaining();
      return success<B>(rest, std::invoke(f, std::move(r).value()));
    };
  }

  // Sequence p1 then p2. A failure of p2 is reported at p2's failure view;
  // input consumed by p1 is not given back.
  template <typename P1, typename P2>
  auto
  pair(P1 p1, P2 p2) {
    using value_type = std::pair<parser_value_t<P1>, parser_value_t<P2>>;
    return [p1 = std::move(p1), p2 = std::move(p2)](
               std::string_view input) -> parse_result<value_type> {
      auto first = std::invoke(p1, input);
      if (!first) return failure<value_type>(first.remaining());
      auto second = std::invoke(p2, first.remaining());
      if (!second) return failure<value_type>(second.remaining());
      auto rest = second.remaining();
      return success(rest, value_type(std::move(first).value(),
                                      std::move(second).value()));
    };
  }

  template <typename P1, typename P2>
  auto
  left(P1 p1, P2 p2) {
    return map(pair(std::move(p1), std::move(p2)),
               [](auto&& values) { return std::move(values.first); });
  }

  template <typename P1, typename P2>
  auto
  right(P1 p1, P2 p2) {
    return map(pair(std::move(p1), std::move(p2)),
               [](auto&& values) { return std::move(values.second); });
  }

  // Try p1; if it fails, run p2 on the same input.
  template <typename P1, typename P2>
  auto
  either(P1 p1, P2 p2) {
    using T = parser_value_t<P1>;
    static_assert(std::is_same_v<T, parser_value_t<P2>>,
                  "either: both alternatives must produce the same type");
    return [p1 = std::move(p1),
            p2 = std::move(p2)](std::string_view input) -> parse_result<T> {
      auto r = std::invoke(p1, input);
      if (r) return r;
      return std::invoke(p2, input);
    };
  }

  namespace detail {

    // Apply p until it fails. A success that consumes nothing is kept and
    // ends the repetition, since applying p again would yield it forever.
    template <typename P>
    std::string_view
    repeat(const P& p, std::string_view input,
           std::vector<parser_value_t<P>>& out) {
      while (true) {
        auto r = std::invoke(p, input);
        if (!r) return input;
        bool progressed = r.remaining().size() < input.size();
        input = r.remaining();
        out.push_back(std::move(r).value());
        if (!progressed) return input;
      }
    }

  } // namespace detail

  template <typename P>
  auto
  one_or_more(P p) {
    using values = std::vector<parser_value_t<P>>;
    return [p = std::move(p)](std::string_view input) -> parse_result<values> {
      values out;
      auto rest = detail::repeat(p, input, out);
      if (out.empty()) return failure<values>(input);
      return success(rest, std::move(out));
    };
  }

  template <typename P>
  auto
  zero_or_more(P p) {
    using values = std::vector<parser_value_t<P>>;
    return [p = std::move(p)](std::string_view input) -> parse_result<values> {
      values out;
      auto rest = detail::repeat(p, input, out);
      return success(rest, std::move(out));
    };
  }

  // Accept p's value only when predicate holds. A rejected value gives the
  // consumed input back.
  template <typename P, typename F>
  auto
  pred(P p, F predicate) {
    using T = parser_value_t<P>;
    return [p = std::move(p), predicate = std::move(predicate)](
               std::string_view input) -> parse_result<T> {
      auto r = std::invoke(p, input);
      if (!r) return r;
      if (!std::invoke(predicate, r.value())) return failure<T>(input);
      return r;
    };
  }

  // Run p, then the parser f builds from p's value on the remaining input.
  template <typename P, typename F>
  auto
  and_then(P p, F f) {
    using A = parser_value_t<P>;
    using next_type = std::decay_t<std::invoke_result_t<const F&, A&&>>;
    using B = parser_value_t<next_type>;
    return [p = std::move(p),
            f = std::move(f)](std::string_view input) -> parse_result<B> {
      auto r = std::invoke(p, input);
      if (!r) return failure<B>(r.remaining());
      auto rest = r.remaining();
      auto next = std::invoke(f, std::move(r).value());
      return std::invoke(next, rest);
    };
  }

  // -- Whitespace ------------------------------------------------------------

  parser<char>
  whitespace_char();

  parser<std::vector<char>>
  space0();

  parser<std::vector<char>>
  space1();

  template <typename P>
  auto
  whitespace_wrap(P p) {
    return right(space0(), left(std::move(p), space0()));
  }

} // namespace xcomb
