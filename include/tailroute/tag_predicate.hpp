// === Tag Predicates ==========================================================
//
// Selection rules match devices with a small expression language:
//
//   tag("expose=web") && !prefix("exit")
//   any("web", "api") || (os("linux") && host("nas"))
//
// Expressions parse into a closed set of node types evaluated by a tiny
// interpreter, so matching stays deterministic and side-effect free.

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "tailroute/device.hpp"

namespace tailroute {

class TagPredicate;

namespace predicate {

/** @brief Device carries exactly this tag. */
struct TagEquals final {
    std::string tag;
};

/** @brief Device carries a tag starting with this prefix. */
struct TagPrefix final {
    std::string prefix;
};

/** @brief Device carries at least one tag of the set. */
struct TagAnyOf final {
    std::vector<std::string> tags;
};

/** @brief Device reports this operating system (case-insensitive). */
struct OsEquals final {
    std::string os;
};

/** @brief Device host name equals this value (case-insensitive). */
struct HostEquals final {
    std::string host;
};

/** @brief Matches every device. */
struct Always final {};

struct Not final {
    std::shared_ptr<const TagPredicate> operand;
};

struct All final {
    std::vector<TagPredicate> operands;
};

struct AnyOf final {
    std::vector<TagPredicate> operands;
};

}  // namespace predicate

/**
 * @brief Parsed predicate tree. Copies share immutable subtrees.
 */
class TagPredicate final {
  public:
    using Node = std::variant<
        predicate::TagEquals,
        predicate::TagPrefix,
        predicate::TagAnyOf,
        predicate::OsEquals,
        predicate::HostEquals,
        predicate::Always,
        predicate::Not,
        predicate::All,
        predicate::AnyOf>;

    explicit TagPredicate(Node node);

    /**
     * @brief Parse an expression.
     * @throws SelectionConfigError with the failing column on bad input.
     */
    [[nodiscard]] static TagPredicate parse(std::string_view expression);

    /** @brief Evaluate the predicate against @p device. */
    [[nodiscard]] bool matches(const Device& device) const;

    /** @brief Canonical textual form, reparseable by parse(). */
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] const Node& node() const noexcept;

  private:
    Node node_;
};

}  // namespace tailroute
