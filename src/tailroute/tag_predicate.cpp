#include "tailroute/tag_predicate.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include <fmt/format.h>

#include "tailroute/errors.hpp"

namespace tailroute {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

bool equals_ignore_case(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size()
        && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
               return std::tolower(a) == std::tolower(b);
           });
}

std::string quote(std::string_view text) {
    std::string quoted{"\""};
    for (const char character : text) {
        if (character == '"' || character == '\\') {
            quoted.push_back('\\');
        }
        quoted.push_back(character);
    }
    quoted.push_back('"');
    return quoted;
}

/** @brief Recursive-descent parser; `&&` binds tighter than `||`. */
class ExpressionParser final {
  public:
    explicit ExpressionParser(std::string_view text) : text_(text) {}

    TagPredicate parse() {
        TagPredicate result = parse_or();
        skip_whitespace();
        if (position_ != text_.size()) {
            fail("unexpected trailing input");
        }
        return result;
    }

  private:
    TagPredicate parse_or() {
        std::vector<TagPredicate> list_operands;
        list_operands.push_back(parse_and());
        while (consume("||")) {
            list_operands.push_back(parse_and());
        }
        if (list_operands.size() == 1) {
            return std::move(list_operands.front());
        }
        return TagPredicate{predicate::AnyOf{std::move(list_operands)}};
    }

    TagPredicate parse_and() {
        std::vector<TagPredicate> list_operands;
        list_operands.push_back(parse_unary());
        while (consume("&&")) {
            list_operands.push_back(parse_unary());
        }
        if (list_operands.size() == 1) {
            return std::move(list_operands.front());
        }
        return TagPredicate{predicate::All{std::move(list_operands)}};
    }

    TagPredicate parse_unary() {
        if (consume("!")) {
            return TagPredicate{predicate::Not{std::make_shared<const TagPredicate>(parse_unary())}};
        }
        if (consume("(")) {
            TagPredicate inner = parse_or();
            expect(")");
            return inner;
        }
        return parse_call();
    }

    TagPredicate parse_call() {
        skip_whitespace();
        const std::size_t start = position_;
        while (position_ < text_.size() && std::isalpha(static_cast<unsigned char>(text_[position_]))) {
            ++position_;
        }
        const std::string_view name = text_.substr(start, position_ - start);
        if (name.empty()) {
            fail("expected a predicate");
        }
        if (name == "true") {
            return TagPredicate{predicate::Always{}};
        }

        expect("(");
        std::vector<std::string> list_arguments;
        if (!consume(")")) {
            list_arguments.push_back(parse_string());
            while (consume(",")) {
                list_arguments.push_back(parse_string());
            }
            expect(")");
        }

        const auto single_argument = [&]() -> std::string {
            if (list_arguments.size() != 1) {
                fail(fmt::format("{}() takes exactly one argument", name));
            }
            return list_arguments.front();
        };

        if (name == "tag") {
            return TagPredicate{predicate::TagEquals{single_argument()}};
        }
        if (name == "prefix") {
            return TagPredicate{predicate::TagPrefix{single_argument()}};
        }
        if (name == "any") {
            if (list_arguments.empty()) {
                fail("any() needs at least one tag");
            }
            return TagPredicate{predicate::TagAnyOf{std::move(list_arguments)}};
        }
        if (name == "os") {
            return TagPredicate{predicate::OsEquals{single_argument()}};
        }
        if (name == "host") {
            return TagPredicate{predicate::HostEquals{single_argument()}};
        }
        position_ = start;
        fail(fmt::format("unknown predicate '{}'", name));
    }

    std::string parse_string() {
        skip_whitespace();
        if (position_ >= text_.size() || text_[position_] != '"') {
            fail("expected a quoted string");
        }
        ++position_;
        std::string value;
        while (position_ < text_.size() && text_[position_] != '"') {
            if (text_[position_] == '\\') {
                ++position_;
                if (position_ >= text_.size()) {
                    break;
                }
            }
            value.push_back(text_[position_]);
            ++position_;
        }
        if (position_ >= text_.size()) {
            fail("unterminated string");
        }
        ++position_;
        if (value.empty()) {
            fail("empty string argument");
        }
        return value;
    }

    void skip_whitespace() {
        while (position_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[position_]))) {
            ++position_;
        }
    }

    bool consume(std::string_view token) {
        skip_whitespace();
        if (text_.substr(position_, token.size()) == token) {
            position_ += token.size();
            return true;
        }
        return false;
    }

    void expect(std::string_view token) {
        if (!consume(token)) {
            fail(fmt::format("expected '{}'", token));
        }
    }

    [[noreturn]] void fail(const std::string& reason) const {
        throw SelectionConfigError(fmt::format("Invalid match expression '{}' at column {}: {}", text_, position_ + 1, reason));
    }

    std::string_view text_;
    std::size_t position_{0};
};

}  // namespace

TagPredicate::TagPredicate(Node node) : node_(std::move(node)) {}

TagPredicate TagPredicate::parse(std::string_view expression) {
    return ExpressionParser{expression}.parse();
}

const TagPredicate::Node& TagPredicate::node() const noexcept {
    return node_;
}

bool TagPredicate::matches(const Device& device) const {
    return std::visit(
        Overloaded{
            [&device](const predicate::TagEquals& leaf) { return device.has_tag(leaf.tag); },
            [&device](const predicate::TagPrefix& leaf) {
                return std::any_of(device.tags.begin(), device.tags.end(), [&leaf](const std::string& tag) {
                    return tag.compare(0, leaf.prefix.size(), leaf.prefix) == 0;
                });
            },
            [&device](const predicate::TagAnyOf& leaf) {
                return std::any_of(leaf.tags.begin(), leaf.tags.end(), [&device](const std::string& tag) {
                    return device.has_tag(tag);
                });
            },
            [&device](const predicate::OsEquals& leaf) { return equals_ignore_case(device.os, leaf.os); },
            [&device](const predicate::HostEquals& leaf) { return equals_ignore_case(device.host_name, leaf.host); },
            [](const predicate::Always&) { return true; },
            [&device](const predicate::Not& combinator) { return !combinator.operand->matches(device); },
            [&device](const predicate::All& combinator) {
                return std::all_of(combinator.operands.begin(), combinator.operands.end(), [&device](const TagPredicate& operand) {
                    return operand.matches(device);
                });
            },
            [&device](const predicate::AnyOf& combinator) {
                return std::any_of(combinator.operands.begin(), combinator.operands.end(), [&device](const TagPredicate& operand) {
                    return operand.matches(device);
                });
            },
        },
        node_
    );
}

std::string TagPredicate::to_string() const {
    const auto join_operands = [](const std::vector<TagPredicate>& operands, std::string_view separator) {
        std::string joined{"("};
        for (std::size_t index = 0; index < operands.size(); ++index) {
            if (index > 0) {
                joined.append(separator);
            }
            joined.append(operands[index].to_string());
        }
        joined.push_back(')');
        return joined;
    };

    return std::visit(
        Overloaded{
            [](const predicate::TagEquals& leaf) { return fmt::format("tag({})", quote(leaf.tag)); },
            [](const predicate::TagPrefix& leaf) { return fmt::format("prefix({})", quote(leaf.prefix)); },
            [](const predicate::TagAnyOf& leaf) {
                std::string arguments;
                for (std::size_t index = 0; index < leaf.tags.size(); ++index) {
                    if (index > 0) {
                        arguments.append(", ");
                    }
                    arguments.append(quote(leaf.tags[index]));
                }
                return fmt::format("any({})", arguments);
            },
            [](const predicate::OsEquals& leaf) { return fmt::format("os({})", quote(leaf.os)); },
            [](const predicate::HostEquals& leaf) { return fmt::format("host({})", quote(leaf.host)); },
            [](const predicate::Always&) { return std::string{"true"}; },
            [](const predicate::Not& combinator) { return "!" + combinator.operand->to_string(); },
            [&join_operands](const predicate::All& combinator) { return join_operands(combinator.operands, " && "); },
            [&join_operands](const predicate::AnyOf& combinator) { return join_operands(combinator.operands, " || "); },
        },
        node_
    );
}

}  // namespace tailroute
