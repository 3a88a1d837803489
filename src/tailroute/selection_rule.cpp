#include "tailroute/selection_rule.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "tailroute/errors.hpp"

namespace tailroute {

namespace {
using nlohmann::json;

constexpr long long k_int_max{std::numeric_limits<int>::max()};

const std::set<std::string> k_rule_keys{
    "name", "match", "protocol", "port", "require_advertised", "port_name", "host", "path_prefix",
    "strip_prefix", "tls", "entry_points", "middlewares", "request_headers", "retry_attempts",
    "priority", "health_check", "aggregate",
};
const std::set<std::string> k_tls_keys{"cert_resolver", "passthrough", "backend_scheme"};
const std::set<std::string> k_health_check_keys{"path", "interval", "timeout"};

/** @brief Collects the rule context so every error names the offending rule. */
class RuleReader final {
  public:
    RuleReader(const json& object, std::string context) : object_(object), str_context_(std::move(context)) {}

    [[noreturn]] void fail(const std::string& reason) const {
        throw SelectionConfigError(fmt::format("{}: {}", str_context_, reason));
    }

    void reject_unknown_keys(const std::set<std::string>& allowed) const {
        for (const auto& [key, value] : object_.items()) {
            if (allowed.count(key) == 0) {
                fail(fmt::format("unknown key '{}'", key));
            }
        }
    }

    [[nodiscard]] bool has(const char* key) const {
        return object_.contains(key) && !object_.at(key).is_null();
    }

    [[nodiscard]] std::string string(const char* key, bool required = false) const {
        if (!has(key)) {
            if (required) {
                fail(fmt::format("'{}' is required", key));
            }
            return {};
        }
        const json& value = object_.at(key);
        if (!value.is_string()) {
            fail(fmt::format("'{}' must be a string", key));
        }
        return value.get<std::string>();
    }

    [[nodiscard]] bool boolean(const char* key) const {
        if (!has(key)) {
            return false;
        }
        const json& value = object_.at(key);
        if (!value.is_boolean()) {
            fail(fmt::format("'{}' must be true or false", key));
        }
        return value.get<bool>();
    }

    /** @brief Integer in [minimum, maximum]; checked before any narrowing. */
    [[nodiscard]] std::optional<long long> integer(const char* key, long long minimum, long long maximum) const {
        if (!has(key)) {
            return std::nullopt;
        }
        const json& value = object_.at(key);
        if (!value.is_number_integer()) {
            fail(fmt::format("'{}' must be an integer", key));
        }
        const bool in_range = value.is_number_unsigned()
            ? value.get<std::uint64_t>() <= static_cast<std::uint64_t>(maximum)
                && static_cast<long long>(value.get<std::uint64_t>()) >= minimum
            : value.get<long long>() >= minimum && value.get<long long>() <= maximum;
        if (!in_range) {
            fail(fmt::format("{} must be between {} and {}", key, minimum, maximum));
        }
        return value.get<long long>();
    }

    [[nodiscard]] std::vector<std::string> string_list(const char* key) const {
        std::vector<std::string> list_values;
        if (!has(key)) {
            return list_values;
        }
        const json& value = object_.at(key);
        if (!value.is_array()) {
            fail(fmt::format("'{}' must be an array of strings", key));
        }
        for (const json& element : value) {
            if (!element.is_string() || element.get<std::string>().empty()) {
                fail(fmt::format("'{}' must contain non-empty strings", key));
            }
            list_values.push_back(element.get<std::string>());
        }
        return list_values;
    }

    [[nodiscard]] std::map<std::string, std::string> string_map(const char* key) const {
        std::map<std::string, std::string> map_values;
        if (!has(key)) {
            return map_values;
        }
        const json& value = object_.at(key);
        if (!value.is_object()) {
            fail(fmt::format("'{}' must be an object", key));
        }
        for (const auto& [entry_key, entry_value] : value.items()) {
            if (!entry_value.is_string()) {
                fail(fmt::format("'{}.{}' must be a string", key, entry_key));
            }
            map_values.emplace(entry_key, entry_value.get<std::string>());
        }
        return map_values;
    }

    [[nodiscard]] RuleReader child(const char* key) const {
        const json& value = object_.at(key);
        if (!value.is_object()) {
            fail(fmt::format("'{}' must be an object", key));
        }
        return RuleReader{value, fmt::format("{}.{}", str_context_, key)};
    }

  private:
    const json& object_;
    std::string str_context_;
};

bool is_valid_rule_name(const std::string& name) {
    if (name.empty() || name.front() == '-' || name.back() == '-') {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
    });
}

void validate_host_template(const RuleReader& reader, const std::string& host_template, bool aggregate) {
    std::size_t position = 0;
    while ((position = host_template.find('{', position)) != std::string::npos) {
        const std::size_t close = host_template.find('}', position);
        if (close == std::string::npos) {
            reader.fail(fmt::format("unterminated placeholder in host '{}'", host_template));
        }
        const std::string placeholder = host_template.substr(position, close - position + 1);
        const bool known = std::find(std::begin(k_host_placeholders), std::end(k_host_placeholders), placeholder)
            != std::end(k_host_placeholders);
        if (!known) {
            reader.fail(fmt::format("unknown placeholder {} in host '{}'", placeholder, host_template));
        }
        if (aggregate && placeholder != "{rule}") {
            reader.fail(fmt::format("aggregate rules cannot use device placeholder {}", placeholder));
        }
        position = close + 1;
    }
    if (host_template.find('`') != std::string::npos) {
        reader.fail("host must not contain backticks");
    }
}

TlsPolicy read_tls(const RuleReader& reader, Protocol protocol) {
    reader.reject_unknown_keys(k_tls_keys);
    TlsPolicy tls{};
    tls.cert_resolver = reader.string("cert_resolver");
    tls.passthrough = reader.boolean("passthrough");
    tls.backend_scheme = reader.string("backend_scheme");
    if (tls.passthrough && protocol != Protocol::Tcp) {
        reader.fail("passthrough is only valid for tcp rules");
    }
    if (!tls.backend_scheme.empty()) {
        if (protocol != Protocol::Http) {
            reader.fail("backend_scheme is only valid for http rules");
        }
        if (tls.backend_scheme != "http" && tls.backend_scheme != "https") {
            reader.fail("backend_scheme must be http or https");
        }
    }
    return tls;
}

HealthCheckHints read_health_check(const RuleReader& reader) {
    reader.reject_unknown_keys(k_health_check_keys);
    HealthCheckHints health_check{};
    health_check.path = reader.string("path", true);
    if (health_check.path.empty() || health_check.path.front() != '/') {
        reader.fail("path must start with '/'");
    }
    health_check.interval = reader.string("interval");
    health_check.timeout = reader.string("timeout");
    return health_check;
}

SelectionRule read_rule(const json& object, std::size_t index) {
    if (!object.is_object()) {
        throw SelectionConfigError(fmt::format("rules[{}] must be an object", index));
    }
    const std::string raw_name = object.contains("name") && object.at("name").is_string()
        ? object.at("name").get<std::string>()
        : std::string{};
    const RuleReader reader{object, raw_name.empty() ? fmt::format("rules[{}]", index) : fmt::format("rule '{}'", raw_name)};
    reader.reject_unknown_keys(k_rule_keys);

    SelectionRule rule{};
    rule.name = reader.string("name", true);
    if (!is_valid_rule_name(rule.name)) {
        reader.fail("name must match [a-z0-9-]+ and not start or end with '-'");
    }
    rule.match = TagPredicate::parse(reader.string("match", true));

    RoutingHints& hints = rule.hints;
    const std::string protocol_name = reader.string("protocol");
    if (!protocol_name.empty()) {
        if (protocol_name != "http" && protocol_name != "tcp" && protocol_name != "udp") {
            reader.fail("protocol must be http, tcp or udp");
        }
        hints.protocol = parse_protocol(protocol_name).value_or(Protocol::Http);
    }

    if (const auto port = reader.integer("port", 1, 65535)) {
        hints.port = static_cast<std::uint16_t>(*port);
    }
    hints.require_advertised = reader.boolean("require_advertised");
    hints.port_name = reader.string("port_name");
    if (hints.require_advertised && !hints.port.has_value()) {
        reader.fail("require_advertised needs a port");
    }
    if (hints.port.has_value() && !hints.port_name.empty()) {
        reader.fail("port and port_name are mutually exclusive");
    }

    hints.aggregate = reader.boolean("aggregate");
    hints.host_template = reader.string("host");
    if (!hints.host_template.empty()) {
        if (hints.protocol == Protocol::Udp) {
            reader.fail("udp rules cannot match on host");
        }
        validate_host_template(reader, hints.host_template, hints.aggregate);
    }

    hints.path_prefix = reader.string("path_prefix");
    hints.strip_prefix = reader.boolean("strip_prefix");
    hints.request_headers = reader.string_map("request_headers");
    hints.middlewares = reader.string_list("middlewares");
    for (const auto& middleware : hints.middlewares) {
        if (middleware.find('@') == std::string::npos) {
            reader.fail(fmt::format("middleware '{}' must name its provider (name@provider)", middleware));
        }
    }
    hints.entry_points = reader.string_list("entry_points");
    if (const auto retry_attempts = reader.integer("retry_attempts", 1, k_int_max)) {
        hints.retry_attempts = static_cast<int>(*retry_attempts);
    }
    if (const auto priority = reader.integer("priority", 0, k_int_max)) {
        hints.priority = static_cast<int>(*priority);
    }
    if (reader.has("health_check")) {
        hints.health_check = read_health_check(reader.child("health_check"));
    }
    if (reader.has("tls")) {
        if (hints.protocol == Protocol::Udp) {
            reader.fail("udp rules cannot use tls");
        }
        hints.tls = read_tls(reader.child("tls"), hints.protocol);
    }

    const bool http_only_used = !hints.path_prefix.empty() || hints.strip_prefix || !hints.request_headers.empty()
        || !hints.middlewares.empty() || hints.retry_attempts.has_value() || hints.health_check.has_value();
    if (hints.protocol != Protocol::Http && http_only_used) {
        reader.fail("path_prefix, strip_prefix, middlewares, request_headers, retry_attempts and health_check are http-only");
    }
    // Traefik only routes a named HostSNI once TLS terminates or passes through.
    if (hints.protocol == Protocol::Tcp && !hints.host_template.empty() && !hints.tls.has_value()) {
        reader.fail("tcp rules matching on host need tls");
    }
    if (hints.protocol == Protocol::Udp && hints.priority.has_value()) {
        reader.fail("udp rules have no priority");
    }
    if (!hints.path_prefix.empty() && hints.path_prefix.front() != '/') {
        reader.fail("path_prefix must start with '/'");
    }
    if (hints.path_prefix.find('`') != std::string::npos) {
        reader.fail("path_prefix must not contain backticks");
    }
    if (hints.strip_prefix && hints.path_prefix.empty()) {
        reader.fail("strip_prefix needs a path_prefix");
    }
    return rule;
}

}  // namespace

RuleSet parse_rule_set(std::string_view document) {
    const json root = json::parse(document.begin(), document.end(), nullptr, false);
    if (root.is_discarded()) {
        throw SelectionConfigError("Rule set is not valid JSON");
    }
    if (!root.is_object()) {
        throw SelectionConfigError("Rule set must be a JSON object");
    }
    for (const auto& [key, value] : root.items()) {
        if (key != "rules" && key != "reload") {
            throw SelectionConfigError(fmt::format("Rule set has unknown key '{}'", key));
        }
    }

    RuleSet rule_set{};
    if (root.contains("reload")) {
        const json& reload = root.at("reload");
        if (reload == "restart") {
            rule_set.reload = ReloadPolicy::Restart;
        } else if (reload == "sighup") {
            rule_set.reload = ReloadPolicy::Sighup;
        } else {
            throw SelectionConfigError("Rule set 'reload' must be \"restart\" or \"sighup\"");
        }
    }

    const auto iterator_rules = root.find("rules");
    if (iterator_rules == root.end() || !iterator_rules->is_array() || iterator_rules->empty()) {
        throw SelectionConfigError("Rule set needs a non-empty 'rules' array");
    }

    std::set<std::string> set_names;
    for (std::size_t index = 0; index < iterator_rules->size(); ++index) {
        SelectionRule rule = read_rule(iterator_rules->at(index), index);
        if (!set_names.insert(rule.name).second) {
            throw SelectionConfigError(fmt::format("Duplicate rule name '{}'", rule.name));
        }
        rule_set.rules.push_back(std::move(rule));
    }
    return rule_set;
}

RuleSet load_rule_set(const std::filesystem::path& path) {
    std::ifstream input{path};
    if (!input) {
        throw SelectionConfigError(fmt::format("Cannot open rule set {}", path.string()));
    }
    std::ostringstream contents;
    contents << input.rdbuf();
    try {
        return parse_rule_set(contents.str());
    } catch (const SelectionConfigError& error) {
        throw SelectionConfigError(fmt::format("{}: {}", path.string(), error.what()));
    }
}

}  // namespace tailroute
