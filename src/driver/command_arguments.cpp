#include "pinworks/command_arguments.hpp"

#include <charconv>
#include <limits>
#include <system_error>

namespace pinworks {

uint64_t parse_unsigned(std::string_view token, std::string_view what) {
    int base = 10;
    std::string_view digits = token;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        base = 16;
        digits.remove_prefix(2);
    }

    uint64_t parsed = 0;
    const char* end = digits.data() + digits.size();
    const auto result = std::from_chars(digits.data(), end, parsed, base);
    if (digits.empty() || result.ec != std::errc() || result.ptr != end) {
        throw std::invalid_argument(std::string(what) + " expects a non-negative integer, got '" +
                                    std::string(token) + "'");
    }
    return parsed;
}

CommandArguments::CommandArguments() = default;

CommandArguments::CommandArguments(std::unordered_map<std::string, std::vector<std::string>> options,
                                   std::vector<std::string> positionals)
    : options_(std::move(options)), positionals_(std::move(positionals)) {}

bool CommandArguments::has(std::string_view long_name) const {
    return options_.count(std::string(long_name)) != 0;
}

const std::vector<std::string>& CommandArguments::values(std::string_view long_name) const {
    static const std::vector<std::string> none;
    const auto it = options_.find(std::string(long_name));
    return it == options_.end() ? none : it->second;
}

std::optional<std::string> CommandArguments::value(std::string_view long_name) const {
    const auto& all = values(long_name);
    if (all.empty()) {
        return std::nullopt;
    }
    return all.front();
}

std::string CommandArguments::value_or(std::string_view long_name, std::string_view fallback) const {
    return value(long_name).value_or(std::string(fallback));
}

uint64_t CommandArguments::value_as_uint(std::string_view long_name, uint64_t fallback) const {
    const auto text = value(long_name);
    if (!text) {
        return fallback;
    }
    return parse_unsigned(*text, "Option '--" + std::string(long_name) + "'");
}

std::size_t CommandArguments::positional_count() const noexcept {
    return positionals_.size();
}

const std::string& CommandArguments::positional(std::size_t index) const {
    if (index >= positionals_.size()) {
        throw std::out_of_range("missing positional argument " + std::to_string(index + 1));
    }
    return positionals_[index];
}

uint32_t CommandArguments::positional_as_uint(std::size_t index, std::string_view what) const {
    const uint64_t parsed = parse_unsigned(positional(index), what);
    if (parsed > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument(std::string(what) + " is out of range");
    }
    return static_cast<uint32_t>(parsed);
}

} // namespace pinworks
