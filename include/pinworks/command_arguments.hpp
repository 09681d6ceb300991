#ifndef PINWORKS_COMMAND_ARGUMENTS_HPP
#define PINWORKS_COMMAND_ARGUMENTS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pinworks {

class CommandArguments {
public:
    CommandArguments();
    CommandArguments(std::unordered_map<std::string, std::vector<std::string>> options,
                     std::vector<std::string> positionals);

    bool has(std::string_view long_name) const;
    const std::vector<std::string>& values(std::string_view long_name) const;
    std::optional<std::string> value(std::string_view long_name) const;
    std::string value_or(std::string_view long_name, std::string_view fallback) const;

    uint64_t value_as_uint(std::string_view long_name, uint64_t fallback) const;

    std::size_t positional_count() const noexcept;
    const std::string& positional(std::size_t index) const;
    // Positional parsed as a non-negative integer (decimal or 0x hex).
    uint32_t positional_as_uint(std::size_t index, std::string_view what) const;
    const std::vector<std::string>& positionals() const noexcept { return positionals_; }

private:
    std::unordered_map<std::string, std::vector<std::string>> options_;
    std::vector<std::string> positionals_;
};

// Decimal or 0x-prefixed hex, whole token; throws std::invalid_argument.
uint64_t parse_unsigned(std::string_view token, std::string_view what);

} // namespace pinworks

#endif // PINWORKS_COMMAND_ARGUMENTS_HPP
