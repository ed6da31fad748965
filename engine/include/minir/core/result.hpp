#pragma once

#include <expected>
#include <format>
#include <string>
#include <utility>

namespace minir::core {

    // Fallible factory return. The error carries a human-readable reason.
    template<typename T>
    using Result = std::expected<T, std::string>;

    template<typename... Args>
    [[nodiscard]] std::unexpected<std::string> fail(std::format_string<Args...> fmt, Args&&... args)
    {
        return std::unexpected(std::format(fmt, std::forward<Args>(args)...));
    }

}
