#pragma once

#include "utils.hpp"

#include <array>
#include <cstdint>
#include <format>
#include <string>

namespace opfreq {
    namespace detail {
        template <size_t N>
        struct string_literal {
            std::array<char, N> str;

            consteval string_literal(const char (&s)[N]) { std::ranges::copy(s, s + N, str.begin()); }
            constexpr std::string_view sv() const { return {str.data(), N - 1}; }
        };

        template <string_literal Format>
        struct format_wrapper {
            consteval format_wrapper() = default;

            template <typename... T>
            constexpr auto operator()(T&&... args) && {
                return std::format(Format.sv(), std::forward<T>(args)...);
            }
        };
    }  // namespace detail

    namespace literals {
        template <detail::string_literal Format>
        inline consteval auto operator""_format() {
            return detail::format_wrapper<Format>{};
        }
    }  // namespace literals

    /*
     * Share of `count` in `total` as a percentage with one decimal place. The quotient is
     * computed as count / total * 100 and rounded by std::format, which rounds the binary
     * double correctly (ties resolve the same way printf does). A zero total yields "0.0".
     */
    inline std::string format_percentage(uint64_t count, uint64_t total) {
        auto pct = total > 0U ? (static_cast<double>(count) / static_cast<double>(total)) * 100.0 : 0.0;
        return std::format("{:.1f}", pct);
    }

}  // namespace opfreq
