#pragma once

#include "opfreq/analysis.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace opfreq::opcode {

    using namespace std::string_view_literals;

    constexpr bool ascii_is_digit(char c) noexcept {
        return c >= '0' && c <= '9';
    }

    constexpr bool ascii_is_upper(char c) noexcept {
        return c >= 'A' && c <= 'Z';
    }

    constexpr bool ascii_is_word(char c) noexcept {
        auto lower = static_cast<char>(c | 0x20);
        return ascii_is_digit(c) || (lower >= 'a' && lower <= 'z') || c == '_';
    }

    constexpr bool ascii_is_blank(char c) noexcept {
        return c == ' ' || c == '\t' || c == '\v' || c == '\f';
    }

    constexpr std::string_view skip_blanks(std::string_view value) noexcept {
        size_t i = 0U;
        while (i < value.size() && ascii_is_blank(value[i])) {
            ++i;
        }
        return value.substr(i);
    }

    // "L12:   LOADK R0 K3" -> "LOADK R0 K3"; lines without a jump label are returned untouched
    constexpr std::string_view strip_label_prefix(std::string_view line) noexcept {
        if (line.size() < 3U || line[0] != 'L' || !ascii_is_digit(line[1])) {
            return line;
        }

        size_t i = 2U;
        while (i < line.size() && ascii_is_digit(line[i])) {
            ++i;
        }
        if (i == line.size() || line[i] != ':') {
            return line;
        }
        return skip_blanks(line.substr(i + 1U));
    }

    /*
     * Matches [A-Z][A-Z0-9_]* anchored at the start of `text`. The token must end on a word
     * boundary, so "Function 0" and "LOADKx" produce no match rather than "F" or a truncation.
     */
    constexpr std::string_view match_opcode_name(std::string_view text) noexcept {
        if (text.empty() || !ascii_is_upper(text.front())) {
            return {};
        }

        size_t end = 1U;
        while (end < text.size() && (ascii_is_upper(text[end]) || ascii_is_digit(text[end]) || text[end] == '_')) {
            ++end;
        }
        if (end < text.size() && ascii_is_word(text[end])) {
            return {};
        }
        return text.substr(0U, end);
    }

    // Visits each line; "\n", "\r\n" and a lone "\r" all terminate a line.
    template <typename F>
    constexpr void for_each_line(std::string_view text, F&& fn) {
        size_t begin = 0U;
        while (begin < text.size()) {
            auto end = text.find_first_of("\r\n"sv, begin);
            if (end == std::string_view::npos) {
                fn(text.substr(begin));
                return;
            }

            fn(text.substr(begin, end - begin));

            if (text[end] == '\r' && end + 1U < text.size() && text[end + 1U] == '\n') {
                ++end;
            }
            begin = end + 1U;
        }
    }

    inline std::string_view opcode_of_line(std::string_view line) noexcept {
        auto body = strip_label_prefix(line);
        if (body.empty()) {
            return {};
        }
        return match_opcode_name(skip_blanks(body));
    }

    inline opcode_counts extract_opcodes(std::string_view disassembly) {
        opcode_counts counts{};
        for_each_line(disassembly, [&counts](std::string_view line) {
            auto name = opcode_of_line(line);
            if (name.empty()) {
                return;
            }
            if (auto it = counts.find(name); it != counts.end()) {
                ++it->second;
            }
            else {
                counts.emplace(std::string{name}, 1U);
            }
        });
        return counts;
    }

    /*
     * Lenient decode of compiler output: well-formed UTF-8 passes through, every byte that
     * cannot start or continue a valid sequence is replaced with U+FFFD.
     */
    inline std::string sanitize_utf8(std::string_view bytes) {
        static constexpr auto replacement = "\xEF\xBF\xBD"sv;

        std::string out{};
        out.reserve(bytes.size());

        size_t i = 0U;
        while (i < bytes.size()) {
            auto lead = static_cast<uint8_t>(bytes[i]);
            if (lead < 0x80U) {
                out.push_back(static_cast<char>(lead));
                ++i;
                continue;
            }

            size_t len = 0U;
            uint8_t lo = 0x80U;
            uint8_t hi = 0xBFU;
            if (lead >= 0xC2U && lead <= 0xDFU) {
                len = 2U;
            }
            else if (lead >= 0xE0U && lead <= 0xEFU) {
                len = 3U;
                if (lead == 0xE0U) {
                    lo = 0xA0U;
                }
                else if (lead == 0xEDU) {
                    hi = 0x9FU;
                }
            }
            else if (lead >= 0xF0U && lead <= 0xF4U) {
                len = 4U;
                if (lead == 0xF0U) {
                    lo = 0x90U;
                }
                else if (lead == 0xF4U) {
                    hi = 0x8FU;
                }
            }

            if (len == 0U) {
                out.append(replacement);
                ++i;
                continue;
            }

            // maximal subpart: consume the valid prefix of a truncated sequence as one replacement
            size_t consumed = 1U;
            bool valid = true;
            while (consumed < len) {
                if (i + consumed >= bytes.size()) {
                    valid = false;
                    break;
                }
                auto c = static_cast<uint8_t>(bytes[i + consumed]);
                auto min = consumed == 1U ? lo : uint8_t{0x80U};
                auto max = consumed == 1U ? hi : uint8_t{0xBFU};
                if (c < min || c > max) {
                    valid = false;
                    break;
                }
                ++consumed;
            }

            if (valid) {
                out.append(bytes.substr(i, len));
            }
            else {
                out.append(replacement);
            }
            i += consumed;
        }
        return out;
    }

}  // namespace opfreq::opcode
