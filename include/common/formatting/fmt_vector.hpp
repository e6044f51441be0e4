// File: common/formatting/fmt_vector.hpp

#ifndef COMMON_FORMATTING_FMT_VECTOR_HPP
#define COMMON_FORMATTING_FMT_VECTOR_HPP

#include <fmt/format.h>
#include <vector>

// Formats std::vector as "[a, b, c]"; elements use their own formatter
template<typename T, typename Alloc>
struct fmt::formatter<std::vector<T, Alloc>> {
    constexpr auto parse(fmt::format_parse_context &ctx) -> decltype(ctx.begin()) {
        return ctx.begin();
    }

    template<typename FormatContext>
    auto format(const std::vector<T, Alloc> &vec, FormatContext &ctx) const -> decltype(ctx.out()) {
        auto out = ctx.out();
        *out++ = '[';

        for (size_t i = 0; i < vec.size(); ++i) {
            if (i != 0) {
                *out++ = ',';
                *out++ = ' ';
            }
            out = fmt::format_to(out, "{}", vec[i]);
        }

        *out++ = ']';
        return out;
    }
};

#endif // COMMON_FORMATTING_FMT_VECTOR_HPP
