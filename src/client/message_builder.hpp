/**
 * @file message_builder.hpp
 * @brief Joins message fragments with single spaces.
 * @author log_courier contributors
 */

#pragma once

#include <charconv>
#include <string>
#include <string_view>
#include <type_traits>

namespace log_courier {

/**
 * @brief Collects already-formatted fragments into one title.
 *
 *   session.log(Level::Warning, MessageBuilder{"retry", attempt, "of", limit});
 *
 * Arithmetic fragments are converted with std::to_chars; everything else
 * must be convertible to std::string_view.
 */
class MessageBuilder {
public:
    MessageBuilder() = default;

    template <typename... Fragments>
    explicit MessageBuilder(const Fragments&... fragments) {
        (add(fragments), ...);
    }

    template <typename T>
    MessageBuilder& add(const T& fragment) {
        if constexpr (std::is_same_v<T, bool>) {
            append(fragment ? "true" : "false");
        } else if constexpr (std::is_same_v<T, char>) {
            append(std::string_view(&fragment, 1));
        } else if constexpr (std::is_arithmetic_v<T>) {
            char buf[64];
            auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), fragment);
            append(ec == std::errc{} ? std::string_view(buf, static_cast<size_t>(end - buf))
                                     : std::string_view{"?"});
        } else {
            append(std::string_view(fragment));
        }
        return *this;
    }

    template <typename T>
    MessageBuilder& operator<<(const T& fragment) { return add(fragment); }

    [[nodiscard]] const std::string& str() const noexcept { return text_; }
    [[nodiscard]] bool empty() const noexcept { return text_.empty(); }

private:
    void append(std::string_view fragment) {
        if (count_++ > 0) text_.push_back(' ');
        text_.append(fragment);
    }

    std::string text_;
    size_t count_ = 0;
};

}  // namespace log_courier
