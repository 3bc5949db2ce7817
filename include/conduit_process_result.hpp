#pragma once

#include <cstddef>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

namespace conduit {

    // Output of a processing function with two outputs. An empty slot means
    // "send nothing on that output this cycle"; it is neither an error nor blocking.
    template <typename U, typename V>
    struct ProcessResult2 {
        std::optional<U> first;
        std::optional<V> second;

        static ProcessResult2 of(std::optional<U> a, std::optional<V> b) {
            return ProcessResult2{std::move(a), std::move(b)};
        }
        static ProcessResult2 both(U a, V b) {
            return ProcessResult2{std::move(a), std::move(b)};
        }
        static ProcessResult2 first_only(U a) {
            return ProcessResult2{std::move(a), std::nullopt};
        }
        static ProcessResult2 second_only(V b) {
            return ProcessResult2{std::nullopt, std::move(b)};
        }
        static ProcessResult2 none() { return ProcessResult2{}; }

        bool has_any() const { return first.has_value() || second.has_value(); }

        template <std::size_t I>
        auto& get() & {
            static_assert(I < 2, "ProcessResult2 has two slots");
            if constexpr (I == 0) return first;
            else return second;
        }
        template <std::size_t I>
        const auto& get() const& {
            static_assert(I < 2, "ProcessResult2 has two slots");
            if constexpr (I == 0) return first;
            else return second;
        }
        template <std::size_t I>
        auto&& get() && {
            static_assert(I < 2, "ProcessResult2 has two slots");
            if constexpr (I == 0) return std::move(first);
            else return std::move(second);
        }
    };

    template <typename U, typename V, typename W>
    struct ProcessResult3 {
        std::optional<U> first;
        std::optional<V> second;
        std::optional<W> third;

        static ProcessResult3 of(std::optional<U> a, std::optional<V> b, std::optional<W> c) {
            return ProcessResult3{std::move(a), std::move(b), std::move(c)};
        }
        static ProcessResult3 all(U a, V b, W c) {
            return ProcessResult3{std::move(a), std::move(b), std::move(c)};
        }
        static ProcessResult3 first_only(U a) {
            return ProcessResult3{std::move(a), std::nullopt, std::nullopt};
        }
        static ProcessResult3 second_only(V b) {
            return ProcessResult3{std::nullopt, std::move(b), std::nullopt};
        }
        static ProcessResult3 third_only(W c) {
            return ProcessResult3{std::nullopt, std::nullopt, std::move(c)};
        }
        static ProcessResult3 none() { return ProcessResult3{}; }

        bool has_any() const {
            return first.has_value() || second.has_value() || third.has_value();
        }

        template <std::size_t I>
        auto& get() & {
            static_assert(I < 3, "ProcessResult3 has three slots");
            if constexpr (I == 0) return first;
            else if constexpr (I == 1) return second;
            else return third;
        }
        template <std::size_t I>
        const auto& get() const& {
            static_assert(I < 3, "ProcessResult3 has three slots");
            if constexpr (I == 0) return first;
            else if constexpr (I == 1) return second;
            else return third;
        }
        template <std::size_t I>
        auto&& get() && {
            static_assert(I < 3, "ProcessResult3 has three slots");
            if constexpr (I == 0) return std::move(first);
            else if constexpr (I == 1) return std::move(second);
            else return std::move(third);
        }
    };

} // namespace conduit

// structured bindings: auto [a, b] = result;
namespace std {
    template <typename U, typename V>
    struct tuple_size<conduit::ProcessResult2<U, V>> : std::integral_constant<std::size_t, 2> {};
    template <std::size_t I, typename U, typename V>
    struct tuple_element<I, conduit::ProcessResult2<U, V>> {
        using type = std::conditional_t<I == 0, std::optional<U>, std::optional<V>>;
    };

    template <typename U, typename V, typename W>
    struct tuple_size<conduit::ProcessResult3<U, V, W>> : std::integral_constant<std::size_t, 3> {};
    template <std::size_t I, typename U, typename V, typename W>
    struct tuple_element<I, conduit::ProcessResult3<U, V, W>> {
        using type = std::conditional_t<I == 0, std::optional<U>,
                     std::conditional_t<I == 1, std::optional<V>, std::optional<W>>>;
    };
} // namespace std
