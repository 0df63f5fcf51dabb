/**
 * @file RadixKey.hpp
 * @brief Key-byte extraction capability consumed by the sort engine.
 *
 * An extractor answers two questions: how many digits (bytes) the key of
 * an item has, and what the byte at a given digit index is, index 0 being
 * the most significant.  Any type modelling KeyExtractor can drive the
 * engine; two ready-made models are provided:
 *
 *  - TraitsExtractor<T>, backed by the RadixKeyTraits<T> customisation
 *    point (specialised here for integers, floating point, byte arrays
 *    and pairs of keyed types);
 *  - FunctionExtractor<F>, built from a digit count and a closure, for
 *    partial keys and ad-hoc composite keys.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDX_RADIX_RADIX_KEY_HPP
    #define RDX_RADIX_RADIX_KEY_HPP

    #include <rdx/core/Concepts.hpp>
    #include <rdx/core/Types.hpp>

    #include <array>
    #include <bit>
    #include <concepts>
    #include <functional>
    #include <type_traits>
    #include <utility>

namespace rdx::radix {

/**
 * @brief A capability extracting digit @p index of an item of type @p T.
 *
 * digitCount() must be constant for the extractor and digitAt() must be
 * referentially consistent for the duration of a sort call.
 */
template <typename E, typename T>
concept KeyExtractor = requires(const E &extractor, const T &item, core::usize index) {
    { extractor.digitCount() }           -> std::convertible_to<core::usize>;
    { extractor.digitAt(item, index) }   -> std::convertible_to<core::u8>;
};

/**
 * @brief Customisation point: specialise for item types with a natural
 *        byte-sequence key.
 *
 * A specialisation exposes `static constexpr core::usize kDigits` and
 * `static core::u8 digitAt(const T &, core::usize)`.
 */
template <typename T>
struct RadixKeyTraits;

/**
 * @brief A type with a usable RadixKeyTraits specialisation.
 */
template <typename T>
concept HasRadixKey = requires(const T &item, core::usize index) {
    { RadixKeyTraits<T>::kDigits }              -> std::convertible_to<core::usize>;
    { RadixKeyTraits<T>::digitAt(item, index) } -> std::convertible_to<core::u8>;
};

// ---- Default traits ------------------------------------------------------

namespace detail {

template <std::unsigned_integral U>
[[nodiscard]] constexpr core::u8 bigEndianByte(U value, core::usize index) noexcept
{
    return static_cast<core::u8>(value >> ((sizeof(U) - 1 - index) * 8));
}

} // namespace detail

/// Unsigned integers, most significant byte first.
template <typename T>
    requires (core::NonBoolIntegral<T> && std::is_unsigned_v<T>)
struct RadixKeyTraits<T> {
    static constexpr core::usize kDigits = sizeof(T);

    static constexpr core::u8 digitAt(T value, core::usize index) noexcept
    {
        return detail::bigEndianByte(value, index);
    }
};

/// Signed integers: the sign bit is flipped so negatives order first.
template <typename T>
    requires (core::NonBoolIntegral<T> && std::is_signed_v<T>)
struct RadixKeyTraits<T> {
    static constexpr core::usize kDigits = sizeof(T);

    static constexpr core::u8 digitAt(T value, core::usize index) noexcept
    {
        using U = std::make_unsigned_t<T>;
        const U flipped = static_cast<U>(value) ^ (U{1} << (sizeof(T) * 8 - 1));
        return detail::bigEndianByte(flipped, index);
    }
};

/// IEEE-754 floats: negatives fully inverted, positives sign-flipped.
template <std::floating_point T>
    requires (sizeof(T) == 4 || sizeof(T) == 8)
struct RadixKeyTraits<T> {
    static constexpr core::usize kDigits = sizeof(T);

    static constexpr core::u8 digitAt(T value, core::usize index) noexcept
    {
        using U = std::conditional_t<sizeof(T) == 4, core::u32, core::u64>;
        constexpr U kSign = U{1} << (sizeof(T) * 8 - 1);

        const U bits = std::bit_cast<U>(value);
        const U key  = (bits & kSign) ? static_cast<U>(~bits) : static_cast<U>(bits ^ kSign);
        return detail::bigEndianByte(key, index);
    }
};

/// Fixed byte strings: byte i is digit i.
template <core::usize N>
struct RadixKeyTraits<std::array<core::u8, N>> {
    static constexpr core::usize kDigits = N;

    static constexpr core::u8 digitAt(const std::array<core::u8, N> &value, core::usize index) noexcept
    {
        return value[index];
    }
};

/// Multi-value keys: every digit of @c first, then every digit of @c second.
template <HasRadixKey A, HasRadixKey B>
struct RadixKeyTraits<std::pair<A, B>> {
    static constexpr core::usize kDigits = RadixKeyTraits<A>::kDigits + RadixKeyTraits<B>::kDigits;

    static constexpr core::u8 digitAt(const std::pair<A, B> &value, core::usize index) noexcept
    {
        if (index < RadixKeyTraits<A>::kDigits)
            return RadixKeyTraits<A>::digitAt(value.first, index);
        return RadixKeyTraits<B>::digitAt(value.second, index - RadixKeyTraits<A>::kDigits);
    }
};

// ---- Extractors ----------------------------------------------------------

/**
 * @brief Extractor forwarding to RadixKeyTraits<T>.
 */
template <HasRadixKey T>
struct TraitsExtractor {
    [[nodiscard]] constexpr core::usize digitCount() const noexcept
    {
        return RadixKeyTraits<T>::kDigits;
    }

    [[nodiscard]] constexpr core::u8 digitAt(const T &item, core::usize index) const noexcept
    {
        return RadixKeyTraits<T>::digitAt(item, index);
    }
};

/**
 * @brief Extractor built from a digit count and a `(item, index) -> u8`
 *        callable.
 *
 * The callable is invoked concurrently from several workers and must not
 * carry mutable state.
 */
template <typename F>
class FunctionExtractor {
public:
    constexpr FunctionExtractor(core::usize digitCount, F fn)
        : _digitCount(digitCount), _fn(std::move(fn)) {}

    [[nodiscard]] constexpr core::usize digitCount() const noexcept { return _digitCount; }

    template <typename T>
    [[nodiscard]] constexpr core::u8 digitAt(const T &item, core::usize index) const
    {
        return static_cast<core::u8>(std::invoke(_fn, item, index));
    }

private:
    core::usize _digitCount;
    F           _fn;
};

/**
 * @brief Build a FunctionExtractor.
 * @param digitCount Number of digits considered for every item.
 * @param fn         Callable `(const T &item, usize index) -> u8`.
 */
template <typename F>
[[nodiscard]] constexpr FunctionExtractor<std::decay_t<F>> makeExtractor(core::usize digitCount, F &&fn)
{
    return FunctionExtractor<std::decay_t<F>>{digitCount, std::forward<F>(fn)};
}

} // namespace rdx::radix

#endif // RDX_RADIX_RADIX_KEY_HPP
