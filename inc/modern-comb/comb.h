// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_COMB_COMB_H_INCLUDED
#define HEADER_MODERN_COMB_COMB_H_INCLUDED

#include <modern-comb/common.h>

#if defined(_WIN32)
    #include <guiddef.h>
#endif

namespace mcomb {

    /**
     * Field layout of Windows GUID and ODBC SQLGUID structures
     *
     * The fields are host integers. comb stores them big-endian in the same order.
     */
    struct comb_parts {
        uint32_t    data1;
        uint16_t    data2;
        uint16_t    data3;
        uint8_t     data4[8];
    };


    /**
     * A COMB identifier
     *
     * 10 random bytes followed by a 2 byte big-endian day counter and a 4 byte big-endian
     * counter of 1/300 second ticks since midnight. SQL Server compares uniqueidentifier
     * values starting from the last 6 bytes so COMBs sort there in creation order.
     *
     * Bytes are stored in the order of the textual representation.
     */
    class comb {
    public:
        /// Whether to print comb in lower or upper case
        enum format {
            lowercase,
            uppercase
        };

        /// Number of characters in string representation of comb
        static constexpr size_t char_length = 36;
        /// Number of characters in string representation of comb surrounded by braces
        static constexpr size_t braced_char_length = comb::char_length + 2;

        /// Offset of the big-endian day counter
        static constexpr size_t day_field_offset = 10;
        /// Offset of the big-endian time of day counter
        static constexpr size_t time_field_offset = 12;
    private:
        static constexpr bool dash_before(size_t byte_idx) noexcept {
            return byte_idx == 4 || byte_idx == 6 || byte_idx == 8 || byte_idx == 10;
        }

        template<impl::char_like T>
        static constexpr bool read(const T * str, std::span<uint8_t, 16> dest) noexcept {
            for (size_t i = 0; i < dest.size(); ++i) {
                if (comb::dash_before(i) && *str++ != T('-'))
                    return false;
                uint8_t high = impl::hex_digit_value(*str++);
                uint8_t low = impl::hex_digit_value(*str++);
                if (high > 0x0F || low > 0x0F)
                    return false;
                dest[i] = uint8_t((high << 4) | low);
            }
            return true;
        }

        template<impl::char_like T>
        static constexpr void write(std::span<const uint8_t, 16> src, T * str, format fmt) noexcept {
            const bool upper = (fmt == comb::uppercase);
            for (size_t i = 0; i < src.size(); ++i) {
                if (comb::dash_before(i))
                    *str++ = T('-');
                *str++ = impl::hex_digit<T>(uint8_t(src[i] >> 4), upper);
                *str++ = impl::hex_digit<T>(uint8_t(src[i] & 0x0F), upper);
            }
        }
    public:
        std::array<uint8_t, 16> bytes{};

    public:
        ///Constructs a Nil comb
        constexpr comb() noexcept = default;

        ///Constructs comb from a string literal
        template<impl::char_like T>
        consteval comb(const T (&src)[comb::char_length + 1]) noexcept {
            if (!comb::read(src, this->bytes) || src[comb::char_length] != 0)
                impl::invalid_constexpr_call("invalid comb string");
        }

        /// Constructs comb from a span of 16 byte-like objects
        template<impl::byte_like Byte>
        constexpr comb(std::span<Byte, 16> src) noexcept {
            std::transform(src.begin(), src.end(), this->bytes.begin(), [](Byte b) {
                return static_cast<uint8_t>(b);
            });
        }

        /// Constructs comb from anything convertible to a span of 16 byte-like objects
        template<class T>
        requires( !impl::is_span<T> && requires(const T & x) {
            std::span{x};
            requires impl::byte_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
            requires decltype(std::span{x})::extent == 16;
        })
        constexpr comb(const T & src) noexcept:
            comb{std::span{src}}
        {}

        /// Constructs comb from GUID-style fields
        constexpr comb(const comb_parts & parts) noexcept {
            auto dest = this->bytes.data();
            dest = impl::write_bytes(parts.data1, dest);
            dest = impl::write_bytes(parts.data2, dest);
            dest = impl::write_bytes(parts.data3, dest);
            std::copy(std::begin(parts.data4), std::end(parts.data4), dest);
        }

    #ifdef _WIN32
        /// Constructs comb from Windows GUID
        constexpr comb(const GUID & guid) noexcept:
            comb(comb_parts{uint32_t(guid.Data1), guid.Data2, guid.Data3,
                            {guid.Data4[0], guid.Data4[1], guid.Data4[2], guid.Data4[3],
                             guid.Data4[4], guid.Data4[5], guid.Data4[6], guid.Data4[7]}})
        {}
    #endif

        /**
         * Generates a new comb from fresh random bytes and the current time
         *
         * @throws boost::uuids::entropy_error if the system cannot supply random bytes
         */
        MCOMB_EXPORTED static auto generate() -> comb;

        /// Returns a Max comb
        static constexpr comb max() noexcept
            { return comb("FFFFFFFF-FFFF-FFFF-FFFF-FFFFFFFFFFFF"); }

        /// Resets the object to a Nil comb
        constexpr void clear() noexcept {
            *this = comb();
        }

        /**
         * Returns the stored day counter
         *
         * This is the low 16 bits of the number of days since 1900-01-01
         */
        constexpr auto day_field() const noexcept -> uint16_t {
            uint16_t ret = 0;
            impl::read_bytes(this->bytes.data() + comb::day_field_offset, ret);
            return ret;
        }

        /**
         * Returns the stored time of day counter
         *
         * This is the low 32 bits of the number of 1/300 second ticks since midnight
         */
        constexpr auto time_field() const noexcept -> uint32_t {
            uint32_t ret = 0;
            impl::read_bytes(this->bytes.data() + comb::time_field_offset, ret);
            return ret;
        }

        constexpr friend auto operator==(const comb & lhs, const comb & rhs) noexcept -> bool = default;
        constexpr friend auto operator<=>(const comb & lhs, const comb & rhs) noexcept -> std::strong_ordering = default;

        /// Converts comb to GUID-style fields
        constexpr auto to_parts() const noexcept -> comb_parts {
            comb_parts ret{};
            auto ptr = this->bytes.data();
            ptr = impl::read_bytes(ptr, ret.data1);
            ptr = impl::read_bytes(ptr, ret.data2);
            ptr = impl::read_bytes(ptr, ret.data3);
            std::copy(ptr, ptr + std::size(ret.data4), ret.data4);
            return ret;
        }

    #ifdef _WIN32
        /// Converts comb to Windows GUID
        constexpr auto to_GUID() const noexcept -> GUID {
            comb_parts parts = this->to_parts();
            GUID ret{};
            ret.Data1 = parts.data1;
            ret.Data2 = parts.data2;
            ret.Data3 = parts.data3;
            std::copy(std::begin(parts.data4), std::end(parts.data4), ret.Data4);
            return ret;
        }
    #endif

        /**
         * Parses comb from a span of characters
         *
         * Accepts `xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx` in either case, optionally
         * surrounded by braces. Characters past the end of the comb are ignored.
         */
        template<impl::char_like T, size_t Extent>
        static constexpr std::optional<comb> from_chars(std::span<const T, Extent> src) noexcept {
            if (src.size() < comb::char_length)
                return std::nullopt;

            const T * str = src.data();
            if (str[0] == T('{')) {
                if (src.size() < comb::braced_char_length || str[comb::char_length + 1] != T('}'))
                    return std::nullopt;
                ++str;
            }

            comb ret;
            if (!comb::read(str, ret.bytes))
                return std::nullopt;
            return ret;
        }

        /// Parses comb from anything convertible to a span of characters
        template<class T>
        requires( !impl::is_span<T> && requires(T & x) {
            std::span{x};
            requires impl::char_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
        })
        static constexpr auto from_chars(const T & src) noexcept
            { return comb::from_chars(std::span{src}); }

        /// Formats comb into a span of characters
        template<impl::char_like T, size_t Extent>
        [[nodiscard]]
        constexpr auto to_chars(std::span<T, Extent> dest, format fmt = lowercase) const noexcept ->
            std::conditional_t<Extent == std::dynamic_extent, bool, void> {

            if constexpr (Extent == std::dynamic_extent) {
                if (dest.size() < comb::char_length)
                    return false;
            } else {
                static_assert(Extent >= comb::char_length, "destination is too small");
            }

            comb::write(this->bytes, dest.data(), fmt);

            if constexpr (Extent == std::dynamic_extent)
                return true;
        }

        /// Formats comb into anything convertible to a span of characters
        template<class T>
        requires( !impl::is_span<T> && requires(T & x) {
            std::span{x};
            requires impl::char_like<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
            requires !std::is_const_v<std::remove_reference_t<decltype(*std::span{x}.begin())>>;
        })
        [[nodiscard]]
        constexpr auto to_chars(T & dest, format fmt = lowercase) const noexcept {
            return this->to_chars(std::span{dest}, fmt);
        }

        /// Returns a character array with formatted comb
        template<impl::char_like T = char>
        constexpr auto to_chars(format fmt = lowercase) const noexcept -> std::array<T, comb::char_length> {
            std::array<T, comb::char_length> ret;
            this->to_chars(ret, fmt);
            return ret;
        }

        template<impl::char_like T = char>
    #if __cpp_lib_constexpr_string >= 201907L
        constexpr
    #endif
        /// Returns a string with formatted comb
        auto to_string(format fmt = lowercase) const -> std::basic_string<T>
        {
            std::basic_string<T> ret(comb::char_length, T(0));
            (void)this->to_chars(ret, fmt);
            return ret;
        }

        /// Prints comb into an ostream
        template<impl::char_like T>
        friend std::basic_ostream<T> & operator<<(std::basic_ostream<T> & str, const comb val) {
            const comb::format fmt = (str.flags() & std::ios_base::uppercase ? comb::uppercase : comb::lowercase);
            std::array<T, comb::char_length> buf;
            val.to_chars(buf, fmt);
            std::copy(buf.begin(), buf.end(), std::ostreambuf_iterator<T>(str));
            return str;
        }

        /// Reads comb from an istream
        template<impl::char_like T>
        friend std::basic_istream<T> & operator>>(std::basic_istream<T> & str, comb & val) {
            std::array<T, comb::char_length> buf;
            auto * strbuf = str.rdbuf();
            for(T & c: buf) {
                auto res = strbuf->sbumpc();
                if (res == std::char_traits<T>::eof()) {
                    str.setstate(std::ios_base::eofbit | std::ios_base::failbit);
                    return str;
                }
                c = T(res);
            }
            if (auto maybe_val = comb::from_chars(buf))
                val = *maybe_val;
            else
                str.setstate(std::ios_base::failbit);
            return str;
        }

        /// Returns hash code for the comb
        friend constexpr size_t hash_value(const comb & val) noexcept {
            static_assert(sizeof(comb) > sizeof(size_t) && sizeof(comb) % sizeof(size_t) == 0);
            const uint8_t * data = val.bytes.data();
            size_t ret = 0;
            for(unsigned i = 0; i < sizeof(comb) / sizeof(size_t); ++i) {
                size_t chunk = 0;
                data = impl::read_bytes(data, chunk);
                ret = impl::hash_combine(ret, chunk);
            }
            return ret;
        }
    };

    static_assert(sizeof(comb) == 16);


    /// The instant day offsets are counted from: 1900-01-01T00:00:00 UTC
    inline constexpr std::chrono::sys_days comb_epoch = std::chrono::year(1900) / std::chrono::January / 1;

    /**
     * Divisor that turns milliseconds into 1/300 second ticks
     *
     * It is an approximation of 10/3. Existing COMB values were produced with this exact
     * literal, so replacing it with 10.0/3 changes results near tick boundaries.
     */
    inline constexpr double time_unit_divisor = 3.333333;

    /**
     * Number of whole days between comb_epoch and the day `now` falls on
     *
     * Only the low 16 bits are stored in a comb, so offsets wrap after 2079-06-06
     * and for instants before the epoch.
     */
    template<class Duration>
    constexpr auto day_offset(std::chrono::sys_time<Duration> now) noexcept -> int32_t {
        auto offset = std::chrono::floor<std::chrono::days>(now) - comb_epoch;
        return int32_t(offset.count());
    }

    /// Number of 1/300 second ticks between the start of `now`'s UTC day and `now`
    template<class Duration>
    constexpr auto time_of_day_units(std::chrono::sys_time<Duration> now) noexcept -> int64_t {
        auto since_midnight = now - std::chrono::floor<std::chrono::days>(now);
        double ms = std::chrono::duration<double, std::milli>(since_midnight).count();
        return int64_t(ms / time_unit_divisor);
    }

    /**
     * Combines 16 random bytes with a timestamp
     *
     * Bytes 0-9 of `random` are kept. Bytes 10-11 receive the low 16 bits of day_offset()
     * and bytes 12-15 the low 32 bits of time_of_day_units(), both most significant byte first.
     */
    template<impl::byte_like Byte, class Duration>
    constexpr auto encode(std::span<Byte, 16> random, std::chrono::sys_time<Duration> now) noexcept -> comb {
        comb ret(random);
        impl::write_bytes(uint16_t(day_offset(now)), ret.bytes.data() + comb::day_field_offset);
        //truncating to 32 bits keeps the last 4 bytes of the 8 byte big-endian form
        impl::write_bytes(uint32_t(uint64_t(time_of_day_units(now))), ret.bytes.data() + comb::time_field_offset);
        return ret;
    }

    /// Combines anything convertible to a span of 16 random byte-like objects with a timestamp
    template<class T, class Duration>
    requires( !impl::is_span<T> && requires(const T & x) {
        std::span{x};
        requires impl::byte_like<std::remove_cvref_t<decltype(*std::span{x}.begin())>>;
        requires decltype(std::span{x})::extent == 16;
    })
    constexpr auto encode(const T & random, std::chrono::sys_time<Duration> now) noexcept -> comb {
        return encode(std::span{random}, now);
    }

    /// Replaces the timestamp fragment of an existing comb
    template<class Duration>
    constexpr auto encode(const comb & random, std::chrono::sys_time<Duration> now) noexcept -> comb {
        return encode(std::span{random.bytes}, now);
    }


    namespace impl {
        //Indices into comb::bytes in the order SQL Server compares uniqueidentifier.
        //SQL Server works on the GUID memory layout where the first three fields
        //are little-endian, hence the reversed runs at the end.
        inline constexpr uint8_t sqlserver_byte_order[16] = {
            10, 11, 12, 13, 14, 15, 8, 9, 7, 6, 5, 4, 3, 2, 1, 0
        };
    }

    /// Compares two combs the way SQL Server orders uniqueidentifier values
    constexpr auto sqlserver_compare(const comb & lhs, const comb & rhs) noexcept -> std::strong_ordering {
        for (uint8_t idx: impl::sqlserver_byte_order) {
            if (auto res = lhs.bytes[idx] <=> rhs.bytes[idx]; res != 0)
                return res;
        }
        return std::strong_ordering::equal;
    }

    /// Less-than predicate using SQL Server uniqueidentifier ordering
    struct sqlserver_less {
        constexpr bool operator()(const comb & lhs, const comb & rhs) const noexcept {
            return sqlserver_compare(lhs, rhs) < 0;
        }
    };


    namespace impl {
        template<class Derived, class CharT>
        struct comb_formatter_base {
            comb::format fmt = comb::lowercase;

            template<class ParseContext>
            constexpr auto parse(ParseContext & ctx) -> typename ParseContext::iterator {
                auto it = ctx.begin();
                while(it != ctx.end()) {
                    if (*it == CharT('l')) {
                        this->fmt = comb::lowercase; ++it;
                    } else if (*it == CharT('u')) {
                        this->fmt = comb::uppercase; ++it;
                    } else if (*it == CharT('}')) {
                        break;
                    } else {
                        static_cast<Derived *>(this)->raise_exception("Invalid format args");
                    }
                }
                return it;
            }

            template <typename FormatContext>
            auto format(comb val, FormatContext & ctx) const -> decltype(ctx.out()) {
                std::array<CharT, comb::char_length> buf;
                val.to_chars(buf, this->fmt);
                return std::copy(buf.begin(), buf.end(), ctx.out());
            }
        };
    }
}

/// std::hash specialization for comb
template<>
struct std::hash<mcomb::comb> {

    constexpr size_t operator()(const mcomb::comb & val) const noexcept {
        return hash_value(val);
    }
};


#if MCOMB_SUPPORTS_STD_FORMAT

/// comb formatter for std::format
template<class CharT>
struct std::formatter<::mcomb::comb, CharT> :
    public ::mcomb::impl::comb_formatter_base<std::formatter<::mcomb::comb, CharT>, CharT>
{
    [[noreturn]] void raise_exception(const char * message) {
        MCOMB_THROW(std::format_error(message));
    }
};

#endif

#if MCOMB_SUPPORTS_FMT_FORMAT

/// comb formatter for fmt::format
template<class CharT>
struct fmt::formatter<::mcomb::comb, CharT> :
    public ::mcomb::impl::comb_formatter_base<fmt::formatter<::mcomb::comb, CharT>, CharT>
{
    void raise_exception(const char * message) {
        FMT_THROW(fmt::format_error(message));
    }
};

#endif

#endif
