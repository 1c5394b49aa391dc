#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

#include "reader_concept.hpp"
#include "writer_concept.hpp"

namespace YamlFusion {

/*
 * Enum representation proxies.
 *
 * Wrapped around a writer, SingletonMapEncoder turns every variant that would be written as
 * `!Variant payload` into the one-entry mapping `{Variant: payload}`; unit variants become their
 * bare name. SingletonMapDecoder reads the same shapes back.
 *
 * Non-recursive proxies only rewrite the value they were applied to: anything nested inside
 * that value (sequence elements, map values, variant payloads) reaches the wrapped writer
 * untouched. Recursive proxies rewrite at every depth.
 *
 * Both hold a reference to the wrapped writer/reader; they live on the stack of the
 * serializer call that applies them.
 */
template<writer::WriterLike Inner, bool Recursive>
class SingletonMapEncoder {
public:
    using inner_type = Inner;
    using error_type = typename Inner::error_type;
    using ArrayFrame = typename Inner::ArrayFrame;
    using MapFrame = typename Inner::MapFrame;

    struct VariantFrame {
        typename Inner::MapFrame map{};
        typename Inner::VariantFrame variant{};
        bool substituted = false;
    };

    static constexpr bool is_recursive = Recursive;

    constexpr explicit SingletonMapEncoder(Inner & inner) : inner_(inner) {}

    constexpr Inner & inner() {
        return inner_;
    }

    constexpr error_type getError() const {
        return inner_.getError();
    }

    constexpr std::size_t depth() const {
        return depth_;
    }

    constexpr bool write_unit_variant(std::string_view name) {
        if(!active()) {
            return inner_.write_unit_variant(name);
        }
        return inner_.write_string(name.data(), name.size());
    }

    constexpr bool write_variant_begin(std::string_view name, VariantFrame & fr) {
        fr.substituted = active();
        depth_ ++;
        if(!fr.substituted) {
            return inner_.write_variant_begin(name, fr.variant);
        }
        const std::size_t one = 1;
        if(!inner_.write_map_begin(one, fr.map)) return false;
        if(!inner_.write_string(name.data(), name.size())) return false;
        return inner_.move_to_value(fr.map);
    }

    constexpr bool write_variant_end(VariantFrame & fr) {
        depth_ --;
        if(!fr.substituted) {
            return inner_.write_variant_end(fr.variant);
        }
        return inner_.write_map_end(fr.map);
    }

    constexpr bool write_array_begin(const std::size_t & size, ArrayFrame & fr) {
        depth_ ++;
        return inner_.write_array_begin(size, fr);
    }
    constexpr bool write_array_end(ArrayFrame & fr) {
        depth_ --;
        return inner_.write_array_end(fr);
    }
    constexpr bool write_map_begin(const std::size_t & size, MapFrame & fr) {
        depth_ ++;
        return inner_.write_map_begin(size, fr);
    }
    constexpr bool write_struct_begin(const std::size_t & size, MapFrame & fr) {
        depth_ ++;
        return inner_.write_struct_begin(size, fr);
    }
    constexpr bool write_map_end(MapFrame & fr) {
        depth_ --;
        return inner_.write_map_end(fr);
    }

    constexpr bool advance_after_value(ArrayFrame & fr) { return inner_.advance_after_value(fr); }
    constexpr bool advance_after_value(MapFrame & fr)   { return inner_.advance_after_value(fr); }
    constexpr bool move_to_value(MapFrame & fr)         { return inner_.move_to_value(fr); }

    constexpr bool write_null()                 { return inner_.write_null(); }
    constexpr bool write_bool(bool b)           { return inner_.write_bool(b); }
    template<class NumberT>
    constexpr bool write_number(const NumberT & v) { return inner_.write_number(v); }
    constexpr bool write_char(char c)           { return inner_.write_char(c); }
    constexpr bool write_string(const char * data, std::size_t size, bool null_terminated = false) {
        return inner_.write_string(data, size, null_terminated);
    }
    constexpr bool write_display(std::string_view text) { return inner_.write_display(text); }
    constexpr bool write_bytes(const std::uint8_t * data, std::size_t size) { return inner_.write_bytes(data, size); }

    constexpr bool finish() {
        return inner_.finish();
    }

private:
    constexpr bool active() const {
        return Recursive || depth_ == 0;
    }

    Inner & inner_;
    std::size_t depth_ = 0;
};

template<reader::ReaderLike Inner, bool Recursive>
class SingletonMapDecoder {
public:
    using inner_type = Inner;
    using error_type = typename Inner::error_type;
    using ArrayFrame = typename Inner::ArrayFrame;
    using MapFrame = typename Inner::MapFrame;

    struct VariantFrame {
        typename Inner::MapFrame map{};
        typename Inner::VariantFrame variant{};
        bool substituted = false;
        bool has_payload = false;
    };

    static constexpr bool is_recursive = Recursive;

    constexpr explicit SingletonMapDecoder(Inner & inner) : inner_(inner) {}

    constexpr Inner & inner() {
        return inner_;
    }

    constexpr error_type getError() const {
        return inner_.getError();
    }

    // `{Variant: payload}` or a bare `Variant` scalar
    constexpr reader::TryParseStatus read_variant_begin(std::string & name, VariantFrame & fr) {
        fr.substituted = active();
        if(!fr.substituted) {
            auto st = inner_.read_variant_begin(name, fr.variant);
            fr.has_payload = fr.variant.has_payload;
            if(st == reader::TryParseStatus::ok && fr.has_payload) depth_ ++;
            return st;
        }

        reader::IterationStatus it = inner_.read_map_begin(fr.map);
        if(it.status == reader::TryParseStatus::error) {
            return reader::TryParseStatus::error;
        }
        if(it.status == reader::TryParseStatus::ok) {
            if(!it.has_value) {
                return reader::TryParseStatus::no_match;  // `{}` names no variant
            }
            auto st = inner_.read_string(name);
            if(st != reader::TryParseStatus::ok) return st;
            if(!inner_.move_to_value(fr.map)) return reader::TryParseStatus::error;
            fr.has_payload = true;
            depth_ ++;
            return reader::TryParseStatus::ok;
        }
        fr.has_payload = false;
        return inner_.read_string(name);
    }

    constexpr reader::TryParseStatus read_unit_payload(VariantFrame & fr) {
        if(!fr.substituted) {
            return inner_.read_unit_payload(fr.variant);
        }
        return fr.has_payload ? reader::TryParseStatus::no_match : reader::TryParseStatus::ok;
    }

    constexpr reader::TryParseStatus read_variant_end(VariantFrame & fr) {
        if(fr.has_payload) depth_ --;
        if(!fr.substituted) {
            return inner_.read_variant_end(fr.variant);
        }
        if(!fr.has_payload) {
            return reader::TryParseStatus::ok;
        }
        reader::IterationStatus it = inner_.advance_after_value(fr.map);
        if(it.status != reader::TryParseStatus::ok) return it.status;
        // a second key means the mapping is not a singleton
        return it.has_value ? reader::TryParseStatus::no_match : reader::TryParseStatus::ok;
    }

    constexpr reader::IterationStatus read_array_begin(ArrayFrame & fr) {
        return entered(inner_.read_array_begin(fr));
    }
    constexpr reader::IterationStatus advance_after_value(ArrayFrame & fr) {
        return left(inner_.advance_after_value(fr));
    }
    constexpr reader::IterationStatus read_map_begin(MapFrame & fr) {
        return entered(inner_.read_map_begin(fr));
    }
    constexpr reader::IterationStatus advance_after_value(MapFrame & fr) {
        return left(inner_.advance_after_value(fr));
    }
    constexpr bool move_to_value(MapFrame & fr) {
        return inner_.move_to_value(fr);
    }

    constexpr reader::TryParseStatus start_value_and_try_read_null() { return inner_.start_value_and_try_read_null(); }
    constexpr reader::TryParseStatus read_bool(bool & b) { return inner_.read_bool(b); }
    template<class NumberT>
    constexpr reader::TryParseStatus read_number(NumberT & v) { return inner_.read_number(v); }
    constexpr reader::TryParseStatus read_char(char & c) { return inner_.read_char(c); }
    constexpr reader::TryParseStatus read_string(std::string & s) { return inner_.read_string(s); }
    constexpr reader::TryParseStatus read_tag(std::string & s) { return inner_.read_tag(s); }

    constexpr bool skip_value() { return inner_.skip_value(); }
    constexpr bool finish() { return inner_.finish(); }

private:
    constexpr bool active() const {
        return Recursive || depth_ == 0;
    }

    // Depth changes only for containers that were actually entered
    constexpr reader::IterationStatus entered(reader::IterationStatus st) {
        if(st.status == reader::TryParseStatus::ok && st.has_value) depth_ ++;
        return st;
    }
    constexpr reader::IterationStatus left(reader::IterationStatus st) {
        if(st.status == reader::TryParseStatus::ok && !st.has_value) depth_ --;
        return st;
    }

    Inner & inner_;
    std::size_t depth_ = 0;
};

namespace singleton_map_details {

template<class W>
struct is_encoder_proxy : std::false_type {};
template<class Inner, bool R>
struct is_encoder_proxy<SingletonMapEncoder<Inner, R>> : std::true_type {};

template<class R>
struct is_decoder_proxy : std::false_type {};
template<class Inner, bool Rec>
struct is_decoder_proxy<SingletonMapDecoder<Inner, Rec>> : std::true_type {};

} // namespace singleton_map_details

/*
 * Runs fn with a writer that applies the singleton-map representation. An active recursive
 * proxy is reused as is; a non-recursive one is unwrapped first so proxies never stack.
 */
template<bool Recursive, class Writer, class Fn>
constexpr bool with_singleton_map(Writer & writer, Fn && fn) {
    if constexpr (singleton_map_details::is_encoder_proxy<Writer>::value) {
        if constexpr (Writer::is_recursive) {
            return fn(writer);
        } else {
            SingletonMapEncoder<typename Writer::inner_type, Recursive> proxy(writer.inner());
            return fn(proxy);
        }
    } else {
        SingletonMapEncoder<Writer, Recursive> proxy(writer);
        return fn(proxy);
    }
}

template<bool Recursive, class Reader, class Fn>
constexpr bool with_singleton_map_reader(Reader & reader, Fn && fn) {
    if constexpr (singleton_map_details::is_decoder_proxy<Reader>::value) {
        if constexpr (Reader::is_recursive) {
            return fn(reader);
        } else {
            SingletonMapDecoder<typename Reader::inner_type, Recursive> proxy(reader.inner());
            return fn(proxy);
        }
    } else {
        SingletonMapDecoder<Reader, Recursive> proxy(reader);
        return fn(proxy);
    }
}

} // namespace YamlFusion
