#pragma once

#include <concepts>
#include <string>
#include <limits>

namespace YamlFusion {

namespace reader {
enum class TryParseStatus {
    no_match,   // not our case, reader position unchanged
    ok,         // parsed and consumed
    error       // malformed, reader already has error
};

struct IterationStatus {
    TryParseStatus status = TryParseStatus::error;
    bool has_value = false;
};


/// ReaderLike concept defines the interface a document reader implementation must satisfy.
/// Keys of a map are read with the ordinary scalar calls between read_map_begin/advance_after_value
/// and move_to_value.
template<typename R>
concept ReaderLike = requires(R reader,
                               R& mutable_reader,
                               bool& bool_ref,
                               int& int_ref,
                               double& double_ref,
                               char& char_ref,
                               std::string& string_ref,
                               typename R::ArrayFrame & arrFrameRef,
                               typename R::MapFrame & mapFrameRef,
                               typename R::VariantFrame & variantFrameRef
                              ) {

    typename R::ArrayFrame;
    typename R::MapFrame;
    typename R::VariantFrame;
    typename R::error_type;

    { reader.getError() } -> std::same_as<typename R::error_type>;

    { mutable_reader.read_array_begin(arrFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.read_map_begin(mapFrameRef) } -> std::same_as<IterationStatus>;

    { mutable_reader.advance_after_value(arrFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.advance_after_value(mapFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.move_to_value(mapFrameRef) } -> std::same_as<bool>;

    { mutable_reader.start_value_and_try_read_null() } -> std::same_as<TryParseStatus>;
    { mutable_reader.read_bool(bool_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.template read_number<int>(int_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.template read_number<double>(double_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.read_char(char_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.read_string(string_ref) } -> std::same_as<TryParseStatus>;
    // `!Tag value`: the tag without its '!', the value stays readable
    { mutable_reader.read_tag(string_ref) } -> std::same_as<TryParseStatus>;

    // Enum variants: name first, then (if has_payload) the payload with the ordinary calls
    { mutable_reader.read_variant_begin(string_ref, variantFrameRef) } -> std::same_as<TryParseStatus>;
    { variantFrameRef.has_payload } -> std::convertible_to<bool>;
    { mutable_reader.read_unit_payload(variantFrameRef) } -> std::same_as<TryParseStatus>;
    { mutable_reader.read_variant_end(variantFrameRef) } -> std::same_as<TryParseStatus>;

    { mutable_reader.finish() } -> std::same_as<bool>;
    { mutable_reader.skip_value() } -> std::same_as<bool>;
};

template<typename R>
constexpr bool is_reader_like_v = ReaderLike<R>;


} // namespace reader

}
