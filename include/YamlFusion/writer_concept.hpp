#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace YamlFusion {

namespace writer {

template<typename R>
concept WriterLike = requires(R writer,
                               R& mutable_writer,
                               const bool& bool_ref,
                               const int& int_ref,
                               const double& double_ref,
                               const char& char_ref,
                               const char* char_ptr,
                               const std::uint8_t* bytes_ptr,
                               std::string_view text,
                               std::size_t size,
                               const std::size_t & sizeRef,
                               typename R::ArrayFrame & arrFrameRef,
                               typename R::MapFrame & mapFrameRef,
                               typename R::VariantFrame & variantFrameRef
                              ) {

    typename R::ArrayFrame;
    typename R::MapFrame;
    typename R::VariantFrame;
    typename R::error_type;

    { writer.getError() } -> std::same_as<typename R::error_type>;

    { mutable_writer.write_array_begin(sizeRef, arrFrameRef) } -> std::same_as<bool>;
    { mutable_writer.write_map_begin(sizeRef, mapFrameRef) } -> std::same_as<bool>;
    // Structs always open a real mapping, whatever their field count
    { mutable_writer.write_struct_begin(sizeRef, mapFrameRef) } -> std::same_as<bool>;

    { mutable_writer.advance_after_value(arrFrameRef) } -> std::same_as<bool>;
    { mutable_writer.advance_after_value(mapFrameRef) } -> std::same_as<bool>;
    { mutable_writer.move_to_value(mapFrameRef) } -> std::same_as<bool>;

    { mutable_writer.write_array_end(arrFrameRef) } -> std::same_as<bool>;
    { mutable_writer.write_map_end(mapFrameRef) } -> std::same_as<bool>;

    { mutable_writer.write_null() } -> std::same_as<bool>;
    { mutable_writer.write_bool(bool_ref) } -> std::same_as<bool>;
    { mutable_writer.template write_number<int>(int_ref) } -> std::same_as<bool>;
    { mutable_writer.template write_number<double>(double_ref) } -> std::same_as<bool>;
    { mutable_writer.write_char(char_ref) } -> std::same_as<bool>;
    { mutable_writer.write_string(char_ptr, size, false) } -> std::same_as<bool>;
    // Text produced by a value's display form; may carry a `!Tag`
    { mutable_writer.write_display(text) } -> std::same_as<bool>;
    { mutable_writer.write_bytes(bytes_ptr, size) } -> std::same_as<bool>;

    // Enum variants. Payloads of newtype/tuple/struct variants are written between
    // begin and end with the ordinary value calls.
    { mutable_writer.write_unit_variant(text) } -> std::same_as<bool>;
    { mutable_writer.write_variant_begin(text, variantFrameRef) } -> std::same_as<bool>;
    { mutable_writer.write_variant_end(variantFrameRef) } -> std::same_as<bool>;

    { mutable_writer.finish() } -> std::same_as<bool>;
};

template<typename R>
constexpr bool is_writer_like_v = WriterLike<R>;

} // namespace writer

}
