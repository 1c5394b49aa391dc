#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>  // std::declval
#include <ranges>
#include <type_traits>
#include <variant>
#include "struct_introspection.hpp"
#include "static_schema.hpp"
#include "struct_fields_helper.hpp"
#include "options.hpp"
#include "errors.hpp"
#include "model.hpp"
#include "singleton_map.hpp"
#include "writer_concept.hpp"

namespace YamlFusion {

template <class WriterError>
class SerializeResult {
    SerializeError m_error = SerializeError::NO_ERROR;
    WriterError m_writerError{};
public:
    constexpr SerializeResult(SerializeError err, WriterError werr):
        m_error(err), m_writerError(werr)
    {}
    constexpr operator bool() const {
        return m_error == SerializeError::NO_ERROR;
    }
    constexpr SerializeError error() const {
        return m_error;
    }
    constexpr WriterError writerError() const {
        return m_writerError;
    }
};


namespace  serializer_details {


template <class WriterError>
class SerializationContext {

    SerializeError error = SerializeError::NO_ERROR;
    WriterError writerError{};

public:
    template<class Writer>
    constexpr bool withWriterError(Writer & writer) {
        if(error == SerializeError::NO_ERROR) {
            error = SerializeError::WRITER_ERROR;
        }
        writerError = writer.getError();
        return false;
    }

    template<class Writer>
    constexpr bool withError(SerializeError err, Writer & writer) {
        if(error == SerializeError::NO_ERROR) {
            error = err;
        }
        writerError = writer.getError();
        return false;
    }

    constexpr SerializeResult<WriterError> result() const {
        return SerializeResult<WriterError>(error, writerError);
    }
};

template <class FieldOptions, static_schema::YamlSerializableValue Field, writer::WriterLike Writer, class CTX>
constexpr bool SerializeValue(const Field & obj, Writer & writer, CTX &ctx);


template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::YamlBool<ObjT>
constexpr bool SerializeNonNullValue(const ObjT & obj, Writer & writer, CTX &ctx) {
    if(!writer.write_bool(obj)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::YamlChar<ObjT>
constexpr bool SerializeNonNullValue(const ObjT & obj, Writer & writer, CTX &ctx) {
    if(!writer.write_char(obj)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::YamlNumber<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    if(!writer.write_number(obj)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::YamlString<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    if(!writer.write_string(obj.data(), obj.size())) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::YamlBytes<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    if(!writer.write_bytes(obj.data.data(), obj.data.size())) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::YamlUnit<ObjT>
constexpr bool SerializeNonNullValue(const ObjT&, Writer & writer, CTX &ctx) {
    if(!writer.write_null()) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class TupleT, writer::WriterLike Writer, class CTX, std::size_t... I>
constexpr bool SerializeTupleElements(const TupleT & tup, Writer & writer, CTX &ctx, std::index_sequence<I...>) {
    typename Writer::ArrayFrame fr;
    if(!writer.write_array_begin(sizeof...(I), fr)) {
        return ctx.withWriterError(writer);
    }
    auto one = [&]<std::size_t Index>(std::integral_constant<std::size_t, Index>) {
        using Elem = std::tuple_element_t<Index, TupleT>;
        using Meta = options::detail::annotation_meta_getter<Elem>;
        if constexpr (Index > 0) {
            if(!writer.advance_after_value(fr)) {
                return ctx.withWriterError(writer);
            }
        }
        return SerializeValue<typename Meta::options>(Meta::getRef(std::get<Index>(tup)), writer, ctx);
    };
    if(!(one(std::integral_constant<std::size_t, I>{}) && ...)) {
        return false;
    }
    if(!writer.write_array_end(fr)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::YamlTuple<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    return SerializeTupleElements(obj, writer, ctx, std::make_index_sequence<std::tuple_size_v<ObjT>>{});
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::YamlSerializableArray<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {

    using FH   = static_schema::array_read_cursor<ObjT>;
    FH cursor{ obj };
    typename Writer::ArrayFrame fr;
    if(!writer.write_array_begin(cursor.size(), fr)) {
        return ctx.withWriterError(writer);
    }

    cursor.reset();
    stream_read_result res;
    res = cursor.read_more();

    while(res != stream_read_result::end) {

        if(res == stream_read_result::error) {
            return ctx.withError(SerializeError::WRITER_ERROR, writer);
        }

        const auto &ch = cursor.get();

        using Meta = options::detail::annotation_meta_getter<typename FH::element_type>;
        if(!SerializeValue<typename Meta::options>(Meta::getRef(ch), writer, ctx)) {
            return false;
        }
        res = cursor.read_more();
        if(res != stream_read_result::end) {
            if(!writer.advance_after_value(fr)) {
                return ctx.withWriterError(writer);
            }
        }
    }
    if(!writer.write_array_end(fr)) {
        return ctx.withWriterError(writer);
    }

    return true;
}

template <class KeyT, writer::WriterLike Writer, class CTX>
constexpr bool SerializeMapKey(const KeyT & key, Writer & writer, CTX &ctx) {
    bool ok;
    if constexpr (static_schema::YamlString<KeyT>) {
        ok = writer.write_string(key.data(), key.size());
    } else if constexpr (static_schema::YamlBool<KeyT>) {
        ok = writer.write_bool(key);
    } else if constexpr (static_schema::YamlChar<KeyT>) {
        ok = writer.write_char(key);
    } else {
        ok = writer.write_number(key);
    }
    if(!ok) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::YamlSerializableMap<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {

    using FH = static_schema::map_read_cursor<ObjT>;
    FH cursor{ obj };

    std::size_t count = cursor.size();
    if constexpr(static_schema::YamlNullableSerializableValue<typename FH::mapped_type> &&
                  Opts::template has_option<options::detail::skip_nulls_tag>) {
        count = 0;
        cursor.reset();
        while(cursor.read_more() == stream_read_result::value) {
            if(!static_schema::isNull(cursor.get_value())) count ++;
        }
    }

    typename Writer::MapFrame fr;
    if(!writer.write_map_begin(count, fr)) {
        return ctx.withWriterError(writer);
    }

    cursor.reset();
    bool first = true;
    stream_read_result res = cursor.read_more();
    while(res != stream_read_result::end) {

        if(res == stream_read_result::error) {
            return ctx.withError(SerializeError::WRITER_ERROR, writer);
        }
        const auto& key = cursor.get_key();
        const auto& value = cursor.get_value();

        using Meta = options::detail::annotation_meta_getter<typename FH::mapped_type>;
        if constexpr(static_schema::YamlNullableSerializableValue<typename FH::mapped_type> &&
                      Opts::template has_option<options::detail::skip_nulls_tag>) {
            if(static_schema::isNull(value)) {
                res = cursor.read_more();
                continue;
            }
        }

        if(!first) {
            if(!writer.advance_after_value(fr)) {
                return ctx.withWriterError(writer);
            }
        }
        first = false;

        if(!SerializeMapKey(key, writer, ctx)) {
            return false;
        }

        if(!writer.move_to_value(fr)) {
            return ctx.withWriterError(writer);
        }

        if(!SerializeValue<typename Meta::options>(Meta::getRef(value), writer, ctx)) {
            return false;
        }
        res = cursor.read_more();
    }

    if(!writer.write_map_end(fr)) {
        return ctx.withWriterError(writer);
    }


    return true;
}


template <bool SkipNulls, std::size_t StructIndex, class Frame, class ObjT, writer::WriterLike Writer, class CTX>
constexpr bool SerializeOneStructField(std::size_t & count, Frame & fr, ObjT& structObj, Writer & writer, CTX &ctx) {
    using Field   = introspection::structureElementTypeByIndex<StructIndex, ObjT>;
    using Meta =  options::detail::annotation_meta_getter<Field>;
    using FieldOpts = options::detail::aggregate_field_opts_getter<ObjT, StructIndex>;
    if constexpr (FieldOpts::template has_option<options::detail::exclude_tag>) {
        return true;
    } else {
        if constexpr(static_schema::YamlNullableSerializableValue<Field> && SkipNulls){
            if(static_schema::isNull(introspection::getStructElementByIndex<StructIndex>(structObj))) {
                return true;
            }
        }
        if(count > 0) {
            if(!writer.advance_after_value(fr)) {
                return ctx.withWriterError(writer);
            }
        }
        constexpr std::string_view f = struct_fields_helper::FieldsHelper<std::remove_cvref_t<ObjT>>::template fieldName<StructIndex>();
        if(!writer.write_string(f.data(), f.size())) {
            return ctx.withWriterError(writer);
        }

        if(!writer.move_to_value(fr)) {
            return ctx.withWriterError(writer);
        }

        count ++;
        return SerializeValue<FieldOpts>(Meta::getRef(
                                             introspection::getStructElementByIndex<StructIndex>(structObj)
                                           ), writer, ctx);
    }
}
template <bool skipNulls, class Frame, class ObjT, writer::WriterLike Writer, class CTX, std::size_t... StructIndex>
constexpr bool SerializeStructFields(Frame &fr, const ObjT& structObj, Writer & writer, CTX &ctx, std::index_sequence<StructIndex...>) {
    std::size_t count = 0;
    return (
        SerializeOneStructField<skipNulls, StructIndex>(count, fr, structObj, writer, ctx)
        && ...
        );
}

template <bool SkipNulls, class ObjT, writer::WriterLike Writer, class CTX>
constexpr bool SerializeStruct(const ObjT& obj, Writer & writer, CTX &ctx) {
    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    static_assert(FH::fieldsAreUnique, "[[[ YamlFusion ]]] Field keys are not unique");
    constexpr auto indexes = std::make_index_sequence<FH::rawFieldsCount>{};
    typename Writer::MapFrame fr;
    if(!writer.write_struct_begin(FH::fieldsCount, fr)) {
        return ctx.withWriterError(writer);
    }

    if(!SerializeStructFields<SkipNulls>(fr, obj, writer, ctx, indexes))
        return false;

    if(!writer.write_map_end(fr)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::YamlObject<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    return SerializeStruct<Opts::template has_option<options::detail::skip_nulls_tag>>(obj, writer, ctx);
}

template <class Alt, writer::WriterLike Writer, class CTX>
constexpr bool SerializeVariant(const Alt & alt, Writer & writer, CTX &ctx) {
    if constexpr (enum_details::is_unit_variant<Alt>::value) {
        if(!writer.write_unit_variant(Alt::name)) {
            return ctx.withWriterError(writer);
        }
        return true;
    } else {
        typename Writer::VariantFrame vf;
        if(!writer.write_variant_begin(Alt::name, vf)) {
            return ctx.withWriterError(writer);
        }
        bool ok;
        if constexpr (enum_details::is_newtype_variant<Alt>::value) {
            using Meta = options::detail::annotation_meta_getter<typename Alt::payload_type>;
            ok = SerializeValue<typename Meta::options>(Meta::getRef(alt.value), writer, ctx);
        } else if constexpr (enum_details::is_tuple_variant<Alt>::value) {
            ok = SerializeTupleElements(alt.values, writer, ctx,
                                        std::make_index_sequence<std::tuple_size_v<typename Alt::payload_type>>{});
        } else {
            ok = SerializeStruct<false>(alt.fields, writer, ctx);
        }
        if(!ok) {
            return false;
        }
        if(!writer.write_variant_end(vf)) {
            return ctx.withWriterError(writer);
        }
        return true;
    }
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::YamlEnum<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    return std::visit([&](const auto & alt) {
        return SerializeVariant(alt, writer, ctx);
    }, obj.value);
}

// `!tag value`, written as a one-entry map whose key displays as the tag
template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::YamlTagged<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    std::string tag = obj.tag;
    if(!tag.starts_with('!')) {
        tag.insert(tag.begin(), '!');
    }
    typename Writer::MapFrame fr;
    if(!writer.write_map_begin(1, fr)) {
        return ctx.withWriterError(writer);
    }
    if(!writer.write_display(tag)) {
        return ctx.withWriterError(writer);
    }
    if(!writer.move_to_value(fr)) {
        return ctx.withWriterError(writer);
    }
    using Meta = options::detail::annotation_meta_getter<decltype(obj.value)>;
    if(!SerializeValue<typename Meta::options>(Meta::getRef(obj.value), writer, ctx)) {
        return false;
    }
    if(!writer.write_map_end(fr)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class FieldOptions, static_schema::YamlSerializableValue Field, writer::WriterLike Writer, class CTX>
constexpr bool SerializePresentOrNull(const Field & obj, Writer & writer, CTX &ctx) {
    if constexpr(static_schema::YamlNullableSerializableValue<Field>) {
        if(static_schema::isNull(obj)) {
            if(!writer.write_null()) {
                return ctx.withWriterError(writer);
            } else {
                return true;
            }
        }
    }
    return SerializeNonNullValue<FieldOptions>(static_schema::getRef(obj), writer, ctx);
}

template <class FieldOptions, static_schema::YamlSerializableValue Field, writer::WriterLike Writer, class CTX>
constexpr bool SerializeValue(const Field & obj, Writer & writer, CTX &ctx) {

    if constexpr (FieldOptions::template has_option<options::detail::exclude_tag>) {
        return true;
    } else if constexpr (FieldOptions::template has_option<options::detail::singleton_map_tag>) {
        using Repr = typename FieldOptions::template get_option<options::detail::singleton_map_tag>;
        static_assert(!Repr::RequiresNullable || static_schema::YamlNullableSerializableValue<Field>,
                      "[[[ YamlFusion ]]] singleton_map_optional applies to std::optional or std::unique_ptr fields");
        return with_singleton_map<Repr::Recursive>(writer, [&](auto & proxy) {
            return SerializePresentOrNull<FieldOptions>(obj, proxy, ctx);
        });
    } else {
        return SerializePresentOrNull<FieldOptions>(obj, writer, ctx);
    }
}

} // namespace serializer_details


// Drives the writer through the value, then finishes the stream
template <static_schema::YamlSerializableValue InputObjectT, writer::WriterLike Writer>
constexpr auto SerializeWithWriter(const InputObjectT & obj, Writer & writer) {
    serializer_details::SerializationContext<typename Writer::error_type> ctx;
    using Meta = options::detail::annotation_meta_getter<InputObjectT>;

    if(serializer_details::SerializeValue<typename Meta::options>(Meta::getRef(obj), writer, ctx)) {
        if(!writer.finish()) {
            ctx.withWriterError(writer);
        }
    }
    return ctx.result();
}


// One document per element; the stream is finished after the last one
template <std::ranges::input_range Documents, writer::WriterLike Writer>
    requires static_schema::YamlSerializableValue<std::ranges::range_value_t<Documents>>
constexpr auto SerializeDocumentsWithWriter(const Documents & docs, Writer & writer) {
    serializer_details::SerializationContext<typename Writer::error_type> ctx;
    using Meta = options::detail::annotation_meta_getter<std::ranges::range_value_t<Documents>>;

    for(const auto & doc : docs) {
        if(!serializer_details::SerializeValue<typename Meta::options>(Meta::getRef(doc), writer, ctx)) {
            return ctx.result();
        }
    }
    if(!writer.finish()) {
        ctx.withWriterError(writer);
    }
    return ctx.result();
}


template <class T>
requires (!static_schema::YamlSerializableValue<T>)
constexpr auto SerializeWithWriter(const T &, auto &) {
    static_assert(detail::always_false<T>::value,
                  "[[[ YamlFusion ]]] T is not a supported YamlFusion serializable value model type.\n"
                  "see YamlSerializableValue concept for full rules");
}

} // namespace YamlFusion
