#pragma once

#include <bitset>
#include <cstddef>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>  // std::declval
#include <variant>

#include "static_schema.hpp"
#include "options.hpp"
#include "struct_introspection.hpp"
#include "struct_fields_helper.hpp"
#include "errors.hpp"
#include "model.hpp"
#include "parse_result.hpp"
#include "path.hpp"
#include "reader_concept.hpp"
#include "singleton_map.hpp"

namespace YamlFusion {

namespace  parser_details {


template <class ReaderError>
class DeserializationContext {
    ReaderError reader_error = {};
    ParseError error = ParseError::NO_ERROR;
    path::Path currentPath;

public:
    // Pops on scope exit unless an error froze the path
    struct PathGuard {
        DeserializationContext & ctx;

        constexpr ~PathGuard() {
            if(ctx.error == ParseError::NO_ERROR)
                ctx.currentPath.pop();
        }
    };


    template<class Reader>
    constexpr bool withParseError(ParseError err, const Reader & reader) {
        error = err;
        if(err == ParseError::NO_ERROR) {
            error = ParseError::READER_ERROR;
        }
        reader_error = reader.getError();
        return false;
    }

    template<class Reader>
    constexpr bool withReaderError(const Reader & reader) {
        error = ParseError::READER_ERROR;
        reader_error = reader.getError();
        return false;
    }
    constexpr ParseError currentError() const {return error;}

    constexpr ParseResult<ReaderError> result() const {
        return ParseResult<ReaderError>(error, reader_error,
                                        error == ParseError::NO_ERROR ? path::Path{} : currentPath);
    }

    constexpr PathGuard getArrayItemGuard(std::size_t index) {
        currentPath.push_index(index);
        return PathGuard{*this};
    }
    constexpr PathGuard getMapItemGuard(std::string_view key) {
        currentPath.push_field(key);
        return PathGuard{*this};
    }
};

template <class FieldOptions, static_schema::YamlParsableValue Field, reader::ReaderLike Tokenizer, class CTX>
constexpr bool ParseValue(Field & field, Tokenizer & reader, CTX &ctx);


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::YamlBool<ObjT>
constexpr bool ParseNonNullValue(ObjT & obj, Tokenizer & reader, CTX &ctx) {
    if (reader::TryParseStatus st = reader.read_bool(obj); st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    } else if (st == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_BOOL_IN_BOOL_VALUE, reader);
    }
    return true;
}


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::YamlNumber<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Tokenizer & reader, CTX &ctx) {
    if (reader::TryParseStatus st = reader.template read_number<ObjT>(obj);
                st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }else if (st == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE, reader);
    }
    return true;
}

template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::YamlChar<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Tokenizer & reader, CTX &ctx) {
    if (reader::TryParseStatus st = reader.read_char(obj); st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    } else if (st == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_CHAR_IN_CHAR_VALUE, reader);
    }
    return true;
}

template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::YamlParsableString<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Tokenizer & reader, CTX &ctx) {
    obj.clear();
    if (reader::TryParseStatus st = reader.read_string(obj); st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    } else if (st == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_STRING_IN_STRING_STORAGE, reader);
    }
    return true;
}

template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::YamlBytes<ObjT>
constexpr bool ParseNonNullValue(ObjT&, Tokenizer & reader, CTX &ctx) {
    return ctx.withParseError(ParseError::UNSUPPORTED_CONSTRUCT, reader);
}

// Only `null` reaches here as success; ParseValue handles it before dispatching
template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::YamlUnit<ObjT>
constexpr bool ParseNonNullValue(ObjT&, Tokenizer & reader, CTX &ctx) {
    return ctx.withParseError(ParseError::NON_NULL_IN_UNIT_VALUE, reader);
}

template <class TupleT, reader::ReaderLike Tokenizer, class CTX, std::size_t... I>
constexpr bool ParseTupleElements(TupleT & tup, Tokenizer & reader, CTX &ctx, std::index_sequence<I...>) {
    typename Tokenizer::ArrayFrame fr;
    reader::IterationStatus iterStatus = reader.read_array_begin(fr);
    if(iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_ARRAY_IN_ARRAY_LIKE_VALUE, reader);
    } else if(iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }

    auto one = [&]<std::size_t Index>(std::integral_constant<std::size_t, Index>) {
        if(!iterStatus.has_value) {
            return ctx.withParseError(ParseError::TUPLE_LENGTH_MISMATCH, reader);
        }
        using Elem = std::tuple_element_t<Index, TupleT>;
        using Meta = options::detail::annotation_meta_getter<Elem>;
        {
            typename CTX::PathGuard guard = ctx.getArrayItemGuard(Index);
            if(!ParseValue<typename Meta::options>(Meta::getRef(std::get<Index>(tup)), reader, ctx)) {
                return false;
            }
        }
        iterStatus = reader.advance_after_value(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
        return true;
    };
    if(!(one(std::integral_constant<std::size_t, I>{}) && ...)) {
        return false;
    }
    if(iterStatus.has_value) {
        return ctx.withParseError(ParseError::TUPLE_LENGTH_MISMATCH, reader);
    }
    return true;
}

template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::YamlTuple<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Tokenizer & reader, CTX &ctx) {
    return ParseTupleElements(obj, reader, ctx, std::make_index_sequence<std::tuple_size_v<ObjT>>{});
}


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::YamlParsableArray<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Tokenizer & reader, CTX &ctx) {

    typename Tokenizer::ArrayFrame fr;
    reader::IterationStatus iterStatus = reader.read_array_begin(fr);
    if(iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_ARRAY_IN_ARRAY_LIKE_VALUE, reader);
    } else if(iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }
    std::size_t parsed_items_count = 0;

    using FH   = static_schema::array_write_cursor<ObjT>;
    FH cursor{ obj };

    cursor.reset();

    while(iterStatus.has_value) {
        stream_write_result alloc_r = cursor.allocate_slot();
        if(alloc_r != stream_write_result::slot_allocated) {
            return ctx.withParseError(ParseError::FIXED_SIZE_CONTAINER_OVERFLOW, reader);
        }

        typename FH::element_type & newItem = cursor.get_slot();
        {
            typename CTX::PathGuard guard = ctx.getArrayItemGuard(parsed_items_count);

            using Meta = options::detail::annotation_meta_getter<typename FH::element_type>;
            if(!ParseValue<typename Meta::options>(Meta::getRef(newItem), reader, ctx)) {
                return false;
            }
        }

        parsed_items_count ++;
        iterStatus = reader.advance_after_value(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
    }
    if(cursor.finalize(true) != stream_write_result::value_processed) {
        return ctx.withParseError(ParseError::FIXED_SIZE_CONTAINER_OVERFLOW, reader);
    }
    return true;
}

template <class KeyT, reader::ReaderLike Tokenizer, class CTX>
constexpr bool ParseMapKey(KeyT & key, Tokenizer & reader, CTX &ctx) {
    reader::TryParseStatus st;
    ParseError mismatch;
    if constexpr (static_schema::YamlParsableString<KeyT>) {
        key.clear();
        st = reader.read_string(key);
        mismatch = ParseError::NON_STRING_IN_STRING_STORAGE;
    } else if constexpr (static_schema::YamlBool<KeyT>) {
        st = reader.read_bool(key);
        mismatch = ParseError::NON_BOOL_IN_BOOL_VALUE;
    } else if constexpr (static_schema::YamlChar<KeyT>) {
        st = reader.read_char(key);
        mismatch = ParseError::NON_CHAR_IN_CHAR_VALUE;
    } else {
        st = reader.template read_number<KeyT>(key);
        mismatch = ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE;
    }
    if(st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    } else if(st == reader::TryParseStatus::no_match) {
        return ctx.withParseError(mismatch, reader);
    }
    return true;
}


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::YamlParsableMap<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Tokenizer & reader, CTX &ctx) {

    typename Tokenizer::MapFrame fr;

    reader::IterationStatus iterStatus = reader.read_map_begin(fr);
    if(iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_MAP_IN_MAP_LIKE_VALUE, reader);
    } else if(iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }

    std::size_t parsed_entries_count = 0;

    using FH = static_schema::map_write_cursor<ObjT>;
    FH cursor{ obj };
    cursor.reset();

    while(iterStatus.has_value) {
        if(cursor.allocate_key() != stream_write_result::slot_allocated) {
            return ctx.withParseError(ParseError::FIXED_SIZE_CONTAINER_OVERFLOW, reader);
        }

        typename FH::key_type& key = cursor.key_ref();
        if(!ParseMapKey(key, reader, ctx)) {
            return false;
        }

        if (!reader.move_to_value(fr)) {
            return ctx.withReaderError(reader);
        }

        if(cursor.allocate_value_for_parsed_key() != stream_write_result::slot_allocated) {
            return ctx.withParseError(ParseError::FIXED_SIZE_CONTAINER_OVERFLOW, reader);
        }

        typename FH::mapped_type& value = cursor.value_ref();
        {
            using Meta = options::detail::annotation_meta_getter<typename FH::mapped_type>;
            if constexpr (static_schema::YamlParsableString<typename FH::key_type>) {
                typename CTX::PathGuard guard = ctx.getMapItemGuard(key);
                if(!ParseValue<typename Meta::options>(Meta::getRef(value), reader, ctx)) {
                    return false;
                }
            } else {
                typename CTX::PathGuard guard = ctx.getArrayItemGuard(parsed_entries_count);
                if(!ParseValue<typename Meta::options>(Meta::getRef(value), reader, ctx)) {
                    return false;
                }
            }
        }

        stream_write_result finalize_r = cursor.finalize_pair(true);
        if(finalize_r != stream_write_result::value_processed) {
            return ctx.withParseError(ParseError::DUPLICATE_KEY_IN_MAP, reader);
        }

        parsed_entries_count++;

        iterStatus = reader.advance_after_value(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
    }

    return true;
}



template<class StructT, std::size_t StructIndex>
using StructFieldMeta = options::detail::annotation_meta_getter<
    introspection::structureElementTypeByIndex<StructIndex, StructT>
>;
template <class ObjT, reader::ReaderLike Tokenizer, class CTX, std::size_t... StructIndex>
constexpr bool ParseStructField(ObjT& structObj, Tokenizer & reader, CTX &ctx, std::index_sequence<StructIndex...>, std::size_t requiredIndex) {
    bool ok = false;
    auto one = [&](auto ic) {
        constexpr std::size_t J = decltype(ic)::value;
        if constexpr (!struct_fields_helper::fieldIsExcluded<ObjT, J>()) {
            if(requiredIndex == J) {
                ok = ParseValue< options::detail::aggregate_field_opts_getter<ObjT, J>>(
                       StructFieldMeta<ObjT, J>::getRef(
                           introspection::getStructElementByIndex<J>(structObj)
                           ),
                       reader, ctx
                       );
            }
        }
    };
    (one(std::integral_constant<std::size_t, StructIndex>{}), ...);
    return ok;
}


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
constexpr bool ParseStruct(ObjT& obj, Tokenizer & reader, CTX &ctx) {

    typename Tokenizer::MapFrame fr;

    reader::IterationStatus iterStatus = reader.read_map_begin(fr);
    if(iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_MAP_IN_MAP_LIKE_VALUE, reader);
    } else if(iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }

    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    static_assert(FH::fieldsAreUnique, "[[[ YamlFusion ]]] Field keys are not unique");

    std::bitset<FH::fieldsCount> parsedFieldsByIndex{};
    std::string key;

    while(iterStatus.has_value) {
        key.clear();
        if (reader::TryParseStatus st = reader.read_string(key); st == reader::TryParseStatus::error) {
            return ctx.withReaderError(reader);
        } else if (st == reader::TryParseStatus::no_match) {
            return ctx.withParseError(ParseError::NON_STRING_IN_STRING_STORAGE, reader);
        }
        const std::size_t arrayIndex = FH::find(key);

        if (!reader.move_to_value(fr)) {
            return ctx.withReaderError(reader);
        }

        if(arrayIndex == FH::NotFound) {
            if constexpr (Opts::template has_option<options::detail::allow_excess_fields_tag>) {
                if(!reader.skip_value()) {
                    return ctx.withReaderError(reader);
                }
            } else {
                typename CTX::PathGuard guard = ctx.getMapItemGuard(key);
                return ctx.withParseError(ParseError::EXCESS_FIELD, reader);
            }
        } else {
            if(parsedFieldsByIndex[arrayIndex] == true) {
                typename CTX::PathGuard guard = ctx.getMapItemGuard(key);
                return ctx.withParseError(ParseError::DUPLICATE_KEY_IN_MAP, reader);
            }

            typename CTX::PathGuard guard = ctx.getMapItemGuard(FH::fieldIndexesToFieldNames[arrayIndex].name);

            if(!ParseStructField(obj, reader, ctx, std::make_index_sequence<FH::rawFieldsCount>{},
                                 FH::fieldIndexesToFieldNames[arrayIndex].originalIndex)) {
                return false;
            }

            parsedFieldsByIndex[arrayIndex] = true;
        }

        iterStatus = reader.advance_after_value(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
    }

    // Absent nullable fields stay empty; every other field must be present
    for(std::size_t i = 0; i < FH::fieldsCount; i ++) {
        if(!parsedFieldsByIndex[i] && !FH::fieldIndexesToFieldNames[i].nullable) {
            typename CTX::PathGuard guard = ctx.getMapItemGuard(FH::fieldIndexesToFieldNames[i].name);
            return ctx.withParseError(ParseError::MISSING_FIELD, reader);
        }
    }

    return true;
}

template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::YamlObject<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Tokenizer & reader, CTX &ctx) {
    return ParseStruct<Opts>(obj, reader, ctx);
}


template <class Alt, class EnumT, reader::ReaderLike Tokenizer, class CTX>
constexpr bool ParseVariantPayload(EnumT & obj, Tokenizer & reader, CTX &ctx, typename Tokenizer::VariantFrame & vf) {
    Alt alt{};
    if constexpr (enum_details::is_unit_variant<Alt>::value) {
        if (reader::TryParseStatus st = reader.read_unit_payload(vf); st == reader::TryParseStatus::error) {
            return ctx.withReaderError(reader);
        } else if (st == reader::TryParseStatus::no_match) {
            return ctx.withParseError(ParseError::SHAPE_MISMATCH, reader);
        }
    } else {
        if(!vf.has_payload) {
            return ctx.withParseError(ParseError::SHAPE_MISMATCH, reader);
        }
        bool ok;
        if constexpr (enum_details::is_newtype_variant<Alt>::value) {
            using Meta = options::detail::annotation_meta_getter<typename Alt::payload_type>;
            ok = ParseValue<typename Meta::options>(Meta::getRef(alt.value), reader, ctx);
        } else if constexpr (enum_details::is_tuple_variant<Alt>::value) {
            ok = ParseTupleElements(alt.values, reader, ctx,
                                    std::make_index_sequence<std::tuple_size_v<typename Alt::payload_type>>{});
        } else {
            ok = ParseStruct<options::detail::no_options>(alt.fields, reader, ctx);
        }
        if(!ok) {
            return false;
        }
    }
    obj.value = std::move(alt);
    return true;
}

template <class EnumT, reader::ReaderLike Tokenizer, class CTX, std::size_t... I>
constexpr bool ParseVariantByIndex(EnumT & obj, Tokenizer & reader, CTX &ctx, typename Tokenizer::VariantFrame & vf,
                                   std::size_t index, std::index_sequence<I...>) {
    bool ok = false;
    (
        (index == I
             ? (ok = ParseVariantPayload<std::variant_alternative_t<I, typename EnumT::variant_type>>(obj, reader, ctx, vf), 0)
             : 0),
        ...
        );
    return ok;
}

template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::YamlEnum<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Tokenizer & reader, CTX &ctx) {
    std::string name;
    typename Tokenizer::VariantFrame vf{};
    if (reader::TryParseStatus st = reader.read_variant_begin(name, vf); st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    } else if (st == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::SHAPE_MISMATCH, reader);
    }

    const std::size_t index = ObjT::index_of(name);
    typename CTX::PathGuard guard = ctx.getMapItemGuard(name);
    if(index == ObjT::VariantCount) {
        return ctx.withParseError(ParseError::UNKNOWN_VARIANT, reader);
    }
    if(!ParseVariantByIndex(obj, reader, ctx, vf, index, std::make_index_sequence<ObjT::VariantCount>{})) {
        return false;
    }

    if (reader::TryParseStatus st = reader.read_variant_end(vf); st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    } else if (st == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::SHAPE_MISMATCH, reader);
    }
    return true;
}

template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::YamlTagged<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Tokenizer & reader, CTX &ctx) {
    if (reader::TryParseStatus st = reader.read_tag(obj.tag); st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    } else if (st == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::SHAPE_MISMATCH, reader);
    }
    using Meta = options::detail::annotation_meta_getter<decltype(obj.value)>;
    return ParseValue<typename Meta::options>(Meta::getRef(obj.value), reader, ctx);
}


template <class FieldOptions, static_schema::YamlParsableValue Field, reader::ReaderLike Tokenizer, class CTX>
constexpr bool ParsePresentOrNull(Field & field, Tokenizer & reader, CTX &ctx) {
    if(reader::TryParseStatus r = reader.start_value_and_try_read_null(); r == reader::TryParseStatus::ok) {
        if constexpr(static_schema::YamlNullableParsableValue<Field>) {
            static_schema::setNull(field);
            return true;
        } else if constexpr(static_schema::YamlUnit<Field>) {
            return true;
        } else {
            return ctx.withParseError(ParseError::NULL_IN_NON_OPTIONAL, reader);
        }
    } else if(r == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    } else {
        return ParseNonNullValue<FieldOptions>(static_schema::getRef(field), reader, ctx);
    }
}

template <class FieldOptions, static_schema::YamlParsableValue Field, reader::ReaderLike Tokenizer, class CTX>
constexpr bool ParseValue(Field & field, Tokenizer & reader, CTX &ctx) {

    if constexpr (FieldOptions::template has_option<options::detail::exclude_tag>) {
        if(!reader.skip_value()) {
            return ctx.withReaderError(reader);
        }
        return true;
    } else if constexpr (FieldOptions::template has_option<options::detail::singleton_map_tag>) {
        using Repr = typename FieldOptions::template get_option<options::detail::singleton_map_tag>;
        static_assert(!Repr::RequiresNullable || static_schema::YamlNullableParsableValue<Field>,
                      "[[[ YamlFusion ]]] singleton_map_optional applies to std::optional or std::unique_ptr fields");
        return with_singleton_map_reader<Repr::Recursive>(reader, [&](auto & proxy) {
            return ParsePresentOrNull<FieldOptions>(field, proxy, ctx);
        });
    } else {
        return ParsePresentOrNull<FieldOptions>(field, reader, ctx);
    }
}


} // namespace parser_details


template <static_schema::YamlParsableValue InputObjectT, reader::ReaderLike Reader>
constexpr auto ParseWithReader(InputObjectT & obj, Reader & reader) {
    using CtxT = parser_details::DeserializationContext<typename Reader::error_type>;

    CtxT ctx;

    if(reader.getError() != typename Reader::error_type{}) {
        ctx.withReaderError(reader);
        return ctx.result();
    }

    using Meta = options::detail::annotation_meta_getter<InputObjectT>;

    parser_details::ParseValue<typename Meta::options>(Meta::getRef(obj), reader, ctx);

    if(ctx.currentError() == ParseError::NO_ERROR) {
        if(!reader.finish()) {
            ctx.withReaderError(reader);
        }
    }
    return ctx.result();
}


template <class T>
    requires (!static_schema::YamlParsableValue<T>)
constexpr auto ParseWithReader(T &, auto &) {
    static_assert(detail::always_false<T>::value,
                  "[[[ YamlFusion ]]] T is not a supported YamlFusion parsable value model type.\n"
                  "see YamlParsableValue concept for full rules");
}


} // namespace YamlFusion
