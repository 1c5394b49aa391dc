#pragma once
#include <rapidyaml.hpp>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "reader_concept.hpp"
#include "scalar_parse.hpp"
#include "number.hpp"

namespace YamlFusion {

namespace ryml_details {

struct RapidYamlParseFailure : std::runtime_error {
    using std::runtime_error::runtime_error;
};

[[noreturn]] inline void throw_on_error(const char* msg, std::size_t len, ryml::Location, void*) {
    throw RapidYamlParseFailure(std::string(msg, len));
}

// rapidyaml reports malformed input through an error callback that aborts by default.
// Each tree and parser gets its own copy, so no process-wide state changes during a parse.
inline ryml::Callbacks throwing_callbacks() {
    ryml::Callbacks cb = ryml::get_callbacks();
    cb.m_error = &throw_on_error;
    return cb;
}

inline std::string_view to_view(c4::csubstr s) {
    return std::string_view(s.data(), s.size());
}

// `!Name` -> `Name`; verbatim `!<Name>` -> `Name`
inline std::string_view strip_tag(c4::csubstr tag) {
    std::string_view t = to_view(tag);
    if (t.starts_with("!<") && t.ends_with(">")) {
        return t.substr(2, t.size() - 3);
    }
    if (t.starts_with('!')) {
        t.remove_prefix(1);
    }
    return t;
}

} // namespace ryml_details

class RapidYamlReader {
public:
    enum class ParseError {
        NO_ERROR,
        UNEXPECTED_END_OF_DATA,
        ILLFORMED_DOCUMENT,
        ILLFORMED_OBJECT,
        ILLFORMED_ARRAY,
        NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE,
        UNSUPPORTED_YAML_FEATURE  // anchors and aliases
    };
    using error_type = ParseError;

    using iterator_type = ryml::ConstNodeRef;

    struct ArrayFrame {
        ryml::ConstNodeRef node{};
        std::size_t        index = 0;
        std::size_t        size  = 0;
        ryml::ConstNodeRef current{};
    };

    struct MapFrame {
        ryml::ConstNodeRef node{};
        std::size_t        index = 0;
        std::size_t        size  = 0;
        ryml::ConstNodeRef current_child{};  // current key-value pair node
    };

    // The payload of a tagged variant is the tagged node itself
    struct VariantFrame {
        bool has_payload = false;
    };

    // Constructor for an external tree (user manages lifetime)
    explicit RapidYamlReader(ryml::ConstNodeRef root)
        : root_(root)
        , current_(root)
    {
        if (root_.readable()) {
            documents_.push_back(root_);
            checkUnsupportedFeatures(root_);
        }
    }

    // Parses the whole stream; the first document is selected
    RapidYamlReader(const char* yaml_data, std::size_t yaml_len)
        : tree_(std::make_unique<ryml::Tree>(ryml_details::throwing_callbacks()))
    {
        try {
            ryml::EventHandlerTree handler(tree_->callbacks());
            ryml::Parser parser(&handler);
            ryml::parse_in_arena(&parser, c4::csubstr(yaml_data, yaml_len), tree_.get());
        } catch (const ryml_details::RapidYamlParseFailure& e) {
            message_ = e.what();
            setError(ParseError::ILLFORMED_DOCUMENT);
            return;
        }

        ryml::ConstNodeRef top = tree_->crootref();
        if (top.is_stream()) {
            for (ryml::ConstNodeRef doc : top.children()) {
                documents_.push_back(doc);
            }
        } else {
            documents_.push_back(top);
        }
        if (!select_document(0)) {
            return;
        }
        for (ryml::ConstNodeRef doc : documents_) {
            checkUnsupportedFeatures(doc);
        }
    }

    RapidYamlReader(const RapidYamlReader&) = delete;
    RapidYamlReader& operator=(const RapidYamlReader&) = delete;
    RapidYamlReader(RapidYamlReader&&) noexcept = default;
    RapidYamlReader& operator=(RapidYamlReader&&) noexcept = default;

    // ---- Introspection ----

    iterator_type current() const noexcept {
        return current_;
    }

    ParseError getError() const noexcept { return err_; }

    // Text reported by rapidyaml for ILLFORMED_DOCUMENT
    const std::string& message() const noexcept { return message_; }

    std::size_t document_count() const noexcept { return documents_.size(); }

    bool select_document(std::size_t index) {
        if (index >= documents_.size()) {
            setError(ParseError::UNEXPECTED_END_OF_DATA);
            return false;
        }
        root_ = documents_[index];
        current_ = root_;
        reading_key_ = false;
        return true;
    }

    // ---- Scalars ----

    // A tagged node is not null until its tag has been taken: `!Variant` alone names a unit variant
    reader::TryParseStatus start_value_and_try_read_null() {
        if (ok() && !reading_key_ && current_.readable() && has_fresh_tag()) {
            return reader::TryParseStatus::no_match;
        }
        return read_untagged_null();
    }

    reader::TryParseStatus read_bool(bool& b) {
        c4::csubstr val;
        bool quoted = false;
        auto st = scalar_text(val, quoted);
        if (st != reader::TryParseStatus::ok) return st;
        if (quoted) return reader::TryParseStatus::no_match;
        if (auto parsed = scalar::parse_bool(ryml_details::to_view(val))) {
            b = *parsed;
            return reader::TryParseStatus::ok;
        }
        return reader::TryParseStatus::no_match;
    }

    template<class NumberT>
    reader::TryParseStatus read_number(NumberT& storage) {
        c4::csubstr val;
        bool quoted = false;
        auto st = scalar_text(val, quoted);
        if (st != reader::TryParseStatus::ok) return st;
        if (quoted || val.empty()) return reader::TryParseStatus::no_match;
        const std::string_view text = ryml_details::to_view(val);

        if constexpr (std::is_same_v<NumberT, Number>) {
            Number n;
            if (Number::from_str(text, n) != NumberParseError::NO_ERROR) {
                return reader::TryParseStatus::no_match;
            }
            storage = n;
            return reader::TryParseStatus::ok;
        } else if constexpr (std::is_integral_v<NumberT>) {
            if (auto u = scalar::parse_unsigned_int(text)) {
                if (*u > static_cast<std::uint64_t>(std::numeric_limits<NumberT>::max())) {
                    setError(ParseError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);
                    return reader::TryParseStatus::error;
                }
                storage = static_cast<NumberT>(*u);
                return reader::TryParseStatus::ok;
            }
            if (auto i = scalar::parse_negative_int(text)) {
                if constexpr (std::is_unsigned_v<NumberT>) {
                    setError(ParseError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);
                    return reader::TryParseStatus::error;
                } else {
                    if (*i < static_cast<std::int64_t>(std::numeric_limits<NumberT>::min())) {
                        setError(ParseError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);
                        return reader::TryParseStatus::error;
                    }
                    storage = static_cast<NumberT>(*i);
                    return reader::TryParseStatus::ok;
                }
            }
            return reader::TryParseStatus::no_match;
        } else {
            static_assert(std::is_floating_point_v<NumberT>,
                          "read_number only supports integral, floating or Number types");
            Number n;
            if (Number::from_str(text, n) != NumberParseError::NO_ERROR) {
                return reader::TryParseStatus::no_match;
            }
            const double d = n.to_f64();
            if constexpr (!std::is_same_v<NumberT, double>) {
                if (n.is_finite() && (d < static_cast<double>(std::numeric_limits<NumberT>::lowest()) ||
                                      d > static_cast<double>(std::numeric_limits<NumberT>::max()))) {
                    setError(ParseError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);
                    return reader::TryParseStatus::error;
                }
            }
            storage = static_cast<NumberT>(d);
            return reader::TryParseStatus::ok;
        }
    }

    reader::TryParseStatus read_char(char& c) {
        c4::csubstr val;
        bool quoted = false;
        auto st = scalar_text(val, quoted);
        if (st != reader::TryParseStatus::ok) return st;
        if (val.size() != 1) return reader::TryParseStatus::no_match;
        c = val[0];
        return reader::TryParseStatus::ok;
    }

    // Any scalar reads as a string, whatever its style
    reader::TryParseStatus read_string(std::string& out) {
        c4::csubstr val;
        bool quoted = false;
        auto st = scalar_text(val, quoted);
        if (st != reader::TryParseStatus::ok) return st;
        out.assign(val.data(), val.size());
        return reader::TryParseStatus::ok;
    }

    reader::TryParseStatus read_tag(std::string& tag) {
        if (!current_.readable()) {
            setError(ParseError::UNEXPECTED_END_OF_DATA);
            return reader::TryParseStatus::error;
        }
        if (!has_fresh_tag()) {
            return reader::TryParseStatus::no_match;
        }
        tag = ryml_details::strip_tag(current_.val_tag());
        tag_taken_ = current_;
        return reader::TryParseStatus::ok;
    }

    // ---- Enum variants ----

    // `!Variant payload` or a bare `Variant` scalar
    reader::TryParseStatus read_variant_begin(std::string& name, VariantFrame& frame) {
        if (!current_.readable()) {
            setError(ParseError::UNEXPECTED_END_OF_DATA);
            return reader::TryParseStatus::error;
        }
        if (has_fresh_tag()) {
            name = ryml_details::strip_tag(current_.val_tag());
            tag_taken_ = current_;
            frame.has_payload = true;
            return reader::TryParseStatus::ok;
        }
        frame.has_payload = false;
        return read_string(name);
    }

    // `!Unit`, `!Unit ''` and `!Unit ~` all name the unit variant
    reader::TryParseStatus read_unit_payload(VariantFrame& frame) {
        if (!frame.has_payload) return reader::TryParseStatus::ok;
        c4::csubstr val;
        bool quoted = false;
        auto st = scalar_text(val, quoted);
        if (st != reader::TryParseStatus::ok) return st;
        if (val.empty() || (!quoted && scalar::parse_null(ryml_details::to_view(val)))) {
            return reader::TryParseStatus::ok;
        }
        return reader::TryParseStatus::no_match;
    }

    reader::TryParseStatus read_variant_end(VariantFrame&) {
        return ok() ? reader::TryParseStatus::ok : reader::TryParseStatus::error;
    }

    // ---- Arrays ----

    reader::IterationStatus read_array_begin(ArrayFrame& frame) {
        reading_key_ = false;

        reader::IterationStatus ret;
        if (!current_.readable()) {
            setError(ParseError::ILLFORMED_ARRAY);
            ret.status = reader::TryParseStatus::error;
            return ret;
        }

        if (!current_.is_seq()) {
            ret.status = reader::TryParseStatus::no_match;
            return ret;
        }

        frame.node    = current_;
        frame.size    = current_.num_children();
        frame.index   = 0;
        frame.current = ryml::ConstNodeRef{};

        if (frame.size > 0) {
            frame.current = current_.first_child();
            current_ = frame.current;
            ret.has_value = true;
        } else {
            ret.has_value = false;
        }
        ret.status = reader::TryParseStatus::ok;

        return ret;
    }

    reader::IterationStatus advance_after_value(ArrayFrame& frame) {
        reading_key_ = false;
        reader::IterationStatus ret;

        if (!frame.node.readable()) {
            setError(ParseError::ILLFORMED_ARRAY);
            ret.status = reader::TryParseStatus::error;
            return ret;
        }

        ++frame.index;
        if (frame.index < frame.size) {
            frame.current = frame.current.next_sibling();
            current_ = frame.current;
            ret.has_value = true;
        } else {
            frame.current = ryml::ConstNodeRef{};
            current_ = frame.node;
            ret.has_value = false;
        }
        ret.status = reader::TryParseStatus::ok;
        return ret;
    }

    // ---- Maps ----

    reader::IterationStatus read_map_begin(MapFrame& frame) {
        reading_key_ = false;
        reader::IterationStatus ret;

        if (!current_.readable()) {
            setError(ParseError::ILLFORMED_OBJECT);
            ret.status = reader::TryParseStatus::error;
            return ret;
        }

        if (!current_.is_map()) {
            ret.status = reader::TryParseStatus::no_match;
            return ret;
        }

        frame.node          = current_;
        frame.size          = current_.num_children();
        frame.index         = 0;
        frame.current_child = ryml::ConstNodeRef{};

        if (frame.size > 0) {
            frame.current_child = current_.first_child();
            current_ = frame.current_child;  // point to first key-value node
            reading_key_ = true;  // next scalar read is the key
            ret.has_value = true;
        } else {
            current_ = frame.node;
            ret.has_value = false;
        }

        ret.status = reader::TryParseStatus::ok;
        return ret;
    }

    bool move_to_value(MapFrame& frame) {
        if (!frame.current_child.readable()) {
            setError(ParseError::UNEXPECTED_END_OF_DATA);
            return false;
        }
        reading_key_ = false;
        // current_ already points to the child node which has both key and val
        return true;
    }

    reader::IterationStatus advance_after_value(MapFrame& frame) {
        reading_key_ = false;
        reader::IterationStatus ret;

        if (!frame.node.readable()) {
            setError(ParseError::ILLFORMED_OBJECT);
            ret.status = reader::TryParseStatus::error;
            return ret;
        }

        ++frame.index;
        if (frame.index < frame.size) {
            frame.current_child = frame.current_child.next_sibling();
            current_ = frame.current_child;
            reading_key_ = true;
            ret.has_value = true;
        } else {
            frame.current_child = ryml::ConstNodeRef{};
            current_ = frame.node;
            ret.has_value = false;
        }
        ret.status = reader::TryParseStatus::ok;

        return ret;
    }

    // ---- Skip/Finish ----

    bool skip_value() {
        // DOM is already built; skip is a no-op
        return ok();
    }

    bool finish() {
        return ok();
    }

private:
    std::unique_ptr<ryml::Tree>     tree_;
    std::vector<ryml::ConstNodeRef> documents_;
    ryml::ConstNodeRef              root_{};
    ryml::ConstNodeRef              current_{};
    ryml::ConstNodeRef              tag_taken_{};   // node whose tag was read as a variant name or Tagged tag
    ParseError                      err_         = ParseError::NO_ERROR;
    bool                            reading_key_ = false;
    std::string                     message_;

    bool ok() const noexcept {
        return err_ == ParseError::NO_ERROR;
    }

    void setError(ParseError e) noexcept {
        if (err_ == ParseError::NO_ERROR) err_ = e;
    }

    // The payload of `!Outer Unit` sits on the node whose tag named `Outer`
    bool has_fresh_tag() const {
        return current_.has_val_tag() && !(current_ == tag_taken_);
    }

    reader::TryParseStatus read_untagged_null() {
        c4::csubstr val;
        bool quoted = false;
        auto st = scalar_text(val, quoted);
        if (st != reader::TryParseStatus::ok) return st;
        if (quoted) return reader::TryParseStatus::no_match;
        if (val.empty() || scalar::parse_null(ryml_details::to_view(val))) {
            return reader::TryParseStatus::ok;
        }
        return reader::TryParseStatus::no_match;
    }

    // Text of the key (while a key is expected) or of the scalar value
    reader::TryParseStatus scalar_text(c4::csubstr& out, bool& quoted) {
        if (!ok()) return reader::TryParseStatus::error;
        if (!current_.readable()) {
            setError(ParseError::UNEXPECTED_END_OF_DATA);
            return reader::TryParseStatus::error;
        }
        if (reading_key_) {
            if (!current_.has_key()) {
                return reader::TryParseStatus::no_match;
            }
            out = current_.key();
            quoted = current_.is_key_quoted();
            return reader::TryParseStatus::ok;
        }
        if (current_.is_container() || !current_.has_val()) {
            return reader::TryParseStatus::no_match;
        }
        out = current_.val();
        quoted = current_.is_val_quoted();
        return reader::TryParseStatus::ok;
    }

    bool hasUnsupportedFeatures(ryml::ConstNodeRef node) const {
        if (!node.readable()) return false;
        if (node.has_key_anchor() || node.has_val_anchor()) return true;
        if (node.is_key_ref() || node.is_val_ref()) return true;
        return false;
    }

    void checkUnsupportedFeatures(ryml::ConstNodeRef node) {
        if (hasUnsupportedFeatures(node)) {
            setError(ParseError::UNSUPPORTED_YAML_FEATURE);
            return;
        }
        if (node.is_container()) {
            for (ryml::ConstNodeRef child : node.children()) {
                checkUnsupportedFeatures(child);
                if (!ok()) return;
            }
        }
    }
};

constexpr std::string_view error_to_string(RapidYamlReader::ParseError e) {
    switch(e) {
    case RapidYamlReader::ParseError::NO_ERROR: return "NO_ERROR"; break;
    case RapidYamlReader::ParseError::UNEXPECTED_END_OF_DATA: return "UNEXPECTED_END_OF_DATA"; break;
    case RapidYamlReader::ParseError::ILLFORMED_DOCUMENT: return "ILLFORMED_DOCUMENT"; break;
    case RapidYamlReader::ParseError::ILLFORMED_OBJECT: return "ILLFORMED_OBJECT"; break;
    case RapidYamlReader::ParseError::ILLFORMED_ARRAY: return "ILLFORMED_ARRAY"; break;
    case RapidYamlReader::ParseError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE: return "NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE"; break;
    case RapidYamlReader::ParseError::UNSUPPORTED_YAML_FEATURE: return "UNSUPPORTED_YAML_FEATURE"; break;
    }
    return "N/A";
}

static_assert(reader::ReaderLike<RapidYamlReader>);

} // namespace YamlFusion
