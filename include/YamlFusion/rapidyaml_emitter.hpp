#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <rapidyaml.hpp>

#include "events.hpp"

namespace YamlFusion {

namespace sink {

/*
 * Event sink that assembles each document as a rapidyaml tree and appends
 * its emitted text to an output string when the document ends.
 * Documents after the first are separated by `---`.
 */
class RapidYamlEmitter {
public:
    enum class Error {
        None,
        InvalidState,     // events out of order
        ComplexKey,       // a sequence or mapping in key position
        OutputFailed
    };

    using error_type = Error;

    explicit RapidYamlEmitter(std::string& output)
        : output_(&output)
    {}

    error_type getError() const noexcept {
        return error_;
    }

    std::size_t documents() const noexcept {
        return documents_;
    }

    bool emit(const Event & ev) {
        if (!ensure_ok()) return false;
        switch (ev.kind) {
        case EventKind::StreamStart:
        case EventKind::StreamEnd:
            return scopes_.empty() ? true : fail(Error::InvalidState);
        case EventKind::DocumentStart:
            if (in_document_) return fail(Error::InvalidState);
            tree_ = ryml::Tree();
            scopes_.clear();
            root_written_ = false;
            in_document_ = true;
            return true;
        case EventKind::DocumentEnd:
            return end_document();
        case EventKind::Scalar:
            return attach_scalar(ev);
        case EventKind::SequenceStart:
            return open_container(ryml::SEQ, ev.tag);
        case EventKind::MappingStart:
            return open_container(ryml::MAP, ev.tag);
        case EventKind::SequenceEnd:
            return close_container(false);
        case EventKind::MappingEnd:
            return close_container(true);
        }
        return fail(Error::InvalidState);
    }

private:
    struct Scope {
        ryml::NodeRef node{};
        bool          is_map        = false;
        bool          expecting_key = true;
        std::string   pending_key;
        std::string   pending_key_tag;
        ScalarStyle   pending_key_style = ScalarStyle::Plain;
    };

    std::string*       output_;
    ryml::Tree         tree_;
    std::vector<Scope> scopes_;
    Error              error_        = Error::None;
    std::size_t        documents_    = 0;
    bool               in_document_  = false;
    bool               root_written_ = false;

    bool fail(Error e) {
        if (error_ == Error::None) {
            error_ = e;
        }
        return false;
    }

    bool ensure_ok() const {
        return error_ == Error::None;
    }

    c4::csubstr arena_copy(std::string_view s) {
        return tree_.to_arena(c4::csubstr(s.data(), s.size()));
    }

    static void apply_val_style(ryml::NodeRef node, ScalarStyle style, bool empty_with_tag) {
        switch (style) {
        case ScalarStyle::SingleQuoted: node |= ryml::VAL_SQUO; break;
        case ScalarStyle::Literal:      node |= ryml::VAL_LITERAL; break;
        case ScalarStyle::Plain:
            // an empty plain scalar behind a tag stays empty instead of becoming ''
            if (empty_with_tag) node |= ryml::VAL_PLAIN;
            break;
        }
    }

    static void apply_key_style(ryml::NodeRef node, ScalarStyle style) {
        switch (style) {
        case ScalarStyle::SingleQuoted: node |= ryml::KEY_SQUO; break;
        case ScalarStyle::Literal:      node |= ryml::KEY_LITERAL; break;
        case ScalarStyle::Plain: break;
        }
    }

    // Creates the node for the next value at the current position
    ryml::NodeRef next_value_node(ryml::NodeType_e type) {
        if (scopes_.empty()) {
            if (root_written_) {
                fail(Error::InvalidState);
                return ryml::NodeRef{};
            }
            root_written_ = true;
            ryml::NodeRef root = tree_.rootref();
            root |= type;
            return root;
        }
        Scope & scope = scopes_.back();
        ryml::NodeRef child = scope.node.append_child();
        if (!scope.is_map) {
            child |= type;
            return child;
        }
        child |= type;
        child.set_key(arena_copy(scope.pending_key));
        if (!scope.pending_key_tag.empty()) {
            child.set_key_tag(arena_copy(scope.pending_key_tag));
        }
        apply_key_style(child, scope.pending_key_style);
        scope.pending_key.clear();
        scope.pending_key_tag.clear();
        scope.pending_key_style = ScalarStyle::Plain;
        scope.expecting_key = true;
        return child;
    }

    bool attach_scalar(const Event & ev) {
        if (!in_document_) return fail(Error::InvalidState);
        if (!scopes_.empty() && scopes_.back().is_map && scopes_.back().expecting_key) {
            Scope & scope = scopes_.back();
            scope.pending_key.assign(ev.value.data(), ev.value.size());
            scope.pending_key_tag.assign(ev.tag.data(), ev.tag.size());
            scope.pending_key_style = ev.style;
            scope.expecting_key = false;
            return true;
        }
        const bool in_map = !scopes_.empty() && scopes_.back().is_map;
        ryml::NodeRef node = next_value_node(in_map ? ryml::KEYVAL : ryml::VAL);
        if (!node.readable()) return false;
        node.set_val(arena_copy(ev.value));
        if (!ev.tag.empty()) {
            node.set_val_tag(arena_copy(ev.tag));
        }
        apply_val_style(node, ev.style, ev.value.empty() && !ev.tag.empty());
        return true;
    }

    bool open_container(ryml::NodeType_e type, std::string_view tag) {
        if (!in_document_) return fail(Error::InvalidState);
        if (!scopes_.empty() && scopes_.back().is_map && scopes_.back().expecting_key) {
            return fail(Error::ComplexKey);
        }
        ryml::NodeRef node = next_value_node(type);
        if (!node.readable()) return false;
        if (!tag.empty()) {
            node.set_val_tag(arena_copy(tag));
        }
        Scope scope;
        scope.node = node;
        scope.is_map = (type == ryml::MAP);
        scopes_.push_back(std::move(scope));
        return true;
    }

    bool close_container(bool is_map) {
        if (scopes_.empty() || scopes_.back().is_map != is_map) {
            return fail(Error::InvalidState);
        }
        if (is_map && !scopes_.back().expecting_key) {
            return fail(Error::InvalidState);
        }
        ryml::NodeRef node = scopes_.back().node;
        if (node.num_children() == 0) {
            // `[]` / `{}` rather than an empty block
            node |= ryml::FLOW_SL;
        }
        scopes_.pop_back();
        return true;
    }

    bool end_document() {
        if (!in_document_ || !scopes_.empty() || !root_written_) {
            return fail(Error::InvalidState);
        }
        in_document_ = false;
        std::string text = ryml::emitrs_yaml<std::string>(tree_);
        if (text.empty()) {
            return fail(Error::OutputFailed);
        }
        if (documents_ > 0) {
            output_->append("---\n");
        }
        output_->append(text);
        if (output_->back() != '\n') {
            output_->push_back('\n');
        }
        ++documents_;
        return true;
    }
};

static_assert(EventSinkLike<RapidYamlEmitter>);

} // namespace sink

} // namespace YamlFusion
