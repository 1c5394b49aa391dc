#pragma once

#include <cstddef>
#include <ios>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "encoder.hpp"
#include "io.hpp"
#include "parser.hpp"
#include "rapidyaml_emitter.hpp"
#include "rapidyaml_reader.hpp"
#include "serializer.hpp"

namespace YamlFusion {

using RapidYamlWriter = YamlEncoder<sink::RapidYamlEmitter>;

namespace yaml_details {

template<class WriterError>
SerializeResult<WriterError> publish(SerializeResult<WriterError> res, std::string & text, std::string & out) {
    if(!res) {
        return res;
    }
    if(!io::is_valid_utf8(text)) {
        return SerializeResult<WriterError>(SerializeError::UTF8_ERROR, WriterError{});
    }
    out = std::move(text);
    return res;
}

} // namespace yaml_details

// YAML text of obj. On failure `out` is left empty.
template<static_schema::YamlSerializableValue InputObjectT>
SerializeResult<EncodeError> Serialize(const InputObjectT & obj, std::string & out, EncoderConfig config = {}) {
    out.clear();
    std::string text;
    RapidYamlWriter writer(sink::RapidYamlEmitter(text), config);
    return yaml_details::publish(SerializeWithWriter(obj, writer), text, out);
}

// Result of writing into a stream: IO_ERROR carries the stream's state bits
class StreamSerializeResult : public SerializeResult<EncodeError> {
    std::ios_base::iostate m_streamState = std::ios_base::goodbit;
public:
    StreamSerializeResult(SerializeResult<EncodeError> res, std::ios_base::iostate state):
        SerializeResult<EncodeError>(res), m_streamState(state)
    {}
    std::ios_base::iostate streamState() const {
        return m_streamState;
    }
};

template<static_schema::YamlSerializableValue InputObjectT>
StreamSerializeResult Serialize(const InputObjectT & obj, std::ostream & os, EncoderConfig config = {}) {
    std::string text;
    auto res = Serialize(obj, text, config);
    if(!res) {
        return StreamSerializeResult(res, os.rdstate());
    }
    os.write(text.data(), static_cast<std::streamsize>(text.size()));
    if(!os) {
        return StreamSerializeResult(SerializeResult<EncodeError>(SerializeError::IO_ERROR, EncodeError::NO_ERROR),
                                     os.rdstate());
    }
    return StreamSerializeResult(res, os.rdstate());
}

// Multi-document stream, documents separated by `---`
template<static_schema::YamlSerializableValue InputObjectT>
SerializeResult<EncodeError> SerializeDocuments(const std::vector<InputObjectT> & docs, std::string & out, EncoderConfig config = {}) {
    out.clear();
    std::string text;
    RapidYamlWriter writer(sink::RapidYamlEmitter(text), config);
    return yaml_details::publish(SerializeDocumentsWithWriter(docs, writer), text, out);
}

template<static_schema::YamlParsableValue InputObjectT>
ParseResult<RapidYamlReader::ParseError> Parse(InputObjectT & obj, std::string_view yaml) {
    RapidYamlReader reader(yaml.data(), yaml.size());
    if(reader.document_count() > 1) {
        // a single value cannot come from several documents
        return ParseResult<RapidYamlReader::ParseError>(ParseError::UNSUPPORTED_CONSTRUCT,
                                                        RapidYamlReader::ParseError::NO_ERROR, path::Path{});
    }
    return ParseWithReader(obj, reader);
}

// Every document of the stream, in order. Stops at the first failing document.
template<static_schema::YamlParsableValue InputObjectT>
ParseResult<RapidYamlReader::ParseError> ParseDocuments(std::vector<InputObjectT> & docs, std::string_view yaml) {
    docs.clear();
    RapidYamlReader reader(yaml.data(), yaml.size());
    if(reader.getError() != RapidYamlReader::ParseError::NO_ERROR) {
        return ParseResult<RapidYamlReader::ParseError>(ParseError::READER_ERROR, reader.getError(), path::Path{});
    }
    for(std::size_t i = 0; i < reader.document_count(); i ++) {
        if(!reader.select_document(i)) {
            return ParseResult<RapidYamlReader::ParseError>(ParseError::READER_ERROR, reader.getError(), path::Path{});
        }
        auto res = ParseWithReader(docs.emplace_back(), reader);
        if(!res) {
            return res;
        }
    }
    return ParseResult<RapidYamlReader::ParseError>(ParseError::NO_ERROR, RapidYamlReader::ParseError::NO_ERROR, path::Path{});
}

} // namespace YamlFusion
