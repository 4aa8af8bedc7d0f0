/*
 * serializer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-04

Description: Public entry points for converting values to and from YAML

**************************************************/

#include "serializer.hpp"

#include <iterator>

#include <spdlog/spdlog.h>

#include "yamlet/serial/dispatch.hpp"
#include "yamlet/serial/reference_resolver.hpp"
#include "yamlet/yaml/errors.hpp"
#include "yamlet/yaml/reader.hpp"
#include "yamlet/yaml/writer.hpp"

namespace yamlet {

namespace {

auto requireRegistry(const SerializerOptions& options)
    -> std::shared_ptr<const TypeRegistry> {
    auto registry = options.typeInfoSource();
    if (!registry) {
        THROW_MISSING_TYPE_METADATA("*", ": no type registry is configured");
    }
    return registry;
}

void skipComments(Reader& reader) {
    while (reader.tokenType() == TokenType::Comment && reader.advance()) {
    }
}

}  // namespace

auto Serializer::serializeSlots(const SlotOps& ops,
                                const std::vector<const void*>& slots,
                                const SerializerOptions& options)
    -> std::string {
    options.freeze();
    auto registry = requireRegistry(options);
    const std::string typeName = demangle(ops.valueType);
    spdlog::debug("serializer: writing {} document(s) of {}", slots.size(),
                  typeName);
    try {
        Writer writer(options.writerOptions());
        for (const void* slot : slots) {
            auto references =
                ReferenceResolver::create(options.referenceHandling());
            WriteContext context(writer, options, *registry, references.get());
            writer.writeDocumentStart();
            context.writeSlot(ops, slot);
            writer.writeDocumentEnd();
        }
        writer.writeStreamEnd();
        std::string text = writer.take();
        spdlog::debug("serializer: wrote {} byte(s) of {}", text.size(),
                      typeName);
        return text;
    } catch (const error::Exception& e) {
        spdlog::error("serializer: writing {} failed: {}", typeName,
                      e.getMessage());
        throw;
    }
}

auto Serializer::readDocuments(std::string_view text, const SlotOps& ops,
                               const std::function<void*()>& nextSlot,
                               bool firstOnly,
                               const SerializerOptions& options)
    -> std::size_t {
    options.freeze();
    auto registry = requireRegistry(options);
    const std::string typeName = demangle(ops.valueType);
    spdlog::debug("serializer: reading {} from {} byte(s)", typeName,
                  text.size());
    try {
        Reader reader(text, options.readerOptions());
        std::size_t count = 0;
        reader.advance();
        while (reader.advance()) {
            skipComments(reader);
            if (reader.tokenType() == TokenType::StreamEnd) {
                break;
            }
            if (reader.tokenType() != TokenType::DocumentStart) {
                THROW_PARSE_ERROR(reader.mark(), "Expected a document, found ",
                                  toString(reader.tokenType()));
            }

            // Anchors never cross document boundaries.
            PreserveResolver references;
            ReadContext context(reader, options, *registry, references);
            void* slot = nextSlot();
            context.next();
            if (reader.tokenType() != TokenType::DocumentEnd) {
                context.readSlot(ops, slot);
                context.next();
            }
            if (reader.tokenType() != TokenType::DocumentEnd) {
                THROW_PARSE_ERROR(reader.mark(),
                                  "Expected the end of the document, found ",
                                  toString(reader.tokenType()));
            }
            spdlog::trace("serializer: document {} read", count);
            ++count;
            if (firstOnly) {
                break;
            }
        }
        spdlog::debug("serializer: read {} document(s) of {}", count,
                      typeName);
        return count;
    } catch (const error::Exception& e) {
        spdlog::error("serializer: reading {} failed: {}", typeName,
                      e.getMessage());
        throw;
    }
}

void Serializer::writeStream(std::ostream& out, const std::string& text) {
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!out) {
        THROW_RUNTIME_ERROR("Failed to write ", text.size(),
                            " byte(s) to the output stream");
    }
}

auto Serializer::readStream(std::istream& in) -> std::string {
    std::string text{std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>()};
    if (in.bad()) {
        THROW_RUNTIME_ERROR("Failed to read the input stream");
    }
    return text;
}

}  // namespace yamlet
