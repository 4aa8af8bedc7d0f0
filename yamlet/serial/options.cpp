/*
 * options.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-04

Description: Serializer options with freeze-on-first-use semantics

**************************************************/

#include "options.hpp"

#include <spdlog/spdlog.h>

#include "yamlet/yaml/errors.hpp"

namespace yamlet {

SerializerOptions::SerializerOptions(const SerializerOptions& other) {
    copyFrom(other);
}

auto SerializerOptions::operator=(const SerializerOptions& other)
    -> SerializerOptions& {
    if (this != &other) {
        checkWritable("*");
        copyFrom(other);
    }
    return *this;
}

SerializerOptions::SerializerOptions(DefaultTag) : is_default_(true) {
    read_only_.store(true, std::memory_order_release);
}

auto SerializerOptions::defaultInstance() -> SerializerOptions& {
    static SerializerOptions instance{DefaultTag{}};
    return instance;
}

void SerializerOptions::copyFrom(const SerializerOptions& other) {
    max_depth_ = other.max_depth_;
    max_alias_expansion_ = other.max_alias_expansion_;
    indent_size_ = other.indent_size_;
    prefer_flow_style_ = other.prefer_flow_style_;
    indent_sequence_items_ = other.indent_sequence_items_;
    default_scalar_style_ = other.default_scalar_style_;
    discriminator_position_ = other.discriminator_position_;
    ignore_null_values_ = other.ignore_null_values_;
    ignore_empty_objects_ = other.ignore_empty_objects_;
    ignore_read_only_properties_ = other.ignore_read_only_properties_;
    include_fields_ = other.include_fields_;
    allow_trailing_commas_ = other.allow_trailing_commas_;
    read_comments_ = other.read_comments_;
    write_comments_ = other.write_comments_;
    emit_document_markers_ = other.emit_document_markers_;
    empty_collection_handling_ = other.empty_collection_handling_;
    naming_policy_ = other.naming_policy_;
    property_ordering_ = other.property_ordering_;
    reference_handling_ = other.reference_handling_;
    schema_ = other.schema_;
    type_info_source_ = other.typeInfoSource();
}

void SerializerOptions::checkWritable(const char* option) const {
    if (isReadOnly()) {
        THROW_READ_ONLY_CONFIGURATION(option);
    }
}

void SerializerOptions::setMaxDepth(int value) {
    checkWritable("maxDepth");
    if (value < 1 || value > kMaxAllowedDepth) {
        THROW_INVALID_CONFIGURATION("maxDepth", "must be within 1..",
                                    kMaxAllowedDepth, ", got ", value);
    }
    max_depth_ = value;
}

void SerializerOptions::setMaxAliasExpansion(std::size_t value) {
    checkWritable("maxAliasExpansion");
    if (value == 0) {
        THROW_INVALID_CONFIGURATION("maxAliasExpansion", "must be positive");
    }
    max_alias_expansion_ = value;
}

void SerializerOptions::setIndentSize(int value) {
    checkWritable("indentSize");
    if (value < 1 || value > 10) {
        THROW_INVALID_CONFIGURATION("indentSize", "must be within 1..10, got ",
                                    value);
    }
    indent_size_ = value;
}

void SerializerOptions::setPreferFlowStyle(bool value) {
    checkWritable("preferFlowStyle");
    prefer_flow_style_ = value;
}

void SerializerOptions::setIndentSequenceItems(bool value) {
    checkWritable("indentSequenceItems");
    indent_sequence_items_ = value;
}

void SerializerOptions::setDefaultScalarStyle(ScalarStyle value) {
    checkWritable("defaultScalarStyle");
    default_scalar_style_ = value;
}

void SerializerOptions::setDiscriminatorPosition(DiscriminatorPosition value) {
    checkWritable("discriminatorPosition");
    discriminator_position_ = value;
}

void SerializerOptions::setIgnoreNullValues(bool value) {
    checkWritable("ignoreNullValues");
    ignore_null_values_ = value;
}

void SerializerOptions::setIgnoreEmptyObjects(bool value) {
    checkWritable("ignoreEmptyObjects");
    ignore_empty_objects_ = value;
}

void SerializerOptions::setIgnoreReadOnlyProperties(bool value) {
    checkWritable("ignoreReadOnlyProperties");
    ignore_read_only_properties_ = value;
}

void SerializerOptions::setIncludeFields(bool value) {
    checkWritable("includeFields");
    include_fields_ = value;
}

void SerializerOptions::setAllowTrailingCommas(bool value) {
    checkWritable("allowTrailingCommas");
    allow_trailing_commas_ = value;
}

void SerializerOptions::setReadComments(bool value) {
    checkWritable("readComments");
    read_comments_ = value;
}

void SerializerOptions::setWriteComments(bool value) {
    checkWritable("writeComments");
    write_comments_ = value;
}

void SerializerOptions::setEmitDocumentMarkers(bool value) {
    checkWritable("emitDocumentMarkers");
    emit_document_markers_ = value;
}

void SerializerOptions::setEmptyCollectionHandling(
    EmptyCollectionHandling value) {
    checkWritable("emptyCollectionHandling");
    empty_collection_handling_ = value;
}

void SerializerOptions::setNamingPolicy(NamingPolicy value) {
    checkWritable("namingPolicy");
    naming_policy_ = value;
}

void SerializerOptions::setPropertyOrdering(PropertyOrdering value) {
    checkWritable("propertyOrdering");
    property_ordering_ = value;
}

void SerializerOptions::setReferenceHandling(ReferenceHandling value) {
    checkWritable("referenceHandling");
    reference_handling_ = value;
}

void SerializerOptions::setSchema(const Schema& value) {
    checkWritable("schema");
    schema_ = &value;
}

auto SerializerOptions::typeInfoSource() const
    -> std::shared_ptr<const TypeRegistry> {
    std::lock_guard lock(mutex_);
    return type_info_source_;
}

void SerializerOptions::setTypeInfoSource(
    std::shared_ptr<const TypeRegistry> registry) {
    std::lock_guard lock(mutex_);
    if (is_default_) {
        if (used_ || type_info_source_ != nullptr) {
            THROW_READ_ONLY_CONFIGURATION("typeInfoSource");
        }
        type_info_source_ = std::move(registry);
        spdlog::debug("serializer: default options bound to a type registry");
        return;
    }
    checkWritable("typeInfoSource");
    type_info_source_ = std::move(registry);
}

void SerializerOptions::freeze() const {
    if (is_default_) {
        std::lock_guard lock(mutex_);
        used_ = true;
        return;
    }
    read_only_.store(true, std::memory_order_release);
}

auto SerializerOptions::readerOptions() const -> ReaderOptions {
    ReaderOptions options;
    options.maxDepth = max_depth_;
    options.readComments = read_comments_;
    options.allowTrailingCommas = allow_trailing_commas_;
    options.schema = schema_;
    return options;
}

auto SerializerOptions::writerOptions() const -> WriterOptions {
    WriterOptions options;
    options.indentSize = indent_size_;
    options.preferFlowStyle = prefer_flow_style_;
    options.indentSequenceItems = indent_sequence_items_;
    options.defaultScalarStyle = default_scalar_style_;
    options.writeComments = write_comments_;
    options.emitDocumentMarkers = emit_document_markers_;
    options.schema = schema_;
    return options;
}

}  // namespace yamlet
