/*
 * options.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-04

Description: Serializer options with freeze-on-first-use semantics

**************************************************/

#ifndef YAMLET_SERIAL_OPTIONS_HPP
#define YAMLET_SERIAL_OPTIONS_HPP

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>

#include "yamlet/serial/naming_policy.hpp"
#include "yamlet/yaml/reader.hpp"
#include "yamlet/yaml/writer.hpp"

namespace yamlet {

class TypeRegistry;

inline constexpr int kDefaultMaxDepth = 64;
inline constexpr int kMaxAllowedDepth = 1000;
inline constexpr std::size_t kDefaultMaxAliasExpansion = 1'000'000;

/**
 * @brief Order in which object properties are written.
 */
enum class PropertyOrdering {
    DeclarationOrder,        ///< Explicit order first, then declaration order
    Alphabetical,            ///< By wire name
    OrderedThenAlphabetical  ///< Explicit order first, then by wire name
};

/**
 * @brief Treatment of shared objects met more than once in one pass.
 */
enum class ReferenceHandling {
    None,          ///< No tracking; cycles end in MaxDepthExceededError
    IgnoreCycles,  ///< A revisited object is written as null
    Preserve       ///< First visit gets an anchor, later visits an alias
};

enum class EmptyCollectionHandling {
    Default,               ///< A null collection reads back as null
    PreferEmptyCollection  ///< A null collection reads back as empty
};

/**
 * @brief Where the discriminator of a polymorphic object is written.
 */
enum class DiscriminatorPosition {
    Ordered,  ///< At the position of the property of the same name, else first
    First     ///< Always the first key
};

/**
 * @brief Configuration of a serializer pass.
 *
 * An options instance is mutable until it is first used by the serializer,
 * after which it is frozen and every setter throws
 * ReadOnlyConfigurationError. Copying a frozen instance yields a new mutable
 * one. Frozen instances can be shared between threads.
 *
 * defaultInstance() is frozen from the start, except that its type registry
 * may be assigned exactly once before the instance is first used.
 */
class SerializerOptions {
public:
    SerializerOptions() = default;
    SerializerOptions(const SerializerOptions& other);
    auto operator=(const SerializerOptions& other) -> SerializerOptions&;

    /**
     * @brief The process-wide options used when a call passes none.
     */
    static auto defaultInstance() -> SerializerOptions&;

    [[nodiscard]] auto maxDepth() const -> int { return max_depth_; }
    void setMaxDepth(int value);

    /**
     * @brief Most tokens a document may replay through aliases of values
     * that are not shared objects. Each such alias re-reads the anchored
     * node, so nested aliases grow the work exponentially.
     */
    [[nodiscard]] auto maxAliasExpansion() const -> std::size_t {
        return max_alias_expansion_;
    }
    void setMaxAliasExpansion(std::size_t value);

    [[nodiscard]] auto indentSize() const -> int { return indent_size_; }
    void setIndentSize(int value);

    [[nodiscard]] auto preferFlowStyle() const -> bool {
        return prefer_flow_style_;
    }
    void setPreferFlowStyle(bool value);

    [[nodiscard]] auto indentSequenceItems() const -> bool {
        return indent_sequence_items_;
    }
    void setIndentSequenceItems(bool value);

    [[nodiscard]] auto defaultScalarStyle() const -> ScalarStyle {
        return default_scalar_style_;
    }
    void setDefaultScalarStyle(ScalarStyle value);

    [[nodiscard]] auto discriminatorPosition() const -> DiscriminatorPosition {
        return discriminator_position_;
    }
    void setDiscriminatorPosition(DiscriminatorPosition value);

    [[nodiscard]] auto ignoreNullValues() const -> bool {
        return ignore_null_values_;
    }
    void setIgnoreNullValues(bool value);

    [[nodiscard]] auto ignoreEmptyObjects() const -> bool {
        return ignore_empty_objects_;
    }
    void setIgnoreEmptyObjects(bool value);

    [[nodiscard]] auto ignoreReadOnlyProperties() const -> bool {
        return ignore_read_only_properties_;
    }
    void setIgnoreReadOnlyProperties(bool value);

    [[nodiscard]] auto includeFields() const -> bool { return include_fields_; }
    void setIncludeFields(bool value);

    [[nodiscard]] auto allowTrailingCommas() const -> bool {
        return allow_trailing_commas_;
    }
    void setAllowTrailingCommas(bool value);

    [[nodiscard]] auto readComments() const -> bool { return read_comments_; }
    void setReadComments(bool value);

    [[nodiscard]] auto writeComments() const -> bool { return write_comments_; }
    void setWriteComments(bool value);

    [[nodiscard]] auto emitDocumentMarkers() const -> bool {
        return emit_document_markers_;
    }
    void setEmitDocumentMarkers(bool value);

    [[nodiscard]] auto emptyCollectionHandling() const
        -> EmptyCollectionHandling {
        return empty_collection_handling_;
    }
    void setEmptyCollectionHandling(EmptyCollectionHandling value);

    [[nodiscard]] auto namingPolicy() const -> NamingPolicy {
        return naming_policy_;
    }
    void setNamingPolicy(NamingPolicy value);

    [[nodiscard]] auto propertyOrdering() const -> PropertyOrdering {
        return property_ordering_;
    }
    void setPropertyOrdering(PropertyOrdering value);

    [[nodiscard]] auto referenceHandling() const -> ReferenceHandling {
        return reference_handling_;
    }
    void setReferenceHandling(ReferenceHandling value);

    [[nodiscard]] auto schema() const -> const Schema& { return *schema_; }
    void setSchema(const Schema& value);

    [[nodiscard]] auto typeInfoSource() const
        -> std::shared_ptr<const TypeRegistry>;

    /**
     * @brief Sets the registry used to look up type metadata.
     * @throws ReadOnlyConfigurationError on a frozen instance, or on the
     * default instance once it has been used or already assigned.
     */
    void setTypeInfoSource(std::shared_ptr<const TypeRegistry> registry);

    /**
     * @brief Makes the instance read-only. Called by every serializer entry
     * point; calling it again has no effect.
     */
    void freeze() const;

    [[nodiscard]] auto isReadOnly() const -> bool {
        return read_only_.load(std::memory_order_acquire);
    }

    [[nodiscard]] auto readerOptions() const -> ReaderOptions;
    [[nodiscard]] auto writerOptions() const -> WriterOptions;

private:
    struct DefaultTag {};
    explicit SerializerOptions(DefaultTag);

    void checkWritable(const char* option) const;
    void copyFrom(const SerializerOptions& other);

    int max_depth_{kDefaultMaxDepth};
    std::size_t max_alias_expansion_{kDefaultMaxAliasExpansion};
    int indent_size_{2};
    bool prefer_flow_style_{false};
    bool indent_sequence_items_{true};
    ScalarStyle default_scalar_style_{ScalarStyle::Any};
    DiscriminatorPosition discriminator_position_{DiscriminatorPosition::Ordered};
    bool ignore_null_values_{false};
    bool ignore_empty_objects_{false};
    bool ignore_read_only_properties_{false};
    bool include_fields_{false};
    bool allow_trailing_commas_{true};
    bool read_comments_{false};
    bool write_comments_{false};
    bool emit_document_markers_{false};
    EmptyCollectionHandling empty_collection_handling_{
        EmptyCollectionHandling::Default};
    NamingPolicy naming_policy_{NamingPolicy::KebabCase};
    PropertyOrdering property_ordering_{PropertyOrdering::DeclarationOrder};
    ReferenceHandling reference_handling_{ReferenceHandling::None};
    const Schema* schema_{&CoreSchema::instance()};

    // Guards type_info_source_ and used_ (only contended on the default
    // instance).
    mutable std::mutex mutex_;
    std::shared_ptr<const TypeRegistry> type_info_source_;
    mutable std::atomic<bool> read_only_{false};
    bool is_default_{false};
    mutable bool used_{false};
};

}  // namespace yamlet

#endif  // YAMLET_SERIAL_OPTIONS_HPP
