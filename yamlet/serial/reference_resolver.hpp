/*
 * reference_resolver.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-04

Description: Object identity tracking for one serializer pass

**************************************************/

#ifndef YAMLET_SERIAL_REFERENCE_RESOLVER_HPP
#define YAMLET_SERIAL_REFERENCE_RESOLVER_HPP

#include <memory>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <unordered_set>

#include "yamlet/serial/options.hpp"

namespace yamlet {

/**
 * @brief An object registered under an anchor while reading.
 */
struct ReferenceEntry {
    std::shared_ptr<void> object;
    std::type_index type;  ///< Static type the pointer refers to
};

/**
 * @brief Identity table of one serialize or deserialize call.
 *
 * A resolver is created per call and passed explicitly through the dispatch
 * engine, so concurrent calls never share state.
 */
class ReferenceResolver {
public:
    virtual ~ReferenceResolver() = default;

    /**
     * @brief Looks up or assigns the id of an object being written.
     * @param object Identity of the object (address of the complete object).
     * @param alreadyExists Set to true if the object was seen before.
     * @return The anchor id, empty for policies that do not use ids.
     */
    virtual auto getReference(const void* object, bool& alreadyExists)
        -> std::string = 0;

    /**
     * @brief Registers an object constructed while reading.
     */
    virtual void addReference(const std::string& id, ReferenceEntry entry) = 0;

    /**
     * @throws ReferenceNotFoundError if the id was never registered.
     */
    [[nodiscard]] virtual auto resolveReference(const std::string& id) const
        -> const ReferenceEntry& = 0;

    /**
     * @brief Resolver for a policy; nullptr for ReferenceHandling::None.
     */
    static auto create(ReferenceHandling handling)
        -> std::unique_ptr<ReferenceResolver>;
};

/**
 * @brief Remembers every object written; a second visit is reported as
 * already seen and written as null.
 */
class IgnoreCyclesResolver final : public ReferenceResolver {
public:
    auto getReference(const void* object, bool& alreadyExists)
        -> std::string override;
    void addReference(const std::string& id, ReferenceEntry entry) override;
    [[nodiscard]] auto resolveReference(const std::string& id) const
        -> const ReferenceEntry& override;

private:
    std::unordered_set<const void*> visited_;
};

/**
 * @brief Assigns `ref1`, `ref2`, ... to objects in visiting order and maps
 * anchors back to objects when reading.
 */
class PreserveResolver final : public ReferenceResolver {
public:
    auto getReference(const void* object, bool& alreadyExists)
        -> std::string override;
    void addReference(const std::string& id, ReferenceEntry entry) override;
    [[nodiscard]] auto resolveReference(const std::string& id) const
        -> const ReferenceEntry& override;

    [[nodiscard]] auto size() const -> std::size_t { return ids_.size(); }

private:
    std::unordered_map<const void*, std::string> ids_;
    std::unordered_map<std::string, ReferenceEntry> objects_;
    int next_id_{1};
};

}  // namespace yamlet

#endif  // YAMLET_SERIAL_REFERENCE_RESOLVER_HPP
