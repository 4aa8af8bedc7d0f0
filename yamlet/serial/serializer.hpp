/*
 * serializer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-04

Description: Public entry points for converting values to and from YAML

**************************************************/

#ifndef YAMLET_SERIAL_SERIALIZER_HPP
#define YAMLET_SERIAL_SERIALIZER_HPP

#include <cstdint>
#include <functional>
#include <future>
#include <istream>
#include <ostream>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "yamlet/error/exception.hpp"
#include "yamlet/serial/options.hpp"
#include "yamlet/serial/type_builder.hpp"
#include "yamlet/serial/type_info.hpp"

namespace yamlet {

/**
 * @brief Serializes values to YAML and back using the type registry of the
 * options.
 *
 * Every call freezes the options it uses and gets its own reference
 * resolver, so calls may run concurrently on different threads with the
 * same options. T may be a registered type, or a `std::optional` or
 * `std::shared_ptr` of one.
 *
 * @code
 * yamlet::SerializerOptions options;
 * options.setTypeInfoSource(yamlet::TypeRegistryBuilder(options)
 *     .object<Pet>("Pet")
 *         .property<&Pet::name>("Name")
 *     .done()
 *     .build());
 * std::string text = yamlet::Serializer::serialize(Pet{"Rex"}, options);
 * Pet pet = yamlet::Serializer::deserialize<Pet>(text, options);
 * @endcode
 */
class Serializer {
public:
    template <typename T>
    static auto serialize(const T& value,
                          const SerializerOptions& options =
                              SerializerOptions::defaultInstance())
        -> std::string {
        return serializeSlots(slotOpsFor<T>(), {&value}, options);
    }

    template <typename T>
    static auto serializeToBytes(const T& value,
                                 const SerializerOptions& options =
                                     SerializerOptions::defaultInstance())
        -> std::vector<std::uint8_t> {
        std::string text = serialize(value, options);
        return std::vector<std::uint8_t>(text.begin(), text.end());
    }

    template <typename T>
    static void serialize(std::ostream& out, const T& value,
                          const SerializerOptions& options =
                              SerializerOptions::defaultInstance()) {
        writeStream(out, serialize(value, options));
    }

    /**
     * @brief Serializes on a worker thread, then writes the whole text.
     *
     * The options are frozen and copied before the call returns, so they
     * need not outlive the future; the stream must. The stop token is
     * checked once, before the text is written; a stop request makes the
     * future throw error::OperationCancelled.
     */
    template <typename T>
    static auto serializeAsync(std::ostream& out, T value,
                               const SerializerOptions& options =
                                   SerializerOptions::defaultInstance(),
                               std::stop_token token = {})
        -> std::future<void> {
        options.freeze();
        return std::async(std::launch::async,
                          [&out, value = std::move(value),
                           snapshot = SerializerOptions(options), token] {
                              std::string text = serialize(value, snapshot);
                              if (token.stop_requested()) {
                                  THROW_OPERATION_CANCELLED(
                                      "Serialization cancelled before the "
                                      "output was written");
                              }
                              writeStream(out, text);
                          });
    }

    /**
     * @brief Writes each value as its own document of one stream.
     */
    template <typename T>
    static auto serializeDocuments(const std::vector<T>& values,
                                   const SerializerOptions& options =
                                       SerializerOptions::defaultInstance())
        -> std::string {
        std::vector<const void*> slots;
        slots.reserve(values.size());
        for (const auto& value : values) {
            slots.push_back(&value);
        }
        return serializeSlots(slotOpsFor<T>(), slots, options);
    }

    /**
     * @brief Reads the first document of text. Empty input yields a
     * value-initialised T.
     */
    template <typename T>
    static auto deserialize(std::string_view text,
                            const SerializerOptions& options =
                                SerializerOptions::defaultInstance()) -> T {
        T value{};
        readDocuments(
            text, slotOpsFor<T>(), [&value]() -> void* { return &value; },
            true, options);
        return value;
    }

    template <typename T>
    static auto deserialize(std::span<const std::uint8_t> bytes,
                            const SerializerOptions& options =
                                SerializerOptions::defaultInstance()) -> T {
        return deserialize<T>(
            std::string_view(reinterpret_cast<const char*>(bytes.data()),
                             bytes.size()),
            options);
    }

    template <typename T>
    static auto deserialize(std::istream& in,
                            const SerializerOptions& options =
                                SerializerOptions::defaultInstance()) -> T {
        std::string text = readStream(in);
        return deserialize<T>(std::string_view(text), options);
    }

    /**
     * @brief Reads the whole stream, then deserializes on a worker thread.
     *
     * As with serializeAsync, the options are copied and the stream must
     * outlive the future. The stop token is checked after the input has
     * been buffered.
     */
    template <typename T>
    static auto deserializeAsync(std::istream& in,
                                 const SerializerOptions& options =
                                     SerializerOptions::defaultInstance(),
                                 std::stop_token token = {}) -> std::future<T> {
        options.freeze();
        return std::async(std::launch::async,
                          [&in, snapshot = SerializerOptions(options), token] {
            std::string text = readStream(in);
            if (token.stop_requested()) {
                THROW_OPERATION_CANCELLED(
                    "Deserialization cancelled after the input was read");
            }
            return deserialize<T>(std::string_view(text), snapshot);
        });
    }

    /**
     * @brief Reads every document of a stream.
     */
    template <typename T>
    static auto deserializeDocuments(std::string_view text,
                                     const SerializerOptions& options =
                                         SerializerOptions::defaultInstance())
        -> std::vector<T> {
        std::vector<T> values;
        readDocuments(
            text, slotOpsFor<T>(),
            [&values]() -> void* { return &values.emplace_back(); }, false,
            options);
        return values;
    }

private:
    static auto serializeSlots(const SlotOps& ops,
                               const std::vector<const void*>& slots,
                               const SerializerOptions& options)
        -> std::string;

    /**
     * @brief Reads documents into the slots returned by nextSlot, which is
     * called once per document.
     * @return Number of documents read.
     */
    static auto readDocuments(std::string_view text, const SlotOps& ops,
                              const std::function<void*()>& nextSlot,
                              bool firstOnly, const SerializerOptions& options)
        -> std::size_t;

    static void writeStream(std::ostream& out, const std::string& text);
    static auto readStream(std::istream& in) -> std::string;
};

}  // namespace yamlet

#endif  // YAMLET_SERIAL_SERIALIZER_HPP
