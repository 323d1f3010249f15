#pragma once
#include "entity.hpp"
#include "log.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace ecsave {

/**
 * @brief Base class of every save/load failure.
 * @details All of them abort the current operation. Nothing already written to the target world
 * is rolled back, so callers should load into a scratch world and discard it on failure.
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A reference points outside the persisted subset.
 * @details Raised at save time for a live entity that is not marked, and at load time for an
 * ordinal outside the stream's entity range.
 */
class UnknownEntity : public Error {
public:
    explicit UnknownEntity(Entity entity)
        : Error(fmt::format("entity {} is not part of the persisted set", entity)),
          entity_(entity) {}

    UnknownEntity(Ordinal ordinal, size_t entity_count)
        : Error(fmt::format("ordinal {} is not defined by the stream ({} entities)", ordinal,
                            entity_count)),
          entity_(wire_entity(ordinal)) {}

    /** @brief The offending live entity, or its wire form when raised during load. */
    Entity entity() const { return entity_; }

private:
    Entity entity_;
};

/**
 * @brief The marked set handed to the translator contains the same entity twice.
 */
class DuplicateEntity : public Error {
public:
    explicit DuplicateEntity(Entity entity)
        : Error(fmt::format("entity {} appears twice in the marked set", entity)),
          entity_(entity) {}

    Entity entity() const { return entity_; }

private:
    Entity entity_;
};

/**
 * @brief The type list names a tag the registry has no visitor for.
 */
class UnsupportedType : public Error {
public:
    explicit UnsupportedType(std::string tag)
        : Error(fmt::format("component type '{}' is not registered", tag)), tag_(std::move(tag)) {}

    const std::string& tag() const { return tag_; }

private:
    std::string tag_;
};

/**
 * @brief The type list names the same tag more than once.
 */
class DuplicateType : public Error {
public:
    explicit DuplicateType(std::string tag)
        : Error(fmt::format("component type '{}' is listed twice", tag)), tag_(std::move(tag)) {}

    const std::string& tag() const { return tag_; }

private:
    std::string tag_;
};

/**
 * @brief The payload encoder/decoder failed or the stream is malformed.
 */
class EncodingError : public Error {
public:
    using Error::Error;
};

} // namespace ecsave
