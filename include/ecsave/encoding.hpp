#pragma once
#include "entity.hpp"
#include "errors.hpp"

#include <yaml-cpp/yaml.h>

#include <type_traits>

/**
 * @file encoding.hpp
 * @brief Component payload encoding on top of yaml-cpp.
 *
 * @details Component types provide a `YAML::convert<T>` specialization. Entity fields inside a
 * payload must already be in wire form (see entity_refs.hpp) when encoded: a wire entity is
 * written as its ordinal and a null reference as YAML null.
 */

namespace YAML {

template <>
struct convert<ecsave::Entity> {
    static Node encode(const ecsave::Entity& e) {
        if (e == ecsave::INVALID_ENTITY)
            return Node(NodeType::Null);
        if (!ecsave::is_wire(e))
            throw ecsave::EncodingError(
                fmt::format("live entity {} reached the encoder without translation", e));
        return Node(e.index);
    }

    static bool decode(const Node& node, ecsave::Entity& e) {
        if (node.IsNull()) {
            e = ecsave::INVALID_ENTITY;
            return true;
        }
        if (!node.IsScalar())
            return false;
        e = ecsave::wire_entity(node.as<ecsave::Ordinal>());
        return true;
    }
};

} // namespace YAML

namespace ecsave {

/**
 * @brief Encodes a component payload. Empty types carry no data and encode as null.
 */
template <typename T>
YAML::Node encode_payload(const T& value) {
    if constexpr (std::is_empty_v<T>) {
        (void)value;
        return YAML::Node(YAML::NodeType::Null);
    } else {
        return YAML::Node(value);
    }
}

template <typename T>
T decode_payload(const YAML::Node& node) {
    if constexpr (std::is_empty_v<T>) {
        (void)node;
        return T{};
    } else {
        return node.as<T>();
    }
}

} // namespace ecsave
