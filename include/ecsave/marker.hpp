#pragma once
#include "component.hpp"
#include "world.hpp"

#include <vector>

namespace ecsave {

/**
 * @brief Returns every live entity carrying the marker component, sorted by (index, generation).
 * @details Queries the world on every call; an empty world yields an empty set.
 */
inline std::vector<Entity> collect_marked(const World& world, ComponentTypeID marker) {
    return world.entities_with(marker);
}

template <typename Marker>
std::vector<Entity> collect_marked(const World& world) {
    return collect_marked(world, component_id<Marker>());
}

/**
 * @brief Flags an entity for persistence.
 */
template <typename Marker>
void mark(World& world, Entity e) {
    world.add(e, Marker{});
}

template <typename Marker>
void unmark(World& world, Entity e) {
    world.remove<Marker>(e);
}

} // namespace ecsave
