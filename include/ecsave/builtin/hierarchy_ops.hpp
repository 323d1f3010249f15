#pragma once
#include "../world.hpp"
#include "hierarchy.hpp"

#include <algorithm>
#include <vector>

namespace ecsave {

namespace detail {

inline void detach_from_parent(World& world, Entity child) {
    Entity parent = world.get<Parent>(child).entity;
    if (auto* kids = world.try_get<Children>(parent)) {
        auto& list = kids->entities;
        list.erase(std::remove(list.begin(), list.end(), child), list.end());
    }
}

} // namespace detail

/**
 * @brief Makes `parent` the parent of `child`, keeping Parent and Children in sync.
 * @details A previous parent loses `child` from its Children. Does nothing if either is dead.
 */
inline void set_parent(World& world, Entity child, Entity parent) {
    ECSAVE_ASSERT(child != parent, "cannot parent entity to itself");
    if (!world.alive(child) || !world.alive(parent))
        return;

    if (world.has<Parent>(child))
        detail::detach_from_parent(world, child);

    world.add(child, Parent{parent});
    if (!world.has<Children>(parent))
        world.add(parent, Children{});
    world.get<Children>(parent).entities.push_back(child);
}

inline void remove_parent(World& world, Entity child) {
    if (!world.has<Parent>(child))
        return;
    detail::detach_from_parent(world, child);
    world.remove<Parent>(child);
}

/**
 * @brief Destroys `root` and all its descendants, leaves first.
 */
inline void destroy_recursive(World& world, Entity root) {
    if (!world.alive(root))
        return;

    std::vector<Entity> to_destroy{root};
    for (size_t cursor = 0; cursor < to_destroy.size(); ++cursor) {
        if (auto* kids = world.try_get<Children>(to_destroy[cursor])) {
            for (auto child : kids->entities) {
                if (world.alive(child))
                    to_destroy.push_back(child);
            }
        }
    }

    for (auto it = to_destroy.rbegin(); it != to_destroy.rend(); ++it)
        world.destroy(*it);
}

} // namespace ecsave
