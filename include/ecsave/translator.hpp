#pragma once
#include "errors.hpp"
#include "world.hpp"

#include <unordered_map>
#include <vector>

namespace ecsave {

/**
 * @brief Bidirectional mapping between live entities and the ordinals of one save or load.
 *
 * @details A translator belongs to exactly one operation and is discarded with it, so ordinals
 * from one stream can never resolve against another world.
 *
 * - Save: `begin(entities)` assigns ordinal `i` to `entities[i]`; `to_ordinal` looks them up.
 * - Load: `begin_load(world, n)` accepts ordinals in `[0, n)`; `to_live` allocates a new entity in
 *   the world the first time an ordinal is seen and returns the same entity on every later call,
 *   whether the ordinal comes from a record or from a reference inside another component.
 */
class EntityTranslator {
public:
    enum class Direction { Save, Load };

    /**
     * @brief Starts a save: ordinal `i` is assigned to `entities[i]`.
     * @throws DuplicateEntity if an entity appears more than once.
     */
    static EntityTranslator begin(const std::vector<Entity>& entities) {
        EntityTranslator tr(Direction::Save);
        tr.live_ = entities;
        tr.ordinals_.reserve(entities.size());
        for (size_t i = 0; i < entities.size(); ++i) {
            if (!tr.ordinals_.emplace(entities[i], static_cast<Ordinal>(i)).second)
                throw DuplicateEntity(entities[i]);
        }
        return tr;
    }

    /**
     * @brief Starts a load from a stream declaring `entity_count` persisted entities.
     */
    static EntityTranslator begin_load(World& world, size_t entity_count) {
        EntityTranslator tr(Direction::Load);
        tr.world_ = &world;
        tr.live_.assign(entity_count, INVALID_ENTITY);
        return tr;
    }

    EntityTranslator(const EntityTranslator&) = delete;
    EntityTranslator& operator=(const EntityTranslator&) = delete;
    EntityTranslator(EntityTranslator&&) = default;
    EntityTranslator& operator=(EntityTranslator&&) = default;

    Direction direction() const { return direction_; }

    /** @brief Number of ordinals this operation covers. */
    size_t size() const { return live_.size(); }

    /**
     * @throws UnknownEntity if `e` was not part of the sequence given to `begin`.
     */
    Ordinal to_ordinal(Entity e) const {
        ECSAVE_ASSERT(direction_ == Direction::Save, "to_ordinal on a load translator");
        auto it = ordinals_.find(e);
        if (it == ordinals_.end())
            throw UnknownEntity(e);
        return it->second;
    }

    /**
     * @brief Returns the live entity for `ordinal`, creating it on first use.
     * @throws UnknownEntity if `ordinal` is outside the stream's entity range.
     */
    Entity to_live(Ordinal ordinal) {
        ECSAVE_ASSERT(direction_ == Direction::Load, "to_live on a save translator");
        if (ordinal >= live_.size())
            throw UnknownEntity(ordinal, live_.size());
        Entity& slot = live_[ordinal];
        if (slot == INVALID_ENTITY) {
            slot = world_->create();
            ordinals_.emplace(slot, ordinal);
            log::trace("translator", "ordinal {} -> {}", ordinal, slot);
        }
        return slot;
    }

    /** @brief Whether `to_live` has already produced an entity for `ordinal`. */
    bool allocated(Ordinal ordinal) const {
        return ordinal < live_.size() && live_[ordinal] != INVALID_ENTITY;
    }

    /**
     * @brief Allocates every ordinal no record or reference has touched.
     * @details Those are persisted entities that own none of the listed types.
     */
    void allocate_remaining() {
        for (size_t o = 0; o < live_.size(); ++o)
            to_live(static_cast<Ordinal>(o));
    }

    /**
     * @brief Live entities indexed by ordinal. During a load, not-yet-allocated ordinals hold
     * INVALID_ENTITY.
     */
    const std::vector<Entity>& entities() const { return live_; }

private:
    explicit EntityTranslator(Direction direction) : direction_(direction) {}

    Direction direction_;
    World* world_ = nullptr;
    std::vector<Entity> live_;
    std::unordered_map<Entity, Ordinal, EntityHash> ordinals_;
};

} // namespace ecsave
