#pragma once
#include <cstdint>
#include <functional>

namespace ecsave {

/**
 * @brief Represents a unique object within the ECS world.
 *
 * @details An Entity is a lightweight identifier composed of an index and a generation count.
 * The generation count is used to detect destroyed entities when indices are recycled, which is
 * also why live identifiers cannot be written to a save file as-is: the same index may name a
 * different entity once the file is loaded.
 */
struct Entity {
    /**
     * @brief The index of the entity in the world's entity table.
     */
    uint32_t index = 0;

    /**
     * @brief The generation version of the entity index.
     * @details Incremented whenever an entity index is reused.
     */
    uint32_t generation = 0;

    bool operator==(const Entity& o) const {
        return index == o.index && generation == o.generation;
    }

    bool operator!=(const Entity& o) const { return !(*this == o); }

    /**
     * @brief Orders by index, then generation.
     * @details Used to give marked-set iteration a stable order independent of archetype layout.
     */
    bool operator<(const Entity& o) const {
        return index != o.index ? index < o.index : generation < o.generation;
    }
};

/**
 * @brief Represents a null or invalid entity handle.
 * @details Index 0 is reserved by the World, so this never names a live entity. A component field
 * holding it is a null reference and is persisted as such.
 */
inline constexpr Entity INVALID_ENTITY{0, 0};

/**
 * @brief Dense, operation-scoped identifier substituting for a live entity in a save stream.
 */
using Ordinal = uint32_t;

/**
 * @brief Generation value reserved for entities in wire form.
 * @details An entity-valued field rewritten for the stream holds `{ordinal, WIRE_GENERATION}`.
 * The World never hands out this generation, so a wire entity cannot be mistaken for a live one.
 */
inline constexpr uint32_t WIRE_GENERATION = 0xFFFFFFFFu;

inline constexpr Entity wire_entity(Ordinal ordinal) { return Entity{ordinal, WIRE_GENERATION}; }

inline constexpr bool is_wire(Entity e) { return e.generation == WIRE_GENERATION; }

/**
 * @brief Hasher for using Entity keys in std::unordered_map or std::unordered_set.
 * @details Packs index and generation into a single 64-bit integer for hashing.
 */
struct EntityHash {
    size_t operator()(const Entity& e) const {
        return std::hash<uint64_t>{}(static_cast<uint64_t>(e.generation) << 32 | e.index);
    }
};

} // namespace ecsave
