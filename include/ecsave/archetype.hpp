#pragma once
#include "component.hpp"
#include "entity.hpp"

#include <algorithm>
#include <bitset>
#include <initializer_list>
#include <map>
#include <vector>

namespace ecsave {

/**
 * @brief Sorted list of component types; identifies an Archetype.
 */
using TypeSet = std::vector<ComponentTypeID>;

struct TypeSetHash {
    size_t operator()(const TypeSet& ts) const {
        size_t h = ts.size();
        for (auto id : ts)
            h ^= std::hash<ComponentTypeID>{}(id) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

inline TypeSet make_typeset(std::initializer_list<ComponentTypeID> ids) {
    TypeSet ts(ids);
    std::sort(ts.begin(), ts.end());
    return ts;
}

/**
 * @brief Cached archetype transitions for adding/removing one component.
 */
struct ArchetypeEdge {
    struct Archetype* add_target = nullptr;
    struct Archetype* remove_target = nullptr;
};

/**
 * @brief Stores every entity that has exactly the same set of components.
 *
 * @details Components are laid out as one column per type (SoA) inside a single allocation that
 * is regrown and migrated when capacity runs out. Row `i` of every column belongs to
 * `entities[i]`.
 */
struct Archetype {
    static constexpr size_t CHUNK_ALIGN = 16;

    TypeSet type_set;
    std::bitset<MAX_COMPONENT_TYPES> component_bits;
    std::map<ComponentTypeID, ComponentColumn> columns;
    std::vector<Entity> entities;
    std::map<ComponentTypeID, ArchetypeEdge> edges;

    Archetype() = default;

    ~Archetype() {
        for (auto& [id, col] : columns)
            col.destroy_all();
        std::free(block_);
    }

    Archetype(const Archetype&) = delete;
    Archetype& operator=(const Archetype&) = delete;

    size_t count() const { return entities.size(); }

    bool has_component(ComponentTypeID id) const {
        return id < MAX_COMPONENT_TYPES && component_bits.test(id);
    }

    ComponentColumn* find_column(ComponentTypeID id) {
        auto it = columns.find(id);
        return it != columns.end() ? &it->second : nullptr;
    }

    const ComponentColumn* find_column(ComponentTypeID id) const {
        auto it = columns.find(id);
        return it != columns.end() ? &it->second : nullptr;
    }

    ArchetypeEdge* find_edge(ComponentTypeID id) {
        auto it = edges.find(id);
        return it != edges.end() ? &it->second : nullptr;
    }

    ArchetypeEdge& edge_for(ComponentTypeID id) { return edges[id]; }

    void assert_parity() const {
        for (auto& [id, col] : columns)
            ECSAVE_ASSERT(col.count == entities.size(), "entity-column parity violated");
    }

    /**
     * @brief Appends an entity row; the caller pushes the component data afterwards.
     */
    void push_entity(Entity e) {
        ensure_capacity(count() + 1);
        entities.push_back(e);
    }

    /**
     * @brief Removes a row with swap-and-pop.
     * @return The entity moved into `row`, or INVALID_ENTITY if `row` was the last one.
     */
    Entity swap_remove(size_t row) {
        Entity swapped = INVALID_ENTITY;
        if (row < entities.size() - 1) {
            swapped = entities.back();
            entities[row] = entities.back();
        }
        entities.pop_back();
        for (auto& [id, col] : columns)
            col.swap_remove(row);
        assert_parity();
        return swapped;
    }

    void ensure_capacity(size_t needed) {
        if (capacity_ >= needed || columns.empty())
            return;

        size_t new_cap = capacity_ == 0 ? 16 : capacity_ * 2;
        if (new_cap < needed)
            new_cap = needed;

        uint8_t* new_block = static_cast<uint8_t*>(std::malloc(block_size_for(new_cap)));

        size_t offset = 0;
        for (auto& [cid, col] : columns) {
            offset = align_up(offset, std::max(CHUNK_ALIGN, col.alignment));
            uint8_t* new_data = new_block + offset;
            for (size_t i = 0; i < col.count; ++i) {
                col.move_fn(new_data + i * col.elem_size, col.data + i * col.elem_size);
                col.destroy_fn(col.data + i * col.elem_size);
            }
            col.data = new_data;
            col.capacity = new_cap;
            offset += new_cap * col.elem_size;
        }

        std::free(block_);
        block_ = new_block;
        capacity_ = new_cap;
    }

private:
    uint8_t* block_ = nullptr;
    size_t capacity_ = 0;

    static size_t align_up(size_t offset, size_t align) {
        return (offset + align - 1) & ~(align - 1);
    }

    size_t block_size_for(size_t cap) const {
        size_t offset = 0;
        for (auto& [cid, col] : columns) {
            offset = align_up(offset, std::max(CHUNK_ALIGN, col.alignment));
            offset += cap * col.elem_size;
        }
        return offset;
    }
};

} // namespace ecsave
