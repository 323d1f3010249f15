#pragma once
#include "archetype.hpp"
#include "component.hpp"
#include "entity.hpp"

#include <algorithm>
#include <memory>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace ecsave {

/**
 * @brief Maps an entity index to the archetype and row holding its data.
 */
struct EntityRecord {
    Archetype* archetype = nullptr;
    size_t row = 0;
};

/**
 * @brief Entity and component storage consumed by the save/load engine.
 *
 * @details The World creates and destroys entities, stores their components in archetypes and
 * migrates entities between archetypes when components are added or removed. Besides the typed
 * API it exposes a small type-erased surface (`has(e, id)`, `entities_with(id)`) so code that
 * only holds a ComponentTypeID can query it.
 *
 * It is not thread-safe for write operations.
 */
class World {
public:
    World() {
        // Reserve index 0 so INVALID_ENTITY is never a live entity.
        generations_.push_back(1);
        records_.push_back({});
    }

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // -- Entity lifecycle --

    /**
     * @brief Creates a new entity with no components.
     * @warning Asserts if called during query iteration (`each`).
     */
    Entity create() {
        ECSAVE_ASSERT(iterating_ == 0, "structural change during iteration");
        Entity e = allocate_entity();
        Archetype* arch = get_or_create_archetype({});
        size_t row = arch->count();
        arch->push_entity(e);
        records_[e.index] = {arch, row};
        return e;
    }

    /**
     * @brief Creates a new entity initialized with a set of components.
     * @warning Asserts if called during query iteration.
     */
    template <typename... Ts>
    Entity create_with(Ts&&... components) {
        ECSAVE_ASSERT(iterating_ == 0, "structural change during iteration");
        (ensure_column_factory<std::decay_t<Ts>>(), ...);

        TypeSet ts = make_typeset({component_id<std::decay_t<Ts>>()...});
        Archetype* arch = get_or_create_archetype(ts);

        Entity e = allocate_entity();
        size_t row = arch->count();
        arch->push_entity(e);
        (push_component<std::decay_t<Ts>>(arch, std::forward<Ts>(components)), ...);
        arch->assert_parity();

        records_[e.index] = {arch, row};
        return e;
    }

    /**
     * @brief Destroys an entity and its components. Does nothing if the entity is already dead.
     * @warning Asserts if called during query iteration.
     */
    void destroy(Entity e) {
        ECSAVE_ASSERT(iterating_ == 0, "structural change during iteration");
        if (!alive(e))
            return;
        auto& rec = records_[e.index];
        Entity swapped = rec.archetype->swap_remove(rec.row);
        if (swapped != INVALID_ENTITY)
            records_[swapped.index].row = rec.row;
        rec = {};
        release_index(e.index);
    }

    /**
     * @brief Destroys every entity. Handles held from before the call are dead afterwards.
     */
    void clear() {
        ECSAVE_ASSERT(iterating_ == 0, "structural change during iteration");
        for (auto& [ts, arch] : archetypes_) {
            for (Entity e : arch->entities) {
                records_[e.index] = {};
                release_index(e.index);
            }
            arch->entities.clear();
            for (auto& [cid, col] : arch->columns)
                col.destroy_all();
        }
    }

    bool alive(Entity e) const {
        return e.index < generations_.size() && e.generation == generations_[e.index] &&
               records_[e.index].archetype != nullptr;
    }

    // -- Utility queries --

    size_t count() const {
        size_t total = 0;
        for (auto& [ts, arch] : archetypes_)
            total += arch->count();
        return total;
    }

    /**
     * @brief Returns the number of entities that possess all of Ts...
     */
    template <typename... Ts>
    size_t count() const {
        ComponentTypeID ids[] = {component_id<Ts>()...};
        size_t total = 0;
        for (auto& [ts, arch] : archetypes_) {
            if (std::all_of(std::begin(ids), std::end(ids),
                            [&](ComponentTypeID id) { return arch->has_component(id); }))
                total += arch->count();
        }
        return total;
    }

    /**
     * @brief Returns every live entity owning component `id`, sorted by (index, generation).
     * @details The order depends only on the entity handles, not on archetype layout, so two calls
     * on the same world state yield the same sequence.
     */
    std::vector<Entity> entities_with(ComponentTypeID id) const {
        std::vector<Entity> result;
        for (auto& [ts, arch] : archetypes_) {
            if (arch->has_component(id))
                result.insert(result.end(), arch->entities.begin(), arch->entities.end());
        }
        std::sort(result.begin(), result.end());
        return result;
    }

    // -- Component access --

    template <typename T>
    bool has(Entity e) const {
        return has(e, component_id<T>());
    }

    bool has(Entity e, ComponentTypeID id) const {
        if (!alive(e))
            return false;
        return records_[e.index].archetype->has_component(id);
    }

    /**
     * @warning Asserts if the entity is dead or missing the component.
     */
    template <typename T>
    T& get(Entity e) {
        ECSAVE_ASSERT(has<T>(e), "get<T> on dead entity or entity missing component");
        auto& rec = records_[e.index];
        return *static_cast<T*>(rec.archetype->find_column(component_id<T>())->get(rec.row));
    }

    template <typename T>
    const T& get(Entity e) const {
        ECSAVE_ASSERT(has<T>(e), "get<T> on dead entity or entity missing component");
        auto& rec = records_[e.index];
        return *static_cast<const T*>(rec.archetype->find_column(component_id<T>())->get(rec.row));
    }

    template <typename T>
    T* try_get(Entity e) {
        return has<T>(e) ? &get<T>(e) : nullptr;
    }

    template <typename T>
    const T* try_get(Entity e) const {
        return has<T>(e) ? &get<T>(e) : nullptr;
    }

    /**
     * @brief Adds a component, or overwrites it if the entity already has one of that type.
     * @details Adding a new type migrates the entity to the archetype that includes it. Does
     * nothing for a dead entity.
     * @warning Asserts if called during query iteration.
     */
    template <typename T>
    void add(Entity e, T&& component) {
        using U = std::decay_t<T>;
        ECSAVE_ASSERT(iterating_ == 0, "structural change during iteration");
        if (!alive(e))
            return;
        ensure_column_factory<U>();
        ComponentTypeID cid = component_id<U>();

        auto& rec = records_[e.index];
        Archetype* old_arch = rec.archetype;
        if (old_arch->has_component(cid)) {
            *static_cast<U*>(old_arch->find_column(cid)->get(rec.row)) = std::forward<T>(component);
            return;
        }

        Archetype* new_arch = find_add_target(old_arch, cid);
        migrate_entity(e, old_arch, new_arch, rec.row);

        U tmp = std::forward<T>(component);
        new_arch->find_column(cid)->push_raw(&tmp);
    }

    /**
     * @brief Removes a component. Does nothing if the entity lacks it.
     * @warning Asserts if called during query iteration.
     */
    template <typename T>
    void remove(Entity e) {
        ECSAVE_ASSERT(iterating_ == 0, "structural change during iteration");
        if (!has<T>(e))
            return;
        auto& rec = records_[e.index];
        Archetype* old_arch = rec.archetype;
        migrate_entity(e, old_arch, find_remove_target(old_arch, component_id<T>()), rec.row);
    }

    // -- Query iteration --

    /**
     * @brief Invokes `fn(Entity, Ts&...)` for every entity possessing all of Ts...
     * @details Structural changes inside `fn` assert.
     */
    template <typename... Ts, typename Func>
    void each(Func&& fn) {
        ++iterating_;
        struct Guard {
            int& count;
            ~Guard() { --count; }
        } guard{iterating_};

        ComponentTypeID ids[] = {component_id<Ts>()...};
        for (auto& [ts, arch] : archetypes_) {
            size_t n = arch->count();
            if (n == 0 || !std::all_of(std::begin(ids), std::end(ids), [&](ComponentTypeID id) {
                    return arch->has_component(id);
                }))
                continue;
            auto ptrs = std::make_tuple(static_cast<Ts*>(
                static_cast<void*>(arch->find_column(component_id<Ts>())->data))...);
            for (size_t i = 0; i < n; ++i)
                fn(arch->entities[i], std::get<Ts*>(ptrs)[i]...);
        }
    }

private:
    std::vector<uint32_t> generations_;
    std::vector<EntityRecord> records_;
    std::vector<uint32_t> free_list_;
    std::unordered_map<TypeSet, std::unique_ptr<Archetype>, TypeSetHash> archetypes_;
    int iterating_ = 0;

    Entity allocate_entity() {
        uint32_t idx;
        if (!free_list_.empty()) {
            idx = free_list_.back();
            free_list_.pop_back();
        } else {
            idx = static_cast<uint32_t>(generations_.size());
            generations_.push_back(0);
            records_.push_back({});
        }
        return Entity{idx, generations_[idx]};
    }

    void release_index(uint32_t idx) {
        // WIRE_GENERATION is reserved for serialized references.
        if (++generations_[idx] == WIRE_GENERATION)
            generations_[idx] = 0;
        free_list_.push_back(idx);
    }

    Archetype* get_or_create_archetype(const TypeSet& ts) {
        auto it = archetypes_.find(ts);
        if (it != archetypes_.end())
            return it->second.get();

        auto arch = std::make_unique<Archetype>();
        arch->type_set = ts;
        auto& factory_reg = column_factory_registry();
        for (auto cid : ts) {
            arch->columns.emplace(cid, factory_reg.at(cid)());
            arch->component_bits.set(cid);
        }
        Archetype* ptr = arch.get();
        archetypes_.emplace(ts, std::move(arch));
        return ptr;
    }

    Archetype* find_add_target(Archetype* src, ComponentTypeID cid) {
        auto* edge = src->find_edge(cid);
        if (edge && edge->add_target)
            return edge->add_target;

        TypeSet new_ts = src->type_set;
        new_ts.push_back(cid);
        std::sort(new_ts.begin(), new_ts.end());
        Archetype* target = get_or_create_archetype(new_ts);
        src->edge_for(cid).add_target = target;
        return target;
    }

    Archetype* find_remove_target(Archetype* src, ComponentTypeID cid) {
        auto* edge = src->find_edge(cid);
        if (edge && edge->remove_target)
            return edge->remove_target;

        TypeSet new_ts;
        for (auto id : src->type_set) {
            if (id != cid)
                new_ts.push_back(id);
        }
        Archetype* target = get_or_create_archetype(new_ts);
        src->edge_for(cid).remove_target = target;
        return target;
    }

    template <typename T>
    void push_component(Archetype* arch, T&& comp) {
        std::decay_t<T> tmp = std::forward<T>(comp);
        arch->find_column(component_id<std::decay_t<T>>())->push_raw(&tmp);
    }

    // Moves every column shared by both archetypes. Columns only in `new_arch` are left for the
    // caller to push; columns only in `old_arch` are destroyed by the swap-remove.
    void migrate_entity(Entity e, Archetype* old_arch, Archetype* new_arch, size_t old_row) {
        new_arch->ensure_capacity(new_arch->count() + 1);
        for (auto& [cid, new_col] : new_arch->columns) {
            if (auto* old_col = old_arch->find_column(cid))
                new_col.push_raw(old_col->get(old_row));
        }

        new_arch->push_entity(e);
        size_t new_row = new_arch->count() - 1;

        Entity swapped = old_arch->swap_remove(old_row);
        if (swapped != INVALID_ENTITY)
            records_[swapped.index].row = old_row;

        records_[e.index] = {new_arch, new_row};
    }
};

} // namespace ecsave
