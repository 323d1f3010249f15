#pragma once
#include "config.hpp"

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <map>
#include <new>
#include <type_traits>
#include <utility>

namespace ecsave {

using ComponentTypeID = uint32_t;

/**
 * @brief Upper bound on distinct component types per process (archetype bitset width).
 */
inline constexpr ComponentTypeID MAX_COMPONENT_TYPES = 256;

inline ComponentTypeID next_component_id() {
    static ComponentTypeID counter = 0;
    ECSAVE_ASSERT(counter < MAX_COMPONENT_TYPES, "too many component types");
    return counter++;
}

template <typename T>
ComponentTypeID component_id() {
    static ComponentTypeID id = next_component_id();
    return id;
}

// Type-erased column storage for a single component type within an archetype.
struct ComponentColumn {
    uint8_t* data = nullptr;
    size_t elem_size = 0;
    size_t count = 0;
    size_t capacity = 0;
    size_t alignment = 1;

    // Move-constructs into uninitialized `dst`; `src` stays alive and is destroyed by its owner.
    using MoveFunc = void (*)(void* dst, void* src);
    using DestroyFunc = void (*)(void* ptr);

    MoveFunc move_fn = nullptr;
    DestroyFunc destroy_fn = nullptr;

    ComponentColumn() = default;

    ComponentColumn(ComponentColumn&& o) noexcept
        : data(o.data),
          elem_size(o.elem_size),
          count(o.count),
          capacity(o.capacity),
          alignment(o.alignment),
          move_fn(o.move_fn),
          destroy_fn(o.destroy_fn) {
        o.data = nullptr;
        o.count = 0;
        o.capacity = 0;
    }

    ComponentColumn& operator=(ComponentColumn&& o) noexcept {
        if (this != &o) {
            destroy_all();
            // data is owned by the archetype's block
            data = o.data;
            elem_size = o.elem_size;
            count = o.count;
            capacity = o.capacity;
            alignment = o.alignment;
            move_fn = o.move_fn;
            destroy_fn = o.destroy_fn;
            o.data = nullptr;
            o.count = 0;
            o.capacity = 0;
        }
        return *this;
    }

    ~ComponentColumn() { destroy_all(); }

    ComponentColumn(const ComponentColumn&) = delete;
    ComponentColumn& operator=(const ComponentColumn&) = delete;

    void push_raw(void* src) {
        ECSAVE_ASSERT(count < capacity, "push_raw: column at capacity");
        move_fn(data + count * elem_size, src);
        ++count;
    }

    // Destroys `row` and relocates the last element into it.
    void swap_remove(size_t row) {
        destroy_fn(data + row * elem_size);
        if (row < count - 1) {
            void* last = data + (count - 1) * elem_size;
            move_fn(data + row * elem_size, last);
            destroy_fn(last);
        }
        --count;
    }

    void* get(size_t row) { return data + row * elem_size; }
    const void* get(size_t row) const { return data + row * elem_size; }

    void destroy_all() {
        if (data && destroy_fn) {
            for (size_t i = 0; i < count; ++i)
                destroy_fn(data + i * elem_size);
        }
        count = 0;
    }
};

template <typename T>
ComponentColumn make_column() {
    ComponentColumn col;
    col.elem_size = sizeof(T);
    col.alignment = alignof(T);
    col.move_fn = [](void* dst, void* src) {
        new (dst) T(std::move(*static_cast<T*>(src)));
    };
    col.destroy_fn = [](void* ptr) {
        static_cast<T*>(ptr)->~T();
    };
    return col;
}

// Column factories let the world build archetypes for type sets it has never seen, without
// knowing the concrete component types.
using ColumnFactory = std::function<ComponentColumn()>;

inline std::map<ComponentTypeID, ColumnFactory>& column_factory_registry() {
    static std::map<ComponentTypeID, ColumnFactory> reg;
    return reg;
}

template <typename T>
void ensure_column_factory() {
    auto& reg = column_factory_registry();
    ComponentTypeID id = component_id<T>();
    if (reg.find(id) == reg.end()) {
        reg[id] = []() -> ComponentColumn {
            return make_column<T>();
        };
    }
}

} // namespace ecsave
