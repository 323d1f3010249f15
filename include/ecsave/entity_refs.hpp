#pragma once
#include "errors.hpp"
#include "translator.hpp"

#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace ecsave {

/**
 * @brief Capability through which the engine reaches every entity-valued field of a component.
 *
 * @details A component with entity references exposes them in one of two ways:
 * - a member `template <typename Fn> void visit_entities(Fn&& fn)` calling `fn(Entity&)` on each
 *   reference, or
 * - a specialization of this trait with `template <typename Fn> static void visit(T&, Fn&&)`.
 *
 * Types with neither have no references. A reference left out here would be written as a live
 * id, which the stream encoder rejects.
 *
 * The `visit_entity` overloads below cover the common field shapes.
 */
template <typename T, typename = void>
struct EntityFields {
    template <typename Fn>
    static void visit(T&, Fn&&) {}
};

template <typename T>
struct EntityFields<T, std::void_t<decltype(std::declval<T&>().visit_entities(
                           std::declval<void (*)(Entity&)>()))>> {
    template <typename Fn>
    static void visit(T& value, Fn&& fn) {
        value.visit_entities(std::forward<Fn>(fn));
    }
};

template <typename Fn>
void visit_entity(Entity& e, Fn&& fn) {
    fn(e);
}

template <typename Fn>
void visit_entity(std::optional<Entity>& e, Fn&& fn) {
    if (e)
        fn(*e);
}

template <typename Fn>
void visit_entity(std::vector<Entity>& entities, Fn&& fn) {
    for (auto& e : entities)
        fn(e);
}

/**
 * @brief Returns a copy of `value` with every live reference replaced by its wire form.
 * @details Null references (INVALID_ENTITY) are kept as null.
 * @throws UnknownEntity if a reference points to an entity outside the persisted set.
 */
template <typename T>
T to_wire(const T& value, const EntityTranslator& translator) {
    T wire = value;
    EntityFields<T>::visit(wire, [&translator](Entity& e) {
        if (e != INVALID_ENTITY)
            e = wire_entity(translator.to_ordinal(e));
    });
    return wire;
}

/**
 * @brief Replaces every wire reference in `value` with the live entity of the current load,
 * allocating entities that have not been seen yet.
 * @throws UnknownEntity for ordinals outside the stream's range.
 * @throws EncodingError if a visited field does not hold a wire reference.
 */
template <typename T>
T from_wire(T value, EntityTranslator& translator) {
    EntityFields<T>::visit(value, [&translator](Entity& e) {
        if (e == INVALID_ENTITY)
            return;
        if (!is_wire(e))
            throw EncodingError(fmt::format("decoded reference {} is not an ordinal", e));
        e = translator.to_live(e.index);
    });
    return value;
}

} // namespace ecsave
