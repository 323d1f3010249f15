#pragma once
#include "component.hpp"
#include "config.hpp"
#include "translator.hpp"
#include "visitors.hpp"
#include "world.hpp"

#include <yaml-cpp/yaml.h>

#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace ecsave {

/**
 * @brief Stable tag plus the type-erased visitors of one persistable component type.
 */
struct TypeEntry {
    using SerializeFunc = YAML::Node (*)(const World&, const std::vector<Entity>&,
                                         const EntityTranslator&);
    using DeserializeFunc = void (*)(World&, const YAML::Node&, EntityTranslator&);

    std::string tag;
    ComponentTypeID component = 0;
    SerializeFunc serialize_fn = nullptr;
    DeserializeFunc deserialize_fn = nullptr;
};

/**
 * @brief Ordered list of type tags naming the components one save or load covers.
 */
using TypeList = std::vector<std::string>;

/**
 * @brief The set of component types the engine can persist, built once at startup.
 *
 * @details Each registration instantiates the serialize/deserialize visitors for its type, so the
 * driver only ever deals with tags and function pointers.
 */
class TypeRegistry {
public:
    /**
     * @brief Registers T under `tag`.
     * @details Registering the same type with the same tag again is a no-op. A tag already used by
     * another type, or a type already registered under another tag, asserts.
     */
    template <typename T>
    void add(const std::string& tag) {
        static_assert(std::is_copy_constructible_v<T>,
                      "persistable components are copied while their references are rewritten");
        static_assert(std::is_default_constructible_v<T>,
                      "persistable components are default-constructed before decoding");

        ComponentTypeID id = component_id<T>();
        auto by_tag = by_tag_.find(tag);
        if (by_tag != by_tag_.end()) {
            ECSAVE_ASSERT(entries_[by_tag->second].component == id,
                          "tag already registered to a different type");
            return;
        }
        auto by_id = by_component_.find(id);
        if (by_id != by_component_.end()) {
            ECSAVE_ASSERT(entries_[by_id->second].tag == tag,
                          "type already registered with a different tag");
            return;
        }

        by_tag_[tag] = entries_.size();
        by_component_[id] = entries_.size();
        entries_.push_back({tag, id, &serialize_block<T>, &deserialize_block<T>});
    }

    const TypeEntry* find(const std::string& tag) const {
        auto it = by_tag_.find(tag);
        return it != by_tag_.end() ? &entries_[it->second] : nullptr;
    }

    template <typename T>
    const TypeEntry* find() const {
        auto it = by_component_.find(component_id<T>());
        return it != by_component_.end() ? &entries_[it->second] : nullptr;
    }

    bool contains(const std::string& tag) const { return find(tag) != nullptr; }

    size_t size() const { return entries_.size(); }

    /** @brief Entries in registration order. */
    const std::vector<TypeEntry>& entries() const { return entries_; }

private:
    std::vector<TypeEntry> entries_;
    std::map<std::string, size_t> by_tag_;
    std::map<ComponentTypeID, size_t> by_component_;
};

/**
 * @brief Builds a type list from registered C++ types, in the order given.
 * @details Asserts if one of the types is not registered.
 */
template <typename... Ts>
TypeList type_list(const TypeRegistry& registry) {
    TypeList list;
    list.reserve(sizeof...(Ts));
    auto append = [&](const TypeEntry* entry) {
        ECSAVE_ASSERT(entry != nullptr, "type_list: type is not registered");
        list.push_back(entry->tag);
    };
    (append(registry.find<Ts>()), ...);
    return list;
}

/**
 * @brief Unqualified type name used as the default tag: the text after the last `::`.
 */
inline std::string_view unqualified_name(std::string_view name) {
    size_t pos = name.rfind("::");
    return pos == std::string_view::npos ? name : name.substr(pos + 2);
}

} // namespace ecsave

/**
 * @brief Registers `Type` under its unqualified name, e.g. `game::Position` as "Position".
 */
#define ECSAVE_REGISTER(registry, Type)                                                            \
    (registry).add<Type>(std::string(::ecsave::unqualified_name(#Type)))
