#pragma once
#include "../encoding.hpp"
#include "../entity.hpp"
#include "../entity_refs.hpp"
#include "../type_registry.hpp"

#include <yaml-cpp/yaml.h>

#include <vector>

namespace ecsave {

struct Parent {
    Entity entity = INVALID_ENTITY;

    template <typename Fn>
    void visit_entities(Fn&& fn) {
        visit_entity(entity, fn);
    }
};

struct Children {
    std::vector<Entity> entities;

    template <typename Fn>
    void visit_entities(Fn&& fn) {
        visit_entity(entities, fn);
    }
};

/**
 * @brief Registers Parent and Children under the tags "Parent" and "Children".
 */
inline void register_hierarchy_components(TypeRegistry& registry) {
    registry.add<Parent>("Parent");
    registry.add<Children>("Children");
}

} // namespace ecsave

namespace YAML {

template <>
struct convert<ecsave::Parent> {
    static Node encode(const ecsave::Parent& p) {
        Node node;
        node["entity"] = p.entity;
        return node;
    }

    static bool decode(const Node& node, ecsave::Parent& p) {
        if (!node.IsMap() || !node["entity"])
            return false;
        p.entity = node["entity"].as<ecsave::Entity>();
        return true;
    }
};

template <>
struct convert<ecsave::Children> {
    static Node encode(const ecsave::Children& c) {
        Node node(NodeType::Sequence);
        node.SetStyle(EmitterStyle::Flow);
        for (auto e : c.entities)
            node.push_back(e);
        return node;
    }

    static bool decode(const Node& node, ecsave::Children& c) {
        if (!node.IsSequence())
            return false;
        c.entities = node.as<std::vector<ecsave::Entity>>();
        return true;
    }
};

} // namespace YAML
