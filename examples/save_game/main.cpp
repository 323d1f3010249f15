#include <ecsave/ecsave.hpp>

#include <cstdio>
#include <fstream>
#include <string>

// ---------------------------------------------------------------------------
// Game components
// ---------------------------------------------------------------------------

struct Position {
    float x, y;
};

struct Health {
    int hp;
    int max_hp;
};

struct Name {
    std::string value;
};

// Points at the entity an AI is chasing.
struct Chase {
    ecsave::Entity target = ecsave::INVALID_ENTITY;

    template <typename Fn>
    void visit_entities(Fn&& fn) {
        ecsave::visit_entity(target, fn);
    }
};

// Runtime-only state, never persisted.
struct RenderHandle {
    int id;
};

// Entities carrying this are written to the save file.
struct SaveMe {};

namespace YAML {

template <>
struct convert<Position> {
    static Node encode(const Position& p) {
        Node node;
        node.SetStyle(EmitterStyle::Flow);
        node["x"] = p.x;
        node["y"] = p.y;
        return node;
    }
    static bool decode(const Node& node, Position& p) {
        if (!node.IsMap())
            return false;
        p.x = node["x"].as<float>();
        p.y = node["y"].as<float>();
        return true;
    }
};

template <>
struct convert<Health> {
    static Node encode(const Health& h) {
        Node node;
        node.SetStyle(EmitterStyle::Flow);
        node["hp"] = h.hp;
        node["max"] = h.max_hp;
        return node;
    }
    static bool decode(const Node& node, Health& h) {
        if (!node.IsMap())
            return false;
        h.hp = node["hp"].as<int>();
        h.max_hp = node["max"].as<int>();
        return true;
    }
};

template <>
struct convert<Name> {
    static Node encode(const Name& n) { return Node(n.value); }
    static bool decode(const Node& node, Name& n) {
        n.value = node.as<std::string>();
        return true;
    }
};

template <>
struct convert<Chase> {
    static Node encode(const Chase& c) { return Node(c.target); }
    static bool decode(const Node& node, Chase& c) {
        c.target = node.as<ecsave::Entity>();
        return true;
    }
};

} // namespace YAML

static void print_world(const char* title, ecsave::World& world) {
    std::printf("%s (%zu entities)\n", title, world.count());
    world.each<Name>([&](ecsave::Entity e, Name& name) {
        std::printf("  %-8s", name.value.c_str());
        if (auto* p = world.try_get<Position>(e))
            std::printf(" pos=(%.1f, %.1f)", p->x, p->y);
        if (auto* h = world.try_get<Health>(e))
            std::printf(" hp=%d/%d", h->hp, h->max_hp);
        if (auto* c = world.try_get<Chase>(e)) {
            auto* target = world.try_get<Name>(c->target);
            std::printf(" chasing=%s", target ? target->value.c_str() : "-");
        }
        if (world.has<ecsave::Parent>(e)) {
            auto* parent = world.try_get<Name>(world.get<ecsave::Parent>(e).entity);
            std::printf(" parent=%s", parent ? parent->value.c_str() : "-");
        }
        std::printf("\n");
    });
}

int main(int argc, char** argv) {
    const std::string path = argc > 1 ? argv[1] : "save_game.yaml";

    ecsave::TypeRegistry registry;
    ECSAVE_REGISTER(registry, Position);
    ECSAVE_REGISTER(registry, Health);
    ECSAVE_REGISTER(registry, Name);
    ECSAVE_REGISTER(registry, Chase);
    ecsave::register_hierarchy_components(registry);

    ecsave::TypeList types =
        ecsave::type_list<Name, Position, Health, Chase, ecsave::Parent, ecsave::Children>(
            registry);

    // Build a small scene. The camera is runtime-only and stays out of the save.
    ecsave::World world;
    auto player = world.create_with(SaveMe{}, Name{"player"}, Position{0, 0}, Health{80, 100},
                                    RenderHandle{1});
    auto sword = world.create_with(SaveMe{}, Name{"sword"});
    world.create_with(SaveMe{}, Name{"goblin"}, Position{5, 3}, Health{12, 12},
                      Chase{player}, RenderHandle{2});
    world.create_with(Name{"camera"}, Position{0, 10}, RenderHandle{3});
    ecsave::set_parent(world, sword, player);

    print_world("Before save", world);

    try {
        std::ofstream out(path);
        ecsave::save<SaveMe>(world, registry, types, out);
        if (!out) {
            std::fprintf(stderr, "cannot write %s\n", path.c_str());
            return 1;
        }
        std::printf("Saved to %s\n\n", path.c_str());

        ecsave::World restored;
        std::ifstream in(path);
        auto loaded = ecsave::load<SaveMe>(restored, registry, in, types);
        std::printf("Loaded %zu entities\n", loaded.size());
        print_world("After load", restored);
    } catch (const ecsave::Error& e) {
        std::fprintf(stderr, "save/load failed: %s\n", e.what());
        return 1;
    }
    return 0;
}
