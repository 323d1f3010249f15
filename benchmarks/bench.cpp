#include <chrono>
#include <cstdio>
#include <ecsave/ecsave.hpp>
#include <string>
#include <vector>

using namespace ecsave;

struct Pos {
    float x, y, z;
};
struct Vel {
    float dx, dy, dz;
};
struct Follow {
    Entity target = INVALID_ENTITY;

    template <typename Fn>
    void visit_entities(Fn&& fn) {
        visit_entity(target, fn);
    }
};
struct Saved {};

namespace YAML {

template <>
struct convert<Pos> {
    static Node encode(const Pos& p) {
        Node node(NodeType::Sequence);
        node.SetStyle(EmitterStyle::Flow);
        node.push_back(p.x);
        node.push_back(p.y);
        node.push_back(p.z);
        return node;
    }
    static bool decode(const Node& node, Pos& p) {
        if (!node.IsSequence() || node.size() != 3)
            return false;
        p = {node[0].as<float>(), node[1].as<float>(), node[2].as<float>()};
        return true;
    }
};

template <>
struct convert<Vel> {
    static Node encode(const Vel& v) {
        Node node(NodeType::Sequence);
        node.SetStyle(EmitterStyle::Flow);
        node.push_back(v.dx);
        node.push_back(v.dy);
        node.push_back(v.dz);
        return node;
    }
    static bool decode(const Node& node, Vel& v) {
        if (!node.IsSequence() || node.size() != 3)
            return false;
        v = {node[0].as<float>(), node[1].as<float>(), node[2].as<float>()};
        return true;
    }
};

template <>
struct convert<Follow> {
    static Node encode(const Follow& f) { return Node(f.target); }
    static bool decode(const Node& node, Follow& f) {
        f.target = node.as<ecsave::Entity>();
        return true;
    }
};

} // namespace YAML

struct Timer {
    using Clock = std::chrono::high_resolution_clock;
    Clock::time_point start;

    Timer() : start(Clock::now()) {}

    double elapsed_ms() const {
        auto end = Clock::now();
        return std::chrono::duration<double, std::milli>(end - start).count();
    }
};

// Every other entity is marked; each marked entity follows the previous marked one.
static void populate(World& w, size_t n) {
    Entity previous = INVALID_ENTITY;
    for (size_t i = 0; i < n; ++i) {
        float f = static_cast<float>(i);
        if (i % 2 == 1) {
            w.create_with(Pos{f, f, f});
            continue;
        }
        Entity e = w.create_with(Saved{}, Pos{f, 0, 0}, Vel{1, 1, 1});
        if (previous != INVALID_ENTITY)
            w.add(e, Follow{previous});
        previous = e;
    }
}

static void bench_collect_marked(size_t n) {
    World w;
    populate(w, n);

    Timer t;
    auto marked = collect_marked<Saved>(w);
    double ms = t.elapsed_ms();
    std::printf("  collect marked          %zu entities: %.2f ms (%.0f ent/ms)\n", marked.size(),
                ms, marked.size() / ms);
}

static void bench_save(const TypeRegistry& reg, const TypeList& types, size_t n) {
    World w;
    populate(w, n);

    Timer t;
    YAML::Node doc = save<Saved>(w, reg, types);
    double ms = t.elapsed_ms();
    std::printf("  save (document)         %zu entities: %.2f ms (%.0f ent/ms)\n", n / 2, ms,
                (n / 2) / ms);

    t = Timer();
    YAML::Emitter out;
    out << doc;
    ms = t.elapsed_ms();
    std::printf("  emit (text)             %zu bytes: %.2f ms\n", out.size(), ms);
}

static void bench_load(const TypeRegistry& reg, const TypeList& types, size_t n) {
    World src;
    populate(src, n);
    std::string text = save_to_string<Saved>(src, reg, types);

    Timer t;
    YAML::Node doc = YAML::Load(text);
    double ms = t.elapsed_ms();
    std::printf("  parse (text)            %zu bytes: %.2f ms\n", text.size(), ms);

    World dst;
    t = Timer();
    auto loaded = load<Saved>(dst, reg, doc, types);
    ms = t.elapsed_ms();
    std::printf("  load (document)         %zu entities: %.2f ms (%.0f ent/ms)\n", loaded.size(),
                ms, loaded.size() / ms);
}

int main() {
    constexpr size_t N_SMALL = 10'000;
    constexpr size_t N_LARGE = 100'000;

    ecsave::log::set_level(ecsave::log::Level::Warn);

    TypeRegistry reg;
    reg.add<Pos>("Pos");
    reg.add<Vel>("Vel");
    reg.add<Follow>("Follow");
    TypeList types = type_list<Pos, Vel, Follow>(reg);

    std::printf("=== ecsave Benchmarks ===\n\n");

    std::printf("Marker Collection:\n");
    bench_collect_marked(N_LARGE);

    std::printf("\nSave:\n");
    bench_save(reg, types, N_SMALL);
    bench_save(reg, types, N_LARGE);

    std::printf("\nLoad:\n");
    bench_load(reg, types, N_SMALL);
    bench_load(reg, types, N_LARGE);

    std::printf("\nDone.\n");
    return 0;
}
