#pragma once
#include "config.hpp"
#include "driver.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "marker.hpp"
#include "options.hpp"
#include "translator.hpp"
#include "type_registry.hpp"
#include "world.hpp"

#include <yaml-cpp/yaml.h>

#include <istream>
#include <limits>
#include <ostream>
#include <string>
#include <vector>

namespace ecsave {

/**
 * @brief Saves the components listed in `types` of every entity carrying `Marker`.
 *
 * @details The marked set is collected from the world, ordinals are assigned in its order, and
 * each listed type is visited once. The returned document is
 * `{version, entities: <marked count>, components: [{type, records: [[ordinal, payload]...]}...]}`.
 * The world is not modified.
 *
 * @throws UnsupportedType, DuplicateType before anything is visited.
 * @throws UnknownEntity if a persisted component references an unmarked entity.
 * @throws EncodingError if a payload cannot be encoded.
 */
template <typename Marker>
YAML::Node save(const World& world, const TypeRegistry& registry, const TypeList& types,
                const SaveOptions& options = {}) {
    ResolvedTypes resolved = resolve_types(registry, types);
    std::vector<Entity> marked = collect_marked<Marker>(world);
    log::debug("save", "{} marked entities, {} types", marked.size(), resolved.size());

    try {
        EntityTranslator translator = EntityTranslator::begin(marked);

        YAML::Node document;
        document[keys::version] = ECSAVE_STREAM_VERSION;
        document[keys::entities] = marked.size();
        YAML::Node components(YAML::NodeType::Sequence);
        run_save(resolved, world, marked, translator, components, options);
        document[keys::components] = components;
        return document;
    } catch (const Error& e) {
        log::warn("save", "save aborted: {}", e.what());
        throw;
    }
}

/**
 * @brief Loads a document produced by `save` into `world`.
 *
 * @details Every persisted entity is created anew; references between them are rewritten to the
 * new entities. With `LoadOptions::restore_markers` each created entity also gets `Marker`.
 * Nothing is rolled back on failure: load into a scratch world if it must stay untouched.
 *
 * @return The created entities, indexed by ordinal.
 * @throws UnsupportedType, DuplicateType before the world is touched.
 * @throws UnknownEntity for a record or reference with an ordinal outside the stream's range.
 * @throws EncodingError for a malformed document or payload, or an entity count beyond the
 * ordinal range.
 */
template <typename Marker>
std::vector<Entity> load(World& world, const TypeRegistry& registry, const YAML::Node& document,
                         const TypeList& types, const LoadOptions& options = {}) {
    ResolvedTypes resolved = resolve_types(registry, types);

    size_t entity_count = 0;
    try {
        if (!document.IsMap())
            throw EncodingError("save document must be a map");
        if (!document[keys::version] ||
            document[keys::version].as<int>() != ECSAVE_STREAM_VERSION)
            throw EncodingError("unsupported save document version");
        if (!document[keys::entities])
            throw EncodingError("save document has no entity count");
        entity_count = document[keys::entities].as<size_t>();
        if (entity_count > std::numeric_limits<Ordinal>::max())
            throw EncodingError(
                fmt::format("entity count {} exceeds the ordinal range", entity_count));
    } catch (const YAML::Exception& e) {
        throw EncodingError(e.what());
    }

    if (options.clear_world)
        world.clear();

    try {
        EntityTranslator translator = EntityTranslator::begin_load(world, entity_count);
        run_load(resolved, document[keys::components], translator, world);
        translator.allocate_remaining();

        if (options.restore_markers) {
            for (Entity e : translator.entities())
                world.add(e, Marker{});
        }
        log::debug("load", "{} entities, {} types", entity_count, resolved.size());
        return translator.entities();
    } catch (const Error& e) {
        log::warn("load", "load aborted: {}", e.what());
        throw;
    }
}

template <typename Marker>
std::string save_to_string(const World& world, const TypeRegistry& registry, const TypeList& types,
                           const SaveOptions& options = {}) {
    YAML::Emitter out;
    out << save<Marker>(world, registry, types, options);
    return out.c_str();
}

template <typename Marker>
void save(const World& world, const TypeRegistry& registry, const TypeList& types,
          std::ostream& out, const SaveOptions& options = {}) {
    out << save_to_string<Marker>(world, registry, types, options) << '\n';
}

/**
 * @throws EncodingError if `text` is not valid YAML, plus everything `load` throws.
 */
template <typename Marker>
std::vector<Entity> load_from_string(World& world, const TypeRegistry& registry,
                                     const std::string& text, const TypeList& types,
                                     const LoadOptions& options = {}) {
    YAML::Node document;
    try {
        document = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw EncodingError(e.what());
    }
    return load<Marker>(world, registry, document, types, options);
}

template <typename Marker>
std::vector<Entity> load(World& world, const TypeRegistry& registry, std::istream& in,
                         const TypeList& types, const LoadOptions& options = {}) {
    YAML::Node document;
    try {
        document = YAML::Load(in);
    } catch (const YAML::Exception& e) {
        throw EncodingError(e.what());
    }
    return load<Marker>(world, registry, document, types, options);
}

} // namespace ecsave
