#pragma once
#include "encoding.hpp"
#include "entity_refs.hpp"
#include "errors.hpp"
#include "translator.hpp"
#include "world.hpp"

#include <yaml-cpp/yaml.h>

#include <unordered_set>
#include <utility>
#include <vector>

namespace ecsave {

/**
 * @brief Emits one `[ordinal, payload]` record per marked entity that owns a T.
 *
 * @details Records follow the order of `marked`, which is the order the translator assigned
 * ordinals in, so the block is deterministic for a given marked set. Only T's storage is read
 * from `world`, through `try_get<T>`.
 * @throws UnknownEntity if a payload references an entity outside the marked set.
 */
template <typename T>
YAML::Node serialize_block(const World& world, const std::vector<Entity>& marked,
                           const EntityTranslator& translator) {
    YAML::Node records(YAML::NodeType::Sequence);
    for (Entity e : marked) {
        const T* component = world.try_get<T>(e);
        if (!component)
            continue;
        YAML::Node record(YAML::NodeType::Sequence);
        record.SetStyle(YAML::EmitterStyle::Flow);
        record.push_back(translator.to_ordinal(e));
        record.push_back(encode_payload(to_wire(*component, translator)));
        records.push_back(record);
    }
    return records;
}

/**
 * @brief Attaches every record of a T block to the live entity of its ordinal.
 *
 * @details Entities are allocated on first sight of their ordinal, either here or while resolving
 * a reference, so records may refer to entities whose own records come later in the stream.
 * An existing T on the target entity is overwritten.
 * @throws EncodingError for malformed records or an ordinal recorded twice in the block.
 */
template <typename T>
void deserialize_block(World& world, const YAML::Node& records, EntityTranslator& translator) {
    if (!records.IsSequence())
        throw EncodingError("records must be a sequence");

    std::unordered_set<Ordinal> seen;
    for (const YAML::Node& record : records) {
        if (!record.IsSequence() || record.size() != 2)
            throw EncodingError("record must be an [ordinal, payload] pair");
        Ordinal ordinal = record[0].as<Ordinal>();
        if (!seen.insert(ordinal).second)
            throw EncodingError(fmt::format("ordinal {} recorded twice", ordinal));

        Entity live = translator.to_live(ordinal);
        T component = from_wire(decode_payload<T>(record[1]), translator);
        world.add(live, std::move(component));
    }
}

} // namespace ecsave
