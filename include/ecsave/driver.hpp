#pragma once
#include "errors.hpp"
#include "log.hpp"
#include "options.hpp"
#include "translator.hpp"
#include "type_registry.hpp"
#include "world.hpp"

#include <yaml-cpp/yaml.h>

#include <map>
#include <set>
#include <string>
#include <vector>

namespace ecsave {

namespace keys {
inline constexpr const char* version = "version";
inline constexpr const char* entities = "entities";
inline constexpr const char* components = "components";
inline constexpr const char* type = "type";
inline constexpr const char* records = "records";
} // namespace keys

using ResolvedTypes = std::vector<const TypeEntry*>;

/**
 * @brief Looks up every tag of `types` before any data is touched.
 * @throws UnsupportedType for an unregistered tag.
 * @throws DuplicateType for a tag listed twice.
 */
inline ResolvedTypes resolve_types(const TypeRegistry& registry, const TypeList& types) {
    ResolvedTypes resolved;
    resolved.reserve(types.size());
    std::set<std::string> seen;
    for (const auto& tag : types) {
        const TypeEntry* entry = registry.find(tag);
        if (!entry)
            throw UnsupportedType(tag);
        if (!seen.insert(tag).second)
            throw DuplicateType(tag);
        resolved.push_back(entry);
    }
    return resolved;
}

/**
 * @brief Appends one `{type, records}` block per listed type to `sink`, in list order.
 * @details Each visitor only sees its own type's storage; which entities it emits is decided by
 * the marked set.
 */
inline void run_save(const ResolvedTypes& types, const World& world,
                     const std::vector<Entity>& marked, const EntityTranslator& translator,
                     YAML::Node& sink, const SaveOptions& options) {
    for (const TypeEntry* entry : types) {
        YAML::Node records;
        try {
            records = entry->serialize_fn(world, marked, translator);
        } catch (const YAML::Exception& e) {
            throw EncodingError(fmt::format("{}: {}", entry->tag, e.what()));
        }

        log::debug("save", "block '{}': {} records", entry->tag, records.size());
        if (records.size() == 0 && options.omit_empty_blocks)
            continue;

        YAML::Node block;
        block[keys::type] = entry->tag;
        block[keys::records] = records;
        sink.push_back(block);
    }
}

/**
 * @brief Feeds each listed type's block from `source` to its deserialize visitor, in list order.
 * @details Blocks are matched by tag, so the stream's block order does not matter. A listed type
 * without a block contributes nothing; blocks of unlisted types are skipped.
 * @throws EncodingError for a malformed block list or a tag appearing twice.
 */
inline void run_load(const ResolvedTypes& types, const YAML::Node& source,
                     EntityTranslator& translator, World& world) {
    std::map<std::string, YAML::Node> blocks;
    try {
        if (source && !source.IsNull()) {
            if (!source.IsSequence())
                throw EncodingError("'components' must be a sequence of blocks");
            for (const YAML::Node& block : source) {
                if (!block.IsMap() || !block[keys::type])
                    throw EncodingError("component block without a type tag");
                auto tag = block[keys::type].as<std::string>();
                if (!blocks.emplace(tag, block[keys::records]).second)
                    throw EncodingError(fmt::format("component block '{}' appears twice", tag));
            }
        }
    } catch (const YAML::Exception& e) {
        throw EncodingError(e.what());
    }

    std::set<std::string> listed;
    for (const TypeEntry* entry : types) {
        listed.insert(entry->tag);
        auto it = blocks.find(entry->tag);
        if (it == blocks.end() || !it->second || it->second.IsNull()) {
            log::debug("load", "block '{}': empty", entry->tag);
            continue;
        }

        try {
            entry->deserialize_fn(world, it->second, translator);
        } catch (const YAML::Exception& e) {
            throw EncodingError(fmt::format("{}: {}", entry->tag, e.what()));
        }
        log::debug("load", "block '{}': {} records", entry->tag, it->second.size());
    }

    for (const auto& [tag, records] : blocks) {
        if (listed.count(tag) == 0)
            log::debug("load", "skipping block '{}' (not in the type list)", tag);
    }
}

} // namespace ecsave
