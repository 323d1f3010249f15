#pragma once

/**
 * @file ecsave.hpp
 * @brief Main entry point for the save/load library.
 * @details Includes the host ECS, the save/load engine and the builtin hierarchy components.
 */

#include "archetype.hpp"
#include "component.hpp"
#include "config.hpp"
#include "entity.hpp"
#include "world.hpp"

#include "driver.hpp"
#include "encoding.hpp"
#include "entity_refs.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "marker.hpp"
#include "options.hpp"
#include "saveload.hpp"
#include "translator.hpp"
#include "type_registry.hpp"
#include "visitors.hpp"

#include "builtin/hierarchy.hpp"
#include "builtin/hierarchy_ops.hpp"
