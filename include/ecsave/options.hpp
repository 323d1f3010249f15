#pragma once

namespace ecsave {

struct SaveOptions {
    /**
     * @brief Leave out blocks of types no marked entity owns.
     * @details By default every listed type gets a block, empty or not.
     */
    bool omit_empty_blocks = false;
};

struct LoadOptions {
    /**
     * @brief Attach the marker component to every entity the load creates, so the loaded world can
     * be saved again with the same subset.
     */
    bool restore_markers = true;

    /**
     * @brief Destroy every entity in the target world before loading.
     */
    bool clear_world = false;
};

} // namespace ecsave
