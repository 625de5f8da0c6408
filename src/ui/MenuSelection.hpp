#pragma once

#include <cstddef>

namespace Wildspirit {

/**
 * Selection index arithmetic for vertical menus and lists.
 * Every helper returns 0 for an empty list instead of dividing by zero.
 */
namespace MenuSelection {

    inline size_t wrapNext(size_t index, size_t count) {
        if (count == 0) return 0;
        return (index % count + 1) % count;
    }

    inline size_t wrapPrevious(size_t index, size_t count) {
        if (count == 0) return 0;
        return (index % count + count - 1) % count;
    }

    // Stops at the ends instead of wrapping (main menu)
    inline size_t clampNext(size_t index, size_t count) {
        if (count == 0) return 0;
        return index + 1 < count ? index + 1 : count - 1;
    }

    inline size_t clampPrevious(size_t index, size_t count) {
        if (count == 0) return 0;
        if (index >= count) return count - 1;
        return index > 0 ? index - 1 : 0;
    }

    // Pull a stale index back into range after the list shrank
    inline size_t clampIndex(size_t index, size_t count) {
        if (count == 0) return 0;
        return index < count ? index : count - 1;
    }

    /**
     * Keep index inside [offset, offset + visibleRows) by moving the scroll offset.
     */
    inline size_t scrollToShow(size_t index, size_t offset, size_t visibleRows) {
        if (visibleRows == 0) return index;
        if (index < offset) return index;
        if (index >= offset + visibleRows) return index - visibleRows + 1;
        return offset;
    }

} // namespace MenuSelection

} // namespace Wildspirit
