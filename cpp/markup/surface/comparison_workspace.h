#pragma once

#include "markup/config/markup_config.h"
#include "markup/entity/markup_types.h"
#include "markup/surface/input_router.h"
#include "markup/view/coordinate_mapper.h"
#include <array>
#include <cstdint>
#include <memory>

namespace markup {

class MarkupSurface;

// Workspace-level keyboard shortcuts, applied to the active slot.
enum class WorkspaceShortcut : std::uint8_t {
    Undo = 0,
    Redo = 1,
    ActivateFirst = 2,
    ActivateSecond = 3,
    ToggleGrid = 4,
    ToggleLineTool = 5,
    ToggleAngleTool = 6,
    ToggleTextTool = 7,
    ToggleHidden = 8,
    ZoomIn = 9,
    ZoomOut = 10,
    PanLeft = 11,
    PanRight = 12,
    PanUp = 13,
    PanDown = 14,
};

/**
 * ComparisonWorkspace: two independent markup surfaces shown side by side
 * (or stacked), with optional grid and transform synchronization.
 *
 * Each slot owns its own surface; nothing is shared except what a sync
 * explicitly mirrors.
 */
class ComparisonWorkspace {
public:
    static constexpr std::uint32_t kSlotCount = 2;

    static constexpr float kZoomStep = 0.1f;
    static constexpr float kMinZoom = 0.25f;
    static constexpr float kMaxZoom = 4.0f;
    static constexpr float kPanStepPx = 20.0f;
    static constexpr float kMaxPanPx = 500.0f;

    explicit ComparisonWorkspace(const MarkupConfig& config = MarkupConfig{});
    ~ComparisonWorkspace();

    ComparisonWorkspace(const ComparisonWorkspace&) = delete;
    ComparisonWorkspace& operator=(const ComparisonWorkspace&) = delete;

    /** @return nullptr for an out-of-range slot */
    MarkupSurface* surface(std::uint32_t slot);
    const MarkupSurface* surface(std::uint32_t slot) const;

    InputRouter& router() { return router_; }

    /**
     * Rebuild a slot's surface (e.g. after a layout switch), carrying over its
     * annotations, style, tool and host inputs. History is not carried.
     */
    bool recreateSurface(std::uint32_t slot);

    /** New media in a slot: clear its annotations, keep grid and hidden. */
    bool replaceMedia(std::uint32_t slot);

    // =========================================================================
    // Grid sync
    // =========================================================================
    bool gridSync() const { return gridSync_; }

    /** Enabling copies `source`'s grid to the other slot. */
    void setGridSync(bool enabled, std::uint32_t source);
    bool updateGrid(std::uint32_t slot, const GridUpdate& update);

    // =========================================================================
    // Transform sync
    // =========================================================================
    bool transformSync() const { return transformSync_; }
    void setTransformSync(bool enabled, std::uint32_t source);
    bool setTransform(std::uint32_t slot, const MediaTransform& transform);

    /** @return True if the shortcut changed anything */
    bool applyShortcut(WorkspaceShortcut shortcut);

private:
    static std::uint32_t other(std::uint32_t slot) { return slot == 0 ? 1u : 0u; }
    bool toggleTool(MarkupSurface& s, MarkupTool tool);

    MarkupConfig config_;
    std::array<std::unique_ptr<MarkupSurface>, kSlotCount> slots_;
    InputRouter router_;
    bool gridSync_{false};
    bool transformSync_{false};
};

} // namespace markup
