#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "markup/core/color.h"
#include "markup/entity/annotation_store.h"
#include "markup/interaction/interaction_controller.h"
#include "markup/measure/calibration_engine.h"
#include "markup/surface/markup_surface.h"
#include <string>
#include <vector>

#ifdef EMSCRIPTEN
namespace {

using namespace markup;

struct BufferMeta {
    std::uint32_t count;
    std::uintptr_t ptr;
};

// JS-facing wrapper: keeps the buffers handed out by pointer alive until the
// next call that rebuilds them.
class MarkupSurfaceBinding {
public:
    MarkupSurfaceBinding() = default;

    MarkupSurface& surface() { return surface_; }

    void rebuildFrame() {
        frame_ = surface_.buildFrame();
        labelPositions_.clear();
        for (const OverlayLabel& label : frame_.labels) {
            labelPositions_.push_back(label.pos.x);
            labelPositions_.push_back(label.pos.y);
        }
    }

    BufferMeta primitiveMeta() const {
        return BufferMeta{
            static_cast<std::uint32_t>(frame_.primitives.size()),
            reinterpret_cast<std::uintptr_t>(frame_.primitives.data()),
        };
    }

    BufferMeta dataMeta() const {
        return BufferMeta{
            static_cast<std::uint32_t>(frame_.data.size()),
            reinterpret_cast<std::uintptr_t>(frame_.data.data()),
        };
    }

    std::uint32_t labelCount() const { return static_cast<std::uint32_t>(frame_.labels.size()); }

    std::string labelText(std::uint32_t i) const {
        return i < frame_.labels.size() ? frame_.labels[i].text : std::string();
    }

    BufferMeta labelPositionMeta() const {
        return BufferMeta{
            static_cast<std::uint32_t>(labelPositions_.size()),
            reinterpret_cast<std::uintptr_t>(labelPositions_.data()),
        };
    }

    BufferMeta saveSnapshot() {
        snapshotBytes_ = surface_.saveSnapshot();
        return BufferMeta{
            static_cast<std::uint32_t>(snapshotBytes_.size()),
            reinterpret_cast<std::uintptr_t>(snapshotBytes_.data()),
        };
    }

    std::uintptr_t allocBytes(std::uint32_t byteCount) {
        scratch_.assign(byteCount, 0);
        return reinterpret_cast<std::uintptr_t>(scratch_.data());
    }

    MarkupError loadSnapshotFromScratch(std::uint32_t byteCount) {
        if (byteCount > scratch_.size()) return MarkupError::BufferTruncated;
        return surface_.loadSnapshot(scratch_.data(), byteCount);
    }

    std::uint32_t loadFontFromScratch(std::uint32_t byteCount) {
        if (byteCount > scratch_.size()) return 0;
        return surface_.loadFont(scratch_.data(), byteCount);
    }

private:
    MarkupSurface surface_;
    OverlayFrame frame_;
    std::vector<float> labelPositions_;
    std::vector<std::uint8_t> snapshotBytes_;
    std::vector<std::uint8_t> scratch_;
};

} // namespace

EMSCRIPTEN_BINDINGS(markup_engine_module) {
    using namespace markup;

    emscripten::enum_<MarkupTool>("MarkupTool")
        .value("None", MarkupTool::None)
        .value("Line", MarkupTool::Line)
        .value("Angle", MarkupTool::Angle)
        .value("Text", MarkupTool::Text)
        .value("Measure", MarkupTool::Measure);

    emscripten::enum_<EntityKind>("EntityKind")
        .value("Line", EntityKind::Line)
        .value("Angle", EntityKind::Angle)
        .value("Text", EntityKind::Text);

    emscripten::enum_<MarkupError>("MarkupError")
        .value("Ok", MarkupError::Ok)
        .value("InvalidMagic", MarkupError::InvalidMagic)
        .value("UnsupportedVersion", MarkupError::UnsupportedVersion)
        .value("BufferTruncated", MarkupError::BufferTruncated)
        .value("InvalidPayloadSize", MarkupError::InvalidPayloadSize)
        .value("StaleReference", MarkupError::StaleReference)
        .value("InvalidInput", MarkupError::InvalidInput)
        .value("EmptyContent", MarkupError::EmptyContent)
        .value("DegenerateGeometry", MarkupError::DegenerateGeometry);

    emscripten::enum_<Key>("Key")
        .value("Other", Key::Other)
        .value("Escape", Key::Escape)
        .value("Delete", Key::Delete)
        .value("Backspace", Key::Backspace)
        .value("Enter", Key::Enter)
        .value("Shift", Key::Shift);

    emscripten::enum_<InteractionEventType>("InteractionEventType")
        .value("OpenToolPanel", InteractionEventType::OpenToolPanel)
        .value("ClosePanelRequested", InteractionEventType::ClosePanelRequested)
        .value("ReferenceInputRequested", InteractionEventType::ReferenceInputRequested)
        .value("TextEditOpened", InteractionEventType::TextEditOpened)
        .value("TextEditClosed", InteractionEventType::TextEditClosed);

    emscripten::value_object<Point2>("Point2")
        .field("x", &Point2::x)
        .field("y", &Point2::y);

    emscripten::value_object<MediaTransform>("MediaTransform")
        .field("scale", &MediaTransform::scale)
        .field("translateX", &MediaTransform::translateX)
        .field("translateY", &MediaTransform::translateY);

    emscripten::value_object<PointerEvent>("PointerEvent")
        .field("x", &PointerEvent::x)
        .field("y", &PointerEvent::y)
        .field("modifiers", &PointerEvent::modifiers);

    emscripten::value_object<KeyEvent>("KeyEvent")
        .field("key", &KeyEvent::key)
        .field("inTextInput", &KeyEvent::inTextInput);

    emscripten::value_object<InteractionEvent>("InteractionEvent")
        .field("type", &InteractionEvent::type)
        .field("kind", &InteractionEvent::kind)
        .field("id", &InteractionEvent::id)
        .field("anchor", &InteractionEvent::anchor);

    emscripten::value_object<BufferMeta>("BufferMeta")
        .field("count", &BufferMeta::count)
        .field("ptr", &BufferMeta::ptr);

    emscripten::register_vector<InteractionEvent>("VectorInteractionEvent");

    emscripten::class_<MarkupSurfaceBinding>("MarkupSurface")
        .constructor<>()
        // Host inputs
        .function("setSurfaceSize", emscripten::optional_override([](MarkupSurfaceBinding& self, float w, float h) {
            return self.surface().setSurfaceSize(w, h);
        }))
        .function("setMediaAspect", emscripten::optional_override([](MarkupSurfaceBinding& self, float aspect) {
            self.surface().setMediaAspect(aspect);
        }))
        .function("setTransform", emscripten::optional_override([](MarkupSurfaceBinding& self, const MediaTransform& t) {
            self.surface().setTransform(t);
        }))
        .function("setCorrectionScale", emscripten::optional_override([](MarkupSurfaceBinding& self, float s) {
            self.surface().setCorrectionScale(s);
        }))
        .function("setPlaybackTime", emscripten::optional_override([](MarkupSurfaceBinding& self, double t) {
            self.surface().setPlaybackTime(t);
        }))
        // Drawing state
        .function("selectTool", emscripten::optional_override([](MarkupSurfaceBinding& self, MarkupTool tool) {
            self.surface().controller().selectTool(tool);
        }))
        .function("setActiveColor", emscripten::optional_override([](MarkupSurfaceBinding& self, const std::string& hex) {
            Color c = 0;
            if (!parseHexColor(hex, c)) return false;
            self.surface().store().setActiveColor(c);
            return true;
        }))
        .function("setLineWidth", emscripten::optional_override([](MarkupSurfaceBinding& self, float w) {
            return self.surface().store().setLineWidth(w);
        }))
        .function("setTextSize", emscripten::optional_override([](MarkupSurfaceBinding& self, float s) {
            return self.surface().store().setTextSize(s);
        }))
        .function("setHidden", emscripten::optional_override([](MarkupSurfaceBinding& self, bool hidden) {
            self.surface().store().setHidden(hidden);
        }))
        .function("removeItem", emscripten::optional_override([](MarkupSurfaceBinding& self, EntityKind kind, std::uint32_t id) {
            return self.surface().store().removeItem(kind, id);
        }))
        .function("clearReference", emscripten::optional_override([](MarkupSurfaceBinding& self, std::uint32_t lineId) {
            return self.surface().store().clearReference(lineId);
        }))
        .function("clearAll", emscripten::optional_override([](MarkupSurfaceBinding& self) {
            self.surface().store().clearAll();
        }))
        .function("undo", emscripten::optional_override([](MarkupSurfaceBinding& self) {
            return self.surface().store().undo();
        }))
        .function("redo", emscripten::optional_override([](MarkupSurfaceBinding& self) {
            return self.surface().store().redo();
        }))
        // Input
        .function("pointerDown", emscripten::optional_override([](MarkupSurfaceBinding& self, const PointerEvent& e) {
            self.surface().controller().pointerDown(e);
        }))
        .function("pointerMove", emscripten::optional_override([](MarkupSurfaceBinding& self, const PointerEvent& e) {
            self.surface().controller().pointerMove(e);
        }))
        .function("pointerUp", emscripten::optional_override([](MarkupSurfaceBinding& self, const PointerEvent& e) {
            self.surface().controller().pointerUp(e);
        }))
        .function("pointerLeave", emscripten::optional_override([](MarkupSurfaceBinding& self) {
            self.surface().controller().pointerLeave();
        }))
        .function("click", emscripten::optional_override([](MarkupSurfaceBinding& self, const PointerEvent& e) {
            self.surface().controller().click(e);
        }))
        .function("doubleClick", emscripten::optional_override([](MarkupSurfaceBinding& self, const PointerEvent& e) {
            self.surface().controller().doubleClick(e);
        }))
        .function("keyDown", emscripten::optional_override([](MarkupSurfaceBinding& self, const KeyEvent& e) {
            return self.surface().controller().keyDown(e);
        }))
        .function("keyUp", emscripten::optional_override([](MarkupSurfaceBinding& self, const KeyEvent& e) {
            self.surface().controller().keyUp(e);
        }))
        .function("setTextEditValue", emscripten::optional_override([](MarkupSurfaceBinding& self, const std::string& value) {
            self.surface().controller().setTextEditValue(value);
        }))
        .function("commitTextEdit", emscripten::optional_override([](MarkupSurfaceBinding& self) {
            return self.surface().controller().commitTextEdit();
        }))
        .function("cancelTextEdit", emscripten::optional_override([](MarkupSurfaceBinding& self) {
            self.surface().controller().cancelTextEdit();
        }))
        .function("submitReference", emscripten::optional_override([](MarkupSurfaceBinding& self, const std::string& value, const std::string& unit) {
            return self.surface().controller().submitReference(value, unit);
        }))
        .function("cancelReference", emscripten::optional_override([](MarkupSurfaceBinding& self) {
            return self.surface().calibration().cancelReferenceCapture();
        }))
        .function("drainEvents", emscripten::optional_override([](MarkupSurfaceBinding& self) {
            return self.surface().controller().drainEvents();
        }))
        // Frame
        .function("rebuildFrame", &MarkupSurfaceBinding::rebuildFrame)
        .function("getPrimitiveMeta", &MarkupSurfaceBinding::primitiveMeta)
        .function("getDataMeta", &MarkupSurfaceBinding::dataMeta)
        .function("getLabelCount", &MarkupSurfaceBinding::labelCount)
        .function("getLabelText", &MarkupSurfaceBinding::labelText)
        .function("getLabelPositionMeta", &MarkupSurfaceBinding::labelPositionMeta)
        // Persistence
        .function("allocBytes", &MarkupSurfaceBinding::allocBytes)
        .function("saveSnapshot", &MarkupSurfaceBinding::saveSnapshot)
        .function("loadSnapshot", &MarkupSurfaceBinding::loadSnapshotFromScratch)
        .function("loadFont", &MarkupSurfaceBinding::loadFontFromScratch)
        .function("replaceMedia", emscripten::optional_override([](MarkupSurfaceBinding& self) {
            self.surface().replaceMedia();
        }));
}
#endif
