#include "markup/surface/markup_surface.h"
#include "markup/core/logging.h"
#include "markup/surface/internal/surface_state.h"

namespace markup {

SurfaceState::SurfaceState(const MarkupConfig& cfg)
    : config(cfg),
      mapper(),
      store(cfg),
      visibility(cfg.durations),
      calibration(store, mapper),
      fonts(),
      textMeasure(&fonts),
      pick(cfg.hitThresholdPx, cfg.handleRadiusPx),
      controller(store, mapper, calibration, pick, visibility),
      overlay(mapper, pick, calibration),
      magnifier(mapper) {
    store.setMapper(&mapper);
    pick.setTextMeasure(&textMeasure);
}

MarkupSurface::MarkupSurface(const MarkupConfig& config)
    : state_(std::make_unique<SurfaceState>(config)) {}

MarkupSurface::~MarkupSurface() = default;

const MarkupConfig& MarkupSurface::config() const { return state_->config; }

bool MarkupSurface::setSurfaceSize(float width, float height) {
    return state_->mapper.setSurfaceSize(width, height);
}

void MarkupSurface::setMediaAspect(float aspect) { state_->mapper.setMediaAspect(aspect); }
void MarkupSurface::setTransform(const MediaTransform& transform) { state_->mapper.setTransform(transform); }
void MarkupSurface::setCorrectionScale(float scale) { state_->mapper.setCorrectionScale(scale); }

void MarkupSurface::setPlaybackTime(double seconds) {
    state_->playbackTime = seconds;
    state_->controller.setPlaybackTime(seconds);
}

double MarkupSurface::playbackTime() const { return state_->playbackTime; }

std::uint32_t MarkupSurface::loadFont(const std::uint8_t* data, std::size_t size) {
    if (!state_->fonts.isInitialized() && !state_->fonts.initialize()) {
        MARKUP_LOG_WARN("loadFont: font manager failed to initialize");
        return 0;
    }
    const std::uint32_t id = state_->fonts.loadFontFromMemory(data, size);
    if (id != 0) state_->textMeasure.setFontId(id);
    return id;
}

CoordinateMapper& MarkupSurface::mapper() { return state_->mapper; }
const CoordinateMapper& MarkupSurface::mapper() const { return state_->mapper; }
AnnotationStore& MarkupSurface::store() { return state_->store; }
const AnnotationStore& MarkupSurface::store() const { return state_->store; }
VisibilityFilter& MarkupSurface::visibility() { return state_->visibility; }
CalibrationEngine& MarkupSurface::calibration() { return state_->calibration; }
const PickSystem& MarkupSurface::pick() const { return state_->pick; }
InteractionController& MarkupSurface::controller() { return state_->controller; }
const InteractionController& MarkupSurface::controller() const { return state_->controller; }
MagnifierPreview& MarkupSurface::magnifier() { return state_->magnifier; }

VisibleSet MarkupSurface::visible() const {
    return state_->visibility.collect(state_->store, state_->playbackTime);
}

OverlayFrame MarkupSurface::buildFrame() const {
    return state_->overlay.build(state_->store, visible(), &state_->controller);
}

void MarkupSurface::attachMagnifier(FrameScheduler& scheduler) {
    SurfaceState* s = state_.get();
    s->magnifier.attach(scheduler, [s]() {
        std::optional<Point2> cursor;
        if (const auto& hover = s->controller.hoverPoint()) {
            cursor = s->mapper.toVisual(*hover);
        }
        return std::make_pair(s->store.tool(), cursor);
    });
}

void MarkupSurface::detachMagnifier() { state_->magnifier.detach(); }

std::vector<std::uint8_t> MarkupSurface::saveSnapshot() const {
    return buildSnapshotBytes(state_->store.snapshot());
}

MarkupError MarkupSurface::loadSnapshot(const std::uint8_t* bytes, std::uint32_t byteCount) {
    MarkupSnap snap;
    const MarkupError err = parseSnapshot(bytes, byteCount, snap);
    if (err != MarkupError::Ok) {
        MARKUP_LOG_WARN("loadSnapshot: %s", markupErrorName(err));
        return err;
    }
    state_->calibration.cancelReferenceCapture();
    state_->controller.selectTool(state_->store.tool());
    state_->store.loadSnap(snap);
    return MarkupError::Ok;
}

SnapDigest MarkupSurface::digest() const {
    return computeSnapDigest(state_->store.snapshot());
}

void MarkupSurface::replaceMedia() {
    MarkupSnap empty;
    empty.grid = state_->store.grid();
    empty.hidden = state_->store.hidden();
    state_->calibration.cancelReferenceCapture();
    state_->controller.selectTool(state_->store.tool());
    state_->store.loadSnap(empty);
}

} // namespace markup
