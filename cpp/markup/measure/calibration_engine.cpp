#include "markup/measure/calibration_engine.h"
#include "markup/core/geometry.h"
#include "markup/core/logging.h"
#include "markup/entity/annotation_store.h"
#include "markup/view/coordinate_mapper.h"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace markup {

namespace {
constexpr float kMinReferencePixels = 1e-3f;

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}
} // namespace

CalibrationEngine::CalibrationEngine(AnnotationStore& store, const CoordinateMapper& mapper)
    : store_(store), mapper_(mapper) {}

float CalibrationEngine::pixelLength(const MarkupLine& line) const {
    return distance(mapper_.toVisual(line.p1), mapper_.toVisual(line.p2));
}

std::optional<float> CalibrationEngine::scaledLength(const MarkupLine& line) const {
    if (!line.isMeasurement || line.referenceLength) return std::nullopt;
    const MarkupLine* ref = store_.referenceLine();
    if (!ref) return std::nullopt;
    const float refPixels = pixelLength(*ref);
    if (refPixels < kMinReferencePixels) return std::nullopt;
    return pixelLength(line) * (*ref->referenceLength) / refPixels;
}

std::string CalibrationEngine::referenceUnit() const {
    const MarkupLine* ref = store_.referenceLine();
    return ref ? ref->unit : std::string();
}

std::string CalibrationEngine::label(const MarkupLine& line) const {
    if (line.referenceLength) {
        return "Ref " + formatLength(*line.referenceLength, line.unit);
    }
    const auto scaled = scaledLength(line);
    if (!scaled) return std::string();
    return formatLength(*scaled, referenceUnit());
}

bool CalibrationEngine::hasPendingReference() const {
    return pending_ && store_.findLine(pending_->lineId) != nullptr;
}

const PendingReference* CalibrationEngine::pendingReference() const {
    return hasPendingReference() ? &*pending_ : nullptr;
}

bool CalibrationEngine::beginReferenceCapture(std::uint32_t lineId) {
    if (hasPendingReference()) return false;
    if (pending_) {
        MARKUP_LOG_DEBUG("beginReferenceCapture: dropping capture for missing line %u", pending_->lineId);
        pending_.reset();
    }
    const MarkupLine* line = store_.findLine(lineId);
    if (!line) return false;
    pending_ = PendingReference{lineId, midpoint(mapper_.toVisual(line->p1), mapper_.toVisual(line->p2))};
    return true;
}

MarkupError CalibrationEngine::submitReference(std::string_view value, std::string_view unit) {
    float parsed = 0.0f;
    if (!parseLength(value, parsed)) {
        MARKUP_LOG_DEBUG("submitReference: rejected input");
        return MarkupError::InvalidInput;
    }
    return submitReference(parsed, unit);
}

MarkupError CalibrationEngine::submitReference(float value, std::string_view unit) {
    if (!pending_) return MarkupError::StaleReference;
    if (!std::isfinite(value) || value <= 0.0f) return MarkupError::InvalidInput;

    const std::uint32_t lineId = pending_->lineId;
    if (!store_.findLine(lineId)) {
        MARKUP_LOG_WARN("submitReference: line %u no longer exists", lineId);
        pending_.reset();
        return MarkupError::StaleReference;
    }
    if (!store_.setReferenceLength(lineId, value, std::string(trim(unit)))) {
        return MarkupError::InvalidInput;
    }
    pending_.reset();
    return MarkupError::Ok;
}

bool CalibrationEngine::cancelReferenceCapture() {
    const bool live = hasPendingReference();
    pending_.reset();
    return live;
}

bool CalibrationEngine::parseLength(std::string_view text, float& out) {
    const std::string buf(trim(text));
    if (buf.empty()) return false;
    char* end = nullptr;
    const double v = std::strtod(buf.c_str(), &end);
    if (end != buf.c_str() + buf.size()) return false;
    if (!std::isfinite(v) || v <= 0.0) return false;
    out = static_cast<float>(v);
    return std::isfinite(out) && out > 0.0f;
}

std::string CalibrationEngine::formatLength(float value, std::string_view unit) {
    char buf[64];
    // Drop trailing zeros: 1000 -> "1000", 12.5 -> "12.5", 1/3 -> "0.33"
    std::snprintf(buf, sizeof(buf), "%.2f", static_cast<double>(value));
    std::string s(buf);
    const auto dot = s.find('.');
    if (dot != std::string::npos) {
        while (!s.empty() && s.back() == '0') s.pop_back();
        if (!s.empty() && s.back() == '.') s.pop_back();
    }
    if (!unit.empty()) {
        s.push_back(' ');
        s.append(unit.data(), unit.size());
    }
    return s;
}

} // namespace markup
