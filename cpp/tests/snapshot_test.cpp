#include "tests/markup_test_common.h"
#include "markup/core/util.h"
#include "markup/persistence/snapshot.h"
#include "markup/surface/markup_surface.h"

using namespace markup;
using namespace markup_test;

namespace {

MarkupSnap sampleSnap() {
    MarkupSnap snap;

    MarkupLine ref;
    ref.id = 3;
    ref.p1 = Point2{0.1f, 0.2f};
    ref.p2 = Point2{0.4f, 0.2f};
    ref.color = 0x00FF00FFu;
    ref.width = 3.0f;
    ref.name = "goal line";
    ref.isMeasurement = true;
    ref.referenceLength = 7.32f;
    ref.unit = "m";
    ref.createdAt = 12.25;
    snap.lines.push_back(ref);

    MarkupLine plain;
    plain.id = 4;
    plain.p1 = Point2{0.5f, 0.5f};
    plain.p2 = Point2{0.9f, 0.1f};
    plain.showAngle = true;
    plain.displayDuration = DisplayDuration::forSeconds(4.0f);
    snap.lines.push_back(plain);

    MarkupAngle angle;
    angle.id = 7;
    angle.p1 = Point2{0.6f, 0.5f};
    angle.vertex = Point2{0.5f, 0.5f};
    angle.p2 = Point2{0.5f, 0.3f};
    angle.angleDeg = 90.0f;
    angle.displayDuration = DisplayDuration::persistent();
    snap.angles.push_back(angle);

    MarkupText text;
    text.id = 9;
    text.pos = Point2{0.3f, 0.7f};
    text.content = "Caf\xC3\xA9 \xF0\x9F\x98\x80";
    text.size = 22.0f;
    text.backgroundColor = 0x000000AAu;
    text.boxWidth = 0.3f;
    text.createdAt = 1.0;
    snap.texts.push_back(text);

    snap.grid.show = true;
    snap.grid.mode = GridMode::Vertical;
    snap.grid.spacingPx = 32.0f;
    snap.grid.originX = 4.0f;
    snap.hidden = true;
    return snap;
}

MarkupError parse(const std::vector<std::uint8_t>& bytes, MarkupSnap& out) {
    return parseSnapshot(bytes.data(), static_cast<std::uint32_t>(bytes.size()), out);
}

} // namespace

TEST(SnapshotTest, RoundTripPreservesDigest) {
    const MarkupSnap snap = sampleSnap();
    const std::vector<std::uint8_t> bytes = buildSnapshotBytes(snap);

    MarkupSnap loaded;
    ASSERT_EQ(parse(bytes, loaded), MarkupError::Ok);
    EXPECT_EQ(computeSnapDigest(loaded), computeSnapDigest(snap));

    ASSERT_EQ(loaded.texts.size(), 1u);
    EXPECT_EQ(loaded.texts[0].content, snap.texts[0].content);
    ASSERT_TRUE(loaded.lines[0].referenceLength.has_value());
    EXPECT_FLOAT_EQ(*loaded.lines[0].referenceLength, 7.32f);
    EXPECT_FALSE(loaded.lines[1].createdAt.has_value());
    EXPECT_EQ(loaded.lines[1].displayDuration, DisplayDuration::forSeconds(4.0f));
    EXPECT_TRUE(loaded.hidden);
}

TEST(SnapshotTest, EmptySnapRoundTrips) {
    MarkupSnap loaded = sampleSnap();
    ASSERT_EQ(parse(buildSnapshotBytes(MarkupSnap{}), loaded), MarkupError::Ok);
    EXPECT_TRUE(loaded.lines.empty());
    EXPECT_TRUE(loaded.texts.empty());
    EXPECT_FALSE(loaded.hidden);
}

TEST(SnapshotTest, DigestIsOrderSensitive) {
    MarkupSnap a = sampleSnap();
    MarkupSnap b = a;
    std::swap(b.lines[0], b.lines[1]);
    EXPECT_NE(computeSnapDigest(a), computeSnapDigest(b));

    b = a;
    b.texts[0].content = "other";
    EXPECT_NE(computeSnapDigest(a), computeSnapDigest(b));
}

TEST(SnapshotTest, RejectsBadMagic) {
    std::vector<std::uint8_t> bytes = buildSnapshotBytes(sampleSnap());
    bytes[0] = 'X';
    MarkupSnap out;
    EXPECT_EQ(parse(bytes, out), MarkupError::InvalidMagic);
}

TEST(SnapshotTest, RejectsUnknownVersion) {
    std::vector<std::uint8_t> bytes = buildSnapshotBytes(sampleSnap());
    writeU32LE(bytes.data(), 4, 99);
    MarkupSnap out;
    EXPECT_EQ(parse(bytes, out), MarkupError::UnsupportedVersion);
}

TEST(SnapshotTest, RejectsTruncation) {
    const std::vector<std::uint8_t> full = buildSnapshotBytes(sampleSnap());
    MarkupSnap out;

    std::vector<std::uint8_t> bytes(full.begin(), full.begin() + 10);
    EXPECT_EQ(parse(bytes, out), MarkupError::BufferTruncated);

    bytes.assign(full.begin(), full.end() - 1);
    EXPECT_EQ(parse(bytes, out), MarkupError::BufferTruncated);

    EXPECT_EQ(parseSnapshot(nullptr, 0, out), MarkupError::BufferTruncated);
}

TEST(SnapshotTest, RejectsCorruptPayload) {
    std::vector<std::uint8_t> bytes = buildSnapshotBytes(sampleSnap());
    bytes.back() ^= 0xFF;
    MarkupSnap out;
    EXPECT_EQ(parse(bytes, out), MarkupError::InvalidPayloadSize);
}

TEST(SnapshotTest, RejectsMissingSection) {
    std::vector<std::uint8_t> bytes = buildSnapshotBytes(sampleSnap());
    const std::uint32_t sections = readU32(bytes.data(), 8);
    writeU32LE(bytes.data(), 8, sections - 1);
    MarkupSnap out;
    EXPECT_EQ(parse(bytes, out), MarkupError::InvalidPayloadSize);
}

TEST(SnapshotTest, FailedParseLeavesOutputUntouched) {
    std::vector<std::uint8_t> bytes = buildSnapshotBytes(sampleSnap());
    bytes.back() ^= 0x01;
    MarkupSnap out;
    out.hidden = true;
    out.grid.spacingPx = 77.0f;
    ASSERT_NE(parse(bytes, out), MarkupError::Ok);
    EXPECT_TRUE(out.hidden);
    EXPECT_FLOAT_EQ(out.grid.spacingPx, 77.0f);
}

TEST(SnapshotTest, SurfaceSaveLoad) {
    MarkupSurface source;
    source.store().loadSnap(sampleSnap());
    const std::vector<std::uint8_t> bytes = source.saveSnapshot();

    MarkupSurface target;
    ASSERT_EQ(target.loadSnapshot(bytes.data(), static_cast<std::uint32_t>(bytes.size())), MarkupError::Ok);
    EXPECT_EQ(target.digest(), source.digest());
    EXPECT_FALSE(target.store().canUndo());
    EXPECT_GT(target.store().addLine(MarkupLine{}), 9u);
}

TEST(SnapshotTest, SurfaceKeepsStateOnBadBytes) {
    MarkupSurface surface;
    surface.store().addLine(MarkupLine{});
    const SnapDigest before = surface.digest();

    std::vector<std::uint8_t> bytes = buildSnapshotBytes(sampleSnap());
    bytes[1] = 0;
    EXPECT_EQ(surface.loadSnapshot(bytes.data(), static_cast<std::uint32_t>(bytes.size())), MarkupError::InvalidMagic);
    EXPECT_EQ(surface.digest(), before);
    EXPECT_TRUE(surface.store().canUndo());
}

TEST(SnapshotTest, RejectsDuplicateIds) {
    MarkupSnap snap = sampleSnap();
    MarkupLine twin = snap.lines[1];
    twin.p2 = Point2{0.2f, 0.9f};
    snap.lines.push_back(twin);
    MarkupSnap out;
    EXPECT_EQ(parse(buildSnapshotBytes(snap), out), MarkupError::InvalidPayloadSize);

    snap = sampleSnap();
    snap.angles.push_back(snap.angles[0]);
    EXPECT_EQ(parse(buildSnapshotBytes(snap), out), MarkupError::InvalidPayloadSize);

    // Ids only need to be unique within their own collection
    snap = sampleSnap();
    snap.texts[0].id = snap.lines[0].id;
    EXPECT_EQ(parse(buildSnapshotBytes(snap), out), MarkupError::Ok);
}

TEST(SnapshotTest, RejectsSecondReferenceLine) {
    MarkupSnap snap = sampleSnap();
    snap.lines[1].referenceLength = 99.0f;
    snap.lines[1].unit = "cm";
    const std::vector<std::uint8_t> bytes = buildSnapshotBytes(snap);

    MarkupSnap out;
    EXPECT_EQ(parse(bytes, out), MarkupError::InvalidPayloadSize);

    MarkupSurface surface;
    const SnapDigest before = surface.digest();
    EXPECT_EQ(surface.loadSnapshot(bytes.data(), static_cast<std::uint32_t>(bytes.size())),
              MarkupError::InvalidPayloadSize);
    EXPECT_EQ(surface.digest(), before);
}

TEST(SnapshotTest, RejectsInvalidSecondsDuration) {
    MarkupSnap snap = sampleSnap();
    snap.lines[1].displayDuration = DisplayDuration::forSeconds(-1.0f);
    MarkupSnap out;
    EXPECT_EQ(parse(buildSnapshotBytes(snap), out), MarkupError::InvalidPayloadSize);

    snap.lines[1].displayDuration = DisplayDuration::forSeconds(std::nanf(""));
    EXPECT_EQ(parse(buildSnapshotBytes(snap), out), MarkupError::InvalidPayloadSize);

    snap.lines[1].displayDuration = DisplayDuration::forSeconds(0.0f);
    EXPECT_EQ(parse(buildSnapshotBytes(snap), out), MarkupError::Ok);
}
