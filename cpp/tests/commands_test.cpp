#include "tests/engine_test_common.h"
#include "pathlink/command/commands.h"
#include "pathlink/command/command_dispatch.h"

#include <cstring>
#include <string>

using namespace pathlink_test;

namespace {

class LayoutBufferWriter {
public:
    LayoutBufferWriter() {
        pushU32(layoutCommandMagicPllc);
        pushU32(layoutCommandVersion);
        pushU32(0);
        pushU32(0);
    }

    LayoutBufferWriter& clearTargets() {
        command(LayoutCommandOp::ClearTargets, nullptr, 0);
        return *this;
    }

    LayoutBufferWriter& upsert(const std::string& id, std::uint32_t category, RectF r) {
        TargetPayloadHeader hdr{r.x, r.y, r.w, r.h, category, static_cast<std::uint32_t>(id.size())};
        std::vector<std::uint8_t> payload(sizeof(hdr) + id.size());
        std::memcpy(payload.data(), &hdr, sizeof(hdr));
        std::memcpy(payload.data() + sizeof(hdr), id.data(), id.size());
        command(LayoutCommandOp::UpsertTarget, payload.data(), static_cast<std::uint32_t>(payload.size()));
        return *this;
    }

    LayoutBufferWriter& canvas(float w, float h) {
        CanvasSizePayload p{w, h};
        command(LayoutCommandOp::SetCanvasSize, reinterpret_cast<const std::uint8_t*>(&p), sizeof(p));
        return *this;
    }

    LayoutBufferWriter& raw(std::uint32_t op, const std::vector<std::uint8_t>& payload) {
        command(static_cast<LayoutCommandOp>(op), payload.data(), static_cast<std::uint32_t>(payload.size()));
        return *this;
    }

    void setU32(std::size_t offset, std::uint32_t v) {
        std::memcpy(bytes_.data() + offset, &v, sizeof(v));
    }

    std::vector<std::uint8_t>& bytes() { return bytes_; }
    std::uintptr_t ptr() const { return reinterpret_cast<std::uintptr_t>(bytes_.data()); }
    std::uint32_t size() const { return static_cast<std::uint32_t>(bytes_.size()); }

private:
    std::vector<std::uint8_t> bytes_;
    std::uint32_t count_ = 0;

    void pushU32(std::uint32_t v) {
        const auto* p = reinterpret_cast<const std::uint8_t*>(&v);
        bytes_.insert(bytes_.end(), p, p + sizeof(v));
    }

    void command(LayoutCommandOp op, const std::uint8_t* payload, std::uint32_t len) {
        pushU32(static_cast<std::uint32_t>(op));
        pushU32(0);
        pushU32(len);
        pushU32(0);
        if (len) bytes_.insert(bytes_.end(), payload, payload + len);
        setU32(8, ++count_);
    }
};

struct CapturedCommand {
    std::uint32_t op;
    std::uint32_t bytes;
};

EngineError captureCommand(void* ctx, std::uint32_t op, const std::uint8_t*, std::uint32_t len) {
    static_cast<std::vector<CapturedCommand>*>(ctx)->push_back(CapturedCommand{op, len});
    return EngineError::Ok;
}

} // namespace

TEST(CommandBufferTest, ParsesEveryCommandInOrder) {
    LayoutBufferWriter w;
    w.clearTargets().upsert("x", 1, RectF{0, 0, 10, 10}).canvas(100, 50);

    std::vector<CapturedCommand> seen;
    ASSERT_EQ(pathlink::parseCommandBuffer(w.bytes().data(), w.size(), &captureCommand, &seen), EngineError::Ok);
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0].op, 1u);
    EXPECT_EQ(seen[0].bytes, 0u);
    EXPECT_EQ(seen[1].op, 2u);
    EXPECT_EQ(seen[1].bytes, sizeof(TargetPayloadHeader) + 1);
    EXPECT_EQ(seen[2].op, 3u);
}

TEST(CommandBufferTest, RejectsMalformedHeaders) {
    LayoutBufferWriter bad;
    bad.setU32(0, 0xDEADBEEF);
    EXPECT_EQ(pathlink::parseCommandBuffer(bad.bytes().data(), bad.size(), nullptr, nullptr), EngineError::InvalidMagic);

    LayoutBufferWriter version;
    version.setU32(4, 2);
    EXPECT_EQ(pathlink::parseCommandBuffer(version.bytes().data(), version.size(), nullptr, nullptr), EngineError::UnsupportedVersion);

    LayoutBufferWriter shortBuf;
    EXPECT_EQ(pathlink::parseCommandBuffer(shortBuf.bytes().data(), 8, nullptr, nullptr), EngineError::BufferTruncated);
    EXPECT_EQ(pathlink::parseCommandBuffer(nullptr, 16, nullptr, nullptr), EngineError::BufferTruncated);
}

TEST(CommandBufferTest, RejectsTruncatedPayload) {
    LayoutBufferWriter w;
    w.upsert("target", 0, RectF{0, 0, 10, 10});
    EXPECT_EQ(pathlink::parseCommandBuffer(w.bytes().data(), w.size() - 2, nullptr, nullptr), EngineError::BufferTruncated);

    LayoutBufferWriter missing;
    missing.clearTargets();
    missing.setU32(8, 2);
    EXPECT_EQ(pathlink::parseCommandBuffer(missing.bytes().data(), missing.size(), nullptr, nullptr), EngineError::BufferTruncated);
}

TEST(LayoutDispatchTest, UpsertReplacesById) {
    pathlink::PendingLayout layout;
    LayoutBufferWriter w;
    w.upsert("a1", 0, RectF{0, 0, 10, 10}).upsert("b1", 1, RectF{20, 0, 10, 10}).upsert("a1", 0, RectF{50, 50, 5, 5});

    auto cb = [](void* ctx, std::uint32_t op, const std::uint8_t* payload, std::uint32_t len) -> EngineError {
        return pathlink::dispatchLayoutCommand(*static_cast<pathlink::PendingLayout*>(ctx), op, payload, len);
    };
    ASSERT_EQ(pathlink::parseCommandBuffer(w.bytes().data(), w.size(), cb, &layout), EngineError::Ok);
    ASSERT_EQ(layout.targets.size(), 2u);
    EXPECT_EQ(layout.targets[0].id, "a1");
    EXPECT_FLOAT_EQ(layout.targets[0].bounds.x, 50.0f);
    EXPECT_EQ(layout.targets[1].category, Category::B);
    EXPECT_FALSE(layout.canvasChanged);
}

TEST(LayoutDispatchTest, RejectsBadPayloads) {
    pathlink::PendingLayout layout;
    const std::uint8_t junk[4] = {1, 2, 3, 4};
    EXPECT_EQ(pathlink::dispatchLayoutCommand(layout, 1, junk, 4), EngineError::InvalidPayloadSize);
    EXPECT_EQ(pathlink::dispatchLayoutCommand(layout, 2, junk, 4), EngineError::InvalidPayloadSize);
    EXPECT_EQ(pathlink::dispatchLayoutCommand(layout, 3, junk, 4), EngineError::InvalidPayloadSize);
    EXPECT_EQ(pathlink::dispatchLayoutCommand(layout, 99, nullptr, 0), EngineError::UnknownCommand);

    TargetPayloadHeader hdr{0, 0, 10, 10, 7, 0};
    EXPECT_EQ(pathlink::dispatchLayoutCommand(layout, 2, reinterpret_cast<const std::uint8_t*>(&hdr), sizeof(hdr)),
        EngineError::InvalidPayload);
}

class LayoutCommandEngineTest : public ::testing::Test {
protected:
    PathLinkEngine engine;

    void SetUp() override {
        loadReferenceBoard(engine);
        drainEvents(engine);
    }
};

TEST_F(LayoutCommandEngineTest, AppliesLayoutAtomically) {
    LayoutBufferWriter w;
    w.clearTargets()
        .upsert("a1", 0, RectF{10, 10, 20, 20})
        .upsert("a2", 0, RectF{200, 10, 20, 20})
        .canvas(640, 480);
    engine.applyLayoutCommandBuffer(w.ptr(), w.size());

    EXPECT_EQ(engine.getLastError(), EngineError::Ok);
    const TargetRegistry& registry = PathLinkEngineTestAccessor::registry(engine);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_FLOAT_EQ(registry.canvasWidth(), 640.0f);
    EXPECT_EQ(registry.findById("b1"), nullptr);

    const auto events = drainEvents(engine);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, static_cast<std::uint16_t>(PathLinkEngine::EventType::LayoutChanged));
    EXPECT_EQ(events[0].a, 2u);
}

TEST_F(LayoutCommandEngineTest, FailedBufferLeavesLayoutUntouched) {
    LayoutBufferWriter w;
    w.clearTargets().upsert("z", 0, RectF{0, 0, 5, 5}).raw(42, {});
    engine.applyLayoutCommandBuffer(w.ptr(), w.size());

    EXPECT_EQ(engine.getLastError(), EngineError::UnknownCommand);
    const TargetRegistry& registry = PathLinkEngineTestAccessor::registry(engine);
    EXPECT_EQ(registry.size(), referenceTargets().size());
    EXPECT_NE(registry.findById("b1"), nullptr);
    EXPECT_EQ(registry.findById("z"), nullptr);
    EXPECT_TRUE(drainEvents(engine).empty());
}

TEST_F(LayoutCommandEngineTest, ErrorClearsOnNextCall) {
    LayoutBufferWriter bad;
    bad.setU32(0, 0);
    engine.applyLayoutCommandBuffer(bad.ptr(), bad.size());
    ASSERT_EQ(engine.getLastError(), EngineError::InvalidMagic);

    engine.onPointerMove(1.0f, 1.0f);
    EXPECT_EQ(engine.getLastError(), EngineError::Ok);
}
