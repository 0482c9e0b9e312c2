// coherence_scene Viewport tests

#include <catch2/catch_test_macros.hpp>
#include <coherence/scene/viewport.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

using namespace coherence_scene;
using coherence_core::ErrorCode;
using coherence_core::ErrorException;
using coherence_ipc::RenderFrameHeader;

namespace {

std::vector<std::byte> rgb_frame(std::int32_t width, std::int32_t height, std::uint8_t value) {
    return std::vector<std::byte>(static_cast<std::size_t>(width * height * 3), static_cast<std::byte>(value));
}

InteropCamera make_camera(std::int32_t width, std::int32_t height) {
    InteropCamera camera{};
    camera.width = width;
    camera.height = height;
    camera.is_perspective = 1;
    camera.lens = 50.0f;
    camera.view_distance = 100.0f;
    camera.forward = coherence_math::Vec3(0.0f, 0.0f, -1.0f);
    camera.up = coherence_math::Vec3(0.0f, 1.0f, 0.0f);
    return camera;
}

} // anonymous namespace

TEST_CASE("Viewport camera and visibility", "[scene][viewport]") {
    Viewport viewport(3);

    REQUIRE(viewport.name() == "Viewport #3");
    REQUIRE(viewport.camera().width == Viewport::DEFAULT_SIZE);
    REQUIRE(viewport.camera().height == Viewport::DEFAULT_SIZE);

    SECTION("camera changes") {
        auto camera = make_camera(640, 480);
        REQUIRE(viewport.set_camera(camera));
        REQUIRE_FALSE(viewport.set_camera(camera));

        camera.lens += 1e-8f;
        REQUIRE_FALSE(viewport.set_camera(camera));

        camera.lens = 35.0f;
        REQUIRE(viewport.set_camera(camera));
        REQUIRE(viewport.serialize().camera.lens == 35.0f);
    }

    SECTION("visible objects") {
        const std::vector<std::int32_t> ids{1, 2, 5};
        REQUIRE(viewport.set_visible_objects(ids));
        REQUIRE_FALSE(viewport.set_visible_objects(ids));
        REQUIRE(viewport.visible_objects() == ids);

        REQUIRE(viewport.set_visible_objects({}));
        REQUIRE(viewport.visible_objects().empty());
    }

    SECTION("inbound camera must carry the same id") {
        InteropViewport data{};
        data.id = 3;
        data.camera = make_camera(320, 240);
        REQUIRE(viewport.apply_inbound(data).is_ok());
        REQUIRE(viewport.camera().width == 320);

        data.id = 4;
        REQUIRE(viewport.apply_inbound(data).is_err());
    }
}

TEST_CASE("Viewport pixel frames", "[scene][viewport][pixels]") {
    Viewport viewport(1);

    SECTION("no frame yet") {
        auto lock = viewport.lock_render_texture();
        REQUIRE(lock.owns_lock());
        REQUIRE(lock->viewport_id == 1);
        REQUIRE(lock->pixels == nullptr);
        REQUIRE(lock->frame == 0);
    }

    SECTION("frames are copied in") {
        auto pixels = rgb_frame(4, 2, 7);
        REQUIRE(viewport.read_pixels(RenderFrameHeader{1, 4, 2}, pixels) == 24);
        REQUIRE(viewport.frame() == 1);

        auto lock = viewport.lock_render_texture();
        REQUIRE(lock->width == 4);
        REQUIRE(lock->height == 2);
        REQUIRE(lock->pixels != nullptr);
        REQUIRE(lock->pixels[23] == 7);
    }

    SECTION("resize follows the frame header") {
        auto small = rgb_frame(2, 2, 1);
        auto large = rgb_frame(8, 4, 2);
        viewport.read_pixels(RenderFrameHeader{1, 2, 2}, small);
        viewport.read_pixels(RenderFrameHeader{1, 8, 4}, large);

        auto lock = viewport.lock_render_texture();
        REQUIRE(lock->width == 8);
        REQUIRE(lock->frame == 2);
        REQUIRE(lock->pixels[8 * 4 * 3 - 1] == 2);
    }

    SECTION("short node is a desync") {
        auto pixels = rgb_frame(2, 2, 1);
        REQUIRE_THROWS_AS(viewport.read_pixels(RenderFrameHeader{1, 4, 4}, pixels), ErrorException);
        REQUIRE(viewport.frame() == 0);
    }

}

TEST_CASE("Viewport explicit acquire and release", "[scene][viewport][pixels]") {
    Viewport viewport(1);
    auto pixels = rgb_frame(2, 2, 9);
    viewport.read_pixels(RenderFrameHeader{1, 2, 2}, pixels);

    SECTION("paired calls") {
        auto data = viewport.acquire_render_texture();
        REQUIRE(data.viewport_id == 1);
        REQUIRE(data.pixels[0] == 9);
        REQUIRE(viewport.release_render_texture().is_ok());

        // Lock is free again
        auto lock = viewport.lock_render_texture();
        REQUIRE(lock.owns_lock());
    }

    SECTION("release without acquire") {
        auto result = viewport.release_render_texture();
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidState);
    }

    SECTION("release from another thread is refused") {
        auto data = viewport.acquire_render_texture();
        REQUIRE(viewport.pixel_buffer()->is_held());

        bool refused = false;
        std::thread other([&]() {
            auto result = viewport.release_render_texture();
            refused = result.is_err() && result.error().code() == ErrorCode::InvalidState;
        });
        other.join();

        REQUIRE(refused);
        REQUIRE(viewport.pixel_buffer()->is_held());
        REQUIRE(viewport.release_render_texture().is_ok());
        REQUIRE_FALSE(viewport.pixel_buffer()->is_held());
    }

    SECTION("writers wait for the reader") {
        auto data = viewport.acquire_render_texture();
        std::atomic<bool> written{false};

        std::thread writer([&]() {
            auto next = rgb_frame(2, 2, 42);
            viewport.read_pixels(RenderFrameHeader{1, 2, 2}, next);
            written = true;
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        REQUIRE_FALSE(written);
        REQUIRE(data.pixels[0] == 9);

        REQUIRE(viewport.release_render_texture().is_ok());
        writer.join();
        REQUIRE(written);

        auto lock = viewport.lock_render_texture();
        REQUIRE(lock->pixels[0] == 42);
        REQUIRE(lock->frame == 2);
    }
}

TEST_CASE("Pixel buffer outlives its viewport while held", "[scene][viewport][pixels]") {
    auto viewport = std::make_unique<Viewport>(2);
    auto pixels = rgb_frame(2, 2, 5);
    viewport->read_pixels(RenderFrameHeader{2, 2, 2}, pixels);

    std::shared_ptr<PixelBuffer> buffer = viewport->pixel_buffer();
    auto data = buffer->acquire();

    // Destroying the viewport does not wait for the reader
    std::thread remover([&]() { viewport.reset(); });
    remover.join();

    REQUIRE(viewport == nullptr);
    REQUIRE(data.viewport_id == 2);
    REQUIRE(data.pixels[11] == 5);
    REQUIRE(buffer->release().is_ok());
    REQUIRE(buffer.use_count() == 1);
}
