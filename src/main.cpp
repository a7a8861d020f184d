/// @file main.cpp
/// @brief Tweenflow demo: sprites animated along splines, in sequences and in loops
///
/// A rocket follows a closed constant-speed path and turns along it, a box runs
/// a yoyo sequence, and a spinner rotates with incremental loops. Supports both
/// native desktop and Emscripten/WASM builds.

#include "math/vec3.hpp"
#include "rendering/path_renderer.hpp"
#include "timing/scheduler.hpp"
#include "tween/path_binding.hpp"
#include "tween/sequence.hpp"
#include "tween/tweener.hpp"
#include "tween/value_bindings.hpp"

#include <raylib.h>

#ifdef __EMSCRIPTEN__
#include <emscripten/emscripten.h>
#endif

#include <cmath>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr int INITIAL_WIDTH = 1280;
constexpr int INITIAL_HEIGHT = 720;
constexpr int TARGET_FPS = 60;
constexpr float PIXELS_PER_UNIT = 60.0f;
constexpr float SPEED_STEP = 0.25f;
constexpr float RAD_TO_DEG = 57.2957795f;

/// Something the demo animates
struct Sprite {
    tweenflow::Vec3 position;
    float rotation = 0.0f; // Degrees
    float scale = 1.0f;
    Color color = WHITE;
};

struct DemoState {
    tweenflow::Scheduler scheduler;
    std::shared_ptr<Sprite> rocket;
    std::shared_ptr<Sprite> box;
    std::shared_ptr<Sprite> spinner;
    tweenflow::Tweener* rocket_tween = nullptr;
    tweenflow::Sequence* box_sequence = nullptr;
    bool partial = false;
    Vector2 offset = {INITIAL_WIDTH / 2.0f, INITIAL_HEIGHT / 2.0f};
};

tweenflow::Property<tweenflow::Vec3> position_of(const std::shared_ptr<Sprite>& sprite) {
    Sprite* s = sprite.get();
    return {"position", [s]() { return s->position; },
            [s](const tweenflow::Vec3& v) { s->position = v; }};
}

tweenflow::Property<float> rotation_of(const std::shared_ptr<Sprite>& sprite) {
    return tweenflow::make_property("rotation", &sprite->rotation);
}

tweenflow::Property<float> scale_of(const std::shared_ptr<Sprite>& sprite) {
    return tweenflow::make_property("scale", &sprite->scale);
}

/// (Re)creates all demo animations
void build_animations(DemoState& state) {
    using namespace tweenflow;

    state.scheduler.kill_all();
    state.partial = false;

    state.rocket = std::make_shared<Sprite>(Sprite{{-4.0f, 0.0f, 0.0f}, 0.0f, 1.0f, ORANGE});
    state.box = std::make_shared<Sprite>(Sprite{{-6.0f, 4.0f, 0.0f}, 0.0f, 1.0f, SKYBLUE});
    state.spinner = std::make_shared<Sprite>(Sprite{{7.0f, -4.0f, 0.0f}, 0.0f, 1.0f, VIOLET});

    // Rocket: closed constant-speed loop, facing along the path
    TweenParams rocket_params;
    rocket_params.ease = EaseType::LINEAR;
    rocket_params.loops = -1;
    Sprite* rocket = state.rocket.get();
    rocket_params
        .bind<PathBinding>(position_of(state.rocket),
                           std::vector<Vec3>{{-4.0f, 0.0f, 0.0f},
                                             {-1.0f, -3.0f, 0.0f},
                                             {3.0f, -2.0f, 0.0f},
                                             {4.0f, 1.5f, 0.0f},
                                             {0.0f, 3.0f, 0.0f}})
        .constant_speed()
        .close_path()
        .orient_to_path([rocket](const Vec3& point) {
            Vec3 dir = point - rocket->position;
            if (dir.length() > 0.0f) {
                rocket->rotation = std::atan2(dir.y, dir.x) * RAD_TO_DEG;
            }
        });
    state.rocket_tween = &state.scheduler.to(state.rocket, 6.0f, std::move(rocket_params));

    // Box: move right, pulse, move down; whole sequence yoyos forever
    SequenceParams seq_params;
    seq_params.loops = -1;
    seq_params.loop_type = LoopType::YOYO;
    Sequence& seq = state.scheduler.sequence(seq_params);

    TweenParams move_right;
    move_right.ease = EaseType::EASE_IN_OUT_CUBIC;
    move_right.bind<Vec3Binding>(position_of(state.box), Vec3{-2.0f, 4.0f, 0.0f});
    seq.append(std::make_unique<Tweener>(state.box, 1.2f, std::move(move_right)));

    TweenParams pulse;
    pulse.ease = EaseType::EASE_OUT_ELASTIC;
    pulse.bind<FloatBinding>(scale_of(state.box), 1.8f);
    seq.append(std::make_unique<Tweener>(state.box, 0.8f, std::move(pulse)));
    seq.append_interval(0.3f);

    TweenParams move_down;
    move_down.ease = EaseType::EASE_OUT_BOUNCE;
    move_down.bind<Vec3Binding>(position_of(state.box), Vec3{0.0f, 3.0f, 0.0f}, true);
    seq.insert(1.0f, std::make_unique<Tweener>(state.box, 1.0f, std::move(move_down)));
    seq.play();
    state.box_sequence = &seq;

    // Spinner: each loop adds another quarter turn
    TweenParams spin;
    spin.ease = EaseType::EASE_IN_OUT_BACK;
    spin.loops = -1;
    spin.loop_type = LoopType::INCREMENTAL;
    spin.delay = 0.5f;
    spin.bind<FloatBinding>(rotation_of(state.spinner), 90.0f, true);
    state.scheduler.to(state.spinner, 0.7f, std::move(spin));
}

void draw_sprite(const Sprite& sprite, Vector2 offset) {
    Vector2 center = {sprite.position.x * PIXELS_PER_UNIT + offset.x,
                      sprite.position.y * PIXELS_PER_UNIT + offset.y};
    float size = 28.0f * sprite.scale;
    Rectangle rect = {center.x, center.y, size, size * 0.6f};
    DrawRectanglePro(rect, {size / 2.0f, size * 0.3f}, sprite.rotation, sprite.color);
}

/// Returns a mode label string
const char* mode_label(tweenflow::PlaybackMode mode) {
    switch (mode) {
    case tweenflow::PlaybackMode::REALTIME:
        return "PLAYING";
    case tweenflow::PlaybackMode::PAUSED:
        return "PAUSED";
    case tweenflow::PlaybackMode::STEP:
        return "STEP";
    }
    return "???";
}

void frame_tick(DemoState& state) {
    float dt = GetFrameTime();
    auto& scheduler = state.scheduler;

    if (IsWindowResized()) {
        state.offset = {GetScreenWidth() / 2.0f, GetScreenHeight() / 2.0f};
    }

    // --- Keyboard ---
    if (IsKeyPressed(KEY_SPACE)) {
        scheduler.toggle_pause();
    }
    if (IsKeyPressed(KEY_RIGHT)) {
        scheduler.step();
    }
    if (IsKeyPressed(KEY_UP)) {
        scheduler.set_speed(scheduler.speed() + SPEED_STEP);
    }
    if (IsKeyPressed(KEY_DOWN) && scheduler.speed() > SPEED_STEP) {
        scheduler.set_speed(scheduler.speed() - SPEED_STEP);
    }
    if (IsKeyPressed(KEY_B) && state.box_sequence != nullptr) {
        state.box_sequence->reverse(true);
    }
    if (IsKeyPressed(KEY_P) && state.rocket_tween != nullptr) {
        if (state.partial) {
            state.rocket_tween->reset_path();
        } else {
            state.rocket_tween->use_partial_path(1, 3);
        }
        state.partial = !state.partial;
    }
    if (IsKeyPressed(KEY_R)) {
        build_animations(state);
    }

    scheduler.tick(dt);

    // --- Draw ---
    BeginDrawing();
    ClearBackground({25, 25, 30, 255});

    if (state.rocket_tween != nullptr) {
        tweenflow::draw_paths(*state.rocket_tween, PIXELS_PER_UNIT, state.offset);
    }
    draw_sprite(*state.rocket, state.offset);
    draw_sprite(*state.box, state.offset);
    draw_sprite(*state.spinner, state.offset);

    int screen_h = GetScreenHeight();
    DrawText(mode_label(scheduler.mode()), 10, screen_h - 50, 14,
             scheduler.mode() == tweenflow::PlaybackMode::PAUSED ? Color{255, 200, 80, 255}
                                                                 : Color{80, 220, 100, 255});
    std::string info = "Speed: " + std::to_string(scheduler.speed()).substr(0, 4) +
                       "x   Animations: " + std::to_string(scheduler.size()) +
                       (state.partial ? "   Partial path" : "");
    DrawText(info.c_str(), 10, screen_h - 32, 13, {140, 140, 140, 255});
    DrawText("SPACE pause  RIGHT step  UP/DOWN speed  B reverse box  P partial path  R reset", 10,
             10, 14, {200, 200, 200, 255});

    EndDrawing();
}

#ifdef __EMSCRIPTEN__
/// Emscripten main loop callback
void emscripten_frame(void* arg) {
    auto* state = static_cast<DemoState*>(arg);
    frame_tick(*state);
}
#endif

} // namespace

int main() {
    SetConfigFlags(FLAG_WINDOW_RESIZABLE);
    InitWindow(INITIAL_WIDTH, INITIAL_HEIGHT, "Tweenflow");
    SetTargetFPS(TARGET_FPS);

    DemoState state;
    build_animations(state);

#ifdef __EMSCRIPTEN__
    emscripten_set_main_loop_arg(emscripten_frame, &state, 0, 1);
#else
    while (!WindowShouldClose()) {
        frame_tick(state);
    }
#endif

    CloseWindow();
    return 0;
}
