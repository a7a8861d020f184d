/// @file test_sequence.cpp
/// @brief Tests for timeline placement, member seeking, looping and ownership of sequences

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "core/log.hpp"
#include "timing/scheduler.hpp"
#include "tween/sequence.hpp"
#include "tween/tweener.hpp"
#include "tween/value_bindings.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace tweenflow;
using Catch::Approx;

namespace {

struct Target {
    float value = 0.0f;
};

TweenParams linear_params(Target& target, float to) {
    TweenParams params;
    params.ease = EaseType::LINEAR;
    params.bind<FloatBinding>(make_property("value", &target.value), to);
    return params;
}

std::unique_ptr<Tweener> make_tween(const std::shared_ptr<Target>& target, float to, float duration) {
    return std::make_unique<Tweener>(target, duration, linear_params(*target, to));
}

std::vector<float> start_times(const Sequence& seq) {
    std::vector<float> out;
    for (const auto& item : seq.items()) {
        out.push_back(item.start_time);
    }
    return out;
}

struct WarningCapture {
    std::vector<std::string> messages;

    WarningCapture() {
        set_warning_handler([this](std::string_view msg) { messages.emplace_back(msg); });
    }
    ~WarningCapture() { set_warning_handler(nullptr); }
};

} // namespace

TEST_CASE("Append places members back to back", "[sequence][timeline]") {
    auto target = std::make_shared<Target>();
    Sequence seq;

    CHECK(seq.append(make_tween(target, 1.0f, 1.0f)) == Approx(1.0f));
    CHECK(seq.append(make_tween(target, 1.0f, 2.0f)) == Approx(3.0f));
    CHECK(seq.append(make_tween(target, 1.0f, 3.0f)) == Approx(6.0f));

    CHECK(start_times(seq) == std::vector<float>{0.0f, 1.0f, 3.0f});
    CHECK(seq.duration() == Approx(6.0f));
    CHECK(seq.full_duration() == Approx(6.0f));

    SECTION("Prepend shifts existing items") {
        seq.prepend(make_tween(target, 1.0f, 1.5f));
        CHECK(start_times(seq) == std::vector<float>{0.0f, 1.5f, 2.5f, 4.5f});
        CHECK(seq.duration() == Approx(7.5f));
    }

    SECTION("Insert goes before the first item starting at or after its time") {
        seq.insert(2.0f, make_tween(target, 1.0f, 1.0f));
        CHECK(start_times(seq) == std::vector<float>{0.0f, 1.0f, 2.0f, 3.0f});
        CHECK(seq.duration() == Approx(6.0f));

        seq.insert(3.0f, make_tween(target, 1.0f, 0.5f));
        CHECK(start_times(seq) == std::vector<float>{0.0f, 1.0f, 2.0f, 3.0f, 3.0f});
        CHECK(seq.items()[3].duration() == Approx(0.5f));
    }

    SECTION("Insert past the end extends the duration") {
        CHECK(seq.insert(10.0f, make_tween(target, 1.0f, 1.0f)) == Approx(11.0f));
    }

    SECTION("Loops multiply the full duration") {
        seq.set_loops(3);
        CHECK(seq.full_duration() == Approx(18.0f));
    }
}

TEST_CASE("Intervals occupy time without a member", "[sequence][timeline]") {
    Sequence seq;
    seq.append_interval(0.5f);
    seq.prepend_interval(1.0f);

    REQUIRE(seq.items().size() == 2);
    CHECK(seq.items()[0].member == nullptr);
    CHECK(seq.items()[1].start_time == Approx(1.0f));
    CHECK(seq.duration() == Approx(1.5f));

    SECTION("Negative intervals are rejected") {
        CHECK_THROWS_AS(seq.append_interval(-1.0f), std::invalid_argument);
    }

    SECTION("Negative insert times are clamped with a warning") {
        WarningCapture capture;
        seq.insert_interval(-2.0f, 3.0f);
        CHECK(capture.messages.size() == 1);
        CHECK(seq.items()[0].start_time == 0.0f);
        CHECK(seq.duration() == Approx(3.0f));
    }
}

TEST_CASE("Sequences are created paused", "[sequence]") {
    auto target = std::make_shared<Target>();
    Sequence seq;
    seq.append(make_tween(target, 10.0f, 1.0f));

    CHECK(seq.is_paused());
    CHECK_FALSE(seq.update(0.5f));
    CHECK(target->value == 0.0f);
    CHECK_FALSE(seq.is_tweening(target.get()));

    seq.play();
    CHECK(seq.is_tweening(target.get()));
}

TEST_CASE("Members play at their offsets", "[sequence]") {
    auto a = std::make_shared<Target>();
    auto b = std::make_shared<Target>();
    int seq_completes = 0;
    int a_completes = 0;
    float a_seen_on_update = -1.0f;

    auto tween_a = make_tween(a, 10.0f, 1.0f);
    tween_a->callbacks().on_complete = [&a_completes](Animation&) { ++a_completes; };

    SequenceParams params;
    params.callbacks.on_complete = [&seq_completes](Animation&) { ++seq_completes; };
    params.callbacks.on_update = [&](Animation&) { a_seen_on_update = a->value; };
    Sequence seq(params);
    seq.append(std::move(tween_a));
    seq.append(make_tween(b, 10.0f, 1.0f));
    seq.play();

    CHECK_FALSE(seq.update(0.5f));
    CHECK(a->value == Approx(5.0f));
    CHECK(b->value == Approx(0.0f));
    CHECK(a_seen_on_update == Approx(5.0f));

    seq.update(1.0f);
    CHECK(a->value == Approx(10.0f));
    CHECK(b->value == Approx(5.0f));
    CHECK(a_completes == 1);

    CHECK(seq.update(0.5f));
    CHECK(b->value == Approx(10.0f));
    CHECK(seq.is_complete());
    CHECK(seq_completes == 1);
    CHECK(a_completes == 1);

    SECTION("Playing backwards runs the members in reverse") {
        seq.play_backwards();
        seq.update(0.5f);
        CHECK_FALSE(seq.is_complete());
        CHECK(a->value == Approx(10.0f));
        CHECK(b->value == Approx(5.0f));
    }

    SECTION("rewind sends every member back to its start") {
        seq.rewind();
        CHECK(a->value == Approx(0.0f));
        CHECK(b->value == Approx(0.0f));
        CHECK(seq.is_paused());
        CHECK(seq.full_elapsed() == 0.0f);
    }
}

TEST_CASE("Startup captures chained start values", "[sequence]") {
    auto target = std::make_shared<Target>();
    Sequence seq;
    seq.append(make_tween(target, 10.0f, 1.0f));
    seq.append(make_tween(target, 20.0f, 1.0f));
    seq.play();

    seq.update(0.5f);
    CHECK(target->value == Approx(5.0f));

    seq.update(1.0f);
    CHECK(target->value == Approx(15.0f));

    SECTION("Seeking back resets the later member, then applies the earlier one") {
        seq.go_to(0.5f);
        CHECK(target->value == Approx(5.0f));
    }
}

TEST_CASE("Seeking backwards resets members that have not started", "[sequence]") {
    auto a = std::make_shared<Target>();
    auto b = std::make_shared<Target>();
    int b_rewinds = 0;
    int b_starts = 0;

    auto tween_b = make_tween(b, 10.0f, 1.0f);
    tween_b->callbacks().on_rewound = [&b_rewinds](Animation&) { ++b_rewinds; };
    tween_b->callbacks().on_start = [&b_starts](Animation&) { ++b_starts; };

    Sequence seq;
    seq.append(make_tween(a, 10.0f, 1.0f));
    seq.append(std::move(tween_b));
    seq.play();

    seq.update(0.5f);
    CHECK(b_starts == 0);

    seq.update(1.0f);
    REQUIRE(b->value == Approx(5.0f));
    CHECK(b_starts == 1);

    seq.go_to(0.5f);
    CHECK(a->value == Approx(5.0f));
    CHECK(b->value == Approx(0.0f));
    CHECK(b_rewinds == 0);
}

TEST_CASE("Reversing mid-flight resets members passed backwards", "[sequence][direction]") {
    auto a = std::make_shared<Target>();
    auto b = std::make_shared<Target>();
    auto c = std::make_shared<Target>();
    Sequence seq;
    seq.append(make_tween(a, 10.0f, 1.0f));
    seq.append(make_tween(b, 10.0f, 2.0f));
    seq.append(make_tween(c, 9.0f, 3.0f));
    seq.play();

    seq.update(4.0f);
    REQUIRE(c->value == Approx(3.0f));

    seq.play_backwards();
    seq.update(1.5f);
    CHECK(seq.full_elapsed() == Approx(2.5f));
    CHECK(c->value == Approx(0.0f));
    CHECK(b->value == Approx(7.5f));
    CHECK(a->value == Approx(10.0f));
}

TEST_CASE("Yoyo sequences mirror local time", "[sequence][loops]") {
    auto target = std::make_shared<Target>();
    SequenceParams params;
    params.loops = 2;
    params.loop_type = LoopType::YOYO;
    Sequence seq(params);
    seq.append(make_tween(target, 10.0f, 1.0f));
    seq.play();

    seq.update(1.5f);
    CHECK(seq.is_looping_back());
    CHECK(target->value == Approx(5.0f));

    CHECK(seq.update(0.5f));
    CHECK(target->value == Approx(0.0f));
}

TEST_CASE("Incremental sequences shift their members each loop", "[sequence][loops]") {
    auto target = std::make_shared<Target>();
    SequenceParams params;
    params.loops = 3;
    params.loop_type = LoopType::INCREMENTAL;
    Sequence seq(params);
    seq.append(make_tween(target, 10.0f, 1.0f));
    seq.play();

    seq.update(1.5f);
    CHECK(target->value == Approx(15.0f));

    SECTION("Rewind undoes the shift") {
        seq.rewind();
        CHECK(target->value == Approx(0.0f));
    }
}

TEST_CASE("Switching a sequence away from incremental loops drops the shift", "[sequence][loops]") {
    auto target = std::make_shared<Target>();
    SequenceParams params;
    params.loops = 3;
    params.loop_type = LoopType::INCREMENTAL;
    Sequence seq(params);
    seq.append(make_tween(target, 10.0f, 1.0f));
    seq.play();

    seq.update(2.5f);
    CHECK(target->value == Approx(25.0f));

    seq.set_loop_type(LoopType::RESTART);
    seq.update(0.1f);
    CHECK(target->value == Approx(6.0f));
}

TEST_CASE("complete() applies the end state", "[sequence]") {
    Scheduler scheduler;
    auto a = std::make_shared<Target>();
    auto b = std::make_shared<Target>();
    Sequence& seq = scheduler.sequence();
    seq.append(make_tween(a, 10.0f, 1.0f));
    seq.append(make_tween(b, 10.0f, 1.0f));

    seq.complete();
    CHECK(a->value == Approx(10.0f));
    CHECK(b->value == Approx(10.0f));
    CHECK(seq.is_destroyed());
    CHECK(scheduler.size() == 0);
}

TEST_CASE("Speed-based members get their duration when added", "[sequence]") {
    auto target = std::make_shared<Target>();
    TweenParams params = linear_params(*target, 10.0f);
    params.speed_based = true;

    Sequence seq;
    seq.append(std::make_unique<Tweener>(target, 5.0f, std::move(params)));
    CHECK(seq.duration() == Approx(2.0f));
}

TEST_CASE("Removing members", "[sequence][ownership]") {
    Scheduler scheduler;
    auto a = std::make_shared<Target>();
    auto b = std::make_shared<Target>();
    Sequence& seq = scheduler.sequence();

    auto tween_a = make_tween(a, 10.0f, 1.0f);
    auto tween_b = make_tween(b, 10.0f, 1.0f);
    Tweener* first = tween_a.get();
    Tweener* second = tween_b.get();
    seq.append(std::move(tween_a));
    seq.append(std::move(tween_b));

    seq.remove(*first);
    CHECK(seq.items().size() == 1);
    CHECK_FALSE(seq.is_destroyed());

    SECTION("Removing a stranger warns") {
        WarningCapture capture;
        Tweener stranger(a, 1.0f, linear_params(*a, 1.0f));
        seq.remove(stranger);
        CHECK(capture.messages.size() == 1);
        CHECK(seq.items().size() == 1);
    }

    SECTION("Removing the last member kills the sequence") {
        seq.remove(*second);
        CHECK(seq.is_destroyed());
        CHECK(scheduler.size() == 0);
        scheduler.tick(0.1f);
    }
}

TEST_CASE("Removing a member from a callback during the update", "[sequence][ownership]") {
    auto a = std::make_shared<Target>();
    auto b = std::make_shared<Target>();
    Sequence seq;

    auto tween_a = make_tween(a, 10.0f, 1.0f);
    auto tween_b = make_tween(b, 10.0f, 1.0f);
    Tweener* second = tween_b.get();
    tween_a->callbacks().on_complete = [&seq, second](Animation&) { seq.remove(*second); };
    seq.append(std::move(tween_a));
    seq.append(std::move(tween_b));
    seq.play();

    seq.update(1.5f);
    CHECK(seq.items().size() == 1);
    CHECK(b->value == Approx(0.0f));
    CHECK(seq.duration() == Approx(2.0f));
}

TEST_CASE("An emptied nested sequence kills its parents", "[sequence][ownership]") {
    Scheduler scheduler;
    auto target = std::make_shared<Target>();
    Sequence& outer = scheduler.sequence();

    auto inner = std::make_unique<Sequence>();
    Sequence* inner_ptr = inner.get();
    auto tween = make_tween(target, 10.0f, 1.0f);
    Tweener* member = tween.get();
    inner->append(std::move(tween));
    outer.append(std::move(inner));
    CHECK(outer.duration() == Approx(1.0f));

    inner_ptr->remove(*member);
    CHECK(inner_ptr->is_destroyed());
    CHECK(outer.is_destroyed());
    CHECK(scheduler.size() == 0);
}

TEST_CASE("Killing a sequence kills its members", "[sequence][ownership]") {
    Scheduler scheduler;
    auto target = std::make_shared<Target>();
    Sequence& seq = scheduler.sequence();
    auto tween = make_tween(target, 10.0f, 1.0f);
    Tweener* member = tween.get();
    seq.append(std::move(tween));

    seq.kill();
    CHECK(seq.is_destroyed());
    CHECK(member->is_destroyed());
    CHECK(scheduler.size() == 0);
}

TEST_CASE("Members whose target expired leave the sequence", "[sequence][ownership]") {
    Scheduler scheduler;
    auto a = std::make_shared<Target>();
    Sequence& seq = scheduler.sequence();
    seq.append(make_tween(a, 10.0f, 1.0f));

    SECTION("The last member going kills the sequence") {
        seq.play();
        scheduler.tick(0.5f);
        CHECK(a->value == Approx(5.0f));

        a.reset();
        scheduler.tick(0.1f);
        CHECK(scheduler.size() == 0);
    }

    SECTION("Other members keep playing") {
        auto b = std::make_shared<Target>();
        seq.append(make_tween(b, 10.0f, 1.0f));
        seq.play();
        scheduler.tick(0.5f);

        const void* expired = a.get();
        a.reset();
        scheduler.tick(0.1f);
        CHECK(seq.items().size() == 1);
        CHECK_FALSE(seq.is_destroyed());
        CHECK_FALSE(seq.is_linked_to(expired));
        CHECK(seq.is_linked_to(b.get()));

        scheduler.tick(1.0f);
        CHECK(b->value == Approx(6.0f));
    }
}

TEST_CASE("Adding an animation takes it over from its owner", "[sequence][ownership]") {
    Scheduler scheduler;
    auto target = std::make_shared<Target>();
    Tweener& tween = scheduler.to(target, 1.0f, linear_params(*target, 10.0f));
    Sequence& seq = scheduler.sequence();
    REQUIRE(scheduler.size() == 2);

    seq.append(tween);
    CHECK(scheduler.size() == 1);
    CHECK(tween.owner() == &seq);
    CHECK(seq.items().size() == 1);

    seq.play();
    scheduler.tick(0.5f);
    CHECK(target->value == Approx(5.0f));
}

TEST_CASE("Invalid members are refused with a warning", "[sequence][ownership]") {
    Scheduler scheduler;
    auto target = std::make_shared<Target>();
    WarningCapture capture;
    Sequence& seq = scheduler.sequence();

    SECTION("Itself") {
        seq.append(seq);
        CHECK(seq.items().empty());
    }

    SECTION("One of its parents") {
        auto inner = std::make_unique<Sequence>();
        Sequence* inner_ptr = inner.get();
        seq.append(std::move(inner));
        inner_ptr->append(seq);
        CHECK(inner_ptr->items().empty());
        CHECK(seq.owner() == &scheduler);
    }

    SECTION("A killed animation") {
        Tweener& tween = scheduler.to(target, 1.0f, linear_params(*target, 10.0f));
        tween.kill();
        seq.append(tween);
        CHECK(seq.items().empty());
    }

    SECTION("An animation nobody owns") {
        Tweener tween(target, 1.0f, linear_params(*target, 10.0f));
        seq.insert(0.0f, tween);
        CHECK(seq.items().empty());
    }

    CHECK(capture.messages.size() == 1);
}

TEST_CASE("Sequences report their members' bindings and targets", "[sequence]") {
    auto a = std::make_shared<Target>();
    auto b = std::make_shared<Target>();
    auto unrelated = std::make_shared<Target>();

    auto inner = std::make_unique<Sequence>();
    inner->append(make_tween(b, 1.0f, 1.0f));
    Sequence seq;
    seq.append(make_tween(a, 1.0f, 1.0f));
    seq.append(std::move(inner));

    std::vector<PropertyBinding*> bindings;
    seq.fill_property_bindings(bindings);
    CHECK(bindings.size() == 2);

    CHECK(seq.is_linked_to(a.get()));
    CHECK(seq.is_linked_to(b.get()));
    CHECK_FALSE(seq.is_linked_to(unrelated.get()));
}
